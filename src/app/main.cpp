// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>
#include <QtCore/QDir>
#include <QtCore/QLoggingCategory>
#include <QtCore/QStringList>

#include <QtWidgets/QApplication>

#include <config/AppConfigLoader.hpp>
#include <shell/ShellWindow.hpp>
#include <windowing/state/SettingsWindowStateStore.hpp>

#include <cstdlib>
#include <cstring>
#include <memory>

#ifndef ISOPGEM_VERSION
#define ISOPGEM_VERSION "0.0.0"
#endif

static constexpr char headlessFlagC[] = "--headless";

static bool hasFlag(int argc, char** argv, const char* flag)
{
	for (int i = 1; i < argc; ++i) {
		if (std::strcmp(argv[i], flag) == 0)
			return true;
	}
	return false;
}

// Maps DEBUG/INFO/WARNING/ERROR/CRITICAL onto filter rules for every
// isopgem.* category. Returns an empty string for unknown levels.
static QString filterRulesForLevel(const QString& level)
{
	const QString upper = level.trimmed().toUpper();
	if (upper == QLatin1String("DEBUG"))
		return QStringLiteral("isopgem.*.debug=true");
	if (upper == QLatin1String("INFO"))
		return QStringLiteral("isopgem.*.debug=false\nisopgem.*.info=true");
	if (upper == QLatin1String("WARNING"))
		return QStringLiteral("isopgem.*.debug=false\nisopgem.*.info=false");
	if (upper == QLatin1String("ERROR") || upper == QLatin1String("CRITICAL"))
		return QStringLiteral("isopgem.*.debug=false\nisopgem.*.info=false\nisopgem.*.warning=false");
	return {};
}

static bool applyLogLevel(const QString& level)
{
	const QString rules = filterRulesForLevel(level);
	if (rules.isEmpty())
		return false;
	QLoggingCategory::setFilterRules(rules);
	return true;
}

static void printWarnings(const QString& header, const QStringList& warnings)
{
	if (warnings.isEmpty())
		return;
	qWarning().noquote() << header;
	for (const QString& w : warnings)
		qWarning().noquote() << "  " << w;
}

int main(int argc, char** argv)
{
	QCoreApplication::setAttribute(Qt::AA_DontUseNativeMenuBar);

	// Headless runs never touch the windowing system.
	std::unique_ptr<QCoreApplication> app;
	if (hasFlag(argc, argv, headlessFlagC))
		app = std::make_unique<QCoreApplication>(argc, argv);
	else
		app = std::make_unique<QApplication>(argc, argv);

	QCoreApplication::setOrganizationName(QStringLiteral("IsopGem"));
	QCoreApplication::setApplicationName(QStringLiteral("IsopGem"));
	QCoreApplication::setApplicationVersion(QStringLiteral(ISOPGEM_VERSION));

	QCommandLineParser parser;
	parser.setApplicationDescription(QStringLiteral("IsopGem - Sacred Geometry & Gematria Tool"));
	parser.addHelpOption();
	parser.addVersionOption();

	const QCommandLineOption envOption(QStringLiteral("env"),
	                                   QStringLiteral("Configuration environment (development, production, test)."),
	                                   QStringLiteral("name"));
	const QCommandLineOption logOption(QStringLiteral("log"),
	                                   QStringLiteral("Log level (DEBUG, INFO, WARNING, ERROR, CRITICAL)."),
	                                   QStringLiteral("level"));
	const QCommandLineOption configDirOption(QStringLiteral("config-dir"),
	                                         QStringLiteral("Directory holding the JSON configuration files."),
	                                         QStringLiteral("dir"));
	const QCommandLineOption headlessOption(QStringLiteral("headless"),
	                                        QStringLiteral("Load the configuration and exit without a window."));
	parser.addOption(envOption);
	parser.addOption(logOption);
	parser.addOption(configDirOption);
	parser.addOption(headlessOption);
	parser.process(*app);

	const bool explicitLogLevel = parser.isSet(logOption);
	if (explicitLogLevel && !applyLogLevel(parser.value(logOption))) {
		qCritical().noquote() << "Unknown log level:" << parser.value(logOption);
		return EXIT_FAILURE;
	}

	QStringList warnings;
	const Config::Environment environment =
	    Config::AppConfigLoader::resolveEnvironment(parser.value(envOption), &warnings);

	const QString configDir = parser.isSet(configDirOption)
	    ? parser.value(configDirOption)
	    : QDir(QCoreApplication::applicationDirPath()).absoluteFilePath(QStringLiteral("config"));

	const Config::AppConfig config = Config::AppConfigLoader::load(configDir, environment, &warnings);

	if (!explicitLogLevel && !applyLogLevel(config.application.logLevel))
		warnings.push_back(QStringLiteral("Ignoring unknown log level '%1'").arg(config.application.logLevel));

	printWarnings(QStringLiteral("Configuration warnings:"), warnings);

	if (parser.isSet(headlessOption)) {
		qInfo().noquote() << QStringLiteral("%1 %2 (%3) configuration loaded")
		                         .arg(config.application.name,
		                              config.application.version,
		                              Config::environmentName(config.application.environment));
		return EXIT_SUCCESS;
	}

	Windowing::SettingsWindowStateStore store(Windowing::SettingsWindowStateStore::makeEnvironment());

	Shell::ShellWindow shell(config, &store);
	if (config.ui.window.maximizeOnStart)
		shell.showMaximized();
	else
		shell.show();
	shell.restoreLayout();

	return app->exec();
}
