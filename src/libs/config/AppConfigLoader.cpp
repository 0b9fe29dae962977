// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "config/AppConfigLoader.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QDir>
#include <QtCore/QJsonObject>

namespace Config {

namespace {

using namespace Qt::StringLiterals;

void report(QStringList* warnings, const QString& msg)
{
    qCWarning(configlog).noquote() << msg;
    if (warnings)
        warnings->push_back(msg);
}

QJsonObject readLayer(const QString& path, QStringList* warnings)
{
    const auto r = Utils::JsonFileUtils::readObject(path);
    switch (r.status) {
        case Utils::JsonFileUtils::JsonReadResult::Status::Ok:
            qCDebug(configlog) << "Loaded config layer" << path;
            return r.object;
        case Utils::JsonFileUtils::JsonReadResult::Status::NotFound:
            report(warnings, u"Config file not found: %1"_s.arg(path));
            return {};
        case Utils::JsonFileUtils::JsonReadResult::Status::Invalid:
            report(warnings, u"Ignoring config file: %1"_s.arg(r.error));
            return {};
    }
    return {};
}

} // namespace

AppConfig AppConfigLoader::load(const QString& configDir, Environment environment, QStringList* warnings)
{
    const QDir dir(configDir);
    const QJsonObject defaults = readLayer(dir.filePath(QString::fromLatin1(kDefaultConfigFile)), warnings);
    const QJsonObject overrides = readLayer(dir.filePath(environmentFileName(environment)), warnings);

    const QJsonObject merged = Utils::JsonFileUtils::mergeObjects(defaults, overrides);

    AppConfig cfg = AppConfig::fromJson(merged, AppConfig::defaults(), warnings);
    cfg.application.environment = environment;

    qCInfo(configlog).noquote() << u"Configuration loaded for environment '%1' from %2"_s
                                       .arg(environmentName(environment), dir.absolutePath());
    return cfg;
}

Environment AppConfigLoader::resolveEnvironment(const QString& commandLineValue, QStringList* warnings)
{
    QString requested = commandLineValue.trimmed();
    if (requested.isEmpty())
        requested = qEnvironmentVariable(kEnvironmentVariable).trimmed();
    if (requested.isEmpty())
        return Environment::Development;

    Environment env = Environment::Development;
    if (!environmentFromString(requested, env)) {
        report(warnings, u"Invalid environment: %1. Using default: %2"_s
                             .arg(requested, environmentName(Environment::Development)));
        return Environment::Development;
    }
    return env;
}

QString AppConfigLoader::environmentFileName(Environment environment)
{
    return environmentName(environment) + u".json"_s;
}

} // namespace Config
