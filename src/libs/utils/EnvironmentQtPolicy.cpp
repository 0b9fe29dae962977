// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/EnvironmentQtPolicy.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QStandardPaths>

Q_LOGGING_CATEGORY(utilslog, "isopgem.utils")

namespace Utils {

namespace {

QString statusText(QSettings::Status status)
{
    switch (status) {
    case QSettings::NoError:
        return {};
    case QSettings::AccessError:
        return QStringLiteral("settings file is not writable");
    case QSettings::FormatError:
        return QStringLiteral("settings file is malformed");
    }
    return QStringLiteral("unknown settings error");
}

} // namespace

EnvironmentPaths QtEnvironmentPersistencePolicy::resolvePaths(const EnvironmentConfig& cfg) const
{
    EnvironmentPaths out;

    const QString root =
        !cfg.configRootOverride.isEmpty()
            ? cfg.configRootOverride
            : QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);

    const QString org = cfg.organizationName.isEmpty() ? QStringLiteral("IsopGem") : cfg.organizationName;
    out.configDir = QDir(QDir(root).filePath(org)).absolutePath();

    const QString app = cfg.applicationName.isEmpty() ? QStringLiteral("IsopGem") : cfg.applicationName;
    out.applicationSettingsFile = QDir(out.configDir).filePath(QStringLiteral("%1.ini").arg(app));
    out.windowStateFile = QDir(out.configDir).filePath(QStringLiteral("WindowState.ini"));

    return out;
}

QString QtEnvironmentPersistencePolicy::settingsFilePath(EnvironmentScope scope, const EnvironmentPaths& paths)
{
    switch (scope) {
    case EnvironmentScope::Application:
        return paths.applicationSettingsFile;
    case EnvironmentScope::WindowState:
        return paths.windowStateFile;
    }
    return paths.applicationSettingsFile;
}

QtEnvironmentPersistencePolicy::SettingsHandle
QtEnvironmentPersistencePolicy::open(EnvironmentScope scope, const EnvironmentPaths& paths) const
{
    SettingsHandle h;
    h.m_settings = std::make_unique<QSettings>(settingsFilePath(scope, paths), QSettings::IniFormat);
    h.m_settings->setFallbacksEnabled(false);
    if (h.m_settings->status() != QSettings::NoError)
        qCWarning(utilslog) << "Opened" << h.m_settings->fileName() << "with status" << h.m_settings->status();
    return h;
}

QVariant QtEnvironmentPersistencePolicy::SettingsHandle::value(QStringView key, const QVariant& def) const
{
    return m_settings->value(key.toString(), def);
}

void QtEnvironmentPersistencePolicy::SettingsHandle::setValue(QStringView key, const QVariant& value)
{
    m_settings->setValue(key.toString(), value);
}

void QtEnvironmentPersistencePolicy::SettingsHandle::remove(QStringView key)
{
    m_settings->remove(key.toString());
}

bool QtEnvironmentPersistencePolicy::SettingsHandle::contains(QStringView key) const
{
    return m_settings->contains(key.toString());
}

QStringList QtEnvironmentPersistencePolicy::SettingsHandle::childGroups(QStringView group) const
{
    m_settings->beginGroup(group.toString());
    const QStringList groups = m_settings->childGroups();
    m_settings->endGroup();
    return groups;
}

bool QtEnvironmentPersistencePolicy::SettingsHandle::sync(QString* error)
{
    const QString dir = QFileInfo(m_settings->fileName()).absolutePath();
    if (!QDir().mkpath(dir)) {
        if (error) *error = QStringLiteral("failed to create directory %1").arg(dir);
        return false;
    }

    m_settings->sync();
    const QSettings::Status status = m_settings->status();
    if (status != QSettings::NoError) {
        if (error) *error = QStringLiteral("%1 (%2)").arg(statusText(status), m_settings->fileName());
        return false;
    }

    if (error) error->clear();
    return true;
}

} // namespace Utils
