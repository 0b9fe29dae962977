// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "windowing/state/SettingsWindowStateStore.hpp"
#include "windowing/WindowingConstants.hpp"

#include <QtCore/QMap>
#include <QtCore/QVariant>

namespace Windowing {

namespace {

using namespace Qt::StringLiterals;

constexpr auto kScope = Utils::EnvironmentScope::WindowState;

const QString kGeometryField = u"geometry"_s;
const QString kVisibleField = u"visible"_s;
const QString kFloatingField = u"floating"_s;
const QString kStateField = u"state"_s;

QString groupFor(SurfaceKind kind)
{
    switch (kind) {
        case SurfaceKind::Panel: return QString::fromLatin1(Constants::kPanelsGroup);
        case SurfaceKind::AuxiliaryWindow: return QString::fromLatin1(Constants::kWindowsGroup);
    }
    return QString::fromLatin1(Constants::kWindowsGroup);
}

QString mainWindowKey(const QString& field)
{
    return QString::fromLatin1(Constants::kMainWindowGroup) + u'/' + field;
}

} // namespace

SettingsWindowStateStore::SettingsWindowStateStore(Utils::Environment environment)
    : m_env(std::move(environment))
{
}

Utils::Environment SettingsWindowStateStore::makeEnvironment(const QString& configRootOverride)
{
    Utils::EnvironmentConfig cfg;
    cfg.organizationName = QStringLiteral("IsopGem");
    cfg.applicationName = QStringLiteral("IsopGem");
    cfg.configRootOverride = configRootOverride;
    return Utils::Environment(cfg);
}

QString SettingsWindowStateStore::settingsKey(SurfaceKind kind, const QString& key, QStringView field)
{
    return u"%1/%2/%3"_s.arg(groupFor(kind), key, field.toString());
}

Utils::Result SettingsWindowStateStore::writeSurfaceRecord(SurfaceKind kind, const QString& key,
                                                           const SurfaceStateRecord& record)
{
    if (key.isEmpty())
        return Utils::Result::failure(u"Cannot persist a surface without a key"_s);

    QMap<QString, QVariant> values;
    values.insert(settingsKey(kind, key, kGeometryField), record.geometry);
    values.insert(settingsKey(kind, key, kVisibleField), record.visible);
    if (kind == SurfaceKind::Panel && record.floating.has_value())
        values.insert(settingsKey(kind, key, kFloatingField), *record.floating);

    return m_env.setSettings(kScope, values);
}

std::optional<SurfaceStateRecord> SettingsWindowStateStore::readSurfaceRecord(SurfaceKind kind,
                                                                              const QString& key) const
{
    const QString geometryKey = settingsKey(kind, key, kGeometryField);
    const QString visibleKey = settingsKey(kind, key, kVisibleField);
    const QString floatingKey = settingsKey(kind, key, kFloatingField);

    const bool hasGeometry = m_env.hasSetting(kScope, geometryKey);
    const bool hasVisible = m_env.hasSetting(kScope, visibleKey);
    if (!hasGeometry && !hasVisible)
        return std::nullopt;

    SurfaceStateRecord record;
    record.geometry = m_env.setting(kScope, geometryKey).toByteArray();
    record.visible = m_env.setting(kScope, visibleKey, true).toBool();
    if (kind == SurfaceKind::Panel && m_env.hasSetting(kScope, floatingKey))
        record.floating = m_env.setting(kScope, floatingKey).toBool();
    return record;
}

Utils::Result SettingsWindowStateStore::writeMainWindowRecord(const MainWindowStateRecord& record)
{
    QMap<QString, QVariant> values;
    values.insert(mainWindowKey(kGeometryField), record.geometry);
    values.insert(mainWindowKey(kStateField), record.state);
    return m_env.setSettings(kScope, values);
}

std::optional<MainWindowStateRecord> SettingsWindowStateStore::readMainWindowRecord() const
{
    MainWindowStateRecord record;
    record.geometry = m_env.setting(kScope, mainWindowKey(kGeometryField)).toByteArray();
    record.state = m_env.setting(kScope, mainWindowKey(kStateField)).toByteArray();
    if (record.isEmpty())
        return std::nullopt;
    return record;
}

QStringList SettingsWindowStateStore::recordedKeys(SurfaceKind kind) const
{
    return m_env.childGroups(kScope, groupFor(kind));
}

} // namespace Windowing
