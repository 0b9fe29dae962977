// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "windowing/WindowingGlobal.hpp"
#include "windowing/api/IWindowStateStore.hpp"

#include <utils/EnvironmentQtPolicy.hpp>

namespace Windowing {

// Window placement kept in the WindowState settings file:
//   panels/<key>/geometry|visible|floating
//   auxiliaryWindows/<key>/geometry|visible
//   mainWindow/geometry|state
class WINDOWING_EXPORT SettingsWindowStateStore final : public IWindowStateStore
{
public:
    explicit SettingsWindowStateStore(Utils::Environment environment);

    Utils::Result writeSurfaceRecord(SurfaceKind kind, const QString& key,
                                     const SurfaceStateRecord& record) override;
    std::optional<SurfaceStateRecord> readSurfaceRecord(SurfaceKind kind,
                                                        const QString& key) const override;

    Utils::Result writeMainWindowRecord(const MainWindowStateRecord& record) override;
    std::optional<MainWindowStateRecord> readMainWindowRecord() const override;

    // Keys that have a record for `kind`, in no particular order.
    QStringList recordedKeys(SurfaceKind kind) const;

    const Utils::Environment& environment() const { return m_env; }

    static QString settingsKey(SurfaceKind kind, const QString& key, QStringView field);
    static Utils::Environment makeEnvironment(const QString& configRootOverride = {});

private:
    Utils::Environment m_env;
};

} // namespace Windowing
