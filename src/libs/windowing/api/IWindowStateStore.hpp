// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "windowing/WindowingGlobal.hpp"
#include "windowing/api/SurfaceTypes.hpp"

#include <utils/Result.hpp>

#include <QtCore/QString>

#include <optional>

namespace Windowing {

class WINDOWING_EXPORT IWindowStateStore
{
public:
    virtual ~IWindowStateStore() = default;

    virtual Utils::Result writeSurfaceRecord(SurfaceKind kind, const QString& key,
                                             const SurfaceStateRecord& record) = 0;
    virtual std::optional<SurfaceStateRecord> readSurfaceRecord(SurfaceKind kind,
                                                                const QString& key) const = 0;

    virtual Utils::Result writeMainWindowRecord(const MainWindowStateRecord& record) = 0;
    virtual std::optional<MainWindowStateRecord> readMainWindowRecord() const = 0;
};

} // namespace Windowing
