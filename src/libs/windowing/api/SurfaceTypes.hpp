// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "windowing/WindowingGlobal.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include <optional>

namespace Windowing {

enum class SurfaceKind : unsigned char {
    Panel,
    AuxiliaryWindow
};

// Created -> Shown <-> Hidden -> Destroyed. Destroyed is terminal.
enum class SurfaceState : unsigned char {
    Created,
    Shown,
    Hidden,
    Destroyed
};

WINDOWING_EXPORT QString surfaceKindName(SurfaceKind kind);
WINDOWING_EXPORT QString surfaceStateName(SurfaceState state);

struct SurfaceStateRecord final {
    QByteArray geometry;
    bool visible = false;

    // Panels only.
    std::optional<bool> floating;
};

struct MainWindowStateRecord final {
    QByteArray geometry;
    QByteArray state;

    bool isEmpty() const { return geometry.isEmpty() && state.isEmpty(); }
};

} // namespace Windowing
