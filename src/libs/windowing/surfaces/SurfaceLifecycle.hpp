// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "windowing/WindowingGlobal.hpp"
#include "windowing/api/SurfaceTypes.hpp"

namespace Windowing::Internal {

class WINDOWING_EXPORT SurfaceLifecycle final
{
public:
    SurfaceState state() const noexcept { return m_state; }
    bool hasBeenShown() const noexcept { return m_shownOnce; }
    bool isDestroyed() const noexcept { return m_state == SurfaceState::Destroyed; }

    // Each returns true when the state actually changed. Nothing leaves
    // Destroyed.
    bool markShown();
    bool markHidden();
    bool markDestroyed();

private:
    SurfaceState m_state = SurfaceState::Created;
    bool m_shownOnce = false;
};

} // namespace Windowing::Internal
