// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "windowing/surfaces/SurfaceLifecycle.hpp"

namespace Windowing {

using namespace Qt::StringLiterals;

QString surfaceKindName(SurfaceKind kind)
{
    switch (kind) {
        case SurfaceKind::Panel: return u"panel"_s;
        case SurfaceKind::AuxiliaryWindow: return u"window"_s;
    }
    return u"window"_s;
}

QString surfaceStateName(SurfaceState state)
{
    switch (state) {
        case SurfaceState::Created: return u"created"_s;
        case SurfaceState::Shown: return u"shown"_s;
        case SurfaceState::Hidden: return u"hidden"_s;
        case SurfaceState::Destroyed: return u"destroyed"_s;
    }
    return u"destroyed"_s;
}

namespace Internal {

bool SurfaceLifecycle::markShown()
{
    if (m_state == SurfaceState::Destroyed || m_state == SurfaceState::Shown)
        return false;
    m_state = SurfaceState::Shown;
    m_shownOnce = true;
    return true;
}

bool SurfaceLifecycle::markHidden()
{
    // A never-shown surface stays Created: hiding it is not a transition.
    if (m_state != SurfaceState::Shown)
        return false;
    m_state = SurfaceState::Hidden;
    return true;
}

bool SurfaceLifecycle::markDestroyed()
{
    if (m_state == SurfaceState::Destroyed)
        return false;
    m_state = SurfaceState::Destroyed;
    return true;
}

} // namespace Internal

} // namespace Windowing
