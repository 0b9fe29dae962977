// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>

namespace Windowing::Constants {

inline constexpr int kMinimumContentWidth = 400;
inline constexpr int kMinimumContentHeight = 300;

inline constexpr int kAuxiliaryWindowWidth = 800;
inline constexpr int kAuxiliaryWindowHeight = 600;

inline constexpr int kPanelContentMargin = 2;

#if defined(Q_OS_LINUX)
inline constexpr int kRefocusDelayMs = 100;
#else
inline constexpr int kRefocusDelayMs = 50;
#endif

// Length of the random suffix appended by WindowManager::openMultiWindow.
inline constexpr int kMultiWindowSuffixLength = 8;

inline constexpr char kPanelObjectNamePrefix[] = "panel.";
inline constexpr char kWindowObjectNamePrefix[] = "window.";

inline constexpr char kPanelsGroup[] = "panels";
inline constexpr char kWindowsGroup[] = "auxiliaryWindows";
inline constexpr char kMainWindowGroup[] = "mainWindow";

inline constexpr char kTabIdPrefix[] = "tab_";
inline constexpr char kPanelButtonPrefix[] = "panel_";
inline constexpr char kWindowButtonPrefix[] = "window_";

} // namespace Windowing::Constants
