// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

namespace Shell::Constants {

inline constexpr char kMainWindowObjectName[] = "isopgem.shell";
inline constexpr char kMainToolbarObjectName[] = "mainToolbar";
inline constexpr char kStatusLabelObjectName[] = "statusLabel";

inline constexpr int kStatusMessageTimeoutMs = 4000;

} // namespace Shell::Constants
