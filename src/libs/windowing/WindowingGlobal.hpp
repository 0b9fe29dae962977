// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(ISOPGEM_WINDOWING_BUILD_SHARED) && (ISOPGEM_WINDOWING_BUILD_SHARED == 1)
#	if defined(ISOPGEM_WINDOWING_LIBRARY)
#		define WINDOWING_EXPORT Q_DECL_EXPORT
#	else
#		define WINDOWING_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define WINDOWING_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(windowinglog)
