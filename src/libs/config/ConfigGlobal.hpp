// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(ISOPGEM_CONFIG_BUILD_SHARED) && (ISOPGEM_CONFIG_BUILD_SHARED == 1)
#	if defined(ISOPGEM_CONFIG_LIBRARY)
#		define CONFIG_EXPORT Q_DECL_EXPORT
#	else
#		define CONFIG_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define CONFIG_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(configlog)
