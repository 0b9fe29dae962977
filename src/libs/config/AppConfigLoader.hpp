// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "config/AppConfig.hpp"

#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Config {

inline constexpr char kEnvironmentVariable[] = "ISOPGEM_ENV";
inline constexpr char kDefaultConfigFile[] = "default.json";

class CONFIG_EXPORT AppConfigLoader final
{
public:
    // Reads <configDir>/default.json and <configDir>/<environment>.json, merges
    // the second over the first and maps the result onto AppConfig::defaults().
    // Missing or malformed files are reported in `warnings` and skipped.
    static AppConfig load(const QString& configDir, Environment environment,
                          QStringList* warnings = nullptr);

    // Command-line value first, then ISOPGEM_ENV, then development.
    static Environment resolveEnvironment(const QString& commandLineValue,
                                          QStringList* warnings = nullptr);

    static QString environmentFileName(Environment environment);
};

} // namespace Config
