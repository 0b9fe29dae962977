// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Environment.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QSettings>

#include <memory>

namespace Utils {

// INI files under <root>/<organization>/, one per scope.
class UTILS_EXPORT QtEnvironmentPersistencePolicy final {
public:
    // One open settings file. Writes stay in memory until sync().
    class UTILS_EXPORT SettingsHandle final {
    public:
        QVariant value(QStringView key, const QVariant& def) const;
        void setValue(QStringView key, const QVariant& value);
        void remove(QStringView key);
        bool contains(QStringView key) const;
        QStringList childGroups(QStringView group) const;

        // Creates the parent directory when needed, then flushes. False with
        // `error` set when the file could not be written.
        bool sync(QString* error);

    private:
        friend class QtEnvironmentPersistencePolicy;
        std::unique_ptr<QSettings> m_settings;
    };

    EnvironmentPaths resolvePaths(const EnvironmentConfig& cfg) const;
    SettingsHandle open(EnvironmentScope scope, const EnvironmentPaths& paths) const;

    static QString settingsFilePath(EnvironmentScope scope, const EnvironmentPaths& paths);
};

using Environment = BasicEnvironment<QtEnvironmentPersistencePolicy>;

} // namespace Utils
