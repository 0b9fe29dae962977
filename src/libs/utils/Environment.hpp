// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QStringView>
#include <QtCore/QVariant>

#include <utility>

namespace Utils {

// Each scope is backed by its own settings file so that window placement
// can be wiped without touching user preferences.
enum class EnvironmentScope : unsigned char {
    Application,
    WindowState
};

struct EnvironmentConfig final {
    QString organizationName;
    QString applicationName;

    // Empty means the platform's writable config location.
    QString configRootOverride;
};

struct EnvironmentPaths final {
    QString configDir;      // resolved absolute
    QString applicationSettingsFile;
    QString windowStateFile;
};

template <typename PersistencePolicy>
class BasicEnvironment final {
public:
    using Policy = PersistencePolicy;
    using SettingsHandle = typename Policy::SettingsHandle;

    explicit BasicEnvironment(EnvironmentConfig config, Policy policy = Policy{})
        : m_config(std::move(config))
        , m_policy(std::move(policy))
        , m_paths(m_policy.resolvePaths(m_config))
    {}

    const EnvironmentConfig& config() const noexcept { return m_config; }
    const EnvironmentPaths& paths()  const noexcept { return m_paths; }
    const Policy& policy() const noexcept { return m_policy; }

    QVariant setting(EnvironmentScope scope, QStringView key, const QVariant& def = {}) const
    {
        return m_policy.open(scope, m_paths).value(key, def);
    }

    Result setSetting(EnvironmentScope scope, QStringView key, const QVariant& value)
    {
        auto h = m_policy.open(scope, m_paths);
        h.setValue(key, value);
        return sync(h, key);
    }

    // Writes several keys under one sync. On failure the error names the first
    // key in iteration order, so pass an ordered container (QMap).
    template <typename Container>
    Result setSettings(EnvironmentScope scope, const Container& values)
    {
        if (values.isEmpty())
            return Result::success();

        auto h = m_policy.open(scope, m_paths);
        for (auto it = values.cbegin(); it != values.cend(); ++it)
            h.setValue(it.key(), it.value());
        return sync(h, values.cbegin().key());
    }

    Result removeSetting(EnvironmentScope scope, QStringView key)
    {
        auto h = m_policy.open(scope, m_paths);
        h.remove(key);
        return sync(h, key);
    }

    bool hasSetting(EnvironmentScope scope, QStringView key) const
    {
        return m_policy.open(scope, m_paths).contains(key);
    }

    QStringList childGroups(EnvironmentScope scope, QStringView group) const
    {
        return m_policy.open(scope, m_paths).childGroups(group);
    }

private:
    static Result sync(SettingsHandle& h, QStringView key)
    {
        QString err;
        if (h.sync(&err))
            return Result::success();
        return Result::failure(QStringLiteral("Failed to persist '%1': %2")
                                   .arg(key.toString(),
                                        err.isEmpty() ? QStringLiteral("unknown error") : err),
                               key.toString());
    }

    EnvironmentConfig m_config;
    Policy m_policy;
    EnvironmentPaths m_paths;
};

} // namespace Utils
