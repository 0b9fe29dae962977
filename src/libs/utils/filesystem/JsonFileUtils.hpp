// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Utils::JsonFileUtils {

struct JsonReadResult final {
    enum class Status : unsigned char {
        Ok,
        NotFound,
        Invalid
    };

    Status status = Status::NotFound;
    QJsonObject object;
    QString error;

    bool isOk() const { return status == Status::Ok; }
};

UTILS_EXPORT JsonReadResult readObject(const QString& path);

// Recursive merge: nested objects merge key by key, any other value in
// `overrides` replaces the one in `base`.
UTILS_EXPORT QJsonObject mergeObjects(const QJsonObject& base, const QJsonObject& overrides);

} // namespace Utils::JsonFileUtils
