// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QJsonValue>

namespace Utils::JsonFileUtils {

JsonReadResult readObject(const QString& path)
{
    JsonReadResult result;

    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty()) {
        result.status = JsonReadResult::Status::Invalid;
        result.error = QStringLiteral("JSON input path is empty.");
        return result;
    }

    QFile file(cleanedPath);
    if (!file.exists()) {
        result.status = JsonReadResult::Status::NotFound;
        result.error = QStringLiteral("JSON file not found: %1").arg(cleanedPath);
        return result;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        result.status = JsonReadResult::Status::Invalid;
        result.error = QStringLiteral("Failed to open JSON file: %1 (%2)").arg(cleanedPath, file.errorString());
        return result;
    }

    const QByteArray bytes = file.readAll();
    if (bytes.trimmed().isEmpty()) {
        // An empty file is a valid, empty document.
        result.status = JsonReadResult::Status::Ok;
        return result;
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        result.status = JsonReadResult::Status::Invalid;
        result.error = QStringLiteral("Failed to parse JSON file: %1 (%2)")
                           .arg(cleanedPath, parseError.errorString());
        return result;
    }

    if (!doc.isObject()) {
        result.status = JsonReadResult::Status::Invalid;
        result.error = QStringLiteral("JSON document is not an object: %1").arg(cleanedPath);
        return result;
    }

    result.status = JsonReadResult::Status::Ok;
    result.object = doc.object();
    return result;
}

QJsonObject mergeObjects(const QJsonObject& base, const QJsonObject& overrides)
{
    QJsonObject merged = base;
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        const QJsonValue current = merged.value(it.key());
        if (it.value().isObject() && current.isObject())
            merged.insert(it.key(), mergeObjects(current.toObject(), it.value().toObject()));
        else
            merged.insert(it.key(), it.value());
    }
    return merged;
}

} // namespace Utils::JsonFileUtils
