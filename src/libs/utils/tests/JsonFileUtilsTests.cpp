// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QTemporaryDir>

using Utils::JsonFileUtils::JsonReadResult;
using Utils::JsonFileUtils::mergeObjects;
using Utils::JsonFileUtils::readObject;

namespace {

void writeFile(const QString& path, const QByteArray& bytes)
{
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
    f.write(bytes);
}

} // namespace

TEST(JsonFileUtilsTests, MissingFileIsNotFound)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    const auto r = readObject(QDir(temp.path()).filePath(QStringLiteral("nope.json")));
    EXPECT_EQ(r.status, JsonReadResult::Status::NotFound);
    EXPECT_FALSE(r.isOk());
}

TEST(JsonFileUtilsTests, EmptyFileIsAnEmptyObject)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const QString path = QDir(temp.path()).filePath(QStringLiteral("empty.json"));
    writeFile(path, "  \n");

    const auto r = readObject(path);
    EXPECT_TRUE(r.isOk());
    EXPECT_TRUE(r.object.isEmpty());
}

TEST(JsonFileUtilsTests, MalformedAndNonObjectDocumentsAreInvalid)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const QString broken = QDir(temp.path()).filePath(QStringLiteral("broken.json"));
    const QString array = QDir(temp.path()).filePath(QStringLiteral("array.json"));
    writeFile(broken, "{\"a\": ");
    writeFile(array, "[1, 2]");

    const auto r1 = readObject(broken);
    EXPECT_EQ(r1.status, JsonReadResult::Status::Invalid);
    EXPECT_FALSE(r1.error.isEmpty());

    const auto r2 = readObject(array);
    EXPECT_EQ(r2.status, JsonReadResult::Status::Invalid);
}

TEST(JsonFileUtilsTests, MergeRecursesIntoNestedObjects)
{
    QJsonObject base{
        {QStringLiteral("app"), QJsonObject{{QStringLiteral("name"), QStringLiteral("IsopGem")},
                                            {QStringLiteral("debug"), false}}},
        {QStringLiteral("list"), QJsonArray{1, 2}},
    };
    QJsonObject overrides{
        {QStringLiteral("app"), QJsonObject{{QStringLiteral("debug"), true}}},
        {QStringLiteral("list"), QJsonArray{3}},
        {QStringLiteral("extra"), 7},
    };

    const QJsonObject merged = mergeObjects(base, overrides);
    const QJsonObject app = merged.value(QStringLiteral("app")).toObject();
    EXPECT_EQ(app.value(QStringLiteral("name")).toString(), QStringLiteral("IsopGem"));
    EXPECT_TRUE(app.value(QStringLiteral("debug")).toBool());
    EXPECT_EQ(merged.value(QStringLiteral("list")).toArray().size(), 1);
    EXPECT_EQ(merged.value(QStringLiteral("extra")).toInt(), 7);
}

TEST(JsonFileUtilsTests, MergeReplacesObjectWithScalar)
{
    QJsonObject base{{QStringLiteral("theme"), QJsonObject{{QStringLiteral("x"), 1}}}};
    QJsonObject overrides{{QStringLiteral("theme"), QStringLiteral("dark")}};

    const QJsonObject merged = mergeObjects(base, overrides);
    EXPECT_EQ(merged.value(QStringLiteral("theme")).toString(), QStringLiteral("dark"));
}
