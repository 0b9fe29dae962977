// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "windowing/state/SettingsWindowStateStore.hpp"

#include <QtCore/QFile>
#include <QtCore/QSettings>
#include <QtCore/QTemporaryDir>

using namespace Qt::StringLiterals;

using Windowing::MainWindowStateRecord;
using Windowing::SettingsWindowStateStore;
using Windowing::SurfaceKind;
using Windowing::SurfaceStateRecord;

TEST(SettingsWindowStateStoreTests, KeysFollowPersistedLayout)
{
    EXPECT_EQ(SettingsWindowStateStore::settingsKey(SurfaceKind::Panel, u"calc"_s, u"floating"),
              u"panels/calc/floating"_s);
    EXPECT_EQ(SettingsWindowStateStore::settingsKey(SurfaceKind::AuxiliaryWindow, u"chart"_s, u"geometry"),
              u"auxiliaryWindows/chart/geometry"_s);
}

TEST(SettingsWindowStateStoreTests, SurfaceRecordRoundTripsThroughIniFile)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    {
        SettingsWindowStateStore store(SettingsWindowStateStore::makeEnvironment(temp.path()));

        SurfaceStateRecord panel;
        panel.geometry = QByteArray("panel-geometry");
        panel.visible = false;
        panel.floating = true;
        ASSERT_TRUE(store.writeSurfaceRecord(SurfaceKind::Panel, u"calc"_s, panel).ok());

        SurfaceStateRecord window;
        window.geometry = QByteArray("window-geometry");
        window.visible = true;
        window.floating = true; // ignored for windows
        ASSERT_TRUE(store.writeSurfaceRecord(SurfaceKind::AuxiliaryWindow, u"chart"_s, window).ok());
    }

    SettingsWindowStateStore reopened(SettingsWindowStateStore::makeEnvironment(temp.path()));

    const auto panel = reopened.readSurfaceRecord(SurfaceKind::Panel, u"calc"_s);
    ASSERT_TRUE(panel.has_value());
    EXPECT_EQ(panel->geometry, QByteArray("panel-geometry"));
    EXPECT_FALSE(panel->visible);
    ASSERT_TRUE(panel->floating.has_value());
    EXPECT_TRUE(*panel->floating);

    const auto window = reopened.readSurfaceRecord(SurfaceKind::AuxiliaryWindow, u"chart"_s);
    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(window->geometry, QByteArray("window-geometry"));
    EXPECT_TRUE(window->visible);
    EXPECT_FALSE(window->floating.has_value());

    QSettings raw(reopened.environment().paths().windowStateFile, QSettings::IniFormat);
    EXPECT_TRUE(raw.contains(u"panels/calc/geometry"_s));
    EXPECT_TRUE(raw.contains(u"panels/calc/visible"_s));
    EXPECT_TRUE(raw.contains(u"panels/calc/floating"_s));
    EXPECT_TRUE(raw.contains(u"auxiliaryWindows/chart/visible"_s));
    EXPECT_FALSE(raw.contains(u"auxiliaryWindows/chart/floating"_s));
}

TEST(SettingsWindowStateStoreTests, MissingRecordIsEmpty)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    SettingsWindowStateStore store(SettingsWindowStateStore::makeEnvironment(temp.path()));
    EXPECT_FALSE(store.readSurfaceRecord(SurfaceKind::Panel, u"nothing"_s).has_value());
    EXPECT_FALSE(store.readMainWindowRecord().has_value());
    EXPECT_TRUE(store.recordedKeys(SurfaceKind::Panel).isEmpty());
}

TEST(SettingsWindowStateStoreTests, KindsDoNotShareRecords)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    SettingsWindowStateStore store(SettingsWindowStateStore::makeEnvironment(temp.path()));
    SurfaceStateRecord record;
    record.visible = true;
    ASSERT_TRUE(store.writeSurfaceRecord(SurfaceKind::Panel, u"shared"_s, record).ok());

    EXPECT_TRUE(store.readSurfaceRecord(SurfaceKind::Panel, u"shared"_s).has_value());
    EXPECT_FALSE(store.readSurfaceRecord(SurfaceKind::AuxiliaryWindow, u"shared"_s).has_value());
    EXPECT_EQ(store.recordedKeys(SurfaceKind::Panel), QStringList{u"shared"_s});
}

TEST(SettingsWindowStateStoreTests, MainWindowRecordRoundTrip)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    SettingsWindowStateStore store(SettingsWindowStateStore::makeEnvironment(temp.path()));
    ASSERT_TRUE(store.writeMainWindowRecord(MainWindowStateRecord{QByteArray("g"), QByteArray("s")}).ok());

    const auto record = store.readMainWindowRecord();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->geometry, QByteArray("g"));
    EXPECT_EQ(record->state, QByteArray("s"));
}

TEST(SettingsWindowStateStoreTests, EmptyKeyIsRejected)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    SettingsWindowStateStore store(SettingsWindowStateStore::makeEnvironment(temp.path()));
    const auto r = store.writeSurfaceRecord(SurfaceKind::Panel, QString(), SurfaceStateRecord{});
    EXPECT_FALSE(r.ok());
}

TEST(SettingsWindowStateStoreTests, UnwritableLocationFails)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    // A regular file where the settings directory should be.
    const QString blocker = temp.filePath(u"blocked"_s);
    QFile f(blocker);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.close();

    SettingsWindowStateStore store(SettingsWindowStateStore::makeEnvironment(blocker));
    SurfaceStateRecord record;
    record.visible = true;
    const auto r = store.writeSurfaceRecord(SurfaceKind::AuxiliaryWindow, u"chart"_s, record);
    EXPECT_FALSE(r.ok());
    EXPECT_TRUE(r.message().contains(u"auxiliaryWindows/chart"_s));
}
