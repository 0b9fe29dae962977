// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/async/DeferredAction.hpp"

#include <QtCore/QCoreApplication>
#include <QtTest/QSignalSpy>
#include <QtTest/QTest>

#include <memory>

using Utils::Async::DeferredAction;

namespace {

QCoreApplication* ensureApp()
{
    static QCoreApplication* app = []() {
        static int argc = 1;
        static char arg0[] = "utils-deferred-tests";
        static char* argv[] = { arg0, nullptr };
        return new QCoreApplication(argc, argv);
    }();
    return app;
}

DeferredAction::Outcome outcomeAt(const QSignalSpy& spy, int index)
{
    return spy.at(index).at(0).value<DeferredAction::Outcome>();
}

} // namespace

TEST(DeferredActionTests, BurstOfSchedulesRunsOnce)
{
    ensureApp();

    int calls = 0;
    DeferredAction action(10, [&calls] { ++calls; });
    QSignalSpy finished(&action, &DeferredAction::finished);

    action.schedule();
    action.schedule();
    action.schedule();
    EXPECT_TRUE(action.isScheduled());

    ASSERT_TRUE(finished.wait(1000));
    QTest::qWait(30);
    EXPECT_EQ(calls, 1);
    ASSERT_EQ(finished.count(), 1);
    EXPECT_EQ(outcomeAt(finished, 0), DeferredAction::Outcome::Ran);
}

TEST(DeferredActionTests, CancelDropsPendingRun)
{
    ensureApp();

    int calls = 0;
    DeferredAction action(5, [&calls] { ++calls; });

    action.schedule();
    action.cancel();
    EXPECT_FALSE(action.isScheduled());

    QTest::qWait(30);
    EXPECT_EQ(calls, 0);
}

TEST(DeferredActionTests, NegativeDelayIsClamped)
{
    ensureApp();

    DeferredAction action(-20, [] {});
    EXPECT_EQ(action.delayMs(), 0);
}

TEST(DeferredActionTests, DestroyedGuardSkipsAction)
{
    ensureApp();

    int calls = 0;
    auto guard = std::make_unique<QObject>();
    DeferredAction action(5, [&calls] { ++calls; });
    action.guardWith(guard.get());
    QSignalSpy finished(&action, &DeferredAction::finished);

    action.schedule();
    guard.reset();

    ASSERT_TRUE(finished.wait(1000));
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(outcomeAt(finished, 0), DeferredAction::Outcome::GuardDestroyed);
}

TEST(DeferredActionTests, PredicateCanRejectAction)
{
    ensureApp();

    int calls = 0;
    bool wanted = false;
    QObject guard;
    DeferredAction action(5, [&calls] { ++calls; });
    action.guardWith(&guard, [&wanted] { return wanted; });
    QSignalSpy finished(&action, &DeferredAction::finished);

    action.schedule();
    ASSERT_TRUE(finished.wait(1000));
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(outcomeAt(finished, 0), DeferredAction::Outcome::NoLongerWanted);

    wanted = true;
    action.schedule();
    ASSERT_TRUE(finished.wait(1000));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(outcomeAt(finished, 1), DeferredAction::Outcome::Ran);
}
