// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "windowing/WindowingConstants.hpp"
#include "windowing/surfaces/AuxiliaryWindow.hpp"
#include "windowing/surfaces/PanelWidget.hpp"
#include "windowing/surfaces/SurfaceLifecycle.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QEvent>
#include <QtCore/QPointer>
#include <QtTest/QSignalSpy>
#include <QtTest/QTest>
#include <QtWidgets/QApplication>
#include <QtWidgets/QLabel>
#include <QtWidgets/QStatusBar>

#include <memory>

using namespace Qt::StringLiterals;

namespace {

QApplication* ensureApp()
{
    static QApplication* app = []() {
        if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
            qputenv("QT_QPA_PLATFORM", QByteArrayLiteral("offscreen"));

        static int argc = 1;
        static char arg0[] = "windowing-surface-tests";
        static char* argv[] = {arg0, nullptr};
        return new QApplication(argc, argv);
    }();
    return app;
}

void flushDeferredDeletes()
{
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
}

} // namespace

TEST(SurfaceLifecycleTests, DestroyedIsTerminal)
{
    Windowing::Internal::SurfaceLifecycle lifecycle;
    EXPECT_EQ(lifecycle.state(), Windowing::SurfaceState::Created);

    EXPECT_FALSE(lifecycle.markHidden());
    EXPECT_EQ(lifecycle.state(), Windowing::SurfaceState::Created);

    EXPECT_TRUE(lifecycle.markShown());
    EXPECT_TRUE(lifecycle.hasBeenShown());
    EXPECT_TRUE(lifecycle.markHidden());
    EXPECT_EQ(lifecycle.state(), Windowing::SurfaceState::Hidden);

    EXPECT_TRUE(lifecycle.markDestroyed());
    EXPECT_FALSE(lifecycle.markDestroyed());
    EXPECT_FALSE(lifecycle.markShown());
    EXPECT_EQ(lifecycle.state(), Windowing::SurfaceState::Destroyed);
}

TEST(SurfaceContentTests, ReplacingContentReleasesPreviousWidget)
{
    ensureApp();

    Windowing::AuxiliaryWindow window(u"Content"_s);
    QPointer<QLabel> first = new QLabel(u"first"_s);
    QPointer<QLabel> second = new QLabel(u"second"_s);

    ASSERT_TRUE(window.setContent(first));
    EXPECT_EQ(window.content(), first.data());
    EXPECT_EQ(first->parentWidget(), window.centralWidget());

    ASSERT_TRUE(window.setContent(second));
    EXPECT_EQ(window.content(), second.data());
    ASSERT_TRUE(first);
    EXPECT_EQ(first->parentWidget(), nullptr);

    const auto labels = window.centralWidget()->findChildren<QLabel*>(Qt::FindDirectChildrenOnly);
    EXPECT_EQ(labels.size(), 1);

    flushDeferredDeletes();
    EXPECT_TRUE(first.isNull());
    EXPECT_FALSE(second.isNull());
}

TEST(SurfaceContentTests, SettingSameContentIsNoOp)
{
    ensureApp();

    Windowing::AuxiliaryWindow window(u"Same"_s);
    QPointer<QLabel> label = new QLabel(u"x"_s);

    ASSERT_TRUE(window.setContent(label));
    ASSERT_TRUE(window.setContent(label));
    flushDeferredDeletes();

    ASSERT_FALSE(label.isNull());
    EXPECT_EQ(window.content(), label.data());
}

TEST(SurfaceContentTests, NullContentIsRejected)
{
    ensureApp();

    Windowing::PanelWidget panel(u"Panel"_s, Config::ThemeColors{});
    auto* label = new QLabel(u"kept"_s);
    ASSERT_TRUE(panel.setContent(label));

    QString error;
    EXPECT_FALSE(panel.setContent(nullptr, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_EQ(panel.content(), label);
}

TEST(SurfaceContentTests, MinimumSizeAppliedOnlyWhenUndeclared)
{
    ensureApp();

    Windowing::PanelWidget panel(u"Panel"_s, Config::ThemeColors{});
    auto* plain = new QLabel;
    ASSERT_TRUE(panel.setContent(plain));
    EXPECT_EQ(plain->minimumSize(), QSize(Windowing::Constants::kMinimumContentWidth,
                                          Windowing::Constants::kMinimumContentHeight));

    auto* sized = new QLabel;
    sized->setMinimumSize(120, 80);
    ASSERT_TRUE(panel.setContent(sized));
    EXPECT_EQ(sized->minimumSize(), QSize(120, 80));
}

TEST(SurfaceContentTests, TakeContentHandsOwnershipToCaller)
{
    ensureApp();

    Windowing::AuxiliaryWindow window(u"Take"_s);
    auto* label = new QLabel(u"mine"_s);
    ASSERT_TRUE(window.setContent(label));

    std::unique_ptr<QWidget> taken(window.takeContent());
    EXPECT_EQ(taken.get(), label);
    EXPECT_EQ(taken->parentWidget(), nullptr);
    EXPECT_EQ(window.content(), nullptr);
    EXPECT_EQ(window.takeContent(), nullptr);
}

TEST(AuxiliaryWindowTests, DefaultsMatchToolWindowConventions)
{
    ensureApp();

    Windowing::AuxiliaryWindow window(u"Tool"_s);
    EXPECT_EQ(window.windowTitle(), u"Tool"_s);
    EXPECT_EQ(window.parentWidget(), nullptr);
    EXPECT_TRUE(window.testAttribute(Qt::WA_DeleteOnClose));
    EXPECT_TRUE(window.windowFlags().testFlag(Qt::WindowStaysOnTopHint));
    EXPECT_TRUE(window.windowFlags().testFlag(Qt::WindowMinimizeButtonHint));
    EXPECT_TRUE(window.windowFlags().testFlag(Qt::WindowMaximizeButtonHint));
    EXPECT_TRUE(window.windowFlags().testFlag(Qt::WindowCloseButtonHint));
    EXPECT_EQ(window.size(), QSize(800, 600));
    EXPECT_EQ(window.minimumSize(), QSize(400, 300));
    EXPECT_TRUE(window.statusBar()->isSizeGripEnabled());
    EXPECT_TRUE(window.surfaceKey().isEmpty());
}

TEST(AuxiliaryWindowTests, CloseEntersDestroyedAndNotifiesOnce)
{
    ensureApp();

    QPointer<Windowing::AuxiliaryWindow> window = new Windowing::AuxiliaryWindow(u"Close"_s);
    window->attachToRegistry(u"tool.close"_s, 7);
    QSignalSpy closed(window.data(), &Windowing::AuxiliaryWindow::surfaceClosed);

    window->show();
    EXPECT_EQ(window->state(), Windowing::SurfaceState::Shown);

    EXPECT_TRUE(window->close());
    ASSERT_EQ(closed.count(), 1);
    EXPECT_EQ(closed.at(0).at(0).toString(), u"tool.close"_s);
    EXPECT_EQ(closed.at(0).at(1).toULongLong(), 7u);
    EXPECT_EQ(window->state(), Windowing::SurfaceState::Destroyed);

    QString error;
    EXPECT_FALSE(window->setContent(new QLabel, &error));
    EXPECT_FALSE(error.isEmpty());

    flushDeferredDeletes();
    EXPECT_TRUE(window.isNull());
}

TEST(AuxiliaryWindowTests, HideMovesShownWindowToHidden)
{
    ensureApp();

    Windowing::AuxiliaryWindow window(u"Hide"_s);
    window.show();
    window.hide();
    EXPECT_EQ(window.state(), Windowing::SurfaceState::Hidden);
    EXPECT_TRUE(window.hasBeenShown());

    window.show();
    EXPECT_EQ(window.state(), Windowing::SurfaceState::Shown);
}

TEST(AuxiliaryWindowTests, EnsureOnTopSchedulesRefocusThatSurvivesClose)
{
    ensureApp();

    QPointer<Windowing::AuxiliaryWindow> window = new Windowing::AuxiliaryWindow(u"Focus"_s);
    window->ensureOnTop();
    EXPECT_TRUE(window->isVisible());
    EXPECT_TRUE(window->isRefocusPending());

    window->close();
    EXPECT_FALSE(window->isRefocusPending());
    flushDeferredDeletes();
    EXPECT_TRUE(window.isNull());

    // Nothing must fire against the deleted window.
    QTest::qWait(Windowing::Constants::kRefocusDelayMs * 2);
}

TEST(PanelWidgetTests, PanelIsDockableEverywhere)
{
    ensureApp();

    Config::ThemeColors colors;
    Windowing::PanelWidget panel(u"Dock"_s, colors);
    panel.attachToRegistry(u"calc"_s, 3);

    EXPECT_EQ(panel.windowTitle(), u"Dock"_s);
    EXPECT_TRUE(panel.allowedAreas() == Qt::AllDockWidgetAreas);
    EXPECT_TRUE(panel.features().testFlag(QDockWidget::DockWidgetMovable));
    EXPECT_TRUE(panel.features().testFlag(QDockWidget::DockWidgetFloatable));
    EXPECT_TRUE(panel.features().testFlag(QDockWidget::DockWidgetClosable));
    EXPECT_TRUE(panel.testAttribute(Qt::WA_DeleteOnClose));
    EXPECT_EQ(panel.objectName(), u"panel.calc"_s);
    EXPECT_EQ(panel.kind(), Windowing::SurfaceKind::Panel);
    EXPECT_TRUE(panel.styleSheet().contains(colors.primary.name()));
}
