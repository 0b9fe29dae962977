// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "windowing/surfaces/AuxiliaryWindow.hpp"
#include "windowing/WindowingConstants.hpp"

#include <utils/async/DeferredAction.hpp>

#include <QtGui/QCloseEvent>
#include <QtGui/QHideEvent>
#include <QtGui/QShowEvent>
#include <QtWidgets/QStatusBar>

namespace Windowing {

using namespace Qt::StringLiterals;

namespace {

constexpr Qt::WindowFlags kAuxiliaryWindowFlags = Qt::Window
                                                  | Qt::WindowStaysOnTopHint
                                                  | Qt::WindowMaximizeButtonHint
                                                  | Qt::WindowMinimizeButtonHint
                                                  | Qt::WindowCloseButtonHint;

} // namespace

AuxiliaryWindow::AuxiliaryWindow(const QString& title, QWidget* parent)
    : QMainWindow(parent, kAuxiliaryWindowFlags)
    , m_slot(new QWidget(this), 0)
    , m_refocus(new Utils::Async::DeferredAction(Constants::kRefocusDelayMs, [this] { refocus(); }, this))
{
    setAttribute(Qt::WA_DeleteOnClose);
    setWindowTitle(title);
    resize(Constants::kAuxiliaryWindowWidth, Constants::kAuxiliaryWindowHeight);
    setMinimumSize(Constants::kMinimumContentWidth, Constants::kMinimumContentHeight);
    statusBar()->setSizeGripEnabled(true);
    setCentralWidget(m_slot.host());

    m_refocus->guardWith(this, [this] { return isVisible() && !m_lifecycle.isDestroyed(); });

    qCDebug(windowinglog) << "Created auxiliary window" << title;
}

AuxiliaryWindow::~AuxiliaryWindow()
{
    m_lifecycle.markDestroyed();
}

void AuxiliaryWindow::attachToRegistry(const QString& key, quint64 instanceId)
{
    m_key = key;
    m_instanceId = instanceId;
    setObjectName(QString::fromLatin1(Constants::kWindowObjectNamePrefix) + key);
}

bool AuxiliaryWindow::setContent(QWidget* content, QString* errorOut)
{
    if (m_lifecycle.isDestroyed()) {
        if (errorOut) *errorOut = u"Window '%1' is closed"_s.arg(m_key);
        return false;
    }
    return m_slot.setContent(content, errorOut);
}

QWidget* AuxiliaryWindow::takeContent()
{
    return m_slot.takeContent();
}

QWidget* AuxiliaryWindow::content() const
{
    return m_slot.content();
}

void AuxiliaryWindow::ensureOnTop()
{
    if (m_lifecycle.isDestroyed())
        return;

    if (isMinimized())
        setWindowState((windowState() & ~Qt::WindowMinimized) | Qt::WindowActive);

    show();
    raise();
    activateWindow();
    m_refocus->schedule();
}

bool AuxiliaryWindow::isRefocusPending() const
{
    return m_refocus->isScheduled();
}

void AuxiliaryWindow::refocus()
{
    raise();
    activateWindow();
}

void AuxiliaryWindow::showEvent(QShowEvent* event)
{
    QMainWindow::showEvent(event);
    if (m_lifecycle.markShown())
        emit surfaceStateChanged(m_lifecycle.state());
}

void AuxiliaryWindow::hideEvent(QHideEvent* event)
{
    QMainWindow::hideEvent(event);
    // Minimizing sends a spontaneous hide; the window is still open.
    if (!event->spontaneous() && m_lifecycle.markHidden())
        emit surfaceStateChanged(m_lifecycle.state());
}

void AuxiliaryWindow::closeEvent(QCloseEvent* event)
{
    QMainWindow::closeEvent(event);
    if (!event->isAccepted())
        return;

    m_refocus->cancel();
    if (m_lifecycle.markDestroyed()) {
        qCDebug(windowinglog) << "Auxiliary window closed:" << m_key << m_instanceId;
        emit surfaceStateChanged(SurfaceState::Destroyed);
        emit surfaceClosed(m_key, m_instanceId);
    }
}

} // namespace Windowing
