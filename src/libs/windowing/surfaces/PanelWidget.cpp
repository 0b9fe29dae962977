// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "windowing/surfaces/PanelWidget.hpp"
#include "windowing/WindowingConstants.hpp"

#include <QtGui/QCloseEvent>
#include <QtGui/QHideEvent>
#include <QtGui/QShowEvent>

namespace Windowing {

using namespace Qt::StringLiterals;

PanelWidget::PanelWidget(const QString& title, const Config::ThemeColors& colors, QWidget* parent)
    : QDockWidget(title, parent)
    , m_slot(new QWidget(this), Constants::kPanelContentMargin)
{
    setAttribute(Qt::WA_DeleteOnClose);
    setAllowedAreas(Qt::AllDockWidgetAreas);
    setFeatures(QDockWidget::DockWidgetMovable
                | QDockWidget::DockWidgetFloatable
                | QDockWidget::DockWidgetClosable);
    setWidget(m_slot.host());
    applyTheme(colors);
}

PanelWidget::~PanelWidget()
{
    m_lifecycle.markDestroyed();
}

void PanelWidget::attachToRegistry(const QString& key, quint64 instanceId)
{
    m_key = key;
    m_instanceId = instanceId;
    // QMainWindow::saveState() identifies dock widgets by object name.
    setObjectName(QString::fromLatin1(Constants::kPanelObjectNamePrefix) + key);
}

bool PanelWidget::setContent(QWidget* content, QString* errorOut)
{
    if (m_lifecycle.isDestroyed()) {
        if (errorOut) *errorOut = u"Panel '%1' is closed"_s.arg(m_key);
        return false;
    }
    return m_slot.setContent(content, errorOut);
}

QWidget* PanelWidget::takeContent()
{
    return m_slot.takeContent();
}

QWidget* PanelWidget::content() const
{
    return m_slot.content();
}

void PanelWidget::bringToFront()
{
    show();
    raise();
    if (isFloating())
        activateWindow();
}

void PanelWidget::showEvent(QShowEvent* event)
{
    QDockWidget::showEvent(event);
    if (m_lifecycle.markShown())
        emit surfaceStateChanged(m_lifecycle.state());
}

void PanelWidget::hideEvent(QHideEvent* event)
{
    QDockWidget::hideEvent(event);
    if (!event->spontaneous() && m_lifecycle.markHidden())
        emit surfaceStateChanged(m_lifecycle.state());
}

void PanelWidget::closeEvent(QCloseEvent* event)
{
    QDockWidget::closeEvent(event);
    if (!event->isAccepted())
        return;

    if (m_lifecycle.markDestroyed()) {
        qCDebug(windowinglog) << "Panel closed:" << m_key << m_instanceId;
        emit surfaceStateChanged(SurfaceState::Destroyed);
        emit surfaceClosed(m_key, m_instanceId);
    }
}

void PanelWidget::applyTheme(const Config::ThemeColors& colors)
{
    setStyleSheet(uR"(
        QDockWidget {
            border: 1px solid #cccccc;
            background-color: %1;
        }
        QDockWidget::title {
            text-align: center;
            background-color: %2;
            color: white;
            padding: 6px;
        }
        QDockWidget::close-button, QDockWidget::float-button {
            background-color: %1;
            border: none;
            padding: 0px;
        }
    )"_s.arg(colors.background.name(), colors.primary.name()));
}

} // namespace Windowing
