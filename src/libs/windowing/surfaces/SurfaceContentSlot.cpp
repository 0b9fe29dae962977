// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "windowing/surfaces/SurfaceContentSlot.hpp"
#include "windowing/WindowingConstants.hpp"

#include <QtWidgets/QVBoxLayout>

namespace Windowing::Internal {

SurfaceContentSlot::SurfaceContentSlot(QWidget* host, int margin)
    : m_host(host)
{
    Q_ASSERT(host);
    auto* layout = new QVBoxLayout(host);
    layout->setContentsMargins(margin, margin, margin, margin);
    layout->setSpacing(0);
    m_layout = layout;
}

bool SurfaceContentSlot::setContent(QWidget* widget, QString* errorOut)
{
    if (!widget) {
        const QString msg = QStringLiteral("Cannot set null content");
        qCWarning(windowinglog).noquote() << msg;
        if (errorOut) *errorOut = msg;
        return false;
    }
    if (!m_host || !m_layout) {
        if (errorOut) *errorOut = QStringLiteral("Content host is gone");
        return false;
    }
    if (widget == content())
        return true;

    if (QWidget* previous = takeContent()) {
        previous->hide();
        previous->deleteLater();
    }

    widget->setParent(m_host);
    if (widget->minimumWidth() == 0 && widget->minimumHeight() == 0)
        widget->setMinimumSize(Constants::kMinimumContentWidth, Constants::kMinimumContentHeight);

    m_layout->addWidget(widget);
    widget->setVisible(true);
    m_content = widget;

    if (errorOut) errorOut->clear();
    return true;
}

QWidget* SurfaceContentSlot::takeContent()
{
    QWidget* current = content();
    m_content.clear();
    if (!current)
        return nullptr;

    if (m_layout)
        m_layout->removeWidget(current);
    current->setParent(nullptr);
    return current;
}

QWidget* SurfaceContentSlot::content() const
{
    // Content that was re-parented elsewhere no longer belongs to this slot.
    if (!m_content || m_content->parentWidget() != m_host)
        return nullptr;
    return m_content;
}

} // namespace Windowing::Internal
