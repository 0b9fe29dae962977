// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "windowing/tabs/ColoredTabBar.hpp"

#include <QtGui/QPainter>
#include <QtWidgets/QStyleOptionTab>
#include <QtWidgets/QStylePainter>

#include <algorithm>

namespace Windowing {

namespace {

constexpr qreal kCornerRadius = 4.0;

int lightenChannel(int value, double factor)
{
    return static_cast<int>(value + (255 - value) * factor);
}

} // namespace

ColoredTabBar::ColoredTabBar(QWidget* parent)
    : QTabBar(parent)
{
}

void ColoredTabBar::setTabColor(int index, const QColor& color)
{
    if (index < 0)
        return;
    if (color.isValid())
        m_colors.insert(index, color);
    else
        m_colors.remove(index);
    update();
}

QColor ColoredTabBar::lightenColor(const QColor& color, double factor)
{
    const double f = std::clamp(factor, 0.0, 1.0);
    const QColor rgb = color.toRgb();
    return QColor(lightenChannel(rgb.red(), f),
                  lightenChannel(rgb.green(), f),
                  lightenChannel(rgb.blue(), f));
}

void ColoredTabBar::paintEvent(QPaintEvent* event)
{
    if (m_colors.isEmpty()) {
        QTabBar::paintEvent(event);
        return;
    }

    QStylePainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);

    for (int i = 0; i < count(); ++i) {
        QStyleOptionTab option;
        initStyleOption(&option, i);
        const QRect rect = tabRect(i);
        const auto it = m_colors.constFind(i);

        if (it == m_colors.constEnd()) {
            painter.drawControl(QStyle::CE_TabBarTab, option);
            continue;
        }

        const QColor accent = it.value();
        const bool selected = currentIndex() == i;

        painter.save();
        painter.setPen(Qt::NoPen);
        painter.setBrush(selected ? accent : lightenColor(accent, kInactiveLightenFactor));
        painter.drawRoundedRect(rect, kCornerRadius, kCornerRadius);
        if (!selected) {
            painter.setBrush(accent);
            painter.drawRect(rect.adjusted(0, 0, 0, -rect.height() + kAccentBarHeight));
        }
        painter.restore();

        painter.save();
        painter.setPen(selected ? QColor(Qt::white) : QColor(Qt::black));
        painter.drawText(rect.adjusted(8, 4, -8, -4), Qt::AlignCenter, tabText(i));
        painter.restore();
    }
}

} // namespace Windowing
