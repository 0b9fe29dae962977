// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "windowing/WindowingGlobal.hpp"

#include <QtCore/QHash>
#include <QtGui/QColor>
#include <QtWidgets/QTabBar>

namespace Windowing {

// Tab bar that paints accented tabs itself: the current one filled with the
// accent and white text, the others in a lightened accent with a 3 px accent
// bar on top. Tabs without an accent use the style.
class WINDOWING_EXPORT ColoredTabBar final : public QTabBar
{
    Q_OBJECT

public:
    explicit ColoredTabBar(QWidget* parent = nullptr);

    void setTabColor(int index, const QColor& color);
    QColor tabColor(int index) const { return m_colors.value(index); }
    bool hasTabColor(int index) const { return m_colors.contains(index); }

    // Moves each channel `factor` of the way towards white (0 keeps the
    // color, 1 gives white).
    static QColor lightenColor(const QColor& color, double factor);

    static constexpr double kInactiveLightenFactor = 0.85;
    static constexpr int kAccentBarHeight = 3;

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    QHash<int, QColor> m_colors;
};

} // namespace Windowing
