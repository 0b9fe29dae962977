// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "windowing/WindowingGlobal.hpp"

#include <QtCore/QPointer>
#include <QtWidgets/QWidget>

QT_BEGIN_NAMESPACE
class QVBoxLayout;
QT_END_NAMESPACE

namespace Windowing::Internal {

// Holds at most one content widget inside a host widget. The slot owns the
// content (through Qt parenting) until it is replaced or taken.
class WINDOWING_EXPORT SurfaceContentSlot final
{
public:
    SurfaceContentSlot(QWidget* host, int margin);

    QWidget* host() const { return m_host; }

    bool setContent(QWidget* widget, QString* errorOut = nullptr);
    QWidget* takeContent();
    QWidget* content() const;

private:
    QPointer<QWidget> m_host;
    QPointer<QVBoxLayout> m_layout;
    QPointer<QWidget> m_content;
};

} // namespace Windowing::Internal
