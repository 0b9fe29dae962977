// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "windowing/WindowingGlobal.hpp"
#include "windowing/api/ISurface.hpp"
#include "windowing/surfaces/SurfaceContentSlot.hpp"
#include "windowing/surfaces/SurfaceLifecycle.hpp"

#include <config/AppConfig.hpp>

#include <QtWidgets/QDockWidget>

namespace Windowing {

// Dockable surface. Movable, floatable and closable in every dock area.
class WINDOWING_EXPORT PanelWidget final : public QDockWidget, public ISurface
{
    Q_OBJECT

public:
    PanelWidget(const QString& title, const Config::ThemeColors& colors, QWidget* parent = nullptr);
    ~PanelWidget() override;

    SurfaceKind kind() const override { return SurfaceKind::Panel; }
    QWidget* surfaceWidget() override { return this; }

    QString surfaceKey() const override { return m_key; }
    quint64 instanceId() const override { return m_instanceId; }
    void attachToRegistry(const QString& key, quint64 instanceId) override;

    SurfaceState state() const override { return m_lifecycle.state(); }
    bool hasBeenShown() const override { return m_lifecycle.hasBeenShown(); }

    bool setContent(QWidget* content, QString* errorOut = nullptr) override;
    QWidget* takeContent() override;
    QWidget* content() const override;

    void bringToFront() override;

signals:
    void surfaceClosed(const QString& key, quint64 instanceId);
    void surfaceStateChanged(Windowing::SurfaceState state);

protected:
    void showEvent(QShowEvent* event) override;
    void hideEvent(QHideEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private:
    void applyTheme(const Config::ThemeColors& colors);

    Internal::SurfaceContentSlot m_slot;
    Internal::SurfaceLifecycle m_lifecycle;
    QString m_key;
    quint64 m_instanceId = 0;
};

} // namespace Windowing
