// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "windowing/WindowingGlobal.hpp"
#include "windowing/api/ISurface.hpp"
#include "windowing/surfaces/SurfaceContentSlot.hpp"
#include "windowing/surfaces/SurfaceLifecycle.hpp"

#include <QtWidgets/QMainWindow>

namespace Utils::Async {
class DeferredAction;
} // namespace Utils::Async

namespace Windowing {

// Parentless top-level window that stays above the shell.
class WINDOWING_EXPORT AuxiliaryWindow final : public QMainWindow, public ISurface
{
    Q_OBJECT

public:
    explicit AuxiliaryWindow(const QString& title, QWidget* parent = nullptr);
    ~AuxiliaryWindow() override;

    SurfaceKind kind() const override { return SurfaceKind::AuxiliaryWindow; }
    QWidget* surfaceWidget() override { return this; }

    QString surfaceKey() const override { return m_key; }
    quint64 instanceId() const override { return m_instanceId; }
    void attachToRegistry(const QString& key, quint64 instanceId) override;

    SurfaceState state() const override { return m_lifecycle.state(); }
    bool hasBeenShown() const override { return m_lifecycle.hasBeenShown(); }

    bool setContent(QWidget* content, QString* errorOut = nullptr) override;
    QWidget* takeContent() override;
    QWidget* content() const override;

    void bringToFront() override { ensureOnTop(); }

    // Restores from minimized, shows, raises and activates, then re-applies
    // focus after a short delay. The delayed step is skipped if the window
    // was closed or hidden in the meantime.
    void ensureOnTop();
    bool isRefocusPending() const;

signals:
    void surfaceClosed(const QString& key, quint64 instanceId);
    void surfaceStateChanged(Windowing::SurfaceState state);

protected:
    void showEvent(QShowEvent* event) override;
    void hideEvent(QHideEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private:
    void refocus();

    Internal::SurfaceContentSlot m_slot;
    Internal::SurfaceLifecycle m_lifecycle;
    Utils::Async::DeferredAction* m_refocus = nullptr;
    QString m_key;
    quint64 m_instanceId = 0;
};

} // namespace Windowing
