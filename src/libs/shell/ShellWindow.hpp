// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "shell/ShellGlobal.hpp"

#include <config/AppConfig.hpp>

#include <QtCore/QStringList>
#include <QtWidgets/QMainWindow>

#include <memory>

QT_BEGIN_NAMESPACE
class QLabel;
class QToolBar;
QT_END_NAMESPACE

namespace Windowing {
class IWindowStateStore;
class TabManager;
class WindowManager;
} // namespace Windowing

namespace Shell {

class PillarInstaller;

// Main application window. Hosts the pillar tab strip and owns the registry
// for every panel and auxiliary window opened from it.
class SHELL_EXPORT ShellWindow final : public QMainWindow
{
    Q_OBJECT

public:
    // `store` must outlive the window.
    ShellWindow(const Config::AppConfig& config,
                Windowing::IWindowStateStore* store,
                QWidget* parent = nullptr);
    ~ShellWindow() override;

    Windowing::WindowManager* windowManager() const { return m_windows; }
    Windowing::TabManager* tabManager() const { return m_tabs; }
    QStringList pillarTabIds() const { return m_pillarTabIds; }
    QString statusText() const;

    // Applies the persisted layout. Call after the window is shown.
    void restoreLayout();

    // Persists the layout and reports the outcome in the status bar.
    bool saveLayout();

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    void initMenus();
    void initToolBar();
    void initStatusBar();
    void showAbout();
    void onSurfaceClosed(const QString& key);

    Config::AppConfig m_config;
    Windowing::WindowManager* m_windows = nullptr;
    Windowing::TabManager* m_tabs = nullptr;
    std::unique_ptr<PillarInstaller> m_pillars;
    QStringList m_pillarTabIds;
    QToolBar* m_toolBar = nullptr;
    QLabel* m_statusLabel = nullptr;
    bool m_shutDown = false;
};

} // namespace Shell
