// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "shell/ShellGlobal.hpp"

#include <config/AppConfig.hpp>
#include <windowing/tabs/TabManager.hpp>

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace Windowing {
class WindowManager;
} // namespace Windowing

namespace Shell {

// One launcher button on a pillar tab and the surface it opens.
struct PillarTool final {
    Windowing::TabManager::ButtonRole role = Windowing::TabManager::ButtonRole::Window;
    QString label;
    QString toolTip;
    QString key;
    QString title;
    // Opens a fresh "<key>_<suffix>" window on every click.
    bool multiInstance = false;
};

struct PillarDefinition final {
    QString tabTitle;
    QList<PillarTool> tools;
};

class SHELL_EXPORT PillarInstaller final
{
public:
    PillarInstaller(Windowing::TabManager* tabs, Windowing::WindowManager* windows);

    static PillarDefinition gematria();
    static PillarDefinition geometry();
    static PillarDefinition documentManager();
    static PillarDefinition astrology();
    static PillarDefinition tq();

    // Installs every pillar enabled in `pillars`, in fixed order. Returns the
    // ids of the tabs created.
    QStringList installEnabled(const Config::PillarsSettings& pillars);

    // Adds the pillar's tab and wires each tool through the dispatch table.
    // Tools that cannot be added are skipped with a warning.
    QString install(const PillarDefinition& pillar);

    // Opens the surface behind `tool` with placeholder content.
    void openTool(const PillarTool& tool) const;

    static QWidget* createPlaceholder(const QString& title);

private:
    Windowing::TabManager* m_tabs = nullptr;
    Windowing::WindowManager* m_windows = nullptr;
};

} // namespace Shell
