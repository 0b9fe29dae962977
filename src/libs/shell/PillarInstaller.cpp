// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "shell/PillarInstaller.hpp"

#include <windowing/WindowManager.hpp>
#include <windowing/surfaces/AuxiliaryWindow.hpp>
#include <windowing/surfaces/PanelWidget.hpp>

#include <QtWidgets/QLabel>
#include <QtWidgets/QPushButton>
#include <QtWidgets/QVBoxLayout>
#include <QtWidgets/QWidget>

#include <utility>

namespace Shell {

using namespace Qt::StringLiterals;
using Windowing::TabManager;

namespace {

PillarTool windowTool(QString label, QString toolTip, QString key, QString title, bool multiInstance = false)
{
    PillarTool tool;
    tool.role = TabManager::ButtonRole::Window;
    tool.label = std::move(label);
    tool.toolTip = std::move(toolTip);
    tool.key = std::move(key);
    tool.title = std::move(title);
    tool.multiInstance = multiInstance;
    return tool;
}

PillarTool panelTool(QString label, QString toolTip, QString key, QString title)
{
    PillarTool tool = windowTool(std::move(label), std::move(toolTip), std::move(key), std::move(title));
    tool.role = TabManager::ButtonRole::Panel;
    return tool;
}

} // namespace

PillarInstaller::PillarInstaller(Windowing::TabManager* tabs, Windowing::WindowManager* windows)
    : m_tabs(tabs)
    , m_windows(windows)
{
}

PillarDefinition PillarInstaller::gematria()
{
    return {u"Gematria"_s,
            {windowTool(u"Word Abacus"_s, u"Open Gematria Word Abacus"_s,
                        u"gematria_word_abacus"_s, u"Gematria Word Abacus"_s),
             windowTool(u"Calculation History"_s, u"Open Calculation History"_s,
                        u"gematria_calculation_history"_s, u"Calculation History"_s),
             panelTool(u"Manage Tags"_s, u"Open Tag Management"_s,
                       u"gematria_tag_management"_s, u"Tag Management"_s)}};
}

PillarDefinition PillarInstaller::geometry()
{
    return {u"Geometry"_s,
            {windowTool(u"Shapes"_s, u"Open Sacred Geometry Shapes"_s,
                        u"geometry_shapes"_s, u"Sacred Geometry Shapes"_s),
             windowTool(u"Calculator"_s, u"Open Geometry Calculator"_s,
                        u"geometry_calculator"_s, u"Geometry Calculator"_s)}};
}

PillarDefinition PillarInstaller::documentManager()
{
    return {u"Document Manager"_s,
            {windowTool(u"Documents"_s, u"Open Document Manager"_s,
                        u"document_manager"_s, u"Document Manager"_s)}};
}

PillarDefinition PillarInstaller::astrology()
{
    return {u"Astrology"_s,
            {windowTool(u"Chart"_s, u"Open Astrology Chart"_s,
                        u"astrology_chart"_s, u"Astrology Chart"_s, true)}};
}

PillarDefinition PillarInstaller::tq()
{
    return {u"TQ"_s,
            {panelTool(u"Analyzer"_s, u"Open TQ Analyzer"_s, u"tq_analyzer"_s, u"TQ Analyzer"_s)}};
}

QStringList PillarInstaller::installEnabled(const Config::PillarsSettings& pillars)
{
    const struct {
        bool enabled;
        PillarDefinition (*definition)();
    } table[] = {
        {pillars.gematria.enabled, &PillarInstaller::gematria},
        {pillars.geometry.enabled, &PillarInstaller::geometry},
        {pillars.documentManager.enabled, &PillarInstaller::documentManager},
        {pillars.astrology.enabled, &PillarInstaller::astrology},
        {pillars.tq.enabled, &PillarInstaller::tq},
    };

    QStringList tabIds;
    for (const auto& entry : table) {
        const PillarDefinition pillar = entry.definition();
        if (!entry.enabled) {
            qCDebug(shelllog) << pillar.tabTitle << "pillar is disabled";
            continue;
        }
        const QString tabId = install(pillar);
        if (!tabId.isEmpty())
            tabIds.push_back(tabId);
    }
    return tabIds;
}

QString PillarInstaller::install(const PillarDefinition& pillar)
{
    if (!m_tabs || !m_windows) {
        qCWarning(shelllog) << "Cannot install pillar" << pillar.tabTitle << "without tabs and windows";
        return {};
    }

    qCInfo(shelllog) << "Initializing" << pillar.tabTitle << "pillar";
    const QString tabId = m_tabs->addTab(pillar.tabTitle);

    for (const PillarTool& tool : pillar.tools) {
        auto handler = [this, tool] { openTool(tool); };
        QString error;
        QPushButton* button = tool.role == TabManager::ButtonRole::Panel
            ? m_tabs->addPanelButton(tabId, tool.label, tool.toolTip, handler, &error)
            : m_tabs->addWindowButton(tabId, tool.label, tool.toolTip, handler, &error);
        if (!button)
            qCWarning(shelllog).noquote() << u"Skipping tool '%1': %2"_s.arg(tool.label, error);
    }

    qCDebug(shelllog) << pillar.tabTitle << "pillar initialized with" << pillar.tools.size() << "tools";
    return tabId;
}

void PillarInstaller::openTool(const PillarTool& tool) const
{
    if (!m_windows)
        return;

    if (tool.role == TabManager::ButtonRole::Panel) {
        // Hidden panels are reused together with their content.
        const Windowing::PanelWidget* existing = m_windows->panel(tool.key);
        QWidget* content = existing && existing->content() ? nullptr : createPlaceholder(tool.title);
        m_windows->openPanel(tool.key, content, tool.title);
        return;
    }

    if (tool.multiInstance) {
        m_windows->openMultiWindow(tool.key, createPlaceholder(tool.title), tool.title);
        return;
    }

    // A hidden window is replaced by the registry, so it needs new content.
    const Windowing::AuxiliaryWindow* existing = m_windows->auxiliaryWindow(tool.key);
    const bool reusable = existing && existing->isVisible() && existing->content();
    m_windows->openWindow(tool.key, reusable ? nullptr : createPlaceholder(tool.title), tool.title);
}

QWidget* PillarInstaller::createPlaceholder(const QString& title)
{
    auto* content = new QWidget;
    content->setObjectName(u"placeholder"_s);
    auto* layout = new QVBoxLayout(content);
    auto* label = new QLabel(u"%1 will be implemented soon"_s.arg(title), content);
    label->setAlignment(Qt::AlignCenter);
    layout->addWidget(label);
    return content;
}

} // namespace Shell
