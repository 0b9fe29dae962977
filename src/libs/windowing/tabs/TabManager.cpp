// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "windowing/tabs/TabManager.hpp"
#include "windowing/tabs/ColoredTabBar.hpp"
#include "windowing/WindowingConstants.hpp"

#include <QtWidgets/QBoxLayout>
#include <QtWidgets/QPushButton>

namespace Windowing {

using namespace Qt::StringLiterals;

namespace {

constexpr double kPressedLightenFactor = 0.9;

QString accentStyleSheet(const QColor& accent)
{
    return uR"(
        QPushButton:hover {
            border-color: %1;
            color: %1;
        }
        QPushButton:pressed {
            background-color: %2;
        }
        QPushButton:focus {
            border: 2px solid %1;
        }
    )"_s.arg(accent.name(),
             ColoredTabBar::lightenColor(accent, kPressedLightenFactor).name());
}

QString baseStyleSheet(const Config::ThemeColors& colors)
{
    return uR"(
        QTabWidget::pane {
            border-top: 1px solid #cccccc;
            background-color: %1;
        }
        QPushButton {
            background-color: %1;
            color: %2;
            border: 1px solid #cccccc;
            border-radius: 4px;
            padding: 6px 12px;
            min-width: 80px;
        }
        QPushButton:hover {
            background-color: #f5f5f5;
            border: 1px solid %3;
            color: %3;
        }
        QPushButton:pressed {
            background-color: #e0e0e0;
            border: 1px solid %3;
        }
        QPushButton:focus {
            border: 2px solid %3;
            outline: none;
        }
    )"_s.arg(colors.background.name(), colors.text.name(), colors.primary.name());
}

} // namespace

TabManager::TabManager(TabButtonDispatcher* dispatcher, const Config::UiSettings& ui, QWidget* parent)
    : QTabWidget(parent)
    , m_dispatcher(dispatcher)
    , m_tabBar(new ColoredTabBar(this))
    , m_accents(ui.pillarAccents)
{
    setTabBar(m_tabBar);
    setTabsClosable(false);
    setMovable(false);
    setDocumentMode(true);
    setStyleSheet(baseStyleSheet(ui.themeColors));

    if (m_dispatcher)
        connect(this, &TabManager::tabButtonClicked, m_dispatcher, &TabButtonDispatcher::dispatch);
    else
        qCWarning(windowinglog) << "TabManager created without a dispatcher; buttons will do nothing";
}

QString TabManager::makeTabId(int index)
{
    return QString::fromLatin1(Constants::kTabIdPrefix) + QString::number(index);
}

QString TabManager::makeButtonId(ButtonRole role, const QString& label)
{
    const char* prefix = role == ButtonRole::Panel ? Constants::kPanelButtonPrefix
                                                   : Constants::kWindowButtonPrefix;
    return QString::fromLatin1(prefix) + label.toLower().replace(u' ', u'_');
}

QString TabManager::addTab(const QString& title)
{
    auto* container = new QWidget;
    auto* layout = new QVBoxLayout(container);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    auto* buttonBar = new QWidget(container);
    auto* buttonLayout = new QHBoxLayout(buttonBar);
    buttonLayout->setContentsMargins(5, 5, 5, 0);
    buttonLayout->setSpacing(5);
    buttonLayout->addStretch();
    layout->addWidget(buttonBar);
    layout->addStretch();

    const int index = QTabWidget::addTab(container, title);
    const QString id = registerTab(index, buttonLayout);

    container->setObjectName(id);
    buttonBar->setObjectName(id + u"_button_bar"_s);
    applyAccent(index);

    qCDebug(windowinglog) << "Added tab" << id << title;
    return id;
}

QString TabManager::registerTab(int index, QHBoxLayout* buttonLayout)
{
    const QString id = makeTabId(index);
    TabEntry& entry = m_tabs[id];
    entry.index = index;
    if (buttonLayout)
        entry.buttonLayout = buttonLayout;
    m_idsByIndex.insert(index, id);
    return id;
}

QPushButton* TabManager::addPanelButton(const QString& tabId, const QString& label, const QString& toolTip,
                                        TabButtonDispatcher::Handler handler, QString* errorOut)
{
    return addButton(ButtonRole::Panel, tabId, label, toolTip, std::move(handler), errorOut);
}

QPushButton* TabManager::addWindowButton(const QString& tabId, const QString& label, const QString& toolTip,
                                         TabButtonDispatcher::Handler handler, QString* errorOut)
{
    return addButton(ButtonRole::Window, tabId, label, toolTip, std::move(handler), errorOut);
}

QPushButton* TabManager::addButton(ButtonRole role, const QString& tabId, const QString& label,
                                   const QString& toolTip, TabButtonDispatcher::Handler handler,
                                   QString* errorOut)
{
    auto fail = [errorOut](const QString& msg) -> QPushButton* {
        qCWarning(windowinglog).noquote() << msg;
        if (errorOut) *errorOut = msg;
        return nullptr;
    };

    const auto it = m_tabs.find(tabId);
    if (it == m_tabs.end())
        return fail(u"Tab with ID '%1' not found"_s.arg(tabId));

    TabEntry& entry = it.value();
    if (!entry.buttonLayout)
        return fail(u"Tab '%1' has no button row"_s.arg(tabId));

    const QString buttonId = makeButtonId(role, label);
    if (entry.buttons.value(buttonId))
        return fail(u"Button '%1' already exists in tab '%2'"_s.arg(buttonId, tabId));

    auto* btn = new QPushButton(label);
    btn->setToolTip(toolTip);
    btn->setObjectName(tabId + u'_' + buttonId);
    connect(btn, &QPushButton::clicked, this, [this, tabId, buttonId] {
        emit tabButtonClicked(tabId, buttonId);
    });

    // Keep the trailing stretch last.
    entry.buttonLayout->insertWidget(entry.buttonLayout->count() - 1, btn);
    entry.buttons.insert(buttonId, btn);
    entry.buttonOrder.push_back(buttonId);

    if (handler && m_dispatcher)
        m_dispatcher->registerHandler(tabId, buttonId, std::move(handler));

    if (errorOut) errorOut->clear();
    return btn;
}

QString TabManager::tabId(int index)
{
    if (index < 0 || index >= count())
        return {};

    const auto it = m_idsByIndex.constFind(index);
    if (it != m_idsByIndex.constEnd())
        return it.value();
    return registerTab(index, nullptr);
}

std::optional<int> TabManager::tabIndex(const QString& tabId) const
{
    const auto it = m_tabs.constFind(tabId);
    if (it == m_tabs.constEnd())
        return std::nullopt;
    return it->index;
}

QPushButton* TabManager::button(const QString& tabId, const QString& buttonId) const
{
    const auto it = m_tabs.constFind(tabId);
    if (it == m_tabs.constEnd())
        return nullptr;
    return it->buttons.value(buttonId);
}

QStringList TabManager::buttonIds(const QString& tabId) const
{
    const auto it = m_tabs.constFind(tabId);
    return it == m_tabs.constEnd() ? QStringList{} : it->buttonOrder;
}

void TabManager::tabInserted(int index)
{
    QTabWidget::tabInserted(index);
    applyAccent(index);
}

void TabManager::applyAccent(int index)
{
    const QColor accent = m_accents.value(tabText(index));
    if (!accent.isValid())
        return;

    m_tabBar->setTabColor(index, accent);
    if (QWidget* page = widget(index))
        page->setStyleSheet(accentStyleSheet(accent));
}

} // namespace Windowing
