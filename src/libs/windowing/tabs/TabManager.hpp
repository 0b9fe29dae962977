// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "windowing/WindowingGlobal.hpp"
#include "windowing/tabs/TabButtonDispatcher.hpp"

#include <config/AppConfig.hpp>

#include <QtCore/QHash>
#include <QtCore/QPointer>
#include <QtWidgets/QTabWidget>

#include <optional>

QT_BEGIN_NAMESPACE
class QHBoxLayout;
class QPushButton;
QT_END_NAMESPACE

namespace Windowing {

class ColoredTabBar;

// Permanent launcher tabs. Each tab holds a row of buttons; clicking one
// emits tabButtonClicked(), which is routed through the dispatcher.
class WINDOWING_EXPORT TabManager final : public QTabWidget
{
    Q_OBJECT

public:
    enum class ButtonRole : unsigned char {
        Panel,
        Window
    };

    TabManager(TabButtonDispatcher* dispatcher, const Config::UiSettings& ui, QWidget* parent = nullptr);

    using QTabWidget::addTab;

    // Appends a tab with an empty button row and returns its id ("tab_<index>").
    QString addTab(const QString& title);

    QPushButton* addPanelButton(const QString& tabId,
                                const QString& label,
                                const QString& toolTip = {},
                                TabButtonDispatcher::Handler handler = {},
                                QString* errorOut = nullptr);

    QPushButton* addWindowButton(const QString& tabId,
                                 const QString& label,
                                 const QString& toolTip = {},
                                 TabButtonDispatcher::Handler handler = {},
                                 QString* errorOut = nullptr);

    // Registers "tab_<index>" for tabs added without an id. Empty when the
    // index is out of range.
    QString tabId(int index);
    std::optional<int> tabIndex(const QString& tabId) const;

    QPushButton* button(const QString& tabId, const QString& buttonId) const;
    QStringList buttonIds(const QString& tabId) const;

    ColoredTabBar* coloredTabBar() const { return m_tabBar; }
    TabButtonDispatcher* dispatcher() const { return m_dispatcher; }

    static QString makeTabId(int index);
    static QString makeButtonId(ButtonRole role, const QString& label);

signals:
    void tabButtonClicked(const QString& tabId, const QString& buttonId);

protected:
    void tabInserted(int index) override;

private:
    struct TabEntry final {
        int index = -1;
        QPointer<QHBoxLayout> buttonLayout;
        QHash<QString, QPointer<QPushButton>> buttons;
        QStringList buttonOrder;
    };

    QPushButton* addButton(ButtonRole role,
                           const QString& tabId,
                           const QString& label,
                           const QString& toolTip,
                           TabButtonDispatcher::Handler handler,
                           QString* errorOut);
    void applyAccent(int index);
    QString registerTab(int index, QHBoxLayout* buttonLayout);

    QPointer<TabButtonDispatcher> m_dispatcher;
    ColoredTabBar* m_tabBar = nullptr;
    QHash<QString, QColor> m_accents;
    QHash<QString, TabEntry> m_tabs;
    QHash<int, QString> m_idsByIndex;
};

} // namespace Windowing
