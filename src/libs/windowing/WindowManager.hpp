// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "windowing/WindowingGlobal.hpp"
#include "windowing/api/IWindowStateStore.hpp"
#include "windowing/api/SurfaceTypes.hpp"
#include "windowing/tabs/TabButtonDispatcher.hpp"

#include <config/AppConfig.hpp>
#include <utils/Result.hpp>

#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QSet>
#include <QtCore/QSize>
#include <QtCore/QStringList>

QT_BEGIN_NAMESPACE
class QMainWindow;
class QWidget;
QT_END_NAMESPACE

namespace Windowing {

class AuxiliaryWindow;
class PanelWidget;

// Registry of every panel and auxiliary window, keyed by caller-chosen
// strings. At most one live surface exists per key, and a key is held by at
// most one kind of surface.
//
// windowClosed(key) fires once per surface instance, whichever of close,
// destruction or discard happens first. Late notifications from an instance
// that has since been replaced never touch the replacement.
class WINDOWING_EXPORT WindowManager final : public QObject
{
    Q_OBJECT

public:
    // `shell` hosts panels and provides the main window record; `store` must
    // outlive the manager.
    WindowManager(QMainWindow* shell,
                  IWindowStateStore* store,
                  const Config::AppConfig& config,
                  QObject* parent = nullptr);
    ~WindowManager() override;

    // Returns the live panel for `key` (shown and raised) or a new one docked
    // in `area`.
    PanelWidget* createPanel(const QString& key,
                             const QString& title,
                             Qt::DockWidgetArea area = Qt::RightDockWidgetArea);

    // Returns the live window for `key`, or a new one when there is none or
    // the cached one was closed or hidden after being shown. A window that
    // was never shown is returned as is. An empty title defaults to the key.
    AuxiliaryWindow* createAuxiliaryWindow(const QString& key, const QString& title = {});

    // create + setContent + show + raise. Null content keeps the current one.
    PanelWidget* openPanel(const QString& key,
                           QWidget* content,
                           const QString& title,
                           Qt::DockWidgetArea area = Qt::RightDockWidgetArea);

    // create + setContent + optional resize + ensureOnTop.
    AuxiliaryWindow* openWindow(const QString& key,
                                QWidget* content,
                                const QString& title = {},
                                const QSize& size = {});

    // Opens a window under "<baseKey>_<8 hex digits>" so that several
    // instances of the same tool can coexist.
    AuxiliaryWindow* openMultiWindow(const QString& baseKey,
                                     QWidget* content,
                                     const QString& title = {},
                                     const QSize& size = {});

    // Brings the surface for `key` to the front. False when unknown.
    bool reapplyZOrder(const QString& key);

    PanelWidget* panel(const QString& key) const;
    AuxiliaryWindow* auxiliaryWindow(const QString& key) const;
    bool hasPanel(const QString& key) const { return panel(key) != nullptr; }
    bool hasWindow(const QString& key) const { return auxiliaryWindow(key) != nullptr; }
    QStringList panelKeys() const;
    QStringList windowKeys() const;

    // Persists the shell record and then every tracked surface. Entries that
    // are gone or fail to persist are dropped (and closed); the others are
    // still written. The result lists every failure.
    Utils::Result saveState();

    // Applies persisted records to the shell and to every tracked surface
    // that has one. Missing records are not errors.
    void restoreState();

    // Requests close on every surface, then forgets all of them.
    void closeAll();

    TabButtonDispatcher* dispatcher() const { return m_dispatcher; }
    void registerTabButtonHandler(const QString& tabId,
                                  const QString& buttonId,
                                  TabButtonDispatcher::Handler handler);

signals:
    void windowClosed(const QString& key);
    void surfaceOpened(const QString& key, Windowing::SurfaceKind kind);

private:
    template <typename T>
    struct Tracked final {
        QPointer<T> surface;
        quint64 instanceId = 0;
    };

    template <typename T>
    void connectSurface(T* surface, SurfaceKind kind, const QString& key, quint64 instanceId);

    void onSurfaceGone(SurfaceKind kind, const QString& key, quint64 instanceId);
    void discard(SurfaceKind kind, const QString& key, const char* reason);
    void evictOtherKind(SurfaceKind wanted, const QString& key);
    bool retire(quint64 instanceId, const QString& key);
    static bool isStale(const AuxiliaryWindow* window);

    QPointer<QMainWindow> m_shell;
    IWindowStateStore* m_store = nullptr;
    Config::ThemeColors m_themeColors;
    TabButtonDispatcher* m_dispatcher = nullptr;

    QHash<QString, Tracked<PanelWidget>> m_panels;
    QHash<QString, Tracked<AuxiliaryWindow>> m_windows;
    QSet<quint64> m_retired;
    quint64 m_nextInstanceId = 1;
};

} // namespace Windowing
