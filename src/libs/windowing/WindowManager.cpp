// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "windowing/WindowManager.hpp"
#include "windowing/WindowingConstants.hpp"
#include "windowing/surfaces/AuxiliaryWindow.hpp"
#include "windowing/surfaces/PanelWidget.hpp"

#include <QtCore/QUuid>
#include <QtWidgets/QMainWindow>

#include <algorithm>

Q_LOGGING_CATEGORY(windowinglog, "isopgem.windowing")

namespace Windowing {

using namespace Qt::StringLiterals;

namespace {

template <typename Map>
QStringList sortedKeys(const Map& map)
{
    QStringList keys = map.keys();
    std::sort(keys.begin(), keys.end());
    return keys;
}

QString randomSuffix()
{
    return QUuid::createUuid().toString(QUuid::Id128).left(Constants::kMultiWindowSuffixLength);
}

} // namespace

WindowManager::WindowManager(QMainWindow* shell,
                             IWindowStateStore* store,
                             const Config::AppConfig& config,
                             QObject* parent)
    : QObject(parent)
    , m_shell(shell)
    , m_store(store)
    , m_themeColors(config.ui.themeColors)
    , m_dispatcher(new TabButtonDispatcher(this))
{
    if (!m_shell)
        qCWarning(windowinglog) << "WindowManager has no shell; panels will float";
    if (!m_store)
        qCWarning(windowinglog) << "WindowManager has no state store; layout will not persist";
}

WindowManager::~WindowManager()
{
    // Windows are parentless, so nothing else would delete them.
    const auto windows = m_windows;
    m_windows.clear();
    for (const auto& entry : windows) {
        if (!entry.surface)
            continue;
        disconnect(entry.surface, nullptr, this, nullptr);
        delete entry.surface.data();
    }
    for (const auto& entry : std::as_const(m_panels)) {
        if (entry.surface)
            disconnect(entry.surface, nullptr, this, nullptr);
    }
}

template <typename T>
void WindowManager::connectSurface(T* surface, SurfaceKind kind, const QString& key, quint64 instanceId)
{
    connect(surface, &T::surfaceClosed, this, [this, kind](const QString& k, quint64 id) {
        onSurfaceGone(kind, k, id);
    });
    // By the time destroyed() fires the surface subobject is gone, so the
    // identity has to be captured here.
    connect(surface, &QObject::destroyed, this, [this, kind, key, instanceId] {
        onSurfaceGone(kind, key, instanceId);
    });
}

PanelWidget* WindowManager::createPanel(const QString& key, const QString& title, Qt::DockWidgetArea area)
{
    if (key.isEmpty()) {
        qCWarning(windowinglog) << "Refusing to create a panel without a key";
        return nullptr;
    }

    evictOtherKind(SurfaceKind::Panel, key);

    const auto it = m_panels.constFind(key);
    if (it != m_panels.constEnd()) {
        PanelWidget* existing = it->surface;
        if (existing && existing->state() != SurfaceState::Destroyed) {
            existing->bringToFront();
            return existing;
        }
        discard(SurfaceKind::Panel, key, "destroyed");
    }

    auto* panel = new PanelWidget(title.isEmpty() ? key : title, m_themeColors, m_shell);
    const quint64 id = m_nextInstanceId++;
    panel->attachToRegistry(key, id);
    connectSurface(panel, SurfaceKind::Panel, key, id);

    if (m_shell)
        m_shell->addDockWidget(area, panel);
    else
        panel->setFloating(true);

    m_panels.insert(key, Tracked<PanelWidget>{panel, id});
    qCDebug(windowinglog) << "Created panel" << key << "instance" << id;
    emit surfaceOpened(key, SurfaceKind::Panel);
    return panel;
}

AuxiliaryWindow* WindowManager::createAuxiliaryWindow(const QString& key, const QString& title)
{
    if (key.isEmpty()) {
        qCWarning(windowinglog) << "Refusing to create a window without a key";
        return nullptr;
    }

    evictOtherKind(SurfaceKind::AuxiliaryWindow, key);

    const auto it = m_windows.constFind(key);
    if (it != m_windows.constEnd()) {
        AuxiliaryWindow* existing = it->surface;
        if (existing && !isStale(existing)) {
            if (existing->isVisible())
                existing->raise();
            return existing;
        }
        discard(SurfaceKind::AuxiliaryWindow, key, "stale");
    }

    auto* window = new AuxiliaryWindow(title.isEmpty() ? key : title);
    const quint64 id = m_nextInstanceId++;
    window->attachToRegistry(key, id);
    connectSurface(window, SurfaceKind::AuxiliaryWindow, key, id);

    m_windows.insert(key, Tracked<AuxiliaryWindow>{window, id});
    qCDebug(windowinglog) << "Created auxiliary window" << key << "instance" << id;
    emit surfaceOpened(key, SurfaceKind::AuxiliaryWindow);
    return window;
}

PanelWidget* WindowManager::openPanel(const QString& key, QWidget* content, const QString& title,
                                      Qt::DockWidgetArea area)
{
    PanelWidget* panel = createPanel(key, title, area);
    if (!panel)
        return nullptr;

    if (content) {
        QString error;
        if (!panel->setContent(content, &error))
            qCWarning(windowinglog).noquote() << u"Panel '%1': %2"_s.arg(key, error);
    }
    panel->bringToFront();
    return panel;
}

AuxiliaryWindow* WindowManager::openWindow(const QString& key, QWidget* content, const QString& title,
                                           const QSize& size)
{
    AuxiliaryWindow* window = createAuxiliaryWindow(key, title);
    if (!window)
        return nullptr;

    if (content) {
        QString error;
        if (!window->setContent(content, &error))
            qCWarning(windowinglog).noquote() << u"Window '%1': %2"_s.arg(key, error);
    }
    if (size.isValid())
        window->resize(size);

    window->ensureOnTop();
    return window;
}

AuxiliaryWindow* WindowManager::openMultiWindow(const QString& baseKey, QWidget* content, const QString& title,
                                                const QSize& size)
{
    QString key;
    do {
        key = baseKey + u'_' + randomSuffix();
    } while (m_windows.contains(key) || m_panels.contains(key));

    return openWindow(key, content, title.isEmpty() ? baseKey : title, size);
}

bool WindowManager::reapplyZOrder(const QString& key)
{
    if (AuxiliaryWindow* window = auxiliaryWindow(key)) {
        window->ensureOnTop();
        return true;
    }
    if (PanelWidget* panel = this->panel(key)) {
        panel->bringToFront();
        return true;
    }
    qCDebug(windowinglog) << "reapplyZOrder: unknown key" << key;
    return false;
}

PanelWidget* WindowManager::panel(const QString& key) const
{
    const auto it = m_panels.constFind(key);
    return it == m_panels.constEnd() ? nullptr : it->surface.data();
}

AuxiliaryWindow* WindowManager::auxiliaryWindow(const QString& key) const
{
    const auto it = m_windows.constFind(key);
    return it == m_windows.constEnd() ? nullptr : it->surface.data();
}

QStringList WindowManager::panelKeys() const
{
    return sortedKeys(m_panels);
}

QStringList WindowManager::windowKeys() const
{
    return sortedKeys(m_windows);
}

Utils::Result WindowManager::saveState()
{
    Utils::Result result;
    if (!m_store) {
        result.addError(u"No window state store"_s);
        return result;
    }

    if (m_shell) {
        const MainWindowStateRecord record{m_shell->saveGeometry(), m_shell->saveState()};
        const Utils::Result r = m_store->writeMainWindowRecord(record);
        if (!r) {
            qCWarning(windowinglog).noquote() << u"Failed to save main window state: %1"_s.arg(r.message());
            result.merge(r);
        }
    }

    for (const QString& key : sortedKeys(m_panels)) {
        PanelWidget* panel = m_panels.value(key).surface;
        if (!panel || panel->state() == SurfaceState::Destroyed) {
            const QString msg = u"Panel '%1' no longer exists"_s.arg(key);
            qCWarning(windowinglog).noquote() << msg;
            result.addError(msg, key);
            discard(SurfaceKind::Panel, key, "gone during save");
            continue;
        }

        SurfaceStateRecord record;
        record.geometry = panel->saveGeometry();
        record.visible = panel->isVisible();
        record.floating = panel->isFloating();

        const Utils::Result r = m_store->writeSurfaceRecord(SurfaceKind::Panel, key, record);
        if (!r) {
            const QString msg = u"Failed to save panel '%1': %2"_s.arg(key, r.message());
            qCWarning(windowinglog).noquote() << msg;
            result.addError(msg, key);
            discard(SurfaceKind::Panel, key, "save failed");
        }
    }

    for (const QString& key : sortedKeys(m_windows)) {
        AuxiliaryWindow* window = m_windows.value(key).surface;
        if (!window || window->state() == SurfaceState::Destroyed) {
            const QString msg = u"Window '%1' no longer exists"_s.arg(key);
            qCWarning(windowinglog).noquote() << msg;
            result.addError(msg, key);
            discard(SurfaceKind::AuxiliaryWindow, key, "gone during save");
            continue;
        }

        SurfaceStateRecord record;
        record.geometry = window->saveGeometry();
        record.visible = window->isVisible();

        const Utils::Result r = m_store->writeSurfaceRecord(SurfaceKind::AuxiliaryWindow, key, record);
        if (!r) {
            const QString msg = u"Failed to save window '%1': %2"_s.arg(key, r.message());
            qCWarning(windowinglog).noquote() << msg;
            result.addError(msg, key);
            discard(SurfaceKind::AuxiliaryWindow, key, "save failed");
        }
    }

    qCInfo(windowinglog) << "Saved window state:" << m_panels.size() << "panels," << m_windows.size()
                         << "windows," << result.errorCount() << "failures";
    return result;
}

void WindowManager::restoreState()
{
    if (!m_store)
        return;

    if (m_shell) {
        if (const auto record = m_store->readMainWindowRecord()) {
            if (!record->geometry.isEmpty() && !m_shell->restoreGeometry(record->geometry))
                qCWarning(windowinglog) << "Ignoring unreadable main window geometry";
            if (!record->state.isEmpty() && !m_shell->restoreState(record->state))
                qCWarning(windowinglog) << "Ignoring unreadable main window state";
        }
    }

    for (const QString& key : sortedKeys(m_panels)) {
        PanelWidget* panel = m_panels.value(key).surface;
        if (!panel || panel->state() == SurfaceState::Destroyed)
            continue;
        const auto record = m_store->readSurfaceRecord(SurfaceKind::Panel, key);
        if (!record)
            continue;

        if (record->floating.has_value())
            panel->setFloating(*record->floating);
        if (!record->geometry.isEmpty())
            panel->restoreGeometry(record->geometry);
        panel->setVisible(record->visible);
    }

    for (const QString& key : sortedKeys(m_windows)) {
        AuxiliaryWindow* window = m_windows.value(key).surface;
        if (!window || window->state() == SurfaceState::Destroyed)
            continue;
        const auto record = m_store->readSurfaceRecord(SurfaceKind::AuxiliaryWindow, key);
        if (!record)
            continue;

        if (!record->geometry.isEmpty() && !window->restoreGeometry(record->geometry))
            qCWarning(windowinglog) << "Ignoring unreadable geometry for window" << key;
        window->setVisible(record->visible);
    }
}

void WindowManager::closeAll()
{
    QList<QPointer<QWidget>> surfaces;
    for (const auto& entry : std::as_const(m_panels))
        surfaces.push_back(entry.surface.data());
    for (const auto& entry : std::as_const(m_windows))
        surfaces.push_back(entry.surface.data());

    for (const auto& surface : std::as_const(surfaces)) {
        if (surface)
            surface->close();
    }

    m_panels.clear();
    m_windows.clear();
}

void WindowManager::registerTabButtonHandler(const QString& tabId, const QString& buttonId,
                                             TabButtonDispatcher::Handler handler)
{
    m_dispatcher->registerHandler(tabId, buttonId, std::move(handler));
}

bool WindowManager::retire(quint64 instanceId, const QString& key)
{
    if (m_retired.contains(instanceId))
        return false;
    m_retired.insert(instanceId);
    emit windowClosed(key);
    return true;
}

void WindowManager::onSurfaceGone(SurfaceKind kind, const QString& key, quint64 instanceId)
{
    if (kind == SurfaceKind::Panel) {
        const auto it = m_panels.find(key);
        if (it != m_panels.end() && it->instanceId == instanceId)
            m_panels.erase(it);
    } else {
        const auto it = m_windows.find(key);
        if (it != m_windows.end() && it->instanceId == instanceId)
            m_windows.erase(it);
    }

    if (retire(instanceId, key))
        qCDebug(windowinglog) << "Surface gone:" << surfaceKindName(kind) << key << "instance" << instanceId;
}

void WindowManager::discard(SurfaceKind kind, const QString& key, const char* reason)
{
    QPointer<QWidget> surface;
    quint64 id = 0;
    if (kind == SurfaceKind::Panel) {
        const Tracked<PanelWidget> entry = m_panels.take(key);
        surface = entry.surface.data();
        id = entry.instanceId;
    } else {
        const Tracked<AuxiliaryWindow> entry = m_windows.take(key);
        surface = entry.surface.data();
        id = entry.instanceId;
    }

    qCDebug(windowinglog) << "Discarding" << surfaceKindName(kind) << key << "instance" << id << "-" << reason;

    if (surface)
        disconnect(surface, nullptr, this, nullptr);
    if (id != 0)
        retire(id, key);
    if (surface)
        surface->close();
}

void WindowManager::evictOtherKind(SurfaceKind wanted, const QString& key)
{
    const bool heldByOther = wanted == SurfaceKind::Panel ? m_windows.contains(key) : m_panels.contains(key);
    if (!heldByOther)
        return;

    const SurfaceKind other = wanted == SurfaceKind::Panel ? SurfaceKind::AuxiliaryWindow : SurfaceKind::Panel;
    qCWarning(windowinglog).noquote() << u"Key '%1' is held by a %2; closing it to create a %3"_s
                                             .arg(key, surfaceKindName(other), surfaceKindName(wanted));
    discard(other, key, "key reused for another kind");
}

bool WindowManager::isStale(const AuxiliaryWindow* window)
{
    if (window->state() == SurfaceState::Destroyed)
        return true;
    return window->hasBeenShown() && !window->isVisible();
}

} // namespace Windowing
