// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "windowing/tabs/TabButtonDispatcher.hpp"

namespace Windowing {

QString TabButtonDispatcher::handlerKey(const QString& tabId, const QString& buttonId)
{
    // Tab ids never contain a slash.
    return tabId + QLatin1Char('/') + buttonId;
}

void TabButtonDispatcher::registerHandler(const QString& tabId, const QString& buttonId, Handler handler)
{
    if (!handler) {
        unregisterHandler(tabId, buttonId);
        return;
    }

    const QString key = handlerKey(tabId, buttonId);
    if (m_handlers.contains(key))
        qCDebug(windowinglog) << "Replacing tab button handler" << key;
    m_handlers.insert(key, std::move(handler));
}

bool TabButtonDispatcher::unregisterHandler(const QString& tabId, const QString& buttonId)
{
    return m_handlers.remove(handlerKey(tabId, buttonId)) > 0;
}

bool TabButtonDispatcher::hasHandler(const QString& tabId, const QString& buttonId) const
{
    return m_handlers.contains(handlerKey(tabId, buttonId));
}

bool TabButtonDispatcher::dispatch(const QString& tabId, const QString& buttonId)
{
    const auto it = m_handlers.constFind(handlerKey(tabId, buttonId));
    if (it == m_handlers.constEnd()) {
        qCDebug(windowinglog) << "No handler for tab button" << tabId << buttonId;
        return false;
    }

    // Copy first: the handler may re-register itself.
    const Handler handler = it.value();
    handler();
    emit dispatched(tabId, buttonId);
    return true;
}

} // namespace Windowing
