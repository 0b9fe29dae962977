// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "windowing/WindowingGlobal.hpp"

#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QString>

#include <functional>

namespace Windowing {

// (tabId, buttonId) -> handler. Registration and dispatch are separate
// steps so a button can exist before its action is wired.
class WINDOWING_EXPORT TabButtonDispatcher final : public QObject
{
    Q_OBJECT

public:
    using Handler = std::function<void()>;

    using QObject::QObject;

    // Replaces any handler already registered for the pair.
    void registerHandler(const QString& tabId, const QString& buttonId, Handler handler);
    bool unregisterHandler(const QString& tabId, const QString& buttonId);

    bool hasHandler(const QString& tabId, const QString& buttonId) const;
    int handlerCount() const { return m_handlers.size(); }

public slots:
    // Returns false, without side effects, when nothing is registered.
    bool dispatch(const QString& tabId, const QString& buttonId);

signals:
    void dispatched(const QString& tabId, const QString& buttonId);

private:
    static QString handlerKey(const QString& tabId, const QString& buttonId);

    QHash<QString, Handler> m_handlers;
};

} // namespace Windowing
