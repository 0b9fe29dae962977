// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QTimer>

#include <functional>

namespace Utils::Async {

// Runs an action once after a delay. schedule() while pending restarts the
// delay, so a burst of requests collapses into one run.
//
// An action tied to a guard object only runs while the guard is alive and
// its predicate (if any) still agrees, which makes it safe to capture the
// guard in the action.
class UTILS_EXPORT DeferredAction final : public QObject
{
    Q_OBJECT

public:
    enum class Outcome {
        Ran,
        GuardDestroyed,
        NoLongerWanted
    };
    Q_ENUM(Outcome)

    using Action = std::function<void()>;
    using Predicate = std::function<bool()>;

    DeferredAction(int delayMs, Action action, QObject* parent = nullptr);

    void guardWith(QObject* guard, Predicate stillWanted = {});

    void schedule();
    void cancel();
    bool isScheduled() const { return m_timer.isActive(); }

    int delayMs() const { return m_timer.interval(); }
    void setDelayMs(int ms);

signals:
    void finished(Utils::Async::DeferredAction::Outcome outcome);

private:
    void run();

    QTimer m_timer;
    Action m_action;
    QPointer<QObject> m_guard;
    bool m_guarded = false;
    Predicate m_stillWanted;
};

} // namespace Utils::Async
