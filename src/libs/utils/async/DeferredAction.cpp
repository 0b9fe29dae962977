// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/async/DeferredAction.hpp"

#include <algorithm>
#include <utility>

namespace Utils::Async {

DeferredAction::DeferredAction(int delayMs, Action action, QObject* parent)
    : QObject(parent)
    , m_action(std::move(action))
{
    m_timer.setSingleShot(true);
    setDelayMs(delayMs);
    connect(&m_timer, &QTimer::timeout, this, &DeferredAction::run);
}

void DeferredAction::guardWith(QObject* guard, Predicate stillWanted)
{
    m_guard = guard;
    m_guarded = guard != nullptr;
    m_stillWanted = std::move(stillWanted);
}

void DeferredAction::schedule()
{
    if (!m_action) {
        qCWarning(utilslog) << "DeferredAction scheduled without an action";
        return;
    }
    m_timer.start();
}

void DeferredAction::cancel()
{
    m_timer.stop();
}

void DeferredAction::setDelayMs(int ms)
{
    m_timer.setInterval(std::max(ms, 0));
}

void DeferredAction::run()
{
    if (m_guarded && !m_guard) {
        emit finished(Outcome::GuardDestroyed);
        return;
    }
    if (m_stillWanted && !m_stillWanted()) {
        emit finished(Outcome::NoLongerWanted);
        return;
    }
    m_action();
    emit finished(Outcome::Ran);
}

} // namespace Utils::Async
