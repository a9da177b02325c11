#include "xtalk/engine/Policy.h"

#include <QDebug>

#include <algorithm>
#include <memory>

namespace xtalk::engine {

Policy::Policy(const QString& kind) : m_kind(kind) {}

Policy::~Policy() = default;

void Policy::attach(PolicyHost* host, int index) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_host = host;
    m_index = index;
}

void Policy::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    onStart();
}

void Policy::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    cancelAllTimers();
    onStop();
}

EventList Policy::process(const Event& e) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return onEvent(e);
}

CommandResult Policy::handleCommand(const QString& line) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return onCommand(line);
}

QJsonObject Policy::configJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return toJson();
}

CommandResult Policy::onCommand(const QString& line) {
    Q_UNUSED(line);
    return CommandResult::failure(QString("%1 does not accept commands").arg(m_kind));
}

Scheduler::TimerId Policy::scheduleAfter(qint64 delayMs, std::function<void()> fn) {
    return scheduleAt(nowMs() + std::max<qint64>(0, delayMs), std::move(fn));
}

Scheduler::TimerId Policy::scheduleAt(qint64 dueMs, std::function<void()> fn) {
    if (!m_host) {
        qWarning().noquote() << QString("%1: cannot schedule while detached").arg(m_kind);
        return Scheduler::kInvalidTimer;
    }

    // The id is only known after scheduling; the callback cannot fire before we store it
    // (the scheduler only fires from its own dispatch loop on this thread).
    auto idHolder = std::make_shared<Scheduler::TimerId>(Scheduler::kInvalidTimer);
    const auto id = m_host->scheduler().scheduleAt(dueMs, [this, idHolder, fn = std::move(fn)]() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_timers.remove(*idHolder)) return; // cancelled meanwhile
        fn();
    });
    *idHolder = id;
    if (id != Scheduler::kInvalidTimer) m_timers.insert(id);
    return id;
}

bool Policy::cancelTimer(Scheduler::TimerId id) {
    if (!m_timers.remove(id)) return false;
    if (m_host) m_host->scheduler().cancel(id);
    return true;
}

void Policy::cancelAllTimers() {
    if (m_host) {
        for (const auto id : m_timers) m_host->scheduler().cancel(id);
    }
    m_timers.clear();
}

void Policy::emitDownstream(const Event& e) {
    if (m_host) m_host->forward(m_index, e);
}

void Policy::sendDirect(OutputPort port, const Event& e) {
    if (m_host) m_host->sendDirect(port, e);
}

qint64 Policy::nowMs() const {
    return m_host ? m_host->scheduler().nowMs() : 0;
}

} // namespace xtalk::engine
