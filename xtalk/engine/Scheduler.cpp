#include "xtalk/engine/Scheduler.h"

#include <QDebug>

#include <algorithm>
#include <exception>

namespace xtalk::engine {

bool Scheduler::heapLess(const Entry& a, const Entry& b) {
    // reversed for min-heap behavior
    if (a.dueMs != b.dueMs) return a.dueMs > b.dueMs;
    return a.id > b.id;
}

Scheduler::Scheduler(const Clock* clock, QObject* parent)
    : QObject(parent), m_clock(clock) {
    m_dispatchTimer.setSingleShot(true);
    // Qt defaults can be coarse (5% slack); MIDI timing needs ms precision.
    m_dispatchTimer.setTimerType(Qt::PreciseTimer);
    connect(&m_dispatchTimer, &QTimer::timeout, this, &Scheduler::onDispatch);
}

Scheduler::TimerId Scheduler::scheduleAt(qint64 dueMs, Callback cb) {
    if (!cb) return kInvalidTimer;

    Entry e;
    e.dueMs = dueMs;
    e.id = m_nextId++;
    e.callback = std::move(cb);
    const TimerId id = e.id;

    m_heap.push_back(std::move(e));
    std::push_heap(m_heap.begin(), m_heap.end(), heapLess);

    if (!m_running) rearm();
    return id;
}

Scheduler::TimerId Scheduler::scheduleAfter(qint64 delayMs, Callback cb) {
    return scheduleAt(nowMs() + std::max<qint64>(0, delayMs), std::move(cb));
}

bool Scheduler::cancel(TimerId id) {
    if (id == kInvalidTimer) return false;
    const auto it = std::find_if(m_heap.begin(), m_heap.end(),
                                 [id](const Entry& e) { return e.id == id; });
    if (it == m_heap.end()) return false;

    m_heap.erase(it);
    std::make_heap(m_heap.begin(), m_heap.end(), heapLess);
    if (!m_running) rearm();
    return true;
}

void Scheduler::clear() {
    m_heap.clear();
    m_dispatchTimer.stop();
}

int Scheduler::runDue() {
    if (m_running) return 0;
    m_running = true;

    int fired = 0;
    while (!m_heap.isEmpty()) {
        const qint64 now = nowMs();
        if (m_heap.front().dueMs > now) break;

        std::pop_heap(m_heap.begin(), m_heap.end(), heapLess);
        Entry e = std::move(m_heap.back());
        m_heap.pop_back();

        // Callbacks may schedule or cancel other timers.
        try {
            e.callback();
        } catch (const std::exception& ex) {
            // A failing callback must not stall the timers behind it.
            qWarning().noquote() << QString("Scheduler: timer %1 failed: %2").arg(e.id).arg(QString::fromUtf8(ex.what()));
        }
        ++fired;
    }

    m_running = false;
    rearm();
    return fired;
}

void Scheduler::onDispatch() {
    runDue();
}

void Scheduler::rearm() {
    if (m_heap.isEmpty()) {
        m_dispatchTimer.stop();
        return;
    }
    const qint64 delay = std::max<qint64>(0, m_heap.front().dueMs - nowMs());
    m_dispatchTimer.start(int(std::min<qint64>(delay, 24 * 3600 * 1000)));
}

} // namespace xtalk::engine
