#pragma once

#include <QObject>
#include <QTimer>
#include <QVector>

#include <functional>

#include "xtalk/engine/Clock.h"

namespace xtalk::engine {

// Cancellable real-time timer facility (single-shot wakeup + min-heap).
// Lives on the pipeline thread; every method must be called from that thread.
class Scheduler : public QObject {
    Q_OBJECT
public:
    using TimerId = quint64;
    using Callback = std::function<void()>;

    static constexpr TimerId kInvalidTimer = 0;

    explicit Scheduler(const Clock* clock, QObject* parent = nullptr);

    TimerId scheduleAt(qint64 dueMs, Callback cb);
    TimerId scheduleAfter(qint64 delayMs, Callback cb);

    // Removes a pending timer. Returns false if it already fired or was never scheduled.
    bool cancel(TimerId id);
    void clear();

    bool isEmpty() const { return m_heap.isEmpty(); }
    int pendingCount() const { return m_heap.size(); }
    qint64 nowMs() const { return m_clock ? m_clock->nowMs() : 0; }
    qint64 nextDueMs() const { return m_heap.isEmpty() ? -1 : m_heap.front().dueMs; }

    // Fires every timer that is due at the current clock time, in due order
    // (ties in scheduling order). Returns the number of callbacks invoked.
    int runDue();

private slots:
    void onDispatch();

private:
    struct Entry {
        qint64 dueMs = 0;
        TimerId id = kInvalidTimer; // monotonically increasing, doubles as FIFO tie-breaker
        Callback callback;
    };

    static bool heapLess(const Entry& a, const Entry& b);
    void rearm();

    const Clock* m_clock = nullptr; // not owned
    QVector<Entry> m_heap;          // min-heap by (dueMs, id)
    QTimer m_dispatchTimer;
    TimerId m_nextId = 1;
    bool m_running = false;
};

} // namespace xtalk::engine
