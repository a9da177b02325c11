#pragma once

#include <QElapsedTimer>
#include <QtGlobal>

#include <atomic>

namespace xtalk::engine {

// Monotonic millisecond clock shared by the pipeline, the scheduler and the host.
class Clock {
public:
    virtual ~Clock() = default;
    virtual qint64 nowMs() const = 0;
};

// Wall clock (QElapsedTimer; monotonic where the platform supports it).
class SteadyClock : public Clock {
public:
    SteadyClock() { m_timer.start(); }
    qint64 nowMs() const override { return m_timer.elapsed(); }

private:
    QElapsedTimer m_timer;
};

// Test clock: time only moves when told to.
class ManualClock : public Clock {
public:
    explicit ManualClock(qint64 startMs = 0) : m_now(startMs) {}
    qint64 nowMs() const override { return m_now.load(); }
    void setMs(qint64 t) { m_now.store(t); }
    void advanceMs(qint64 d) { m_now.fetch_add(d); }

private:
    std::atomic<qint64> m_now{0};
};

} // namespace xtalk::engine
