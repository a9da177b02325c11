#pragma once

#include <QJsonObject>
#include <QSet>
#include <QString>

#include <functional>
#include <mutex>

#include "xtalk/engine/Event.h"
#include "xtalk/engine/OutputSink.h"
#include "xtalk/engine/Scheduler.h"

namespace xtalk::engine {

// Outcome of a control command; rendered as one protocol line.
struct CommandResult {
    bool ok = true;
    QString error;

    static CommandResult success() { return {}; }
    static CommandResult failure(const QString& reason) { return {false, reason}; }
    QString toResponseLine() const { return ok ? QStringLiteral("OK") : QStringLiteral("ERROR ") + error; }
};

// What a policy can ask of the pipeline that owns it.
class PolicyHost {
public:
    virtual ~PolicyHost() = default;
    virtual Scheduler& scheduler() = 0;
    // Feeds an asynchronously produced event into the chain right after the policy at fromIndex.
    virtual void forward(int fromIndex, const Event& e) = 0;
    // Bypasses the chain (reference click, error notes).
    virtual void sendDirect(OutputPort port, const Event& e) = 0;
};

// One configured filter stage.
//
// Non-virtual public entry points take the policy's own lock, so event processing,
// timer callbacks and control commands (possibly from the control server thread) never
// interleave inside one policy. There is no lock shared between policies.
class Policy {
public:
    explicit Policy(const QString& kind);
    virtual ~Policy();

    Policy(const Policy&) = delete;
    Policy& operator=(const Policy&) = delete;

    const QString& kind() const { return m_kind; }
    int index() const { return m_index; }

    void attach(PolicyHost* host, int index);
    void start();
    void stop();

    EventList process(const Event& e);
    CommandResult handleCommand(const QString& line);
    QJsonObject configJson() const;

    virtual bool acceptsCommands() const { return false; }

protected:
    virtual void onStart() {}
    virtual void onStop() {}
    virtual EventList onEvent(const Event& e) = 0;
    virtual CommandResult onCommand(const QString& line);
    virtual QJsonObject toJson() const = 0;

    // Helpers below require the policy lock, i.e. call them from onEvent/onCommand/onStart
    // or from a callback scheduled through them.
    Scheduler::TimerId scheduleAfter(qint64 delayMs, std::function<void()> fn);
    Scheduler::TimerId scheduleAt(qint64 dueMs, std::function<void()> fn);
    bool cancelTimer(Scheduler::TimerId id);
    void cancelAllTimers();
    int pendingTimers() const { return m_timers.size(); }
    void emitDownstream(const Event& e);
    void sendDirect(OutputPort port, const Event& e);
    qint64 nowMs() const;

    // For state accessors called from outside the pipeline (tests, control surfaces).
    std::unique_lock<std::mutex> lockState() const { return std::unique_lock<std::mutex>(m_mutex); }

private:
    QString m_kind;
    PolicyHost* m_host = nullptr; // not owned
    int m_index = -1;
    mutable std::mutex m_mutex;
    QSet<Scheduler::TimerId> m_timers;
};

} // namespace xtalk::engine
