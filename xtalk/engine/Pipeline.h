#pragma once

#include <QObject>
#include <QStringList>

#include <memory>
#include <vector>

#include "xtalk/engine/Clock.h"
#include "xtalk/engine/Event.h"
#include "xtalk/engine/OutputSink.h"
#include "xtalk/engine/Policy.h"
#include "xtalk/engine/Scheduler.h"

namespace xtalk::engine {

// Ordered chain of policies. Owns the policies and the scheduler they share.
// dispatch(), forward() and the scheduler run on one thread (the pipeline thread);
// only Policy::handleCommand() may be called from elsewhere.
class Pipeline : public QObject, public PolicyHost {
    Q_OBJECT
public:
    explicit Pipeline(const Clock* clock, QObject* parent = nullptr);
    ~Pipeline() override;

    void addPolicy(std::unique_ptr<Policy> policy);
    int size() const { return int(m_policies.size()); }
    Policy* policy(int index) const;
    Policy* findPolicy(const QString& kind) const;
    QStringList policyKinds() const;

    void setOutputSink(OutputSink* sink) { m_sink = sink; }

    void start();
    void stop();
    bool isRunning() const { return m_running; }

    // Fires due timers, then runs the event through the whole chain.
    // Returns what the chain produced for the main port; the caller delivers it.
    EventList dispatch(const Event& e);

    const Clock* clock() const { return m_clock; }

    // PolicyHost
    Scheduler& scheduler() override { return m_scheduler; }
    void forward(int fromIndex, const Event& e) override;
    void sendDirect(OutputPort port, const Event& e) override;

public slots:
    // dispatch() + delivery to the sink's main port.
    void dispatchToSink(const xtalk::engine::Event& e);

private:
    EventList runChain(int startIndex, const EventList& input);

    const Clock* m_clock = nullptr; // not owned
    Scheduler m_scheduler;
    std::vector<std::unique_ptr<Policy>> m_policies;
    OutputSink* m_sink = nullptr; // not owned
    bool m_running = false;
};

} // namespace xtalk::engine
