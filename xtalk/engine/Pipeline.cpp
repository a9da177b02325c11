#include "xtalk/engine/Pipeline.h"

#include <QDebug>

#include <algorithm>
#include <exception>

namespace xtalk::engine {

Pipeline::Pipeline(const Clock* clock, QObject* parent)
    : QObject(parent), m_clock(clock), m_scheduler(clock) {}

Pipeline::~Pipeline() {
    stop();
}

void Pipeline::addPolicy(std::unique_ptr<Policy> policy) {
    if (!policy) return;
    policy->attach(this, int(m_policies.size()));
    m_policies.push_back(std::move(policy));
}

Policy* Pipeline::policy(int index) const {
    if (index < 0 || index >= int(m_policies.size())) return nullptr;
    return m_policies[size_t(index)].get();
}

Policy* Pipeline::findPolicy(const QString& kind) const {
    for (const auto& p : m_policies) {
        if (p->kind() == kind) return p.get();
    }
    return nullptr;
}

QStringList Pipeline::policyKinds() const {
    QStringList out;
    for (const auto& p : m_policies) out << p->kind();
    return out;
}

void Pipeline::start() {
    if (m_running) return;
    m_running = true;
    for (auto& p : m_policies) p->start();
    qInfo().noquote() << "Pipeline: started with policies:" << policyKinds().join(" -> ");
}

void Pipeline::stop() {
    if (!m_running) return;
    m_running = false;
    for (auto& p : m_policies) p->stop();
    m_scheduler.clear();
}

EventList Pipeline::dispatch(const Event& e) {
    m_scheduler.runDue();
    return runChain(0, EventList{e});
}

void Pipeline::dispatchToSink(const xtalk::engine::Event& e) {
    const EventList out = dispatch(e);
    if (!m_sink) return;
    for (const auto& o : out) m_sink->send(OutputPort::Main, o);
}

void Pipeline::forward(int fromIndex, const Event& e) {
    const EventList out = runChain(fromIndex + 1, EventList{e});
    if (!m_sink) return;
    for (const auto& o : out) m_sink->send(OutputPort::Main, o);
}

void Pipeline::sendDirect(OutputPort port, const Event& e) {
    if (m_sink) m_sink->send(port, e);
}

EventList Pipeline::runChain(int startIndex, const EventList& input) {
    EventList current = input;
    for (int i = std::max(0, startIndex); i < int(m_policies.size()) && !current.isEmpty(); ++i) {
        Policy* p = m_policies[size_t(i)].get();
        EventList next;
        for (const Event& ev : current) {
            try {
                next += p->process(ev);
            } catch (const std::exception& ex) {
                // One faulty filter must not stall the signal path.
                qWarning().noquote() << QString("Pipeline: policy '%1' failed on %2: %3 (passing through)")
                                            .arg(p->kind(), ev.toString(), QString::fromUtf8(ex.what()));
                next.push_back(ev);
            }
        }
        current = next;
    }
    return current;
}

} // namespace xtalk::engine
