#include "ConfigLoader.h"
#include "xtalk/engine/Pipeline.h"
#include "xtalk/engine/Scheduler.h"
#include "xtalk/policies/AmplifyPolicy.h"
#include "xtalk/policies/ChokePolicy.h"
#include "xtalk/policies/ReplacePolicy.h"
#include "xtalk/tests/TestSupport.h"

#include <QCoreApplication>
#include <QJsonObject>
#include <QtGlobal>

#include <stdexcept>

using xtalk::engine::Event;
using xtalk::engine::EventList;
using xtalk::engine::ManualClock;
using xtalk::engine::Policy;
using xtalk::engine::Scheduler;
using xtalk::tests::FakeLauncher;
using xtalk::tests::Harness;

namespace {

static int g_failures = 0;

static void expect(bool cond, const QString& msg) {
    if (!cond) {
        ++g_failures;
        qWarning().noquote() << "FAIL:" << msg;
    }
}

static void expectEq(qint64 a, qint64 b, const QString& msg) {
    expect(a == b, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectStrEq(const QString& a, const QString& b, const QString& msg) {
    expect(a == b, msg + QString(" (got '%1' expected '%2')").arg(a, b));
}

// Counts what reaches it and passes everything on.
class CountingPolicy : public Policy {
public:
    CountingPolicy() : Policy("count") {}
    int seen = 0;

protected:
    EventList onEvent(const Event& e) override {
        ++seen;
        return {e};
    }
    QJsonObject toJson() const override { return {}; }
};

class ThrowingPolicy : public Policy {
public:
    ThrowingPolicy() : Policy("throw") {}

protected:
    EventList onEvent(const Event&) override { throw std::runtime_error("boom"); }
    QJsonObject toJson() const override { return {}; }
};

// Swallows every event and re-emits it later with the note raised by one.
class EchoLaterPolicy : public Policy {
public:
    explicit EchoLaterPolicy(qint64 delayMs) : Policy("echo"), m_delayMs(delayMs) {}

protected:
    EventList onEvent(const Event& e) override {
        const Event later = e.withNote(e.note + 1).withTimestamp(e.timestampMs + m_delayMs);
        scheduleAt(later.timestampMs, [this, later]() { emitDownstream(later); });
        return {};
    }
    QJsonObject toJson() const override { return {}; }

private:
    qint64 m_delayMs;
};

static std::unique_ptr<xtalk::policies::AmplifyPolicy> doubler(int note) {
    xtalk::policies::AmplifyConfig cfg;
    cfg.gains.insert(note, xtalk::policies::AmplifyConfig::Gain{200, 0});
    return std::make_unique<xtalk::policies::AmplifyPolicy>(cfg);
}

static std::unique_ptr<xtalk::policies::ReplacePolicy> remap(int from, int to) {
    xtalk::policies::ReplaceRule rule;
    rule.from = {from};
    rule.to = to;
    rule.enabled = true;
    xtalk::policies::ReplaceConfig cfg;
    cfg.rules = {rule};
    return std::make_unique<xtalk::policies::ReplacePolicy>(cfg);
}

} // namespace

static void testEventCodec() {
    Event e;
    expect(Event::fromMidi({0x99, 38, 100}, 5, &e), "Event: note on decodes");
    expect(e == Event::noteOn(38, 100, 5, 9), "Event: channel from the status byte");
    expect(Event::fromMidi({0x90, 38, 0}, 6, &e) && e.isNoteOff(), "Event: note on with velocity 0 is a note off");
    expect(Event::fromMidi({0x80, 38, 64}, 7, &e) && e.isNoteOff() && e.velocity == 64, "Event: note off keeps release velocity");
    expect(!Event::fromMidi({0xB0, 7, 100}, 8, &e), "Event: control change is not a note event");
    expect(!Event::fromMidi({0x90, 38}, 8, &e), "Event: truncated message rejected");

    const auto raw = Event::noteOn(42, 80, 0, 15).toMidi();
    expect(raw.size() == 3 && raw[0] == 0x9F && raw[1] == 42 && raw[2] == 80, "Event: encodes status with channel");
    expectEq(Event::noteOn(1, 1, 0).withVelocity(300).velocity, 127, "Event: withVelocity clamps");
}

static void testScheduler() {
    ManualClock clock(100);
    Scheduler s(&clock);
    QStringList fired;

    s.scheduleAt(120, [&]() { fired << "b"; });
    const auto cancelled = s.scheduleAt(110, [&]() { fired << "x"; });
    s.scheduleAt(110, [&]() { fired << "a1"; });
    s.scheduleAt(110, [&]() { fired << "a2"; });
    expectEq(s.nextDueMs(), 110, "Scheduler: earliest due first");

    expect(s.cancel(cancelled), "Scheduler: pending timer can be cancelled");
    expect(!s.cancel(cancelled), "Scheduler: cancel twice fails");

    expectEq(s.runDue(), 0, "Scheduler: nothing due yet");
    clock.setMs(115);
    expectEq(s.runDue(), 2, "Scheduler: due timers fire");
    expectStrEq(fired.join(','), "a1,a2", "Scheduler: ties fire in scheduling order; cancelled never fires");

    // Callbacks may schedule work that is already due.
    s.scheduleAt(115, [&]() {
        fired << "c";
        s.scheduleAt(115, [&]() { fired << "d"; });
    });
    s.runDue();
    expectStrEq(fired.join(','), "a1,a2,c,d", "Scheduler: work scheduled from a callback runs in the same pass");

    clock.setMs(200);
    s.runDue();
    expect(s.isEmpty(), "Scheduler: empty after everything fired");
    expectStrEq(fired.join(','), "a1,a2,c,d,b", "Scheduler: later timer fires last");

    // A throwing callback neither stops its pass nor later passes.
    fired.clear();
    s.scheduleAt(210, [&]() { throw std::runtime_error("boom"); });
    s.scheduleAt(210, [&]() { fired << "e"; });
    s.scheduleAt(220, [&]() { fired << "f"; });
    clock.setMs(210);
    expectEq(s.runDue(), 2, "Scheduler: throwing callback counted, next one still fires");
    clock.setMs(220);
    expectEq(s.runDue(), 1, "Scheduler: keeps firing after a callback threw");
    expectStrEq(fired.join(','), "e,f", "Scheduler: timers after a failure fire in order");
}

static void testOrdering() {
    {
        Harness h;
        h.add(doubler(38));
        h.add(remap(38, 40));
        h.start();
        h.on(38, 30, 0);
        expect(h.sink.main.size() == 1 && h.sink.main[0] == Event::noteOn(40, 60, 0), "Pipeline: amplify then replace");
    }
    {
        Harness h;
        h.add(remap(38, 40));
        h.add(doubler(38));
        h.start();
        h.on(38, 30, 0);
        expect(h.sink.main.size() == 1 && h.sink.main[0] == Event::noteOn(40, 30, 0), "Pipeline: replace then amplify");
    }
    {
        Harness h;
        const EventList out = h.pipeline.dispatch(Event::noteOn(38, 30, 0));
        expectEq(out.size(), 1, "Pipeline: empty chain passes through");
    }
}

static void testFaultPassThrough() {
    Harness h;
    h.add(doubler(38));
    h.add(std::make_unique<ThrowingPolicy>());
    auto* tail = h.add(std::make_unique<CountingPolicy>());
    h.start();

    h.on(38, 30, 0);
    expectEq(tail->seen, 1, "Pipeline: a failing policy does not stop the chain");
    expect(h.sink.main.size() == 1 && h.sink.main[0].velocity == 60, "Pipeline: event passes the failing policy unmodified");
}

static void testAsyncDownstreamOnly() {
    Harness h;
    auto* head = h.add(std::make_unique<CountingPolicy>());
    h.add(std::make_unique<EchoLaterPolicy>(10));
    auto* tail = h.add(std::make_unique<CountingPolicy>());
    h.start();

    h.on(38, 30, 0);
    expectEq(head->seen, 1, "Async: head saw the live event");
    expectEq(tail->seen, 0, "Async: tail waits");
    expect(h.sink.main.isEmpty(), "Async: nothing emitted yet");

    h.advanceTo(10);
    expectEq(head->seen, 1, "Async: emissions never re-enter upstream policies");
    expectEq(tail->seen, 1, "Async: emission runs through downstream policies");
    expect(h.sink.main.size() == 1 && h.sink.main[0] == Event::noteOn(39, 30, 10), "Async: emission delivered to the sink");

    // Due timers fire before the next live event is processed.
    h.on(50, 30, 20);
    h.on(60, 30, 40);
    expectEq(tail->seen, 2, "Async: timer due at 30 fired before the event at 40");
}

static void testStopCancelsTimers() {
    xtalk::policies::ChokeConfig cfg;
    cfg.groups.insert(49, {55});
    Harness h;
    auto* choke = h.add(std::make_unique<xtalk::policies::ChokePolicy>(cfg));
    h.start();
    h.on(49, 100, 0);
    expect(!h.pipeline.scheduler().isEmpty(), "Stop: window timer pending");
    h.pipeline.stop();
    expect(h.pipeline.scheduler().isEmpty(), "Stop: timers cancelled");
    expect(!h.pipeline.isRunning(), "Stop: pipeline stopped");
    expect(choke->isWindowOpen(49), "Stop: policy state is kept");
}

static void testConfigLoader() {
    ConfigLoader loader;
    PipelineConfig cfg = loader.loadFromJsonBytes(R"({
        "pipeline": ["amplify", "replace", "amplify"],
        "amplify": {"amplify": {"38": {"multiply": 200}}},
        "2": {"amplify": {"40": {"add": 7}}},
        "replace": {"replace": [{"from": [38], "to": 40, "enabled": true}]}
    })", "test");
    expect(cfg.isValid, "Config: valid document: " + cfg.error);
    expectStrEq(cfg.chain.join(','), "amplify,replace,amplify", "Config: pipeline key");
    expectStrEq(ConfigLoader::resolveChain({}, cfg).join(','), "amplify,replace,amplify", "Config: document chain used by default");
    expectStrEq(ConfigLoader::resolveChain({"choke", " time "}, cfg).join(','), "choke,time", "Config: explicit chain wins");
    expectStrEq(ConfigLoader::resolveChain({}, PipelineConfig()).join(','), "xtalk", "Config: cross-talk filter alone by default");

    FakeLauncher launcher;
    xtalk::policies::PolicyEnvironment env;
    env.launcher = &launcher;
    Harness h;
    QString err;
    expect(ConfigLoader::buildPipeline(cfg, cfg.chain, env, &h.pipeline, &err), "Config: pipeline builds: " + err);
    expectEq(h.pipeline.size(), 3, "Config: three policies");
    h.start();
    h.on(38, 30, 0);
    expect(h.sink.main.size() == 1 && h.sink.main[0] == Event::noteOn(40, 67, 0),
           "Config: index keyed section overrides the kind section");

    expect(!loader.loadFromJsonBytes("{", "broken").isValid, "Config: JSON errors reported");
    expect(!loader.loadFromJsonBytes("[]", "array").isValid, "Config: top level must be an object");
    expect(!loader.loadFromJsonBytes(R"({"pipeline": "xtalk"})", "p").isValid, "Config: pipeline must be a list");
    expect(loader.loadConfig(QString()).isValid, "Config: no file means defaults");
    expect(!loader.loadConfig("/nonexistent/xtalk.json").isValid, "Config: unreadable file reported");

    Harness bad;
    err.clear();
    expect(!ConfigLoader::buildPipeline(cfg, {"amplify", "nope"}, env, &bad.pipeline, &err), "Config: unknown policy aborts");
    expect(err.contains("nope"), "Config: error names the unknown policy");
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testEventCodec();
    testScheduler();
    testOrdering();
    testFaultPassThrough();
    testAsyncDownstreamOnly();
    testStopCancelsTimers();
    testConfigLoader();

    if (g_failures == 0) {
        qInfo("PipelineTests: PASS");
        return 0;
    }

    qWarning("PipelineTests: FAIL (%d failures)", g_failures);
    return 1;
}
