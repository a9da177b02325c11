#pragma once

#include <QStringList>
#include <QVector>

#include <memory>

#include "xtalk/engine/Clock.h"
#include "xtalk/engine/Event.h"
#include "xtalk/engine/OutputSink.h"
#include "xtalk/engine/Pipeline.h"
#include "xtalk/io/ProcessLauncher.h"

namespace xtalk::tests {

class RecordingSink : public engine::OutputSink {
public:
    void send(engine::OutputPort port, const engine::Event& e) override {
        if (port == engine::OutputPort::Reference) reference.push_back(e);
        else main.push_back(e);
    }
    void clear() {
        main.clear();
        reference.clear();
    }

    engine::EventList main;
    engine::EventList reference;
};

class FakeLauncher : public io::ProcessLauncher {
public:
    void spawn(const QStringList& command) override { spawned.push_back(command); }
    QVector<QStringList> spawned;
};

// One pipeline on a manual clock. Everything the chain produces ends up in sink.
struct Harness {
    engine::ManualClock clock;
    engine::Pipeline pipeline{&clock};
    RecordingSink sink;

    Harness() { pipeline.setOutputSink(&sink); }

    template <typename P>
    P* add(std::unique_ptr<P> p) {
        P* raw = p.get();
        pipeline.addPolicy(std::move(p));
        return raw;
    }

    void start(qint64 atMs = 0) {
        clock.setMs(atMs);
        pipeline.start();
    }

    // Moves the clock and delivers e as the host would.
    void feed(const engine::Event& e) {
        clock.setMs(e.timestampMs);
        pipeline.dispatchToSink(e);
    }
    void on(int note, int velocity, qint64 t, int channel = 0) { feed(engine::Event::noteOn(note, velocity, t, channel)); }
    void off(int note, qint64 t, int channel = 0) { feed(engine::Event::noteOff(note, t, channel)); }

    // Moves the clock and fires whatever became due.
    int advanceTo(qint64 t) {
        clock.setMs(t);
        return pipeline.scheduler().runDue();
    }
};

inline engine::EventList noteOnsOf(const engine::EventList& events) {
    engine::EventList out;
    for (const auto& e : events) {
        if (e.isNoteOn()) out.push_back(e);
    }
    return out;
}

} // namespace xtalk::tests
