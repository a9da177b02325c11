#pragma once

#include <QJsonObject>
#include <QSet>
#include <QVector>

#include "xtalk/engine/Policy.h"

namespace xtalk::policies {

struct ReplayConfig {
    QSet<int> record;   // notes starting/stopping a recording
    QSet<int> play;     // notes starting/stopping playback
    bool loop = true;
    bool pass = true;   // forward the record/play control notes
    bool playStopsRecord = true;

    static bool fromJson(const QJsonObject& o, ReplayConfig* out, QString* outError);
    QJsonObject toJson() const;
};

// MIDI looper: records a take between two record hits and plays it back on a play hit.
class ReplayPolicy : public engine::Policy {
public:
    static constexpr const char* kKind = "replay";

    enum class Mode { Idle, Recording, Playing };

    struct TakeEntry {
        engine::Event event;
        qint64 offsetMs = 0; // from the first recorded event
    };

    explicit ReplayPolicy(const ReplayConfig& config);

    const ReplayConfig& config() const { return m_cfg; }

    Mode mode() const;
    QVector<TakeEntry> take() const;
    qint64 takeLengthMs() const;

protected:
    engine::EventList onEvent(const engine::Event& e) override;
    void onStop() override;
    QJsonObject toJson() const override { return m_cfg.toJson(); }

private:
    bool isControlNote(int note) const { return m_cfg.record.contains(note) || m_cfg.play.contains(note); }

    void startRecording();
    void stopRecording(qint64 nowMs);
    void record(const engine::Event& e);
    void startPlayback(qint64 startMs);
    qint64 cycleLengthMs() const;
    void cancelPlayTimers();
    void scheduleCycle(qint64 cycleStartMs);
    void stopPlayback();

    const ReplayConfig m_cfg;

    bool m_recording = false;
    bool m_playing = false;
    QVector<TakeEntry> m_take;
    qint64 m_firstEventMs = -1;
    qint64 m_takeLengthMs = 0;
    QSet<int> m_heldWhileRecording; // (channel << 8) | note of recorded note ons
    QVector<engine::Scheduler::TimerId> m_playTimers;
};

} // namespace xtalk::policies
