#include "xtalk/policies/ReplayPolicy.h"

#include <QDebug>

#include <algorithm>

#include "xtalk/util/Json.h"

namespace xtalk::policies {

using engine::Event;
using engine::EventList;

namespace {
static int noteKey(const Event& e) { return (e.channel << 8) | e.note; }
} // namespace

bool ReplayConfig::fromJson(const QJsonObject& o, ReplayConfig* out, QString* outError) {
    util::ConfigReader r(ReplayPolicy::kKind, o);
    ReplayConfig c;
    c.record = r.getNoteSet("record");
    c.play = r.getNoteSet("play");
    c.loop = r.getBool("loop", c.loop);
    c.pass = r.getBool("pass", c.pass);
    c.playStopsRecord = r.getBool("play_stops_record", c.playStopsRecord);

    if (!r.ok()) {
        if (outError) *outError = r.error();
        return false;
    }
    if (out) *out = c;
    return true;
}

QJsonObject ReplayConfig::toJson() const {
    QJsonObject o;
    o.insert("record", util::noteSetToJson(record));
    o.insert("play", util::noteSetToJson(play));
    o.insert("loop", loop);
    o.insert("pass", pass);
    o.insert("play_stops_record", playStopsRecord);
    return o;
}

ReplayPolicy::ReplayPolicy(const ReplayConfig& config)
    : engine::Policy(kKind), m_cfg(config) {}

ReplayPolicy::Mode ReplayPolicy::mode() const {
    const auto lock = lockState();
    if (m_recording) return Mode::Recording;
    if (m_playing) return Mode::Playing;
    return Mode::Idle;
}

QVector<ReplayPolicy::TakeEntry> ReplayPolicy::take() const {
    const auto lock = lockState();
    return m_take;
}

qint64 ReplayPolicy::takeLengthMs() const {
    const auto lock = lockState();
    return m_takeLengthMs;
}

EventList ReplayPolicy::onEvent(const Event& e) {
    if (isControlNote(e.note)) {
        if (e.isNoteOn()) {
            if (m_cfg.record.contains(e.note)) {
                if (m_recording) stopRecording(e.timestampMs);
                else startRecording();
            } else {
                if (m_recording && m_cfg.playStopsRecord) stopRecording(e.timestampMs);
                if (m_playing) stopPlayback();
                else startPlayback(e.timestampMs);
            }
        }
        if (m_cfg.pass) return {e};
        return {};
    }

    if (m_recording) record(e);
    return {e};
}

void ReplayPolicy::onStop() {
    m_playing = false;
    m_playTimers.clear();
}

void ReplayPolicy::startRecording() {
    stopPlayback();
    m_take.clear();
    m_heldWhileRecording.clear();
    m_firstEventMs = -1;
    m_takeLengthMs = 0;
    m_recording = true;
    qInfo() << "Replay: recording";
}

void ReplayPolicy::stopRecording(qint64 nowMs) {
    m_recording = false;
    // The stop hit marks the end of the take, so loops keep the recorded bar length.
    m_takeLengthMs = m_take.isEmpty() ? 0 : std::max<qint64>(0, nowMs - m_firstEventMs);
    qInfo().noquote() << QString("Replay: recorded %1 event(s), %2 ms").arg(m_take.size()).arg(m_takeLengthMs);
}

void ReplayPolicy::record(const Event& e) {
    // Note offs of notes that started before the recording would replay as orphans.
    if (e.isNoteOff() && !m_heldWhileRecording.remove(noteKey(e))) return;
    if (e.isNoteOn()) m_heldWhileRecording.insert(noteKey(e));

    if (m_firstEventMs < 0) m_firstEventMs = e.timestampMs;
    m_take.push_back({e, e.timestampMs - m_firstEventMs});
}

void ReplayPolicy::startPlayback(qint64 startMs) {
    if (m_take.isEmpty()) {
        qInfo() << "Replay: nothing recorded";
        return;
    }
    m_playing = true;
    qInfo().noquote() << QString("Replay: playing %1 event(s)%2").arg(m_take.size()).arg(m_cfg.loop ? " (loop)" : "");
    scheduleCycle(startMs);
}

qint64 ReplayPolicy::cycleLengthMs() const {
    // A take still being recorded has no length yet; its last offset bounds the cycle.
    if (m_take.isEmpty()) return m_takeLengthMs;
    return std::max(m_takeLengthMs, m_take.last().offsetMs);
}

void ReplayPolicy::cancelPlayTimers() {
    for (const auto id : m_playTimers) cancelTimer(id);
    m_playTimers.clear();
}

void ReplayPolicy::scheduleCycle(qint64 cycleStartMs) {
    cancelPlayTimers();
    for (const auto& entry : m_take) {
        const qint64 due = cycleStartMs + entry.offsetMs;
        const Event ev = entry.event.withTimestamp(due);
        m_playTimers.push_back(scheduleAt(due, [this, ev]() { emitDownstream(ev); }));
    }

    // Scheduled last, so it fires after every emission due at the same time.
    const qint64 cycleLength = cycleLengthMs();
    const qint64 cycleEndMs = cycleStartMs + cycleLength;
    m_playTimers.push_back(scheduleAt(cycleEndMs, [this, cycleEndMs, cycleLength]() {
        if (m_cfg.loop && cycleLength > 0) {
            scheduleCycle(cycleEndMs);
            return;
        }
        m_playing = false;
        cancelPlayTimers();
        qInfo() << "Replay: playback finished";
    }));
}

void ReplayPolicy::stopPlayback() {
    if (!m_playing) return;
    cancelPlayTimers();
    m_playing = false;
    qInfo() << "Replay: playback stopped";
}

} // namespace xtalk::policies
