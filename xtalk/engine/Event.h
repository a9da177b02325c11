#pragma once

#include <QtGlobal>
#include <QString>
#include <QVector>

#include <vector>

namespace xtalk::engine {

// Canonical note event flowing through the pipeline.
// Immutable once dispatched: policies that alter an event produce a new one (see with*()).
struct Event {
    enum class Kind { NoteOn, NoteOff };

    Kind kind = Kind::NoteOn;
    int note = 0;      // 0..127
    int velocity = 0;  // 0..127
    int channel = 0;   // 0..15
    qint64 timestampMs = 0; // monotonic, pipeline clock domain

    static Event noteOn(int note, int velocity, qint64 timestampMs, int channel = 0);
    static Event noteOff(int note, qint64 timestampMs, int channel = 0, int velocity = 0);

    // Decodes a raw MIDI message. Returns false for anything that is not a note on/off.
    // NoteOn with velocity 0 is decoded as NoteOff.
    static bool fromMidi(const std::vector<unsigned char>& message, qint64 timestampMs, Event* out);
    std::vector<unsigned char> toMidi() const;

    bool isNoteOn() const { return kind == Kind::NoteOn; }
    bool isNoteOff() const { return kind == Kind::NoteOff; }

    Event withNote(int n) const;
    Event withVelocity(int v) const;
    Event withTimestamp(qint64 t) const;

    QString toString() const;

    bool operator==(const Event& o) const;
    bool operator!=(const Event& o) const { return !(*this == o); }
};

using EventList = QVector<Event>;

inline int clampMidi(int v) { return v < 0 ? 0 : (v > 127 ? 127 : v); }

} // namespace xtalk::engine
