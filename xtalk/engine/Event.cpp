#include "xtalk/engine/Event.h"

namespace xtalk::engine {

Event Event::noteOn(int note, int velocity, qint64 timestampMs, int channel) {
    Event e;
    e.kind = Kind::NoteOn;
    e.note = note;
    e.velocity = velocity;
    e.channel = channel;
    e.timestampMs = timestampMs;
    return e;
}

Event Event::noteOff(int note, qint64 timestampMs, int channel, int velocity) {
    Event e;
    e.kind = Kind::NoteOff;
    e.note = note;
    e.velocity = velocity;
    e.channel = channel;
    e.timestampMs = timestampMs;
    return e;
}

bool Event::fromMidi(const std::vector<unsigned char>& message, qint64 timestampMs, Event* out) {
    if (message.size() < 3 || !out) return false;
    const unsigned char status = message[0] & 0xF0;
    const int channel = message[0] & 0x0F;
    const int note = message[1] & 0x7F;
    const int velocity = message[2] & 0x7F;

    if (status == 0x90 && velocity > 0) {
        *out = noteOn(note, velocity, timestampMs, channel);
        return true;
    }
    if (status == 0x80 || status == 0x90) {
        *out = noteOff(note, timestampMs, channel, velocity);
        return true;
    }
    return false;
}

std::vector<unsigned char> Event::toMidi() const {
    const unsigned char status = (kind == Kind::NoteOn) ? 0x90 : 0x80;
    return {(unsigned char)(status | (channel & 0x0F)),
            (unsigned char)clampMidi(note),
            (unsigned char)clampMidi(velocity)};
}

Event Event::withNote(int n) const {
    Event e = *this;
    e.note = clampMidi(n);
    return e;
}

Event Event::withVelocity(int v) const {
    Event e = *this;
    e.velocity = clampMidi(v);
    return e;
}

Event Event::withTimestamp(qint64 t) const {
    Event e = *this;
    e.timestampMs = t;
    return e;
}

QString Event::toString() const {
    return QString("%1(note=%2 vel=%3 ch=%4 t=%5)")
        .arg(kind == Kind::NoteOn ? "on" : "off")
        .arg(note)
        .arg(velocity)
        .arg(channel + 1)
        .arg(timestampMs);
}

bool Event::operator==(const Event& o) const {
    return kind == o.kind && note == o.note && velocity == o.velocity && channel == o.channel &&
           timestampMs == o.timestampMs;
}

} // namespace xtalk::engine
