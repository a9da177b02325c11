#include "xtalk/policies/ChokePolicy.h"

#include <QDebug>

#include <algorithm>

#include "xtalk/util/Json.h"

namespace xtalk::policies {

using engine::Event;
using engine::EventList;

bool ChokeConfig::fromJson(const QJsonObject& o, ChokeConfig* out, QString* outError) {
    util::ConfigReader r(ChokePolicy::kKind, o);
    ChokeConfig c;

    const QJsonObject groups = r.getObject("choke");
    for (auto it = groups.begin(); it != groups.end(); ++it) {
        int trigger = 0;
        if (!util::parseNoteKey(it.key(), &trigger)) {
            r.fail(QString("'choke' key '%1' is not a MIDI note").arg(it.key()));
            break;
        }
        c.groups.insert(trigger, r.noteSetFrom(it.value(), QString("'choke.%1'").arg(it.key())));
    }
    c.chokeMaxMs = r.getInt("choke_max", c.chokeMaxMs);
    c.chokeCount = r.getInt("choke_cnt", c.chokeCount);
    c.cymbalMax = r.getInt("cymbal_max", c.cymbalMax);

    if (r.ok() && c.chokeMaxMs < 0) r.fail("'choke_max' must not be negative");
    if (r.ok() && c.chokeCount < 0) r.fail("'choke_cnt' must not be negative");
    if (r.ok() && (c.cymbalMax < 0 || c.cymbalMax > 127)) r.fail("'cymbal_max' must be a velocity (0..127)");

    if (!r.ok()) {
        if (outError) *outError = r.error();
        return false;
    }
    if (out) *out = c;
    return true;
}

QJsonObject ChokeConfig::toJson() const {
    QJsonObject groupsJson;
    for (auto it = groups.begin(); it != groups.end(); ++it) {
        groupsJson.insert(QString::number(it.key()), util::noteSetToJson(it.value()));
    }
    QJsonObject o;
    o.insert("choke", groupsJson);
    o.insert("choke_max", chokeMaxMs);
    o.insert("choke_cnt", chokeCount);
    o.insert("cymbal_max", cymbalMax);
    return o;
}

ChokePolicy::ChokePolicy(const ChokeConfig& config)
    : engine::Policy(kKind), m_cfg(config) {}

bool ChokePolicy::isWindowOpen(int trigger) const {
    const auto lock = lockState();
    return m_windows.contains(trigger);
}

int ChokePolicy::memberCount(int trigger) const {
    const auto lock = lockState();
    const auto it = m_windows.constFind(trigger);
    return it == m_windows.constEnd() ? 0 : it->count;
}

EventList ChokePolicy::onEvent(const Event& e) {
    // Choking must never produce stuck notes.
    if (!e.isNoteOn()) return {e};

    expireWindows(e.timestampMs);

    // Member of an open window: count it, cap it or drop it. QMap order keeps this deterministic.
    for (auto g = m_cfg.groups.constBegin(); g != m_cfg.groups.constEnd(); ++g) {
        if (g.key() == e.note || !g.value().contains(e.note)) continue;
        auto w = m_windows.find(g.key());
        if (w == m_windows.end()) continue;

        ++w->count;
        if (w->count <= m_cfg.chokeCount) {
            const int velocity = std::min(e.velocity, m_cfg.cymbalMax);
            qDebug().noquote() << QString("Choke: member %1 of %2 passes (%3/%4), velocity %5 -> %6")
                                      .arg(e.note).arg(g.key()).arg(w->count).arg(m_cfg.chokeCount)
                                      .arg(e.velocity).arg(velocity);
            return {e.withVelocity(velocity)};
        }
        qDebug().noquote() << QString("Choke: suppressed %1 (group %2)").arg(e.toString()).arg(g.key());
        return {};
    }

    if (m_cfg.groups.contains(e.note)) openWindow(e.note, e.timestampMs);
    return {e};
}

void ChokePolicy::expireWindows(qint64 nowMs) {
    QVector<int> expired;
    for (auto it = m_windows.constBegin(); it != m_windows.constEnd(); ++it) {
        if (it->expiryMs <= nowMs) expired.push_back(it.key());
    }
    for (int trigger : expired) closeWindow(trigger);
}

void ChokePolicy::openWindow(int trigger, qint64 nowMs) {
    Window& w = m_windows[trigger];
    if (w.expiryTimer != engine::Scheduler::kInvalidTimer) cancelTimer(w.expiryTimer);

    // A repeated trigger hit extends the window; the member count carries over.
    w.expiryMs = nowMs + m_cfg.chokeMaxMs;
    w.expiryTimer = scheduleAt(w.expiryMs, [this, trigger]() {
        auto it = m_windows.find(trigger);
        if (it == m_windows.end()) return;
        it->expiryTimer = engine::Scheduler::kInvalidTimer;
        closeWindow(trigger);
    });
}

void ChokePolicy::closeWindow(int trigger) {
    const auto it = m_windows.find(trigger);
    if (it == m_windows.end()) return;
    if (it->expiryTimer != engine::Scheduler::kInvalidTimer) cancelTimer(it->expiryTimer);
    qDebug().noquote() << QString("Choke: window of %1 closed after %2 member hit(s)").arg(trigger).arg(it->count);
    m_windows.erase(it);
}

} // namespace xtalk::policies
