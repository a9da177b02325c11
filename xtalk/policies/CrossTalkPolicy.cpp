#include "xtalk/policies/CrossTalkPolicy.h"

#include <QDebug>
#include <QJsonArray>

#include <algorithm>

#include "xtalk/util/Json.h"

namespace xtalk::policies {

using engine::Event;
using engine::EventList;

bool CrossTalkConfig::fromJson(const QJsonObject& o, CrossTalkConfig* out, QString* outError) {
    util::ConfigReader r(CrossTalkPolicy::kKind, o);
    CrossTalkConfig c;
    c.delayMs = r.getInt("delay", c.delayMs);
    c.historyMs = r.getInt("history", c.historyMs);
    c.threshold = r.getInt("threshold", c.threshold);
    c.minimum = r.getInt("minimum", c.minimum);

    const QJsonArray rules = r.getArray("rules");
    for (int i = 0; i < rules.size() && r.ok(); ++i) {
        const QString where = QString("rules[%1]").arg(i);
        if (!rules.at(i).isObject()) {
            r.fail(where + " must be an object");
            break;
        }
        const QJsonObject ro = rules.at(i).toObject();
        CrossTalkRule rule;
        if (ro.contains("notes")) rule.notes = r.noteSetFrom(ro.value("notes"), where + ".notes");
        if (ro.contains("cause")) rule.cause = r.noteSetFrom(ro.value("cause"), where + ".cause");
        if (ro.value("threshold").isDouble()) rule.threshold = ro.value("threshold").toInt(-1);
        if (ro.value("minimum").isDouble()) rule.minimum = ro.value("minimum").toInt(-1);
        if (ro.value("only_self").isBool()) rule.onlySelf = ro.value("only_self").toBool();
        c.rules.push_back(rule);
    }

    if (r.ok() && c.delayMs < 0) r.fail("'delay' must not be negative");
    if (r.ok() && c.historyMs < 0) r.fail("'history' must not be negative");
    if (r.ok() && (c.threshold < 0 || c.threshold > 100)) r.fail("'threshold' must be 0..100");
    if (r.ok() && (c.minimum < 0 || c.minimum > 128)) r.fail("'minimum' must be 0..128");

    if (!r.ok()) {
        if (outError) *outError = r.error();
        return false;
    }
    if (out) *out = c;
    return true;
}

QJsonObject CrossTalkConfig::toJson() const {
    QJsonArray rs;
    for (const auto& rule : rules) {
        QJsonObject ro;
        ro.insert("notes", util::noteSetToJson(rule.notes));
        ro.insert("cause", util::noteSetToJson(rule.cause));
        ro.insert("threshold", rule.threshold);
        ro.insert("minimum", rule.minimum);
        ro.insert("only_self", rule.onlySelf);
        rs.append(ro);
    }
    QJsonObject o;
    o.insert("delay", delayMs);
    o.insert("history", historyMs);
    o.insert("threshold", threshold);
    o.insert("minimum", minimum);
    o.insert("rules", rs);
    return o;
}

CrossTalkPolicy::CrossTalkPolicy(const CrossTalkConfig& config) : engine::Policy(kKind), m_cfg(config) {
    for (const auto& r : m_cfg.rules) m_rules.push_back(compile(r));

    // Without rules one catch-all applies the defaults. With rules, a trailing catch-all
    // without causes still enforces the default minimum for every note.
    CrossTalkRule fallback;
    if (!m_rules.isEmpty()) fallback.threshold = 0;
    m_rules.push_back(compile(fallback));
}

CrossTalkPolicy::Rule CrossTalkPolicy::compile(const CrossTalkRule& r) const {
    Rule out;
    out.notes = r.notes;
    out.allNotes = r.notes.isEmpty();
    const int threshold = (r.threshold < 0 || r.threshold > 100) ? m_cfg.threshold : r.threshold;
    out.threshold = threshold / 100.0;
    out.minimum = (r.minimum < 0 || r.minimum > 127) ? m_cfg.minimum : r.minimum;
    out.cause = r.cause;
    out.allCauses = r.cause.isEmpty() && threshold != 0;
    out.noCause = r.cause.isEmpty() && threshold == 0;
    out.onlySelf = r.onlySelf;
    return out;
}

int CrossTalkPolicy::pendingCount() const {
    const auto lock = lockState();
    return int(m_pending.size());
}

int CrossTalkPolicy::historySize() const {
    const auto lock = lockState();
    return int(m_history.size());
}

void CrossTalkPolicy::onStop() {
    if (!m_pending.empty()) {
        qWarning().noquote() << QString("CrossTalk: dropping %1 undecided events").arg(m_pending.size());
    }
    m_pending.clear();
    m_history.clear();
}

EventList CrossTalkPolicy::onEvent(const Event& e) {
    if (e.isNoteOn()) m_history.push_back(e);

    if (m_cfg.delayMs <= 0) {
        if (e.isNoteOn() && blocks(e, e.timestampMs)) return {};
        return {e};
    }

    m_pending.push_back(e);
    scheduleAt(e.timestampMs + m_cfg.delayMs, [this]() { decideNext(); });
    return {};
}

void CrossTalkPolicy::decideNext() {
    if (m_pending.empty()) return;
    const Event e = m_pending.front();
    m_pending.pop_front();
    if (e.isNoteOn() && blocks(e, e.timestampMs + m_cfg.delayMs)) return;
    emitDownstream(e);
}

void CrossTalkPolicy::pruneHistory(qint64 decisionMs) {
    const qint64 horizon = decisionMs - m_cfg.delayMs - m_cfg.historyMs;
    while (!m_history.empty() && m_history.front().timestampMs < horizon) m_history.pop_front();
}

bool CrossTalkPolicy::blocks(const Event& e, qint64 decisionMs) {
    pruneHistory(decisionMs);

    for (const auto& rule : m_rules) {
        if (!rule.allNotes && !rule.notes.contains(e.note)) continue;

        if (e.velocity < rule.minimum) {
            qDebug().noquote() << QString("CrossTalk: blocked %1 (below minimum %2)").arg(e.toString()).arg(rule.minimum);
            return true;
        }
        if (rule.noCause) continue;

        int loudest = -1;
        for (const auto& h : m_history) {
            if (h.timestampMs > decisionMs) continue;
            if (!rule.allCauses && !rule.cause.contains(h.note)) continue;
            loudest = std::max(loudest, h.velocity);
        }
        if (loudest < 0) continue;

        const double acceptable = loudest * rule.threshold;
        bool accepted = e.velocity >= acceptable;
        if (!accepted && !rule.onlySelf) {
            for (const auto& h : m_history) {
                if (h.note == e.note && h.timestampMs <= decisionMs && h.velocity >= acceptable) {
                    accepted = true;
                    break;
                }
            }
        }
        if (!accepted) {
            qDebug().noquote() << QString("CrossTalk: blocked %1 (loudest cause %2)").arg(e.toString()).arg(loudest);
            return true;
        }
    }
    return false;
}

} // namespace xtalk::policies
