#include "xtalk/policies/ExecPolicy.h"

#include <QDebug>

#include <cmath>

#include "xtalk/util/Json.h"

namespace xtalk::policies {

using engine::Event;
using engine::EventList;

namespace {

// Accepts [{command: [...], min_velocity: n}, ...] and the short form ["cmd", "arg", ...].
static bool parseEntries(const QJsonValue& v, const QString& key, util::ConfigReader& r,
                         QVector<ExecConfig::Entry>* out) {
    if (!v.isArray() || v.toArray().isEmpty()) {
        r.fail(QString("'exec.%1' must be a non-empty list").arg(key));
        return false;
    }
    const QJsonArray a = v.toArray();

    if (a.first().isString()) {
        ExecConfig::Entry e;
        for (const auto& s : a) {
            if (!s.isString()) {
                r.fail(QString("'exec.%1' must only contain strings").arg(key));
                return false;
            }
            e.command << s.toString();
        }
        out->push_back(e);
        return true;
    }

    for (const auto& item : a) {
        if (!item.isObject()) {
            r.fail(QString("'exec.%1' entries must be objects with 'command' and 'min_velocity'").arg(key));
            return false;
        }
        const QJsonObject o = item.toObject();
        const auto cmd = o.value("command");
        if (!cmd.isArray() || cmd.toArray().isEmpty()) {
            r.fail(QString("'exec.%1.command' must be a non-empty list of strings").arg(key));
            return false;
        }
        ExecConfig::Entry e;
        for (const auto& s : cmd.toArray()) {
            if (!s.isString()) {
                r.fail(QString("'exec.%1.command' must be a list of strings").arg(key));
                return false;
            }
            e.command << s.toString();
        }
        const auto minV = o.value("min_velocity");
        if (!minV.isUndefined()) {
            if (!minV.isDouble()) {
                r.fail(QString("'exec.%1.min_velocity' must be a number").arg(key));
                return false;
            }
            const double d = minV.toDouble();
            if (d != std::floor(d) || d < 0 || d > 127) {
                r.fail(QString("'exec.%1.min_velocity' must be an integer in 0..127").arg(key));
                return false;
            }
            e.minVelocity = int(d);
        }
        out->push_back(e);
    }
    return true;
}

static QJsonArray entriesToJson(const QVector<ExecConfig::Entry>& entries) {
    QJsonArray a;
    for (const auto& e : entries) {
        QJsonObject o;
        o.insert("command", QJsonArray::fromStringList(e.command));
        o.insert("min_velocity", e.minVelocity);
        a.append(o);
    }
    return a;
}

} // namespace

bool ExecConfig::fromJson(const QJsonObject& o, ExecConfig* out, QString* outError) {
    util::ConfigReader r(ExecPolicy::kKind, o);
    ExecConfig c;

    const QJsonObject cmds = r.getObject("exec");
    for (auto it = cmds.begin(); it != cmds.end() && r.ok(); ++it) {
        if (it.key() == "default") {
            parseEntries(it.value(), it.key(), r, &c.defaultCommands);
            continue;
        }
        int note = 0;
        if (!util::parseNoteKey(it.key(), &note)) {
            r.fail(QString("'exec' key '%1' is not a MIDI note").arg(it.key()));
            break;
        }
        QVector<Entry> entries;
        if (parseEntries(it.value(), it.key(), r, &entries)) c.commands.insert(note, entries);
    }
    c.pass = r.getBool("pass", c.pass);
    c.allNotes = r.getBool("all_notes", c.allNotes);
    c.suppressMs = r.getInt("suppress", c.suppressMs);

    if (!r.ok()) {
        if (outError) *outError = r.error();
        return false;
    }
    if (out) *out = c;
    return true;
}

QJsonObject ExecConfig::toJson() const {
    QJsonObject cmds;
    for (auto it = commands.begin(); it != commands.end(); ++it) {
        cmds.insert(QString::number(it.key()), entriesToJson(it.value()));
    }
    if (!defaultCommands.isEmpty()) cmds.insert("default", entriesToJson(defaultCommands));

    QJsonObject o;
    o.insert("exec", cmds);
    o.insert("pass", pass);
    o.insert("all_notes", allNotes);
    o.insert("suppress", suppressMs);
    return o;
}

ExecPolicy::ExecPolicy(const ExecConfig& config, io::ProcessLauncher* launcher)
    : engine::Policy(kKind), m_cfg(config), m_launcher(launcher) {}

bool ExecPolicy::isDebouncing(int note) const {
    const auto lock = lockState();
    return m_debounce.contains(note);
}

const QVector<ExecConfig::Entry>* ExecPolicy::entriesFor(int note) const {
    const auto it = m_cfg.commands.constFind(note);
    if (it != m_cfg.commands.constEnd()) return &it.value();
    if (m_cfg.allNotes && !m_cfg.defaultCommands.isEmpty()) return &m_cfg.defaultCommands;
    return nullptr;
}

EventList ExecPolicy::onEvent(const Event& e) {
    const auto* entries = entriesFor(e.note);
    if (!entries) return {e};

    if (e.isNoteOn()) trigger(e, *entries);

    // Without pass, matching notes are blocked even when nothing ran (debounced or below every tier),
    // and so are their note offs.
    if (!m_cfg.pass) return {};
    return {e};
}

void ExecPolicy::trigger(const Event& e, const QVector<ExecConfig::Entry>& entries) {
    if (m_cfg.suppressMs >= 0) {
        const auto it = m_debounce.constFind(e.note);
        if (it != m_debounce.constEnd() && e.timestampMs - it->lastMs <= m_cfg.suppressMs) {
            qDebug().noquote() << QString("Exec: suppressed re-trigger of note %1").arg(e.note);
            return;
        }
    }

    const ExecConfig::Entry* match = nullptr;
    for (const auto& entry : entries) {
        if (e.velocity >= entry.minVelocity) {
            match = &entry;
            break;
        }
    }
    if (!match) {
        qDebug().noquote() << QString("Exec: %1 is below every velocity tier").arg(e.toString());
        return;
    }

    if (m_cfg.suppressMs >= 0) {
        Debounce& d = m_debounce[e.note];
        if (d.expiryTimer != engine::Scheduler::kInvalidTimer) cancelTimer(d.expiryTimer);
        d.lastMs = e.timestampMs;
        const int note = e.note;
        d.expiryTimer = scheduleAt(e.timestampMs + m_cfg.suppressMs + 1, [this, note]() { m_debounce.remove(note); });
    }

    qInfo().noquote() << QString("Exec: note %1 (velocity %2) -> %3").arg(e.note).arg(e.velocity).arg(match->command.join(' '));
    if (!m_launcher) {
        qWarning() << "Exec: no process launcher available";
        return;
    }
    m_launcher->spawn(match->command);
}

} // namespace xtalk::policies
