#include "xtalk/policies/ReplacePolicy.h"

#include <QDebug>
#include <QJsonArray>

#include "xtalk/util/Json.h"

namespace xtalk::policies {

using engine::CommandResult;
using engine::Event;
using engine::EventList;

namespace {

int activeKey(const Event& e) { return (e.channel << 8) | e.note; }

} // namespace

bool ReplaceConfig::fromJson(const QJsonObject& o, ReplaceConfig* out, QString* outError) {
    util::ConfigReader r(ReplacePolicy::kKind, o);
    ReplaceConfig c;
    c.server = r.getBool("server", c.server);
    c.port = r.getInt("port", c.port);
    c.address = r.getString("address", c.address);
    c.timeoutMs = r.getInt("timeout", c.timeoutMs);

    const QJsonArray rules = r.getArray("replace");
    for (int i = 0; i < rules.size() && r.ok(); ++i) {
        const QString where = QString("replace[%1]").arg(i);
        if (!rules.at(i).isObject()) {
            r.fail(where + " must be an object");
            break;
        }
        const QJsonObject ro = rules.at(i).toObject();
        ReplaceRule rule;

        const QJsonValue id = ro.value("id");
        if (id.isString()) rule.id = id.toString().trimmed();
        else if (id.isDouble()) rule.id = QString::number(qint64(id.toDouble()));
        else if (!id.isUndefined() && !id.isNull()) r.fail(where + ".id must be a string or number");

        if (!util::parseNote(ro.value("to"), &rule.to)) {
            r.fail(where + ".to must be a MIDI note");
            break;
        }
        if (ro.contains("from")) rule.from = r.noteSetFrom(ro.value("from"), where + ".from");
        if (ro.contains("enable")) rule.enable = r.noteSetFrom(ro.value("enable"), where + ".enable");
        if (ro.contains("disable")) rule.disable = r.noteSetFrom(ro.value("disable"), where + ".disable");
        const QJsonValue en = ro.value("enabled");
        if (en.isBool()) rule.enabled = en.toBool();
        else if (en.isDouble()) rule.enabled = en.toDouble() != 0.0;
        else if (!en.isUndefined() && !en.isNull()) r.fail(where + ".enabled must be a boolean");
        c.rules.push_back(rule);
    }

    if (r.ok() && (c.port < 0 || c.port > 65535)) r.fail("'port' must be 0..65535");
    if (r.ok() && c.timeoutMs <= 0) r.fail("'timeout' must be positive");

    if (!r.ok()) {
        if (outError) *outError = r.error();
        return false;
    }
    if (out) *out = c;
    return true;
}

QJsonObject ReplaceConfig::toJson() const {
    QJsonArray rs;
    for (const auto& rule : rules) {
        QJsonObject ro;
        if (!rule.id.isEmpty()) ro.insert("id", rule.id);
        ro.insert("from", util::noteSetToJson(rule.from));
        ro.insert("to", rule.to);
        ro.insert("enable", util::noteSetToJson(rule.enable));
        ro.insert("disable", util::noteSetToJson(rule.disable));
        ro.insert("enabled", rule.enabled);
        rs.append(ro);
    }
    QJsonObject o;
    o.insert("replace", rs);
    o.insert("server", server);
    o.insert("port", port);
    o.insert("address", address);
    o.insert("timeout", timeoutMs);
    return o;
}

QString ReplacePolicy::groupIdOf(const ReplaceRule& rule, int ruleIndex) {
    return rule.id.isEmpty() ? QString("#%1").arg(ruleIndex) : rule.id;
}

ReplacePolicy::ReplacePolicy(const ReplaceConfig& config) : engine::Policy(kKind), m_cfg(config) {
    for (int i = 0; i < m_cfg.rules.size(); ++i) {
        const auto& rule = m_cfg.rules.at(i);
        m_enabled.push_back(rule.enabled);

        const QString gid = groupIdOf(rule, i);
        int g = m_groupIds.indexOf(gid);
        if (g < 0) {
            m_groupIds.push_back(gid);
            m_groupRules.push_back({});
            g = m_groupIds.size() - 1;
        }
        m_groupRules[g].push_back(i);
        if (rule.enabled && m_cursor < 0) m_cursor = g;
    }
}

bool ReplacePolicy::isRuleEnabled(int ruleIndex) const {
    const auto lock = lockState();
    return ruleIndex >= 0 && ruleIndex < m_enabled.size() && m_enabled.at(ruleIndex);
}

QStringList ReplacePolicy::enabledGroups() const {
    const auto lock = lockState();
    QStringList out;
    for (int g = 0; g < m_groupRules.size(); ++g) {
        for (int i : m_groupRules.at(g)) {
            if (m_enabled.at(i)) {
                out.push_back(m_groupIds.at(g));
                break;
            }
        }
    }
    return out;
}

int ReplacePolicy::cursor() const {
    const auto lock = lockState();
    return m_cursor;
}

void ReplacePolicy::setEnabled(int ruleIndex, bool on) {
    if (m_enabled.at(ruleIndex) == on) return;
    m_enabled[ruleIndex] = on;
    qDebug().noquote() << QString("Replace: rule %1 (%2) %3")
                              .arg(ruleIndex)
                              .arg(groupIdOf(m_cfg.rules.at(ruleIndex), ruleIndex))
                              .arg(on ? "enabled" : "disabled");
}

void ReplacePolicy::applyTriggers(int note) {
    for (int i = 0; i < m_cfg.rules.size(); ++i) {
        const auto& rule = m_cfg.rules.at(i);
        const bool en = rule.enable.contains(note);
        const bool dis = rule.disable.contains(note);
        if (en && dis) setEnabled(i, !m_enabled.at(i));
        else if (en) setEnabled(i, true);
        else if (dis) setEnabled(i, false);
    }
}

int ReplacePolicy::mapNote(int note) const {
    for (int i = 0; i < m_cfg.rules.size(); ++i) {
        if (m_enabled.at(i) && m_cfg.rules.at(i).from.contains(note)) return m_cfg.rules.at(i).to;
    }
    return note;
}

EventList ReplacePolicy::onEvent(const Event& e) {
    if (e.isNoteOn()) {
        applyTriggers(e.note);
        const int to = mapNote(e.note);
        m_active.insert(activeKey(e), to);
        if (to != e.note) qDebug().noquote() << QString("Replace: %1 -> %2").arg(e.note).arg(to);
        return {e.withNote(to)};
    }

    // A NoteOff follows whatever its NoteOn became.
    const auto it = m_active.find(activeKey(e));
    if (it != m_active.end()) {
        const int to = it.value();
        m_active.erase(it);
        return {e.withNote(to)};
    }
    return {e.withNote(mapNote(e.note))};
}

int ReplacePolicy::stepCursor(int direction) {
    const int n = m_groupIds.size();
    if (n == 0) return -1;
    if (m_cursor < 0) m_cursor = direction > 0 ? 0 : n - 1;
    else m_cursor = ((m_cursor + direction) % n + n) % n;
    return m_cursor;
}

void ReplacePolicy::apply(Action action, int group) {
    const auto& members = m_groupRules.at(group);
    switch (action) {
    case Action::Enable:
        for (int i : members) setEnabled(i, true);
        break;
    case Action::Disable:
        for (int i : members) setEnabled(i, false);
        break;
    case Action::Toggle:
        for (int i : members) setEnabled(i, !m_enabled.at(i));
        break;
    case Action::Unique:
        for (int i = 0; i < m_enabled.size(); ++i) {
            if (!members.contains(i)) setEnabled(i, false);
        }
        for (int i : members) setEnabled(i, true);
        m_cursor = group;
        break;
    }
}

CommandResult ReplacePolicy::onCommand(const QString& line) {
    const QString text = line.trimmed();
    if (text.isEmpty()) return CommandResult::failure("empty command");

    const int space = text.indexOf(' ');
    const QString cmd = space < 0 ? text : text.left(space);
    const QString arg = space < 0 ? QString() : text.mid(space + 1).trimmed();

    if (cmd == "next" || cmd == "previous") {
        if (!arg.isEmpty()) return CommandResult::failure(QString("unexpected argument %1").arg(arg));
        const int g = stepCursor(cmd == "next" ? 1 : -1);
        if (g < 0) return CommandResult::failure("no replacements configured");
        apply(Action::Unique, g);
        qInfo().noquote() << QString("Replace: selected %1").arg(m_groupIds.at(g));
        return CommandResult::success();
    }

    Action action;
    if (cmd == "enable") action = Action::Enable;
    else if (cmd == "disable") action = Action::Disable;
    else if (cmd == "toggle") action = Action::Toggle;
    else if (cmd == "unique") action = Action::Unique;
    else return CommandResult::failure(QString("unknown command %1").arg(cmd));

    if (arg.isEmpty()) return CommandResult::failure("missing id");

    int group = -1;
    if (arg == "next" || arg == "previous") {
        group = stepCursor(arg == "next" ? 1 : -1);
        if (group < 0) return CommandResult::failure("no replacements configured");
    } else {
        group = m_groupIds.indexOf(arg);
        if (group < 0) return CommandResult::failure(QString("unknown id %1").arg(arg));
    }

    apply(action, group);
    qInfo().noquote() << QString("Replace: %1 %2").arg(cmd, m_groupIds.at(group));
    return CommandResult::success();
}

} // namespace xtalk::policies
