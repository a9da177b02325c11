#pragma once

#include <QHash>
#include <QJsonObject>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>

#include "xtalk/engine/Policy.h"

namespace xtalk::policies {

struct ReplaceRule {
    QString id;          // empty: the rule forms a group of its own
    QSet<int> from;
    int to = 0;
    QSet<int> enable;    // NoteOn triggers; a note in both sets toggles
    QSet<int> disable;
    bool enabled = false; // initial state
};

struct ReplaceConfig {
    QVector<ReplaceRule> rules;
    bool server = false;
    int port = 1560;
    QString address = "localhost";
    int timeoutMs = 5000; // per-line read timeout of control connections

    static bool fromJson(const QJsonObject& o, ReplaceConfig* out, QString* outError);
    QJsonObject toJson() const;
};

// Runtime-switchable note remapping.
//
// Rules are switched by trigger notes or by text commands (see ControlServer):
//   enable|disable|toggle|unique <id>|next|previous
//   next|previous
class ReplacePolicy : public engine::Policy {
public:
    static constexpr const char* kKind = "replace";

    explicit ReplacePolicy(const ReplaceConfig& config);

    const ReplaceConfig& config() const { return m_cfg; }
    bool acceptsCommands() const override { return true; }

    bool isRuleEnabled(int ruleIndex) const;
    QStringList enabledGroups() const;
    QStringList groups() const { return m_groupIds; }
    int cursor() const;

protected:
    engine::EventList onEvent(const engine::Event& e) override;
    engine::CommandResult onCommand(const QString& line) override;
    QJsonObject toJson() const override { return m_cfg.toJson(); }

private:
    enum class Action { Enable, Disable, Toggle, Unique };

    void applyTriggers(int note);
    int mapNote(int note) const;
    int stepCursor(int direction);
    void apply(Action action, int group);
    void setEnabled(int ruleIndex, bool on);
    static QString groupIdOf(const ReplaceRule& rule, int ruleIndex);

    const ReplaceConfig m_cfg;

    QVector<bool> m_enabled;              // per rule
    QStringList m_groupIds;               // distinct group ids in config order
    QVector<QVector<int>> m_groupRules;   // group -> rule indices
    int m_cursor = -1;
    QHash<int, int> m_active;             // (channel << 8 | note) of a sounding NoteOn -> emitted note
};

} // namespace xtalk::policies
