#pragma once

#include <QJsonObject>
#include <QSet>
#include <QString>
#include <QVector>

#include <deque>

#include "xtalk/engine/Policy.h"

namespace xtalk::policies {

struct CrossTalkRule {
    QSet<int> notes;      // empty: every note
    QSet<int> cause;      // empty: every note (none if the effective threshold is 0)
    int threshold = -1;   // percent; outside 0..100 uses the policy default
    int minimum = -1;     // velocity; outside 0..127 uses the policy default
    bool onlySelf = false;
};

struct CrossTalkConfig {
    int delayMs = 5;
    int historyMs = 150;
    int threshold = 30;
    int minimum = 0;
    QVector<CrossTalkRule> rules;

    static bool fromJson(const QJsonObject& o, CrossTalkConfig* out, QString* outError);
    QJsonObject toJson() const;
};

// Threshold based cross-talk cancellation.
//
// Every event is held back for delay ms so that the strike causing cross-talk has a chance
// to arrive. A NoteOn is then blocked if it is weaker than threshold percent of the loudest
// cause note seen within delay + history ms, unless a recent hit of the same note was loud
// enough. Events leave in arrival order.
class CrossTalkPolicy : public engine::Policy {
public:
    static constexpr const char* kKind = "xtalk";

    explicit CrossTalkPolicy(const CrossTalkConfig& config);

    const CrossTalkConfig& config() const { return m_cfg; }
    int pendingCount() const;
    int historySize() const;

protected:
    void onStop() override;
    engine::EventList onEvent(const engine::Event& e) override;
    QJsonObject toJson() const override { return m_cfg.toJson(); }

private:
    struct Rule {
        QSet<int> notes;
        bool allNotes = true;
        QSet<int> cause;
        bool allCauses = true;
        bool noCause = false;
        double threshold = 0.0; // fraction
        int minimum = 0;
        bool onlySelf = false;
    };

    Rule compile(const CrossTalkRule& r) const;
    void decideNext();
    bool blocks(const engine::Event& e, qint64 decisionMs);
    void pruneHistory(qint64 decisionMs);

    const CrossTalkConfig m_cfg;
    QVector<Rule> m_rules;
    std::deque<engine::Event> m_history; // recent NoteOns, arrival order
    std::deque<engine::Event> m_pending; // waiting for their decision
};

} // namespace xtalk::policies
