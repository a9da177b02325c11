#pragma once

#include <QHash>
#include <QJsonObject>
#include <QMap>
#include <QSet>

#include "xtalk/engine/Policy.h"

namespace xtalk::policies {

struct ChokeConfig {
    QMap<int, QSet<int>> groups; // trigger note -> member notes it chokes
    int chokeMaxMs = 20;         // window length
    int chokeCount = 1;          // members allowed through per window
    int cymbalMax = 50;          // velocity ceiling for members that pass

    static bool fromJson(const QJsonObject& o, ChokeConfig* out, QString* outError);
    QJsonObject toJson() const;
};

// Suppresses or softens cross-talk on the members of a choke group right after its trigger was hit.
class ChokePolicy : public engine::Policy {
public:
    static constexpr const char* kKind = "choke";

    explicit ChokePolicy(const ChokeConfig& config);

    const ChokeConfig& config() const { return m_cfg; }

    bool isWindowOpen(int trigger) const;
    int memberCount(int trigger) const;

protected:
    engine::EventList onEvent(const engine::Event& e) override;
    QJsonObject toJson() const override { return m_cfg.toJson(); }

private:
    struct Window {
        qint64 expiryMs = -1;
        int count = 0;
        engine::Scheduler::TimerId expiryTimer = engine::Scheduler::kInvalidTimer;
    };

    void expireWindows(qint64 nowMs);
    void openWindow(int trigger, qint64 nowMs);
    void closeWindow(int trigger);

    const ChokeConfig m_cfg;
    QHash<int, Window> m_windows; // open windows by trigger note
};

} // namespace xtalk::policies
