#pragma once

#include <QHash>
#include <QJsonObject>
#include <QMap>
#include <QStringList>
#include <QVector>

#include "xtalk/engine/Policy.h"
#include "xtalk/io/ProcessLauncher.h"

namespace xtalk::policies {

struct ExecConfig {
    struct Entry {
        QStringList command;
        int minVelocity = 0;
    };

    QMap<int, QVector<Entry>> commands; // note -> velocity tiers, first match wins
    QVector<Entry> defaultCommands;     // "default" key, used for unlisted notes when allNotes is set
    bool pass = true;
    bool allNotes = false;
    int suppressMs = -1;                // negative: no debounce

    static bool fromJson(const QJsonObject& o, ExecConfig* out, QString* outError);
    QJsonObject toJson() const;
};

// Runs external commands on matching note hits, with velocity tiers and per-note debounce.
class ExecPolicy : public engine::Policy {
public:
    static constexpr const char* kKind = "exec";

    ExecPolicy(const ExecConfig& config, io::ProcessLauncher* launcher);

    const ExecConfig& config() const { return m_cfg; }
    bool isDebouncing(int note) const;

protected:
    engine::EventList onEvent(const engine::Event& e) override;
    QJsonObject toJson() const override { return m_cfg.toJson(); }

private:
    const QVector<ExecConfig::Entry>* entriesFor(int note) const;
    void trigger(const engine::Event& e, const QVector<ExecConfig::Entry>& entries);

    struct Debounce {
        qint64 lastMs = 0;
        engine::Scheduler::TimerId expiryTimer = engine::Scheduler::kInvalidTimer;
    };

    const ExecConfig m_cfg;
    io::ProcessLauncher* m_launcher = nullptr; // not owned
    QHash<int, Debounce> m_debounce;
};

} // namespace xtalk::policies
