#pragma once

#include <QJsonObject>
#include <QSet>
#include <QString>

#include <deque>

#include "xtalk/engine/Policy.h"

namespace xtalk::policies {

struct TimeCheckConfig {
    QSet<int> control;          // notes to check; empty = every note
    QSet<int> toggle;           // notes switching the check on/off
    QString client = "time";    // name of the reference output port
    int delayMs = 0;            // error note delay after the offending hit
    int playIntervalMs = 500;   // click period; <= 0 disables clicks and checks
    int acceptRangeMs = 30;
    int maxDiffMs = 100;        // negative: unbounded
    int errorEarly = 1;
    int errorLate = 2;
    int errorVelocity = 127;    // outside 0..127: use the hit's velocity
    bool drop = false;          // remove off-time hits from the main stream
    int calibrationMs = 0;      // seed of the calibration offset
    bool autoCalibration = true;
    int calibrationWindow = 100;
    int clickNote = 37;
    int clickVelocity = 100;

    static bool fromJson(const QJsonObject& o, TimeCheckConfig* out, QString* outError);
    QJsonObject toJson() const;
};

// Practice aid: plays a reference click and reports hits that are early or late.
//
// Clicks sit on a grid (origin + k * play_interval). A hit at t is compared with the click
// nearest to t - calibration; the remaining deviation decides between on time, error note
// and unrelated hit.
class TimeCheckPolicy : public engine::Policy {
public:
    static constexpr const char* kKind = "time";
    static constexpr int kReferenceChannel = 15; // channel 16

    enum class Verdict { Unchecked, OnTime, Early, Late, OutOfRange };

    explicit TimeCheckPolicy(const TimeCheckConfig& config);

    const TimeCheckConfig& config() const { return m_cfg; }

    bool isEnabled() const;
    double calibrationMs() const;
    qint64 clickOriginMs() const;
    qint64 clicksSent() const;
    Verdict lastVerdict() const;
    qint64 lastDeviationMs() const;

protected:
    void onStart() override;
    engine::EventList onEvent(const engine::Event& e) override;
    QJsonObject toJson() const override { return m_cfg.toJson(); }

private:
    bool checks(int note) const;
    void scheduleClick(qint64 index);
    qint64 nearestClickMs(qint64 t) const;
    void reportError(const engine::Event& hit, qint64 deviationMs);
    void observe(qint64 observedMs);

    const TimeCheckConfig m_cfg;

    bool m_enabled = true;
    qint64 m_clickOriginMs = -1;
    qint64 m_clickCursor = 0; // index of the next click
    double m_calibrationMs = 0.0;
    std::deque<qint64> m_history; // accepted observed offsets (hit - click)
    Verdict m_lastVerdict = Verdict::Unchecked;
    qint64 m_lastDeviationMs = 0;
};

} // namespace xtalk::policies
