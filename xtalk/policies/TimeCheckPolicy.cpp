#include "xtalk/policies/TimeCheckPolicy.h"

#include <QDebug>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numeric>

#include "xtalk/util/Json.h"

namespace xtalk::policies {

using engine::Event;
using engine::EventList;
using engine::OutputPort;

bool TimeCheckConfig::fromJson(const QJsonObject& o, TimeCheckConfig* out, QString* outError) {
    util::ConfigReader r(TimeCheckPolicy::kKind, o);
    TimeCheckConfig c;
    c.control = r.getNoteSet("control");
    c.toggle = r.getNoteSet("toggle");
    c.client = r.getString("client", c.client);
    c.delayMs = r.getInt("delay", c.delayMs);
    c.playIntervalMs = r.getInt("play_interval", c.playIntervalMs);
    c.acceptRangeMs = r.getInt("accept_range", c.acceptRangeMs);
    c.maxDiffMs = r.getInt("max_diff", c.maxDiffMs);
    c.errorEarly = r.getInt("error_early", c.errorEarly);
    c.errorLate = r.getInt("error_late", c.errorLate);
    c.errorVelocity = r.getInt("error_velocity", c.errorVelocity);
    c.drop = r.getBool("drop", c.drop);
    c.calibrationMs = r.getInt("calibration", c.calibrationMs);
    c.autoCalibration = r.getBool("auto_calibration", c.autoCalibration);
    c.calibrationWindow = r.getInt("calibration_window", c.calibrationWindow);
    c.clickNote = r.getInt("click_note", c.clickNote);
    c.clickVelocity = r.getInt("click_velocity", c.clickVelocity);

    if (r.ok() && c.delayMs < 0) r.fail("'delay' must not be negative");
    if (r.ok() && c.acceptRangeMs < 0) r.fail("'accept_range' must not be negative");
    if (r.ok() && (c.errorEarly < 0 || c.errorEarly > 127)) r.fail("'error_early' must be a MIDI note");
    if (r.ok() && (c.errorLate < 0 || c.errorLate > 127)) r.fail("'error_late' must be a MIDI note");
    if (r.ok() && (c.clickNote < 0 || c.clickNote > 127)) r.fail("'click_note' must be a MIDI note");
    if (r.ok() && (c.clickVelocity < 1 || c.clickVelocity > 127)) r.fail("'click_velocity' must be 1..127");
    if (r.ok() && c.calibrationWindow < 1) r.fail("'calibration_window' must be positive");
    if (r.ok() && c.client.trimmed().isEmpty()) r.fail("'client' must not be empty");

    if (!r.ok()) {
        if (outError) *outError = r.error();
        return false;
    }
    if (out) *out = c;
    return true;
}

QJsonObject TimeCheckConfig::toJson() const {
    QJsonObject o;
    o.insert("control", util::noteSetToJson(control));
    o.insert("toggle", util::noteSetToJson(toggle));
    o.insert("client", client);
    o.insert("delay", delayMs);
    o.insert("play_interval", playIntervalMs);
    o.insert("accept_range", acceptRangeMs);
    o.insert("max_diff", maxDiffMs);
    o.insert("error_early", errorEarly);
    o.insert("error_late", errorLate);
    o.insert("error_velocity", errorVelocity);
    o.insert("drop", drop);
    o.insert("calibration", calibrationMs);
    o.insert("auto_calibration", autoCalibration);
    o.insert("calibration_window", calibrationWindow);
    o.insert("click_note", clickNote);
    o.insert("click_velocity", clickVelocity);
    return o;
}

TimeCheckPolicy::TimeCheckPolicy(const TimeCheckConfig& config)
    : engine::Policy(kKind), m_cfg(config), m_calibrationMs(config.calibrationMs) {
    m_history.push_back(config.calibrationMs);
}

bool TimeCheckPolicy::isEnabled() const {
    const auto lock = lockState();
    return m_enabled;
}

double TimeCheckPolicy::calibrationMs() const {
    const auto lock = lockState();
    return m_calibrationMs;
}

qint64 TimeCheckPolicy::clickOriginMs() const {
    const auto lock = lockState();
    return m_clickOriginMs;
}

qint64 TimeCheckPolicy::clicksSent() const {
    const auto lock = lockState();
    return m_clickCursor;
}

TimeCheckPolicy::Verdict TimeCheckPolicy::lastVerdict() const {
    const auto lock = lockState();
    return m_lastVerdict;
}

qint64 TimeCheckPolicy::lastDeviationMs() const {
    const auto lock = lockState();
    return m_lastDeviationMs;
}

void TimeCheckPolicy::onStart() {
    if (m_cfg.playIntervalMs <= 0) {
        qInfo() << "Time: no play interval configured, timing checks disabled";
        return;
    }
    m_clickOriginMs = nowMs();
    m_clickCursor = 0;
    scheduleClick(0);
}

void TimeCheckPolicy::scheduleClick(qint64 index) {
    const qint64 due = m_clickOriginMs + index * m_cfg.playIntervalMs;
    scheduleAt(due, [this, index, due]() {
        sendDirect(OutputPort::Reference, Event::noteOn(m_cfg.clickNote, m_cfg.clickVelocity, due, kReferenceChannel));
        sendDirect(OutputPort::Reference, Event::noteOff(m_cfg.clickNote, due, kReferenceChannel));
        m_clickCursor = index + 1;
        scheduleClick(index + 1);
    });
}

bool TimeCheckPolicy::checks(int note) const {
    return m_cfg.control.isEmpty() || m_cfg.control.contains(note);
}

qint64 TimeCheckPolicy::nearestClickMs(qint64 t) const {
    const double k = std::round(double(t - m_clickOriginMs) / double(m_cfg.playIntervalMs));
    return m_clickOriginMs + qint64(std::max(0.0, k)) * m_cfg.playIntervalMs;
}

EventList TimeCheckPolicy::onEvent(const Event& e) {
    if (!e.isNoteOn()) return {e};

    if (m_cfg.toggle.contains(e.note)) {
        m_enabled = !m_enabled;
        qInfo().noquote() << QString("Time: checking %1").arg(m_enabled ? "enabled" : "disabled");
        return {e};
    }
    if (!m_enabled || m_clickOriginMs < 0 || !checks(e.note)) return {e};

    const qint64 calibration = qint64(std::llround(m_calibrationMs));
    const qint64 click = nearestClickMs(e.timestampMs - calibration);
    const qint64 observed = e.timestampMs - click;
    const qint64 deviation = observed - calibration;
    const qint64 magnitude = std::llabs(deviation);
    m_lastDeviationMs = deviation;

    qDebug().noquote() << QString("Time: %1 vs click %2: deviation %3 ms (calibration %4)")
                              .arg(e.toString()).arg(click).arg(deviation).arg(m_calibrationMs);

    if (magnitude <= m_cfg.acceptRangeMs) {
        m_lastVerdict = Verdict::OnTime;
        if (m_cfg.autoCalibration && deviation != 0) observe(observed);
        return {e};
    }

    if (m_cfg.maxDiffMs >= 0 && magnitude > m_cfg.maxDiffMs) {
        // Too far from any click to be an attempt at it.
        m_lastVerdict = Verdict::OutOfRange;
    } else {
        m_lastVerdict = deviation < 0 ? Verdict::Early : Verdict::Late;
        reportError(e, deviation);
    }

    if (m_cfg.drop) return {};
    return {e};
}

void TimeCheckPolicy::reportError(const Event& hit, qint64 deviationMs) {
    const int note = deviationMs < 0 ? m_cfg.errorEarly : m_cfg.errorLate;
    const int velocity = (m_cfg.errorVelocity < 0 || m_cfg.errorVelocity > 127) ? hit.velocity : m_cfg.errorVelocity;
    qInfo().noquote() << QString("Time: %1 ms %2 (note %3)")
                             .arg(std::llabs(deviationMs)).arg(deviationMs < 0 ? "early" : "late").arg(hit.note);

    auto send = [this, note, velocity]() {
        const qint64 t = nowMs();
        sendDirect(OutputPort::Reference, Event::noteOn(note, velocity, t, kReferenceChannel));
        sendDirect(OutputPort::Reference, Event::noteOff(note, t, kReferenceChannel));
    };
    if (m_cfg.delayMs <= 0) {
        send();
        return;
    }
    scheduleAt(hit.timestampMs + m_cfg.delayMs, send);
}

void TimeCheckPolicy::observe(qint64 observedMs) {
    // Bounded moving average over accepted observations, seeded with the configured calibration.
    m_history.push_back(observedMs);
    while (int(m_history.size()) > m_cfg.calibrationWindow) m_history.pop_front();
    const double sum = std::accumulate(m_history.begin(), m_history.end(), 0.0);
    m_calibrationMs = sum / double(m_history.size());
}

} // namespace xtalk::policies
