#include "xtalk/policies/AmplifyPolicy.h"

#include <QDebug>

#include <cmath>

#include "xtalk/util/Json.h"

namespace xtalk::policies {

bool AmplifyConfig::fromJson(const QJsonObject& o, AmplifyConfig* out, QString* outError) {
    util::ConfigReader r(AmplifyPolicy::kKind, o);
    AmplifyConfig c;

    const QJsonObject gains = r.getObject("amplify");
    for (auto it = gains.begin(); it != gains.end() && r.ok(); ++it) {
        int note = 0;
        if (!util::parseNoteKey(it.key(), &note)) {
            r.fail(QString("'amplify' key '%1' is not a MIDI note").arg(it.key()));
            break;
        }
        if (!it.value().isObject()) {
            r.fail(QString("'amplify.%1' must be an object with 'multiply' and/or 'add'").arg(it.key()));
            break;
        }
        const QJsonObject go = it.value().toObject();
        Gain g;
        const auto mul = go.value("multiply");
        const auto add = go.value("add");
        if (!mul.isUndefined() && !mul.isDouble()) {
            r.fail(QString("'amplify.%1.multiply' must be a number").arg(it.key()));
            break;
        }
        if (!add.isUndefined() && !add.isDouble()) {
            r.fail(QString("'amplify.%1.add' must be a number").arg(it.key()));
            break;
        }
        if (mul.isDouble()) g.multiply = mul.toDouble();
        if (add.isDouble()) g.add = int(std::lround(add.toDouble()));
        c.gains.insert(note, g);
    }

    if (!r.ok()) {
        if (outError) *outError = r.error();
        return false;
    }
    if (out) *out = c;
    return true;
}

QJsonObject AmplifyConfig::toJson() const {
    QJsonObject gainsJson;
    for (auto it = gains.begin(); it != gains.end(); ++it) {
        QJsonObject g;
        g.insert("multiply", it.value().multiply);
        g.insert("add", it.value().add);
        gainsJson.insert(QString::number(it.key()), g);
    }
    QJsonObject o;
    o.insert("amplify", gainsJson);
    return o;
}

int AmplifyConfig::apply(int velocity, const Gain& g) {
    const long scaled = std::lround(double(velocity) * g.multiply / 100.0);
    return engine::clampMidi(int(scaled) + g.add);
}

AmplifyPolicy::AmplifyPolicy(const AmplifyConfig& config)
    : engine::Policy(kKind), m_cfg(config) {}

engine::EventList AmplifyPolicy::onEvent(const engine::Event& e) {
    if (!e.isNoteOn()) return {e};
    const auto it = m_cfg.gains.constFind(e.note);
    if (it == m_cfg.gains.constEnd()) return {e};

    const int velocity = AmplifyConfig::apply(e.velocity, it.value());
    qDebug().noquote() << QString("Amplify: note %1 velocity %2 -> %3").arg(e.note).arg(e.velocity).arg(velocity);
    return {e.withVelocity(velocity)};
}

} // namespace xtalk::policies
