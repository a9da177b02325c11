#pragma once

#include <QJsonObject>
#include <QMap>

#include "xtalk/engine/Policy.h"

namespace xtalk::policies {

struct AmplifyConfig {
    struct Gain {
        double multiply = 100.0; // percent
        int add = 0;
    };

    QMap<int, Gain> gains; // note -> gain

    static bool fromJson(const QJsonObject& o, AmplifyConfig* out, QString* outError);
    QJsonObject toJson() const;

    // clamp(round(v * multiply / 100) + add, 0, 127)
    static int apply(int velocity, const Gain& g);
};

// Linear velocity transform per note. Stateless.
class AmplifyPolicy : public engine::Policy {
public:
    static constexpr const char* kKind = "amplify";

    explicit AmplifyPolicy(const AmplifyConfig& config);

    const AmplifyConfig& config() const { return m_cfg; }

protected:
    engine::EventList onEvent(const engine::Event& e) override;
    QJsonObject toJson() const override { return m_cfg.toJson(); }

private:
    const AmplifyConfig m_cfg;
};

} // namespace xtalk::policies
