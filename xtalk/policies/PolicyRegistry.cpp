#include "xtalk/policies/PolicyRegistry.h"

#include "xtalk/policies/AmplifyPolicy.h"
#include "xtalk/policies/ChokePolicy.h"
#include "xtalk/policies/CrossTalkPolicy.h"
#include "xtalk/policies/ExecPolicy.h"
#include "xtalk/policies/ReplacePolicy.h"
#include "xtalk/policies/ReplayPolicy.h"
#include "xtalk/policies/TimeCheckPolicy.h"

namespace xtalk::policies {

namespace {

const PolicyRegistry::Entry kEntries[] = {
    {CrossTalkPolicy::kKind, "threshold based cross-talk cancellation"},
    {ChokePolicy::kKind, "cymbal choke windows opened by trigger notes"},
    {AmplifyPolicy::kKind, "per-note velocity gain and offset"},
    {ExecPolicy::kKind, "run commands on note hits"},
    {ReplayPolicy::kKind, "record and loop a take"},
    {TimeCheckPolicy::kKind, "reference click and timing feedback"},
    {ReplacePolicy::kKind, "switchable note remapping with a TCP control server"},
};

template <typename Config, typename PolicyT>
std::unique_ptr<engine::Policy> build(const QJsonObject& o, QString* outError) {
    Config cfg;
    if (!Config::fromJson(o, &cfg, outError)) return nullptr;
    return std::make_unique<PolicyT>(cfg);
}

} // namespace

QStringList PolicyRegistry::kinds() {
    QStringList out;
    for (const auto& e : kEntries) out.push_back(QString::fromUtf8(e.kind));
    return out;
}

QString PolicyRegistry::describe(const QString& kind) {
    for (const auto& e : kEntries) {
        if (kind == QLatin1String(e.kind)) return QString::fromUtf8(e.description);
    }
    return {};
}

bool PolicyRegistry::contains(const QString& kind) {
    return kinds().contains(kind);
}

std::unique_ptr<engine::Policy> PolicyRegistry::create(const QString& kind,
                                                       const QJsonObject& config,
                                                       const PolicyEnvironment& env,
                                                       QString* outError) {
    if (kind == ChokePolicy::kKind) return build<ChokeConfig, ChokePolicy>(config, outError);
    if (kind == AmplifyPolicy::kKind) return build<AmplifyConfig, AmplifyPolicy>(config, outError);
    if (kind == ReplayPolicy::kKind) return build<ReplayConfig, ReplayPolicy>(config, outError);
    if (kind == TimeCheckPolicy::kKind) return build<TimeCheckConfig, TimeCheckPolicy>(config, outError);
    if (kind == ReplacePolicy::kKind) return build<ReplaceConfig, ReplacePolicy>(config, outError);
    if (kind == CrossTalkPolicy::kKind) return build<CrossTalkConfig, CrossTalkPolicy>(config, outError);
    if (kind == ExecPolicy::kKind) {
        ExecConfig cfg;
        if (!ExecConfig::fromJson(config, &cfg, outError)) return nullptr;
        if (!env.launcher) {
            if (outError) *outError = "exec: no process launcher available";
            return nullptr;
        }
        return std::make_unique<ExecPolicy>(cfg, env.launcher);
    }
    if (outError) *outError = QString("unknown policy '%1' (known: %2)").arg(kind, kinds().join(", "));
    return nullptr;
}

} // namespace xtalk::policies
