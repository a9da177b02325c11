#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <memory>

#include "xtalk/engine/Policy.h"

namespace xtalk::io {
class ProcessLauncher;
}

namespace xtalk::policies {

// Collaborators handed to policies at construction.
struct PolicyEnvironment {
    io::ProcessLauncher* launcher = nullptr; // not owned
};

// Closed table of the policy kinds this build knows about.
class PolicyRegistry {
public:
    struct Entry {
        const char* kind;
        const char* description;
    };

    static QStringList kinds();
    static QString describe(const QString& kind);
    static bool contains(const QString& kind);

    // Parses config and builds the policy. Returns nullptr and sets outError on unknown
    // kinds and configuration errors.
    static std::unique_ptr<engine::Policy> create(const QString& kind,
                                                  const QJsonObject& config,
                                                  const PolicyEnvironment& env,
                                                  QString* outError);
};

} // namespace xtalk::policies
