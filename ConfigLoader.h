#ifndef CONFIGLOADER_H
#define CONFIGLOADER_H

#include <QByteArray>
#include <QString>
#include <QStringList>

#include "PipelineConfig.h"
#include "xtalk/policies/PolicyRegistry.h"

namespace xtalk::engine {
class Pipeline;
}

class ConfigLoader {
public:
    ConfigLoader();

    // An empty path yields a valid, empty document (every policy at its defaults).
    PipelineConfig loadConfig(const QString& filePath);
    PipelineConfig loadFromJsonBytes(const QByteArray& bytes, const QString& origin);

    // Chain to build: the explicit list if given, else the document's "pipeline", else the
    // cross-talk filter alone.
    static QStringList resolveChain(const QStringList& requested, const PipelineConfig& config);

    // Creates every policy of the chain and appends it to the pipeline. Stops at the first
    // configuration error.
    static bool buildPipeline(const PipelineConfig& config,
                              const QStringList& chain,
                              const xtalk::policies::PolicyEnvironment& env,
                              xtalk::engine::Pipeline* pipeline,
                              QString* outError);
};

#endif // CONFIGLOADER_H
