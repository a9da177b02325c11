#include "ConfigLoader.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include "xtalk/engine/Pipeline.h"
#include "xtalk/policies/CrossTalkPolicy.h"

ConfigLoader::ConfigLoader() {}

PipelineConfig ConfigLoader::loadConfig(const QString& filePath) {
    PipelineConfig config;
    config.path = filePath;
    if (filePath.isEmpty()) {
        config.isValid = true;
        return config;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        config.error = QString("could not open config file %1: %2").arg(filePath, file.errorString());
        qWarning().noquote() << "ConfigLoader:" << config.error;
        return config;
    }
    return loadFromJsonBytes(file.readAll(), filePath);
}

PipelineConfig ConfigLoader::loadFromJsonBytes(const QByteArray& bytes, const QString& origin) {
    PipelineConfig config;
    config.path = origin;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        config.error = QString("%1: JSON error at offset %2: %3")
                           .arg(origin).arg(parseError.offset).arg(parseError.errorString());
        qWarning().noquote() << "ConfigLoader:" << config.error;
        return config;
    }
    if (!doc.isObject()) {
        config.error = QString("%1: top level must be an object").arg(origin);
        qWarning().noquote() << "ConfigLoader:" << config.error;
        return config;
    }

    config.document = doc.object();
    const QJsonValue pipeline = config.document.value("pipeline");
    if (pipeline.isArray()) {
        for (const auto& v : pipeline.toArray()) {
            if (!v.isString() || v.toString().trimmed().isEmpty()) {
                config.error = QString("%1: 'pipeline' must be a list of policy names").arg(origin);
                return config;
            }
            config.chain.push_back(v.toString().trimmed());
        }
    } else if (!pipeline.isUndefined() && !pipeline.isNull()) {
        config.error = QString("%1: 'pipeline' must be a list of policy names").arg(origin);
        return config;
    }

    config.isValid = true;
    return config;
}

QStringList ConfigLoader::resolveChain(const QStringList& requested, const PipelineConfig& config) {
    QStringList chain;
    for (const auto& kind : requested) {
        if (!kind.trimmed().isEmpty()) chain.push_back(kind.trimmed());
    }
    if (!chain.isEmpty()) return chain;
    if (!config.chain.isEmpty()) return config.chain;
    return {QString::fromUtf8(xtalk::policies::CrossTalkPolicy::kKind)};
}

bool ConfigLoader::buildPipeline(const PipelineConfig& config,
                                 const QStringList& chain,
                                 const xtalk::policies::PolicyEnvironment& env,
                                 xtalk::engine::Pipeline* pipeline,
                                 QString* outError) {
    if (!pipeline) {
        if (outError) *outError = "no pipeline";
        return false;
    }
    for (int i = 0; i < chain.size(); ++i) {
        const QString& kind = chain.at(i);
        QString err;
        auto policy = xtalk::policies::PolicyRegistry::create(kind, config.sectionFor(i, kind), env, &err);
        if (!policy) {
            if (outError) *outError = err;
            return false;
        }
        pipeline->addPolicy(std::move(policy));
    }
    return true;
}
