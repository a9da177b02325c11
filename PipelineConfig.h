#ifndef PIPELINECONFIG_H
#define PIPELINECONFIG_H

#include <QJsonObject>
#include <QString>
#include <QStringList>

// Parsed configuration document.
//
// Policy sections are keyed by policy kind, or by the policy's position in the chain
// ("0", "1", ...), which takes precedence so one kind can appear twice with different settings.
struct PipelineConfig {
    QString path;
    QJsonObject document;
    QStringList chain; // from the "pipeline" key, empty if absent
    bool isValid = false;
    QString error;

    QJsonObject sectionFor(int index, const QString& kind) const {
        const QString byIndex = QString::number(index);
        if (document.value(byIndex).isObject()) return document.value(byIndex).toObject();
        return document.value(kind).toObject();
    }
};

#endif // PIPELINECONFIG_H
