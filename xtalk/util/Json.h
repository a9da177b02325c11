#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QSet>
#include <QString>
#include <QVector>

namespace xtalk::util {

// Typed reads from one policy's JSON config object.
// Missing keys yield the default; present keys of the wrong type record an error
// (first one wins) that names the policy and the key. Unknown keys are never looked at.
class ConfigReader {
public:
    ConfigReader(const QString& policy, const QJsonObject& object);

    bool has(const char* key) const { return m_obj.contains(QString::fromUtf8(key)); }
    QJsonValue value(const char* key) const { return m_obj.value(QString::fromUtf8(key)); }

    int getInt(const char* key, int def);
    bool getBool(const char* key, bool def);
    QString getString(const char* key, const QString& def);
    QSet<int> getNoteSet(const char* key);
    QJsonObject getObject(const char* key);
    QJsonArray getArray(const char* key);

    // Note set from an arbitrary value (array of notes or a single note). context is used in errors.
    QSet<int> noteSetFrom(const QJsonValue& v, const QString& context);

    void fail(const QString& message);
    bool ok() const { return m_error.isEmpty(); }
    QString error() const { return m_error; }
    const QString& policy() const { return m_policy; }

private:
    QString m_policy;
    QJsonObject m_obj;
    QString m_error;
};

// A note is a JSON number or a numeric string in 0..127.
bool parseNote(const QJsonValue& v, int* out);
bool parseNoteKey(const QString& key, int* out);

QJsonArray noteSetToJson(const QSet<int>& notes);
QVector<int> sortedNotes(const QSet<int>& notes);

} // namespace xtalk::util
