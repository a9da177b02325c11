#include "xtalk/util/Json.h"

#include <algorithm>
#include <cmath>

namespace xtalk::util {

ConfigReader::ConfigReader(const QString& policy, const QJsonObject& object)
    : m_policy(policy), m_obj(object) {}

void ConfigReader::fail(const QString& message) {
    if (m_error.isEmpty()) m_error = QString("%1: %2").arg(m_policy, message);
}

int ConfigReader::getInt(const char* key, int def) {
    const auto v = value(key);
    if (v.isUndefined() || v.isNull()) return def;
    if (v.isDouble()) return int(std::lround(v.toDouble()));
    if (v.isString()) {
        bool ok = false;
        const int i = v.toString().trimmed().toInt(&ok);
        if (ok) return i;
    }
    fail(QString("'%1' must be an integer").arg(QString::fromUtf8(key)));
    return def;
}

bool ConfigReader::getBool(const char* key, bool def) {
    const auto v = value(key);
    if (v.isUndefined() || v.isNull()) return def;
    if (v.isBool()) return v.toBool();
    if (v.isDouble()) return v.toDouble() != 0.0;
    fail(QString("'%1' must be a boolean").arg(QString::fromUtf8(key)));
    return def;
}

QString ConfigReader::getString(const char* key, const QString& def) {
    const auto v = value(key);
    if (v.isUndefined() || v.isNull()) return def;
    if (v.isString()) return v.toString();
    fail(QString("'%1' must be a string").arg(QString::fromUtf8(key)));
    return def;
}

QSet<int> ConfigReader::getNoteSet(const char* key) {
    const auto v = value(key);
    if (v.isUndefined() || v.isNull()) return {};
    return noteSetFrom(v, QString("'%1'").arg(QString::fromUtf8(key)));
}

QSet<int> ConfigReader::noteSetFrom(const QJsonValue& v, const QString& context) {
    QSet<int> out;
    int note = 0;
    if (parseNote(v, &note)) {
        out.insert(note);
        return out;
    }
    if (!v.isArray()) {
        fail(QString("%1 must be a list of MIDI notes").arg(context));
        return out;
    }
    for (const auto& e : v.toArray()) {
        if (!parseNote(e, &note)) {
            fail(QString("%1 contains an invalid MIDI note").arg(context));
            continue;
        }
        out.insert(note);
    }
    return out;
}

QJsonObject ConfigReader::getObject(const char* key) {
    const auto v = value(key);
    if (v.isUndefined() || v.isNull()) return {};
    if (v.isObject()) return v.toObject();
    fail(QString("'%1' must be an object").arg(QString::fromUtf8(key)));
    return {};
}

QJsonArray ConfigReader::getArray(const char* key) {
    const auto v = value(key);
    if (v.isUndefined() || v.isNull()) return {};
    if (v.isArray()) return v.toArray();
    fail(QString("'%1' must be a list").arg(QString::fromUtf8(key)));
    return {};
}

bool parseNote(const QJsonValue& v, int* out) {
    int n = -1;
    if (v.isDouble()) {
        const double d = v.toDouble();
        if (d != std::floor(d)) return false;
        n = int(d);
    } else if (v.isString()) {
        bool ok = false;
        n = v.toString().trimmed().toInt(&ok);
        if (!ok) return false;
    } else {
        return false;
    }
    if (n < 0 || n > 127) return false;
    if (out) *out = n;
    return true;
}

bool parseNoteKey(const QString& key, int* out) {
    return parseNote(QJsonValue(key), out);
}

QVector<int> sortedNotes(const QSet<int>& notes) {
    QVector<int> v(notes.begin(), notes.end());
    std::sort(v.begin(), v.end());
    return v;
}

QJsonArray noteSetToJson(const QSet<int>& notes) {
    QJsonArray a;
    for (int n : sortedNotes(notes)) a.append(n);
    return a;
}

} // namespace xtalk::util
