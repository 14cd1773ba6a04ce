/*
 * sessioncodec.cpp — JSON form of tab metadata and word caches
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sessioncodec.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace SessionCodec {

static QJsonObject recordToJson(const TabRecord &tab)
{
    QJsonObject obj;
    obj[QLatin1String("id")] = QString::number(tab.id);
    obj[QLatin1String("name")] = tab.name;
    obj[QLatin1String("fontFamily")] = tab.fontFamily;
    obj[QLatin1String("fontSize")] = tab.fontSize;
    obj[QLatin1String("wpm")] = tab.wpm;
    if (!tab.sourcePath.isEmpty())
        obj[QLatin1String("source")] = tab.sourcePath;
    obj[QLatin1String("position")] = tab.position;
    obj[QLatin1String("cacheId")] = tab.cacheId;
    return obj;
}

static std::optional<TabRecord> recordFromJson(const QJsonObject &obj)
{
    TabRecord tab;
    bool ok = false;
    tab.id = obj.value(QLatin1String("id")).toString().toULongLong(&ok);
    tab.cacheId = obj.value(QLatin1String("cacheId")).toString();
    if (!ok || tab.id == InvalidTabId || tab.cacheId.isEmpty())
        return std::nullopt;

    tab.name = obj.value(QLatin1String("name")).toString();
    tab.fontFamily = obj.value(QLatin1String("fontFamily")).toString();
    tab.fontSize = obj.value(QLatin1String("fontSize")).toDouble();
    tab.wpm = obj.value(QLatin1String("wpm")).toInt();
    tab.sourcePath = obj.value(QLatin1String("source")).toString();
    tab.position = obj.value(QLatin1String("position")).toInt();
    return tab;
}

QJsonObject sessionToJson(const SessionRecord &session)
{
    QJsonArray tabs;
    for (const TabRecord &tab : session.tabs)
        tabs.append(recordToJson(tab));

    QJsonObject root;
    root[QLatin1String("version")] = FormatVersion;
    root[QLatin1String("activeId")] = QString::number(session.activeId);
    root[QLatin1String("tabs")] = tabs;
    return root;
}

std::optional<SessionRecord> sessionFromJson(const QJsonObject &obj)
{
    if (obj.value(QLatin1String("version")).toInt() != FormatVersion)
        return std::nullopt;

    SessionRecord session;
    session.activeId = obj.value(QLatin1String("activeId")).toString().toULongLong();

    const QJsonArray tabs = obj.value(QLatin1String("tabs")).toArray();
    for (const QJsonValue &value : tabs) {
        auto tab = recordFromJson(value.toObject());
        if (!tab) {
            qWarning() << "SessionCodec: skipping malformed tab entry";
            continue;
        }
        session.tabs.append(*tab);
    }
    return session;
}

QJsonObject wordsToJson(const WordSequence &words)
{
    QJsonArray array;
    for (const Word &word : words) {
        QJsonObject w;
        w[QLatin1String("t")] = word.text;
        if (word.paragraphEnd)
            w[QLatin1String("p")] = true;
        array.append(w);
    }

    QJsonObject root;
    root[QLatin1String("version")] = FormatVersion;
    root[QLatin1String("words")] = array;
    return root;
}

std::optional<WordSequence> wordsFromJson(const QJsonObject &obj)
{
    const QJsonValue value = obj.value(QLatin1String("words"));
    if (!value.isArray())
        return std::nullopt;

    const QJsonArray array = value.toArray();
    WordSequence words;
    words.reserve(array.size());
    for (const QJsonValue &entry : array) {
        const QJsonObject w = entry.toObject();
        const QString text = w.value(QLatin1String("t")).toString();
        if (text.isEmpty())
            return std::nullopt;
        words.append(Word{text, w.value(QLatin1String("p")).toBool()});
    }
    return words;
}

static std::optional<QJsonObject> parseObject(const QByteArray &data)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "SessionCodec: malformed JSON:" << error.errorString();
        return std::nullopt;
    }
    return doc.object();
}

QByteArray encodeSession(const SessionRecord &session)
{
    return QJsonDocument(sessionToJson(session)).toJson(QJsonDocument::Indented);
}

std::optional<SessionRecord> decodeSession(const QByteArray &data)
{
    const auto obj = parseObject(data);
    if (!obj)
        return std::nullopt;
    return sessionFromJson(*obj);
}

QByteArray encodeWords(const WordSequence &words)
{
    return QJsonDocument(wordsToJson(words)).toJson(QJsonDocument::Compact);
}

std::optional<WordSequence> decodeWords(const QByteArray &data)
{
    const auto obj = parseObject(data);
    if (!obj)
        return std::nullopt;
    return wordsFromJson(*obj);
}

} // namespace SessionCodec
