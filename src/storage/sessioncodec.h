/*
 * sessioncodec.h — JSON form of tab metadata and word caches
 *
 * Shared by both storage backends so a session can move between them.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_SESSIONCODEC_H
#define BLINKREADER_SESSIONCODEC_H

#include <QByteArray>
#include <QJsonObject>

#include <optional>

#include "tabrecord.h"
#include "word.h"

namespace SessionCodec {

constexpr int FormatVersion = 1;

QJsonObject sessionToJson(const SessionRecord &session);
std::optional<SessionRecord> sessionFromJson(const QJsonObject &obj);

QJsonObject wordsToJson(const WordSequence &words);
std::optional<WordSequence> wordsFromJson(const QJsonObject &obj);

// Compact document bytes <-> records. nullopt on malformed input.
QByteArray encodeSession(const SessionRecord &session);
std::optional<SessionRecord> decodeSession(const QByteArray &data);
QByteArray encodeWords(const WordSequence &words);
std::optional<WordSequence> decodeWords(const QByteArray &data);

} // namespace SessionCodec

#endif // BLINKREADER_SESSIONCODEC_H
