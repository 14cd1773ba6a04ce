/*
 * wordtiming.cpp — Per-word display duration and fixation point
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "wordtiming.h"

#include <QtMath>

#include <algorithm>

namespace WordTiming {

int characterCount(const QString &text)
{
    return static_cast<int>(text.toUcs4().size());
}

int fixationIndex(const QString &text)
{
    const int count = characterCount(text);

    int index;
    if (count <= 1)
        index = 0;
    else if (count <= 5)
        index = 1;
    else if (count <= 9)
        index = 2;
    else if (count <= 13)
        index = 3;
    else
        index = 4;

    return std::min(index, std::max(count - 1, 0));
}

double durationMultiplier(const Word &word)
{
    const QString &text = word.text;
    double multiplier = 1.0;

    if (characterCount(text) > LongWordThreshold)
        multiplier = std::max(multiplier, LongWordMultiplier);
    if (text.endsWith(QLatin1Char(',')) || text.endsWith(QLatin1Char(';')))
        multiplier = std::max(multiplier, ClausePauseMultiplier);
    if (text.endsWith(QLatin1Char('.')) || text.endsWith(QLatin1Char('?'))
        || text.endsWith(QLatin1Char('!')))
        multiplier = std::max(multiplier, SentencePauseMultiplier);
    if (word.paragraphEnd)
        multiplier = std::max(multiplier, ParagraphPauseMultiplier);

    return multiplier;
}

qint64 displayDurationMs(const Word &word, int wpm)
{
    const double baseMs = 60000.0 / std::max(wpm, 1);
    return qRound64(baseMs * durationMultiplier(word));
}

// UTF-16 offset of the code point following the one at offset.
static qsizetype nextCodePoint(const QString &text, qsizetype offset)
{
    if (text.at(offset).isHighSurrogate() && offset + 1 < text.size()
        && text.at(offset + 1).isLowSurrogate())
        return offset + 2;
    return offset + 1;
}

FixationSplit split(const QString &text)
{
    if (text.isEmpty())
        return {};

    const int index = fixationIndex(text);
    qsizetype pivotStart = 0;
    for (int i = 0; i < index; ++i)
        pivotStart = nextCodePoint(text, pivotStart);
    const qsizetype pivotEnd = nextCodePoint(text, pivotStart);

    FixationSplit result;
    result.before = text.left(pivotStart);
    result.pivot = text.mid(pivotStart, pivotEnd - pivotStart);
    result.after = text.mid(pivotEnd);
    return result;
}

} // namespace WordTiming
