/*
 * wordtiming.h — Per-word display duration and fixation point
 *
 * Pure functions, evaluated fresh for every word. Character counts are in
 * Unicode code points, not UTF-16 units.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_WORDTIMING_H
#define BLINKREADER_WORDTIMING_H

#include <QString>

#include "word.h"

namespace WordTiming {

// Pause multipliers. The largest applicable one wins; they never stack.
constexpr double LongWordMultiplier = 1.3;
constexpr double ClausePauseMultiplier = 2.0;
constexpr double SentencePauseMultiplier = 3.0;
constexpr double ParagraphPauseMultiplier = 4.0;
constexpr int LongWordThreshold = 10;

// The three display segments around the fixation character.
struct FixationSplit {
    QString before;
    QString pivot;
    QString after;
};

int characterCount(const QString &text);

// Index of the Optical Recognition Point, slightly left of centre.
int fixationIndex(const QString &text);

double durationMultiplier(const Word &word);
qint64 displayDurationMs(const Word &word, int wpm);

FixationSplit split(const QString &text);

} // namespace WordTiming

#endif // BLINKREADER_WORDTIMING_H
