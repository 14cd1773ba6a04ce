/*
 * readerlimits.h — Speed and navigation bounds for reading sessions
 *
 * Defaults match the shipped configuration; MainWindow overrides them from
 * BlinkReaderSettings at startup.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_READERLIMITS_H
#define BLINKREADER_READERLIMITS_H

#include <QtGlobal>

#include <algorithm>

struct ReaderLimits {
    int defaultWpm = 300;
    int minWpm = 100;
    int maxWpm = 1000;
    int wpmStep = 50;
    int skipAmount = 5;
    qreal defaultFontSize = 48.0;

    int clampWpm(int wpm) const { return std::clamp(wpm, minWpm, std::max(minWpm, maxWpm)); }
};

#endif // BLINKREADER_READERLIMITS_H
