/*
 * readingtimer.h — One-shot countdown to the next automatic advance
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_READINGTIMER_H
#define BLINKREADER_READINGTIMER_H

#include <QtGlobal>

#include <algorithm>

struct ReadingTimer {
    qint64 durationMs = 0;
    qint64 elapsedMs = 0;

    void start(qint64 duration)
    {
        durationMs = std::max<qint64>(duration, 0);
        elapsedMs = 0;
    }

    void clear()
    {
        durationMs = 0;
        elapsedMs = 0;
    }

    void advance(qint64 deltaMs)
    {
        elapsedMs = std::min(durationMs, elapsedMs + std::max<qint64>(deltaMs, 0));
    }

    bool isActive() const { return durationMs > 0; }
    bool finished() const { return isActive() && elapsedMs >= durationMs; }
    qint64 remainingMs() const { return durationMs - elapsedMs; }
};

#endif // BLINKREADER_READINGTIMER_H
