/*
 * readingstatemachine.h — Idle / Playing / Paused playback of the active tab
 *
 * Driven by discrete commands and by tick() from the frame loop. The timer
 * is only ever reset from resetTimer(), the state machine's reaction to the
 * word-change notification.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_READINGSTATEMACHINE_H
#define BLINKREADER_READINGSTATEMACHINE_H

#include <QObject>

#include "readercommand.h"
#include "readerlimits.h"
#include "readingtimer.h"

class NotificationBus;
class ReadingContext;
class WordsManager;

class ReadingStateMachine : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Playing,
        Paused,
    };
    Q_ENUM(State)

    ReadingStateMachine(ReadingContext *context, NotificationBus *bus,
                        QObject *parent = nullptr);

    void setLimits(const ReaderLimits &limits) { m_limits = limits; }
    const ReaderLimits &limits() const { return m_limits; }

    State state() const { return m_state; }
    const ReadingTimer &timer() const { return m_timer; }
    qint64 remainingMs() const { return m_timer.remainingMs(); }

    void execute(ReaderCommand command);

    void play();
    void pause();
    void togglePlayPause();
    void stop();
    void skipForward();
    void skipBackward();
    void restart();
    void increaseSpeed();
    void decreaseSpeed();

public Q_SLOTS:
    /// Advance the running timer; on expiry move to the next word.
    void tick(qint64 elapsedMs);

    /// Reaction to NotificationBus::wordChanged.
    void resetTimer();

Q_SIGNALS:
    void stateChanged(ReadingStateMachine::State state);
    void timerReset(qint64 durationMs);
    void wpmChanged(int wpm);

private:
    void setState(State state);
    void adjustSpeed(int delta);
    WordsManager *playableWords() const;

    ReadingContext *m_context;
    NotificationBus *m_bus;
    ReaderLimits m_limits;
    State m_state = State::Idle;
    ReadingTimer m_timer;
};

#endif // BLINKREADER_READINGSTATEMACHINE_H
