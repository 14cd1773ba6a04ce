/*
 * readingstatemachine.cpp — Idle / Playing / Paused playback of the active tab
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "readingstatemachine.h"
#include "notificationbus.h"
#include "readingcontext.h"
#include "wordsmanager.h"
#include "wordtiming.h"

ReadingStateMachine::ReadingStateMachine(ReadingContext *context,
                                         NotificationBus *bus, QObject *parent)
    : QObject(parent)
    , m_context(context)
    , m_bus(bus)
{
    connect(m_bus, &NotificationBus::wordChanged,
            this, &ReadingStateMachine::resetTimer);
}

void ReadingStateMachine::execute(ReaderCommand command)
{
    switch (command) {
    case ReaderCommand::Play:
        play();
        break;
    case ReaderCommand::Pause:
        pause();
        break;
    case ReaderCommand::TogglePlayPause:
        togglePlayPause();
        break;
    case ReaderCommand::Stop:
        stop();
        break;
    case ReaderCommand::SkipForward:
        skipForward();
        break;
    case ReaderCommand::SkipBackward:
        skipBackward();
        break;
    case ReaderCommand::IncreaseSpeed:
        increaseSpeed();
        break;
    case ReaderCommand::DecreaseSpeed:
        decreaseSpeed();
        break;
    case ReaderCommand::Restart:
        restart();
        break;
    }
}

WordsManager *ReadingStateMachine::playableWords() const
{
    WordsManager *words = m_context->activeWords();
    if (!words || !words->hasWords())
        return nullptr;
    return words;
}

void ReadingStateMachine::play()
{
    if (!playableWords())
        return;

    switch (m_state) {
    case State::Idle:
        setState(State::Playing);
        // Entering playback starts the timer the same way a word change does.
        m_bus->postWordChanged();
        break;
    case State::Paused:
        setState(State::Playing);
        break;
    case State::Playing:
        break;
    }
}

void ReadingStateMachine::pause()
{
    if (m_state == State::Playing)
        setState(State::Paused);
}

void ReadingStateMachine::togglePlayPause()
{
    if (m_state == State::Playing)
        pause();
    else
        play();
}

void ReadingStateMachine::stop()
{
    m_timer.clear();
    setState(State::Idle);
}

void ReadingStateMachine::skipForward()
{
    if (WordsManager *words = m_context->activeWords())
        words->skipForward(m_limits.skipAmount);
}

void ReadingStateMachine::skipBackward()
{
    if (WordsManager *words = m_context->activeWords())
        words->skipBackward(m_limits.skipAmount);
}

void ReadingStateMachine::restart()
{
    if (WordsManager *words = m_context->activeWords())
        words->restart();
}

void ReadingStateMachine::increaseSpeed()
{
    adjustSpeed(m_limits.wpmStep);
}

void ReadingStateMachine::decreaseSpeed()
{
    adjustSpeed(-m_limits.wpmStep);
}

void ReadingStateMachine::adjustSpeed(int delta)
{
    if (!m_context->activeWords())
        return;

    const int current = m_context->activeWpm();
    const int wpm = m_limits.clampWpm(current + delta);
    if (wpm == current)
        return;

    // The word on screen keeps its duration; the new speed applies from the
    // next word change.
    m_context->setActiveWpm(wpm);
    Q_EMIT wpmChanged(wpm);
}

void ReadingStateMachine::tick(qint64 elapsedMs)
{
    if (m_state != State::Playing)
        return;

    WordsManager *words = playableWords();
    if (!words) {
        stop();
        return;
    }

    m_timer.advance(elapsedMs);
    if (!m_timer.finished())
        return;

    // advance() notifies, which restarts the timer for the new word.
    if (!words->advance())
        stop();
}

void ReadingStateMachine::resetTimer()
{
    WordsManager *words = m_context->activeWords();
    const Word *word = words ? words->currentWord() : nullptr;
    if (!word) {
        stop();
        return;
    }

    const qint64 duration = WordTiming::displayDurationMs(*word, m_context->activeWpm());
    m_timer.start(duration);
    Q_EMIT timerReset(duration);
}

void ReadingStateMachine::setState(State state)
{
    if (m_state == state)
        return;
    m_state = state;
    Q_EMIT stateChanged(m_state);
}
