/*
 * wordsmanager.h — Per-tab word sequence and read position
 *
 * Owns one tab's WordSequence and the cursor into it. Every operation that
 * can move the cursor emits positionChanged() exactly once; there is no
 * other way to reposition it after construction.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_WORDSMANAGER_H
#define BLINKREADER_WORDSMANAGER_H

#include <QObject>
#include <QString>

#include "word.h"

class WordsManager : public QObject
{
    Q_OBJECT

public:
    /// position is clamped into the sequence.
    WordsManager(const WordSequence &words, const QString &cacheId,
                 int position = 0, QObject *parent = nullptr);

    const WordSequence &words() const { return m_words; }
    QString cacheId() const { return m_cacheId; }

    bool hasWords() const { return !m_words.isEmpty(); }
    int count() const { return static_cast<int>(m_words.size()); }
    int position() const { return m_index; }

    /// nullptr when the sequence is empty.
    const Word *currentWord() const;

    bool isAtEnd() const;

    /// Move one word forward. Returns false at the last word (no-op).
    bool advance();

    // Saturating moves; always notify, even when clamped in place.
    void skipForward(int amount);
    void skipBackward(int amount);

    /// Back to the first word. Purely positional.
    void restart();

    /// index / (count - 1); 0 for sequences of one word or less.
    double progress() const;

Q_SIGNALS:
    void positionChanged();

private:
    WordSequence m_words;
    QString m_cacheId;
    int m_index = 0;
};

#endif // BLINKREADER_WORDSMANAGER_H
