/*
 * wordsmanager.cpp — Per-tab word sequence and read position
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "wordsmanager.h"

#include <algorithm>

WordsManager::WordsManager(const WordSequence &words, const QString &cacheId,
                           int position, QObject *parent)
    : QObject(parent)
    , m_words(words)
    , m_cacheId(cacheId)
{
    if (!m_words.isEmpty())
        m_index = std::clamp(position, 0, count() - 1);
}

const Word *WordsManager::currentWord() const
{
    if (m_words.isEmpty())
        return nullptr;
    return &m_words.at(m_index);
}

bool WordsManager::isAtEnd() const
{
    return m_index + 1 >= count();
}

bool WordsManager::advance()
{
    if (isAtEnd())
        return false;
    ++m_index;
    Q_EMIT positionChanged();
    return true;
}

void WordsManager::skipForward(int amount)
{
    if (m_words.isEmpty())
        return;
    const qint64 target = static_cast<qint64>(m_index) + std::max(amount, 0);
    m_index = static_cast<int>(std::min<qint64>(target, count() - 1));
    Q_EMIT positionChanged();
}

void WordsManager::skipBackward(int amount)
{
    if (m_words.isEmpty())
        return;
    const qint64 target = static_cast<qint64>(m_index) - std::max(amount, 0);
    m_index = static_cast<int>(std::max<qint64>(target, 0));
    Q_EMIT positionChanged();
}

void WordsManager::restart()
{
    if (m_words.isEmpty())
        return;
    m_index = 0;
    Q_EMIT positionChanged();
}

double WordsManager::progress() const
{
    if (count() <= 1)
        return 0.0;
    return static_cast<double>(m_index) / (count() - 1);
}
