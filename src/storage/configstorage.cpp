/*
 * configstorage.cpp — Session persistence in a single KConfig file
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "configstorage.h"
#include "sessioncodec.h"

#include <KConfigGroup>

#include <QDebug>

static const QString kSessionGroup = QStringLiteral("Session");
static const QString kCacheGroup = QStringLiteral("WordCache");

ConfigStorage::ConfigStorage(const QString &configPath)
    : m_config(KSharedConfig::openConfig(configPath, KConfig::SimpleConfig))
{
}

bool ConfigStorage::sync()
{
    if (!m_config->sync()) {
        qWarning() << "ConfigStorage: failed to write" << m_config->name();
        return false;
    }
    return true;
}

bool ConfigStorage::saveTabMetadata(const SessionRecord &session)
{
    KConfigGroup group(m_config, kSessionGroup);
    group.writeEntry("Tabs", QString::fromUtf8(SessionCodec::encodeSession(session)));
    return sync();
}

std::optional<SessionRecord> ConfigStorage::loadTabMetadata() const
{
    const KConfigGroup group(m_config, kSessionGroup);
    const QString data = group.readEntry("Tabs", QString());
    if (data.isEmpty()) {
        qDebug() << "ConfigStorage: no saved tabs in" << m_config->name();
        return std::nullopt;
    }
    return SessionCodec::decodeSession(data.toUtf8());
}

bool ConfigStorage::writeWordCache(const QString &cacheId, const WordSequence &words)
{
    if (cacheId.isEmpty())
        return false;
    KConfigGroup group(m_config, kCacheGroup);
    group.writeEntry(cacheId, QString::fromUtf8(SessionCodec::encodeWords(words)));
    return sync();
}

std::optional<WordSequence> ConfigStorage::loadWordCache(const QString &cacheId) const
{
    const KConfigGroup group(m_config, kCacheGroup);
    if (cacheId.isEmpty() || !group.hasKey(cacheId))
        return std::nullopt;
    return SessionCodec::decodeWords(group.readEntry(cacheId, QString()).toUtf8());
}

bool ConfigStorage::deleteWordCache(const QString &cacheId)
{
    KConfigGroup group(m_config, kCacheGroup);
    if (!group.hasKey(cacheId))
        return true;
    group.deleteEntry(cacheId);
    return sync();
}

QStringList ConfigStorage::wordCacheIds() const
{
    return KConfigGroup(m_config, kCacheGroup).keyList();
}
