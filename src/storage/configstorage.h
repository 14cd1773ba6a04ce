/*
 * configstorage.h — Session persistence in a single KConfig file
 *
 * Key/value layout for platforms where only a settings store is available:
 * group [Session] key Tabs holds the metadata document, group [WordCache]
 * holds one compact JSON document per cache id.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_CONFIGSTORAGE_H
#define BLINKREADER_CONFIGSTORAGE_H

#include <KSharedConfig>

#include "storagebackend.h"

class ConfigStorage : public StorageBackend
{
public:
    explicit ConfigStorage(const QString &configPath);

    bool saveTabMetadata(const SessionRecord &session) override;
    std::optional<SessionRecord> loadTabMetadata() const override;

    bool writeWordCache(const QString &cacheId, const WordSequence &words) override;
    std::optional<WordSequence> loadWordCache(const QString &cacheId) const override;
    bool deleteWordCache(const QString &cacheId) override;
    QStringList wordCacheIds() const override;

private:
    bool sync();

    KSharedConfigPtr m_config;
};

#endif // BLINKREADER_CONFIGSTORAGE_H
