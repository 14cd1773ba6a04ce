/*
 * storagebackend.h — Persistence contract for tab metadata and word caches
 *
 * The core only ever talks to this interface. Two interchangeable backends
 * exist (one JSON file per cache entry, or a single KConfig file) and the
 * one in use is chosen at startup from the StorageBackend setting.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_STORAGEBACKEND_H
#define BLINKREADER_STORAGEBACKEND_H

#include <QString>
#include <QStringList>

#include <memory>
#include <optional>

#include "tabrecord.h"
#include "word.h"

class StorageBackend
{
public:
    enum Kind {
        Files,
        ConfigFile,
    };

    virtual ~StorageBackend() = default;

    virtual bool saveTabMetadata(const SessionRecord &session) = 0;
    /// std::nullopt when nothing was saved yet or the data is unreadable.
    virtual std::optional<SessionRecord> loadTabMetadata() const = 0;

    virtual QString generateCacheId() const;

    virtual bool writeWordCache(const QString &cacheId, const WordSequence &words) = 0;
    virtual std::optional<WordSequence> loadWordCache(const QString &cacheId) const = 0;
    virtual bool deleteWordCache(const QString &cacheId) = 0;

    /// Every cache id currently stored, used to find orphans.
    virtual QStringList wordCacheIds() const = 0;

    /// location is a directory for Files and a config file path for
    /// ConfigFile. Empty selects the standard per-user location.
    static std::unique_ptr<StorageBackend> create(Kind kind, const QString &location = {});
};

#endif // BLINKREADER_STORAGEBACKEND_H
