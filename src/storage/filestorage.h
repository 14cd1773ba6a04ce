/*
 * filestorage.h — Session persistence as JSON files in a directory
 *
 *   <dir>/tabs.json           tab metadata
 *   <dir>/cache/<id>.json     one word cache per tab
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_FILESTORAGE_H
#define BLINKREADER_FILESTORAGE_H

#include "storagebackend.h"

class FileStorage : public StorageBackend
{
public:
    explicit FileStorage(const QString &directory);

    QString directory() const { return m_dir; }

    bool saveTabMetadata(const SessionRecord &session) override;
    std::optional<SessionRecord> loadTabMetadata() const override;

    bool writeWordCache(const QString &cacheId, const WordSequence &words) override;
    std::optional<WordSequence> loadWordCache(const QString &cacheId) const override;
    bool deleteWordCache(const QString &cacheId) override;
    QStringList wordCacheIds() const override;

private:
    QString metadataPath() const;
    QString cacheDir() const;
    QString cachePath(const QString &cacheId) const;

    static bool isValidCacheId(const QString &cacheId);
    static bool writeFile(const QString &path, const QByteArray &data);
    static std::optional<QByteArray> readFile(const QString &path);

    QString m_dir;
};

#endif // BLINKREADER_FILESTORAGE_H
