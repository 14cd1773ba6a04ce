/*
 * filestorage.cpp — Session persistence as JSON files in a directory
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "filestorage.h"
#include "sessioncodec.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSaveFile>

FileStorage::FileStorage(const QString &directory)
    : m_dir(directory)
{
}

QString FileStorage::metadataPath() const
{
    return m_dir + QStringLiteral("/tabs.json");
}

QString FileStorage::cacheDir() const
{
    return m_dir + QStringLiteral("/cache");
}

QString FileStorage::cachePath(const QString &cacheId) const
{
    return cacheDir() + QLatin1Char('/') + cacheId + QStringLiteral(".json");
}

bool FileStorage::isValidCacheId(const QString &cacheId)
{
    // Ids become file names; refuse anything that could escape the cache dir.
    static const QRegularExpression idRx(QStringLiteral("^[A-Za-z0-9_-]+$"));
    return idRx.match(cacheId).hasMatch();
}

bool FileStorage::writeFile(const QString &path, const QByteArray &data)
{
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        qWarning() << "FileStorage: cannot create directory for" << path;
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "FileStorage: cannot open" << path << file.errorString();
        return false;
    }
    if (file.write(data) != data.size()) {
        qWarning() << "FileStorage: short write to" << path << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qWarning() << "FileStorage: cannot commit" << path << file.errorString();
        return false;
    }
    return true;
}

std::optional<QByteArray> FileStorage::readFile(const QString &path)
{
    QFile file(path);
    if (!file.exists())
        return std::nullopt;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "FileStorage: cannot read" << path << file.errorString();
        return std::nullopt;
    }
    return file.readAll();
}

bool FileStorage::saveTabMetadata(const SessionRecord &session)
{
    return writeFile(metadataPath(), SessionCodec::encodeSession(session));
}

std::optional<SessionRecord> FileStorage::loadTabMetadata() const
{
    const auto data = readFile(metadataPath());
    if (!data) {
        qDebug() << "FileStorage: no saved tabs at" << metadataPath();
        return std::nullopt;
    }
    return SessionCodec::decodeSession(*data);
}

bool FileStorage::writeWordCache(const QString &cacheId, const WordSequence &words)
{
    if (!isValidCacheId(cacheId)) {
        qWarning() << "FileStorage: invalid cache id" << cacheId;
        return false;
    }
    return writeFile(cachePath(cacheId), SessionCodec::encodeWords(words));
}

std::optional<WordSequence> FileStorage::loadWordCache(const QString &cacheId) const
{
    if (!isValidCacheId(cacheId))
        return std::nullopt;
    const auto data = readFile(cachePath(cacheId));
    if (!data)
        return std::nullopt;
    return SessionCodec::decodeWords(*data);
}

bool FileStorage::deleteWordCache(const QString &cacheId)
{
    if (!isValidCacheId(cacheId))
        return false;
    const QString path = cachePath(cacheId);
    if (!QFile::exists(path))
        return true;
    if (!QFile::remove(path)) {
        qWarning() << "FileStorage: failed to remove" << path;
        return false;
    }
    return true;
}

QStringList FileStorage::wordCacheIds() const
{
    QStringList ids;
    const QStringList entries = QDir(cacheDir()).entryList(
        {QStringLiteral("*.json")}, QDir::Files);
    for (const QString &entry : entries)
        ids.append(QFileInfo(entry).completeBaseName());
    return ids;
}
