#include "storagebackend.h"
#include "configstorage.h"
#include "filestorage.h"

#include <QStandardPaths>
#include <QUuid>

QString StorageBackend::generateCacheId() const
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

std::unique_ptr<StorageBackend> StorageBackend::create(Kind kind, const QString &location)
{
    switch (kind) {
    case ConfigFile: {
        QString path = location;
        if (path.isEmpty())
            path = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
                   + QStringLiteral("/sessionrc");
        return std::make_unique<ConfigStorage>(path);
    }
    case Files:
        break;
    }

    QString dir = location;
    if (dir.isEmpty())
        dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
              + QStringLiteral("/session");
    return std::make_unique<FileStorage>(dir);
}
