#include "tabsession.h"
#include "readertab.h"
#include "storagebackend.h"
#include "taborder.h"
#include "tabregistry.h"
#include "wordsmanager.h"

#include <QDebug>
#include <QSet>

#include <algorithm>

TabSession::TabSession(TabRegistry *registry, QObject *parent)
    : QObject(parent)
    , m_registry(registry)
{
    m_autosave.setInterval(5000);
    connect(&m_autosave, &QTimer::timeout, this, &TabSession::save);
}

int TabSession::restore()
{
    StorageBackend *storage = m_registry->storage();
    if (!storage)
        return 0;

    const std::optional<SessionRecord> loaded = storage->loadTabMetadata();
    if (!loaded)
        qDebug() << "TabSession: no saved session";
    const SessionRecord session = loaded.value_or(SessionRecord());

    removeOrphanCaches(storage, session);

    int restored = 0;
    for (const TabRecord &record : session.tabs) {
        TabCreateRequest request;
        request.id = record.id;
        request.name = record.name;
        request.fontFamily = record.fontFamily;
        request.fontSize = record.fontSize;
        request.wpm = record.wpm;
        request.position = record.position;
        request.filePath = record.sourcePath;
        request.activate = record.id == session.activeId;

        std::optional<WordSequence> words;
        if (!record.cacheId.isEmpty())
            words = storage->loadWordCache(record.cacheId);

        if (words) {
            request.words = words;
            request.cacheId = record.cacheId;
            if (m_registry->createTab(request).ok())
                ++restored;
        } else if (!record.sourcePath.isEmpty()) {
            qDebug() << "TabSession: cache" << record.cacheId << "missing, re-reading"
                     << record.sourcePath;
            if (m_registry->requestTab(request) != InvalidTabId)
                ++restored;
        } else {
            qWarning() << "TabSession: dropping tab" << record.name
                       << "- its word cache is gone";
        }
    }
    return restored;
}

void TabSession::removeOrphanCaches(StorageBackend *storage, const SessionRecord &session)
{
    QSet<QString> referenced;
    for (const TabRecord &record : session.tabs)
        referenced.insert(record.cacheId);

    const QStringList stored = storage->wordCacheIds();
    for (const QString &cacheId : stored) {
        if (referenced.contains(cacheId))
            continue;
        qDebug() << "TabSession: removing orphaned cache" << cacheId;
        if (!storage->deleteWordCache(cacheId))
            qWarning() << "TabSession: failed to remove orphaned cache" << cacheId;
    }
}

SessionRecord TabSession::snapshot() const
{
    SessionRecord session;
    const ReaderTab *active = m_registry->activeTab();
    if (active && active->isReader())
        session.activeId = active->id();

    const QList<TabId> ids = m_registry->order()->ids();
    for (TabId id : ids) {
        const ReaderTab *tab = m_registry->tab(id);
        if (!tab || !tab->isReader())
            continue;

        TabRecord record;
        record.id = id;
        record.name = tab->name();
        record.fontFamily = tab->font().family;
        record.fontSize = tab->font().pointSize;
        record.wpm = tab->wpm();
        record.sourcePath = tab->sourcePath();
        record.position = tab->words()->position();
        record.cacheId = tab->words()->cacheId();
        session.tabs.append(record);
    }
    return session;
}

bool TabSession::save()
{
    StorageBackend *storage = m_registry->storage();
    if (!storage)
        return false;

    if (!storage->saveTabMetadata(snapshot())) {
        qWarning() << "TabSession: failed to save tab metadata";
        return false;
    }
    return true;
}

void TabSession::setAutosaveInterval(int seconds)
{
    m_autosave.setInterval(std::max(1, seconds) * 1000);
}

void TabSession::startAutosave()
{
    m_autosave.start();
}

void TabSession::stopAutosave()
{
    m_autosave.stop();
}
