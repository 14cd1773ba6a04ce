/*
 * tabsession.h — Persist and restore the reader tabs across runs
 *
 * Restoring replays each saved tab through TabRegistry::createTab() with
 * its cached words. A tab whose cache is gone is re-parsed from its source
 * file when it has one and skipped otherwise. Caches that no saved tab
 * references are deleted before anything is recreated.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_TABSESSION_H
#define BLINKREADER_TABSESSION_H

#include <QObject>
#include <QTimer>

#include "tabrecord.h"

class StorageBackend;
class TabRegistry;

class TabSession : public QObject
{
    Q_OBJECT

public:
    explicit TabSession(TabRegistry *registry, QObject *parent = nullptr);

    /// Returns the number of tabs recreated or queued for re-parsing.
    int restore();

    /// Snapshot of the current reader tabs in display order.
    SessionRecord snapshot() const;

    bool save();

    void setAutosaveInterval(int seconds);
    int autosaveInterval() const { return m_autosave.interval() / 1000; }
    void startAutosave();
    void stopAutosave();

private:
    void removeOrphanCaches(StorageBackend *storage, const SessionRecord &session);

    TabRegistry *m_registry;
    QTimer m_autosave;
};

#endif // BLINKREADER_TABSESSION_H
