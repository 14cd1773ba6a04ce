/*
 * tabrecord.h — Persisted per-tab metadata
 *
 * One TabRecord per reader tab. Word content is stored separately in the
 * word cache, keyed by cacheId, so large texts are never duplicated in the
 * metadata document.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_TABRECORD_H
#define BLINKREADER_TABRECORD_H

#include <QList>
#include <QString>

#include "tabid.h"

struct TabRecord {
    TabId id = InvalidTabId;
    QString name;
    QString fontFamily;
    qreal fontSize = 0;
    int wpm = 0;
    QString sourcePath;   // empty for pasted text
    int position = 0;
    QString cacheId;

    bool operator==(const TabRecord &o) const
    {
        return id == o.id && name == o.name && fontFamily == o.fontFamily
            && fontSize == o.fontSize && wpm == o.wpm
            && sourcePath == o.sourcePath && position == o.position
            && cacheId == o.cacheId;
    }
};

struct SessionRecord {
    TabId activeId = InvalidTabId;
    QList<TabRecord> tabs;  // in tab order
};

#endif // BLINKREADER_TABRECORD_H
