/*
 * taborder.h — Display and adjacency order of the live tabs
 *
 * Derived state: the order follows TabRegistry::tabAdded / tabRemoved and
 * has no public mutators. Ids are kept ascending. New ids always exceed
 * every id seen so far and restored tabs keep their saved ids, so this is
 * creation order, and a restored tab that finishes loading late still
 * lands in its saved slot.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_TABORDER_H
#define BLINKREADER_TABORDER_H

#include <QList>
#include <QObject>

#include "tabid.h"

class TabRegistry;

class TabOrder : public QObject
{
    Q_OBJECT

public:
    explicit TabOrder(TabRegistry *registry);

    const QList<TabId> &ids() const { return m_ids; }
    int count() const { return static_cast<int>(m_ids.size()); }
    int indexOf(TabId id) const { return static_cast<int>(m_ids.indexOf(id)); }
    TabId at(int index) const;

    /// The tab to activate when `id` goes away: next, else previous, never
    /// `id` itself. InvalidTabId if there is none.
    TabId findAdjacent(TabId id) const;

    // Cyclic neighbours for tab switching.
    TabId nextOf(TabId id) const;
    TabId previousOf(TabId id) const;

private Q_SLOTS:
    void onTabAdded(TabId id);
    void onTabRemoved(TabId id);

private:
    QList<TabId> m_ids;
};

#endif // BLINKREADER_TABORDER_H
