#include "taborder.h"
#include "tabregistry.h"

#include <algorithm>

TabOrder::TabOrder(TabRegistry *registry)
    : QObject(registry)
{
    connect(registry, &TabRegistry::tabAdded, this, &TabOrder::onTabAdded);
    connect(registry, &TabRegistry::tabRemoved, this, &TabOrder::onTabRemoved);
}

TabId TabOrder::at(int index) const
{
    if (index < 0 || index >= count())
        return InvalidTabId;
    return m_ids.at(index);
}

TabId TabOrder::findAdjacent(TabId id) const
{
    const int idx = indexOf(id);
    if (idx < 0)
        return InvalidTabId;
    if (idx + 1 < count())
        return m_ids.at(idx + 1);
    if (idx > 0)
        return m_ids.at(idx - 1);
    return InvalidTabId;
}

TabId TabOrder::nextOf(TabId id) const
{
    const int idx = indexOf(id);
    if (idx < 0 || count() < 2)
        return InvalidTabId;
    return m_ids.at((idx + 1) % count());
}

TabId TabOrder::previousOf(TabId id) const
{
    const int idx = indexOf(id);
    if (idx < 0 || count() < 2)
        return InvalidTabId;
    return m_ids.at((idx + count() - 1) % count());
}

void TabOrder::onTabAdded(TabId id)
{
    const auto pos = std::lower_bound(m_ids.begin(), m_ids.end(), id);
    if (pos == m_ids.end() || *pos != id)
        m_ids.insert(pos, id);
}

void TabOrder::onTabRemoved(TabId id)
{
    m_ids.removeAll(id);
}
