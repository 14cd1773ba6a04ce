#include "readertab.h"

ReaderTab::ReaderTab(TabId id, Kind kind, const QString &name, QObject *parent)
    : QObject(parent)
    , m_id(id)
    , m_kind(kind)
    , m_name(name)
{
}
