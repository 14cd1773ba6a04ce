#include "fontcatalog.h"

FontCatalog::FontCatalog(const QStringList &families)
{
    setFamilies(families);
}

void FontCatalog::setFamilies(const QStringList &families)
{
    m_families = families;
    m_families.removeDuplicates();
    m_families.sort(Qt::CaseInsensitive);
    if (!m_families.contains(m_default))
        m_default.clear();
}

void FontCatalog::setDefaultFamily(const QString &family)
{
    if (m_families.contains(family))
        m_default = family;
}

QString FontCatalog::defaultFamily() const
{
    if (!m_default.isEmpty())
        return m_default;
    return m_families.isEmpty() ? QString() : m_families.first();
}

bool FontCatalog::contains(const QString &family) const
{
    return m_families.contains(family);
}

QString FontCatalog::resolve(const QString &requested) const
{
    if (!requested.isEmpty() && contains(requested))
        return requested;
    const QString fallback = defaultFamily();
    return fallback.isEmpty() ? requested : fallback;
}
