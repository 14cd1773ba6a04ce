/*
 * fontcatalog.h — Font families available to reader tabs
 *
 * Discovery happens elsewhere (QFontDatabase in the application); the
 * catalog only resolves a requested family, falling back to the default.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_FONTCATALOG_H
#define BLINKREADER_FONTCATALOG_H

#include <QString>
#include <QStringList>

class FontCatalog
{
public:
    FontCatalog() = default;
    explicit FontCatalog(const QStringList &families);

    void setFamilies(const QStringList &families);
    const QStringList &families() const { return m_families; }

    /// Ignored unless the family is in the catalog.
    void setDefaultFamily(const QString &family);
    QString defaultFamily() const;

    bool contains(const QString &family) const;
    QString resolve(const QString &requested) const;

private:
    QStringList m_families;  // sorted; the first one is the fallback default
    QString m_default;
};

#endif // BLINKREADER_FONTCATALOG_H
