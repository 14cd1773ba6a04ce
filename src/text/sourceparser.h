/*
 * sourceparser.h — Format-specific reduction of a source to plain text
 *
 * A SourceParser turns raw file bytes into one normalized text stream in
 * which paragraphs are separated by blank lines. Segmentation itself is
 * format independent (see TextSegmenter).
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_SOURCEPARSER_H
#define BLINKREADER_SOURCEPARSER_H

#include <QByteArray>
#include <QString>
#include <QStringList>

class SourceParser
{
public:
    virtual ~SourceParser() = default;

    /// Lower-case file suffixes handled by this parser, without the dot.
    virtual QStringList extensions() const = 0;

    /// Extract plain text. On failure returns false and fills errorDetail.
    virtual bool extractText(const QByteArray &bytes, QString &text,
                             QString &errorDetail) const = 0;

    bool canParse(const QString &suffix) const
    {
        return extensions().contains(suffix.toLower());
    }

protected:
    // Strict UTF-8 decode shared by all text-based formats. Skips a BOM.
    static bool decodeUtf8(const QByteArray &bytes, QString &text,
                           QString &errorDetail);
};

#endif // BLINKREADER_SOURCEPARSER_H
