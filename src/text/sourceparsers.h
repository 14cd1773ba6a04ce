/*
 * sourceparsers.h — Registry of source formats keyed by file suffix
 *
 * parseFile() is safe to run on a worker thread: the registry is not
 * modified after construction and parsers are stateless.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_SOURCEPARSERS_H
#define BLINKREADER_SOURCEPARSERS_H

#include <QString>
#include <QStringList>

#include <memory>
#include <vector>

#include "parseerror.h"

class SourceParser;

class SourceParsers
{
public:
    SourceParsers();
    ~SourceParsers();

    SourceParsers(const SourceParsers &) = delete;
    SourceParsers &operator=(const SourceParsers &) = delete;

    /// Parser for the file's suffix, or nullptr if the format is unsupported.
    const SourceParser *parserForPath(const QString &filePath) const;

    /// All supported suffixes, e.g. for a file dialog filter.
    QStringList supportedExtensions() const;

    /// Name filter for QFileDialog ("*.txt *.md ...").
    QString nameFilter() const;

    /// Read, extract and segment a file.
    ParseResult parseFile(const QString &filePath) const;

    /// Extract and segment bytes already in memory.
    ParseResult parseBytes(const QString &filePath, const QByteArray &bytes) const;

private:
    std::vector<std::unique_ptr<SourceParser>> m_parsers;
};

#endif // BLINKREADER_SOURCEPARSERS_H
