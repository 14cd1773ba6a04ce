/*
 * sourceparsers.cpp — Registry of source formats keyed by file suffix
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sourceparsers.h"
#include "markdownparser.h"
#include "plaintextparser.h"
#include "textsegmenter.h"

#include <QFile>
#include <QFileInfo>

SourceParsers::SourceParsers()
{
    m_parsers.push_back(std::make_unique<PlainTextParser>());
    m_parsers.push_back(std::make_unique<MarkdownParser>());
}

SourceParsers::~SourceParsers() = default;

const SourceParser *SourceParsers::parserForPath(const QString &filePath) const
{
    const QString suffix = QFileInfo(filePath).suffix();
    if (suffix.isEmpty())
        return nullptr;
    for (const auto &parser : m_parsers) {
        if (parser->canParse(suffix))
            return parser.get();
    }
    return nullptr;
}

QStringList SourceParsers::supportedExtensions() const
{
    QStringList result;
    for (const auto &parser : m_parsers)
        result.append(parser->extensions());
    return result;
}

QString SourceParsers::nameFilter() const
{
    QStringList patterns;
    const QStringList exts = supportedExtensions();
    for (const QString &ext : exts)
        patterns.append(QStringLiteral("*.") + ext);
    return patterns.join(QLatin1Char(' '));
}

ParseResult SourceParsers::parseFile(const QString &filePath) const
{
    // Reject unsupported formats before touching the disk.
    if (!parserForPath(filePath))
        return ParseResult::failure(ParseError::UnsupportedFormat, filePath,
                                    QFileInfo(filePath).suffix());

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly))
        return ParseResult::failure(ParseError::IoFailure, filePath, file.errorString());

    const QByteArray bytes = file.readAll();
    if (file.error() != QFileDevice::NoError)
        return ParseResult::failure(ParseError::IoFailure, filePath, file.errorString());

    return parseBytes(filePath, bytes);
}

ParseResult SourceParsers::parseBytes(const QString &filePath, const QByteArray &bytes) const
{
    const SourceParser *parser = parserForPath(filePath);
    if (!parser)
        return ParseResult::failure(ParseError::UnsupportedFormat, filePath,
                                    QFileInfo(filePath).suffix());

    QString text;
    QString detail;
    if (!parser->extractText(bytes, text, detail))
        return ParseResult::failure(ParseError::MalformedContent, filePath, detail);

    ParseResult result;
    result.words = TextSegmenter::segment(text);
    return result;
}
