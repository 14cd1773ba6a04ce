/*
 * markdownparser.h — MD4C reduction of Markdown to plain reading text
 *
 * Same callback structure as the document builders: static MD4C callbacks
 * forward into instance handlers of a per-parse reducer. Every block becomes
 * one paragraph of the output, separated by blank lines; inline markup is
 * dropped.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_MARKDOWNPARSER_H
#define BLINKREADER_MARKDOWNPARSER_H

#include "sourceparser.h"

class MarkdownParser : public SourceParser
{
public:
    QStringList extensions() const override;
    bool extractText(const QByteArray &bytes, QString &text,
                     QString &errorDetail) const override;
};

#endif // BLINKREADER_MARKDOWNPARSER_H
