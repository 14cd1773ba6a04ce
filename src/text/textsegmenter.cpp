/*
 * textsegmenter.cpp — Split normalized text into timed word units
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textsegmenter.h"

#include <QRegularExpression>
#include <QStringList>

namespace TextSegmenter {

WordSequence segment(const QString &text)
{
    static const QRegularExpression lineBreakRx(QStringLiteral("\\r\\n|\\r|\\n"));
    static const QRegularExpression spaceRx(QStringLiteral("\\s+"),
                                            QRegularExpression::UseUnicodePropertiesOption);

    WordSequence words;
    const QStringList lines = text.split(lineBreakRx);

    for (const QString &line : lines) {
        const QString trimmed = line.trimmed();

        // Blank line: the pause belongs to the end of the paragraph, so flag
        // the word before the gap rather than the first one after it.
        if (trimmed.isEmpty()) {
            if (!words.isEmpty())
                words.last().paragraphEnd = true;
            continue;
        }

        const QStringList tokens = trimmed.split(spaceRx, Qt::SkipEmptyParts);
        for (const QString &token : tokens)
            words.append(Word{token, false});
    }

    return words;
}

} // namespace TextSegmenter
