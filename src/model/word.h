/*
 * word.h — Word unit produced by segmentation
 *
 * A Word is immutable once segmentation produced it; navigation only ever
 * moves a cursor over a WordSequence.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_WORD_H
#define BLINKREADER_WORD_H

#include <QList>
#include <QString>

struct Word {
    QString text;
    bool paragraphEnd = false;  // last word before a blank-line gap

    bool operator==(const Word &o) const
    {
        return text == o.text && paragraphEnd == o.paragraphEnd;
    }
    bool operator!=(const Word &o) const { return !(*this == o); }
};

using WordSequence = QList<Word>;

#endif // BLINKREADER_WORD_H
