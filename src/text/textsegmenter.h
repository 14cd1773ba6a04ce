/*
 * textsegmenter.h — Split normalized text into timed word units
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_TEXTSEGMENTER_H
#define BLINKREADER_TEXTSEGMENTER_H

#include <QString>

#include "word.h"

namespace TextSegmenter {

// Whitespace-delimited tokens become words. A single line break is plain
// whitespace; a blank line marks the last word before it as paragraphEnd.
WordSequence segment(const QString &text);

} // namespace TextSegmenter

#endif // BLINKREADER_TEXTSEGMENTER_H
