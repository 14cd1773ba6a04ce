/*
 * readingcontext.h — What the reading engine needs to know about tabs
 *
 * Implemented by TabRegistry. Lets the state machine and the display model
 * follow the active tab without depending on the tab lifecycle code.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_READINGCONTEXT_H
#define BLINKREADER_READINGCONTEXT_H

#include "tabid.h"

class WordsManager;

class ReadingContext
{
public:
    virtual ~ReadingContext() = default;

    virtual TabId activeTabId() const = 0;

    /// Content of the active tab, or nullptr for none / a non-content tab.
    virtual WordsManager *activeWords() const = 0;

    virtual int activeWpm() const = 0;
    virtual void setActiveWpm(int wpm) = 0;
};

#endif // BLINKREADER_READINGCONTEXT_H
