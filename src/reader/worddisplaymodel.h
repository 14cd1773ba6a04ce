/*
 * worddisplaymodel.h — Display content for the fixation-aligned word
 *
 * Holds the three text segments (before, pivot, after) and the geometry
 * that keeps the pivot character at a fixed x position. Updated only by its
 * two notification reactions.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_WORDDISPLAYMODEL_H
#define BLINKREADER_WORDDISPLAYMODEL_H

#include <QObject>

#include "fontsettings.h"
#include "tabid.h"
#include "wordtiming.h"

class NotificationBus;
class ReadingContext;

class WordDisplayModel : public QObject
{
    Q_OBJECT

public:
    // Approximate glyph width relative to the point size.
    static constexpr qreal CharWidthRatio = 0.6;

    WordDisplayModel(ReadingContext *context, NotificationBus *bus,
                     QObject *parent = nullptr);

    const WordTiming::FixationSplit &segments() const { return m_segments; }
    bool isEmpty() const { return m_segments.pivot.isEmpty(); }

    const FontSettings &font() const { return m_font; }

    /// Offset of the before/after segments from the pivot centre.
    qreal halfCharWidth() const { return m_halfCharWidth; }

public Q_SLOTS:
    /// Reaction to NotificationBus::wordChanged.
    void recompute();
    /// Reaction to NotificationBus::fontChanged.
    void applyFont(TabId tabId, const FontSettings &font);

Q_SIGNALS:
    void contentChanged();
    void geometryChanged();

private:
    ReadingContext *m_context;
    WordTiming::FixationSplit m_segments;
    FontSettings m_font;
    qreal m_halfCharWidth = 0;
};

#endif // BLINKREADER_WORDDISPLAYMODEL_H
