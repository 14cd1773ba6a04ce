#include "worddisplaymodel.h"
#include "notificationbus.h"
#include "readingcontext.h"
#include "wordsmanager.h"

WordDisplayModel::WordDisplayModel(ReadingContext *context, NotificationBus *bus,
                                   QObject *parent)
    : QObject(parent)
    , m_context(context)
{
    connect(bus, &NotificationBus::wordChanged, this, &WordDisplayModel::recompute);
    connect(bus, &NotificationBus::fontChanged, this, &WordDisplayModel::applyFont);
}

void WordDisplayModel::recompute()
{
    WordsManager *words = m_context->activeWords();
    const Word *word = words ? words->currentWord() : nullptr;

    m_segments = word ? WordTiming::split(word->text) : WordTiming::FixationSplit{};
    Q_EMIT contentChanged();
}

void WordDisplayModel::applyFont(TabId tabId, const FontSettings &font)
{
    // Fonts of background tabs are stored on the tab but not displayed.
    if (tabId != m_context->activeTabId())
        return;

    m_font = font;
    m_halfCharWidth = font.pointSize * CharWidthRatio * 0.5;
    Q_EMIT geometryChanged();
}
