/*
 * tabregistry.h — Owner of the live tab set and the active-tab marker
 *
 * Every tab, whether started from pasted text, a file, the home page or a
 * restored session, is created through createTab(). File sources can be
 * parsed off the GUI thread with requestTab(); closing a pending id drops
 * the load without side effects.
 *
 * Tab switches post fontChanged (reader tabs) followed by wordChanged on
 * the NotificationBus. Cursor moves of the active tab's WordsManager are
 * forwarded as wordChanged; moves of inactive tabs are not.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_TABREGISTRY_H
#define BLINKREADER_TABREGISTRY_H

#include <QHash>
#include <QObject>
#include <QString>

#include <optional>

#include "fontsettings.h"
#include "parseerror.h"
#include "readerlimits.h"
#include "readertab.h"
#include "readingcontext.h"
#include "tabid.h"
#include "word.h"

template<typename T>
class QFutureWatcher;

class FontCatalog;
class NotificationBus;
class SourceParsers;
class StorageBackend;
class TabOrder;

struct TabCreateRequest {
    ReaderTab::Kind kind = ReaderTab::Kind::Reader;

    /// Empty picks a name from the source.
    QString name;

    // Content source, in order of precedence: words, filePath, text.
    std::optional<WordSequence> words;
    QString filePath;
    QString text;

    /// Cache id of `words` when they come from a persisted cache.
    QString cacheId;

    /// Restored tabs keep their id when it is still free.
    TabId id = InvalidTabId;

    QString fontFamily;
    std::optional<qreal> fontSize;
    std::optional<int> wpm;
    int position = 0;

    bool activate = true;

    static TabCreateRequest home();
    static TabCreateRequest fromText(const QString &text, const QString &name = {});
    static TabCreateRequest fromFile(const QString &filePath);
};

struct TabCreateResult {
    TabId id = InvalidTabId;
    std::optional<ParseError> error;

    bool ok() const { return id != InvalidTabId; }
};

class TabRegistry : public QObject, public ReadingContext
{
    Q_OBJECT

public:
    /// storage may be null, in which case nothing is cached.
    TabRegistry(NotificationBus *bus, StorageBackend *storage,
                const SourceParsers *parsers, QObject *parent = nullptr);
    ~TabRegistry() override;

    void setLimits(const ReaderLimits &limits) { m_limits = limits; }
    const ReaderLimits &limits() const { return m_limits; }

    void setFontCatalog(const FontCatalog *catalog) { m_fonts = catalog; }
    void setStorage(StorageBackend *storage) { m_storage = storage; }
    StorageBackend *storage() const { return m_storage; }

    /// Synchronous creation. On a parse failure no tab exists afterwards.
    TabCreateResult createTab(const TabCreateRequest &request);

    /// Like createTab(), but file sources are parsed on the thread pool.
    /// Returns the id the tab will get; the outcome is reported through
    /// tabAdded() or tabCreationFailed().
    TabId requestTab(const TabCreateRequest &request);

    bool isPending(TabId id) const { return m_pending.contains(id); }
    int pendingCount() const { return static_cast<int>(m_pending.size()); }

    bool selectTab(TabId id);

    /// Closes a reader tab or cancels a pending load. Home tabs stay.
    bool closeTab(TabId id);

    void requestFontChange(TabId id, const FontSettings &font);
    bool setWpm(TabId id, int wpm);

    ReaderTab *tab(TabId id) const { return m_tabs.value(id, nullptr); }
    ReaderTab *activeTab() const { return tab(m_activeId); }
    const TabOrder *order() const { return m_order; }

    /// Live tab ids in display order.
    QList<TabId> tabIds() const;
    int openTabCount() const { return static_cast<int>(m_tabs.size()); }
    int readerTabCount() const;

    // ReadingContext
    TabId activeTabId() const override { return m_activeId; }
    WordsManager *activeWords() const override;
    int activeWpm() const override;
    void setActiveWpm(int wpm) override;

Q_SIGNALS:
    void tabAdded(TabId id);
    void tabRemoved(TabId id);
    void activeTabChanged(TabId id);
    void tabWpmChanged(TabId id, int wpm);
    void tabFontApplied(TabId id, const FontSettings &font);
    void tabCreationFailed(TabId id, const ParseError &error);
    void loadStarted(TabId id, const QString &name);
    void loadCancelled(TabId id);

private Q_SLOTS:
    void applyFont(TabId id, const FontSettings &font);

private:
    struct PendingLoad {
        QFutureWatcher<ParseResult> *watcher = nullptr;
        TabCreateRequest request;
    };

    TabId allocateId(TabId requested);
    QString defaultName(const TabCreateRequest &request) const;
    void finishLoad(TabId id);

    NotificationBus *m_bus;
    StorageBackend *m_storage;
    const SourceParsers *m_parsers;
    const FontCatalog *m_fonts = nullptr;
    ReaderLimits m_limits;

    QHash<TabId, ReaderTab *> m_tabs;
    QHash<TabId, PendingLoad> m_pending;
    TabOrder *m_order;
    TabId m_activeId = InvalidTabId;
    TabId m_nextId = 1;
};

#endif // BLINKREADER_TABREGISTRY_H
