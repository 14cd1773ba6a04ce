/*
 * tabregistry.cpp — Tab creation, selection and teardown
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tabregistry.h"
#include "fontcatalog.h"
#include "notificationbus.h"
#include "sourceparsers.h"
#include "storagebackend.h"
#include "taborder.h"
#include "textsegmenter.h"
#include "wordsmanager.h"

#include <KLocalizedString>

#include <QDebug>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QtConcurrent>

#include <algorithm>

TabCreateRequest TabCreateRequest::home()
{
    TabCreateRequest request;
    request.kind = ReaderTab::Kind::Home;
    request.name = i18n("Home");
    return request;
}

TabCreateRequest TabCreateRequest::fromText(const QString &text, const QString &name)
{
    TabCreateRequest request;
    request.text = text;
    request.name = name;
    return request;
}

TabCreateRequest TabCreateRequest::fromFile(const QString &filePath)
{
    TabCreateRequest request;
    request.filePath = filePath;
    return request;
}

TabRegistry::TabRegistry(NotificationBus *bus, StorageBackend *storage,
                         const SourceParsers *parsers, QObject *parent)
    : QObject(parent)
    , m_bus(bus)
    , m_storage(storage)
    , m_parsers(parsers)
    , m_order(new TabOrder(this))
{
    connect(m_bus, &NotificationBus::fontChanged, this, &TabRegistry::applyFont);
}

TabRegistry::~TabRegistry()
{
    // Workers hold m_parsers; let them finish before it can go away.
    for (auto it = m_pending.begin(); it != m_pending.end(); ++it) {
        it->watcher->disconnect(this);
        it->watcher->waitForFinished();
        delete it->watcher;
    }
    m_pending.clear();
}

TabCreateResult TabRegistry::createTab(const TabCreateRequest &request)
{
    TabCreateResult result;
    const bool isReader = request.kind == ReaderTab::Kind::Reader;

    WordSequence words;
    QString cacheId;
    if (isReader) {
        if (request.words) {
            words = *request.words;
            cacheId = request.cacheId;
        } else if (!request.filePath.isEmpty()) {
            if (!m_parsers) {
                result.error = ParseError{ParseError::UnsupportedFormat, request.filePath, QString()};
                return result;
            }
            ParseResult parsed = m_parsers->parseFile(request.filePath);
            if (!parsed.ok()) {
                qWarning() << "TabRegistry: cannot open" << request.filePath
                           << ":" << parsed.error->message();
                result.error = parsed.error;
                return result;
            }
            words = parsed.words;
        } else {
            words = TextSegmenter::segment(request.text);
        }

        // Fresh content gets a new cache entry; restored content keeps its own.
        if (cacheId.isEmpty() && m_storage) {
            cacheId = m_storage->generateCacheId();
            if (!m_storage->writeWordCache(cacheId, words))
                qWarning() << "TabRegistry: failed to write word cache" << cacheId;
        }
    }

    const TabId id = allocateId(request.id);
    auto *tab = new ReaderTab(id, request.kind, defaultName(request), this);
    if (isReader) {
        tab->m_sourcePath = request.filePath;
        tab->m_font.family = m_fonts ? m_fonts->resolve(request.fontFamily) : request.fontFamily;
        tab->m_font.pointSize = request.fontSize.value_or(m_limits.defaultFontSize);
        tab->m_wpm = m_limits.clampWpm(request.wpm.value_or(m_limits.defaultWpm));
        tab->m_words = new WordsManager(words, cacheId, request.position, tab);
        connect(tab->m_words, &WordsManager::positionChanged, this, [this, id]() {
            if (id == m_activeId)
                m_bus->postWordChanged();
        });
    }

    m_tabs.insert(id, tab);
    Q_EMIT tabAdded(id);

    if (request.activate || m_activeId == InvalidTabId)
        selectTab(id);

    result.id = id;
    return result;
}

TabId TabRegistry::requestTab(const TabCreateRequest &request)
{
    if (request.kind != ReaderTab::Kind::Reader || request.words
        || request.filePath.isEmpty() || !m_parsers) {
        const TabCreateResult result = createTab(request);
        if (!result.ok() && result.error)
            Q_EMIT tabCreationFailed(InvalidTabId, *result.error);
        return result.id;
    }

    const TabId id = allocateId(request.id);
    PendingLoad load;
    load.request = request;
    load.request.id = id;
    load.watcher = new QFutureWatcher<ParseResult>(this);
    connect(load.watcher, &QFutureWatcherBase::finished, this, [this, id]() {
        finishLoad(id);
    });
    m_pending.insert(id, load);

    const SourceParsers *parsers = m_parsers;
    const QString path = request.filePath;
    load.watcher->setFuture(QtConcurrent::run([parsers, path]() {
        return parsers->parseFile(path);
    }));

    Q_EMIT loadStarted(id, defaultName(request));
    return id;
}

void TabRegistry::finishLoad(TabId id)
{
    auto it = m_pending.find(id);
    if (it == m_pending.end())
        return;

    PendingLoad load = it.value();
    m_pending.erase(it);
    const ParseResult parsed = load.watcher->result();
    load.watcher->deleteLater();

    if (!parsed.ok()) {
        qWarning() << "TabRegistry: cannot open" << load.request.filePath
                   << ":" << parsed.error->message();
        Q_EMIT tabCreationFailed(id, *parsed.error);
        return;
    }

    TabCreateRequest request = load.request;
    request.words = parsed.words;
    request.cacheId.clear();
    createTab(request);
}

bool TabRegistry::selectTab(TabId id)
{
    ReaderTab *target = tab(id);
    if (!target)
        return false;
    if (id == m_activeId)
        return true;

    m_activeId = id;
    Q_EMIT activeTabChanged(id);

    if (target->isReader())
        m_bus->postFontChanged(id, target->font());
    m_bus->postWordChanged();
    return true;
}

bool TabRegistry::closeTab(TabId id)
{
    auto pending = m_pending.find(id);
    if (pending != m_pending.end()) {
        QFutureWatcher<ParseResult> *watcher = pending->watcher;
        m_pending.erase(pending);
        watcher->disconnect(this);
        delete watcher;
        qDebug() << "TabRegistry: cancelled load for tab" << id;
        Q_EMIT loadCancelled(id);
        return true;
    }

    ReaderTab *target = tab(id);
    if (!target || !target->isReader())
        return false;

    const bool wasActive = id == m_activeId;
    const TabId adjacent = m_order->findAdjacent(id);

    const QString cacheId = target->words()->cacheId();
    if (m_storage && !cacheId.isEmpty() && !m_storage->deleteWordCache(cacheId))
        qWarning() << "TabRegistry: failed to delete word cache" << cacheId;

    m_tabs.remove(id);
    if (wasActive)
        m_activeId = InvalidTabId;
    Q_EMIT tabRemoved(id);
    delete target;

    if (wasActive) {
        if (adjacent != InvalidTabId) {
            selectTab(adjacent);
        } else {
            Q_EMIT activeTabChanged(InvalidTabId);
            m_bus->postWordChanged();
        }
    }
    return true;
}

void TabRegistry::requestFontChange(TabId id, const FontSettings &font)
{
    ReaderTab *target = tab(id);
    if (!target || !target->isReader())
        return;

    FontSettings resolved = font;
    if (m_fonts)
        resolved.family = m_fonts->resolve(font.family);
    m_bus->postFontChanged(id, resolved);
}

void TabRegistry::applyFont(TabId id, const FontSettings &font)
{
    ReaderTab *target = tab(id);
    if (!target || !target->isReader() || target->m_font == font)
        return;
    target->m_font = font;
    Q_EMIT tabFontApplied(id, font);
}

bool TabRegistry::setWpm(TabId id, int wpm)
{
    ReaderTab *target = tab(id);
    if (!target || !target->isReader())
        return false;

    const int clamped = m_limits.clampWpm(wpm);
    if (clamped != target->m_wpm) {
        target->m_wpm = clamped;
        Q_EMIT tabWpmChanged(id, clamped);
    }
    return true;
}

QList<TabId> TabRegistry::tabIds() const
{
    return m_order->ids();
}

int TabRegistry::readerTabCount() const
{
    return static_cast<int>(std::count_if(m_tabs.cbegin(), m_tabs.cend(),
                                          [](const ReaderTab *t) { return t->isReader(); }));
}

WordsManager *TabRegistry::activeWords() const
{
    const ReaderTab *active = activeTab();
    return active ? active->words() : nullptr;
}

int TabRegistry::activeWpm() const
{
    const ReaderTab *active = activeTab();
    return (active && active->isReader()) ? active->wpm() : m_limits.defaultWpm;
}

void TabRegistry::setActiveWpm(int wpm)
{
    setWpm(m_activeId, wpm);
}

TabId TabRegistry::allocateId(TabId requested)
{
    if (requested != InvalidTabId && !m_tabs.contains(requested) && !m_pending.contains(requested)) {
        m_nextId = std::max(m_nextId, requested + 1);
        return requested;
    }
    while (m_tabs.contains(m_nextId) || m_pending.contains(m_nextId))
        ++m_nextId;
    return m_nextId++;
}

QString TabRegistry::defaultName(const TabCreateRequest &request) const
{
    if (!request.name.isEmpty())
        return request.name;
    if (!request.filePath.isEmpty())
        return QFileInfo(request.filePath).completeBaseName();
    return i18n("Text %1", readerTabCount() + 1);
}
