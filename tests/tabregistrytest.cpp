#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>
#include <QThreadPool>

#include <memory>

#include "filestorage.h"
#include "fontcatalog.h"
#include "notificationbus.h"
#include "readertab.h"
#include "sourceparsers.h"
#include "taborder.h"
#include "tabregistry.h"
#include "wordsmanager.h"

class TabRegistryTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void textTabDefaults();
    void createdTabWritesCache();
    void orderFollowsLifecycle();
    void closingActiveSelectsAdjacent();
    void closingInactiveKeepsActive();
    void closeDeletesCache();
    void homeTabCannotBeClosed();
    void parseErrorCreatesNothing();
    void restoredIdIsReused();
    void fontFallsBackToCatalogDefault();
    void wpmIsClamped();
    void cyclicNavigation();
    void asyncLoadCreatesTab();
    void asyncLoadFailureReported();
    void cancelledLoadHasNoSideEffects();

private:
    QString writeFile(const QString &name, const QByteArray &data);
    TabId addText(const QString &text);

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<FileStorage> m_storage;
    std::unique_ptr<NotificationBus> m_bus;
    std::unique_ptr<SourceParsers> m_parsers;
    std::unique_ptr<TabRegistry> m_registry;
};

void TabRegistryTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_storage = std::make_unique<FileStorage>(m_dir->filePath(QStringLiteral("session")));
    m_bus = std::make_unique<NotificationBus>();
    m_parsers = std::make_unique<SourceParsers>();
    m_registry = std::make_unique<TabRegistry>(m_bus.get(), m_storage.get(), m_parsers.get());
}

void TabRegistryTest::cleanup()
{
    m_registry.reset();
    m_parsers.reset();
    m_bus.reset();
    m_storage.reset();
    m_dir.reset();
}

QString TabRegistryTest::writeFile(const QString &name, const QByteArray &data)
{
    const QString path = m_dir->filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return QString();
    file.write(data);
    return path;
}

TabId TabRegistryTest::addText(const QString &text)
{
    const TabCreateResult result = m_registry->createTab(TabCreateRequest::fromText(text));
    return result.id;
}

void TabRegistryTest::textTabDefaults()
{
    QSignalSpy added(m_registry.get(), &TabRegistry::tabAdded);
    const TabId first = addText(QStringLiteral("hello world"));
    const TabId second = addText(QStringLiteral("again"));

    QVERIFY(first != InvalidTabId);
    QVERIFY(second != first);
    QCOMPARE(added.count(), 2);

    const ReaderTab *tab = m_registry->tab(first);
    QVERIFY(tab);
    QVERIFY(tab->isReader());
    QCOMPARE(tab->name(), QStringLiteral("Text 1"));
    QCOMPARE(m_registry->tab(second)->name(), QStringLiteral("Text 2"));
    QCOMPARE(tab->wpm(), 300);
    QCOMPARE(tab->font().pointSize, 48.0);
    QCOMPARE(tab->words()->count(), 2);
    QCOMPARE(m_registry->activeTabId(), second);
    QCOMPARE(m_registry->openTabCount(), 2);
}

void TabRegistryTest::createdTabWritesCache()
{
    const TabId id = addText(QStringLiteral("one two three"));
    const QString cacheId = m_registry->tab(id)->words()->cacheId();
    QVERIFY(!cacheId.isEmpty());
    QVERIFY(m_storage->wordCacheIds().contains(cacheId));

    const std::optional<WordSequence> cached = m_storage->loadWordCache(cacheId);
    QVERIFY(cached);
    QCOMPARE(*cached, m_registry->tab(id)->words()->words());
}

void TabRegistryTest::orderFollowsLifecycle()
{
    const TabId a = addText(QStringLiteral("a"));
    const TabId b = addText(QStringLiteral("b"));
    const TabId c = addText(QStringLiteral("c"));
    QCOMPARE(m_registry->order()->ids(), QList<TabId>({a, b, c}));
    QCOMPARE(m_registry->tabIds(), QList<TabId>({a, b, c}));

    QVERIFY(m_registry->closeTab(b));
    QCOMPARE(m_registry->order()->ids(), QList<TabId>({a, c}));
    QCOMPARE(m_registry->order()->indexOf(c), 1);
    QCOMPARE(m_registry->order()->indexOf(b), -1);

    const TabId d = addText(QStringLiteral("d"));
    QCOMPARE(m_registry->order()->ids(), QList<TabId>({a, c, d}));
}

void TabRegistryTest::closingActiveSelectsAdjacent()
{
    const TabId a = addText(QStringLiteral("a"));
    const TabId b = addText(QStringLiteral("b"));
    const TabId c = addText(QStringLiteral("c"));
    QVERIFY(m_registry->selectTab(b));

    QCOMPARE(m_registry->order()->findAdjacent(b), c);

    // Next neighbour first
    QVERIFY(m_registry->closeTab(b));
    QCOMPARE(m_registry->activeTabId(), c);

    // No next: previous
    QVERIFY(m_registry->closeTab(c));
    QCOMPARE(m_registry->activeTabId(), a);

    // Nothing left
    QSignalSpy active(m_registry.get(), &TabRegistry::activeTabChanged);
    QVERIFY(m_registry->closeTab(a));
    QCOMPARE(m_registry->activeTabId(), InvalidTabId);
    QCOMPARE(active.count(), 1);
    QCOMPARE(active.first().first().value<TabId>(), InvalidTabId);
    QCOMPARE(m_registry->openTabCount(), 0);
}

void TabRegistryTest::closingInactiveKeepsActive()
{
    const TabId a = addText(QStringLiteral("a"));
    const TabId b = addText(QStringLiteral("b"));
    QCOMPARE(m_registry->activeTabId(), b);

    QSignalSpy active(m_registry.get(), &TabRegistry::activeTabChanged);
    QSignalSpy words(m_bus.get(), &NotificationBus::wordChanged);
    QVERIFY(m_registry->closeTab(a));
    QCOMPARE(m_registry->activeTabId(), b);
    QCOMPARE(active.count(), 0);
    QCOMPARE(words.count(), 0);

    QCOMPARE(m_registry->order()->findAdjacent(b), InvalidTabId);
}

void TabRegistryTest::closeDeletesCache()
{
    const TabId id = addText(QStringLiteral("to be closed"));
    const QString cacheId = m_registry->tab(id)->words()->cacheId();
    QVERIFY(m_storage->wordCacheIds().contains(cacheId));

    QSignalSpy removed(m_registry.get(), &TabRegistry::tabRemoved);
    QVERIFY(m_registry->closeTab(id));
    QCOMPARE(removed.count(), 1);
    QVERIFY(!m_registry->tab(id));
    QVERIFY(!m_storage->wordCacheIds().contains(cacheId));

    QVERIFY(!m_registry->closeTab(id));
}

void TabRegistryTest::homeTabCannotBeClosed()
{
    const TabCreateResult home = m_registry->createTab(TabCreateRequest::home());
    QVERIFY(home.ok());
    const ReaderTab *tab = m_registry->tab(home.id);
    QCOMPARE(tab->kind(), ReaderTab::Kind::Home);
    QVERIFY(!tab->words());
    QCOMPARE(tab->name(), QStringLiteral("Home"));
    QVERIFY(m_storage->wordCacheIds().isEmpty());

    QVERIFY(!m_registry->closeTab(home.id));
    QVERIFY(m_registry->tab(home.id));
    QCOMPARE(m_registry->readerTabCount(), 0);
}

void TabRegistryTest::parseErrorCreatesNothing()
{
    QSignalSpy added(m_registry.get(), &TabRegistry::tabAdded);
    const QString pdf = writeFile(QStringLiteral("book.pdf"), QByteArray("%PDF-1.4"));

    const TabCreateResult result = m_registry->createTab(TabCreateRequest::fromFile(pdf));
    QVERIFY(!result.ok());
    QVERIFY(result.error);
    QCOMPARE(result.error->reason, ParseError::UnsupportedFormat);

    const QString broken = writeFile(QStringLiteral("broken.txt"), QByteArray("\xff\xfe\xfd"));
    const TabCreateResult malformed = m_registry->createTab(TabCreateRequest::fromFile(broken));
    QCOMPARE(malformed.error->reason, ParseError::MalformedContent);

    QCOMPARE(added.count(), 0);
    QCOMPARE(m_registry->openTabCount(), 0);
    QVERIFY(m_storage->wordCacheIds().isEmpty());
}

void TabRegistryTest::restoredIdIsReused()
{
    TabCreateRequest request;
    request.id = 42;
    request.words = WordSequence({Word{QStringLiteral("x"), false}, Word{QStringLiteral("y"), false}});
    request.cacheId = QStringLiteral("restored-cache");
    request.position = 9;
    request.name = QStringLiteral("Saved");

    const TabCreateResult result = m_registry->createTab(request);
    QCOMPARE(result.id, TabId(42));
    const ReaderTab *tab = m_registry->tab(42);
    QCOMPARE(tab->name(), QStringLiteral("Saved"));
    QCOMPARE(tab->words()->cacheId(), QStringLiteral("restored-cache"));
    QCOMPARE(tab->words()->position(), 1);

    // Restored content is not written again
    QVERIFY(m_storage->wordCacheIds().isEmpty());

    // Fresh ids never collide with restored ones
    const TabId next = addText(QStringLiteral("fresh"));
    QVERIFY(next > 42);

    // A taken id falls back to a new one
    TabCreateRequest duplicate = request;
    QVERIFY(m_registry->createTab(duplicate).id != TabId(42));
}

void TabRegistryTest::fontFallsBackToCatalogDefault()
{
    FontCatalog catalog({QStringLiteral("Serif"), QStringLiteral("Mono"), QStringLiteral("Sans")});
    catalog.setDefaultFamily(QStringLiteral("Sans"));
    m_registry->setFontCatalog(&catalog);

    TabCreateRequest known = TabCreateRequest::fromText(QStringLiteral("a"));
    known.fontFamily = QStringLiteral("Mono");
    QCOMPARE(m_registry->tab(m_registry->createTab(known).id)->font().family, QStringLiteral("Mono"));

    TabCreateRequest unknown = TabCreateRequest::fromText(QStringLiteral("b"));
    unknown.fontFamily = QStringLiteral("No Such Font");
    QCOMPARE(m_registry->tab(m_registry->createTab(unknown).id)->font().family, QStringLiteral("Sans"));

    const TabId plain = addText(QStringLiteral("c"));
    QCOMPARE(m_registry->tab(plain)->font().family, QStringLiteral("Sans"));

    m_registry->setFontCatalog(nullptr);
}

void TabRegistryTest::wpmIsClamped()
{
    ReaderLimits limits;
    m_registry->setLimits(limits);
    const TabId id = addText(QStringLiteral("a b"));

    QSignalSpy changed(m_registry.get(), &TabRegistry::tabWpmChanged);
    QVERIFY(m_registry->setWpm(id, 5000));
    QCOMPARE(m_registry->tab(id)->wpm(), limits.maxWpm);
    QVERIFY(m_registry->setWpm(id, 1));
    QCOMPARE(m_registry->tab(id)->wpm(), limits.minWpm);
    QCOMPARE(changed.count(), 2);

    TabCreateRequest fast = TabCreateRequest::fromText(QStringLiteral("c"));
    fast.wpm = 99999;
    QCOMPARE(m_registry->tab(m_registry->createTab(fast).id)->wpm(), limits.maxWpm);
}

void TabRegistryTest::cyclicNavigation()
{
    const TabId a = addText(QStringLiteral("a"));
    const TabId b = addText(QStringLiteral("b"));
    const TabId c = addText(QStringLiteral("c"));
    const TabOrder *order = m_registry->order();

    QCOMPARE(order->nextOf(a), b);
    QCOMPARE(order->nextOf(c), a);
    QCOMPARE(order->previousOf(a), c);
    QCOMPARE(order->previousOf(b), a);

    m_registry->closeTab(b);
    m_registry->closeTab(c);
    QCOMPARE(order->nextOf(a), InvalidTabId);
    QCOMPARE(order->findAdjacent(a), InvalidTabId);
}

void TabRegistryTest::asyncLoadCreatesTab()
{
    const QString path = writeFile(QStringLiteral("chapter.txt"), QByteArray("It was a dark night."));
    QSignalSpy added(m_registry.get(), &TabRegistry::tabAdded);
    QSignalSpy started(m_registry.get(), &TabRegistry::loadStarted);

    const TabId id = m_registry->requestTab(TabCreateRequest::fromFile(path));
    QVERIFY(id != InvalidTabId);
    QCOMPARE(started.count(), 1);
    QVERIFY(m_registry->isPending(id));
    QVERIFY(!m_registry->tab(id));

    QVERIFY(added.wait(5000));
    QCOMPARE(added.first().first().value<TabId>(), id);
    QVERIFY(!m_registry->isPending(id));

    const ReaderTab *tab = m_registry->tab(id);
    QCOMPARE(tab->name(), QStringLiteral("chapter"));
    QCOMPARE(tab->sourcePath(), path);
    QCOMPARE(tab->words()->count(), 5);
    QCOMPARE(m_registry->activeTabId(), id);
    QVERIFY(m_storage->wordCacheIds().contains(tab->words()->cacheId()));
}

void TabRegistryTest::asyncLoadFailureReported()
{
    QSignalSpy failed(m_registry.get(), &TabRegistry::tabCreationFailed);
    QSignalSpy added(m_registry.get(), &TabRegistry::tabAdded);

    const TabId id = m_registry->requestTab(
        TabCreateRequest::fromFile(m_dir->filePath(QStringLiteral("missing.txt"))));
    QVERIFY(failed.wait(5000));
    QCOMPARE(failed.first().first().value<TabId>(), id);
    QCOMPARE(failed.first().at(1).value<ParseError>().reason, ParseError::IoFailure);
    QCOMPARE(added.count(), 0);
    QVERIFY(!m_registry->isPending(id));
}

void TabRegistryTest::cancelledLoadHasNoSideEffects()
{
    const QString path = writeFile(QStringLiteral("long.md"), QByteArray("# Chapter\n\nSome text."));
    QSignalSpy added(m_registry.get(), &TabRegistry::tabAdded);
    QSignalSpy failed(m_registry.get(), &TabRegistry::tabCreationFailed);
    QSignalSpy cancelled(m_registry.get(), &TabRegistry::loadCancelled);

    const TabId id = m_registry->requestTab(TabCreateRequest::fromFile(path));
    QVERIFY(m_registry->closeTab(id));
    QCOMPARE(cancelled.count(), 1);
    QVERIFY(!m_registry->isPending(id));

    // Let the worker finish and any queued delivery run
    QThreadPool::globalInstance()->waitForDone();
    QTest::qWait(50);

    QCOMPARE(added.count(), 0);
    QCOMPARE(failed.count(), 0);
    QVERIFY(!m_registry->tab(id));
    QVERIFY(m_storage->wordCacheIds().isEmpty());
    QCOMPARE(m_registry->activeTabId(), InvalidTabId);
}

QTEST_GUILESS_MAIN(TabRegistryTest)
#include "tabregistrytest.moc"
