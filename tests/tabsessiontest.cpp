#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

#include <memory>

#include "filestorage.h"
#include "notificationbus.h"
#include "readertab.h"
#include "sourceparsers.h"
#include "taborder.h"
#include "tabregistry.h"
#include "tabsession.h"
#include "wordsmanager.h"

class TabSessionTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void saveAndRestore();
    void homeTabIsNotSaved();
    void orphanCachesAreRemoved();
    void missingMetadataRestoresNothing();
    void missingCacheIsReparsedFromSource();
    void reparsedTabKeepsSavedPlace();
    void missingCacheWithoutSourceIsDropped();
    void autosaveInterval();

private:
    // A second registry over the same storage, as after a restart.
    void restart();

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<FileStorage> m_storage;
    std::unique_ptr<SourceParsers> m_parsers;
    std::unique_ptr<NotificationBus> m_bus;
    std::unique_ptr<TabRegistry> m_registry;
    std::unique_ptr<TabSession> m_session;
};

void TabSessionTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_storage = std::make_unique<FileStorage>(m_dir->filePath(QStringLiteral("session")));
    m_parsers = std::make_unique<SourceParsers>();
    m_bus = std::make_unique<NotificationBus>();
    m_registry = std::make_unique<TabRegistry>(m_bus.get(), m_storage.get(), m_parsers.get());
    m_session = std::make_unique<TabSession>(m_registry.get());
}

void TabSessionTest::cleanup()
{
    m_session.reset();
    m_registry.reset();
    m_bus.reset();
    m_parsers.reset();
    m_storage.reset();
    m_dir.reset();
}

void TabSessionTest::restart()
{
    m_session.reset();
    m_registry.reset();
    m_bus = std::make_unique<NotificationBus>();
    m_registry = std::make_unique<TabRegistry>(m_bus.get(), m_storage.get(), m_parsers.get());
    m_session = std::make_unique<TabSession>(m_registry.get());
}

void TabSessionTest::saveAndRestore()
{
    const TabId first = m_registry->createTab(
        TabCreateRequest::fromText(QStringLiteral("one two three four five six"),
                                   QStringLiteral("Notes"))).id;
    const TabId second = m_registry->createTab(
        TabCreateRequest::fromText(QStringLiteral("alpha beta gamma"))).id;
    QVERIFY(first != InvalidTabId);
    QVERIFY(second != InvalidTabId);

    m_registry->tab(first)->words()->skipForward(3);
    QVERIFY(m_registry->setWpm(first, 450));
    m_registry->requestFontChange(first, FontSettings{QStringLiteral("Serif"), 60.0});
    QVERIFY(m_registry->selectTab(first));

    QVERIFY(m_session->save());
    restart();

    QCOMPARE(m_session->restore(), 2);
    QCOMPARE(m_registry->tabIds(), QList<TabId>({first, second}));
    QCOMPARE(m_registry->activeTabId(), first);

    const ReaderTab *notes = m_registry->tab(first);
    QVERIFY(notes);
    QCOMPARE(notes->name(), QStringLiteral("Notes"));
    QCOMPARE(notes->wpm(), 450);
    QCOMPARE(notes->font(), (FontSettings{QStringLiteral("Serif"), 60.0}));
    QCOMPARE(notes->words()->position(), 3);
    QCOMPARE(notes->words()->count(), 6);

    const ReaderTab *other = m_registry->tab(second);
    QVERIFY(other);
    QCOMPARE(other->words()->position(), 0);
    QCOMPARE(other->words()->currentWord()->text, QStringLiteral("alpha"));

    // New tabs never collide with restored ids
    const TabId third = m_registry->createTab(
        TabCreateRequest::fromText(QStringLiteral("later"))).id;
    QVERIFY(third > second);
}

void TabSessionTest::homeTabIsNotSaved()
{
    const TabId home = m_registry->createTab(TabCreateRequest::home()).id;
    const TabId text = m_registry->createTab(
        TabCreateRequest::fromText(QStringLiteral("just words"))).id;
    QVERIFY(m_registry->selectTab(home));

    const SessionRecord session = m_session->snapshot();
    QCOMPARE(session.tabs.size(), 1);
    QCOMPARE(session.tabs.first().id, text);
    QCOMPARE(session.activeId, InvalidTabId);
}

void TabSessionTest::orphanCachesAreRemoved()
{
    const TabId kept = m_registry->createTab(
        TabCreateRequest::fromText(QStringLiteral("kept words"))).id;
    const QString keptCache = m_registry->tab(kept)->words()->cacheId();
    QVERIFY(m_session->save());

    // Written after the last save, as when the app dies before autosave
    QVERIFY(m_storage->writeWordCache(QStringLiteral("stray"),
                                      {Word{QStringLiteral("stray"), false}}));
    restart();

    QCOMPARE(m_session->restore(), 1);
    QCOMPARE(m_storage->wordCacheIds(), QStringList({keptCache}));
}

void TabSessionTest::missingMetadataRestoresNothing()
{
    QVERIFY(m_storage->writeWordCache(QStringLiteral("leftover"),
                                      {Word{QStringLiteral("x"), false}}));

    QCOMPARE(m_session->restore(), 0);
    QCOMPARE(m_registry->openTabCount(), 0);
    QVERIFY(m_storage->wordCacheIds().isEmpty());
}

void TabSessionTest::missingCacheIsReparsedFromSource()
{
    const QString path = m_dir->filePath(QStringLiteral("essay.txt"));
    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("Short essay text here.");
    }

    const TabId id = m_registry->createTab(TabCreateRequest::fromFile(path)).id;
    QVERIFY(id != InvalidTabId);
    m_registry->tab(id)->words()->skipForward(2);
    const QString oldCache = m_registry->tab(id)->words()->cacheId();
    QVERIFY(m_session->save());
    QVERIFY(m_storage->deleteWordCache(oldCache));
    restart();

    QSignalSpy added(m_registry.get(), &TabRegistry::tabAdded);
    QCOMPARE(m_session->restore(), 1);
    QVERIFY(m_registry->isPending(id));
    QVERIFY(added.wait());

    const ReaderTab *tab = m_registry->tab(id);
    QVERIFY(tab);
    QCOMPARE(tab->sourcePath(), path);
    QCOMPARE(tab->words()->count(), 4);
    QCOMPARE(tab->words()->position(), 2);
    QVERIFY(!tab->words()->cacheId().isEmpty());
    QVERIFY(tab->words()->cacheId() != oldCache);
}

void TabSessionTest::reparsedTabKeepsSavedPlace()
{
    const QString path = m_dir->filePath(QStringLiteral("middle.txt"));
    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("Loaded from disk.");
    }

    const TabId first = m_registry->createTab(
        TabCreateRequest::fromText(QStringLiteral("first tab"))).id;
    const TabId middle = m_registry->createTab(TabCreateRequest::fromFile(path)).id;
    const TabId last = m_registry->createTab(
        TabCreateRequest::fromText(QStringLiteral("last tab"))).id;
    QCOMPARE(m_registry->tabIds(), QList<TabId>({first, middle, last}));

    QVERIFY(m_storage->deleteWordCache(m_registry->tab(middle)->words()->cacheId()));
    QVERIFY(m_session->save());
    restart();

    QSignalSpy added(m_registry.get(), &TabRegistry::tabAdded);
    QCOMPARE(m_session->restore(), 3);
    QCOMPARE(m_registry->tabIds(), QList<TabId>({first, last}));
    QVERIFY(added.wait());

    QCOMPARE(m_registry->tabIds(), QList<TabId>({first, middle, last}));
    QCOMPARE(m_registry->order()->indexOf(middle), 1);

    // The next save keeps the original order
    const SessionRecord session = m_session->snapshot();
    QCOMPARE(session.tabs.size(), 3);
    QCOMPARE(session.tabs.at(1).id, middle);
}

void TabSessionTest::missingCacheWithoutSourceIsDropped()
{
    const TabId id = m_registry->createTab(
        TabCreateRequest::fromText(QStringLiteral("pasted only"))).id;
    const QString cache = m_registry->tab(id)->words()->cacheId();
    QVERIFY(m_session->save());
    QVERIFY(m_storage->deleteWordCache(cache));
    restart();

    QCOMPARE(m_session->restore(), 0);
    QVERIFY(!m_registry->tab(id));
    QCOMPARE(m_registry->pendingCount(), 0);
}

void TabSessionTest::autosaveInterval()
{
    QCOMPARE(m_session->autosaveInterval(), 5);
    m_session->setAutosaveInterval(0);
    QCOMPARE(m_session->autosaveInterval(), 1);
    m_session->setAutosaveInterval(30);
    QCOMPARE(m_session->autosaveInterval(), 30);
}

QTEST_GUILESS_MAIN(TabSessionTest)
#include "tabsessiontest.moc"
