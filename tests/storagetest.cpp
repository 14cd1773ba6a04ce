#include <QFile>
#include <QSet>
#include <QTemporaryDir>
#include <QTest>

#include <memory>

#include "filestorage.h"
#include "sessioncodec.h"
#include "storagebackend.h"

Q_DECLARE_METATYPE(StorageBackend::Kind)

class StorageTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void sessionRoundTrip_data();
    void sessionRoundTrip();
    void nothingSavedYet_data();
    void nothingSavedYet();
    void wordCacheLifecycle_data();
    void wordCacheLifecycle();
    void cacheIdsAreUnique();

    void corruptMetadataLoadsNothing();
    void malformedTabEntriesAreSkipped();
    void cacheIdsCannotEscapeDirectory();

private:
    void addBackends();
    std::unique_ptr<StorageBackend> backend(StorageBackend::Kind kind) const;

    std::unique_ptr<QTemporaryDir> m_dir;
};

static SessionRecord sampleSession()
{
    TabRecord pasted;
    pasted.id = 3;
    pasted.name = QStringLiteral("Text 1");
    pasted.fontFamily = QStringLiteral("DejaVu Serif");
    pasted.fontSize = 52.5;
    pasted.wpm = 350;
    pasted.position = 17;
    pasted.cacheId = QStringLiteral("0b6f4c1e-3d7a-4a55-9a44-7c5c2d9e8f01");

    TabRecord file;
    file.id = 7;
    file.name = QStringLiteral("chapter");
    file.fontFamily = QStringLiteral("Noto Sans");
    file.fontSize = 48;
    file.wpm = 300;
    file.sourcePath = QStringLiteral("/home/reader/books/chapter.md");
    file.position = 0;
    file.cacheId = QStringLiteral("e2a1c9d8-0f4b-4f0a-8b1c-2d3e4f5a6b7c");

    SessionRecord session;
    session.activeId = 7;
    session.tabs = {pasted, file};
    return session;
}

void StorageTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void StorageTest::cleanup()
{
    m_dir.reset();
}

void StorageTest::addBackends()
{
    QTest::addColumn<StorageBackend::Kind>("kind");
    QTest::newRow("files") << StorageBackend::Files;
    QTest::newRow("config") << StorageBackend::ConfigFile;
}

std::unique_ptr<StorageBackend> StorageTest::backend(StorageBackend::Kind kind) const
{
    const QString location = kind == StorageBackend::Files
        ? m_dir->filePath(QStringLiteral("session"))
        : m_dir->filePath(QStringLiteral("sessionrc"));
    return StorageBackend::create(kind, location);
}

void StorageTest::sessionRoundTrip_data()
{
    addBackends();
}

void StorageTest::sessionRoundTrip()
{
    QFETCH(StorageBackend::Kind, kind);
    const SessionRecord session = sampleSession();

    QVERIFY(backend(kind)->saveTabMetadata(session));

    // A fresh instance reads what the first one wrote
    const std::optional<SessionRecord> loaded = backend(kind)->loadTabMetadata();
    QVERIFY(loaded);
    QCOMPARE(loaded->activeId, session.activeId);
    QCOMPARE(loaded->tabs.size(), 2);
    QCOMPARE(loaded->tabs.at(0), session.tabs.at(0));
    QCOMPARE(loaded->tabs.at(1), session.tabs.at(1));
}

void StorageTest::nothingSavedYet_data()
{
    addBackends();
}

void StorageTest::nothingSavedYet()
{
    QFETCH(StorageBackend::Kind, kind);
    auto storage = backend(kind);
    QVERIFY(!storage->loadTabMetadata());
    QVERIFY(storage->wordCacheIds().isEmpty());
    QVERIFY(!storage->loadWordCache(QStringLiteral("absent")));
}

void StorageTest::wordCacheLifecycle_data()
{
    addBackends();
}

void StorageTest::wordCacheLifecycle()
{
    QFETCH(StorageBackend::Kind, kind);
    auto storage = backend(kind);

    const WordSequence words = {
        Word{QStringLiteral("First"), false},
        Word{QStringLiteral("paragraph."), true},
        Word{QStringLiteral("Second"), false},
        Word{QStringLiteral("café"), false},
    };
    const WordSequence other = {Word{QStringLiteral("alone"), false}};

    QVERIFY(storage->writeWordCache(QStringLiteral("cache-a"), words));
    QVERIFY(storage->writeWordCache(QStringLiteral("cache-b"), other));

    const QStringList ids = storage->wordCacheIds();
    QCOMPARE(QSet<QString>(ids.cbegin(), ids.cend()),
             QSet<QString>({QStringLiteral("cache-a"), QStringLiteral("cache-b")}));

    const std::optional<WordSequence> loaded = backend(kind)->loadWordCache(QStringLiteral("cache-a"));
    QVERIFY(loaded);
    QCOMPARE(*loaded, words);

    QVERIFY(storage->deleteWordCache(QStringLiteral("cache-a")));
    QVERIFY(!storage->loadWordCache(QStringLiteral("cache-a")));
    QCOMPARE(storage->wordCacheIds(), QStringList({QStringLiteral("cache-b")}));

    // Deleting twice is not an error
    QVERIFY(storage->deleteWordCache(QStringLiteral("cache-a")));
}

void StorageTest::cacheIdsAreUnique()
{
    auto storage = backend(StorageBackend::Files);
    QSet<QString> ids;
    for (int i = 0; i < 100; ++i)
        ids.insert(storage->generateCacheId());
    QCOMPARE(ids.size(), 100);
    QVERIFY(!ids.contains(QString()));
}

void StorageTest::corruptMetadataLoadsNothing()
{
    const QString dir = m_dir->filePath(QStringLiteral("session"));
    FileStorage storage(dir);
    QVERIFY(storage.saveTabMetadata(sampleSession()));

    QFile file(dir + QStringLiteral("/tabs.json"));
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("{ \"version\": 1, \"tabs\": [");
    file.close();

    QVERIFY(!storage.loadTabMetadata());
}

void StorageTest::malformedTabEntriesAreSkipped()
{
    const QByteArray json =
        "{ \"version\": 1, \"activeId\": \"5\", \"tabs\": ["
        "  { \"id\": \"5\", \"name\": \"Good\", \"fontFamily\": \"Serif\", \"fontSize\": 48,"
        "    \"wpm\": 300, \"position\": 2, \"cacheId\": \"abc\" },"
        "  { \"id\": \"oops\", \"cacheId\": \"def\" },"
        "  { \"id\": \"6\", \"name\": \"No cache\" }"
        "] }";

    const std::optional<SessionRecord> session = SessionCodec::decodeSession(json);
    QVERIFY(session);
    QCOMPARE(session->activeId, TabId(5));
    QCOMPARE(session->tabs.size(), 1);
    QCOMPARE(session->tabs.first().name, QStringLiteral("Good"));
    QVERIFY(session->tabs.first().sourcePath.isEmpty());

    QVERIFY(!SessionCodec::decodeSession("{ \"version\": 99, \"tabs\": [] }"));
    QVERIFY(!SessionCodec::decodeWords("{ \"words\": [ { \"t\": \"\" } ] }"));
    QVERIFY(!SessionCodec::decodeWords("[]"));
}

void StorageTest::cacheIdsCannotEscapeDirectory()
{
    FileStorage storage(m_dir->filePath(QStringLiteral("session")));
    const WordSequence words = {Word{QStringLiteral("x"), false}};

    QVERIFY(!storage.writeWordCache(QStringLiteral("../escape"), words));
    QVERIFY(!storage.writeWordCache(QString(), words));
    QVERIFY(!QFile::exists(m_dir->filePath(QStringLiteral("escape.json"))));
}

QTEST_GUILESS_MAIN(StorageTest)
#include "storagetest.moc"
