#ifndef BLINKREADER_MAINWINDOW_H
#define BLINKREADER_MAINWINDOW_H

#include <KXmlGuiWindow>

#include <memory>

#include "fontcatalog.h"
#include "parseerror.h"
#include "readercommand.h"
#include "readingstatemachine.h"
#include "sourceparsers.h"
#include "tabid.h"

class QAction;
class QCloseEvent;
class QLabel;
class QStackedWidget;
class QTabBar;
class KRecentFilesAction;
class ControlBar;
class FrameDriver;
class HomeView;
class NotificationBus;
class StorageBackend;
class TabRegistry;
class TabSession;
class WordDisplayModel;
class WordView;

class MainWindow : public KXmlGuiWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

    /// Recreate the tabs of the previous run and start autosaving.
    void restoreSession();

    void openFile(const QString &filePath);

protected:
    void closeEvent(QCloseEvent *event) override;

private Q_SLOTS:
    void onNewTab();
    void onFileOpen();
    void onFileOpenRecent(const QUrl &url);
    void onCloseTab();
    void onTabBarCloseRequested(int index);
    void onTabBarCurrentChanged(int index);
    void onTabAdded(TabId id);
    void onTabRemoved(TabId id);
    void onActiveTabChanged(TabId id);
    void onLoadStarted(TabId id, const QString &name);
    void onLoadCancelled(TabId id);
    void onTabCreationFailed(TabId id, const ParseError &error);
    void onReaderStateChanged(ReadingStateMachine::State state);
    void showPreferences();
    void applySettings();

private:
    void setupActions();
    QAction *addReaderAction(const QString &name, const QString &text,
                             const QString &icon, const QKeySequence &shortcut,
                             ReaderCommand command);
    void updateProgress();
    void updateActions();
    int tabBarIndex(TabId id) const;
    TabId tabBarId(int index) const;
    void hideCloseButton(int index);

    SourceParsers m_parsers;
    std::unique_ptr<StorageBackend> m_storage;
    FontCatalog m_fonts;

    NotificationBus *m_bus = nullptr;
    TabRegistry *m_registry = nullptr;
    ReadingStateMachine *m_reader = nullptr;
    WordDisplayModel *m_display = nullptr;
    FrameDriver *m_frames = nullptr;
    TabSession *m_session = nullptr;

    QTabBar *m_tabBar = nullptr;
    QStackedWidget *m_stack = nullptr;
    HomeView *m_homeView = nullptr;
    QWidget *m_readerPage = nullptr;
    WordView *m_wordView = nullptr;
    ControlBar *m_controlBar = nullptr;
    QLabel *m_filePathLabel = nullptr;

    KRecentFilesAction *m_recentFilesAction = nullptr;
    QAction *m_playPauseAction = nullptr;
    QAction *m_closeTabAction = nullptr;
    QList<QAction *> m_readerActions;
};

#endif // BLINKREADER_MAINWINDOW_H
