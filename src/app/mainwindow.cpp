#include "mainwindow.h"

#include <KActionCollection>
#include <KConfigGroup>
#include <KLocalizedString>
#include <KRecentFilesAction>
#include <KSharedConfig>
#include <KStandardAction>
#include <KToolBar>

#include "blinkreadersettings.h"
#include "controlbar.h"
#include "framedriver.h"
#include "homeview.h"
#include "newtabdialog.h"
#include "notificationbus.h"
#include "preferencesdialog.h"
#include "readertab.h"
#include "storagebackend.h"
#include "taborder.h"
#include "tabregistry.h"
#include "tabsession.h"
#include "worddisplaymodel.h"
#include "wordsmanager.h"
#include "wordview.h"

#include <QAction>
#include <QApplication>
#include <QCloseEvent>
#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QFontDatabase>
#include <QLabel>
#include <QSignalBlocker>
#include <QStackedWidget>
#include <QStatusBar>
#include <QStyle>
#include <QTabBar>
#include <QVBoxLayout>

MainWindow::MainWindow(QWidget *parent)
    : KXmlGuiWindow(parent)
{
    setAttribute(Qt::WA_DeleteOnClose, false);

    auto *settings = BlinkReaderSettings::self();

    // Storage location is fixed for the lifetime of the window
    const auto kind = settings->storageBackend() == BlinkReaderSettings::EnumStorageBackend::ConfigFile
        ? StorageBackend::ConfigFile
        : StorageBackend::Files;
    m_storage = StorageBackend::create(kind);

    m_fonts.setFamilies(QFontDatabase::families());
    m_fonts.setDefaultFamily(settings->defaultFontFamily());

    // Reading engine. Construction order is the order in which the bus
    // listeners run: registry (fonts), state machine (timer), display.
    m_bus = new NotificationBus(this);
    m_registry = new TabRegistry(m_bus, m_storage.get(), &m_parsers, this);
    m_registry->setFontCatalog(&m_fonts);
    m_reader = new ReadingStateMachine(m_registry, m_bus, this);
    m_display = new WordDisplayModel(m_registry, m_bus, this);
    m_frames = new FrameDriver(this);
    m_session = new TabSession(m_registry, this);

    // Central widget: tab bar over a stack of home page / reader page
    auto *central = new QWidget(this);
    auto *centralLayout = new QVBoxLayout(central);
    centralLayout->setContentsMargins(0, 0, 0, 0);
    centralLayout->setSpacing(0);

    m_tabBar = new QTabBar(central);
    m_tabBar->setTabsClosable(true);
    m_tabBar->setMovable(false);
    m_tabBar->setDocumentMode(true);
    m_tabBar->setExpanding(false);
    m_tabBar->setFocusPolicy(Qt::NoFocus);
    centralLayout->addWidget(m_tabBar);

    m_stack = new QStackedWidget(central);
    centralLayout->addWidget(m_stack, 1);

    m_homeView = new HomeView(m_stack);
    m_homeView->setSupportedExtensions(m_parsers.supportedExtensions());
    m_stack->addWidget(m_homeView);

    m_readerPage = new QWidget(m_stack);
    auto *readerLayout = new QVBoxLayout(m_readerPage);
    readerLayout->setContentsMargins(0, 0, 0, 0);
    m_wordView = new WordView(m_display, m_readerPage);
    m_wordView->setPlaceholderText(i18n("This tab has no words to show."));
    readerLayout->addWidget(m_wordView, 1);
    m_controlBar = new ControlBar(m_readerPage);
    m_controlBar->setFontFamilies(m_fonts.families());
    readerLayout->addWidget(m_controlBar);
    m_stack->addWidget(m_readerPage);

    setCentralWidget(central);

    connect(m_tabBar, &QTabBar::currentChanged, this, &MainWindow::onTabBarCurrentChanged);
    connect(m_tabBar, &QTabBar::tabCloseRequested, this, &MainWindow::onTabBarCloseRequested);
    connect(m_homeView, &HomeView::newTabRequested, this, &MainWindow::onNewTab);
    connect(m_homeView, &HomeView::openFileRequested, this, &MainWindow::onFileOpen);

    connect(m_registry, &TabRegistry::tabAdded, this, &MainWindow::onTabAdded);
    connect(m_registry, &TabRegistry::tabRemoved, this, &MainWindow::onTabRemoved);
    connect(m_registry, &TabRegistry::activeTabChanged, this, &MainWindow::onActiveTabChanged);
    connect(m_registry, &TabRegistry::loadStarted, this, &MainWindow::onLoadStarted);
    connect(m_registry, &TabRegistry::loadCancelled, this, &MainWindow::onLoadCancelled);
    connect(m_registry, &TabRegistry::tabCreationFailed, this, &MainWindow::onTabCreationFailed);
    connect(m_registry, &TabRegistry::tabWpmChanged, this, [this](TabId id, int wpm) {
        if (id == m_registry->activeTabId())
            m_controlBar->setWpm(wpm);
    });
    connect(m_registry, &TabRegistry::tabFontApplied, this, [this](TabId id, const FontSettings &font) {
        if (id == m_registry->activeTabId())
            m_controlBar->setFontSettings(font);
    });

    connect(m_bus, &NotificationBus::wordChanged, this, &MainWindow::updateProgress);
    connect(m_reader, &ReadingStateMachine::stateChanged, this, &MainWindow::onReaderStateChanged);
    connect(m_frames, &FrameDriver::frame, m_reader, &ReadingStateMachine::tick);

    connect(m_controlBar, &ControlBar::wpmEdited, this, [this](int wpm) {
        m_registry->setWpm(m_registry->activeTabId(), wpm);
    });
    connect(m_controlBar, &ControlBar::fontEdited, this, [this](const FontSettings &font) {
        m_registry->requestFontChange(m_registry->activeTabId(), font);
    });

    setupActions();

    m_filePathLabel = new QLabel;
    m_filePathLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    statusBar()->addWidget(m_filePathLabel, 1);

    applySettings();

    m_registry->createTab(TabCreateRequest::home());
    onReaderStateChanged(m_reader->state());

    setMinimumSize(640, 360);
    resize(1000, 600);
}

MainWindow::~MainWindow()
{
    // Tabs and pending loads reference the storage and parsers
    delete m_session;
    delete m_display;
    delete m_reader;
    delete m_registry;
}

void MainWindow::restoreSession()
{
    const int restored = m_session->restore();
    qDebug() << "MainWindow: restored" << restored << "tabs";
    m_session->startAutosave();
}

void MainWindow::openFile(const QString &filePath)
{
    const QString absolute = QFileInfo(filePath).absoluteFilePath();
    if (m_recentFilesAction)
        m_recentFilesAction->addUrl(QUrl::fromLocalFile(absolute));
    m_registry->requestTab(TabCreateRequest::fromFile(absolute));
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    m_session->stopAutosave();
    m_session->save();

    KConfigGroup recentGroup(KSharedConfig::openConfig(),
                             QStringLiteral("RecentFiles"));
    if (m_recentFilesAction)
        m_recentFilesAction->saveEntries(recentGroup);

    KXmlGuiWindow::closeEvent(event);
}

void MainWindow::setupActions()
{
    KActionCollection *ac = actionCollection();

    // Standard actions
    KStandardAction::quit(this, &QWidget::close, ac);
    KStandardAction::preferences(this, &MainWindow::showPreferences, ac);
    KStandardAction::open(this, &MainWindow::onFileOpen, ac);
    m_closeTabAction = KStandardAction::close(this, &MainWindow::onCloseTab, ac);

    m_recentFilesAction = KStandardAction::openRecent(
        this, &MainWindow::onFileOpenRecent, ac);
    KConfigGroup recentGroup(KSharedConfig::openConfig(),
                             QStringLiteral("RecentFiles"));
    m_recentFilesAction->loadEntries(recentGroup);

    // Tabs
    auto *newTab = ac->addAction(QStringLiteral("tab_new"));
    newTab->setText(i18n("&New Tab..."));
    newTab->setIcon(QIcon::fromTheme(QStringLiteral("tab-new")));
    ac->setDefaultShortcut(newTab, QKeySequence(Qt::CTRL | Qt::Key_T));
    connect(newTab, &QAction::triggered, this, &MainWindow::onNewTab);

    auto *nextTab = ac->addAction(QStringLiteral("tab_next"));
    nextTab->setText(i18n("Ne&xt Tab"));
    nextTab->setIcon(QIcon::fromTheme(QStringLiteral("go-next-view")));
    ac->setDefaultShortcut(nextTab, QKeySequence(Qt::CTRL | Qt::Key_Tab));
    connect(nextTab, &QAction::triggered, this, [this]() {
        const TabId next = m_registry->order()->nextOf(m_registry->activeTabId());
        if (next != InvalidTabId)
            m_registry->selectTab(next);
    });

    auto *previousTab = ac->addAction(QStringLiteral("tab_previous"));
    previousTab->setText(i18n("Pre&vious Tab"));
    previousTab->setIcon(QIcon::fromTheme(QStringLiteral("go-previous-view")));
    ac->setDefaultShortcut(previousTab, QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_Tab));
    connect(previousTab, &QAction::triggered, this, [this]() {
        const TabId previous = m_registry->order()->previousOf(m_registry->activeTabId());
        if (previous != InvalidTabId)
            m_registry->selectTab(previous);
    });

    // Reader > transport
    m_playPauseAction = addReaderAction(QStringLiteral("reader_play_pause"), i18n("&Play"),
                                        QStringLiteral("media-playback-start"),
                                        QKeySequence(Qt::Key_Space), ReaderCommand::TogglePlayPause);
    addReaderAction(QStringLiteral("reader_stop"), i18n("&Stop"),
                    QStringLiteral("media-playback-stop"),
                    QKeySequence(Qt::Key_Escape), ReaderCommand::Stop);
    addReaderAction(QStringLiteral("reader_restart"), i18n("&Restart"),
                    QStringLiteral("media-skip-backward"),
                    QKeySequence(Qt::Key_R), ReaderCommand::Restart);
    addReaderAction(QStringLiteral("reader_skip_backward"), i18n("Skip &Back"),
                    QStringLiteral("media-seek-backward"),
                    QKeySequence(Qt::Key_Left), ReaderCommand::SkipBackward);
    addReaderAction(QStringLiteral("reader_skip_forward"), i18n("Skip &Forward"),
                    QStringLiteral("media-seek-forward"),
                    QKeySequence(Qt::Key_Right), ReaderCommand::SkipForward);
    addReaderAction(QStringLiteral("reader_speed_up"), i18n("Speed &Up"),
                    QStringLiteral("go-up"),
                    QKeySequence(Qt::Key_Up), ReaderCommand::IncreaseSpeed);
    addReaderAction(QStringLiteral("reader_slow_down"), i18n("Slow &Down"),
                    QStringLiteral("go-down"),
                    QKeySequence(Qt::Key_Down), ReaderCommand::DecreaseSpeed);

    m_controlBar->setActions(m_readerActions);

    setupGUI(Default, QStringLiteral("blinkreaderui.rc"));

    toolBar()->setToolButtonStyle(Qt::ToolButtonTextBesideIcon);
}

QAction *MainWindow::addReaderAction(const QString &name, const QString &text,
                                     const QString &icon, const QKeySequence &shortcut,
                                     ReaderCommand command)
{
    KActionCollection *ac = actionCollection();
    auto *action = ac->addAction(name);
    action->setText(text);
    action->setIcon(QIcon::fromTheme(icon));
    action->setPriority(QAction::LowPriority);
    ac->setDefaultShortcut(action, shortcut);
    connect(action, &QAction::triggered, this, [this, command]() {
        m_reader->execute(command);
    });
    m_readerActions.append(action);
    return action;
}

void MainWindow::onNewTab()
{
    NewTabDialog dialog(m_parsers.nameFilter(), this);
    if (dialog.exec() != QDialog::Accepted)
        return;

    if (!dialog.filePath().isEmpty()) {
        openFile(dialog.filePath());
        return;
    }
    m_registry->createTab(TabCreateRequest::fromText(dialog.text(), dialog.tabName()));
}

void MainWindow::onFileOpen()
{
    const QString path = QFileDialog::getOpenFileName(
        this,
        i18n("Open File"),
        QDir::homePath(),
        m_parsers.nameFilter());

    if (!path.isEmpty())
        openFile(path);
}

void MainWindow::onFileOpenRecent(const QUrl &url)
{
    if (url.isLocalFile())
        openFile(url.toLocalFile());
}

void MainWindow::onCloseTab()
{
    m_registry->closeTab(m_registry->activeTabId());
}

void MainWindow::onTabBarCloseRequested(int index)
{
    m_registry->closeTab(tabBarId(index));
}

void MainWindow::onTabBarCurrentChanged(int index)
{
    const TabId id = tabBarId(index);
    if (m_registry->tab(id)) {
        m_registry->selectTab(id);
        return;
    }

    // Loading placeholders cannot be selected
    const QSignalBlocker blocker(m_tabBar);
    m_tabBar->setCurrentIndex(tabBarIndex(m_registry->activeTabId()));
}

void MainWindow::onTabAdded(TabId id)
{
    const ReaderTab *tab = m_registry->tab(id);
    if (!tab)
        return;

    const QSignalBlocker blocker(m_tabBar);

    // Replace the loading placeholder, if any
    const int placeholder = tabBarIndex(id);
    if (placeholder >= 0)
        m_tabBar->removeTab(placeholder);

    const int index = m_tabBar->insertTab(m_registry->order()->indexOf(id), tab->name());
    m_tabBar->setTabData(index, QVariant::fromValue(id));
    m_tabBar->setTabToolTip(index, tab->sourcePath());
    if (!tab->isReader()) {
        m_tabBar->setTabIcon(index, QIcon::fromTheme(QStringLiteral("go-home")));
        hideCloseButton(index);
    }

    m_tabBar->setCurrentIndex(tabBarIndex(m_registry->activeTabId()));
}

void MainWindow::onTabRemoved(TabId id)
{
    const int index = tabBarIndex(id);
    if (index < 0)
        return;
    const QSignalBlocker blocker(m_tabBar);
    m_tabBar->removeTab(index);
}

void MainWindow::onActiveTabChanged(TabId id)
{
    {
        const QSignalBlocker blocker(m_tabBar);
        m_tabBar->setCurrentIndex(tabBarIndex(id));
    }

    const ReaderTab *tab = m_registry->tab(id);
    const bool isReader = tab && tab->isReader();
    m_stack->setCurrentWidget(isReader ? m_readerPage : static_cast<QWidget *>(m_homeView));
    m_controlBar->setReaderEnabled(isReader);

    if (isReader) {
        m_controlBar->setWpm(tab->wpm());
        m_controlBar->setFontSettings(tab->font());
        m_filePathLabel->setText(tab->sourcePath());
        m_wordView->setFocus();
    } else {
        m_filePathLabel->clear();
    }
    setCaption(tab ? tab->name() : QString());

    updateProgress();
    updateActions();
}

void MainWindow::onLoadStarted(TabId id, const QString &name)
{
    const QSignalBlocker blocker(m_tabBar);
    const int index = m_tabBar->addTab(QIcon::fromTheme(QStringLiteral("view-refresh")),
                                       i18n("%1 (loading)", name));
    m_tabBar->setTabData(index, QVariant::fromValue(id));
    statusBar()->showMessage(i18n("Loading %1...", name), 3000);
}

void MainWindow::onLoadCancelled(TabId id)
{
    onTabRemoved(id);
    statusBar()->showMessage(i18n("Loading cancelled"), 3000);
}

void MainWindow::onTabCreationFailed(TabId id, const ParseError &error)
{
    onTabRemoved(id);
    statusBar()->showMessage(error.message(), 5000);
}

void MainWindow::onReaderStateChanged(ReadingStateMachine::State state)
{
    m_controlBar->setState(state);

    const bool playing = state == ReadingStateMachine::State::Playing;
    m_playPauseAction->setText(playing ? i18n("&Pause") : i18n("&Play"));
    m_playPauseAction->setIcon(QIcon::fromTheme(playing
        ? QStringLiteral("media-playback-pause")
        : QStringLiteral("media-playback-start")));

    if (playing)
        m_frames->start();
    else
        m_frames->stop();
}

void MainWindow::showPreferences()
{
    if (KConfigDialog::showDialog(QStringLiteral("settings")))
        return;

    auto *dialog = new BlinkReaderConfigDialog(this, m_fonts.families());
    dialog->setAttribute(Qt::WA_DeleteOnClose);
    connect(dialog, &KConfigDialog::settingsChanged,
            this, &MainWindow::applySettings);
    dialog->show();
}

void MainWindow::applySettings()
{
    auto *settings = BlinkReaderSettings::self();

    ReaderLimits limits;
    limits.defaultWpm = settings->defaultWpm();
    limits.minWpm = settings->minWpm();
    limits.maxWpm = settings->maxWpm();
    limits.wpmStep = settings->wpmStep();
    limits.skipAmount = settings->skipAmount();
    limits.defaultFontSize = settings->defaultFontSize();

    m_registry->setLimits(limits);
    m_reader->setLimits(limits);
    m_controlBar->setLimits(limits);

    m_fonts.setDefaultFamily(settings->defaultFontFamily());
    m_frames->setInterval(settings->frameInterval());
    m_session->setAutosaveInterval(settings->autosaveInterval());

    if (const ReaderTab *tab = m_registry->activeTab()) {
        if (tab->isReader())
            m_controlBar->setWpm(tab->wpm());
    }
}

void MainWindow::updateProgress()
{
    const WordsManager *words = m_registry->activeWords();
    if (words && words->hasWords())
        m_controlBar->setProgress(words->position() + 1, words->count());
    else
        m_controlBar->setProgress(0, 0);
}

void MainWindow::updateActions()
{
    const WordsManager *words = m_registry->activeWords();
    const bool enabled = words && words->hasWords();
    for (QAction *action : std::as_const(m_readerActions))
        action->setEnabled(enabled);

    const ReaderTab *active = m_registry->activeTab();
    m_closeTabAction->setEnabled(active && active->isReader());
}

int MainWindow::tabBarIndex(TabId id) const
{
    for (int i = 0; i < m_tabBar->count(); ++i) {
        if (m_tabBar->tabData(i).value<TabId>() == id)
            return i;
    }
    return -1;
}

TabId MainWindow::tabBarId(int index) const
{
    if (index < 0 || index >= m_tabBar->count())
        return InvalidTabId;
    return m_tabBar->tabData(index).value<TabId>();
}

void MainWindow::hideCloseButton(int index)
{
    const auto side = static_cast<QTabBar::ButtonPosition>(
        m_tabBar->style()->styleHint(QStyle::SH_TabBar_CloseButtonPosition, nullptr, m_tabBar));
    m_tabBar->setTabButton(index, side, nullptr);
}
