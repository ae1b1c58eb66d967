#include "browser.h"
#include "browserwindow.h"
#include "bookmarksdialog.h"
#include "bookmarkstore.h"
#include "tabwidget.h"
#include <QApplication>
#include <QCloseEvent>
#include <QFileDialog>
#include <QLineEdit>
#include <QMenuBar>
#include <QMessageBox>
#include <QProgressBar>
#include <QScreen>
#include <QSettings>
#include <QStatusBar>
#include <QToolBar>
#include <QVBoxLayout>

namespace {

// Toolbar buttons fall back to their text when the icon theme lacks the icon.
QAction *createThemedAction(const QString &iconName, const QString &text, QObject *parent)
{
    QAction *action = new QAction(QIcon::fromTheme(iconName), text, parent);
    action->setIconVisibleInMenu(false);
    return action;
}

}

BrowserWindow::BrowserWindow(Browser *browser, QWebEngineProfile *profile)
    : m_browser(browser)
    , m_resolver(browser->settings().searchBaseUrl)
    , m_viewFactory(profile)
    , m_tabWidget(new TabWidget(&m_viewFactory, this))
    , m_bookmarksDialog(new BookmarksDialog(browser->bookmarks(), this))
    , m_progressBar(new QProgressBar(this))
    , m_historyBackAction(nullptr)
    , m_historyForwardAction(nullptr)
    , m_stopReloadAction(nullptr)
    , m_homeAction(nullptr)
    , m_newTabAction(nullptr)
    , m_searchAction(nullptr)
    , m_addBookmarkAction(nullptr)
    , m_showBookmarksAction(nullptr)
    , m_urlLineEdit(nullptr)
    , m_favAction(nullptr)
{
    setAttribute(Qt::WA_DeleteOnClose, true);
    setFocusPolicy(Qt::ClickFocus);

    m_tabWidget->setHomePage(browser->settings().homePage);

    QToolBar *toolbar = createToolBar();
    addToolBar(toolbar);
    menuBar()->addMenu(createFileMenu(m_tabWidget));
    menuBar()->addMenu(createViewMenu());
    menuBar()->addMenu(createBookmarksMenu());
    menuBar()->addMenu(createWindowMenu(m_tabWidget));
    menuBar()->addMenu(createHelpMenu());

    QWidget *centralWidget = new QWidget(this);
    QVBoxLayout *layout = new QVBoxLayout;
    layout->setSpacing(0);
    layout->setContentsMargins(0, 0, 0, 0);
    addToolBarBreak();

    m_progressBar->setMaximumHeight(1);
    m_progressBar->setTextVisible(false);
    m_progressBar->setStyleSheet(QStringLiteral("QProgressBar {border: 0px} QProgressBar::chunk {background-color: #da4453}"));

    layout->addWidget(m_progressBar);
    layout->addWidget(m_tabWidget);
    centralWidget->setLayout(layout);
    setCentralWidget(centralWidget);

    connect(m_tabWidget, &TabWidget::titleChanged, this, &BrowserWindow::handleWebViewTitleChanged);
    connect(m_tabWidget, &TabWidget::linkHovered, [this](const QString &url) {
        statusBar()->showMessage(url);
    });
    connect(m_tabWidget, &TabWidget::statusMessage, statusBar(), &QStatusBar::showMessage);
    connect(m_tabWidget, &TabWidget::loadProgress, this, &BrowserWindow::handleWebViewLoadProgress);
    connect(m_tabWidget, &TabWidget::navigationStateChanged, this, &BrowserWindow::handleNavigationStateChanged);
    connect(m_tabWidget, &TabWidget::urlChanged, [this](const QUrl &url) {
        m_urlLineEdit->setText(url.toDisplayString());
        m_urlLineEdit->setCursorPosition(0);
    });
    connect(m_tabWidget, &TabWidget::iconChanged, m_favAction, &QAction::setIcon);
    connect(m_urlLineEdit, &QLineEdit::returnPressed, this, &BrowserWindow::handleAddressEntered);
    connect(m_bookmarksDialog, &BookmarksDialog::bookmarkActivated, [this](const QUrl &url) {
        m_tabWidget->openTab(ResolvedTarget(ResolvedTarget::Url, url.toString()));
    });

    QAction *focusUrlLineEditAction = new QAction(this);
    addAction(focusUrlLineEditAction);
    focusUrlLineEditAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_L));
    connect(focusUrlLineEditAction, &QAction::triggered, this, [this] () {
        m_urlLineEdit->setFocus(Qt::ShortcutFocusReason);
        m_urlLineEdit->selectAll();
    });

    handleWebViewTitleChanged(QString());
    statusBar()->showMessage(tr("Ready"));
    m_tabWidget->openHomeTab();

    readSettings();
}

BrowserWindow::~BrowserWindow()
{
    writeSettings();
}

QSize BrowserWindow::sizeHint() const
{
    QRect desktopRect = QApplication::primaryScreen()->geometry();
    QSize size = desktopRect.size() * qreal(0.9);
    return size;
}

QMenu *BrowserWindow::createFileMenu(TabWidget *tabWidget)
{
    QMenu *fileMenu = new QMenu(tr("&File"));
    fileMenu->addAction(m_newTabAction);
    fileMenu->addAction(tr("&Open File..."), this, &BrowserWindow::handleFileOpenTriggered, QKeySequence::Open);
    fileMenu->addSeparator();

    QAction *closeTabAction = new QAction(tr("&Close Tab"), this);
    closeTabAction->setShortcuts(QKeySequence::Close);
    connect(closeTabAction, &QAction::triggered, tabWidget, &TabWidget::closeCurrentTab);
    fileMenu->addAction(closeTabAction);

    QAction *closeAction = new QAction(tr("&Quit"), this);
    closeAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Q));
    connect(closeAction, &QAction::triggered, this, &QWidget::close);
    fileMenu->addAction(closeAction);
    return fileMenu;
}

QMenu *BrowserWindow::createViewMenu()
{
    QMenu *viewMenu = new QMenu(tr("&View"));
    QAction *stopAction = viewMenu->addAction(tr("&Stop"));
    QList<QKeySequence> shortcuts;
    shortcuts.append(QKeySequence(Qt::CTRL | Qt::Key_Period));
    shortcuts.append(Qt::Key_Escape);
    stopAction->setShortcuts(shortcuts);
    connect(stopAction, &QAction::triggered, [this]() {
        m_tabWidget->triggerAction(NavigableView::Stop);
    });

    QAction *reloadAction = viewMenu->addAction(tr("Reload Page"));
    reloadAction->setShortcuts(QKeySequence::Refresh);
    connect(reloadAction, &QAction::triggered, [this]() {
        m_tabWidget->triggerAction(NavigableView::Reload);
    });

    QAction *zoomIn = viewMenu->addAction(tr("Zoom &In"));
    zoomIn->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Plus));
    connect(zoomIn, &QAction::triggered, [this]() {
        if (currentTab())
            currentTab()->setZoom(currentTab()->zoom() + 0.1);
    });

    QAction *zoomOut = viewMenu->addAction(tr("Zoom &Out"));
    zoomOut->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_Minus));
    connect(zoomOut, &QAction::triggered, [this]() {
        if (currentTab())
            currentTab()->setZoom(currentTab()->zoom() - 0.1);
    });

    QAction *resetZoom = viewMenu->addAction(tr("Reset &Zoom"));
    resetZoom->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_0));
    connect(resetZoom, &QAction::triggered, [this]() {
        if (currentTab())
            currentTab()->setZoom(1.0);
    });

    viewMenu->addSeparator();
    QAction *viewStatusbarAction = new QAction(tr("Status Bar"), this);
    viewStatusbarAction->setCheckable(true);
    viewStatusbarAction->setChecked(true);
    connect(viewStatusbarAction, &QAction::toggled, statusBar(), &QStatusBar::setVisible);
    viewMenu->addAction(viewStatusbarAction);

    return viewMenu;
}

QMenu *BrowserWindow::createBookmarksMenu()
{
    QMenu *menu = new QMenu(tr("&Bookmarks"));
    menu->addAction(m_addBookmarkAction);
    menu->addAction(m_showBookmarksAction);
    return menu;
}

QMenu *BrowserWindow::createWindowMenu(TabWidget *tabWidget)
{
    QMenu *menu = new QMenu(tr("&Window"));

    QAction *nextTabAction = new QAction(tr("Show Next Tab"), this);
    QList<QKeySequence> shortcuts;
    shortcuts.append(QKeySequence(Qt::CTRL | Qt::Key_BraceRight));
    shortcuts.append(QKeySequence(Qt::CTRL | Qt::Key_PageDown));
    shortcuts.append(QKeySequence(Qt::CTRL | Qt::Key_BracketRight));
    shortcuts.append(QKeySequence(Qt::CTRL | Qt::Key_Less));
    nextTabAction->setShortcuts(shortcuts);
    connect(nextTabAction, &QAction::triggered, tabWidget, &TabWidget::nextTab);
    menu->addAction(nextTabAction);

    QAction *previousTabAction = new QAction(tr("Show Previous Tab"), this);
    shortcuts.clear();
    shortcuts.append(QKeySequence(Qt::CTRL | Qt::Key_BraceLeft));
    shortcuts.append(QKeySequence(Qt::CTRL | Qt::Key_PageUp));
    shortcuts.append(QKeySequence(Qt::CTRL | Qt::Key_BracketLeft));
    shortcuts.append(QKeySequence(Qt::CTRL | Qt::Key_Greater));
    previousTabAction->setShortcuts(shortcuts);
    connect(previousTabAction, &QAction::triggered, tabWidget, &TabWidget::previousTab);
    menu->addAction(previousTabAction);

    return menu;
}

QMenu *BrowserWindow::createHelpMenu()
{
    QMenu *helpMenu = new QMenu(tr("&Help"));
    helpMenu->addAction(tr("About &Qt"), qApp, QApplication::aboutQt);
    return helpMenu;
}

QToolBar *BrowserWindow::createToolBar()
{
    QToolBar *navigationBar = new QToolBar(tr("Navigation"));
    navigationBar->setMovable(false);
    navigationBar->toggleViewAction()->setEnabled(false);

    m_historyBackAction = createThemedAction(QStringLiteral("go-previous"), tr("Back"), this);
    QList<QKeySequence> backShortcuts = QKeySequence::keyBindings(QKeySequence::Back);
    for (auto it = backShortcuts.begin(); it != backShortcuts.end();) {
        // Chromium already handles navigate on backspace when appropriate.
        if ((*it)[0] == Qt::Key_Backspace)
            it = backShortcuts.erase(it);
        else
            ++it;
    }
    // For some reason Qt doesn't bind the dedicated Back key to Back.
    backShortcuts.append(QKeySequence(Qt::Key_Back));
    m_historyBackAction->setShortcuts(backShortcuts);
    m_historyBackAction->setToolTip(tr("Go back in history"));
    connect(m_historyBackAction, &QAction::triggered, [this]() {
        m_tabWidget->triggerAction(NavigableView::Back);
    });
    navigationBar->addAction(m_historyBackAction);

    m_historyForwardAction = createThemedAction(QStringLiteral("go-next"), tr("Forward"), this);
    QList<QKeySequence> fwdShortcuts = QKeySequence::keyBindings(QKeySequence::Forward);
    for (auto it = fwdShortcuts.begin(); it != fwdShortcuts.end();) {
        if (((*it)[0] & Qt::Key_unknown) == Qt::Key_Backspace)
            it = fwdShortcuts.erase(it);
        else
            ++it;
    }
    fwdShortcuts.append(QKeySequence(Qt::Key_Forward));
    m_historyForwardAction->setShortcuts(fwdShortcuts);
    m_historyForwardAction->setToolTip(tr("Go forward in history"));
    connect(m_historyForwardAction, &QAction::triggered, [this]() {
        m_tabWidget->triggerAction(NavigableView::Forward);
    });
    navigationBar->addAction(m_historyForwardAction);

    m_stopReloadAction = createThemedAction(QStringLiteral("view-refresh"), tr("Reload"), this);
    m_stopReloadAction->setData(NavigableView::Reload);
    connect(m_stopReloadAction, &QAction::triggered, [this]() {
        m_tabWidget->triggerAction(NavigableView::Action(m_stopReloadAction->data().toInt()));
    });
    navigationBar->addAction(m_stopReloadAction);

    m_homeAction = createThemedAction(QStringLiteral("go-home"), tr("Home"), this);
    m_homeAction->setToolTip(tr("Go to the home page"));
    connect(m_homeAction, &QAction::triggered, this, &BrowserWindow::handleHomeTriggered);
    navigationBar->addAction(m_homeAction);

    navigationBar->addSeparator();

    m_newTabAction = createThemedAction(QStringLiteral("tab-new"), tr("New &Tab"), this);
    m_newTabAction->setShortcuts(QKeySequence::AddTab);
    connect(m_newTabAction, &QAction::triggered, this, [this]() {
        m_tabWidget->openHomeTab();
        m_urlLineEdit->setFocus();
    });
    navigationBar->addAction(m_newTabAction);

    m_urlLineEdit = new QLineEdit(this);
    m_urlLineEdit->setPlaceholderText(tr("Search or enter address"));
    m_favAction = new QAction(this);
    m_urlLineEdit->addAction(m_favAction, QLineEdit::LeadingPosition);
    m_urlLineEdit->setClearButtonEnabled(true);
    navigationBar->addWidget(m_urlLineEdit);

    m_searchAction = createThemedAction(QStringLiteral("system-search"), tr("Search"), this);
    m_searchAction->setToolTip(tr("Search the web for the address bar text"));
    connect(m_searchAction, &QAction::triggered, this, &BrowserWindow::handleSearchTriggered);
    navigationBar->addAction(m_searchAction);

    navigationBar->addSeparator();

    m_addBookmarkAction = createThemedAction(QStringLiteral("bookmark-new"), tr("&Add Bookmark"), this);
    m_addBookmarkAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_D));
    connect(m_addBookmarkAction, &QAction::triggered, this, &BrowserWindow::handleAddBookmarkTriggered);
    navigationBar->addAction(m_addBookmarkAction);

    m_showBookmarksAction = createThemedAction(QStringLiteral("bookmarks-organize"), tr("&Manage Bookmarks..."), this);
    m_showBookmarksAction->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_O));
    connect(m_showBookmarksAction, &QAction::triggered, this, &BrowserWindow::handleShowBookmarksTriggered);
    navigationBar->addAction(m_showBookmarksAction);

    return navigationBar;
}

void BrowserWindow::handleNavigationStateChanged(bool canGoBack, bool canGoForward)
{
    m_historyBackAction->setEnabled(canGoBack);
    m_historyForwardAction->setEnabled(canGoForward);
}

void BrowserWindow::handleWebViewTitleChanged(const QString &title)
{
    QString suffix = tr("Wayfarer");

    if (title.isEmpty())
        setWindowTitle(suffix);
    else
        setWindowTitle(title + " - " + suffix);
}

void BrowserWindow::handleFileOpenTriggered()
{
    QUrl url = QFileDialog::getOpenFileUrl(this, tr("Open Web Resource"), QString(),
                                                tr("Web Resources (*.html *.htm *.svg *.png *.gif *.svgz);;All files (*.*)"));
    if (url.isEmpty())
        return;
    m_tabWidget->navigate(ResolvedTarget(ResolvedTarget::Url, url.toString()));
}

void BrowserWindow::handleAddressEntered()
{
    const ResolvedTarget target = m_resolver.resolve(m_urlLineEdit->text());
    if (target.isNull())
        return;
    m_tabWidget->navigate(target);
    if (currentTab())
        currentTab()->widget()->setFocus();
}

void BrowserWindow::handleSearchTriggered()
{
    const ResolvedTarget target = m_resolver.search(m_urlLineEdit->text());
    if (target.isNull())
        return;
    m_tabWidget->navigate(target);
}

void BrowserWindow::handleHomeTriggered()
{
    m_tabWidget->navigate(ResolvedTarget(ResolvedTarget::Url, m_tabWidget->homePage().toString()));
}

void BrowserWindow::handleAddBookmarkTriggered()
{
    const QUrl url = currentTab() ? currentTab()->currentUrl() : QUrl();
    BookmarkStore *store = m_browser->bookmarks();
    switch (store->addPage(url)) {
    case BookmarkStore::Added:
        statusBar()->showMessage(tr("Bookmarked %1").arg(url.toDisplayString()), 3000);
        break;
    case BookmarkStore::BlankPage:
        QMessageBox::warning(this, tr("Cannot Add Bookmark"),
                             tr("Cannot add a bookmark for a blank or invalid page."));
        break;
    case BookmarkStore::AlreadyBookmarked:
        QMessageBox::information(this, tr("Bookmark Exists"), tr("This URL is already bookmarked."));
        break;
    case BookmarkStore::Failed:
        QMessageBox::warning(this, tr("Add Bookmark"),
                             tr("Could not save the bookmark:\n%1").arg(store->errorString()));
        break;
    }
}

void BrowserWindow::handleShowBookmarksTriggered()
{
    m_bookmarksDialog->exec();
}

void BrowserWindow::handleEngineEvent(NavigableView *source, const EngineEvent &event)
{
    Q_UNUSED(source);
    const QString text = event.statusText();
    if (!text.isEmpty())
        statusBar()->showMessage(text, event.statusTimeout());
}

void BrowserWindow::closeEvent(QCloseEvent *event)
{
    if (m_tabWidget->count() > 1) {
        int ret = QMessageBox::warning(this, tr("Confirm close"),
                                       tr("Are you sure you want to close the window ?\n"
                                          "There are %1 tabs open.").arg(m_tabWidget->count()),
                                       QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
        if (ret == QMessageBox::No) {
            event->ignore();
            return;
        }
    }
    event->accept();
    deleteLater();
}

TabWidget *BrowserWindow::tabWidget() const
{
    return m_tabWidget;
}

NavigableView *BrowserWindow::currentTab() const
{
    return m_tabWidget->currentView();
}

void BrowserWindow::handleWebViewLoadProgress(int progress)
{
    static QIcon stopIcon(QIcon::fromTheme(QStringLiteral("process-stop")));
    static QIcon reloadIcon(QIcon::fromTheme(QStringLiteral("view-refresh")));

    if (0 < progress && progress < 100) {
        m_stopReloadAction->setData(NavigableView::Stop);
        m_stopReloadAction->setIcon(stopIcon);
        m_stopReloadAction->setText(tr("Stop"));
        m_stopReloadAction->setToolTip(tr("Stop loading the current page"));
        m_progressBar->setValue(progress);
    } else {
        m_stopReloadAction->setData(NavigableView::Reload);
        m_stopReloadAction->setIcon(reloadIcon);
        m_stopReloadAction->setText(tr("Reload"));
        m_stopReloadAction->setToolTip(tr("Reload the current page"));
        m_progressBar->setValue(0);
    }
}

void BrowserWindow::readSettings()
{
    QSettings settings;
    const QByteArray geometry = settings.value(QStringLiteral("window/geometry")).toByteArray();
    if (!geometry.isEmpty())
        restoreGeometry(geometry);
}

void BrowserWindow::writeSettings()
{
    QSettings settings;
    settings.setValue(QStringLiteral("window/geometry"), saveGeometry());
}
