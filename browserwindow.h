#ifndef BROWSERWINDOW_H
#define BROWSERWINDOW_H

#include "addressresolver.h"
#include "engineevent.h"
#include "webview.h"
#include <QMainWindow>

QT_BEGIN_NAMESPACE
class QLineEdit;
class QProgressBar;
class QWebEngineProfile;
QT_END_NAMESPACE

class BookmarksDialog;
class Browser;
class TabWidget;

class BrowserWindow : public QMainWindow, public EngineEventListener
{
    Q_OBJECT

public:
    BrowserWindow(Browser *browser, QWebEngineProfile *profile);
    ~BrowserWindow();
    QSize sizeHint() const override;
    TabWidget *tabWidget() const;
    NavigableView *currentTab() const;

    // Download notifications from the profile.
    void handleEngineEvent(NavigableView *source, const EngineEvent &event) override;

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void handleFileOpenTriggered();
    void handleAddressEntered();
    void handleSearchTriggered();
    void handleHomeTriggered();
    void handleAddBookmarkTriggered();
    void handleShowBookmarksTriggered();
    void handleWebViewLoadProgress(int);
    void handleWebViewTitleChanged(const QString &title);
    void handleNavigationStateChanged(bool canGoBack, bool canGoForward);

private:
    QMenu *createFileMenu(TabWidget *tabWidget);
    QMenu *createViewMenu();
    QMenu *createBookmarksMenu();
    QMenu *createWindowMenu(TabWidget *tabWidget);
    QMenu *createHelpMenu();
    QToolBar *createToolBar();
    void readSettings();
    void writeSettings();

private:
    Browser *m_browser;
    AddressResolver m_resolver;
    WebViewFactory m_viewFactory;
    TabWidget *m_tabWidget;
    BookmarksDialog *m_bookmarksDialog;
    QProgressBar *m_progressBar;
    QAction *m_historyBackAction;
    QAction *m_historyForwardAction;
    QAction *m_stopReloadAction;
    QAction *m_homeAction;
    QAction *m_newTabAction;
    QAction *m_searchAction;
    QAction *m_addBookmarkAction;
    QAction *m_showBookmarksAction;
    QLineEdit *m_urlLineEdit;
    QAction *m_favAction;
};

#endif // BROWSERWINDOW_H
