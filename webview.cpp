#include "webview.h"
#include "browserwindow.h"
#include "tabwidget.h"
#include <QAction>
#include <QWebEngineHistory>
#include <QWebEngineProfile>

WebView::WebView(QWebEngineProfile *profile, QWidget *parent)
    : QWebEngineView(parent)
    , m_listener(nullptr)
    , m_loadProgress(100)
{
    setPage(new QWebEnginePage(profile, this));

    connect(this, &QWebEngineView::loadStarted, [this]() {
        m_loadProgress = 0;
        notify(EngineEvent::loadStarted(url()));
    });
    connect(this, &QWebEngineView::loadProgress, [this](int progress) {
        m_loadProgress = progress;
        notify(EngineEvent::loadProgress(progress));
    });
    connect(this, &QWebEngineView::loadFinished, [this](bool success) {
        m_loadProgress = 100;
        notify(EngineEvent::loadFinished(url(), success));
    });
    connect(this, &QWebEngineView::urlChanged, [this](const QUrl &url) {
        notify(EngineEvent::urlChanged(url));
        notify(EngineEvent(EngineEvent::HistoryChanged));
    });
    connect(this, &QWebEngineView::titleChanged, [this](const QString &title) {
        notify(EngineEvent::titleChanged(title));
    });
    connect(this, &QWebEngineView::iconChanged, [this]() {
        notify(EngineEvent(EngineEvent::IconChanged));
    });
    connect(page(), &QWebEnginePage::linkHovered, [this](const QString &url) {
        notify(EngineEvent::linkHovered(url));
    });
    connect(page()->action(QWebEnginePage::Back), &QAction::changed, [this]() {
        notify(EngineEvent(EngineEvent::HistoryChanged));
    });
    connect(page()->action(QWebEnginePage::Forward), &QAction::changed, [this]() {
        notify(EngineEvent(EngineEvent::HistoryChanged));
    });
    connect(page(), &QWebEnginePage::renderProcessTerminated,
            [this](QWebEnginePage::RenderProcessTerminationStatus status, int exitCode) {
        if (status == QWebEnginePage::NormalTerminationStatus)
            return;
        qWarning("Render process terminated with status %d, exit code %d", int(status), exitCode);
        m_loadProgress = 100;
        notify(EngineEvent::loadFinished(url(), false));
    });
}

void WebView::load(const QUrl &url)
{
    QWebEngineView::load(url);
}

void WebView::goBack()
{
    QWebEngineView::back();
}

void WebView::goForward()
{
    QWebEngineView::forward();
}

void WebView::stop()
{
    QWebEngineView::stop();
}

void WebView::reload()
{
    QWebEngineView::reload();
}

QUrl WebView::currentUrl() const
{
    return url();
}

QString WebView::pageTitle() const
{
    return title();
}

QIcon WebView::pageIcon() const
{
    return icon();
}

bool WebView::canGoBack() const
{
    return history()->canGoBack();
}

bool WebView::canGoForward() const
{
    return history()->canGoForward();
}

qreal WebView::zoom() const
{
    return zoomFactor();
}

void WebView::setZoom(qreal factor)
{
    setZoomFactor(qBound(qreal(0.25), factor, qreal(5.0)));
}

void WebView::notify(const EngineEvent &event)
{
    if (m_listener)
        m_listener->handleEngineEvent(this, event);
}

QWebEngineView *WebView::createWindow(QWebEnginePage::WebWindowType type)
{
    BrowserWindow *mainWindow = qobject_cast<BrowserWindow*>(window());
    if (!mainWindow)
        return nullptr;

    TabWidget *tabWidget = mainWindow->tabWidget();
    TabHandle handle = 0;
    switch (type) {
    case QWebEnginePage::WebBrowserBackgroundTab:
        handle = tabWidget->createTab(false);
        break;
    case QWebEnginePage::WebBrowserTab:
    case QWebEnginePage::WebBrowserWindow:
    case QWebEnginePage::WebDialog:
        handle = tabWidget->createTab(true);
        break;
    }
    NavigableView *view = tabWidget->view(handle);
    return view ? qobject_cast<WebView*>(view->widget()) : nullptr;
}

NavigableView *WebViewFactory::createView(QWidget *parent)
{
    return new WebView(m_profile, parent);
}
