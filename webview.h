#ifndef WEBVIEW_H
#define WEBVIEW_H

#include "engineevent.h"
#include "navigableview.h"
#include <QWebEnginePage>
#include <QWebEngineView>

QT_BEGIN_NAMESPACE
class QWebEngineProfile;
QT_END_NAMESPACE

class WebView : public QWebEngineView, public NavigableView
{
    Q_OBJECT

public:
    explicit WebView(QWebEngineProfile *profile, QWidget *parent = nullptr);

    QWidget *widget() override { return this; }

    void load(const QUrl &url) override;
    void goBack() override;
    void goForward() override;
    void stop() override;
    void reload() override;

    QUrl currentUrl() const override;
    QString pageTitle() const override;
    QIcon pageIcon() const override;
    int loadPercent() const override { return m_loadProgress; }
    bool canGoBack() const override;
    bool canGoForward() const override;

    qreal zoom() const override;
    void setZoom(qreal factor) override;

    void setEngineEventListener(EngineEventListener *listener) override { m_listener = listener; }

protected:
    QWebEngineView *createWindow(QWebEnginePage::WebWindowType type) override;

private:
    void notify(const EngineEvent &event);

    EngineEventListener *m_listener;
    int m_loadProgress;
};

class WebViewFactory : public ViewFactory
{
public:
    explicit WebViewFactory(QWebEngineProfile *profile) : m_profile(profile) {}

    NavigableView *createView(QWidget *parent) override;

private:
    QWebEngineProfile *m_profile;
};

#endif // WEBVIEW_H
