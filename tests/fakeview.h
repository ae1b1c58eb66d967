//
// Engine-free NavigableView for exercising the tab manager.
//

#ifndef FAKEVIEW_H
#define FAKEVIEW_H

#include "engineevent.h"
#include "navigableview.h"
#include <QList>
#include <QPointer>
#include <QWidget>

class FakeView : public QWidget, public NavigableView
{
public:
    explicit FakeView(QWidget *parent = nullptr) : QWidget(parent) {}

    QWidget *widget() override { return this; }

    void load(const QUrl &url) override
    {
        loads.append(url);
        url_ = url;
    }
    void goBack() override { ++backCount; }
    void goForward() override { ++forwardCount; }
    void stop() override { ++stopCount; }
    void reload() override { ++reloadCount; }

    QUrl currentUrl() const override { return url_; }
    QString pageTitle() const override { return title; }
    QIcon pageIcon() const override { return QIcon(); }
    int loadPercent() const override { return progress; }
    bool canGoBack() const override { return back; }
    bool canGoForward() const override { return forward; }

    qreal zoom() const override { return zoomFactor; }
    void setZoom(qreal factor) override { zoomFactor = factor; }

    void setEngineEventListener(EngineEventListener *l) override { listener = l; }

    void send(const EngineEvent &event)
    {
        if (listener)
            listener->handleEngineEvent(this, event);
    }

    QList<QUrl> loads;
    QUrl url_;
    QString title;
    int progress = 100;
    bool back = false;
    bool forward = false;
    qreal zoomFactor = 1.0;
    int backCount = 0;
    int forwardCount = 0;
    int stopCount = 0;
    int reloadCount = 0;
    EngineEventListener *listener = nullptr;
};

class FakeViewFactory : public ViewFactory
{
public:
    NavigableView *createView(QWidget *parent) override
    {
        FakeView *view = new FakeView(parent);
        created.append(view);
        return view;
    }

    FakeView *last() const { return created.isEmpty() ? nullptr : created.last().data(); }

    QList<QPointer<FakeView>> created;
};

#endif // FAKEVIEW_H
