#ifndef NAVIGABLEVIEW_H
#define NAVIGABLEVIEW_H

#include <QIcon>
#include <QString>
#include <QUrl>

QT_BEGIN_NAMESPACE
class QWidget;
QT_END_NAMESPACE

class EngineEventListener;

// What the tab manager needs from a page view. Implementations report
// engine state changes to the registered listener as EngineEvents.
class NavigableView
{
public:
    enum Action {
        Back,
        Forward,
        Reload,
        Stop
    };

    virtual ~NavigableView() {}

    virtual QWidget *widget() = 0;

    virtual void load(const QUrl &url) = 0;
    virtual void goBack() = 0;
    virtual void goForward() = 0;
    virtual void stop() = 0;
    virtual void reload() = 0;

    virtual QUrl currentUrl() const = 0;
    virtual QString pageTitle() const = 0;
    virtual QIcon pageIcon() const = 0;
    virtual int loadPercent() const = 0;
    virtual bool canGoBack() const = 0;
    virtual bool canGoForward() const = 0;

    virtual qreal zoom() const = 0;
    virtual void setZoom(qreal factor) = 0;

    virtual void setEngineEventListener(EngineEventListener *listener) = 0;

    void trigger(Action action)
    {
        switch (action) {
        case Back: goBack(); break;
        case Forward: goForward(); break;
        case Reload: reload(); break;
        case Stop: stop(); break;
        }
    }
};

class ViewFactory
{
public:
    virtual ~ViewFactory() {}
    virtual NavigableView *createView(QWidget *parent) = 0;
};

#endif // NAVIGABLEVIEW_H
