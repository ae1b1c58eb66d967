#ifndef DOWNLOADMANAGER_H
#define DOWNLOADMANAGER_H

#include <QObject>
#include <QPointer>
#include <QWebEngineDownloadItem>
#include <QWidget>

struct EngineEvent;
class EngineEventListener;

// Asks where to save each download, reports progress to the listener and
// offers to open the file once it is complete.
class DownloadManager : public QObject
{
    Q_OBJECT

public:
    explicit DownloadManager(QObject *parent = nullptr);

    void setWindow(QWidget *window) { m_window = window; }
    void setEngineEventListener(EngineEventListener *listener) { m_listener = listener; }

public slots:
    void handleDownloadRequested(QWebEngineDownloadItem *download);

private:
    void handleDownloadFinished(QWebEngineDownloadItem *download);
    void notify(const EngineEvent &event);

    QPointer<QWidget> m_window;
    EngineEventListener *m_listener;
};

#endif // DOWNLOADMANAGER_H
