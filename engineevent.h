#ifndef ENGINEEVENT_H
#define ENGINEEVENT_H

#include <QCoreApplication>
#include <QString>
#include <QUrl>

class NavigableView;

// Everything the rendering engine reports back to the shell.
struct EngineEvent
{
    Q_DECLARE_TR_FUNCTIONS(EngineEvent)

public:
    enum Type {
        UrlChanged,
        TitleChanged,
        IconChanged,
        LoadStarted,
        LoadProgress,
        NavigationFinished,
        LoadFailed,
        HistoryChanged,
        LinkHovered,
        DownloadRequested,
        DownloadProgress,
        DownloadFinished,
        DownloadCancelled,
        DownloadFailed
    };

    explicit EngineEvent(Type t = UrlChanged) : type(t) {}

    static EngineEvent urlChanged(const QUrl &url);
    static EngineEvent titleChanged(const QString &title);
    static EngineEvent loadStarted(const QUrl &url);
    static EngineEvent loadProgress(int percent);
    static EngineEvent loadFinished(const QUrl &url, bool ok);
    static EngineEvent linkHovered(const QString &link);
    static EngineEvent download(Type type, const QString &fileName,
                                qint64 bytesReceived = 0, qint64 bytesTotal = 0);

    // Status bar text, empty for events that do not produce one.
    QString statusText() const;
    // Milliseconds the status text stays visible, 0 keeps it until replaced.
    int statusTimeout() const;

    Type type;
    QUrl url;
    QString text;
    int progress = 0;
    qint64 bytesReceived = 0;
    qint64 bytesTotal = 0;
};

class EngineEventListener
{
public:
    virtual ~EngineEventListener() {}

    // source is null for profile-wide events such as downloads.
    virtual void handleEngineEvent(NavigableView *source, const EngineEvent &event) = 0;
};

#endif // ENGINEEVENT_H
