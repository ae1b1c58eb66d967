#include "engineevent.h"

EngineEvent EngineEvent::urlChanged(const QUrl &url)
{
    EngineEvent event(UrlChanged);
    event.url = url;
    return event;
}

EngineEvent EngineEvent::titleChanged(const QString &title)
{
    EngineEvent event(TitleChanged);
    event.text = title;
    return event;
}

EngineEvent EngineEvent::loadStarted(const QUrl &url)
{
    EngineEvent event(LoadStarted);
    event.url = url;
    return event;
}

EngineEvent EngineEvent::loadProgress(int percent)
{
    EngineEvent event(LoadProgress);
    event.progress = qBound(0, percent, 100);
    return event;
}

EngineEvent EngineEvent::loadFinished(const QUrl &url, bool ok)
{
    EngineEvent event(ok ? NavigationFinished : LoadFailed);
    event.url = url;
    event.progress = 100;
    return event;
}

EngineEvent EngineEvent::linkHovered(const QString &link)
{
    EngineEvent event(LinkHovered);
    event.text = link;
    return event;
}

EngineEvent EngineEvent::download(Type type, const QString &fileName,
                                  qint64 bytesReceived, qint64 bytesTotal)
{
    EngineEvent event(type);
    event.text = fileName;
    event.bytesReceived = bytesReceived;
    event.bytesTotal = bytesTotal;
    if (bytesTotal > 0)
        event.progress = int(qBound<qint64>(0, bytesReceived * 100 / bytesTotal, 100));
    return event;
}

QString EngineEvent::statusText() const
{
    switch (type) {
    case LoadStarted:
        return tr("Loading %1").arg(url.host().isEmpty() ? url.toDisplayString() : url.host());
    case LoadProgress:
        return tr("Loading... %1%").arg(progress);
    case NavigationFinished:
        return url.toDisplayString();
    case LoadFailed:
        return tr("Failed to load %1").arg(url.toDisplayString());
    case LinkHovered:
        return text;
    case DownloadRequested:
        return tr("Downloading: %1").arg(text);
    case DownloadProgress:
        if (bytesTotal > 0)
            return tr("Downloading: %1 (%2%)").arg(text).arg(progress);
        return tr("Downloading: %1 (%2 bytes)").arg(text).arg(bytesReceived);
    case DownloadFinished:
        return tr("Download complete: %1").arg(text);
    case DownloadCancelled:
        return tr("Download cancelled: %1").arg(text);
    case DownloadFailed:
        return tr("Download failed: %1").arg(text);
    case UrlChanged:
    case TitleChanged:
    case IconChanged:
    case HistoryChanged:
        break;
    }
    return QString();
}

int EngineEvent::statusTimeout() const
{
    switch (type) {
    case DownloadFinished:
    case DownloadCancelled:
    case DownloadFailed:
        return 3000;
    default:
        return 0;
    }
}
