#include "downloadmanager.h"
#include "engineevent.h"
#include "logging.h"
#include <QDesktopServices>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QMessageBox>
#include <QStandardPaths>
#include <QWebEngineDownloadItem>

namespace {

QString fileNameOf(const QWebEngineDownloadItem *download)
{
#if QT_VERSION >= QT_VERSION_CHECK(5, 14, 0)
    QString name = download->downloadFileName();
#else
    QString name = QFileInfo(download->path()).fileName();
#endif
    if (name.isEmpty())
        name = download->url().fileName();
    return name;
}

QString filePathOf(const QWebEngineDownloadItem *download)
{
#if QT_VERSION >= QT_VERSION_CHECK(5, 14, 0)
    return QDir(download->downloadDirectory()).filePath(download->downloadFileName());
#else
    return download->path();
#endif
}

}

DownloadManager::DownloadManager(QObject *parent)
    : QObject(parent)
    , m_listener(nullptr)
{
}

void DownloadManager::handleDownloadRequested(QWebEngineDownloadItem *download)
{
    const QString suggestedName = fileNameOf(download);
    const QString downloadDir = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    const QString path = QFileDialog::getSaveFileName(m_window, tr("Save File"),
                                                      QDir(downloadDir).filePath(suggestedName));
    if (path.isEmpty()) {
        download->cancel();
        qCDebug(lcDownloads) << "download declined" << download->url();
        notify(EngineEvent::download(EngineEvent::DownloadCancelled, suggestedName));
        return;
    }

#if QT_VERSION >= QT_VERSION_CHECK(5, 14, 0)
    const QFileInfo target(path);
    download->setDownloadDirectory(target.absolutePath());
    download->setDownloadFileName(target.fileName());
#else
    download->setPath(path);
#endif

    connect(download, &QWebEngineDownloadItem::downloadProgress, this,
            [this, download](qint64 bytesReceived, qint64 bytesTotal) {
        notify(EngineEvent::download(EngineEvent::DownloadProgress, fileNameOf(download),
                                     bytesReceived, bytesTotal));
    });
    connect(download, &QWebEngineDownloadItem::finished, this, [this, download]() {
        handleDownloadFinished(download);
    });

    download->accept();
    qCInfo(lcDownloads) << "downloading" << download->url() << "to" << path;
    notify(EngineEvent::download(EngineEvent::DownloadRequested, fileNameOf(download)));
}

void DownloadManager::handleDownloadFinished(QWebEngineDownloadItem *download)
{
    const QString name = fileNameOf(download);

    switch (download->state()) {
    case QWebEngineDownloadItem::DownloadCompleted: {
        const QString path = filePathOf(download);
        qCInfo(lcDownloads) << "download complete" << path;
        notify(EngineEvent::download(EngineEvent::DownloadFinished, name,
                                     download->receivedBytes(), download->totalBytes()));
        int ret = QMessageBox::question(m_window, tr("Download Complete"),
                                        tr("'%1' downloaded to:\n%2\n\nDo you want to open it?")
                                        .arg(name, QDir::toNativeSeparators(path)),
                                        QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
        if (ret == QMessageBox::Yes && !QDesktopServices::openUrl(QUrl::fromLocalFile(path))) {
            qCWarning(lcDownloads) << "no application to open" << path;
            QMessageBox::warning(m_window, tr("Download Complete"),
                                 tr("Could not open %1").arg(QDir::toNativeSeparators(path)));
        }
        break;
    }
    case QWebEngineDownloadItem::DownloadCancelled:
        qCInfo(lcDownloads) << "download cancelled" << download->url();
        notify(EngineEvent::download(EngineEvent::DownloadCancelled, name));
        break;
    default:
        qCWarning(lcDownloads) << "download failed" << download->url() << download->interruptReasonString();
        notify(EngineEvent::download(EngineEvent::DownloadFailed,
                                     tr("%1 (%2)").arg(name, download->interruptReasonString())));
        break;
    }
}

void DownloadManager::notify(const EngineEvent &event)
{
    if (m_listener)
        m_listener->handleEngineEvent(nullptr, event);
}
