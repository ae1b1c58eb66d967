#include "browser.h"
#include "browserwindow.h"
#include "logging.h"
#include <QSettings>
#include <QWebEngineProfile>

Browser::Browser()
    : m_settings(BrowserSettings::load(QSettings()))
    , m_bookmarks(m_settings.bookmarksFile)
    , m_profile(QWebEngineProfile::defaultProfile())
{
    if (m_settings.userAgent.isEmpty())
        m_profile->setHttpUserAgent(m_profile->httpUserAgent() + QStringLiteral(" Wayfarer/1.0"));
    else
        m_profile->setHttpUserAgent(m_settings.userAgent);

    QObject::connect(m_profile, &QWebEngineProfile::downloadRequested,
                     &m_downloadManager, &DownloadManager::handleDownloadRequested);
}

BrowserWindow *Browser::createWindow()
{
    auto mainWindow = new BrowserWindow(this, m_profile);
    m_downloadManager.setWindow(mainWindow);
    m_downloadManager.setEngineEventListener(mainWindow);
    QObject::connect(mainWindow, &QObject::destroyed, &m_downloadManager, [this]() {
        m_downloadManager.setEngineEventListener(nullptr);
    });
    qCDebug(lcBookmarks) << "bookmarks file" << m_bookmarks.filePath();
    mainWindow->show();
    return mainWindow;
}
