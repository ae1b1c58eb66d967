#ifndef BROWSER_H
#define BROWSER_H

#include "bookmarkstore.h"
#include "browsersettings.h"
#include "downloadmanager.h"

QT_BEGIN_NAMESPACE
class QWebEngineProfile;
QT_END_NAMESPACE

class BrowserWindow;

class Browser
{
public:
    Browser();

    BrowserWindow *createWindow();

    const BrowserSettings &settings() const { return m_settings; }
    BookmarkStore *bookmarks() { return &m_bookmarks; }

private:
    BrowserSettings m_settings;
    BookmarkStore m_bookmarks;
    DownloadManager m_downloadManager;
    QWebEngineProfile *m_profile;
};

#endif // BROWSER_H
