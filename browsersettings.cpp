#include "browsersettings.h"
#include "logging.h"
#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace {

const char HomePageKey[] = "general/homePage";
const char SearchBaseUrlKey[] = "search/baseUrl";
const char BookmarksFileKey[] = "bookmarks/file";
const char UserAgentKey[] = "network/userAgent";

}

BrowserSettings BrowserSettings::defaults()
{
    BrowserSettings settings;
    settings.homePage = QUrl(QStringLiteral("https://duckduckgo.com/"));
    settings.searchBaseUrl = QStringLiteral("https://duckduckgo.com/?q=");
    settings.bookmarksFile = defaultBookmarksFile();
    return settings;
}

BrowserSettings BrowserSettings::load(const QSettings &settings)
{
    BrowserSettings result = defaults();

    const QUrl homePage = QUrl::fromUserInput(settings.value(HomePageKey).toString());
    if (homePage.isValid())
        result.homePage = homePage;

    const QString searchBaseUrl = settings.value(SearchBaseUrlKey).toString().trimmed();
    if (!searchBaseUrl.isEmpty())
        result.searchBaseUrl = searchBaseUrl;

    const QString bookmarksFile = settings.value(BookmarksFileKey).toString().trimmed();
    if (!bookmarksFile.isEmpty())
        result.bookmarksFile = bookmarksFile;

    result.userAgent = settings.value(UserAgentKey).toString().trimmed();

    qCDebug(lcSettings) << "home page" << result.homePage
                        << "search" << result.searchBaseUrl
                        << "bookmarks" << result.bookmarksFile;
    return result;
}

QString BrowserSettings::defaultBookmarksFile()
{
    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dataDir.isEmpty())
        dataDir = QDir::homePath() + QStringLiteral("/.wayfarer");
    return QDir(dataDir).filePath(QStringLiteral("bookmarks.txt"));
}
