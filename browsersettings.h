#ifndef BROWSERSETTINGS_H
#define BROWSERSETTINGS_H

#include <QString>
#include <QUrl>

QT_BEGIN_NAMESPACE
class QSettings;
QT_END_NAMESPACE

struct BrowserSettings
{
    QUrl homePage;
    QString searchBaseUrl;
    QString bookmarksFile;
    // Empty means the engine default with the application token appended.
    QString userAgent;

    static BrowserSettings defaults();
    static BrowserSettings load(const QSettings &settings);
    static QString defaultBookmarksFile();
};

#endif // BROWSERSETTINGS_H
