//
// Unit tests for QSettings-backed configuration
//

#include <gtest/gtest.h>
#include <QSettings>
#include <QTemporaryDir>
#include "browsersettings.h"

namespace {

class BrowserSettingsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_iniPath = m_dir.filePath(QStringLiteral("wayfarer.ini"));
    }

    QTemporaryDir m_dir;
    QString m_iniPath;
};

}

TEST_F(BrowserSettingsTest, EmptySettingsUseDefaults)
{
    QSettings settings(m_iniPath, QSettings::IniFormat);
    const BrowserSettings loaded = BrowserSettings::load(settings);
    const BrowserSettings defaults = BrowserSettings::defaults();

    EXPECT_EQ(loaded.homePage, QUrl(QStringLiteral("https://duckduckgo.com/")));
    EXPECT_EQ(loaded.searchBaseUrl, QStringLiteral("https://duckduckgo.com/?q="));
    EXPECT_EQ(loaded.bookmarksFile, defaults.bookmarksFile);
    EXPECT_TRUE(loaded.userAgent.isEmpty());
}

TEST_F(BrowserSettingsTest, DefaultBookmarksFileIsNamedBookmarksTxt)
{
    EXPECT_TRUE(BrowserSettings::defaultBookmarksFile().endsWith(QStringLiteral("/bookmarks.txt")));
}

TEST_F(BrowserSettingsTest, StoredValuesOverrideDefaults)
{
    QSettings settings(m_iniPath, QSettings::IniFormat);
    settings.setValue(QStringLiteral("general/homePage"), QStringLiteral("https://start.example/"));
    settings.setValue(QStringLiteral("search/baseUrl"), QStringLiteral("https://search.example/?s="));
    settings.setValue(QStringLiteral("bookmarks/file"), m_dir.filePath(QStringLiteral("marks.txt")));
    settings.setValue(QStringLiteral("network/userAgent"), QStringLiteral("TestAgent/2.0"));

    const BrowserSettings loaded = BrowserSettings::load(settings);

    EXPECT_EQ(loaded.homePage, QUrl(QStringLiteral("https://start.example/")));
    EXPECT_EQ(loaded.searchBaseUrl, QStringLiteral("https://search.example/?s="));
    EXPECT_EQ(loaded.bookmarksFile, m_dir.filePath(QStringLiteral("marks.txt")));
    EXPECT_EQ(loaded.userAgent, QStringLiteral("TestAgent/2.0"));
}

TEST_F(BrowserSettingsTest, BlankValuesFallBackToDefaults)
{
    QSettings settings(m_iniPath, QSettings::IniFormat);
    settings.setValue(QStringLiteral("general/homePage"), QString());
    settings.setValue(QStringLiteral("search/baseUrl"), QStringLiteral("   "));
    settings.setValue(QStringLiteral("bookmarks/file"), QString());

    const BrowserSettings loaded = BrowserSettings::load(settings);

    EXPECT_EQ(loaded.homePage, BrowserSettings::defaults().homePage);
    EXPECT_EQ(loaded.searchBaseUrl, BrowserSettings::defaults().searchBaseUrl);
    EXPECT_EQ(loaded.bookmarksFile, BrowserSettings::defaultBookmarksFile());
}
