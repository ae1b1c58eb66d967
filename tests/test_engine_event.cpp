//
// Unit tests for engine event construction and status text
//

#include <gtest/gtest.h>
#include "engineevent.h"

TEST(EngineEvent, LoadFinishedMapsSuccessToEventType)
{
    const QUrl url(QStringLiteral("https://example.com/"));
    EXPECT_EQ(EngineEvent::loadFinished(url, true).type, EngineEvent::NavigationFinished);
    EXPECT_EQ(EngineEvent::loadFinished(url, false).type, EngineEvent::LoadFailed);
    EXPECT_EQ(EngineEvent::loadFinished(url, true).statusText(), QStringLiteral("https://example.com/"));
}

TEST(EngineEvent, LoadProgressIsClamped)
{
    EXPECT_EQ(EngineEvent::loadProgress(-5).progress, 0);
    EXPECT_EQ(EngineEvent::loadProgress(140).progress, 100);
    EXPECT_EQ(EngineEvent::loadProgress(37).statusText(), QStringLiteral("Loading... 37%"));
}

TEST(EngineEvent, LoadStartedFallsBackToFullUrlWithoutHost)
{
    const EngineEvent event = EngineEvent::loadStarted(QUrl(QStringLiteral("about:blank")));
    EXPECT_EQ(event.statusText(), QStringLiteral("Loading about:blank"));
}

TEST(EngineEvent, PageStateEventsHaveNoStatusText)
{
    EXPECT_TRUE(EngineEvent::urlChanged(QUrl(QStringLiteral("https://a.example"))).statusText().isEmpty());
    EXPECT_TRUE(EngineEvent::titleChanged(QStringLiteral("A")).statusText().isEmpty());
    EXPECT_TRUE(EngineEvent(EngineEvent::IconChanged).statusText().isEmpty());
    EXPECT_TRUE(EngineEvent(EngineEvent::HistoryChanged).statusText().isEmpty());
}

TEST(EngineEvent, LinkHoverShowsLink)
{
    EXPECT_EQ(EngineEvent::linkHovered(QStringLiteral("https://b.example")).statusText(),
              QStringLiteral("https://b.example"));
}

TEST(EngineEvent, DownloadProgressReportsPercentWhenSizeKnown)
{
    const EngineEvent known = EngineEvent::download(EngineEvent::DownloadProgress,
                                                    QStringLiteral("file.zip"), 250, 1000);
    EXPECT_EQ(known.progress, 25);
    EXPECT_EQ(known.statusText(), QStringLiteral("Downloading: file.zip (25%)"));

    const EngineEvent unknown = EngineEvent::download(EngineEvent::DownloadProgress,
                                                      QStringLiteral("file.zip"), 512, -1);
    EXPECT_EQ(unknown.statusText(), QStringLiteral("Downloading: file.zip (512 bytes)"));
}

TEST(EngineEvent, DownloadOutcomesAreTransient)
{
    const QString name = QStringLiteral("report.pdf");
    const EngineEvent requested = EngineEvent::download(EngineEvent::DownloadRequested, name);
    const EngineEvent finished = EngineEvent::download(EngineEvent::DownloadFinished, name);
    const EngineEvent cancelled = EngineEvent::download(EngineEvent::DownloadCancelled, name);
    const EngineEvent failed = EngineEvent::download(EngineEvent::DownloadFailed, name);

    EXPECT_EQ(requested.statusText(), QStringLiteral("Downloading: report.pdf"));
    EXPECT_EQ(requested.statusTimeout(), 0);
    EXPECT_EQ(finished.statusText(), QStringLiteral("Download complete: report.pdf"));
    EXPECT_EQ(finished.statusTimeout(), 3000);
    EXPECT_EQ(cancelled.statusText(), QStringLiteral("Download cancelled: report.pdf"));
    EXPECT_EQ(cancelled.statusTimeout(), 3000);
    EXPECT_EQ(failed.statusText(), QStringLiteral("Download failed: report.pdf"));
    EXPECT_EQ(failed.statusTimeout(), 3000);
}
