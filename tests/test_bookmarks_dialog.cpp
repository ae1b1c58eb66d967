//
// Unit tests for the bookmarks dialog
//

#include <gtest/gtest.h>
#include <QListWidget>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "bookmarksdialog.h"
#include "bookmarkstore.h"

namespace {

class BookmarksDialogTest : public ::testing::Test
{
protected:
    BookmarksDialogTest()
        : store(dir.filePath(QStringLiteral("bookmarks.txt")))
    {
    }

    QTemporaryDir dir;
    BookmarkStore store;
};

}

TEST_F(BookmarksDialogTest, ReloadListsStoredUrlsInOrder)
{
    ASSERT_TRUE(store.add(QStringLiteral("https://a.example")));
    ASSERT_TRUE(store.add(QStringLiteral("https://b.example")));

    BookmarksDialog dialog(&store);
    ASSERT_TRUE(dialog.reload());

    ASSERT_EQ(dialog.listWidget()->count(), 2);
    EXPECT_EQ(dialog.listWidget()->item(0)->text(), QStringLiteral("https://a.example"));
    EXPECT_EQ(dialog.listWidget()->item(1)->text(), QStringLiteral("https://b.example"));
}

TEST_F(BookmarksDialogTest, ReloadPicksUpExternalChanges)
{
    BookmarksDialog dialog(&store);
    ASSERT_TRUE(dialog.reload());
    EXPECT_EQ(dialog.listWidget()->count(), 0);

    ASSERT_TRUE(store.add(QStringLiteral("https://later.example")));
    ASSERT_TRUE(dialog.reload());
    EXPECT_EQ(dialog.listWidget()->count(), 1);
}

TEST_F(BookmarksDialogTest, OpenSelectedEmitsBookmarkUrl)
{
    ASSERT_TRUE(store.add(QStringLiteral("https://a.example")));
    ASSERT_TRUE(store.add(QStringLiteral("https://b.example/path?x=1")));

    BookmarksDialog dialog(&store);
    ASSERT_TRUE(dialog.reload());
    QSignalSpy spy(&dialog, &BookmarksDialog::bookmarkActivated);

    dialog.listWidget()->setCurrentRow(1);
    dialog.openSelected();

    ASSERT_EQ(spy.count(), 1);
    EXPECT_EQ(spy.at(0).at(0).toUrl(), QUrl(QStringLiteral("https://b.example/path?x=1")));
    EXPECT_EQ(dialog.result(), int(QDialog::Accepted));
}

TEST_F(BookmarksDialogTest, OpenWithoutSelectionDoesNothing)
{
    BookmarksDialog dialog(&store);
    ASSERT_TRUE(dialog.reload());
    QSignalSpy spy(&dialog, &BookmarksDialog::bookmarkActivated);

    dialog.openSelected();

    EXPECT_EQ(spy.count(), 0);
}

TEST_F(BookmarksDialogTest, DeleteUrlRemovesEveryCopyFromListAndFile)
{
    const QString dup = QStringLiteral("https://dup.example");
    ASSERT_TRUE(store.add(dup));
    ASSERT_TRUE(store.add(QStringLiteral("https://keep.example")));
    ASSERT_TRUE(store.add(dup));

    BookmarksDialog dialog(&store);
    ASSERT_TRUE(dialog.reload());
    ASSERT_EQ(dialog.listWidget()->count(), 3);

    ASSERT_TRUE(dialog.deleteUrl(dup));
    ASSERT_EQ(dialog.listWidget()->count(), 1);
    EXPECT_EQ(dialog.listWidget()->item(0)->text(), QStringLiteral("https://keep.example"));
    EXPECT_EQ(store.list(), QStringList{QStringLiteral("https://keep.example")});
}
