#ifndef BOOKMARKSTORE_H
#define BOOKMARKSTORE_H

#include <QCoreApplication>
#include <QString>
#include <QStringList>

QT_BEGIN_NAMESPACE
class QUrl;
QT_END_NAMESPACE

// One URL per line in a UTF-8 text file. The file is re-read on every
// query; nothing is cached in memory.
class BookmarkStore
{
    Q_DECLARE_TR_FUNCTIONS(BookmarkStore)

public:
    enum AddResult {
        Added,
        BlankPage,
        AlreadyBookmarked,
        Failed
    };

    explicit BookmarkStore(const QString &filePath);

    QString filePath() const { return m_filePath; }

    bool add(const QString &url);
    bool remove(const QString &url);
    QStringList list() const;
    bool contains(const QString &url) const;

    // Bookmarks a visited page unless it is blank or already stored.
    AddResult addPage(const QUrl &url);

    // Empty when the last call succeeded.
    QString errorString() const { return m_errorString; }

private:
    bool ensureParentDirectory();
    bool readLines(QStringList *lines) const;
    void setError(const QString &message) const;

    QString m_filePath;
    mutable QString m_errorString;
};

#endif // BOOKMARKSTORE_H
