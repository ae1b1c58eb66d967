#include "bookmarkstore.h"
#include "logging.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>
#include <QUrl>

BookmarkStore::BookmarkStore(const QString &filePath)
    : m_filePath(filePath)
{
}

bool BookmarkStore::add(const QString &url)
{
    m_errorString.clear();
    const QString entry = url.trimmed();
    if (entry.isEmpty()) {
        setError(tr("Cannot bookmark an empty address"));
        return false;
    }
    if (!ensureParentDirectory())
        return false;

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadWrite | QIODevice::Append | QIODevice::Text)) {
        setError(tr("Cannot open %1 for writing: %2").arg(m_filePath, file.errorString()));
        return false;
    }

    // A hand-edited file may lack the final newline.
    QByteArray line;
    if (file.size() > 0 && file.seek(file.size() - 1) && file.peek(1) != "\n")
        line += '\n';
    line += entry.toUtf8() + '\n';
    if (!file.seek(file.size())) {
        setError(tr("Cannot write to %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }
    if (file.write(line) != line.size()) {
        setError(tr("Cannot write to %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }
    file.close();

    qCDebug(lcBookmarks) << "added" << entry;
    return true;
}

bool BookmarkStore::remove(const QString &url)
{
    m_errorString.clear();
    QStringList lines;
    if (!readLines(&lines))
        return false;
    if (!ensureParentDirectory())
        return false;

    const QString target = url.trimmed();
    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        setError(tr("Cannot open %1 for writing: %2").arg(m_filePath, file.errorString()));
        return false;
    }

    int removed = 0;
    QTextStream out(&file);
    out.setCodec("UTF-8");
    for (const QString &line : lines) {
        if (line == target) {
            ++removed;
            continue;
        }
        out << line << '\n';
    }
    out.flush();

    if (!file.commit()) {
        setError(tr("Cannot write to %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }

    qCDebug(lcBookmarks) << "removed" << removed << "entries for" << target;
    return true;
}

QStringList BookmarkStore::list() const
{
    m_errorString.clear();
    QStringList lines;
    if (!readLines(&lines))
        return QStringList();
    return lines;
}

bool BookmarkStore::contains(const QString &url) const
{
    return list().contains(url.trimmed());
}

BookmarkStore::AddResult BookmarkStore::addPage(const QUrl &url)
{
    m_errorString.clear();
    if (url.isEmpty() || !url.isValid() || url == QUrl(QStringLiteral("about:blank")))
        return BlankPage;

    const QString entry = url.toString();
    const bool exists = contains(entry);
    if (!m_errorString.isEmpty())
        return Failed;
    if (exists)
        return AlreadyBookmarked;
    return add(entry) ? Added : Failed;
}

bool BookmarkStore::ensureParentDirectory()
{
    const QDir dir = QFileInfo(m_filePath).absoluteDir();
    if (dir.exists() || dir.mkpath(QStringLiteral(".")))
        return true;
    setError(tr("Cannot create directory %1").arg(dir.absolutePath()));
    return false;
}

bool BookmarkStore::readLines(QStringList *lines) const
{
    QFile file(m_filePath);
    if (!file.exists())
        return true;

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        setError(tr("Cannot open %1 for reading: %2").arg(m_filePath, file.errorString()));
        return false;
    }

    QTextStream in(&file);
    in.setCodec("UTF-8");
    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        if (!line.isEmpty())
            lines->append(line);
    }
    return true;
}

void BookmarkStore::setError(const QString &message) const
{
    m_errorString = message;
    qCWarning(lcBookmarks).noquote() << message;
}
