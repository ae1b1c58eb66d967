#ifndef BOOKMARKSDIALOG_H
#define BOOKMARKSDIALOG_H

#include <QDialog>
#include <QUrl>

QT_BEGIN_NAMESPACE
class QListWidget;
class QPushButton;
QT_END_NAMESPACE

class BookmarkStore;

class BookmarksDialog : public QDialog
{
    Q_OBJECT

public:
    explicit BookmarksDialog(BookmarkStore *store, QWidget *parent = nullptr);

    QListWidget *listWidget() const { return m_list; }

signals:
    void bookmarkActivated(const QUrl &url);

public slots:
    bool reload();
    void openSelected();
    void deleteSelected();
    bool deleteUrl(const QString &url);

protected:
    void showEvent(QShowEvent *event) override;

private:
    void updateButtons();

    BookmarkStore *m_store;
    QListWidget *m_list;
    QPushButton *m_openButton;
    QPushButton *m_deleteButton;
};

#endif // BOOKMARKSDIALOG_H
