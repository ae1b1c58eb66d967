#include "bookmarksdialog.h"
#include "bookmarkstore.h"
#include <QDialogButtonBox>
#include <QListWidget>
#include <QMessageBox>
#include <QPushButton>
#include <QVBoxLayout>

BookmarksDialog::BookmarksDialog(BookmarkStore *store, QWidget *parent)
    : QDialog(parent)
    , m_store(store)
    , m_list(new QListWidget(this))
    , m_openButton(nullptr)
    , m_deleteButton(nullptr)
{
    setWindowTitle(tr("Bookmarks"));
    resize(400, 300);

    QDialogButtonBox *buttons = new QDialogButtonBox(this);
    m_openButton = buttons->addButton(tr("&Open"), QDialogButtonBox::AcceptRole);
    m_deleteButton = buttons->addButton(tr("&Delete"), QDialogButtonBox::ActionRole);
    buttons->addButton(QDialogButtonBox::Close);

    QVBoxLayout *layout = new QVBoxLayout;
    layout->addWidget(m_list);
    layout->addWidget(buttons);
    setLayout(layout);

    // Accept is driven by openSelected() so an empty selection keeps the dialog open.
    connect(m_openButton, &QPushButton::clicked, this, &BookmarksDialog::openSelected);
    connect(m_deleteButton, &QPushButton::clicked, this, &BookmarksDialog::deleteSelected);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    connect(m_list, &QListWidget::itemActivated, this, &BookmarksDialog::openSelected);
    connect(m_list, &QListWidget::currentRowChanged, this, &BookmarksDialog::updateButtons);
    updateButtons();
}

bool BookmarksDialog::reload()
{
    m_list->clear();
    const QStringList urls = m_store->list();
    if (!m_store->errorString().isEmpty()) {
        QMessageBox::warning(this, tr("Bookmarks"),
                             tr("Could not read bookmarks:\n%1").arg(m_store->errorString()));
        updateButtons();
        return false;
    }
    m_list->addItems(urls);
    if (m_list->count() > 0)
        m_list->setCurrentRow(0);
    updateButtons();
    return true;
}

void BookmarksDialog::openSelected()
{
    QListWidgetItem *item = m_list->currentItem();
    if (!item)
        return;
    emit bookmarkActivated(QUrl(item->text(), QUrl::TolerantMode));
    accept();
}

void BookmarksDialog::deleteSelected()
{
    QListWidgetItem *item = m_list->currentItem();
    if (!item)
        return;

    const QString url = item->text();
    int ret = QMessageBox::question(this, tr("Delete Bookmark"),
                                    tr("Are you sure you want to delete this bookmark?\n%1").arg(url),
                                    QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
    if (ret != QMessageBox::Yes)
        return;
    deleteUrl(url);
}

// Removes every entry equal to url without asking.
bool BookmarksDialog::deleteUrl(const QString &url)
{
    if (!m_store->remove(url)) {
        QMessageBox::warning(this, tr("Delete Bookmark"),
                             tr("Could not delete the bookmark:\n%1").arg(m_store->errorString()));
        return false;
    }
    return reload();
}

void BookmarksDialog::showEvent(QShowEvent *event)
{
    reload();
    QDialog::showEvent(event);
}

void BookmarksDialog::updateButtons()
{
    const bool hasSelection = m_list->currentItem() != nullptr;
    m_openButton->setEnabled(hasSelection);
    m_deleteButton->setEnabled(hasSelection);
}
