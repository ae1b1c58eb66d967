#ifndef LOGGING_H
#define LOGGING_H

#include <QLoggingCategory>

// Address bar input classification
Q_DECLARE_LOGGING_CATEGORY(lcAddress)

// Bookmark file reads and writes
Q_DECLARE_LOGGING_CATEGORY(lcBookmarks)

// Tab creation, activation and close
Q_DECLARE_LOGGING_CATEGORY(lcTabs)

// Download requests and their outcome
Q_DECLARE_LOGGING_CATEGORY(lcDownloads)

// QSettings lookups
Q_DECLARE_LOGGING_CATEGORY(lcSettings)

#endif // LOGGING_H
