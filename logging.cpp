#include "logging.h"

Q_LOGGING_CATEGORY(lcAddress, "wayfarer.address")
Q_LOGGING_CATEGORY(lcBookmarks, "wayfarer.bookmarks")
Q_LOGGING_CATEGORY(lcTabs, "wayfarer.tabs")
Q_LOGGING_CATEGORY(lcDownloads, "wayfarer.downloads")
Q_LOGGING_CATEGORY(lcSettings, "wayfarer.settings")
