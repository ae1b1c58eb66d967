#ifndef TABWIDGET_H
#define TABWIDGET_H

#include "addressresolver.h"
#include "engineevent.h"
#include "navigableview.h"
#include <QHash>
#include <QTabWidget>

typedef quint64 TabHandle;

class TabWidget : public QTabWidget, public EngineEventListener
{
    Q_OBJECT

public:
    explicit TabWidget(ViewFactory *factory, QWidget *parent = nullptr);
    ~TabWidget();

    QUrl homePage() const { return m_homePage; }
    void setHomePage(const QUrl &url) { m_homePage = url; }

    // A null target opens the home page.
    TabHandle openTab(const ResolvedTarget &target = ResolvedTarget());
    TabHandle openBackgroundTab(const ResolvedTarget &target = ResolvedTarget());
    // Adds a tab without navigating it, for pages that open their own windows.
    TabHandle createTab(bool makeCurrent = true);
    void closeTab(TabHandle handle);
    void closeOtherTabs(TabHandle handle);
    void activate(TabHandle handle);

    void navigate(const ResolvedTarget &target);
    void triggerAction(NavigableView::Action action);

    NavigableView *currentView() const;
    NavigableView *view(TabHandle handle) const;
    TabHandle currentHandle() const;
    TabHandle handleAt(int index) const;
    using QTabWidget::indexOf;
    int indexOf(TabHandle handle) const;
    QList<TabHandle> handles() const;

    void handleEngineEvent(NavigableView *source, const EngineEvent &event) override;

signals:
    // Only emitted for the active tab.
    void titleChanged(const QString &title);
    void urlChanged(const QUrl &url);
    void iconChanged(const QIcon &icon);
    void loadProgress(int progress);
    void linkHovered(const QString &url);
    void navigationStateChanged(bool canGoBack, bool canGoForward);
    void statusMessage(const QString &message, int timeout);

public slots:
    void openHomeTab();
    void closeCurrentTab();
    void nextTab();
    void previousTab();
    void reloadAllTabs();

private slots:
    void handleCurrentChanged(int index);
    void handleTabCloseRequested(int index);
    void handleTabBarDoubleClicked(int index);
    void handleContextMenuRequested(const QPoint &pos);

private:
    TabHandle addView(const QUrl &url, bool makeCurrent);
    NavigableView *viewForWidget(const QWidget *widget) const;
    void publishState(NavigableView *view);

    ViewFactory *m_factory;
    QUrl m_homePage;
    TabHandle m_lastHandle;
    QHash<TabHandle, NavigableView *> m_views;
};

#endif // TABWIDGET_H
