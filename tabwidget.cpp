#include "tabwidget.h"
#include "logging.h"
#include <QCursor>
#include <QMenu>
#include <QTabBar>

TabWidget::TabWidget(ViewFactory *factory, QWidget *parent)
    : QTabWidget(parent)
    , m_factory(factory)
    , m_lastHandle(0)
{
    QTabBar *tabBar = this->tabBar();
    tabBar->setTabsClosable(true);
    tabBar->setSelectionBehaviorOnRemove(QTabBar::SelectLeftTab);
    tabBar->setMovable(true);
    tabBar->setContextMenuPolicy(Qt::CustomContextMenu);
    setDocumentMode(true);
    setElideMode(Qt::ElideRight);

    connect(tabBar, &QTabBar::customContextMenuRequested, this, &TabWidget::handleContextMenuRequested);
    connect(tabBar, &QTabBar::tabCloseRequested, this, &TabWidget::handleTabCloseRequested);
    connect(tabBar, &QTabBar::tabBarDoubleClicked, this, &TabWidget::handleTabBarDoubleClicked);
    connect(this, &QTabWidget::currentChanged, this, &TabWidget::handleCurrentChanged);
}

TabWidget::~TabWidget()
{
    for (NavigableView *view : qAsConst(m_views))
        view->setEngineEventListener(nullptr);
}

TabHandle TabWidget::openTab(const ResolvedTarget &target)
{
    return addView(target.isNull() ? m_homePage : target.url(), true);
}

TabHandle TabWidget::openBackgroundTab(const ResolvedTarget &target)
{
    return addView(target.isNull() ? m_homePage : target.url(), false);
}

TabHandle TabWidget::createTab(bool makeCurrent)
{
    return addView(QUrl(), makeCurrent);
}

void TabWidget::openHomeTab()
{
    addView(m_homePage, true);
}

TabHandle TabWidget::addView(const QUrl &url, bool makeCurrent)
{
    NavigableView *view = m_factory->createView(this);
    const TabHandle handle = ++m_lastHandle;
    m_views.insert(handle, view);
    view->setEngineEventListener(this);

    const int index = addTab(view->widget(), tr("New Tab"));
    tabBar()->setTabData(index, QVariant::fromValue<quint64>(handle));

    if (!url.isEmpty())
        view->load(url);

    if (makeCurrent)
        setCurrentIndex(index);

    qCDebug(lcTabs) << "opened tab" << handle << url << (makeCurrent ? "foreground" : "background");
    return handle;
}

void TabWidget::closeTab(TabHandle handle)
{
    NavigableView *view = m_views.value(handle);
    if (!view) {
        qCDebug(lcTabs) << "close ignored for unknown tab" << handle;
        return;
    }

    // The window always keeps one tab.
    if (count() == 1)
        openHomeTab();

    m_views.remove(handle);
    view->setEngineEventListener(nullptr);
    QWidget *widget = view->widget();
    removeTab(QTabWidget::indexOf(widget));
    widget->deleteLater();

    qCDebug(lcTabs) << "closed tab" << handle << "remaining" << count();
}

void TabWidget::closeOtherTabs(TabHandle handle)
{
    if (!m_views.contains(handle))
        return;
    const QList<TabHandle> all = handles();
    for (TabHandle other : all) {
        if (other != handle)
            closeTab(other);
    }
}

void TabWidget::closeCurrentTab()
{
    closeTab(currentHandle());
}

void TabWidget::activate(TabHandle handle)
{
    NavigableView *view = m_views.value(handle);
    if (!view)
        return;
    if (currentWidget() == view->widget())
        publishState(view);
    else
        setCurrentWidget(view->widget());
}

void TabWidget::navigate(const ResolvedTarget &target)
{
    if (target.isNull())
        return;
    if (NavigableView *view = currentView())
        view->load(target.url());
    else
        openTab(target);
}

void TabWidget::triggerAction(NavigableView::Action action)
{
    if (NavigableView *view = currentView())
        view->trigger(action);
}

void TabWidget::reloadAllTabs()
{
    for (NavigableView *view : qAsConst(m_views))
        view->reload();
}

void TabWidget::nextTab()
{
    if (count() < 2)
        return;
    int next = currentIndex() + 1;
    if (next == count())
        next = 0;
    setCurrentIndex(next);
}

void TabWidget::previousTab()
{
    if (count() < 2)
        return;
    int previous = currentIndex() - 1;
    if (previous < 0)
        previous = count() - 1;
    setCurrentIndex(previous);
}

NavigableView *TabWidget::currentView() const
{
    return viewForWidget(currentWidget());
}

NavigableView *TabWidget::view(TabHandle handle) const
{
    return m_views.value(handle);
}

TabHandle TabWidget::currentHandle() const
{
    return handleAt(currentIndex());
}

TabHandle TabWidget::handleAt(int index) const
{
    if (index < 0 || index >= count())
        return 0;
    return tabBar()->tabData(index).value<quint64>();
}

int TabWidget::indexOf(TabHandle handle) const
{
    NavigableView *view = m_views.value(handle);
    return view ? QTabWidget::indexOf(view->widget()) : -1;
}

QList<TabHandle> TabWidget::handles() const
{
    QList<TabHandle> result;
    for (int i = 0; i < count(); ++i)
        result.append(handleAt(i));
    return result;
}

NavigableView *TabWidget::viewForWidget(const QWidget *widget) const
{
    if (!widget)
        return nullptr;
    for (NavigableView *view : m_views) {
        if (view->widget() == widget)
            return view;
    }
    return nullptr;
}

void TabWidget::handleEngineEvent(NavigableView *source, const EngineEvent &event)
{
    if (!source)
        return;
    const int index = QTabWidget::indexOf(source->widget());
    if (index == -1)
        return;
    const bool isCurrent = index == currentIndex();

    switch (event.type) {
    case EngineEvent::TitleChanged: {
        const QString label = event.text.isEmpty() ? tr("New Tab") : event.text;
        setTabText(index, label);
        setTabToolTip(index, label);
        if (isCurrent)
            emit titleChanged(event.text);
        break;
    }
    case EngineEvent::IconChanged:
        setTabIcon(index, source->pageIcon());
        if (isCurrent)
            emit iconChanged(source->pageIcon());
        break;
    case EngineEvent::UrlChanged:
        if (isCurrent)
            emit urlChanged(event.url);
        break;
    case EngineEvent::LoadStarted:
    case EngineEvent::LoadProgress:
        if (isCurrent) {
            emit loadProgress(event.type == EngineEvent::LoadStarted ? 0 : event.progress);
            emit statusMessage(event.statusText(), event.statusTimeout());
        }
        break;
    case EngineEvent::LoadFailed:
        qCInfo(lcTabs) << "load failed in tab" << handleAt(index) << event.url;
        Q_FALLTHROUGH();
    case EngineEvent::NavigationFinished:
        if (isCurrent) {
            emit loadProgress(100);
            emit statusMessage(event.statusText(), event.statusTimeout());
            emit navigationStateChanged(source->canGoBack(), source->canGoForward());
        }
        break;
    case EngineEvent::HistoryChanged:
        if (isCurrent)
            emit navigationStateChanged(source->canGoBack(), source->canGoForward());
        break;
    case EngineEvent::LinkHovered:
        if (isCurrent)
            emit linkHovered(event.text);
        break;
    default:
        qWarning("Unhandled engine event %d from tab", int(event.type));
        break;
    }
}

void TabWidget::publishState(NavigableView *view)
{
    if (!view) {
        emit titleChanged(QString());
        emit urlChanged(QUrl());
        emit iconChanged(QIcon());
        emit loadProgress(0);
        emit navigationStateChanged(false, false);
        return;
    }
    emit titleChanged(view->pageTitle());
    emit urlChanged(view->currentUrl());
    emit iconChanged(view->pageIcon());
    emit loadProgress(view->loadPercent());
    emit navigationStateChanged(view->canGoBack(), view->canGoForward());
}

void TabWidget::handleCurrentChanged(int index)
{
    NavigableView *view = viewForWidget(widget(index));
    qCDebug(lcTabs) << "current tab" << handleAt(index);
    publishState(view);
    if (view)
        view->widget()->setFocus();
}

void TabWidget::handleTabCloseRequested(int index)
{
    closeTab(handleAt(index));
}

void TabWidget::handleTabBarDoubleClicked(int index)
{
    if (index == -1)
        openHomeTab();
}

void TabWidget::handleContextMenuRequested(const QPoint &pos)
{
    QMenu menu;
    menu.addAction(tr("New &Tab"), this, &TabWidget::openHomeTab, QKeySequence::AddTab);
    const int index = tabBar()->tabAt(pos);
    if (index != -1) {
        const TabHandle handle = handleAt(index);
        QAction *action = menu.addAction(tr("&Reload Tab"));
        action->setShortcut(QKeySequence::Refresh);
        connect(action, &QAction::triggered, this, [this, handle]() {
            if (NavigableView *view = m_views.value(handle))
                view->reload();
        });
        menu.addSeparator();
        action = menu.addAction(tr("&Close Tab"));
        action->setShortcut(QKeySequence::Close);
        connect(action, &QAction::triggered, this, [this, handle]() {
            closeTab(handle);
        });
        action = menu.addAction(tr("Close &Other Tabs"));
        action->setEnabled(count() > 1);
        connect(action, &QAction::triggered, this, [this, handle]() {
            closeOtherTabs(handle);
        });
    }
    menu.addSeparator();
    menu.addAction(tr("Reload &All Tabs"), this, &TabWidget::reloadAllTabs);
    menu.exec(QCursor::pos());
}
