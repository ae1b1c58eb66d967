#include "browser.h"
#include "browserwindow.h"
#include <QApplication>
#include <QLoggingCategory>

int main(int argc, char **argv)
{
    QCoreApplication::setOrganizationName(QStringLiteral("Wayfarer"));
    QCoreApplication::setApplicationName(QStringLiteral("Wayfarer"));
    QCoreApplication::setAttribute(Qt::AA_EnableHighDpiScaling);

    // Debug output of our categories is opt-in through QT_LOGGING_RULES.
    if (qEnvironmentVariableIsEmpty("QT_LOGGING_RULES"))
        QLoggingCategory::setFilterRules(QStringLiteral("wayfarer.*.debug=false"));

    QApplication app(argc, argv);
    app.setWindowIcon(QIcon::fromTheme(QStringLiteral("web-browser")));

    Browser browser;
    browser.createWindow();
    return app.exec();
}
