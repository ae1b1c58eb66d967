#include <gtest/gtest.h>

#include <QApplication>
#include <QFileInfo>
#include <QLibraryInfo>
#include <QString>

namespace {

void configureQtPlatform()
{
    // Respect any caller-provided platform selection.
    if (!qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
        return;

    const QString pluginDir = QLibraryInfo::location(QLibraryInfo::PluginsPath)
                              + QStringLiteral("/platforms");
#if defined(Q_OS_MAC)
    const QString offscreenPlugin = QStringLiteral("libqoffscreen.dylib");
#elif defined(Q_OS_WIN)
    const QString offscreenPlugin = QStringLiteral("qoffscreen.dll");
#else
    const QString offscreenPlugin = QStringLiteral("libqoffscreen.so");
#endif
    if (QFileInfo::exists(pluginDir + QLatin1Char('/') + offscreenPlugin))
        qputenv("QT_QPA_PLATFORM", QByteArrayLiteral("offscreen"));
}

} // namespace

int main(int argc, char **argv)
{
    configureQtPlatform();

    QApplication app(argc, argv);
    QApplication::setOrganizationName(QStringLiteral("WayfarerTests"));
    QApplication::setApplicationName(QStringLiteral("wayfarer_tests"));

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
