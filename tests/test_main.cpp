#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <QCoreApplication>
#include <QStandardPaths>

int main(int argc, char* argv[]) {
    // Timers, sockets and QSettings need an application object.
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("dlsync-tests"));
    QStandardPaths::setTestModeEnabled(true);

    return Catch::Session().run(argc, argv);
}
