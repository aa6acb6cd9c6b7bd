#include "test_support.hpp"

#include <QSettings>
#include <QUrl>

import dlsync.services.backend_config;

namespace {

void clearBackendGroup() {
    QSettings settings;
    settings.remove(QStringLiteral("backend"));
}

} // namespace

TEST_CASE("defaults target the loopback backend") {
    const BackendConfig config;
    REQUIRE(config.host == QString("127.0.0.1"));
    REQUIRE(config.port == 7899);
    REQUIRE(config.connectTimeoutMs == 3000);
    REQUIRE(config.keepaliveIntervalMs == 25000);
    REQUIRE(config.commandTimeoutMs == 10000);
    REQUIRE(config.pingTimeoutMs == 2000);
    REQUIRE(config.autoReconnect);
}

TEST_CASE("urls are derived from host and port") {
    BackendConfig config;
    config.host = "backend.lan";
    config.port = 8123;

    REQUIRE(config.eventsUrl() == QUrl("ws://backend.lan:8123/ws"));
    REQUIRE(config.commandUrl("/api/downloads") == QUrl("http://backend.lan:8123/api/downloads"));
    REQUIRE(config.baseUrl() == QUrl("http://backend.lan:8123"));
}

TEST_CASE("endpoint settings survive a save and load") {
    clearBackendGroup();

    BackendConfig config;
    config.host = "10.0.0.5";
    config.port = 9000;
    config.autoReconnect = false;
    config.reconnectIntervalMs = 1500;
    saveBackendConfig(config);

    const BackendConfig loaded = loadBackendConfig();
    REQUIRE(loaded.host == QString("10.0.0.5"));
    REQUIRE(loaded.port == 9000);
    REQUIRE_FALSE(loaded.autoReconnect);
    REQUIRE(loaded.reconnectIntervalMs == 1500);
    // Timings are not persisted.
    REQUIRE(loaded.commandTimeoutMs == 10000);

    clearBackendGroup();
}

TEST_CASE("invalid persisted values fall back to defaults") {
    clearBackendGroup();
    {
        QSettings settings;
        settings.beginGroup(QStringLiteral("backend"));
        settings.setValue(QStringLiteral("host"), QStringLiteral("   "));
        settings.setValue(QStringLiteral("port"), 0);
        settings.setValue(QStringLiteral("reconnectIntervalMs"), -10);
        settings.endGroup();
    }

    const BackendConfig loaded = loadBackendConfig();
    REQUIRE(loaded.host == QString("127.0.0.1"));
    REQUIRE(loaded.port == 7899);
    REQUIRE(loaded.reconnectIntervalMs == 5000);

    clearBackendGroup();
}

TEST_CASE("a host with scheme and port is normalized on load") {
    clearBackendGroup();
    {
        QSettings settings;
        settings.setValue(QStringLiteral("backend/host"), QStringLiteral("HTTP://LocalHost:7899/"));
    }

    REQUIRE(loadBackendConfig().host == QString("localhost"));

    clearBackendGroup();
}
