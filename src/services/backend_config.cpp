module;
#include <QSettings>
#include <QString>
#include <QUrl>
#include <QtGlobal>

module dlsync.services.backend_config;

import dlsync.utils.download_utils;

namespace utils = dlsync::utils;

static QString settingsGroup()
{
    return QStringLiteral("backend");
}

QUrl BackendConfig::baseUrl() const
{
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(host);
    url.setPort(port);
    return url;
}

QUrl BackendConfig::eventsUrl() const
{
    QUrl url;
    url.setScheme(QStringLiteral("ws"));
    url.setHost(host);
    url.setPort(port);
    url.setPath(QStringLiteral("/ws"));
    return url;
}

QUrl BackendConfig::commandUrl(const QString& path) const
{
    QUrl url = baseUrl();
    url.setPath(path);
    return url;
}

BackendConfig loadBackendConfig()
{
    BackendConfig config;
    QSettings settings;
    settings.beginGroup(settingsGroup());
    const QString host = utils::normalizeHost(settings.value(QStringLiteral("host"), config.host).toString());
    if (!host.isEmpty()) config.host = host;
    const int port = settings.value(QStringLiteral("port"), config.port).toInt();
    if (port > 0 && port <= 65535) config.port = static_cast<quint16>(port);
    config.autoReconnect = settings.value(QStringLiteral("autoReconnect"), config.autoReconnect).toBool();
    const int interval = settings.value(QStringLiteral("reconnectIntervalMs"), config.reconnectIntervalMs).toInt();
    if (interval > 0) config.reconnectIntervalMs = interval;
    settings.endGroup();
    return config;
}

void saveBackendConfig(const BackendConfig& config)
{
    QSettings settings;
    settings.beginGroup(settingsGroup());
    settings.setValue(QStringLiteral("host"), config.host);
    settings.setValue(QStringLiteral("port"), config.port);
    settings.setValue(QStringLiteral("autoReconnect"), config.autoReconnect);
    settings.setValue(QStringLiteral("reconnectIntervalMs"), config.reconnectIntervalMs);
    settings.endGroup();
}
