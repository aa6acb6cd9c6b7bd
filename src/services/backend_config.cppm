/*!
 * @file        backend_config.cppm
 * @brief       Backend endpoint and protocol timing configuration.
 * @details     Holds the host/port of the download backend together with the
 *              fixed timings of the command and event channels. Endpoint and
 *              reconnect preferences persist in the `backend` settings group;
 *              protocol timings are code-level defaults.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QUrl>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module dlsync.services.backend_config;
#endif

#ifdef Q_MOC_RUN
#define DLSYNC_MODULE_EXPORT
#else
#define DLSYNC_MODULE_EXPORT export
#endif

DLSYNC_MODULE_EXPORT struct BackendConfig {
    QString host = QStringLiteral("127.0.0.1");    //!< Loopback by default.
    quint16 port = 7899;                           //!< Backend HTTP/WS port.

    int connectTimeoutMs = 3000;                   //!< Event channel open deadline.
    int keepaliveIntervalMs = 25000;               //!< Ping cadence while open.
    int commandTimeoutMs = 10000;                  //!< Transfer timeout for commands.
    int pingTimeoutMs = 2000;                      //!< Transfer timeout for `/ping`.

    bool autoReconnect = true;                     //!< Reopen after an unexpected close.
    int reconnectIntervalMs = 5000;                //!< Delay before reopening.

    //!< @brief Base URL of the command channel (`http://host:port`).
    QUrl baseUrl() const;

    //!< @brief URL of the event channel (`ws://host:port/ws`).
    QUrl eventsUrl() const;

    //!< @brief Absolute command URL for @p path (which starts with '/').
    QUrl commandUrl(const QString& path) const;

    bool operator==(const BackendConfig& other) const = default;
};

/**
 * @brief Loads the persisted endpoint settings on top of the defaults.
 *
 * Invalid values (empty host, port 0, non-positive interval) fall back to the
 * defaults.
 */
DLSYNC_MODULE_EXPORT BackendConfig loadBackendConfig();

//!< @brief Persists the endpoint settings of @p config.
DLSYNC_MODULE_EXPORT void saveBackendConfig(const BackendConfig& config);
