/*!
 * @file        backend_client.cppm
 * @brief       Dual-channel client for the download backend.
 * @details     Talks to the backend over two independent transports:
 *
 *              - a request/response command channel (HTTP, JSON bodies) with
 *                fixed transfer timeouts;
 *              - a push-only event channel with a connect deadline, periodic
 *                keepalive and tracking of intentional closes.
 *
 *              Failures never escape as exceptions. Commands report through a
 *              CommandResult handed to the caller's completion callback; read
 *              helpers degrade to empty values and write helpers return a
 *              result carrying `success` and `error`.
 *
 *              The client is constructed by the composition root and passed
 *              by reference to whoever needs it. reset() is the single
 *              teardown entry point.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <functional>
#include <optional>
#include <QByteArray>
#include <QJsonDocument>
#include <QList>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
#include <QSet>
#include <QString>
#include <QTimer>
#include <QVector>

#ifndef Q_MOC_RUN
export module dlsync.services.backend_client;
export import dlsync.core.downloadtypes;
export import dlsync.services.backend_config;
export import dlsync.services.backend_events;
export import dlsync.services.event_channel;
#endif

#ifdef Q_MOC_RUN
#define DLSYNC_MODULE_EXPORT
#else
#define DLSYNC_MODULE_EXPORT export
#endif

/**
 * @brief Outcome of one command channel request.
 */
DLSYNC_MODULE_EXPORT struct CommandResult {
    enum class Failure {
        None,       //!< Request succeeded.
        Transport,  //!< No HTTP response (refused, timed out, aborted).
        Http,       //!< Non-2xx status.
        Decode      //!< 2xx with a body that is not JSON.
    };

    bool ok = false;
    Failure kind = Failure::None;
    int httpStatus = 0;         //!< 0 when no response was received.
    QJsonDocument json;         //!< Decoded body; null for an empty body.
    QString error;              //!< Failure detail.
};

//!< @brief Result of `POST /api/downloads`.
DLSYNC_MODULE_EXPORT struct AddDownloadResult {
    bool success = false;
    std::optional<Download> download;
    QString error;
};

//!< @brief Result of pause/resume/cancel.
DLSYNC_MODULE_EXPORT struct ControlResult {
    bool success = false;
    QString error;
};

DLSYNC_MODULE_EXPORT class BackendClient : public QObject {

    Q_OBJECT

public:
    enum class ChannelState { Idle, Connecting, Open };

    using ConnectCallback = std::function<void(bool)>;
    using CommandCallback = std::function<void(const CommandResult&)>;

    /**
     * @brief Construct a client for @p config.
     * @param channel Event channel to use; the client takes ownership. A
     *        WebSocket channel is created when none is given.
     */
    explicit BackendClient(const BackendConfig& config,
                           EventChannel* channel = nullptr,
                           QObject* parent = nullptr);
    ~BackendClient() override;

    const BackendConfig& config() const { return m_config; }

    /**
     * @brief Switches to another endpoint.
     *
     * Tears down both channels through reset() first.
     */
    void setConfig(const BackendConfig& config);

    ChannelState channelState() const { return m_state; }

    //!< @brief Whether the event channel is open.
    bool isConnected() const { return m_state == ChannelState::Open; }

    /**
     * @brief Opens the event channel.
     *
     * While an attempt is in flight further calls join it, so the channel is
     * opened once and every caller observes the same outcome. When already
     * open, @p done is resolved with true immediately.
     */
    void connectEvents(ConnectCallback done = {});

    /**
     * @brief Closes the event channel on purpose.
     *
     * Pending connect callbacks resolve with false. No disconnected() signal
     * is emitted for this close.
     */
    void disconnectEvents();

    /**
     * @brief Full teardown: closes the event channel and aborts every
     * in-flight command, whose callbacks resolve as transport failures.
     */
    void reset();

    /**
     * @brief Sends one command.
     * @param method HTTP verb.
     * @param path Absolute path, e.g. `/api/downloads`.
     * @param body JSON body; a null document sends no body.
     * @param done Receives the outcome. Always invoked exactly once.
     */
    void sendCommand(const QByteArray& method,
                     const QString& path,
                     const QJsonDocument& body,
                     CommandCallback done);

    //!< @brief Reachability check. Resolves true on any 2xx answer.
    void ping(std::function<void(bool)> done);

    void fetchStatus(std::function<void(std::optional<BackendStatus>)> done);
    void listQueues(std::function<void(QVector<QueueInfo>)> done);
    void listDownloads(std::function<void(QVector<Download>)> done);

    /**
     * @brief Reads the download snapshot without degrading.
     *
     * Unlike listDownloads(), a failed read resolves with std::nullopt so an
     * empty backend can be told apart from an unreachable one.
     */
    void fetchDownloads(std::function<void(std::optional<QVector<Download>>)> done);

    void addDownload(const AddDownloadRequest& request, std::function<void(const AddDownloadResult&)> done);
    void pauseDownload(const QString& id, std::function<void(const ControlResult&)> done);
    void resumeDownload(const QString& id, std::function<void(const ControlResult&)> done);
    void cancelDownload(const QString& id, std::function<void(const ControlResult&)> done);

signals:
    //!< @brief The event channel reached the open state.
    void connected();

    //!< @brief An open event channel closed without being asked to.
    void disconnected();

    //!< @brief A typed event arrived (including kinds this client does not model).
    void eventReceived(const BackendEvent& event);

    //!< @brief The backend pushed an `error` event.
    void backendError(const QString& message);

private:
    void request(const QByteArray& method,
                 const QString& path,
                 const QJsonDocument& body,
                 int timeoutMs,
                 CommandCallback done);

    void control(const QString& id, const QString& action, std::function<void(const ControlResult&)> done);

    void handleOpened();
    void handleClosed();
    void handleFailed(const QString& reason);
    void handleConnectTimeout();
    void handleText(const QString& text);
    void sendKeepalive();

    //!< @brief Resolves and clears every pending connect callback.
    void resolveWaiters(bool ok);

    BackendConfig m_config;                         //!< Endpoint and timings.
    EventChannel* m_channel = nullptr;              //!< Owned event channel.
    ChannelState m_state = ChannelState::Idle;      //!< Event channel state.
    bool m_intentionalClose = false;                //!< Set by disconnectEvents().
    QList<ConnectCallback> m_waiters;               //!< Callers of an in-flight connect.

    QNetworkAccessManager m_net;                    //!< Command channel.
    QSet<QNetworkReply*> m_pending;                 //!< In-flight command replies.
    QTimer m_connectTimer;                          //!< Connect deadline.
    QTimer m_keepaliveTimer;                        //!< Ping cadence.
};

#include "backend_client.moc"
