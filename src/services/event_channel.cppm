/*!
 * @file        event_channel.cppm
 * @brief       Persistent push channel abstraction for backend events.
 * @details     Declares the minimal interface the transport client needs from
 *              a long-lived event connection: open, close, send a text frame,
 *              and signals for lifecycle and incoming frames.
 *
 *              The default implementation is a WebSocket. A desktop host that
 *              bridges events through its own publish/subscribe mechanism can
 *              provide another implementation delivering the same frames.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QString>
#include <QUrl>
#include <QWebSocket>

#ifndef Q_MOC_RUN
export module dlsync.services.event_channel;
#endif

#ifdef Q_MOC_RUN
#define DLSYNC_MODULE_EXPORT
#else
#define DLSYNC_MODULE_EXPORT export
#endif

/**
 * @brief Abstract long-lived, push-only connection.
 *
 * Implementations emit opened() once per successful open() and closed() once
 * per connection that ends. failed() reports errors, and textReceived() is
 * emitted for every incoming text frame in arrival order.
 */
DLSYNC_MODULE_EXPORT class EventChannel : public QObject {

    Q_OBJECT

public:
    explicit EventChannel(QObject* parent = nullptr) : QObject(parent) {}
    ~EventChannel() override = default;

    /**
     * @brief Starts connecting to @p url. Completion is signaled.
     *
     * A previous connection still in place is dropped without closed().
     */
    virtual void open(const QUrl& url) = 0;

    //!< @brief Closes the connection. closed() follows.
    virtual void close() = 0;

    /**
     * @brief Sends one text frame.
     * @return false when the frame could not be handed to the connection.
     */
    virtual bool sendText(const QString& text) = 0;

    //!< @brief Returns whether the connection is open.
    virtual bool isOpen() const = 0;

signals:
    void opened();
    void closed();
    void failed(const QString& reason);
    void textReceived(const QString& text);
};

/**
 * @brief EventChannel over a QWebSocket.
 */
DLSYNC_MODULE_EXPORT class WebSocketEventChannel : public EventChannel {

    Q_OBJECT

public:
    explicit WebSocketEventChannel(QObject* parent = nullptr);

    void open(const QUrl& url) override;
    void close() override;
    bool sendText(const QString& text) override;
    bool isOpen() const override;

private:
    QWebSocket m_socket;    //!< Underlying socket.
};

#include "event_channel.moc"
