module;
#include <QAbstractSocket>
#include <QDebug>
#include <QObject>
#include <QSignalBlocker>
#include <QString>
#include <QUrl>
#include <QWebSocket>

module dlsync.services.event_channel;

WebSocketEventChannel::WebSocketEventChannel(QObject* parent)
    : EventChannel(parent)
{
    connect(&m_socket, &QWebSocket::connected, this, &EventChannel::opened);
    connect(&m_socket, &QWebSocket::disconnected, this, &EventChannel::closed);
    connect(&m_socket, &QWebSocket::textMessageReceived, this, &EventChannel::textReceived);
    connect(&m_socket, &QWebSocket::errorOccurred, this, [this](QAbstractSocket::SocketError) {
        qDebug() << "WebSocketEventChannel: socket error:" << m_socket.errorString();
        emit failed(m_socket.errorString());
    });
}

void WebSocketEventChannel::open(const QUrl& url)
{
    if (m_socket.state() != QAbstractSocket::UnconnectedState) {
        // The previous connection's close belongs to it, not to this attempt.
        const QSignalBlocker blocker(m_socket);
        m_socket.abort();
    }
    m_socket.open(url);
}

void WebSocketEventChannel::close()
{
    if (m_socket.state() == QAbstractSocket::UnconnectedState) return;
    if (m_socket.state() == QAbstractSocket::ConnectedState) {
        m_socket.close();
        return;
    }
    // Still handshaking: there is nothing to close gracefully.
    m_socket.abort();
}

bool WebSocketEventChannel::sendText(const QString& text)
{
    if (!isOpen()) return false;
    const qint64 sent = m_socket.sendTextMessage(text);
    return sent == text.toUtf8().size();
}

bool WebSocketEventChannel::isOpen() const
{
    return m_socket.state() == QAbstractSocket::ConnectedState;
}
