#include "test_support.hpp"

#include <QHostAddress>
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QWebSocket>
#include <QWebSocketServer>

import dlsync.services.event_channel;

namespace {

// Loopback WebSocket endpoint that keeps its peers and records what they send.
struct LoopbackServer {
    LoopbackServer()
        : server(QStringLiteral("dlsync-tests"), QWebSocketServer::NonSecureMode)
    {
        QObject::connect(&server, &QWebSocketServer::newConnection, [this]() {
            while (QWebSocket* peer = server.nextPendingConnection()) {
                peers.append(peer);
                QObject::connect(peer, &QWebSocket::textMessageReceived, [this](const QString& text) { received << text; });
            }
        });
        server.listen(QHostAddress::LocalHost, 0);
    }

    QUrl url() const { return QUrl(QStringLiteral("ws://127.0.0.1:%1/ws").arg(server.serverPort())); }

    QStringList received;
    QList<QWebSocket*> peers;       // children of server
    QWebSocketServer server;
};

struct ChannelLog {
    int opened = 0;
    int closed = 0;
    QStringList failures;
    QStringList texts;
};

void watch(EventChannel& channel, ChannelLog& log) {
    QObject::connect(&channel, &EventChannel::opened, [&log]() { ++log.opened; });
    QObject::connect(&channel, &EventChannel::closed, [&log]() { ++log.closed; });
    QObject::connect(&channel, &EventChannel::failed, [&log](const QString& reason) { log.failures << reason; });
    QObject::connect(&channel, &EventChannel::textReceived, [&log](const QString& text) { log.texts << text; });
}

} // namespace

TEST_CASE("websocket channel opens, receives pushes and sends text") {
    LoopbackServer server;
    REQUIRE(server.server.isListening());
    WebSocketEventChannel channel;
    ChannelLog log;
    watch(channel, log);

    channel.open(server.url());
    REQUIRE(waitUntil([&]() { return log.opened == 1 && server.peers.size() == 1; }));
    REQUIRE(channel.isOpen());

    server.peers.first()->sendTextMessage(R"({"type":"progress","id":"d1","downloaded":5})");
    server.peers.first()->sendTextMessage(QStringLiteral("\"pong\""));
    REQUIRE(waitUntil([&log]() { return log.texts.size() == 2; }));
    REQUIRE(log.texts.last() == QString("\"pong\""));

    REQUIRE(channel.sendText(QStringLiteral("ping")));
    REQUIRE(waitUntil([&server]() { return server.received == QStringList({"ping"}); }));
    REQUIRE(log.failures.isEmpty());
}

TEST_CASE("websocket channel reports a server close once") {
    LoopbackServer server;
    WebSocketEventChannel channel;
    ChannelLog log;
    watch(channel, log);

    channel.open(server.url());
    REQUIRE(waitUntil([&]() { return log.opened == 1 && server.peers.size() == 1; }));

    server.peers.first()->close();
    REQUIRE(waitUntil([&log]() { return log.closed == 1; }));
    pumpEvents(100);

    REQUIRE(log.closed == 1);
    REQUIRE_FALSE(channel.isOpen());
    REQUIRE_FALSE(channel.sendText(QStringLiteral("ping")));
}

TEST_CASE("websocket channel fails without opening on a refused port") {
    QUrl deadUrl;
    {
        LoopbackServer server;
        deadUrl = server.url();
    }
    WebSocketEventChannel channel;
    ChannelLog log;
    watch(channel, log);

    channel.open(deadUrl);

    REQUIRE(waitUntil([&log]() { return !log.failures.isEmpty(); }));
    REQUIRE(log.opened == 0);
    REQUIRE_FALSE(channel.isOpen());
    REQUIRE_FALSE(channel.sendText(QStringLiteral("ping")));
}

TEST_CASE("closing during the handshake never opens") {
    LoopbackServer server;
    WebSocketEventChannel channel;
    ChannelLog log;
    watch(channel, log);

    channel.open(server.url());
    channel.close();
    pumpEvents(200);

    REQUIRE(log.opened == 0);
    REQUIRE_FALSE(channel.isOpen());
}

TEST_CASE("reopening while the previous connection closes does not report its close") {
    LoopbackServer server;
    WebSocketEventChannel channel;
    ChannelLog log;
    watch(channel, log);

    channel.open(server.url());
    REQUIRE(waitUntil([&log]() { return log.opened == 1; }));

    channel.close();
    channel.open(server.url());

    REQUIRE(waitUntil([&log]() { return log.opened == 2; }));
    REQUIRE(log.closed == 0);
    REQUIRE(channel.isOpen());
}
