module;
#include <functional>
#include <optional>
#include <utility>
#include <variant>
#include <QByteArray>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QObject>
#include <QString>
#include <QTimer>
#include <QUrl>
#include <QVariant>
#include <QVector>

module dlsync.services.backend_client;

namespace {

ControlResult controlResultFrom(const CommandResult& result)
{
    ControlResult out;
    if (!result.ok) {
        out.error = result.error;
        return out;
    }
    const QJsonObject obj = result.json.object();
    // An empty 2xx body counts as acceptance.
    out.success = obj.isEmpty() ? true : obj.value(QStringLiteral("success")).toBool();
    out.error = obj.value(QStringLiteral("error")).toString();
    return out;
}

} // namespace

BackendClient::BackendClient(const BackendConfig& config, EventChannel* channel, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_channel(channel)
{
    if (!m_channel) m_channel = new WebSocketEventChannel(this);
    m_channel->setParent(this);

    connect(m_channel, &EventChannel::opened, this, &BackendClient::handleOpened);
    connect(m_channel, &EventChannel::closed, this, &BackendClient::handleClosed);
    connect(m_channel, &EventChannel::failed, this, &BackendClient::handleFailed);
    connect(m_channel, &EventChannel::textReceived, this, &BackendClient::handleText);

    m_connectTimer.setSingleShot(true);
    connect(&m_connectTimer, &QTimer::timeout, this, &BackendClient::handleConnectTimeout);
    connect(&m_keepaliveTimer, &QTimer::timeout, this, &BackendClient::sendKeepalive);
}

BackendClient::~BackendClient()
{
    // Nobody is left to observe callbacks: detach quietly.
    m_channel->disconnect(this);
    m_connectTimer.stop();
    m_keepaliveTimer.stop();
    const auto replies = m_pending;
    m_pending.clear();
    for (QNetworkReply* reply : replies) {
        reply->disconnect(this);
        reply->abort();
    }
    m_waiters.clear();
}

void BackendClient::setConfig(const BackendConfig& config)
{
    reset();
    m_config = config;
}

void BackendClient::connectEvents(ConnectCallback done)
{
    if (m_state == ChannelState::Open) {
        if (done) done(true);
        return;
    }
    if (done) m_waiters.append(std::move(done));
    if (m_state == ChannelState::Connecting) return;

    m_state = ChannelState::Connecting;
    m_intentionalClose = false;
    m_connectTimer.start(m_config.connectTimeoutMs);
    qDebug() << "BackendClient: opening event channel" << m_config.eventsUrl().toString();
    m_channel->open(m_config.eventsUrl());
}

void BackendClient::disconnectEvents()
{
    m_intentionalClose = true;
    m_connectTimer.stop();
    m_keepaliveTimer.stop();
    const bool active = (m_state != ChannelState::Idle);
    m_state = ChannelState::Idle;
    resolveWaiters(false);
    if (active) m_channel->close();
}

void BackendClient::reset()
{
    disconnectEvents();
    const auto replies = m_pending;
    for (QNetworkReply* reply : replies) {
        // finished() fires synchronously and resolves the callback.
        reply->abort();
    }
}

void BackendClient::sendCommand(const QByteArray& method,
                                const QString& path,
                                const QJsonDocument& body,
                                CommandCallback done)
{
    request(method, path, body, m_config.commandTimeoutMs, std::move(done));
}

void BackendClient::ping(std::function<void(bool)> done)
{
    request("GET", QStringLiteral("/ping"), QJsonDocument(), m_config.pingTimeoutMs,
            [done = std::move(done)](const CommandResult& result) {
        if (done) done(result.httpStatus >= 200 && result.httpStatus < 300);
    });
}

void BackendClient::fetchStatus(std::function<void(std::optional<BackendStatus>)> done)
{
    sendCommand("GET", QStringLiteral("/api/status"), QJsonDocument(),
                [done = std::move(done)](const CommandResult& result) {
        if (!done) return;
        if (!result.ok || !result.json.isObject()) {
            qWarning() << "BackendClient: status request failed:" << result.error;
            done(std::nullopt);
            return;
        }
        done(BackendStatus::fromJson(result.json.object()));
    });
}

void BackendClient::listQueues(std::function<void(QVector<QueueInfo>)> done)
{
    sendCommand("GET", QStringLiteral("/api/queues"), QJsonDocument(),
                [done = std::move(done)](const CommandResult& result) {
        if (!done) return;
        QVector<QueueInfo> queues;
        if (!result.ok || !result.json.isArray()) {
            qWarning() << "BackendClient: queue list request failed:" << result.error;
            done(queues);
            return;
        }
        for (const QJsonValue& v : result.json.array()) {
            if (!v.isObject()) continue;
            if (auto queue = QueueInfo::fromJson(v.toObject())) queues.append(*queue);
        }
        done(queues);
    });
}

void BackendClient::listDownloads(std::function<void(QVector<Download>)> done)
{
    fetchDownloads([done = std::move(done)](std::optional<QVector<Download>> downloads) {
        if (done) done(downloads.value_or(QVector<Download>()));
    });
}

void BackendClient::fetchDownloads(std::function<void(std::optional<QVector<Download>>)> done)
{
    sendCommand("GET", QStringLiteral("/api/downloads"), QJsonDocument(),
                [done = std::move(done)](const CommandResult& result) {
        if (!done) return;
        if (!result.ok || !result.json.isArray()) {
            qWarning() << "BackendClient: download list request failed:" << result.error;
            done(std::nullopt);
            return;
        }
        QVector<Download> downloads;
        for (const QJsonValue& v : result.json.array()) {
            if (!v.isObject()) continue;
            if (auto download = Download::fromJson(v.toObject())) downloads.append(*download);
        }
        done(downloads);
    });
}

void BackendClient::addDownload(const AddDownloadRequest& request,
                                std::function<void(const AddDownloadResult&)> done)
{
    sendCommand("POST", QStringLiteral("/api/downloads"), QJsonDocument(request.toJson()),
                [done = std::move(done)](const CommandResult& result) {
        if (!done) return;
        AddDownloadResult out;
        if (!result.ok) {
            out.error = result.error;
            done(out);
            return;
        }
        const QJsonObject obj = result.json.object();
        out.success = obj.value(QStringLiteral("success")).toBool();
        out.error = obj.value(QStringLiteral("error")).toString();
        const QJsonValue entity = obj.value(QStringLiteral("download"));
        if (entity.isObject()) out.download = Download::fromJson(entity.toObject());
        done(out);
    });
}

void BackendClient::pauseDownload(const QString& id, std::function<void(const ControlResult&)> done)
{
    control(id, QStringLiteral("pause"), std::move(done));
}

void BackendClient::resumeDownload(const QString& id, std::function<void(const ControlResult&)> done)
{
    control(id, QStringLiteral("resume"), std::move(done));
}

void BackendClient::cancelDownload(const QString& id, std::function<void(const ControlResult&)> done)
{
    control(id, QStringLiteral("cancel"), std::move(done));
}

void BackendClient::control(const QString& id, const QString& action, std::function<void(const ControlResult&)> done)
{
    const QString path = QStringLiteral("/api/downloads/%1/%2")
                             .arg(QString::fromUtf8(QUrl::toPercentEncoding(id)), action);
    sendCommand("POST", path, QJsonDocument(), [done = std::move(done)](const CommandResult& result) {
        if (done) done(controlResultFrom(result));
    });
}

void BackendClient::request(const QByteArray& method,
                            const QString& path,
                            const QJsonDocument& body,
                            int timeoutMs,
                            CommandCallback done)
{
    QNetworkRequest req{m_config.commandUrl(path)};
    req.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    req.setRawHeader("User-Agent", "dlsync/1.0");
    req.setTransferTimeout(timeoutMs);

    const QByteArray payload = body.isNull() ? QByteArray() : body.toJson(QJsonDocument::Compact);
    QNetworkReply* reply = nullptr;
    if (method == "GET") {
        reply = m_net.get(req);
    } else if (method == "POST") {
        reply = m_net.post(req, payload);
    } else {
        reply = m_net.sendCustomRequest(req, method, payload);
    }
    m_pending.insert(reply);

    // The transfer timeout only catches stalls; this bounds the whole request.
    auto* deadline = new QTimer(reply);
    deadline->setSingleShot(true);
    connect(deadline, &QTimer::timeout, reply, [reply]() {
        reply->setProperty("dlsyncTimedOut", true);
        reply->abort();
    });
    deadline->start(timeoutMs);

    connect(reply, &QNetworkReply::finished, this, [this, reply, timeoutMs, done = std::move(done)]() {
        m_pending.remove(reply);
        reply->deleteLater();

        CommandResult result;
        const bool timedOut = reply->property("dlsyncTimedOut").toBool();
        result.httpStatus = timedOut ? 0 : reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const QByteArray data = reply->readAll();

        if (result.httpStatus == 0) {
            result.kind = CommandResult::Failure::Transport;
            result.error = timedOut ? QStringLiteral("Request timed out after %1 ms").arg(timeoutMs)
                                    : reply->errorString();
            qDebug() << "BackendClient: transport failure on" << reply->url().path() << result.error;
        } else if (result.httpStatus < 200 || result.httpStatus >= 300) {
            result.kind = CommandResult::Failure::Http;
            result.error = QString::fromUtf8(data).trimmed();
            if (result.error.isEmpty()) result.error = QStringLiteral("HTTP %1").arg(result.httpStatus);
        } else if (data.trimmed().isEmpty()) {
            result.ok = true;
        } else {
            QJsonParseError err;
            result.json = QJsonDocument::fromJson(data, &err);
            if (err.error != QJsonParseError::NoError) {
                result.kind = CommandResult::Failure::Decode;
                result.error = err.errorString();
                result.json = QJsonDocument();
            } else {
                result.ok = true;
            }
        }
        if (done) done(result);
    });
}

void BackendClient::handleOpened()
{
    if (m_state != ChannelState::Connecting) {
        // Opened after a timeout or an intentional close: not wanted anymore.
        m_channel->close();
        return;
    }
    m_connectTimer.stop();
    m_state = ChannelState::Open;
    m_keepaliveTimer.start(m_config.keepaliveIntervalMs);
    qDebug() << "BackendClient: event channel open";
    resolveWaiters(true);
    emit connected();
}

void BackendClient::handleClosed()
{
    const bool wasOpen = (m_state == ChannelState::Open);
    m_connectTimer.stop();
    m_keepaliveTimer.stop();
    m_state = ChannelState::Idle;
    resolveWaiters(false);
    if (wasOpen && !m_intentionalClose) {
        qWarning() << "BackendClient: event channel closed unexpectedly";
        emit disconnected();
    }
}

void BackendClient::handleFailed(const QString& reason)
{
    qWarning() << "BackendClient: event channel error:" << reason;
    if (m_state != ChannelState::Connecting) return;
    m_connectTimer.stop();
    m_state = ChannelState::Idle;
    resolveWaiters(false);
    m_channel->close();
}

void BackendClient::handleConnectTimeout()
{
    if (m_state != ChannelState::Connecting) return;
    qWarning() << "BackendClient: event channel connect timed out after" << m_config.connectTimeoutMs << "ms";
    m_state = ChannelState::Idle;
    resolveWaiters(false);
    m_channel->close();
}

void BackendClient::handleText(const QString& text)
{
    const QByteArray frame = text.toUtf8();
    if (dlsync::events::isKeepaliveFrame(frame)) return;

    QString error;
    const std::optional<BackendEvent> event = dlsync::events::decodeFrame(frame, &error);
    if (!event) {
        qWarning() << "BackendClient: dropping undecodable frame:" << error;
        return;
    }
    if (const auto* backendFailure = std::get_if<ErrorEvent>(&*event)) {
        const QString message = backendFailure->message.isEmpty() ? QStringLiteral("Unknown error")
                                                                   : backendFailure->message;
        emit backendError(message);
        return;
    }
    emit eventReceived(*event);
}

void BackendClient::sendKeepalive()
{
    if (m_state != ChannelState::Open) return;
    if (m_channel->sendText(QStringLiteral("ping"))) return;
    qWarning() << "BackendClient: keepalive send failed, closing event channel";
    m_channel->close();
}

void BackendClient::resolveWaiters(bool ok)
{
    const QList<ConnectCallback> waiters = std::exchange(m_waiters, {});
    for (const ConnectCallback& waiter : waiters) waiter(ok);
}
