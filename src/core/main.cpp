#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QString>
#include <QStringList>
#include <QTextStream>
#include <QTimer>
#include <QVector>

import dlsync.core.syncsession;
import dlsync.utils.download_utils;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace utils = dlsync::utils;

static void printView(QTextStream& out, const DownloadStore& store, const SyncSession& session)
{
    const QVector<Download> rows = store.view();
    out << QStringLiteral("[%1] %2 download(s)")
               .arg(SyncSession::connectionStatusName(session.connectionStatus()))
               .arg(rows.size())
        << Qt::endl;
    for (const Download& d : rows) {
        const QString size = d.size ? utils::formatBytes(*d.size) : QStringLiteral("?");
        QString line = QStringLiteral("  %1 %2% %3 %4/s  %5")
                           .arg(downloadStatusName(d.status), -11)
                           .arg(qRound(d.progress() * 100.0), 3)
                           .arg(size, 10)
                           .arg(utils::formatBytes(d.speed), 10)
                           .arg(d.filename.isEmpty() ? d.url : d.filename);
        if (d.eta) line += QStringLiteral("  eta %1").arg(utils::formatDuration(*d.eta));
        if (!d.error.isEmpty()) line += QStringLiteral("  (%1)").arg(d.error);
        out << line << Qt::endl;
    }
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("dlsync"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Mirror the download backend and print its live state."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption hostOption(QStringLiteral("host"), QStringLiteral("Backend host."), QStringLiteral("host"));
    const QCommandLineOption portOption(QStringLiteral("port"), QStringLiteral("Backend port."), QStringLiteral("port"));
    const QCommandLineOption filterOption(QStringLiteral("filter"),
                                          QStringLiteral("all, active, completed, failed, queued or paused."),
                                          QStringLiteral("filter"));
    const QCommandLineOption searchOption(QStringLiteral("search"), QStringLiteral("Filename or URL substring."), QStringLiteral("query"));
    const QCommandLineOption sortOption(QStringLiteral("sort"),
                                        QStringLiteral("name, size, progress, date or status."),
                                        QStringLiteral("field"));
    const QCommandLineOption ascOption(QStringLiteral("asc"), QStringLiteral("Sort ascending."));
    const QCommandLineOption addOption(QStringLiteral("add"), QStringLiteral("Submit a URL (repeatable)."), QStringLiteral("url"));
    const QCommandLineOption onceOption(QStringLiteral("once"), QStringLiteral("Print the first snapshot and exit."));
    parser.addOptions({hostOption, portOption, filterOption, searchOption, sortOption, ascOption, addOption, onceOption});
    parser.process(app);

    BackendConfig config = loadBackendConfig();
    if (parser.isSet(hostOption)) {
        const QString host = utils::normalizeHost(parser.value(hostOption));
        if (!host.isEmpty()) config.host = host;
    }
    if (parser.isSet(portOption)) {
        bool ok = false;
        const uint port = parser.value(portOption).toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            qCritical() << "dlsync-monitor: invalid port" << parser.value(portOption);
            return 2;
        }
        config.port = static_cast<quint16>(port);
    }
    const bool once = parser.isSet(onceOption);
    if (once) config.autoReconnect = false;

    DownloadStore store;
    if (parser.isSet(filterOption)) {
        const auto filter = parseDownloadFilter(parser.value(filterOption));
        if (!filter) {
            qCritical() << "dlsync-monitor: unknown filter" << parser.value(filterOption);
            return 2;
        }
        store.setFilter(*filter);
    }
    if (parser.isSet(sortOption)) {
        const auto field = parseSortField(parser.value(sortOption));
        if (!field) {
            qCritical() << "dlsync-monitor: unknown sort field" << parser.value(sortOption);
            return 2;
        }
        store.setSortField(*field);
    }
    store.setSearchQuery(parser.value(searchOption));
    if (parser.isSet(ascOption)) store.setSortOrder(Qt::AscendingOrder);

    BackendClient client(config);
    SyncSession session(client, store);

    QTextStream out(stdout);

    // Store signals arrive in bursts; print at most once per interval.
    QTimer printTimer;
    printTimer.setSingleShot(true);
    printTimer.setInterval(500);
    QObject::connect(&printTimer, &QTimer::timeout, &app, [&]() { printView(out, store, session); });
    const auto schedulePrint = [&printTimer]() {
        if (!printTimer.isActive()) printTimer.start();
    };

    if (!once) {
        QObject::connect(&store, &DownloadStore::downloadAdded, &app, schedulePrint);
        QObject::connect(&store, &DownloadStore::downloadChanged, &app, schedulePrint);
        QObject::connect(&store, &DownloadStore::downloadRemoved, &app, schedulePrint);
        QObject::connect(&store, &DownloadStore::downloadsReset, &app, schedulePrint);
        QObject::connect(&session, &SyncSession::statusChanged, &app, schedulePrint);
    } else {
        QObject::connect(&session, &SyncSession::refreshed, &app, [&]() {
            printView(out, store, session);
            const bool reachable = session.connectionStatus() != SyncSession::ConnectionStatus::Disconnected;
            session.stop();
            QCoreApplication::exit(reachable ? 0 : 1);
        }, Qt::QueuedConnection);
    }

    QObject::connect(&session, &SyncSession::commandFailed, &app,
                     [](const QString& id, const QString& action, const QString& error) {
        qWarning() << "dlsync-monitor:" << action << id << "failed:" << error;
    });
    QObject::connect(&session.dispatcher(), &EventDispatcher::queueStarted, &app, [](const QString& id) {
        qInfo() << "dlsync-monitor: queue started" << id;
    });
    QObject::connect(&session.dispatcher(), &EventDispatcher::queueCompleted, &app, [](const QString& id) {
        qInfo() << "dlsync-monitor: queue completed" << id;
    });

    session.start();
    for (const QString& url : parser.values(addOption)) {
        AddDownloadRequest request;
        request.url = url;
        session.addDownload(request);
    }

    return app.exec();
}
