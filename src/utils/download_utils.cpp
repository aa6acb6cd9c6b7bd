module;
#include <QFileInfo>
#include <QRegularExpression>
#include <QUrlQuery>
#include <QtGlobal>

module dlsync.utils.download_utils;

namespace dlsync::utils {

QString normalizeFilePath(const QString& path)
{
    const QString trimmed = path.trimmed();
    if (trimmed.startsWith("file://")) {
        QUrl url(trimmed);
        if (url.isValid() && url.isLocalFile()) {
            return url.toLocalFile();
        }
    }
    return trimmed;
}

QString decodeQueryValue(const QString& value)
{
    QString v = value;
    v.replace('+', ' ');
    return QUrl::fromPercentEncoding(v.toUtf8());
}

QString filenameFromDisposition(const QString& value)
{
    const QString decoded = decodeQueryValue(value);
    if (decoded.isEmpty()) return QString();
    static const QRegularExpression re(QStringLiteral("filename\\*?=(?:UTF-8''|\"?)([^\";]+)"));
    auto match = re.match(decoded);
    if (match.hasMatch()) return match.captured(1).trimmed();
    return QString();
}

QString fileNameFromUrl(const QUrl& url)
{
    if (!url.isValid()) return QString();
    QUrlQuery query(url);
    QString disp = query.queryItemValue(QStringLiteral("response-content-disposition"));
    if (disp.isEmpty()) disp = query.queryItemValue(QStringLiteral("content-disposition"));
    if (disp.isEmpty()) disp = query.queryItemValue(QStringLiteral("rscd"));
    if (!disp.isEmpty()) {
        const QString fromDisp = filenameFromDisposition(disp);
        if (!fromDisp.isEmpty()) return fromDisp;
    }
    const QString filename = query.queryItemValue(QStringLiteral("filename"));
    if (!filename.isEmpty()) return decodeQueryValue(filename);

    return QFileInfo(url.path()).fileName();
}

QString normalizeHost(const QString& host)
{
    QString h = host.trimmed().toLower();
    if (h.isEmpty()) return QString();
    if (h.contains("://")) {
        QUrl u(h);
        if (u.isValid()) h = u.host().toLower();
    }
    const int slash = h.indexOf('/');
    if (slash >= 0) h = h.left(slash);
    // host:port, but leave bare IPv6 literals alone.
    const int colon = h.lastIndexOf(':');
    if (colon > 0 && h.indexOf(':') == colon) h = h.left(colon);
    return h;
}

QString formatBytes(qint64 bytes)
{
    if (bytes < 0) return QStringLiteral("?");
    static const char* units[] = { "B", "KB", "MB", "GB", "TB" };
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) return QStringLiteral("%1 B").arg(bytes);
    return QStringLiteral("%1 %2").arg(value, 0, 'f', 1).arg(QLatin1String(units[unit]));
}

QString formatDuration(qint64 seconds)
{
    if (seconds < 0) return QStringLiteral("--");
    const qint64 h = seconds / 3600;
    const qint64 m = (seconds % 3600) / 60;
    const qint64 s = seconds % 60;
    if (h > 0) return QStringLiteral("%1h %2m").arg(h).arg(m, 2, 10, QLatin1Char('0'));
    if (m > 0) return QStringLiteral("%1m %2s").arg(m).arg(s, 2, 10, QLatin1Char('0'));
    return QStringLiteral("%1s").arg(s);
}

} // namespace dlsync::utils
