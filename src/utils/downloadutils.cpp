#include "downloadutils.h"

#include <QRandomGenerator>
#include <QUrl>

#include <algorithm>
#include <cmath>

QString DownloadUtils::generateTaskId()
{
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    QString suffix;
    suffix.reserve(9);
    for (int i = 0; i < 9; ++i) {
        suffix.append(QLatin1Char(alphabet[QRandomGenerator::global()->bounded(36)]));
    }

    return QString("task_%1_%2").arg(QDateTime::currentMSecsSinceEpoch()).arg(suffix);
}

QString DownloadUtils::replaceUnsafeCharacters(const QString &name)
{
    QString result = name;
    for (QChar &ch : result) {
        const char16_t c = ch.unicode();
        const bool safe = (c >= u'a' && c <= u'z') || (c >= u'A' && c <= u'Z') ||
                          (c >= u'0' && c <= u'9') || c == u'.' || c == u'_' || c == u'-';
        if (!safe) {
            ch = QLatin1Char('_');
        }
    }
    return result;
}

bool DownloadUtils::isDotsOnly(const QString &name)
{
    return std::all_of(name.cbegin(), name.cend(), [](QChar ch) { return ch == QLatin1Char('.'); });
}

QString DownloadUtils::sanitizeFileName(const QString &url, const QString &customName)
{
    // "." and ".." would name a directory
    if (!customName.isEmpty() && !isDotsOnly(customName)) {
        return replaceUnsafeCharacters(customName);
    }

    QUrl parsed(url);
    if (!parsed.isValid()) {
        return QString("download_%1.mp4").arg(QDateTime::currentMSecsSinceEpoch());
    }

    QString name = parsed.fileName();
    if (isDotsOnly(name)) {
        name = QString("download_%1").arg(QDateTime::currentMSecsSinceEpoch());
    }

    name = replaceUnsafeCharacters(name);
    if (!name.contains('.')) {
        name += ".mp4";
    }
    return name;
}

QString DownloadUtils::numberedFileName(const QString &fileName, int n)
{
    const int dot = fileName.lastIndexOf(QLatin1Char('.'));
    if (dot <= 0) {
        return QString("%1_%2").arg(fileName).arg(n);
    }
    return QString("%1_%2%3").arg(fileName.left(dot)).arg(n).arg(fileName.mid(dot));
}

bool DownloadUtils::isValidDownloadUrl(const QString &url)
{
    QUrl parsed(url, QUrl::StrictMode);
    if (!parsed.isValid() || parsed.host().isEmpty()) {
        return false;
    }
    const QString scheme = parsed.scheme().toLower();
    return scheme == "http" || scheme == "https";
}

QString DownloadUtils::formatFileSize(qint64 bytes)
{
    if (bytes <= 0) {
        return "0 B";
    }

    static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }

    if (unit == 0) {
        return QString("%1 B").arg(bytes);
    }
    // Up to two decimals, trailing zeros dropped ("1.5 MB", "2 GB")
    return QString("%1 %2").arg(QString::number(value, 'g', value < 10 ? 3 : (value < 100 ? 4 : 5)),
                                QLatin1String(units[unit]));
}

qint64 DownloadUtils::calculateEta(qint64 bytesTransferred, qint64 bytesTotal,
                                   const QDateTime &startedAt, const QDateTime &now)
{
    if (bytesTransferred <= 0 || bytesTotal <= 0 || !startedAt.isValid()) {
        return 0;
    }

    const qint64 elapsedMs = startedAt.msecsTo(now);
    if (elapsedMs <= 0) {
        return 0;
    }

    const double bytesPerSecond = bytesTransferred / (elapsedMs / 1000.0);
    const qint64 remaining = std::max<qint64>(0, bytesTotal - bytesTransferred);
    return static_cast<qint64>(std::ceil(remaining / bytesPerSecond));
}

QString DownloadUtils::formatEta(qint64 seconds)
{
    if (seconds < 60) {
        return QString("%1s").arg(std::max<qint64>(0, seconds));
    }
    if (seconds < 3600) {
        return QString("%1m %2s").arg(seconds / 60).arg(seconds % 60);
    }
    return QString("%1h %2m").arg(seconds / 3600).arg((seconds % 3600) / 60);
}

bool DownloadUtils::hasEnoughStorage(qint64 requiredBytes, qint64 availableBytes)
{
    // Unknown free space never blocks a download
    if (availableBytes < 0) {
        return true;
    }
    return availableBytes >= requiredBytes + StorageSafetyMargin;
}
