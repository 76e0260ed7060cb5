#ifndef DOWNLOADUTILS_H
#define DOWNLOADUTILS_H

#include <QDateTime>
#include <QString>

/**
 * @brief Helpers for naming, validating and describing downloads
 *
 * All functions are pure apart from generateTaskId() and the clock reads
 * in sanitizeFileName() and calculateEta().
 */
class DownloadUtils
{
public:
    /// Free space required on top of the expected file size
    static constexpr qint64 StorageSafetyMargin = 100LL * 1024 * 1024;

    /**
     * @brief Allocate a new task identifier
     * @return An id of the form "task_<msecs>_<9 random base-36 chars>"
     */
    static QString generateTaskId();

    /**
     * @brief Derive a safe local file name for a download
     * @param url Source address
     * @param customName Optional caller-supplied name, used as is once sanitized
     * @return Name restricted to [A-Za-z0-9._-]
     *
     * Without a custom name the last path segment of @p url is used.
     * An empty segment becomes "download_<msecs>", and a name with no
     * extension gets ".mp4" appended. A custom name made only of dots is
     * ignored.
     */
    static QString sanitizeFileName(const QString &url, const QString &customName = QString());

    /// @brief "clip.mp4" with @p n = 2 gives "clip_2.mp4"
    static QString numberedFileName(const QString &fileName, int n);

    /// @brief True for well-formed http and https URLs with a host
    static bool isValidDownloadUrl(const QString &url);

    /// @brief Human readable size, e.g. "1.5 MB"
    static QString formatFileSize(qint64 bytes);

    /**
     * @brief Estimate remaining seconds from the average rate so far
     * @return Seconds remaining, or 0 when nothing is known yet
     */
    static qint64 calculateEta(qint64 bytesTransferred, qint64 bytesTotal,
                               const QDateTime &startedAt,
                               const QDateTime &now = QDateTime::currentDateTimeUtc());

    /// @brief Format seconds as "42s", "3m 5s" or "2h 10m"
    static QString formatEta(qint64 seconds);

    /// @brief True if @p availableBytes covers @p requiredBytes plus the safety margin
    static bool hasEnoughStorage(qint64 requiredBytes, qint64 availableBytes);

private:
    static QString replaceUnsafeCharacters(const QString &name);
    static bool isDotsOnly(const QString &name);
};

#endif // DOWNLOADUTILS_H
