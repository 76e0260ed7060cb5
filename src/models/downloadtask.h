/**
 * @file downloadtask.h
 * @brief Task record, lifecycle states and error taxonomy for downloads.
 *
 * A DownloadTask is a plain value type. The DownloadManager owns the
 * authoritative copy of every task; callers only ever see copies.
 */

#ifndef DOWNLOADTASK_H
#define DOWNLOADTASK_H

#include <QByteArray>
#include <QDateTime>
#include <QJsonObject>
#include <QMap>
#include <QMetaType>
#include <QString>

#include <optional>

/**
 * @brief Lifecycle state of a download task.
 *
 * Completed and Cancelled are terminal. Paused and Failed can be resumed.
 */
enum class TaskState {
    Pending,    ///< Waiting in the queue for a concurrency slot
    Active,     ///< Transfer in progress
    Paused,     ///< Stopped by the user or by a connectivity loss
    Completed,  ///< File fully downloaded
    Failed,     ///< Transfer failed, see DownloadTask::lastError
    Cancelled   ///< Cancelled by the user (never kept in the registry)
};

/**
 * @brief Failure classes recorded on a failed task.
 */
enum class DownloadErrorCode {
    InvalidUrl,           ///< Malformed or non-http(s) address
    NetworkError,         ///< Connectivity or transport failure
    Timeout,              ///< Transfer stalled past the configured timeout
    ServerError,          ///< Server answered with an HTTP error status
    FileSystemError,      ///< Destination file could not be written
    InsufficientStorage,  ///< Not enough free space for the expected size
    Cancelled,            ///< Transfer aborted on request
    Unknown               ///< Anything else
};

/// @brief Convert TaskState to its persisted string form.
[[nodiscard]] QString taskStateToString(TaskState state);

/// @brief Parse a persisted state string. Unknown strings yield std::nullopt.
[[nodiscard]] std::optional<TaskState> taskStateFromString(const QString &text);

/// @brief Convert an error code to its persisted string form (e.g. "NETWORK_ERROR").
[[nodiscard]] QString errorCodeToString(DownloadErrorCode code);

/// @brief Parse a persisted error code. Unrecognized codes map to Unknown.
[[nodiscard]] DownloadErrorCode errorCodeFromString(const QString &text);

/**
 * @brief True if the error is attributed to connectivity loss.
 *
 * Only network-class failures are retried automatically, both after
 * a short delay and when connectivity comes back.
 */
[[nodiscard]] bool isNetworkClassError(DownloadErrorCode code);

/// @brief True for Completed and Cancelled.
[[nodiscard]] inline bool isTerminalState(TaskState state)
{
    return state == TaskState::Completed || state == TaskState::Cancelled;
}

/**
 * @brief Error details stored on a failed task.
 */
struct DownloadError {
    DownloadErrorCode code = DownloadErrorCode::Unknown;
    QString message;
    QDateTime timestamp;
    int retryCount = 0;  ///< Automatic retries already spent on this failure streak

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static DownloadError fromJson(const QJsonObject &json);
};

/**
 * @brief Options accepted when submitting a new download.
 */
struct DownloadOptions {
    QString fileName;                ///< Optional custom file name (sanitized)
    QMap<QString, QString> headers;  ///< Passed through to the transfer client
    int priority = 0;                ///< Higher priority is admitted first
};

/**
 * @brief One requested transfer and its lifecycle state.
 */
struct DownloadTask {
    QString id;
    QString url;
    QString fileName;
    QString filePath;
    TaskState state = TaskState::Pending;

    int progress = 0;            ///< 0-100, left unchanged while the size is unknown
    qint64 bytesTransferred = 0;
    qint64 bytesTotal = 0;       ///< 0 until the transfer reports a size

    QDateTime createdAt;
    QDateTime startedAt;         ///< Invalid until the first start
    QDateTime completedAt;       ///< Invalid until completion

    std::optional<DownloadError> lastError;
    QByteArray resumeToken;      ///< Opaque, owned by the transfer client

    int priority = 0;
    QMap<QString, QString> headers;
    int retryCount = 0;

    [[nodiscard]] bool isFinished() const { return isTerminalState(state); }

    /// @name Persistence
    /// @{
    [[nodiscard]] QJsonObject toJson() const;

    /**
     * @brief Builds a task from a persisted record.
     * @param json The record.
     * @param ok Set to false if required fields are missing or malformed.
     */
    [[nodiscard]] static DownloadTask fromJson(const QJsonObject &json, bool *ok = nullptr);
    /// @}
};

Q_DECLARE_METATYPE(DownloadTask)
Q_DECLARE_METATYPE(TaskState)
Q_DECLARE_METATYPE(DownloadError)
Q_DECLARE_METATYPE(DownloadErrorCode)

#endif // DOWNLOADTASK_H
