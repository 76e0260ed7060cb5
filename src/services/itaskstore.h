/**
 * @file itaskstore.h
 * @brief Interface for task and file metadata persistence.
 */

#ifndef ITASKSTORE_H
#define ITASKSTORE_H

#include <QDateTime>
#include <QList>
#include <QString>

#include <optional>

#include "models/downloadtask.h"

/**
 * @brief Per-task record of where its file lives.
 */
struct FileMetadata {
    QString taskId;
    QString filePath;
    QString url;
    QDateTime savedAt;
};

/**
 * @brief Abstract persistence gateway used by the download engine.
 *
 * Writes are treated as synchronous. They report failure through their
 * return value; the caller logs it and keeps its in-memory state.
 *
 * @par Example usage:
 * @code
 * ITaskStore *store = new JsonTaskStore(dataDir, downloadDir);
 * store->initialize();
 * QList<DownloadTask> tasks = store->loadAllTasks();
 * ...
 * if (!store->saveAllTasks(tasks)) {
 *     qWarning() << "Failed to persist tasks";
 * }
 * @endcode
 */
class ITaskStore
{
public:
    virtual ~ITaskStore() = default;

    /// @brief Ensures the storage locations exist. Safe to call repeatedly.
    virtual bool initialize() = 0;

    /// @name Task registry
    /// @{

    /// @brief Every persisted task. Malformed records are skipped.
    [[nodiscard]] virtual QList<DownloadTask> loadAllTasks() = 0;

    /// @brief Overwrites the persisted registry with @p tasks.
    virtual bool saveAllTasks(const QList<DownloadTask> &tasks) = 0;
    /// @}

    /// @name Files
    /// @{
    virtual bool deleteFile(const QString &filePath) = 0;
    [[nodiscard]] virtual bool fileExists(const QString &filePath) const = 0;

    /// @brief Destination path for a sanitized file name.
    [[nodiscard]] virtual QString filePathFor(const QString &fileName) const = 0;

    /// @brief Free bytes at the destination, or -1 if unknown.
    [[nodiscard]] virtual qint64 availableBytes() const = 0;
    /// @}

    /// @name File metadata
    /// @{
    virtual bool saveMetadata(const DownloadTask &task) = 0;
    [[nodiscard]] virtual std::optional<FileMetadata> metadata(const QString &taskId) const = 0;
    virtual bool deleteMetadata(const QString &taskId) = 0;
    /// @}

    /**
     * @brief Removes files and metadata of failed and cancelled tasks.
     * @return Number of files deleted.
     */
    virtual int cleanupFailedDownloads(const QList<DownloadTask> &tasks) = 0;
};

#endif // ITASKSTORE_H
