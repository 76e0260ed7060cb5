/**
 * @file mocktaskstore.h
 * @brief In-memory task store for engine tests.
 */

#ifndef MOCKTASKSTORE_H
#define MOCKTASKSTORE_H

#include <QHash>
#include <QStringList>

#include "services/itaskstore.h"

/**
 * @brief Mock persistence gateway keeping everything in memory.
 *
 * Records every deleteFile() and deleteMetadata() call so tests can check
 * exactly-once semantics, and can be told to fail writes.
 */
class MockTaskStore : public ITaskStore
{
public:
    MockTaskStore() = default;
    ~MockTaskStore() override = default;

    /// @name ITaskStore Implementation
    /// @{
    bool initialize() override;
    [[nodiscard]] QList<DownloadTask> loadAllTasks() override { return savedTasks_; }
    bool saveAllTasks(const QList<DownloadTask> &tasks) override;

    bool deleteFile(const QString &filePath) override;
    [[nodiscard]] bool fileExists(const QString &filePath) const override { return files_.contains(filePath); }
    [[nodiscard]] QString filePathFor(const QString &fileName) const override { return "/mock/downloads/" + fileName; }
    [[nodiscard]] qint64 availableBytes() const override { return availableBytes_; }

    bool saveMetadata(const DownloadTask &task) override;
    [[nodiscard]] std::optional<FileMetadata> metadata(const QString &taskId) const override;
    bool deleteMetadata(const QString &taskId) override;

    int cleanupFailedDownloads(const QList<DownloadTask> &tasks) override;
    /// @}

    /// @name Mock Control Methods
    /// @{
    void mockSetTasks(const QList<DownloadTask> &tasks) { savedTasks_ = tasks; }
    void mockSetAvailableBytes(qint64 bytes) { availableBytes_ = bytes; }
    void mockSetSaveFails(bool fails) { saveFails_ = fails; }
    void mockAddFile(const QString &filePath) { files_.append(filePath); }
    /// @}

    /// @name Test Inspection Methods
    /// @{
    [[nodiscard]] QList<DownloadTask> mockSavedTasks() const { return savedTasks_; }
    [[nodiscard]] int mockSaveCount() const { return saveCount_; }
    [[nodiscard]] int mockInitializeCount() const { return initializeCount_; }
    [[nodiscard]] QStringList mockDeletedFiles() const { return deletedFiles_; }
    [[nodiscard]] QStringList mockDeletedMetadata() const { return deletedMetadata_; }
    [[nodiscard]] bool mockHasMetadata(const QString &taskId) const { return metadata_.contains(taskId); }
    /// @}

private:
    QList<DownloadTask> savedTasks_;
    QHash<QString, FileMetadata> metadata_;
    QStringList files_;
    QStringList deletedFiles_;
    QStringList deletedMetadata_;

    qint64 availableBytes_ = -1;
    bool saveFails_ = false;
    int saveCount_ = 0;
    int initializeCount_ = 0;
};

#endif // MOCKTASKSTORE_H
