/**
 * @file jsontaskstore.h
 * @brief File system persistence of the task registry and file metadata.
 */

#ifndef JSONTASKSTORE_H
#define JSONTASKSTORE_H

#include <QJsonDocument>
#include <QString>

#include "itaskstore.h"

/**
 * @brief ITaskStore backed by JSON files.
 *
 * Layout:
 * - `<dataDirectory>/tasks.json`: array of task records
 * - `<dataDirectory>/metadata.json`: object keyed by task id
 * - `<downloadDirectory>/`: downloaded files
 *
 * The download directory defaults to `<dataDirectory>/downloads`. Every
 * write goes through QSaveFile, so a failed write leaves the previous
 * snapshot intact.
 */
class JsonTaskStore : public ITaskStore
{
public:
    explicit JsonTaskStore(const QString &dataDirectory,
                           const QString &downloadDirectory = QString());
    ~JsonTaskStore() override = default;

    bool initialize() override;

    [[nodiscard]] QList<DownloadTask> loadAllTasks() override;
    bool saveAllTasks(const QList<DownloadTask> &tasks) override;

    bool deleteFile(const QString &filePath) override;
    [[nodiscard]] bool fileExists(const QString &filePath) const override;
    [[nodiscard]] QString filePathFor(const QString &fileName) const override;
    [[nodiscard]] qint64 availableBytes() const override;

    bool saveMetadata(const DownloadTask &task) override;
    [[nodiscard]] std::optional<FileMetadata> metadata(const QString &taskId) const override;
    bool deleteMetadata(const QString &taskId) override;

    int cleanupFailedDownloads(const QList<DownloadTask> &tasks) override;

    [[nodiscard]] QString dataDirectory() const { return dataDirectory_; }
    [[nodiscard]] QString downloadDirectory() const { return downloadDirectory_; }
    [[nodiscard]] QString tasksFilePath() const;
    [[nodiscard]] QString metadataFilePath() const;

private:
    [[nodiscard]] QJsonDocument readDocument(const QString &path) const;
    bool writeDocument(const QString &path, const QJsonDocument &document);

    QString dataDirectory_;
    QString downloadDirectory_;
};

#endif // JSONTASKSTORE_H
