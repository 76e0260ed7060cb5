/**
 * @file jsontaskstore.cpp
 * @brief Implementation of the JsonTaskStore persistence gateway.
 */

#include "jsontaskstore.h"
#include "utils/logging.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStorageInfo>

JsonTaskStore::JsonTaskStore(const QString &dataDirectory, const QString &downloadDirectory)
    : dataDirectory_(QDir::cleanPath(dataDirectory))
    , downloadDirectory_(downloadDirectory.isEmpty()
                             ? QDir::cleanPath(dataDirectory + "/downloads")
                             : QDir::cleanPath(downloadDirectory))
{
}

QString JsonTaskStore::tasksFilePath() const
{
    return dataDirectory_ + "/tasks.json";
}

QString JsonTaskStore::metadataFilePath() const
{
    return dataDirectory_ + "/metadata.json";
}

bool JsonTaskStore::initialize()
{
    QDir dir;
    if (!dir.mkpath(dataDirectory_)) {
        qWarning() << "JsonTaskStore: Cannot create data directory" << dataDirectory_;
        return false;
    }
    if (!dir.mkpath(downloadDirectory_)) {
        qWarning() << "JsonTaskStore: Cannot create download directory" << downloadDirectory_;
        return false;
    }
    LOG_VERBOSE() << "JsonTaskStore: Using" << dataDirectory_ << "downloads in" << downloadDirectory_;
    return true;
}

QJsonDocument JsonTaskStore::readDocument(const QString &path) const
{
    QFile file(path);
    if (!file.exists()) {
        return QJsonDocument();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "JsonTaskStore: Cannot open" << path << ":" << file.errorString();
        return QJsonDocument();
    }

    QJsonParseError parseError;
    QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "JsonTaskStore: Malformed JSON in" << path << ":" << parseError.errorString();
        return QJsonDocument();
    }
    return document;
}

bool JsonTaskStore::writeDocument(const QString &path, const QJsonDocument &document)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "JsonTaskStore: Cannot write" << path << ":" << file.errorString();
        return false;
    }

    const QByteArray data = document.toJson(QJsonDocument::Compact);
    if (file.write(data) != data.size()) {
        qWarning() << "JsonTaskStore: Short write to" << path << ":" << file.errorString();
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        qWarning() << "JsonTaskStore: Cannot commit" << path << ":" << file.errorString();
        return false;
    }
    return true;
}

QList<DownloadTask> JsonTaskStore::loadAllTasks()
{
    QList<DownloadTask> tasks;

    const QJsonDocument document = readDocument(tasksFilePath());
    if (!document.isArray()) {
        return tasks;
    }

    const QJsonArray records = document.array();
    for (const QJsonValue &record : records) {
        bool ok = false;
        DownloadTask task = DownloadTask::fromJson(record.toObject(), &ok);
        if (!ok) {
            qWarning() << "JsonTaskStore: Skipping malformed task record";
            continue;
        }
        tasks.append(task);
    }

    LOG_VERBOSE() << "JsonTaskStore: Loaded" << tasks.size() << "tasks";
    return tasks;
}

bool JsonTaskStore::saveAllTasks(const QList<DownloadTask> &tasks)
{
    QJsonArray records;
    for (const DownloadTask &task : tasks) {
        records.append(task.toJson());
    }
    return writeDocument(tasksFilePath(), QJsonDocument(records));
}

bool JsonTaskStore::deleteFile(const QString &filePath)
{
    if (filePath.isEmpty() || !QFile::exists(filePath)) {
        return false;
    }
    if (!QFile::remove(filePath)) {
        qWarning() << "JsonTaskStore: Failed to delete" << filePath;
        return false;
    }
    LOG_VERBOSE() << "JsonTaskStore: Deleted" << filePath;
    return true;
}

bool JsonTaskStore::fileExists(const QString &filePath) const
{
    return QFileInfo::exists(filePath);
}

QString JsonTaskStore::filePathFor(const QString &fileName) const
{
    return downloadDirectory_ + "/" + fileName;
}

qint64 JsonTaskStore::availableBytes() const
{
    QStorageInfo storage(downloadDirectory_);
    if (!storage.isValid() || !storage.isReady()) {
        return -1;
    }
    return storage.bytesAvailable();
}

bool JsonTaskStore::saveMetadata(const DownloadTask &task)
{
    QJsonObject all = readDocument(metadataFilePath()).object();

    QJsonObject entry;
    entry["taskId"] = task.id;
    entry["filePath"] = task.filePath;
    entry["url"] = task.url;
    entry["savedAt"] = static_cast<double>(QDateTime::currentMSecsSinceEpoch());
    all[task.id] = entry;

    return writeDocument(metadataFilePath(), QJsonDocument(all));
}

std::optional<FileMetadata> JsonTaskStore::metadata(const QString &taskId) const
{
    const QJsonObject all = readDocument(metadataFilePath()).object();
    if (!all.value(taskId).isObject()) {
        return std::nullopt;
    }

    const QJsonObject entry = all.value(taskId).toObject();
    FileMetadata result;
    result.taskId = entry.value("taskId").toString(taskId);
    result.filePath = entry.value("filePath").toString();
    result.url = entry.value("url").toString();
    result.savedAt = QDateTime::fromMSecsSinceEpoch(
        static_cast<qint64>(entry.value("savedAt").toDouble()));
    return result;
}

bool JsonTaskStore::deleteMetadata(const QString &taskId)
{
    QJsonObject all = readDocument(metadataFilePath()).object();
    if (!all.contains(taskId)) {
        return true;
    }
    all.remove(taskId);
    return writeDocument(metadataFilePath(), QJsonDocument(all));
}

int JsonTaskStore::cleanupFailedDownloads(const QList<DownloadTask> &tasks)
{
    int deleted = 0;
    for (const DownloadTask &task : tasks) {
        if (task.state != TaskState::Failed && task.state != TaskState::Cancelled) {
            continue;
        }
        if (deleteFile(task.filePath)) {
            ++deleted;
        }
        if (!deleteMetadata(task.id)) {
            qWarning() << "JsonTaskStore: Failed to drop metadata for" << task.id;
        }
    }

    if (deleted > 0) {
        qInfo() << "JsonTaskStore: Cleaned up" << deleted << "failed downloads";
    }
    return deleted;
}
