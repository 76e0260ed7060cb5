#include "downloadtask.h"

QString taskStateToString(TaskState state)
{
    switch (state) {
    case TaskState::Pending: return QStringLiteral("pending");
    case TaskState::Active: return QStringLiteral("downloading");
    case TaskState::Paused: return QStringLiteral("paused");
    case TaskState::Completed: return QStringLiteral("completed");
    case TaskState::Failed: return QStringLiteral("failed");
    case TaskState::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("pending");
}

std::optional<TaskState> taskStateFromString(const QString &text)
{
    static const TaskState allStates[] = {
        TaskState::Pending, TaskState::Active, TaskState::Paused,
        TaskState::Completed, TaskState::Failed, TaskState::Cancelled
    };
    for (TaskState state : allStates) {
        if (taskStateToString(state) == text) {
            return state;
        }
    }
    return std::nullopt;
}

QString errorCodeToString(DownloadErrorCode code)
{
    switch (code) {
    case DownloadErrorCode::InvalidUrl: return QStringLiteral("INVALID_URL");
    case DownloadErrorCode::NetworkError: return QStringLiteral("NETWORK_ERROR");
    case DownloadErrorCode::Timeout: return QStringLiteral("TIMEOUT");
    case DownloadErrorCode::ServerError: return QStringLiteral("SERVER_ERROR");
    case DownloadErrorCode::FileSystemError: return QStringLiteral("FILE_SYSTEM_ERROR");
    case DownloadErrorCode::InsufficientStorage: return QStringLiteral("INSUFFICIENT_STORAGE");
    case DownloadErrorCode::Cancelled: return QStringLiteral("CANCELLED");
    case DownloadErrorCode::Unknown: return QStringLiteral("UNKNOWN");
    }
    return QStringLiteral("UNKNOWN");
}

DownloadErrorCode errorCodeFromString(const QString &text)
{
    static const DownloadErrorCode allCodes[] = {
        DownloadErrorCode::InvalidUrl, DownloadErrorCode::NetworkError,
        DownloadErrorCode::Timeout, DownloadErrorCode::ServerError,
        DownloadErrorCode::FileSystemError, DownloadErrorCode::InsufficientStorage,
        DownloadErrorCode::Cancelled
    };
    for (DownloadErrorCode code : allCodes) {
        if (errorCodeToString(code) == text) {
            return code;
        }
    }
    return DownloadErrorCode::Unknown;
}

bool isNetworkClassError(DownloadErrorCode code)
{
    return code == DownloadErrorCode::NetworkError || code == DownloadErrorCode::Timeout;
}

namespace {

QJsonValue timestampToJson(const QDateTime &time)
{
    if (!time.isValid()) {
        return QJsonValue();
    }
    return QJsonValue(static_cast<double>(time.toMSecsSinceEpoch()));
}

QDateTime timestampFromJson(const QJsonValue &value)
{
    if (!value.isDouble()) {
        return QDateTime();
    }
    return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(value.toDouble()));
}

} // namespace

QJsonObject DownloadError::toJson() const
{
    QJsonObject json;
    json["code"] = errorCodeToString(code);
    json["message"] = message;
    json["timestamp"] = timestampToJson(timestamp);
    json["retryCount"] = retryCount;
    return json;
}

DownloadError DownloadError::fromJson(const QJsonObject &json)
{
    DownloadError error;
    error.code = errorCodeFromString(json.value("code").toString());
    error.message = json.value("message").toString();
    error.timestamp = timestampFromJson(json.value("timestamp"));
    error.retryCount = json.value("retryCount").toInt(0);
    return error;
}

QJsonObject DownloadTask::toJson() const
{
    QJsonObject json;
    json["id"] = id;
    json["url"] = url;
    json["fileName"] = fileName;
    json["filePath"] = filePath;
    json["state"] = taskStateToString(state);
    json["progress"] = progress;
    json["bytesTransferred"] = static_cast<double>(bytesTransferred);
    json["bytesTotal"] = static_cast<double>(bytesTotal);
    json["createdAt"] = timestampToJson(createdAt);
    if (startedAt.isValid()) {
        json["startedAt"] = timestampToJson(startedAt);
    }
    if (completedAt.isValid()) {
        json["completedAt"] = timestampToJson(completedAt);
    }
    if (lastError) {
        json["error"] = lastError->toJson();
    }
    if (!resumeToken.isEmpty()) {
        json["resumeToken"] = QString::fromLatin1(resumeToken.toBase64());
    }
    json["priority"] = priority;
    json["retryCount"] = retryCount;

    QJsonObject headerJson;
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        headerJson[it.key()] = it.value();
    }
    json["headers"] = headerJson;
    return json;
}

DownloadTask DownloadTask::fromJson(const QJsonObject &json, bool *ok)
{
    DownloadTask task;
    task.id = json.value("id").toString();
    task.url = json.value("url").toString();
    task.fileName = json.value("fileName").toString();
    task.filePath = json.value("filePath").toString();

    std::optional<TaskState> state = taskStateFromString(json.value("state").toString());
    bool valid = !task.id.isEmpty() && !task.url.isEmpty() && state.has_value();
    if (state) {
        task.state = *state;
    }

    task.progress = qBound(0, json.value("progress").toInt(0), 100);
    task.bytesTransferred = static_cast<qint64>(json.value("bytesTransferred").toDouble(0));
    task.bytesTotal = static_cast<qint64>(json.value("bytesTotal").toDouble(0));
    task.createdAt = timestampFromJson(json.value("createdAt"));
    task.startedAt = timestampFromJson(json.value("startedAt"));
    task.completedAt = timestampFromJson(json.value("completedAt"));

    if (json.value("error").isObject()) {
        task.lastError = DownloadError::fromJson(json.value("error").toObject());
    }
    task.resumeToken = QByteArray::fromBase64(json.value("resumeToken").toString().toLatin1());
    task.priority = json.value("priority").toInt(0);
    task.retryCount = json.value("retryCount").toInt(0);

    const QJsonObject headerJson = json.value("headers").toObject();
    for (auto it = headerJson.constBegin(); it != headerJson.constEnd(); ++it) {
        task.headers.insert(it.key(), it.value().toString());
    }

    if (ok) {
        *ok = valid;
    }
    return task;
}
