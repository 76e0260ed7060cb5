/**
 * @file downloadmanager.cpp
 * @brief Implementation of the DownloadManager lifecycle engine.
 */

#include "downloadmanager.h"

#include "itaskstore.h"
#include "itransferclient.h"
#include "networkmonitor.h"
#include "progressthrottle.h"
#include "utils/downloadutils.h"
#include "utils/logging.h"

#include <QDebug>
#include <QTimer>

#include <algorithm>
#include <utility>

QString requestStatusToString(RequestStatus status)
{
    switch (status) {
    case RequestStatus::Ok: return QStringLiteral("ok");
    case RequestStatus::NotFound: return QStringLiteral("not found");
    case RequestStatus::InvalidInput: return QStringLiteral("invalid input");
    case RequestStatus::NoNetwork: return QStringLiteral("no network");
    case RequestStatus::InvalidState: return QStringLiteral("invalid state");
    }
    return QStringLiteral("unknown");
}

DownloadManager::DownloadManager(const DownloadConfig &config,
                                 ITransferClient *client,
                                 ITaskStore *store,
                                 NetworkMonitor *monitor,
                                 QObject *parent)
    : QObject(parent)
    , config_(config)
    , client_(client)
    , store_(store)
    , monitor_(monitor)
    , throttle_(new ProgressThrottle(config.progressThrottleMs, this))
    , queue_(config.maxConcurrentDownloads)
{
    qRegisterMetaType<DownloadTask>();
    qRegisterMetaType<DownloadError>();
    qRegisterMetaType<TaskState>();
    qRegisterMetaType<DownloadErrorCode>();

    connect(client_, &ITransferClient::transferProgress,
            this, &DownloadManager::onTransferProgress);
    connect(client_, &ITransferClient::transferFinished,
            this, &DownloadManager::onTransferFinished);
    connect(client_, &ITransferClient::transferFailed,
            this, &DownloadManager::onTransferFailed);

    connect(throttle_, &ProgressThrottle::ready,
            this, &DownloadManager::onProgressReady);

    if (monitor_) {
        connect(monitor_, &NetworkMonitor::becameOnline,
                this, &DownloadManager::onNetworkOnline);
        connect(monitor_, &NetworkMonitor::becameOffline,
                this, &DownloadManager::onNetworkOffline);
    }
}

DownloadManager::~DownloadManager() = default;

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

bool DownloadManager::initialize()
{
    if (initialized_) {
        return true;
    }

    const bool storeReady = store_->initialize();
    if (!storeReady) {
        qWarning() << "DownloadManager: Task store could not be initialized";
    }

    const QList<DownloadTask> restored = store_->loadAllTasks();
    QList<DownloadTask> pending;

    for (DownloadTask task : restored) {
        if (tasks_.contains(task.id) || task.state == TaskState::Cancelled) {
            continue;
        }
        if (task.state == TaskState::Active) {
            // The transfer died with the previous session
            task.state = TaskState::Paused;
        }
        if (task.state == TaskState::Pending) {
            pending.append(task);
        }
        tasks_.insert(task.id, task);
        taskOrder_.append(task.id);
    }

    std::stable_sort(pending.begin(), pending.end(),
                     [](const DownloadTask &a, const DownloadTask &b) {
                         return a.createdAt < b.createdAt;
                     });
    for (const DownloadTask &task : pending) {
        queue_.enqueue(task.id, task.priority);
    }

    qInfo() << "DownloadManager: Restored" << tasks_.size() << "tasks,"
            << pending.size() << "pending";

    persist();
    initialized_ = true;

    if (monitor_) {
        monitor_->start();
    }
    processQueue();
    return storeReady;
}

void DownloadManager::shutdown()
{
    shuttingDown_ = true;

    const QList<DownloadTask> running = activeTasks();
    for (const DownloadTask &task : running) {
        pause(task.id);
    }

    persist();
    if (monitor_) {
        monitor_->stop();
    }
    LOG_VERBOSE() << "DownloadManager: Shut down," << running.size() << "transfers paused";
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

SubmitResult DownloadManager::submit(const QString &url, const DownloadOptions &options)
{
    SubmitResult result;

    if (!DownloadUtils::isValidDownloadUrl(url)) {
        qWarning() << "DownloadManager: Rejected invalid URL" << url;
        result.status = RequestStatus::InvalidInput;
        return result;
    }

    DownloadTask task;
    do {
        task.id = DownloadUtils::generateTaskId();
    } while (tasks_.contains(task.id));
    task.url = url;
    task.fileName = uniqueFileName(DownloadUtils::sanitizeFileName(url, options.fileName));
    task.filePath = store_->filePathFor(task.fileName);
    task.state = TaskState::Pending;
    task.createdAt = QDateTime::currentDateTimeUtc();
    task.priority = options.priority;
    task.headers = options.headers;

    tasks_.insert(task.id, task);
    taskOrder_.append(task.id);

    if (!store_->saveMetadata(task)) {
        qWarning() << "DownloadManager: Failed to save metadata for" << task.id;
    }
    persist();

    queue_.enqueue(task.id, task.priority);
    qInfo() << "DownloadManager: Queued" << task.id << url << "as" << task.fileName;
    emit taskSubmitted(task);

    processQueue();

    result.taskId = task.id;
    return result;
}

RequestStatus DownloadManager::pause(const QString &taskId)
{
    DownloadTask *task = findTask(taskId);
    if (!task) {
        return RequestStatus::NotFound;
    }
    if (task->state != TaskState::Active) {
        return RequestStatus::Ok;
    }

    QByteArray token;
    QString error;
    if (!client_->pause(taskId, token, error)) {
        qWarning() << "DownloadManager: Transfer pause failed for" << taskId << ":" << error;
        token.clear();
    }

    throttle_->flush(taskId);
    task = findTask(taskId);
    if (!task || task->state != TaskState::Active) {
        return RequestStatus::Ok;
    }

    // A failed pause keeps the token of the previous pause
    if (!token.isEmpty()) {
        task->resumeToken = token;
    }
    freshAttempts_.remove(taskId);
    queue_.release(taskId);
    throttle_->cancel(taskId);

    transitionTo(taskId, TaskState::Paused);
    persist();
    processQueue();
    return RequestStatus::Ok;
}

RequestStatus DownloadManager::resume(const QString &taskId)
{
    DownloadTask *task = findTask(taskId);
    if (!task) {
        return RequestStatus::NotFound;
    }
    if (task->state != TaskState::Paused && task->state != TaskState::Failed) {
        return RequestStatus::InvalidState;
    }
    if (!isNetworkOnline()) {
        return RequestStatus::NoNetwork;
    }

    task->retryCount = 0;
    requeueTask(taskId);
    return RequestStatus::Ok;
}

RequestStatus DownloadManager::cancel(const QString &taskId)
{
    DownloadTask *task = findTask(taskId);
    if (!task) {
        return RequestStatus::NotFound;
    }
    if (task->state == TaskState::Completed) {
        return RequestStatus::InvalidState;
    }

    if (task->state == TaskState::Active) {
        QByteArray token;
        QString error;
        if (!client_->pause(taskId, token, error)) {
            qWarning() << "DownloadManager: Transfer stop failed while cancelling" << taskId
                       << ":" << error;
        }
    }

    throttle_->flush(taskId);
    task = findTask(taskId);
    if (!task) {
        return RequestStatus::Ok;
    }

    queue_.remove(taskId);
    freshAttempts_.remove(taskId);
    throttle_->cancel(taskId);

    if (!store_->deleteFile(task->filePath)) {
        LOG_VERBOSE() << "DownloadManager: No file removed for" << taskId;
    }
    if (!store_->deleteMetadata(taskId)) {
        qWarning() << "DownloadManager: Failed to delete metadata for" << taskId;
    }

    transitionTo(taskId, TaskState::Cancelled);

    task = findTask(taskId);
    if (task) {
        const DownloadTask snapshot = *task;
        emit downloadCancelled(snapshot);
        tasks_.remove(taskId);
        taskOrder_.removeAll(taskId);
    }

    qInfo() << "DownloadManager: Cancelled" << taskId;
    persist();
    processQueue();
    return RequestStatus::Ok;
}

int DownloadManager::removeCompleted()
{
    int removed = 0;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->state == TaskState::Completed) {
            if (!store_->deleteMetadata(it.key())) {
                qWarning() << "DownloadManager: Failed to delete metadata for" << it.key();
            }
            taskOrder_.removeAll(it.key());
            it = tasks_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        persist();
    }
    return removed;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<DownloadTask> DownloadManager::task(const QString &taskId) const
{
    auto it = tasks_.constFind(taskId);
    if (it == tasks_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

QList<DownloadTask> DownloadManager::tasks() const
{
    QList<DownloadTask> result;
    result.reserve(taskOrder_.size());
    for (const QString &id : taskOrder_) {
        result.append(tasks_.value(id));
    }
    return result;
}

QList<DownloadTask> DownloadManager::activeTasks() const
{
    QList<DownloadTask> result;
    for (const QString &id : taskOrder_) {
        const DownloadTask task = tasks_.value(id);
        if (task.state == TaskState::Active) {
            result.append(task);
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// Transfer callbacks
// ---------------------------------------------------------------------------

void DownloadManager::onTransferProgress(const QString &taskId, qint64 bytesWritten, qint64 bytesTotal)
{
    DownloadTask *task = findTask(taskId);
    if (!task || task->state != TaskState::Active) {
        return;
    }

    // The first report of an attempt may restart from zero; later ones never go back
    if (freshAttempts_.remove(taskId)) {
        task->bytesTransferred = qMax<qint64>(0, bytesWritten);
    } else {
        task->bytesTransferred = qMax(task->bytesTransferred, bytesWritten);
    }
    if (bytesTotal > 0) {
        task->bytesTotal = bytesTotal;
    }
    if (task->bytesTotal > 0) {
        task->progress = qBound(0, qRound(100.0 * task->bytesTransferred / task->bytesTotal), 100);
    }

    throttle_->submit(taskId);
}

void DownloadManager::onProgressReady(const QString &taskId)
{
    DownloadTask *task = findTask(taskId);
    if (!task) {
        return;
    }
    const DownloadTask snapshot = *task;
    emit progressChanged(snapshot);
}

void DownloadManager::onTransferFinished(const QString &taskId)
{
    DownloadTask *task = findTask(taskId);
    if (!task || task->state != TaskState::Active) {
        return;
    }

    throttle_->flush(taskId);
    task = findTask(taskId);
    if (!task || task->state != TaskState::Active) {
        return;
    }

    task->progress = 100;
    task->bytesTotal = qMax(task->bytesTotal, task->bytesTransferred);
    task->completedAt = QDateTime::currentDateTimeUtc();
    task->resumeToken.clear();
    task->lastError.reset();
    task->retryCount = 0;

    freshAttempts_.remove(taskId);
    queue_.release(taskId);
    throttle_->cancel(taskId);

    transitionTo(taskId, TaskState::Completed);
    persist();

    task = findTask(taskId);
    if (task) {
        qInfo() << "DownloadManager: Completed" << taskId << "-"
                << DownloadUtils::formatFileSize(task->bytesTransferred);
        const DownloadTask snapshot = *task;
        emit downloadCompleted(snapshot);
    }

    processQueue();
}

void DownloadManager::onTransferFailed(const QString &taskId, DownloadErrorCode code,
                                       const QString &message, const QByteArray &resumeToken)
{
    DownloadTask *task = findTask(taskId);
    if (!task || task->state != TaskState::Active) {
        return;
    }

    throttle_->flush(taskId);
    task = findTask(taskId);
    if (!task || task->state != TaskState::Active) {
        return;
    }

    if (!resumeToken.isEmpty()) {
        task->resumeToken = resumeToken;
    }
    failTask(taskId, code, message);
}

// ---------------------------------------------------------------------------
// Network policy
// ---------------------------------------------------------------------------

void DownloadManager::onNetworkOffline()
{
    const QList<DownloadTask> running = activeTasks();
    if (!running.isEmpty()) {
        qInfo() << "DownloadManager: Network lost, pausing" << running.size() << "downloads";
    }
    for (const DownloadTask &task : running) {
        pause(task.id);
    }
}

void DownloadManager::onNetworkOnline()
{
    // Pending tasks held back while offline
    processQueue();

    if (!config_.autoRetryOnNetworkRestore) {
        return;
    }

    QStringList retryIds;
    for (const QString &id : std::as_const(taskOrder_)) {
        const DownloadTask task = tasks_.value(id);
        if (task.state == TaskState::Failed && task.lastError &&
            isNetworkClassError(task.lastError->code)) {
            retryIds.append(id);
        }
    }

    if (!retryIds.isEmpty()) {
        qInfo() << "DownloadManager: Network restored, retrying" << retryIds.size() << "downloads";
    }
    for (const QString &id : retryIds) {
        const RequestStatus status = resume(id);
        if (status != RequestStatus::Ok) {
            LOG_VERBOSE() << "DownloadManager: Retry of" << id << "skipped:"
                          << requestStatusToString(status);
        }
    }
}

// ---------------------------------------------------------------------------
// Internals
// ---------------------------------------------------------------------------

DownloadTask *DownloadManager::findTask(const QString &taskId)
{
    auto it = tasks_.find(taskId);
    return it == tasks_.end() ? nullptr : &it.value();
}

bool DownloadManager::isNetworkOnline() const
{
    return !monitor_ || monitor_->isOnline();
}

bool DownloadManager::isNetworkOffline() const
{
    return monitor_ && monitor_->state() == NetworkMonitor::NetworkState::Offline;
}

QString DownloadManager::uniqueFileName(const QString &fileName) const
{
    auto taken = [this](const QString &name) {
        const QString path = store_->filePathFor(name);
        if (store_->fileExists(path)) {
            return true;
        }
        for (const DownloadTask &task : tasks_) {
            if (task.filePath == path) {
                return true;
            }
        }
        return false;
    };

    QString candidate = fileName;
    for (int n = 1; taken(candidate); ++n) {
        candidate = DownloadUtils::numberedFileName(fileName, n);
    }
    if (candidate != fileName) {
        LOG_VERBOSE() << "DownloadManager:" << fileName << "already taken, using" << candidate;
    }
    return candidate;
}

void DownloadManager::processQueue()
{
    // Calls made while admitting are folded into the running loop
    if (admitting_ || shuttingDown_ || isNetworkOffline()) {
        return;
    }

    admitting_ = true;
    while (std::optional<QString> taskId = queue_.dequeueIfCapacity()) {
        startTask(*taskId);
    }
    admitting_ = false;
}

void DownloadManager::startTask(const QString &taskId)
{
    DownloadTask *task = findTask(taskId);
    if (!task || task->state != TaskState::Pending) {
        qWarning() << "DownloadManager: Dropping stale queue entry" << taskId;
        queue_.release(taskId);
        return;
    }

    if (task->bytesTotal > 0) {
        const qint64 available = store_->availableBytes();
        if (!DownloadUtils::hasEnoughStorage(task->bytesTotal, available)) {
            failTask(taskId, DownloadErrorCode::InsufficientStorage,
                     tr("Not enough free space: need %1, have %2")
                         .arg(DownloadUtils::formatFileSize(task->bytesTotal
                                                            + DownloadUtils::StorageSafetyMargin),
                              DownloadUtils::formatFileSize(available)));
            return;
        }
    }

    if (!task->startedAt.isValid()) {
        task->startedAt = QDateTime::currentDateTimeUtc();
    }

    TransferRequest request;
    request.taskId = taskId;
    request.url = task->url;
    request.destination = task->filePath;
    request.headers = task->headers;
    request.resumeToken = task->resumeToken;
    request.timeoutMs = config_.timeoutMs;

    freshAttempts_.insert(taskId);

    transitionTo(taskId, TaskState::Active);
    persist();

    // A subscriber may have paused or cancelled the task already
    task = findTask(taskId);
    if (!task || task->state != TaskState::Active) {
        return;
    }

    LOG_VERBOSE() << "DownloadManager: Starting" << taskId
                  << (request.resumeToken.isEmpty() ? "" : "(resuming)");
    client_->start(request);
}

void DownloadManager::failTask(const QString &taskId, DownloadErrorCode code, const QString &message)
{
    DownloadTask *task = findTask(taskId);
    if (!task) {
        return;
    }

    DownloadError error;
    error.code = code;
    error.message = message;
    error.timestamp = QDateTime::currentDateTimeUtc();
    error.retryCount = task->retryCount;

    task->lastError = error;

    freshAttempts_.remove(taskId);
    queue_.release(taskId);
    throttle_->cancel(taskId);

    qWarning() << "DownloadManager:" << taskId << "failed with"
               << errorCodeToString(code) << "-" << message;

    transitionTo(taskId, TaskState::Failed);
    persist();

    task = findTask(taskId);
    if (task) {
        const DownloadTask snapshot = *task;
        emit downloadFailed(snapshot, error);
        scheduleRetry(taskId);
    }

    processQueue();
}

void DownloadManager::requeueTask(const QString &taskId)
{
    DownloadTask *task = findTask(taskId);
    if (!task) {
        return;
    }

    task->lastError.reset();
    task->priority = 0;

    transitionTo(taskId, TaskState::Pending);

    task = findTask(taskId);
    if (task && task->state == TaskState::Pending &&
        !queue_.isQueued(taskId) && !queue_.isAdmitted(taskId)) {
        queue_.enqueue(taskId, task->priority);
    }

    persist();
    processQueue();
}

void DownloadManager::scheduleRetry(const QString &taskId)
{
    const DownloadTask *task = findTask(taskId);
    if (!task || !task->lastError || !isNetworkClassError(task->lastError->code)) {
        return;
    }
    if (!isNetworkOnline() || task->retryCount >= config_.maxRetryAttempts) {
        return;
    }

    LOG_VERBOSE() << "DownloadManager: Retry" << (task->retryCount + 1) << "of"
                  << config_.maxRetryAttempts << "for" << taskId
                  << "in" << config_.retryDelayMs << "ms";
    QTimer::singleShot(config_.retryDelayMs, this, [this, taskId]() {
        retryTask(taskId);
    });
}

void DownloadManager::retryTask(const QString &taskId)
{
    DownloadTask *task = findTask(taskId);
    if (!task || task->state != TaskState::Failed || shuttingDown_ || !isNetworkOnline()) {
        return;
    }

    task->retryCount += 1;
    qInfo() << "DownloadManager: Retrying" << taskId << "attempt" << task->retryCount;
    requeueTask(taskId);
}

void DownloadManager::transitionTo(const QString &taskId, TaskState newState)
{
    DownloadTask *task = findTask(taskId);
    if (!task || task->state == newState) {
        return;
    }

    const TaskState oldState = task->state;
    task->state = newState;

    qDebug() << "DownloadManager:" << taskId << "state transition"
             << taskStateToString(oldState) << "->" << taskStateToString(newState);

    const DownloadTask snapshot = *task;
    emit statusChanged(snapshot, oldState);
}

void DownloadManager::persist()
{
    if (!store_->saveAllTasks(tasks())) {
        qWarning() << "DownloadManager: Failed to persist" << tasks_.size() << "tasks";
    }
}
