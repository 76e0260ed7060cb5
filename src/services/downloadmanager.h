/**
 * @file downloadmanager.h
 * @brief Lifecycle engine for queued, resumable downloads.
 *
 * DownloadManager owns the task registry and drives every task through
 * Pending, Active, Paused, Completed, Failed and Cancelled. Transfers,
 * persistence and connectivity are injected so each can be mocked.
 */

#ifndef DOWNLOADMANAGER_H
#define DOWNLOADMANAGER_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>

#include <optional>

#include "models/downloadconfig.h"
#include "models/downloadqueue.h"
#include "models/downloadtask.h"

class ITaskStore;
class ITransferClient;
class NetworkMonitor;
class ProgressThrottle;

/**
 * @brief Outcome of a caller request.
 */
enum class RequestStatus {
    Ok,            ///< Request applied (or a documented no-op)
    NotFound,      ///< No task with that id
    InvalidInput,  ///< Malformed URL or options
    NoNetwork,     ///< Resume refused while the network is not online
    InvalidState   ///< Operation not allowed in the task's current state
};

/// @brief Convert RequestStatus to a short display string.
[[nodiscard]] QString requestStatusToString(RequestStatus status);

/**
 * @brief Result of DownloadManager::submit().
 */
struct SubmitResult {
    RequestStatus status = RequestStatus::Ok;
    QString taskId;  ///< Empty unless status is Ok

    [[nodiscard]] bool ok() const { return status == RequestStatus::Ok; }
};

/**
 * @brief Schedules downloads under a concurrency cap and tracks their
 * lifecycle.
 *
 * Everything runs on the thread owning the manager. Requests return
 * synchronously; outcomes are announced through signals. For one task the
 * order is always: pending progress, then statusChanged(), then
 * downloadCompleted(), downloadFailed() or downloadCancelled().
 *
 * Callers only ever receive copies of task records.
 *
 * @par Example usage:
 * @code
 * HttpTransferClient client;
 * JsonTaskStore store(dataDir);
 * HttpNetworkProbe probe(QUrl(config.probeUrl));
 * NetworkMonitor monitor(&probe, config.networkCheckIntervalMs);
 *
 * DownloadManager manager(config, &client, &store, &monitor);
 * connect(&manager, &DownloadManager::downloadCompleted,
 *         [](const DownloadTask &task) { qInfo() << task.filePath; });
 *
 * manager.initialize();
 * SubmitResult result = manager.submit("https://example.com/a.mp4");
 * ...
 * manager.pause(result.taskId);
 * manager.resume(result.taskId);
 * @endcode
 */
class DownloadManager : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs the engine.
     * @param config Engine settings, fixed for the manager's lifetime.
     * @param client Transfer primitive (not owned).
     * @param store Persistence gateway (not owned).
     * @param monitor Connectivity tracker (not owned). May be nullptr, in
     *        which case the network is assumed to be online.
     * @param parent Optional parent QObject for memory management.
     */
    DownloadManager(const DownloadConfig &config,
                    ITransferClient *client,
                    ITaskStore *store,
                    NetworkMonitor *monitor,
                    QObject *parent = nullptr);
    ~DownloadManager() override;

    /// @name Lifecycle
    /// @{

    /**
     * @brief Restores persisted tasks and starts monitoring.
     *
     * Tasks that were Active when the previous session ended come back as
     * Paused. Pending tasks are re-queued in creation order. Calling this
     * more than once has no effect.
     *
     * @return False if the store could not be prepared. The engine still
     *         runs with whatever could be loaded.
     */
    bool initialize();

    /**
     * @brief Pauses every Active task, persists and stops monitoring.
     *
     * No task is admitted after shutdown.
     */
    void shutdown();

    [[nodiscard]] bool isInitialized() const { return initialized_; }
    /// @}

    /// @name Requests
    /// @{

    /**
     * @brief Creates a Pending task and queues it.
     * @param url http or https address.
     * @param options Optional file name, headers and priority.
     * @return InvalidInput (and no task) for an unusable URL.
     */
    SubmitResult submit(const QString &url, const DownloadOptions &options = DownloadOptions());

    /**
     * @brief Pauses an Active task, keeping its resume token.
     *
     * Returns Ok without doing anything if the task is not Active. A pause
     * the transfer client fails to perform is logged and the task is
     * paused regardless.
     */
    RequestStatus pause(const QString &taskId);

    /**
     * @brief Re-queues a Paused or Failed task.
     *
     * Returns InvalidState for any other state and NoNetwork while the
     * network is not online.
     */
    RequestStatus resume(const QString &taskId);

    /**
     * @brief Stops a task, deletes its file and forgets it.
     *
     * Returns InvalidState for a Completed task.
     */
    RequestStatus cancel(const QString &taskId);

    /**
     * @brief Drops Completed tasks and their metadata from the registry. Files are kept.
     * @return Number of records removed.
     */
    int removeCompleted();
    /// @}

    /// @name Queries
    /// @{
    [[nodiscard]] std::optional<DownloadTask> task(const QString &taskId) const;

    /// @brief Every task in submission order.
    [[nodiscard]] QList<DownloadTask> tasks() const;

    [[nodiscard]] QList<DownloadTask> activeTasks() const;
    [[nodiscard]] int pendingCount() const { return queue_.pendingCount(); }
    [[nodiscard]] int activeCount() const { return queue_.activeCount(); }

    /// @brief True when no task is queued or running.
    [[nodiscard]] bool isIdle() const { return pendingCount() == 0 && activeCount() == 0; }

    [[nodiscard]] const DownloadConfig &config() const { return config_; }
    /// @}

signals:
    void taskSubmitted(const DownloadTask &task);
    void progressChanged(const DownloadTask &task);
    void statusChanged(const DownloadTask &task, TaskState oldState);
    void downloadCompleted(const DownloadTask &task);
    void downloadFailed(const DownloadTask &task, const DownloadError &error);
    void downloadCancelled(const DownloadTask &task);

private slots:
    void onTransferProgress(const QString &taskId, qint64 bytesWritten, qint64 bytesTotal);
    void onTransferFinished(const QString &taskId);
    void onTransferFailed(const QString &taskId, DownloadErrorCode code, const QString &message,
                          const QByteArray &resumeToken);
    void onProgressReady(const QString &taskId);
    void onNetworkOnline();
    void onNetworkOffline();

private:
    DownloadTask *findTask(const QString &taskId);
    [[nodiscard]] bool isNetworkOnline() const;
    [[nodiscard]] bool isNetworkOffline() const;

    /// Appends a numeric suffix until no file or task holds the destination.
    [[nodiscard]] QString uniqueFileName(const QString &fileName) const;

    void processQueue();
    void startTask(const QString &taskId);
    void failTask(const QString &taskId, DownloadErrorCode code, const QString &message);
    void requeueTask(const QString &taskId);
    void scheduleRetry(const QString &taskId);
    void retryTask(const QString &taskId);
    void transitionTo(const QString &taskId, TaskState newState);
    void persist();

    DownloadConfig config_;
    ITransferClient *client_ = nullptr;
    ITaskStore *store_ = nullptr;
    NetworkMonitor *monitor_ = nullptr;
    ProgressThrottle *throttle_ = nullptr;

    DownloadQueue queue_;
    QHash<QString, DownloadTask> tasks_;
    QStringList taskOrder_;
    QSet<QString> freshAttempts_;  ///< Started tasks that have not reported progress yet

    bool initialized_ = false;
    bool shuttingDown_ = false;
    bool admitting_ = false;
};

#endif // DOWNLOADMANAGER_H
