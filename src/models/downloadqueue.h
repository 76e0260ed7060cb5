/**
 * @file downloadqueue.h
 * @brief Priority queue and admission bookkeeping for pending downloads.
 */

#ifndef DOWNLOADQUEUE_H
#define DOWNLOADQUEUE_H

#include <QDateTime>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>

#include <optional>

/**
 * @brief A task waiting for a concurrency slot.
 */
struct QueueEntry {
    QString taskId;
    int priority = 0;
    QDateTime enqueuedAt;
};

/**
 * @brief Holds pending task ids ordered by priority and admits them up to a
 * concurrency limit.
 *
 * Strictly higher priority is dequeued first; equal priorities keep their
 * enqueue order. The class is pure bookkeeping: it never fails and unknown
 * ids are ignored.
 *
 * The queue does not check for duplicates. Enqueuing an id that is already
 * queued or admitted makes it come out twice, so callers must only enqueue
 * ids that are neither isQueued() nor isAdmitted().
 *
 * @par Example usage:
 * @code
 * DownloadQueue queue(2);
 * queue.enqueue("a");
 * queue.enqueue("b", 5);
 *
 * while (auto id = queue.dequeueIfCapacity()) {
 *     startTransfer(*id);   // "b" first, then "a"
 * }
 * ...
 * queue.release("b");       // frees the slot on any terminal outcome
 * @endcode
 */
class DownloadQueue
{
public:
    /**
     * @brief Constructs a queue.
     * @param maxConcurrent Maximum number of admitted ids (at least 1).
     */
    explicit DownloadQueue(int maxConcurrent = 3);

    /**
     * @brief Inserts a task id.
     * @param taskId The task to queue.
     * @param priority Higher values are admitted first.
     */
    void enqueue(const QString &taskId, int priority = 0);

    /**
     * @brief Admits the front entry if a slot is free.
     * @return The admitted id, or std::nullopt if the queue is empty or full.
     */
    [[nodiscard]] std::optional<QString> dequeueIfCapacity();

    /**
     * @brief Frees the slot held by an admitted id. No-op if not admitted.
     */
    void release(const QString &taskId);

    /**
     * @brief Purges an id from both the pending queue and the admitted set.
     */
    void remove(const QString &taskId);

    /**
     * @brief Drops every queued and admitted id.
     */
    void clear();

    [[nodiscard]] bool hasCapacity() const { return admitted_.size() < maxConcurrent_; }
    [[nodiscard]] int pendingCount() const { return entries_.size(); }
    [[nodiscard]] int activeCount() const { return admitted_.size(); }
    [[nodiscard]] int maxConcurrent() const { return maxConcurrent_; }

    [[nodiscard]] bool isQueued(const QString &taskId) const;
    [[nodiscard]] bool isAdmitted(const QString &taskId) const { return admitted_.contains(taskId); }

    /// @brief Queued ids in admission order.
    [[nodiscard]] QStringList queuedTaskIds() const;

    /// @brief Admitted ids (unordered).
    [[nodiscard]] QStringList admittedTaskIds() const;

private:
    QList<QueueEntry> entries_;
    QSet<QString> admitted_;
    int maxConcurrent_;
};

#endif // DOWNLOADQUEUE_H
