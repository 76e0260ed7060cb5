#include "downloadqueue.h"

#include <algorithm>

DownloadQueue::DownloadQueue(int maxConcurrent)
    : maxConcurrent_(std::max(1, maxConcurrent))
{
}

void DownloadQueue::enqueue(const QString &taskId, int priority)
{
    QueueEntry entry;
    entry.taskId = taskId;
    entry.priority = priority;
    entry.enqueuedAt = QDateTime::currentDateTimeUtc();

    // First position holding a strictly lower priority; equal priorities stay FIFO
    auto insertAt = std::find_if(entries_.begin(), entries_.end(),
                                 [priority](const QueueEntry &existing) {
                                     return existing.priority < priority;
                                 });
    entries_.insert(insertAt, entry);
}

std::optional<QString> DownloadQueue::dequeueIfCapacity()
{
    if (!hasCapacity() || entries_.isEmpty()) {
        return std::nullopt;
    }

    QueueEntry entry = entries_.takeFirst();
    admitted_.insert(entry.taskId);
    return entry.taskId;
}

void DownloadQueue::release(const QString &taskId)
{
    admitted_.remove(taskId);
}

void DownloadQueue::remove(const QString &taskId)
{
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&taskId](const QueueEntry &entry) {
                                      return entry.taskId == taskId;
                                  }),
                   entries_.end());
    admitted_.remove(taskId);
}

void DownloadQueue::clear()
{
    entries_.clear();
    admitted_.clear();
}

bool DownloadQueue::isQueued(const QString &taskId) const
{
    return std::any_of(entries_.cbegin(), entries_.cend(),
                       [&taskId](const QueueEntry &entry) {
                           return entry.taskId == taskId;
                       });
}

QStringList DownloadQueue::queuedTaskIds() const
{
    QStringList ids;
    ids.reserve(entries_.size());
    for (const QueueEntry &entry : entries_) {
        ids.append(entry.taskId);
    }
    return ids;
}

QStringList DownloadQueue::admittedTaskIds() const
{
    return QStringList(admitted_.cbegin(), admitted_.cend());
}
