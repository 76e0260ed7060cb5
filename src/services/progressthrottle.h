/**
 * @file progressthrottle.h
 * @brief Per-task rate limiter for progress notifications.
 */

#ifndef PROGRESSTHROTTLE_H
#define PROGRESSTHROTTLE_H

#include <QElapsedTimer>
#include <QHash>
#include <QObject>
#include <QString>

class QTimer;

/**
 * @brief Coalesces bursts of progress updates into at most one ready()
 * per interval per task.
 *
 * The first submit() for a task emits at once. Submits arriving inside the
 * interval are folded into a single trailing ready() when the interval
 * expires. An interval of 0 disables throttling.
 *
 * ready() only carries the task id; the receiver reads the latest values
 * itself, so a trailing emission always reports the newest progress.
 */
class ProgressThrottle : public QObject
{
    Q_OBJECT

public:
    explicit ProgressThrottle(int intervalMs = 100, QObject *parent = nullptr);
    ~ProgressThrottle() override;

    [[nodiscard]] int interval() const { return intervalMs_; }

    /// @brief Requests an emission for @p taskId.
    void submit(const QString &taskId);

    /// @brief Emits a pending trailing emission immediately, if any.
    void flush(const QString &taskId);

    /// @brief Drops any pending emission and forgets the task.
    void cancel(const QString &taskId);

    [[nodiscard]] bool hasPending(const QString &taskId) const;

signals:
    void ready(const QString &taskId);

private:
    struct Slot {
        QElapsedTimer lastEmit;
        QTimer *trailing = nullptr;
    };

    void emitNow(const QString &taskId, Slot &slot);

    int intervalMs_;
    QHash<QString, Slot> taskSlots_;
};

#endif // PROGRESSTHROTTLE_H
