#include "progressthrottle.h"

#include <QTimer>

ProgressThrottle::ProgressThrottle(int intervalMs, QObject *parent)
    : QObject(parent)
    , intervalMs_(qMax(0, intervalMs))
{
}

ProgressThrottle::~ProgressThrottle() = default;

void ProgressThrottle::submit(const QString &taskId)
{
    if (intervalMs_ == 0) {
        emit ready(taskId);
        return;
    }

    Slot &slot = taskSlots_[taskId];

    if (slot.trailing && slot.trailing->isActive()) {
        return;
    }

    const qint64 elapsed = slot.lastEmit.isValid() ? slot.lastEmit.elapsed() : intervalMs_;
    if (elapsed >= intervalMs_) {
        emitNow(taskId, slot);
        return;
    }

    if (!slot.trailing) {
        slot.trailing = new QTimer(this);
        slot.trailing->setSingleShot(true);
        connect(slot.trailing, &QTimer::timeout, this, [this, taskId]() {
            auto it = taskSlots_.find(taskId);
            if (it != taskSlots_.end()) {
                emitNow(taskId, it.value());
            }
        });
    }
    slot.trailing->start(static_cast<int>(intervalMs_ - elapsed));
}

void ProgressThrottle::flush(const QString &taskId)
{
    auto it = taskSlots_.find(taskId);
    if (it == taskSlots_.end() || !it->trailing || !it->trailing->isActive()) {
        return;
    }
    emitNow(taskId, it.value());
}

void ProgressThrottle::cancel(const QString &taskId)
{
    auto it = taskSlots_.find(taskId);
    if (it == taskSlots_.end()) {
        return;
    }
    if (it->trailing) {
        it->trailing->stop();
        it->trailing->deleteLater();
    }
    taskSlots_.erase(it);
}

bool ProgressThrottle::hasPending(const QString &taskId) const
{
    auto it = taskSlots_.constFind(taskId);
    return it != taskSlots_.constEnd() && it->trailing && it->trailing->isActive();
}

void ProgressThrottle::emitNow(const QString &taskId, Slot &slot)
{
    if (slot.trailing) {
        slot.trailing->stop();
    }
    slot.lastEmit.start();
    emit ready(taskId);
}
