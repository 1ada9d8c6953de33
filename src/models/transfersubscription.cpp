#include "transfersubscription.h"

#include <QDeadlineTimer>
#include <QMutexLocker>

#include <algorithm>

TransferSubscription::TransferSubscription(int maxBacklog)
    : maxBacklog_(std::max(1, maxBacklog))
{
}

std::optional<TransferEvent> TransferSubscription::next(int timeoutMs)
{
    QMutexLocker locker(&mutex_);
    QDeadlineTimer deadline = timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever)
                                            : QDeadlineTimer(timeoutMs);
    while (events_.isEmpty() && !closed_) {
        if (!available_.wait(&mutex_, deadline)) {
            break;
        }
    }
    if (events_.isEmpty()) {
        return std::nullopt;
    }
    return events_.dequeue();
}

QList<TransferEvent> TransferSubscription::drain()
{
    QMutexLocker locker(&mutex_);
    QList<TransferEvent> events;
    while (!events_.isEmpty()) {
        events.append(events_.dequeue());
    }
    return events;
}

int TransferSubscription::pendingCount() const
{
    QMutexLocker locker(&mutex_);
    return static_cast<int>(events_.size());
}

bool TransferSubscription::isClosed() const
{
    QMutexLocker locker(&mutex_);
    return closed_;
}

void TransferSubscription::close()
{
    QMutexLocker locker(&mutex_);
    closed_ = true;
    available_.wakeAll();
}

void TransferSubscription::push(const TransferEvent &event)
{
    QMutexLocker locker(&mutex_);
    if (closed_) {
        return;
    }
    if (events_.size() >= maxBacklog_ && coalesceLocked(event)) {
        return;
    }
    events_.enqueue(event);
    available_.wakeAll();
}

bool TransferSubscription::coalesceLocked(const TransferEvent &event)
{
    if (event.type != TransferEvent::Type::Progress) {
        return false;
    }
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (it->taskId != event.taskId) {
            continue;
        }
        // Only a trailing progress update may be replaced, or a state change would be reordered
        if (it->type != TransferEvent::Type::Progress) {
            return false;
        }
        *it = event;
        return true;
    }
    return false;
}
