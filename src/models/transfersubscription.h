/**
 * @file transfersubscription.h
 * @brief Independent pull-based view of the transfer event stream.
 */

#ifndef TRANSFERSUBSCRIPTION_H
#define TRANSFERSUBSCRIPTION_H

#include "transfertask.h"

#include <QList>
#include <QMutex>
#include <QQueue>
#include <QWaitCondition>

#include <optional>

/**
 * @brief A subscriber's private event queue.
 *
 * Every subscription receives every event published after it was created,
 * in publication order. Consumers pull at their own pace; a slow consumer
 * does not hold up the engine or other subscribers.
 *
 * Once more than maxBacklog() events are waiting, a Progress event replaces
 * the queued event for its task when that event is also Progress. State
 * changes are never dropped, so the backlog of a stalled consumer grows
 * with the number of state changes only.
 *
 * @par Example usage:
 * @code
 * auto sub = queue->subscribe();
 * while (auto event = sub->next(1000)) {
 *     if (event->type == TransferEvent::Type::Progress) { ... }
 * }
 * @endcode
 */
class TransferSubscription
{
public:
    static constexpr int DefaultMaxBacklog = 4096;

    explicit TransferSubscription(int maxBacklog = DefaultMaxBacklog);

    TransferSubscription(const TransferSubscription &) = delete;
    TransferSubscription &operator=(const TransferSubscription &) = delete;

    /**
     * @brief Waits for the next event.
     * @param timeoutMs Maximum wait; negative waits forever.
     * @return std::nullopt on timeout or once the subscription is closed and empty.
     */
    [[nodiscard]] std::optional<TransferEvent> next(int timeoutMs = -1);

    /// Returns every queued event without waiting.
    [[nodiscard]] QList<TransferEvent> drain();

    [[nodiscard]] int pendingCount() const;
    [[nodiscard]] int maxBacklog() const { return maxBacklog_; }
    [[nodiscard]] bool isClosed() const;

    /// Stops delivery and wakes any waiting consumer.
    void close();

    /// Appends an event; ignored once closed.
    void push(const TransferEvent &event);

private:
    [[nodiscard]] bool coalesceLocked(const TransferEvent &event);

    const int maxBacklog_;
    mutable QMutex mutex_;
    QWaitCondition available_;
    QQueue<TransferEvent> events_;
    bool closed_ = false;
};

#endif // TRANSFERSUBSCRIPTION_H
