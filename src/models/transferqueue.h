#ifndef TRANSFERQUEUE_H
#define TRANSFERQUEUE_H

#include <QElapsedTimer>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QQueue>
#include <QRecursiveMutex>
#include <QThreadPool>
#include <QTimer>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "models/transfersubscription.h"
#include "models/transfertask.h"
#include "services/connectionprofile.h"
#include "services/sessionpool.h"
#include "services/settings.h"
#include "utils/ratemeter.h"

class ISessionFactory;

/**
 * @brief Authoritative task list plus a subscription that continues from it.
 */
struct TransferSnapshot {
    QList<TransferTask> tasks;
    std::shared_ptr<TransferSubscription> subscription;
};

/**
 * @brief Concurrency-limited transfer engine.
 *
 * Tasks are admitted with enqueue() and run on a private worker pool of
 * maxConcurrent threads. Each running task leases one session for its
 * profile from a SessionPool. Transient failures are retried with capped
 * exponential backoff; everything else fails the task.
 *
 * Every state change and progress update is published, in order, to all
 * live subscriptions and emitted as transferEvent(). Events are published
 * at the moment the engine's state changes, so a snapshot taken together
 * with a subscription never misses or duplicates an event.
 *
 * @par Example usage:
 * @code
 * TransferQueue queue(&factory, [&](const QString &id) { return store.findProfile(vault, id); },
 *                     settings);
 * connect(&queue, &TransferQueue::taskCompleted, this, &MyClass::onDone);
 * TransferId id = queue.enqueue(TransferTask::upload(profile.id, "/tmp/a.bin", "/in/a.bin"));
 * @endcode
 */
class TransferQueue : public QObject
{
    Q_OBJECT

public:
    /// Resolves a profile id at the moment a task starts.
    using ProfileProvider = std::function<std::optional<ConnectionProfile>(const QString &)>;

    TransferQueue(ISessionFactory *factory,
                  ProfileProvider profileProvider,
                  const Settings &settings = Settings(),
                  QObject *parent = nullptr);
    ~TransferQueue() override;

    /// @name Admission
    /// @{

    /**
     * @brief Admits a task in state Queued and returns its id.
     *
     * Identical (profile, remote, local) tasks are all admitted.
     */
    TransferId enqueue(TransferTask task);
    TransferId enqueueUpload(const QString &profileId, const QString &localPath,
                             const QString &remotePath, int priority = 0);
    TransferId enqueueDownload(const QString &profileId, const QString &remotePath,
                               const QString &localPath, int priority = 0);
    /// @}

    /// @name Control
    /// @{

    /**
     * @brief Cancels a queued or running task.
     * @return False if the task is unknown or already finished.
     */
    bool cancel(TransferId id);
    void cancelAll();

    /// Stops admission and interrupts running tasks, which return to Queued.
    void pauseAll();
    void resumeAll();

    /// Re-queues a Failed or Cancelled task with its retry count reset.
    bool retry(TransferId id);

    /// Drops a finished task. @return False if unknown or not finished.
    bool acknowledge(TransferId id);

    /// Drops every finished task. @return Number removed.
    int removeFinished();
    /// @}

    /// @name Observation
    /// @{
    [[nodiscard]] std::shared_ptr<TransferSubscription> subscribe();
    [[nodiscard]] TransferSnapshot snapshotAndSubscribe();

    [[nodiscard]] QList<TransferTask> tasks() const;
    [[nodiscard]] std::optional<TransferTask> task(TransferId id) const;
    [[nodiscard]] int runningCount() const;
    [[nodiscard]] int queuedCount() const;
    [[nodiscard]] bool isPaused() const;
    [[nodiscard]] bool isIdle() const;
    /// @}

    [[nodiscard]] int maxConcurrent() const { return settings_.maxConcurrent; }
    [[nodiscard]] const Settings &settings() const { return settings_; }
    [[nodiscard]] SessionPool *sessionPool() const { return pool_; }

    /// Delay before automatic retry number @p attempt (1-based).
    [[nodiscard]] qint64 backoffDelayMs(int attempt) const;

signals:
    void transferEvent(const TransferEvent &event);
    void taskStarted(TransferId id);
    void taskCompleted(TransferId id);
    void taskFailed(TransferId id, const QString &error);
    void taskCancelled(TransferId id);
    void allTasksFinished();

private slots:
    void schedule();

private:
    enum class Interrupt { None, Cancel, Pause };

    struct TaskEntry {
        TransferTask task;
        std::shared_ptr<std::atomic_bool> stopFlag = std::make_shared<std::atomic_bool>(false);
        Interrupt interrupt = Interrupt::None;
        qint64 notBeforeMs = 0;
        qint64 resumeOffset = 0;
        RateMeter rate;
    };

    struct PendingSignal {
        TransferEvent event;
        bool allFinished = false;
    };

    void requestSchedule();
    void runTask(TransferId id, std::shared_ptr<SessionPool::Lease> lease);
    [[nodiscard]] qint64 startOffsetFor(const TransferTask &task, IProtocolSession *session, qint64 offset);
    void reportProgress(TransferId id, qint64 done, qint64 total);
    void finishTask(TransferId id, const std::optional<TransferError> &error,
                    bool interrupted, bool resumable);
    void handleInterruptedLocked(TaskEntry &entry, bool resumable);
    void handleFailureLocked(TaskEntry &entry, const TransferError &error, bool resumable);
    void removePartialFile(const TransferTask &task, IProtocolSession *session);
    void removePartialUploadLater(const TransferTask &task);

    void setStateLocked(TaskEntry &entry, TransferState state, bool willRetry = false);
    void publishLocked(const TransferEvent &event);
    [[nodiscard]] TransferEvent makeEventLocked(const TaskEntry &entry, TransferEvent::Type type) const;
    void checkAllFinishedLocked();
    void emitPending();

    [[nodiscard]] TaskEntry *findLocked(TransferId id);
    [[nodiscard]] const TaskEntry *findLocked(TransferId id) const;
    [[nodiscard]] bool hasActiveLocked() const;

    Settings settings_;
    ProfileProvider profileProvider_;
    SessionPool *pool_;
    QThreadPool workers_;
    QTimer *retryTimer_;
    QElapsedTimer clock_;

    mutable QMutex mutex_;
    std::map<TransferId, TaskEntry> tasks_;
    TransferId nextId_ = 1;
    bool paused_ = false;
    bool shuttingDown_ = false;
    std::vector<std::weak_ptr<TransferSubscription>> subscribers_;
    QQueue<PendingSignal> pendingSignals_;
    QRecursiveMutex emitMutex_;
};

#endif // TRANSFERQUEUE_H
