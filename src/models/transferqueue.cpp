#include "transferqueue.h"
#include "services/sessionfactory.h"
#include "utils/bandwidthlimiter.h"
#include "utils/logging.h"

#include <QDebug>
#include <QFile>
#include <QMetaObject>
#include <QMutexLocker>
#include <QThread>

#include <algorithm>
#include <cmath>
#include <set>

namespace {

constexpr qint64 ThrottleSliceMs = 50;

} // namespace

TransferQueue::TransferQueue(ISessionFactory *factory,
                             ProfileProvider profileProvider,
                             const Settings &settings,
                             QObject *parent)
    : QObject(parent)
    , settings_(settings)
    , profileProvider_(std::move(profileProvider))
    , pool_(new SessionPool(factory, settings.maxConcurrent, settings.maxSessionsPerProfile,
                            settings.idleTimeoutMs, this))
    , retryTimer_(new QTimer(this))
{
    qRegisterMetaType<TransferEvent>("TransferEvent");
    qRegisterMetaType<TransferId>("TransferId");

    workers_.setMaxThreadCount(std::max(1, settings_.maxConcurrent));

    retryTimer_->setSingleShot(true);
    connect(retryTimer_, &QTimer::timeout, this, &TransferQueue::schedule);

    clock_.start();
}

TransferQueue::~TransferQueue()
{
    {
        QMutexLocker locker(&mutex_);
        shuttingDown_ = true;
        for (auto &item : tasks_) {
            TaskEntry &entry = item.second;
            if (entry.task.state == TransferState::Running) {
                if (entry.interrupt == Interrupt::None) {
                    entry.interrupt = Interrupt::Pause;
                }
                entry.stopFlag->store(true);
            }
        }
    }
    workers_.waitForDone();

    QMutexLocker locker(&mutex_);
    for (const auto &weak : subscribers_) {
        if (auto subscription = weak.lock()) {
            subscription->close();
        }
    }
    subscribers_.clear();
}

// Admission

TransferId TransferQueue::enqueue(TransferTask task)
{
    TransferId id = 0;
    {
        QMutexLocker locker(&mutex_);
        id = nextId_++;

        task.id = id;
        task.state = TransferState::Queued;
        task.bytesTransferred = 0;
        task.retryCount = 0;
        task.lastError.reset();
        task.created = QDateTime::currentDateTime();
        task.started = QDateTime();
        task.finished = QDateTime();
        task.bytesPerSecond = 0.0;
        task.etaSeconds = -1;

        TaskEntry entry;
        entry.task = task;
        auto inserted = tasks_.emplace(id, std::move(entry));
        publishLocked(makeEventLocked(inserted.first->second, TransferEvent::Type::Added));
    }

    LOG_VERBOSE() << "TransferQueue: Enqueued" << id
                  << (task.direction == TransferDirection::Upload ? "upload" : "download")
                  << task.localPath << task.remotePath;
    emitPending();
    requestSchedule();
    return id;
}

TransferId TransferQueue::enqueueUpload(const QString &profileId, const QString &localPath,
                                        const QString &remotePath, int priority)
{
    TransferTask task = TransferTask::upload(profileId, localPath, remotePath);
    task.priority = priority;
    return enqueue(task);
}

TransferId TransferQueue::enqueueDownload(const QString &profileId, const QString &remotePath,
                                          const QString &localPath, int priority)
{
    TransferTask task = TransferTask::download(profileId, remotePath, localPath);
    task.priority = priority;
    return enqueue(task);
}

// Control

bool TransferQueue::cancel(TransferId id)
{
    QString partialToRemove;
    std::optional<TransferTask> partialUpload;
    {
        QMutexLocker locker(&mutex_);
        TaskEntry *entry = findLocked(id);
        if (!entry || isTerminal(entry->task.state)) {
            return false;
        }

        if (entry->task.state == TransferState::Queued) {
            // A paused or backing-off task may already have written part of the file
            if (settings_.partialFiles == PartialFilePolicy::Delete && entry->task.bytesTransferred > 0) {
                if (entry->task.direction == TransferDirection::Download) {
                    partialToRemove = entry->task.localPath;
                } else {
                    partialUpload = entry->task;
                }
            }
            entry->task.finished = QDateTime::currentDateTime();
            setStateLocked(*entry, TransferState::Cancelled);
            checkAllFinishedLocked();
        } else {
            // Running: the worker stops at the next chunk boundary
            entry->interrupt = Interrupt::Cancel;
            entry->stopFlag->store(true);
        }
    }

    qDebug() << "TransferQueue: Cancel requested for" << id;
    if (!partialToRemove.isEmpty() && QFile::exists(partialToRemove) && !QFile::remove(partialToRemove)) {
        qWarning() << "TransferQueue: Could not remove partial file" << partialToRemove;
    }
    if (partialUpload) {
        removePartialUploadLater(*partialUpload);
    }
    emitPending();
    return true;
}

void TransferQueue::removePartialUploadLater(const TransferTask &task)
{
    std::unique_ptr<SessionPool::Lease> lease = pool_->tryAcquire(task.profileId);
    if (!lease) {
        qWarning() << "TransferQueue: No session free, partial upload left on server:" << task.remotePath;
        return;
    }

    std::shared_ptr<SessionPool::Lease> shared(std::move(lease));
    workers_.start([this, task, shared]() mutable {
        std::optional<ConnectionProfile> profile;
        if (profileProvider_) {
            profile = profileProvider_(task.profileId);
        }
        if (!profile) {
            qWarning() << "TransferQueue: Profile" << task.profileId
                       << "is gone, partial upload left on server:" << task.remotePath;
        } else {
            try {
                shared->open(*profile);
                removePartialFile(task, shared->session());
            } catch (const FftpError &e) {
                qWarning() << "TransferQueue: Could not reach server to remove partial upload"
                           << task.remotePath << e.what();
            }
        }
        shared.reset();
        // The cleanup held a pool slot that queued tasks may be waiting for
        requestSchedule();
    });
}

void TransferQueue::cancelAll()
{
    QList<TransferId> active;
    {
        QMutexLocker locker(&mutex_);
        for (const auto &item : tasks_) {
            if (!isTerminal(item.second.task.state)) {
                active.append(item.first);
            }
        }
    }
    for (TransferId id : active) {
        cancel(id);
    }
}

void TransferQueue::pauseAll()
{
    QMutexLocker locker(&mutex_);
    if (paused_) {
        return;
    }
    paused_ = true;
    int interrupted = 0;
    for (auto &item : tasks_) {
        TaskEntry &entry = item.second;
        if (entry.task.state == TransferState::Running && entry.interrupt == Interrupt::None) {
            entry.interrupt = Interrupt::Pause;
            entry.stopFlag->store(true);
            ++interrupted;
        }
    }
    qInfo() << "TransferQueue: Paused," << interrupted << "running transfers interrupted";
}

void TransferQueue::resumeAll()
{
    {
        QMutexLocker locker(&mutex_);
        if (!paused_) {
            return;
        }
        paused_ = false;
    }
    qInfo() << "TransferQueue: Resumed";
    requestSchedule();
}

bool TransferQueue::retry(TransferId id)
{
    {
        QMutexLocker locker(&mutex_);
        TaskEntry *entry = findLocked(id);
        if (!entry || (entry->task.state != TransferState::Failed
                       && entry->task.state != TransferState::Cancelled)) {
            return false;
        }

        entry->task.retryCount = 0;
        entry->task.lastError.reset();
        entry->task.finished = QDateTime();
        entry->notBeforeMs = 0;
        if (settings_.partialFiles == PartialFilePolicy::Keep) {
            entry->resumeOffset = entry->task.bytesTransferred;
        } else {
            // The partial file is gone, so this is a fresh run from zero
            entry->resumeOffset = 0;
            entry->task.bytesTransferred = 0;
        }
        setStateLocked(*entry, TransferState::Queued);
    }
    emitPending();
    requestSchedule();
    return true;
}

bool TransferQueue::acknowledge(TransferId id)
{
    {
        QMutexLocker locker(&mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end() || !isTerminal(it->second.task.state)) {
            return false;
        }
        publishLocked(makeEventLocked(it->second, TransferEvent::Type::Removed));
        tasks_.erase(it);
    }
    emitPending();
    return true;
}

int TransferQueue::removeFinished()
{
    int removed = 0;
    {
        QMutexLocker locker(&mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (isTerminal(it->second.task.state)) {
                publishLocked(makeEventLocked(it->second, TransferEvent::Type::Removed));
                it = tasks_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    emitPending();
    return removed;
}

// Observation

std::shared_ptr<TransferSubscription> TransferQueue::subscribe()
{
    QMutexLocker locker(&mutex_);
    auto subscription = std::make_shared<TransferSubscription>();
    subscribers_.push_back(subscription);
    return subscription;
}

TransferSnapshot TransferQueue::snapshotAndSubscribe()
{
    QMutexLocker locker(&mutex_);
    TransferSnapshot snapshot;
    for (const auto &item : tasks_) {
        snapshot.tasks.append(item.second.task);
    }
    snapshot.subscription = std::make_shared<TransferSubscription>();
    subscribers_.push_back(snapshot.subscription);
    return snapshot;
}

QList<TransferTask> TransferQueue::tasks() const
{
    QMutexLocker locker(&mutex_);
    QList<TransferTask> result;
    for (const auto &item : tasks_) {
        result.append(item.second.task);
    }
    return result;
}

std::optional<TransferTask> TransferQueue::task(TransferId id) const
{
    QMutexLocker locker(&mutex_);
    const TaskEntry *entry = findLocked(id);
    if (!entry) {
        return std::nullopt;
    }
    return entry->task;
}

int TransferQueue::runningCount() const
{
    QMutexLocker locker(&mutex_);
    return static_cast<int>(std::count_if(tasks_.begin(), tasks_.end(), [](const auto &item) {
        return item.second.task.state == TransferState::Running;
    }));
}

int TransferQueue::queuedCount() const
{
    QMutexLocker locker(&mutex_);
    return static_cast<int>(std::count_if(tasks_.begin(), tasks_.end(), [](const auto &item) {
        return item.second.task.state == TransferState::Queued;
    }));
}

bool TransferQueue::isPaused() const
{
    QMutexLocker locker(&mutex_);
    return paused_;
}

bool TransferQueue::isIdle() const
{
    QMutexLocker locker(&mutex_);
    return !hasActiveLocked();
}

qint64 TransferQueue::backoffDelayMs(int attempt) const
{
    if (attempt < 1) {
        return 0;
    }
    const double delay = settings_.retryBaseDelayMs * std::pow(settings_.retryMultiplier, attempt - 1);
    return static_cast<qint64>(std::min(delay, static_cast<double>(settings_.retryMaxDelayMs)));
}

// Scheduling

void TransferQueue::requestSchedule()
{
    if (QThread::currentThread() == thread()) {
        schedule();
    } else {
        QMetaObject::invokeMethod(this, &TransferQueue::schedule, Qt::QueuedConnection);
    }
}

void TransferQueue::schedule()
{
    qint64 nextDueMs = -1;
    {
        QMutexLocker locker(&mutex_);
        if (paused_ || shuttingDown_) {
            return;
        }

        const qint64 now = clock_.elapsed();
        std::set<QString> blockedProfiles;

        for (;;) {
            int running = 0;
            for (const auto &item : tasks_) {
                if (item.second.task.state == TransferState::Running) {
                    ++running;
                }
            }
            if (running >= settings_.maxConcurrent) {
                break;
            }

            // Highest priority first; map order keeps FIFO within a priority
            TaskEntry *best = nullptr;
            for (auto &item : tasks_) {
                TaskEntry &entry = item.second;
                if (entry.task.state != TransferState::Queued || entry.notBeforeMs > now
                    || blockedProfiles.count(entry.task.profileId) > 0) {
                    continue;
                }
                if (!best || entry.task.priority > best->task.priority) {
                    best = &entry;
                }
            }
            if (!best) {
                break;
            }

            std::unique_ptr<SessionPool::Lease> lease = pool_->tryAcquire(best->task.profileId);
            if (!lease) {
                blockedProfiles.insert(best->task.profileId);
                continue;
            }

            best->interrupt = Interrupt::None;
            best->stopFlag->store(false);
            best->task.started = QDateTime::currentDateTime();
            best->task.bytesPerSecond = 0.0;
            best->task.etaSeconds = -1;
            best->rate.clear();
            best->rate.addSample(now, best->task.bytesTransferred);
            setStateLocked(*best, TransferState::Running);

            const TransferId id = best->task.id;
            std::shared_ptr<SessionPool::Lease> shared(std::move(lease));
            workers_.start([this, id, shared]() mutable {
                runTask(id, std::move(shared));
            });
        }

        for (const auto &item : tasks_) {
            const TaskEntry &entry = item.second;
            if (entry.task.state == TransferState::Queued && entry.notBeforeMs > now) {
                nextDueMs = nextDueMs < 0 ? entry.notBeforeMs : std::min(nextDueMs, entry.notBeforeMs);
            }
        }
        if (nextDueMs >= 0) {
            nextDueMs = std::max<qint64>(0, nextDueMs - now);
        }
    }

    if (nextDueMs >= 0) {
        retryTimer_->start(static_cast<int>(nextDueMs));
    }
    emitPending();
}

// Worker side

qint64 TransferQueue::startOffsetFor(const TransferTask &task, IProtocolSession *session, qint64 offset)
{
    if (offset <= 0 || !session->supportsResume()) {
        return 0;
    }
    if (task.direction == TransferDirection::Upload) {
        // Bytes in flight when the last run stopped may not have reached the server
        std::optional<qint64> remote = session->remoteSize(task.remotePath);
        return remote ? std::min(offset, *remote) : 0;
    }
    const qint64 local = QFile(task.localPath).size();
    return std::min(offset, local);
}

void TransferQueue::runTask(TransferId id, std::shared_ptr<SessionPool::Lease> lease)
{
    TransferTask task;
    std::shared_ptr<std::atomic_bool> stopFlag;
    qint64 offset = 0;
    {
        QMutexLocker locker(&mutex_);
        TaskEntry *entry = findLocked(id);
        if (!entry) {
            return;
        }
        task = entry->task;
        stopFlag = entry->stopFlag;
        offset = entry->resumeOffset;
    }

    std::optional<TransferError> error;
    bool interrupted = false;
    bool resumable = false;

    std::optional<ConnectionProfile> profile;
    if (profileProvider_) {
        profile = profileProvider_(task.profileId);
    }

    if (!profile) {
        error = TransferError{ErrorKind::ProfileNotFound,
                              QStringLiteral("No profile with id %1").arg(task.profileId)};
    } else {
        try {
            lease->open(*profile);
            IProtocolSession *session = lease->session();
            resumable = session->supportsResume();
            offset = startOffsetFor(task, session, offset);

            const BandwidthLimiter limiter(settings_.speedLimit);
            QElapsedTimer runClock;
            runClock.start();
            const qint64 startOffset = offset;

            auto progress = [&](qint64 done, qint64 total) {
                reportProgress(id, done, total);
                qint64 delay = limiter.delayMs(runClock.elapsed(), done - startOffset);
                while (delay > 0 && !stopFlag->load()) {
                    QThread::msleep(static_cast<unsigned long>(std::min(delay, ThrottleSliceMs)));
                    delay = limiter.delayMs(runClock.elapsed(), done - startOffset);
                }
            };

            LOG_VERBOSE() << "TransferQueue: Task" << id << "starting at offset" << offset
                          << (lease->reused() ? "(reused session)" : "(new session)");

            if (task.direction == TransferDirection::Upload) {
                session->upload(task.localPath, task.remotePath, offset, progress, *stopFlag);
            } else {
                session->download(task.remotePath, task.localPath, offset, progress, *stopFlag);
            }
        } catch (const TransferCancelledError &) {
            interrupted = true;
        } catch (const FftpError &e) {
            error = TransferError{e.kind(), e.message()};
        } catch (const std::exception &e) {
            error = TransferError{ErrorKind::Internal, QString::fromUtf8(e.what())};
        }
    }

    bool deletePartial = false;
    {
        QMutexLocker locker(&mutex_);
        const TaskEntry *entry = findLocked(id);
        deletePartial = entry && entry->interrupt == Interrupt::Cancel
            && (interrupted || error.has_value())
            && settings_.partialFiles == PartialFilePolicy::Delete;
    }
    if (deletePartial) {
        removePartialFile(task, lease->session());
    }

    // Hand the session back before anyone can observe the final state
    lease.reset();

    finishTask(id, error, interrupted, resumable);
}

void TransferQueue::removePartialFile(const TransferTask &task, IProtocolSession *session)
{
    if (task.direction == TransferDirection::Download) {
        if (QFile::exists(task.localPath) && !QFile::remove(task.localPath)) {
            qWarning() << "TransferQueue: Could not remove partial file" << task.localPath;
        }
        return;
    }
    if (!session || !session->isConnected()) {
        qWarning() << "TransferQueue: Partial upload left on server:" << task.remotePath;
        return;
    }
    try {
        session->remove(task.remotePath);
    } catch (const FftpError &e) {
        qWarning() << "TransferQueue: Could not remove partial upload" << task.remotePath << e.what();
    }
}

void TransferQueue::reportProgress(TransferId id, qint64 done, qint64 total)
{
    {
        QMutexLocker locker(&mutex_);
        TaskEntry *entry = findLocked(id);
        if (!entry || entry->task.state != TransferState::Running) {
            return;
        }
        if (total >= 0 && entry->task.totalBytes < 0) {
            entry->task.totalBytes = total;
        }
        // Only forward progress; a restarted run stays silent until it catches up
        if (done <= entry->task.bytesTransferred) {
            return;
        }
        entry->task.bytesTransferred = done;
        entry->rate.addSample(clock_.elapsed(), done);
        entry->task.bytesPerSecond = entry->rate.bytesPerSecond();
        entry->task.etaSeconds = entry->task.totalBytes >= 0
            ? entry->rate.etaSeconds(entry->task.totalBytes - done) : -1;
        publishLocked(makeEventLocked(*entry, TransferEvent::Type::Progress));
    }
    emitPending();
}

void TransferQueue::finishTask(TransferId id, const std::optional<TransferError> &error,
                               bool interrupted, bool resumable)
{
    {
        QMutexLocker locker(&mutex_);
        TaskEntry *entry = findLocked(id);
        if (entry) {
            entry->task.bytesPerSecond = 0.0;
            entry->task.etaSeconds = -1;

            if (entry->interrupt != Interrupt::None && (interrupted || error)) {
                handleInterruptedLocked(*entry, resumable);
            } else if (error) {
                handleFailureLocked(*entry, *error, resumable);
            } else if (interrupted) {
                entry->interrupt = Interrupt::Cancel;
                handleInterruptedLocked(*entry, resumable);
            } else {
                if (entry->task.totalBytes < 0) {
                    entry->task.totalBytes = entry->task.bytesTransferred;
                }
                entry->task.lastError.reset();
                entry->task.finished = QDateTime::currentDateTime();
                setStateLocked(*entry, TransferState::Completed);
                qInfo() << "TransferQueue: Task" << id << "completed," << entry->task.bytesTransferred << "bytes";
            }
            entry->interrupt = Interrupt::None;

            if (isTerminal(entry->task.state)) {
                checkAllFinishedLocked();
            }
        }
    }
    emitPending();
    requestSchedule();
}

void TransferQueue::handleInterruptedLocked(TaskEntry &entry, bool resumable)
{
    if (entry.interrupt == Interrupt::Pause) {
        entry.resumeOffset = resumable ? entry.task.bytesTransferred : 0;
        entry.notBeforeMs = 0;
        setStateLocked(entry, TransferState::Queued);
        LOG_VERBOSE() << "TransferQueue: Task" << entry.task.id << "paused at" << entry.task.bytesTransferred;
        return;
    }
    entry.task.finished = QDateTime::currentDateTime();
    setStateLocked(entry, TransferState::Cancelled);
    qInfo() << "TransferQueue: Task" << entry.task.id << "cancelled";
}

void TransferQueue::handleFailureLocked(TaskEntry &entry, const TransferError &error, bool resumable)
{
    entry.task.lastError = error;

    const bool willRetry = isTransient(error.kind)
        && entry.task.retryCount < settings_.maxRetries
        && !shuttingDown_;

    if (willRetry) {
        setStateLocked(entry, TransferState::Failed, true);
        entry.task.retryCount++;
        entry.resumeOffset = resumable ? entry.task.bytesTransferred : 0;
        const qint64 delay = backoffDelayMs(entry.task.retryCount);
        entry.notBeforeMs = clock_.elapsed() + delay;
        setStateLocked(entry, TransferState::Queued);
        qInfo() << "TransferQueue: Task" << entry.task.id << "failed (" << errorKindToString(error.kind)
                << "), retry" << entry.task.retryCount << "of" << settings_.maxRetries << "in" << delay << "ms";
        return;
    }

    entry.task.finished = QDateTime::currentDateTime();
    setStateLocked(entry, TransferState::Failed);
    qWarning() << "TransferQueue: Task" << entry.task.id << "failed:" << errorKindToString(error.kind)
               << error.message;
}

// Event publication

TransferEvent TransferQueue::makeEventLocked(const TaskEntry &entry, TransferEvent::Type type) const
{
    TransferEvent event;
    event.type = type;
    event.taskId = entry.task.id;
    event.state = entry.task.state;
    event.previousState = entry.task.state;
    event.bytesTransferred = entry.task.bytesTransferred;
    event.totalBytes = entry.task.totalBytes;
    event.retryCount = entry.task.retryCount;
    event.bytesPerSecond = entry.task.bytesPerSecond;
    event.etaSeconds = entry.task.etaSeconds;
    if (entry.task.state == TransferState::Failed) {
        event.error = entry.task.lastError;
    }
    return event;
}

void TransferQueue::setStateLocked(TaskEntry &entry, TransferState state, bool willRetry)
{
    const TransferState previous = entry.task.state;
    entry.task.state = state;

    TransferEvent event = makeEventLocked(entry, TransferEvent::Type::StateChanged);
    event.previousState = previous;
    event.willRetry = willRetry;
    publishLocked(event);

    LOG_VERBOSE() << "TransferQueue: Task" << entry.task.id << transferStateToString(previous)
                  << "->" << transferStateToString(state);
}

void TransferQueue::publishLocked(const TransferEvent &event)
{
    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
        if (auto subscription = it->lock()) {
            subscription->push(event);
            ++it;
        } else {
            it = subscribers_.erase(it);
        }
    }
    pendingSignals_.enqueue(PendingSignal{event, false});
}

void TransferQueue::checkAllFinishedLocked()
{
    if (!hasActiveLocked()) {
        pendingSignals_.enqueue(PendingSignal{TransferEvent(), true});
    }
}

void TransferQueue::emitPending()
{
    // One signal at a time, so a re-entrant call keeps the published order
    QMutexLocker emitLocker(&emitMutex_);
    for (;;) {
        PendingSignal pending;
        {
            QMutexLocker locker(&mutex_);
            if (pendingSignals_.isEmpty()) {
                return;
            }
            pending = pendingSignals_.dequeue();
        }

        if (pending.allFinished) {
            emit allTasksFinished();
            continue;
        }

        const TransferEvent &event = pending.event;
        emit transferEvent(event);
        if (event.type != TransferEvent::Type::StateChanged) {
            continue;
        }
        switch (event.state) {
        case TransferState::Running:
            emit taskStarted(event.taskId);
            break;
        case TransferState::Completed:
            emit taskCompleted(event.taskId);
            break;
        case TransferState::Failed:
            if (!event.willRetry) {
                emit taskFailed(event.taskId, event.error ? event.error->message : QString());
            }
            break;
        case TransferState::Cancelled:
            emit taskCancelled(event.taskId);
            break;
        case TransferState::Queued:
            break;
        }
    }
}

TransferQueue::TaskEntry *TransferQueue::findLocked(TransferId id)
{
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

const TransferQueue::TaskEntry *TransferQueue::findLocked(TransferId id) const
{
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

bool TransferQueue::hasActiveLocked() const
{
    for (const auto &item : tasks_) {
        if (!isTerminal(item.second.task.state)) {
            return true;
        }
    }
    return false;
}
