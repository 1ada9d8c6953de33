#include "sessionpool.h"
#include "errors.h"
#include "sessionfactory.h"
#include "utils/logging.h"

#include <QMutexLocker>

#include <algorithm>

// Lease

SessionPool::Lease::Lease(SessionPool *pool, const QString &profileId,
                          std::unique_ptr<IProtocolSession> session,
                          std::unique_ptr<IProtocolSession> evicted)
    : pool_(pool)
    , profileId_(profileId)
    , session_(std::move(session))
    , evicted_(std::move(evicted))
{
}

SessionPool::Lease::~Lease()
{
    if (evicted_) {
        closeSession(std::move(evicted_));
    }
    if (session_) {
        session_->detachFromThread();
    }
    pool_->release(profileId_, std::move(session_));
}

void SessionPool::Lease::open(const ConnectionProfile &profile)
{
    if (evicted_) {
        closeSession(std::move(evicted_));
    }

    if (session_) {
        session_->attachToCurrentThread();
        if (session_->isConnected()) {
            reused_ = true;
            LOG_VERBOSE() << "SessionPool: Reusing session for profile" << profileId_;
            return;
        }
        session_.reset();
    }

    reused_ = false;
    session_ = pool_->createSession(profile);
    session_->connectToHost(profile);
}

// SessionPool

SessionPool::SessionPool(ISessionFactory *factory,
                         int maxTotal,
                         int maxPerProfile,
                         int idleTimeoutMs,
                         QObject *parent)
    : QObject(parent)
    , factory_(factory)
    , maxTotal_(std::max(1, maxTotal))
    , maxPerProfile_(std::max(1, maxPerProfile))
    , idleTimeoutMs_(idleTimeoutMs)
    , reaper_(new QTimer(this))
{
    reaper_->setInterval(std::clamp(idleTimeoutMs_ / 4, 10, 1000));
    connect(reaper_, &QTimer::timeout, this, &SessionPool::reapIdle);
    reaper_->start();
}

SessionPool::~SessionPool()
{
    closeIdle();
}

void SessionPool::setLimits(int maxTotal, int maxPerProfile)
{
    QMutexLocker locker(&mutex_);
    maxTotal_ = std::max(1, maxTotal);
    maxPerProfile_ = std::max(1, maxPerProfile);
}

int SessionPool::totalLocked() const
{
    int total = 0;
    for (const auto &entry : profiles_) {
        total += entry.second.busy + static_cast<int>(entry.second.idle.size());
    }
    return total;
}

bool SessionPool::canOpenLocked(const QString &profileId, bool *needsEviction) const
{
    *needsEviction = false;

    int open = 0;
    auto it = profiles_.find(profileId);
    if (it != profiles_.end()) {
        if (!it->second.idle.empty()) {
            return true;
        }
        open = it->second.busy;
    }
    if (open >= maxPerProfile_) {
        return false;
    }
    if (totalLocked() < maxTotal_) {
        return true;
    }

    // Full: an idle session of another profile can make room
    for (const auto &entry : profiles_) {
        if (entry.first != profileId && !entry.second.idle.empty()) {
            *needsEviction = true;
            return true;
        }
    }
    return false;
}

bool SessionPool::hasCapacity(const QString &profileId) const
{
    QMutexLocker locker(&mutex_);
    bool needsEviction = false;
    return canOpenLocked(profileId, &needsEviction);
}

std::unique_ptr<SessionPool::Lease> SessionPool::tryAcquire(const QString &profileId)
{
    QMutexLocker locker(&mutex_);

    bool needsEviction = false;
    if (!canOpenLocked(profileId, &needsEviction)) {
        return nullptr;
    }

    std::unique_ptr<IProtocolSession> evicted;
    if (needsEviction) {
        // Evict the longest-idle session of any other profile
        std::vector<IdleSession> *victimList = nullptr;
        qint64 oldest = -1;
        for (auto &entry : profiles_) {
            if (entry.first == profileId) {
                continue;
            }
            for (const IdleSession &idle : entry.second.idle) {
                if (idle.since.elapsed() > oldest) {
                    oldest = idle.since.elapsed();
                    victimList = &entry.second.idle;
                }
            }
        }
        if (victimList) {
            auto victim = std::max_element(victimList->begin(), victimList->end(),
                [](const IdleSession &a, const IdleSession &b) {
                    return a.since.elapsed() < b.since.elapsed();
                });
            evicted = std::move(victim->session);
            victimList->erase(victim);
            LOG_VERBOSE() << "SessionPool: Evicting idle session to make room for profile" << profileId;
        }
    }

    ProfileSlots &slot = profiles_[profileId];
    std::unique_ptr<IProtocolSession> session;
    if (!slot.idle.empty()) {
        // Most recently used first, it is the most likely to be alive
        session = std::move(slot.idle.back().session);
        slot.idle.pop_back();
    }
    slot.busy++;

    return std::unique_ptr<Lease>(new Lease(this, profileId, std::move(session), std::move(evicted)));
}

std::unique_ptr<IProtocolSession> SessionPool::createSession(const ConnectionProfile &profile)
{
    std::unique_ptr<IProtocolSession> session = factory_->createSession(profile);
    if (!session) {
        throw InternalError(QStringLiteral("No session implementation for profile %1").arg(profile.id));
    }
    QMutexLocker locker(&mutex_);
    created_++;
    return session;
}

void SessionPool::release(const QString &profileId, std::unique_ptr<IProtocolSession> session)
{
    std::unique_ptr<IProtocolSession> toClose;
    {
        QMutexLocker locker(&mutex_);
        ProfileSlots &slot = profiles_[profileId];
        slot.busy = std::max(0, slot.busy - 1);

        if (session && session->isConnected()) {
            IdleSession idle;
            idle.session = std::move(session);
            idle.since.start();
            slot.idle.push_back(std::move(idle));
        } else {
            toClose = std::move(session);
        }
    }
    if (toClose) {
        closeSession(std::move(toClose));
    }
}

void SessionPool::reapIdle()
{
    std::vector<std::unique_ptr<IProtocolSession>> expired;
    {
        QMutexLocker locker(&mutex_);
        for (auto &entry : profiles_) {
            auto &idle = entry.second.idle;
            for (auto it = idle.begin(); it != idle.end();) {
                if (it->since.hasExpired(idleTimeoutMs_)) {
                    expired.push_back(std::move(it->session));
                    it = idle.erase(it);
                } else {
                    ++it;
                }
            }
        }
    }
    if (!expired.empty()) {
        LOG_VERBOSE() << "SessionPool: Closing" << expired.size() << "idle sessions";
    }
    for (auto &session : expired) {
        closeSession(std::move(session));
    }
}

void SessionPool::closeIdle()
{
    std::vector<std::unique_ptr<IProtocolSession>> idleSessions;
    {
        QMutexLocker locker(&mutex_);
        for (auto &entry : profiles_) {
            for (IdleSession &idle : entry.second.idle) {
                idleSessions.push_back(std::move(idle.session));
            }
            entry.second.idle.clear();
        }
    }
    for (auto &session : idleSessions) {
        closeSession(std::move(session));
    }
}

void SessionPool::closeSession(std::unique_ptr<IProtocolSession> session)
{
    if (!session) {
        return;
    }
    session->attachToCurrentThread();
    session->disconnectFromHost();
}

int SessionPool::idleCount() const
{
    QMutexLocker locker(&mutex_);
    int count = 0;
    for (const auto &entry : profiles_) {
        count += static_cast<int>(entry.second.idle.size());
    }
    return count;
}

int SessionPool::busyCount() const
{
    QMutexLocker locker(&mutex_);
    int count = 0;
    for (const auto &entry : profiles_) {
        count += entry.second.busy;
    }
    return count;
}

int SessionPool::sessionCount(const QString &profileId) const
{
    QMutexLocker locker(&mutex_);
    auto it = profiles_.find(profileId);
    if (it == profiles_.end()) {
        return 0;
    }
    return it->second.busy + static_cast<int>(it->second.idle.size());
}

int SessionPool::createdCount() const
{
    QMutexLocker locker(&mutex_);
    return created_;
}
