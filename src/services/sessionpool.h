/**
 * @file sessionpool.h
 * @brief Bounded pool of live protocol sessions keyed by profile.
 */

#ifndef SESSIONPOOL_H
#define SESSIONPOOL_H

#include "connectionprofile.h"
#include "iprotocolsession.h"

#include <QElapsedTimer>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QTimer>

#include <map>
#include <memory>
#include <vector>

class ISessionFactory;

/**
 * @brief Pool of reusable sessions with per-profile and total limits.
 *
 * A caller reserves a slot with tryAcquire() and receives a Lease. The
 * lease opens (or reuses) a connection on the caller's thread and returns
 * it to the pool when destroyed. Idle sessions are closed after the idle
 * timeout. When the total limit is reached, an idle session of another
 * profile is evicted to make room.
 *
 * @par Example usage:
 * @code
 * std::unique_ptr<SessionPool::Lease> lease = pool->tryAcquire(profile.id);
 * if (lease) {
 *     lease->open(profile);       // connects or reuses
 *     lease->session()->download(...);
 * }                               // session goes back to the pool
 * @endcode
 */
class SessionPool : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief RAII handle on one pooled session.
     */
    class Lease
    {
    public:
        ~Lease();

        Lease(const Lease &) = delete;
        Lease &operator=(const Lease &) = delete;

        /**
         * @brief Makes the leased session usable on the current thread.
         *
         * Reuses the pooled connection if it is still alive, otherwise
         * creates and connects a new session.
         * @throws FftpError from the session's connectToHost().
         */
        void open(const ConnectionProfile &profile);

        [[nodiscard]] IProtocolSession *session() const { return session_.get(); }
        [[nodiscard]] IProtocolSession *operator->() const { return session_.get(); }
        [[nodiscard]] QString profileId() const { return profileId_; }

        /// True if open() reused an existing connection.
        [[nodiscard]] bool reused() const { return reused_; }

    private:
        friend class SessionPool;
        Lease(SessionPool *pool, const QString &profileId,
              std::unique_ptr<IProtocolSession> session,
              std::unique_ptr<IProtocolSession> evicted);

        SessionPool *pool_;
        QString profileId_;
        std::unique_ptr<IProtocolSession> session_;
        std::unique_ptr<IProtocolSession> evicted_;
        bool reused_ = false;
    };

    SessionPool(ISessionFactory *factory,
                int maxTotal,
                int maxPerProfile,
                int idleTimeoutMs,
                QObject *parent = nullptr);
    ~SessionPool() override;

    /**
     * @brief Reserves a session slot for a profile without blocking.
     * @return nullptr if the per-profile or total limit is reached.
     */
    [[nodiscard]] std::unique_ptr<Lease> tryAcquire(const QString &profileId);

    /// True if tryAcquire() would currently succeed for the profile.
    [[nodiscard]] bool hasCapacity(const QString &profileId) const;

    /// @name Statistics
    /// @{
    [[nodiscard]] int idleCount() const;
    [[nodiscard]] int busyCount() const;
    [[nodiscard]] int sessionCount(const QString &profileId) const;
    [[nodiscard]] int createdCount() const;
    /// @}

    [[nodiscard]] int maxTotal() const { return maxTotal_; }
    [[nodiscard]] int maxPerProfile() const { return maxPerProfile_; }
    [[nodiscard]] int idleTimeoutMs() const { return idleTimeoutMs_; }

    void setLimits(int maxTotal, int maxPerProfile);

public slots:
    /// Closes idle sessions older than the idle timeout.
    void reapIdle();

    /// Closes every idle session.
    void closeIdle();

private:
    struct IdleSession {
        std::unique_ptr<IProtocolSession> session;
        QElapsedTimer since;
    };

    struct ProfileSlots {
        int busy = 0;
        std::vector<IdleSession> idle;
    };

    void release(const QString &profileId, std::unique_ptr<IProtocolSession> session);
    std::unique_ptr<IProtocolSession> createSession(const ConnectionProfile &profile);
    [[nodiscard]] int totalLocked() const;
    [[nodiscard]] bool canOpenLocked(const QString &profileId, bool *needsEviction) const;
    static void closeSession(std::unique_ptr<IProtocolSession> session);

    ISessionFactory *factory_;
    int maxTotal_;
    int maxPerProfile_;
    int idleTimeoutMs_;
    int created_ = 0;
    std::map<QString, ProfileSlots> profiles_;
    QTimer *reaper_;
    mutable QMutex mutex_;
};

#endif // SESSIONPOOL_H
