/**
 * @file mocksession.h
 * @brief Scriptable in-memory protocol sessions for testing.
 *
 * MockSessionFactory hands out MockSession objects that share one
 * MockBackend: an in-memory remote file system plus the knobs tests use
 * to inject failures, slow transfers down and park them mid-flight.
 */

#ifndef MOCKSESSION_H
#define MOCKSESSION_H

#include <QMap>
#include <QMutex>
#include <QWaitCondition>

#include <memory>
#include <optional>

#include "services/errors.h"
#include "services/sessionfactory.h"

/**
 * @brief State shared by every mock session of one factory.
 *
 * All members are safe to call from any thread.
 *
 * @par Example usage:
 * @code
 * auto factory = std::make_unique<MockSessionFactory>();
 * factory->backend()->failNextTransfers("/in/a.bin", 2, ErrorKind::Network);
 * factory->backend()->setChunkDelayMs(5);
 * TransferQueue queue(factory.get(), provider, settings);
 * @endcode
 */
class MockBackend
{
public:
    /// @name Remote file system
    /// @{
    void setRemoteFile(const QString &path, const QByteArray &data);
    [[nodiscard]] QByteArray remoteFile(const QString &path) const;
    [[nodiscard]] bool hasRemoteFile(const QString &path) const;
    /// @}

    /// @name Scripting
    /// @{

    /// The next @p count transfers of @p remotePath fail with @p kind after one chunk.
    void failNextTransfers(const QString &remotePath, int count, ErrorKind kind);
    /// The next @p count connect attempts fail with NetworkError.
    void failNextConnects(int count);
    void setChunkSize(int bytes);
    void setChunkDelayMs(int ms);
    void setResumeSupported(bool supported);

    /// Parks every transfer after its first chunk until release() or cancel.
    void holdAfterFirstChunk(bool hold);
    void release();
    /// @}

    /// @name Observation
    /// @{
    [[nodiscard]] int sessionsCreated() const;
    [[nodiscard]] int connectCount() const;
    [[nodiscard]] int transferCount() const;
    [[nodiscard]] int activeTransfers() const;
    [[nodiscard]] int maxActiveTransfers() const;
    [[nodiscard]] int heldTransfers() const;
    [[nodiscard]] QList<qint64> resumeOffsets() const;
    /// @}

private:
    friend class MockSession;
    friend class MockSessionFactory;

    void noteSessionCreated();
    void noteConnect();
    void beginTransfer(qint64 resumeOffset);
    void endTransfer();
    void truncateRemote(const QString &path, qint64 size);
    void appendRemote(const QString &path, const QByteArray &chunk);
    [[nodiscard]] bool takeConnectFailure();
    [[nodiscard]] std::optional<ErrorKind> takeFailure(const QString &remotePath);
    void waitWhileHeld(const std::atomic_bool &cancel);
    [[nodiscard]] int chunkSize() const;
    [[nodiscard]] int chunkDelayMs() const;
    [[nodiscard]] bool resumeSupported() const;

    mutable QMutex mutex_;
    QWaitCondition heldCondition_;
    QMap<QString, QByteArray> remoteFiles_;
    QMap<QString, QList<ErrorKind>> failures_;
    int connectFailures_ = 0;
    int chunkSize_ = 1024;
    int chunkDelayMs_ = 0;
    bool resumeSupported_ = true;
    bool hold_ = false;
    int held_ = 0;
    int sessionsCreated_ = 0;
    int connects_ = 0;
    int transfers_ = 0;
    int active_ = 0;
    int maxActive_ = 0;
    QList<qint64> resumeOffsets_;
};

/**
 * @brief In-memory IProtocolSession backed by a MockBackend.
 */
class MockSession : public IProtocolSession
{
public:
    MockSession(std::shared_ptr<MockBackend> backend, Protocol protocol);
    ~MockSession() override = default;

    [[nodiscard]] Protocol protocol() const override { return protocol_; }

    void connectToHost(const ConnectionProfile &profile) override;
    void disconnectFromHost() override;
    [[nodiscard]] bool isConnected() const override { return connected_; }

    [[nodiscard]] QList<RemoteEntry> listDirectory(const QString &path) override;
    void remove(const QString &path) override;
    void makeDirectory(const QString &path) override;
    void removeDirectory(const QString &path) override;
    void rename(const QString &from, const QString &to) override;
    [[nodiscard]] std::optional<qint64> remoteSize(const QString &path) override;

    void upload(const QString &localPath, const QString &remotePath, qint64 resumeOffset,
                const ProgressCallback &progress, const std::atomic_bool &cancel) override;
    void download(const QString &remotePath, const QString &localPath, qint64 resumeOffset,
                  const ProgressCallback &progress, const std::atomic_bool &cancel) override;
    [[nodiscard]] bool supportsResume() const override;

private:
    void ensureConnected() const;
    [[noreturn]] void fail(ErrorKind kind, const QString &message);

    std::shared_ptr<MockBackend> backend_;
    Protocol protocol_;
    bool connected_ = false;
};

/**
 * @brief ISessionFactory producing MockSession objects.
 */
class MockSessionFactory : public ISessionFactory
{
public:
    MockSessionFactory();

    [[nodiscard]] std::unique_ptr<IProtocolSession> createSession(const ConnectionProfile &profile) override;

    [[nodiscard]] const std::shared_ptr<MockBackend> &backend() const { return backend_; }

private:
    std::shared_ptr<MockBackend> backend_;
};

#endif // MOCKSESSION_H
