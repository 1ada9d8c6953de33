/**
 * @file iprotocolsession.h
 * @brief Interface for protocol session implementations.
 *
 * A session is one live connection to a server bound to one profile. The
 * transfer engine only talks to this interface, so FTP, FTPS, SFTP and the
 * test mocks are interchangeable.
 */

#ifndef IPROTOCOLSESSION_H
#define IPROTOCOLSESSION_H

#include <QList>
#include <QString>

#include <atomic>
#include <functional>
#include <optional>

#include "connectionprofile.h"
#include "remoteentry.h"

class KnownHostsStore;

/**
 * @brief Tuning shared by every session implementation.
 */
struct SessionOptions {
    int connectTimeoutMs = 30000;            ///< Connect and per-read timeout
    qint64 chunkSize = 64 * 1024;            ///< Bytes per read/write step
    KnownHostsStore *knownHosts = nullptr;   ///< SFTP host key store (not owned)
};

/**
 * @brief Abstract interface for protocol sessions.
 *
 * All calls block the calling thread until the operation finishes and
 * report failures by throwing FftpError subclasses:
 * - AuthenticationError: login or host key refused
 * - NetworkError: unreachable, timeout, connection dropped
 * - ProtocolError: unexpected or negative server response
 * - LocalIOError: local file cannot be read or written
 * - TransferCancelledError: the cancel flag was raised
 *
 * A session serves one operation at a time. It may be handed between
 * threads; the new owner calls attachToCurrentThread() before use and
 * detachFromThread() when handing it back.
 *
 * @par Example usage:
 * @code
 * std::unique_ptr<IProtocolSession> session = factory.createSession(profile);
 * session->connectToHost(profile);
 * std::atomic_bool cancel{false};
 * session->download("/pub/file.bin", "/tmp/file.bin", 0,
 *                   [](qint64 done, qint64 total) { ... }, cancel);
 * @endcode
 */
class IProtocolSession
{
public:
    /// Called once per chunk with (bytes so far, total or -1 if unknown).
    using ProgressCallback = std::function<void(qint64, qint64)>;

    virtual ~IProtocolSession() = default;

    [[nodiscard]] virtual Protocol protocol() const = 0;

    /// @name Connection
    /// @{
    virtual void connectToHost(const ConnectionProfile &profile) = 0;
    /// Closes the connection; never throws.
    virtual void disconnectFromHost() = 0;
    [[nodiscard]] virtual bool isConnected() const = 0;
    /// @}

    /// @name Remote file system
    /// @{
    [[nodiscard]] virtual QList<RemoteEntry> listDirectory(const QString &path) = 0;
    virtual void remove(const QString &path) = 0;
    virtual void makeDirectory(const QString &path) = 0;
    virtual void removeDirectory(const QString &path) = 0;
    virtual void rename(const QString &from, const QString &to) = 0;

    /// Size of a remote file, or std::nullopt if the server does not report it.
    [[nodiscard]] virtual std::optional<qint64> remoteSize(const QString &path) = 0;
    /// @}

    /// @name Transfers
    /// @{

    /**
     * @brief Uploads a local file, starting at @p resumeOffset.
     *
     * Returns normally once the server confirmed the transfer.
     */
    virtual void upload(const QString &localPath,
                        const QString &remotePath,
                        qint64 resumeOffset,
                        const ProgressCallback &progress,
                        const std::atomic_bool &cancel) = 0;

    /**
     * @brief Downloads a remote file, starting at @p resumeOffset.
     *
     * The local file is truncated to @p resumeOffset before writing.
     */
    virtual void download(const QString &remotePath,
                          const QString &localPath,
                          qint64 resumeOffset,
                          const ProgressCallback &progress,
                          const std::atomic_bool &cancel) = 0;

    [[nodiscard]] virtual bool supportsResume() const = 0;
    /// @}

    /// @name Thread hand-over
    /// @{
    virtual void attachToCurrentThread() {}
    virtual void detachFromThread() {}
    /// @}
};

#endif // IPROTOCOLSESSION_H
