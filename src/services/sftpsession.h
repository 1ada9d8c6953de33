/**
 * @file sftpsession.h
 * @brief Blocking SFTP session built on libssh2.
 */

#ifndef SFTPSESSION_H
#define SFTPSESSION_H

#include "iprotocolsession.h"

#include <QByteArray>

typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;
typedef struct _LIBSSH2_SFTP_HANDLE LIBSSH2_SFTP_HANDLE;

/**
 * @brief SFTP implementation of IProtocolSession.
 *
 * Connects a plain TCP socket, runs the SSH handshake in blocking mode and
 * authenticates with a password or a private key file. The server host key
 * is checked against the KnownHostsStore from SessionOptions (trust on first
 * use); without a store the connection is refused.
 *
 * libssh2 state is not tied to a thread, so a session can be used from any
 * one thread at a time without hand-over.
 */
class SftpSession : public IProtocolSession
{
public:
    static constexpr int DefaultFileMode = 0644;
    static constexpr int DefaultDirectoryMode = 0755;
    static constexpr int KeepaliveIntervalSec = 30;

    explicit SftpSession(const SessionOptions &options = SessionOptions());
    ~SftpSession() override;

    SftpSession(const SftpSession &) = delete;
    SftpSession &operator=(const SftpSession &) = delete;

    /// @name IProtocolSession Implementation
    /// @{
    [[nodiscard]] Protocol protocol() const override { return Protocol::Sftp; }

    void connectToHost(const ConnectionProfile &profile) override;
    void disconnectFromHost() override;
    [[nodiscard]] bool isConnected() const override;

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
    [[nodiscard]] bool supportsResume() const override { return true; }
    /// @}

    /// Maps a libssh2 host key type to its OpenSSH name.
    [[nodiscard]] static QString hostKeyTypeName(int type);

    /// Renders SFTP permission bits as "rwxr-xr-x".
    [[nodiscard]] static QString permissionString(unsigned long mode);

private:
    void ensureConnected() const;
    void openSocket(const QString &host, quint16 port);
    void verifyHostKey();
    void authenticate(const ConnectionProfile &profile);
    [[noreturn]] void raise(const QString &what);
    void closeAll();

    [[nodiscard]] QString describe() const;

    SessionOptions options_;
    int socket_ = -1;
    LIBSSH2_SESSION *session_ = nullptr;
    LIBSSH2_SFTP *sftp_ = nullptr;
    QString host_;
    quint16 port_ = 0;
    QString profileName_;
};

#endif // SFTPSESSION_H
