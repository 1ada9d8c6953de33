#include "sftpsession.h"
#include "errors.h"
#include "knownhostsstore.h"
#include "utils/logging.h"

#include <QDebug>
#include <QFile>

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <memory>
#include <mutex>

namespace {

std::once_flag libssh2InitFlag;

void ensureLibssh2()
{
    std::call_once(libssh2InitFlag, []() {
        if (libssh2_init(0) != 0) {
            qCritical() << "SFTP: libssh2_init failed";
        }
    });
}

struct SftpHandleCloser {
    void operator()(LIBSSH2_SFTP_HANDLE *handle) const
    {
        if (handle) {
            libssh2_sftp_close_handle(handle);
        }
    }
};
using SftpHandlePtr = std::unique_ptr<LIBSSH2_SFTP_HANDLE, SftpHandleCloser>;

QDateTime fromEpoch(unsigned long seconds)
{
    return QDateTime::fromSecsSinceEpoch(static_cast<qint64>(seconds), Qt::UTC);
}

} // namespace

SftpSession::SftpSession(const SessionOptions &options)
    : options_(options)
{
    ensureLibssh2();
}

SftpSession::~SftpSession()
{
    closeAll();
}

QString SftpSession::describe() const
{
    return QStringLiteral("%1:%2").arg(host_).arg(port_);
}

// Connection

void SftpSession::connectToHost(const ConnectionProfile &profile)
{
    if (isConnected()) {
        disconnectFromHost();
    }

    host_ = profile.host;
    port_ = profile.effectivePort();
    profileName_ = profile.name;
    qDebug() << "SFTP: Connecting to" << describe();

    try {
        openSocket(host_, port_);

        session_ = libssh2_session_init();
        if (!session_) {
            throw InternalError(QStringLiteral("libssh2_session_init failed"));
        }
        libssh2_session_set_blocking(session_, 1);
        libssh2_session_set_timeout(session_, options_.connectTimeoutMs);

        if (libssh2_session_handshake(session_, socket_) != 0) {
            raise(QStringLiteral("SSH handshake"));
        }
        libssh2_keepalive_config(session_, 1, KeepaliveIntervalSec);

        verifyHostKey();
        authenticate(profile);

        sftp_ = libssh2_sftp_init(session_);
        if (!sftp_) {
            raise(QStringLiteral("SFTP subsystem start"));
        }
    } catch (const FftpError &) {
        closeAll();
        throw;
    }

    qDebug() << "SFTP: Logged in to" << describe() << "as profile" << profileName_;
}

void SftpSession::openSocket(const QString &host, quint16 port)
{
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const QByteArray hostName = host.toUtf8();
    const QByteArray service = QByteArray::number(port);

    struct addrinfo *result = nullptr;
    const int gai = ::getaddrinfo(hostName.constData(), service.constData(), &hints, &result);
    if (gai != 0) {
        throw NetworkError(QStringLiteral("Cannot resolve %1: %2")
                               .arg(host, QString::fromLocal8Bit(gai_strerror(gai))));
    }

    for (struct addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
        int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd == -1) {
            continue;
        }
        int keepalive = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));

        struct timeval tv{};
        tv.tv_sec = options_.connectTimeoutMs / 1000;
        tv.tv_usec = (options_.connectTimeoutMs % 1000) * 1000;
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (::connect(fd, rp->ai_addr, rp->ai_addrlen) == 0) {
            socket_ = fd;
            break;
        }
        ::close(fd);
    }
    ::freeaddrinfo(result);

    if (socket_ == -1) {
        throw NetworkError(QStringLiteral("Cannot connect to %1").arg(describe()));
    }
}

void SftpSession::verifyHostKey()
{
    size_t keyLength = 0;
    int keyType = 0;
    const char *hostKey = libssh2_session_hostkey(session_, &keyLength, &keyType);
    if (!hostKey || keyLength == 0) {
        raise(QStringLiteral("Reading host key"));
    }
    if (!options_.knownHosts) {
        throw AuthenticationError(QStringLiteral("No known hosts store to verify %1").arg(describe()));
    }
    options_.knownHosts->verifyOrTrust(host_, port_, hostKeyTypeName(keyType),
                                       QByteArray(hostKey, static_cast<int>(keyLength)));
}

void SftpSession::authenticate(const ConnectionProfile &profile)
{
    const QByteArray user = profile.username.toUtf8();
    QByteArray secret = profile.secret.toUtf8();
    int rc = 0;

    if (profile.credentialKind == CredentialKind::PrivateKey) {
        const QByteArray keyPath = QFile::encodeName(profile.keyPath);
        LOG_VERBOSE() << "SFTP: Public key authentication for profile" << profileName_;
        rc = libssh2_userauth_publickey_fromfile_ex(session_, user.constData(),
                                                    static_cast<unsigned int>(user.size()),
                                                    nullptr, keyPath.constData(),
                                                    secret.isEmpty() ? nullptr : secret.constData());
    } else {
        LOG_VERBOSE() << "SFTP: Password authentication for profile" << profileName_;
        rc = libssh2_userauth_password_ex(session_, user.constData(),
                                          static_cast<unsigned int>(user.size()),
                                          secret.constData(),
                                          static_cast<unsigned int>(secret.size()), nullptr);
    }
    secret.fill('\0');

    if (rc == 0) {
        return;
    }
    if (rc == LIBSSH2_ERROR_AUTHENTICATION_FAILED || rc == LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED) {
        throw AuthenticationError(QStringLiteral("Login to %1 refused for profile '%2'")
                                      .arg(describe(), profileName_));
    }
    if (rc == LIBSSH2_ERROR_FILE) {
        throw LocalIOError(QStringLiteral("Cannot read private key %1").arg(profile.keyPath));
    }
    raise(QStringLiteral("Authentication"));
}

void SftpSession::disconnectFromHost()
{
    if (session_) {
        qDebug() << "SFTP: Disconnecting from" << describe();
    }
    closeAll();
}

void SftpSession::closeAll()
{
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "Normal shutdown");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (socket_ != -1) {
        ::close(socket_);
        socket_ = -1;
    }
}

bool SftpSession::isConnected() const
{
    return sftp_ != nullptr;
}

void SftpSession::ensureConnected() const
{
    if (!isConnected()) {
        throw NetworkError(QStringLiteral("Not connected to %1").arg(describe()));
    }
}

void SftpSession::raise(const QString &what)
{
    char *messagePtr = nullptr;
    int messageLength = 0;
    const int code = session_ ? libssh2_session_last_error(session_, &messagePtr, &messageLength, 0)
                              : LIBSSH2_ERROR_SOCKET_NONE;
    QString reason = messagePtr ? QString::fromUtf8(messagePtr, messageLength) : QString();

    if (code == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        const unsigned long status = libssh2_sftp_last_error(sftp_);
        reason = QStringLiteral("SFTP status %1").arg(status);
        if (status == LIBSSH2_FX_CONNECTION_LOST || status == LIBSSH2_FX_NO_CONNECTION) {
            closeAll();
            throw NetworkError(QStringLiteral("%1 on %2: connection lost").arg(what, describe()));
        }
        if (status == LIBSSH2_FX_PERMISSION_DENIED) {
            throw ProtocolError(QStringLiteral("%1 on %2: permission denied").arg(what, describe()));
        }
        if (status == LIBSSH2_FX_NO_SUCH_FILE || status == LIBSSH2_FX_NO_SUCH_PATH) {
            throw ProtocolError(QStringLiteral("%1 on %2: no such file").arg(what, describe()));
        }
        throw ProtocolError(QStringLiteral("%1 on %2 failed: %3").arg(what, describe(), reason));
    }

    const QString message = QStringLiteral("%1 on %2 failed: %3").arg(what, describe(), reason);
    qWarning() << "SFTP:" << message;

    switch (code) {
    case LIBSSH2_ERROR_SOCKET_NONE:
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
    case LIBSSH2_ERROR_TIMEOUT:
    case LIBSSH2_ERROR_BANNER_RECV:
    case LIBSSH2_ERROR_BANNER_SEND:
        closeAll();
        throw NetworkError(message);
    case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
    case LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED:
    case LIBSSH2_ERROR_HOSTKEY_SIGN:
    case LIBSSH2_ERROR_HOSTKEY_INIT:
        throw AuthenticationError(message);
    default:
        throw ProtocolError(message);
    }
}

// Remote file system

QList<RemoteEntry> SftpSession::listDirectory(const QString &path)
{
    ensureConnected();
    const QByteArray dirPath = (path.isEmpty() ? QStringLiteral("/") : path).toUtf8();
    SftpHandlePtr dir(libssh2_sftp_open_ex(sftp_, dirPath.constData(),
                                           static_cast<unsigned int>(dirPath.size()),
                                           0, 0, LIBSSH2_SFTP_OPENDIR));
    if (!dir) {
        raise(QStringLiteral("Listing %1").arg(path));
    }

    QList<RemoteEntry> entries;
    char name[512];
    char longEntry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    for (;;) {
        std::memset(&attrs, 0, sizeof(attrs));
        const int rc = libssh2_sftp_readdir_ex(dir.get(), name, sizeof(name),
                                               longEntry, sizeof(longEntry), &attrs);
        if (rc == 0) {
            break;
        }
        if (rc < 0) {
            raise(QStringLiteral("Listing %1").arg(path));
        }

        RemoteEntry entry;
        entry.name = QString::fromUtf8(name, rc);
        if (entry.name == "." || entry.name == "..") {
            continue;
        }
        if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
            entry.isDirectory = LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
            entry.isSymlink = LIBSSH2_SFTP_S_ISLNK(attrs.permissions);
            entry.permissions = permissionString(attrs.permissions);
        }
        if ((attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) && !entry.isDirectory) {
            entry.size = static_cast<qint64>(attrs.filesize);
        }
        if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
            entry.modified = fromEpoch(attrs.mtime);
        }
        entries.append(entry);
    }

    LOG_VERBOSE() << "SFTP: Listed" << entries.size() << "entries in" << path;
    return entries;
}

void SftpSession::remove(const QString &path)
{
    ensureConnected();
    const QByteArray p = path.toUtf8();
    if (libssh2_sftp_unlink_ex(sftp_, p.constData(), static_cast<unsigned int>(p.size())) != 0) {
        raise(QStringLiteral("Deleting %1").arg(path));
    }
}

void SftpSession::makeDirectory(const QString &path)
{
    ensureConnected();
    const QByteArray p = path.toUtf8();
    if (libssh2_sftp_mkdir_ex(sftp_, p.constData(), static_cast<unsigned int>(p.size()),
                              DefaultDirectoryMode) != 0) {
        raise(QStringLiteral("Creating directory %1").arg(path));
    }
}

void SftpSession::removeDirectory(const QString &path)
{
    ensureConnected();
    const QByteArray p = path.toUtf8();
    if (libssh2_sftp_rmdir_ex(sftp_, p.constData(), static_cast<unsigned int>(p.size())) != 0) {
        raise(QStringLiteral("Removing directory %1").arg(path));
    }
}

void SftpSession::rename(const QString &from, const QString &to)
{
    ensureConnected();
    const QByteArray source = from.toUtf8();
    const QByteArray target = to.toUtf8();
    const long flags = LIBSSH2_SFTP_RENAME_OVERWRITE | LIBSSH2_SFTP_RENAME_ATOMIC
                     | LIBSSH2_SFTP_RENAME_NATIVE;
    if (libssh2_sftp_rename_ex(sftp_, source.constData(), static_cast<unsigned int>(source.size()),
                               target.constData(), static_cast<unsigned int>(target.size()),
                               flags) != 0) {
        raise(QStringLiteral("Renaming %1").arg(from));
    }
}

std::optional<qint64> SftpSession::remoteSize(const QString &path)
{
    ensureConnected();
    const QByteArray p = path.toUtf8();
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::memset(&attrs, 0, sizeof(attrs));
    if (libssh2_sftp_stat_ex(sftp_, p.constData(), static_cast<unsigned int>(p.size()),
                             LIBSSH2_SFTP_STAT, &attrs) != 0) {
        if (libssh2_session_last_errno(session_) == LIBSSH2_ERROR_SFTP_PROTOCOL) {
            return std::nullopt;
        }
        raise(QStringLiteral("Stat %1").arg(path));
    }
    if (!(attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)) {
        return std::nullopt;
    }
    return static_cast<qint64>(attrs.filesize);
}

// Transfers

void SftpSession::download(const QString &remotePath, const QString &localPath, qint64 resumeOffset,
                           const ProgressCallback &progress, const std::atomic_bool &cancel)
{
    ensureConnected();

    QFile file(localPath);
    if (!file.open(resumeOffset > 0 ? QIODevice::ReadWrite : QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw LocalIOError(QStringLiteral("Cannot open %1 for writing: %2").arg(localPath, file.errorString()));
    }
    if (resumeOffset > 0 && (!file.resize(resumeOffset) || !file.seek(resumeOffset))) {
        throw LocalIOError(QStringLiteral("Cannot resume %1 at %2").arg(localPath).arg(resumeOffset));
    }

    const qint64 total = remoteSize(remotePath).value_or(-1);
    const QByteArray p = remotePath.toUtf8();
    SftpHandlePtr handle(libssh2_sftp_open_ex(sftp_, p.constData(), static_cast<unsigned int>(p.size()),
                                              LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE));
    if (!handle) {
        raise(QStringLiteral("Opening %1").arg(remotePath));
    }
    if (resumeOffset > 0) {
        libssh2_sftp_seek64(handle.get(), static_cast<libssh2_uint64_t>(resumeOffset));
    }

    QByteArray buffer(static_cast<int>(options_.chunkSize), '\0');
    qint64 done = resumeOffset;
    for (;;) {
        if (cancel.load()) {
            handle.reset();
            throw TransferCancelledError();
        }
        const ssize_t n = libssh2_sftp_read(handle.get(), buffer.data(), static_cast<size_t>(buffer.size()));
        if (n == 0) {
            break;
        }
        if (n < 0) {
            raise(QStringLiteral("Reading %1").arg(remotePath));
        }
        if (file.write(buffer.constData(), n) != n) {
            throw LocalIOError(QStringLiteral("Cannot write %1: %2").arg(localPath, file.errorString()));
        }
        done += n;
        if (progress) {
            progress(done, total);
        }
    }

    if (!file.flush()) {
        throw LocalIOError(QStringLiteral("Cannot write %1: %2").arg(localPath, file.errorString()));
    }
    LOG_VERBOSE() << "SFTP: Downloaded" << remotePath << done << "bytes";
}

void SftpSession::upload(const QString &localPath, const QString &remotePath, qint64 resumeOffset,
                         const ProgressCallback &progress, const std::atomic_bool &cancel)
{
    ensureConnected();

    QFile file(localPath);
    if (!file.open(QIODevice::ReadOnly)) {
        throw LocalIOError(QStringLiteral("Cannot open %1: %2").arg(localPath, file.errorString()));
    }
    const qint64 total = file.size();
    if (resumeOffset > total || (resumeOffset > 0 && !file.seek(resumeOffset))) {
        throw LocalIOError(QStringLiteral("Cannot resume %1 at %2").arg(localPath).arg(resumeOffset));
    }

    const QByteArray p = remotePath.toUtf8();
    const unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT
                              | (resumeOffset > 0 ? 0 : LIBSSH2_FXF_TRUNC);
    SftpHandlePtr handle(libssh2_sftp_open_ex(sftp_, p.constData(), static_cast<unsigned int>(p.size()),
                                              flags, DefaultFileMode, LIBSSH2_SFTP_OPENFILE));
    if (!handle) {
        raise(QStringLiteral("Opening %1 for writing").arg(remotePath));
    }
    if (resumeOffset > 0) {
        libssh2_sftp_seek64(handle.get(), static_cast<libssh2_uint64_t>(resumeOffset));
    }

    qint64 done = resumeOffset;
    while (!file.atEnd()) {
        if (cancel.load()) {
            handle.reset();
            throw TransferCancelledError();
        }
        const QByteArray chunk = file.read(options_.chunkSize);
        if (chunk.isEmpty()) {
            throw LocalIOError(QStringLiteral("Cannot read %1: %2").arg(localPath, file.errorString()));
        }

        const char *data = chunk.constData();
        size_t remaining = static_cast<size_t>(chunk.size());
        while (remaining > 0) {
            const ssize_t written = libssh2_sftp_write(handle.get(), data, remaining);
            if (written < 0) {
                raise(QStringLiteral("Writing %1").arg(remotePath));
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
        done += chunk.size();
        if (progress) {
            progress(done, total);
        }
    }

    if (libssh2_sftp_close_handle(handle.release()) != 0) {
        raise(QStringLiteral("Closing %1").arg(remotePath));
    }
    LOG_VERBOSE() << "SFTP: Uploaded" << remotePath << done << "bytes";
}

// Helpers

QString SftpSession::hostKeyTypeName(int type)
{
    switch (type) {
    case LIBSSH2_HOSTKEY_TYPE_RSA: return QStringLiteral("ssh-rsa");
    case LIBSSH2_HOSTKEY_TYPE_DSS: return QStringLiteral("ssh-dss");
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return QStringLiteral("ecdsa-sha2-nistp256");
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return QStringLiteral("ecdsa-sha2-nistp384");
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return QStringLiteral("ecdsa-sha2-nistp521");
    case LIBSSH2_HOSTKEY_TYPE_ED25519: return QStringLiteral("ssh-ed25519");
    default: return QStringLiteral("unknown");
    }
}

QString SftpSession::permissionString(unsigned long mode)
{
    static const char flags[] = "rwxrwxrwx";
    QString out(9, QLatin1Char('-'));
    for (int i = 0; i < 9; ++i) {
        if (mode & (1UL << (8 - i))) {
            out[i] = QLatin1Char(flags[i]);
        }
    }
    return out;
}
