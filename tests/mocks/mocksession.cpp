#include "mocksession.h"

#include <QFile>
#include <QMutexLocker>
#include <QThread>

#include <algorithm>

namespace {

/// Keeps MockBackend's active-transfer count balanced on every exit path.
class TransferGuard
{
public:
    TransferGuard(MockBackend *backend, qint64 offset, void (MockBackend::*begin)(qint64),
                  void (MockBackend::*end)())
        : backend_(backend)
        , end_(end)
    {
        (backend_->*begin)(offset);
    }
    ~TransferGuard() { (backend_->*end_)(); }

    TransferGuard(const TransferGuard &) = delete;
    TransferGuard &operator=(const TransferGuard &) = delete;

private:
    MockBackend *backend_;
    void (MockBackend::*end_)();
};

} // namespace

// MockBackend

void MockBackend::setRemoteFile(const QString &path, const QByteArray &data)
{
    QMutexLocker locker(&mutex_);
    remoteFiles_.insert(path, data);
}

QByteArray MockBackend::remoteFile(const QString &path) const
{
    QMutexLocker locker(&mutex_);
    return remoteFiles_.value(path);
}

bool MockBackend::hasRemoteFile(const QString &path) const
{
    QMutexLocker locker(&mutex_);
    return remoteFiles_.contains(path);
}

void MockBackend::failNextTransfers(const QString &remotePath, int count, ErrorKind kind)
{
    QMutexLocker locker(&mutex_);
    for (int i = 0; i < count; ++i) {
        failures_[remotePath].append(kind);
    }
}

void MockBackend::failNextConnects(int count)
{
    QMutexLocker locker(&mutex_);
    connectFailures_ = count;
}

void MockBackend::setChunkSize(int bytes)
{
    QMutexLocker locker(&mutex_);
    chunkSize_ = std::max(1, bytes);
}

void MockBackend::setChunkDelayMs(int ms)
{
    QMutexLocker locker(&mutex_);
    chunkDelayMs_ = ms;
}

void MockBackend::setResumeSupported(bool supported)
{
    QMutexLocker locker(&mutex_);
    resumeSupported_ = supported;
}

void MockBackend::holdAfterFirstChunk(bool hold)
{
    QMutexLocker locker(&mutex_);
    hold_ = hold;
    if (!hold_) {
        heldCondition_.wakeAll();
    }
}

void MockBackend::release()
{
    holdAfterFirstChunk(false);
}

int MockBackend::sessionsCreated() const
{
    QMutexLocker locker(&mutex_);
    return sessionsCreated_;
}

int MockBackend::connectCount() const
{
    QMutexLocker locker(&mutex_);
    return connects_;
}

int MockBackend::transferCount() const
{
    QMutexLocker locker(&mutex_);
    return transfers_;
}

int MockBackend::activeTransfers() const
{
    QMutexLocker locker(&mutex_);
    return active_;
}

int MockBackend::maxActiveTransfers() const
{
    QMutexLocker locker(&mutex_);
    return maxActive_;
}

int MockBackend::heldTransfers() const
{
    QMutexLocker locker(&mutex_);
    return held_;
}

QList<qint64> MockBackend::resumeOffsets() const
{
    QMutexLocker locker(&mutex_);
    return resumeOffsets_;
}

void MockBackend::noteSessionCreated()
{
    QMutexLocker locker(&mutex_);
    ++sessionsCreated_;
}

void MockBackend::noteConnect()
{
    QMutexLocker locker(&mutex_);
    ++connects_;
}

bool MockBackend::takeConnectFailure()
{
    QMutexLocker locker(&mutex_);
    if (connectFailures_ > 0) {
        --connectFailures_;
        return true;
    }
    return false;
}

void MockBackend::beginTransfer(qint64 resumeOffset)
{
    QMutexLocker locker(&mutex_);
    ++transfers_;
    ++active_;
    maxActive_ = std::max(maxActive_, active_);
    resumeOffsets_.append(resumeOffset);
}

void MockBackend::endTransfer()
{
    QMutexLocker locker(&mutex_);
    --active_;
}

void MockBackend::truncateRemote(const QString &path, qint64 size)
{
    QMutexLocker locker(&mutex_);
    remoteFiles_[path].truncate(static_cast<int>(size));
}

void MockBackend::appendRemote(const QString &path, const QByteArray &chunk)
{
    QMutexLocker locker(&mutex_);
    remoteFiles_[path].append(chunk);
}

std::optional<ErrorKind> MockBackend::takeFailure(const QString &remotePath)
{
    QMutexLocker locker(&mutex_);
    auto it = failures_.find(remotePath);
    if (it == failures_.end() || it->isEmpty()) {
        return std::nullopt;
    }
    return it->takeFirst();
}

void MockBackend::waitWhileHeld(const std::atomic_bool &cancel)
{
    QMutexLocker locker(&mutex_);
    if (!hold_) {
        return;
    }
    ++held_;
    while (hold_ && !cancel.load()) {
        heldCondition_.wait(&mutex_, 10);
    }
    --held_;
}

int MockBackend::chunkSize() const
{
    QMutexLocker locker(&mutex_);
    return chunkSize_;
}

int MockBackend::chunkDelayMs() const
{
    QMutexLocker locker(&mutex_);
    return chunkDelayMs_;
}

bool MockBackend::resumeSupported() const
{
    QMutexLocker locker(&mutex_);
    return resumeSupported_;
}

// MockSession

MockSession::MockSession(std::shared_ptr<MockBackend> backend, Protocol protocol)
    : backend_(std::move(backend))
    , protocol_(protocol)
{
}

void MockSession::connectToHost(const ConnectionProfile &profile)
{
    backend_->noteConnect();
    if (backend_->takeConnectFailure()) {
        throw NetworkError(QString("Connection to %1 refused").arg(profile.displayAddress()));
    }
    connected_ = true;
}

void MockSession::disconnectFromHost()
{
    connected_ = false;
}

QList<RemoteEntry> MockSession::listDirectory(const QString &path)
{
    ensureConnected();
    const QString prefix = path.endsWith('/') ? path : path + '/';
    QList<RemoteEntry> entries;
    QMutexLocker locker(&backend_->mutex_);
    for (auto it = backend_->remoteFiles_.cbegin(); it != backend_->remoteFiles_.cend(); ++it) {
        if (it.key().startsWith(prefix) && !it.key().mid(prefix.size()).contains('/')) {
            RemoteEntry entry;
            entry.name = it.key().mid(prefix.size());
            entry.size = it.value().size();
            entries.append(entry);
        }
    }
    return entries;
}

void MockSession::remove(const QString &path)
{
    ensureConnected();
    QMutexLocker locker(&backend_->mutex_);
    if (backend_->remoteFiles_.remove(path) == 0) {
        throw ProtocolError(QString("550 %1: No such file").arg(path));
    }
}

void MockSession::makeDirectory(const QString &path)
{
    Q_UNUSED(path)
    ensureConnected();
}

void MockSession::removeDirectory(const QString &path)
{
    Q_UNUSED(path)
    ensureConnected();
}

void MockSession::rename(const QString &from, const QString &to)
{
    ensureConnected();
    QMutexLocker locker(&backend_->mutex_);
    if (!backend_->remoteFiles_.contains(from)) {
        throw ProtocolError(QString("550 %1: No such file").arg(from));
    }
    backend_->remoteFiles_.insert(to, backend_->remoteFiles_.take(from));
}

std::optional<qint64> MockSession::remoteSize(const QString &path)
{
    ensureConnected();
    QMutexLocker locker(&backend_->mutex_);
    auto it = backend_->remoteFiles_.constFind(path);
    if (it == backend_->remoteFiles_.cend()) {
        return std::nullopt;
    }
    return it.value().size();
}

void MockSession::upload(const QString &localPath, const QString &remotePath, qint64 resumeOffset,
                         const ProgressCallback &progress, const std::atomic_bool &cancel)
{
    ensureConnected();

    QFile file(localPath);
    if (!file.open(QIODevice::ReadOnly)) {
        throw LocalIOError(QString("Cannot open %1: %2").arg(localPath, file.errorString()));
    }
    const QByteArray data = file.readAll();
    const qint64 total = data.size();
    qint64 offset = std::min(resumeOffset, total);

    TransferGuard guard(backend_.get(), offset, &MockBackend::beginTransfer, &MockBackend::endTransfer);
    const std::optional<ErrorKind> failure = backend_->takeFailure(remotePath);
    const int chunkSize = backend_->chunkSize();
    const int delay = backend_->chunkDelayMs();

    if (offset == 0) {
        backend_->setRemoteFile(remotePath, QByteArray());
    } else {
        backend_->truncateRemote(remotePath, offset);
    }

    bool first = true;
    while (offset < total) {
        if (cancel.load()) {
            throw TransferCancelledError();
        }
        if (delay > 0) {
            QThread::msleep(static_cast<unsigned long>(delay));
        }
        const QByteArray chunk = data.mid(static_cast<int>(offset), chunkSize);
        backend_->appendRemote(remotePath, chunk);
        offset += chunk.size();
        progress(offset, total);

        if (first) {
            first = false;
            if (failure) {
                fail(*failure, QString("Injected failure uploading %1").arg(remotePath));
            }
            backend_->waitWhileHeld(cancel);
        }
    }
}

void MockSession::download(const QString &remotePath, const QString &localPath, qint64 resumeOffset,
                           const ProgressCallback &progress, const std::atomic_bool &cancel)
{
    ensureConnected();

    if (!backend_->hasRemoteFile(remotePath)) {
        throw ProtocolError(QString("550 %1: No such file").arg(remotePath));
    }
    const QByteArray data = backend_->remoteFile(remotePath);
    const qint64 total = data.size();
    qint64 offset = std::min(resumeOffset, total);

    QFile file(localPath);
    const bool resuming = offset > 0 && file.exists();
    if (!file.open(resuming ? QIODevice::ReadWrite : (QIODevice::WriteOnly | QIODevice::Truncate))) {
        throw LocalIOError(QString("Cannot write %1: %2").arg(localPath, file.errorString()));
    }
    if (resuming) {
        file.resize(offset);
        file.seek(offset);
    } else {
        offset = 0;
    }

    TransferGuard guard(backend_.get(), offset, &MockBackend::beginTransfer, &MockBackend::endTransfer);
    const std::optional<ErrorKind> failure = backend_->takeFailure(remotePath);
    const int chunkSize = backend_->chunkSize();
    const int delay = backend_->chunkDelayMs();

    bool first = true;
    while (offset < total) {
        if (cancel.load()) {
            throw TransferCancelledError();
        }
        if (delay > 0) {
            QThread::msleep(static_cast<unsigned long>(delay));
        }
        const QByteArray chunk = data.mid(static_cast<int>(offset), chunkSize);
        if (file.write(chunk) != chunk.size()) {
            throw LocalIOError(QString("Write to %1 failed").arg(localPath));
        }
        file.flush();
        offset += chunk.size();
        progress(offset, total);

        if (first) {
            first = false;
            if (failure) {
                fail(*failure, QString("Injected failure downloading %1").arg(remotePath));
            }
            backend_->waitWhileHeld(cancel);
        }
    }
}

bool MockSession::supportsResume() const
{
    return backend_->resumeSupported();
}

void MockSession::ensureConnected() const
{
    if (!connected_) {
        throw NetworkError("Not connected");
    }
}

void MockSession::fail(ErrorKind kind, const QString &message)
{
    switch (kind) {
    case ErrorKind::Network:
        connected_ = false;
        throw NetworkError(message);
    case ErrorKind::Authentication:
        throw AuthenticationError(message);
    case ErrorKind::Protocol:
        throw ProtocolError(message);
    case ErrorKind::LocalIO:
        throw LocalIOError(message);
    default:
        throw InternalError(message);
    }
}

// MockSessionFactory

MockSessionFactory::MockSessionFactory()
    : backend_(std::make_shared<MockBackend>())
{
}

std::unique_ptr<IProtocolSession> MockSessionFactory::createSession(const ConnectionProfile &profile)
{
    backend_->noteSessionCreated();
    return std::make_unique<MockSession>(backend_, profile.protocol);
}
