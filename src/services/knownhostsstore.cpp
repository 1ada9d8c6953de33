#include "knownhostsstore.h"
#include "errors.h"
#include "utils/logging.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSaveFile>
#include <QTextStream>

KnownHostsStore::KnownHostsStore(const QString &path)
    : path_(path)
{
    load();
}

QString KnownHostsStore::hostKey(const QString &host, quint16 port)
{
    return QStringLiteral("%1:%2").arg(host.toLower()).arg(port);
}

void KnownHostsStore::load()
{
    QFile file(path_);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "KnownHosts: Cannot read" << path_ << file.errorString();
        return;
    }

    int lineNumber = 0;
    QTextStream in(&file);
    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        ++lineNumber;
        if (line.isEmpty() || line.startsWith('#')) {
            continue;
        }
        const QStringList parts = line.split(' ', Qt::SkipEmptyParts);
        if (parts.size() != 3) {
            qWarning() << "KnownHosts: Skipping malformed line" << lineNumber << "in" << path_;
            continue;
        }
        const QByteArray key = QByteArray::fromBase64(parts.at(2).toLatin1());
        if (key.isEmpty()) {
            qWarning() << "KnownHosts: Skipping line" << lineNumber << "with invalid key";
            continue;
        }
        entries_.insert(parts.at(0).toLower(), Entry{parts.at(1), key});
    }
    LOG_VERBOSE() << "KnownHosts: Loaded" << entries_.size() << "hosts from" << path_;
}

void KnownHostsStore::save() const
{
    const QFileInfo info(path_);
    if (!QDir().mkpath(info.absolutePath())) {
        throw LocalIOError(QStringLiteral("Cannot create directory for %1").arg(path_));
    }

    QSaveFile file(path_);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        throw LocalIOError(QStringLiteral("Cannot write %1: %2").arg(path_, file.errorString()));
    }
    QTextStream out(&file);
    for (auto it = entries_.cbegin(); it != entries_.cend(); ++it) {
        out << it.key() << ' ' << it->keyType << ' ' << QString::fromLatin1(it->key.toBase64()) << '\n';
    }
    out.flush();
    if (!file.commit()) {
        throw LocalIOError(QStringLiteral("Cannot write %1: %2").arg(path_, file.errorString()));
    }
}

KnownHostsStore::Verdict KnownHostsStore::check(const QString &host, quint16 port,
                                                const QString &keyType, const QByteArray &key) const
{
    QMutexLocker locker(&mutex_);
    return checkLocked(hostKey(host, port), keyType, key);
}

KnownHostsStore::Verdict KnownHostsStore::checkLocked(const QString &hostPort, const QString &keyType,
                                                      const QByteArray &key) const
{
    auto it = entries_.constFind(hostPort);
    if (it == entries_.cend()) {
        return Verdict::Unknown;
    }
    return (it->keyType == keyType && it->key == key) ? Verdict::Match : Verdict::Mismatch;
}

void KnownHostsStore::trust(const QString &host, quint16 port, const QString &keyType, const QByteArray &key)
{
    QMutexLocker locker(&mutex_);
    trustLocked(hostKey(host, port), keyType, key);
}

void KnownHostsStore::trustLocked(const QString &hostPort, const QString &keyType, const QByteArray &key)
{
    entries_.insert(hostPort, Entry{keyType, key});
    save();
}

void KnownHostsStore::verifyOrTrust(const QString &host, quint16 port,
                                    const QString &keyType, const QByteArray &key)
{
    const QString hostPort = hostKey(host, port);

    // Held across check and insert so two first connections cannot both be trusted
    QMutexLocker locker(&mutex_);
    switch (checkLocked(hostPort, keyType, key)) {
    case Verdict::Match:
        return;
    case Verdict::Unknown:
        qInfo() << "KnownHosts: Trusting new host" << hostPort << keyType << fingerprint(key);
        trustLocked(hostPort, keyType, key);
        return;
    case Verdict::Mismatch:
        qWarning() << "KnownHosts: Host key for" << hostPort << "has changed;"
                   << "presented" << keyType << fingerprint(key);
        throw AuthenticationError(QStringLiteral("Host key for %1 does not match the stored key")
                                      .arg(hostPort));
    }
}

bool KnownHostsStore::forget(const QString &host, quint16 port)
{
    QMutexLocker locker(&mutex_);
    if (entries_.remove(hostKey(host, port)) == 0) {
        return false;
    }
    save();
    return true;
}

int KnownHostsStore::count() const
{
    QMutexLocker locker(&mutex_);
    return static_cast<int>(entries_.size());
}

QString KnownHostsStore::fingerprint(const QByteArray &key)
{
    QByteArray digest = QCryptographicHash::hash(key, QCryptographicHash::Sha256);
    QByteArray encoded = digest.toBase64(QByteArray::OmitTrailingEquals);
    return QStringLiteral("SHA256:") + QString::fromLatin1(encoded);
}
