/**
 * @file knownhostsstore.h
 * @brief Trust-on-first-use store of SSH host keys.
 */

#ifndef KNOWNHOSTSSTORE_H
#define KNOWNHOSTSSTORE_H

#include <QByteArray>
#include <QMap>
#include <QMutex>
#include <QString>

/**
 * @brief Persistent host key store.
 *
 * File format is one line per host:
 * @code
 * host:port keytype base64key
 * @endcode
 * The first key seen for a host is stored; later connections must present
 * the same key. The store is safe to use from several session threads.
 */
class KnownHostsStore
{
public:
    enum class Verdict {
        Match,     ///< Key equals the stored key
        Unknown,   ///< No key stored for this host
        Mismatch   ///< A different key is stored
    };

    /**
     * @brief Opens the store at @p path; a missing file is an empty store.
     */
    explicit KnownHostsStore(const QString &path);

    [[nodiscard]] QString path() const { return path_; }

    [[nodiscard]] Verdict check(const QString &host, quint16 port,
                                const QString &keyType, const QByteArray &key) const;

    /**
     * @brief Stores (or replaces) the key for a host and rewrites the file.
     * @throws LocalIOError if the file cannot be written.
     */
    void trust(const QString &host, quint16 port, const QString &keyType, const QByteArray &key);

    /**
     * @brief Accepts a matching key, records an unknown one, refuses a changed one.
     * @throws AuthenticationError on Mismatch.
     */
    void verifyOrTrust(const QString &host, quint16 port,
                       const QString &keyType, const QByteArray &key);

    /// Removes a host; returns false if it was not stored.
    bool forget(const QString &host, quint16 port);

    [[nodiscard]] int count() const;

    /// "SHA256:<base64>" fingerprint, as printed by OpenSSH.
    [[nodiscard]] static QString fingerprint(const QByteArray &key);

private:
    struct Entry {
        QString keyType;
        QByteArray key;
    };

    [[nodiscard]] static QString hostKey(const QString &host, quint16 port);
    [[nodiscard]] Verdict checkLocked(const QString &hostPort, const QString &keyType,
                                      const QByteArray &key) const;
    void trustLocked(const QString &hostPort, const QString &keyType, const QByteArray &key);
    void load();
    void save() const;

    QString path_;
    QMap<QString, Entry> entries_;
    mutable QMutex mutex_;
};

#endif // KNOWNHOSTSSTORE_H
