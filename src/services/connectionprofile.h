/**
 * @file connectionprofile.h
 * @brief Saved connection settings for one remote server.
 */

#ifndef CONNECTIONPROFILE_H
#define CONNECTIONPROFILE_H

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <optional>

enum class Protocol { Ftp, Ftps, Sftp };

enum class CredentialKind { Password, PrivateKey };

/// @brief Convert Protocol to its persisted/CLI name
[[nodiscard]] inline const char *protocolToString(Protocol protocol)
{
    switch (protocol) {
        case Protocol::Ftp: return "ftp";
        case Protocol::Ftps: return "ftps";
        case Protocol::Sftp: return "sftp";
    }
    return "unknown";
}

/// @brief Parse a protocol name, case-insensitive
[[nodiscard]] std::optional<Protocol> protocolFromString(const QString &name);

/**
 * @brief A saved connection profile.
 *
 * The secret is the password for CredentialKind::Password or the key
 * passphrase for CredentialKind::PrivateKey. Profiles only ever reach disk
 * inside the encrypted vault payload.
 */
struct ConnectionProfile {
    QString id;                 ///< Stable UUID, assigned on creation
    QString name;               ///< Display name
    Protocol protocol = Protocol::Sftp;
    QString host;
    quint16 port = 0;           ///< 0 selects the protocol default
    QString username;
    CredentialKind credentialKind = CredentialKind::Password;
    QString secret;             ///< Password or key passphrase
    QString keyPath;            ///< Private key file (PrivateKey only)
    QString remotePath;         ///< Optional start directory
    bool ftpsImplicit = false;  ///< FTPS: TLS from connect instead of AUTH TLS
    bool passiveMode = true;    ///< FTP: only passive mode is supported
    QDateTime created;
    QDateTime lastUsed;

    /// Creates a profile with a fresh id and creation timestamp.
    [[nodiscard]] static ConnectionProfile create(const QString &name, Protocol protocol,
                                                  const QString &host, const QString &username);

    /// Port to connect to, resolving 0 to the protocol default.
    [[nodiscard]] quint16 effectivePort() const;

    /// "user@host:port" without any secret.
    [[nodiscard]] QString displayAddress() const;

    [[nodiscard]] QJsonObject toJson() const;

    /**
     * @brief Parses a profile object.
     * @return std::nullopt if required fields are missing or malformed.
     */
    [[nodiscard]] static std::optional<ConnectionProfile> fromJson(const QJsonObject &json);

    /// Overwrites the secret in memory.
    void wipeSecret();

    [[nodiscard]] bool operator==(const ConnectionProfile &other) const;
    [[nodiscard]] bool operator!=(const ConnectionProfile &other) const { return !(*this == other); }
};

#endif // CONNECTIONPROFILE_H
