/**
 * @file errors.h
 * @brief Exception hierarchy shared by the vault, crypto and transfer layers.
 *
 * Every failure the core raises derives from FftpError and carries an
 * ErrorKind so callers can classify it without catching each subclass.
 * Messages never contain credential material.
 */

#ifndef ERRORS_H
#define ERRORS_H

#include <QString>

#include <stdexcept>

/**
 * @brief Classification of every error raised by the core.
 */
enum class ErrorKind {
    WrongPassword,       ///< Vault could not be decrypted with the given password
    CorruptVault,        ///< Vault container or payload is malformed
    UnsupportedVersion,  ///< Vault was written by a newer format version
    ProfileNotFound,     ///< No profile with the requested id
    WeakParameter,       ///< Password or KDF cost below the configured floor
    Authentication,      ///< Crypto tag mismatch or remote login refused
    Network,             ///< Host unreachable, timeout, dropped connection
    Protocol,            ///< Malformed or unexpected server response
    LocalIO,             ///< Local file could not be read or written
    Cancelled,           ///< Operation interrupted by a cancel request
    Internal             ///< Unexpected library failure
};

/// @brief Convert ErrorKind to string for logging
[[nodiscard]] inline const char *errorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::WrongPassword: return "WrongPassword";
    case ErrorKind::CorruptVault: return "CorruptVault";
    case ErrorKind::UnsupportedVersion: return "UnsupportedVersion";
    case ErrorKind::ProfileNotFound: return "ProfileNotFound";
    case ErrorKind::WeakParameter: return "WeakParameter";
    case ErrorKind::Authentication: return "Authentication";
    case ErrorKind::Network: return "Network";
    case ErrorKind::Protocol: return "Protocol";
    case ErrorKind::LocalIO: return "LocalIO";
    case ErrorKind::Cancelled: return "Cancelled";
    case ErrorKind::Internal: return "Internal";
    }
    return "Unknown";
}

/**
 * @brief Returns true if a failure of this kind is eligible for automatic retry.
 *
 * Only network failures are transient. Authentication, protocol and local
 * I/O failures would fail the same way again.
 */
[[nodiscard]] inline bool isTransient(ErrorKind kind)
{
    return kind == ErrorKind::Network;
}

/**
 * @brief Base class of all core exceptions.
 */
class FftpError : public std::runtime_error
{
public:
    FftpError(ErrorKind kind, const QString &message)
        : std::runtime_error(message.toStdString())
        , kind_(kind)
    {
    }

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] QString message() const { return QString::fromStdString(what()); }

private:
    ErrorKind kind_;
};

/// @name Vault layer
/// @{

class WrongPasswordError : public FftpError
{
public:
    explicit WrongPasswordError(const QString &message = QStringLiteral("Wrong master password"))
        : FftpError(ErrorKind::WrongPassword, message) {}
};

class CorruptVaultError : public FftpError
{
public:
    explicit CorruptVaultError(const QString &message)
        : FftpError(ErrorKind::CorruptVault, message) {}
};

class UnsupportedVersionError : public FftpError
{
public:
    explicit UnsupportedVersionError(int version)
        : FftpError(ErrorKind::UnsupportedVersion,
                    QStringLiteral("Unsupported vault format version %1").arg(version))
        , version_(version) {}

    [[nodiscard]] int version() const noexcept { return version_; }

private:
    int version_;
};

class ProfileNotFoundError : public FftpError
{
public:
    explicit ProfileNotFoundError(const QString &profileId)
        : FftpError(ErrorKind::ProfileNotFound,
                    QStringLiteral("No profile with id %1").arg(profileId)) {}
};
/// @}

/// @name Crypto layer
/// @{

class WeakParameterError : public FftpError
{
public:
    explicit WeakParameterError(const QString &message)
        : FftpError(ErrorKind::WeakParameter, message) {}
};

class InternalError : public FftpError
{
public:
    explicit InternalError(const QString &message)
        : FftpError(ErrorKind::Internal, message) {}
};
/// @}

/// @name Transfer layer
/// @{

class AuthenticationError : public FftpError
{
public:
    explicit AuthenticationError(const QString &message)
        : FftpError(ErrorKind::Authentication, message) {}
};

class NetworkError : public FftpError
{
public:
    explicit NetworkError(const QString &message)
        : FftpError(ErrorKind::Network, message) {}
};

class ProtocolError : public FftpError
{
public:
    explicit ProtocolError(const QString &message)
        : FftpError(ErrorKind::Protocol, message) {}
};

class LocalIOError : public FftpError
{
public:
    explicit LocalIOError(const QString &message)
        : FftpError(ErrorKind::LocalIO, message) {}
};

class TransferCancelledError : public FftpError
{
public:
    TransferCancelledError()
        : FftpError(ErrorKind::Cancelled, QStringLiteral("Transfer cancelled")) {}
};
/// @}

#endif // ERRORS_H
