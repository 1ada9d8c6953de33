/**
 * @file sessionfactory.h
 * @brief Creates protocol sessions for a profile.
 */

#ifndef SESSIONFACTORY_H
#define SESSIONFACTORY_H

#include "iprotocolsession.h"

#include <memory>

/**
 * @brief Interface for session creation, so tests can inject mock sessions.
 */
class ISessionFactory
{
public:
    virtual ~ISessionFactory() = default;

    /// Returns an unconnected session for the profile's protocol.
    [[nodiscard]] virtual std::unique_ptr<IProtocolSession> createSession(const ConnectionProfile &profile) = 0;
};

/**
 * @brief Production factory: FtpSession for FTP/FTPS, SftpSession for SFTP.
 */
class SessionFactory : public ISessionFactory
{
public:
    explicit SessionFactory(const SessionOptions &options = SessionOptions());

    [[nodiscard]] std::unique_ptr<IProtocolSession> createSession(const ConnectionProfile &profile) override;

    [[nodiscard]] const SessionOptions &options() const { return options_; }

private:
    SessionOptions options_;
};

#endif // SESSIONFACTORY_H
