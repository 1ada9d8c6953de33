#include "sessionfactory.h"
#include "ftpsession.h"
#include "sftpsession.h"

SessionFactory::SessionFactory(const SessionOptions &options)
    : options_(options)
{
}

std::unique_ptr<IProtocolSession> SessionFactory::createSession(const ConnectionProfile &profile)
{
    switch (profile.protocol) {
    case Protocol::Ftp:
        return std::make_unique<FtpSession>(false, options_);
    case Protocol::Ftps:
        return std::make_unique<FtpSession>(true, options_);
    case Protocol::Sftp:
        return std::make_unique<SftpSession>(options_);
    }
    return nullptr;
}
