#include "connectionprofile.h"

#include <QUuid>

namespace {

constexpr quint16 FtpDefaultPort = 21;
constexpr quint16 FtpsImplicitDefaultPort = 990;
constexpr quint16 SftpDefaultPort = 22;

QString credentialKindToString(CredentialKind kind)
{
    return kind == CredentialKind::PrivateKey ? QStringLiteral("key") : QStringLiteral("password");
}

QString dateToJson(const QDateTime &dt)
{
    return dt.isValid() ? dt.toUTC().toString(Qt::ISODateWithMs) : QString();
}

QDateTime dateFromJson(const QJsonValue &value)
{
    const QString text = value.toString();
    if (text.isEmpty()) {
        return {};
    }
    return QDateTime::fromString(text, Qt::ISODateWithMs);
}

} // namespace

std::optional<Protocol> protocolFromString(const QString &name)
{
    const QString lower = name.trimmed().toLower();
    if (lower == QLatin1String("ftp")) return Protocol::Ftp;
    if (lower == QLatin1String("ftps")) return Protocol::Ftps;
    if (lower == QLatin1String("sftp")) return Protocol::Sftp;
    return std::nullopt;
}

ConnectionProfile ConnectionProfile::create(const QString &name, Protocol protocol,
                                            const QString &host, const QString &username)
{
    ConnectionProfile profile;
    profile.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    profile.name = name;
    profile.protocol = protocol;
    profile.host = host;
    profile.username = username;
    profile.created = QDateTime::currentDateTimeUtc();
    return profile;
}

quint16 ConnectionProfile::effectivePort() const
{
    if (port != 0) {
        return port;
    }
    switch (protocol) {
    case Protocol::Ftp:
        return FtpDefaultPort;
    case Protocol::Ftps:
        return ftpsImplicit ? FtpsImplicitDefaultPort : FtpDefaultPort;
    case Protocol::Sftp:
        return SftpDefaultPort;
    }
    return FtpDefaultPort;
}

QString ConnectionProfile::displayAddress() const
{
    return QStringLiteral("%1@%2:%3").arg(username, host).arg(effectivePort());
}

QJsonObject ConnectionProfile::toJson() const
{
    QJsonObject json;
    json["id"] = id;
    json["name"] = name;
    json["protocol"] = QString::fromLatin1(protocolToString(protocol));
    json["host"] = host;
    json["port"] = port;
    json["username"] = username;
    json["credential"] = credentialKindToString(credentialKind);
    json["secret"] = secret;
    if (!keyPath.isEmpty()) {
        json["keyPath"] = keyPath;
    }
    if (!remotePath.isEmpty()) {
        json["remotePath"] = remotePath;
    }
    json["ftpsImplicit"] = ftpsImplicit;
    json["passive"] = passiveMode;
    json["created"] = dateToJson(created);
    json["lastUsed"] = dateToJson(lastUsed);
    return json;
}

std::optional<ConnectionProfile> ConnectionProfile::fromJson(const QJsonObject &json)
{
    if (!json["id"].isString() || !json["host"].isString() || !json["protocol"].isString()) {
        return std::nullopt;
    }
    std::optional<Protocol> protocol = protocolFromString(json["protocol"].toString());
    if (!protocol) {
        return std::nullopt;
    }
    const int port = json["port"].toInt(0);
    if (port < 0 || port > 65535) {
        return std::nullopt;
    }

    ConnectionProfile profile;
    profile.id = json["id"].toString();
    profile.name = json["name"].toString();
    profile.protocol = *protocol;
    profile.host = json["host"].toString();
    profile.port = static_cast<quint16>(port);
    profile.username = json["username"].toString();
    profile.credentialKind = json["credential"].toString() == QLatin1String("key")
        ? CredentialKind::PrivateKey : CredentialKind::Password;
    profile.secret = json["secret"].toString();
    profile.keyPath = json["keyPath"].toString();
    profile.remotePath = json["remotePath"].toString();
    profile.ftpsImplicit = json["ftpsImplicit"].toBool(false);
    profile.passiveMode = json["passive"].toBool(true);
    profile.created = dateFromJson(json["created"]);
    profile.lastUsed = dateFromJson(json["lastUsed"]);

    if (profile.id.isEmpty() || profile.host.isEmpty()) {
        return std::nullopt;
    }
    return profile;
}

void ConnectionProfile::wipeSecret()
{
    secret.fill(QChar(0));
    secret.clear();
}

bool ConnectionProfile::operator==(const ConnectionProfile &other) const
{
    return id == other.id && name == other.name && protocol == other.protocol
        && host == other.host && port == other.port && username == other.username
        && credentialKind == other.credentialKind && secret == other.secret
        && keyPath == other.keyPath && remotePath == other.remotePath
        && ftpsImplicit == other.ftpsImplicit && passiveMode == other.passiveMode
        && created == other.created && lastUsed == other.lastUsed;
}
