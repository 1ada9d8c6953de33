#include "ftpsession.h"
#include "errors.h"
#include "utils/logging.h"

#include <QDebug>
#include <QFile>
#include <QHostAddress>
#include <QLocale>
#include <QRegularExpression>
#include <QThread>

FtpSession::FtpSession(bool secure, const SessionOptions &options)
    : secure_(secure)
    , options_(options)
{
}

FtpSession::~FtpSession()
{
    closeSockets();
}

QString FtpSession::describe() const
{
    return QStringLiteral("%1:%2").arg(host_).arg(port_);
}

// Connection

void FtpSession::connectToHost(const ConnectionProfile &profile)
{
    if (isConnected()) {
        disconnectFromHost();
    }
    if (!profile.passiveMode) {
        throw ProtocolError(QStringLiteral("Active mode FTP is not supported"));
    }

    host_ = profile.host;
    port_ = profile.effectivePort();
    profileName_ = profile.name;
    protectedData_ = false;

    qDebug() << "FTP: Connecting to" << host_ << ":" << port_
             << (secure_ ? (profile.ftpsImplicit ? "(implicit TLS)" : "(explicit TLS)") : "");

    controlSocket_ = std::make_unique<QSslSocket>();
    if (secure_ && profile.ftpsImplicit) {
        controlSocket_->connectToHostEncrypted(host_, port_);
        if (!controlSocket_->waitForEncrypted(options_.connectTimeoutMs)) {
            const bool tlsRefused = !controlSocket_->sslHandshakeErrors().isEmpty();
            const QString reason = controlSocket_->errorString();
            closeSockets();
            if (tlsRefused) {
                throw AuthenticationError(QStringLiteral("TLS certificate of %1 rejected: %2")
                                              .arg(describe(), reason));
            }
            throw NetworkError(QStringLiteral("Cannot connect to %1: %2").arg(describe(), reason));
        }
    } else {
        controlSocket_->connectToHost(host_, port_);
        if (!controlSocket_->waitForConnected(options_.connectTimeoutMs)) {
            const QString reason = controlSocket_->errorString();
            closeSockets();
            throw NetworkError(QStringLiteral("Cannot connect to %1: %2").arg(describe(), reason));
        }
    }

    try {
        Reply greeting = readReply(options_.connectTimeoutMs);
        expectReply(greeting, {FtpReplyServiceReady}, QStringLiteral("greeting"));

        if (secure_ && !profile.ftpsImplicit) {
            expectReply(command("AUTH TLS"), {FtpReplySecurityExchangeOk}, QStringLiteral("AUTH TLS"));
            controlSocket_->startClientEncryption();
            startTls(controlSocket_.get(), QStringLiteral("control connection"));
        }

        login(profile);

        if (secure_) {
            expectReply(command("PBSZ 0"), {FtpReplyCommandOk}, QStringLiteral("PBSZ"));
            expectReply(command("PROT P"), {FtpReplyCommandOk}, QStringLiteral("PROT"));
            protectedData_ = true;
        }

        expectReply(command("TYPE I"), {FtpReplyCommandOk}, QStringLiteral("TYPE I"));
    } catch (const FftpError &) {
        closeSockets();
        throw;
    }
    qDebug() << "FTP: Logged in to" << describe() << "as profile" << profileName_;
}

void FtpSession::login(const ConnectionProfile &profile)
{
    const QString user = profile.username.isEmpty() ? QStringLiteral("anonymous") : profile.username;
    Reply reply = command("USER " + user);
    if (reply.code == FtpReplyPasswordRequired) {
        reply = command("PASS " + profile.secret);
    }
    if (reply.code != FtpReplyUserLoggedIn) {
        if (reply.code == FtpReplyServiceClosing) {
            failWith(reply, QStringLiteral("login"));
        }
        closeSockets();
        throw AuthenticationError(QStringLiteral("Login to %1 refused for profile '%2' (%3)")
                                      .arg(describe(), profileName_).arg(reply.code));
    }
    loggedIn_ = true;
}

void FtpSession::startTls(QSslSocket *socket, const QString &what)
{
    if (socket->waitForEncrypted(options_.connectTimeoutMs)) {
        return;
    }
    const bool tlsRefused = !socket->sslHandshakeErrors().isEmpty();
    const QString reason = socket->errorString();
    closeSockets();
    if (tlsRefused) {
        throw AuthenticationError(QStringLiteral("TLS handshake on %1 with %2 rejected: %3")
                                      .arg(what, describe(), reason));
    }
    throw NetworkError(QStringLiteral("TLS handshake on %1 with %2 failed: %3")
                           .arg(what, describe(), reason));
}

void FtpSession::disconnectFromHost()
{
    if (controlSocket_ && controlSocket_->state() == QAbstractSocket::ConnectedState) {
        LOG_VERBOSE() << "FTP: >>" << "QUIT";
        controlSocket_->write("QUIT\r\n");
        controlSocket_->waitForBytesWritten(AbortReplyTimeoutMs);
        controlSocket_->disconnectFromHost();
        if (controlSocket_->state() != QAbstractSocket::UnconnectedState) {
            controlSocket_->waitForDisconnected(AbortReplyTimeoutMs);
        }
        qDebug() << "FTP: Disconnected from" << describe();
    }
    closeSockets();
}

bool FtpSession::isConnected() const
{
    return loggedIn_ && controlSocket_
        && controlSocket_->state() == QAbstractSocket::ConnectedState;
}

void FtpSession::closeSockets()
{
    loggedIn_ = false;
    if (dataSocket_) {
        dataSocket_->abort();
        dataSocket_.reset();
    }
    if (controlSocket_) {
        controlSocket_->abort();
        controlSocket_.reset();
    }
}

void FtpSession::attachToCurrentThread()
{
    // Sockets are parked without thread affinity, so they can be pulled here
    if (controlSocket_ && controlSocket_->thread() != QThread::currentThread()) {
        controlSocket_->moveToThread(QThread::currentThread());
    }
}

void FtpSession::detachFromThread()
{
    if (dataSocket_) {
        dataSocket_->abort();
        dataSocket_.reset();
    }
    if (controlSocket_) {
        controlSocket_->moveToThread(nullptr);
    }
}

// Control channel

void FtpSession::sendCommand(const QString &command)
{
    if (!controlSocket_ || controlSocket_->state() != QAbstractSocket::ConnectedState) {
        closeSockets();
        throw NetworkError(QStringLiteral("Control connection to %1 is closed").arg(describe()));
    }
    LOG_VERBOSE() << "FTP: >>" << commandForLog(command);
    controlSocket_->write((command + "\r\n").toUtf8());
    if (!controlSocket_->waitForBytesWritten(options_.connectTimeoutMs)) {
        const QString reason = controlSocket_->errorString();
        closeSockets();
        throw NetworkError(QStringLiteral("Lost connection to %1: %2").arg(describe(), reason));
    }
}

FtpSession::Reply FtpSession::readReply(int timeoutMs)
{
    if (!controlSocket_) {
        throw NetworkError(QStringLiteral("Not connected to %1").arg(describe()));
    }

    int firstCode = 0;
    for (;;) {
        while (!controlSocket_->canReadLine()) {
            if (!controlSocket_->waitForReadyRead(timeoutMs)) {
                const bool timedOut = controlSocket_->error() == QAbstractSocket::SocketTimeoutError;
                const QString reason = controlSocket_->errorString();
                closeSockets();
                throw NetworkError(timedOut
                    ? QStringLiteral("Timed out waiting for %1").arg(describe())
                    : QStringLiteral("Lost connection to %1: %2").arg(describe(), reason));
            }
        }

        // Leading whitespace is significant: " 220 x" continues a reply, it does not end it
        const QString line = decodeControlLine(controlSocket_->readLine());
        LOG_VERBOSE() << "FTP: <<" << line;

        int code = 0;
        QString text;
        bool isFinal = false;
        if (!parseReplyLine(line, code, text, isFinal)) {
            if (firstCode != 0) {
                continue;  // free-form continuation line of a multi-line reply
            }
            closeSockets();
            throw ProtocolError(QStringLiteral("Malformed reply from %1").arg(describe()));
        }
        if (firstCode == 0) {
            firstCode = code;
        }
        if (isFinal && code == firstCode) {
            return Reply{code, text};
        }
    }
}

FtpSession::Reply FtpSession::command(const QString &command)
{
    sendCommand(command);
    return readReply(options_.connectTimeoutMs);
}

void FtpSession::expectReply(const Reply &reply, std::initializer_list<int> accepted, const QString &what)
{
    for (int code : accepted) {
        if (reply.code == code) {
            return;
        }
    }
    failWith(reply, what);
}

void FtpSession::failWith(const Reply &reply, const QString &what)
{
    const QString message = QStringLiteral("%1 failed on %2: %3 %4")
                                .arg(what, describe()).arg(reply.code).arg(reply.text);
    qWarning() << "FTP:" << message;

    switch (reply.code) {
    case FtpReplyServiceClosing:
        closeSockets();
        throw NetworkError(message);
    case FtpReplyCantOpenData:
    case FtpReplyTransferAborted:
        throw NetworkError(message);
    case FtpReplyNotLoggedIn:
        throw AuthenticationError(message);
    default:
        throw ProtocolError(message);
    }
}

// Remote file system

QList<RemoteEntry> FtpSession::listDirectory(const QString &path)
{
    openDataConnection();
    startDataTransfer(path.isEmpty() ? QStringLiteral("LIST") : "LIST " + path,
                      QStringLiteral("LIST"));

    QByteArray listing;
    for (;;) {
        if (dataSocket_->bytesAvailable() > 0) {
            listing.append(dataSocket_->readAll());
            continue;
        }
        if (dataSocket_->state() != QAbstractSocket::ConnectedState) {
            break;
        }
        if (!dataSocket_->waitForReadyRead(options_.connectTimeoutMs)) {
            if (dataSocket_->error() == QAbstractSocket::RemoteHostClosedError
                || dataSocket_->state() != QAbstractSocket::ConnectedState) {
                listing.append(dataSocket_->readAll());
                break;
            }
            closeSockets();
            throw NetworkError(QStringLiteral("Timed out reading listing from %1").arg(describe()));
        }
    }

    finishDataTransfer(QStringLiteral("LIST"));
    QList<RemoteEntry> entries = parseDirectoryListing(listing);
    LOG_VERBOSE() << "FTP: Parsed" << entries.size() << "entries";
    return entries;
}

void FtpSession::remove(const QString &path)
{
    expectReply(command("DELE " + path), {FtpReplyActionOk}, QStringLiteral("DELE"));
}

void FtpSession::makeDirectory(const QString &path)
{
    expectReply(command("MKD " + path), {FtpReplyPathCreated}, QStringLiteral("MKD"));
}

void FtpSession::removeDirectory(const QString &path)
{
    expectReply(command("RMD " + path), {FtpReplyActionOk}, QStringLiteral("RMD"));
}

void FtpSession::rename(const QString &from, const QString &to)
{
    expectReply(command("RNFR " + from), {FtpReplyPendingFurtherInfo}, QStringLiteral("RNFR"));
    expectReply(command("RNTO " + to), {FtpReplyActionOk}, QStringLiteral("RNTO"));
}

std::optional<qint64> FtpSession::remoteSize(const QString &path)
{
    Reply reply = command("SIZE " + path);
    if (reply.code != FtpReplyFileStatus) {
        if (reply.code == FtpReplyServiceClosing) {
            failWith(reply, QStringLiteral("SIZE"));
        }
        return std::nullopt;
    }
    bool ok = false;
    qint64 size = reply.text.trimmed().toLongLong(&ok);
    if (!ok || size < 0) {
        return std::nullopt;
    }
    return size;
}

// Data channel

void FtpSession::openDataConnection()
{
    quint16 dataPort = 0;
    Reply reply = command("PASV");
    QString ignoredHost;
    if (reply.code != FtpReplyEnteringPassive || !parsePassiveResponse(reply.text, ignoredHost, dataPort)) {
        reply = command("EPSV");
        if (reply.code != FtpReplyEnteringExtendedPassive
            || !parseExtendedPassiveResponse(reply.text, dataPort)) {
            failWith(reply, QStringLiteral("Passive mode"));
        }
    }

    // Use the control socket's peer address instead of the IP from PASV
    // Many FTP servers return internal IPs that aren't reachable
    const QHostAddress dataHost = controlSocket_->peerAddress();
    LOG_VERBOSE() << "FTP: Data connection to" << dataHost.toString() << ":" << dataPort;

    dataSocket_ = std::make_unique<QSslSocket>();
    if (protectedData_) {
        dataSocket_->setPeerVerifyName(host_);
    }
    dataSocket_->connectToHost(dataHost, dataPort);
    if (!dataSocket_->waitForConnected(options_.connectTimeoutMs)) {
        const QString reason = dataSocket_->errorString();
        dataSocket_.reset();
        throw NetworkError(QStringLiteral("Cannot open data connection to %1: %2").arg(describe(), reason));
    }
}

void FtpSession::startDataTransfer(const QString &commandText, const QString &what)
{
    Reply reply = command(commandText);
    if (reply.code != FtpReplyFileStatusOk && reply.code != FtpReplyDataConnectionOpen) {
        dataSocket_.reset();
        failWith(reply, what);
    }
    if (protectedData_) {
        dataSocket_->startClientEncryption();
        startTls(dataSocket_.get(), QStringLiteral("data connection"));
    }
}

void FtpSession::finishDataTransfer(const QString &what)
{
    if (dataSocket_) {
        dataSocket_->disconnectFromHost();
        if (dataSocket_->state() != QAbstractSocket::UnconnectedState) {
            dataSocket_->waitForDisconnected(options_.connectTimeoutMs);
        }
        dataSocket_.reset();
    }
    expectReply(readReply(options_.connectTimeoutMs),
                {FtpReplyTransferComplete, FtpReplyActionOk}, what);
}

void FtpSession::abortTransfer()
{
    if (dataSocket_) {
        dataSocket_->abort();
        dataSocket_.reset();
    }
    qDebug() << "FTP: Aborting transfer on" << describe();

    // Servers answer ABOR with 426 followed by 226, or with a single 226
    try {
        Reply reply = command("ABOR");
        if (reply.code == FtpReplyTransferAborted || reply.isPreliminary()
            || reply.code == FtpReplyFileStatusOk) {
            reply = readReply(AbortReplyTimeoutMs);
        }
        LOG_VERBOSE() << "FTP: ABOR acknowledged with" << reply.code;
    } catch (const NetworkError &e) {
        qWarning() << "FTP: Control connection lost while aborting:" << e.what();
        closeSockets();
    } catch (const ProtocolError &e) {
        qWarning() << "FTP: Unexpected reply while aborting:" << e.what();
        closeSockets();
    }
}

// Transfers

void FtpSession::download(const QString &remotePath, const QString &localPath, qint64 resumeOffset,
                          const ProgressCallback &progress, const std::atomic_bool &cancel)
{
    QFile file(localPath);
    if (!file.open(resumeOffset > 0 ? QIODevice::ReadWrite : QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw LocalIOError(QStringLiteral("Cannot open %1 for writing: %2").arg(localPath, file.errorString()));
    }
    if (resumeOffset > 0 && (!file.resize(resumeOffset) || !file.seek(resumeOffset))) {
        throw LocalIOError(QStringLiteral("Cannot resume %1 at %2: %3")
                               .arg(localPath).arg(resumeOffset).arg(file.errorString()));
    }

    const qint64 total = remoteSize(remotePath).value_or(-1);

    openDataConnection();
    if (resumeOffset > 0) {
        expectReply(command(QStringLiteral("REST %1").arg(resumeOffset)),
                    {FtpReplyPendingFurtherInfo}, QStringLiteral("REST"));
    }
    startDataTransfer("RETR " + remotePath, QStringLiteral("RETR"));

    qint64 done = resumeOffset;
    for (;;) {
        if (cancel.load()) {
            file.close();
            abortTransfer();
            throw TransferCancelledError();
        }
        if (dataSocket_->bytesAvailable() == 0) {
            if (dataSocket_->state() != QAbstractSocket::ConnectedState) {
                break;
            }
            if (!dataSocket_->waitForReadyRead(options_.connectTimeoutMs)) {
                if (dataSocket_->bytesAvailable() == 0
                    && (dataSocket_->error() == QAbstractSocket::RemoteHostClosedError
                        || dataSocket_->state() != QAbstractSocket::ConnectedState)) {
                    break;
                }
                if (dataSocket_->bytesAvailable() == 0) {
                    closeSockets();
                    throw NetworkError(QStringLiteral("Timed out downloading %1 from %2")
                                           .arg(remotePath, describe()));
                }
            }
        }

        const QByteArray chunk = dataSocket_->read(options_.chunkSize);
        if (chunk.isEmpty()) {
            continue;
        }
        if (file.write(chunk) != chunk.size()) {
            const QString reason = file.errorString();
            abortTransfer();
            throw LocalIOError(QStringLiteral("Cannot write %1: %2").arg(localPath, reason));
        }
        done += chunk.size();
        if (progress) {
            progress(done, total);
        }
    }

    if (!file.flush()) {
        throw LocalIOError(QStringLiteral("Cannot write %1: %2").arg(localPath, file.errorString()));
    }
    file.close();
    finishDataTransfer(QStringLiteral("RETR"));
    if (total >= 0 && done != total) {
        throw NetworkError(QStringLiteral("Download of %1 ended after %2 of %3 bytes")
                               .arg(remotePath).arg(done).arg(total));
    }
    LOG_VERBOSE() << "FTP: Downloaded" << remotePath << done << "bytes";
}

void FtpSession::upload(const QString &localPath, const QString &remotePath, qint64 resumeOffset,
                        const ProgressCallback &progress, const std::atomic_bool &cancel)
{
    QFile file(localPath);
    if (!file.open(QIODevice::ReadOnly)) {
        throw LocalIOError(QStringLiteral("Cannot open %1: %2").arg(localPath, file.errorString()));
    }
    const qint64 total = file.size();
    if (resumeOffset > total || (resumeOffset > 0 && !file.seek(resumeOffset))) {
        throw LocalIOError(QStringLiteral("Cannot resume %1 at %2").arg(localPath).arg(resumeOffset));
    }

    openDataConnection();
    if (resumeOffset > 0) {
        expectReply(command(QStringLiteral("REST %1").arg(resumeOffset)),
                    {FtpReplyPendingFurtherInfo}, QStringLiteral("REST"));
    }
    startDataTransfer("STOR " + remotePath, QStringLiteral("STOR"));

    qint64 done = resumeOffset;
    while (!file.atEnd()) {
        if (cancel.load()) {
            abortTransfer();
            throw TransferCancelledError();
        }

        const QByteArray chunk = file.read(options_.chunkSize);
        if (chunk.isEmpty()) {
            const QString reason = file.errorString();
            abortTransfer();
            throw LocalIOError(QStringLiteral("Cannot read %1: %2").arg(localPath, reason));
        }

        dataSocket_->write(chunk);
        while (dataSocket_->bytesToWrite() > 0) {
            if (!dataSocket_->waitForBytesWritten(options_.connectTimeoutMs)) {
                const QString reason = dataSocket_->errorString();
                closeSockets();
                throw NetworkError(QStringLiteral("Upload of %1 to %2 interrupted: %3")
                                       .arg(remotePath, describe(), reason));
            }
        }
        done += chunk.size();
        if (progress) {
            progress(done, total);
        }
    }

    finishDataTransfer(QStringLiteral("STOR"));
    LOG_VERBOSE() << "FTP: Uploaded" << remotePath << done << "bytes";
}

// Parsers

bool FtpSession::parseReplyLine(const QString &line, int &code, QString &text, bool &isFinal)
{
    if (line.size() < FtpReplyCodeLength) {
        return false;
    }
    for (int i = 0; i < FtpReplyCodeLength; ++i) {
        if (!line.at(i).isDigit()) {
            return false;
        }
    }
    bool ok = false;
    const int value = line.left(FtpReplyCodeLength).toInt(&ok);
    if (!ok || value < 100 || value > 599) {
        return false;
    }
    if (line.size() > FtpReplyCodeLength) {
        const QChar separator = line.at(FtpReplyCodeLength);
        if (separator != QLatin1Char(' ') && separator != QLatin1Char('-')) {
            return false;
        }
        isFinal = separator == QLatin1Char(' ');
    } else {
        isFinal = true;
    }
    code = value;
    text = line.mid(FtpReplyTextOffset);
    return true;
}

QString FtpSession::decodeControlLine(const QByteArray &raw)
{
    QByteArray line = raw;
    while (line.endsWith('\n') || line.endsWith('\r')) {
        line.chop(1);
    }
    return QString::fromUtf8(line);
}

QString FtpSession::commandForLog(const QString &command)
{
    if (command.startsWith(QLatin1String("PASS "), Qt::CaseInsensitive)) {
        return QStringLiteral("PASS ") + fftp::redacted(command.mid(5));
    }
    return command;
}

bool FtpSession::parsePassiveResponse(const QString &text, QString &host, quint16 &port)
{
    // Parse response like: 227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)
    static const QRegularExpression rx("(\\d+),(\\d+),(\\d+),(\\d+),(\\d+),(\\d+)");
    auto match = rx.match(text);

    if (!match.hasMatch()) {
        return false;
    }

    for (int i = 1; i <= 6; ++i) {
        if (match.captured(i).toInt() > 255) {
            return false;
        }
    }

    host = QString("%1.%2.%3.%4")
               .arg(match.captured(1))
               .arg(match.captured(2))
               .arg(match.captured(3))
               .arg(match.captured(4));

    int p1 = match.captured(5).toInt();
    int p2 = match.captured(6).toInt();
    port = static_cast<quint16>((p1 * PassivePortMultiplier) + p2);

    return port != 0;
}

bool FtpSession::parseExtendedPassiveResponse(const QString &text, quint16 &port)
{
    // Parse response like: 229 Entering Extended Passive Mode (|||6446|)
    static const QRegularExpression rx("\\((.)\\1\\1(\\d+)\\1\\)");
    auto match = rx.match(text);
    if (!match.hasMatch()) {
        return false;
    }
    bool ok = false;
    const int value = match.captured(2).toInt(&ok);
    if (!ok || value <= 0 || value > 65535) {
        return false;
    }
    port = static_cast<quint16>(value);
    return true;
}

QList<RemoteEntry> FtpSession::parseDirectoryListing(const QByteArray &data)
{
    QList<RemoteEntry> entries;
    QString listing = QString::fromUtf8(data);
    QStringList lines = listing.split('\n', Qt::SkipEmptyParts);

    // Unix-style listing: drwxr-xr-x 2 user group 4096 Jan 1 12:00 dirname
    // Or simple listing: filename
    static const QRegularExpression unixRx(
        "^([dl\\-])([rwxsStT\\-]{9})\\S*\\s+\\d+\\s+\\S+\\s+\\S+\\s+(\\d+)\\s+"
        "(\\w{3})\\s+(\\d{1,2})\\s+(\\d{1,2}:\\d{2}|\\d{4})\\s+(.+)$");

    const QLocale c = QLocale::c();
    const QDate today = QDate::currentDate();

    for (QString line : lines) {
        if (line.endsWith('\r')) {
            line.chop(1);
        }
        if (line.trimmed().isEmpty() || line.startsWith("total ")) continue;

        RemoteEntry entry;
        auto match = unixRx.match(line);

        if (match.hasMatch()) {
            const QString type = match.captured(1);
            entry.isDirectory = (type == "d");
            entry.isSymlink = (type == "l");
            entry.permissions = match.captured(2);
            entry.size = match.captured(3).toLongLong();
            entry.name = match.captured(7);
            if (entry.isSymlink) {
                const int arrow = entry.name.indexOf(" -> ");
                if (arrow > 0) {
                    entry.name.truncate(arrow);
                }
            }

            // Recent files carry a time instead of a year
            const QString yearOrTime = match.captured(6);
            const QString dayMonth = match.captured(4) + ' ' + match.captured(5);
            if (yearOrTime.contains(':')) {
                QDate date = c.toDate(dayMonth + ' ' + QString::number(today.year()), "MMM d yyyy");
                if (date.isValid() && date > today.addDays(1)) {
                    date = date.addYears(-1);
                }
                const QTime time = QTime::fromString(yearOrTime, "H:mm");
                entry.modified = QDateTime(date, time.isValid() ? time : QTime(0, 0));
            } else {
                entry.modified = QDateTime(c.toDate(dayMonth + ' ' + yearOrTime, "MMM d yyyy"), QTime(0, 0));
            }
        } else {
            // Simple listing - just filename
            entry.name = line.trimmed();
            entry.isDirectory = false;  // Can't tell from simple listing
        }

        if (!entry.name.isEmpty() && entry.name != "." && entry.name != "..") {
            entries.append(entry);
        }
    }

    return entries;
}
