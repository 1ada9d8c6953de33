/**
 * @file test_ftpsession_server.cpp
 * @brief Tests FtpSession against a scripted FTP server on localhost.
 *
 * The server runs blocking socket I/O on its own thread because
 * FtpSession itself blocks on the control and data sockets.
 */

#include <QtTest>
#include <QMutex>
#include <QSemaphore>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTemporaryDir>
#include <QThread>

#include <atomic>

#include <services/errors.h>
#include <services/ftpsession.h>

class ScriptedFtpServer : public QThread
{
public:
    explicit ScriptedFtpServer(const QString &password)
        : password_(password)
    {
    }

    ~ScriptedFtpServer() override
    {
        wait(10000);
    }

    /// Starts the thread and blocks until the control port is listening.
    quint16 listen()
    {
        start();
        ready_.acquire();
        return port_;
    }

    void setFile(const QString &path, const QByteArray &data)
    {
        QMutexLocker locker(&mutex_);
        files_[path] = data;
    }

    QByteArray file(const QString &path) const
    {
        QMutexLocker locker(&mutex_);
        return files_.value(path);
    }

    bool hasFile(const QString &path) const
    {
        QMutexLocker locker(&mutex_);
        return files_.contains(path);
    }

    /// Replaces the banner; may hold several CRLF-separated lines. Set before listen().
    void setGreeting(const QByteArray &greeting)
    {
        greeting_ = greeting;
    }

protected:
    void run() override
    {
        QTcpServer control;
        control.listen(QHostAddress::LocalHost, 0);
        port_ = control.serverPort();
        ready_.release();

        if (!control.waitForNewConnection(10000)) {
            return;
        }
        QTcpSocket *client = control.nextPendingConnection();
        reply(client, greeting_);

        QTcpServer data;
        qint64 restOffset = 0;
        while (client->state() == QAbstractSocket::ConnectedState) {
            if (!client->canReadLine() && !client->waitForReadyRead(10000)) {
                break;
            }
            while (client->canReadLine()) {
                const QString line = QString::fromUtf8(client->readLine()).trimmed();
                const QString verb = line.section(' ', 0, 0).toUpper();
                const QString arg = line.section(' ', 1);

                if (verb == "USER") {
                    reply(client, "331 Password required");
                } else if (verb == "PASS") {
                    reply(client, arg == password_ ? "230 Logged in" : "530 Login incorrect");
                } else if (verb == "TYPE") {
                    reply(client, "200 Type set to I");
                } else if (verb == "PASV") {
                    data.close();
                    data.listen(QHostAddress::LocalHost, 0);
                    const quint16 port = data.serverPort();
                    reply(client, QStringLiteral("227 Entering Passive Mode (127,0,0,1,%1,%2)")
                                      .arg(port / 256).arg(port % 256).toUtf8());
                } else if (verb == "SIZE") {
                    if (hasFile(arg)) {
                        reply(client, "213 " + QByteArray::number(file(arg).size()));
                    } else {
                        reply(client, "550 No such file");
                    }
                } else if (verb == "REST") {
                    restOffset = arg.toLongLong();
                    reply(client, "350 Restarting");
                } else if (verb == "LIST") {
                    sendData(client, data,
                             "drwxr-xr-x 2 alice users 4096 Jan  5 12:00 photos\r\n"
                             "-rw-r--r-- 1 alice users 11 Mar 10 2023 notes.txt\r\n");
                } else if (verb == "RETR") {
                    if (!hasFile(arg)) {
                        reply(client, "550 No such file");
                    } else {
                        sendData(client, data, file(arg).mid(restOffset));
                    }
                    restOffset = 0;
                } else if (verb == "STOR") {
                    receiveData(client, data, arg, restOffset);
                    restOffset = 0;
                } else if (verb == "DELE") {
                    QMutexLocker locker(&mutex_);
                    reply(client, files_.remove(arg) > 0 ? "250 Deleted" : "550 No such file");
                } else if (verb == "QUIT") {
                    reply(client, "221 Goodbye");
                    client->disconnectFromHost();
                    if (client->state() != QAbstractSocket::UnconnectedState) {
                        client->waitForDisconnected(5000);
                    }
                    return;
                } else {
                    reply(client, "502 Command not implemented");
                }
            }
        }
    }

private:
    static void reply(QTcpSocket *socket, const QByteArray &line)
    {
        socket->write(line + "\r\n");
        socket->waitForBytesWritten(5000);
    }

    static void reply(QTcpSocket *socket, const char *line)
    {
        reply(socket, QByteArray(line));
    }

    static QTcpSocket *acceptData(QTcpServer &data)
    {
        if (!data.hasPendingConnections() && !data.waitForNewConnection(10000)) {
            return nullptr;
        }
        return data.nextPendingConnection();
    }

    void sendData(QTcpSocket *client, QTcpServer &data, const QByteArray &payload)
    {
        reply(client, "150 Opening data connection");
        QTcpSocket *channel = acceptData(data);
        if (!channel) {
            reply(client, "425 Can't open data connection");
            return;
        }
        channel->write(payload);
        while (channel->bytesToWrite() > 0 && channel->waitForBytesWritten(5000)) {
        }
        channel->disconnectFromHost();
        if (channel->state() != QAbstractSocket::UnconnectedState) {
            channel->waitForDisconnected(5000);
        }
        delete channel;
        reply(client, "226 Transfer complete");
    }

    void receiveData(QTcpSocket *client, QTcpServer &data, const QString &path, qint64 offset)
    {
        reply(client, "150 Ok to send data");
        QTcpSocket *channel = acceptData(data);
        if (!channel) {
            reply(client, "425 Can't open data connection");
            return;
        }
        QByteArray received;
        while (channel->state() == QAbstractSocket::ConnectedState) {
            if (!channel->waitForReadyRead(5000)) {
                break;
            }
            received.append(channel->readAll());
        }
        received.append(channel->readAll());
        delete channel;
        {
            QMutexLocker locker(&mutex_);
            QByteArray &stored = files_[path];
            stored.truncate(offset);
            stored.append(received);
        }
        reply(client, "226 Transfer complete");
    }

    QString password_;
    QByteArray greeting_ = "220 scripted server ready";
    std::atomic<quint16> port_{0};
    QSemaphore ready_;
    mutable QMutex mutex_;
    QHash<QString, QByteArray> files_;
};

class TestFtpSessionServer : public QObject
{
    Q_OBJECT

private:
    SessionOptions options;

    ConnectionProfile profileFor(quint16 port, const QString &password)
    {
        ConnectionProfile profile = ConnectionProfile::create("scripted", Protocol::Ftp, "127.0.0.1", "alice");
        profile.port = port;
        profile.secret = password;
        return profile;
    }

private slots:
    void init()
    {
        options.connectTimeoutMs = 5000;
        options.chunkSize = 4;
    }

    // ========== Connection ==========

    void testLoginAndList()
    {
        ScriptedFtpServer server("s3cret");
        const quint16 port = server.listen();

        FtpSession session(false, options);
        session.connectToHost(profileFor(port, "s3cret"));
        QVERIFY(session.isConnected());
        QCOMPARE(session.protocol(), Protocol::Ftp);

        const QList<RemoteEntry> entries = session.listDirectory("/");
        QCOMPARE(entries.size(), 2);
        QCOMPARE(entries[0].name, QString("photos"));
        QVERIFY(entries[0].isDirectory);
        QCOMPARE(entries[1].name, QString("notes.txt"));
        QCOMPARE(entries[1].size, qint64(11));

        session.disconnectFromHost();
        QVERIFY(!session.isConnected());
    }

    void testWrongPasswordIsAuthenticationError()
    {
        ScriptedFtpServer server("s3cret");
        const quint16 port = server.listen();

        FtpSession session(false, options);
        QVERIFY_THROWS_EXCEPTION(AuthenticationError, session.connectToHost(profileFor(port, "wrong")));
        QVERIFY(!session.isConnected());
    }

    void testConnectionRefusedIsNetworkError()
    {
        quint16 port = 0;
        {
            QTcpServer unused;
            QVERIFY(unused.listen(QHostAddress::LocalHost, 0));
            port = unused.serverPort();
        }

        FtpSession session(false, options);
        try {
            session.connectToHost(profileFor(port, "s3cret"));
            QFAIL("connectToHost should have thrown");
        } catch (const FftpError &e) {
            QCOMPARE(e.kind(), ErrorKind::Network);
            QVERIFY(isTransient(e.kind()));
        }
    }

    void testIndentedLineInsideMultiLineGreeting()
    {
        ScriptedFtpServer server("s3cret");
        server.setGreeting("220-Welcome to the scripted server\r\n"
                           " 220 is the code you will see below\r\n"
                           "220 ready");
        const quint16 port = server.listen();

        FtpSession session(false, options);
        session.connectToHost(profileFor(port, "s3cret"));
        QVERIFY(session.isConnected());
        QCOMPARE(session.listDirectory("/").size(), 2);
        session.disconnectFromHost();
    }

    void testActiveModeRejected()
    {
        FtpSession session(false, options);
        ConnectionProfile profile = profileFor(21, "s3cret");
        profile.passiveMode = false;

        QVERIFY_THROWS_EXCEPTION(ProtocolError, session.connectToHost(profile));
    }

    // ========== Transfers ==========

    void testDownloadReportsProgress()
    {
        ScriptedFtpServer server("s3cret");
        server.setFile("/pub/readme.txt", "hello world");
        const quint16 port = server.listen();

        QTemporaryDir dir;
        const QString local = dir.filePath("readme.txt");

        FtpSession session(false, options);
        session.connectToHost(profileFor(port, "s3cret"));
        QCOMPARE(session.remoteSize("/pub/readme.txt"), std::optional<qint64>(11));

        qint64 lastDone = 0;
        qint64 lastTotal = 0;
        std::atomic_bool cancel{false};
        session.download("/pub/readme.txt", local, 0,
                         [&](qint64 done, qint64 total) { lastDone = done; lastTotal = total; }, cancel);

        QFile file(local);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QCOMPARE(file.readAll(), QByteArray("hello world"));
        QCOMPARE(lastDone, qint64(11));
        QCOMPARE(lastTotal, qint64(11));

        session.disconnectFromHost();
    }

    void testDownloadResumesFromOffset()
    {
        ScriptedFtpServer server("s3cret");
        server.setFile("/pub/readme.txt", "hello world");
        const quint16 port = server.listen();

        QTemporaryDir dir;
        const QString local = dir.filePath("readme.txt");
        {
            QFile partial(local);
            QVERIFY(partial.open(QIODevice::WriteOnly));
            partial.write("hello");
        }

        FtpSession session(false, options);
        session.connectToHost(profileFor(port, "s3cret"));
        std::atomic_bool cancel{false};
        session.download("/pub/readme.txt", local, 5, {}, cancel);

        QFile file(local);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QCOMPARE(file.readAll(), QByteArray("hello world"));

        session.disconnectFromHost();
    }

    void testUpload()
    {
        ScriptedFtpServer server("s3cret");
        const quint16 port = server.listen();

        QTemporaryDir dir;
        const QString local = dir.filePath("report.csv");
        {
            QFile out(local);
            QVERIFY(out.open(QIODevice::WriteOnly));
            out.write("a,b,c\n1,2,3\n");
        }

        FtpSession session(false, options);
        session.connectToHost(profileFor(port, "s3cret"));

        qint64 lastDone = 0;
        std::atomic_bool cancel{false};
        session.upload(local, "/incoming/report.csv", 0,
                       [&](qint64 done, qint64) { lastDone = done; }, cancel);

        QCOMPARE(lastDone, qint64(12));
        QCOMPARE(server.file("/incoming/report.csv"), QByteArray("a,b,c\n1,2,3\n"));

        session.disconnectFromHost();
    }

    void testMissingRemoteFile()
    {
        ScriptedFtpServer server("s3cret");
        const quint16 port = server.listen();

        QTemporaryDir dir;
        FtpSession session(false, options);
        session.connectToHost(profileFor(port, "s3cret"));

        QVERIFY(!session.remoteSize("/nope.bin").has_value());

        std::atomic_bool cancel{false};
        try {
            session.download("/nope.bin", dir.filePath("nope.bin"), 0, {}, cancel);
            QFAIL("download should have thrown");
        } catch (const FftpError &e) {
            QCOMPARE(e.kind(), ErrorKind::Protocol);
        }

        session.disconnectFromHost();
    }

    void testRemove()
    {
        ScriptedFtpServer server("s3cret");
        server.setFile("/old.log", "x");
        const quint16 port = server.listen();

        FtpSession session(false, options);
        session.connectToHost(profileFor(port, "s3cret"));
        session.remove("/old.log");
        QVERIFY(!server.hasFile("/old.log"));

        session.disconnectFromHost();
    }
};

QTEST_MAIN(TestFtpSessionServer)
#include "test_ftpsession_server.moc"
