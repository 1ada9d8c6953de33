/**
 * @file test_ftpsession_protocol.cpp
 * @brief Unit tests for FtpSession protocol parsing.
 *
 * Tests verify:
 * - Reply line splitting (final and continuation lines)
 * - Password masking in the command log
 * - Passive mode address extraction from PASV and EPSV replies
 * - Directory listing parsing (Unix-style and bare names)
 */

#include <QtTest>

#include <services/ftpsession.h>
#include <utils/logging.h>

class TestFtpSessionProtocol : public QObject
{
    Q_OBJECT

private slots:
    // === Reply Line Tests ===

    void parseReplyLine_Final()
    {
        int code = 0;
        QString text;
        bool isFinal = false;

        QVERIFY(FtpSession::parseReplyLine("230 User logged in", code, text, isFinal));
        QCOMPARE(code, 230);
        QCOMPARE(text, QString("User logged in"));
        QVERIFY(isFinal);
    }

    void parseReplyLine_Continuation()
    {
        int code = 0;
        QString text;
        bool isFinal = true;

        QVERIFY(FtpSession::parseReplyLine("220-Welcome to the server", code, text, isFinal));
        QCOMPARE(code, 220);
        QVERIFY(!isFinal);
    }

    void parseReplyLine_BareCode()
    {
        int code = 0;
        QString text;
        bool isFinal = false;

        QVERIFY(FtpSession::parseReplyLine("200", code, text, isFinal));
        QCOMPARE(code, 200);
        QVERIFY(isFinal);
        QVERIFY(text.isEmpty());
    }

    void parseReplyLine_Malformed()
    {
        int code = 0;
        QString text;
        bool isFinal = false;

        QVERIFY(!FtpSession::parseReplyLine("hello", code, text, isFinal));
        QVERIFY(!FtpSession::parseReplyLine("22", code, text, isFinal));
        QVERIFY(!FtpSession::parseReplyLine("2300 x", code, text, isFinal));
        QVERIFY(!FtpSession::parseReplyLine("099 too low", code, text, isFinal));
    }

    void parseReplyLine_IndentedIsNotAReply()
    {
        int code = 0;
        QString text;
        bool isFinal = false;

        QVERIFY(!FtpSession::parseReplyLine(" 220 indented", code, text, isFinal));
        QVERIFY(!FtpSession::parseReplyLine("+22 signed", code, text, isFinal));
    }

    void decodeControlLine_KeepsLeadingWhitespace()
    {
        QCOMPARE(FtpSession::decodeControlLine(" 220 indented\r\n"), QString(" 220 indented"));
        QCOMPARE(FtpSession::decodeControlLine("230 ok  \r\n"), QString("230 ok  "));
        QCOMPARE(FtpSession::decodeControlLine("226 done\n"), QString("226 done"));
        QCOMPARE(FtpSession::decodeControlLine("\r\n"), QString());
    }

    // === Command Logging Tests ===

    void commandForLog_MasksPassword()
    {
        const QString logged = FtpSession::commandForLog("PASS hunter2");
        QCOMPARE(logged, QString("PASS ") + fftp::redacted("hunter2"));
        QVERIFY(!logged.contains("hunter2"));
        QVERIFY(!FtpSession::commandForLog("pass hunter2").contains("hunter2"));
    }

    void commandForLog_KeepsOtherCommands()
    {
        QCOMPARE(FtpSession::commandForLog("USER alice"), QString("USER alice"));
        QCOMPARE(FtpSession::commandForLog("RETR /pub/PASS file"), QString("RETR /pub/PASS file"));
    }

    // === PASV Response Parsing Tests ===

    void parsePassiveResponse_StandardFormat()
    {
        QString host;
        quint16 port = 0;

        bool result = FtpSession::parsePassiveResponse(
            "Entering Passive Mode (192,168,1,64,4,0)", host, port);

        QVERIFY(result);
        QCOMPARE(host, QString("192.168.1.64"));
        QCOMPARE(port, static_cast<quint16>(1024));  // (4 * 256) + 0
    }

    void parsePassiveResponse_HighPort()
    {
        QString host;
        quint16 port = 0;

        bool result = FtpSession::parsePassiveResponse(
            "Entering Passive Mode (10,0,0,1,200,10)", host, port);

        QVERIFY(result);
        QCOMPARE(host, QString("10.0.0.1"));
        QCOMPARE(port, static_cast<quint16>(51210));  // (200 * 256) + 10
    }

    void parsePassiveResponse_WithoutParentheses()
    {
        QString host;
        quint16 port = 0;

        // Some servers omit the parentheses
        QVERIFY(FtpSession::parsePassiveResponse("Entering Passive Mode 127,0,0,1,0,21", host, port));
        QCOMPARE(host, QString("127.0.0.1"));
        QCOMPARE(port, static_cast<quint16>(21));
    }

    void parsePassiveResponse_OutOfRangeOctet()
    {
        QString host;
        quint16 port = 0;

        QVERIFY(!FtpSession::parsePassiveResponse("Entering Passive Mode (300,0,0,1,4,0)", host, port));
    }

    void parsePassiveResponse_ZeroPort()
    {
        QString host;
        quint16 port = 0;

        QVERIFY(!FtpSession::parsePassiveResponse("Entering Passive Mode (10,0,0,1,0,0)", host, port));
    }

    void parsePassiveResponse_Garbage()
    {
        QString host;
        quint16 port = 0;

        QVERIFY(!FtpSession::parsePassiveResponse("Passive mode refused", host, port));
    }

    // === EPSV Response Parsing Tests ===

    void parseExtendedPassiveResponse_Standard()
    {
        quint16 port = 0;

        QVERIFY(FtpSession::parseExtendedPassiveResponse(
            "Entering Extended Passive Mode (|||6446|)", port));
        QCOMPARE(port, static_cast<quint16>(6446));
    }

    void parseExtendedPassiveResponse_AlternateDelimiter()
    {
        quint16 port = 0;

        QVERIFY(FtpSession::parseExtendedPassiveResponse("Entering Extended Passive Mode (!!!50000!)", port));
        QCOMPARE(port, static_cast<quint16>(50000));
    }

    void parseExtendedPassiveResponse_Invalid()
    {
        quint16 port = 0;

        QVERIFY(!FtpSession::parseExtendedPassiveResponse("Entering Extended Passive Mode (|||0|)", port));
        QVERIFY(!FtpSession::parseExtendedPassiveResponse("Entering Extended Passive Mode (|||70000|)", port));
        QVERIFY(!FtpSession::parseExtendedPassiveResponse("Entering Extended Passive Mode", port));
    }

    // === Directory Listing Tests ===

    void parseDirectoryListing_UnixFormat()
    {
        QByteArray listing =
            "total 12\r\n"
            "drwxr-xr-x 2 alice users 4096 Jan  5 12:00 photos\r\n"
            "-rw-r--r-- 1 alice users 174848 Mar 10 2023 backup.tar\r\n"
            "lrwxrwxrwx 1 alice users 11 Feb  2 09:15 latest -> backup.tar\r\n";

        QList<RemoteEntry> entries = FtpSession::parseDirectoryListing(listing);

        QCOMPARE(entries.size(), 3);

        QCOMPARE(entries[0].name, QString("photos"));
        QVERIFY(entries[0].isDirectory);
        QCOMPARE(entries[0].permissions, QString("rwxr-xr-x"));

        QCOMPARE(entries[1].name, QString("backup.tar"));
        QVERIFY(!entries[1].isDirectory);
        QCOMPARE(entries[1].size, qint64(174848));
        QCOMPARE(entries[1].modified.date(), QDate(2023, 3, 10));

        QCOMPARE(entries[2].name, QString("latest"));
        QVERIFY(entries[2].isSymlink);
    }

    void parseDirectoryListing_NameWithSpaces()
    {
        QByteArray listing = "-rw-r--r-- 1 bob staff 42 Dec 24 2022 Holiday Notes.txt\n";

        QList<RemoteEntry> entries = FtpSession::parseDirectoryListing(listing);

        QCOMPARE(entries.size(), 1);
        QCOMPARE(entries[0].name, QString("Holiday Notes.txt"));
        QCOMPARE(entries[0].size, qint64(42));
    }

    void parseDirectoryListing_SkipsDotEntries()
    {
        QByteArray listing =
            "drwxr-xr-x 2 alice users 4096 Jan  5 12:00 .\n"
            "drwxr-xr-x 9 alice users 4096 Jan  5 12:00 ..\n"
            "-rw-r--r-- 1 alice users 10 Jan  5 12:00 a.txt\n";

        QList<RemoteEntry> entries = FtpSession::parseDirectoryListing(listing);

        QCOMPARE(entries.size(), 1);
        QCOMPARE(entries[0].name, QString("a.txt"));
    }

    void parseDirectoryListing_BareNames()
    {
        QList<RemoteEntry> entries = FtpSession::parseDirectoryListing("one.bin\r\ntwo.bin\r\n");

        QCOMPARE(entries.size(), 2);
        QCOMPARE(entries[0].name, QString("one.bin"));
        QVERIFY(!entries[0].isDirectory);
        QCOMPARE(entries[1].name, QString("two.bin"));
    }

    void parseDirectoryListing_Empty()
    {
        QVERIFY(FtpSession::parseDirectoryListing(QByteArray()).isEmpty());
        QVERIFY(FtpSession::parseDirectoryListing("\r\n").isEmpty());
    }
};

QTEST_MAIN(TestFtpSessionProtocol)
#include "test_ftpsession_protocol.moc"
