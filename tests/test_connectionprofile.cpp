#include <QtTest>
#include <QJsonObject>

#include "services/connectionprofile.h"

class TestConnectionProfile : public QObject
{
    Q_OBJECT

private slots:
    void testCreateAssignsIdAndTimestamp()
    {
        const ConnectionProfile a = ConnectionProfile::create("home-nas", Protocol::Sftp, "nas.local", "alice");
        const ConnectionProfile b = ConnectionProfile::create("home-nas", Protocol::Sftp, "nas.local", "alice");

        QVERIFY(!a.id.isEmpty());
        QVERIFY(a.id != b.id);
        QVERIFY(a.created.isValid());
        QVERIFY(!a.lastUsed.isValid());
        QCOMPARE(a.credentialKind, CredentialKind::Password);
        QVERIFY(a.passiveMode);
    }

    void testEffectivePort_data()
    {
        QTest::addColumn<int>("protocol");
        QTest::addColumn<bool>("implicit");
        QTest::addColumn<int>("port");
        QTest::addColumn<int>("expected");

        QTest::newRow("ftp default") << int(Protocol::Ftp) << false << 0 << 21;
        QTest::newRow("ftps explicit") << int(Protocol::Ftps) << false << 0 << 21;
        QTest::newRow("ftps implicit") << int(Protocol::Ftps) << true << 0 << 990;
        QTest::newRow("sftp default") << int(Protocol::Sftp) << false << 0 << 22;
        QTest::newRow("custom") << int(Protocol::Sftp) << false << 2222 << 2222;
    }

    void testEffectivePort()
    {
        QFETCH(int, protocol);
        QFETCH(bool, implicit);
        QFETCH(int, port);
        QFETCH(int, expected);

        ConnectionProfile profile = ConnectionProfile::create("p", static_cast<Protocol>(protocol), "h", "u");
        profile.ftpsImplicit = implicit;
        profile.port = static_cast<quint16>(port);
        QCOMPARE(int(profile.effectivePort()), expected);
    }

    void testDisplayAddressHasNoSecret()
    {
        ConnectionProfile profile = ConnectionProfile::create("nas", Protocol::Sftp, "nas.local", "alice");
        profile.secret = "hunter2";

        QCOMPARE(profile.displayAddress(), QString("alice@nas.local:22"));
        QVERIFY(!profile.displayAddress().contains("hunter2"));
    }

    void testProtocolNames()
    {
        QCOMPARE(QString(protocolToString(Protocol::Ftps)), QString("ftps"));
        QCOMPARE(protocolFromString("SFTP"), std::optional<Protocol>(Protocol::Sftp));
        QCOMPARE(protocolFromString(" ftp "), std::optional<Protocol>(Protocol::Ftp));
        QVERIFY(!protocolFromString("scp").has_value());
    }

    void testJsonRoundTrip()
    {
        ConnectionProfile profile = ConnectionProfile::create("web", Protocol::Ftps, "ftp.example.com", "bob");
        profile.port = 2121;
        profile.secret = "pa55";
        profile.remotePath = "/htdocs";
        profile.ftpsImplicit = true;
        profile.passiveMode = false;
        profile.lastUsed = QDateTime::currentDateTimeUtc();

        const auto restored = ConnectionProfile::fromJson(profile.toJson());
        QVERIFY(restored.has_value());
        QVERIFY(*restored == profile);
    }

    void testJsonKeyCredential()
    {
        ConnectionProfile profile = ConnectionProfile::create("key", Protocol::Sftp, "h", "u");
        profile.credentialKind = CredentialKind::PrivateKey;
        profile.keyPath = "/home/u/.ssh/id_ed25519";

        const QJsonObject json = profile.toJson();
        QCOMPARE(json["credential"].toString(), QString("key"));

        const auto restored = ConnectionProfile::fromJson(json);
        QCOMPARE(restored->credentialKind, CredentialKind::PrivateKey);
        QCOMPARE(restored->keyPath, profile.keyPath);
    }

    void testFromJsonRejectsMalformed()
    {
        const QJsonObject valid = ConnectionProfile::create("p", Protocol::Ftp, "h", "u").toJson();

        QJsonObject noId = valid;
        noId.remove("id");
        QVERIFY(!ConnectionProfile::fromJson(noId).has_value());

        QJsonObject badProtocol = valid;
        badProtocol["protocol"] = "gopher";
        QVERIFY(!ConnectionProfile::fromJson(badProtocol).has_value());

        QJsonObject badPort = valid;
        badPort["port"] = 70000;
        QVERIFY(!ConnectionProfile::fromJson(badPort).has_value());

        QJsonObject emptyHost = valid;
        emptyHost["host"] = "";
        QVERIFY(!ConnectionProfile::fromJson(emptyHost).has_value());
    }

    void testWipeSecret()
    {
        ConnectionProfile profile = ConnectionProfile::create("p", Protocol::Ftp, "h", "u");
        profile.secret = "secret";
        profile.wipeSecret();
        QVERIFY(profile.secret.isEmpty());
    }
};

QTEST_MAIN(TestConnectionProfile)
#include "test_connectionprofile.moc"
