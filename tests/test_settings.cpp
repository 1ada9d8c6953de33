#include <QtTest>
#include <QSettings>
#include <QTemporaryDir>

#include "services/settings.h"
#include "services/vaultstore.h"

class TestSettings : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir tempDir;

    QString writeIni(const QString &name, const QByteArray &contents)
    {
        const QString path = tempDir.filePath(name);
        QFile file(path);
        if (file.open(QIODevice::WriteOnly)) {
            file.write(contents);
        }
        return path;
    }

private slots:
    void testDefaults()
    {
        const Settings settings;

        QCOMPARE(settings.minPasswordLength, 8);
        QVERIFY(settings.kdf == (KdfParams{15, 8, 1}));
        QVERIFY(settings.kdfFloor == (KdfParams{14, 8, 1}));
        QCOMPARE(settings.maxConcurrent, 2);
        QCOMPARE(settings.maxSessionsPerProfile, 2);
        QCOMPARE(settings.maxRetries, 3);
        QCOMPARE(settings.retryBaseDelayMs, 1000);
        QCOMPARE(settings.retryMultiplier, 2.0);
        QCOMPARE(settings.retryMaxDelayMs, 30000);
        QCOMPARE(settings.chunkSize, qint64(65536));
        QCOMPARE(settings.speedLimit, qint64(0));
        QCOMPARE(settings.partialFiles, PartialFilePolicy::Keep);
        QCOMPARE(settings.idleTimeoutMs, 60000);
        QCOMPARE(settings.connectTimeoutMs, 30000);
        QVERIFY(settings.vaultPath.endsWith("vault.ffv"));
        QVERIFY(settings.knownHostsPath.endsWith("known_hosts"));
    }

    void testLoadFromIni()
    {
        const QString path = writeIni("fftp.ini",
            "[transfer]\n"
            "maxConcurrent=4\n"
            "maxRetries=5\n"
            "retryBaseDelayMs=250\n"
            "retryMultiplier=1.5\n"
            "partialFiles=delete\n"
            "speedLimit=1048576\n"
            "[session]\n"
            "idleTimeoutMs=5000\n"
            "[vault]\n"
            "kdfLogN=16\n"
            "path=/tmp/custom.ffv\n");

        const Settings settings = Settings::loadFile(path);

        QCOMPARE(settings.maxConcurrent, 4);
        QCOMPARE(settings.maxRetries, 5);
        QCOMPARE(settings.retryBaseDelayMs, 250);
        QCOMPARE(settings.retryMultiplier, 1.5);
        QCOMPARE(settings.partialFiles, PartialFilePolicy::Delete);
        QCOMPARE(settings.speedLimit, qint64(1048576));
        QCOMPARE(settings.idleTimeoutMs, 5000);
        QCOMPARE(int(settings.kdf.logN), 16);
        QCOMPARE(settings.vaultPath, QString("/tmp/custom.ffv"));
        // Untouched keys keep their defaults
        QCOMPARE(settings.maxSessionsPerProfile, 2);
    }

    void testOutOfRangeFallsBackToDefault()
    {
        const QString path = writeIni("bad.ini",
            "[transfer]\n"
            "maxConcurrent=0\n"
            "retryMultiplier=abc\n"
            "chunkSize=12\n"
            "partialFiles=shred\n"
            "[vault]\n"
            "kdfLogN=40\n");

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("maxConcurrent"));
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("retryMultiplier"));
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("chunkSize"));
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("partialFiles"));
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("kdfLogN"));
        const Settings settings = Settings::loadFile(path);

        QCOMPARE(settings.maxConcurrent, 2);
        QCOMPARE(settings.retryMultiplier, 2.0);
        QCOMPARE(settings.chunkSize, qint64(65536));
        QCOMPARE(settings.partialFiles, PartialFilePolicy::Keep);
        QCOMPARE(int(settings.kdf.logN), 15);
    }

    void testKdfCostIsRaisedToFloor()
    {
        const QString path = writeIni("floor.ini",
            "[vault]\n"
            "kdfFloorLogN=17\n");

        const Settings settings = Settings::loadFile(path);
        QCOMPARE(int(settings.kdfFloor.logN), 17);
        QCOMPARE(int(settings.kdf.logN), 17);
    }

    void testKdfCostAboveMemoryCeilingFallsBackToFloor()
    {
        const QString path = writeIni("ceiling.ini",
            "[vault]\n"
            "kdfLogN=20\n"
            "kdfR=64\n");

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("memory ceiling"));
        const Settings settings = Settings::loadFile(path);
        QVERIFY(settings.kdf == settings.kdfFloor);
        QVERIFY(CryptoEngine::withinCeiling(settings.kdf));
    }

    void testSaveAndReload()
    {
        Settings original;
        original.maxConcurrent = 6;
        original.partialFiles = PartialFilePolicy::Delete;
        original.knownHostsPath = "/tmp/kh";

        const QString path = tempDir.filePath("saved.ini");
        {
            QSettings store(path, QSettings::IniFormat);
            original.save(store);
        }

        const Settings loaded = Settings::loadFile(path);
        QCOMPARE(loaded.maxConcurrent, 6);
        QCOMPARE(loaded.partialFiles, PartialFilePolicy::Delete);
        QCOMPARE(loaded.knownHostsPath, QString("/tmp/kh"));
        QVERIFY(loaded.kdf == original.kdf);
    }

    void testDerivedOptions()
    {
        Settings settings;
        settings.minPasswordLength = 12;
        settings.connectTimeoutMs = 1234;
        settings.chunkSize = 4096;

        const VaultPolicy policy = settings.vaultPolicy();
        QCOMPARE(policy.minPasswordLength, 12);
        QVERIFY(policy.kdf == settings.kdf);

        const SessionOptions options = settings.sessionOptions();
        QCOMPARE(options.connectTimeoutMs, 1234);
        QCOMPARE(options.chunkSize, qint64(4096));
        QVERIFY(options.knownHosts == nullptr);
    }
};

QTEST_MAIN(TestSettings)
#include "test_settings.moc"
