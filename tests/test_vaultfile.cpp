#include <QtTest>

#include "services/errors.h"
#include "services/vaultfile.h"

class TestVaultFile : public QObject
{
    Q_OBJECT

private:
    static VaultFile sample()
    {
        VaultFile file;
        file.kdf = KdfParams{15, 8, 1};
        file.salt = QByteArray(CryptoEngine::SaltLength, '\x11');
        file.box.nonce = QByteArray(CryptoEngine::NonceLength, '\x22');
        file.box.ciphertext = QByteArray("ciphertext bytes");
        file.box.tag = QByteArray(CryptoEngine::TagLength, '\x33');
        return file;
    }

private slots:
    void testLayout()
    {
        const QByteArray data = sample().serialize();

        // magic(4) version(1) kdf(1) logN(1) r(4) p(4) saltLen(1) salt(16)
        // nonceLen(1) nonce(12) ctLen(4) ct(16) tag(16)
        QCOMPARE(data.size(), 4 + 1 + 1 + 1 + 4 + 4 + 1 + 16 + 1 + 12 + 4 + 16 + 16);
        QCOMPARE(data.left(4), QByteArray("FFVT"));
        QCOMPARE(static_cast<quint8>(data.at(4)), quint8(1));
        QCOMPARE(static_cast<quint8>(data.at(5)), VaultFile::KdfScrypt);
        QCOMPARE(static_cast<quint8>(data.at(6)), quint8(15));
        // r is big-endian
        QCOMPARE(data.mid(7, 4), QByteArray("\x00\x00\x00\x08", 4));
        QCOMPARE(data.mid(11, 4), QByteArray("\x00\x00\x00\x01", 4));
        QCOMPARE(static_cast<quint8>(data.at(15)), quint8(16));
        QCOMPARE(data.right(16), QByteArray(16, '\x33'));
    }

    void testAssociatedDataIsHeaderPrefix()
    {
        const VaultFile file = sample();
        const QByteArray aad = file.associatedData();
        QVERIFY(file.serialize().startsWith(aad));
        QCOMPARE(aad.size(), 4 + 1 + 1 + 1 + 4 + 4 + 1 + 16);
    }

    void testParseRestoresFields()
    {
        const VaultFile original = sample();
        const VaultFile parsed = VaultFile::parse(original.serialize());

        QCOMPARE(parsed.version, VaultFile::CurrentVersion);
        QVERIFY(parsed.kdf == original.kdf);
        QCOMPARE(parsed.salt, original.salt);
        QCOMPARE(parsed.box.nonce, original.box.nonce);
        QCOMPARE(parsed.box.ciphertext, original.box.ciphertext);
        QCOMPARE(parsed.box.tag, original.box.tag);
    }

    void testBadMagicIsCorrupt()
    {
        QByteArray data = sample().serialize();
        data[0] = 'X';
        QVERIFY_THROWS_EXCEPTION(CorruptVaultError, VaultFile::parse(data));
        QVERIFY_THROWS_EXCEPTION(CorruptVaultError, VaultFile::parse(QByteArray()));
    }

    void testVersionZeroIsCorrupt()
    {
        QByteArray data = sample().serialize();
        data[4] = 0;
        QVERIFY_THROWS_EXCEPTION(CorruptVaultError, VaultFile::parse(data));
    }

    void testNewerVersionIsUnsupported()
    {
        QByteArray data = sample().serialize();
        data[4] = 2;
        QVERIFY_THROWS_EXCEPTION(UnsupportedVersionError, VaultFile::parse(data));
    }

    void testUnknownKdfIsCorrupt()
    {
        QByteArray data = sample().serialize();
        data[5] = 7;
        QVERIFY_THROWS_EXCEPTION(CorruptVaultError, VaultFile::parse(data));
    }

    void testTruncationIsCorrupt()
    {
        const QByteArray data = sample().serialize();
        for (int length : {5, 10, 20, 40, data.size() - 1}) {
            QVERIFY_THROWS_EXCEPTION(CorruptVaultError, VaultFile::parse(data.left(length)));
        }
    }

    void testTrailingBytesAreCorrupt()
    {
        QByteArray data = sample().serialize();
        data.append('\0');
        QVERIFY_THROWS_EXCEPTION(CorruptVaultError, VaultFile::parse(data));
    }
};

QTEST_MAIN(TestVaultFile)
#include "test_vaultfile.moc"
