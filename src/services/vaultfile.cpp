#include "vaultfile.h"
#include "errors.h"

#include <QDataStream>
#include <QIODevice>

#include <cstring>

namespace {

void writeBlob8(QDataStream &out, const QByteArray &blob)
{
    out << static_cast<quint8>(blob.size());
    out.writeRawData(blob.constData(), static_cast<int>(blob.size()));
}

QByteArray readRaw(QDataStream &in, quint32 length, const char *what)
{
    QByteArray blob(static_cast<int>(length), '\0');
    if (length > 0 && in.readRawData(blob.data(), static_cast<int>(length)) != static_cast<int>(length)) {
        throw CorruptVaultError(QStringLiteral("Vault file is truncated (%1)").arg(QLatin1String(what)));
    }
    return blob;
}

void checkStream(const QDataStream &in, const char *what)
{
    if (in.status() != QDataStream::Ok) {
        throw CorruptVaultError(QStringLiteral("Vault file is truncated (%1)").arg(QLatin1String(what)));
    }
}

} // namespace

QByteArray VaultFile::associatedData() const
{
    QByteArray data;
    QDataStream out(&data, QIODevice::WriteOnly);
    out.setByteOrder(QDataStream::BigEndian);
    out.writeRawData(Magic, sizeof(Magic));
    out << version << KdfScrypt << kdf.logN << kdf.r << kdf.p;
    writeBlob8(out, salt);
    return data;
}

QByteArray VaultFile::serialize() const
{
    QByteArray data = associatedData();
    QDataStream out(&data, QIODevice::WriteOnly | QIODevice::Append);
    out.setByteOrder(QDataStream::BigEndian);
    writeBlob8(out, box.nonce);
    out << static_cast<quint32>(box.ciphertext.size());
    out.writeRawData(box.ciphertext.constData(), static_cast<int>(box.ciphertext.size()));
    out.writeRawData(box.tag.constData(), static_cast<int>(box.tag.size()));
    return data;
}

VaultFile VaultFile::parse(const QByteArray &data)
{
    QDataStream in(data);
    in.setByteOrder(QDataStream::BigEndian);

    char magic[sizeof(Magic)] = {};
    if (in.readRawData(magic, sizeof(magic)) != static_cast<int>(sizeof(magic))
        || std::memcmp(magic, Magic, sizeof(Magic)) != 0) {
        throw CorruptVaultError(QStringLiteral("Not a vault file (bad magic)"));
    }

    VaultFile file;
    in >> file.version;
    checkStream(in, "version");
    if (file.version == 0) {
        throw CorruptVaultError(QStringLiteral("Invalid vault format version 0"));
    }
    if (file.version > CurrentVersion) {
        throw UnsupportedVersionError(file.version);
    }

    quint8 kdfId = 0;
    in >> kdfId >> file.kdf.logN >> file.kdf.r >> file.kdf.p;
    checkStream(in, "kdf parameters");
    if (kdfId != KdfScrypt) {
        throw CorruptVaultError(QStringLiteral("Unknown key derivation id %1").arg(int(kdfId)));
    }
    // Checked before any derivation so a damaged header cannot demand unbounded memory
    if (!CryptoEngine::withinCeiling(file.kdf)) {
        throw CorruptVaultError(QStringLiteral("Vault key derivation parameters are out of range"));
    }

    quint8 saltLength = 0;
    in >> saltLength;
    checkStream(in, "salt length");
    file.salt = readRaw(in, saltLength, "salt");

    quint8 nonceLength = 0;
    in >> nonceLength;
    checkStream(in, "nonce length");
    if (nonceLength != CryptoEngine::NonceLength) {
        throw CorruptVaultError(QStringLiteral("Unexpected nonce length %1").arg(int(nonceLength)));
    }
    file.box.nonce = readRaw(in, nonceLength, "nonce");

    quint32 ciphertextLength = 0;
    in >> ciphertextLength;
    checkStream(in, "ciphertext length");
    const qint64 remaining = data.size() - in.device()->pos();
    if (ciphertextLength > MaxCiphertextLength
        || static_cast<qint64>(ciphertextLength) + CryptoEngine::TagLength != remaining) {
        throw CorruptVaultError(QStringLiteral("Vault ciphertext length is inconsistent with file size"));
    }
    file.box.ciphertext = readRaw(in, ciphertextLength, "ciphertext");
    file.box.tag = readRaw(in, CryptoEngine::TagLength, "tag");
    return file;
}
