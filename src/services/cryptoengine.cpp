#include "cryptoengine.h"
#include "errors.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>

namespace {

struct EvpCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX *ctx) const
    {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

QString opensslError(const char *step)
{
    unsigned long code = ERR_get_error();
    char buffer[256] = {};
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return QStringLiteral("AES GCM: %1 failed: %2").arg(QLatin1String(step), QLatin1String(buffer));
}

const unsigned char *bytes(const QByteArray &data)
{
    return reinterpret_cast<const unsigned char *>(data.constData());
}

unsigned char *bytes(QByteArray &data)
{
    return reinterpret_cast<unsigned char *>(data.data());
}

EvpCipherCtxPtr initializeContext(const QByteArray &key, const QByteArray &nonce, bool encrypt)
{
    if (key.size() != CryptoEngine::KeyLength) {
        throw InternalError(QStringLiteral("AES GCM: invalid key size %1").arg(key.size()));
    }
    if (nonce.size() != CryptoEngine::NonceLength) {
        throw InternalError(QStringLiteral("AES GCM: invalid nonce size %1").arg(nonce.size()));
    }

    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw InternalError(QStringLiteral("AES GCM: failed to create cipher context"));
    }

    int result = encrypt
        ? EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr)
        : EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
    if (result != 1) {
        throw InternalError(opensslError("cipher init"));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, CryptoEngine::NonceLength, nullptr) != 1) {
        throw InternalError(opensslError("set nonce length"));
    }
    result = encrypt
        ? EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key), bytes(nonce))
        : EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key), bytes(nonce));
    if (result != 1) {
        throw InternalError(opensslError("set key and nonce"));
    }
    return ctx;
}

} // namespace

CryptoEngine::CryptoEngine(const KdfParams &floor)
    : floor_(floor)
{
}

void CryptoEngine::checkParams(const KdfParams &params) const
{
    if (params.logN < floor_.logN || params.r < floor_.r || params.p < floor_.p) {
        throw WeakParameterError(
            QStringLiteral("KDF cost (logN=%1, r=%2, p=%3) is below the required floor (logN=%4, r=%5, p=%6)")
                .arg(int(params.logN)).arg(params.r).arg(params.p)
                .arg(int(floor_.logN)).arg(floor_.r).arg(floor_.p));
    }
    if (!withinCeiling(params)) {
        throw WeakParameterError(
            QStringLiteral("KDF cost (logN=%1, r=%2, p=%3) is above the supported ceiling")
                .arg(int(params.logN)).arg(params.r).arg(params.p));
    }
}

bool CryptoEngine::withinCeiling(const KdfParams &params)
{
    if (params.logN < 1 || params.logN > MaxLogN || params.r < 1 || params.p < 1 || params.p > MaxP) {
        return false;
    }
    const quint64 n = quint64(1) << params.logN;
    // r is a full 32-bit value, so bound it before multiplying
    if (params.r > MaxMemoryBytes / 128) {
        return false;
    }
    return 128 * quint64(params.r) * n <= MaxMemoryBytes;
}

QByteArray CryptoEngine::deriveKey(const QByteArray &password,
                                   const QByteArray &salt,
                                   const KdfParams &params) const
{
    checkParams(params);
    if (salt.size() < SaltLength) {
        throw WeakParameterError(QStringLiteral("Salt must be at least %1 bytes").arg(SaltLength));
    }

    const quint64 n = quint64(1) << params.logN;
    // scrypt needs 128 * r * (N + p) bytes; leave headroom for the block buffer
    const quint64 maxMem = 128 * quint64(params.r) * (n + params.p + 2) + (1u << 20);

    QByteArray key(KeyLength, '\0');
    int result = EVP_PBE_scrypt(password.constData(), static_cast<size_t>(password.size()),
                                bytes(salt), static_cast<size_t>(salt.size()),
                                n, params.r, params.p, maxMem,
                                bytes(key), static_cast<size_t>(key.size()));
    if (result != 1) {
        secureWipe(key);
        unsigned long code = ERR_get_error();
        char buffer[256] = {};
        ERR_error_string_n(code, buffer, sizeof(buffer));
        throw InternalError(QStringLiteral("scrypt derivation failed: %1").arg(QLatin1String(buffer)));
    }
    return key;
}

SealedBox CryptoEngine::encrypt(const QByteArray &key,
                                const QByteArray &plaintext,
                                const QByteArray &associatedData) const
{
    SealedBox box;
    box.nonce = randomBytes(NonceLength);

    EvpCipherCtxPtr ctx = initializeContext(key, box.nonce, true);

    int outLen = 0;
    if (!associatedData.isEmpty()
        && EVP_EncryptUpdate(ctx.get(), nullptr, &outLen, bytes(associatedData),
                             associatedData.size()) != 1) {
        throw InternalError(opensslError("associated data"));
    }

    box.ciphertext.resize(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    int written = 0;
    if (!plaintext.isEmpty()) {
        if (EVP_EncryptUpdate(ctx.get(), bytes(box.ciphertext), &outLen, bytes(plaintext),
                              plaintext.size()) != 1) {
            throw InternalError(opensslError("encrypt update"));
        }
        written = outLen;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), bytes(box.ciphertext) + written, &outLen) != 1) {
        throw InternalError(opensslError("encrypt final"));
    }
    box.ciphertext.resize(written + outLen);

    box.tag.resize(TagLength);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TagLength, box.tag.data()) != 1) {
        throw InternalError(opensslError("get tag"));
    }
    return box;
}

QByteArray CryptoEngine::decrypt(const QByteArray &key,
                                 const SealedBox &box,
                                 const QByteArray &associatedData) const
{
    if (box.tag.size() != TagLength || box.nonce.size() != NonceLength) {
        throw AuthenticationError(QStringLiteral("Decryption failed"));
    }

    EvpCipherCtxPtr ctx = initializeContext(key, box.nonce, false);

    int outLen = 0;
    if (!associatedData.isEmpty()
        && EVP_DecryptUpdate(ctx.get(), nullptr, &outLen, bytes(associatedData),
                             associatedData.size()) != 1) {
        throw InternalError(opensslError("associated data"));
    }

    QByteArray plaintext(box.ciphertext.size() + EVP_MAX_BLOCK_LENGTH, '\0');
    int written = 0;
    if (!box.ciphertext.isEmpty()) {
        if (EVP_DecryptUpdate(ctx.get(), bytes(plaintext), &outLen, bytes(box.ciphertext),
                              box.ciphertext.size()) != 1) {
            secureWipe(plaintext);
            throw InternalError(opensslError("decrypt update"));
        }
        written = outLen;
    }

    QByteArray tag = box.tag;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TagLength, tag.data()) != 1) {
        secureWipe(plaintext);
        throw InternalError(opensslError("set tag"));
    }

    // Final fails when the tag does not verify
    if (EVP_DecryptFinal_ex(ctx.get(), bytes(plaintext) + written, &outLen) != 1) {
        ERR_clear_error();
        secureWipe(plaintext);
        throw AuthenticationError(QStringLiteral("Decryption failed"));
    }
    plaintext.resize(written + outLen);
    return plaintext;
}

QByteArray CryptoEngine::randomBytes(int count)
{
    QByteArray out(count, '\0');
    if (count > 0 && RAND_bytes(bytes(out), count) != 1) {
        throw InternalError(QStringLiteral("RAND_bytes failed"));
    }
    return out;
}

void CryptoEngine::secureWipe(QByteArray &buffer)
{
    if (!buffer.isEmpty()) {
        OPENSSL_cleanse(buffer.data(), static_cast<size_t>(buffer.size()));
    }
    buffer.clear();
}
