/**
 * @file cryptoengine.h
 * @brief Password-based key derivation and authenticated encryption.
 *
 * Keys are derived with scrypt and payloads are sealed with AES-256-GCM.
 * The engine performs no I/O and holds no key material between calls.
 */

#ifndef CRYPTOENGINE_H
#define CRYPTOENGINE_H

#include <QByteArray>
#include <QtGlobal>

/**
 * @brief scrypt cost parameters (N = 2^logN).
 */
struct KdfParams {
    quint8 logN = 15;
    quint32 r = 8;
    quint32 p = 1;

    [[nodiscard]] bool operator==(const KdfParams &other) const
    {
        return logN == other.logN && r == other.r && p == other.p;
    }
    [[nodiscard]] bool operator!=(const KdfParams &other) const { return !(*this == other); }
};

/**
 * @brief Output of one encryption: nonce, ciphertext and GCM tag.
 */
struct SealedBox {
    QByteArray nonce;
    QByteArray ciphertext;
    QByteArray tag;
};

/**
 * @brief scrypt + AES-256-GCM engine.
 *
 * The engine is configured with a cost floor. Any derivation requested
 * below that floor is refused, so a tampered vault header cannot
 * downgrade the work factor.
 *
 * @par Example usage:
 * @code
 * CryptoEngine crypto(KdfParams{14, 8, 1});
 * QByteArray salt = CryptoEngine::randomBytes(CryptoEngine::SaltLength);
 * QByteArray key = crypto.deriveKey(password, salt, KdfParams{});
 * SealedBox box = crypto.encrypt(key, plaintext, header);
 * QByteArray back = crypto.decrypt(key, box, header);
 * CryptoEngine::secureWipe(key);
 * @endcode
 */
class CryptoEngine
{
public:
    /// @name Sizes
    /// @{
    static constexpr int KeyLength = 32;    ///< AES-256 key
    static constexpr int SaltLength = 16;   ///< Minimum and generated salt size
    static constexpr int NonceLength = 12;  ///< 96-bit GCM nonce
    static constexpr int TagLength = 16;    ///< 128-bit GCM tag
    /// @}

    /// @name Ceiling on cost parameters
    /// @{
    static constexpr quint8 MaxLogN = 20;
    static constexpr quint32 MaxP = 16;
    static constexpr quint64 MaxMemoryBytes = quint64(1) << 30;  ///< Limit on 128 * r * N
    /// @}

    /**
     * @brief Constructs an engine that refuses costs below @p floor.
     */
    explicit CryptoEngine(const KdfParams &floor = KdfParams{14, 8, 1});

    [[nodiscard]] KdfParams floor() const { return floor_; }

    /**
     * @brief Throws WeakParameterError if @p params is below the floor or above the ceiling.
     */
    void checkParams(const KdfParams &params) const;

    /// True if deriving with @p params stays within the memory and cost ceiling.
    [[nodiscard]] static bool withinCeiling(const KdfParams &params);

    /**
     * @brief Derives a KeyLength-byte key from a password and salt.
     * @throws WeakParameterError if the cost or salt is too weak.
     * @throws InternalError if OpenSSL fails.
     */
    [[nodiscard]] QByteArray deriveKey(const QByteArray &password,
                                       const QByteArray &salt,
                                       const KdfParams &params) const;

    /**
     * @brief Encrypts @p plaintext under @p key with a fresh random nonce.
     * @param associatedData Bytes authenticated but not encrypted.
     */
    [[nodiscard]] SealedBox encrypt(const QByteArray &key,
                                    const QByteArray &plaintext,
                                    const QByteArray &associatedData) const;

    /**
     * @brief Verifies and decrypts a sealed box.
     * @throws AuthenticationError on any tag, key or associated-data mismatch.
     *         No plaintext is returned in that case.
     */
    [[nodiscard]] QByteArray decrypt(const QByteArray &key,
                                     const SealedBox &box,
                                     const QByteArray &associatedData) const;

    /// Cryptographically secure random bytes.
    [[nodiscard]] static QByteArray randomBytes(int count);

    /// Overwrites the buffer contents with zeros and clears it.
    static void secureWipe(QByteArray &buffer);

private:
    KdfParams floor_;
};

#endif // CRYPTOENGINE_H
