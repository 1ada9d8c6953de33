/**
 * @file vaultfile.h
 * @brief Binary container format of the encrypted vault.
 *
 * Layout (big-endian):
 * @code
 * "FFVT" | u8 version | u8 kdfId | u8 logN | u32 r | u32 p
 *        | u8 saltLen | salt | u8 nonceLen | nonce
 *        | u32 ciphertextLen | ciphertext | tag[16]
 * @endcode
 * Everything from the magic up to and including the salt is authenticated
 * as associated data. The nonce is bound through GCM itself.
 */

#ifndef VAULTFILE_H
#define VAULTFILE_H

#include "cryptoengine.h"

#include <QByteArray>

/**
 * @brief Parsed vault container.
 */
struct VaultFile {
    static constexpr char Magic[4] = {'F', 'F', 'V', 'T'};
    static constexpr quint8 CurrentVersion = 1;
    static constexpr quint8 KdfScrypt = 1;
    static constexpr quint32 MaxCiphertextLength = 64u * 1024u * 1024u;

    quint8 version = CurrentVersion;
    KdfParams kdf;
    QByteArray salt;
    SealedBox box;

    /// Header bytes bound to the ciphertext as associated data.
    [[nodiscard]] QByteArray associatedData() const;

    /// Full serialized file contents.
    [[nodiscard]] QByteArray serialize() const;

    /**
     * @brief Parses file contents.
     * @throws CorruptVaultError on bad magic, truncation or inconsistent lengths.
     * @throws UnsupportedVersionError if written by a newer format version.
     */
    [[nodiscard]] static VaultFile parse(const QByteArray &data);
};

#endif // VAULTFILE_H
