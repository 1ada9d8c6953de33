/**
 * @file vaultstore.h
 * @brief Encrypted on-disk store of connection profiles.
 *
 * The vault holds every saved ConnectionProfile in a single file sealed
 * under a key derived from the master password. Each mutation re-encrypts
 * the whole collection with a fresh nonce and atomically replaces the file.
 */

#ifndef VAULTSTORE_H
#define VAULTSTORE_H

#include "connectionprofile.h"
#include "cryptoengine.h"

#include <QList>
#include <QMutex>
#include <QString>

#include <memory>
#include <optional>

/**
 * @brief Password and key-derivation policy applied by VaultStore.
 */
struct VaultPolicy {
    int minPasswordLength = 8;     ///< Shorter master passwords are refused
    KdfParams kdf;                 ///< Cost used for new vaults and password changes
    KdfParams kdfFloor{14, 8, 1};  ///< Stored costs below this are refused
};

/**
 * @brief Move-only handle to an unlocked vault.
 *
 * The handle owns the derived key and the decrypted profiles. Locking or
 * destroying it wipes both. A default-constructed or moved-from handle is
 * closed.
 */
class VaultHandle
{
public:
    VaultHandle();
    ~VaultHandle();

    VaultHandle(VaultHandle &&other) noexcept;
    VaultHandle &operator=(VaultHandle &&other) noexcept;
    VaultHandle(const VaultHandle &) = delete;
    VaultHandle &operator=(const VaultHandle &) = delete;

    [[nodiscard]] bool isOpen() const { return state_ != nullptr; }
    [[nodiscard]] QString path() const;
    [[nodiscard]] KdfParams kdfParams() const;

private:
    friend class VaultStore;

    struct State {
        QString path;
        QByteArray key;
        QByteArray salt;
        KdfParams kdf;
        QList<ConnectionProfile> profiles;
        QMutex mutex;
    };

    void wipe();

    std::unique_ptr<State> state_;
};

/**
 * @brief Creates, unlocks and mutates vault files.
 *
 * VaultStore itself is stateless apart from its policy; all per-vault
 * state lives in the VaultHandle it returns. Operations on one handle are
 * serialized by the handle's mutex.
 *
 * @par Example usage:
 * @code
 * VaultStore store;
 * VaultHandle vault = store.create(path, "Tr0ub4dor&3");
 * ConnectionProfile nas = ConnectionProfile::create("home-nas", Protocol::Sftp,
 *                                                   "nas.local", "alice");
 * store.addProfile(vault, nas);
 * store.lock(vault);
 *
 * vault = store.unlock(path, "Tr0ub4dor&3");
 * for (const ConnectionProfile &p : store.listProfiles(vault)) { ... }
 * @endcode
 */
class VaultStore
{
public:
    explicit VaultStore(const VaultPolicy &policy = VaultPolicy());

    [[nodiscard]] const VaultPolicy &policy() const { return policy_; }

    /**
     * @brief Creates a new empty vault at @p path.
     * @throws WeakParameterError if the password violates the policy.
     * @throws LocalIOError if the file exists or cannot be written.
     */
    [[nodiscard]] VaultHandle create(const QString &path, const QString &masterPassword) const;

    /**
     * @brief Opens an existing vault. The file is never modified.
     * @throws WrongPasswordError, CorruptVaultError, UnsupportedVersionError,
     *         WeakParameterError, LocalIOError
     */
    [[nodiscard]] VaultHandle unlock(const QString &path, const QString &masterPassword) const;

    /// Wipes key material and decrypted profiles; the handle becomes closed.
    void lock(VaultHandle &handle) const;

    /// Profiles in insertion order.
    [[nodiscard]] QList<ConnectionProfile> listProfiles(const VaultHandle &handle) const;

    [[nodiscard]] std::optional<ConnectionProfile> findProfile(const VaultHandle &handle,
                                                               const QString &id) const;

    /**
     * @brief Appends a profile and persists the vault.
     *
     * A fresh id is assigned if the profile has none or its id is already
     * in use; a missing creation time is set to now.
     * @return The id the profile was stored under.
     */
    QString addProfile(VaultHandle &handle, ConnectionProfile profile) const;

    /// Replaces the profile with the same id. @throws ProfileNotFoundError
    void updateProfile(VaultHandle &handle, const ConnectionProfile &profile) const;

    /// @throws ProfileNotFoundError
    void removeProfile(VaultHandle &handle, const QString &id) const;

    /// Sets the last-used time to now. @throws ProfileNotFoundError
    void touchProfile(VaultHandle &handle, const QString &id) const;

    /**
     * @brief Re-encrypts the vault under a new master password.
     *
     * A fresh salt and the current policy cost are used. The handle switches
     * to the new key only once the new file has been written.
     */
    void changeMasterPassword(VaultHandle &handle, const QString &newPassword) const;

    /// Re-encrypts and rewrites the current contents.
    void save(VaultHandle &handle) const;

private:
    void checkPasswordPolicy(const QString &password) const;
    [[nodiscard]] VaultHandle::State &openState(const VaultHandle &handle) const;
    void writeVault(const QString &path,
                    const QByteArray &key,
                    const QByteArray &salt,
                    const KdfParams &kdf,
                    const QList<ConnectionProfile> &profiles) const;
    [[nodiscard]] static int indexOf(const QList<ConnectionProfile> &profiles, const QString &id);

    VaultPolicy policy_;
    CryptoEngine crypto_;
};

#endif // VAULTSTORE_H
