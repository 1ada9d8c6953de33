#include "vaultstore.h"
#include "errors.h"
#include "vaultfile.h"
#include "utils/logging.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QSaveFile>
#include <QUuid>

namespace {

QByteArray serializeProfiles(const QList<ConnectionProfile> &profiles)
{
    QJsonArray array;
    for (const ConnectionProfile &profile : profiles) {
        array.append(profile.toJson());
    }
    return QJsonDocument(array).toJson(QJsonDocument::Compact);
}

QList<ConnectionProfile> parseProfiles(const QByteArray &payload)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        throw CorruptVaultError(QStringLiteral("Vault payload is not a profile list"));
    }

    QList<ConnectionProfile> profiles;
    const QJsonArray array = doc.array();
    for (const QJsonValue &value : array) {
        std::optional<ConnectionProfile> profile = ConnectionProfile::fromJson(value.toObject());
        if (!value.isObject() || !profile) {
            throw CorruptVaultError(QStringLiteral("Vault payload contains a malformed profile"));
        }
        profiles.append(*profile);
    }
    return profiles;
}

QByteArray readVaultFile(const QString &path)
{
    QFile file(path);
    if (!file.exists()) {
        throw LocalIOError(QStringLiteral("Vault file not found: %1").arg(path));
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw LocalIOError(QStringLiteral("Cannot open vault file %1: %2").arg(path, file.errorString()));
    }
    return file.readAll();
}

} // namespace

// VaultHandle

VaultHandle::VaultHandle() = default;

VaultHandle::~VaultHandle()
{
    wipe();
}

VaultHandle::VaultHandle(VaultHandle &&other) noexcept = default;

VaultHandle &VaultHandle::operator=(VaultHandle &&other) noexcept
{
    if (this != &other) {
        wipe();
        state_ = std::move(other.state_);
    }
    return *this;
}

QString VaultHandle::path() const
{
    return state_ ? state_->path : QString();
}

KdfParams VaultHandle::kdfParams() const
{
    return state_ ? state_->kdf : KdfParams();
}

void VaultHandle::wipe()
{
    if (!state_) {
        return;
    }
    {
        QMutexLocker locker(&state_->mutex);
        CryptoEngine::secureWipe(state_->key);
        for (ConnectionProfile &profile : state_->profiles) {
            profile.wipeSecret();
        }
        state_->profiles.clear();
    }
    state_.reset();
}

// VaultStore

VaultStore::VaultStore(const VaultPolicy &policy)
    : policy_(policy)
    , crypto_(policy.kdfFloor)
{
}

VaultHandle VaultStore::create(const QString &path, const QString &masterPassword) const
{
    checkPasswordPolicy(masterPassword);
    if (QFileInfo::exists(path)) {
        throw LocalIOError(QStringLiteral("Refusing to overwrite existing vault %1").arg(path));
    }

    QByteArray password = masterPassword.toUtf8();
    const QByteArray salt = CryptoEngine::randomBytes(CryptoEngine::SaltLength);
    QByteArray key = crypto_.deriveKey(password, salt, policy_.kdf);
    CryptoEngine::secureWipe(password);

    writeVault(path, key, salt, policy_.kdf, {});

    VaultHandle handle;
    handle.state_ = std::make_unique<VaultHandle::State>();
    handle.state_->path = path;
    handle.state_->key = key;
    handle.state_->salt = salt;
    handle.state_->kdf = policy_.kdf;
    CryptoEngine::secureWipe(key);

    qInfo() << "Vault: created" << path;
    return handle;
}

VaultHandle VaultStore::unlock(const QString &path, const QString &masterPassword) const
{
    const VaultFile file = VaultFile::parse(readVaultFile(path));
    crypto_.checkParams(file.kdf);

    QByteArray password = masterPassword.toUtf8();
    QByteArray key = crypto_.deriveKey(password, file.salt, file.kdf);
    CryptoEngine::secureWipe(password);

    QByteArray payload;
    try {
        payload = crypto_.decrypt(key, file.box, file.associatedData());
    } catch (const AuthenticationError &) {
        CryptoEngine::secureWipe(key);
        qWarning() << "Vault: unlock failed for" << path;
        throw WrongPasswordError();
    }

    QList<ConnectionProfile> profiles;
    try {
        profiles = parseProfiles(payload);
    } catch (const CorruptVaultError &) {
        CryptoEngine::secureWipe(payload);
        CryptoEngine::secureWipe(key);
        throw;
    }
    CryptoEngine::secureWipe(payload);

    VaultHandle handle;
    handle.state_ = std::make_unique<VaultHandle::State>();
    handle.state_->path = path;
    handle.state_->key = key;
    handle.state_->salt = file.salt;
    handle.state_->kdf = file.kdf;
    handle.state_->profiles = profiles;
    CryptoEngine::secureWipe(key);

    qInfo() << "Vault: unlocked" << path << "with" << profiles.size() << "profiles";
    return handle;
}

void VaultStore::lock(VaultHandle &handle) const
{
    if (handle.isOpen()) {
        LOG_VERBOSE() << "Vault: locking" << handle.path();
    }
    handle.wipe();
}

QList<ConnectionProfile> VaultStore::listProfiles(const VaultHandle &handle) const
{
    VaultHandle::State &state = openState(handle);
    QMutexLocker locker(&state.mutex);
    return state.profiles;
}

std::optional<ConnectionProfile> VaultStore::findProfile(const VaultHandle &handle,
                                                         const QString &id) const
{
    VaultHandle::State &state = openState(handle);
    QMutexLocker locker(&state.mutex);
    int index = indexOf(state.profiles, id);
    if (index < 0) {
        return std::nullopt;
    }
    return state.profiles.at(index);
}

QString VaultStore::addProfile(VaultHandle &handle, ConnectionProfile profile) const
{
    VaultHandle::State &state = openState(handle);
    QMutexLocker locker(&state.mutex);

    if (profile.id.isEmpty() || indexOf(state.profiles, profile.id) >= 0) {
        profile.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    if (!profile.created.isValid()) {
        profile.created = QDateTime::currentDateTimeUtc();
    }

    QList<ConnectionProfile> updated = state.profiles;
    updated.append(profile);
    writeVault(state.path, state.key, state.salt, state.kdf, updated);
    state.profiles = updated;

    LOG_VERBOSE() << "Vault: added profile" << profile.id << profile.name;
    return profile.id;
}

void VaultStore::updateProfile(VaultHandle &handle, const ConnectionProfile &profile) const
{
    VaultHandle::State &state = openState(handle);
    QMutexLocker locker(&state.mutex);

    int index = indexOf(state.profiles, profile.id);
    if (index < 0) {
        throw ProfileNotFoundError(profile.id);
    }

    QList<ConnectionProfile> updated = state.profiles;
    updated[index] = profile;
    writeVault(state.path, state.key, state.salt, state.kdf, updated);
    state.profiles = updated;

    LOG_VERBOSE() << "Vault: updated profile" << profile.id;
}

void VaultStore::removeProfile(VaultHandle &handle, const QString &id) const
{
    VaultHandle::State &state = openState(handle);
    QMutexLocker locker(&state.mutex);

    int index = indexOf(state.profiles, id);
    if (index < 0) {
        throw ProfileNotFoundError(id);
    }

    QList<ConnectionProfile> updated = state.profiles;
    updated.removeAt(index);
    writeVault(state.path, state.key, state.salt, state.kdf, updated);
    state.profiles[index].wipeSecret();
    state.profiles = updated;

    LOG_VERBOSE() << "Vault: removed profile" << id;
}

void VaultStore::touchProfile(VaultHandle &handle, const QString &id) const
{
    VaultHandle::State &state = openState(handle);
    QMutexLocker locker(&state.mutex);

    int index = indexOf(state.profiles, id);
    if (index < 0) {
        throw ProfileNotFoundError(id);
    }

    QList<ConnectionProfile> updated = state.profiles;
    updated[index].lastUsed = QDateTime::currentDateTimeUtc();
    writeVault(state.path, state.key, state.salt, state.kdf, updated);
    state.profiles = updated;
}

void VaultStore::changeMasterPassword(VaultHandle &handle, const QString &newPassword) const
{
    checkPasswordPolicy(newPassword);

    VaultHandle::State &state = openState(handle);
    QMutexLocker locker(&state.mutex);

    QByteArray password = newPassword.toUtf8();
    const QByteArray salt = CryptoEngine::randomBytes(CryptoEngine::SaltLength);
    QByteArray key = crypto_.deriveKey(password, salt, policy_.kdf);
    CryptoEngine::secureWipe(password);

    try {
        writeVault(state.path, key, salt, policy_.kdf, state.profiles);
    } catch (const FftpError &) {
        CryptoEngine::secureWipe(key);
        throw;
    }

    CryptoEngine::secureWipe(state.key);
    state.key = key;
    state.salt = salt;
    state.kdf = policy_.kdf;
    CryptoEngine::secureWipe(key);

    qInfo() << "Vault: master password changed for" << state.path;
}

void VaultStore::save(VaultHandle &handle) const
{
    VaultHandle::State &state = openState(handle);
    QMutexLocker locker(&state.mutex);
    writeVault(state.path, state.key, state.salt, state.kdf, state.profiles);
}

void VaultStore::checkPasswordPolicy(const QString &password) const
{
    if (password.size() < policy_.minPasswordLength) {
        throw WeakParameterError(QStringLiteral("Master password must be at least %1 characters")
                                     .arg(policy_.minPasswordLength));
    }
}

VaultHandle::State &VaultStore::openState(const VaultHandle &handle) const
{
    if (!handle.state_) {
        throw InternalError(QStringLiteral("Vault is locked"));
    }
    return *handle.state_;
}

void VaultStore::writeVault(const QString &path,
                            const QByteArray &key,
                            const QByteArray &salt,
                            const KdfParams &kdf,
                            const QList<ConnectionProfile> &profiles) const
{
    VaultFile file;
    file.kdf = kdf;
    file.salt = salt;

    QByteArray payload = serializeProfiles(profiles);
    file.box = crypto_.encrypt(key, payload, file.associatedData());
    CryptoEngine::secureWipe(payload);

    QSaveFile out(path);
    if (!out.open(QIODevice::WriteOnly)) {
        throw LocalIOError(QStringLiteral("Cannot write vault %1: %2").arg(path, out.errorString()));
    }
    out.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);

    const QByteArray data = file.serialize();
    if (out.write(data) != data.size()) {
        out.cancelWriting();
        throw LocalIOError(QStringLiteral("Cannot write vault %1: %2").arg(path, out.errorString()));
    }
    if (!out.commit()) {
        throw LocalIOError(QStringLiteral("Cannot replace vault %1: %2").arg(path, out.errorString()));
    }
    LOG_VERBOSE() << "Vault: wrote" << data.size() << "bytes to" << path;
}

int VaultStore::indexOf(const QList<ConnectionProfile> &profiles, const QString &id)
{
    for (int i = 0; i < profiles.size(); ++i) {
        if (profiles.at(i).id == id) {
            return i;
        }
    }
    return -1;
}
