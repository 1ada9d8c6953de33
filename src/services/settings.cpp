#include "settings.h"
#include "iprotocolsession.h"
#include "vaultstore.h"

#include <QDebug>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace {

constexpr int MinKdfLogN = 10;
constexpr int MaxKdfLogN = CryptoEngine::MaxLogN;
constexpr int MaxKdfP = static_cast<int>(CryptoEngine::MaxP);

QString defaultDataPath(const QString &fileName)
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dir.isEmpty()) {
        dir = QDir::homePath() + "/.fftp";
    }
    return dir + '/' + fileName;
}

int readInt(QSettings &store, const QString &key, int fallback, int min, int max)
{
    if (!store.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const int value = store.value(key).toInt(&ok);
    if (!ok || value < min || value > max) {
        qWarning() << "Settings:" << key << "=" << store.value(key).toString()
                   << "is out of range [" << min << "," << max << "], using" << fallback;
        return fallback;
    }
    return value;
}

qint64 readInt64(QSettings &store, const QString &key, qint64 fallback, qint64 min, qint64 max)
{
    if (!store.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const qint64 value = store.value(key).toLongLong(&ok);
    if (!ok || value < min || value > max) {
        qWarning() << "Settings:" << key << "=" << store.value(key).toString()
                   << "is out of range, using" << fallback;
        return fallback;
    }
    return value;
}

double readDouble(QSettings &store, const QString &key, double fallback, double min, double max)
{
    if (!store.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const double value = store.value(key).toDouble(&ok);
    if (!ok || value < min || value > max) {
        qWarning() << "Settings:" << key << "=" << store.value(key).toString()
                   << "is out of range, using" << fallback;
        return fallback;
    }
    return value;
}

} // namespace

Settings::Settings()
    : vaultPath(defaultDataPath("vault.ffv"))
    , knownHostsPath(defaultDataPath("known_hosts"))
{
}

Settings Settings::load(QSettings &store)
{
    Settings s;

    s.minPasswordLength = readInt(store, "vault/minPasswordLength", s.minPasswordLength, 1, 1024);
    s.kdfFloor.logN = static_cast<quint8>(readInt(store, "vault/kdfFloorLogN", s.kdfFloor.logN, MinKdfLogN, MaxKdfLogN));
    s.kdfFloor.r = static_cast<quint32>(readInt(store, "vault/kdfFloorR", s.kdfFloor.r, 1, 1024));
    s.kdfFloor.p = static_cast<quint32>(readInt(store, "vault/kdfFloorP", s.kdfFloor.p, 1, MaxKdfP));
    if (!CryptoEngine::withinCeiling(s.kdfFloor)) {
        qWarning() << "Settings: vault KDF floor exceeds the memory ceiling, using" << int(Settings().kdfFloor.logN);
        s.kdfFloor = Settings().kdfFloor;
    }
    s.kdf.logN = static_cast<quint8>(readInt(store, "vault/kdfLogN", s.kdf.logN, s.kdfFloor.logN, MaxKdfLogN));
    s.kdf.r = static_cast<quint32>(readInt(store, "vault/kdfR", s.kdf.r, static_cast<int>(s.kdfFloor.r), 1024));
    s.kdf.p = static_cast<quint32>(readInt(store, "vault/kdfP", s.kdf.p, static_cast<int>(s.kdfFloor.p), MaxKdfP));
    // A default cost below a raised floor would make new vaults unusable
    if (s.kdf.logN < s.kdfFloor.logN) s.kdf.logN = s.kdfFloor.logN;
    if (s.kdf.r < s.kdfFloor.r) s.kdf.r = s.kdfFloor.r;
    if (s.kdf.p < s.kdfFloor.p) s.kdf.p = s.kdfFloor.p;
    if (!CryptoEngine::withinCeiling(s.kdf)) {
        qWarning() << "Settings: vault KDF cost exceeds the memory ceiling, using the floor";
        s.kdf = s.kdfFloor;
    }
    s.vaultPath = store.value("vault/path", s.vaultPath).toString();

    s.maxConcurrent = readInt(store, "transfer/maxConcurrent", s.maxConcurrent, 1, 64);
    s.maxSessionsPerProfile = readInt(store, "transfer/maxSessionsPerProfile", s.maxSessionsPerProfile, 1, 64);
    s.maxRetries = readInt(store, "transfer/maxRetries", s.maxRetries, 0, 100);
    s.retryBaseDelayMs = readInt(store, "transfer/retryBaseDelayMs", s.retryBaseDelayMs, 0, 3600000);
    s.retryMultiplier = readDouble(store, "transfer/retryMultiplier", s.retryMultiplier, 1.0, 10.0);
    s.retryMaxDelayMs = readInt(store, "transfer/retryMaxDelayMs", s.retryMaxDelayMs, s.retryBaseDelayMs, 3600000);
    if (s.retryMaxDelayMs < s.retryBaseDelayMs) {
        s.retryMaxDelayMs = s.retryBaseDelayMs;
    }
    s.chunkSize = readInt64(store, "transfer/chunkSize", s.chunkSize, 1024, 16 * 1024 * 1024);
    s.speedLimit = readInt64(store, "transfer/speedLimit", s.speedLimit, 0, Q_INT64_C(1) << 40);

    const QString partial = store.value("transfer/partialFiles", "keep").toString().toLower();
    if (partial == QLatin1String("delete")) {
        s.partialFiles = PartialFilePolicy::Delete;
    } else if (partial != QLatin1String("keep")) {
        qWarning() << "Settings: transfer/partialFiles =" << partial << "is not keep|delete, using keep";
    }

    s.idleTimeoutMs = readInt(store, "session/idleTimeoutMs", s.idleTimeoutMs, 0, 86400000);
    s.connectTimeoutMs = readInt(store, "session/connectTimeoutMs", s.connectTimeoutMs, 100, 600000);
    s.knownHostsPath = store.value("session/knownHostsPath", s.knownHostsPath).toString();

    return s;
}

Settings Settings::loadFile(const QString &path)
{
    QSettings store(path, QSettings::IniFormat);
    if (store.status() != QSettings::NoError) {
        qWarning() << "Settings: Cannot read" << path << ", using defaults";
    }
    return load(store);
}

void Settings::save(QSettings &store) const
{
    store.setValue("vault/minPasswordLength", minPasswordLength);
    store.setValue("vault/kdfLogN", int(kdf.logN));
    store.setValue("vault/kdfR", kdf.r);
    store.setValue("vault/kdfP", kdf.p);
    store.setValue("vault/kdfFloorLogN", int(kdfFloor.logN));
    store.setValue("vault/kdfFloorR", kdfFloor.r);
    store.setValue("vault/kdfFloorP", kdfFloor.p);
    store.setValue("vault/path", vaultPath);

    store.setValue("transfer/maxConcurrent", maxConcurrent);
    store.setValue("transfer/maxSessionsPerProfile", maxSessionsPerProfile);
    store.setValue("transfer/maxRetries", maxRetries);
    store.setValue("transfer/retryBaseDelayMs", retryBaseDelayMs);
    store.setValue("transfer/retryMultiplier", retryMultiplier);
    store.setValue("transfer/retryMaxDelayMs", retryMaxDelayMs);
    store.setValue("transfer/chunkSize", chunkSize);
    store.setValue("transfer/speedLimit", speedLimit);
    store.setValue("transfer/partialFiles", partialFilePolicyToString(partialFiles));

    store.setValue("session/idleTimeoutMs", idleTimeoutMs);
    store.setValue("session/connectTimeoutMs", connectTimeoutMs);
    store.setValue("session/knownHostsPath", knownHostsPath);
}

VaultPolicy Settings::vaultPolicy() const
{
    VaultPolicy policy;
    policy.minPasswordLength = minPasswordLength;
    policy.kdf = kdf;
    policy.kdfFloor = kdfFloor;
    return policy;
}

SessionOptions Settings::sessionOptions() const
{
    SessionOptions options;
    options.connectTimeoutMs = connectTimeoutMs;
    options.chunkSize = chunkSize;
    return options;
}

QString Settings::partialFilePolicyToString(PartialFilePolicy policy)
{
    return policy == PartialFilePolicy::Delete ? QStringLiteral("delete") : QStringLiteral("keep");
}
