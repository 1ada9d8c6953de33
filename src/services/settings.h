/**
 * @file settings.h
 * @brief Application configuration loaded from QSettings.
 *
 * Values are grouped as vault/, transfer/ and session/ keys. Out-of-range
 * values fall back to the default with a warning so a bad config file
 * never produces an unusable engine.
 */

#ifndef SETTINGS_H
#define SETTINGS_H

#include "cryptoengine.h"

#include <QString>

class QSettings;
struct SessionOptions;
struct VaultPolicy;

/// What happens to a partially transferred file when its task is cancelled.
enum class PartialFilePolicy { Keep, Delete };

/**
 * @brief Every tunable of the vault, transfer engine and sessions.
 */
struct Settings {
    /// @name Vault
    /// @{
    int minPasswordLength = 8;
    KdfParams kdf{15, 8, 1};
    KdfParams kdfFloor{14, 8, 1};
    QString vaultPath;  ///< Defaults to <AppDataLocation>/vault.ffv
    /// @}

    /// @name Transfer engine
    /// @{
    int maxConcurrent = 2;
    int maxSessionsPerProfile = 2;
    int maxRetries = 3;
    int retryBaseDelayMs = 1000;
    double retryMultiplier = 2.0;
    int retryMaxDelayMs = 30000;
    qint64 chunkSize = 64 * 1024;
    qint64 speedLimit = 0;  ///< Bytes per second per task, 0 = unlimited
    PartialFilePolicy partialFiles = PartialFilePolicy::Keep;
    /// @}

    /// @name Sessions
    /// @{
    int idleTimeoutMs = 60000;
    int connectTimeoutMs = 30000;
    QString knownHostsPath;  ///< Defaults to <AppDataLocation>/known_hosts
    /// @}

    /// Defaults, with data paths under the application data directory.
    Settings();

    /**
     * @brief Reads settings, clamping invalid values to their defaults.
     */
    [[nodiscard]] static Settings load(QSettings &store);

    /// Loads from an INI file.
    [[nodiscard]] static Settings loadFile(const QString &path);

    void save(QSettings &store) const;

    [[nodiscard]] VaultPolicy vaultPolicy() const;
    [[nodiscard]] SessionOptions sessionOptions() const;

    [[nodiscard]] static QString partialFilePolicyToString(PartialFilePolicy policy);
};

#endif // SETTINGS_H
