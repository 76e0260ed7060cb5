/**
 * @file downloadconfig.h
 * @brief Tunables for the download engine.
 */

#ifndef DOWNLOADCONFIG_H
#define DOWNLOADCONFIG_H

#include <QString>

class QSettings;

/**
 * @brief Engine configuration with built-in defaults.
 *
 * Values are read from QSettings under the "downloads/" group. Keys that
 * are absent keep their defaults, and out-of-range numbers are clamped.
 */
struct DownloadConfig {
    int maxConcurrentDownloads = 3;
    int timeoutMs = 30000;
    int maxRetryAttempts = 3;
    int progressThrottleMs = 100;
    bool autoRetryOnNetworkRestore = true;
    int retryDelayMs = 2000;
    int networkCheckIntervalMs = 5000;
    QString probeUrl = QStringLiteral("https://www.google.com/generate_204");
    QString downloadDirectory;  ///< Empty means defaultDownloadDirectory()

    /// @brief Reads every "downloads/*" key present in @p settings.
    [[nodiscard]] static DownloadConfig fromSettings(QSettings &settings);

    /// @brief Writes every field to "downloads/*" keys.
    void save(QSettings &settings) const;

    /// @brief Directory holding the task registry and file metadata.
    [[nodiscard]] static QString defaultDataDirectory();

    /// @brief Destination used when downloadDirectory is empty.
    [[nodiscard]] static QString defaultDownloadDirectory();

    /// @brief downloadDirectory, or the default when it is empty.
    [[nodiscard]] QString effectiveDownloadDirectory() const;
};

#endif // DOWNLOADCONFIG_H
