#include "downloadconfig.h"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

#include <algorithm>

DownloadConfig DownloadConfig::fromSettings(QSettings &settings)
{
    DownloadConfig config;

    settings.beginGroup("downloads");
    config.maxConcurrentDownloads = std::max(
        1, settings.value("maxConcurrent", config.maxConcurrentDownloads).toInt());
    config.timeoutMs = std::max(
        0, settings.value("timeoutMs", config.timeoutMs).toInt());
    config.maxRetryAttempts = std::max(
        0, settings.value("maxRetryAttempts", config.maxRetryAttempts).toInt());
    config.progressThrottleMs = std::max(
        0, settings.value("progressThrottleMs", config.progressThrottleMs).toInt());
    config.autoRetryOnNetworkRestore =
        settings.value("autoRetryOnNetworkRestore", config.autoRetryOnNetworkRestore).toBool();
    config.retryDelayMs = std::max(
        0, settings.value("retryDelayMs", config.retryDelayMs).toInt());
    config.networkCheckIntervalMs = std::max(
        100, settings.value("networkCheckIntervalMs", config.networkCheckIntervalMs).toInt());
    config.probeUrl = settings.value("probeUrl", config.probeUrl).toString();
    config.downloadDirectory = settings.value("directory", config.downloadDirectory).toString();
    settings.endGroup();

    return config;
}

void DownloadConfig::save(QSettings &settings) const
{
    settings.beginGroup("downloads");
    settings.setValue("maxConcurrent", maxConcurrentDownloads);
    settings.setValue("timeoutMs", timeoutMs);
    settings.setValue("maxRetryAttempts", maxRetryAttempts);
    settings.setValue("progressThrottleMs", progressThrottleMs);
    settings.setValue("autoRetryOnNetworkRestore", autoRetryOnNetworkRestore);
    settings.setValue("retryDelayMs", retryDelayMs);
    settings.setValue("networkCheckIntervalMs", networkCheckIntervalMs);
    settings.setValue("probeUrl", probeUrl);
    settings.setValue("directory", downloadDirectory);
    settings.endGroup();
}

QString DownloadConfig::defaultDataDirectory()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) {
        base = QDir::homePath() + "/.resumedl";
    }
    return base;
}

QString DownloadConfig::defaultDownloadDirectory()
{
    return defaultDataDirectory() + "/downloads";
}

QString DownloadConfig::effectiveDownloadDirectory() const
{
    return downloadDirectory.isEmpty() ? defaultDownloadDirectory() : downloadDirectory;
}
