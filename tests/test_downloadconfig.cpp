#include <QtTest>
#include <QSettings>
#include <QTemporaryDir>

#include "models/downloadconfig.h"

class TestDownloadConfig : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir tempDir;

    QString settingsPath() const { return tempDir.path() + "/resumedl.ini"; }

private slots:
    void init()
    {
        QVERIFY(tempDir.isValid());
        QFile::remove(settingsPath());
    }

    void testDefaults()
    {
        const DownloadConfig config;
        QCOMPARE(config.maxConcurrentDownloads, 3);
        QCOMPARE(config.timeoutMs, 30000);
        QCOMPARE(config.maxRetryAttempts, 3);
        QCOMPARE(config.progressThrottleMs, 100);
        QVERIFY(config.autoRetryOnNetworkRestore);
        QVERIFY(config.downloadDirectory.isEmpty());
        QCOMPARE(config.effectiveDownloadDirectory(), DownloadConfig::defaultDownloadDirectory());
    }

    void testEmptySettingsGiveDefaults()
    {
        QSettings settings(settingsPath(), QSettings::IniFormat);
        const DownloadConfig config = DownloadConfig::fromSettings(settings);
        QCOMPARE(config.maxConcurrentDownloads, 3);
        QCOMPARE(config.retryDelayMs, 2000);
        QCOMPARE(config.networkCheckIntervalMs, 5000);
    }

    void testSaveAndReload()
    {
        DownloadConfig config;
        config.maxConcurrentDownloads = 5;
        config.timeoutMs = 10000;
        config.maxRetryAttempts = 1;
        config.progressThrottleMs = 250;
        config.autoRetryOnNetworkRestore = false;
        config.probeUrl = "http://127.0.0.1/ping";
        config.downloadDirectory = tempDir.path() + "/media";

        {
            QSettings settings(settingsPath(), QSettings::IniFormat);
            config.save(settings);
        }

        QSettings settings(settingsPath(), QSettings::IniFormat);
        const DownloadConfig loaded = DownloadConfig::fromSettings(settings);
        QCOMPARE(loaded.maxConcurrentDownloads, 5);
        QCOMPARE(loaded.timeoutMs, 10000);
        QCOMPARE(loaded.maxRetryAttempts, 1);
        QCOMPARE(loaded.progressThrottleMs, 250);
        QVERIFY(!loaded.autoRetryOnNetworkRestore);
        QCOMPARE(loaded.probeUrl, QString("http://127.0.0.1/ping"));
        QCOMPARE(loaded.effectiveDownloadDirectory(), tempDir.path() + "/media");
    }

    void testOutOfRangeValuesClamped()
    {
        {
            QSettings settings(settingsPath(), QSettings::IniFormat);
            settings.setValue("downloads/maxConcurrent", 0);
            settings.setValue("downloads/maxRetryAttempts", -4);
            settings.setValue("downloads/progressThrottleMs", -1);
            settings.setValue("downloads/networkCheckIntervalMs", 5);
        }

        QSettings settings(settingsPath(), QSettings::IniFormat);
        const DownloadConfig config = DownloadConfig::fromSettings(settings);
        QCOMPARE(config.maxConcurrentDownloads, 1);
        QCOMPARE(config.maxRetryAttempts, 0);
        QCOMPARE(config.progressThrottleMs, 0);
        QCOMPARE(config.networkCheckIntervalMs, 100);
    }
};

QTEST_MAIN(TestDownloadConfig)
#include "test_downloadconfig.moc"
