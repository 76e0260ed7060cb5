#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QSettings>
#include <QSet>
#include <QTextStream>
#include <QTimer>
#include <QUrl>

#include <memory>
#include <utility>

#include "models/downloadconfig.h"
#include "services/downloadmanager.h"
#include "services/httpnetworkprobe.h"
#include "services/httptransferclient.h"
#include "services/jsontaskstore.h"
#include "services/networkmonitor.h"
#include "utils/downloadutils.h"
#include "utils/logging.h"
#include "version.h"

namespace {

constexpr int ExitInvalidArguments = 2;

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

QString describeProgress(const DownloadTask &task)
{
    QString line = QString("%1 %2%").arg(task.fileName).arg(task.progress, 3);
    if (task.bytesTotal > 0) {
        line += QString("  %1 / %2").arg(DownloadUtils::formatFileSize(task.bytesTransferred),
                                         DownloadUtils::formatFileSize(task.bytesTotal));
        const qint64 eta = DownloadUtils::calculateEta(task.bytesTransferred, task.bytesTotal,
                                                       task.startedAt);
        if (eta > 0) {
            line += "  ETA " + DownloadUtils::formatEta(eta);
        }
    } else {
        line += "  " + DownloadUtils::formatFileSize(task.bytesTransferred);
    }
    return line;
}

void printTaskTable(const QList<DownloadTask> &tasks)
{
    if (tasks.isEmpty()) {
        out() << "No downloads recorded" << Qt::endl;
        return;
    }
    for (const DownloadTask &task : tasks) {
        out() << task.id << "  "
              << taskStateToString(task.state).leftJustified(11) << " "
              << QString("%1%").arg(task.progress, 3) << "  "
              << DownloadUtils::formatFileSize(task.bytesTotal > 0 ? task.bytesTotal
                                                                   : task.bytesTransferred)
                     .rightJustified(10)
              << "  " << task.filePath;
        if (task.lastError) {
            out() << "  [" << errorCodeToString(task.lastError->code) << ": "
                  << task.lastError->message << "]";
        }
        out() << Qt::endl;
    }
}

bool parseHeaders(const QStringList &values, QMap<QString, QString> &headers)
{
    for (const QString &value : values) {
        const int colon = value.indexOf(':');
        if (colon <= 0) {
            err() << "Invalid header (expected \"Name: value\"): " << value << Qt::endl;
            return false;
        }
        headers.insert(value.left(colon).trimmed(), value.mid(colon + 1).trimmed());
    }
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("resumedl");
    app.setApplicationVersion(RESUMEDL_VERSION);
    app.setOrganizationName("resumedl");
    app.setOrganizationDomain("example.com");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Queued, resumable HTTP downloader");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("urls", "http or https URLs to download", "[url...]");

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    QCommandLineOption directoryOption(
        QStringList() << "d" << "directory",
        "Save downloads into <dir>", "dir");
    QCommandLineOption concurrencyOption(
        QStringList() << "c" << "max-concurrent",
        "Run at most <n> downloads at once", "n");
    QCommandLineOption priorityOption(
        QStringList() << "p" << "priority",
        "Queue priority for the given URLs (higher starts first)", "n", "0");
    QCommandLineOption outputNameOption(
        QStringList() << "o" << "output-name",
        "File name for a single URL", "name");
    QCommandLineOption headerOption(
        QStringList() << "H" << "header",
        "Extra request header \"Name: value\" (repeatable)", "header");
    QCommandLineOption listOption("list", "Print recorded downloads and exit");
    QCommandLineOption resumeOption("resume", "Resume all paused and failed downloads");
    QCommandLineOption cancelOption("cancel", "Cancel the download with <id> (repeatable)", "id");
    QCommandLineOption clearOption("clear-completed", "Forget completed downloads");
    QCommandLineOption probeOption("probe-url", "URL used to check connectivity", "url");

    parser.addOptions({verboseOption, directoryOption, concurrencyOption, priorityOption,
                       outputNameOption, headerOption, listOption, resumeOption, cancelOption,
                       clearOption, probeOption});

    parser.process(app);

    // Set verbose logging flag
    resumedl::verboseLogging = parser.isSet(verboseOption);

    if (resumedl::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    QSettings settings;
    DownloadConfig config = DownloadConfig::fromSettings(settings);

    if (parser.isSet(directoryOption)) {
        config.downloadDirectory = parser.value(directoryOption);
    }
    if (parser.isSet(concurrencyOption)) {
        bool ok = false;
        const int limit = parser.value(concurrencyOption).toInt(&ok);
        if (!ok || limit < 1) {
            err() << "--max-concurrent expects a positive number" << Qt::endl;
            return ExitInvalidArguments;
        }
        config.maxConcurrentDownloads = limit;
    }
    if (parser.isSet(probeOption)) {
        const QUrl probeUrl(parser.value(probeOption));
        if (!probeUrl.isValid() || probeUrl.scheme().isEmpty()) {
            err() << "--probe-url expects an absolute URL" << Qt::endl;
            return ExitInvalidArguments;
        }
        config.probeUrl = probeUrl.toString();
    }

    bool priorityOk = false;
    const int priority = parser.value(priorityOption).toInt(&priorityOk);
    if (!priorityOk) {
        err() << "--priority expects a number" << Qt::endl;
        return ExitInvalidArguments;
    }

    DownloadOptions options;
    options.priority = priority;
    if (!parseHeaders(parser.values(headerOption), options.headers)) {
        return ExitInvalidArguments;
    }

    const QStringList urls = parser.positionalArguments();
    if (parser.isSet(outputNameOption)) {
        if (urls.size() != 1) {
            err() << "--output-name needs exactly one URL" << Qt::endl;
            return ExitInvalidArguments;
        }
        options.fileName = parser.value(outputNameOption);
    }

    JsonTaskStore store(DownloadConfig::defaultDataDirectory(), config.effectiveDownloadDirectory());

    if (parser.isSet(listOption)) {
        if (!store.initialize()) {
            return 1;
        }
        printTaskTable(store.loadAllTasks());
        return 0;
    }

    HttpTransferClient client;
    HttpNetworkProbe probe(QUrl(config.probeUrl));
    NetworkMonitor monitor(&probe, config.networkCheckIntervalMs);
    DownloadManager manager(config, &client, &store, &monitor);

    QSet<QString> watched;
    bool requestFailed = false;
    bool waitingForNetwork = false;

    // Exit once nothing is queued, running or about to be retried
    auto checkDone = [&]() {
        if (waitingForNetwork || !manager.isIdle()) {
            return;
        }
        for (const QString &id : std::as_const(watched)) {
            const std::optional<DownloadTask> task = manager.task(id);
            if (task && task->state == TaskState::Failed && task->lastError &&
                isNetworkClassError(task->lastError->code) &&
                task->retryCount < config.maxRetryAttempts && monitor.isOnline()) {
                return;
            }
        }
        QTimer::singleShot(0, &app, [&]() {
            bool allCompleted = !requestFailed;
            for (const QString &id : std::as_const(watched)) {
                const std::optional<DownloadTask> task = manager.task(id);
                if (!task || task->state != TaskState::Completed) {
                    allCompleted = false;
                }
            }
            app.exit(allCompleted ? 0 : 1);
        });
    };

    QObject::connect(&manager, &DownloadManager::progressChanged,
                     [](const DownloadTask &task) {
        out() << describeProgress(task) << Qt::endl;
    });
    QObject::connect(&manager, &DownloadManager::statusChanged,
                     [&](const DownloadTask &task, TaskState oldState) {
        LOG_VERBOSE() << task.id << taskStateToString(oldState) << "->" << taskStateToString(task.state);
        if (task.state == TaskState::Paused) {
            out() << task.fileName << " paused" << Qt::endl;
        }
        checkDone();
    });
    QObject::connect(&manager, &DownloadManager::downloadCompleted,
                     [&](const DownloadTask &task) {
        out() << task.fileName << " done -> " << task.filePath << Qt::endl;
        checkDone();
    });
    QObject::connect(&manager, &DownloadManager::downloadFailed,
                     [&](const DownloadTask &task, const DownloadError &error) {
        err() << task.fileName << " failed: " << errorCodeToString(error.code)
              << " " << error.message << Qt::endl;
        checkDone();
    });
    QObject::connect(&manager, &DownloadManager::downloadCancelled,
                     [](const DownloadTask &task) {
        out() << task.id << " cancelled" << Qt::endl;
    });
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &manager, &DownloadManager::shutdown);

    if (!manager.initialize()) {
        err() << "Download storage is unavailable, continuing without persistence" << Qt::endl;
    }

    // Restored queue entries count as resumed in this run
    for (const DownloadTask &task : manager.tasks()) {
        if (task.state == TaskState::Pending || task.state == TaskState::Active) {
            watched.insert(task.id);
        }
    }

    if (parser.isSet(clearOption)) {
        out() << "Removed " << manager.removeCompleted() << " completed downloads" << Qt::endl;
    }

    for (const QString &id : parser.values(cancelOption)) {
        const RequestStatus status = manager.cancel(id);
        if (status != RequestStatus::Ok) {
            err() << "Cannot cancel " << id << ": " << requestStatusToString(status) << Qt::endl;
            requestFailed = true;
        }
        watched.remove(id);
    }

    for (const QString &url : urls) {
        const SubmitResult result = manager.submit(url, options);
        if (!result.ok()) {
            err() << "Cannot download " << url << ": " << requestStatusToString(result.status)
                  << Qt::endl;
            requestFailed = true;
            continue;
        }
        watched.insert(result.taskId);
    }

    if (parser.isSet(resumeOption)) {
        auto resumeAll = [&]() {
            waitingForNetwork = false;
            for (const DownloadTask &task : manager.tasks()) {
                if (task.state != TaskState::Paused && task.state != TaskState::Failed) {
                    continue;
                }
                const RequestStatus status = manager.resume(task.id);
                if (status != RequestStatus::Ok) {
                    err() << "Cannot resume " << task.id << ": "
                          << requestStatusToString(status) << Qt::endl;
                    requestFailed = true;
                    continue;
                }
                watched.insert(task.id);
            }
            checkDone();
        };

        // Resuming needs a confirmed network state
        if (monitor.state() == NetworkMonitor::NetworkState::Unknown) {
            waitingForNetwork = true;
            auto connection = std::make_shared<QMetaObject::Connection>();
            *connection = QObject::connect(&monitor, &NetworkMonitor::stateChanged,
                                           [connection, resumeAll](NetworkMonitor::NetworkState,
                                                                   NetworkMonitor::NetworkState newState) {
                if (newState == NetworkMonitor::NetworkState::Unknown) {
                    return;
                }
                QObject::disconnect(*connection);
                resumeAll();
            });
            // A probe that keeps failing never confirms a state; give up after the timeout
            QTimer::singleShot(config.timeoutMs, &app, [&, connection, resumeAll]() {
                if (waitingForNetwork) {
                    QObject::disconnect(*connection);
                    resumeAll();
                }
            });
        } else {
            resumeAll();
        }
    }

    checkDone();
    return app.exec();
}
