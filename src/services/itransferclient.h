/**
 * @file itransferclient.h
 * @brief Interface for resumable transfer implementations.
 *
 * The download engine drives transfers only through this interface, so
 * tests can swap in a scripted client.
 */

#ifndef ITRANSFERCLIENT_H
#define ITRANSFERCLIENT_H

#include <QByteArray>
#include <QMap>
#include <QObject>
#include <QString>

#include "models/downloadtask.h"

/**
 * @brief Everything a client needs to start (or continue) one transfer.
 */
struct TransferRequest {
    QString taskId;
    QString url;
    QString destination;             ///< Absolute local file path
    QMap<QString, QString> headers;
    QByteArray resumeToken;          ///< Empty for a fresh start
    int timeoutMs = 30000;
};

/**
 * @brief Abstract interface for resumable transfer clients.
 *
 * A client runs any number of transfers at once, keyed by task id. It never
 * touches task records: it only reports progress and outcomes. Exactly one
 * of transferFinished() or transferFailed() is emitted per started transfer
 * unless the transfer is paused first, in which case neither is.
 *
 * @par Example usage:
 * @code
 * ITransferClient *client = new HttpTransferClient(this);
 * connect(client, &ITransferClient::transferFinished, this, &Foo::onDone);
 *
 * TransferRequest request;
 * request.taskId = "task_1";
 * request.url = "https://example.com/a.mp4";
 * request.destination = "/tmp/a.mp4";
 * client->start(request);
 *
 * QByteArray token;
 * QString error;
 * if (!client->pause("task_1", token, error)) {
 *     qWarning() << error;
 * }
 * @endcode
 */
class ITransferClient : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a transfer client interface.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ITransferClient(QObject *parent = nullptr) : QObject(parent) {}
    ~ITransferClient() override = default;

    /**
     * @brief Starts a transfer, continuing from the token when one is given.
     *
     * Failures to start are reported asynchronously via transferFailed().
     */
    virtual void start(const TransferRequest &request) = 0;

    /**
     * @brief Stops a running transfer and hands back a resume token.
     * @param taskId The transfer to stop.
     * @param[out] resumeToken Opaque data for a later start(); may be empty.
     * @param[out] errorMessage Reason on failure.
     * @return True if the transfer was stopped cleanly.
     *
     * After this call no further signals are emitted for @p taskId, whatever
     * the return value.
     */
    virtual bool pause(const QString &taskId, QByteArray &resumeToken, QString &errorMessage) = 0;

    /// @brief True while @p taskId has a running transfer.
    [[nodiscard]] virtual bool isRunning(const QString &taskId) const = 0;

signals:
    void transferProgress(const QString &taskId, qint64 bytesWritten, qint64 bytesTotal);
    void transferFinished(const QString &taskId);
    /**
     * @brief A transfer ended with an error.
     * @param resumeToken Where the bytes on disk end, when they are still usable; may be empty.
     */
    void transferFailed(const QString &taskId, DownloadErrorCode code, const QString &message,
                        const QByteArray &resumeToken);
};

#endif // ITRANSFERCLIENT_H
