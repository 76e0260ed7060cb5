/**
 * @file httptransferclient.h
 * @brief Resumable HTTP(S) downloads over QNetworkAccessManager.
 */

#ifndef HTTPTRANSFERCLIENT_H
#define HTTPTRANSFERCLIENT_H

#include <QHash>
#include <QNetworkAccessManager>
#include <QNetworkReply>

#include <optional>

#include "itransferclient.h"

class QFile;

/**
 * @brief Decoded form of the resume token handed out by HttpTransferClient.
 *
 * Serialized as a compact JSON object: {"offset", "etag", "lastModified"}.
 */
struct HttpResumeToken {
    qint64 offset = 0;
    QString etag;
    QString lastModified;

    [[nodiscard]] QByteArray encode() const;
    [[nodiscard]] static std::optional<HttpResumeToken> decode(const QByteArray &token);
};

/**
 * @brief ITransferClient streaming HTTP responses straight to disk.
 *
 * A transfer with a resume token continues with `Range: bytes=<offset>-`
 * and, when a validator is known, `If-Range`. A server that answers such a
 * request with 200 sent the whole entity again, so the local file is
 * truncated and the transfer restarts from zero. Partial files are left
 * in place on failure.
 *
 * @par Example usage:
 * @code
 * HttpTransferClient *client = new HttpTransferClient(this);
 * connect(client, &ITransferClient::transferProgress,
 *         this, [](const QString &id, qint64 written, qint64 total) {
 *     qDebug() << id << written << "/" << total;
 * });
 *
 * TransferRequest request;
 * request.taskId = "task_1";
 * request.url = "https://example.com/video.mp4";
 * request.destination = "/tmp/video.mp4";
 * client->start(request);
 * @endcode
 */
class HttpTransferClient : public ITransferClient
{
    Q_OBJECT

public:
    explicit HttpTransferClient(QObject *parent = nullptr);
    ~HttpTransferClient() override;

    void start(const TransferRequest &request) override;
    bool pause(const QString &taskId, QByteArray &resumeToken, QString &errorMessage) override;
    [[nodiscard]] bool isRunning(const QString &taskId) const override;

    [[nodiscard]] int runningCount() const { return transfers_.size(); }

private slots:
    void onReadyRead();
    void onFinished();

private:
    struct Transfer {
        TransferRequest request;
        QNetworkReply *reply = nullptr;
        QFile *file = nullptr;
        qint64 offset = 0;       ///< Bytes already on disk when the request was sent
        qint64 received = 0;     ///< Bytes written from this response
        qint64 total = 0;        ///< Expected final size, 0 if unknown
        bool ranged = false;
        bool headersChecked = false;
        QString etag;
        QString lastModified;
    };

    bool applyResponseHeaders(Transfer &transfer, QString &errorMessage);
    bool writeAvailable(Transfer &transfer, QString &errorMessage);
    void failTransfer(const QString &taskId, DownloadErrorCode code, const QString &message);
    void reportStartFailure(const QString &taskId, DownloadErrorCode code, const QString &message);
    void releaseTransfer(const QString &taskId, bool abortReply);

    [[nodiscard]] static DownloadErrorCode classifyError(QNetworkReply *reply);

    QNetworkAccessManager *networkManager_ = nullptr;
    QHash<QString, Transfer> transfers_;
    QHash<QNetworkReply *, QString> replyTasks_;
};

#endif // HTTPTRANSFERCLIENT_H
