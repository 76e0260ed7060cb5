/**
 * @file httptransferclient.cpp
 * @brief Implementation of the HttpTransferClient.
 */

#include "httptransferclient.h"
#include "utils/logging.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

QByteArray HttpResumeToken::encode() const
{
    QJsonObject json;
    json["offset"] = static_cast<double>(offset);
    json["etag"] = etag;
    json["lastModified"] = lastModified;
    return QJsonDocument(json).toJson(QJsonDocument::Compact);
}

std::optional<HttpResumeToken> HttpResumeToken::decode(const QByteArray &token)
{
    if (token.isEmpty()) {
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(token, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        return std::nullopt;
    }

    const QJsonObject json = document.object();
    HttpResumeToken result;
    result.offset = static_cast<qint64>(json.value("offset").toDouble(-1));
    result.etag = json.value("etag").toString();
    result.lastModified = json.value("lastModified").toString();
    if (result.offset < 0) {
        return std::nullopt;
    }
    return result;
}

HttpTransferClient::HttpTransferClient(QObject *parent)
    : ITransferClient(parent)
    , networkManager_(new QNetworkAccessManager(this))
{
}

HttpTransferClient::~HttpTransferClient()
{
    const QStringList ids = transfers_.keys();
    for (const QString &taskId : ids) {
        releaseTransfer(taskId, true);
    }
}

bool HttpTransferClient::isRunning(const QString &taskId) const
{
    return transfers_.contains(taskId);
}

void HttpTransferClient::start(const TransferRequest &request)
{
    if (transfers_.contains(request.taskId)) {
        qWarning() << "HttpTransferClient: Transfer already running for" << request.taskId;
        return;
    }

    const QUrl url(request.url);
    if (!url.isValid()) {
        reportStartFailure(request.taskId, DownloadErrorCode::InvalidUrl,
                           tr("Invalid URL: %1").arg(request.url));
        return;
    }

    QFileInfo destinationInfo(request.destination);
    if (!QDir().mkpath(destinationInfo.absolutePath())) {
        reportStartFailure(request.taskId, DownloadErrorCode::FileSystemError,
                           tr("Cannot create directory %1").arg(destinationInfo.absolutePath()));
        return;
    }

    Transfer transfer;
    transfer.request = request;

    // Continue only if the partial file still holds at least the recorded bytes
    std::optional<HttpResumeToken> token = HttpResumeToken::decode(request.resumeToken);
    if (token && token->offset > 0 && destinationInfo.exists() &&
        destinationInfo.size() >= token->offset) {
        transfer.ranged = true;
        transfer.offset = token->offset;
        transfer.etag = token->etag;
        transfer.lastModified = token->lastModified;
    }

    auto *file = new QFile(request.destination, this);
    const bool opened = transfer.ranged
        ? file->open(QIODevice::ReadWrite)
        : file->open(QIODevice::WriteOnly | QIODevice::Truncate);
    if (!opened || (transfer.ranged && (!file->resize(transfer.offset) || !file->seek(transfer.offset)))) {
        const QString error = file->errorString();
        delete file;
        reportStartFailure(request.taskId, DownloadErrorCode::FileSystemError,
                           tr("Cannot open %1: %2").arg(request.destination, error));
        return;
    }
    transfer.file = file;

    QNetworkRequest networkRequest(url);
    networkRequest.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                                QNetworkRequest::NoLessSafeRedirectPolicy);
    if (request.timeoutMs > 0) {
        networkRequest.setTransferTimeout(request.timeoutMs);
    }
    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it) {
        networkRequest.setRawHeader(it.key().toUtf8(), it.value().toUtf8());
    }

    if (transfer.ranged) {
        networkRequest.setRawHeader("Range", QString("bytes=%1-").arg(transfer.offset).toUtf8());
        const QString validator = !transfer.etag.isEmpty() ? transfer.etag : transfer.lastModified;
        if (!validator.isEmpty()) {
            networkRequest.setRawHeader("If-Range", validator.toUtf8());
        }
    }

    QNetworkReply *reply = networkManager_->get(networkRequest);
    transfer.reply = reply;
    replyTasks_.insert(reply, request.taskId);
    transfers_.insert(request.taskId, transfer);

    connect(reply, &QNetworkReply::readyRead, this, &HttpTransferClient::onReadyRead);
    connect(reply, &QNetworkReply::finished, this, &HttpTransferClient::onFinished);

    LOG_VERBOSE() << "HttpTransferClient: Started" << request.taskId << request.url
                  << (transfer.ranged ? QString("from byte %1").arg(transfer.offset) : QString());
}

bool HttpTransferClient::pause(const QString &taskId, QByteArray &resumeToken, QString &errorMessage)
{
    auto it = transfers_.find(taskId);
    if (it == transfers_.end()) {
        errorMessage = tr("No running transfer for %1").arg(taskId);
        return false;
    }

    Transfer &transfer = it.value();
    QString writeError;
    bool written = true;
    if (!transfer.headersChecked && transfer.reply->bytesAvailable() > 0) {
        written = applyResponseHeaders(transfer, writeError);
    }
    written = written && writeAvailable(transfer, writeError);
    const bool flushed = transfer.file->flush();

    HttpResumeToken token;
    token.offset = transfer.offset + transfer.received;
    token.etag = transfer.etag;
    token.lastModified = transfer.lastModified;

    releaseTransfer(taskId, true);

    if (!written || !flushed) {
        errorMessage = writeError.isEmpty() ? tr("Failed to flush %1").arg(taskId) : writeError;
        return false;
    }

    resumeToken = token.encode();
    LOG_VERBOSE() << "HttpTransferClient: Paused" << taskId << "at byte" << token.offset;
    return true;
}

bool HttpTransferClient::applyResponseHeaders(Transfer &transfer, QString &errorMessage)
{
    transfer.headersChecked = true;
    QNetworkReply *reply = transfer.reply;

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (transfer.ranged && status == 200) {
        // Server ignored the range (or the validator changed): start over
        qInfo() << "HttpTransferClient: Server restarted" << transfer.request.taskId << "from zero";
        transfer.ranged = false;
        transfer.offset = 0;
        if (!transfer.file->resize(0) || !transfer.file->seek(0)) {
            errorMessage = tr("Cannot truncate %1: %2")
                               .arg(transfer.request.destination, transfer.file->errorString());
            return false;
        }
    }

    const QByteArray etag = reply->rawHeader("ETag");
    if (!etag.isEmpty()) {
        transfer.etag = QString::fromLatin1(etag);
    }
    const QByteArray lastModified = reply->rawHeader("Last-Modified");
    if (!lastModified.isEmpty()) {
        transfer.lastModified = QString::fromLatin1(lastModified);
    }

    // An error body says nothing about the file size
    if (status >= 400) {
        transfer.total = 0;
        return true;
    }

    bool ok = false;
    const qint64 contentLength = reply->header(QNetworkRequest::ContentLengthHeader).toLongLong(&ok);
    transfer.total = (ok && contentLength > 0) ? transfer.offset + contentLength : 0;
    return true;
}

bool HttpTransferClient::writeAvailable(Transfer &transfer, QString &errorMessage)
{
    const QByteArray data = transfer.reply->readAll();
    if (data.isEmpty()) {
        return true;
    }

    // Error bodies are not part of the file
    const int status = transfer.reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 400) {
        return true;
    }

    if (transfer.file->write(data) != data.size()) {
        errorMessage = tr("Write to %1 failed: %2")
                           .arg(transfer.request.destination, transfer.file->errorString());
        return false;
    }
    transfer.received += data.size();
    return true;
}

void HttpTransferClient::onReadyRead()
{
    auto *reply = qobject_cast<QNetworkReply *>(sender());
    const QString taskId = replyTasks_.value(reply);
    auto it = transfers_.find(taskId);
    if (it == transfers_.end()) {
        return;
    }

    Transfer &transfer = it.value();
    QString error;
    if ((!transfer.headersChecked && !applyResponseHeaders(transfer, error)) ||
        !writeAvailable(transfer, error)) {
        failTransfer(taskId, DownloadErrorCode::FileSystemError, error);
        return;
    }

    if (transfer.reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt() >= 400) {
        return;
    }

    const qint64 written = transfer.offset + transfer.received;
    const qint64 total = transfer.total > 0 ? qMax(transfer.total, written) : 0;
    emit transferProgress(taskId, written, total);
}

void HttpTransferClient::onFinished()
{
    auto *reply = qobject_cast<QNetworkReply *>(sender());
    const QString taskId = replyTasks_.value(reply);
    auto it = transfers_.find(taskId);
    if (it == transfers_.end()) {
        return;
    }

    Transfer &transfer = it.value();
    QString error;
    if (!transfer.headersChecked && !applyResponseHeaders(transfer, error)) {
        failTransfer(taskId, DownloadErrorCode::FileSystemError, error);
        return;
    }

    if (reply->error() != QNetworkReply::NoError) {
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const QString message = status >= 400
            ? tr("HTTP %1: %2").arg(status).arg(reply->errorString())
            : reply->errorString();
        failTransfer(taskId, classifyError(reply), message);
        return;
    }

    if (!writeAvailable(transfer, error) || !transfer.file->flush()) {
        failTransfer(taskId, DownloadErrorCode::FileSystemError,
                     error.isEmpty() ? transfer.file->errorString() : error);
        return;
    }

    const qint64 written = transfer.offset + transfer.received;
    releaseTransfer(taskId, false);

    emit transferProgress(taskId, written, written);
    qInfo() << "HttpTransferClient: Finished" << taskId << "-" << written << "bytes";
    emit transferFinished(taskId);
}

DownloadErrorCode HttpTransferClient::classifyError(QNetworkReply *reply)
{
    switch (reply->error()) {
    case QNetworkReply::TimeoutError:
    case QNetworkReply::OperationCanceledError:  // transfer timeout aborts the reply
        return DownloadErrorCode::Timeout;

    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyConnectionClosedError:
    case QNetworkReply::ProxyNotFoundError:
    case QNetworkReply::ProxyTimeoutError:
    case QNetworkReply::SslHandshakeFailedError:
        return DownloadErrorCode::NetworkError;

    case QNetworkReply::ProtocolUnknownError:
        return DownloadErrorCode::InvalidUrl;

    default:
        break;
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 400) {
        return DownloadErrorCode::ServerError;
    }
    return DownloadErrorCode::Unknown;
}

void HttpTransferClient::failTransfer(const QString &taskId, DownloadErrorCode code,
                                      const QString &message)
{
    // Bytes already on disk stay usable after a dropped connection
    QByteArray resumeToken;
    auto it = transfers_.find(taskId);
    if (it != transfers_.end() && isNetworkClassError(code)) {
        Transfer &transfer = it.value();
        HttpResumeToken token;
        token.offset = transfer.offset + transfer.received;
        token.etag = transfer.etag;
        token.lastModified = transfer.lastModified;
        if (token.offset > 0 && transfer.file->flush()) {
            resumeToken = token.encode();
        }
    }

    releaseTransfer(taskId, true);
    qWarning() << "HttpTransferClient:" << taskId << "failed:" << message;
    emit transferFailed(taskId, code, message, resumeToken);
}

void HttpTransferClient::reportStartFailure(const QString &taskId, DownloadErrorCode code,
                                            const QString &message)
{
    qWarning() << "HttpTransferClient: Cannot start" << taskId << ":" << message;
    QTimer::singleShot(0, this, [this, taskId, code, message]() {
        emit transferFailed(taskId, code, message, QByteArray());
    });
}

void HttpTransferClient::releaseTransfer(const QString &taskId, bool abortReply)
{
    auto it = transfers_.find(taskId);
    if (it == transfers_.end()) {
        return;
    }

    Transfer transfer = it.value();
    transfers_.erase(it);
    replyTasks_.remove(transfer.reply);

    if (transfer.reply) {
        transfer.reply->disconnect(this);
        if (abortReply && transfer.reply->isRunning()) {
            transfer.reply->abort();
        }
        transfer.reply->deleteLater();
    }
    if (transfer.file) {
        transfer.file->close();
        delete transfer.file;
    }
}
