#include "httpnetworkprobe.h"
#include "utils/logging.h"

#include <QNetworkInterface>
#include <QNetworkReply>
#include <QNetworkRequest>

HttpNetworkProbe::HttpNetworkProbe(const QUrl &probeUrl, int timeoutMs, QObject *parent)
    : INetworkProbe(parent)
    , networkManager_(new QNetworkAccessManager(this))
    , probeUrl_(probeUrl)
    , timeoutMs_(timeoutMs)
{
}

HttpNetworkProbe::~HttpNetworkProbe()
{
    if (pendingReply_) {
        pendingReply_->disconnect(this);
        pendingReply_->abort();
    }
}

bool HttpNetworkProbe::hasUsableInterface()
{
    const QList<QNetworkInterface> interfaces = QNetworkInterface::allInterfaces();
    for (const QNetworkInterface &iface : interfaces) {
        const QNetworkInterface::InterfaceFlags flags = iface.flags();
        if (flags.testFlag(QNetworkInterface::IsLoopBack)) {
            continue;
        }
        if (flags.testFlag(QNetworkInterface::IsUp) && flags.testFlag(QNetworkInterface::IsRunning)) {
            return true;
        }
    }
    return false;
}

void HttpNetworkProbe::check()
{
    if (pendingReply_) {
        return;
    }

    if (!probeUrl_.isValid()) {
        emit probeFailed(tr("Invalid probe URL: %1").arg(probeUrl_.toString()));
        return;
    }

    if (!hasUsableInterface()) {
        LOG_VERBOSE() << "HttpNetworkProbe: No usable network interface";
        emit probeFinished(false, false);
        return;
    }

    QNetworkRequest request(probeUrl_);
    request.setTransferTimeout(timeoutMs_);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);

    pendingReply_ = networkManager_->head(request);
    connect(pendingReply_, &QNetworkReply::finished,
            this, &HttpNetworkProbe::onReplyFinished);
}

void HttpNetworkProbe::onReplyFinished()
{
    QNetworkReply *reply = qobject_cast<QNetworkReply *>(sender());
    if (!reply) {
        return;
    }
    reply->deleteLater();
    if (reply == pendingReply_) {
        pendingReply_.clear();
    }

    // Any HTTP status, even an error status, proves the target is reachable
    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    const bool reachable = status.isValid();

    if (!reachable) {
        LOG_VERBOSE() << "HttpNetworkProbe: Probe unreachable:" << reply->errorString();
    }
    emit probeFinished(true, reachable);
}
