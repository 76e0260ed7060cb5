/**
 * @file httpnetworkprobe.h
 * @brief Reachability probe using interface state and an HTTP HEAD request.
 */

#ifndef HTTPNETWORKPROBE_H
#define HTTPNETWORKPROBE_H

#include <QNetworkAccessManager>
#include <QPointer>
#include <QUrl>

#include "inetworkprobe.h"

class QNetworkReply;

/**
 * @brief INetworkProbe that sends a HEAD request to a fixed URL.
 *
 * "connected" means at least one non-loopback interface is up and running.
 * "reachable" means the HEAD request got any HTTP response, whatever its
 * status code. Without a usable interface no request is sent.
 */
class HttpNetworkProbe : public INetworkProbe
{
    Q_OBJECT

public:
    explicit HttpNetworkProbe(const QUrl &probeUrl, int timeoutMs = 5000,
                              QObject *parent = nullptr);
    ~HttpNetworkProbe() override;

    void check() override;

    [[nodiscard]] QUrl probeUrl() const { return probeUrl_; }

    /// @brief True if a non-loopback interface is up and running.
    [[nodiscard]] static bool hasUsableInterface();

private slots:
    void onReplyFinished();

private:
    QNetworkAccessManager *networkManager_ = nullptr;
    QPointer<QNetworkReply> pendingReply_;
    QUrl probeUrl_;
    int timeoutMs_;
};

#endif // HTTPNETWORKPROBE_H
