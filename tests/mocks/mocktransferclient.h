/**
 * @file mocktransferclient.h
 * @brief Scripted transfer client for engine tests.
 */

#ifndef MOCKTRANSFERCLIENT_H
#define MOCKTRANSFERCLIENT_H

#include <QList>
#include <QMap>
#include <QStringList>

#include "services/itransferclient.h"

/**
 * @brief Mock transfer client implementing ITransferClient for testing.
 *
 * Nothing happens on its own: tests drive each running transfer with the
 * mockEmit* methods and inspect the recorded start() and pause() calls.
 *
 * @par Example usage:
 * @code
 * MockTransferClient *client = new MockTransferClient(this);
 * DownloadManager manager(config, client, store, monitor);
 *
 * QString id = manager.submit("https://x/a.mp4").taskId;
 * client->mockEmitProgress(id, 500, 1000);
 * client->mockEmitFinished(id);
 *
 * QCOMPARE(client->mockStartRequests().size(), 1);
 * @endcode
 */
class MockTransferClient : public ITransferClient
{
    Q_OBJECT

public:
    explicit MockTransferClient(QObject *parent = nullptr);
    ~MockTransferClient() override = default;

    /// @name ITransferClient Implementation
    /// @{
    void start(const TransferRequest &request) override;
    bool pause(const QString &taskId, QByteArray &resumeToken, QString &errorMessage) override;
    [[nodiscard]] bool isRunning(const QString &taskId) const override { return running_.contains(taskId); }
    /// @}

    /// @name Mock Control Methods
    /// @{

    /// @brief Emits transferProgress() for a running transfer.
    void mockEmitProgress(const QString &taskId, qint64 bytesWritten, qint64 bytesTotal);

    /// @brief Ends a running transfer with transferFinished().
    void mockEmitFinished(const QString &taskId);

    /// @brief Ends a running transfer with transferFailed().
    void mockEmitFailed(const QString &taskId, DownloadErrorCode code,
                        const QString &message = QString("mock failure"),
                        const QByteArray &resumeToken = QByteArray());

    /// @brief Makes every following pause() call fail with @p errorMessage.
    void mockSetPauseFails(bool fails, const QString &errorMessage = QString("mock pause failure"));

    /// @brief Token returned by successful pause() calls.
    void mockSetResumeToken(const QByteArray &token) { resumeToken_ = token; }

    void mockReset();
    /// @}

    /// @name Test Inspection Methods
    /// @{
    [[nodiscard]] QList<TransferRequest> mockStartRequests() const { return startRequests_; }
    [[nodiscard]] QStringList mockStartedIds() const;
    [[nodiscard]] QStringList mockPauseRequests() const { return pauseRequests_; }
    [[nodiscard]] QStringList mockRunningIds() const { return running_; }
    [[nodiscard]] int mockRunningCount() const { return running_.size(); }
    /// @}

private:
    QList<TransferRequest> startRequests_;
    QStringList pauseRequests_;
    QStringList running_;

    bool pauseFails_ = false;
    QString pauseError_;
    QByteArray resumeToken_ = "mock-token";
};

#endif // MOCKTRANSFERCLIENT_H
