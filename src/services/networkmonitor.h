/**
 * @file networkmonitor.h
 * @brief Tracks connectivity by polling a network probe.
 */

#ifndef NETWORKMONITOR_H
#define NETWORKMONITOR_H

#include <QObject>
#include <QTimer>

#include "inetworkprobe.h"

/**
 * @brief Polls an INetworkProbe and reports online/offline transitions.
 *
 * The monitor starts in Unknown. A probe result is Online only when the
 * host has a usable interface and the probe target answered. A probe that
 * could not be carried out moves the monitor to Unknown without firing
 * becameOnline() or becameOffline().
 *
 * @par Example usage:
 * @code
 * NetworkMonitor *monitor = new NetworkMonitor(probe, 5000, this);
 * connect(monitor, &NetworkMonitor::becameOffline, this, &Foo::pauseAll);
 * connect(monitor, &NetworkMonitor::becameOnline, this, &Foo::retryFailed);
 * monitor->start();
 * @endcode
 */
class NetworkMonitor : public QObject
{
    Q_OBJECT
    Q_PROPERTY(NetworkState state READ state NOTIFY stateChanged)

public:
    enum class NetworkState {
        Unknown,  ///< No probe has completed, or the last probe failed
        Online,   ///< Interface up and probe target reachable
        Offline   ///< No usable interface or target unreachable
    };
    Q_ENUM(NetworkState)

    /**
     * @brief Constructs a monitor.
     * @param probe Probe to poll (not owned, must outlive the monitor).
     * @param intervalMs Poll interval in milliseconds.
     * @param parent Optional parent QObject for memory management.
     */
    explicit NetworkMonitor(INetworkProbe *probe, int intervalMs = 5000,
                            QObject *parent = nullptr);
    ~NetworkMonitor() override;

    /// @name Polling
    /// @{

    /// @brief Probes immediately, then every interval. No-op if running.
    void start();

    /// @brief Halts polling. A probe already in flight is still applied.
    void stop();

    /// @brief Forces an immediate probe.
    void checkNow();

    [[nodiscard]] bool isRunning() const { return pollTimer_->isActive(); }
    [[nodiscard]] int interval() const { return pollTimer_->interval(); }
    /// @}

    [[nodiscard]] NetworkState state() const { return state_; }
    [[nodiscard]] bool isOnline() const { return state_ == NetworkState::Online; }

signals:
    void stateChanged(NetworkState oldState, NetworkState newState);
    void becameOnline();
    void becameOffline();

private slots:
    void onProbeFinished(bool connected, bool reachable);
    void onProbeFailed(const QString &message);

private:
    void setState(NetworkState state);

    INetworkProbe *probe_ = nullptr;
    QTimer *pollTimer_ = nullptr;
    NetworkState state_ = NetworkState::Unknown;
    NetworkState lastConfirmed_ = NetworkState::Unknown;
};

/// @brief Human readable state name for logs.
[[nodiscard]] QString networkStateToString(NetworkMonitor::NetworkState state);

#endif // NETWORKMONITOR_H
