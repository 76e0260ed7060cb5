#include "networkmonitor.h"
#include "utils/logging.h"

#include <QDebug>

QString networkStateToString(NetworkMonitor::NetworkState state)
{
    switch (state) {
    case NetworkMonitor::NetworkState::Online: return QStringLiteral("online");
    case NetworkMonitor::NetworkState::Offline: return QStringLiteral("offline");
    case NetworkMonitor::NetworkState::Unknown: return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

NetworkMonitor::NetworkMonitor(INetworkProbe *probe, int intervalMs, QObject *parent)
    : QObject(parent)
    , probe_(probe)
    , pollTimer_(new QTimer(this))
{
    pollTimer_->setInterval(intervalMs);
    connect(pollTimer_, &QTimer::timeout, this, &NetworkMonitor::checkNow);

    if (probe_) {
        connect(probe_, &INetworkProbe::probeFinished,
                this, &NetworkMonitor::onProbeFinished);
        connect(probe_, &INetworkProbe::probeFailed,
                this, &NetworkMonitor::onProbeFailed);
    }
}

NetworkMonitor::~NetworkMonitor()
{
    stop();
}

void NetworkMonitor::start()
{
    if (pollTimer_->isActive()) {
        return;
    }

    LOG_VERBOSE() << "NetworkMonitor: Polling every" << pollTimer_->interval() << "ms";
    pollTimer_->start();
    checkNow();
}

void NetworkMonitor::stop()
{
    pollTimer_->stop();
}

void NetworkMonitor::checkNow()
{
    if (!probe_) {
        qWarning() << "NetworkMonitor: No probe configured";
        return;
    }
    probe_->check();
}

void NetworkMonitor::onProbeFinished(bool connected, bool reachable)
{
    const NetworkState newState = (connected && reachable)
                                      ? NetworkState::Online
                                      : NetworkState::Offline;
    const NetworkState previousConfirmed = lastConfirmed_;
    lastConfirmed_ = newState;

    setState(newState);

    if (newState == NetworkState::Online && previousConfirmed != NetworkState::Online) {
        qInfo() << "NetworkMonitor: Network is online";
        emit becameOnline();
    } else if (newState == NetworkState::Offline && previousConfirmed == NetworkState::Online) {
        qInfo() << "NetworkMonitor: Network is offline";
        emit becameOffline();
    }
}

void NetworkMonitor::onProbeFailed(const QString &message)
{
    qWarning() << "NetworkMonitor: Probe failed:" << message;
    setState(NetworkState::Unknown);
}

void NetworkMonitor::setState(NetworkState state)
{
    if (state_ == state) {
        return;
    }

    const NetworkState oldState = state_;
    state_ = state;
    LOG_VERBOSE() << "NetworkMonitor:" << networkStateToString(oldState)
                  << "->" << networkStateToString(state);
    emit stateChanged(oldState, state);
}
