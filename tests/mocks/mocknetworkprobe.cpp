#include "mocknetworkprobe.h"

MockNetworkProbe::MockNetworkProbe(QObject *parent)
    : INetworkProbe(parent)
{
}

void MockNetworkProbe::check()
{
    ++checkCount_;
    if (autoRespond_) {
        emit probeFinished(connected_, reachable_);
    }
}

void MockNetworkProbe::mockSetResult(bool connected, bool reachable)
{
    connected_ = connected;
    reachable_ = reachable;
}

void MockNetworkProbe::mockRespond(bool connected, bool reachable)
{
    mockSetResult(connected, reachable);
    emit probeFinished(connected, reachable);
}

void MockNetworkProbe::mockFail(const QString &message)
{
    emit probeFailed(message);
}
