#include <QtTest>
#include <QSignalSpy>

#include "mocks/mocknetworkprobe.h"
#include "services/networkmonitor.h"

class TestNetworkMonitor : public QObject
{
    Q_OBJECT

private:
    MockNetworkProbe *probe;
    NetworkMonitor *monitor;

private slots:
    void init()
    {
        probe = new MockNetworkProbe(this);
        probe->mockSetAutoRespond(false);
        monitor = new NetworkMonitor(probe, 50, this);
    }

    void cleanup()
    {
        delete monitor;
        delete probe;
        monitor = nullptr;
        probe = nullptr;
    }

    void testInitialStateUnknown()
    {
        QCOMPARE(monitor->state(), NetworkMonitor::NetworkState::Unknown);
        QVERIFY(!monitor->isOnline());
        QVERIFY(!monitor->isRunning());
    }

    void testStartProbesImmediately()
    {
        monitor->start();
        QCOMPARE(probe->mockCheckCount(), 1);
        QVERIFY(monitor->isRunning());

        // Second start is a no-op
        monitor->start();
        QCOMPARE(probe->mockCheckCount(), 1);
    }

    void testPollsPeriodically()
    {
        monitor->start();
        QTRY_VERIFY_WITH_TIMEOUT(probe->mockCheckCount() >= 3, 2000);

        monitor->stop();
        QVERIFY(!monitor->isRunning());
        const int count = probe->mockCheckCount();
        QTest::qWait(200);
        QCOMPARE(probe->mockCheckCount(), count);
    }

    void testCheckNowForcesProbe()
    {
        monitor->checkNow();
        QCOMPARE(probe->mockCheckCount(), 1);
    }

    void testFirstOnlineResultEmitsBecameOnline()
    {
        QSignalSpy onlineSpy(monitor, &NetworkMonitor::becameOnline);
        QSignalSpy offlineSpy(monitor, &NetworkMonitor::becameOffline);
        QSignalSpy stateSpy(monitor, &NetworkMonitor::stateChanged);

        probe->mockRespond(true, true);

        QCOMPARE(monitor->state(), NetworkMonitor::NetworkState::Online);
        QVERIFY(monitor->isOnline());
        QCOMPARE(onlineSpy.count(), 1);
        QCOMPARE(offlineSpy.count(), 0);
        QCOMPARE(stateSpy.count(), 1);
        QCOMPARE(stateSpy.first().at(0).value<NetworkMonitor::NetworkState>(),
                 NetworkMonitor::NetworkState::Unknown);
        QCOMPARE(stateSpy.first().at(1).value<NetworkMonitor::NetworkState>(),
                 NetworkMonitor::NetworkState::Online);
    }

    void testOfflineFromUnknownDoesNotEmitBecameOffline()
    {
        QSignalSpy offlineSpy(monitor, &NetworkMonitor::becameOffline);
        QSignalSpy stateSpy(monitor, &NetworkMonitor::stateChanged);

        probe->mockRespond(true, false);

        QCOMPARE(monitor->state(), NetworkMonitor::NetworkState::Offline);
        QCOMPARE(stateSpy.count(), 1);
        QCOMPARE(offlineSpy.count(), 0);
    }

    void testOnlineToOfflineEmitsBecameOffline()
    {
        probe->mockRespond(true, true);

        QSignalSpy offlineSpy(monitor, &NetworkMonitor::becameOffline);
        probe->mockRespond(false, false);

        QCOMPARE(monitor->state(), NetworkMonitor::NetworkState::Offline);
        QCOMPARE(offlineSpy.count(), 1);
    }

    void testConnectedButUnreachableIsOffline()
    {
        probe->mockRespond(true, true);
        QSignalSpy offlineSpy(monitor, &NetworkMonitor::becameOffline);

        probe->mockRespond(true, false);
        QCOMPARE(monitor->state(), NetworkMonitor::NetworkState::Offline);
        QCOMPARE(offlineSpy.count(), 1);
    }

    void testRepeatedResultEmitsNothing()
    {
        probe->mockRespond(true, true);

        QSignalSpy onlineSpy(monitor, &NetworkMonitor::becameOnline);
        QSignalSpy stateSpy(monitor, &NetworkMonitor::stateChanged);
        probe->mockRespond(true, true);
        probe->mockRespond(true, true);

        QCOMPARE(onlineSpy.count(), 0);
        QCOMPARE(stateSpy.count(), 0);
    }

    void testProbeFailureSetsUnknownWithoutTransitions()
    {
        probe->mockRespond(true, true);

        QSignalSpy onlineSpy(monitor, &NetworkMonitor::becameOnline);
        QSignalSpy offlineSpy(monitor, &NetworkMonitor::becameOffline);
        QSignalSpy stateSpy(monitor, &NetworkMonitor::stateChanged);

        probe->mockFail("dns broke");

        QCOMPARE(monitor->state(), NetworkMonitor::NetworkState::Unknown);
        QCOMPARE(stateSpy.count(), 1);
        QCOMPARE(offlineSpy.count(), 0);
        QCOMPARE(onlineSpy.count(), 0);
    }

    void testOnlineAfterFailureFromOnlineDoesNotReannounce()
    {
        probe->mockRespond(true, true);
        probe->mockFail();

        QSignalSpy onlineSpy(monitor, &NetworkMonitor::becameOnline);
        probe->mockRespond(true, true);

        QCOMPARE(monitor->state(), NetworkMonitor::NetworkState::Online);
        QCOMPARE(onlineSpy.count(), 0);
    }

    void testOfflineAfterFailureFromOnlineAnnouncesOffline()
    {
        probe->mockRespond(true, true);
        probe->mockFail();

        QSignalSpy offlineSpy(monitor, &NetworkMonitor::becameOffline);
        probe->mockRespond(false, false);

        QCOMPARE(offlineSpy.count(), 1);
    }

    void testOfflineThenOnlineAnnouncesOnline()
    {
        probe->mockRespond(true, true);
        probe->mockRespond(false, false);

        QSignalSpy onlineSpy(monitor, &NetworkMonitor::becameOnline);
        probe->mockRespond(true, true);
        QCOMPARE(onlineSpy.count(), 1);
    }
};

QTEST_MAIN(TestNetworkMonitor)
#include "test_networkmonitor.moc"
