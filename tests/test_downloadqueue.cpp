#include <QtTest>

#include "models/downloadqueue.h"

class TestDownloadQueue : public QObject
{
    Q_OBJECT

private:
    QStringList drain(DownloadQueue &queue)
    {
        QStringList order;
        while (auto id = queue.dequeueIfCapacity()) {
            order.append(*id);
        }
        return order;
    }

private slots:
    void testEmptyQueueDequeuesNothing()
    {
        DownloadQueue queue(2);
        QVERIFY(!queue.dequeueIfCapacity().has_value());
        QCOMPARE(queue.pendingCount(), 0);
        QCOMPARE(queue.activeCount(), 0);
        QVERIFY(queue.hasCapacity());
    }

    void testFifoAmongEqualPriorities()
    {
        DownloadQueue queue(10);
        queue.enqueue("a");
        queue.enqueue("b");
        queue.enqueue("c");

        QCOMPARE(drain(queue), QStringList({"a", "b", "c"}));
    }

    void testHigherPriorityFirst()
    {
        DownloadQueue queue(1);
        queue.enqueue("low", 0);
        queue.enqueue("high", 5);

        auto first = queue.dequeueIfCapacity();
        QVERIFY(first.has_value());
        QCOMPARE(*first, QString("high"));
    }

    void testMixedPrioritiesNonIncreasingOrder()
    {
        DownloadQueue queue(10);
        queue.enqueue("a", 1);
        queue.enqueue("b", 3);
        queue.enqueue("c", 1);
        queue.enqueue("d", 2);
        queue.enqueue("e", 3);
        queue.enqueue("f", -1);

        QCOMPARE(queue.queuedTaskIds(), QStringList({"b", "e", "d", "a", "c", "f"}));
        QCOMPARE(drain(queue), QStringList({"b", "e", "d", "a", "c", "f"}));
    }

    void testCapacityLimit()
    {
        DownloadQueue queue(2);
        queue.enqueue("a");
        queue.enqueue("b");
        queue.enqueue("c");

        QCOMPARE(drain(queue), QStringList({"a", "b"}));
        QCOMPARE(queue.activeCount(), 2);
        QCOMPARE(queue.pendingCount(), 1);
        QVERIFY(!queue.hasCapacity());
        QVERIFY(!queue.dequeueIfCapacity().has_value());
    }

    void testReleaseAdmitsNext()
    {
        DownloadQueue queue(1);
        queue.enqueue("a");
        queue.enqueue("b");

        QCOMPARE(*queue.dequeueIfCapacity(), QString("a"));
        QVERIFY(!queue.dequeueIfCapacity().has_value());

        queue.release("a");
        QVERIFY(queue.hasCapacity());
        QCOMPARE(*queue.dequeueIfCapacity(), QString("b"));
        QVERIFY(queue.isAdmitted("b"));
        QVERIFY(!queue.isAdmitted("a"));
    }

    void testReleaseUnknownIsNoOp()
    {
        DownloadQueue queue(1);
        queue.enqueue("a");
        QCOMPARE(*queue.dequeueIfCapacity(), QString("a"));

        queue.release("missing");
        QCOMPARE(queue.activeCount(), 1);
    }

    void testRemovePurgesQueuedAndAdmitted()
    {
        DownloadQueue queue(1);
        queue.enqueue("a");
        queue.enqueue("b");
        QCOMPARE(*queue.dequeueIfCapacity(), QString("a"));

        queue.remove("b");
        QVERIFY(!queue.isQueued("b"));
        QCOMPARE(queue.pendingCount(), 0);

        queue.remove("a");
        QVERIFY(!queue.isAdmitted("a"));
        QCOMPARE(queue.activeCount(), 0);

        queue.remove("never-seen");
        QCOMPARE(queue.pendingCount(), 0);
    }

    void testActiveCountNeverExceedsLimit()
    {
        DownloadQueue queue(3);
        for (int i = 0; i < 10; ++i) {
            queue.enqueue(QString("t%1").arg(i), i % 4);
        }

        int released = 0;
        while (queue.pendingCount() > 0) {
            while (auto id = queue.dequeueIfCapacity()) {
                QVERIFY(queue.activeCount() <= queue.maxConcurrent());
            }
            const QStringList admitted = queue.admittedTaskIds();
            QVERIFY(!admitted.isEmpty());
            queue.release(admitted.first());
            ++released;
        }
        QVERIFY(released >= 7);
    }

    void testDuplicateEnqueueComesOutTwice()
    {
        DownloadQueue queue(5);
        queue.enqueue("a");
        queue.enqueue("a");

        QCOMPARE(queue.pendingCount(), 2);
        QCOMPARE(drain(queue), QStringList({"a", "a"}));
    }

    void testClear()
    {
        DownloadQueue queue(1);
        queue.enqueue("a");
        queue.enqueue("b");
        QVERIFY(queue.dequeueIfCapacity().has_value());

        queue.clear();
        QCOMPARE(queue.pendingCount(), 0);
        QCOMPARE(queue.activeCount(), 0);
    }

    void testLimitClampedToOne()
    {
        DownloadQueue queue(0);
        QCOMPARE(queue.maxConcurrent(), 1);
    }
};

QTEST_MAIN(TestDownloadQueue)
#include "test_downloadqueue.moc"
