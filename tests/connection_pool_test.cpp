// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include "fake_transport.h"
#include "test_util.h"

using namespace zen;
using namespace sb;
using namespace sb::test;


namespace
{
const LogMessageFun ignoreLog = [](const std::wstring& msg, MessageType type) {};
}


TEST(ConnectionPool, ConcurrencyIsBoundedByParallelism)
{
    FakeRemote remote;
    remote.callDelay = std::chrono::milliseconds(50);

    ConnectionPool pool(makeFakeTransportFactory(remote), 3, ignoreLog);

    ThreadGroup<std::function<void()>> workers(10, Zstr("Pool test"));
    for (int i = 0; i < 10; ++i)
        workers.run([&pool]
        {
            PooledTransport transport = pool.acquire();
            transport->connect();
            transport->remove(Zstr("/nothing"));
        });
    workers.wait();

    EXPECT_EQ(remote.maxActiveCalls, 3);
    EXPECT_EQ(remote.removeCount, 10);
    EXPECT_LE(remote.createdCount, 3);
    EXPECT_LE(pool.getInstanceCount(), 3u);
}


TEST(ConnectionPool, IdleTransportsAreReused)
{
    FakeRemote remote;
    ConnectionPool pool(makeFakeTransportFactory(remote), 2, ignoreLog);

    for (int i = 0; i < 5; ++i)
    {
        PooledTransport transport = pool.acquire();
        transport->connect();
    }
    EXPECT_EQ(remote.createdCount, 1);
    EXPECT_EQ(remote.connectCount, 1);
    EXPECT_EQ(pool.getInstanceCount(), 1u);
}


TEST(ConnectionPool, UnhealthyTransportIsDiscardedOnRelease)
{
    FakeRemote remote;
    ConnectionPool pool(makeFakeTransportFactory(remote), 2, ignoreLog);

    {
        PooledTransport transport = pool.acquire(); //never connected => unhealthy
    }
    EXPECT_EQ(pool.getInstanceCount(), 0u);
    EXPECT_EQ(remote.instanceCount, 0);
}


TEST(ConnectionPool, CloseAllClosesIdleAndLaterReleasedTransports)
{
    FakeRemote remote;
    ConnectionPool pool(makeFakeTransportFactory(remote), 2, ignoreLog);

    std::optional<PooledTransport> busy(pool.acquire());
    (*busy)->connect();
    {
        PooledTransport idle = pool.acquire();
        idle->connect();
    }
    EXPECT_EQ(pool.getInstanceCount(), 2u);

    pool.closeAll();
    EXPECT_EQ(remote.closeCount, 1);
    EXPECT_EQ(pool.getInstanceCount(), 1u);

    busy.reset(); //acquired before closeAll(): closed on release
    EXPECT_EQ(remote.closeCount, 2);
    EXPECT_EQ(pool.getInstanceCount(), 0u);
    EXPECT_EQ(remote.instanceCount, 0);

    PooledTransport transport = pool.acquire(); //lazily reconnects
    transport->connect();
    EXPECT_EQ(remote.connectCount, 3);
}


TEST(ConnectionPool, PreWarmConnectsUpToParallelism)
{
    FakeRemote remote;
    ConnectionPool pool(makeFakeTransportFactory(remote), 3, ignoreLog);

    pool.preWarm();
    ASSERT_TRUE(waitUntil([&] { return remote.connectCount == 3; }));

    {
        PooledTransport transport = pool.acquire();
        EXPECT_TRUE(transport->isHealthy());
    }
    EXPECT_EQ(remote.createdCount, 3);
    EXPECT_EQ(pool.getInstanceCount(), 3u);
}


TEST(ConnectionPool, PreWarmFailureIsNotFatal)
{
    FakeRemote remote;
    remote.failConnect = true;

    std::atomic<int> warnings{0};
    ConnectionPool pool(makeFakeTransportFactory(remote), 2, [&](const std::wstring& msg, MessageType type)
    {
        if (type == MSG_TYPE_WARNING)
            ++warnings;
    });
    pool.preWarm();
    ASSERT_TRUE(waitUntil([&] { return warnings == 2; }));

    remote.failConnect = false;

    PooledTransport transport = pool.acquire();
    EXPECT_FALSE(transport->isHealthy());
    transport->connect(); //retried lazily
    EXPECT_TRUE(transport->isHealthy());
}


TEST(ConnectionPool, ShutdownWakesUpWaitingAcquire)
{
    FakeRemote remote;
    ConnectionPool pool(makeFakeTransportFactory(remote), 1, ignoreLog);

    PooledTransport transport = pool.acquire();

    std::atomic<bool> stopped{false};
    std::thread waiter([&]
    {
        try
        {
            PooledTransport t2 = pool.acquire(); //throw ThreadStopRequest
        }
        catch (const ThreadStopRequest&) { stopped = true; }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(stopped);

    pool.shutdown();
    waiter.join();
    EXPECT_TRUE(stopped);

    EXPECT_THROW(pool.acquire(), ThreadStopRequest);
}
