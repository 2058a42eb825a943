// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <atomic>
#include <gtest/gtest.h>
#include "base/cycle_lock.h"
#include "test_util.h"

using namespace zen;
using namespace sb;


TEST(CycleLock, TryLockFailsWhileHeld)
{
    CycleLock cycleLock;
    {
        std::optional<CycleLock::Holder> holder = cycleLock.tryLock();
        ASSERT_TRUE(holder);
        EXPECT_TRUE(cycleLock.isLocked());

        bool otherThreadLocked = true;
        std::thread([&] { otherThreadLocked = static_cast<bool>(cycleLock.tryLock()); }).join();
        EXPECT_FALSE(otherThreadLocked);
    }
    EXPECT_FALSE(cycleLock.isLocked());
    EXPECT_TRUE(cycleLock.tryLock());
}


TEST(CycleLock, ReentranceIsContractViolation)
{
    CycleLock cycleLock;
    CycleLock::Holder holder = cycleLock.lock();

    EXPECT_THROW(cycleLock.tryLock(), std::logic_error);
    EXPECT_THROW(cycleLock.lock(), std::logic_error);
}


TEST(CycleLock, MutualExclusion)
{
    CycleLock cycleLock;
    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([&]
        {
            for (int j = 0; j < 20; ++j)
            {
                CycleLock::Holder holder = cycleLock.lock();
                const int now = ++inside;
                if (now > maxInside)
                    maxInside = now;
                std::this_thread::sleep_for(std::chrono::microseconds(200));
                --inside;
            }
        });
    for (std::thread& t : threads)
        t.join();

    EXPECT_EQ(maxInside, 1);
    EXPECT_FALSE(cycleLock.isLocked());
}


TEST(CycleLock, WaitersAreServedInArrivalOrder)
{
    CycleLock cycleLock;
    std::optional<CycleLock::Holder> holder = cycleLock.tryLock();
    ASSERT_TRUE(holder);

    std::mutex lockOrder;
    std::vector<int> order;

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i)
    {
        threads.emplace_back([&, i]
        {
            CycleLock::Holder h = cycleLock.lock();
            std::lock_guard dummy(lockOrder);
            order.push_back(i);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(100)); //make sure thread i is queued before i + 1
    }

    //no barging while others are waiting
    bool bargeLocked = true;
    std::thread([&] { bargeLocked = static_cast<bool>(cycleLock.tryLock()); }).join();
    EXPECT_FALSE(bargeLocked);

    holder.reset();
    for (std::thread& t : threads)
        t.join();

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}


TEST(CycleLock, InterruptedWaiterGivesUpItsPlace)
{
    CycleLock cycleLock;
    std::optional<CycleLock::Holder> holder = cycleLock.tryLock();
    ASSERT_TRUE(holder);

    std::atomic<bool> waiterStopped{false};
    InterruptibleThread waiter([&]
    {
        try
        {
            CycleLock::Holder h = cycleLock.lock(); //throw ThreadStopRequest
        }
        catch (const ThreadStopRequest&)
        {
            waiterStopped = true;
            throw;
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    waiter.requestStop();
    waiter.join();
    EXPECT_TRUE(waiterStopped);

    holder.reset();
    EXPECT_TRUE(cycleLock.tryLock()); //queue is empty again
}
