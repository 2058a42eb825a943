// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef CYCLE_LOCK_H_8203948572039485
#define CYCLE_LOCK_H_8203948572039485

#include <deque>
#include <optional>
#include <zen/thread.h>


namespace sb
{
//serialize sync cycles of one target: non-reentrant, waiters are served FIFO
class CycleLock
{
public:
    CycleLock() {}

    class Holder //release lock in destructor
    {
    public:
        Holder(Holder&& tmp) noexcept : lock_(std::exchange(tmp.lock_, nullptr)) {}
        ~Holder() { if (lock_) lock_->unlock(); }

    private:
        friend class CycleLock;
        explicit Holder(CycleLock& lock) : lock_(&lock) {}

        Holder           (const Holder&) = delete;
        Holder& operator=(const Holder&) = delete;

        CycleLock* lock_;
    };

    //non-blocking: no value if locked or other threads are already waiting
    std::optional<Holder> tryLock(); //throw std::logic_error (reentrance)

    //blocking: FIFO
    Holder lock(); //throw ThreadStopRequest, std::logic_error (reentrance)

    bool isLocked();

private:
    CycleLock           (const CycleLock&) = delete;
    CycleLock& operator=(const CycleLock&) = delete;

    void unlock();

    std::mutex lockState_;
    std::condition_variable conditionUnlocked_;
    bool locked_ = false;
    std::thread::id owner_;
    std::deque<uint64_t> waitingTickets_; //FIFO
    uint64_t nextTicket_ = 0;
};
}

#endif //CYCLE_LOCK_H_8203948572039485
