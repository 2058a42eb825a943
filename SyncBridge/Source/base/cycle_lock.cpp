// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "cycle_lock.h"

using namespace zen;
using namespace sb;


namespace
{
[[noreturn]] void throwReentrance()
{
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation! Cycle lock is not reentrant.");
}
}


std::optional<CycleLock::Holder> CycleLock::tryLock()
{
    std::lock_guard dummy(lockState_);

    if (locked_ && owner_ == std::this_thread::get_id())
        throwReentrance();

    if (locked_ || !waitingTickets_.empty())
        return std::nullopt;

    locked_ = true;
    owner_ = std::this_thread::get_id();
    return Holder(*this);
}


CycleLock::Holder CycleLock::lock() //throw ThreadStopRequest
{
    std::unique_lock dummy(lockState_);

    if (locked_ && owner_ == std::this_thread::get_id())
        throwReentrance();

    const uint64_t ticket = nextTicket_++;
    waitingTickets_.push_back(ticket);
    ZEN_ON_SCOPE_FAIL( //interrupted: give up our place in the queue
        std::erase(waitingTickets_, ticket);
        conditionUnlocked_.notify_all());

    interruptibleWait(conditionUnlocked_, dummy, [&] { return !locked_ && waitingTickets_.front() == ticket; }); //throw ThreadStopRequest

    waitingTickets_.pop_front();
    locked_ = true;
    owner_ = std::this_thread::get_id();
    return Holder(*this);
}


void CycleLock::unlock()
{
    {
        std::lock_guard dummy(lockState_);
        locked_ = false;
        owner_ = std::thread::id();
    }
    conditionUnlocked_.notify_all();
}


bool CycleLock::isLocked()
{
    std::lock_guard dummy(lockState_);
    return locked_;
}
