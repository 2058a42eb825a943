// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef CONNECTION_POOL_H_3298475029834752
#define CONNECTION_POOL_H_3298475029834752

#include <zen/thread.h>
#include "transport.h"


namespace sb
{
using CreateTransportFun = std::function<std::unique_ptr<Transport>()>;

class ConnectionPool;

//scoped access to one pooled Transport: returned to the pool in destructor
class PooledTransport
{
public:
    PooledTransport(PooledTransport&& tmp) noexcept :
        pool_(std::exchange(tmp.pool_, nullptr)),
        transport_(std::move(tmp.transport_)),
        generation_(tmp.generation_) {}

    ~PooledTransport();

    Transport& operator* () const { return *transport_; }
    Transport* operator->() const { return transport_.get(); }

private:
    friend class ConnectionPool;
    PooledTransport(ConnectionPool& pool, std::unique_ptr<Transport>&& transport, int generation) :
        pool_(&pool), transport_(std::move(transport)), generation_(generation) {}

    PooledTransport           (const PooledTransport&) = delete;
    PooledTransport& operator=(const PooledTransport&) = delete;

    ConnectionPool* pool_;
    std::unique_ptr<Transport> transport_;
    int generation_;
};


//up to "parallelism" concurrently usable Transports for one sync target
class ConnectionPool
{
public:
    ConnectionPool(const CreateTransportFun& createTransport, size_t parallelism, const LogMessageFun& logMessage);
    ~ConnectionPool();

    //connect idle transports up to "parallelism" in the background; failures are logged only
    void preWarm();

    //blocks until a transport is available; connection is established lazily by the Transport itself
    PooledTransport acquire(); //throw ThreadStopRequest: calling thread was asked to stop, or pool was shut down

    //close idle transports; busy ones are closed when released
    void closeAll();

    //wake up and fail all waiting and future acquire() calls; stop pre-warming
    //call from controlling thread only (not concurrently with preWarm())
    void shutdown();

    size_t getParallelism() const { return parallelism_; }
    size_t getInstanceCount(); //idle + busy

private:
    ConnectionPool           (const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    friend class PooledTransport;
    void release(std::unique_ptr<Transport>&& transport, int generation); //noexcept

    const CreateTransportFun createTransport_;
    const size_t parallelism_;
    const LogMessageFun logMessage_;

    std::mutex lockPool_;
    std::condition_variable conditionTransportAvailable_;
    std::vector<std::unique_ptr<Transport>> idleTransports_;
    size_t instanceCount_ = 0; //idle + busy + being pre-warmed
    int closeGeneration_ = 0; //transports acquired before the last closeAll() are closed on release
    bool shutdown_ = false;

    zen::InterruptibleThread preWarmThread_;
};
}

#endif //CONNECTION_POOL_H_3298475029834752
