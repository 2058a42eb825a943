// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "connection_pool.h"

using namespace zen;
using namespace sb;


PooledTransport::~PooledTransport()
{
    if (pool_) //not moved-from
        pool_->release(std::move(transport_), generation_);
}


ConnectionPool::ConnectionPool(const CreateTransportFun& createTransport, size_t parallelism, const LogMessageFun& logMessage) :
    createTransport_(createTransport),
    parallelism_(parallelism),
    logMessage_(logMessage)
{
    if (parallelism == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


ConnectionPool::~ConnectionPool()
{
    shutdown();
    closeAll();
}


void ConnectionPool::preWarm()
{
    size_t count = 0;
    {
        std::lock_guard dummy(lockPool_);
        if (shutdown_ || instanceCount_ >= parallelism_)
            return;

        count = parallelism_ - instanceCount_;
        instanceCount_ += count; //reserve
    }

    preWarmThread_ = InterruptibleThread([this, count]
    {
        setCurrentThreadName(Zstr("Pool pre-warm"));

        size_t pending = count;
        ZEN_ON_SCOPE_EXIT(if (pending > 0) //interrupted: give back reservation
        {
            {
                std::lock_guard dummy(lockPool_);
                instanceCount_ -= pending;
            }
            conditionTransportAvailable_.notify_all();
        });

        while (pending > 0)
        {
            interruptionPoint(); //throw ThreadStopRequest

            std::unique_ptr<Transport> transport = createTransport_();
            try
            {
                transport->connect(); //throw ConnectionError
                logMessage_(replaceCpy(replaceCpy(_("Connected to %x (%y)."), L"%x", fmtPath(transport->getDisplayPath(Zstr("/")))),
                                       L"%y", transport->getConnectionDetails()), MSG_TYPE_INFO);
            }
            catch (const ConnectionError& e) { logMessage_(e.toString(), MSG_TYPE_WARNING); } //acquire() will try again

            {
                std::lock_guard dummy(lockPool_);
                --pending;
                if (shutdown_)
                    --instanceCount_;
                else
                    idleTransports_.push_back(std::move(transport));
            }
            conditionTransportAvailable_.notify_all();
        }
    });
}


PooledTransport ConnectionPool::acquire() //throw ThreadStopRequest
{
    std::unique_ptr<Transport> transport;
    int generation = 0;
    {
        std::unique_lock dummy(lockPool_);
        interruptibleWait(conditionTransportAvailable_, dummy, [this]
        {
            return shutdown_ || !idleTransports_.empty() || instanceCount_ < parallelism_;
        }); //throw ThreadStopRequest

        if (shutdown_)
            throw ThreadStopRequest();

        generation = closeGeneration_;

        if (!idleTransports_.empty())
        {
            transport = std::move(idleTransports_.back());
            /**/                  idleTransports_.pop_back();
        }
        else
            ++instanceCount_; //reserve
    }

    if (!transport)
    {
        ZEN_ON_SCOPE_FAIL(
        {
            std::lock_guard dummy(lockPool_);
            --instanceCount_;
        }
        conditionTransportAvailable_.notify_all());

        transport = createTransport_();
    }
    else if (!transport->isHealthy()) //e.g. session idled too long, or pre-warming failed
        transport->close(); //=> reconnect lazily

    return PooledTransport(*this, std::move(transport), generation);
}


void ConnectionPool::release(std::unique_ptr<Transport>&& transport, int generation) //noexcept
{
    {
        std::lock_guard dummy(lockPool_);

        if (!shutdown_ && generation == closeGeneration_ && transport->isHealthy())
        {
            idleTransports_.push_back(std::move(transport));
        }
        else
            --instanceCount_; //discard: replaced lazily by next acquire()
    }
    conditionTransportAvailable_.notify_all();

    if (transport)
        transport->close();
}


void ConnectionPool::closeAll()
{
    std::vector<std::unique_ptr<Transport>> idleTransports;
    {
        std::lock_guard dummy(lockPool_);
        idleTransports.swap(idleTransports_);
        instanceCount_ -= idleTransports.size();
        ++closeGeneration_;
    }
    conditionTransportAvailable_.notify_all();

    for (const std::unique_ptr<Transport>& transport : idleTransports)
        transport->close();
}


void ConnectionPool::shutdown()
{
    {
        std::lock_guard dummy(lockPool_);
        shutdown_ = true;
    }
    conditionTransportAvailable_.notify_all();

    preWarmThread_ = InterruptibleThread(); //stop and join: no log output after shutdown
}


size_t ConnectionPool::getInstanceCount()
{
    std::lock_guard dummy(lockPool_);
    return instanceCount_;
}
