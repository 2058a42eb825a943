// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "sync_manager.h"

using namespace zen;
using namespace sb;


SyncManager::SyncManager(LogSink& logSink, const GetTransportFactoryFun& getTransportFactory, const SyncEngine::Options& engineOptions) :
    logSink_(logSink),
    getTransportFactory_(getTransportFactory),
    engineOptions_(engineOptions) {}


SyncManager::~SyncManager()
{
    stopAll();
}


void SyncManager::start(const SyncTarget& target)
{
    stop(target.id);

    auto engine = std::make_shared<SyncEngine>(target, getTransportFactory_(target), logSink_, engineOptions_);
    engine->start();

    engines_.access([&](std::map<int, std::shared_ptr<SyncEngine>>& engines) { engines[target.id] = engine; });
}


void SyncManager::stop(int targetId)
{
    std::shared_ptr<SyncEngine> engine = engines_.access([&](std::map<int, std::shared_ptr<SyncEngine>>& engines)
    {
        std::shared_ptr<SyncEngine> tmp;
        if (auto it = engines.find(targetId); it != engines.end())
        {
            tmp = std::move(it->second);
            engines.erase(it);
        }
        return tmp;
    });
    //teardown outside of lock; deferred until a running triggerSyncNowAll() releases the engine
    engine.reset();
}


void SyncManager::stopAll()
{
    for (int targetId : getRunningTargets())
        stop(targetId);
}


std::shared_ptr<SyncEngine> SyncManager::getEngine(int targetId)
{
    return engines_.access([&](std::map<int, std::shared_ptr<SyncEngine>>& engines)
    {
        auto it = engines.find(targetId);
        return it != engines.end() ? it->second : nullptr;
    });
}


TargetStatus SyncManager::getStatus(int targetId)
{
    TargetStatus status;
    if (std::shared_ptr<SyncEngine> engine = getEngine(targetId))
    {
        status.running  = true;
        status.progress = engine->getProgress();
    }
    return status;
}


std::vector<int> SyncManager::getRunningTargets()
{
    return engines_.access([](std::map<int, std::shared_ptr<SyncEngine>>& engines)
    {
        std::vector<int> targetIds;
        for (const auto& [targetId, engine] : engines)
            targetIds.push_back(targetId);
        return targetIds;
    });
}


std::vector<std::pair<int, CycleSummary>> SyncManager::triggerSyncNowAll()
{
    //engines are owned here, not by the detached worker threads: last release must not happen on a worker
    std::vector<std::shared_ptr<SyncEngine>> engines;
    std::vector<std::pair<int, std::future<CycleSummary>>> futures;

    for (int targetId : getRunningTargets())
        if (std::shared_ptr<SyncEngine> engine = getEngine(targetId))
        {
            SyncEngine* const enginePtr = engine.get();
            engines.push_back(std::move(engine));
            futures.emplace_back(targetId, runAsync([enginePtr] { return enginePtr->triggerSyncNow(); }));
        }

    for (auto& [targetId, ft] : futures)
        ft.wait();

    std::vector<std::pair<int, CycleSummary>> summaries;
    for (auto& [targetId, ft] : futures)
        summaries.emplace_back(targetId, ft.get());
    return summaries;
}
