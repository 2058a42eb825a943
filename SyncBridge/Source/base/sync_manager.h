// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SYNC_MANAGER_H_7710293847561029
#define SYNC_MANAGER_H_7710293847561029

#include "sync_engine.h"


namespace sb
{
struct TargetStatus
{
    bool running = false;
    SyncProgress progress;
};


//one independent SyncEngine per target; thread-safe
class SyncManager
{
public:
    using GetTransportFactoryFun = std::function<CreateTransportFun(const SyncTarget& target)>;

    SyncManager(LogSink& logSink, const GetTransportFactoryFun& getTransportFactory, const SyncEngine::Options& engineOptions);
    ~SyncManager(); //stops all

    //restarts if already running; "target" must be validated
    void start(const SyncTarget& target);
    void stop(int targetId); //blocks until teardown completed, unless triggerSyncNowAll() is running; no-op if not running
    void stopAll();

    TargetStatus getStatus(int targetId);
    std::vector<int> getRunningTargets();

    std::shared_ptr<SyncEngine> getEngine(int targetId); //nullptr if not running

    //run one cycle on all targets in parallel
    std::vector<std::pair<int /*targetId*/, CycleSummary>> triggerSyncNowAll();

private:
    SyncManager           (const SyncManager&) = delete;
    SyncManager& operator=(const SyncManager&) = delete;

    LogSink& logSink_;
    const GetTransportFactoryFun getTransportFactory_;
    const SyncEngine::Options engineOptions_;

    zen::Protected<std::map<int, std::shared_ptr<SyncEngine>>> engines_;
};
}

#endif //SYNC_MANAGER_H_7710293847561029
