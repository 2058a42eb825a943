// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SYNC_ENGINE_H_4471920384756102
#define SYNC_ENGINE_H_4471920384756102

#include <deque>
#include <map>
#include "../afs/connection_pool.h"
#include "conflict_resolver.h"
#include "cycle_lock.h"
#include "ignore_rules.h"
#include "local_watcher.h"
#include "log_sink.h"
#include "path_mapping.h"


namespace sb
{
struct CycleSummary
{
    int uploaded   = 0;
    int downloaded = 0;
    int deleted    = 0;
    int failed     = 0;
    int skipped    = 0; //no action required
    bool listFailed = false;
};


enum class TaskType
{
    upload,
    download,
    remove, //remote item
};

enum class TaskTrigger
{
    watchEvent,
    cycleScan,
    manual,
};

struct TransferTask
{
    TaskType type = TaskType::upload;
    Zstring relPath;
    Zstring sourcePath;
    Zstring targetPath;
    TaskTrigger trigger = TaskTrigger::cycleScan;
    uint64_t bytesExpected = 0; //download: size as listed remotely
};


struct ActiveTransfer
{
    Zstring  name; //relative path
    uint64_t bytesTotal = 0;
    uint64_t bytesTransferred = 0;
    int      percent = 0;
    double   bytesPerSec = 0;
    std::optional<int64_t> remainingSec; //no value: unknown
};

struct SyncProgress
{
    std::vector<ActiveTransfer> activeTransfers;
    size_t queueLength    = 0; //tasks waiting for a worker
    size_t filesInBatch   = 0;
    size_t filesCompleted = 0;
};


/*  one engine per SyncTarget:
    - periodic cycles: timer (first tick immediate) + full remote listing
    - local changes: debounced watch events are uploaded (or deleted remotely) right away
    - download-only: a single cycle after start, no timer, no watcher
    - at most one cycle at a time; watch tasks may run concurrently with a cycle      */
class SyncEngine
{
public:
    struct Options
    {
        std::chrono::seconds idleCloseThreshold{60}; //close pooled connections after each cycle if sync interval is longer
        std::chrono::milliseconds downloadSuppressionGrace{5000};
        LocalWatcher::Options watcher;
    };

    //"target" must be validated (see validateSyncTarget())
    SyncEngine(const SyncTarget& target, const CreateTransportFun& createTransport, LogSink& logSink, const Options& options);
    ~SyncEngine(); //stop timer and watcher, let in-flight transfers finish, close connections

    void start(); //not thread-safe; call once

    CycleSummary triggerSyncNow(); //waits for a running cycle, then runs one; throw ThreadStopRequest

    void manualUpload  (const Zstring& relPath);    //throw FileError
    void manualDownload(const Zstring& remotePath); //throw FileError

    SyncProgress getProgress();
    std::vector<zen::LogEntry> getLogs(); //newest first

    const SyncTarget& getTarget() const { return target_; }

    static constexpr size_t LOG_RING_SIZE = 50;

private:
    SyncEngine           (const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    CycleSummary runCycle(); //caller must hold cycle lock

    void onLocalChange(const LocalChange& change); //watcher thread
    void dispatchTask(TransferTask&& task, const std::function<void(bool success)>& onTaskDone /*noexcept*/);
    void executeTask(const TransferTask& task); //throw FileError, ThreadStopRequest

    bool isExcluded(const Zstring& relPath, bool isFolder);
    std::shared_ptr<const IgnoreRules> getIgnoreRules();

    void closeIdleConnections();

    void logMessage(const std::wstring& msg, zen::MessageType type); //noexcept

    const SyncTarget target_;
    const PathMapping pathMap_;
    const Options options_;
    LogSink& logSink_;

    ConnectionPool pool_;
    CycleLock cycleLock_;
    IgnoreRulesLoader ignoreRulesLoader_;
    ChangeSuppressor suppressor_;

    struct TransferState
    {
        Zstring name;
        uint64_t bytesTotal = 0;
        uint64_t bytesTransferred = 0;
        std::chrono::steady_clock::time_point startTime;
    };
    struct ProgressState
    {
        std::map<uint64_t, TransferState> active;
        uint64_t nextTransferId = 0;
        size_t tasksPending   = 0;
        size_t filesInBatch   = 0;
        size_t filesCompleted = 0;
    };
    zen::Protected<ProgressState> progress_;

    zen::Protected<std::deque<zen::LogEntry>> logRing_; //newest first

    std::atomic<bool> stopping_{false}; //skip queued tasks during teardown

    zen::ThreadGroup<std::function<void()>> workers_;

    std::unique_ptr<LocalWatcher> watcher_;
    zen::InterruptibleThread timerThread_;
};
}

#endif //SYNC_ENGINE_H_4471920384756102
