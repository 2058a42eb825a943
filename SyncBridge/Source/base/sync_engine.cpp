// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "sync_engine.h"
#include <cmath>
#include <zen/file_traverser.h>
#include <zen/file_path.h>

using namespace zen;
using namespace sb;


namespace
{
std::wstring formatCycleSummary(const CycleSummary& summary)
{
    std::wstring msg = _("Uploaded:") + L' ' + numberTo<std::wstring>(summary.uploaded) + L", " +
                       _("Downloaded:") + L' ' + numberTo<std::wstring>(summary.downloaded) + L", " +
                       _("Failed:") + L' ' + numberTo<std::wstring>(summary.failed) + L", " +
                       _("Unchanged:") + L' ' + numberTo<std::wstring>(summary.skipped);
    if (summary.listFailed)
        msg += L"\n" + _("The remote folder could not be listed.");
    return msg;
}
}


SyncEngine::SyncEngine(const SyncTarget& target, const CreateTransportFun& createTransport, LogSink& logSink, const Options& options) :
    target_(target),
    pathMap_(target.localPath, target.remotePath),
    options_(options),
    logSink_(logSink),
    pool_(createTransport, target.parallelConnections, [this](const std::wstring& msg, MessageType type) { logMessage(msg, type); }),
    ignoreRulesLoader_(target.localPath),
    suppressor_(options.downloadSuppressionGrace),
    workers_(target.parallelConnections, Zstr("Sync worker ") + numberTo<Zstring>(target.id)) {}


SyncEngine::~SyncEngine()
{
    stopping_ = true; //queued tasks are dropped, in-flight transfers finish

    //1. no new work
    timerThread_ = InterruptibleThread(); //requests stop + joins: waits for a running cycle
    watcher_.reset();

    //2. in-flight transfers
    workers_.wait();

    //3. close connections
    pool_.shutdown();
    pool_.closeAll();

    logMessage(_("Synchronization stopped."), MSG_TYPE_INFO);
}


void SyncEngine::start()
{
    logMessage(replaceCpy(replaceCpy(_("Synchronization started: %x <-> %y"), L"%x", fmtPath(pathMap_.getLocalRoot())),
                          L"%y", utfTo<std::wstring>(getSyncModeName(target_.syncMode)) + L' ' + fmtPath(pathMap_.getRemoteRoot())), MSG_TYPE_INFO);

    pool_.preWarm();

    if (target_.syncMode == SyncMode::downloadOnly)
    {
        timerThread_ = InterruptibleThread([this]
        {
            setCurrentThreadName(Zstr("Sync once ") + numberTo<Zstring>(target_.id));

            CycleLock::Holder holder = cycleLock_.lock(); //throw ThreadStopRequest
            runCycle(); //throw ThreadStopRequest

            pool_.closeAll();
            logMessage(_("Single download cycle finished. Connections closed."), MSG_TYPE_INFO);
        });
        return;
    }

    watcher_ = std::make_unique<LocalWatcher>(pathMap_.getLocalRoot(),
                                              [this](const Zstring& relPath, bool isFolder) { return isExcluded(relPath, isFolder); },
                                              [this](const LocalChange& change) { onLocalChange(change); },
                                              suppressor_,
                                              [this](const std::wstring& msg, MessageType type) { logMessage(msg, type); },
                                              options_.watcher);

    timerThread_ = InterruptibleThread([this]
    {
        setCurrentThreadName(Zstr("Sync timer ") + numberTo<Zstring>(target_.id));

        for (;;) //first tick is immediate
        {
            if (std::optional<CycleLock::Holder> holder = cycleLock_.tryLock())
                runCycle(); //throw ThreadStopRequest
            else
                logMessage(_("Previous sync cycle is still running. Skipping this one."), MSG_TYPE_WARNING);

            interruptibleSleep(std::chrono::seconds(target_.syncIntervalSec)); //throw ThreadStopRequest
        }
    });
}


CycleSummary SyncEngine::triggerSyncNow() //throw ThreadStopRequest
{
    CycleLock::Holder holder = cycleLock_.lock(); //throw ThreadStopRequest
    return runCycle(); //throw ThreadStopRequest
}


CycleSummary SyncEngine::runCycle() //throw ThreadStopRequest
{
    logMessage(_("Sync cycle started."), MSG_TYPE_INFO);

    CycleSummary summary;

    const std::shared_ptr<const IgnoreRules> ignoreRules = getIgnoreRules();
    auto excluded = [&](const Zstring& relPath, bool isFolder) { return isHiddenPath(relPath) || ignoreRules->isIgnored(relPath, isFolder); };

    //------------------------------------------------------------------------------------
    std::map<Zstring, FileRecord> remoteFiles;
    try
    {
        PooledTransport transport = pool_.acquire(); //throw ThreadStopRequest
        transport->connect(); //throw ConnectionError

        auto onSubFolderError = [&](const ListError& e) { logMessage(e.toString(), MSG_TYPE_WARNING); };

        for (FileRecord& file : transport->listRecursive(pathMap_.getRemoteRoot(), onSubFolderError)) //throw ConnectionError, ListError
            if (!excluded(file.relPath, false /*isFolder*/))
                remoteFiles.emplace(file.relPath, std::move(file));
    }
    catch (const FileError& e) //ConnectionError, ListError: continue with empty remote tree
    {
        logMessage(e.toString(), MSG_TYPE_ERROR);
        summary.listFailed = true;
    }

    //local-only files are needed for uploads only
    std::map<Zstring, FileDetails> localFiles;
    if (allowsUpload(target_.syncMode))
        try
        {
            if (itemExists(pathMap_.getLocalRoot())) //throw FileError
            {
                auto onFile = [&](const Zstring& relPath, const FileInfo& fi)
                {
                    if (!excluded(relPath, false /*isFolder*/))
                        localFiles.emplace(relPath, FileDetails{fi.fileSize, fi.modTime});
                };
                auto onFolder = [&](const Zstring& relPath) { return !excluded(relPath, true /*isFolder*/); };

                traverseFolderRecursive(pathMap_.getLocalRoot(), onFile, onFolder); //throw FileError
            }
        }
        catch (const FileError& e)
        {
            logMessage(e.toString(), MSG_TYPE_ERROR);
            ++summary.failed;
        }

    //------------------------------------------------------------------------------------
    std::vector<TransferTask> tasks;

    auto evaluate = [&](const Zstring& relPath, std::optional<time_t> localModTime, std::optional<time_t> remoteModTime, uint64_t remoteSize)
    {
        switch (resolveConflict(localModTime, remoteModTime, target_.syncMode, target_.timeToleranceSec))
        {
            case SyncAction::none:
                ++summary.skipped;
                break;

            case SyncAction::upload:
                tasks.push_back({TaskType::upload, relPath,
                                 pathMap_.localFromRelative(relPath), pathMap_.remoteFromRelative(relPath), TaskTrigger::cycleScan});
                break;

            case SyncAction::download:
                tasks.push_back({TaskType::download, relPath,
                                 pathMap_.remoteFromRelative(relPath), pathMap_.localFromRelative(relPath), TaskTrigger::cycleScan, remoteSize});
                break;
        }
    };

    for (const auto& [relPath, remote] : remoteFiles)
    {
        std::optional<time_t> localModTime;
        if (allowsUpload(target_.syncMode))
        {
            if (auto it = localFiles.find(relPath); it != localFiles.end())
                localModTime = it->second.modTime;
        }
        else //download only: stat lazily
            try
            {
                if (const std::optional<FileDetails> details = getFileDetailsIfExists(pathMap_.localFromRelative(relPath))) //throw FileError
                    localModTime = details->modTime;
            }
            catch (const FileError& e)
            {
                logMessage(e.toString(), MSG_TYPE_ERROR);
                ++summary.failed;
                continue;
            }

        evaluate(relPath, localModTime, remote.modTime, remote.fileSize);
    }

    for (const auto& [relPath, local] : localFiles)
        if (!remoteFiles.contains(relPath))
            evaluate(relPath, local.modTime, std::nullopt, 0);

    //------------------------------------------------------------------------------------
    if (!tasks.empty())
    {
        std::mutex lockSummary;

        for (TransferTask& task : tasks)
        {
            const TaskType taskType = task.type;
            dispatchTask(std::move(task), [&, taskType](bool success)
            {
                std::lock_guard dummy(lockSummary);
                if (!success)
                    ++summary.failed;
                else
                    switch (taskType)
                    {
                        case TaskType::upload:
                            ++summary.uploaded;
                            break;
                        case TaskType::download:
                            ++summary.downloaded;
                            break;
                        case TaskType::remove:
                            ++summary.deleted;
                            break;
                    }
            });
        }
        workers_.wait(); //"summary" is referenced by pending tasks!
    }

    logMessage(_("Sync cycle completed.") + L'\n' + formatCycleSummary(summary),
               summary.failed > 0 || summary.listFailed ? MSG_TYPE_WARNING : MSG_TYPE_INFO);

    closeIdleConnections();
    return summary;
}


void SyncEngine::closeIdleConnections()
{
    if (std::chrono::seconds(target_.syncIntervalSec) > options_.idleCloseThreshold)
    {
        pool_.closeAll();
        logMessage(_("Idle connections closed until the next sync cycle."), MSG_TYPE_INFO);
    }
}


void SyncEngine::onLocalChange(const LocalChange& change)
{
    if (!allowsUpload(target_.syncMode))
        return;

    switch (change.type)
    {
        case LocalChangeType::created:
        case LocalChangeType::modified:
            dispatchTask({TaskType::upload, change.relPath,
                          pathMap_.localFromRelative(change.relPath), pathMap_.remoteFromRelative(change.relPath), TaskTrigger::watchEvent}, nullptr);
            break;

        case LocalChangeType::deleted:
            if (target_.syncDeletions)
                dispatchTask({TaskType::remove, change.relPath,
                              pathMap_.localFromRelative(change.relPath), pathMap_.remoteFromRelative(change.relPath), TaskTrigger::watchEvent}, nullptr);
            break;
    }
}


void SyncEngine::dispatchTask(TransferTask&& task, const std::function<void(bool success)>& onTaskDone /*noexcept*/)
{
    progress_.access([](ProgressState& ps)
    {
        if (ps.tasksPending++ == 0) //new batch
        {
            ps.filesInBatch   = 0;
            ps.filesCompleted = 0;
        }
        ++ps.filesInBatch;
    });

    workers_.run([this, task = std::move(task), onTaskDone]
    {
        ZEN_ON_SCOPE_EXIT(progress_.access([](ProgressState& ps)
        {
            --ps.tasksPending;
            ++ps.filesCompleted;
        }));

        if (stopping_)
            return;

        try
        {
            executeTask(task); //throw FileError, ThreadStopRequest
            if (onTaskDone)
                onTaskDone(true);
        }
        catch (const FileError& e)
        {
            logMessage(e.toString(), MSG_TYPE_ERROR);
            if (onTaskDone)
                onTaskDone(false);
        }
    });
}


void SyncEngine::executeTask(const TransferTask& task) //throw FileError, ThreadStopRequest
{
    const uint64_t transferId = progress_.access([&](ProgressState& ps)
    {
        const uint64_t id = ps.nextTransferId++;
        ps.active[id] = {task.relPath, task.bytesExpected, 0, std::chrono::steady_clock::now()};
        return id;
    });
    ZEN_ON_SCOPE_EXIT(progress_.access([&](ProgressState& ps) { ps.active.erase(transferId); }));

    uint64_t bytesTransferred = 0;
    const IoCallback notifyIO = [&](int64_t bytesDelta)
    {
        bytesTransferred += bytesDelta;
        progress_.access([&](ProgressState& ps) { ps.active[transferId].bytesTransferred = bytesTransferred; });
    };

    PooledTransport transport = pool_.acquire(); //throw ThreadStopRequest
    transport->connect(); //throw ConnectionError

    switch (task.type)
    {
        case TaskType::upload:
        {
            const uint64_t fileSize = getFileSize(task.sourcePath); //throw FileError
            progress_.access([&](ProgressState& ps) { ps.active[transferId].bytesTotal = fileSize; });

            const UploadResult result = transport->upload(task.sourcePath, task.targetPath, notifyIO); //throw ConnectionError, TransferError
            if (result.errorModTime)
                logMessage(result.errorModTime->toString(), MSG_TYPE_WARNING);

            logSink_.addTransferStat(target_.id, fileSize, TransferDirection::upload, std::time(nullptr));
            logMessage(replaceCpy(_("Uploaded %x."), L"%x", fmtPath(task.relPath)), MSG_TYPE_INFO);
        }
        break;

        case TaskType::download:
        {
            suppressor_.onDownloadStart(task.relPath);
            ZEN_ON_SCOPE_EXIT(suppressor_.onDownloadEnd(task.relPath, std::chrono::steady_clock::now()));

            transport->download(task.sourcePath, task.targetPath, notifyIO); //throw ConnectionError, TransferError, NotFoundError

            logSink_.addTransferStat(target_.id, bytesTransferred, TransferDirection::download, std::time(nullptr));
            logMessage(replaceCpy(_("Downloaded %x."), L"%x", fmtPath(task.relPath)), MSG_TYPE_INFO);
        }
        break;

        case TaskType::remove:
            transport->remove(task.targetPath); //throw ConnectionError, TransferError
            logMessage(replaceCpy(_("Deleted remote file %x."), L"%x", fmtPath(task.targetPath)), MSG_TYPE_INFO);
            break;
    }
}


void SyncEngine::manualUpload(const Zstring& relPath) //throw FileError
{
    const Zstring relPathFmt = [&]
    {
        Zstring tmp = normalizeSeparators(relPath);
        while (startsWith(tmp, FILE_NAME_SEPARATOR))
            tmp = tmp.substr(1);
        return tmp;
    }();
    const std::wstring errorMsg = replaceCpy(_("Cannot upload file %x."), L"%x", fmtPath(relPath));
    try
    {
        if (relPathFmt.empty() || !isValidRelPath(relPathFmt))
            throw TransferError(errorMsg, _("Invalid relative path."));

        const Zstring localPath = pathMap_.localFromRelative(relPathFmt);
        if (getItemTypeIfExists(localPath) != ItemType::file) //throw FileError
            throw TransferError(errorMsg, replaceCpy(_("Cannot find file %x."), L"%x", fmtPath(localPath)));

        executeTask({TaskType::upload, relPathFmt, localPath, pathMap_.remoteFromRelative(relPathFmt), TaskTrigger::manual}); //throw FileError, ThreadStopRequest
    }
    catch (const FileError& e)
    {
        logMessage(e.toString(), MSG_TYPE_ERROR);
        throw;
    }
}


void SyncEngine::manualDownload(const Zstring& remotePath) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(_("Cannot download file %x."), L"%x", fmtPath(remotePath));
    try
    {
        const Zstring remotePathFmt = normalizeSeparators(remotePath);
        if (!startsWith(remotePathFmt, FILE_NAME_SEPARATOR) || endsWith(remotePathFmt, FILE_NAME_SEPARATOR))
            throw TransferError(errorMsg, _("Invalid remote path."));

        //outside of remote root: place into local root by item name
        const Zstring relPath = startsWith(remotePathFmt, appendSeparator(pathMap_.getRemoteRoot())) ?
                                pathMap_.remoteToRelative(remotePathFmt) :
                                getItemName(remotePathFmt);
        if (relPath.empty() || !isValidRelPath(relPath))
            throw TransferError(errorMsg, _("Invalid remote path."));

        executeTask({TaskType::download, relPath, remotePathFmt, pathMap_.localFromRelative(relPath), TaskTrigger::manual}); //throw FileError, ThreadStopRequest
    }
    catch (const FileError& e)
    {
        logMessage(e.toString(), MSG_TYPE_ERROR);
        throw;
    }
}


SyncProgress SyncEngine::getProgress()
{
    const auto now = std::chrono::steady_clock::now();

    SyncProgress progress = progress_.access([&](ProgressState& ps)
    {
        SyncProgress output;
        output.filesInBatch   = ps.filesInBatch;
        output.filesCompleted = ps.filesCompleted;

        for (const auto& [id, ts] : ps.active)
        {
            ActiveTransfer at;
            at.name             = ts.name;
            at.bytesTotal       = ts.bytesTotal;
            at.bytesTransferred = ts.bytesTransferred;
            if (ts.bytesTotal > 0)
                at.percent = static_cast<int>(std::min<uint64_t>(ts.bytesTransferred * 100 / ts.bytesTotal, 100));

            const double elapsedSec = std::chrono::duration<double>(now - ts.startTime).count();
            if (elapsedSec > 0)
                at.bytesPerSec = ts.bytesTransferred / elapsedSec;

            if (at.bytesPerSec > 0 && ts.bytesTotal >= ts.bytesTransferred)
                at.remainingSec = static_cast<int64_t>(std::ceil((ts.bytesTotal - ts.bytesTransferred) / at.bytesPerSec));

            output.activeTransfers.push_back(std::move(at));
        }
        return output;
    });

    progress.queueLength = workers_.getTasksWaiting();
    return progress;
}


std::vector<LogEntry> SyncEngine::getLogs()
{
    return logRing_.access([](const std::deque<LogEntry>& ring) { return std::vector<LogEntry>(ring.begin(), ring.end()); });
}


bool SyncEngine::isExcluded(const Zstring& relPath, bool isFolder)
{
    return isHiddenPath(relPath) || getIgnoreRules()->isIgnored(relPath, isFolder);
}


std::shared_ptr<const IgnoreRules> SyncEngine::getIgnoreRules()
{
    try
    {
        return ignoreRulesLoader_.getRules(); //throw FileError
    }
    catch (const FileError& e)
    {
        logMessage(e.toString() + L"\n\n" + _("Using default ignore rules."), MSG_TYPE_WARNING);
        return std::make_shared<const IgnoreRules>(IgnoreRules::getDefault());
    }
}


void SyncEngine::logMessage(const std::wstring& msg, MessageType type) //noexcept
{
    const LogEntry entry{std::time(nullptr), type, utfTo<Zstringc>(msg)};

    logRing_.access([&](std::deque<LogEntry>& ring)
    {
        ring.push_front(entry);
        if (ring.size() > LOG_RING_SIZE)
            ring.pop_back();
    });

    logSink_.addLog(target_.id, entry);
}
