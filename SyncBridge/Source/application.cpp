// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <iostream>
#include <csignal>
#include <zen/extra_log.h>
#include <zen/file_path.h>
#include <zen/sys_error.h>
#include "afs/init_curl_libssh2.h"
#include "base/config.h"
#include "base/log_store.h"
#include "base/sync_manager.h"
#include "base/transport_factory.h"
#include "return_codes.h"

    #include <unistd.h> //getcwd()

using namespace zen;
using namespace sb;


namespace
{
std::mutex lockConsole; //serialize console output of all threads


void notifyAppError(const std::wstring& msg)
{
    std::lock_guard dummy(lockConsole);
    std::cerr << utfTo<std::string>(_("Error") + L": " + msg) + '\n';
}


void logToConsole(const std::wstring& msg, MessageType type)
{
    const std::string msgFmt = formatMessage({std::time(nullptr), type, utfTo<Zstringc>(msg)});

    std::lock_guard dummy(lockConsole);
    std::cerr << msgFmt;
}


void flushExtraLog()
{
    const ErrorLog extraLog = fetchExtraLog();

    std::lock_guard dummy(lockConsole);
    for (const LogEntry& entry : extraLog)
        std::cerr << formatMessage(entry);
}


void showSyntaxHelp()
{
    std::cerr << utfTo<std::string>(_("Syntax:") + L"\n" +
                                    L"syncbridge <config.json> [--once]" + L"\n\n" +
                                    L"--once" + L'\n' +
                                    _("Run one sync cycle for each target and exit.") + L"\n\n" +
                                    _("Signals:") + L'\n' +
                                    L"SIGINT, SIGTERM: " + _("Stop all targets and exit.") + L'\n' +
                                    L"SIGUSR1: " + _("Start a sync cycle for all targets now.")) + '\n';
}


Zstring getWorkingDirectory() //throw FileError
{
    char* dirPath = ::getcwd(nullptr, 0);
    if (!dirPath)
        THROW_LAST_FILE_ERROR(_("Cannot determine the working directory."), "getcwd");
    ZEN_ON_SCOPE_EXIT(::free(dirPath));

    return dirPath;
}


//forward log entries to the persistent store and the console
class DaemonLogSink : public LogSink
{
public:
    DaemonLogSink(LogStore& logStore, const std::vector<SyncTarget>& targets) : logStore_(logStore)
    {
        for (const SyncTarget& target : targets)
            targetNames_[target.id] = utfTo<Zstringc>(getTargetDisplayName(target));
    }

    void addLog(int targetId, const LogEntry& entry) override
    {
        Zstringc context;
        if (auto it = targetNames_.find(targetId); it != targetNames_.end())
            context = it->second;
        {
            std::lock_guard dummy(lockConsole);
            std::cerr << formatMessage(entry, context);
        }
        logStore_.addLog(targetId, entry);
    }

    void addTransferStat(int targetId, uint64_t bytes, TransferDirection direction, time_t time) override
    {
        logStore_.addTransferStat(targetId, bytes, direction, time);
    }

private:
    LogStore& logStore_;
    std::map<int, Zstringc> targetNames_; //read-only after construction
};


SbExitCode runOnce(const std::vector<SyncTarget>& targets, LogSink& logSink, const SyncEngine::Options& engineOptions)
{
    std::vector<std::future<CycleSummary>> futures;
    for (const SyncTarget& target : targets)
        futures.push_back(runAsync([&target, &logSink, &engineOptions]
        {
            SyncEngine engine(target, getTransportFactory(target), logSink, engineOptions); //no timer, no watcher
            return engine.triggerSyncNow();
        }));

    for (std::future<CycleSummary>& ft : futures)
        ft.wait(); //workers reference "targets" and "logSink"

    SbExitCode exitCode = SbExitCode::success;
    for (std::future<CycleSummary>& ft : futures)
    {
        const CycleSummary summary = ft.get();
        if (summary.failed > 0 || summary.listFailed)
            raiseExitCode(exitCode, SbExitCode::cycleFailed);
    }
    return exitCode;
}


SbExitCode runDaemon(const std::vector<SyncTarget>& targets, LogSink& logSink, const SyncEngine::Options& engineOptions, const sigset_t& sigSet)
{
    SyncManager manager(logSink, [](const SyncTarget& target) { return getTransportFactory(target); }, engineOptions);

    for (const SyncTarget& target : targets)
        manager.start(target);

    std::future<void> syncNowAll; //SIGUSR1 runs asynchronously: keep handling signals meanwhile

    for (;;)
    {
        flushExtraLog();

        const timespec timeout{1 /*sec*/, 0 /*nsec*/};
        const int sigNo = ::sigtimedwait(&sigSet, nullptr, &timeout);

        if (sigNo == SIGINT || sigNo == SIGTERM)
            break;

        if (sigNo == SIGUSR1)
        {
            if (syncNowAll.valid() && !isReady(syncNowAll))
                logToConsole(_("Sync cycles are still running. Ignoring signal SIGUSR1."), MSG_TYPE_WARNING);
            else
                syncNowAll = runAsync([&manager] { manager.triggerSyncNowAll(); });
        }
        else if (sigNo < 0 && errno != EAGAIN && errno != EINTR)
        {
            notifyAppError(formatSystemError("sigtimedwait", getLastError()));
            break;
        }
    }

    //stop timers and watchers first, then wait for "sync now" cycles still holding their engines
    manager.stopAll();
    if (syncNowAll.valid())
        syncNowAll.wait();

    return SbExitCode::success;
}
}


int main(int argc, char* argv[])
{
    bool runOnceOnly = false;
    Zstring configPath;

    for (int i = 1; i < argc; ++i)
    {
        const Zstring arg = argv[i];
        if (arg == Zstr("--once"))
            runOnceOnly = true;
        else if (arg == Zstr("--help") || arg == Zstr("-h"))
        {
            showSyntaxHelp();
            return static_cast<int>(SbExitCode::success);
        }
        else if (configPath.empty() && !startsWith(arg, Zstr('-')))
            configPath = arg;
        else
        {
            notifyAppError(replaceCpy(_("Unknown command line parameter %x."), L"%x", fmtPath(arg)));
            showSyntaxHelp();
            return static_cast<int>(SbExitCode::configError);
        }
    }
    if (configPath.empty())
    {
        showSyntaxHelp();
        return static_cast<int>(SbExitCode::configError);
    }

    //block before any thread is created: handled synchronously via sigtimedwait()
    sigset_t sigSet{};
    ::sigemptyset(&sigSet);
    ::sigaddset(&sigSet, SIGINT);
    ::sigaddset(&sigSet, SIGTERM);
    ::sigaddset(&sigSet, SIGUSR1);
    if (const int rv = ::pthread_sigmask(SIG_BLOCK, &sigSet, nullptr);
        rv != 0)
    {
        notifyAppError(formatSystemError("pthread_sigmask", rv));
        return static_cast<int>(SbExitCode::configError);
    }

    const UniInitializer uniInit; //libcurl, libssh2: outlive all transports

    ConfigReadResult cfgResult;
    try
    {
        const Zstring workingDir = getWorkingDirectory(); //throw FileError

        if (!startsWith(configPath, FILE_NAME_SEPARATOR))
            configPath = appendPath(workingDir, configPath);

        cfgResult = readConfig(configPath, workingDir); //throw FileError, ConfigError
    }
    catch (const FileError& e)
    {
        notifyAppError(e.toString());
        return static_cast<int>(SbExitCode::configError);
    }

    SbExitCode exitCode = SbExitCode::success;

    for (const ConfigError& e : cfgResult.invalidTargets)
        notifyAppError(e.toString());

    if (cfgResult.config.targets.empty())
    {
        notifyAppError(replaceCpy(_("No valid sync target found in %x."), L"%x", fmtPath(configPath)));
        return static_cast<int>(SbExitCode::configError);
    }

    SyncEngine::Options engineOptions;
    engineOptions.idleCloseThreshold = std::chrono::seconds(cfgResult.config.idleCloseThresholdSec);
    {
        LogStore logStore(cfgResult.config.stateDir); //flushes on destruction
        DaemonLogSink logSink(logStore, cfgResult.config.targets);

        raiseExitCode(exitCode, runOnceOnly ?
                      runOnce  (cfgResult.config.targets, logSink, engineOptions) :
                      runDaemon(cfgResult.config.targets, logSink, engineOptions, sigSet));
    }
    flushExtraLog();

    return static_cast<int>(exitCode);
}
