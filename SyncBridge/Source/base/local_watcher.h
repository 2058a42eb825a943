// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef LOCAL_WATCHER_H_2938475610293847
#define LOCAL_WATCHER_H_2938475610293847

#include <map>
#include <zen/thread.h>
#include "../afs/transport.h"


namespace sb
{
enum class LocalChangeType
{
    created,
    modified,
    deleted,
};

struct LocalChange
{
    LocalChangeType type = LocalChangeType::modified;
    Zstring relPath; //relative to local root
};

using SteadyTime = std::chrono::steady_clock::time_point;


//collapse bursts of changes per path: emit once no further change arrived within the stability window
class ChangeDebouncer
{
public:
    explicit ChangeDebouncer(std::chrono::milliseconds stabilityWindow) : stabilityWindow_(stabilityWindow) {}

    void add(LocalChangeType type, const Zstring& relPath, SteadyTime now); //resets deadline of "relPath"

    std::vector<LocalChange> fetchSettled(SteadyTime now);

    std::optional<SteadyTime> getNextDeadline() const;
    size_t getPendingCount() const { return pending_.size(); }

private:
    struct PendingChange
    {
        LocalChangeType type;
        SteadyTime deadline;
    };

    const std::chrono::milliseconds stabilityWindow_;
    std::map<Zstring, PendingChange> pending_;
};


//paths being downloaded must not trigger uploads: suppressed during download plus grace period
//includes the download's temp file (see writeLocalFileTransactional())
class ChangeSuppressor
{
public:
    explicit ChangeSuppressor(std::chrono::milliseconds gracePeriod) : gracePeriod_(gracePeriod) {}

    void onDownloadStart(const Zstring& relPath);
    void onDownloadEnd  (const Zstring& relPath, SteadyTime now);

    bool isSuppressed(const Zstring& relPath, SteadyTime now);

private:
    struct Suppression
    {
        int activeDownloads = 0;
        SteadyTime graceEnd;
    };

    const std::chrono::milliseconds gracePeriod_;
    zen::Protected<std::map<Zstring, Suppression>> suppressions_;
};


/*  monitor local root recursively (Linux inotify) and report settled changes:
    - folders themselves are not reported, only the files inside
    - initial state is not reported
    - excluded and suppressed paths are dropped
    - local root not (yet) existing or removed: retry every second                  */
class LocalWatcher
{
public:
    struct Options
    {
        std::chrono::milliseconds stabilityWindow{2000};
        std::chrono::milliseconds rootRetryInterval{1000};
    };

    LocalWatcher(const Zstring& localRoot,
                 const std::function<bool(const Zstring& relPath, bool isFolder)>& isExcluded, /*thread-safe*/
                 const std::function<void(const LocalChange& change)>& onChange, /*called on watcher thread; may throw ThreadStopRequest*/
                 ChangeSuppressor& suppressor, /*must outlive LocalWatcher*/
                 const LogMessageFun& logMessage,
                 const Options& options);
    ~LocalWatcher(); //stops monitoring: waits for a running "onChange" to finish

private:
    LocalWatcher           (const LocalWatcher&) = delete;
    LocalWatcher& operator=(const LocalWatcher&) = delete;

    void runMonitor(); //throw ThreadStopRequest
    void emitChange(LocalChange change); //throw ThreadStopRequest

    const Zstring localRoot_;
    const std::function<bool(const Zstring& relPath, bool isFolder)> isExcluded_;
    const std::function<void(const LocalChange& change)> onChange_;
    ChangeSuppressor& suppressor_;
    const LogMessageFun logMessage_;
    const Options options_;

    zen::InterruptibleThread monitorThread_; //declare last: starts in constructor
};
}

#endif //LOCAL_WATCHER_H_2938475610293847
