// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef DIR_WATCHER_348577025748023458
#define DIR_WATCHER_348577025748023458

#include <vector>
#include <chrono>
#include <functional>
#include <memory>
#include "file_error.h"


namespace zen
{
//Linux: inotify https://linux.die.net/man/7/inotify

//watch directory including subdirectories
/*
!Note handling of directories!:
    inotify reports newly added subdirectories but does not watch them automatically!
    => fetchChanges() installs watches for new folders (and their contents) as they are reported
    removal of base directory is NOT notified! => check existence externally
*/
class DirWatcher
{
public:
    //"excludeFolder": relative path of a sub folder => true to not watch it
    DirWatcher(const Zstring& dirPath, const std::function<bool(const Zstring& relPath)>& excludeFolder /*optional*/); //throw FileError
    ~DirWatcher();

    enum class ChangeType
    {
        create,
        update,
        remove,
    };

    struct Change
    {
        ChangeType type = ChangeType::create;
        Zstring itemPath;
        bool isFolder = false;
    };

    //block until events are available or timeout: return false on timeout
    bool waitForChanges(std::chrono::milliseconds timeout); //throw FileError

    //extract accumulated changes since last call: non-blocking
    std::vector<Change> fetchChanges(); //throw FileError

    size_t getWatchCount() const;

private:
    DirWatcher           (const DirWatcher&) = delete;
    DirWatcher& operator=(const DirWatcher&) = delete;

    void addWatchRecursive(const Zstring& dirPath); //throw FileError

    const Zstring baseDirPath_;
    const std::function<bool(const Zstring& relPath)> excludeFolder_;

    struct Impl;
    const std::unique_ptr<Impl> pimpl_;
};
}

#endif
