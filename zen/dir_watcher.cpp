// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "dir_watcher.h"
#include <unordered_map>
#include "scope_guard.h"
#include "file_path.h"
#include "file_traverser.h"
#include "file_access.h"
    #include <sys/inotify.h>
    #include <poll.h>
    #include <fcntl.h> //fcntl
    #include <unistd.h> //close
    #include <limits.h> //NAME_MAX

using namespace zen;


struct DirWatcher::Impl
{
    int notifDescr = 0;
    std::unordered_map<int, Zstring> watchedPaths; //watch descriptor and (sub-)directory paths -> owned by "notifDescr"
};


DirWatcher::DirWatcher(const Zstring& dirPath, const std::function<bool(const Zstring& relPath)>& excludeFolder) : //throw FileError
    baseDirPath_(normalizeSeparators(dirPath)),
    excludeFolder_(excludeFolder),
    pimpl_(std::make_unique<Impl>())
{
    //init
    pimpl_->notifDescr = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (pimpl_->notifDescr == -1)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot monitor directory %x."), L"%x", fmtPath(baseDirPath_)), "inotify_init1");

    ZEN_ON_SCOPE_FAIL( ::close(pimpl_->notifDescr); );

    addWatchRecursive(baseDirPath_); //throw FileError
}


DirWatcher::~DirWatcher()
{
    ::close(pimpl_->notifDescr); //associated watches are removed automatically!
}


size_t DirWatcher::getWatchCount() const { return pimpl_->watchedPaths.size(); }


void DirWatcher::addWatchRecursive(const Zstring& dirPath) //throw FileError
{
    //get all subdirectories
    std::vector<Zstring> fullFolderList{dirPath};

    const Zstring relPrefix = dirPath == baseDirPath_ ? Zstring() :
                              appendSeparator(Zstring(strView(dirPath).substr(appendSeparator(baseDirPath_).size())));
    traverseFolderRecursive(dirPath, [](const Zstring& /*relPath*/, const FileInfo& /*fi*/) {},
                            [&](const Zstring& relPath)
    {
        if (excludeFolder_ && excludeFolder_(relPrefix + relPath))
            return false;
        fullFolderList.push_back(appendPath(dirPath, relPath));
        return true;
    }); //throw FileError

    //add watches
    for (const Zstring& subDirPath : fullFolderList)
    {
        const int wd = ::inotify_add_watch(pimpl_->notifDescr, subDirPath.c_str(),
                                           IN_ONLYDIR     | //"Only watch pathname if it is a directory."
                                           IN_DONT_FOLLOW | //don't follow symbolic links
                                           IN_CREATE      |
                                           IN_CLOSE_WRITE |
                                           IN_DELETE      |
                                           IN_DELETE_SELF |
                                           IN_MOVED_FROM  |
                                           IN_MOVED_TO    |
                                           IN_MOVE_SELF);
        if (wd == -1)
        {
            const ErrorCode ec = getLastError(); //copy before directly/indirectly making other system calls!
            if (ec == ENOENT) //sub folder deleted in the meantime
                continue;
            if (ec == ENOSPC) //fix misleading system message "No space left on device"
                throw FileError(replaceCpy(_("Cannot monitor directory %x."), L"%x", fmtPath(subDirPath)),
                                formatSystemError("inotify_add_watch", L"ENOSPC",
                                                  L"The user limit on the total number of inotify watches was reached or the kernel failed to allocate a needed resource."));

            throw FileError(replaceCpy(_("Cannot monitor directory %x."), L"%x", fmtPath(subDirPath)), formatSystemError("inotify_add_watch", ec));
        }

        pimpl_->watchedPaths[wd] = subDirPath;
    }
}


bool DirWatcher::waitForChanges(std::chrono::milliseconds timeout) //throw FileError
{
    pollfd pfd{.fd = pimpl_->notifDescr, .events = POLLIN, .revents = 0};

    const int rv = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rv < 0)
    {
        if (errno == EINTR)
            return false;
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot monitor directory %x."), L"%x", fmtPath(baseDirPath_)), "poll");
    }
    return rv > 0;
}


std::vector<DirWatcher::Change> DirWatcher::fetchChanges() //throw FileError
{
    std::vector<std::byte> buf(512 * (sizeof(inotify_event) + NAME_MAX + 1));
    std::vector<Change> output;

    for (;;)
    {
        ssize_t bytesRead = 0;
        do
        {
            //non-blocking call, see IN_NONBLOCK
            bytesRead = ::read(pimpl_->notifDescr, buf.data(), buf.size());
        }
        while (bytesRead < 0 && errno == EINTR); //"Interrupted function call; When this happens, you should try the call again."

        if (bytesRead < 0)
        {
            if (errno == EAGAIN) //no more events queued
                return output;

            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot monitor directory %x."), L"%x", fmtPath(baseDirPath_)), "read");
        }

        std::vector<Zstring> newFolders;

        ssize_t bytePos = 0;
        while (bytePos < bytesRead)
        {
            const inotify_event& evt = reinterpret_cast<const inotify_event&>(buf[bytePos]);

            if (evt.mask & IN_IGNORED) //watch removed: folder deleted or moved away
                pimpl_->watchedPaths.erase(evt.wd);
            else if (evt.len != 0) //exclude case: deletion of "self", already reported by parent directory watch
            {
                auto it = pimpl_->watchedPaths.find(evt.wd);
                if (it != pimpl_->watchedPaths.end())
                {
                    //Note: evt.len is NOT the size of the evt.name c-string, but the array size including all padding 0 characters!
                    //It may be even 0 in which case evt.name must not be used!
                    const Zstring itemPath = appendPath(it->second, evt.name);
                    const bool isFolder = evt.mask & IN_ISDIR;

                    if ((evt.mask & IN_CREATE) ||
                        (evt.mask & IN_MOVED_TO))
                    {
                        output.push_back({ChangeType::create, itemPath, isFolder});
                        if (isFolder)
                            newFolders.push_back(itemPath);
                    }
                    else if (evt.mask & IN_CLOSE_WRITE)
                        output.push_back({ChangeType::update, itemPath, isFolder});
                    else if ((evt.mask & IN_DELETE     ) ||
                             (evt.mask & IN_MOVED_FROM))
                        output.push_back({ChangeType::remove, itemPath, isFolder});
                }
            }
            bytePos += sizeof(inotify_event) + evt.len;
        }

        for (const Zstring& folderPath : newFolders)
        {
            const Zstring relPath(strView(folderPath).substr(appendSeparator(baseDirPath_).size()));
            if (excludeFolder_ && excludeFolder_(relPath))
                continue;

            try
            {
                //files created inside the new folder before the watch was installed would be missed: report them as well
                traverseFolderRecursive(folderPath, [&](const Zstring& /*relPath*/, const FileInfo& fi)
                {
                    output.push_back({ChangeType::create, fi.fullPath, false});
                },
                [&](const Zstring& subRelPath) { return !excludeFolder_ || !excludeFolder_(relPath + FILE_NAME_SEPARATOR + subRelPath); }); //throw FileError

                addWatchRecursive(folderPath); //throw FileError
            }
            catch (FileError&)
            {
                if (itemExists(folderPath)) //throw FileError
                    throw;
                //else: folder was removed again before we could watch it: a "remove" event is queued already
            }
        }
    }
}
