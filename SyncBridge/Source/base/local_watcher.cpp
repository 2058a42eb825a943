// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "local_watcher.h"
#include <algorithm>
#include <zen/dir_watcher.h>
#include <zen/file_access.h>
#include <zen/file_path.h>

using namespace zen;
using namespace sb;


void ChangeDebouncer::add(LocalChangeType type, const Zstring& relPath, SteadyTime now)
{
    auto [it, inserted] = pending_.try_emplace(relPath, PendingChange{type, now + stabilityWindow_});
    if (!inserted)
    {
        PendingChange& change = it->second;
        change.deadline = now + stabilityWindow_;

        if (change.type == LocalChangeType::created && type == LocalChangeType::modified)
            ; //still a new file
        else if (change.type == LocalChangeType::deleted && type == LocalChangeType::created)
            change.type = LocalChangeType::modified; //replaced
        else
            change.type = type;
    }
}


std::vector<LocalChange> ChangeDebouncer::fetchSettled(SteadyTime now)
{
    std::vector<LocalChange> output;
    for (auto it = pending_.begin(); it != pending_.end();)
        if (it->second.deadline <= now)
        {
            output.push_back({it->second.type, it->first});
            it = pending_.erase(it);
        }
        else
            ++it;
    return output;
}


std::optional<SteadyTime> ChangeDebouncer::getNextDeadline() const
{
    std::optional<SteadyTime> deadline;
    for (const auto& [relPath, change] : pending_)
        if (!deadline || change.deadline < *deadline)
            deadline = change.deadline;
    return deadline;
}

//------------------------------------------------------------------------------------------

void ChangeSuppressor::onDownloadStart(const Zstring& relPath)
{
    suppressions_.access([&](std::map<Zstring, Suppression>& suppressions) { ++suppressions[relPath].activeDownloads; });
}


void ChangeSuppressor::onDownloadEnd(const Zstring& relPath, SteadyTime now)
{
    suppressions_.access([&](std::map<Zstring, Suppression>& suppressions)
    {
        Suppression& sup = suppressions[relPath];
        sup.activeDownloads = std::max(sup.activeDownloads - 1, 0);
        sup.graceEnd = now + gracePeriod_;
    });
}


bool ChangeSuppressor::isSuppressed(const Zstring& relPath, SteadyTime now)
{
    return suppressions_.access([&](std::map<Zstring, Suppression>& suppressions)
    {
        auto isActive = [&](const Zstring& path)
        {
            auto it = suppressions.find(path);
            if (it == suppressions.end())
                return false;

            if (it->second.activeDownloads > 0 || now < it->second.graceEnd)
                return true;

            suppressions.erase(it); //expired
            return false;
        };

        if (isActive(relPath))
            return true;

        //the temp file a download is written to
        if (const std::optional<Zstring> targetPath = getTransactionalTargetPath(relPath))
            return isActive(*targetPath);

        return false;
    });
}

//------------------------------------------------------------------------------------------

LocalWatcher::LocalWatcher(const Zstring& localRoot,
                           const std::function<bool(const Zstring& relPath, bool isFolder)>& isExcluded,
                           const std::function<void(const LocalChange& change)>& onChange,
                           ChangeSuppressor& suppressor,
                           const LogMessageFun& logMessage,
                           const Options& options) :
    localRoot_(localRoot),
    isExcluded_(isExcluded),
    onChange_(onChange),
    suppressor_(suppressor),
    logMessage_(logMessage),
    options_(options)
{
    monitorThread_ = InterruptibleThread([this]
    {
        setCurrentThreadName(Zstr("Local watcher"));
        runMonitor(); //throw ThreadStopRequest
    });
}


LocalWatcher::~LocalWatcher()
{
    monitorThread_.requestStop();
    monitorThread_.join();
}


void LocalWatcher::runMonitor() //throw ThreadStopRequest
{
    ChangeDebouncer debouncer(options_.stabilityWindow);
    std::unique_ptr<DirWatcher> watcher;
    bool rootUnavailableReported = false;

    const Zstring rootPrefix = appendSeparator(localRoot_);

    auto checkRootExisting = [&] //throw FileError
    {
        //removal of base directory is NOT notified by DirWatcher
        if (getItemTypeIfExists(localRoot_) != ItemType::folder) //throw FileError
            throw FileError(replaceCpy(_("Cannot find folder %x."), L"%x", fmtPath(localRoot_)));
    };

    for (;;)
    {
        if (!watcher)
            try
            {
                checkRootExisting(); //throw FileError

                watcher = std::make_unique<DirWatcher>(localRoot_, [this](const Zstring& relPath) { return isExcluded_(relPath, true /*isFolder*/); }); //throw FileError

                if (rootUnavailableReported)
                    logMessage_(replaceCpy(_("Monitoring folder %x resumed."), L"%x", fmtPath(localRoot_)), MSG_TYPE_INFO);
                rootUnavailableReported = false;
            }
            catch (const FileError& e)
            {
                if (!rootUnavailableReported)
                    logMessage_(e.toString() + L"\n\n" + _("Retrying every second..."), MSG_TYPE_WARNING);
                rootUnavailableReported = true;

                interruptibleSleep(options_.rootRetryInterval); //throw ThreadStopRequest
                continue;
            }

        try
        {
            std::chrono::milliseconds timeout = options_.rootRetryInterval;
            if (const std::optional<SteadyTime> deadline = debouncer.getNextDeadline())
                timeout = std::clamp(std::chrono::ceil<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now()),
                                     std::chrono::milliseconds(0), timeout);

            if (watcher->waitForChanges(timeout)) //throw FileError
                for (const DirWatcher::Change& change : watcher->fetchChanges()) //throw FileError
                {
                    if (change.isFolder || !startsWith(change.itemPath, rootPrefix))
                        continue;

                    const Zstring relPath = change.itemPath.substr(rootPrefix.size());
                    if (isExcluded_(relPath, false /*isFolder*/))
                        continue;

                    const SteadyTime now = std::chrono::steady_clock::now();
                    if (suppressor_.isSuppressed(relPath, now))
                        continue;

                    switch (change.type)
                    {
                        case DirWatcher::ChangeType::create:
                            debouncer.add(LocalChangeType::created, relPath, now);
                            break;
                        case DirWatcher::ChangeType::update:
                            debouncer.add(LocalChangeType::modified, relPath, now);
                            break;
                        case DirWatcher::ChangeType::remove:
                            debouncer.add(LocalChangeType::deleted, relPath, now);
                            break;
                    }
                }

            checkRootExisting(); //throw FileError
        }
        catch (const FileError& e)
        {
            logMessage_(e.toString() + L"\n\n" + _("Retrying every second..."), MSG_TYPE_WARNING);
            rootUnavailableReported = true;
            watcher.reset();
            continue;
        }

        interruptionPoint(); //throw ThreadStopRequest

        for (const LocalChange& change : debouncer.fetchSettled(std::chrono::steady_clock::now()))
            emitChange(change); //throw ThreadStopRequest
    }
}


void LocalWatcher::emitChange(LocalChange change) //throw ThreadStopRequest
{
    if (suppressor_.isSuppressed(change.relPath, std::chrono::steady_clock::now()))
        return;

    //report what the item *is* now, not how it got there
    try
    {
        const std::optional<ItemType> type = getItemTypeIfExists(appendPath(localRoot_, change.relPath)); //throw FileError

        if (change.type == LocalChangeType::deleted)
        {
            if (type == ItemType::file) //re-created in the meantime
                change.type = LocalChangeType::modified;
        }
        else if (!type)
            change.type = LocalChangeType::deleted;

        if (type && *type != ItemType::file) //folders and symlinks are not synced
            return;
    }
    catch (const FileError& e)
    {
        logMessage_(e.toString(), MSG_TYPE_WARNING);
        return;
    }

    onChange_(change); //throw ThreadStopRequest
}
