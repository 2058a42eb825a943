// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "file_access.h"
#include <deque>
#include <ctime>
    #include <fcntl.h>  //AT_FDCWD
    #include <unistd.h>
    #include <cstdio>   //rename

using namespace zen;


namespace
{
ItemType getItemTypeImpl(const Zstring& itemPath) //throw SysError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        THROW_LAST_SYS_ERROR("lstat");

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}
}


ItemType zen::getItemType(const Zstring& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), e.toString()); }
}


std::optional<ItemType> zen::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
    {
        const ErrorCode ec = getLastError(); //copy before making other system calls!
        if (ec == ENOENT || ec == ENOTDIR)
            return std::nullopt;

        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), formatSystemError("lstat", ec));
    }

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file;
}


std::optional<FileDetails> zen::getFileDetailsIfExists(const Zstring& filePath) //throw FileError
{
    struct stat fileInfo = {};
    if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
    {
        const ErrorCode ec = getLastError();
        if (ec == ENOENT || ec == ENOTDIR)
            return std::nullopt;

        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath)), formatSystemError("stat", ec));
    }

    if (!S_ISREG(fileInfo.st_mode))
        return std::nullopt;

    return FileDetails{static_cast<uint64_t>(fileInfo.st_size), fileInfo.st_mtim.tv_sec /*follow Windows Explorer: always round down!*/};
}


uint64_t zen::getFileSize(const Zstring& filePath) //throw FileError
{
    try
    {
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0)
            THROW_LAST_SYS_ERROR("stat");

        return fileInfo.st_size;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath)), e.toString()); }
}


void zen::setFileTime(const Zstring& filePath, time_t modTime) //throw FileError
{
    const timespec newTimes[2]
    {
        {.tv_sec = ::time(nullptr), .tv_nsec = 0}, //access time; don't use UTIME_NOW/UTIME_OMIT: more bugs!
        {.tv_sec = modTime,         .tv_nsec = 0},
    };

    if (::utimensat(AT_FDCWD, filePath.c_str(), newTimes, 0 /*follow symlinks*/) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write modification time of %x."), L"%x", fmtPath(filePath)), "utimensat");
}


void zen::removeFilePlain(const Zstring& filePath) //throw FileError
{
    try
    {
        if (::unlink(filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}


bool zen::removeFileIfExists(const Zstring& filePath) //throw FileError
{
    if (::unlink(filePath.c_str()) != 0)
    {
        const ErrorCode ec = getLastError();
        if (ec == ENOENT)
            return false;
        throw FileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), formatSystemError("unlink", ec));
    }
    return true;
}


void zen::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) //throw FileError, ErrorTargetExisting
{
    auto getErrorMsg = [&] { return replaceCpy(replaceCpy(_("Cannot move file %x to %y."), L"%x", L'\n' + fmtPath(pathFrom)), L"%y", L'\n' + fmtPath(pathTo)); };

    if (!replaceExisting)
    {
        //rename() will never fail with EEXIST, but always overwrite!
        //=> Linux: renameat2() with RENAME_NOREPLACE -> still new, probably buggy
        struct stat infoTarget = {};
        if (::lstat(pathTo.c_str(), &infoTarget) == 0)
            throw ErrorTargetExisting(getErrorMsg(), formatSystemError("rename", EEXIST));
    }

    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
        THROW_LAST_FILE_ERROR(getErrorMsg(), "rename");
}


void zen::createDirectory(const Zstring& dirPath) //throw FileError, ErrorTargetExisting
{
    try
    {
        //don't allow creating irregular folders!
        const Zstring dirName = getItemName(dirPath);
        if (std::all_of(dirName.begin(), dirName.end(), [](Zchar c) { return c == Zstr('.'); }))
            throw SysError(replaceCpy<std::wstring>(L"Invalid folder name %x.", L"%x", fmtPath(dirName)));

        const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

        if (::mkdir(dirPath.c_str(), mode) != 0)
        {
            const int ec = errno; //copy before directly or indirectly making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), formatSystemError("mkdir", ec));
            THROW_LAST_SYS_ERROR("mkdir");
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), e.toString()); }
}


void zen::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    //find first existing parent folder (backwards iteration):
    Zstring dirPathEx = normalizeSeparators(dirPath);
    std::deque<Zstring> dirNames;
    for (;;)
    {
        const std::optional<ItemType> type = getItemTypeIfExists(dirPathEx); //throw FileError
        if (type)
        {
            if (*type == ItemType::file /*obscure, but possible*/)
                throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)),
                                replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(dirPathEx))));
            break;
        }

        const std::optional<Zstring> parentPath = getParentFolderPath(dirPathEx);
        if (!parentPath) //device root
            throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)));

        dirNames.push_front(getItemName(dirPathEx));
        dirPathEx = *parentPath;
    }
    //-----------------------------------------------------------

    Zstring dirPathNew = dirPathEx;
    for (const Zstring& dirName : dirNames)
        try
        {
            dirPathNew = appendPath(dirPathNew, dirName);
            createDirectory(dirPathNew); //throw FileError, ErrorTargetExisting
        }
        catch (ErrorTargetExisting&) {} //concurrent creation by another thread: fine
}
