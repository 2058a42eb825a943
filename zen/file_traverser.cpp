// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "file_traverser.h"
#include "file_error.h"
#include "file_path.h"
    #include <sys/stat.h>
    #include <dirent.h>

using namespace zen;


void zen::traverseFolder(const Zstring& dirPath,
                         const std::function<void(const FileInfo&    fi)>& onFile,
                         const std::function<void(const FolderInfo&  fi)>& onFolder,
                         const std::function<void(const SymlinkInfo& si)>& onSymlink) //throw FileError
{
    DIR* folder = ::opendir(dirPath.c_str()); //directory must NOT end with path separator, except "/"
    if (!folder)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot open directory %x."), L"%x", fmtPath(dirPath)), "opendir");
    ZEN_ON_SCOPE_EXIT(::closedir(folder)); //never close nullptr handles! -> crash

    for (;;)
    {
        errno = 0;
        const dirent* dirEntry = ::readdir(folder); //don't use readdir_r(): deprecated
        if (!dirEntry)
        {
            if (errno == 0) //errno left unchanged => no more items
                return;

            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(dirPath)), "readdir");
        }

        //don't return "." and ".."
        const char* itemNameRaw = dirEntry->d_name;

        if (itemNameRaw[0] == '.' &&
            (itemNameRaw[1] == 0 || (itemNameRaw[1] == '.' && itemNameRaw[2] == 0)))
            continue;

        const Zstring& itemName = itemNameRaw;
        if (itemName.empty())
            throw FileError(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(dirPath)), formatSystemError("readdir", L"", L"Folder contains an item without name."));

        const Zstring& itemPath = appendPath(dirPath, itemName);

        struct stat statData = {};
        if (::lstat(itemPath.c_str(), &statData) != 0) //lstat() does not resolve symlinks
        {
            if (errno == ENOENT) //deleted while traversing: a watched folder is a moving target
                continue;
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), "lstat");
        }

        if (S_ISLNK(statData.st_mode)) //on Linux there is no distinction between file and directory symlinks!
        {
            if (onSymlink)
                onSymlink({itemName, itemPath, statData.st_mtime});
        }
        else if (S_ISDIR(statData.st_mode))
        {
            if (onFolder)
                onFolder({itemName, itemPath});
        }
        else if (S_ISREG(statData.st_mode)) //skip named pipes, devices, sockets: an "open" on a pipe will block
        {
            if (onFile)
                onFile({itemName, itemPath, static_cast<uint64_t>(statData.st_size), statData.st_mtime});
        }
    }
}


namespace
{
void traverseRecursiveImpl(const Zstring& dirPath, const Zstring& relPathPrefix,
                           const std::function<void(const Zstring& relPath, const FileInfo& fi)>& onFile,
                           const std::function<bool(const Zstring& relPath)>& onFolder) //throw FileError
{
    std::vector<FolderInfo> subFolders;

    traverseFolder(dirPath,
    [&](const FileInfo& fi) { onFile(relPathPrefix + fi.itemName, fi); },
    [&](const FolderInfo& fi) { subFolders.push_back(fi); },
    nullptr); //throw FileError

    //recurse after closing the directory handle: limit number of open handles
    for (const FolderInfo& fi : subFolders)
    {
        const Zstring relPath = relPathPrefix + fi.itemName;
        if (!onFolder || onFolder(relPath))
            traverseRecursiveImpl(fi.fullPath, relPath + FILE_NAME_SEPARATOR, onFile, onFolder); //throw FileError
    }
}
}


void zen::traverseFolderRecursive(const Zstring& baseDirPath,
                                  const std::function<void(const Zstring& relPath, const FileInfo& fi)>& onFile,
                                  const std::function<bool(const Zstring& relPath)>& onFolder) //throw FileError
{
    traverseRecursiveImpl(baseDirPath, Zstring(), onFile, onFolder); //throw FileError
}
