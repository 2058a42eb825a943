// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FILE_ACCESS_H_8017341345614857
#define FILE_ACCESS_H_8017341345614857

#include <functional>
#include "file_path.h"
#include "file_error.h"
    #include <sys/stat.h>

namespace zen
{
//report bytes transferred since last call: may throw to cancel
using IoCallback = std::function<void(int64_t bytesDelta)>;

enum class ItemType
{
    file,
    folder,
    symlink,
};
//(hopefully) fast: does not distinguish between error/not existing
ItemType getItemType(const Zstring& itemPath); //throw FileError
//distinguish error/not existing: ENOENT and ENOTDIR mean "not existing"
std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath); //throw FileError

inline bool itemExists(const Zstring& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError

struct FileDetails
{
    uint64_t fileSize = 0;
    time_t modTime = 0; //UTC, rounded down to seconds
};
//symlink handling: follow; no value if not existing or not a regular file
std::optional<FileDetails> getFileDetailsIfExists(const Zstring& filePath); //throw FileError

//symlink handling: follow
uint64_t getFileSize(const Zstring& filePath); //throw FileError

//symlink handling: follow
void setFileTime(const Zstring& filePath, time_t modTime); //throw FileError

void removeFilePlain(const Zstring& filePath); //throw FileError; ERROR if not existing
bool removeFileIfExists(const Zstring& filePath); //throw FileError; return false if not existing

//rename within the same file system
void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting); //throw FileError, ErrorTargetExisting

void createDirectory(const Zstring& dirPath); //throw FileError, ErrorTargetExisting

//creates directories recursively if not existing
void createDirectoryIfMissingRecursion(const Zstring& dirPath); //throw FileError
}

#endif //FILE_ACCESS_H_8017341345614857
