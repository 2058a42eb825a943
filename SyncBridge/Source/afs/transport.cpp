// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "transport.h"
#include <algorithm>
#include <zen/file_io.h>
#include <zen/extra_log.h>

using namespace zen;
using namespace sb;


void sb::writeLocalFileTransactional(const Zstring& localPath, std::optional<time_t> modTime,
                                     const std::function<void(const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock)>& produceContent /*throw X*/) //throw FileError, X
{
    if (const std::optional<Zstring>& parentPath = getParentFolderPath(localPath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    const Zstring tmpFilePath = getPathWithTempName(localPath);
    {
        FileOutputPlain fileOut(tmpFilePath); //throw FileError, (ErrorTargetExisting)
        //=> ~FileOutputPlain() deletes the incomplete temp file on error

        produceContent([&](const void* buffer, size_t bytesToWrite) //throw FileError
        {
            const char* it = static_cast<const char*>(buffer);
            const char* const itEnd = it + bytesToWrite;
            while (it != itEnd)
                it += fileOut.tryWrite(it, itEnd - it); //throw FileError; may return short
        }); //throw FileError, X

        fileOut.close(); //throw FileError
    }
    {
        ZEN_ON_SCOPE_FAIL(try { removeFilePlain(tmpFilePath); /*throw FileError*/ }
        catch (const FileError& e) { logExtraError(e.toString()); });

        moveAndRenameItem(tmpFilePath, localPath, true /*replaceExisting*/); //throw FileError, (ErrorTargetExisting)
    }

    if (modTime)
        setFileTime(localPath, *modTime); //throw FileError
}


void KnownFolders::forgetParentsOf(const Zstring& itemPath)
{
    std::erase_if(folderPaths_, [&](const Zstring& folderPath) { return startsWith(itemPath, appendSeparator(folderPath)); });
}


std::optional<Zstring> sb::getTransactionalTargetPath(const Zstring& tmpFilePath)
{
    //see getPathWithTempName(): <file name>.<4 hex digits>.tmp
    if (!endsWith(tmpFilePath, Zstr(".tmp")))
        return std::nullopt;

    const Zstring pathNoExt = beforeLast(tmpFilePath, Zstr('.'), IfNotFoundReturn::none);
    const Zstring shortGuid = afterLast(pathNoExt, Zstr('.'), IfNotFoundReturn::none);
    auto isLowerHex = [](Zchar c) { return isDigit(c) || (Zstr('a') <= c && c <= Zstr('f')); };
    if (shortGuid.size() != 4 || !std::all_of(shortGuid.begin(), shortGuid.end(), isLowerHex))
        return std::nullopt;

    const Zstring targetPath = beforeLast(pathNoExt, Zstr('.'), IfNotFoundReturn::none);
    if (targetPath.empty() || endsWith(targetPath, FILE_NAME_SEPARATOR))
        return std::nullopt;

    return targetPath;
}
