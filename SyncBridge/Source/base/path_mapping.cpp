// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "path_mapping.h"
#include <zen/file_path.h>

using namespace zen;
using namespace sb;


namespace
{
Zstring normalizePath(const Zstring& path)
{
    Zstring output = normalizeSeparators(path);
    if (output.size() > 1 && endsWith(output, FILE_NAME_SEPARATOR))
        output.pop_back();
    return output;
}


[[noreturn]] void throwContractViolation(const Zstring& path, const Zstring& root)
{
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation! " +
                           "Path \"" + utfTo<std::string>(path) + "\" is not located below \"" + utfTo<std::string>(root) + "\".");
}


Zstring getRelativePath(const Zstring& root, const Zstring& path) //throw std::logic_error
{
    const Zstring pathNorm = normalizePath(path);
    if (pathNorm == root)
        return Zstring();

    const Zstring rootPrefix = appendSeparator(root);
    if (!startsWith(pathNorm, rootPrefix))
        throwContractViolation(path, root);

    Zstring relPath = pathNorm.substr(rootPrefix.size());
    if (!isValidRelPath(relPath)) //e.g. "root/../etc"
        throwContractViolation(path, root);

    return relPath;
}


Zstring getAbsolutePath(const Zstring& root, const Zstring& relPath) //throw std::logic_error
{
    if (relPath.empty())
        return root;

    if (!isValidRelPath(relPath))
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation! " +
                               "Invalid relative path \"" + utfTo<std::string>(relPath) + "\".");
    return appendPath(root, relPath);
}
}


PathMapping::PathMapping(const Zstring& localRoot, const Zstring& remoteRoot) :
    localRoot_ (normalizePath(localRoot)),
    remoteRoot_(normalizePath(remoteRoot))
{
    if (!startsWith(localRoot_,  FILE_NAME_SEPARATOR) ||
        !startsWith(remoteRoot_, FILE_NAME_SEPARATOR))
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation! Roots must be absolute.");
}


Zstring PathMapping::localToRelative (const Zstring& localPath ) const { return getRelativePath(localRoot_,  localPath); }
Zstring PathMapping::remoteToRelative(const Zstring& remotePath) const { return getRelativePath(remoteRoot_, remotePath); }

Zstring PathMapping::localFromRelative (const Zstring& relPath) const { return getAbsolutePath(localRoot_,  relPath); }
Zstring PathMapping::remoteFromRelative(const Zstring& relPath) const { return getAbsolutePath(remoteRoot_, relPath); }

Zstring PathMapping::toRemote(const Zstring& localPath ) const { return remoteFromRelative(localToRelative(localPath)); }
Zstring PathMapping::toLocal (const Zstring& remotePath) const { return localFromRelative(remoteToRelative(remotePath)); }
