// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "file_path.h"
#include <cassert>
#include <cstdlib>

using namespace zen;


std::optional<Zstring> zen::getParentFolderPath(const Zstring& itemPath)
{
    const Zstring path = normalizeSeparators(itemPath);
    if (path.empty() || path == Zstr("/"))
        return std::nullopt;

    const size_t pos = path.rfind(FILE_NAME_SEPARATOR);
    if (pos == Zstring::npos)
        return std::nullopt;
    if (pos == 0)
        return Zstring(Zstr("/"));

    return path.substr(0, pos);
}


Zstring zen::appendSeparator(Zstring path) //support rvalue references!
{
    if (!endsWith(path, FILE_NAME_SEPARATOR))
        path += FILE_NAME_SEPARATOR;
    return path; //returning a by-value parameter => RVO if possible, r-value otherwise
}


bool zen::isValidRelPath(const Zstring& relPath)
{
    //relPath is expected to use FILE_NAME_SEPARATOR!
    if (startsWith(relPath, FILE_NAME_SEPARATOR) ||
        endsWith  (relPath, FILE_NAME_SEPARATOR) ||
        contains(relPath, Zstr("//")))
        return false;

    bool valid = true;
    split(relPath, FILE_NAME_SEPARATOR, [&](const ZstringView itemName)
    {
        if (itemName == Zstr(".") || itemName == Zstr(".."))
            valid = false;
    });
    return valid;
}


Zstring zen::appendPath(const Zstring& basePath, const Zstring& relPath)
{
    assert(isValidRelPath(relPath) || relPath.empty());
    if (relPath.empty())
        return basePath;

    if (basePath.empty())
        return relPath;

    if (endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + relPath;

    Zstring output = basePath;
    output.reserve(basePath.size() + 1 + relPath.size()); //append all three strings using a single memory allocation
    return std::move(output) + FILE_NAME_SEPARATOR + relPath;
}


Zstring zen::normalizeSeparators(const Zstring& path)
{
    Zstring output;
    output.reserve(path.size());

    for (const Zchar c : path)
        if (c != FILE_NAME_SEPARATOR || !endsWith(output, FILE_NAME_SEPARATOR))
            output += c;

    if (output.size() > 1 && endsWith(output, FILE_NAME_SEPARATOR))
        output.pop_back();
    return output;
}


std::optional<Zstring> zen::getEnvironmentVar(const ZstringView name)
{
    const char* buffer = ::getenv(Zstring(name).c_str()); //no extended error reporting
    if (!buffer)
        return {};
    Zstring val(buffer);

    //some messed up apps put quotation marks around the path
    if (startsWith(val, Zstr('\"')) && endsWith(val, Zstr('\"')) && val.size() >= 2)
        val = val.substr(1, val.size() - 2);

    return val;
}
