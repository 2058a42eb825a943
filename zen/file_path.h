// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FILE_PATH_H_3984678473567247567
#define FILE_PATH_H_3984678473567247567

#include <optional>
#include "zstring.h"


namespace zen
{
const Zchar FILE_NAME_SEPARATOR = '/';

std::optional<Zstring> getParentFolderPath(const Zstring& itemPath); //no value for root or relative single-name paths
inline Zstring getItemName(const Zstring& itemPath) { return afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all); }

Zstring appendSeparator(Zstring path); //support rvalue references!

bool isValidRelPath(const Zstring& relPath);

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

//collapse duplicate separators and drop a trailing one (except for root "/")
Zstring normalizeSeparators(const Zstring& path);

std::optional<Zstring> getEnvironmentVar(const ZstringView name);
}

#endif //FILE_PATH_H_3984678473567247567
