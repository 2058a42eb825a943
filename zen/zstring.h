// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef ZSTRING_H_73425873425789
#define ZSTRING_H_73425873425789

#include <stdexcept> //not used by this header, but the "rest of the world" needs it!
#include <string>
#include "utf.h"


using Zchar = char;
#define Zstr(x) x

//native file system paths: UTF-8 on Linux
using Zstring = std::basic_string<Zchar>;

using ZstringView = std::basic_string_view<Zchar>;

//UTF-8 payloads for log messages and protocol text
using Zstringc = std::string;

#endif //ZSTRING_H_73425873425789
