// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef EXTRA_LOG_H_601673246392441846218957402563
#define EXTRA_LOG_H_601673246392441846218957402563

#include "error_log.h"
#include "thread.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - while an exception is in flight
    - cleanup errors
    - failures of the log sink itself                                */

namespace zen
{
namespace impl
{
inline Protected<ErrorLog>& refExtraLog()
{
    static Protected<ErrorLog> extraLog; //"magic static": thread-safe init
    return extraLog;
}
}


inline
ErrorLog fetchExtraLog()
{
    return impl::refExtraLog().access([](ErrorLog& log) { return std::exchange(log, ErrorLog()); });
}


inline
void logExtraError(const std::wstring& msg) //nothrow!
{
    try
    {
        impl::refExtraLog().access([&](ErrorLog& log) { logMsg(log, msg, MSG_TYPE_ERROR); });
    }
    catch (const std::bad_alloc&) { assert(false); } //no memory left to report this anywhere
}
}

#endif //EXTRA_LOG_H_601673246392441846218957402563
