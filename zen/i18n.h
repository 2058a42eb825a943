// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef I18_N_H_3843489325044253425456
#define I18_N_H_3843489325044253425456

#include <cstdint>
#include "string_tools.h"


//minimal layer marking user-facing text - without platform/library dependencies!

#define ZEN_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s)        zen::translate(ZEN_TRANS_CONCAT_SUB(L, s))
#define _P(s, p, n) zen::translate(ZEN_TRANS_CONCAT_SUB(L, s), ZEN_TRANS_CONCAT_SUB(L, p), n)
//source and translation are required to use %x as number placeholder
//for plural form, which will be substituted automatically!!!

namespace zen
{
//the daemon ships English text only: translation is the identity
inline
std::wstring translate(const std::wstring& text)
{
    return text;
}


inline
std::wstring translate(const std::wstring& singular, const std::wstring& plural, int64_t n)
{
    return replaceCpy(n == 1 || n == -1 ? singular : plural, L"%x", numberTo<std::wstring>(n));
}
}

#endif //I18_N_H_3843489325044253425456
