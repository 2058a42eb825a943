// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef UTF_H_01832479146991573473545
#define UTF_H_01832479146991573473545

#include "string_tools.h"


namespace zen
{
//convert all(!) char- and wchar_t-based "string-like" objects applying UTF conversions (but only if necessary!)
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

const char BYTE_ORDER_MARK_UTF8[] = "\xEF\xBB\xBF";

template <class UtfString>
bool isValidUtf(const UtfString& str);





//----------------------- implementation ----------------------------------
namespace impl
{
using CodePoint = uint32_t;

const CodePoint LEAD_SURROGATE      = 0xd800;
const CodePoint TRAIL_SURROGATE_MAX = 0xdfff;
const CodePoint CODE_POINT_MAX      = 0x10ffff;
const CodePoint REPLACEMENT_CHAR    = 0xfffd;


template <class Function> inline
void codePointToUtf8(CodePoint cp, Function writeOutput)
{
    if (cp < 0x80)
        writeOutput(static_cast<char>(cp));
    else if (cp < 0x800)
    {
        writeOutput(static_cast<char>((cp >> 6  ) | 0xc0));
        writeOutput(static_cast<char>((cp & 0x3f) | 0x80));
    }
    else if (cp < 0x10000)
    {
        writeOutput(static_cast<char>(( cp >> 12        ) | 0xe0));
        writeOutput(static_cast<char>(((cp >> 6) & 0x3f ) | 0x80));
        writeOutput(static_cast<char>(( cp & 0x3f       ) | 0x80));
    }
    else
    {
        writeOutput(static_cast<char>(( cp >> 18        ) | 0xf0));
        writeOutput(static_cast<char>(((cp >> 12) & 0x3f) | 0x80));
        writeOutput(static_cast<char>(((cp >> 6 ) & 0x3f) | 0x80));
        writeOutput(static_cast<char>(( cp & 0x3f       ) | 0x80));
    }
}


//returns REPLACEMENT_CHAR for invalid sequences; "it" advances past the decoded sequence
inline
CodePoint decodeUtf8(std::string_view::const_iterator& it, std::string_view::const_iterator itEnd, bool& valid)
{
    const unsigned char lead = static_cast<unsigned char>(*it++);
    if (lead < 0x80)
        return lead;

    size_t trailCount = 0;
    CodePoint cp = 0;
    if      ((lead & 0xe0) == 0xc0) { trailCount = 1; cp = lead & 0x1f; }
    else if ((lead & 0xf0) == 0xe0) { trailCount = 2; cp = lead & 0x0f; }
    else if ((lead & 0xf8) == 0xf0) { trailCount = 3; cp = lead & 0x07; }
    else
    {
        valid = false;
        return REPLACEMENT_CHAR;
    }

    for (size_t i = 0; i < trailCount; ++i)
    {
        if (it == itEnd || (static_cast<unsigned char>(*it) & 0xc0) != 0x80)
        {
            valid = false;
            return REPLACEMENT_CHAR;
        }
        cp = (cp << 6) | (static_cast<unsigned char>(*it++) & 0x3f);
    }

    if (cp > CODE_POINT_MAX || (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX))
    {
        valid = false;
        return REPLACEMENT_CHAR;
    }
    return cp;
}


inline
std::wstring utf8ToWide(std::string_view str)
{
    static_assert(sizeof(wchar_t) == 4); //UTF-32 on Linux
    std::wstring output;
    output.reserve(str.size());

    bool valid = true;
    for (auto it = str.begin(); it != str.end(); )
        output += static_cast<wchar_t>(decodeUtf8(it, str.end(), valid));
    return output;
}


inline
std::string wideToUtf8(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());

    for (const wchar_t c : str)
    {
        CodePoint cp = static_cast<CodePoint>(c);
        if (cp > CODE_POINT_MAX || (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX))
            cp = REPLACEMENT_CHAR;
        codePointToUtf8(cp, [&](char ch) { output += ch; });
    }
    return output;
}
}


template <class UtfString> inline
bool isValidUtf(const UtfString& str)
{
    static_assert(std::is_same_v<GetCharTypeT<UtfString>, char>);
    const std::string_view sv = strView(str);

    bool valid = true;
    for (auto it = sv.begin(); it != sv.end() && valid; )
        impl::decodeUtf8(it, sv.end(), valid);
    return valid;
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    using SourceChar = GetCharTypeT<SourceString>;
    using TargetChar = GetCharTypeT<TargetString>;
    const auto sv = strView(str);

    if constexpr (std::is_same_v<SourceChar, TargetChar>)
        return TargetString(sv.begin(), sv.end());
    else if constexpr (std::is_same_v<SourceChar, char>)
        return TargetString(impl::utf8ToWide(sv));
    else
        return TargetString(impl::wideToUtf8(sv));
}
}

#endif //UTF_H_01832479146991573473545
