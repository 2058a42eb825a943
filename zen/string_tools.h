// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>


//non-member helpers for std::basic_string, std::basic_string_view, char arrays and single chars
namespace zen
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isLineBreak (Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only, unlike std::isdigit()
template <class Char> bool isAsciiChar (Char c);
template <class S   > bool isAsciiString(const S& str);
template <class Char> Char asciiToLower(Char c);

template <class S, class T> bool contains             (const S& str, const T& term);
template <class S, class T> bool startsWith           (const S& str, const T& prefix);
template <class S, class T> bool startsWithAsciiNoCase(const S& str, const T& prefix);
template <class S, class T> bool endsWith             (const S& str, const T& postfix);
template <class S, class T> bool equalAsciiNoCase     (const S& lhs, const T& rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

template <class S, class Char, class Function> void split(const S& str, Char delimiter, Function onStringPart);
template <class S, class Function1, class Function2> void split2(const S& str, Function1 isDelimiter, Function2 onStringPart);

template <class S> [[nodiscard]] S trimCpy(const S& str);
template <class S>                void trim(S& str);

template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U>               void replace(S& str, const T& oldTerm, const U& newTerm);

//convert arithmetic types <-> strings (std::string, std::wstring)
template <class S, class T, class Num> S printNumber(const T& format, const Num& number); //format a single number using std::snprintf()

template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str);

template <class Iterator> auto makeStringView(Iterator first, Iterator last);
template <class Char>     auto makeStringView(const Char* str, size_t len) { return std::basic_string_view<Char>(str, len); }








//---------------------- implementation ----------------------
namespace impl
{
template <class T> struct CharTypeOf { using Type = typename T::value_type; };
template <> struct CharTypeOf<char>    { using Type = char; };
template <> struct CharTypeOf<wchar_t> { using Type = wchar_t; };
template <class Char> struct CharTypeOf<Char*>       { using Type = std::remove_const_t<Char>; };
template <class Char> struct CharTypeOf<const Char*> { using Type = Char; };
template <class Char, size_t N> struct CharTypeOf<Char[N]> { using Type = std::remove_const_t<Char>; };
}
template <class T>
using GetCharTypeT = typename impl::CharTypeOf<std::remove_cvref_t<T>>::Type;


//view on strings, char arrays and single chars
template <class T> inline
auto strView(const T& str)
{
    using Char = GetCharTypeT<T>;
    if constexpr (std::is_same_v<std::remove_cvref_t<T>, Char>)
        return std::basic_string_view<Char>(&str, 1);
    else
        return std::basic_string_view<Char>(str);
}


template <class Iterator> inline
auto makeStringView(Iterator first, Iterator last)
{
    using Char = std::remove_cvref_t<decltype(*first)>;
    return std::basic_string_view<Char>(first == last ? nullptr : &*first, last - first);
}


template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}


template <class Char> inline
bool isLineBreak(Char c) { return c == '\n' || c == '\r'; }


template <class Char> inline
bool isDigit(Char c) { return static_cast<Char>('0') <= c && c <= static_cast<Char>('9'); }


template <class Char> inline
bool isAsciiChar(Char c)
{
    return static_cast<std::make_unsigned_t<Char>>(c) < 128;
}


template <class S> inline
bool isAsciiString(const S& str)
{
    const auto sv = strView(str);
    return std::all_of(sv.begin(), sv.end(), [](auto c) { return isAsciiChar(c); });
}


template <class Char> inline
Char asciiToLower(Char c)
{
    if (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z'))
        return static_cast<Char>(c - static_cast<Char>('A') + static_cast<Char>('a'));
    return c;
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    return strView(str).find(strView(term)) != std::basic_string_view<GetCharTypeT<S>>::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    const auto sv = strView(str);
    const auto pv = strView(prefix);
    return sv.size() >= pv.size() && sv.compare(0, pv.size(), pv) == 0;
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    const auto sv = strView(str);
    const auto pv = strView(postfix);
    return sv.size() >= pv.size() && sv.compare(sv.size() - pv.size(), pv.size(), pv) == 0;
}


template <class S, class T> inline
bool equalAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto lv = strView(lhs);
    const auto rv = strView(rhs);
    return lv.size() == rv.size() &&
           std::equal(lv.begin(), lv.end(), rv.begin(), [](auto a, auto b) { return asciiToLower(a) == asciiToLower(b); });
}


template <class S, class T> inline
bool startsWithAsciiNoCase(const S& str, const T& prefix)
{
    const auto sv = strView(str);
    const auto pv = strView(prefix);
    return sv.size() >= pv.size() && equalAsciiNoCase(sv.substr(0, pv.size()), pv);
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto sv = strView(str);
    const auto tv = strView(term);
    const size_t pos = sv.rfind(tv);
    if (pos == sv.npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(sv.substr(pos + tv.size()));
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto sv = strView(str);
    const size_t pos = sv.rfind(strView(term));
    if (pos == sv.npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(sv.substr(0, pos));
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto sv = strView(str);
    const auto tv = strView(term);
    const size_t pos = sv.find(tv);
    if (pos == sv.npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(sv.substr(pos + tv.size()));
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto sv = strView(str);
    const size_t pos = sv.find(strView(term));
    if (pos == sv.npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(sv.substr(0, pos));
}


template <class S, class Function1, class Function2> inline
void split2(const S& str, Function1 isDelimiter, Function2 onStringPart)
{
    const auto sv = strView(str);
    auto blockFirst = sv.begin();
    for (;;)
    {
        const auto blockLast = std::find_if(blockFirst, sv.end(), isDelimiter);
        onStringPart(makeStringView(blockFirst, blockLast));

        if (blockLast == sv.end())
            return;
        blockFirst = blockLast + 1;
    }
}


template <class S, class Char, class Function> inline
void split(const S& str, Char delimiter, Function onStringPart)
{
    split2(str, [delimiter](Char c) { return c == delimiter; }, onStringPart);
}


template <class S> inline
S trimCpy(const S& str)
{
    const auto sv = strView(str);
    const auto first = std::find_if_not(sv.begin(), sv.end(), isWhiteSpace<GetCharTypeT<S>>);
    auto last = sv.end();
    while (last != first && isWhiteSpace(*(last - 1)))
        --last;
    return S(makeStringView(first, last));
}


template <class S> inline
void trim(S& str) { str = trimCpy(str); }


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    const auto oldView = strView(oldTerm);
    const auto newView = strView(newTerm);
    if (oldView.empty())
        return;

    S output;
    size_t pos = 0;
    for (;;)
    {
        const size_t posFound = str.find(oldView, pos);
        if (posFound == S::npos)
            break;
        output.append(str, pos, posFound - pos);
        output.append(newView);
        pos = posFound + oldView.size();
    }
    if (pos == 0)
        return;
    output.append(str, pos);
    str = std::move(output);
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class T, class Num> inline
S printNumber(const T& format, const Num& number) //format a single number using ::snprintf()
{
    static_assert(std::is_same_v<GetCharTypeT<S>, GetCharTypeT<T>>);
    static_assert(std::is_same_v<GetCharTypeT<S>, char>);

    const int BUFFER_SIZE = 128;
    char buffer[BUFFER_SIZE]; //zero-initialize?
    const int charsWritten = std::snprintf(buffer, BUFFER_SIZE, std::string(strView(format)).c_str(), number);

    return 0 < charsWritten && charsWritten < BUFFER_SIZE ? S(buffer, charsWritten) : S();
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    using Char = GetCharTypeT<S>;
    std::string tmp;
    if constexpr (std::is_floating_point_v<Num>)
        tmp = std::to_string(number);
    else
    {
        char buf[64] = {};
        const std::to_chars_result rv = std::to_chars(std::begin(buf), std::end(buf), number);
        tmp.assign(buf, rv.ptr);
    }

    if constexpr (std::is_same_v<Char, char>)
        return S(tmp);
    else
        return S(tmp.begin(), tmp.end()); //ASCII only
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    const auto sv = strView(str);
    std::string tmp(sv.size(), '\0');
    std::transform(sv.begin(), sv.end(), tmp.begin(), [](auto c) { return static_cast<char>(c); });

    const char* first = tmp.c_str();
    const char* last  = first + tmp.size();
    while (first != last && isWhiteSpace(*first))
        ++first;

    if constexpr (std::is_floating_point_v<Num>)
        return static_cast<Num>(std::strtod(first, nullptr));
    else
    {
        if (first != last && *first == '+')
            ++first;
        Num number = 0;
        if (std::from_chars(first, last, number).ec != std::errc())
            return 0;
        return number;
    }
}
}

#endif //STRING_TOOLS_H_213458973046
