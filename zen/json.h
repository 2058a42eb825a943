// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef JSON_H_0187348321748321758934215734
#define JSON_H_0187348321748321758934215734

#include <map>
#include <optional>
#include "utf.h"


namespace zen
{
//RFC 8259: https://tools.ietf.org/html/rfc8259
struct JsonValue
{
    enum class Type
    {
        null,    //
        boolean, //primitive types
        number,  //
        string,  //
        array,
        object,
    };

    /**/     JsonValue() {}
    explicit JsonValue(Type t)          : type(t) {}
    explicit JsonValue(bool b)          : type(Type::boolean), primVal(b ? "true" : "false") {}
    explicit JsonValue(int num)         : type(Type::number),  primVal(numberTo<std::string>(num)) {}
    explicit JsonValue(int64_t num)     : type(Type::number),  primVal(numberTo<std::string>(num)) {}
    explicit JsonValue(uint64_t num)    : type(Type::number),  primVal(numberTo<std::string>(num)) {}
    explicit JsonValue(std::string str) : type(Type::string),  primVal(std::move(str)) {} //unifying assignment
    explicit JsonValue(const char* str) : type(Type::string),  primVal(str) {}
    explicit JsonValue(const void*) = delete; //catch usage errors e.g. const int* -> JsonValue(bool)

    Type type = Type::null;
    std::string                      primVal; //for primitive types
    std::vector<JsonValue>           arrayVal;
    std::map<std::string, JsonValue> objectVal; //duplicate keys: last one wins
};


std::string serializeJson(const JsonValue& jval,
                          const std::string& lineBreak = "\n",
                          const std::string& indent    = "    "); //noexcept


struct JsonParsingError
{
    JsonParsingError(size_t rowNo, size_t colNo) : row(rowNo), col(colNo) {}
    const size_t row; //beginning with 0
    const size_t col; //
};
JsonValue parseJson(const std::string& stream); //throw JsonParsingError



//helper functions for JsonValue access:
inline
const JsonValue* getChildFromJsonObject(const JsonValue& jvalue, const std::string& name)
{
    if (jvalue.type != JsonValue::Type::object)
        return nullptr;

    auto it = jvalue.objectVal.find(name);
    if (it == jvalue.objectVal.end())
        return nullptr;

    return &it->second;
}





//---------------------- implementation ----------------------
namespace json_impl
{
inline
std::string jsonEscape(const std::string& str)
{
    static const char hexDigits[] = "0123456789abcdef";

    std::string output;
    for (const char c : str)
        switch (c)
        {
            //*INDENT-OFF*
            case '\\': output += "\\\\"; break; //
            case  '"': output += "\\\""; break; //escaping mandatory

            case '\b': output += "\\b"; break; //
            case '\f': output += "\\f"; break; //
            case '\n': output += "\\n"; break; //prefer compact escaping
            case '\r': output += "\\r"; break; //
            case '\t': output += "\\t"; break; //

            default:
                if (static_cast<unsigned char>(c) < 32)
                {
                    output += "\\u00";
                    output += hexDigits[static_cast<unsigned char>(c) >> 4];
                    output += hexDigits[static_cast<unsigned char>(c) & 0xf];
                }
                else
                    output += c;
                break;
            //*INDENT-ON*
        }
    return output;
}


inline
void serialize(const JsonValue& jval, std::string& stream, const std::string& lineBreak, const std::string& indent, size_t indentLevel)
{
    //the caller is repsonsible for line breaks and indentation of *first* line
    auto writeIndent = [&](size_t level)
    {
        for (size_t i = 0; i < level; ++i)
            stream += indent;
    };

    //objects and arrays share the same layout
    auto writeContainer = [&](char open, char close, const auto& items, auto writeItem)
    {
        stream += open;
        if (!items.empty())
        {
            bool first = true;
            for (const auto& item : items)
            {
                if (!first)
                    stream += ',';
                first = false;

                stream += lineBreak;
                writeIndent(indentLevel + 1);
                writeItem(item);
            }
            stream += lineBreak;
            writeIndent(indentLevel);
        }
        stream += close;
    };

    switch (jval.type)
    {
        case JsonValue::Type::null:
            stream += "null";
            break;

        case JsonValue::Type::boolean:
        case JsonValue::Type::number:
            stream += jval.primVal;
            break;

        case JsonValue::Type::string:
            stream += '"' + jsonEscape(jval.primVal) + '"';
            break;

        case JsonValue::Type::object:
            writeContainer('{', '}', jval.objectVal, [&](const auto& child)
            {
                stream += '"' + jsonEscape(child.first) + "\":";
                if (!indent.empty())
                    stream += ' ';
                serialize(child.second, stream, lineBreak, indent, indentLevel + 1);
            });
            break;

        case JsonValue::Type::array:
            writeContainer('[', ']', jval.arrayVal, [&](const JsonValue& child)
            {
                serialize(child, stream, lineBreak, indent, indentLevel + 1);
            });
            break;
    }
}


class JsonParser
{
public:
    explicit JsonParser(const std::string& stream) : stream_(stream), pos_(stream_.begin())
    {
        if (startsWith(stream_, BYTE_ORDER_MARK_UTF8))
            pos_ += strLength(BYTE_ORDER_MARK_UTF8);
    }

    JsonValue parse() //throw JsonParsingError
    {
        JsonValue jval = parseValue(); //throw JsonParsingError
        skipWhiteSpace();
        if (pos_ != stream_.end())
            throwParsingError();
        return jval;
    }

private:
    JsonParser           (const JsonParser&) = delete;
    JsonParser& operator=(const JsonParser&) = delete;

    static size_t strLength(const char* str) { return std::char_traits<char>::length(str); }

    static bool isJsonWhiteSpace(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
    static bool isJsonNumChar   (char c) { return isDigit(c) || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E'; }

    void skipWhiteSpace() { pos_ = std::find_if_not(pos_, stream_.end(), isJsonWhiteSpace); }

    bool consumeLiteral(const char* literal)
    {
        if (!startsWith(makeStringView(pos_, stream_.end()), literal))
            return false;
        pos_ += strLength(literal);
        return true;
    }

    void consumeChar(char c) //throw JsonParsingError
    {
        skipWhiteSpace();
        if (pos_ == stream_.end() || *pos_ != c)
            throwParsingError();
        ++pos_;
    }

    bool peekChar(char c)
    {
        skipWhiteSpace();
        return pos_ != stream_.end() && *pos_ == c;
    }

    JsonValue parseValue() //throw JsonParsingError
    {
        skipWhiteSpace();
        if (pos_ == stream_.end())
            throwParsingError();

        if (*pos_ == '{')
        {
            ++pos_;
            JsonValue jval(JsonValue::Type::object);

            if (!peekChar('}'))
                for (;;)
                {
                    skipWhiteSpace();
                    std::string name = parseString(); //throw JsonParsingError
                    consumeChar(':');                 //

                    jval.objectVal.insert_or_assign(std::move(name), parseValue()); //throw JsonParsingError

                    if (!peekChar(','))
                        break;
                    ++pos_;
                }
            consumeChar('}'); //throw JsonParsingError
            return jval;
        }

        if (*pos_ == '[')
        {
            ++pos_;
            JsonValue jval(JsonValue::Type::array);

            if (!peekChar(']'))
                for (;;)
                {
                    jval.arrayVal.push_back(parseValue()); //throw JsonParsingError

                    if (!peekChar(','))
                        break;
                    ++pos_;
                }
            consumeChar(']'); //throw JsonParsingError
            return jval;
        }

        if (*pos_ == '"')
            return JsonValue(parseString()); //throw JsonParsingError

        if (consumeLiteral("null"))
            return JsonValue();
        if (consumeLiteral("true"))
            return JsonValue(true);
        if (consumeLiteral("false"))
            return JsonValue(false);

        const auto itNumEnd = std::find_if_not(pos_, stream_.end(), isJsonNumChar);
        if (itNumEnd == pos_)
            throwParsingError();

        JsonValue jval(JsonValue::Type::number);
        jval.primVal.assign(pos_, itNumEnd);
        pos_ = itNumEnd;
        return jval;
    }

    std::string parseString() //throw JsonParsingError
    {
        if (pos_ == stream_.end() || *pos_ != '"')
            throwParsingError();
        ++pos_;

        std::string output;
        uint32_t leadSurrogate = 0;

        auto writeCodePoint = [&](uint32_t cp)
        {
            impl::codePointToUtf8(cp, [&](char c) { output += c; });
        };

        for (;;)
        {
            if (pos_ == stream_.end())
                throwParsingError();

            const char c = *pos_++;
            if (c == '"')
                break;

            if (c != '\\')
            {
                output += c;
                continue;
            }

            if (pos_ == stream_.end())
                throwParsingError();

            switch (const char c2 = *pos_++)
            {
                //*INDENT-OFF*
                case '\\':
                case '"':
                case '/': output += c2;   break;
                case 'b': output += '\b'; break;
                case 'f': output += '\f'; break;
                case 'n': output += '\n'; break;
                case 'r': output += '\r'; break;
                case 't': output += '\t'; break;
                //*INDENT-ON*
                case 'u':
                {
                    if (stream_.end() - pos_ < 4)
                        throwParsingError();

                    uint32_t unit = 0;
                    for (int i = 0; i < 4; ++i)
                    {
                        const char h = *pos_++;
                        unit *= 16;
                        if (isDigit(h))
                            unit += h - '0';
                        else if ('a' <= asciiToLower(h) && asciiToLower(h) <= 'f')
                            unit += asciiToLower(h) - 'a' + 10;
                        else
                            throwParsingError();
                    }

                    if (0xd800 <= unit && unit < 0xdc00)
                        leadSurrogate = unit;
                    else if (0xdc00 <= unit && unit < 0xe000 && leadSurrogate != 0)
                    {
                        writeCodePoint(0x10000 + ((leadSurrogate - 0xd800) << 10) + (unit - 0xdc00));
                        leadSurrogate = 0;
                    }
                    else
                        writeCodePoint(unit);
                    break;
                }
                default:
                    throwParsingError();
            }
        }
        return output;
    }

    [[noreturn]] void throwParsingError() const
    {
        size_t row = 0;
        auto itLineStart = stream_.begin();
        for (auto it = stream_.begin(); it != pos_; ++it)
            if (*it == '\n')
            {
                ++row;
                itLineStart = it + 1;
            }
        throw JsonParsingError(row, pos_ - itLineStart);
    }

    const std::string stream_;
    std::string::const_iterator pos_;
};
}


inline
std::string serializeJson(const JsonValue& jval,
                          const std::string& lineBreak,
                          const std::string& indent) //noexcept
{
    std::string output;
    json_impl::serialize(jval, output, lineBreak, indent, 0);
    output += lineBreak;
    return output;
}


inline
JsonValue parseJson(const std::string& stream) //throw JsonParsingError
{
    return json_impl::JsonParser(stream).parse(); //throw JsonParsingError
}
}

#endif //JSON_H_0187348321748321758934215734
