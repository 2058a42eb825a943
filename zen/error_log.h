// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef ERROR_LOG_H_8917590832147915
#define ERROR_LOG_H_8917590832147915

#include <optional>
#include <vector>
#include "time.h"
#include "i18n.h"
#include "zstring.h"


namespace zen
{
enum MessageType
{
    MSG_TYPE_INFO    = 0x1,
    MSG_TYPE_WARNING = 0x2,
    MSG_TYPE_ERROR   = 0x4,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    Zstringc message; //UTF-8
};

using ErrorLog = std::vector<LogEntry>;

void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr));

//console format: "[2026-10-19 12:00:00]  Warning:  [context] message", continuation lines indented
std::string formatMessage(const LogEntry& entry, const Zstringc& context = {});

//stable names for persisted logs: "info", "warning", "error"
std::string getMessageTypeName(MessageType type);
std::optional<MessageType> parseMessageTypeName(const std::string& name); //also accepts legacy "success"






//######################## implementation ##########################
inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time)
{
    log.push_back({time, type, utfTo<Zstringc>(msg)});
}


inline
std::wstring getMessageTypeLabel(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_INFO:
            return _("Info");
        case MSG_TYPE_WARNING:
            return _("Warning");
        case MSG_TYPE_ERROR:
            return _("Error");
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


inline
std::string getMessageTypeName(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_INFO:
            return "info";
        case MSG_TYPE_WARNING:
            return "warning";
        case MSG_TYPE_ERROR:
            return "error";
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


inline
std::optional<MessageType> parseMessageTypeName(const std::string& name)
{
    if (name == "info" || name == "success")
        return MSG_TYPE_INFO;
    if (name == "warning")
        return MSG_TYPE_WARNING;
    if (name == "error")
        return MSG_TYPE_ERROR;
    return std::nullopt;
}


inline
std::string formatMessage(const LogEntry& entry, const Zstringc& context)
{
    std::string msgFmt = '[' + utfTo<std::string>(formatTime(formatIsoDateTimeTag, getLocalTime(entry.time))) + "]  " +
                         utfTo<std::string>(getMessageTypeLabel(entry.type)) + ":  ";
    const size_t prefixLen = utfTo<std::wstring>(msgFmt).size(); //consider Unicode!

    if (!context.empty())
        msgFmt += context + ' ';

    const Zstringc msg = trimCpy(entry.message);

    for (auto it = msg.begin(); it != msg.end(); )
        if (*it == '\n')
        {
            msgFmt += *it++;
            msgFmt.append(prefixLen, ' ');
            //skip duplicate newlines
            for (; it != msg.end() && *it == '\n'; ++it)
                ;
        }
        else
            msgFmt += *it++;

    msgFmt += '\n';
    return msgFmt;
}
}

#endif //ERROR_LOG_H_8917590832147915
