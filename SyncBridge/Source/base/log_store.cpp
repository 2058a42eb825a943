// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "log_store.h"
#include <map>
#include <zen/extra_log.h>
#include <zen/file_access.h>
#include <zen/file_io.h>
#include <zen/file_path.h>
#include <zen/json.h>

using namespace zen;
using namespace sb;


namespace
{
const int SECONDS_PER_DAY = 24 * 3600;


std::string formatTimeStamp(time_t utc)
{
    return utfTo<std::string>(formatTime(formatUtcStampTag, getUtcTime(utc)));
}


std::optional<time_t> parseTimeStamp(const std::string& str)
{
    //also accept fractional seconds: 2026-10-19T12:00:00.000Z
    const std::string strFmt = contains(str, '.') ? beforeLast(str, '.', IfNotFoundReturn::all) + 'Z' : str;

    const TimeComp tc = parseTime(formatUtcStampTag, strFmt);
    if (tc == TimeComp())
        return std::nullopt;

    const auto [utc, success] = utcToTimeT(tc);
    if (!success)
        return std::nullopt;
    return utc;
}


std::string getDirectionName(TransferDirection direction)
{
    return direction == TransferDirection::upload ? "upload" : "download";
}


template <class Num>
std::optional<Num> getNumber(const JsonValue& jval, const std::string& name)
{
    if (const JsonValue* child = getChildFromJsonObject(jval, name))
        if (child->type == JsonValue::Type::number)
            return stringTo<Num>(child->primVal);
    return std::nullopt;
}


std::optional<std::string> getString(const JsonValue& jval, const std::string& name)
{
    if (const JsonValue* child = getChildFromJsonObject(jval, name))
        if (child->type == JsonValue::Type::string)
            return child->primVal;
    return std::nullopt;
}


//no value: file not existing
std::optional<JsonValue> loadJsonFile(const Zstring& filePath) //throw FileError
{
    if (!itemExists(filePath)) //throw FileError
        return std::nullopt;

    const std::string content = getFileContent(filePath, nullptr /*notifyUnbufferedIO*/); //throw FileError
    try
    {
        return parseJson(content); //throw JsonParsingError
    }
    catch (const JsonParsingError& e)
    {
        throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath)),
                        replaceCpy(replaceCpy(_("JSON parsing error at row %x, column %y."),
                                              L"%x", numberTo<std::wstring>(e.row + 1)),
                                   L"%y", numberTo<std::wstring>(e.col + 1)));
    }
}
}


LogStore::LogStore(const Zstring& stateDir, std::chrono::milliseconds saveDelay) :
    logsFilePath_ (appendPath(stateDir, Zstr("sync_logs.json"))),
    statsFilePath_(appendPath(stateDir, Zstr("transfer_stats.json"))),
    saveDelay_(saveDelay)
{
    load(); //noexcept

    saverThread_ = InterruptibleThread([this]
    {
        setCurrentThreadName(Zstr("Log store"));
        for (;;)
        {
            {
                std::unique_lock dummy(lockState_);
                interruptibleWait(conditionDirty_, dummy, [this] { return dirty_; }); //throw ThreadStopRequest
            }
            interruptibleSleep(saveDelay_); //throw ThreadStopRequest: coalesce bursts

            try { flush(); /*throw FileError*/ }
            catch (const FileError& e) { logExtraError(e.toString()); }
        }
    });
}


LogStore::~LogStore()
{
    saverThread_ = InterruptibleThread(); //stop and join

    try { flush(); /*throw FileError*/ }
    catch (const FileError& e) { logExtraError(e.toString()); }
}


void LogStore::load() //noexcept
{
    try
    {
        if (const std::optional<JsonValue> jval = loadJsonFile(logsFilePath_)) //throw FileError
        {
            if (const std::optional<int64_t> lastId = getNumber<int64_t>(*jval, "lastId"))
                lastLogId_ = *lastId;

            if (const JsonValue* jlogs = getChildFromJsonObject(*jval, "logs"))
                for (const JsonValue& jentry : jlogs->arrayVal)
                {
                    const std::optional<int64_t>     id        = getNumber<int64_t>(jentry, "id");
                    const std::optional<int>         targetId  = getNumber<int>(jentry, "connection_id");
                    const std::optional<std::string> type      = getString(jentry, "type");
                    const std::optional<std::string> message   = getString(jentry, "message");
                    const std::optional<std::string> createdAt = getString(jentry, "created_at");

                    if (id && targetId && type && message && createdAt)
                        if (const std::optional<MessageType> msgType = parseMessageTypeName(*type))
                            if (const std::optional<time_t> time = parseTimeStamp(*createdAt))
                            {
                                logs_.push_back({*id, *targetId, *msgType, *message, *time});
                                lastLogId_ = std::max(lastLogId_, *id);
                            }
                }
        }
    }
    catch (const FileError& e) { logExtraError(e.toString()); }

    try
    {
        if (const std::optional<JsonValue> jval = loadJsonFile(statsFilePath_)) //throw FileError
        {
            if (const std::optional<int64_t> lastId = getNumber<int64_t>(*jval, "lastId"))
                lastStatId_ = *lastId;

            if (const JsonValue* jstats = getChildFromJsonObject(*jval, "stats"))
                for (const JsonValue& jentry : jstats->arrayVal)
                {
                    const std::optional<int64_t>     id        = getNumber<int64_t>(jentry, "id");
                    const std::optional<int>         targetId  = getNumber<int>(jentry, "connection_id");
                    const std::optional<uint64_t>    bytes     = getNumber<uint64_t>(jentry, "bytes");
                    const std::optional<std::string> direction = getString(jentry, "direction");
                    const std::optional<std::string> createdAt = getString(jentry, "created_at");

                    if (id && targetId && bytes && direction && createdAt &&
                        (*direction == "upload" || *direction == "download"))
                        if (const std::optional<time_t> time = parseTimeStamp(*createdAt))
                        {
                            stats_.push_back({*id, *targetId, *bytes,
                                              *direction == "upload" ? TransferDirection::upload : TransferDirection::download, *time});
                            lastStatId_ = std::max(lastStatId_, *id);
                        }
                }
        }
    }
    catch (const FileError& e) { logExtraError(e.toString()); }

    removeExpiredStats(std::time(nullptr));
}


void LogStore::addLog(int targetId, const LogEntry& entry)
{
    {
        std::lock_guard dummy(lockState_);

        logs_.push_front({++lastLogId_, targetId, entry.type, std::string(entry.message.begin(), entry.message.end()), entry.time});

        size_t targetCount = 0;
        for (auto it = logs_.begin(); it != logs_.end();)
            if (it->targetId == targetId && ++targetCount > MAX_LOGS_PER_TARGET)
                it = logs_.erase(it);
            else
                ++it;

        dirty_ = true;
    }
    conditionDirty_.notify_all();
}


void LogStore::addTransferStat(int targetId, uint64_t bytes, TransferDirection direction, time_t time)
{
    {
        std::lock_guard dummy(lockState_);

        stats_.push_back({++lastStatId_, targetId, bytes, direction, time});
        removeExpiredStats(time);

        dirty_ = true;
    }
    conditionDirty_.notify_all();
}


void LogStore::removeExpiredStats(time_t now)
{
    const time_t cutOff = now - STATS_RETENTION_DAYS * SECONDS_PER_DAY;

    std::erase_if(stats_, [cutOff](const StoredTransferStat& stat) { return stat.time <= cutOff; });
}


std::vector<StoredLogEntry> LogStore::getLogs(int targetId, size_t limit)
{
    std::lock_guard dummy(lockState_);

    std::vector<StoredLogEntry> output;
    for (const StoredLogEntry& entry : logs_)
        if (entry.targetId == targetId)
        {
            if (output.size() >= limit)
                break;
            output.push_back(entry);
        }
    return output;
}


TransferStats LogStore::getStats(int targetId, time_t now)
{
    std::lock_guard dummy(lockState_);

    const time_t reportStart = now - STATS_REPORT_DAYS * SECONDS_PER_DAY;

    TransferStats output;
    std::map<std::string, std::pair<uint64_t /*upload*/, uint64_t /*download*/>> dailyTotals; //sorted by date

    for (const StoredTransferStat& stat : stats_)
        if (stat.targetId == targetId)
        {
            (stat.direction == TransferDirection::upload ? output.totalUploaded : output.totalDownloaded) += stat.bytes;

            if (stat.time > reportStart)
            {
                auto& [uploaded, downloaded] = dailyTotals[utfTo<std::string>(formatTime(formatIsoDateTag, getUtcTime(stat.time)))];
                (stat.direction == TransferDirection::upload ? uploaded : downloaded) += stat.bytes;
            }
        }

    for (const auto& [date, totals] : dailyTotals)
    {
        output.daily.push_back({date, TransferDirection::upload,   totals.first});
        output.daily.push_back({date, TransferDirection::download, totals.second});
    }
    return output;
}


void LogStore::flush() //throw FileError
{
    std::lock_guard dummySave(lockSave_);

    JsonValue jlogs  (JsonValue::Type::object);
    JsonValue jstats (JsonValue::Type::object);
    {
        std::lock_guard dummy(lockState_);
        if (!dirty_)
            return;
        dirty_ = false;

        JsonValue& jlogArray = jlogs.objectVal["logs"] = JsonValue(JsonValue::Type::array);
        for (const StoredLogEntry& entry : logs_)
        {
            JsonValue jentry(JsonValue::Type::object);
            jentry.objectVal["id"]            = JsonValue(entry.id);
            jentry.objectVal["connection_id"] = JsonValue(entry.targetId);
            jentry.objectVal["type"]          = JsonValue(getMessageTypeName(entry.type));
            jentry.objectVal["message"]       = JsonValue(entry.message);
            jentry.objectVal["created_at"]    = JsonValue(formatTimeStamp(entry.time));
            jlogArray.arrayVal.push_back(std::move(jentry));
        }
        jlogs.objectVal["lastId"] = JsonValue(lastLogId_);

        JsonValue& jstatArray = jstats.objectVal["stats"] = JsonValue(JsonValue::Type::array);
        for (const StoredTransferStat& stat : stats_)
        {
            JsonValue jentry(JsonValue::Type::object);
            jentry.objectVal["id"]            = JsonValue(stat.id);
            jentry.objectVal["connection_id"] = JsonValue(stat.targetId);
            jentry.objectVal["bytes"]         = JsonValue(stat.bytes);
            jentry.objectVal["direction"]     = JsonValue(getDirectionName(stat.direction));
            jentry.objectVal["created_at"]    = JsonValue(formatTimeStamp(stat.time));
            jstatArray.arrayVal.push_back(std::move(jentry));
        }
        jstats.objectVal["lastId"] = JsonValue(lastStatId_);
    }

    auto markDirtyOnFailure = [this]
    {
        std::lock_guard dummy(lockState_);
        dirty_ = true; //retry with next save
    };
    ZEN_ON_SCOPE_FAIL(markDirtyOnFailure());

    if (const std::optional<Zstring> parentPath = getParentFolderPath(logsFilePath_))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    setFileContent(logsFilePath_,  serializeJson(jlogs),  nullptr /*notifyUnbufferedIO*/); //throw FileError
    setFileContent(statsFilePath_, serializeJson(jstats), nullptr /*notifyUnbufferedIO*/); //
}
