// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "config.h"
#include <algorithm>
#include <limits>
#include <set>
#include <zen/file_io.h>
#include <zen/file_path.h>
#include <zen/json.h>

using namespace zen;
using namespace sb;


namespace
{
std::optional<int64_t> parseInteger(const std::string& str)
{
    const std::string_view digits = startsWith(str, '-') ? std::string_view(str).substr(1) : std::string_view(str);
    if (digits.empty() || digits.size() > 18 || !std::all_of(digits.begin(), digits.end(), isDigit<char>))
        return std::nullopt;
    return stringTo<int64_t>(str);
}


//read values of a JSON object; missing keys (or null) keep the current value
class JsonIn
{
public:
    JsonIn(const JsonValue& jobj, const std::wstring& errorMsg, const std::wstring& context) :
        jobj_(jobj), errorMsg_(errorMsg), context_(context) {}

    void operator()(const std::string& name, Zstring& value) const //throw ConfigError
    {
        if (const JsonValue* jval = getChild(name, JsonValue::Type::string, L"string"))
            value = utfTo<Zstring>(jval->primVal);
    }

    void operator()(const std::string& name, bool& value) const //throw ConfigError
    {
        if (const JsonValue* jval = getChild(name, JsonValue::Type::boolean, L"boolean"))
            value = jval->primVal == "true";
    }

    void operator()(const std::string& name, int& value) const { readInteger(name, value); } //throw ConfigError
    void operator()(const std::string& name, size_t& value) const { readInteger(name, value); } //

private:
    template <class Num>
    void readInteger(const std::string& name, Num& value) const //throw ConfigError
    {
        if (const JsonValue* jval = getChild(name, JsonValue::Type::number, L"integer"))
        {
            const std::optional<int64_t> num = parseInteger(jval->primVal);
            const bool inRange = num &&
                                 *num >= static_cast<int64_t>(std::numeric_limits<Num>::min()) &&
                                 (*num < 0 || static_cast<uint64_t>(*num) <= static_cast<uint64_t>(std::numeric_limits<Num>::max()));
            if (!inRange)
                throw ConfigError(errorMsg_, context_ + replaceCpy(replaceCpy(_("Invalid value %x for %y."),
                                                                              L"%x", utfTo<std::wstring>(jval->primVal)),
                                                                   L"%y", fmtPath(utfTo<std::wstring>(name))));
            value = static_cast<Num>(*num);
        }
    }

    const JsonValue* getChild(const std::string& name, JsonValue::Type type, const std::wstring& typeName) const //throw ConfigError
    {
        const JsonValue* jval = getChildFromJsonObject(jobj_, name);
        if (!jval || jval->type == JsonValue::Type::null)
            return nullptr;

        if (jval->type != type)
            throw ConfigError(errorMsg_, context_ + replaceCpy(replaceCpy(_("Value of %x has the wrong type, expected: %y."),
                                                                          L"%x", fmtPath(utfTo<std::wstring>(name))),
                                                               L"%y", typeName));
        return jval;
    }

    const JsonValue& jobj_;
    const std::wstring errorMsg_;
    const std::wstring context_;
};


SyncTarget parseTarget(const JsonValue& jtarget, size_t index, const std::wstring& errorMsg) //throw ConfigError
{
    std::wstring context = replaceCpy(_("Target #%x:"), L"%x", numberTo<std::wstring>(index + 1)) + L' ';

    if (jtarget.type != JsonValue::Type::object)
        throw ConfigError(errorMsg, context + _("Expected a JSON object."));

    SyncTarget target;
    {
        JsonIn in(jtarget, errorMsg, context);
        if (!getChildFromJsonObject(jtarget, "id"))
            throw ConfigError(errorMsg, context + replaceCpy(_("Missing value for %x."), L"%x", fmtPath(L"id")));
        in("id",   target.id);
        in("name", target.name);
    }
    context = replaceCpy(_("Target %x:"), L"%x", getTargetDisplayName(target)) + L' ';

    JsonIn in(jtarget, errorMsg, context);

    std::string protocolName = getProtocolName(target.protocol);
    in("protocol", protocolName);
    if (const std::optional<SyncProtocol> protocol = parseProtocolName(protocolName))
        target.protocol = *protocol;
    else
        throw ConfigError(errorMsg, context + replaceCpy(replaceCpy(_("Invalid value %x for %y."), L"%x", fmtPath(utfTo<std::wstring>(protocolName))),
                                                         L"%y", fmtPath(L"protocol")));
    in("host",             target.host);
    in("port",             target.port);
    in("username",         target.username);
    in("password",         target.password);
    in("private_key_file", target.privateKeyFile);
    in("secure",           target.secure);
    in("local_path",       target.localPath);
    in("remote_path",      target.remotePath);

    std::string syncModeName = getSyncModeName(target.syncMode);
    in("sync_mode", syncModeName);
    if (const std::optional<SyncMode> mode = parseSyncModeName(syncModeName))
        target.syncMode = *mode;
    else
        throw ConfigError(errorMsg, context + replaceCpy(replaceCpy(_("Invalid value %x for %y."), L"%x", fmtPath(utfTo<std::wstring>(syncModeName))),
                                                         L"%y", fmtPath(L"sync_mode")));
    in("sync_deletions",       target.syncDeletions);
    in("parallel_connections", target.parallelConnections);
    in("buffer_size",          target.bufferSize);
    in("sync_interval_sec",    target.syncIntervalSec);
    in("time_tolerance_sec",   target.timeToleranceSec);
    in("timeout_sec",          target.timeoutSec);

    return target;
}
}


ConfigReadResult sb::parseConfig(const std::string& stream, const Zstring& filePath, const Zstring& workingDir) //throw ConfigError
{
    const std::wstring errorMsg = replaceCpy(_("Invalid configuration file %x."), L"%x", fmtPath(filePath));

    JsonValue jroot;
    try
    {
        jroot = parseJson(stream); //throw JsonParsingError
    }
    catch (const JsonParsingError& e)
    {
        throw ConfigError(errorMsg, replaceCpy(replaceCpy(_("JSON parsing error at row %x, column %y."),
                                                          L"%x", numberTo<std::wstring>(e.row + 1)),
                                               L"%y", numberTo<std::wstring>(e.col + 1)));
    }
    if (jroot.type != JsonValue::Type::object)
        throw ConfigError(errorMsg, _("Expected a JSON object."));

    ConfigReadResult result;
    SyncConfig& cfg = result.config;

    JsonIn in(jroot, errorMsg, std::wstring());
    in("state_dir",                cfg.stateDir);
    in("idle_close_threshold_sec", cfg.idleCloseThresholdSec);

    if (trimCpy(cfg.stateDir).empty())
        cfg.stateDir = workingDir;
    else if (!startsWith(cfg.stateDir, FILE_NAME_SEPARATOR))
        cfg.stateDir = appendPath(workingDir, cfg.stateDir);

    if (cfg.idleCloseThresholdSec < 0)
        throw ConfigError(errorMsg, replaceCpy(replaceCpy(_("Invalid value %x for %y."), L"%x", numberTo<std::wstring>(cfg.idleCloseThresholdSec)),
                                               L"%y", fmtPath(L"idle_close_threshold_sec")));

    if (const JsonValue* jtargets = getChildFromJsonObject(jroot, "targets"))
    {
        if (jtargets->type != JsonValue::Type::array)
            throw ConfigError(errorMsg, replaceCpy(replaceCpy(_("Value of %x has the wrong type, expected: %y."),
                                                              L"%x", fmtPath(L"targets")), L"%y", L"array"));
        std::set<int> targetIds;

        for (size_t i = 0; i < jtargets->arrayVal.size(); ++i)
            try
            {
                const SyncTarget target = parseTarget(jtargets->arrayVal[i], i, errorMsg); //throw ConfigError

                if (!targetIds.insert(target.id).second)
                    throw ConfigError(errorMsg, replaceCpy(_("Target %x:"), L"%x", getTargetDisplayName(target)) + L' ' +
                                      replaceCpy(_("Duplicate target ID %x."), L"%x", numberTo<std::wstring>(target.id)));
                try
                {
                    cfg.targets.push_back(validateSyncTarget(target, workingDir)); //throw ConfigError
                }
                catch (const ConfigError& e) { throw ConfigError(errorMsg, e.toString()); }
            }
            catch (const ConfigError& e) { result.invalidTargets.push_back(e); }
    }
    return result;
}


ConfigReadResult sb::readConfig(const Zstring& filePath, const Zstring& workingDir) //throw FileError, ConfigError
{
    const std::string stream = getFileContent(filePath, nullptr /*notifyUnbufferedIO*/); //throw FileError
    return parseConfig(stream, filePath, workingDir); //throw ConfigError
}


std::string sb::serializeConfig(const SyncConfig& cfg)
{
    JsonValue jroot(JsonValue::Type::object);
    jroot.objectVal["state_dir"]                = JsonValue(utfTo<std::string>(cfg.stateDir));
    jroot.objectVal["idle_close_threshold_sec"] = JsonValue(cfg.idleCloseThresholdSec);

    JsonValue& jtargets = jroot.objectVal["targets"] = JsonValue(JsonValue::Type::array);
    for (const SyncTarget& target : cfg.targets)
    {
        JsonValue jtarget(JsonValue::Type::object);
        auto& out = jtarget.objectVal;
        out["id"]                   = JsonValue(target.id);
        out["name"]                 = JsonValue(utfTo<std::string>(target.name));
        out["protocol"]             = JsonValue(getProtocolName(target.protocol));
        out["host"]                 = JsonValue(utfTo<std::string>(target.host));
        out["port"]                 = JsonValue(target.port);
        out["username"]             = JsonValue(utfTo<std::string>(target.username));
        out["password"]             = JsonValue(utfTo<std::string>(target.password));
        out["private_key_file"]     = JsonValue(utfTo<std::string>(target.privateKeyFile));
        out["secure"]               = JsonValue(target.secure);
        out["local_path"]           = JsonValue(utfTo<std::string>(target.localPath));
        out["remote_path"]          = JsonValue(utfTo<std::string>(target.remotePath));
        out["sync_mode"]            = JsonValue(getSyncModeName(target.syncMode));
        out["sync_deletions"]       = JsonValue(target.syncDeletions);
        out["parallel_connections"] = JsonValue(target.parallelConnections);
        out["buffer_size"]          = JsonValue(static_cast<uint64_t>(target.bufferSize));
        out["sync_interval_sec"]    = JsonValue(target.syncIntervalSec);
        out["time_tolerance_sec"]   = JsonValue(target.timeToleranceSec);
        out["timeout_sec"]          = JsonValue(target.timeoutSec);

        jtargets.arrayVal.push_back(std::move(jtarget));
    }
    return serializeJson(jroot);
}


void sb::writeConfig(const SyncConfig& cfg, const Zstring& filePath) //throw FileError
{
    setFileContent(filePath, serializeConfig(cfg), nullptr /*notifyUnbufferedIO*/); //throw FileError
}
