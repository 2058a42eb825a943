// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "sync_target.h"
#include <algorithm>
#include <cassert>
#include <zen/file_path.h>

using namespace zen;
using namespace sb;


namespace
{
Zstring trimTrailingSeparator(const Zstring& path)
{
    Zstring output = normalizeSeparators(path);
    if (output.size() > 1 && endsWith(output, FILE_NAME_SEPARATOR))
        output.pop_back();
    return output;
}
}


SyncTarget sb::validateSyncTarget(const SyncTarget& target, const Zstring& workingDir) //throw ConfigError
{
    SyncTarget output = target;
    const std::wstring errorMsg = replaceCpy(_("Invalid configuration for %x."), L"%x", getTargetDisplayName(target));

    if (trimCpy(output.host).empty())
        throw ConfigError(errorMsg, _("Server name must not be empty."));

    if (output.port < 0 || output.port > 65535)
        throw ConfigError(errorMsg, replaceCpy(_("Port %x is out of range (1-65535)."), L"%x", numberTo<std::wstring>(output.port)));

    if (!startsWith(output.remotePath, Zstr('/')))
        throw ConfigError(errorMsg, replaceCpy(_("Remote path %x must be absolute."), L"%x", fmtPath(output.remotePath)));
    output.remotePath = trimTrailingSeparator(output.remotePath);

    if (trimCpy(output.localPath).empty())
        output.localPath = appendPath(appendPath(workingDir, Zstr("sync_data")), numberTo<Zstring>(output.id));

    if (!startsWith(output.localPath, FILE_NAME_SEPARATOR))
        throw ConfigError(errorMsg, replaceCpy(_("Local path %x must be absolute."), L"%x", fmtPath(output.localPath)));
    output.localPath = trimTrailingSeparator(output.localPath);

    output.parallelConnections = std::clamp(output.parallelConnections, PARALLEL_CONNECTIONS_MIN, PARALLEL_CONNECTIONS_MAX);

    if (output.bufferSize == 0)
        throw ConfigError(errorMsg, _("Buffer size must be greater than zero."));

    if (output.syncIntervalSec < 1)
        throw ConfigError(errorMsg, _("Sync interval must be at least 1 second."));

    if (output.timeToleranceSec < 0)
        throw ConfigError(errorMsg, _("Time tolerance must not be negative."));

    if (output.timeoutSec < 1)
        throw ConfigError(errorMsg, _("Timeout must be at least 1 second."));

    if (!output.privateKeyFile.empty() && output.protocol != SyncProtocol::sftp)
        throw ConfigError(errorMsg, _("Private key authentication requires protocol \"sftp\"."));

    return output;
}


int sb::getEffectivePort(const SyncTarget& target)
{
    if (target.port > 0)
        return target.port;

    return target.protocol == SyncProtocol::sftp ? 22 : 21;
}


bool sb::useTls(const SyncTarget& target)
{
    return target.protocol == SyncProtocol::ftps ||
           (target.protocol == SyncProtocol::ftp && target.secure);
}


std::string sb::getProtocolName(SyncProtocol protocol)
{
    switch (protocol)
    {
        case SyncProtocol::ftp:
            return "ftp";
        case SyncProtocol::ftps:
            return "ftps";
        case SyncProtocol::sftp:
            return "sftp";
    }
    assert(false);
    return {};
}


std::optional<SyncProtocol> sb::parseProtocolName(const std::string_view name)
{
    for (const SyncProtocol protocol : {SyncProtocol::ftp, SyncProtocol::ftps, SyncProtocol::sftp})
        if (equalAsciiNoCase(name, getProtocolName(protocol)))
            return protocol;
    return {};
}


std::string sb::getSyncModeName(SyncMode mode)
{
    switch (mode)
    {
        case SyncMode::uploadOnly:
            return "upload_only";
        case SyncMode::downloadOnly:
            return "download_only";
        case SyncMode::biDirectional:
            return "bi_directional";
    }
    assert(false);
    return {};
}


std::optional<SyncMode> sb::parseSyncModeName(const std::string_view name)
{
    for (const SyncMode mode : {SyncMode::uploadOnly, SyncMode::downloadOnly, SyncMode::biDirectional})
        if (name == getSyncModeName(mode))
            return mode;
    return {};
}


std::wstring sb::getTargetDisplayName(const SyncTarget& target)
{
    return L'"' + utfTo<std::wstring>(target.name) + L"\" [" + numberTo<std::wstring>(target.id) + L']';
}
