// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef CONFIG_H_3019283746501928
#define CONFIG_H_3019283746501928

#include <vector>
#include "sync_target.h"


namespace sb
{
struct SyncConfig
{
    Zstring stateDir; //sync_logs.json, transfer_stats.json
    int idleCloseThresholdSec = 60;
    std::vector<SyncTarget> targets; //validated
};

struct ConfigReadResult
{
    SyncConfig config;
    std::vector<ConfigError> invalidTargets; //skipped targets
};

//- unknown keys are ignored
//- invalid targets are skipped and reported; any other error is fatal
ConfigReadResult parseConfig(const std::string& stream, const Zstring& filePath /*for error messages*/, const Zstring& workingDir); //throw ConfigError
ConfigReadResult readConfig(const Zstring& filePath, const Zstring& workingDir); //throw FileError, ConfigError

std::string serializeConfig(const SyncConfig& cfg);
void writeConfig(const SyncConfig& cfg, const Zstring& filePath); //throw FileError
}

#endif //CONFIG_H_3019283746501928
