// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SYNC_TARGET_H_0928375019283745
#define SYNC_TARGET_H_0928375019283745

#include <optional>
#include <zen/file_error.h>


namespace sb
{
DEFINE_NEW_FILE_ERROR(ConfigError)

enum class SyncProtocol
{
    ftp,
    ftps,
    sftp,
};

enum class SyncMode
{
    uploadOnly,
    downloadOnly,
    biDirectional,
};

inline bool allowsUpload  (SyncMode mode) { return mode != SyncMode::downloadOnly; }
inline bool allowsDownload(SyncMode mode) { return mode != SyncMode::uploadOnly; }

const int PARALLEL_CONNECTIONS_MIN = 1;
const int PARALLEL_CONNECTIONS_MAX = 10;


//one configured local root <-> remote root relationship; read-only snapshot while syncing
struct SyncTarget
{
    int     id = 0;
    Zstring name;

    SyncProtocol protocol = SyncProtocol::ftp;
    Zstring host;
    int     port = 0; //0: protocol default
    Zstring username;
    Zstring password;
    Zstring privateKeyFile; //SFTP only
    bool    secure = false; //FTP: explicit TLS

    Zstring localPath;  //empty: <working dir>/sync_data/<id>
    Zstring remotePath = Zstr("/");

    SyncMode syncMode      = SyncMode::biDirectional;
    bool     syncDeletions = false;

    int    parallelConnections = 3;
    size_t bufferSize          = 4 * 1024 * 1024;
    int    syncIntervalSec     = 60;
    int    timeToleranceSec    = 2;
    int    timeoutSec          = 30;

    bool operator==(const SyncTarget&) const = default;
};

//returns target with defaults applied and paths normalized
SyncTarget validateSyncTarget(const SyncTarget& target, const Zstring& workingDir); //throw ConfigError

int getEffectivePort(const SyncTarget& target);
bool useTls(const SyncTarget& target);

std::string getProtocolName(SyncProtocol protocol);
std::optional<SyncProtocol> parseProtocolName(const std::string_view name);

std::string getSyncModeName(SyncMode mode);
std::optional<SyncMode> parseSyncModeName(const std::string_view name);

std::wstring getTargetDisplayName(const SyncTarget& target); //e.g. "site" [1]
}

#endif //SYNC_TARGET_H_0928375019283745
