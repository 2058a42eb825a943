// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FTP_LISTING_H_7826340983745109234
#define FTP_LISTING_H_7826340983745109234

#include <functional>
#include <optional>
#include <vector>
#include <zen/sys_error.h>


namespace sb
{
enum class FtpItemType
{
    file,
    folder,
    symlink,
};

struct FtpItem
{
    FtpItemType type = FtpItemType::file;
    Zstring itemName;
    uint64_t fileSize = 0;
    time_t modTime = 0; //number of seconds since Jan. 1st 1970 UTC
};

//convert raw item names as sent by the server
using ServerToUtf = std::function<Zstring(const std::string_view& str)>; //throw SysError


//split raw server response into lines; skips empty lines (consider <CR><LF>)
std::vector<std::string_view> splitFtpResponse(const std::string& buf);
std::vector<std::string_view> splitFtpResponse(std::string&&) = delete;

std::wstring formatFtpStatus(int sc);

//last "xyz " status code found in a (multi-line) server response, 0 if none
int getLastFtpStatusCode(const std::string& response);


struct FtpFeatures
{
    bool mlsd = false;
    bool mfmt = false;
    bool clnt = false;
    bool utf8 = false;
};
FtpFeatures parseFeatResponse(const std::string& featResponse);


//- "." and ".." are never returned
//- "utcTimeNow": reference for the year-less LIST time stamps
std::vector<FtpItem> parseMlsd   (const std::string& buf, const ServerToUtf& serverToUtf); //throw SysError
std::vector<FtpItem> parseUnknown(const std::string& buf, const ServerToUtf& serverToUtf, time_t utcTimeNow); //throw SysError
std::vector<FtpItem> parseUnix   (const std::string& buf, const ServerToUtf& serverToUtf, time_t utcTimeNow); //throw SysError
std::vector<FtpItem> parseWindows(const std::string& buf, const ServerToUtf& serverToUtf, time_t utcTimeNow); //throw SysError

//"213 YYYYMMDDHHMMSS[.sss]"
time_t parseMdtmResponse(const std::string& response); //throw SysError
//"213 <file size>"; no value if server responds with 550 (e.g. item is a folder)
std::optional<uint64_t> parseSizeResponse(const std::string& response); //throw SysError
}

#endif //FTP_LISTING_H_7826340983745109234
