// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FTP_H_745895742383425326568678
#define FTP_H_745895742383425326568678

#include <memory>
#include "transport.h"


namespace sb
{
const int DEFAULT_PORT_FTP = 21;

struct FtpLogin
{
    Zstring server;
    int     port = 0; //use default if 0
    Zstring username; //empty: anonymous
    Zstring password;
    bool    useTls = false; //explicit TLS (FTPS): https://tools.ietf.org/html/rfc4217
    int     timeoutSec = 30;
    size_t  bufferSize = 4 * 1024 * 1024;
};

std::unique_ptr<Transport> createFtpTransport(const FtpLogin& login);
}

#endif //FTP_H_745895742383425326568678
