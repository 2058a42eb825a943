// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SFTP_H_5392187498172458978456
#define SFTP_H_5392187498172458978456

#include <memory>
#include "transport.h"


namespace sb
{
const int DEFAULT_PORT_SFTP = 22;

struct SftpLogin
{
    Zstring server;
    int     port = 0; //use default if 0
    Zstring username;
    Zstring password;           //password authentication, or passphrase of the private key
    Zstring privateKeyFilePath; //if not empty: public key authentication
    int     timeoutSec = 30;
    size_t  bufferSize = 4 * 1024 * 1024;
};

std::unique_ptr<Transport> createSftpTransport(const SftpLogin& login);
}

#endif //SFTP_H_5392187498172458978456
