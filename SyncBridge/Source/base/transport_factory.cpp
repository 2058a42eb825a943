// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "transport_factory.h"
#include "../afs/ftp.h"
#include "../afs/sftp.h"

using namespace zen;
using namespace sb;


CreateTransportFun sb::getTransportFactory(const SyncTarget& target)
{
    switch (target.protocol)
    {
        case SyncProtocol::ftp:
        case SyncProtocol::ftps:
        {
            FtpLogin login;
            login.server     = target.host;
            login.port       = target.port;
            login.username   = target.username;
            login.password   = target.password;
            login.useTls     = useTls(target);
            login.timeoutSec = target.timeoutSec;
            login.bufferSize = target.bufferSize;
            return [login] { return createFtpTransport(login); };
        }

        case SyncProtocol::sftp:
        {
            SftpLogin login;
            login.server             = target.host;
            login.port               = target.port;
            login.username           = target.username;
            login.password           = target.password;
            login.privateKeyFilePath = target.privateKeyFile;
            login.timeoutSec         = target.timeoutSec;
            login.bufferSize         = target.bufferSize;
            return [login] { return createSftpTransport(login); };
        }
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}
