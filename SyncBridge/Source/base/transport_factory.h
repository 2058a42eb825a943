// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef TRANSPORT_FACTORY_H_0192837465019283
#define TRANSPORT_FACTORY_H_0192837465019283

#include "../afs/connection_pool.h"
#include "sync_target.h"


namespace sb
{
//FTP/FTPS via libcurl, SFTP via libssh2
CreateTransportFun getTransportFactory(const SyncTarget& target);
}

#endif //TRANSPORT_FACTORY_H_0192837465019283
