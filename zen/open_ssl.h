// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef OPEN_SSL_H_801974580936508934568792347506
#define OPEN_SSL_H_801974580936508934568792347506

#include "sys_error.h"


namespace zen
{
//init OpenSSL before use! (libcurl FTPS and libssh2 both run on top of it)
void openSslInit();
void openSslTearDown();

//OpenSSH-style fingerprint: "SHA256:" + unpadded base64 of the SHA-256 digest
std::string getSha256Fingerprint(const std::string_view hostKey); //throw SysError
}

#endif //OPEN_SSL_H_801974580936508934568792347506
