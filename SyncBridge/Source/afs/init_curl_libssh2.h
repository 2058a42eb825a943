// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef INIT_CURL_LIBSSH2_H_4570285702375915765
#define INIT_CURL_LIBSSH2_H_4570285702375915765


namespace sb
{
//(S)FTP initialization/shutdown:
//create on the main thread *before* any transport and destroy only after all connection pools are closed
class UniInitializer
{
public:
    UniInitializer();
    ~UniInitializer();

private:
    UniInitializer           (const UniInitializer&) = delete;
    UniInitializer& operator=(const UniInitializer&) = delete;
};
}

#endif //INIT_CURL_LIBSSH2_H_4570285702375915765
