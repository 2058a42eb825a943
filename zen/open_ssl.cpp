// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "open_ssl.h"
#include "extra_log.h"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>


using namespace zen;


namespace
{
#ifndef OPENSSL_THREADS
    #error OpenSSL must be built with thread support!
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


std::wstring formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string(); err.c: it seems the message uses at most ~200 bytes
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec)), utfTo<std::wstring>(errorBuf));
}


std::wstring formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //"returns latest error code from the thread's error queue without modifying it"
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}


struct OpenSslThreadCleanUp
{
    ~OpenSslThreadCleanUp()
    {
        ::OPENSSL_thread_stop();
    }
};
thread_local OpenSslThreadCleanUp tearDownOpenSslThreadData;
}


void zen::openSslInit()
{
    //official Wiki: https://wiki.openssl.org/index.php/Library_Initialization
    //explicitly init OpenSSL on main thread before libcurl/libssh2 worker threads start using it
    if (::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError(_("Error during process initialization.") + L"\n\n" + formatLastOpenSSLError("OPENSSL_init_ssl"));
}


void zen::openSslTearDown() {}
//OpenSSL 1.1.0+ deprecates all clean up functions


std::string zen::getSha256Fingerprint(const std::string_view hostKey) //throw SysError
{
    unsigned char digest[EVP_MAX_MD_SIZE] = {};
    unsigned int digestLen = 0;

    //https://www.openssl.org/docs/manmaster/man3/EVP_Digest.html
    if (::EVP_Digest(hostKey.data(), hostKey.size(), digest, &digestLen, ::EVP_sha256(), nullptr) != 1)
        throw SysError(formatLastOpenSSLError("EVP_Digest"));

    std::string b64(4 * ((digestLen + 2) / 3) + 1, '\0'); //+1 for null-termination
    const int b64Len = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(b64.data()), digest, static_cast<int>(digestLen));
    if (b64Len < 0)
        throw SysError(formatLastOpenSSLError("EVP_EncodeBlock"));
    b64.resize(b64Len);

    while (endsWith(b64, '='))
        b64.pop_back();

    return "SHA256:" + b64;
}
