// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "ftp.h"
#include <algorithm>
#include <zen/file_io.h>
#include <zen/time.h>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include "ftp_listing.h"
#include <glib.h>

using namespace zen;
using namespace sb;


namespace
{
//sessions idling between two sync cycles should survive: most servers drop idle control connections after 300 sec
constexpr std::chrono::seconds FTP_SESSION_MAX_IDLE_TIME(120);

constexpr ZstringView ftpPrefix = Zstr("ftp:");

//curl.h: CURL_MAX_READ_SIZE; upload buffer is limited to 2 MB
constexpr size_t FTP_DOWNLOAD_BUFFER_SIZE_MAX = CURL_MAX_READ_SIZE;
constexpr size_t FTP_UPLOAD_BUFFER_SIZE_MAX   = 2 * 1024 * 1024;


enum class ServerEncoding
{
    unknown,
    utf8,
    ansi
};


int getEffectivePort(int portOption)
{
    if (portOption > 0)
        return portOption;
    return DEFAULT_PORT_FTP;
}


Zstring ansiToUtfEncoding(const std::string_view& str) //throw SysError
{
    if (str.empty()) return {};

    gsize bytesWritten = 0; //not including the terminating null

    GError* error = nullptr;
    ZEN_ON_SCOPE_EXIT(if (error) ::g_error_free(error));

    //https://developer.gnome.org/glib/stable/glib-Character-Set-Conversion.html#g-convert
    gchar* utfStr = ::g_convert(str.data(),    //const gchar* str
                                str.size(),    //gssize len
                                "UTF-8",       //const gchar* to_codeset
                                "LATIN1",      //const gchar* from_codeset
                                nullptr,       //gsize* bytes_read
                                &bytesWritten, //gsize* bytes_written
                                &error);       //GError** error
    if (!utfStr)
        throw SysError(formatGlibError("g_convert(" + std::string(str) + ", LATIN1 -> UTF-8)", error));
    ZEN_ON_SCOPE_EXIT(::g_free(utfStr));

    return {utfStr, bytesWritten};
}


std::string utfToAnsiEncoding(const Zstring& str) //throw SysError
{
    if (str.empty()) return {};

    gsize bytesWritten = 0; //not including the terminating null

    GError* error = nullptr;
    ZEN_ON_SCOPE_EXIT(if (error) ::g_error_free(error));

    //fails for: 1. broken UTF-8 2. not-ANSI-encodable Unicode
    gchar* ansiStr = ::g_convert(str.c_str(),   //const gchar* str
                                 str.size(),    //gssize len
                                 "LATIN1",      //const gchar* to_codeset
                                 "UTF-8",       //const gchar* from_codeset
                                 nullptr,       //gsize* bytes_read
                                 &bytesWritten, //gsize* bytes_written
                                 &error);       //GError** error
    if (!ansiStr)
        throw SysError(formatGlibError("g_convert(" + utfTo<std::string>(str) + ", UTF-8 -> LATIN1)", error));
    ZEN_ON_SCOPE_EXIT(::g_free(ansiStr));

    return {ansiStr, bytesWritten};
}


std::wstring getCurlDisplayPath(const FtpLogin& login, const Zstring& serverPath)
{
    Zstring displayPath = Zstring(ftpPrefix) + Zstr("//");

    if (!login.username.empty())
        displayPath += login.username + Zstr('@');

    displayPath += login.server;

    if (getEffectivePort(login.port) != DEFAULT_PORT_FTP)
        displayPath += Zstr(':') + numberTo<Zstring>(getEffectivePort(login.port));

    if (serverPath != Zstr("/"))
        displayPath += serverPath;

    return utfTo<std::wstring>(displayPath);
}

//================================================================================================================
//================================================================================================================

//=> most likely *not* a connection issue
struct SysErrorFtpProtocol : public zen::SysError
{
    SysErrorFtpProtocol(const std::wstring& msg, long ftpError) : SysError(msg), ftpErrorCode(ftpError) {}

    long ftpErrorCode;
};

DEFINE_NEW_SYS_ERROR(SysErrorPassword)


class FtpSession
{
public:
    explicit FtpSession(const FtpLogin& login) : login_(login)
    {
        lastSuccessfulUseTime_ = std::chrono::steady_clock::now();
    }

    ~FtpSession()
    {
        if (easyHandle_)
            ::curl_easy_cleanup(easyHandle_);
    }

    //returns server response (header data)
    std::string perform(const std::string& serverPath, bool isDir, curl_ftpmethod pathMethod,
                        const std::vector<CurlOption>& extraOptions, bool requestUtf8) //throw SysError, SysErrorPassword, SysErrorFtpProtocol
    {
        if (requestUtf8) //avoid endless recursion
            initUtf8(); //throw SysError, SysErrorFtpProtocol

        if (!easyHandle_)
        {
            easyHandle_ = ::curl_easy_init();
            if (!easyHandle_)
                throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
        }
        else
            ::curl_easy_reset(easyHandle_);

        char curlErrorBuf[CURL_ERROR_SIZE] = {};

        std::string headerData;
        curl_write_callback onHeaderReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& output = *static_cast<std::string*>(callbackData);
            output.append(buffer, size * nitems);
            return size * nitems;
        };

        const std::string curlUrlPath = getCurlUrlPath(serverPath, isDir); //throw SysError

        std::vector<CurlOption> options =
        {
            {CURLOPT_ERRORBUFFER, curlErrorBuf},
            {CURLOPT_HEADERDATA, &headerData},
            {CURLOPT_HEADERFUNCTION, onHeaderReceived},
            {CURLOPT_URL, curlUrlPath.c_str()},
            {CURLOPT_FTP_FILEMETHOD, pathMethod},
            {CURLOPT_PORT, getEffectivePort(login_.port)},

            //thread-safety: https://curl.haxx.se/libcurl/c/threadsafe.html
            {CURLOPT_NOSIGNAL, 1},

            //allow PASV IP: some FTP servers really use IP different from control connection
            {CURLOPT_FTP_SKIP_PASV_IP, 0},

            {CURLOPT_CONNECTTIMEOUT, login_.timeoutSec},

            //CURLOPT_TIMEOUT puts a hard limit on total transfer time => use low speed limit instead
            {CURLOPT_LOW_SPEED_TIME, login_.timeoutSec},
            {CURLOPT_LOW_SPEED_LIMIT, 1 /*[bytes]*/}, //can't use "0" which means "inactive", so use some low number

            //FTP only; unlike CURLOPT_TIMEOUT, this one is NOT a limit on the total transfer time
            {CURLOPT_SERVER_RESPONSE_TIMEOUT, login_.timeoutSec},

            //long-running file uploads require keep-alives for the TCP control connection
            {CURLOPT_TCP_KEEPALIVE, 1},
            //=> CURLOPT_TCP_KEEPIDLE (=delay) and CURLOPT_TCP_KEEPINTVL both default to 60 sec

            {CURLOPT_SOCKOPTFUNCTION, setSocketCloseOnExec},

            //no certificate checks: FTPS servers in the wild mostly use self-signed certificates
            //be explicit: "even when [CURLOPT_SSL_VERIFYPEER] is disabled [...] curl may still load the certificate file specified in CURLOPT_CAINFO."
            {CURLOPT_CAINFO, 0},
            {CURLOPT_SSL_VERIFYPEER, 0},
            {CURLOPT_SSL_VERIFYHOST, 0},
        };

        std::string usernameUtf8;
        std::string passwordUtf8;
        if (!login_.username.empty()) //else: libcurl will default to CURL_DEFAULT_USER("anonymous") and CURL_DEFAULT_PASSWORD("ftp@example.com")
        {
            usernameUtf8 = utfTo<std::string>(login_.username);
            passwordUtf8 = utfTo<std::string>(login_.password);
            options.emplace_back(CURLOPT_USERNAME, usernameUtf8.c_str());
            options.emplace_back(CURLOPT_PASSWORD, passwordUtf8.c_str());
        }

        if (login_.useTls) //https://tools.ietf.org/html/rfc4217
        {
            //require SSL for both control and data:
            options.emplace_back(CURLOPT_USE_SSL, CURLUSESSL_ALL);
            //try TLS first, then SSL (currently: CURLFTPAUTH_DEFAULT == CURLFTPAUTH_SSL):
            options.emplace_back(CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS);
        }

        options.insert(options.end(), extraOptions.begin(), extraOptions.end());

        setCurlOptions(easyHandle_, options); //throw SysError

        //=======================================================================================================
        const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);
        //curl_easy_perform() considers FTP response codes >= 400 as failure
        //=> prefix FTP commands with * to ignore: https://curl.se/libcurl/c/CURLOPT_QUOTE.html
        //=======================================================================================================

        if (rcPerf != CURLE_OK)
        {
            std::wstring errorMsg = trimCpy(utfTo<std::wstring>(curlErrorBuf)); //optional

            if (const std::vector<std::string_view>& headerLines = splitFtpResponse(headerData);
                !headerLines.empty())
                if (const std::string_view& response = trimCpy(headerLines.back()); //that *should* be the server's error response
                    !response.empty())
                    errorMsg += (errorMsg.empty() ? L"" : L"\n") + utfTo<std::wstring>(response);

            if (rcPerf == CURLE_LOGIN_DENIED)
                throw SysErrorPassword(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));

            long ftpStatusCode = 0; //optional
            /*const CURLcode rc =*/ ::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &ftpStatusCode);
            //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
            if (ftpStatusCode != 0)
                throw SysErrorFtpProtocol(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg + L'\n' + formatFtpStatus(ftpStatusCode)), ftpStatusCode);

            throw SysError(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));
        }

        lastSuccessfulUseTime_ = std::chrono::steady_clock::now();
        return headerData;
    }

    //returns server response (header data)
    std::string runSingleFtpCommand(const std::string& ftpCmd, bool requestUtf8) //throw SysError, SysErrorFtpProtocol
    {
        curl_slist* quote = nullptr;
        ZEN_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
        quote = ::curl_slist_append(quote, ftpCmd.c_str());

        return perform("/", true /*isDir*/, CURLFTPMETHOD_NOCWD /*avoid needless CWDs*/,
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, quote},
        }, requestUtf8); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
    }

    void testConnection() //throw SysError, SysErrorPassword
    {
        //'*': as long as we get an FTP response - *any* FTP response (including 550) - the connection itself is fine!
        const std::string& featBuf = runSingleFtpCommand("*FEAT", false /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol

        for (const std::string_view& line : splitFtpResponse(featBuf))
            if (startsWith(line, "211 ") ||
                startsWith(line, "500 ") ||
                startsWith(line, "502 ") ||
                startsWith(line, "550 "))
                return;

        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(featBuf) + L')');
    }

    void ensureBinaryMode() //throw SysError
    {
        if (std::optional<curl_socket_t> currentSocket = getActiveSocket()) //throw SysError
            if (*currentSocket == binaryEnabledSocket_)
                return;

        runSingleFtpCommand("TYPE I", false /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol

        //make sure our binary-enabled session is still there (== libcurl behaves as we expect)
        std::optional<curl_socket_t> currentSocket = getActiveSocket(); //throw SysError
        if (currentSocket)
            binaryEnabledSocket_ = *currentSocket; //remember what we did
        //=> pray libcurl doesn't internally set "TYPE A"!
        else
            throw SysError(L"Curl failed to cache FTP session.");
    }

    //------------------------------------------------------------------------------------------------------------
    bool supportsMlsd() { return getFeatures().mlsd; } //
    bool supportsMfmt() { return getFeatures().mfmt; } //throw SysError
    bool supportsClnt() { return getFeatures().clnt; } //
    bool supportsUtf8()
    {
        if (getFeatures().utf8)
            return true;

        initUtf8(); //vsFTPd: supports UTF8 via "OPTS UTF8 ON", even if "UTF8" is missing from "FEAT"
        return socketUsesUtf8_;
    }

    bool isHealthy() const
    {
        return std::chrono::steady_clock::now() - lastSuccessfulUseTime_ <= FTP_SESSION_MAX_IDLE_TIME;
    }

    Zstring serverToUtfEncoding(const std::string_view& str) //throw SysError
    {
        if (isAsciiString(str)) //fast path
            return {str.begin(), str.end()};

        switch (encoding_) //throw SysError
        {
            case ServerEncoding::unknown:
                /* "UTF-8 encodings contain enough internal structure that it is always, in practice, possible to determine
                    whether a UTF-8 or raw encoding has been used" https://www.rfc-editor.org/rfc/rfc3659#section-2.2
                   => auto-detect encoding even if FEAT does not advertize UTF8                                           */
                encoding_ = supportsUtf8() || isValidUtf(str) ? ServerEncoding::utf8 : ServerEncoding::ansi;
                return serverToUtfEncoding(str); //throw SysError

            case ServerEncoding::utf8:
                if (!isValidUtf(str))
                    throw SysError(_("Invalid character encoding:") + L' ' + utfTo<std::wstring>(str) + L' ' + _("Expected:") + L" [UTF-8]");

                return utfTo<Zstring>(str);

            case ServerEncoding::ansi:
                return ansiToUtfEncoding(str); //throw SysError
        }
        assert(false);
        return {};
    }

    std::string getServerPath(const Zstring& serverPath) //throw SysError
    {
        if (isAsciiString(serverPath)) //fast path
            return {serverPath.begin(), serverPath.end()};

        switch (encoding_) //throw SysError
        {
            case ServerEncoding::unknown:
                if (!supportsUtf8())
                    throw SysError(_("Failed to auto-detect character encoding:") + L' ' + utfTo<std::wstring>(serverPath)); //might be ANSI or UTF8 with non-compliant server...

                encoding_ = ServerEncoding::utf8;
                return getServerPath(serverPath); //throw SysError

            case ServerEncoding::utf8:
                if (!isValidUtf(serverPath))
                    throw SysError(_("Invalid character encoding:") + L' ' + utfTo<std::wstring>(serverPath) + L' ' + _("Expected:") + L" [UTF-8]");

                return utfTo<std::string>(serverPath);

            case ServerEncoding::ansi:
                return utfToAnsiEncoding(serverPath); //throw SysError
        }
        assert(false);
        return {};
    }

private:
    FtpSession           (const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    std::string getCurlUrlPath(const std::string& serverPath, bool isDir) //throw SysError
    {
        std::string curlRelPath; //libcurl expects encoded paths (except for '/' char!!!) => bug: https://github.com/curl/curl/pull/4423

        split(serverPath, '/', [&](std::string_view comp)
        {
            if (!comp.empty())
            {
                char* compFmt = ::curl_easy_escape(easyHandle_, comp.data(), static_cast<int>(comp.size()));
                if (!compFmt)
                    throw SysError(formatSystemError(std::string("curl_easy_escape(") + std::string(comp) + ')', L"", L"Conversion failure"));
                ZEN_ON_SCOPE_EXIT(::curl_free(compFmt));

                if (!curlRelPath.empty())
                    curlRelPath += '/';
                curlRelPath += compFmt;
            }
        });

        if (trimCpy(login_.server).empty())
            throw SysError(_("Server name must not be empty."));

        /*  1. CURLFTPMETHOD_NOCWD requires absolute paths to unconditionally skip CWDs: https://github.com/curl/curl/pull/4382
            2. CURLFTPMETHOD_SINGLECWD requires absolute paths to skip one needless "CWD entry path": https://github.com/curl/curl/pull/4332
              => use // because /%2f had bugs                                                                               */
        std::string path = utfTo<std::string>(Zstring(ftpPrefix) + Zstr("//") + login_.server) + "//" + curlRelPath;

        if (isDir && !endsWith(path, '/')) //curl-FTP needs directory paths to end with a slash
            path += '/';
        return path;
    }

    void initUtf8() //throw SysError, SysErrorFtpProtocol
    {
        /*  Some RFC-2640-non-compliant servers require UTF8 to be explicitly enabled, e.g. Microsoft FTP Service
            "OPTS UTF8 ON" needs to be activated each time libcurl internally creates a new session       */

        if (std::optional<curl_socket_t> currentSocket = getActiveSocket()) //throw SysError
            if (*currentSocket == utf8RequestedSocket_) //caveat: a non-UTF8-enabled session might already exist, e.g. from a previous call to supportsMlsd()
                return;

        //some servers require "CLNT" before accepting "OPTS UTF8 ON"
        if (supportsClnt()) //throw SysError
            runSingleFtpCommand("CLNT SyncBridge", false /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol

        //ignore if server does not know this legacy command
        const std::string& optsBuf = runSingleFtpCommand("*OPTS UTF8 ON", false /*requestUtf8*/); //throw SysError, (SysErrorFtpProtocol)

        const int ftpStatusCode = getLastFtpStatusCode(optsBuf);

        socketUsesUtf8_ = ftpStatusCode == 200 || //"200 Always in UTF8 mode."  "200 UTF8 set to on"
                          ftpStatusCode == 202;   //"202 UTF8 mode is always enabled."

        //make sure our Unicode-enabled session is still there (== libcurl behaves as we expect)
        std::optional<curl_socket_t> currentSocket = getActiveSocket(); //throw SysError
        if (currentSocket)
            utf8RequestedSocket_ = *currentSocket; //remember what we did
        else
            throw SysError(L"Curl failed to cache FTP session.");
    }

    std::optional<curl_socket_t> getActiveSocket() //throw SysError
    {
        if (easyHandle_)
        {
            curl_socket_t currentSocket = 0;
            const CURLcode rc = ::curl_easy_getinfo(easyHandle_, CURLINFO_ACTIVESOCKET, &currentSocket);
            if (rc != CURLE_OK)
                throw SysError(formatSystemError("curl_easy_getinfo(CURLINFO_ACTIVESOCKET)", formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
            if (currentSocket != CURL_SOCKET_BAD)
                return currentSocket;
        }
        return {};
    }

    const FtpFeatures& getFeatures() //throw SysError
    {
        if (!featureCache_)
            //*: ignore error if server does not support/allow FEAT
            featureCache_ = parseFeatResponse(runSingleFtpCommand("*FEAT", false /*requestUtf8*/)); //throw SysError, (SysErrorFtpProtocol)
        //used by initUtf8()! => requestUtf8 = false!!!
        return *featureCache_;
    }

    const FtpLogin login_;
    CURL* easyHandle_ = nullptr;

    curl_socket_t utf8RequestedSocket_ = 0;
    curl_socket_t binaryEnabledSocket_ = 0;

    bool socketUsesUtf8_ = false;

    ServerEncoding encoding_ = ServerEncoding::unknown;

    std::optional<FtpFeatures> featureCache_;

    std::chrono::steady_clock::time_point lastSuccessfulUseTime_;
};

//================================================================================================================
//================================================================================================================

class FtpTransport : public Transport
{
public:
    explicit FtpTransport(const FtpLogin& login) : login_(login) {}

    void connect() override //throw ConnectionError
    {
        if (session_ && !corrupted_)
            return;
        session_.reset(); //broken sessions are not reused
        try
        {
            auto session = std::make_unique<FtpSession>(login_);
            session->testConnection(); //throw SysError, SysErrorPassword
            session_ = std::move(session);
            corrupted_ = false;
        }
        catch (const SysError& e) { throw ConnectionError(replaceCpy(_("Unable to connect to %x."), L"%x", fmtPath(getDisplayPath(Zstr("/")))), e.toString()); }
    }

    std::vector<FileRecord> listRecursive(const Zstring& remoteRoot, const std::function<void(const ListError& e)>& onSubFolderError) override //throw ConnectionError, ListError
    {
        std::vector<FileRecord> output;
        std::vector<std::pair<Zstring /*server path*/, Zstring /*relative path*/>> workload{{remoteRoot, Zstring()}};

        while (!workload.empty())
        {
            auto [dirPath, relDirPath] = std::move(workload.back()); //yes, no strong exception guarantee (std::bad_alloc)
            /**/                                   workload.pop_back();  //

            std::vector<FtpItem> items;
            try
            {
                items = readFolder(dirPath); //throw ConnectionError, SysErrorFtpProtocol
            }
            catch (const SysError& e) //=> SysErrorFtpProtocol
            {
                const ListError errorList(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(getDisplayPath(dirPath))), e.toString());
                if (relDirPath.empty())
                    throw errorList;
                onSubFolderError(errorList);
                continue;
            }

            for (const FtpItem& item : items)
            {
                const Zstring itemPath    = appendPath(dirPath,    item.itemName);
                const Zstring itemRelPath = appendPath(relDirPath, item.itemName);

                switch (item.type)
                {
                    case FtpItemType::file:
                        output.push_back({itemRelPath, item.fileSize, item.modTime});
                        break;

                    case FtpItemType::folder:
                        workload.emplace_back(itemPath, itemRelPath);
                        break;

                    case FtpItemType::symlink:
                        try
                        {
                            if (const std::optional<FileDetails> details = getSymlinkTargetDetails(itemPath)) //throw ConnectionError, SysErrorFtpProtocol
                                output.push_back({itemRelPath, details->fileSize, details->modTime});
                            //else: symlink to folder => skip
                        }
                        catch (const SysError& e)
                        {
                            onSubFolderError(ListError(replaceCpy(_("Cannot resolve symbolic link %x."), L"%x", fmtPath(getDisplayPath(itemPath))), e.toString()));
                        }
                        break;
                }
            }
        }
        return output;
    }

    /* File already existing:
        vsftpd:           overwrites
        FileZilla Server: overwrites
        Windows IIS:      overwrites          */
    UploadResult upload(const Zstring& localPath, const Zstring& remotePath, const IoCallback& notifyUnbufferedIO /*throw X*/) override //throw ConnectionError, TransferError, FileError, X
    {
        ZEN_ON_SCOPE_FAIL(knownFolders_.forgetParentsOf(remotePath)); //next upload re-creates missing folders

        if (const std::optional<Zstring> parentPath = getParentFolderPath(remotePath))
            ensureDir(*parentPath); //throw ConnectionError, TransferError

        FileInputPlain fileIn(localPath); //throw FileError

        std::exception_ptr exception;

        auto getBytesToSend = [&](void* buffer, size_t bytesToRead) -> size_t
        {
            try
            {
                //libcurl calls back until 0 bytes are returned (Posix read() semantics)
                size_t bytesRead = 0;
                while (bytesRead < bytesToRead) //don't return short unless end of stream
                {
                    const size_t bytesReadNow = fileIn.tryRead(static_cast<char*>(buffer) + bytesRead, bytesToRead - bytesRead); //throw FileError
                    if (bytesReadNow == 0) //end of file
                        break;
                    bytesRead += bytesReadNow;
                }
                if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead); //throw X
                return bytesRead;
            }
            catch (...)
            {
                exception = std::current_exception();
                return CURL_READFUNC_ABORT; //signal error condition => CURLE_ABORTED_BY_CALLBACK
            }
        };
        curl_read_callback getBytesToSendWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            return (*static_cast<decltype(getBytesToSend)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        runSessionCommand(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getDisplayPath(remotePath))), [&](FtpSession& session) //throw ConnectionError, TransferError
        {
            try
            {
                session.ensureBinaryMode(); //throw SysError

                session.perform(session.getServerPath(remotePath), false /*isDir*/, CURLFTPMETHOD_NOCWD,
                {
                    {CURLOPT_UPLOAD, 1L},
                    {CURLOPT_READDATA, &getBytesToSend},
                    {CURLOPT_READFUNCTION, getBytesToSendWrapper},
                    {CURLOPT_UPLOAD_BUFFERSIZE, std::clamp<size_t>(login_.bufferSize, 16 * 1024, FTP_UPLOAD_BUFFER_SIZE_MAX)},
                    {CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(fileIn.getFileSize())},
                }, true /*requestUtf8*/); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
            }
            catch (const SysError&)
            {
                if (exception)
                    std::rethrow_exception(exception);
                throw;
            }
        });
        //------------------------------------------------------------------------------------
        UploadResult result;
        try
        {
            setModTime(remotePath, fileIn.getModTime()); //throw FileError
        }
        catch (const FileError& e) { result.errorModTime = e; }

        return result;
    }

    void download(const Zstring& remotePath, const Zstring& localPath, const IoCallback& notifyUnbufferedIO /*throw X*/) override //throw ConnectionError, TransferError, NotFoundError, FileError, X
    {
        const std::wstring errorMsg = replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getDisplayPath(remotePath)));

        time_t modTime = 0;
        runSessionCommand(errorMsg, [&](FtpSession& session) //throw ConnectionError, TransferError
        {
            session.ensureBinaryMode(); //throw SysError
            try
            {
                //https://tools.ietf.org/html/rfc3659#section-3
                modTime = parseMdtmResponse(session.runSingleFtpCommand("MDTM " + session.getServerPath(remotePath), true /*requestUtf8*/)); //throw SysError, SysErrorFtpProtocol
            }
            catch (const SysErrorFtpProtocol& e)
            {
                if (e.ftpErrorCode == 550) //FTP 550 No such file or directory
                    throw NotFoundError(errorMsg, e.toString());
                throw;
            }
        });

        writeLocalFileTransactional(localPath, modTime, [&](const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock) //throw FileError, X
        {
            std::exception_ptr exception;

            auto onBytesReceived = [&](const void* buffer, size_t bytesToWrite)
            {
                try
                {
                    writeBlock(buffer, bytesToWrite); //throw FileError
                    if (notifyUnbufferedIO) notifyUnbufferedIO(bytesToWrite); //throw X
                    return bytesToWrite;
                }
                catch (...)
                {
                    exception = std::current_exception();
                    return bytesToWrite + 1; //signal error condition => CURLE_WRITE_ERROR
                }
            };
            curl_write_callback onBytesReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
            {
                return (*static_cast<decltype(onBytesReceived)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
            };

            runSessionCommand(errorMsg, [&](FtpSession& session) //throw ConnectionError, TransferError
            {
                try
                {
                    session.perform(session.getServerPath(remotePath), false /*isDir*/, CURLFTPMETHOD_NOCWD,
                    {
                        {CURLOPT_WRITEDATA, &onBytesReceived},
                        {CURLOPT_WRITEFUNCTION, onBytesReceivedWrapper},
                        {CURLOPT_IGNORE_CONTENT_LENGTH, 1L}, //skip FTP "SIZE" command before download (=> download until actual EOF if file size changes)
                        {CURLOPT_BUFFERSIZE, std::clamp<size_t>(login_.bufferSize, 16 * 1024, FTP_DOWNLOAD_BUFFER_SIZE_MAX)},
                    }, true /*requestUtf8*/); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
                }
                catch (const SysError&)
                {
                    if (exception)
                        std::rethrow_exception(exception);
                    throw;
                }
            });
        }); //throw FileError, X
    }

    void remove(const Zstring& remotePath) override //throw ConnectionError, TransferError
    {
        runSessionCommand(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(getDisplayPath(remotePath))), [&](FtpSession& session) //throw ConnectionError, TransferError
        {
            try
            {
                session.runSingleFtpCommand("DELE " + session.getServerPath(remotePath), true /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol
            }
            catch (const SysErrorFtpProtocol& e)
            {
                if (e.ftpErrorCode == 550) //FTP 550 No such file or directory => already gone
                    return;
                throw;
            }
        });
    }

    //already existing: MKD fails with 550 and a clear error message:
    //      vsftpd:           "550 Create directory operation failed."
    //      FileZilla Server: "550 Directory already exists"
    //      Windows IIS:      "550 Cannot create a file when that file already exists"
    void ensureDir(const Zstring& remotePath) override //throw ConnectionError, TransferError
    {
        if (remotePath == Zstr("/") || knownFolders_.contains(remotePath))
            return;

        if (const std::optional<Zstring> parentPath = getParentFolderPath(remotePath))
            ensureDir(*parentPath); //throw ConnectionError, TransferError

        runSessionCommand(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(getDisplayPath(remotePath))), [&](FtpSession& session) //throw ConnectionError, TransferError
        {
            try
            {
                session.runSingleFtpCommand("MKD " + session.getServerPath(remotePath), true /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol
            }
            catch (const SysErrorFtpProtocol&)
            {
                //already existing?
                const std::optional<Zstring> parentPath = getParentFolderPath(remotePath);
                if (!parentPath)
                    throw;

                const std::vector<FtpItem> items = readFolder(*parentPath); //throw ConnectionError, SysErrorFtpProtocol
                const Zstring folderName = getItemName(remotePath);
                if (std::none_of(items.begin(), items.end(), [&](const FtpItem& item) { return item.type != FtpItemType::file && item.itemName == folderName; }))
                    throw;
            }
        });
        knownFolders_.insert(remotePath);
    }

    void close() override
    {
        session_.reset();
        knownFolders_.clear();
        mfmtMissingReported_ = false;
    }

    bool isHealthy() const override { return session_ && !corrupted_ && session_->isHealthy(); }

    std::wstring getDisplayPath(const Zstring& remotePath) const override { return getCurlDisplayPath(login_, remotePath); }

    std::wstring getConnectionDetails() const override
    {
        return login_.useTls ? L"FTPS (explicit TLS)" : L"FTP";
    }

private:
    //map low-level errors: server responses (SysErrorFtpProtocol) concern the current item only, anything else breaks the session
    template <class Function>
    void runSessionCommand(const std::wstring& errorMsg, Function cmd /*throw SysError*/) //throw ConnectionError, TransferError
    {
        connect(); //throw ConnectionError
        try
        {
            cmd(*session_); //throw SysError, SysErrorFtpProtocol, (ConnectionError, NotFoundError)
        }
        catch (const SysErrorFtpProtocol& e)
        {
            if (e.ftpErrorCode == 421 || //Service not available, closing control connection.
                e.ftpErrorCode == 530)   //User not logged in.
            {
                corrupted_ = true;
                throw ConnectionError(errorMsg, e.toString());
            }
            throw TransferError(errorMsg, e.toString());
        }
        catch (const SysError& e)
        {
            corrupted_ = true;
            throw ConnectionError(errorMsg, e.toString());
        }
    }

    std::vector<FtpItem> readFolder(const Zstring& dirPath) //throw ConnectionError, SysErrorFtpProtocol
    {
        connect(); //throw ConnectionError
        try
        {
            std::string rawListing; //get raw FTP directory listing

            curl_write_callback onBytesReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
            {
                auto& listing = *static_cast<std::string*>(callbackData);
                listing.append(buffer, size * nitems);
                return size * nitems;
            };

            std::vector<CurlOption> options =
            {
                {CURLOPT_WRITEDATA, &rawListing},
                {CURLOPT_WRITEFUNCTION, onBytesReceived},
            };
            curl_ftpmethod pathMethod = CURLFTPMETHOD_SINGLECWD;

            if (session_->supportsMlsd()) //throw SysError
            {
                options.emplace_back(CURLOPT_CUSTOMREQUEST, "MLSD");

                //some FTP servers process wildcard characters inside the "dirpath": http://www.proftpd.org/docs/howto/Globbing.html
                const bool pathHasWildcards =
                    contains(afterFirst(dirPath, Zstr('['), IfNotFoundReturn::none), Zstr(']')) ||
                    contains(dirPath, Zstr('*')) ||
                    contains(dirPath, Zstr('?'));

                if (!pathHasWildcards)
                    pathMethod = CURLFTPMETHOD_NOCWD; //faster traversal compared to CURLFTPMETHOD_SINGLECWD
            }
            //else: use "LIST" + CURLFTPMETHOD_SINGLECWD
            //caveat: let's better not use LIST parameters: https://cr.yp.to/ftp/list.html

            FtpSession& session = *session_;
            session.perform(session.getServerPath(dirPath), true /*isDir*/, pathMethod, options, true /*requestUtf8*/); //throw SysError, SysErrorPassword, SysErrorFtpProtocol

            const ServerToUtf serverToUtf = [&session](const std::string_view& str) { return session.serverToUtfEncoding(str); }; //throw SysError

            if (session.supportsMlsd()) //throw SysError
                return parseMlsd(rawListing, serverToUtf); //throw SysError
            else
                return parseUnknown(rawListing, serverToUtf, std::time(nullptr)); //throw SysError
        }
        catch (const SysErrorFtpProtocol&) { throw; }
        catch (const SysError& e)
        {
            corrupted_ = true;
            throw ConnectionError(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(getDisplayPath(dirPath))), e.toString());
        }
    }

    struct FileDetails
    {
        uint64_t fileSize = 0;
        time_t modTime = 0;
    };

    //no value for symlinks pointing to a folder
    std::optional<FileDetails> getSymlinkTargetDetails(const Zstring& linkPath) //throw ConnectionError, SysErrorFtpProtocol
    {
        connect(); //throw ConnectionError
        try
        {
            FtpSession& session = *session_;
            //MLSD doesn't follow symlinks => SIZE + MDTM
            //if it's a folder expect FTP code 550
            session.ensureBinaryMode(); //throw SysError
            //...or some server return ASCII size or fail with '550 SIZE not allowed in ASCII mode'
            const std::optional<uint64_t> fileSize = parseSizeResponse(session.runSingleFtpCommand("*SIZE " + session.getServerPath(linkPath), true /*requestUtf8*/)); //throw SysError, SysErrorFtpProtocol
            if (!fileSize)
                return std::nullopt;

            const time_t modTime = parseMdtmResponse(session.runSingleFtpCommand("MDTM " + session.getServerPath(linkPath), true /*requestUtf8*/)); //throw SysError, SysErrorFtpProtocol
            return FileDetails{*fileSize, modTime};
        }
        catch (const SysErrorFtpProtocol&) { throw; }
        catch (const SysError& e)
        {
            corrupted_ = true;
            throw ConnectionError(replaceCpy(_("Cannot resolve symbolic link %x."), L"%x", fmtPath(getDisplayPath(linkPath))), e.toString());
        }
    }

    void setModTime(const Zstring& remotePath, time_t modTime) //throw FileError
    {
        const std::wstring errorMsg = replaceCpy(_("Cannot write modification time of %x."), L"%x", fmtPath(getDisplayPath(remotePath)));

        const std::string isoTime = utfTo<std::string>(formatTime(Zstr("%Y%m%d%H%M%S"), getUtcTime(modTime))); //returns empty string on error
        if (isoTime.empty())
            throw FileError(errorMsg, L"Invalid modification time (time_t: " + numberTo<std::wstring>(modTime) + L')');

        runSessionCommand(errorMsg, [&](FtpSession& session) //throw ConnectionError, TransferError
        {
            if (!session.supportsMfmt()) //throw SysError
            {
                if (mfmtMissingReported_) //once per session
                    return;
                mfmtMissingReported_ = true;
                throw SysErrorFtpProtocol(L"Server does not support the MFMT command. Uploaded files keep the server's modification time.", 502);
            }

            session.runSingleFtpCommand("MFMT " + isoTime + ' ' + session.getServerPath(remotePath), true /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol
        });
    }

    const FtpLogin login_;
    std::unique_ptr<FtpSession> session_;
    bool corrupted_ = false;
    KnownFolders knownFolders_;
    bool mfmtMissingReported_ = false;
};
}


std::unique_ptr<Transport> sb::createFtpTransport(const FtpLogin& login)
{
    return std::make_unique<FtpTransport>(login);
}
