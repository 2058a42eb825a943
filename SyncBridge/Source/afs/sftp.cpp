// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "sftp.h"
#include <array>
#include <algorithm>
#include <cstring> //strdup
#include <zen/file_io.h>
#include <zen/socket.h>
#include <zen/open_ssl.h>
#include <zen/extra_log.h>
#include <libssh2/libssh2_wrap.h> //DON'T include <libssh2_sftp.h> directly!

using namespace zen;
using namespace sb;


namespace
{
//same as FTP: keep pooled sessions alive between two sync cycles
constexpr std::chrono::seconds SFTP_SESSION_MAX_IDLE_TIME(120);

//libssh2 sends at most 30000 bytes per SFTP packet, but pipelines bigger requests
constexpr size_t SFTP_BLOCK_SIZE_MIN = 32 * 1024;
constexpr size_t SFTP_BLOCK_SIZE_MAX = 4 * 1024 * 1024;

const long SFTP_DEFAULT_PERMISSION_FILE   = LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                                            LIBSSH2_SFTP_S_IRGRP |
                                            LIBSSH2_SFTP_S_IROTH;
const long SFTP_DEFAULT_PERMISSION_FOLDER = LIBSSH2_SFTP_S_IRWXU |
                                            LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IXGRP |
                                            LIBSSH2_SFTP_S_IROTH | LIBSSH2_SFTP_S_IXOTH;

int getEffectivePort(int portOption)
{
    if (portOption > 0)
        return portOption;
    return DEFAULT_PORT_SFTP;
}


std::string getLibssh2Path(const Zstring& itemPath)
{
    return utfTo<std::string>(itemPath);
}


std::wstring getSftpDisplayPath(const SftpLogin& login, const Zstring& itemPath)
{
    Zstring displayPath = Zstr("sftp://");

    if (!login.username.empty()) //show username!
        displayPath += login.username + Zstr('@');

    displayPath += login.server;

    if (getEffectivePort(login.port) != DEFAULT_PORT_SFTP)
        displayPath += Zstr(':') + numberTo<Zstring>(getEffectivePort(login.port));

    if (itemPath != Zstr("/"))
        displayPath += itemPath;

    return utfTo<std::wstring>(displayPath);
}

//===========================================================================================================================

//=> most likely *not* a connection issue
struct SysErrorSftpProtocol : public zen::SysError
{
    SysErrorSftpProtocol(const std::wstring& msg, unsigned long sftpError) : SysError(msg), sftpErrorCode(sftpError) {}

    const unsigned long sftpErrorCode;
};

DEFINE_NEW_SYS_ERROR(SysErrorPassword)


//one blocking SSH session with a single SFTP channel
class SshSession
{
public:
    explicit SshSession(const SftpLogin& login) : //throw SysError, SysErrorPassword
        login_(login)
    {
        ZEN_ON_SCOPE_FAIL(cleanup()); //destructor call would lead to member double clean-up!!!

        socket_.emplace(login_.server, getEffectivePort(login_.port), login_.timeoutSec); //throw SysError

        sshSession_ = ::libssh2_session_init();
        if (!sshSession_) //does not set ssh last error; source: only memory allocation may fail
            throw SysError(formatSystemError("libssh2_session_init", formatSshStatusCode(LIBSSH2_ERROR_ALLOC), L""));

        ::libssh2_session_set_blocking(sshSession_, 1);
        ::libssh2_session_set_timeout(sshSession_, login_.timeoutSec * 1000 /*ms*/);

        if (::libssh2_session_handshake(sshSession_, socket_->get()) != 0)
            throw SysError(formatLastSshError("libssh2_session_handshake"));

        size_t hostKeyLen = 0;
        int hostKeyType = LIBSSH2_HOSTKEY_TYPE_UNKNOWN;
        const char* hostKey = ::libssh2_session_hostkey(sshSession_, &hostKeyLen, &hostKeyType);
        if (!hostKey)
            throw SysError(formatLastSshError("libssh2_session_hostkey"));
        hostKeyFingerprint_ = getSha256Fingerprint(makeStringView(hostKey, hostKeyLen)); //throw SysError

        authenticate(); //throw SysError, SysErrorPassword

        sftpChannel_ = ::libssh2_sftp_init(sshSession_);
        if (!sftpChannel_)
            throw SysError(formatLastSshError("libssh2_sftp_init"));

        lastSuccessfulUseTime_ = std::chrono::steady_clock::now();
    }

    ~SshSession() { cleanup(); }

    bool isHealthy() const
    {
        if (possiblyCorrupted_)
            return false;

        if (std::chrono::steady_clock::now() > lastSuccessfulUseTime_ + SFTP_SESSION_MAX_IDLE_TIME)
            return false;

        return true;
    }

    void markAsCorrupted() { possiblyCorrupted_ = true; }

    const std::string& getHostKeyFingerprint() const { return hostKeyFingerprint_; }

    struct Details
    {
        LIBSSH2_SESSION* sshSession;
        LIBSSH2_SFTP*   sftpChannel;
    };

    //returns the (non-negative) result of "sftpCommand"
    int executeBlocking(const char* functionName, const std::function<int(const Details& sd)>& sftpCommand /*noexcept!*/) //throw SysError, SysErrorSftpProtocol
    {
        const int rc = sftpCommand({sshSession_, sftpChannel_});

        if (rc < 0 && ::libssh2_session_last_errno(sshSession_) != rc) //when libssh2 fails to properly set last error; e.g. https://github.com/libssh2/libssh2/pull/123
            ::libssh2_session_set_last_error(sshSession_, rc, nullptr);

        if (rc >= LIBSSH2_ERROR_NONE ||
            (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && ::libssh2_sftp_last_error(sftpChannel_) != LIBSSH2_FX_OK))
            //libssh2 source: LIBSSH2_ERROR_SFTP_PROTOCOL *without* setting LIBSSH2_SFTP::last_errno indicates a corrupted connection!
        {
            lastSuccessfulUseTime_ = std::chrono::steady_clock::now(); //[!] LIBSSH2_ERROR_SFTP_PROTOCOL is NOT an SSH error => the SSH session is just fine!

            if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL)
                throw SysErrorSftpProtocol(formatLastSshError(functionName), ::libssh2_sftp_last_error(sftpChannel_));
            return rc;
        }

        //=> SSH session errors only (hopefully!) e.g. LIBSSH2_ERROR_SOCKET_RECV, LIBSSH2_ERROR_TIMEOUT
        possiblyCorrupted_ = true;
        throw SysError(formatLastSshError(functionName));
    }

private:
    SshSession           (const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    void authenticate() //throw SysError, SysErrorPassword
    {
        const auto usernameUtf8 = utfTo<std::string>(login_.username);
        const auto passwordUtf8 = utfTo<std::string>(login_.password);

        const char* authList = ::libssh2_userauth_list(sshSession_, usernameUtf8.c_str(), static_cast<unsigned int>(usernameUtf8.size()));
        if (!authList)
        {
            if (::libssh2_userauth_authenticated(sshSession_) != 1)
                throw SysError(formatLastSshError("libssh2_userauth_list"));
            return; //SSH_USERAUTH_NONE has authenticated successfully => we're already done
        }

        bool supportAuthPassword    = false;
        bool supportAuthKeyfile     = false;
        bool supportAuthInteractive = false;
        split(authList, ',', [&](std::string_view authMethod)
        {
            authMethod = trimCpy(authMethod);
            if (authMethod == "password")
                supportAuthPassword = true;
            else if (authMethod == "publickey")
                supportAuthKeyfile = true;
            else if (authMethod == "keyboard-interactive")
                supportAuthInteractive = true;
        });

        if (!login_.privateKeyFilePath.empty())
        {
            if (!supportAuthKeyfile)
                throw SysError(replaceCpy(_("The server does not support authentication via %x."), L"%x", L"\"key file\"") +
                               L'\n' +_("Required:") + L' ' + utfTo<std::wstring>(authList));

            if (::libssh2_userauth_publickey_fromfile(sshSession_, usernameUtf8, utfTo<std::string>(login_.privateKeyFilePath), passwordUtf8) != 0)
                throw SysErrorPassword(formatLastSshError("libssh2_userauth_publickey_fromfile"));
        }
        else if (supportAuthPassword)
        {
            if (::libssh2_userauth_password(sshSession_, usernameUtf8, passwordUtf8) != 0)
                throw SysErrorPassword(formatLastSshError("libssh2_userauth_password"));
        }
        else if (supportAuthInteractive) //some servers support "keyboard-interactive", but not "password"
        {
            std::wstring unexpectedPrompts;

            auto authCallback = [&](int num_prompts, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses)
            {
                //a single prompt without echo is the password request; prompt text may be localized
                if (num_prompts == 1 && prompts[0].echo == 0)
                {
                    responses[0].text = //pass ownership; will be ::free()d
                        ::strdup(passwordUtf8.c_str());
                    responses[0].length = static_cast<unsigned int>(passwordUtf8.size());
                }
                else
                    for (int i = 0; i < num_prompts; ++i)
                        unexpectedPrompts += (unexpectedPrompts.empty() ? L"" : L"|") + utfTo<std::wstring>(makeStringView(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length));
            };
            using AuthCbType = decltype(authCallback);

            auto authCallbackWrapper = [](const char* name, int name_len, const char* instruction, int instruction_len,
                                          int num_prompts, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses, void** abstract)
            {
                AuthCbType* callback = *reinterpret_cast<AuthCbType**>(abstract); //free this poor little C-API from its shackles and redirect to a proper lambda
                (*callback)(num_prompts, prompts, responses);
            };

            if (*::libssh2_session_abstract(sshSession_))
                throw SysError(L"libssh2_session_abstract: non-null value");

            *reinterpret_cast<AuthCbType**>(::libssh2_session_abstract(sshSession_)) = &authCallback;
            ZEN_ON_SCOPE_EXIT(*::libssh2_session_abstract(sshSession_) = nullptr);

            if (::libssh2_userauth_keyboard_interactive_ex(sshSession_, usernameUtf8.c_str(), static_cast<unsigned int>(usernameUtf8.size()), authCallbackWrapper) != 0)
                throw SysErrorPassword(formatLastSshError("libssh2_userauth_keyboard_interactive") +
                                       (unexpectedPrompts.empty() ? L"" : L"\nUnexpected prompts: " + unexpectedPrompts));
        }
        else
            throw SysError(replaceCpy(_("The server does not support authentication via %x."), L"%x", L"\"username/password\"") +
                           L'\n' +_("Required:") + L' ' + utfTo<std::wstring>(authList));
    }

    void cleanup() //attention: may block heavily after error!
    {
        if (sftpChannel_)
            if (::libssh2_sftp_shutdown(sftpChannel_) != LIBSSH2_ERROR_NONE)
                assert(false);

        if (sshSession_)
        {
            if (!possiblyCorrupted_) //else: avoid further stress on the broken SSH session and take French leave
                if (::libssh2_session_disconnect(sshSession_, "SyncBridge says \"bye\"!") != LIBSSH2_ERROR_NONE) //= server notification only! no local cleanup apparently
                    assert(false);

            if (::libssh2_session_free(sshSession_) != LIBSSH2_ERROR_NONE)
                assert(false);
        }
    }

    std::wstring formatLastSshError(const char* functionName) const
    {
        char* lastErrorMsg = nullptr; //owned by "sshSession"
        const int sshStatusCode = ::libssh2_session_last_error(sshSession_, &lastErrorMsg, nullptr, false /*want_buf*/);

        std::wstring errorMsg;
        if (lastErrorMsg)
            errorMsg = trimCpy(utfTo<std::wstring>(lastErrorMsg));

        //LIBSSH2_ERROR_SFTP_PROTOCOL does *not* mean libssh2_sftp_last_error() is also available!
        //But if it's not, we have a broken connection, and lastErrorMsg contains meaningful details!
        if (sshStatusCode == LIBSSH2_ERROR_SFTP_PROTOCOL && sftpChannel_ && ::libssh2_sftp_last_error(sftpChannel_) != LIBSSH2_FX_OK)
        {
            if (errorMsg == L"SFTP Protocol Error") //that's trite!
                errorMsg.clear();
            return formatSystemError(functionName, formatSftpStatusCode(::libssh2_sftp_last_error(sftpChannel_)), errorMsg);
        }

        return formatSystemError(functionName, formatSshStatusCode(sshStatusCode), errorMsg);
    }

    const SftpLogin login_;
    std::optional<Socket> socket_; //*bound* after constructor has run
    LIBSSH2_SESSION* sshSession_ = nullptr;
    LIBSSH2_SFTP* sftpChannel_ = nullptr;
    bool possiblyCorrupted_ = false;
    std::string hostKeyFingerprint_;
    std::chrono::steady_clock::time_point lastSuccessfulUseTime_;
};

//===========================================================================================================================

enum class SftpItemType
{
    file,
    folder,
    symlink,
};

struct SftpItem
{
    SftpItemType type;
    Zstring  itemName;
    uint64_t fileSize;
    time_t   modTime;
};


class SftpTransport : public Transport
{
public:
    explicit SftpTransport(const SftpLogin& login) : login_(login) {}

    void connect() override //throw ConnectionError
    {
        if (session_ && session_->isHealthy())
            return;
        session_.reset(); //broken sessions are not reused
        try
        {
            session_ = std::make_unique<SshSession>(login_); //throw SysError, SysErrorPassword
        }
        catch (const SysError& e) { throw ConnectionError(replaceCpy(_("Unable to connect to %x."), L"%x", fmtPath(getDisplayPath(Zstr("/")))), e.toString()); }
    }

    std::vector<FileRecord> listRecursive(const Zstring& remoteRoot, const std::function<void(const ListError& e)>& onSubFolderError) override //throw ConnectionError, ListError
    {
        std::vector<FileRecord> output;
        std::vector<std::pair<Zstring /*server path*/, Zstring /*relative path*/>> workload{{remoteRoot, Zstring()}};

        while (!workload.empty())
        {
            auto [dirPath, relDirPath] = std::move(workload.back());
            /**/                                   workload.pop_back();

            const std::wstring errorMsg = replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(getDisplayPath(dirPath)));
            std::vector<SftpItem> items;
            try
            {
                runSessionCommand(errorMsg, [&](SshSession& session) { items = getDirContentFlat(session, dirPath); }); //throw ConnectionError, TransferError
            }
            catch (const ConnectionError&) { throw; }
            catch (const TransferError& e)
            {
                const ListError errorList(errorMsg, e.toString());
                if (relDirPath.empty())
                    throw errorList;
                onSubFolderError(errorList);
                continue;
            }

            for (const SftpItem& item : items)
            {
                const Zstring itemPath    = appendPath(dirPath,    item.itemName);
                const Zstring itemRelPath = appendPath(relDirPath, item.itemName);

                switch (item.type)
                {
                    case SftpItemType::file:
                        output.push_back({itemRelPath, item.fileSize, item.modTime});
                        break;

                    case SftpItemType::folder:
                        workload.emplace_back(itemPath, itemRelPath);
                        break;

                    case SftpItemType::symlink:
                        try
                        {
                            LIBSSH2_SFTP_ATTRIBUTES attribsTrg = {};
                            runSessionCommand(replaceCpy(_("Cannot resolve symbolic link %x."), L"%x", fmtPath(getDisplayPath(itemPath))), [&](SshSession& session)
                            {
                                session.executeBlocking("libssh2_sftp_stat", //throw SysError, SysErrorSftpProtocol
                                [&](const SshSession::Details& sd) { return ::libssh2_sftp_stat(sd.sftpChannel, getLibssh2Path(itemPath), &attribsTrg); }); //noexcept!
                            }); //throw ConnectionError, TransferError

                            //symlinks to folders are not followed
                            if ((attribsTrg.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) != 0 && !LIBSSH2_SFTP_S_ISDIR(attribsTrg.permissions))
                            {
                                if ((attribsTrg.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) == 0 ||
                                    (attribsTrg.flags & LIBSSH2_SFTP_ATTR_SIZE) == 0)
                                    throw TransferError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getDisplayPath(itemPath))), L"File attributes not available.");

                                output.push_back({itemRelPath, attribsTrg.filesize, static_cast<time_t>(attribsTrg.mtime)});
                            }
                        }
                        catch (const ConnectionError&) { throw; }
                        catch (const TransferError& e) { onSubFolderError(ListError(e.toString())); }
                        break;
                }
            }
        }
        return output;
    }

    UploadResult upload(const Zstring& localPath, const Zstring& remotePath, const IoCallback& notifyUnbufferedIO /*throw X*/) override //throw ConnectionError, TransferError, FileError, X
    {
        ZEN_ON_SCOPE_FAIL(knownFolders_.forgetParentsOf(remotePath)); //next upload re-creates missing folders

        if (const std::optional<Zstring> parentPath = getParentFolderPath(remotePath))
            ensureDir(*parentPath); //throw ConnectionError, TransferError

        FileInputPlain fileIn(localPath); //throw FileError

        const std::wstring errorMsg = replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getDisplayPath(remotePath)));

        runSessionCommand(errorMsg, [&](SshSession& session) //throw ConnectionError, TransferError
        {
            LIBSSH2_SFTP_HANDLE* fileHandle = nullptr;
            session.executeBlocking("libssh2_sftp_open", //throw SysError, SysErrorSftpProtocol
                                    [&](const SshSession::Details& sd) //noexcept!
            {
                //existing files are overwritten
                fileHandle = ::libssh2_sftp_open(sd.sftpChannel, getLibssh2Path(remotePath),
                                                 LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                                 SFTP_DEFAULT_PERMISSION_FILE); //note: server may also apply umask!
                if (!fileHandle)
                    return std::min(::libssh2_session_last_errno(sd.sshSession), LIBSSH2_ERROR_SOCKET_NONE);
                return LIBSSH2_ERROR_NONE;
            });
            bool handleClosed = false;
            ZEN_ON_SCOPE_EXIT(if (!handleClosed) closeHandle(session, fileHandle, errorMsg));

            std::vector<char> buffer(std::clamp(login_.bufferSize, SFTP_BLOCK_SIZE_MIN, SFTP_BLOCK_SIZE_MAX));
            for (;;)
            {
                const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size()); //throw FileError
                if (bytesRead == 0) //end of file
                    break;

                for (size_t bytesWritten = 0; bytesWritten < bytesRead;)
                {
                    const int rc = session.executeBlocking("libssh2_sftp_write", //throw SysError, SysErrorSftpProtocol
                                                           [&](const SshSession::Details& sd) //noexcept!
                    {
                        return static_cast<int>(::libssh2_sftp_write(fileHandle, buffer.data() + bytesWritten, bytesRead - bytesWritten));
                    });
                    ASSERT_SYSERROR(static_cast<size_t>(rc) <= bytesRead - bytesWritten); //better safe than sorry
                    bytesWritten += rc;
                }
                if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead); //throw X
            }

            handleClosed = true;
            session.executeBlocking("libssh2_sftp_close", //throw SysError, SysErrorSftpProtocol
            [&](const SshSession::Details& sd) { return ::libssh2_sftp_close(fileHandle); }); //noexcept!
        });
        //------------------------------------------------------------------------------------
        UploadResult result;
        try
        {
            LIBSSH2_SFTP_ATTRIBUTES attribNew = {};
            attribNew.flags = LIBSSH2_SFTP_ATTR_ACMODTIME;
            attribNew.mtime = static_cast<decltype(attribNew.mtime)>(fileIn.getModTime());
            attribNew.atime = static_cast<decltype(attribNew.atime)>(std::time(nullptr));

            runSessionCommand(replaceCpy(_("Cannot write modification time of %x."), L"%x", fmtPath(getDisplayPath(remotePath))), [&](SshSession& session)
            {
                session.executeBlocking("libssh2_sftp_setstat", //throw SysError, SysErrorSftpProtocol
                [&](const SshSession::Details& sd) { return ::libssh2_sftp_setstat(sd.sftpChannel, getLibssh2Path(remotePath), &attribNew); }); //noexcept!
            }); //throw ConnectionError, TransferError
        }
        catch (const ConnectionError&) { throw; }
        catch (const TransferError& e) { result.errorModTime = e; }

        return result;
    }

    void download(const Zstring& remotePath, const Zstring& localPath, const IoCallback& notifyUnbufferedIO /*throw X*/) override //throw ConnectionError, TransferError, NotFoundError, FileError, X
    {
        const std::wstring errorMsg = replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getDisplayPath(remotePath)));

        LIBSSH2_SFTP_ATTRIBUTES attribs = {};
        runSessionCommand(errorMsg, [&](SshSession& session) //throw ConnectionError, TransferError
        {
            try
            {
                session.executeBlocking("libssh2_sftp_stat", //throw SysError, SysErrorSftpProtocol
                [&](const SshSession::Details& sd) { return ::libssh2_sftp_stat(sd.sftpChannel, getLibssh2Path(remotePath), &attribs); }); //noexcept!
            }
            catch (const SysErrorSftpProtocol& e)
            {
                if (e.sftpErrorCode == LIBSSH2_FX_NO_SUCH_FILE)
                    throw NotFoundError(errorMsg, e.toString());
                throw;
            }
        });
        if ((attribs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) == 0)
            throw TransferError(errorMsg, L"Modification time not supported.");

        writeLocalFileTransactional(localPath, static_cast<time_t>(attribs.mtime), [&](const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock) //throw FileError, X
        {
            runSessionCommand(errorMsg, [&](SshSession& session) //throw ConnectionError, TransferError
            {
                LIBSSH2_SFTP_HANDLE* fileHandle = nullptr;
                session.executeBlocking("libssh2_sftp_open", //throw SysError, SysErrorSftpProtocol
                                        [&](const SshSession::Details& sd) //noexcept!
                {
                    fileHandle = ::libssh2_sftp_open(sd.sftpChannel, getLibssh2Path(remotePath), LIBSSH2_FXF_READ, 0);
                    if (!fileHandle)
                        return std::min(::libssh2_session_last_errno(sd.sshSession), LIBSSH2_ERROR_SOCKET_NONE);
                    return LIBSSH2_ERROR_NONE;
                });
                ZEN_ON_SCOPE_EXIT(closeHandle(session, fileHandle, errorMsg));

                std::vector<char> buffer(std::clamp(login_.bufferSize, SFTP_BLOCK_SIZE_MIN, SFTP_BLOCK_SIZE_MAX));
                for (;;)
                {
                    //libssh2_sftp_read has same semantics as Posix read: only 0 means EOF
                    const int bytesRead = session.executeBlocking("libssh2_sftp_read", //throw SysError, SysErrorSftpProtocol
                    [&](const SshSession::Details& sd) { return static_cast<int>(::libssh2_sftp_read(fileHandle, buffer.data(), buffer.size())); }); //noexcept!
                    ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= buffer.size()); //better safe than sorry

                    if (bytesRead == 0)
                        break;

                    writeBlock(buffer.data(), bytesRead); //throw FileError
                    if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead); //throw X
                }
            });
        }); //throw FileError, X
    }

    void remove(const Zstring& remotePath) override //throw ConnectionError, TransferError
    {
        runSessionCommand(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(getDisplayPath(remotePath))), [&](SshSession& session) //throw ConnectionError, TransferError
        {
            try
            {
                session.executeBlocking("libssh2_sftp_unlink", //throw SysError, SysErrorSftpProtocol
                [&](const SshSession::Details& sd) { return ::libssh2_sftp_unlink(sd.sftpChannel, getLibssh2Path(remotePath)); }); //noexcept!
            }
            catch (const SysErrorSftpProtocol& e)
            {
                if (e.sftpErrorCode == LIBSSH2_FX_NO_SUCH_FILE) //already gone
                    return;
                throw;
            }
        });
    }

    void ensureDir(const Zstring& remotePath) override //throw ConnectionError, TransferError
    {
        if (remotePath == Zstr("/") || knownFolders_.contains(remotePath))
            return;

        if (const std::optional<Zstring> parentPath = getParentFolderPath(remotePath))
            ensureDir(*parentPath); //throw ConnectionError, TransferError

        runSessionCommand(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(getDisplayPath(remotePath))), [&](SshSession& session) //throw ConnectionError, TransferError
        {
            try
            {
                session.executeBlocking("libssh2_sftp_mkdir", //throw SysError, SysErrorSftpProtocol
                [&](const SshSession::Details& sd) { return ::libssh2_sftp_mkdir(sd.sftpChannel, getLibssh2Path(remotePath), SFTP_DEFAULT_PERMISSION_FOLDER); }); //noexcept!
            }
            catch (const SysErrorSftpProtocol&) //libssh2_sftp_mkdir reports generic LIBSSH2_FX_FAILURE if existing
            {
                LIBSSH2_SFTP_ATTRIBUTES attribs = {};
                try
                {
                    session.executeBlocking("libssh2_sftp_stat", //throw SysError, SysErrorSftpProtocol
                    [&](const SshSession::Details& sd) { return ::libssh2_sftp_stat(sd.sftpChannel, getLibssh2Path(remotePath), &attribs); }); //noexcept!
                }
                catch (const SysErrorSftpProtocol&) {} //=> report the original error

                if ((attribs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) == 0 || !LIBSSH2_SFTP_S_ISDIR(attribs.permissions))
                    throw;
            }
        });
        knownFolders_.insert(remotePath);
    }

    void close() override
    {
        session_.reset();
        knownFolders_.clear();
    }

    bool isHealthy() const override { return session_ && session_->isHealthy(); }

    std::wstring getDisplayPath(const Zstring& remotePath) const override { return getSftpDisplayPath(login_, remotePath); }

    std::wstring getConnectionDetails() const override
    {
        std::wstring details = L"SFTP";
        if (session_)
            details += L", host key " + utfTo<std::wstring>(session_->getHostKeyFingerprint());
        return details;
    }

private:
    template <class Function>
    void runSessionCommand(const std::wstring& errorMsg, Function cmd /*throw SysError*/) //throw ConnectionError, TransferError
    {
        connect(); //throw ConnectionError
        try
        {
            cmd(*session_); //throw SysError, SysErrorSftpProtocol, (NotFoundError, FileError, X)
        }
        catch (const SysErrorSftpProtocol& e) { throw TransferError(errorMsg, e.toString()); }
        catch (const SysError& e)
        {
            session_->markAsCorrupted();
            throw ConnectionError(errorMsg, e.toString());
        }
    }

    static void closeHandle(SshSession& session, LIBSSH2_SFTP_HANDLE* fileHandle, const std::wstring& errorMsg)
    {
        try
        {
            session.executeBlocking("libssh2_sftp_close", //throw SysError, SysErrorSftpProtocol
            [&](const SshSession::Details& sd) { return ::libssh2_sftp_close(fileHandle); }); //noexcept!
        }
        catch (const SysError& e) { logExtraError(errorMsg + L"\n\n" + e.toString()); }
    }

    std::vector<SftpItem> getDirContentFlat(SshSession& session, const Zstring& dirPath) //throw SysError, SysErrorSftpProtocol
    {
        LIBSSH2_SFTP_HANDLE* dirHandle = nullptr;
        session.executeBlocking("libssh2_sftp_opendir", //throw SysError, SysErrorSftpProtocol
                                [&](const SshSession::Details& sd) //noexcept!
        {
            dirHandle = ::libssh2_sftp_opendir(sd.sftpChannel, getLibssh2Path(dirPath));
            if (!dirHandle)
                return std::min(::libssh2_session_last_errno(sd.sshSession), LIBSSH2_ERROR_SOCKET_NONE);
            return LIBSSH2_ERROR_NONE;
        });

        ZEN_ON_SCOPE_EXIT(try
        {
            session.executeBlocking("libssh2_sftp_closedir", //throw SysError, SysErrorSftpProtocol
            [&](const SshSession::Details& sd) { return ::libssh2_sftp_closedir(dirHandle); }); //noexcept!
        }
        catch (const SysError& e) { logExtraError(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(getDisplayPath(dirPath))) + L"\n\n" + e.toString()); });

        std::vector<SftpItem> output;
        for (;;)
        {
            std::array<char, 1024> buf; //in practice NAME_MAX(255)+1 should suffice
            LIBSSH2_SFTP_ATTRIBUTES attribs = {};
            const int rc = session.executeBlocking("libssh2_sftp_readdir", //throw SysError, SysErrorSftpProtocol
            [&](const SshSession::Details& sd) { return ::libssh2_sftp_readdir(dirHandle, buf.data(), buf.size(), &attribs); }); //noexcept!

            if (rc == 0) //no more items
                return output;

            const std::string_view sftpItemName = makeStringView(buf.data(), rc);

            if (sftpItemName == "." || sftpItemName == "..") //check needed for SFTP, too!
                continue;

            const Zstring& itemName = utfTo<Zstring>(sftpItemName);

            if ((attribs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) == 0) //server probably does not support these attributes => fail at folder level
                throw SysErrorSftpProtocol(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getDisplayPath(appendPath(dirPath, itemName)))) +
                                           L' ' + L"File attributes not available.", LIBSSH2_FX_OP_UNSUPPORTED);

            if (LIBSSH2_SFTP_S_ISLNK(attribs.permissions))
                output.push_back({SftpItemType::symlink, itemName, 0, 0});
            else if (LIBSSH2_SFTP_S_ISDIR(attribs.permissions))
                output.push_back({SftpItemType::folder, itemName, 0, 0});
            else //a file or named pipe, ect: LIBSSH2_SFTP_S_ISREG, LIBSSH2_SFTP_S_ISCHR, LIBSSH2_SFTP_S_ISBLK, LIBSSH2_SFTP_S_ISFIFO, LIBSSH2_SFTP_S_ISSOCK
            {
                if ((attribs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) == 0 ||
                    (attribs.flags & LIBSSH2_SFTP_ATTR_SIZE) == 0)
                    throw SysErrorSftpProtocol(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getDisplayPath(appendPath(dirPath, itemName)))) +
                                               L' ' + L"Modification time or file size not supported.", LIBSSH2_FX_OP_UNSUPPORTED);

                output.push_back({SftpItemType::file, itemName, attribs.filesize, static_cast<time_t>(attribs.mtime)});
            }
        }
    }

    const SftpLogin login_;
    std::unique_ptr<SshSession> session_;
    KnownFolders knownFolders_;
};
}


std::unique_ptr<Transport> sb::createSftpTransport(const SftpLogin& login)
{
    return std::make_unique<SftpTransport>(login);
}
