// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef TRANSPORT_H_4380957203948570234
#define TRANSPORT_H_4380957203948570234

#include <functional>
#include <optional>
#include <set>
#include <vector>
#include <zen/file_access.h>
#include <zen/error_log.h>


namespace sb
{
DEFINE_NEW_FILE_ERROR(ConnectionError) //authentication failure, unreachable host, broken session
DEFINE_NEW_FILE_ERROR(ListError)
DEFINE_NEW_FILE_ERROR(TransferError)

struct NotFoundError : public TransferError
{
    NotFoundError(const std::wstring& msg) : TransferError(msg) {}
    NotFoundError(const std::wstring& msg, const std::wstring& descr) : TransferError(msg, descr) {}
};


//diagnostics sink: noexcept, called from any thread
using LogMessageFun = std::function<void(const std::wstring& msg, zen::MessageType type)>;


struct FileRecord
{
    Zstring relPath; //forward slashes, no leading slash
    uint64_t fileSize = 0;
    time_t modTime = 0; //UTC
};


struct UploadResult
{
    std::optional<zen::FileError> errorModTime; //remote modification time could not be set
};


//a single logical connection to one remote endpoint; *not* thread-safe: used by one thread at a time (see ConnectionPool)
//remote paths are absolute and use '/' separators
class Transport
{
public:
    virtual ~Transport() {}

    //no-op if already connected
    virtual void connect() = 0; //throw ConnectionError

    //- recursive: folders are not returned, symlinks are followed when they resolve to files
    //- an inaccessible sub folder is reported via "onSubFolderError" and treated as empty
    virtual std::vector<FileRecord> listRecursive(const Zstring& remoteRoot,
                                                  const std::function<void(const ListError& e)>& onSubFolderError) = 0; //throw ConnectionError, ListError

    //creates missing parent folders and overwrites an existing remote file
    virtual UploadResult upload(const Zstring& localPath, const Zstring& remotePath, const zen::IoCallback& notifyUnbufferedIO /*throw X*/) = 0; //throw ConnectionError, TransferError, X

    //creates missing local parent folders; transactional: the local file is replaced only after the download completed
    //the local modification time is set to the remote one
    virtual void download(const Zstring& remotePath, const Zstring& localPath, const zen::IoCallback& notifyUnbufferedIO /*throw X*/) = 0; //throw ConnectionError, TransferError, NotFoundError, X

    //not existing is not an error
    virtual void remove(const Zstring& remotePath) = 0; //throw ConnectionError, TransferError

    virtual void ensureDir(const Zstring& remotePath) = 0; //throw ConnectionError, TransferError

    virtual void close() = 0; //noexcept

    //false if not connected, after a connection-level error, or when idle for too long
    virtual bool isHealthy() const = 0;

    virtual std::wstring getDisplayPath(const Zstring& remotePath) const = 0;

    //e.g. TLS state or host key fingerprint
    virtual std::wstring getConnectionDetails() const = 0;
};


//remote folders created or found existing during one session: ensureDir() skips them
class KnownFolders
{
public:
    bool contains(const Zstring& folderPath) const { return folderPaths_.contains(folderPath); }
    void insert(const Zstring& folderPath) { folderPaths_.insert(folderPath); }
    void clear() { folderPaths_.clear(); }

    //call when a transfer of "itemPath" failed: its parent folders may have been deleted remotely
    void forgetParentsOf(const Zstring& itemPath);

private:
    std::set<Zstring> folderPaths_;
};


//helper for Transport implementations:
//write into a temporary file next to "localPath" and rename when complete
void writeLocalFileTransactional(const Zstring& localPath, std::optional<time_t> modTime,
                                 const std::function<void(const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock)>& produceContent /*throw X*/); //throw FileError, X

//"a/b.txt.8c2f.tmp" => "a/b.txt"; no value if not a temp name of writeLocalFileTransactional()
std::optional<Zstring> getTransactionalTargetPath(const Zstring& tmpFilePath);
}

#endif //TRANSPORT_H_4380957203948570234
