// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "file_io.h"
#include <atomic>
#include <random>
#include "extra_log.h"
    #include <sys/stat.h>
    #include <fcntl.h>  //open
    #include <unistd.h> //close, read, write

using namespace zen;


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        try
        {
            close(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


void FileBase::close() //throw FileError
{
    try
    {
        if (hFile_ == invalidFileHandle)
            throw SysError(L"Contract error: close() called more than once.");
        if (::close(hFile_) != 0)
            THROW_LAST_SYS_ERROR("close");
        hFile_ = invalidFileHandle; //do NOT set on error! => ~FileOutputPlain() still wants to (try to) delete the file!
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
std::pair<FileBase::FileHandle, struct stat> openHandleForRead(const Zstring& filePath) //throw FileError
{
    try
    {
        //caveat: check for file types that block during open(): character device, block device, named pipe
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
            THROW_LAST_SYS_ERROR("stat");

        if (!S_ISREG(fileInfo.st_mode))
            throw SysError(_("Unsupported item type."));

        const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
            THROW_LAST_SYS_ERROR("open");
        return {fdFile /*pass ownership*/, fileInfo};
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}
}


FileInputPlain::FileInputPlain(FileHandle handle, const struct stat& fileInfo, const Zstring& filePath) :
    FileBase(handle, filePath),
    fileSize_(fileInfo.st_size),
    modTime_(fileInfo.st_mtim.tv_sec) {}


FileInputPlain::FileInputPlain(const Zstring& filePath) :
    FileInputPlain(openHandleForRead(filePath), filePath) {}


FileInputPlain::FileInputPlain(const std::pair<FileHandle, struct stat>& fileInfo, const Zstring& filePath) :
    FileInputPlain(fileInfo.first, fileInfo.second, filePath) {}


size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError; may return short, only 0 means EOF!
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string("Contract violation! ") + __FILE__ + ':' + numberTo<std::string>(__LINE__));
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(getHandle(), buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR); //Compare copy_reg() in copy.c: ftp://ftp.gnu.org/gnu/coreutils/coreutils-8.23.tar.xz

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");
        if (static_cast<size_t>(bytesRead) > bytesToRead) //better safe than sorry
            throw SysError(formatSystemError("read", L"", L"Buffer overflow."));

        return bytesRead; //"zero indicates end of file"
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForWrite(const Zstring& filePath) //throw FileError, ErrorTargetExisting
{
    try
    {
        const mode_t lockFileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH; //0666 => umask will be applied implicitly!

        //O_EXCL contains a race condition on NFS file systems: https://linux.die.net/man/2/open
        const int fdFile = ::open(filePath.c_str(),                             //const char* pathname
                                  O_CREAT | O_WRONLY | O_EXCL | O_CLOEXEC, //int flags
                                  lockFileMode);                           //mode_t mode
        if (fdFile == -1)
        {
            const int ec = errno; //copy before making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), formatSystemError("open", ec));

            THROW_LAST_SYS_ERROR("open");
        }
        return fdFile; //pass ownership
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}
}


FileOutputPlain::FileOutputPlain(const Zstring& filePath) : //throw FileError, ErrorTargetExisting
    FileBase(openHandleForWrite(filePath), filePath) {}


FileOutputPlain::~FileOutputPlain()
{
    if (getHandle() != invalidFileHandle) //not finalized => clean up garbage
        try
        {
            //"deleting while handle is open" == FILE_FLAG_DELETE_ON_CLOSE
            if (::unlink(getFilePath().c_str()) != 0)
                THROW_LAST_SYS_ERROR("unlink");
        }
        catch (const SysError& e)
        {
            logExtraError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(getFilePath())) + L"\n\n" + e.toString());
        }
}


size_t FileOutputPlain::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError; may return short! CONTRACT: bytesToWrite > 0
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string("Contract violation! ") + __FILE__ + ':' + numberTo<std::string>(__LINE__));
    try
    {
        ssize_t bytesWritten = 0;
        do
        {
            bytesWritten = ::write(getHandle(), buffer, bytesToWrite);
        }
        while (bytesWritten < 0 && errno == EINTR);

        if (bytesWritten <= 0)
        {
            if (bytesWritten == 0) //comment in safe-read.c suggests to treat this as an error due to buggy drivers
                errno = ENOSPC;

            THROW_LAST_SYS_ERROR("write");
        }
        if (bytesWritten > static_cast<ssize_t>(bytesToWrite)) //better safe than sorry
            throw SysError(formatSystemError("write", L"", L"Buffer overflow."));

        return bytesWritten;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

Zstring zen::getPathWithTempName(const Zstring& filePath) //generate (hopefully) unique file name
{
    const Zstring shortGuid_ = [&]
    {
        static std::atomic<unsigned int> counter{0};
        thread_local std::mt19937 rng{std::random_device{}()};
        const unsigned int rnd = std::uniform_int_distribution<unsigned int>(0, 0xffff)(rng);
        return printNumber<Zstring>(Zstr("%04x"), rnd ^ (++counter & 0xffff));
    }();

    const std::optional<Zstring> parentPath = getParentFolderPath(filePath);
    if (!parentPath)
        return filePath + Zstr('.') + shortGuid_ + Zstr(".tmp");

    const Zstring fileName = getItemName(filePath);
    const Zstring tmpName = fileName + Zstr('.') + shortGuid_ + Zstr(".tmp");
    return appendPath(*parentPath, tmpName);
}


std::string zen::getFileContent(const Zstring& filePath, const IoCallback& notifyUnbufferedIO /*throw X*/) //throw FileError, X
{
    FileInputPlain fileIn(filePath); //throw FileError

    std::string buffer;
    buffer.resize(static_cast<size_t>(fileIn.getFileSize()) + 1); //+1: detect EOF without an extra round trip
    size_t bytesReadTotal = 0;
    for (;;)
    {
        if (bytesReadTotal == buffer.size())
            buffer.resize(buffer.size() * 2);

        const size_t bytesRead = fileIn.tryRead(&buffer[bytesReadTotal], buffer.size() - bytesReadTotal); //throw FileError
        if (bytesRead == 0) //EOF
            break;
        bytesReadTotal += bytesRead;

        if (notifyUnbufferedIO) notifyUnbufferedIO(bytesRead); //throw X
    }
    buffer.resize(bytesReadTotal);
    fileIn.close(); //throw FileError
    return buffer;
}


void zen::setFileContent(const Zstring& filePath, const std::string_view bytes, const IoCallback& notifyUnbufferedIO /*throw X*/) //throw FileError, X
{
    const Zstring tmpFilePath = getPathWithTempName(filePath);

    FileOutputPlain tmpFile(tmpFilePath); //throw FileError, (ErrorTargetExisting)

    size_t bytesWrittenTotal = 0;
    while (bytesWrittenTotal < bytes.size())
    {
        const size_t bytesWritten = tmpFile.tryWrite(bytes.data() + bytesWrittenTotal,
                                                     std::min(bytes.size() - bytesWrittenTotal, FileBase::defaultBlockSize)); //throw FileError
        bytesWrittenTotal += bytesWritten;
        if (notifyUnbufferedIO) notifyUnbufferedIO(bytesWritten); //throw X
    }
    tmpFile.close(); //throw FileError
    //take over ownership:
    ZEN_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); /*throw FileError*/ }
    catch (const FileError& e) { logExtraError(e.toString()); });

    //operation finished: move temp file transactionally
    moveAndRenameItem(tmpFilePath, filePath, true /*replaceExisting*/); //throw FileError, (ErrorTargetExisting)
}
