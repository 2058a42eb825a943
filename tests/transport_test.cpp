// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include <zen/file_io.h>
#include <zen/file_traverser.h>
#include "afs/transport.h"
#include "test_util.h"

using namespace zen;
using namespace sb;
using namespace sb::test;


TEST(TransactionalTargetPath, RecognizesTempNames)
{
    EXPECT_EQ(getTransactionalTargetPath(Zstr("big.bin.8c2f.tmp")), Zstr("big.bin"));
    EXPECT_EQ(getTransactionalTargetPath(Zstr("sub/dir/a.txt.00ff.tmp")), Zstr("sub/dir/a.txt"));
    EXPECT_EQ(getTransactionalTargetPath(Zstr("big.bin.8c2f.tmp.3021.tmp")), Zstr("big.bin.8c2f.tmp"));

    EXPECT_FALSE(getTransactionalTargetPath(Zstr("big.bin")));
    EXPECT_FALSE(getTransactionalTargetPath(Zstr("scratch.tmp")));
    EXPECT_FALSE(getTransactionalTargetPath(Zstr("big.bin.8C2F.tmp")));
    EXPECT_FALSE(getTransactionalTargetPath(Zstr("big.bin.8c2.tmp")));
    EXPECT_FALSE(getTransactionalTargetPath(Zstr("sub/.8c2f.tmp")));
}


TEST(TransactionalTargetPath, MatchesGeneratedTempNames)
{
    const Zstring filePath = Zstr("/data/site/index.html");
    for (int i = 0; i < 20; ++i)
        EXPECT_EQ(getTransactionalTargetPath(getPathWithTempName(filePath)), filePath);
}


TEST(TransactionalWrite, ReplacesFileWhenComplete)
{
    TempFolder folder;
    const Zstring filePath = folder / Zstr("sub/a.txt");

    writeLocalFileTransactional(filePath, 1'700'000'000, [](const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock)
    {
        writeBlock("hello", 5);
    });
    EXPECT_EQ(readFile(filePath), "hello");
    EXPECT_EQ(getFileDetailsIfExists(filePath)->modTime, 1'700'000'000);

    //failure: original file untouched, no temp file left behind
    EXPECT_THROW(writeLocalFileTransactional(filePath, std::nullopt, [](const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock)
    {
        writeBlock("partial", 7);
        throw TransferError(L"Connection lost.");
    }), TransferError);
    EXPECT_EQ(readFile(filePath), "hello");

    std::vector<Zstring> itemNames;
    traverseFolder(folder / Zstr("sub"), [&](const FileInfo& fi) { itemNames.push_back(fi.itemName); }, nullptr, nullptr);
    EXPECT_EQ(itemNames, std::vector<Zstring>{Zstr("a.txt")});
}


TEST(KnownFolders, ForgetParentsOfFailedTransfer)
{
    KnownFolders folders;
    folders.insert(Zstr("/remote"));
    folders.insert(Zstr("/remote/sub"));
    folders.insert(Zstr("/remote/sub/deeper"));
    folders.insert(Zstr("/remote/subsidiary"));
    folders.insert(Zstr("/remote/other"));

    folders.forgetParentsOf(Zstr("/remote/sub/x.txt"));

    EXPECT_FALSE(folders.contains(Zstr("/remote")));
    EXPECT_FALSE(folders.contains(Zstr("/remote/sub")));
    EXPECT_TRUE (folders.contains(Zstr("/remote/sub/deeper")));
    EXPECT_TRUE (folders.contains(Zstr("/remote/subsidiary")));
    EXPECT_TRUE (folders.contains(Zstr("/remote/other")));

    folders.clear();
    EXPECT_FALSE(folders.contains(Zstr("/remote/other")));
}
