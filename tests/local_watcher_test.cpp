// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include "base/local_watcher.h"
#include "test_util.h"

using namespace zen;
using namespace sb;
using namespace sb::test;
using namespace std::chrono_literals;


namespace
{
const SteadyTime T0 = std::chrono::steady_clock::now();
}


TEST(ChangeDebouncer, BurstIsCollapsed)
{
    ChangeDebouncer debouncer(2000ms);

    for (int i = 0; i < 10; ++i)
        debouncer.add(LocalChangeType::modified, Zstr("a.txt"), T0 + i * 100ms);

    EXPECT_EQ(debouncer.getPendingCount(), 1u);
    EXPECT_EQ(debouncer.getNextDeadline(), T0 + 900ms + 2000ms);

    EXPECT_TRUE(debouncer.fetchSettled(T0 + 2800ms).empty()); //window restarted with each event

    const std::vector<LocalChange> changes = debouncer.fetchSettled(T0 + 2900ms);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].relPath, Zstr("a.txt"));
    EXPECT_EQ(changes[0].type, LocalChangeType::modified);

    EXPECT_EQ(debouncer.getPendingCount(), 0u);
    EXPECT_FALSE(debouncer.getNextDeadline());
}


TEST(ChangeDebouncer, PathsSettleIndependently)
{
    ChangeDebouncer debouncer(1000ms);
    debouncer.add(LocalChangeType::created, Zstr("a.txt"), T0);
    debouncer.add(LocalChangeType::created, Zstr("b.txt"), T0 + 500ms);

    std::vector<LocalChange> changes = debouncer.fetchSettled(T0 + 1000ms);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].relPath, Zstr("a.txt"));

    changes = debouncer.fetchSettled(T0 + 1500ms);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].relPath, Zstr("b.txt"));
}


TEST(ChangeDebouncer, ChangeTypesAreMerged)
{
    ChangeDebouncer debouncer(1000ms);

    debouncer.add(LocalChangeType::created,  Zstr("new.txt"), T0);
    debouncer.add(LocalChangeType::modified, Zstr("new.txt"), T0);

    debouncer.add(LocalChangeType::deleted, Zstr("replaced.txt"), T0);
    debouncer.add(LocalChangeType::created, Zstr("replaced.txt"), T0);

    debouncer.add(LocalChangeType::modified, Zstr("gone.txt"), T0);
    debouncer.add(LocalChangeType::deleted,  Zstr("gone.txt"), T0);

    std::map<Zstring, LocalChangeType> changes;
    for (const LocalChange& change : debouncer.fetchSettled(T0 + 1000ms))
        changes[change.relPath] = change.type;

    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes[Zstr("new.txt")],      LocalChangeType::created);
    EXPECT_EQ(changes[Zstr("replaced.txt")], LocalChangeType::modified);
    EXPECT_EQ(changes[Zstr("gone.txt")],     LocalChangeType::deleted);
}


TEST(ChangeSuppressor, SuppressedDuringDownloadAndGracePeriod)
{
    ChangeSuppressor suppressor(5000ms);
    EXPECT_FALSE(suppressor.isSuppressed(Zstr("a.txt"), T0));

    suppressor.onDownloadStart(Zstr("a.txt"));
    EXPECT_TRUE (suppressor.isSuppressed(Zstr("a.txt"), T0 + 60s)); //no time limit while downloading
    EXPECT_FALSE(suppressor.isSuppressed(Zstr("b.txt"), T0));

    suppressor.onDownloadEnd(Zstr("a.txt"), T0 + 60s);
    EXPECT_TRUE (suppressor.isSuppressed(Zstr("a.txt"), T0 + 64s));
    EXPECT_FALSE(suppressor.isSuppressed(Zstr("a.txt"), T0 + 65s));
    EXPECT_FALSE(suppressor.isSuppressed(Zstr("a.txt"), T0 + 64s)); //expired entry was removed
}


TEST(ChangeSuppressor, ConcurrentDownloadsOfSamePath)
{
    ChangeSuppressor suppressor(1000ms);

    suppressor.onDownloadStart(Zstr("a.txt"));
    suppressor.onDownloadStart(Zstr("a.txt"));
    suppressor.onDownloadEnd(Zstr("a.txt"), T0);

    EXPECT_TRUE(suppressor.isSuppressed(Zstr("a.txt"), T0 + 10s)); //one download still active

    suppressor.onDownloadEnd(Zstr("a.txt"), T0 + 10s);
    EXPECT_FALSE(suppressor.isSuppressed(Zstr("a.txt"), T0 + 11s));
}


TEST(ChangeSuppressor, DownloadTempFileIsSuppressed)
{
    ChangeSuppressor suppressor(1000ms);
    suppressor.onDownloadStart(Zstr("sub/big.bin"));

    EXPECT_TRUE (suppressor.isSuppressed(Zstr("sub/big.bin.8c2f.tmp"), T0));
    EXPECT_FALSE(suppressor.isSuppressed(Zstr("big.bin.8c2f.tmp"), T0));     //other folder
    EXPECT_FALSE(suppressor.isSuppressed(Zstr("sub/big.bin.tmp"), T0));      //not a temp name
    EXPECT_FALSE(suppressor.isSuppressed(Zstr("sub/other.bin.8c2f.tmp"), T0));

    suppressor.onDownloadEnd(Zstr("sub/big.bin"), T0);
    EXPECT_TRUE (suppressor.isSuppressed(Zstr("sub/big.bin.8c2f.tmp"), T0 + 500ms));
    EXPECT_FALSE(suppressor.isSuppressed(Zstr("sub/big.bin.8c2f.tmp"), T0 + 2s));
}


namespace
{
class LocalWatcherTest : public testing::Test
{
protected:
    std::vector<LocalChange> getChanges(const Zstring& relPath)
    {
        return changes_.access([&](const std::vector<LocalChange>& changes)
        {
            std::vector<LocalChange> output;
            for (const LocalChange& change : changes)
                if (change.relPath == relPath)
                    output.push_back(change);
            return output;
        });
    }

    std::unique_ptr<LocalWatcher> startWatcher()
    {
        LocalWatcher::Options options;
        options.stabilityWindow   = 200ms;
        options.rootRetryInterval = 100ms;

        auto watcher = std::make_unique<LocalWatcher>(root_.path(),
                                                      [](const Zstring& relPath, bool isFolder) { return startsWith(relPath, Zstr("ignored")); },
                                                      [this](const LocalChange& change) { changes_.access([&](std::vector<LocalChange>& changes) { changes.push_back(change); }); },
                                                      suppressor_,
                                                      [](const std::wstring& msg, MessageType type) {},
                                                      options);
        std::this_thread::sleep_for(500ms); //let inotify watches get installed
        return watcher;
    }

    TempFolder root_;
    ChangeSuppressor suppressor_{1000ms};
    Protected<std::vector<LocalChange>> changes_;
};
}


TEST_F(LocalWatcherTest, ReportsCreatedAndDeletedFiles)
{
    createDirectoryIfMissingRecursion(root_ / Zstr("sub"));
    std::unique_ptr<LocalWatcher> watcher = startWatcher();

    writeFile(root_ / Zstr("sub/a.txt"), "content", 1'700'000'000);
    ASSERT_TRUE(waitUntil([&] { return !getChanges(Zstr("sub/a.txt")).empty(); }));
    EXPECT_NE(getChanges(Zstr("sub/a.txt")).back().type, LocalChangeType::deleted);

    removeFilePlain(root_ / Zstr("sub/a.txt"));
    ASSERT_TRUE(waitUntil([&]
    {
        const std::vector<LocalChange> changes = getChanges(Zstr("sub/a.txt"));
        return !changes.empty() && changes.back().type == LocalChangeType::deleted;
    }));
}


TEST_F(LocalWatcherTest, ExcludedAndSuppressedPathsAreDropped)
{
    createDirectoryIfMissingRecursion(root_ / Zstr("ignored"));
    std::unique_ptr<LocalWatcher> watcher = startWatcher();

    suppressor_.onDownloadStart(Zstr("downloading.txt"));

    writeFile(root_ / Zstr("ignored/x.txt"),   "x", 1'700'000'000);
    writeFile(root_ / Zstr("downloading.txt"), "d", 1'700'000'000);
    writeFile(root_ / Zstr("b.txt"),           "b", 1'700'000'000);

    ASSERT_TRUE(waitUntil([&] { return !getChanges(Zstr("b.txt")).empty(); }));
    std::this_thread::sleep_for(500ms);

    EXPECT_TRUE(getChanges(Zstr("ignored/x.txt")).empty());
    EXPECT_TRUE(getChanges(Zstr("downloading.txt")).empty());

    suppressor_.onDownloadEnd(Zstr("downloading.txt"), std::chrono::steady_clock::now());
}


TEST_F(LocalWatcherTest, RootCreatedLater)
{
    const Zstring lateRoot = root_ / Zstr("late");

    LocalWatcher::Options options;
    options.stabilityWindow   = 200ms;
    options.rootRetryInterval = 100ms;

    std::atomic<int> warnings{0};
    LocalWatcher watcher(lateRoot,
                         [](const Zstring& relPath, bool isFolder) { return false; },
                         [this](const LocalChange& change) { changes_.access([&](std::vector<LocalChange>& changes) { changes.push_back(change); }); },
                         suppressor_,
                         [&](const std::wstring& msg, MessageType type) { if (type == MSG_TYPE_WARNING) ++warnings; },
                         options);

    ASSERT_TRUE(waitUntil([&] { return warnings > 0; }));

    createDirectoryIfMissingRecursion(lateRoot);
    std::this_thread::sleep_for(500ms); //retry picks up the folder

    writeFile(appendPath(lateRoot, Zstr("c.txt")), "c", 1'700'000'000);
    ASSERT_TRUE(waitUntil([&] { return !getChanges(Zstr("c.txt")).empty(); }));

    EXPECT_EQ(warnings, 1); //reported once, not every retry
}
