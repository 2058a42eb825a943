// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include <zen/file_access.h>
#include "base/sync_manager.h"
#include "fake_transport.h"
#include "test_util.h"

using namespace zen;
using namespace sb;
using namespace sb::test;
using namespace std::chrono_literals;


namespace
{
const time_t T = 1'700'000'000;


class TestLogSink : public LogSink
{
public:
    void addLog(int targetId, const LogEntry& entry) override
    {
        logs_.access([&](std::vector<LogEntry>& logs) { logs.push_back(entry); });
    }

    void addTransferStat(int targetId, uint64_t bytes, TransferDirection direction, time_t time) override
    {
        (direction == TransferDirection::upload ? bytesUploaded : bytesDownloaded) += bytes;
    }

    size_t countLogs(const std::string& text, std::optional<MessageType> type = std::nullopt)
    {
        return logs_.access([&](const std::vector<LogEntry>& logs)
        {
            return std::count_if(logs.begin(), logs.end(), [&](const LogEntry& entry)
            {
                return contains(entry.message, text) && (!type || entry.type == *type);
            });
        });
    }

    std::atomic<uint64_t> bytesUploaded{0};
    std::atomic<uint64_t> bytesDownloaded{0};

private:
    Protected<std::vector<LogEntry>> logs_;
};


class SyncEngineTest : public testing::Test
{
protected:
    SyncTarget makeTarget(SyncMode mode)
    {
        SyncTarget target;
        target.id = 1;
        target.name = Zstr("test");
        target.host = Zstr("fake");
        target.localPath = local_.path();
        target.remotePath = Zstr("/remote");
        target.syncMode = mode;
        target.syncIntervalSec = 60;
        return validateSyncTarget(target, local_.path());
    }

    std::unique_ptr<SyncEngine> makeEngine(const SyncTarget& target)
    {
        SyncEngine::Options options;
        options.watcher.stabilityWindow   = 200ms;
        options.watcher.rootRetryInterval = 100ms;
        return std::make_unique<SyncEngine>(target, makeFakeTransportFactory(remote_), logSink_, options);
    }

    Zstring localPath(const Zstring& relPath) const { return local_ / relPath; }

    TempFolder local_;
    FakeRemote remote_;
    TestLogSink logSink_;
};
}


TEST_F(SyncEngineTest, NewLocalFileIsUploaded)
{
    writeFile(localPath(Zstr("a.txt")), "hello", T);

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::biDirectional));
    const CycleSummary summary = engine->triggerSyncNow();

    EXPECT_EQ(summary.uploaded, 1);
    EXPECT_EQ(summary.downloaded, 0);
    EXPECT_EQ(summary.failed, 0);
    EXPECT_FALSE(summary.listFailed);

    const std::optional<FakeRemoteFile> file = remote_.getFile(Zstr("/remote/a.txt"));
    ASSERT_TRUE(file);
    EXPECT_EQ(file->content, "hello");
    EXPECT_EQ(file->modTime, T);

    EXPECT_EQ(logSink_.bytesUploaded, 5u);
    EXPECT_EQ(logSink_.countLogs("Uploaded \"a.txt\"."), 1u);
}


TEST_F(SyncEngineTest, NewRemoteFileIsDownloaded)
{
    remote_.putFile(Zstr("/remote/sub/b.txt"), "remote content", T);

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::biDirectional));
    const CycleSummary summary = engine->triggerSyncNow();

    EXPECT_EQ(summary.downloaded, 1);
    EXPECT_EQ(summary.uploaded, 0);
    EXPECT_EQ(readFile(localPath(Zstr("sub/b.txt"))), "remote content");
    EXPECT_EQ(getFileDetailsIfExists(localPath(Zstr("sub/b.txt")))->modTime, T);
    EXPECT_EQ(logSink_.bytesDownloaded, 14u);
}


TEST_F(SyncEngineTest, SecondCycleIsNoOp)
{
    writeFile(localPath(Zstr("a.txt")), "local", T);
    remote_.putFile(Zstr("/remote/b.txt"), "remote", T);

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::biDirectional));

    const CycleSummary first = engine->triggerSyncNow();
    EXPECT_EQ(first.uploaded, 1);
    EXPECT_EQ(first.downloaded, 1);

    const CycleSummary second = engine->triggerSyncNow();
    EXPECT_EQ(second.uploaded, 0);
    EXPECT_EQ(second.downloaded, 0);
    EXPECT_EQ(second.failed, 0);
    EXPECT_EQ(second.skipped, 2);

    EXPECT_EQ(remote_.uploadCount, 1);
    EXPECT_EQ(remote_.downloadCount, 1);
}


TEST_F(SyncEngineTest, NewerSideWins)
{
    writeFile(localPath(Zstr("local_newer.txt")), "new local", T + 100);
    remote_.putFile(Zstr("/remote/local_newer.txt"), "old remote", T);

    writeFile(localPath(Zstr("remote_newer.txt")), "old local", T);
    remote_.putFile(Zstr("/remote/remote_newer.txt"), "new remote", T + 100);

    writeFile(localPath(Zstr("within_tolerance.txt")), "local", T + 1);
    remote_.putFile(Zstr("/remote/within_tolerance.txt"), "remote", T);

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::biDirectional));
    const CycleSummary summary = engine->triggerSyncNow();

    EXPECT_EQ(summary.uploaded, 1);
    EXPECT_EQ(summary.downloaded, 1);
    EXPECT_EQ(summary.skipped, 1);

    EXPECT_EQ(remote_.getFile(Zstr("/remote/local_newer.txt"))->content, "new local");
    EXPECT_EQ(readFile(localPath(Zstr("remote_newer.txt"))), "new remote");
    EXPECT_EQ(readFile(localPath(Zstr("within_tolerance.txt"))), "local");
    EXPECT_EQ(remote_.getFile(Zstr("/remote/within_tolerance.txt"))->content, "remote");
}


TEST_F(SyncEngineTest, SyncDeletionsDoesNotDeleteOneSidedFiles)
{
    writeFile(localPath(Zstr("local_only.txt")), "local", T);
    remote_.putFile(Zstr("/remote/remote_only.txt"), "remote", T);

    SyncTarget target = makeTarget(SyncMode::biDirectional);
    target.syncDeletions = true;
    std::unique_ptr<SyncEngine> engine = makeEngine(target);

    const CycleSummary summary = engine->triggerSyncNow();

    //a file missing on one side is new on the other, not deleted
    EXPECT_EQ(summary.uploaded, 1);
    EXPECT_EQ(summary.downloaded, 1);
    EXPECT_EQ(summary.deleted, 0);
    EXPECT_EQ(remote_.removeCount, 0);
    EXPECT_EQ(remote_.getFile(Zstr("/remote/local_only.txt"))->content, "local");
    EXPECT_EQ(readFile(localPath(Zstr("remote_only.txt"))), "remote");
    EXPECT_EQ(readFile(localPath(Zstr("local_only.txt"))), "local");
}


TEST_F(SyncEngineTest, UploadOnlyNeverDownloads)
{
    writeFile(localPath(Zstr("a.txt")), "local", T);
    remote_.putFile(Zstr("/remote/b.txt"), "remote", T);
    remote_.putFile(Zstr("/remote/a.txt"), "newer remote", T + 100);

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::uploadOnly));
    const CycleSummary summary = engine->triggerSyncNow();

    EXPECT_EQ(summary.uploaded, 0);
    EXPECT_EQ(summary.downloaded, 0);
    EXPECT_EQ(summary.skipped, 2);
    EXPECT_FALSE(itemExists(localPath(Zstr("b.txt"))));
    EXPECT_EQ(readFile(localPath(Zstr("a.txt"))), "local");
}


TEST_F(SyncEngineTest, DownloadOnlyNeverUploads)
{
    writeFile(localPath(Zstr("local_only.txt")), "local", T);
    writeFile(localPath(Zstr("b.txt")), "newer local", T + 100);
    remote_.putFile(Zstr("/remote/b.txt"), "remote", T);
    remote_.putFile(Zstr("/remote/c.txt"), "remote c", T);

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::downloadOnly));
    const CycleSummary summary = engine->triggerSyncNow();

    EXPECT_EQ(summary.uploaded, 0);
    EXPECT_EQ(summary.downloaded, 1);
    EXPECT_EQ(remote_.uploadCount, 0);
    EXPECT_FALSE(remote_.getFile(Zstr("/remote/local_only.txt")));
    EXPECT_EQ(readFile(localPath(Zstr("c.txt"))), "remote c");
    EXPECT_EQ(readFile(localPath(Zstr("b.txt"))), "newer local");
}


TEST_F(SyncEngineTest, DownloadOnlyRunsSingleCycleAfterStart)
{
    remote_.putFile(Zstr("/remote/c.txt"), "remote c", T);

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::downloadOnly));
    engine->start();

    ASSERT_TRUE(waitUntil([&] { return logSink_.countLogs("Single download cycle finished.") == 1u; }));
    EXPECT_EQ(readFile(localPath(Zstr("c.txt"))), "remote c");

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(logSink_.countLogs("Sync cycle started."), 1u); //no timer

    writeFile(localPath(Zstr("new_local.txt")), "x", T);
    std::this_thread::sleep_for(500ms);
    EXPECT_EQ(remote_.uploadCount, 0); //no watcher
}


TEST_F(SyncEngineTest, IgnoredAndHiddenFilesAreSkipped)
{
    writeFile(localPath(Zstr("index.html")), "<html/>", T);
    writeFile(localPath(Zstr("app.log")), "log", T);
    writeFile(localPath(Zstr(".env")), "SECRET=1", T);
    writeFile(localPath(Zstr("node_modules/lib/index.js")), "js", T);
    remote_.putFile(Zstr("/remote/.htaccess"), "deny", T);
    remote_.putFile(Zstr("/remote/vendor/autoload.php"), "php", T);

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::biDirectional));
    const CycleSummary summary = engine->triggerSyncNow();

    EXPECT_EQ(summary.uploaded, 1);
    EXPECT_EQ(summary.downloaded, 0);
    EXPECT_TRUE(remote_.getFile(Zstr("/remote/index.html")));
    EXPECT_FALSE(remote_.getFile(Zstr("/remote/app.log")));
    EXPECT_FALSE(remote_.getFile(Zstr("/remote/.env")));
    EXPECT_FALSE(itemExists(localPath(Zstr(".htaccess"))));
    EXPECT_FALSE(itemExists(localPath(Zstr("vendor"))));
}


TEST_F(SyncEngineTest, IgnoreFileOverridesDefaults)
{
    writeFile(localPath(Zstr(".ftpignore")), "*.tmp\n", T);
    writeFile(localPath(Zstr("app.log")), "log", T);
    writeFile(localPath(Zstr("scratch.tmp")), "tmp", T);

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::biDirectional));
    const CycleSummary summary = engine->triggerSyncNow();

    EXPECT_EQ(summary.uploaded, 1);
    EXPECT_TRUE (remote_.getFile(Zstr("/remote/app.log")));
    EXPECT_FALSE(remote_.getFile(Zstr("/remote/scratch.tmp")));
    EXPECT_FALSE(remote_.getFile(Zstr("/remote/.ftpignore")));
}


TEST_F(SyncEngineTest, ListFailureIsReported)
{
    writeFile(localPath(Zstr("a.txt")), "local", T);
    remote_.failList = true;

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::biDirectional));
    const CycleSummary summary = engine->triggerSyncNow();

    EXPECT_TRUE(summary.listFailed);
    EXPECT_EQ(summary.downloaded, 0);
    EXPECT_GE(logSink_.countLogs("Cannot read directory", MSG_TYPE_ERROR), 1u);
}


TEST_F(SyncEngineTest, ConnectionFailureFailsTasks)
{
    writeFile(localPath(Zstr("a.txt")), "a", T);
    writeFile(localPath(Zstr("b.txt")), "b", T);
    remote_.failConnect = true;

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::biDirectional));
    const CycleSummary summary = engine->triggerSyncNow();

    EXPECT_TRUE(summary.listFailed);
    EXPECT_EQ(summary.uploaded, 0);
    EXPECT_EQ(summary.failed, 2);

    //recovers with the next cycle
    remote_.failConnect = false;
    const CycleSummary summary2 = engine->triggerSyncNow();
    EXPECT_FALSE(summary2.listFailed);
    EXPECT_EQ(summary2.uploaded, 2);
}


TEST_F(SyncEngineTest, ParallelTransfersAreBounded)
{
    for (int i = 0; i < 10; ++i)
        writeFile(localPath(Zstr("file") + numberTo<Zstring>(i) + Zstr(".txt")), "data", T);
    remote_.callDelay = 50ms;

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::biDirectional)); //3 parallel connections
    const CycleSummary summary = engine->triggerSyncNow();

    EXPECT_EQ(summary.uploaded, 10);
    EXPECT_LE(remote_.maxActiveCalls, 3);
    EXPECT_GE(remote_.maxActiveCalls, 2);
    EXPECT_LE(remote_.createdCount, 3);
}


TEST_F(SyncEngineTest, IdleConnectionsClosedForLongIntervals)
{
    writeFile(localPath(Zstr("a.txt")), "a", T);

    SyncTarget target = makeTarget(SyncMode::biDirectional);
    target.syncIntervalSec = 3600;
    std::unique_ptr<SyncEngine> engine = makeEngine(target);

    engine->triggerSyncNow();
    EXPECT_EQ(remote_.instanceCount, 0);
    EXPECT_EQ(logSink_.countLogs("Idle connections closed"), 1u);
}


TEST_F(SyncEngineTest, ConnectionsKeptForShortIntervals)
{
    writeFile(localPath(Zstr("a.txt")), "a", T);

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::biDirectional)); //60 sec: not above threshold
    engine->triggerSyncNow();

    EXPECT_GT(remote_.instanceCount, 0);
    EXPECT_EQ(logSink_.countLogs("Idle connections closed"), 0u);

    engine.reset();
    EXPECT_EQ(remote_.instanceCount, 0); //closed on teardown
}


TEST_F(SyncEngineTest, ManualUpload)
{
    writeFile(localPath(Zstr("dir/a.txt")), "manual", T);

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::downloadOnly)); //not restricted by mode

    engine->manualUpload(Zstr("/dir/a.txt"));
    EXPECT_EQ(remote_.getFile(Zstr("/remote/dir/a.txt"))->content, "manual");

    EXPECT_THROW(engine->manualUpload(Zstr("missing.txt")), FileError);
    EXPECT_THROW(engine->manualUpload(Zstr("../outside.txt")), FileError);
    EXPECT_THROW(engine->manualUpload(Zstr("")), FileError);
    EXPECT_GE(logSink_.countLogs("Cannot upload file", MSG_TYPE_ERROR), 3u);
}


TEST_F(SyncEngineTest, ManualDownload)
{
    remote_.putFile(Zstr("/remote/dir/c.txt"), "inside", T);
    remote_.putFile(Zstr("/elsewhere/d.txt"), "outside", T);

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::uploadOnly)); //not restricted by mode

    engine->manualDownload(Zstr("/remote/dir/c.txt"));
    EXPECT_EQ(readFile(localPath(Zstr("dir/c.txt"))), "inside");

    engine->manualDownload(Zstr("/elsewhere/d.txt")); //outside remote root: by item name
    EXPECT_EQ(readFile(localPath(Zstr("d.txt"))), "outside");

    EXPECT_THROW(engine->manualDownload(Zstr("/remote/missing.txt")), NotFoundError);
    EXPECT_THROW(engine->manualDownload(Zstr("relative.txt")), FileError);
}


TEST_F(SyncEngineTest, LogRingIsBounded)
{
    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::biDirectional));

    for (int i = 0; i < 30; ++i)
        engine->triggerSyncNow();

    const std::vector<LogEntry> logs = engine->getLogs();
    ASSERT_EQ(logs.size(), SyncEngine::LOG_RING_SIZE);
    EXPECT_TRUE(contains(logs.front().message, "Sync cycle completed.")); //newest first
}


TEST_F(SyncEngineTest, ProgressAfterCycle)
{
    writeFile(localPath(Zstr("a.txt")), "a", T);
    writeFile(localPath(Zstr("b.txt")), "b", T);

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::biDirectional));
    EXPECT_TRUE(engine->getProgress().activeTransfers.empty());

    engine->triggerSyncNow();

    const SyncProgress progress = engine->getProgress();
    EXPECT_TRUE(progress.activeTransfers.empty());
    EXPECT_EQ(progress.queueLength, 0u);
    EXPECT_EQ(progress.filesInBatch, 2u);
    EXPECT_EQ(progress.filesCompleted, 2u);
}


TEST_F(SyncEngineTest, CyclesDoNotOverlap)
{
    for (int i = 0; i < 3; ++i)
        writeFile(localPath(Zstr("f") + numberTo<Zstring>(i)), "x", T);
    remote_.callDelay = 20ms;

    std::unique_ptr<SyncEngine> engine = makeEngine(makeTarget(SyncMode::biDirectional));

    std::vector<std::future<CycleSummary>> futures;
    for (int i = 0; i < 4; ++i)
        futures.push_back(runAsync([&] { return engine->triggerSyncNow(); }));

    int uploaded = 0;
    for (std::future<CycleSummary>& ft : futures)
        uploaded += ft.get().uploaded;

    EXPECT_EQ(uploaded, 3); //each file exactly once: cycles ran one after another
    EXPECT_EQ(remote_.uploadCount, 3);
}


TEST_F(SyncEngineTest, LocalChangesAreUploadedByWatcher)
{
    SyncTarget target = makeTarget(SyncMode::biDirectional);
    target.syncIntervalSec = 3600;
    target.syncDeletions = true;

    std::unique_ptr<SyncEngine> engine = makeEngine(target);
    engine->start();

    ASSERT_TRUE(waitUntil([&] { return logSink_.countLogs("Sync cycle completed.") == 1u; }));
    std::this_thread::sleep_for(500ms); //watcher is up

    writeFile(localPath(Zstr("watched.txt")), "watched", T);
    ASSERT_TRUE(waitUntil([&] { return static_cast<bool>(remote_.getFile(Zstr("/remote/watched.txt"))); }));
    EXPECT_EQ(logSink_.countLogs("Sync cycle completed."), 1u); //not uploaded by a cycle

    removeFilePlain(localPath(Zstr("watched.txt")));
    ASSERT_TRUE(waitUntil([&] { return !remote_.getFile(Zstr("/remote/watched.txt")); }));
}


TEST_F(SyncEngineTest, LocalDeletionKeepsRemoteByDefault)
{
    SyncTarget target = makeTarget(SyncMode::biDirectional);
    target.syncIntervalSec = 3600;

    std::unique_ptr<SyncEngine> engine = makeEngine(target);
    engine->start();

    ASSERT_TRUE(waitUntil([&] { return logSink_.countLogs("Sync cycle completed.") == 1u; }));
    std::this_thread::sleep_for(500ms);

    writeFile(localPath(Zstr("keep.txt")), "keep", T);
    ASSERT_TRUE(waitUntil([&] { return static_cast<bool>(remote_.getFile(Zstr("/remote/keep.txt"))); }));

    removeFilePlain(localPath(Zstr("keep.txt")));
    std::this_thread::sleep_for(1000ms);
    EXPECT_TRUE(remote_.getFile(Zstr("/remote/keep.txt")));
    EXPECT_EQ(remote_.removeCount, 0);
}


TEST_F(SyncEngineTest, TimerTickSkippedWhileCycleRuns)
{
    remote_.callDelay = 1500ms; //every listing takes 1.5 sec

    SyncTarget target = makeTarget(SyncMode::biDirectional);
    target.syncIntervalSec = 1;

    std::unique_ptr<SyncEngine> engine = makeEngine(target);
    engine->start(); //first tick: t = 0, second tick: t = 2.5 sec

    ASSERT_TRUE(waitUntil([&] { return logSink_.countLogs("Sync cycle completed.") == 1u; }));

    //hold the cycle lock from t = 1.5 sec until t = 3 sec
    std::future<CycleSummary> manualCycle = runAsync([&] { return engine->triggerSyncNow(); });

    ASSERT_TRUE(waitUntil([&] { return logSink_.countLogs("Previous sync cycle is still running", MSG_TYPE_WARNING) >= 1u; }));
    EXPECT_FALSE(manualCycle.get().listFailed);

    EXPECT_EQ(logSink_.countLogs("Sync cycle started."), 2u); //the skipped tick is not queued
}


TEST_F(SyncEngineTest, SlowDownloadDoesNotUploadTempFile)
{
    SyncTarget target = makeTarget(SyncMode::biDirectional);
    target.syncIntervalSec = 3600;

    std::unique_ptr<SyncEngine> engine = makeEngine(target);
    engine->start();

    ASSERT_TRUE(waitUntil([&] { return logSink_.countLogs("Sync cycle completed.") == 1u; }));
    std::this_thread::sleep_for(500ms); //watcher is up

    remote_.putFile(Zstr("/remote/big.bin"), "0123456789", T);
    remote_.downloadStall = 1500ms; //temp file exists much longer than the stability window

    const CycleSummary summary = engine->triggerSyncNow();
    EXPECT_EQ(summary.downloaded, 1);
    EXPECT_EQ(readFile(localPath(Zstr("big.bin"))), "0123456789");

    std::this_thread::sleep_for(1000ms); //let pending watch events settle

    EXPECT_EQ(remote_.getFiles().size(), 1u);
    EXPECT_EQ(remote_.uploadCount, 0);
    EXPECT_EQ(logSink_.countLogs("Uploaded \""), 0u);

    remote_.downloadStall = 0ms;
    const CycleSummary second = engine->triggerSyncNow();
    EXPECT_EQ(second.uploaded, 0);
    EXPECT_EQ(second.downloaded, 0);
    EXPECT_EQ(remote_.getFiles().size(), 1u);
}


TEST(SyncManager, StartStopAndSyncAll)
{
    TempFolder local1;
    TempFolder local2;
    FakeRemote remote;
    TestLogSink logSink;

    SyncEngine::Options options;
    options.watcher.stabilityWindow = 200ms;

    auto makeTarget = [](int id, const Zstring& localPath)
    {
        SyncTarget target;
        target.id = id;
        target.host = Zstr("fake");
        target.localPath = localPath;
        target.remotePath = Zstr("/remote") + numberTo<Zstring>(id);
        target.syncIntervalSec = 3600;
        return validateSyncTarget(target, localPath);
    };

    SyncManager manager(logSink, [&](const SyncTarget& target) { return makeFakeTransportFactory(remote); }, options);

    manager.start(makeTarget(1, local1.path()));
    manager.start(makeTarget(2, local2.path()));
    EXPECT_EQ(manager.getRunningTargets(), (std::vector<int>{1, 2}));
    EXPECT_TRUE(manager.getStatus(1).running);
    EXPECT_FALSE(manager.getStatus(3).running);

    ASSERT_TRUE(waitUntil([&] { return logSink.countLogs("Sync cycle completed.") == 2u; }));

    writeFile(appendPath(local1.path(), Zstr("one.txt")), "1", T);
    remote.putFile(Zstr("/remote2/two.txt"), "2", T);

    const std::vector<std::pair<int, CycleSummary>> summaries = manager.triggerSyncNowAll();
    ASSERT_EQ(summaries.size(), 2u);

    EXPECT_TRUE(remote.getFile(Zstr("/remote1/one.txt")));
    EXPECT_EQ(readFile(appendPath(local2.path(), Zstr("two.txt"))), "2");

    manager.stop(1);
    EXPECT_EQ(manager.getRunningTargets(), std::vector<int>{2});
    EXPECT_FALSE(manager.getEngine(1));

    manager.start(makeTarget(2, local2.path())); //restart
    EXPECT_EQ(manager.getRunningTargets(), std::vector<int>{2});

    manager.stopAll();
    EXPECT_TRUE(manager.getRunningTargets().empty());
    EXPECT_EQ(logSink.countLogs("Synchronization stopped."), 3u);
}
