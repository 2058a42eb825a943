// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include <zen/extra_log.h>
#include <zen/time.h>
#include "base/log_store.h"
#include "test_util.h"

using namespace zen;
using namespace sb;
using namespace sb::test;


namespace
{
const time_t DAY = 24 * 3600;

LogEntry makeEntry(const std::string& msg, MessageType type = MSG_TYPE_INFO, time_t time = 1'700'000'000)
{
    return {time, type, msg};
}

std::string formatDate(time_t utc)
{
    return utfTo<std::string>(formatTime(formatIsoDateTag, getUtcTime(utc)));
}
}


TEST(LogStore, LogsAreReturnedNewestFirstPerTarget)
{
    TempFolder stateDir;
    LogStore store(stateDir.path());

    store.addLog(1, makeEntry("first"));
    store.addLog(2, makeEntry("other target"));
    store.addLog(1, makeEntry("second", MSG_TYPE_WARNING));
    store.addLog(1, makeEntry("third", MSG_TYPE_ERROR));

    const std::vector<StoredLogEntry> logs = store.getLogs(1);
    ASSERT_EQ(logs.size(), 3u);
    EXPECT_EQ(logs[0].message, "third");
    EXPECT_EQ(logs[0].type, MSG_TYPE_ERROR);
    EXPECT_EQ(logs[1].message, "second");
    EXPECT_EQ(logs[2].message, "first");
    EXPECT_GT(logs[0].id, logs[1].id);
    EXPECT_EQ(logs[0].targetId, 1);

    EXPECT_EQ(store.getLogs(1, 2).size(), 2u);
    EXPECT_EQ(store.getLogs(2).size(), 1u);
    EXPECT_TRUE(store.getLogs(3).empty());
}


TEST(LogStore, LogsAreCappedPerTarget)
{
    TempFolder stateDir;
    LogStore store(stateDir.path());

    for (size_t i = 0; i < LogStore::MAX_LOGS_PER_TARGET + 5; ++i)
        store.addLog(1, makeEntry("msg " + numberTo<std::string>(i)));
    for (int i = 0; i < 3; ++i)
        store.addLog(2, makeEntry("other"));

    const std::vector<StoredLogEntry> logs = store.getLogs(1, 5000);
    ASSERT_EQ(logs.size(), LogStore::MAX_LOGS_PER_TARGET);
    EXPECT_EQ(logs.front().message, "msg 1004");
    EXPECT_EQ(logs.back ().message, "msg 5");

    EXPECT_EQ(store.getLogs(2).size(), 3u);
}


TEST(LogStore, PersistedAndReloaded)
{
    TempFolder stateDir;
    {
        LogStore store(stateDir.path());
        store.addLog(1, makeEntry("hello", MSG_TYPE_WARNING, 1'700'000'000));
        store.addTransferStat(1, 123, TransferDirection::upload, std::time(nullptr));
    } //final flush

    const std::string logsJson = readFile(stateDir / Zstr("sync_logs.json"));
    EXPECT_NE(logsJson.find("2023-11-14T22:13:20Z"), std::string::npos);
    EXPECT_NE(logsJson.find("\"lastId\""), std::string::npos);
    EXPECT_NE(logsJson.find("\"connection_id\""), std::string::npos);
    EXPECT_NE(readFile(stateDir / Zstr("transfer_stats.json")).find("\"upload\""), std::string::npos);

    LogStore store(stateDir.path());
    std::vector<StoredLogEntry> logs = store.getLogs(1);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].message, "hello");
    EXPECT_EQ(logs[0].type, MSG_TYPE_WARNING);
    EXPECT_EQ(logs[0].time, 1'700'000'000);
    EXPECT_EQ(store.getStats(1).totalUploaded, 123u);

    store.addLog(1, makeEntry("again"));
    logs = store.getLogs(1);
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_GT(logs[0].id, logs[1].id); //ids continue after reload
}


TEST(LogStore, LegacyEntriesAreAccepted)
{
    TempFolder stateDir;
    writeFile(stateDir / Zstr("sync_logs.json"),
              R"({"logs":[{"id":5,"connection_id":1,"type":"success","message":"Uploaded","created_at":"2026-01-02T03:04:05.000Z"},
                          {"id":4,"connection_id":1,"type":"bogus","message":"dropped","created_at":"2026-01-02T03:04:05.000Z"}],
                  "lastId":5})", 1'700'000'000);

    LogStore store(stateDir.path());
    std::vector<StoredLogEntry> logs = store.getLogs(1);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].type, MSG_TYPE_INFO);
    EXPECT_EQ(logs[0].id, 5);
    EXPECT_EQ(formatDate(logs[0].time), "2026-01-02");

    store.addLog(1, makeEntry("next"));
    EXPECT_EQ(store.getLogs(1)[0].id, 6);
}


TEST(LogStore, CorruptedFileStartsEmpty)
{
    TempFolder stateDir;
    writeFile(stateDir / Zstr("sync_logs.json"), "{ this is not json", 1'700'000'000);
    fetchExtraLog(); //discard previous

    LogStore store(stateDir.path());
    EXPECT_TRUE(store.getLogs(1).empty());
    EXPECT_FALSE(fetchExtraLog().empty());

    store.addLog(1, makeEntry("fresh start"));
    store.flush();

    LogStore store2(stateDir.path());
    EXPECT_EQ(store2.getLogs(1).size(), 1u);
}


TEST(LogStore, SaveIsDelayedAndCoalesced)
{
    TempFolder stateDir;
    LogStore store(stateDir.path(), std::chrono::milliseconds(100));

    for (int i = 0; i < 20; ++i)
        store.addLog(1, makeEntry("burst"));

    ASSERT_TRUE(waitUntil([&] { return itemExists(stateDir / Zstr("sync_logs.json")); }));
    ASSERT_TRUE(waitUntil([&] { return readFile(stateDir / Zstr("sync_logs.json")).find("\"lastId\": 20") != std::string::npos; }));
}


TEST(LogStore, TransferStatsAggregation)
{
    TempFolder stateDir;
    LogStore store(stateDir.path());

    const time_t now = std::time(nullptr);

    store.addTransferStat(1, 5000, TransferDirection::upload,   now - 40 * DAY); //beyond retention
    store.addTransferStat(1, 1000, TransferDirection::upload,   now - 10 * DAY); //beyond report period
    store.addTransferStat(1,   20, TransferDirection::download, now -  3 * DAY);
    store.addTransferStat(1,  100, TransferDirection::upload,   now);
    store.addTransferStat(1,   50, TransferDirection::upload,   now);
    store.addTransferStat(1,   30, TransferDirection::download, now);
    store.addTransferStat(2, 9999, TransferDirection::download, now); //other target

    const TransferStats stats = store.getStats(1, now);

    EXPECT_EQ(stats.totalUploaded,   1150u);
    EXPECT_EQ(stats.totalDownloaded, 50u);

    ASSERT_EQ(stats.daily.size(), 4u);
    EXPECT_EQ(stats.daily[0].date, formatDate(now - 3 * DAY));
    EXPECT_EQ(stats.daily[0].direction, TransferDirection::upload);
    EXPECT_EQ(stats.daily[0].totalBytes, 0u);
    EXPECT_EQ(stats.daily[1].direction, TransferDirection::download);
    EXPECT_EQ(stats.daily[1].totalBytes, 20u);

    EXPECT_EQ(stats.daily[2].date, formatDate(now));
    EXPECT_EQ(stats.daily[2].direction, TransferDirection::upload);
    EXPECT_EQ(stats.daily[2].totalBytes, 150u);
    EXPECT_EQ(stats.daily[3].direction, TransferDirection::download);
    EXPECT_EQ(stats.daily[3].totalBytes, 30u);

    EXPECT_EQ(store.getStats(2, now).totalDownloaded, 9999u);
}
