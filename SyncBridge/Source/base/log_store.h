// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef LOG_STORE_H_8172635409182736
#define LOG_STORE_H_8172635409182736

#include <deque>
#include <zen/file_error.h>
#include <zen/thread.h>
#include "log_sink.h"


namespace sb
{
struct StoredLogEntry
{
    int64_t id = 0;
    int targetId = 0;
    zen::MessageType type = zen::MSG_TYPE_INFO;
    std::string message; //UTF-8
    time_t time = 0;
};

struct StoredTransferStat
{
    int64_t id = 0;
    int targetId = 0;
    uint64_t bytes = 0;
    TransferDirection direction = TransferDirection::upload;
    time_t time = 0;
};

struct DailyTransferStat
{
    std::string date; //UTC, e.g. 2026-10-19
    TransferDirection direction = TransferDirection::upload;
    uint64_t totalBytes = 0;
};

struct TransferStats
{
    std::vector<DailyTransferStat> daily; //sorted by date; upload before download
    uint64_t totalUploaded   = 0;
    uint64_t totalDownloaded = 0;
};


/*  persist log entries and transfer statistics as JSON in a state folder:
        sync_logs.json       {"logs":[{id,connection_id,type,message,created_at}], "lastId"}   newest first
        transfer_stats.json  {"stats":[{id,connection_id,bytes,direction,created_at}], "lastId"}

    - saving is delayed (coalescing bursts) and runs on a background thread
    - unreadable or corrupted files are reported via extra log and start empty     */
class LogStore : public LogSink
{
public:
    explicit LogStore(const Zstring& stateDir, std::chrono::milliseconds saveDelay = std::chrono::seconds(1));
    ~LogStore(); //final flush

    void addLog(int targetId, const zen::LogEntry& entry) override;
    void addTransferStat(int targetId, uint64_t bytes, TransferDirection direction, time_t time) override;

    std::vector<StoredLogEntry> getLogs(int targetId, size_t limit = 200); //newest first
    TransferStats getStats(int targetId, time_t now = std::time(nullptr));

    void flush(); //throw FileError

    static constexpr size_t MAX_LOGS_PER_TARGET  = 1000;
    static const int    STATS_RETENTION_DAYS = 30;
    static const int    STATS_REPORT_DAYS    = 7;

private:
    LogStore           (const LogStore&) = delete;
    LogStore& operator=(const LogStore&) = delete;

    void load(); //noexcept
    void removeExpiredStats(time_t now); //lockState_ must be held

    const Zstring logsFilePath_;
    const Zstring statsFilePath_;
    const std::chrono::milliseconds saveDelay_;

    std::mutex lockState_;
    std::condition_variable conditionDirty_;
    std::deque<StoredLogEntry> logs_; //newest first
    std::deque<StoredTransferStat> stats_; //oldest first
    int64_t lastLogId_  = 0;
    int64_t lastStatId_ = 0;
    bool dirty_ = false;

    std::mutex lockSave_; //serialize file writes

    zen::InterruptibleThread saverThread_;
};
}

#endif //LOG_STORE_H_8172635409182736
