// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef LOG_SINK_H_6610293847561029
#define LOG_SINK_H_6610293847561029

#include <zen/error_log.h>


namespace sb
{
enum class TransferDirection
{
    upload,
    download,
};

//fire-and-forget: thread-safe, noexcept; persistence failures go to the extra log
class LogSink
{
public:
    virtual ~LogSink() {}

    virtual void addLog(int targetId, const zen::LogEntry& entry) = 0;
    virtual void addTransferStat(int targetId, uint64_t bytes, TransferDirection direction, time_t time) = 0;
};
}

#endif //LOG_SINK_H_6610293847561029
