// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef CONFLICT_RESOLVER_H_7823401928374
#define CONFLICT_RESOLVER_H_7823401928374

#include <ctime>
#include <optional>
#include "sync_target.h"


namespace sb
{
enum class SyncAction
{
    none,
    upload,
    download,
};

/*  last writer wins:
    - one side missing: copy existing side (if mode allows); never delete
    - both existing: strictly newer side (beyond tolerance) is copied onto the older one
    - deterministic, no side effects                                                     */
SyncAction resolveConflict(std::optional<time_t> localModTime,
                           std::optional<time_t> remoteModTime, SyncMode mode, int toleranceSec);

std::wstring getActionLabel(SyncAction action);
}

#endif //CONFLICT_RESOLVER_H_7823401928374
