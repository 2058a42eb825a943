// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "conflict_resolver.h"
#include <cassert>

using namespace zen;
using namespace sb;


SyncAction sb::resolveConflict(std::optional<time_t> localModTime,
                               std::optional<time_t> remoteModTime, SyncMode mode, int toleranceSec)
{
    auto gate = [mode](SyncAction action)
    {
        switch (action)
        {
            case SyncAction::none:
                break;
            case SyncAction::upload:
                return allowsUpload(mode) ? action : SyncAction::none;
            case SyncAction::download:
                return allowsDownload(mode) ? action : SyncAction::none;
        }
        return SyncAction::none;
    };

    if (!localModTime)
        return remoteModTime ? gate(SyncAction::download) : SyncAction::none;

    if (!remoteModTime) //bi-directional + deletion propagation: ambiguous => recreate instead of deleting
        return gate(SyncAction::upload);

    //cast to int64_t: time_t may be 32-bit
    const int64_t timeDiff = static_cast<int64_t>(*localModTime) - static_cast<int64_t>(*remoteModTime);

    if (timeDiff > toleranceSec)
        return gate(SyncAction::upload);
    if (timeDiff < -static_cast<int64_t>(toleranceSec))
        return gate(SyncAction::download);

    return SyncAction::none; //equal within tolerance
}


std::wstring sb::getActionLabel(SyncAction action)
{
    switch (action)
    {
        case SyncAction::none:
            return _("Do nothing");
        case SyncAction::upload:
            return _("Upload");
        case SyncAction::download:
            return _("Download");
    }
    assert(false);
    return std::wstring();
}
