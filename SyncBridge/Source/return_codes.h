// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef RETURN_CODES_H_5501928374650192
#define RETURN_CODES_H_5501928374650192


namespace sb
{
enum class SbExitCode //as returned on process exit
{
    success = 0,
    cycleFailed, //--once: at least one cycle reported failures
    configError,
};


inline
void raiseExitCode(SbExitCode& rc, SbExitCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}
}

#endif //RETURN_CODES_H_5501928374650192
