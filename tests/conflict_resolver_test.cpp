// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include "base/conflict_resolver.h"

using namespace sb;


namespace
{
const time_t T = 1'700'000'000;
const int TOLERANCE = 2;
}


TEST(ConflictResolver, OneSideMissingCopiesExistingSide)
{
    EXPECT_EQ(resolveConflict(T, std::nullopt, SyncMode::biDirectional, TOLERANCE), SyncAction::upload);
    EXPECT_EQ(resolveConflict(std::nullopt, T, SyncMode::biDirectional, TOLERANCE), SyncAction::download);
    EXPECT_EQ(resolveConflict(std::nullopt, std::nullopt, SyncMode::biDirectional, TOLERANCE), SyncAction::none);
}


TEST(ConflictResolver, NewerSideWins)
{
    EXPECT_EQ(resolveConflict(T + 10, T, SyncMode::biDirectional, TOLERANCE), SyncAction::upload);
    EXPECT_EQ(resolveConflict(T, T + 10, SyncMode::biDirectional, TOLERANCE), SyncAction::download);
}


TEST(ConflictResolver, DifferenceWithinToleranceIsEqual)
{
    EXPECT_EQ(resolveConflict(T, T, SyncMode::biDirectional, TOLERANCE), SyncAction::none);
    EXPECT_EQ(resolveConflict(T + 2, T, SyncMode::biDirectional, TOLERANCE), SyncAction::none);
    EXPECT_EQ(resolveConflict(T, T + 2, SyncMode::biDirectional, TOLERANCE), SyncAction::none);

    EXPECT_EQ(resolveConflict(T + 3, T, SyncMode::biDirectional, TOLERANCE), SyncAction::upload);
    EXPECT_EQ(resolveConflict(T, T + 3, SyncMode::biDirectional, TOLERANCE), SyncAction::download);

    EXPECT_EQ(resolveConflict(T + 1, T, SyncMode::biDirectional, 0), SyncAction::upload);
}


TEST(ConflictResolver, UploadOnlyNeverDownloads)
{
    EXPECT_EQ(resolveConflict(std::nullopt, T, SyncMode::uploadOnly, TOLERANCE), SyncAction::none);
    EXPECT_EQ(resolveConflict(T, T + 100, SyncMode::uploadOnly, TOLERANCE), SyncAction::none);

    EXPECT_EQ(resolveConflict(T, std::nullopt, SyncMode::uploadOnly, TOLERANCE), SyncAction::upload);
    EXPECT_EQ(resolveConflict(T + 100, T, SyncMode::uploadOnly, TOLERANCE), SyncAction::upload);
}


TEST(ConflictResolver, DownloadOnlyNeverUploads)
{
    EXPECT_EQ(resolveConflict(T, std::nullopt, SyncMode::downloadOnly, TOLERANCE), SyncAction::none);
    EXPECT_EQ(resolveConflict(T + 100, T, SyncMode::downloadOnly, TOLERANCE), SyncAction::none);

    EXPECT_EQ(resolveConflict(std::nullopt, T, SyncMode::downloadOnly, TOLERANCE), SyncAction::download);
    EXPECT_EQ(resolveConflict(T, T + 100, SyncMode::downloadOnly, TOLERANCE), SyncAction::download);
}


TEST(ConflictResolver, Deterministic)
{
    for (int i = 0; i < 3; ++i)
        EXPECT_EQ(resolveConflict(T + 5, T, SyncMode::biDirectional, TOLERANCE), SyncAction::upload);
}
