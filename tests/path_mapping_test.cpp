// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include "base/path_mapping.h"

using namespace sb;


TEST(PathMapping, LocalToRemote)
{
    const PathMapping pathMap(Zstr("/home/user/site"), Zstr("/public_html"));

    EXPECT_EQ(pathMap.toRemote(Zstr("/home/user/site/index.html")), Zstr("/public_html/index.html"));
    EXPECT_EQ(pathMap.toRemote(Zstr("/home/user/site/css/main.css")), Zstr("/public_html/css/main.css"));
    EXPECT_EQ(pathMap.toRemote(Zstr("/home/user/site")), Zstr("/public_html"));
}


TEST(PathMapping, RemoteToLocal)
{
    const PathMapping pathMap(Zstr("/home/user/site"), Zstr("/public_html"));

    EXPECT_EQ(pathMap.toLocal(Zstr("/public_html/index.html")), Zstr("/home/user/site/index.html"));
    EXPECT_EQ(pathMap.toLocal(Zstr("/public_html/a/b/c.txt")), Zstr("/home/user/site/a/b/c.txt"));
}


TEST(PathMapping, Bijection)
{
    const PathMapping pathMap(Zstr("/data/local"), Zstr("/srv/remote"));

    for (const Zstring relPath : {Zstr("a.txt"), Zstr("sub/b.txt"), Zstr("x/y/z/file name.bin")})
    {
        const Zstring localPath = pathMap.localFromRelative(relPath);
        EXPECT_EQ(pathMap.toLocal(pathMap.toRemote(localPath)), localPath);
        EXPECT_EQ(pathMap.localToRelative(localPath), relPath);
        EXPECT_EQ(pathMap.remoteToRelative(pathMap.toRemote(localPath)), relPath);
    }
}


TEST(PathMapping, RemoteRootIsFileSystemRoot)
{
    const PathMapping pathMap(Zstr("/data/local"), Zstr("/"));

    EXPECT_EQ(pathMap.toRemote(Zstr("/data/local/a.txt")), Zstr("/a.txt"));
    EXPECT_EQ(pathMap.toLocal(Zstr("/dir/b.txt")), Zstr("/data/local/dir/b.txt"));
    EXPECT_EQ(pathMap.remoteToRelative(Zstr("/")), Zstr(""));
}


TEST(PathMapping, TrailingSeparatorsAreIgnored)
{
    const PathMapping pathMap(Zstr("/data/local/"), Zstr("/srv/remote/"));

    EXPECT_EQ(pathMap.getLocalRoot(), Zstr("/data/local"));
    EXPECT_EQ(pathMap.getRemoteRoot(), Zstr("/srv/remote"));
    EXPECT_EQ(pathMap.toRemote(Zstr("/data/local/a.txt")), Zstr("/srv/remote/a.txt"));
}


TEST(PathMapping, PathOutsideRootIsContractViolation)
{
    const PathMapping pathMap(Zstr("/data/local"), Zstr("/srv/remote"));

    EXPECT_THROW(pathMap.toRemote(Zstr("/data/other/a.txt")), std::logic_error);
    EXPECT_THROW(pathMap.toRemote(Zstr("/data/localx/a.txt")), std::logic_error); //prefix, but not a parent folder
    EXPECT_THROW(pathMap.toLocal (Zstr("/srv/a.txt")), std::logic_error);
    EXPECT_THROW(pathMap.toRemote(Zstr("/data/local/../etc/passwd")), std::logic_error);
}


TEST(PathMapping, RelativeRootsAreRejected)
{
    EXPECT_THROW(PathMapping(Zstr("data/local"), Zstr("/srv")), std::logic_error);
    EXPECT_THROW(PathMapping(Zstr("/data/local"), Zstr("srv")), std::logic_error);
}
