// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include <zen/time.h>
#include "afs/ftp_listing.h"

using namespace zen;
using namespace sb;


namespace
{
time_t utc(int year, int month, int day, int hour = 0, int minute = 0, int second = 0)
{
    TimeComp tc;
    tc.year   = year;
    tc.month  = month;
    tc.day    = day;
    tc.hour   = hour;
    tc.minute = minute;
    tc.second = second;
    const auto [t, valid] = utcToTimeT(tc);
    if (!valid)
        throw std::logic_error("invalid test time");
    return t;
}

const ServerToUtf asUtf8 = [](const std::string_view& str) { return Zstring(str); };
}


TEST(FtpListing, StatusCodeOfLastLine)
{
    EXPECT_EQ(getLastFtpStatusCode("220-Welcome\r\n220 Ready\r\n"), 220);
    EXPECT_EQ(getLastFtpStatusCode("150 Opening\r\n226 Transfer complete\r\n"), 226);
    EXPECT_EQ(getLastFtpStatusCode("no status here"), 0);
}


TEST(FtpListing, FormatStatus)
{
    EXPECT_EQ(formatFtpStatus(550), L"FTP status 550: File unavailable, e.g. file not found, no access.");
    EXPECT_EQ(formatFtpStatus(299), L"FTP status 299.");
}


TEST(FtpListing, FeatResponse)
{
    const FtpFeatures features = parseFeatResponse("211-Features:\r\n"
                                                   " MDTM\r\n"
                                                   " MFMT\r\n"
                                                   " MLST type*;size*;modify*;\r\n"
                                                   " UTF8\r\n"
                                                   "211 End\r\n");
    EXPECT_TRUE(features.mlsd);
    EXPECT_TRUE(features.mfmt);
    EXPECT_TRUE(features.utf8);
    EXPECT_FALSE(features.clnt);

    const FtpFeatures none = parseFeatResponse("500 Unknown command\r\n");
    EXPECT_FALSE(none.mlsd);
    EXPECT_FALSE(none.mfmt);
}


TEST(FtpListing, Mlsd)
{
    const std::vector<FtpItem> items = parseMlsd("type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755; .\r\n"
                                                 "type=file;size=4;modify=20170113063314;UNIX.mode=0600; readme.txt\r\n"
                                                 "type=dir;sizd=4096;modify=20170117144634.123; folder\r\n"
                                                 "type=OS.unix=slink:/target;modify=20170117144634; link\r\n", asUtf8);
    ASSERT_EQ(items.size(), 3u);

    EXPECT_EQ(items[0].type, FtpItemType::file);
    EXPECT_EQ(items[0].itemName, Zstr("readme.txt"));
    EXPECT_EQ(items[0].fileSize, 4u);
    EXPECT_EQ(items[0].modTime, utc(2017, 1, 13, 6, 33, 14));

    EXPECT_EQ(items[1].type, FtpItemType::folder);
    EXPECT_EQ(items[1].itemName, Zstr("folder"));
    EXPECT_EQ(items[1].modTime, utc(2017, 1, 17, 14, 46, 34));

    EXPECT_EQ(items[2].type, FtpItemType::symlink);
    EXPECT_EQ(items[2].itemName, Zstr("link"));
}


TEST(FtpListing, MlsdFileWithoutSizeIsRejected)
{
    EXPECT_THROW(parseMlsd("type=file;modify=20170113063314; readme.txt\r\n", asUtf8), SysError);
}


TEST(FtpListing, UnixListing)
{
    const time_t now = utc(2026, 6, 15, 12, 0);

    const std::vector<FtpItem> items = parseUnix("total 4953\r\n"
                                                 "drwxr-xr-x 1 root root    4096 Jan 10 11:58 version\r\n"
                                                 "-rwxr-xr-x 1 root root    1084 Sep  2 01:17 Unit Test.txt\r\n"
                                                 "-rwxr-xr-x 1 1000  300    2217 Feb 28  2016 win32.manifest\r\n"
                                                 "lrwxr-xr-x 1 root root      18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects\r\n", asUtf8, now);
    ASSERT_EQ(items.size(), 4u);

    EXPECT_EQ(items[0].type, FtpItemType::folder);
    EXPECT_EQ(items[0].itemName, Zstr("version"));
    EXPECT_EQ(items[0].modTime, utc(2026, 1, 10, 11, 58));

    EXPECT_EQ(items[1].type, FtpItemType::file);
    EXPECT_EQ(items[1].itemName, Zstr("Unit Test.txt"));
    EXPECT_EQ(items[1].fileSize, 1084u);
    EXPECT_EQ(items[1].modTime, utc(2025, 9, 2, 1, 17)); //in the future for this year => last year

    EXPECT_EQ(items[2].itemName, Zstr("win32.manifest"));
    EXPECT_EQ(items[2].fileSize, 2217u);
    EXPECT_EQ(items[2].modTime, utc(2016, 2, 28));

    EXPECT_EQ(items[3].type, FtpItemType::symlink);
    EXPECT_EQ(items[3].itemName, Zstr("Projects"));
}


TEST(FtpListing, UnixListingWithoutOwnerAndGroup)
{
    const std::vector<FtpItem> items = parseUnix("drwxrwxrwx 1              0 Jan  1  2020 dirname/\r\n"
                                                 "-rw-r--r-- 1             12 Jan  1  2020 file.txt\r\n", asUtf8, utc(2026, 6, 15));
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].type, FtpItemType::folder);
    EXPECT_EQ(items[0].itemName, Zstr("dirname"));
    EXPECT_EQ(items[1].itemName, Zstr("file.txt"));
    EXPECT_EQ(items[1].fileSize, 12u);
}


TEST(FtpListing, WindowsListing)
{
    const std::vector<FtpItem> items = parseUnknown("10-27-15  03:46AM       <DIR>          pub\r\n"
                                                    "04-08-14  03:09PM               11,399 readme.txt\r\n"
                                                    "06-20-2017  12:50PM              1875499 zstring.obj\r\n", asUtf8, utc(2026, 6, 15));
    ASSERT_EQ(items.size(), 3u);

    EXPECT_EQ(items[0].type, FtpItemType::folder);
    EXPECT_EQ(items[0].itemName, Zstr("pub"));
    EXPECT_EQ(items[0].modTime, utc(2015, 10, 27, 3, 46));

    EXPECT_EQ(items[1].type, FtpItemType::file);
    EXPECT_EQ(items[1].fileSize, 11399u);
    EXPECT_EQ(items[1].modTime, utc(2014, 4, 8, 15, 9));

    EXPECT_EQ(items[2].fileSize, 1875499u);
    EXPECT_EQ(items[2].modTime, utc(2017, 6, 20, 12, 50));
}


TEST(FtpListing, MdtmAndSizeResponses)
{
    EXPECT_EQ(parseMdtmResponse("213 20170113063314\r\n"), utc(2017, 1, 13, 6, 33, 14));
    EXPECT_EQ(parseMdtmResponse("213 20170113063314.250\r\n"), utc(2017, 1, 13, 6, 33, 14));
    EXPECT_THROW(parseMdtmResponse("550 No such file\r\n"), SysError);

    EXPECT_EQ(parseSizeResponse("213 1024\r\n"), 1024u);
    EXPECT_EQ(parseSizeResponse("550 I can only retrieve regular files\r\n"), std::nullopt);
    EXPECT_THROW(parseSizeResponse("500 ?\r\n"), SysError);
}
