// *****************************************************************************
// * This file is part of the SyncBridge project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include "base/config.h"
#include "test_util.h"

using namespace zen;
using namespace sb;
using namespace sb::test;


namespace
{
const Zstring workingDir = Zstr("/srv/syncbridge");

ConfigReadResult parse(const std::string& json)
{
    return parseConfig(json, Zstr("/srv/syncbridge/config.json"), workingDir); //throw ConfigError
}
}


TEST(Config, FullTarget)
{
    const ConfigReadResult result = parse(R"({
        "state_dir": "state",
        "idle_close_threshold_sec": 120,
        "targets": [{
            "id": 7,
            "name": "My Site",
            "protocol": "sftp",
            "host": "example.com",
            "port": 2222,
            "username": "deploy",
            "password": "secret",
            "private_key_file": "/home/deploy/.ssh/id_ed25519",
            "local_path": "/var/www/site/",
            "remote_path": "/home/deploy/public/",
            "sync_mode": "upload_only",
            "sync_deletions": true,
            "parallel_connections": 5,
            "buffer_size": 65536,
            "sync_interval_sec": 300,
            "time_tolerance_sec": 3,
            "timeout_sec": 15,
            "some_future_key": [1, 2, 3]
        }]
    })");

    EXPECT_TRUE(result.invalidTargets.empty());
    EXPECT_EQ(result.config.stateDir, Zstr("/srv/syncbridge/state"));
    EXPECT_EQ(result.config.idleCloseThresholdSec, 120);
    ASSERT_EQ(result.config.targets.size(), 1u);

    const SyncTarget& target = result.config.targets[0];
    EXPECT_EQ(target.id, 7);
    EXPECT_EQ(target.name, Zstr("My Site"));
    EXPECT_EQ(target.protocol, SyncProtocol::sftp);
    EXPECT_EQ(target.host, Zstr("example.com"));
    EXPECT_EQ(target.port, 2222);
    EXPECT_EQ(target.username, Zstr("deploy"));
    EXPECT_EQ(target.password, Zstr("secret"));
    EXPECT_EQ(target.privateKeyFile, Zstr("/home/deploy/.ssh/id_ed25519"));
    EXPECT_EQ(target.localPath, Zstr("/var/www/site"));
    EXPECT_EQ(target.remotePath, Zstr("/home/deploy/public"));
    EXPECT_EQ(target.syncMode, SyncMode::uploadOnly);
    EXPECT_TRUE(target.syncDeletions);
    EXPECT_EQ(target.parallelConnections, 5);
    EXPECT_EQ(target.bufferSize, 65536u);
    EXPECT_EQ(target.syncIntervalSec, 300);
    EXPECT_EQ(target.timeToleranceSec, 3);
    EXPECT_EQ(target.timeoutSec, 15);
}


TEST(Config, Defaults)
{
    const ConfigReadResult result = parse(R"({"targets": [{"id": 3, "host": "ftp.example.com"}]})");

    EXPECT_EQ(result.config.stateDir, workingDir);
    EXPECT_EQ(result.config.idleCloseThresholdSec, 60);
    ASSERT_EQ(result.config.targets.size(), 1u);

    const SyncTarget& target = result.config.targets[0];
    EXPECT_EQ(target.protocol, SyncProtocol::ftp);
    EXPECT_EQ(getEffectivePort(target), 21);
    EXPECT_FALSE(useTls(target));
    EXPECT_EQ(target.localPath, Zstr("/srv/syncbridge/sync_data/3"));
    EXPECT_EQ(target.remotePath, Zstr("/"));
    EXPECT_EQ(target.syncMode, SyncMode::biDirectional);
    EXPECT_FALSE(target.syncDeletions);
    EXPECT_EQ(target.parallelConnections, 3);
    EXPECT_EQ(target.bufferSize, 4u * 1024 * 1024);
    EXPECT_EQ(target.syncIntervalSec, 60);
    EXPECT_EQ(target.timeToleranceSec, 2);
    EXPECT_EQ(target.timeoutSec, 30);
}


TEST(Config, ProtocolDefaults)
{
    const ConfigReadResult result = parse(R"({"targets": [
        {"id": 1, "host": "h", "protocol": "sftp"},
        {"id": 2, "host": "h", "protocol": "ftps"},
        {"id": 3, "host": "h", "protocol": "FTP", "secure": true}
    ]})");
    ASSERT_EQ(result.config.targets.size(), 3u);

    EXPECT_EQ(getEffectivePort(result.config.targets[0]), 22);
    EXPECT_TRUE(useTls(result.config.targets[1]));
    EXPECT_EQ(result.config.targets[2].protocol, SyncProtocol::ftp);
    EXPECT_TRUE(useTls(result.config.targets[2]));
}


TEST(Config, ParallelConnectionsAreClamped)
{
    const ConfigReadResult result = parse(R"({"targets": [
        {"id": 1, "host": "h", "parallel_connections": 0},
        {"id": 2, "host": "h", "parallel_connections": 25}
    ]})");
    ASSERT_EQ(result.config.targets.size(), 2u);
    EXPECT_EQ(result.config.targets[0].parallelConnections, 1);
    EXPECT_EQ(result.config.targets[1].parallelConnections, 10);
}


TEST(Config, InvalidTargetsAreSkipped)
{
    const ConfigReadResult result = parse(R"({"targets": [
        {"id": 1, "host": ""},
        {"id": 2, "host": "h", "remote_path": "relative/path"},
        {"id": 3, "host": "h", "port": 70000},
        {"id": 4, "host": "h", "protocol": "webdav"},
        {"id": 5, "host": "h", "sync_mode": "mirror"},
        {"id": 6, "host": "h", "port": "21"},
        {"id": 7, "host": "h", "sync_interval_sec": 0},
        {"id": 8, "host": "h", "private_key_file": "/key", "protocol": "ftp"},
        {"id": 9, "host": "h", "local_path": "relative"},
        {"host": "no id"},
        "not an object",
        {"id": 10, "host": "valid.example.com"}
    ]})");

    EXPECT_EQ(result.invalidTargets.size(), 11u);
    ASSERT_EQ(result.config.targets.size(), 1u);
    EXPECT_EQ(result.config.targets[0].id, 10);
}


TEST(Config, DuplicateIdIsRejected)
{
    const ConfigReadResult result = parse(R"({"targets": [
        {"id": 1, "host": "first"},
        {"id": 1, "host": "second"}
    ]})");

    ASSERT_EQ(result.config.targets.size(), 1u);
    EXPECT_EQ(result.config.targets[0].host, Zstr("first"));
    ASSERT_EQ(result.invalidTargets.size(), 1u);
    EXPECT_NE(result.invalidTargets[0].toString().find(L"Duplicate target ID"), std::wstring::npos);
}


TEST(Config, FatalErrors)
{
    EXPECT_THROW(parse("{ not json"), ConfigError);
    EXPECT_THROW(parse("[]"), ConfigError);
    EXPECT_THROW(parse(R"({"targets": {}})"), ConfigError);
    EXPECT_THROW(parse(R"({"idle_close_threshold_sec": -1})"), ConfigError);
    EXPECT_THROW(parse(R"({"state_dir": 5})"), ConfigError);
}


TEST(Config, SerializeAndParseAgain)
{
    SyncConfig cfg;
    cfg.stateDir = Zstr("/var/lib/syncbridge");
    cfg.idleCloseThresholdSec = 90;

    SyncTarget target;
    target.id = 42;
    target.name = Zstr("Shop \"live\"");
    target.protocol = SyncProtocol::ftps;
    target.host = Zstr("ftp.shop.example");
    target.port = 990;
    target.username = Zstr("admin");
    target.password = Zstr("p\\a\"ss");
    target.localPath = Zstr("/data/shop");
    target.remotePath = Zstr("/htdocs");
    target.syncMode = SyncMode::downloadOnly;
    target.syncDeletions = true;
    target.parallelConnections = 7;
    target.bufferSize = 1024 * 1024;
    target.syncIntervalSec = 3600;
    target.timeToleranceSec = 0;
    target.timeoutSec = 45;
    cfg.targets.push_back(target);

    const ConfigReadResult result = parse(serializeConfig(cfg));

    EXPECT_TRUE(result.invalidTargets.empty());
    EXPECT_EQ(result.config.stateDir, cfg.stateDir);
    EXPECT_EQ(result.config.idleCloseThresholdSec, 90);
    ASSERT_EQ(result.config.targets.size(), 1u);
    EXPECT_TRUE(result.config.targets[0] == target);
}


TEST(Config, ReadFromFile)
{
    TempFolder tmp;
    const Zstring filePath = tmp / Zstr("config.json");

    SyncConfig cfg;
    cfg.stateDir = tmp.path();
    SyncTarget target;
    target.id = 1;
    target.host = Zstr("localhost");
    target.localPath = tmp / Zstr("local");
    cfg.targets.push_back(target);

    writeConfig(cfg, filePath);

    const ConfigReadResult result = readConfig(filePath, tmp.path());
    ASSERT_EQ(result.config.targets.size(), 1u);
    EXPECT_EQ(result.config.targets[0].localPath, tmp / Zstr("local"));

    EXPECT_THROW(readConfig(tmp / Zstr("missing.json"), tmp.path()), FileError);
}
