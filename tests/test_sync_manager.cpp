#include <gtest/gtest.h>
#include <managers/registry.hpp>
#include <managers/sync_manager.hpp>
#include <core/utils.hpp>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include "fake_connection.hpp"

class SyncManagerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path src_dir;       // local side
    fs::path remote_dir;    // what the local-shell "server" sees
    FakeFleet fleet;
    std::unique_ptr<Registry> registry;
    std::unique_ptr<SyncManager> sync;

    void SetUp() override {
        std::string test_name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        test_dir = fs::temp_directory_path() /
                   ("fleet_sync_test_" + std::to_string(getpid()) + "_" + test_name);
        fs::remove_all(test_dir);
        src_dir = test_dir / "src";
        remote_dir = test_dir / "remote";
        fs::create_directories(src_dir);
        fs::create_directories(remote_dir / "tmp");

        fleet.make_local("web1");
        registry = std::make_unique<Registry>(fleet.factory(), 5);
        ASSERT_TRUE(registry->add_server(make_server("web1")).is_ok());
        ASSERT_TRUE(registry->add_server(make_server("web2")).is_ok());
        make_sync(SyncSettings{});
    }

    void TearDown() override {
        sync.reset();
        registry.reset();
        fs::remove_all(test_dir);
    }

    void make_sync(SyncSettings settings) {
        settings.remote_temp_dir = (remote_dir / "tmp").string();
        sync = std::make_unique<SyncManager>(*registry, settings);
    }

    void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    SyncProfile profile(const std::string& name, const fs::path& source, const fs::path& target,
                        std::vector<std::string> servers = {"web1"}) {
        SyncProfile p;
        p.name = name;
        p.source_path = source.string();
        p.target_path = target.string();
        p.servers = std::move(servers);
        return p;
    }
};

// ── Profiles ────────────────────────────────────────────────

TEST_F(SyncManagerTest, ProfileFieldValidation) {
    fs::path src = src_dir / "app.conf";
    auto base = profile("cfg", src, "/etc/app.conf");

    auto no_name = base;
    no_name.name.clear();
    EXPECT_EQ(sync->create_sync_profile(no_name).kind, ErrorKind::Validation);

    auto no_source = base;
    no_source.source_path.clear();
    EXPECT_EQ(sync->create_sync_profile(no_source).kind, ErrorKind::Validation);

    auto no_servers = base;
    no_servers.servers.clear();
    EXPECT_EQ(sync->create_sync_profile(no_servers).kind, ErrorKind::Validation);

    auto relative = base;
    relative.target_path = "etc/app.conf";
    EXPECT_EQ(sync->create_sync_profile(relative).kind, ErrorKind::Validation);

    auto root = base;
    root.target_path = "/";
    EXPECT_EQ(sync->create_sync_profile(root).kind, ErrorKind::Validation);

    auto bad_mode = base;
    bad_mode.permissions = "644; rm -rf /";
    EXPECT_EQ(sync->create_sync_profile(bad_mode).kind, ErrorKind::Validation);

    EXPECT_TRUE(sync->list_sync_profiles().empty());
}

TEST_F(SyncManagerTest, ProfileCrud) {
    auto p = profile("cfg", src_dir / "app.conf", "/etc/app.conf", {"web1", "web2", "web1"});
    ASSERT_TRUE(sync->create_sync_profile(p).is_ok());
    EXPECT_EQ(sync->create_sync_profile(p).kind, ErrorKind::Validation);

    auto got = sync->get_sync_profile("cfg");
    ASSERT_TRUE(got.is_ok());
    EXPECT_EQ(got.value.servers, (std::vector<std::string>{"web1", "web2"}));

    p.description = "app config";
    ASSERT_TRUE(sync->update_sync_profile(p).is_ok());
    auto updated = sync->get_sync_profile("cfg").value;
    EXPECT_EQ(updated.description, "app config");
    EXPECT_EQ(updated.created_at, got.value.created_at);

    EXPECT_EQ(sync->update_sync_profile(profile("ghost", "/a", "/b")).kind, ErrorKind::NotFound);
    ASSERT_TRUE(sync->delete_sync_profile("cfg").is_ok());
    EXPECT_EQ(sync->get_sync_profile("cfg").kind, ErrorKind::NotFound);
    EXPECT_EQ(sync->delete_sync_profile("cfg").kind, ErrorKind::NotFound);
}

TEST_F(SyncManagerTest, ValidateProfileChecksSourceAndServers) {
    fs::path src = src_dir / "app.conf";
    auto p = profile("cfg", src, "/etc/app.conf");
    EXPECT_EQ(sync->validate_profile(p).kind, ErrorKind::Validation);   // source missing

    write_file(src, "x=1\n");
    EXPECT_TRUE(sync->validate_profile(p).is_ok());

    p.servers.push_back("ghost");
    EXPECT_EQ(sync->validate_profile(p).kind, ErrorKind::Validation);
}

// ── File sync ───────────────────────────────────────────────

TEST_F(SyncManagerTest, FileSyncRoundTripValidates) {
    fs::path src = src_dir / "app.conf";
    fs::path target = remote_dir / "etc" / "app.conf";
    write_file(src, "listen=8080\nworkers=4\n");
    ASSERT_TRUE(sync->create_sync_profile(profile("cfg", src, target)).is_ok());

    auto r = sync->sync_configuration("cfg", test_deadline());
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& event = r.value;
    EXPECT_EQ(event.event_type, "sync");
    EXPECT_EQ(event.success_count, 1);
    EXPECT_EQ(event.failure_count, 0);
    EXPECT_EQ(event.total_files, 1);
    EXPECT_EQ(event.total_bytes, 22u);

    const auto& result = event.results.at("web1");
    EXPECT_TRUE(result.success) << result.error;
    ASSERT_TRUE(result.checksum.has_value());
    EXPECT_EQ(*result.checksum, compute_file_md5(src));
    EXPECT_EQ(read_file(target), "listen=8080\nworkers=4\n");

    // Temp upload was moved into place
    EXPECT_TRUE(fs::is_empty(remote_dir / "tmp"));
}

TEST_F(SyncManagerTest, ResyncAfterExternalModificationConverges) {
    fs::path src = src_dir / "app.conf";
    fs::path target = remote_dir / "app.conf";
    write_file(src, "mode=prod\n");
    ASSERT_TRUE(sync->create_sync_profile(profile("cfg", src, target)).is_ok());
    ASSERT_TRUE(sync->sync_configuration("cfg", test_deadline()).value.results.at("web1").success);

    write_file(target, "mode=debug\nhacked=1\n");
    ASSERT_NE(compute_file_md5(target), compute_file_md5(src));

    auto r = sync->sync_configuration("cfg", test_deadline());
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.results.at("web1").success);
    EXPECT_EQ(read_file(target), "mode=prod\n");
    EXPECT_EQ(compute_file_md5(target), compute_file_md5(src));
}

TEST_F(SyncManagerTest, BackupKeepsPreviousContent) {
    fs::path src = src_dir / "app.conf";
    fs::path target = remote_dir / "app.conf";
    write_file(src, "new\n");
    write_file(target, "old\n");

    auto p = profile("cfg", src, target);
    p.backup_before = true;
    ASSERT_TRUE(sync->create_sync_profile(p).is_ok());

    auto r = sync->sync_configuration("cfg", test_deadline());
    ASSERT_TRUE(r.is_ok());
    const auto& result = r.value.results.at("web1");
    ASSERT_TRUE(result.success) << result.error;
    ASSERT_TRUE(result.backup_path.has_value());
    EXPECT_EQ(result.backup_path->rfind(target.string() + ".backup.", 0), 0u);
    EXPECT_EQ(read_file(*result.backup_path), "old\n");
    EXPECT_EQ(read_file(target), "new\n");
}

TEST_F(SyncManagerTest, BackupSkippedWhenTargetMissing) {
    fs::path src = src_dir / "app.conf";
    write_file(src, "new\n");
    auto p = profile("cfg", src, remote_dir / "fresh.conf");
    p.backup_before = true;
    ASSERT_TRUE(sync->create_sync_profile(p).is_ok());

    auto result = sync->sync_configuration("cfg", test_deadline()).value.results.at("web1");
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.backup_path.has_value());
}

TEST_F(SyncManagerTest, PermissionsApplied) {
    fs::path src = src_dir / "secret.conf";
    fs::path target = remote_dir / "secret.conf";
    write_file(src, "token=abc\n");

    auto p = profile("cfg", src, target);
    p.permissions = "600";
    ASSERT_TRUE(sync->create_sync_profile(p).is_ok());
    ASSERT_TRUE(sync->sync_configuration("cfg", test_deadline()).value.results.at("web1").success);

    auto perms = fs::status(target).permissions() & fs::perms::all;
    EXPECT_EQ(perms, fs::perms::owner_read | fs::perms::owner_write);
}

// ── Hooks ───────────────────────────────────────────────────

TEST_F(SyncManagerTest, PreCommandFailureAbortsServer) {
    fs::path src = src_dir / "app.conf";
    fs::path target = remote_dir / "app.conf";
    write_file(src, "x\n");

    auto p = profile("cfg", src, target);
    p.pre_commands = {"true", "exit 3", "touch " + (remote_dir / "never").string()};
    ASSERT_TRUE(sync->create_sync_profile(p).is_ok());

    auto r = sync->sync_configuration("cfg", test_deadline());
    ASSERT_TRUE(r.is_ok());
    const auto& result = r.value.results.at("web1");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::CommandFailed);
    EXPECT_FALSE(fs::exists(target));
    EXPECT_FALSE(fs::exists(remote_dir / "never"));
    EXPECT_EQ(r.value.failure_count, 1);
}

TEST_F(SyncManagerTest, PostCommandFailureIsHardFailure) {
    fs::path src = src_dir / "app.conf";
    fs::path target = remote_dir / "app.conf";
    write_file(src, "x\n");

    auto p = profile("cfg", src, target);
    p.post_commands = {"touch " + (remote_dir / "reloaded").string(), "false"};
    ASSERT_TRUE(sync->create_sync_profile(p).is_ok());

    auto result = sync->sync_configuration("cfg", test_deadline()).value.results.at("web1");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::CommandFailed);
    EXPECT_TRUE(fs::exists(target));
    EXPECT_TRUE(fs::exists(remote_dir / "reloaded"));
}

// ── Directory sync ──────────────────────────────────────────

TEST_F(SyncManagerTest, DirectorySyncAppliesExcludes) {
    fs::path src = src_dir / "app";
    write_file(src / "nginx.conf", "server {}\n");
    write_file(src / "sites" / "default.conf", "location / {}\n");
    write_file(src / "logs" / "access.log", "GET /\n");
    write_file(src / "scratch.tmp", "junk\n");
    fs::path target = remote_dir / "opt" / "app";

    auto p = profile("app", src, target);
    p.excludes = {"*.tmp", "logs/"};
    ASSERT_TRUE(sync->create_sync_profile(p).is_ok());

    auto r = sync->sync_configuration("app", test_deadline());
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& result = r.value.results.at("web1");
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.files_updated, 2);
    EXPECT_EQ(result.files_skipped, 2);
    EXPECT_EQ(result.bytes_transferred, 24u);

    // Fingerprint: MD5 over the per-file MD5s in sorted relative-path order
    std::string expected = md5_hex(compute_file_md5(src / "nginx.conf") +
                                   compute_file_md5(src / "sites" / "default.conf"));
    EXPECT_EQ(r.value.source_checksum, expected);
    ASSERT_TRUE(result.checksum.has_value());
    EXPECT_EQ(*result.checksum, expected);

    EXPECT_EQ(read_file(target / "nginx.conf"), "server {}\n");
    EXPECT_EQ(read_file(target / "sites" / "default.conf"), "location / {}\n");
    EXPECT_FALSE(fs::exists(target / "logs"));
    EXPECT_FALSE(fs::exists(target / "scratch.tmp"));
    EXPECT_TRUE(fs::is_empty(remote_dir / "tmp"));
}

TEST_F(SyncManagerTest, DirectoryResyncConverges) {
    fs::path src = src_dir / "app";
    write_file(src / "a.conf", "a=1\n");
    write_file(src / "b.conf", "b=1\n");
    fs::path target = remote_dir / "app";
    ASSERT_TRUE(sync->create_sync_profile(profile("app", src, target)).is_ok());
    ASSERT_TRUE(sync->sync_configuration("app", test_deadline()).value.results.at("web1").success);

    write_file(target / "b.conf", "b=tampered\n");
    auto result = sync->sync_configuration("app", test_deadline()).value.results.at("web1");
    EXPECT_TRUE(result.success) << result.error;
    EXPECT_EQ(read_file(target / "b.conf"), "b=1\n");
}

// ── Fan-out ─────────────────────────────────────────────────

TEST_F(SyncManagerTest, OneReachableOneUnreachable) {
    fleet.host("web2")->fail_connect = true;
    fs::path src = src_dir / "app.conf";
    write_file(src, "x=1\n");
    ASSERT_TRUE(sync->create_sync_profile(
        profile("cfg", src, remote_dir / "app.conf", {"web1", "web2"})).is_ok());

    auto r = sync->sync_configuration("cfg", test_deadline());
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.success_count, 1);
    EXPECT_EQ(r.value.failure_count, 1);
    EXPECT_TRUE(r.value.results.at("web1").success);
    EXPECT_FALSE(r.value.results.at("web2").success);
    EXPECT_FALSE(r.value.results.at("web2").error.empty());
    EXPECT_EQ(r.value.results.at("web2").server_name, "web2");
}

TEST_F(SyncManagerTest, RemoteChecksumMismatchIsHardFailure) {
    fs::path src = src_dir / "app.conf";
    write_file(src, "x=1\n");
    fleet.host("web2")->handler = [](const std::string& cmd) {
        if (cmd.rfind("md5sum", 0) == 0) {
            return Result<RemoteResult>::Ok(
                fake_output(0, "0123456789abcdef0123456789abcdef  /etc/app.conf\n"));
        }
        return Result<RemoteResult>::Ok(fake_output(0, ""));
    };
    ASSERT_TRUE(sync->create_sync_profile(profile("cfg", src, "/etc/app.conf", {"web2"})).is_ok());

    auto r = sync->sync_configuration("cfg", test_deadline());
    ASSERT_TRUE(r.is_ok());
    const auto& result = r.value.results.at("web2");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::ChecksumMismatch);
    ASSERT_TRUE(result.checksum.has_value());
    EXPECT_EQ(*result.checksum, "0123456789abcdef0123456789abcdef");

    // Upload went to the temp dir, not straight to the target
    auto uploads = fleet.host("web2")->uploads;
    ASSERT_EQ(uploads.size(), 1u);
    EXPECT_EQ(uploads[0].rfind((remote_dir / "tmp").string() + "/fleet_sync_", 0), 0u);
}

TEST_F(SyncManagerTest, RemoteChecksumTimeoutIsTimeout) {
    fs::path src = src_dir / "app.conf";
    write_file(src, "x=1\n");
    fleet.host("web2")->handler = [](const std::string& cmd) {
        if (cmd.rfind("md5sum", 0) == 0) {
            RemoteResult slow = fake_output(-1, "");
            slow.timed_out = true;
            return Result<RemoteResult>::Ok(slow);
        }
        return Result<RemoteResult>::Ok(fake_output(0, ""));
    };
    ASSERT_TRUE(sync->create_sync_profile(profile("cfg", src, "/etc/app.conf", {"web2"})).is_ok());

    auto r = sync->sync_configuration("cfg", test_deadline());
    ASSERT_TRUE(r.is_ok());
    const auto& result = r.value.results.at("web2");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::Timeout);
    EXPECT_FALSE(result.checksum.has_value());
}

TEST_F(SyncManagerTest, RemoteChecksumCommandFailureIsCommandFailed) {
    fs::path src = src_dir / "app.conf";
    write_file(src, "x=1\n");
    fleet.host("web2")->handler = [](const std::string& cmd) {
        if (cmd.rfind("md5sum", 0) == 0) {
            return Result<RemoteResult>::Ok(fake_output(127, "sh: md5sum: command not found\n"));
        }
        return Result<RemoteResult>::Ok(fake_output(0, ""));
    };
    ASSERT_TRUE(sync->create_sync_profile(profile("cfg", src, "/etc/app.conf", {"web2"})).is_ok());

    auto r = sync->sync_configuration("cfg", test_deadline());
    ASSERT_TRUE(r.is_ok());
    const auto& result = r.value.results.at("web2");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::CommandFailed);
    EXPECT_NE(result.error.find("command not found"), std::string::npos);
}

TEST_F(SyncManagerTest, ValidationCanBeDisabled) {
    fs::path src = src_dir / "app.conf";
    write_file(src, "x=1\n");
    auto p = profile("cfg", src, "/etc/app.conf", {"web2"});
    p.validate = false;
    ASSERT_TRUE(sync->create_sync_profile(p).is_ok());

    auto result = sync->sync_configuration("cfg", test_deadline()).value.results.at("web2");
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.checksum.has_value());
    for (const auto& cmd : fleet.host("web2")->command_log()) {
        EXPECT_EQ(cmd.find("md5sum"), std::string::npos);
    }
}

// ── Failures before fan-out ─────────────────────────────────

TEST_F(SyncManagerTest, UnknownProfileRecordsNothing) {
    auto r = sync->sync_configuration("ghost", test_deadline());
    EXPECT_EQ(r.kind, ErrorKind::NotFound);
    EXPECT_TRUE(sync->get_sync_history().empty());
}

TEST_F(SyncManagerTest, MissingSourceFailsAndIsRecorded) {
    ASSERT_TRUE(sync->create_sync_profile(
        profile("cfg", src_dir / "missing.conf", remote_dir / "x.conf")).is_ok());

    auto r = sync->sync_configuration("cfg", test_deadline());
    EXPECT_EQ(r.kind, ErrorKind::Io);

    auto history = sync->get_sync_history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_FALSE(history[0].error.empty());
    EXPECT_TRUE(history[0].results.empty());
    EXPECT_EQ(sync->get_sync_stats().failed_syncs, 1);
}

// ── Dry run, history, stats ─────────────────────────────────

TEST_F(SyncManagerTest, DryRunExecutesNothing) {
    fs::path src = src_dir / "app";
    write_file(src / "a.conf", "a\n");
    write_file(src / "b.log", "b\n");
    auto p = profile("app", src, "/opt/app", {"web2", "ghost"});
    p.excludes = {"*.log"};
    p.pre_commands = {"systemctl stop app"};
    ASSERT_TRUE(sync->create_sync_profile(p).is_ok());

    auto r = sync->dry_run("app");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.event_type, "dry_run");
    EXPECT_TRUE(r.value.results.at("web2").success);
    EXPECT_EQ(r.value.results.at("web2").files_updated, 1);
    EXPECT_EQ(r.value.results.at("web2").files_skipped, 1);
    EXPECT_FALSE(r.value.results.at("ghost").success);
    EXPECT_EQ(r.value.results.at("ghost").error_kind, ErrorKind::NotFound);
    EXPECT_EQ(fleet.host("web2")->connects.load(), 0);

    auto stats = sync->get_sync_stats();
    EXPECT_EQ(stats.total_events, 1);
    EXPECT_EQ(stats.successful_syncs, 0);
    EXPECT_EQ(stats.failed_syncs, 0);
}

TEST_F(SyncManagerTest, HistoryIsCapped) {
    SyncSettings settings;
    settings.history_cap = 2;
    make_sync(settings);

    fs::path src = src_dir / "app.conf";
    write_file(src, "x\n");
    for (const auto& name : {"p1", "p2", "p3"}) {
        ASSERT_TRUE(sync->create_sync_profile(profile(name, src, "/etc/app.conf")).is_ok());
        ASSERT_TRUE(sync->dry_run(name).is_ok());
    }

    auto history = sync->get_sync_history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].profile_name, "p2");
    EXPECT_EQ(history[1].profile_name, "p3");
    EXPECT_EQ(sync->get_sync_stats().history_capacity, 2);
}

TEST_F(SyncManagerTest, StatsCountOutcomesAndServers) {
    fleet.host("web2")->fail_connect = true;
    fs::path src = src_dir / "app.conf";
    write_file(src, "x\n");
    ASSERT_TRUE(sync->create_sync_profile(profile("ok", src, remote_dir / "ok.conf", {"web1"})).is_ok());
    ASSERT_TRUE(sync->create_sync_profile(
        profile("mixed", src, remote_dir / "mixed.conf", {"web1", "web2"})).is_ok());

    ASSERT_TRUE(sync->sync_configuration("ok", test_deadline()).is_ok());
    ASSERT_TRUE(sync->sync_configuration("mixed", test_deadline()).is_ok());

    auto stats = sync->get_sync_stats();
    EXPECT_EQ(stats.total_profiles, 2);
    EXPECT_EQ(stats.total_events, 2);
    EXPECT_EQ(stats.successful_syncs, 1);
    EXPECT_EQ(stats.failed_syncs, 1);
    EXPECT_EQ(stats.total_servers, 2);
}
