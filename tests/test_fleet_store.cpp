#include <gtest/gtest.h>
#include <managers/fleet_store.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

class FleetStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::unique_ptr<FleetStore> store;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("fleet_store_test_" + std::to_string(getpid()));
        fs::remove_all(test_dir);
        store = std::make_unique<FleetStore>(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    static Timestamp at(int64_t epoch_secs) {
        return Timestamp(std::chrono::seconds(epoch_secs));
    }
};

TEST_F(FleetStoreTest, EmptyStoreLoadsNothing) {
    auto servers = store->load_servers();
    ASSERT_TRUE(servers.is_ok());
    EXPECT_TRUE(servers.value.empty());
    EXPECT_TRUE(store->load_clusters().value.empty());
    EXPECT_TRUE(store->load_profiles().value.empty());
    EXPECT_TRUE(store->load_tasks().value.empty());
}

TEST_F(FleetStoreTest, ServersRoundTrip) {
    ServerConfig b;
    b.name = "web2";
    b.host = "10.0.0.2";
    b.port = 2222;
    b.username = "ops";
    b.key_path = "/home/ops/.ssh/id_ed25519";
    b.tags = {"prod", "eu-west"};
    b.timeout_secs = 7;

    ServerConfig a;
    a.name = "web1";
    a.host = "10.0.0.1";
    a.username = "deploy";
    a.password = "p\"ss:w0rd";

    ASSERT_TRUE(store->save_server(b).is_ok());
    ASSERT_TRUE(store->save_server(a).is_ok());

    auto r = store->load_servers();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 2u);

    // Sorted by file name
    const auto& s1 = r.value[0];
    EXPECT_EQ(s1.name, "web1");
    EXPECT_EQ(s1.port, 22);
    EXPECT_EQ(s1.password, "p\"ss:w0rd");
    EXPECT_TRUE(s1.tags.empty());

    const auto& s2 = r.value[1];
    EXPECT_EQ(s2.name, "web2");
    EXPECT_EQ(s2.host, "10.0.0.2");
    EXPECT_EQ(s2.port, 2222);
    EXPECT_EQ(s2.username, "ops");
    EXPECT_EQ(s2.key_path, "/home/ops/.ssh/id_ed25519");
    EXPECT_EQ(s2.tags, (std::vector<std::string>{"prod", "eu-west"}));
    EXPECT_EQ(s2.timeout_secs, 7);
}

TEST_F(FleetStoreTest, ServerDocumentsAreOwnerOnly) {
    // A world-readable leftover from an interrupted save must not leak the password
    fs::create_directories(test_dir / "servers");
    fs::path stale = test_dir / "servers" / "web1.json.tmp";
    std::ofstream(stale) << "junk";
    fs::permissions(stale, fs::perms::owner_read | fs::perms::owner_write |
                           fs::perms::group_read | fs::perms::others_read);

    mode_t old_mask = umask(022);
    ServerConfig s;
    s.name = "web1";
    s.host = "h";
    s.username = "u";
    s.password = "secret";
    auto saved = store->save_server(s);
    umask(old_mask);
    ASSERT_TRUE(saved.is_ok());

    auto perms = fs::status(test_dir / "servers" / "web1.json").permissions() & fs::perms::all;
    EXPECT_EQ(perms, fs::perms::owner_read | fs::perms::owner_write);
    EXPECT_FALSE(fs::exists(stale));
    EXPECT_EQ(store->load_servers().value.at(0).password, "secret");
}

TEST_F(FleetStoreTest, OwnerOnlyFileIsRestrictedBeforeWrite) {
    fs::create_directories(test_dir);
    fs::path path = test_dir / "creds";
    std::ofstream(path) << "previous contents";
    fs::permissions(path, fs::perms::all);

    mode_t old_mask = umask(0);
    std::ofstream out;
    bool opened = platform::open_owner_only(path, out);
    umask(old_mask);
    ASSERT_TRUE(opened);

    // Open, empty and already private
    EXPECT_EQ(fs::status(path).permissions() & fs::perms::all,
              fs::perms::owner_read | fs::perms::owner_write);
    EXPECT_EQ(fs::file_size(path), 0u);

    out << "password=secret\n";
    out.close();
    EXPECT_EQ(fs::file_size(path), 16u);
}

TEST_F(FleetStoreTest, OwnerOnlyFileFailsInMissingDirectory) {
    std::ofstream out;
    EXPECT_FALSE(platform::open_owner_only(test_dir / "nope" / "creds", out));
    EXPECT_FALSE(out.is_open());
}

TEST_F(FleetStoreTest, SaveOverwrites) {
    ServerConfig s;
    s.name = "web1";
    s.host = "old.example.com";
    ASSERT_TRUE(store->save_server(s).is_ok());
    s.host = "new.example.com";
    ASSERT_TRUE(store->save_server(s).is_ok());

    auto r = store->load_servers();
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_EQ(r.value[0].host, "new.example.com");
}

TEST_F(FleetStoreTest, ClustersRoundTrip) {
    Cluster c;
    c.name = "web";
    c.description = "frontends, all regions";
    c.servers = {"web2", "web1"};
    c.tags = {{"env", "prod"}, {"team", "edge"}};
    c.created_at = at(1700000000);
    c.updated_at = at(1700000600);
    ASSERT_TRUE(store->save_cluster(c).is_ok());

    auto r = store->load_clusters();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 1u);
    const auto& got = r.value[0];
    EXPECT_EQ(got.name, "web");
    EXPECT_EQ(got.description, "frontends, all regions");
    EXPECT_EQ(got.servers, (std::vector<std::string>{"web2", "web1"}));
    EXPECT_EQ(got.tags, c.tags);
    EXPECT_TRUE(got.created_at == c.created_at);
    EXPECT_TRUE(got.updated_at == c.updated_at);
}

TEST_F(FleetStoreTest, ProfilesRoundTrip) {
    SyncProfile p;
    p.name = "nginx";
    p.source_path = "/srv/config/nginx";
    p.target_path = "/etc/nginx";
    p.servers = {"web1", "web2"};
    p.excludes = {"*.bak", "!keep.bak"};
    p.pre_commands = {"nginx -t"};
    p.post_commands = {"systemctl reload nginx"};
    p.backup_before = true;
    p.validate = false;
    p.permissions = "644";
    p.owner = "root";
    p.group = "www-data";
    p.created_at = at(1700000000);
    ASSERT_TRUE(store->save_profile(p).is_ok());

    auto r = store->load_profiles();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 1u);
    const auto& got = r.value[0];
    EXPECT_EQ(got.target_path, "/etc/nginx");
    EXPECT_EQ(got.servers, p.servers);
    EXPECT_EQ(got.excludes, p.excludes);
    EXPECT_EQ(got.pre_commands, p.pre_commands);
    EXPECT_EQ(got.post_commands, p.post_commands);
    EXPECT_TRUE(got.backup_before);
    EXPECT_FALSE(got.validate);
    EXPECT_EQ(got.permissions, "644");
    EXPECT_EQ(got.owner, "root");
    EXPECT_EQ(got.group, "www-data");
    EXPECT_TRUE(got.created_at == p.created_at);
}

TEST_F(FleetStoreTest, TasksRoundTrip) {
    MonitoringTask t;
    t.name = "web-health";
    t.servers = {"web1"};
    t.interval = std::chrono::seconds(120);
    t.timeout = std::chrono::seconds(45);
    t.enabled = false;

    HealthCheck http;
    http.name = "http";
    http.command = "curl -sf http://localhost/health";
    http.expected_output = "ok";
    http.timeout = std::chrono::seconds(5);
    http.critical = true;

    HealthCheck disk;
    disk.name = "disk";
    disk.command = "test $(df --output=pcent / | tail -1 | tr -d ' %') -lt 90";
    disk.expected_exit = 0;
    t.checks = {http, disk};
    ASSERT_TRUE(store->save_task(t).is_ok());

    auto r = store->load_tasks();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 1u);
    const auto& got = r.value[0];
    EXPECT_EQ(got.interval.count(), 120);
    EXPECT_EQ(got.timeout.count(), 45);
    EXPECT_FALSE(got.enabled);
    ASSERT_EQ(got.checks.size(), 2u);
    EXPECT_EQ(got.checks[0].command, http.command);
    EXPECT_EQ(got.checks[0].expected_output, "ok");
    EXPECT_EQ(got.checks[0].timeout.count(), 5);
    EXPECT_TRUE(got.checks[0].critical);
    EXPECT_EQ(got.checks[1].command, disk.command);
    EXPECT_FALSE(got.checks[1].critical);
}

TEST_F(FleetStoreTest, RemoveDocuments) {
    Cluster c;
    c.name = "web";
    c.servers = {"web1"};
    ASSERT_TRUE(store->save_cluster(c).is_ok());

    ASSERT_TRUE(store->remove_cluster("web").is_ok());
    EXPECT_TRUE(store->load_clusters().value.empty());
    EXPECT_EQ(store->remove_cluster("web").kind, ErrorKind::NotFound);
    EXPECT_EQ(store->remove_task("never-saved").kind, ErrorKind::NotFound);
}

TEST_F(FleetStoreTest, RejectsUnsafeNames) {
    ServerConfig s;
    s.host = "h";
    for (const auto& name : {"", ".", "..", "../escape", "a/b", "a\\b"}) {
        s.name = name;
        EXPECT_EQ(store->save_server(s).kind, ErrorKind::Validation) << name;
    }
    EXPECT_EQ(store->remove_profile("../x").kind, ErrorKind::Validation);
    EXPECT_FALSE(fs::exists(test_dir / "escape.json"));
}

TEST_F(FleetStoreTest, BadDocumentsAreSkipped) {
    Cluster c;
    c.name = "good";
    c.servers = {"web1"};
    ASSERT_TRUE(store->save_cluster(c).is_ok());

    std::ofstream(test_dir / "clusters" / "broken.json") << "{\"name\": \"broken\", ";
    std::ofstream(test_dir / "clusters" / "list.json") << "[1, 2, 3]";
    std::ofstream(test_dir / "clusters" / "notes.txt") << "not a document";

    auto r = store->load_clusters();
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_EQ(r.value[0].name, "good");
}
