#include <atomic>
#include <csignal>
#include <string>
#include <core/config.hpp>
#include <core/log.hpp>
#include <managers/cluster_manager.hpp>
#include <managers/cluster_monitor.hpp>
#include <managers/fleet_store.hpp>
#include <managers/registry.hpp>
#include <managers/sync_manager.hpp>
#include <platform/platform.hpp>
#include <ssh/connection.hpp>
#include <fmt/format.h>

static std::atomic<bool> g_shutdown{false};

static void print_usage() {
    fmt::print("Usage: fleetd [--config <path>]\n\n"
               "    --config <path>    Config file (default ~/.fleet/config.yaml)\n"
               "    --version          Show version\n"
               "    --help             Show this help\n");
}

// Re-create every stored definition. A definition that no longer validates is
// reported and skipped; the rest still load.
static void restore(const FleetStore& store, Registry& registry, ClusterManager& clusters,
                    ClusterMonitor& monitor, SyncManager& sync) {
    auto report = [](const std::string& what, const std::string& name, const std::string& error) {
        fmt::print(stderr, "fleetd: skipping {} '{}': {}\n", what, name, error);
        fleet_log(fmt::format("fleetd: skipping {} {}: {}", what, name, error));
    };

    auto servers = store.load_servers();
    if (servers.is_err()) report("servers", store.root().string(), servers.error);
    for (const auto& s : servers.value) {
        auto r = registry.add_server(s);
        if (r.is_err()) report("server", s.name, r.error);
    }

    auto stored_clusters = store.load_clusters();
    if (stored_clusters.is_err()) report("clusters", store.root().string(), stored_clusters.error);
    for (const auto& c : stored_clusters.value) {
        auto r = clusters.create_cluster(c.name, c.description, c.servers, c.tags);
        if (r.is_err()) report("cluster", c.name, r.error);
    }

    auto profiles = store.load_profiles();
    if (profiles.is_err()) report("profiles", store.root().string(), profiles.error);
    for (const auto& p : profiles.value) {
        auto r = sync.create_sync_profile(p);
        if (r.is_err()) report("sync profile", p.name, r.error);
    }

    auto tasks = store.load_tasks();
    if (tasks.is_err()) report("tasks", store.root().string(), tasks.error);
    for (const auto& t : tasks.value) {
        auto r = monitor.create_task(t);
        if (r.is_err()) report("task", t.name, r.error);
    }

    fmt::print("fleetd: {} servers, {} clusters, {} sync profiles, {} tasks\n",
               registry.list_servers().size(), clusters.list_clusters().size(),
               sync.list_sync_profiles().size(), monitor.list_tasks().size());
}

int main(int argc, char** argv) {
    std::string config_path;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--version") {
            fmt::print("fleetd version 0.1.0\n");
            return 0;
        } else if (arg == "--help") {
            print_usage();
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            fmt::print(stderr, "fleetd: unknown argument: {}\n", arg);
            print_usage();
            return 1;
        }
    }

    auto config = config_path.empty() ? Config::load_global() : Config::load(config_path);
    if (config.is_err()) {
        fmt::print(stderr, "fleetd: {}\n", config.error);
        return 1;
    }
    set_fleet_log_path(config.value.log_file());
    fleet_log("fleetd: starting");

    FleetStore store(config.value.state_dir());
    Registry registry(SSHConnection::factory(), config.value.connect_timeout(),
                      config.value.command_timeout());
    ClusterManager clusters(registry);
    ClusterMonitor monitor(registry, config.value.monitor());
    SyncManager sync(registry, config.value.sync());

    restore(store, registry, clusters, monitor, sync);

    std::signal(SIGINT, [](int) { g_shutdown.store(true); });
    std::signal(SIGTERM, [](int) { g_shutdown.store(true); });

    auto started = monitor.start_monitoring();
    if (started.is_err()) {
        fmt::print(stderr, "fleetd: {}\n", started.error);
        return 1;
    }

    while (!g_shutdown.load()) {
        platform::sleep_ms(200);
    }

    fmt::print("fleetd: shutting down\n");
    auto stopped = monitor.stop_monitoring();
    if (stopped.is_err()) fleet_log("fleetd: " + stopped.error);
    registry.close_all();
    fleet_log("fleetd: stopped");
    return 0;
}
