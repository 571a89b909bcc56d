#include "cluster_manager.hpp"
#include <core/constants.hpp>
#include <core/fan_out.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

// ── ClusterExecutionResult ────────────────────────────────

double ClusterExecutionResult::success_rate() const {
    if (total_servers == 0) return 0.0;
    return static_cast<double>(success_count) / total_servers * 100.0;
}

std::vector<std::string> ClusterExecutionResult::failed_servers() const {
    std::vector<std::string> names;
    for (const auto& [server, r] : results) {
        if (!r.success()) names.push_back(server);
    }
    return names;
}

std::vector<std::string> ClusterExecutionResult::successful_servers() const {
    std::vector<std::string> names;
    for (const auto& [server, r] : results) {
        if (r.success()) names.push_back(server);
    }
    return names;
}

// ── Validation ────────────────────────────────────────────

// Members keep their order; repeats are dropped.
static Result<std::vector<std::string>> normalize_members(const std::vector<std::string>& servers) {
    if (servers.empty()) {
        return Result<std::vector<std::string>>::Err(ErrorKind::Validation,
            "Cluster must have at least one server");
    }
    std::vector<std::string> members;
    for (const auto& s : servers) {
        if (s.empty()) {
            return Result<std::vector<std::string>>::Err(ErrorKind::Validation,
                "Cluster member name cannot be empty");
        }
        if (std::find(members.begin(), members.end(), s) == members.end()) {
            members.push_back(s);
        }
    }
    return Result<std::vector<std::string>>::Ok(members);
}

// ── CRUD ──────────────────────────────────────────────────

ClusterManager::ClusterManager(RemoteManager& remote)
    : remote_(remote) {}

Result<void> ClusterManager::create_cluster(const std::string& name,
                                            const std::string& description,
                                            const std::vector<std::string>& servers,
                                            const std::map<std::string, std::string>& tags) {
    if (name.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "Cluster name cannot be empty");
    }
    auto members = normalize_members(servers);
    if (members.is_err()) return Result<void>::Err(members);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (clusters_.count(name)) {
        return Result<void>::Err(ErrorKind::Validation, "Cluster '" + name + "' already exists");
    }

    Cluster cluster;
    cluster.name = name;
    cluster.description = description;
    cluster.servers = members.value;
    cluster.tags = tags;
    cluster.created_at = std::chrono::system_clock::now();
    cluster.updated_at = cluster.created_at;
    clusters_.emplace(name, std::move(cluster));

    fleet_log(fmt::format("clusters: created {} ({} servers)", name, members.value.size()));
    return Result<void>::Ok();
}

Result<Cluster> ClusterManager::get_cluster(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = clusters_.find(name);
    if (it == clusters_.end()) {
        return Result<Cluster>::Err(ErrorKind::NotFound, "Cluster '" + name + "' not found");
    }
    return Result<Cluster>::Ok(it->second);
}

Result<void> ClusterManager::update_cluster(const std::string& name,
                                            const std::string& description,
                                            const std::vector<std::string>& servers,
                                            const std::map<std::string, std::string>& tags) {
    auto members = normalize_members(servers);
    if (members.is_err()) return Result<void>::Err(members);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = clusters_.find(name);
    if (it == clusters_.end()) {
        return Result<void>::Err(ErrorKind::NotFound, "Cluster '" + name + "' not found");
    }
    auto& cluster = it->second;
    cluster.description = description;
    cluster.servers = members.value;
    cluster.tags = tags;
    cluster.updated_at = std::chrono::system_clock::now();
    return Result<void>::Ok();
}

Result<void> ClusterManager::delete_cluster(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (clusters_.erase(name) == 0) {
        return Result<void>::Err(ErrorKind::NotFound, "Cluster '" + name + "' not found");
    }
    fleet_log("clusters: deleted " + name);
    return Result<void>::Ok();
}

std::vector<Cluster> ClusterManager::list_clusters() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Cluster> out;
    out.reserve(clusters_.size());
    for (const auto& [name, cluster] : clusters_) out.push_back(cluster);
    return out;
}

Result<void> ClusterManager::add_server_to_cluster(const std::string& cluster,
                                                   const std::string& server) {
    if (server.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "Server name cannot be empty");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = clusters_.find(cluster);
    if (it == clusters_.end()) {
        return Result<void>::Err(ErrorKind::NotFound, "Cluster '" + cluster + "' not found");
    }
    auto& members = it->second.servers;
    if (std::find(members.begin(), members.end(), server) != members.end()) {
        return Result<void>::Err(ErrorKind::Validation,
            "Server '" + server + "' is already in cluster '" + cluster + "'");
    }
    members.push_back(server);
    it->second.updated_at = std::chrono::system_clock::now();
    return Result<void>::Ok();
}

Result<void> ClusterManager::remove_server_from_cluster(const std::string& cluster,
                                                        const std::string& server) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = clusters_.find(cluster);
    if (it == clusters_.end()) {
        return Result<void>::Err(ErrorKind::NotFound, "Cluster '" + cluster + "' not found");
    }
    auto& members = it->second.servers;
    auto pos = std::find(members.begin(), members.end(), server);
    if (pos == members.end()) {
        return Result<void>::Err(ErrorKind::NotFound,
            "Server '" + server + "' not found in cluster '" + cluster + "'");
    }
    // The last member may not leave: clusters always have at least one
    if (members.size() == 1) {
        return Result<void>::Err(ErrorKind::Validation,
            "Cannot remove the last server from cluster '" + cluster + "'");
    }
    members.erase(pos);
    it->second.updated_at = std::chrono::system_clock::now();
    return Result<void>::Ok();
}

// ── Fan-out ───────────────────────────────────────────────

Result<ClusterExecutionResult> ClusterManager::execute_on_cluster(const std::string& name,
                                                                  const std::string& command,
                                                                  Deadline deadline) {
    auto cluster = get_cluster(name);
    if (cluster.is_err()) return Result<ClusterExecutionResult>::Err(cluster);

    ClusterExecutionResult exec;
    exec.cluster_name = name;
    exec.command = command;
    exec.total_servers = static_cast<int>(cluster.value.servers.size());
    exec.start_time = std::chrono::system_clock::now();
    auto start = Clock::now();

    exec.results = fan_out<RemoteResult>(cluster.value.servers, [&](const std::string& server) {
        return to_remote_result(server, command, remote_.execute_command(server, command, deadline));
    });

    std::chrono::milliseconds total{0};
    for (const auto& [server, r] : exec.results) {
        if (r.success()) exec.success_count++;
        else exec.failure_count++;
        total += r.duration;
    }
    exec.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    if (!exec.results.empty()) {
        exec.average_duration = total / static_cast<long long>(exec.results.size());
    }

    fleet_log(fmt::format("clusters: exec on {} '{}': {}/{} ok in {}ms", name, command,
                          exec.success_count, exec.total_servers, exec.duration.count()));
    return Result<ClusterExecutionResult>::Ok(exec);
}

Result<ClusterHealth> ClusterManager::check_cluster_health(const std::string& name,
                                                           Deadline deadline) {
    auto cluster = get_cluster(name);
    if (cluster.is_err()) return Result<ClusterHealth>::Err(cluster);

    auto start = Clock::now();
    Deadline check_deadline = std::min(deadline,
        deadline_in(std::chrono::seconds(PROBE_TIMEOUT_SECS)));

    auto results = fan_out<bool>(cluster.value.servers, [&](const std::string& server) {
        auto r = remote_.execute_command(server, PROBE_COMMAND, check_deadline);
        return r.is_ok() && r.value.success();
    });

    ClusterHealth health;
    health.total_servers = static_cast<int>(cluster.value.servers.size());
    for (const auto& [server, online] : results) {
        if (online) health.online_servers++;
        else health.offline_servers++;
    }
    if (health.total_servers > 0) {
        health.healthy_percent = static_cast<double>(health.online_servers) /
                                 health.total_servers * 100.0;
    }
    if (health.online_servers == health.total_servers) {
        health.status = ClusterStatus::Online;
    } else if (health.online_servers > 0) {
        health.status = ClusterStatus::Degraded;
    } else {
        health.status = ClusterStatus::Offline;
    }
    health.last_checked = std::chrono::system_clock::now();
    health.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = clusters_.find(name);
        if (it != clusters_.end()) it->second.health = health;
    }

    fleet_log(fmt::format("clusters: health {} = {} ({}/{})", name,
                          cluster_status_name(health.status),
                          health.online_servers, health.total_servers));
    return Result<ClusterHealth>::Ok(health);
}

ClusterStats ClusterManager::get_cluster_stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    ClusterStats stats;
    stats.total_clusters = static_cast<int>(clusters_.size());
    for (const auto& [name, cluster] : clusters_) {
        stats.total_server_refs += static_cast<int>(cluster.servers.size());
        switch (cluster.health.status) {
            case ClusterStatus::Online:   stats.healthy_clusters++; break;
            case ClusterStatus::Degraded: stats.degraded_clusters++; break;
            case ClusterStatus::Offline:  stats.offline_clusters++; break;
            default: break;
        }
    }
    return stats;
}
