#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "remote_manager.hpp"

enum class ClusterStatus { Unknown, Online, Degraded, Offline };

inline const char* cluster_status_name(ClusterStatus status) {
    switch (status) {
        case ClusterStatus::Online:   return "online";
        case ClusterStatus::Degraded: return "degraded";
        case ClusterStatus::Offline:  return "offline";
        default:                      return "unknown";
    }
}

struct ClusterHealth {
    ClusterStatus status = ClusterStatus::Unknown;
    int online_servers = 0;
    int offline_servers = 0;
    int total_servers = 0;
    double healthy_percent = 0.0;
    Timestamp last_checked{};
    std::chrono::milliseconds response_time{0};
};

struct Cluster {
    std::string name;
    std::string description;
    std::vector<std::string> servers;              // member names, resolved at execution
    std::map<std::string, std::string> tags;
    Timestamp created_at{};
    Timestamp updated_at{};
    ClusterHealth health;                          // last computed
};

struct ClusterExecutionResult {
    std::string cluster_name;
    std::string command;
    int total_servers = 0;
    int success_count = 0;
    int failure_count = 0;
    std::map<std::string, RemoteResult> results;   // exactly one per member
    Timestamp start_time{};
    std::chrono::milliseconds duration{0};
    std::chrono::milliseconds average_duration{0};

    double success_rate() const;
    std::vector<std::string> failed_servers() const;
    std::vector<std::string> successful_servers() const;
};

struct ClusterStats {
    int total_clusters = 0;
    int total_server_refs = 0;
    int healthy_clusters = 0;
    int degraded_clusters = 0;
    int offline_clusters = 0;
};

// Named groups of servers. Membership is not checked against the registry;
// unknown members simply fail when a command reaches them.
class ClusterManager {
public:
    explicit ClusterManager(RemoteManager& remote);

    Result<void> create_cluster(const std::string& name,
                                const std::string& description,
                                const std::vector<std::string>& servers,
                                const std::map<std::string, std::string>& tags = {});
    Result<Cluster> get_cluster(const std::string& name) const;
    Result<void> update_cluster(const std::string& name,
                                const std::string& description,
                                const std::vector<std::string>& servers,
                                const std::map<std::string, std::string>& tags);
    Result<void> delete_cluster(const std::string& name);
    std::vector<Cluster> list_clusters() const;

    Result<void> add_server_to_cluster(const std::string& cluster, const std::string& server);
    Result<void> remove_server_from_cluster(const std::string& cluster, const std::string& server);

    // Run command on every member concurrently. Only an unknown cluster fails the call.
    Result<ClusterExecutionResult> execute_on_cluster(const std::string& name,
                                                      const std::string& command,
                                                      Deadline deadline);

    // Check every member; the result is also stored on the cluster.
    Result<ClusterHealth> check_cluster_health(const std::string& name, Deadline deadline);

    ClusterStats get_cluster_stats() const;

private:
    RemoteManager& remote_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, Cluster> clusters_;
};
