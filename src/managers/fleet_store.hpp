#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "cluster_manager.hpp"
#include "cluster_monitor.hpp"
#include "sync_manager.hpp"

namespace fs = std::filesystem;

// On-disk definitions, one JSON document per object:
//
//   <root>/servers/<name>.json
//   <root>/clusters/<name>.json
//   <root>/profiles/<name>.json
//   <root>/tasks/<name>.json
//
// Writes go to a temp file that is renamed into place. Only definitions are
// stored; runtime state (status, health, alerts, history) is not.
class FleetStore {
public:
    explicit FleetStore(fs::path root);

    const fs::path& root() const { return root_; }

    Result<void> save_server(const ServerConfig& server);
    Result<void> remove_server(const std::string& name);
    Result<std::vector<ServerConfig>> load_servers() const;

    Result<void> save_cluster(const Cluster& cluster);
    Result<void> remove_cluster(const std::string& name);
    Result<std::vector<Cluster>> load_clusters() const;

    Result<void> save_profile(const SyncProfile& profile);
    Result<void> remove_profile(const std::string& name);
    Result<std::vector<SyncProfile>> load_profiles() const;

    Result<void> save_task(const MonitoringTask& task);
    Result<void> remove_task(const std::string& name);
    Result<std::vector<MonitoringTask>> load_tasks() const;

private:
    Result<fs::path> document_path(const std::string& kind, const std::string& name) const;
    Result<void> write_document(const std::string& kind, const std::string& name,
                                const std::string& text, bool secret = false);
    Result<void> remove_document(const std::string& kind, const std::string& name);

    // Every readable document in a kind's directory, sorted by file name.
    // Unparseable documents are logged and skipped.
    template <typename T, typename Decode>
    Result<std::vector<T>> read_documents(const std::string& kind, Decode decode) const;

    fs::path root_;
};
