#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>
#include "remote_manager.hpp"

struct SyncProfile {
    std::string name;
    std::string description;
    std::string source_path;               // local file or directory
    std::string target_path;               // absolute remote path
    std::vector<std::string> servers;
    std::vector<std::string> excludes;     // directory sources only
    std::vector<std::string> pre_commands;
    std::vector<std::string> post_commands;
    bool backup_before = false;
    bool validate = true;
    std::string permissions;               // chmod mode, empty = leave alone
    std::string owner;
    std::string group;
    std::map<std::string, std::string> tags;
    Timestamp created_at{};
    Timestamp updated_at{};
};

struct SyncResult {
    std::string server_name;
    bool success = false;
    int files_updated = 0;
    int files_skipped = 0;
    uintmax_t bytes_transferred = 0;
    std::chrono::milliseconds duration{0};
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
    std::optional<std::string> backup_path;
    std::optional<std::string> checksum;   // remote fingerprint, when validated
};

struct SyncEvent {
    std::string profile_name;
    std::string event_type;                // "sync" or "dry_run"
    Timestamp timestamp{};
    std::vector<std::string> servers;
    std::map<std::string, SyncResult> results;
    int success_count = 0;
    int failure_count = 0;
    int total_files = 0;
    uintmax_t total_bytes = 0;
    std::string source_checksum;
    std::chrono::milliseconds duration{0};
    std::string error;
};

struct SyncStats {
    int total_profiles = 0;
    int total_events = 0;
    int successful_syncs = 0;
    int failed_syncs = 0;
    int total_servers = 0;                 // distinct, across all profiles
    int history_capacity = 0;
};

// Profile-driven push of a local file or directory to many servers.
//
// Per server, strictly in order: pre-commands, backup, transfer, chmod/chown,
// checksum validation, post-commands. Servers run concurrently and never
// affect each other. Every run is appended to a bounded history.
class SyncManager {
public:
    explicit SyncManager(RemoteManager& remote, SyncSettings settings = {});

    Result<void> create_sync_profile(const SyncProfile& profile);
    Result<void> update_sync_profile(const SyncProfile& profile);
    Result<void> delete_sync_profile(const std::string& name);
    Result<SyncProfile> get_sync_profile(const std::string& name) const;
    std::vector<SyncProfile> list_sync_profiles() const;

    // Field checks plus: source exists locally and every server is registered.
    Result<void> validate_profile(const SyncProfile& profile) const;

    // Unknown profile or unreadable source fails the call; anything that goes
    // wrong on one server is reported in that server's SyncResult.
    Result<SyncEvent> sync_configuration(const std::string& name, Deadline deadline);

    // Same planning as a sync, nothing is executed remotely.
    Result<SyncEvent> dry_run(const std::string& name);

    std::vector<SyncEvent> get_sync_history() const;
    SyncStats get_sync_stats() const;

private:
    // What gets sent: computed once per run, shared by every server.
    struct SourcePlan {
        bool is_dir = false;
        std::vector<std::string> files;    // relative to source (directory only)
        int excluded = 0;
        uintmax_t total_bytes = 0;
        std::string checksum;
        std::filesystem::path archive;     // local tar (directory sync only)
    };

    static Result<void> check_fields(const SyncProfile& profile);
    static Result<SourcePlan> plan_source(const SyncProfile& profile);

    SyncResult sync_to_server(const SyncProfile& profile, const SourcePlan& plan,
                              const std::string& server, const std::string& stamp,
                              Deadline deadline);

    Result<void> transfer(const SyncProfile& profile, const SourcePlan& plan,
                          const std::string& server, const std::string& stamp,
                          Deadline deadline);

    Result<std::string> remote_checksum(const SyncProfile& profile, const SourcePlan& plan,
                                        const std::string& server, Deadline deadline);

    // Run one hook command; Err if it could not run or exited non-zero.
    Result<void> run_hook(const std::string& server, const std::string& command,
                          Deadline deadline);

    void record_event(const SyncEvent& event);

    RemoteManager& remote_;
    SyncSettings settings_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, SyncProfile> profiles_;
    std::deque<SyncEvent> history_;
};
