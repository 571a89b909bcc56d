#include "sync_manager.hpp"
#include "exclude_matcher.hpp"
#include <core/fan_out.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/archive.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <set>
#include <stdexcept>

static constexpr const char* BACKUP_MARKER = "FLEET_BACKUP_DONE";

// Remote temp names must not collide between concurrent syncs to one server.
static std::string remote_temp_name(const std::string& dir, const std::string& stamp,
                                    const char* suffix) {
    static std::atomic<uint64_t> seq{0};
    return fmt::format("{}/fleet_sync_{}_{}{}", dir, stamp, ++seq, suffix);
}

// ── Profiles ───────────────────────────────────────────────

SyncManager::SyncManager(RemoteManager& remote, SyncSettings settings)
    : remote_(remote), settings_(std::move(settings)) {
    if (settings_.history_cap < 1) settings_.history_cap = 1;
}

Result<void> SyncManager::check_fields(const SyncProfile& profile) {
    if (profile.name.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "Profile name cannot be empty");
    }
    if (profile.source_path.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "Source path cannot be empty");
    }
    if (profile.target_path.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "Target path cannot be empty");
    }
    if (profile.target_path[0] != '/') {
        return Result<void>::Err(ErrorKind::Validation,
            "Target path must be absolute: " + profile.target_path);
    }
    if (profile.target_path.find_first_not_of('/') == std::string::npos) {
        return Result<void>::Err(ErrorKind::Validation, "Target path cannot be the root directory");
    }
    if (profile.servers.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "Profile must list at least one server");
    }
    for (const auto& s : profile.servers) {
        if (s.empty()) {
            return Result<void>::Err(ErrorKind::Validation, "Server name cannot be empty");
        }
    }
    if (!profile.permissions.empty() &&
        profile.permissions.find_first_not_of("01234567ugoa+-=rwxXst,") != std::string::npos) {
        return Result<void>::Err(ErrorKind::Validation,
            "Invalid permissions: " + profile.permissions);
    }
    return Result<void>::Ok();
}

// Servers keep their order; repeats are dropped.
static std::vector<std::string> unique_servers(const std::vector<std::string>& servers) {
    std::vector<std::string> out;
    for (const auto& s : servers) {
        if (std::find(out.begin(), out.end(), s) == out.end()) out.push_back(s);
    }
    return out;
}

Result<void> SyncManager::create_sync_profile(const SyncProfile& profile) {
    auto valid = check_fields(profile);
    if (valid.is_err()) return valid;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (profiles_.count(profile.name)) {
        return Result<void>::Err(ErrorKind::Validation,
            "Sync profile '" + profile.name + "' already exists");
    }

    SyncProfile stored = profile;
    stored.servers = unique_servers(profile.servers);
    stored.created_at = std::chrono::system_clock::now();
    stored.updated_at = stored.created_at;
    profiles_.emplace(stored.name, std::move(stored));

    fleet_log(fmt::format("sync: profile {} created ({} -> {})", profile.name,
                          profile.source_path, profile.target_path));
    return Result<void>::Ok();
}

Result<void> SyncManager::update_sync_profile(const SyncProfile& profile) {
    auto valid = check_fields(profile);
    if (valid.is_err()) return valid;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = profiles_.find(profile.name);
    if (it == profiles_.end()) {
        return Result<void>::Err(ErrorKind::NotFound, "Sync profile '" + profile.name + "' not found");
    }

    Timestamp created = it->second.created_at;
    it->second = profile;
    it->second.servers = unique_servers(profile.servers);
    it->second.created_at = created;
    it->second.updated_at = std::chrono::system_clock::now();
    return Result<void>::Ok();
}

Result<void> SyncManager::delete_sync_profile(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (profiles_.erase(name) == 0) {
        return Result<void>::Err(ErrorKind::NotFound, "Sync profile '" + name + "' not found");
    }
    fleet_log("sync: profile " + name + " deleted");
    return Result<void>::Ok();
}

Result<SyncProfile> SyncManager::get_sync_profile(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = profiles_.find(name);
    if (it == profiles_.end()) {
        return Result<SyncProfile>::Err(ErrorKind::NotFound, "Sync profile '" + name + "' not found");
    }
    return Result<SyncProfile>::Ok(it->second);
}

std::vector<SyncProfile> SyncManager::list_sync_profiles() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<SyncProfile> out;
    out.reserve(profiles_.size());
    for (const auto& [name, profile] : profiles_) out.push_back(profile);
    return out;
}

Result<void> SyncManager::validate_profile(const SyncProfile& profile) const {
    auto valid = check_fields(profile);
    if (valid.is_err()) return valid;

    std::error_code ec;
    if (!fs::exists(profile.source_path, ec)) {
        return Result<void>::Err(ErrorKind::Validation,
            "Source path does not exist: " + profile.source_path);
    }
    for (const auto& server : profile.servers) {
        if (!remote_.has_server(server)) {
            return Result<void>::Err(ErrorKind::Validation, "Unknown server: " + server);
        }
    }
    return Result<void>::Ok();
}

// ── Planning ───────────────────────────────────────────────

Result<SyncManager::SourcePlan> SyncManager::plan_source(const SyncProfile& profile) {
    SourcePlan plan;
    fs::path source(profile.source_path);
    std::error_code ec;
    auto status = fs::status(source, ec);
    if (ec || !fs::exists(status)) {
        return Result<SourcePlan>::Err(ErrorKind::Io,
            "Source path does not exist: " + profile.source_path);
    }

    if (fs::is_regular_file(status)) {
        plan.total_bytes = fs::file_size(source, ec);
        if (ec) {
            return Result<SourcePlan>::Err(ErrorKind::Io,
                "Cannot stat " + profile.source_path + ": " + ec.message());
        }
        plan.checksum = compute_file_md5(source);
        if (plan.checksum.empty()) {
            return Result<SourcePlan>::Err(ErrorKind::Io, "Cannot read " + profile.source_path);
        }
        return Result<SourcePlan>::Ok(plan);
    }

    if (!fs::is_directory(status)) {
        return Result<SourcePlan>::Err(ErrorKind::Io,
            "Source is neither a file nor a directory: " + profile.source_path);
    }

    ExcludeMatcher matcher(profile.excludes);
    auto collected = matcher.collect(source);
    if (collected.is_err()) return Result<SourcePlan>::Err(collected);

    plan.is_dir = true;
    plan.files = collected.value.files;
    plan.excluded = collected.value.excluded;
    plan.total_bytes = collected.value.total_bytes;

    std::string digests;
    for (const auto& rel : plan.files) {
        auto md5 = compute_file_md5(source / rel);
        if (md5.empty()) {
            return Result<SourcePlan>::Err(ErrorKind::Io, "Cannot read " + (source / rel).string());
        }
        digests += md5;
    }
    plan.checksum = md5_hex(digests);
    return Result<SourcePlan>::Ok(plan);
}

// ── Per-server steps ───────────────────────────────────────

Result<void> SyncManager::run_hook(const std::string& server, const std::string& command,
                                   Deadline deadline) {
    auto r = remote_.execute_command(server, command, deadline);
    if (r.is_err()) return Result<void>::Err(r);
    if (r.value.timed_out) {
        return Result<void>::Err(ErrorKind::Timeout, "'" + command + "' timed out");
    }
    if (r.value.exit_code != 0) {
        return Result<void>::Err(ErrorKind::CommandFailed,
            fmt::format("'{}' exited {}: {}", command, r.value.exit_code, trimmed(r.value.output)));
    }
    return Result<void>::Ok();
}

Result<void> SyncManager::transfer(const SyncProfile& profile, const SourcePlan& plan,
                                   const std::string& server, const std::string& stamp,
                                   Deadline deadline) {
    const std::string target = shell_quote(profile.target_path);
    std::string tmp;
    std::string install;

    if (plan.is_dir) {
        tmp = remote_temp_name(settings_.remote_temp_dir, stamp, ".tar");
        install = fmt::format("mkdir -p {0} && tar xf {1} -C {0}; rc=$?; rm -f {1}; exit $rc",
                              target, shell_quote(tmp));
    } else {
        tmp = remote_temp_name(settings_.remote_temp_dir, stamp, ".tmp");
        std::string parent = fs::path(profile.target_path).parent_path().generic_string();
        if (parent.empty()) parent = "/";
        install = fmt::format("mkdir -p {0} && mv -f {1} {2} || {{ rc=$?; rm -f {1}; exit $rc; }}",
                              shell_quote(parent), shell_quote(tmp), target);
    }

    const fs::path local = plan.is_dir ? plan.archive : fs::path(profile.source_path);
    auto uploaded = remote_.upload_file(server, local, tmp, deadline);
    if (uploaded.is_err()) return uploaded;

    auto r = remote_.execute_command(server, install, deadline);
    if (r.is_err()) return Result<void>::Err(r);
    if (r.value.timed_out) {
        return Result<void>::Err(ErrorKind::Timeout, "Installing into " + profile.target_path + " timed out");
    }
    if (r.value.exit_code != 0) {
        return Result<void>::Err(ErrorKind::CommandFailed,
            fmt::format("Installing into {} failed (exit {}): {}", profile.target_path,
                        r.value.exit_code, trimmed(r.value.output)));
    }
    return Result<void>::Ok();
}

// A checksum command that never finished says nothing about the target
static Result<void> checksum_ran(const RemoteResult& r, const std::string& what) {
    if (r.timed_out) {
        return Result<void>::Err(ErrorKind::Timeout, "Checksum of " + what + " timed out");
    }
    if (r.exit_code != 0) {
        return Result<void>::Err(ErrorKind::CommandFailed,
            fmt::format("Cannot checksum {} (exit {}): {}", what, r.exit_code, trimmed(r.output)));
    }
    return Result<void>::Ok();
}

Result<std::string> SyncManager::remote_checksum(const SyncProfile& profile, const SourcePlan& plan,
                                                 const std::string& server, Deadline deadline) {
    const std::string target = shell_quote(profile.target_path);

    if (!plan.is_dir) {
        auto r = remote_.execute_command(server, "md5sum -- " + target, deadline);
        if (r.is_err()) return Result<std::string>::Err(r);
        auto ran = checksum_ran(r.value, profile.target_path);
        if (ran.is_err()) return Result<std::string>::Err(ran);
        std::string md5 = parse_md5_from_output(r.value.output);
        if (md5.empty()) {
            return Result<std::string>::Err(ErrorKind::CommandFailed,
                "No checksum for " + profile.target_path + ": " + trimmed(r.value.output));
        }
        return Result<std::string>::Ok(md5);
    }

    // Nothing was sent, so there is nothing to hash
    if (plan.files.empty()) return Result<std::string>::Ok(md5_hex(""));

    std::string cmd = "cd " + target + " && md5sum --";
    for (const auto& rel : plan.files) cmd += " " + shell_quote(rel);

    auto r = remote_.execute_command(server, cmd, deadline);
    if (r.is_err()) return Result<std::string>::Err(r);
    auto ran = checksum_ran(r.value, "files under " + profile.target_path);
    if (ran.is_err()) return Result<std::string>::Err(ran);

    // md5sum prints one line per argument, in argument order
    std::string digests;
    size_t count = 0;
    for (const auto& line : split_lines(r.value.output)) {
        std::string md5 = parse_md5_from_output(line);
        if (md5.empty()) continue;
        digests += md5;
        count++;
    }
    if (count != plan.files.size()) {
        return Result<std::string>::Err(ErrorKind::ChecksumMismatch,
            fmt::format("Expected {} checksums from {}, got {}", plan.files.size(), server, count));
    }
    return Result<std::string>::Ok(md5_hex(digests));
}

SyncResult SyncManager::sync_to_server(const SyncProfile& profile, const SourcePlan& plan,
                                       const std::string& server, const std::string& stamp,
                                       Deadline deadline) {
    auto start = Clock::now();
    SyncResult result;
    result.server_name = server;

    auto fail = [&](ErrorKind kind, const std::string& msg) {
        result.success = false;
        result.error = msg;
        result.error_kind = kind;
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        fleet_log(fmt::format("sync: {} on {} failed: {}", profile.name, server, msg));
        return result;
    };

    if (!remote_.has_server(server)) {
        return fail(ErrorKind::NotFound, "Unknown server: " + server);
    }

    for (const auto& cmd : profile.pre_commands) {
        auto hook = run_hook(server, cmd, deadline);
        if (hook.is_err()) return fail(hook.kind, "Pre-command failed: " + hook.error);
    }

    if (profile.backup_before) {
        std::string backup = profile.target_path + ".backup." + stamp;
        std::string cmd = fmt::format("if [ -e {0} ]; then cp -a {0} {1} && echo {2}; fi",
                                      shell_quote(profile.target_path), shell_quote(backup),
                                      BACKUP_MARKER);
        auto r = remote_.execute_command(server, cmd, deadline);
        if (r.is_err()) {
            fleet_log(fmt::format("sync: backup on {} failed: {}", server, r.error));
        } else if (r.value.success() && r.value.output.find(BACKUP_MARKER) != std::string::npos) {
            result.backup_path = backup;
        } else if (r.value.failed()) {
            fleet_log(fmt::format("sync: backup on {} failed (exit {}): {}", server,
                                  r.value.exit_code, trimmed(r.value.output)));
        }
    }

    auto sent = transfer(profile, plan, server, stamp, deadline);
    if (sent.is_err()) return fail(sent.kind, sent.error);

    const std::string recursive = plan.is_dir ? "-R " : "";
    const std::string target = shell_quote(profile.target_path);
    if (!profile.permissions.empty()) {
        auto chmod = run_hook(server, "chmod " + recursive + shell_quote(profile.permissions) +
                                      " " + target, deadline);
        if (chmod.is_err()) fleet_log(fmt::format("sync: chmod on {}: {}", server, chmod.error));
    }
    if (!profile.owner.empty() || !profile.group.empty()) {
        std::string ownership = profile.owner;
        if (!profile.group.empty()) ownership += ":" + profile.group;
        auto chown = run_hook(server, "chown " + recursive + shell_quote(ownership) + " " + target,
                              deadline);
        if (chown.is_err()) fleet_log(fmt::format("sync: chown on {}: {}", server, chown.error));
    }

    if (profile.validate) {
        auto remote_sum = remote_checksum(profile, plan, server, deadline);
        if (remote_sum.is_err()) return fail(remote_sum.kind, remote_sum.error);
        result.checksum = remote_sum.value;
        if (remote_sum.value != plan.checksum) {
            return fail(ErrorKind::ChecksumMismatch,
                fmt::format("Checksum mismatch on {}: local {}, remote {}", server,
                            plan.checksum, remote_sum.value));
        }
    }

    for (const auto& cmd : profile.post_commands) {
        auto hook = run_hook(server, cmd, deadline);
        if (hook.is_err()) return fail(hook.kind, "Post-command failed: " + hook.error);
    }

    result.success = true;
    result.files_updated = plan.is_dir ? static_cast<int>(plan.files.size()) : 1;
    result.files_skipped = plan.excluded;
    result.bytes_transferred = plan.total_bytes;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    return result;
}

// ── Runs ───────────────────────────────────────────────────

static void tally(SyncEvent& event) {
    event.success_count = 0;
    event.failure_count = 0;
    event.total_files = 0;
    event.total_bytes = 0;
    for (const auto& [server, r] : event.results) {
        if (r.success) {
            event.success_count++;
            event.total_files += r.files_updated;
            event.total_bytes += r.bytes_transferred;
        } else {
            event.failure_count++;
        }
    }
}

Result<SyncEvent> SyncManager::sync_configuration(const std::string& name, Deadline deadline) {
    auto profile = get_sync_profile(name);
    if (profile.is_err()) return Result<SyncEvent>::Err(profile);

    auto start = Clock::now();
    SyncEvent event;
    event.profile_name = name;
    event.event_type = "sync";
    event.timestamp = std::chrono::system_clock::now();
    event.servers = profile.value.servers;

    auto finish = [&]() {
        event.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        record_event(event);
    };

    auto planned = plan_source(profile.value);
    if (planned.is_err()) {
        event.error = planned.error;
        finish();
        return Result<SyncEvent>::Err(planned);
    }
    SourcePlan plan = planned.value;
    event.source_checksum = plan.checksum;

    if (plan.is_dir) {
        plan.archive = platform::temp_file("fleet_sync");
        try {
            platform::create_tar(plan.archive, profile.value.source_path, plan.files);
        } catch (const std::runtime_error& e) {
            std::error_code ec;
            fs::remove(plan.archive, ec);
            event.error = std::string("Cannot build archive: ") + e.what();
            finish();
            return Result<SyncEvent>::Err(ErrorKind::Io, event.error);
        }
    }

    const std::string stamp = file_timestamp(event.timestamp);
    event.results = fan_out<SyncResult>(event.servers, [&](const std::string& server) {
        return sync_to_server(profile.value, plan, server, stamp, deadline);
    });

    if (plan.is_dir) {
        std::error_code ec;
        fs::remove(plan.archive, ec);
    }

    tally(event);
    finish();
    fleet_log(fmt::format("sync: {} done: {} ok, {} failed, {} files, {} bytes in {}ms", name,
                          event.success_count, event.failure_count, event.total_files,
                          event.total_bytes, event.duration.count()));
    return Result<SyncEvent>::Ok(event);
}

Result<SyncEvent> SyncManager::dry_run(const std::string& name) {
    auto profile = get_sync_profile(name);
    if (profile.is_err()) return Result<SyncEvent>::Err(profile);

    auto start = Clock::now();
    SyncEvent event;
    event.profile_name = name;
    event.event_type = "dry_run";
    event.timestamp = std::chrono::system_clock::now();
    event.servers = profile.value.servers;

    auto planned = plan_source(profile.value);
    if (planned.is_err()) {
        event.error = planned.error;
    } else {
        const SourcePlan& plan = planned.value;
        event.source_checksum = plan.checksum;
        for (const auto& server : event.servers) {
            SyncResult r;
            r.server_name = server;
            if (remote_.has_server(server)) {
                r.success = true;
                r.files_updated = plan.is_dir ? static_cast<int>(plan.files.size()) : 1;
                r.files_skipped = plan.excluded;
                r.bytes_transferred = plan.total_bytes;
                r.checksum = plan.checksum;
            } else {
                r.error = "Unknown server: " + server;
                r.error_kind = ErrorKind::NotFound;
            }
            event.results[server] = r;
        }
        tally(event);
    }

    event.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    record_event(event);
    if (planned.is_err()) return Result<SyncEvent>::Err(planned);
    return Result<SyncEvent>::Ok(event);
}

// ── History ────────────────────────────────────────────────

void SyncManager::record_event(const SyncEvent& event) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    history_.push_back(event);
    while (history_.size() > static_cast<size_t>(settings_.history_cap)) {
        history_.pop_front();
    }
}

std::vector<SyncEvent> SyncManager::get_sync_history() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::vector<SyncEvent>(history_.begin(), history_.end());
}

SyncStats SyncManager::get_sync_stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    SyncStats stats;
    stats.total_profiles = static_cast<int>(profiles_.size());
    stats.total_events = static_cast<int>(history_.size());
    stats.history_capacity = settings_.history_cap;

    for (const auto& event : history_) {
        if (event.event_type != "sync") continue;
        if (event.failure_count == 0 && event.error.empty()) {
            stats.successful_syncs++;
        } else {
            stats.failed_syncs++;
        }
    }

    std::set<std::string> servers;
    for (const auto& [name, profile] : profiles_) {
        servers.insert(profile.servers.begin(), profile.servers.end());
    }
    stats.total_servers = static_cast<int>(servers.size());
    return stats;
}
