#include "cluster_monitor.hpp"
#include "metrics.hpp"
#include <core/fan_out.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

// ── Construction / Destruction ──────────────────────────────

ClusterMonitor::ClusterMonitor(RemoteManager& remote, MonitorSettings settings)
    : remote_(remote), settings_(settings) {
    if (settings_.tick_seconds <= 0) settings_.tick_seconds = MONITOR_TICK_SECS;
    if (settings_.alert_cap <= 0) settings_.alert_cap = MAX_ALERTS;
}

ClusterMonitor::~ClusterMonitor() {
    if (running_) {
        auto stopped = stop_monitoring();
        if (stopped.is_err()) fleet_log("monitor: " + stopped.error);
    }
    wait_idle();
}

// ── Tasks ───────────────────────────────────────────────────

Result<void> ClusterMonitor::validate_task(const MonitoringTask& task) {
    if (task.name.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "Task name cannot be empty");
    }
    if (task.servers.empty()) {
        return Result<void>::Err(ErrorKind::Validation,
            "Task '" + task.name + "' must have at least one server");
    }
    if (task.checks.empty()) {
        return Result<void>::Err(ErrorKind::Validation,
            "Task '" + task.name + "' must have at least one health check");
    }
    if (task.interval.count() <= 0 || task.timeout.count() <= 0) {
        return Result<void>::Err(ErrorKind::Validation,
            "Task '" + task.name + "' interval and timeout must be positive");
    }
    for (const auto& check : task.checks) {
        if (check.name.empty() || check.command.empty()) {
            return Result<void>::Err(ErrorKind::Validation,
                "Health checks in '" + task.name + "' need a name and a command");
        }
        if (check.timeout.count() <= 0) {
            return Result<void>::Err(ErrorKind::Validation,
                "Health check '" + check.name + "' timeout must be positive");
        }
    }
    return Result<void>::Ok();
}

Result<void> ClusterMonitor::create_task(const MonitoringTask& task) {
    auto valid = validate_task(task);
    if (valid.is_err()) return valid;

    std::unique_lock<std::shared_mutex> lock(tasks_mutex_);
    if (tasks_.count(task.name)) {
        return Result<void>::Err(ErrorKind::Validation,
            "Monitoring task '" + task.name + "' already exists");
    }

    MonitoringTask t = task;
    t.created_at = std::chrono::system_clock::now();
    t.last_run = Timestamp{};
    t.next_run = t.created_at;     // due on the next tick
    t.running = false;
    tasks_.emplace(t.name, std::move(t));

    fleet_log(fmt::format("monitor: task {} created ({} servers, {} checks)",
                          task.name, task.servers.size(), task.checks.size()));
    return Result<void>::Ok();
}

Result<void> ClusterMonitor::update_task(const std::string& name, const MonitoringTask& task) {
    if (task.name != name) {
        return Result<void>::Err(ErrorKind::Validation, "Task name cannot be changed");
    }
    auto valid = validate_task(task);
    if (valid.is_err()) return valid;

    std::unique_lock<std::shared_mutex> lock(tasks_mutex_);
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        return Result<void>::Err(ErrorKind::NotFound, "Monitoring task '" + name + "' not found");
    }

    // Definition changes; schedule and run state stay
    auto& t = it->second;
    t.description = task.description;
    t.servers = task.servers;
    t.checks = task.checks;
    t.interval = task.interval;
    t.timeout = task.timeout;
    t.enabled = task.enabled;
    t.tags = task.tags;
    return Result<void>::Ok();
}

Result<void> ClusterMonitor::delete_task(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(tasks_mutex_);
    if (tasks_.erase(name) == 0) {
        return Result<void>::Err(ErrorKind::NotFound, "Monitoring task '" + name + "' not found");
    }
    fleet_log("monitor: task " + name + " deleted");
    return Result<void>::Ok();
}

Result<MonitoringTask> ClusterMonitor::get_task(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(tasks_mutex_);
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        return Result<MonitoringTask>::Err(ErrorKind::NotFound,
            "Monitoring task '" + name + "' not found");
    }
    return Result<MonitoringTask>::Ok(it->second);
}

std::vector<MonitoringTask> ClusterMonitor::list_tasks() const {
    std::shared_lock<std::shared_mutex> lock(tasks_mutex_);
    std::vector<MonitoringTask> out;
    out.reserve(tasks_.size());
    for (const auto& [name, task] : tasks_) out.push_back(task);
    return out;
}

Result<void> ClusterMonitor::set_task_enabled(const std::string& name, bool enabled) {
    std::unique_lock<std::shared_mutex> lock(tasks_mutex_);
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        return Result<void>::Err(ErrorKind::NotFound, "Monitoring task '" + name + "' not found");
    }
    it->second.enabled = enabled;
    return Result<void>::Ok();
}

// ── Lifecycle ───────────────────────────────────────────────

Result<void> ClusterMonitor::start_monitoring() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) {
        return Result<void>::Err(ErrorKind::State, "Monitoring is already running");
    }

    running_ = true;
    scheduler_ = std::thread(&ClusterMonitor::scheduler_loop, this);
    fleet_log(fmt::format("monitor: started (tick {}s)", settings_.tick_seconds));
    return Result<void>::Ok();
}

Result<void> ClusterMonitor::stop_monitoring() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_) {
        return Result<void>::Err(ErrorKind::State, "Monitoring is not running");
    }

    running_ = false;
    if (scheduler_.joinable()) scheduler_.join();

    // In-flight runs finish on their own deadlines
    wait_idle();
    fleet_log("monitor: stopped");
    return Result<void>::Ok();
}

void ClusterMonitor::scheduler_loop() {
    while (running_) {
        tick(std::chrono::system_clock::now());

        // Sleep in short slices so stop() is responsive
        for (int i = 0; i < settings_.tick_seconds * 10 && running_; i++) {
            platform::sleep_ms(100);
        }
    }
}

// ── Scheduling ──────────────────────────────────────────────

Result<MonitoringTask> ClusterMonitor::claim(const std::string& name, Timestamp now,
                                             bool scheduled) {
    std::unique_lock<std::shared_mutex> lock(tasks_mutex_);
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        return Result<MonitoringTask>::Err(ErrorKind::NotFound,
            "Monitoring task '" + name + "' not found");
    }

    auto& task = it->second;
    if (task.running) {
        return Result<MonitoringTask>::Err(ErrorKind::State,
            "Monitoring task '" + name + "' is already running");
    }
    if (scheduled && (!task.enabled || now < task.next_run)) {
        return Result<MonitoringTask>::Err(ErrorKind::State,
            "Monitoring task '" + name + "' is not due");
    }

    task.running = true;
    task.last_run = now;
    Timestamp projected = now + task.interval;
    task.next_run = std::max(task.next_run, projected);
    return Result<MonitoringTask>::Ok(task);
}

void ClusterMonitor::release(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(tasks_mutex_);
    auto it = tasks_.find(name);
    if (it != tasks_.end()) it->second.running = false;
}

int ClusterMonitor::tick(Timestamp now) {
    reap_workers();

    std::vector<std::string> due;
    {
        std::shared_lock<std::shared_mutex> lock(tasks_mutex_);
        for (const auto& [name, task] : tasks_) {
            if (task.enabled && !task.running && now >= task.next_run) {
                due.push_back(name);
            }
        }
    }

    int dispatched = 0;
    for (const auto& name : due) {
        auto claimed = claim(name, now, true);
        if (claimed.is_err()) continue;   // raced with run_task or delete

        auto done = std::make_shared<std::atomic<bool>>(false);
        MonitoringTask task = std::move(claimed.value);

        std::lock_guard<std::mutex> lock(workers_mutex_);
        Worker w;
        w.done = done;
        w.thread = std::thread([this, task, done]() {
            execute_task(task);
            release(task.name);
            done->store(true);
        });
        workers_.push_back(std::move(w));
        dispatched++;
    }

    if (dispatched > 0) {
        fleet_log(fmt::format("monitor: tick dispatched {} task(s)", dispatched));
    }
    return dispatched;
}

Result<void> ClusterMonitor::run_task(const std::string& name) {
    auto claimed = claim(name, std::chrono::system_clock::now(), false);
    if (claimed.is_err()) return Result<void>::Err(claimed);

    execute_task(claimed.value);
    release(name);
    return Result<void>::Ok();
}

void ClusterMonitor::reap_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void ClusterMonitor::wait_idle() {
    while (true) {
        std::list<Worker> pending;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            pending.swap(workers_);
        }
        if (pending.empty()) return;
        for (auto& w : pending) {
            if (w.thread.joinable()) w.thread.join();
        }
    }
}

// ── Task execution ──────────────────────────────────────────

void ClusterMonitor::execute_task(const MonitoringTask& task) {
    auto start = Clock::now();
    Deadline deadline = start + task.timeout;

    fan_out<bool>(task.servers, [&](const std::string& server) {
        check_server(task, server, deadline);
        return true;
    });

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    fleet_log(fmt::format("monitor: task {} finished in {}ms", task.name, elapsed.count()));
}

void ClusterMonitor::check_server(const MonitoringTask& task, const std::string& server,
                                  Deadline deadline) {
    ServerMetrics metrics;
    {
        std::shared_lock<std::shared_mutex> lock(metrics_mutex_);
        auto it = metrics_.find(server);
        if (it != metrics_.end()) metrics = it->second;
    }
    metrics.server_name = server;

    auto reply = remote_.execute_command(server, PROBE_COMMAND,
        std::min(deadline, deadline_in(std::chrono::seconds(PROBE_TIMEOUT_SECS))));

    bool reachable = reply.is_ok() && reply.value.success() &&
                     reply.value.output.find(PROBE_EXPECTED) != std::string::npos;
    if (!reachable) {
        metrics.status = ServerStatus::Offline;
        metrics.last_update = std::chrono::system_clock::now();
        store_metrics(metrics);

        std::string error = reply.is_err() ? reply.error
                          : reply.value.timed_out ? "connectivity check timed out"
                          : fmt::format("connectivity check exit {}: {}", reply.value.exit_code,
                                        trimmed(reply.value.output));
        raise_alert(AlertLevel::Critical, server, "connectivity", "Server is not responding",
                    {{"task", task.name}, {"error", error}});
        return;
    }

    metrics.status = ServerStatus::Online;
    metrics.response_time = reply.value.duration;

    for (const auto& check : task.checks) {
        run_health_check(task, server, check, deadline, metrics);
    }

    collect_system_metrics(remote_, server, deadline, metrics);

    metrics.last_update = std::chrono::system_clock::now();
    store_metrics(metrics);
}

void ClusterMonitor::run_health_check(const MonitoringTask& task, const std::string& server,
                                      const HealthCheck& check, Deadline deadline,
                                      ServerMetrics& metrics) {
    Deadline check_deadline = std::min(deadline, deadline_in(check.timeout));
    auto r = remote_.execute_command(server, check.command, check_deadline);

    AlertLevel mismatch_level = check.critical ? AlertLevel::Critical : AlertLevel::Warning;

    // Execution errors only alert for critical checks
    if (r.is_err() || r.value.timed_out) {
        if (check.critical) {
            std::string error = r.is_err() ? r.error : "timed out";
            raise_alert(AlertLevel::Critical, server, check.name,
                        "Health check failed: " + error,
                        {{"task", task.name}, {"command", check.command}, {"error", error}});
        }
        return;
    }

    if (r.value.exit_code != check.expected_exit) {
        raise_alert(mismatch_level, server, check.name,
                    fmt::format("Health check exit code mismatch: expected {}, got {}",
                                check.expected_exit, r.value.exit_code),
                    {{"task", task.name},
                     {"command", check.command},
                     {"expected_exit", std::to_string(check.expected_exit)},
                     {"actual_exit", std::to_string(r.value.exit_code)},
                     {"output", r.value.output}});
        return;
    }

    if (!check.expected_output.empty() &&
        r.value.output.find(check.expected_output) == std::string::npos) {
        raise_alert(mismatch_level, server, check.name, "Health check output mismatch",
                    {{"task", task.name},
                     {"command", check.command},
                     {"expected_output", check.expected_output},
                     {"actual_output", r.value.output}});
        return;
    }

    parse_custom_metrics(r.value.output, metrics);
}

// ── Alerts and metrics ──────────────────────────────────────

void ClusterMonitor::raise_alert(AlertLevel level, const std::string& server,
                                 const std::string& check, const std::string& message,
                                 std::map<std::string, std::string> metadata) {
    MonitoringAlert alert;
    alert.level = level;
    alert.server_name = server;
    alert.check_name = check;
    alert.message = message;
    alert.timestamp = std::chrono::system_clock::now();
    alert.metadata = std::move(metadata);

    auto unix_secs = std::chrono::duration_cast<std::chrono::seconds>(
        alert.timestamp.time_since_epoch()).count();

    {
        std::unique_lock<std::shared_mutex> lock(alerts_mutex_);
        alert.id = fmt::format("{}_{}_{}_{}", server, check, unix_secs, ++alert_seq_);
        alerts_.push_back(alert);
        while (alerts_.size() > static_cast<size_t>(settings_.alert_cap)) {
            alerts_.pop_front();
        }
    }

    fleet_log(fmt::format("monitor: ALERT [{}] {}/{}: {}", alert_level_name(level),
                          server, check, message));
}

std::vector<MonitoringAlert> ClusterMonitor::get_alerts(bool resolved) const {
    std::shared_lock<std::shared_mutex> lock(alerts_mutex_);
    std::vector<MonitoringAlert> out;
    for (const auto& a : alerts_) {
        if (a.resolved == resolved) out.push_back(a);
    }
    return out;
}

Result<void> ClusterMonitor::resolve_alert(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(alerts_mutex_);
    for (auto& a : alerts_) {
        if (a.id != id) continue;
        if (!a.resolved) {
            a.resolved = true;
            a.resolved_at = std::chrono::system_clock::now();
        }
        return Result<void>::Ok();
    }
    return Result<void>::Err(ErrorKind::NotFound, "Alert '" + id + "' not found");
}

void ClusterMonitor::store_metrics(const ServerMetrics& metrics) {
    std::unique_lock<std::shared_mutex> lock(metrics_mutex_);
    metrics_[metrics.server_name] = metrics;
}

std::map<std::string, ServerMetrics> ClusterMonitor::get_server_metrics() const {
    std::shared_lock<std::shared_mutex> lock(metrics_mutex_);
    return metrics_;
}
