#pragma once

#include <atomic>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "remote_manager.hpp"

enum class AlertLevel { Info, Warning, Critical };

inline const char* alert_level_name(AlertLevel level) {
    switch (level) {
        case AlertLevel::Warning:  return "warning";
        case AlertLevel::Critical: return "critical";
        default:                   return "info";
    }
}

struct HealthCheck {
    std::string name;
    std::string command;
    int expected_exit = 0;
    std::string expected_output;          // substring; empty = not checked
    std::chrono::seconds timeout{DEFAULT_CHECK_TIMEOUT_SECS};
    bool critical = false;
};

struct MonitoringTask {
    std::string name;
    std::string description;
    std::vector<std::string> servers;
    std::vector<HealthCheck> checks;
    std::chrono::seconds interval{DEFAULT_TASK_INTERVAL_SECS};
    std::chrono::seconds timeout{DEFAULT_TASK_TIMEOUT_SECS};
    bool enabled = true;
    std::map<std::string, std::string> tags;

    // Runtime state, owned by the monitor
    Timestamp created_at{};
    Timestamp last_run{};
    Timestamp next_run{};
    bool running = false;
};

struct MonitoringAlert {
    std::string id;
    AlertLevel level = AlertLevel::Info;
    std::string server_name;
    std::string check_name;
    std::string message;
    Timestamp timestamp{};
    bool resolved = false;
    Timestamp resolved_at{};
    std::map<std::string, std::string> metadata;
};

// Periodic health checks and metric collection across servers.
//
// A scheduler thread calls tick() every settings.tick_seconds. Each due task
// runs on its own worker thread and fans out to its servers. A task is never
// run twice at once: the running flag is set at dispatch and cleared when the
// run finishes, and next_run is pushed forward at dispatch.
class ClusterMonitor {
public:
    explicit ClusterMonitor(RemoteManager& remote, MonitorSettings settings = {});
    ~ClusterMonitor();

    ClusterMonitor(const ClusterMonitor&) = delete;
    ClusterMonitor& operator=(const ClusterMonitor&) = delete;

    // ── Tasks ──────────────────────────────────────────────
    Result<void> create_task(const MonitoringTask& task);
    Result<void> update_task(const std::string& name, const MonitoringTask& task);
    Result<void> delete_task(const std::string& name);
    Result<MonitoringTask> get_task(const std::string& name) const;
    std::vector<MonitoringTask> list_tasks() const;
    Result<void> set_task_enabled(const std::string& name, bool enabled);

    // ── Scheduling ─────────────────────────────────────────
    Result<void> start_monitoring();
    Result<void> stop_monitoring();    // joins in-flight runs
    bool is_running() const { return running_.load(); }

    // One scheduler pass: dispatch every enabled, idle task whose next_run <= now.
    // Returns the number of tasks dispatched.
    int tick(Timestamp now);

    // Run one task now, on the calling thread. State error if it is already running.
    Result<void> run_task(const std::string& name);

    // Block until every dispatched run has finished.
    void wait_idle();

    // ── Results ────────────────────────────────────────────
    std::vector<MonitoringAlert> get_alerts(bool resolved) const;
    Result<void> resolve_alert(const std::string& id);
    std::map<std::string, ServerMetrics> get_server_metrics() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    static Result<void> validate_task(const MonitoringTask& task);

    // Mark the task running and advance its schedule. Returns the definition to run.
    Result<MonitoringTask> claim(const std::string& name, Timestamp now, bool scheduled);
    void release(const std::string& name);

    void execute_task(const MonitoringTask& task);
    void check_server(const MonitoringTask& task, const std::string& server, Deadline deadline);
    void run_health_check(const MonitoringTask& task, const std::string& server,
                          const HealthCheck& check, Deadline deadline, ServerMetrics& metrics);

    void raise_alert(AlertLevel level, const std::string& server, const std::string& check,
                     const std::string& message, std::map<std::string, std::string> metadata);
    void store_metrics(const ServerMetrics& metrics);

    void scheduler_loop();
    void reap_workers();

    RemoteManager& remote_;
    MonitorSettings settings_;

    mutable std::shared_mutex tasks_mutex_;
    std::map<std::string, MonitoringTask> tasks_;

    mutable std::shared_mutex alerts_mutex_;
    std::deque<MonitoringAlert> alerts_;
    uint64_t alert_seq_ = 0;

    mutable std::shared_mutex metrics_mutex_;
    std::map<std::string, ServerMetrics> metrics_;

    std::mutex workers_mutex_;
    std::list<Worker> workers_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::thread scheduler_;
};
