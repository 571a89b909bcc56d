#include "log.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / "fleet_debug.log").string();
    return path;
}

} // namespace

void set_fleet_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_storage() = path;
}

void fleet_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    const auto& path = log_path_storage();
    if (path.empty()) return;

    std::ofstream out(path, std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

void fleet_log_remote(const std::string& label, const RemoteResult& r) {
    fleet_log(fmt::format("{} CMD: {}", label, r.command));
    fleet_log(fmt::format("{} exit={} {}ms output({})={}", label, r.exit_code,
                          r.duration.count(), r.output.size(), r.output.substr(0, 500)));
    if (!r.error.empty())
        fleet_log(fmt::format("{} error={}", label, r.error.substr(0, 500)));
}
