#include "metrics.hpp"
#include "remote_manager.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>

// Whole-token number parse. Rejects trailing junk, nan and inf.
static std::optional<double> parse_double(const std::string& token) {
    std::string s = trimmed(token);
    if (s.empty()) return std::nullopt;

    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

static std::vector<std::string> fields_of(const std::string& output) {
    std::istringstream in(output);
    std::vector<std::string> fields;
    std::string f;
    while (in >> f) fields.push_back(f);
    return fields;
}

std::optional<std::vector<double>> parse_load_average(const std::string& output) {
    auto fields = fields_of(output);
    if (fields.size() < 3) return std::nullopt;

    std::vector<double> load;
    for (int i = 0; i < 3; i++) {
        auto v = parse_double(fields[i]);
        if (!v || *v < 0) return std::nullopt;
        load.push_back(*v);
    }
    return load;
}

std::optional<std::chrono::seconds> parse_uptime(const std::string& output) {
    auto fields = fields_of(output);
    if (fields.empty()) return std::nullopt;

    auto v = parse_double(fields[0]);
    if (!v || *v <= 0) return std::nullopt;
    return std::chrono::seconds(static_cast<long long>(*v));
}

std::optional<double> parse_percentage(const std::string& output) {
    std::string s = trimmed(output);
    if (!s.empty() && s.back() == '%') s.pop_back();

    auto v = parse_double(s);
    if (!v || *v < 0 || *v > 100) return std::nullopt;
    return v;
}

std::optional<double> parse_cpu_usage(const std::string& idle_output) {
    auto idle = parse_percentage(idle_output);
    if (!idle) return std::nullopt;
    return 100.0 - *idle;
}

std::optional<int> parse_count(const std::string& output) {
    std::string s = trimmed(output);
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    int v = safe_stoi(s, -1);
    if (v < 0) return std::nullopt;
    return v;
}

int parse_custom_metrics(const std::string& output, ServerMetrics& metrics) {
    const size_t marker_len = std::strlen(METRIC_MARKER);
    int merged = 0;

    for (const auto& raw : split_lines(output)) {
        std::string line = trimmed(raw);
        if (line.compare(0, marker_len, METRIC_MARKER) != 0) continue;

        auto eq = line.find('=', marker_len);
        if (eq == std::string::npos) continue;

        std::string key = trimmed(line.substr(marker_len, eq - marker_len));
        std::string value = trimmed(line.substr(eq + 1));
        if (key.empty()) continue;

        // A key moves between the two maps if its value changes type
        if (auto num = parse_double(value)) {
            metrics.custom_metrics[key] = *num;
            metrics.custom_labels.erase(key);
        } else {
            metrics.custom_labels[key] = value;
            metrics.custom_metrics.erase(key);
        }
        merged++;
    }
    return merged;
}

void collect_system_metrics(RemoteManager& remote, const std::string& server,
                            Deadline deadline, ServerMetrics& metrics) {
    auto run = [&](const char* command) -> std::optional<std::string> {
        auto r = remote.execute_command(server, command, deadline);
        if (r.is_err() || !r.value.success()) return std::nullopt;
        return r.value.output;
    };

    if (auto out = run(LOADAVG_COMMAND)) {
        if (auto v = parse_load_average(*out)) metrics.load_average = *v;
    }
    if (auto out = run(CPU_IDLE_COMMAND)) {
        if (auto v = parse_cpu_usage(*out)) metrics.cpu_usage = *v;
    }
    if (auto out = run(MEMORY_COMMAND)) {
        if (auto v = parse_percentage(*out)) metrics.memory_usage = *v;
    }
    if (auto out = run(DISK_COMMAND)) {
        if (auto v = parse_percentage(*out)) metrics.disk_usage = *v;
    }
    if (auto out = run(PROCESS_COMMAND)) {
        if (auto v = parse_count(*out)) metrics.process_count = *v;
    }
    if (auto out = run(UPTIME_COMMAND)) {
        if (auto v = parse_uptime(*out)) metrics.uptime = *v;
    }
}
