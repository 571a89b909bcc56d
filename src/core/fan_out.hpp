#pragma once

#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Run fn(target) for every target on its own thread, join all of them, and
// return the results keyed by target. No worker outlives the call.
//
// Duplicate targets run once. fn must not throw; failures belong in R.
template <typename R, typename Fn>
std::map<std::string, R> fan_out(const std::vector<std::string>& targets, Fn fn) {
    std::map<std::string, R> results;
    std::mutex results_mutex;
    std::vector<std::thread> workers;
    workers.reserve(targets.size());

    std::vector<std::string> unique;
    for (const auto& t : targets) {
        bool seen = false;
        for (const auto& u : unique) {
            if (u == t) { seen = true; break; }
        }
        if (!seen) unique.push_back(t);
    }

    for (const auto& target : unique) {
        workers.emplace_back([&results, &results_mutex, &fn, target]() {
            R r = fn(target);
            std::lock_guard<std::mutex> lock(results_mutex);
            results[target] = std::move(r);
        });
    }

    for (auto& w : workers) {
        if (w.joinable()) w.join();
    }
    return results;
}
