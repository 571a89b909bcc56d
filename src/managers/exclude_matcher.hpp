#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>
#include <regex>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Files under a directory after exclusion, relative and sorted by generic path.
struct FileSet {
    std::vector<std::string> files;
    int excluded = 0;
    uintmax_t total_bytes = 0;
};

// gitignore-style exclusion for directory sync.
//
//   *.log      any path component matching the glob
//   cache/     any directory named cache (and everything below it)
//   conf/*.bak anchored at the sync root because it contains a '/'
//   !keep.log  re-include; the last matching pattern wins
class ExcludeMatcher {
public:
    explicit ExcludeMatcher(const std::vector<std::string>& patterns);

    // rel_path uses '/' separators and is relative to the sync root.
    bool is_excluded(const std::string& rel_path) const;

    // Walk root recursively and split regular files into kept and excluded.
    Result<FileSet> collect(const fs::path& root) const;

private:
    struct Rule {
        std::regex re;
        bool negate = false;
        bool dir_only = false;
        bool anchored = false;
    };

    std::vector<Rule> rules_;

    static std::string glob_to_regex(const std::string& glob);
    bool rule_matches(const Rule& rule, const std::vector<std::string>& parts) const;
};
