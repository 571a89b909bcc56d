#include "exclude_matcher.hpp"
#include <core/utils.hpp>
#include <algorithm>
#include <sstream>

ExcludeMatcher::ExcludeMatcher(const std::vector<std::string>& patterns) {
    for (auto pattern : patterns) {
        trim(pattern);
        if (pattern.empty() || pattern[0] == '#') continue;

        Rule rule;
        if (pattern[0] == '!') {
            rule.negate = true;
            pattern.erase(0, 1);
        }
        if (!pattern.empty() && pattern.back() == '/') {
            rule.dir_only = true;
            pattern.pop_back();
        }
        if (!pattern.empty() && pattern[0] == '/') {
            rule.anchored = true;
            pattern.erase(0, 1);
        }
        if (pattern.empty()) continue;
        if (pattern.find('/') != std::string::npos) rule.anchored = true;

        try {
            rule.re = std::regex(glob_to_regex(pattern));
        } catch (const std::regex_error&) {
            // Unbalanced brackets and the like: fall back to a literal match
            std::string literal;
            for (char c : pattern) {
                if (std::string("\\^$.|?*+()[]{}").find(c) != std::string::npos) literal += '\\';
                literal += c;
            }
            rule.re = std::regex(literal);
        }
        rules_.push_back(std::move(rule));
    }
}

std::string ExcludeMatcher::glob_to_regex(const std::string& glob) {
    std::string regex;
    bool escape = false;

    for (size_t i = 0; i < glob.length(); ++i) {
        char c = glob[i];

        if (escape) {
            regex += '\\';
            regex += c;
            escape = false;
        } else if (c == '\\') {
            escape = true;
        } else if (c == '*') {
            // ** crosses directory boundaries
            if (i + 1 < glob.length() && glob[i + 1] == '*') {
                regex += ".*";
                i++;
                if (i + 1 < glob.length() && glob[i + 1] == '/') {
                    regex += "/?";
                    i++;
                }
            } else {
                regex += "[^/]*";
            }
        } else if (c == '?') {
            regex += "[^/]";
        } else if (c == '[' || c == ']') {
            regex += c;
        } else if (std::string(".^$|+(){}").find(c) != std::string::npos) {
            regex += '\\';
            regex += c;
        } else {
            regex += c;
        }
    }

    return regex;
}

static std::vector<std::string> split_path(const std::string& rel_path) {
    std::vector<std::string> parts;
    std::stringstream ss(rel_path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty() && part != ".") parts.push_back(part);
    }
    return parts;
}

bool ExcludeMatcher::rule_matches(const Rule& rule, const std::vector<std::string>& parts) const {
    // Directory rules never match the final component, which is the file itself
    size_t limit = rule.dir_only ? parts.size() - 1 : parts.size();

    if (rule.anchored) {
        std::string prefix;
        for (size_t i = 0; i < limit; i++) {
            if (i) prefix += '/';
            prefix += parts[i];
            if (std::regex_match(prefix, rule.re)) return true;
        }
        return false;
    }

    for (size_t i = 0; i < limit; i++) {
        if (std::regex_match(parts[i], rule.re)) return true;
    }
    return false;
}

bool ExcludeMatcher::is_excluded(const std::string& rel_path) const {
    std::string normalized = rel_path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    auto parts = split_path(normalized);
    if (parts.empty()) return false;

    // Process patterns in order (later patterns override earlier ones)
    bool excluded = false;
    for (const auto& rule : rules_) {
        if (rule_matches(rule, parts)) excluded = !rule.negate;
    }
    return excluded;
}

Result<FileSet> ExcludeMatcher::collect(const fs::path& root) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Result<FileSet>::Err(ErrorKind::Io, "Not a directory: " + root.string());
    }

    FileSet set;
    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) {
        return Result<FileSet>::Err(ErrorKind::Io,
            "Cannot read " + root.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return Result<FileSet>::Err(ErrorKind::Io,
                "Cannot read " + root.string() + ": " + ec.message());
        }
        if (!it->is_regular_file(ec)) continue;

        std::string rel = it->path().lexically_relative(root).generic_string();
        if (is_excluded(rel)) {
            set.excluded++;
            continue;
        }

        auto size = it->file_size(ec);
        if (ec) {
            return Result<FileSet>::Err(ErrorKind::Io,
                "Cannot stat " + it->path().string() + ": " + ec.message());
        }
        set.total_bytes += size;
        set.files.push_back(rel);
    }
    if (ec) {
        return Result<FileSet>::Err(ErrorKind::Io,
            "Cannot read " + root.string() + ": " + ec.message());
    }

    // Sort for consistent ordering
    std::sort(set.files.begin(), set.files.end());
    return Result<FileSet>::Ok(set);
}
