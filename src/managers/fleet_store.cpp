#include "fleet_store.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

FleetStore::FleetStore(fs::path root)
    : root_(std::move(root)) {}

// ── Encoding ───────────────────────────────────────────────

static int64_t to_epoch(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

static Timestamp from_epoch(int64_t secs) {
    return Timestamp(std::chrono::seconds(secs));
}

// Flow maps and double-quoted strings make the emitter's output valid JSON.
static void begin_json(YAML::Emitter& out) {
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetBoolFormat(YAML::TrueFalseBool);
}

static std::string encode_server(const ServerConfig& s) {
    YAML::Emitter out;
    begin_json(out);
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << s.name;
    out << YAML::Key << "host" << YAML::Value << s.host;
    out << YAML::Key << "port" << YAML::Value << s.port;
    out << YAML::Key << "username" << YAML::Value << s.username;
    out << YAML::Key << "password" << YAML::Value << s.password;
    out << YAML::Key << "key_path" << YAML::Value << s.key_path;
    out << YAML::Key << "tags" << YAML::Value << s.tags;
    out << YAML::Key << "timeout_secs" << YAML::Value << s.timeout_secs;
    out << YAML::EndMap;
    return out.c_str();
}

static ServerConfig decode_server(const YAML::Node& n) {
    ServerConfig s;
    s.name = n["name"].as<std::string>("");
    s.host = n["host"].as<std::string>("");
    s.port = n["port"].as<int>(22);
    s.username = n["username"].as<std::string>("");
    s.password = n["password"].as<std::string>("");
    s.key_path = n["key_path"].as<std::string>("");
    if (n["tags"]) s.tags = n["tags"].as<std::vector<std::string>>();
    s.timeout_secs = n["timeout_secs"].as<int>(0);
    return s;
}

static std::string encode_cluster(const Cluster& c) {
    YAML::Emitter out;
    begin_json(out);
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << c.name;
    out << YAML::Key << "description" << YAML::Value << c.description;
    out << YAML::Key << "servers" << YAML::Value << c.servers;
    out << YAML::Key << "tags" << YAML::Value << c.tags;
    out << YAML::Key << "created_at" << YAML::Value << to_epoch(c.created_at);
    out << YAML::Key << "updated_at" << YAML::Value << to_epoch(c.updated_at);
    out << YAML::EndMap;
    return out.c_str();
}

static Cluster decode_cluster(const YAML::Node& n) {
    Cluster c;
    c.name = n["name"].as<std::string>("");
    c.description = n["description"].as<std::string>("");
    if (n["servers"]) c.servers = n["servers"].as<std::vector<std::string>>();
    if (n["tags"]) c.tags = n["tags"].as<std::map<std::string, std::string>>();
    c.created_at = from_epoch(n["created_at"].as<int64_t>(0));
    c.updated_at = from_epoch(n["updated_at"].as<int64_t>(0));
    return c;
}

static std::string encode_profile(const SyncProfile& p) {
    YAML::Emitter out;
    begin_json(out);
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << p.name;
    out << YAML::Key << "description" << YAML::Value << p.description;
    out << YAML::Key << "source_path" << YAML::Value << p.source_path;
    out << YAML::Key << "target_path" << YAML::Value << p.target_path;
    out << YAML::Key << "servers" << YAML::Value << p.servers;
    out << YAML::Key << "excludes" << YAML::Value << p.excludes;
    out << YAML::Key << "pre_commands" << YAML::Value << p.pre_commands;
    out << YAML::Key << "post_commands" << YAML::Value << p.post_commands;
    out << YAML::Key << "backup_before" << YAML::Value << p.backup_before;
    out << YAML::Key << "validate" << YAML::Value << p.validate;
    out << YAML::Key << "permissions" << YAML::Value << p.permissions;
    out << YAML::Key << "owner" << YAML::Value << p.owner;
    out << YAML::Key << "group" << YAML::Value << p.group;
    out << YAML::Key << "tags" << YAML::Value << p.tags;
    out << YAML::Key << "created_at" << YAML::Value << to_epoch(p.created_at);
    out << YAML::Key << "updated_at" << YAML::Value << to_epoch(p.updated_at);
    out << YAML::EndMap;
    return out.c_str();
}

static std::vector<std::string> string_list(const YAML::Node& n) {
    if (!n || !n.IsSequence()) return {};
    return n.as<std::vector<std::string>>();
}

static SyncProfile decode_profile(const YAML::Node& n) {
    SyncProfile p;
    p.name = n["name"].as<std::string>("");
    p.description = n["description"].as<std::string>("");
    p.source_path = n["source_path"].as<std::string>("");
    p.target_path = n["target_path"].as<std::string>("");
    p.servers = string_list(n["servers"]);
    p.excludes = string_list(n["excludes"]);
    p.pre_commands = string_list(n["pre_commands"]);
    p.post_commands = string_list(n["post_commands"]);
    p.backup_before = n["backup_before"].as<bool>(false);
    p.validate = n["validate"].as<bool>(true);
    p.permissions = n["permissions"].as<std::string>("");
    p.owner = n["owner"].as<std::string>("");
    p.group = n["group"].as<std::string>("");
    if (n["tags"]) p.tags = n["tags"].as<std::map<std::string, std::string>>();
    p.created_at = from_epoch(n["created_at"].as<int64_t>(0));
    p.updated_at = from_epoch(n["updated_at"].as<int64_t>(0));
    return p;
}

static std::string encode_task(const MonitoringTask& t) {
    YAML::Emitter out;
    begin_json(out);
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << t.name;
    out << YAML::Key << "description" << YAML::Value << t.description;
    out << YAML::Key << "servers" << YAML::Value << t.servers;
    out << YAML::Key << "checks" << YAML::Value << YAML::BeginSeq;
    for (const auto& c : t.checks) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << c.name;
        out << YAML::Key << "command" << YAML::Value << c.command;
        out << YAML::Key << "expected_exit" << YAML::Value << c.expected_exit;
        out << YAML::Key << "expected_output" << YAML::Value << c.expected_output;
        out << YAML::Key << "timeout_secs" << YAML::Value << static_cast<int64_t>(c.timeout.count());
        out << YAML::Key << "critical" << YAML::Value << c.critical;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "interval_secs" << YAML::Value << static_cast<int64_t>(t.interval.count());
    out << YAML::Key << "timeout_secs" << YAML::Value << static_cast<int64_t>(t.timeout.count());
    out << YAML::Key << "enabled" << YAML::Value << t.enabled;
    out << YAML::Key << "tags" << YAML::Value << t.tags;
    out << YAML::EndMap;
    return out.c_str();
}

static MonitoringTask decode_task(const YAML::Node& n) {
    MonitoringTask t;
    t.name = n["name"].as<std::string>("");
    t.description = n["description"].as<std::string>("");
    t.servers = string_list(n["servers"]);
    if (n["checks"] && n["checks"].IsSequence()) {
        for (const auto& c : n["checks"]) {
            HealthCheck check;
            check.name = c["name"].as<std::string>("");
            check.command = c["command"].as<std::string>("");
            check.expected_exit = c["expected_exit"].as<int>(0);
            check.expected_output = c["expected_output"].as<std::string>("");
            check.timeout = std::chrono::seconds(c["timeout_secs"].as<int64_t>(DEFAULT_CHECK_TIMEOUT_SECS));
            check.critical = c["critical"].as<bool>(false);
            t.checks.push_back(check);
        }
    }
    t.interval = std::chrono::seconds(n["interval_secs"].as<int64_t>(DEFAULT_TASK_INTERVAL_SECS));
    t.timeout = std::chrono::seconds(n["timeout_secs"].as<int64_t>(DEFAULT_TASK_TIMEOUT_SECS));
    t.enabled = n["enabled"].as<bool>(true);
    if (n["tags"]) t.tags = n["tags"].as<std::map<std::string, std::string>>();
    return t;
}

// ── Files ──────────────────────────────────────────────────

Result<fs::path> FleetStore::document_path(const std::string& kind, const std::string& name) const {
    if (name.empty() || name == "." || name == ".." ||
        name.find_first_of("/\\") != std::string::npos) {
        return Result<fs::path>::Err(ErrorKind::Validation,
            fmt::format("Cannot store {} named '{}'", kind, name));
    }
    return Result<fs::path>::Ok(root_ / kind / (name + ".json"));
}

Result<void> FleetStore::write_document(const std::string& kind, const std::string& name,
                                        const std::string& text, bool secret) {
    auto path = document_path(kind, name);
    if (path.is_err()) return Result<void>::Err(path);

    std::error_code ec;
    fs::create_directories(path.value.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Io,
            "Cannot create " + path.value.parent_path().string() + ": " + ec.message());
    }

    fs::path tmp = path.value;
    tmp += ".tmp";
    {
        std::ofstream fout;
        bool opened;
        if (secret) {
            // Server documents hold credentials
            opened = platform::open_owner_only(tmp, fout);
        } else {
            fout.open(tmp, std::ios::binary | std::ios::trunc);
            opened = fout.is_open();
        }
        if (!opened) {
            return Result<void>::Err(ErrorKind::Io, "Cannot write " + tmp.string());
        }
        fout << text << "\n";
        if (!fout.flush()) {
            fout.close();
            fs::remove(tmp, ec);
            return Result<void>::Err(ErrorKind::Io, "Cannot write " + tmp.string());
        }
    }

    fs::rename(tmp, path.value, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return Result<void>::Err(ErrorKind::Io,
            "Cannot replace " + path.value.string() + ": " + ec.message());
    }
    return Result<void>::Ok();
}

Result<void> FleetStore::remove_document(const std::string& kind, const std::string& name) {
    auto path = document_path(kind, name);
    if (path.is_err()) return Result<void>::Err(path);

    std::error_code ec;
    bool removed = fs::remove(path.value, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Io,
            "Cannot remove " + path.value.string() + ": " + ec.message());
    }
    if (!removed) {
        return Result<void>::Err(ErrorKind::NotFound, fmt::format("No stored {} '{}'", kind, name));
    }
    return Result<void>::Ok();
}

template <typename T, typename Decode>
Result<std::vector<T>> FleetStore::read_documents(const std::string& kind, Decode decode) const {
    std::vector<T> items;
    fs::path dir = root_ / kind;

    std::error_code ec;
    if (!fs::exists(dir, ec)) return Result<std::vector<T>>::Ok(items);

    std::vector<fs::path> files;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".json" && it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return Result<std::vector<T>>::Err(ErrorKind::Io,
            "Cannot read " + dir.string() + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        try {
            YAML::Node root = YAML::LoadFile(file.string());
            if (!root.IsMap()) {
                fleet_log("store: skipping " + file.string() + ": not an object");
                continue;
            }
            items.push_back(decode(root));
        } catch (const YAML::Exception& e) {
            fleet_log("store: skipping " + file.string() + ": " + e.what());
        }
    }
    return Result<std::vector<T>>::Ok(items);
}

// ── Servers ────────────────────────────────────────────────

Result<void> FleetStore::save_server(const ServerConfig& server) {
    return write_document("servers", server.name, encode_server(server), true);
}

Result<void> FleetStore::remove_server(const std::string& name) {
    return remove_document("servers", name);
}

Result<std::vector<ServerConfig>> FleetStore::load_servers() const {
    return read_documents<ServerConfig>("servers", decode_server);
}

// ── Clusters ───────────────────────────────────────────────

Result<void> FleetStore::save_cluster(const Cluster& cluster) {
    return write_document("clusters", cluster.name, encode_cluster(cluster));
}

Result<void> FleetStore::remove_cluster(const std::string& name) {
    return remove_document("clusters", name);
}

Result<std::vector<Cluster>> FleetStore::load_clusters() const {
    return read_documents<Cluster>("clusters", decode_cluster);
}

// ── Sync profiles ──────────────────────────────────────────

Result<void> FleetStore::save_profile(const SyncProfile& profile) {
    return write_document("profiles", profile.name, encode_profile(profile));
}

Result<void> FleetStore::remove_profile(const std::string& name) {
    return remove_document("profiles", name);
}

Result<std::vector<SyncProfile>> FleetStore::load_profiles() const {
    return read_documents<SyncProfile>("profiles", decode_profile);
}

// ── Monitoring tasks ───────────────────────────────────────

Result<void> FleetStore::save_task(const MonitoringTask& task) {
    return write_document("tasks", task.name, encode_task(task));
}

Result<void> FleetStore::remove_task(const std::string& name) {
    return remove_document("tasks", name);
}

Result<std::vector<MonitoringTask>> FleetStore::load_tasks() const {
    return read_documents<MonitoringTask>("tasks", decode_task);
}
