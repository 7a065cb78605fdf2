#include "entity_store.hpp"
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>

// ── Transaction ───────────────────────────────────────────

template <>
std::vector<Credential> Transaction::all<Credential>() const {
    std::vector<Credential> rows;
    rows.reserve(credentials_.size());
    for (const auto& [id, c] : credentials_) rows.push_back(c);
    return rows;
}

template <>
std::vector<Port> Transaction::all<Port>() const {
    std::vector<Port> rows;
    rows.reserve(ports_.size());
    for (const auto& [id, p] : ports_) rows.push_back(p);
    return rows;
}

Credential& Transaction::credential(EntityId id) {
    auto it = credentials_.find(id);
    if (it == credentials_.end()) {
        throw EntityVanishedError(fmt::format("Credential {} not found", id));
    }
    touched_credentials_.emplace(id, it->second.version);
    return it->second;
}

Port& Transaction::port(EntityId id) {
    auto it = ports_.find(id);
    if (it == ports_.end()) {
        throw EntityVanishedError(fmt::format("Port {} not found", id));
    }
    touched_ports_.emplace(id, it->second.version);
    return it->second;
}

template <>
Credential& Transaction::get<Credential>(EntityId id) {
    return credential(id);
}

template <>
Port& Transaction::get<Port>(EntityId id) {
    return port(id);
}

// ── EntityStore ───────────────────────────────────────────

EntityStore::EntityStore(fs::path path)
    : path_(std::move(path)) {}

EntityId EntityStore::add_credential(Credential credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    credential.id = next_id_++;
    credential.version = 1;
    EntityId id = credential.id;
    credentials_.emplace(id, std::move(credential));
    dirty_ = true;
    return id;
}

EntityId EntityStore::add_port(int port_number) {
    std::lock_guard<std::mutex> lock(mutex_);
    Port port;
    port.id = next_id_++;
    port.version = 1;
    port.port_number = port_number;
    EntityId id = port.id;
    ports_.emplace(id, std::move(port));
    dirty_ = true;
    return id;
}

bool EntityStore::remove_credential(EntityId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = credentials_.find(id);
    if (it == credentials_.end()) return false;

    if (it->second.port) {
        auto port_it = ports_.find(*it->second.port);
        if (port_it != ports_.end() && port_it->second.credential == id) {
            port_it->second.credential.reset();
            port_it->second.version++;
        }
    }
    credentials_.erase(it);
    dirty_ = true;
    return true;
}

bool EntityStore::remove_port(EntityId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ports_.find(id);
    if (it == ports_.end()) return false;

    if (it->second.credential) {
        auto cred_it = credentials_.find(*it->second.credential);
        if (cred_it != credentials_.end() && cred_it->second.port == id) {
            cred_it->second.port.reset();
            cred_it->second.version++;
        }
    }
    ports_.erase(it);
    dirty_ = true;
    return true;
}

void EntityStore::sync_ports(const std::vector<int>& numbers) {
    std::vector<int> missing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int n : numbers) {
            bool exists = std::any_of(ports_.begin(), ports_.end(),
                                      [n](const auto& kv) { return kv.second.port_number == n; });
            if (!exists) missing.push_back(n);
        }
    }
    for (int n : missing) {
        add_port(n);
        pool_log(fmt::format("store: created port {}", n));
    }
}

std::vector<Credential> EntityStore::credentials() const {
    return all<Credential>();
}

std::vector<Port> EntityStore::ports() const {
    return all<Port>();
}

template <>
std::vector<Credential> EntityStore::all<Credential>() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Credential> rows;
    rows.reserve(credentials_.size());
    for (const auto& [id, c] : credentials_) rows.push_back(c);
    return rows;
}

template <>
std::vector<Port> EntityStore::all<Port>() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Port> rows;
    rows.reserve(ports_.size());
    for (const auto& [id, p] : ports_) rows.push_back(p);
    return rows;
}

std::optional<Credential> EntityStore::find_credential(EntityId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = credentials_.find(id);
    if (it == credentials_.end()) return std::nullopt;
    return it->second;
}

std::optional<Port> EntityStore::find_port(EntityId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ports_.find(id);
    if (it == ports_.end()) return std::nullopt;
    return it->second;
}

Transaction EntityStore::begin() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx;
    tx.credentials_ = credentials_;
    tx.ports_ = ports_;
    return tx;
}

bool EntityStore::commit(const Transaction& tx) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Validate every touched record before writing any of them
    for (const auto& [id, version] : tx.touched_credentials_) {
        auto it = credentials_.find(id);
        if (it == credentials_.end()) {
            throw EntityVanishedError(fmt::format("Credential {} was deleted", id));
        }
        if (it->second.version != version) return false;
    }
    for (const auto& [id, version] : tx.touched_ports_) {
        auto it = ports_.find(id);
        if (it == ports_.end()) {
            throw EntityVanishedError(fmt::format("Port {} was deleted", id));
        }
        if (it->second.version != version) return false;
    }

    for (const auto& [id, version] : tx.touched_credentials_) {
        Credential updated = tx.credentials_.at(id);
        updated.version = version + 1;
        credentials_[id] = std::move(updated);
    }
    for (const auto& [id, version] : tx.touched_ports_) {
        Port updated = tx.ports_.at(id);
        updated.version = version + 1;
        ports_[id] = std::move(updated);
    }

    if (!tx.touched_credentials_.empty() || !tx.touched_ports_.empty()) {
        dirty_ = true;
    }
    return true;
}

bool EntityStore::dirty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dirty_;
}

// ── Persistence ───────────────────────────────────────────

static std::string time_or_empty(const std::optional<TimePoint>& tp) {
    return tp ? to_iso(*tp) : "";
}

static std::optional<EntityId> optional_id(const YAML::Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    EntityId id = node.as<EntityId>(0);
    if (id <= 0) return std::nullopt;
    return id;
}

void EntityStore::load() {
    std::map<EntityId, Credential> credentials;
    std::map<EntityId, Port> ports;
    EntityId max_id = 0;

    if (!path_.empty() && fs::exists(path_)) {
        try {
            YAML::Node root = YAML::LoadFile(path_.string());

            if (root["credentials"] && root["credentials"].IsSequence()) {
                for (const auto& n : root["credentials"]) {
                    Credential c;
                    c.id = n["id"].as<EntityId>(0);
                    c.host = n["host"].as<std::string>("");
                    c.username = n["username"].as<std::string>("");
                    c.password = n["password"].as<std::string>("");
                    c.is_live = n["is_live"].as<bool>(false);
                    c.port = optional_id(n["port"]);
                    c.check.is_checking = n["is_checking"].as<bool>(false);
                    c.check.last_checked = parse_iso_time_point(n["last_checked"].as<std::string>(""));
                    c.version = 1;
                    if (c.id <= 0 || c.host.empty()) continue;
                    max_id = std::max(max_id, c.id);
                    credentials[c.id] = c;
                }
            }

            if (root["ports"] && root["ports"].IsSequence()) {
                for (const auto& n : root["ports"]) {
                    Port p;
                    p.id = n["id"].as<EntityId>(0);
                    p.port_number = n["port_number"].as<int>(0);
                    p.credential = optional_id(n["credential"]);
                    p.external_ip = n["external_ip"].as<std::string>("");
                    p.time_connected = parse_iso_time_point(n["time_connected"].as<std::string>(""));
                    p.used_credentials = n["used_credentials"].as<std::vector<EntityId>>(std::vector<EntityId>());
                    p.check.is_checking = n["is_checking"].as<bool>(false);
                    p.check.last_checked = parse_iso_time_point(n["last_checked"].as<std::string>(""));
                    p.version = 1;
                    if (p.id <= 0 || p.port_number <= 0) continue;
                    max_id = std::max(max_id, p.id);
                    ports[p.id] = p;
                }
            }
        } catch (const std::exception& e) {
            // Corrupted store file, start fresh
            pool_log(fmt::format("store: cannot read {}: {}", path_.string(), e.what()));
            credentials.clear();
            ports.clear();
            max_id = 0;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    credentials_ = std::move(credentials);
    ports_ = std::move(ports);
    next_id_ = max_id + 1;
    dirty_ = false;
}

void EntityStore::save() {
    if (path_.empty()) return;

    std::map<EntityId, Credential> credentials;
    std::map<EntityId, Port> ports;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        credentials = credentials_;
        ports = ports_;
        dirty_ = false;
    }

    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "credentials" << YAML::Value << YAML::BeginSeq;
    for (const auto& [id, c] : credentials) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << c.id;
        out << YAML::Key << "host" << YAML::Value << c.host;
        out << YAML::Key << "username" << YAML::Value << c.username;
        out << YAML::Key << "password" << YAML::Value << c.password;
        out << YAML::Key << "is_live" << YAML::Value << c.is_live;
        out << YAML::Key << "port" << YAML::Value << (c.port ? *c.port : 0);
        out << YAML::Key << "is_checking" << YAML::Value << c.check.is_checking;
        out << YAML::Key << "last_checked" << YAML::Value << time_or_empty(c.check.last_checked);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "ports" << YAML::Value << YAML::BeginSeq;
    for (const auto& [id, p] : ports) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << p.id;
        out << YAML::Key << "port_number" << YAML::Value << p.port_number;
        out << YAML::Key << "credential" << YAML::Value << (p.credential ? *p.credential : 0);
        out << YAML::Key << "external_ip" << YAML::Value << p.external_ip;
        out << YAML::Key << "time_connected" << YAML::Value << time_or_empty(p.time_connected);
        out << YAML::Key << "used_credentials" << YAML::Value << YAML::Flow << p.used_credentials;
        out << YAML::Key << "is_checking" << YAML::Value << p.check.is_checking;
        out << YAML::Key << "last_checked" << YAML::Value << time_or_empty(p.check.last_checked);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;

    // Written to <path>.tmp, then renamed over the old file
    if (!path_.parent_path().empty()) {
        fs::create_directories(path_.parent_path());
    }
    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream fout(tmp.string());
        if (!fout) {
            throw std::runtime_error("Cannot write store file " + tmp.string());
        }
        fout << out.c_str();
    }
    fs::rename(tmp, path_);
}
