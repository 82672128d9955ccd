#include "config.hpp"
#include "io.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <yaml-cpp/yaml.h>

template <typename T>
static T getOrDefault(const YAML::Node& node, const std::string& key, const T& def) {
    return node[key] ? node[key].as<T>() : def;
}

std::string config_file_path() {
    const char* env_path = std::getenv("CLIPWIRE_CONFIG");
    if (env_path && *env_path) {
        return env_path;
    }
    std::string dir = config_dir_path();
    if (dir.empty()) return "";
    return dir + "/" + CONFIG_FILENAME;
}


// ---------------- Parsing ----------------
static bool parse_config(const YAML::Node& root, Config& cfg, std::string& err) {
    if (!root.IsDefined() || root.IsNull()) {
        return true; // empty file
    }
    if (!root.IsMap()) {
        err = "config root must be a mapping";
        return false;
    }

    if (auto node = root["defaults"]) {
        cfg.default_peer = getOrDefault<std::string>(node, "peer", cfg.default_peer);
    }

    if (auto node = root["peers"]) {
        if (!node.IsMap()) {
            err = "peers must be a mapping of name to peer settings";
            return false;
        }
        for (const auto& kv : node) {
            PeerDescriptor peer;
            peer.name = kv.first.as<std::string>();
            const YAML::Node& p = kv.second;
            if (!p.IsMap()) {
                err = "peer \"" + peer.name + "\" must be a mapping";
                return false;
            }
            peer.address = getOrDefault<std::string>(p, "ssh", "");
            peer.remote_cmd = getOrDefault<std::string>(p, "remote_cmd", DEFAULT_REMOTE_CMD);
            if (peer.address.empty()) {
                err = "peer \"" + peer.name + "\": ssh is required";
                return false;
            }
            if (peer.remote_cmd.empty()) {
                peer.remote_cmd = DEFAULT_REMOTE_CMD;
            }
            cfg.peers[peer.name] = std::move(peer);
        }
    }

    if (auto node = root["watch"]) {
        long long interval = getOrDefault<long long>(node, "interval_ms",
            static_cast<long long>(cfg.watch_interval_ms));
        if (interval < static_cast<long long>(MIN_WATCH_INTERVAL_MS)) {
            err = "watch.interval_ms must be at least " + std::to_string(MIN_WATCH_INTERVAL_MS);
            return false;
        }
        if (interval > static_cast<long long>(MAX_WATCH_INTERVAL_MS)) {
            err = "watch.interval_ms must be at most " + std::to_string(MAX_WATCH_INTERVAL_MS);
            return false;
        }
        cfg.watch_interval_ms = static_cast<unsigned>(interval);
    }

    if (auto node = root["fx"]) {
        if (!node.IsMap()) {
            err = "fx must be a mapping of name to transform settings";
            return false;
        }
        for (const auto& kv : node) {
            FxDescriptor fx;
            fx.name = kv.first.as<std::string>();
            const YAML::Node& f = kv.second;
            if (!f.IsMap()) {
                err = "fx \"" + fx.name + "\" must be a mapping";
                return false;
            }
            if (f["cmd"]) {
                if (!f["cmd"].IsSequence()) {
                    err = "fx \"" + fx.name + "\": cmd must be a list";
                    return false;
                }
                fx.cmd = f["cmd"].as<std::vector<std::string>>();
            }
            fx.shell = getOrDefault<std::string>(f, "shell", "");
            fx.description = getOrDefault<std::string>(f, "description", "");
            if (fx.cmd.empty() == fx.shell.empty()) {
                err = "fx \"" + fx.name + "\": set exactly one of cmd or shell";
                return false;
            }
            cfg.fx[fx.name] = std::move(fx);
        }
    }

    if (auto node = root["sync"]) {
        SyncSettings& sync = cfg.sync;
        sync.backend = getOrDefault<std::string>(node, "backend", sync.backend);
        sync.path = getOrDefault<std::string>(node, "path", sync.path);
        sync.encryption = getOrDefault<std::string>(node, "encryption", sync.encryption);
        sync.passphrase = getOrDefault<std::string>(node, "passphrase", sync.passphrase);
        long long ttl = getOrDefault<long long>(node, "ttl_days", 0);

        if (sync.backend != "local") {
            err = "unsupported sync backend: " + sync.backend + " (only \"local\" is available)";
            return false;
        }
        if (sync.encryption.empty()) sync.encryption = "none";
        if (sync.encryption != "none" && sync.encryption != "xchacha20") {
            err = "sync.encryption must be \"none\" or \"xchacha20\"";
            return false;
        }
        if (sync.encryption == "xchacha20" && sync.passphrase.empty()) {
            err = "sync.passphrase is required when sync.encryption is xchacha20";
            return false;
        }
        if (ttl < 0 || ttl > 36500) {
            err = "sync.ttl_days must be between 0 and 36500";
            return false;
        }
        sync.ttl_days = static_cast<unsigned>(ttl);
    }

    return true;
}


// ---------------- Loading ----------------
bool load_config_file(const std::string& path, Config& out, std::string& err) {
    std::string text;
    if (!read_file(path, text, MAX_TEXT_FILE_SIZE)) {
        if (errno == ENOENT) {
            err = "config file not found: " + path +
                "\n\nPeer sync is not configured. Create the file with a peers section."
                "\nSee: clipwire help";
        }
        else {
            err = "reading config " + path + ": " + std::strerror(errno);
        }
        return false;
    }

    Config cfg;
    cfg.path = path;
    try {
        YAML::Node root = YAML::Load(text);
        if (!parse_config(root, cfg, err)) {
            err = "invalid config " + path + ": " + err;
            return false;
        }
    }
    catch (const YAML::Exception& e) {
        err = "parsing config " + path + ": " + e.what();
        audit_log_level(LogLevel::WARN,
            "load_config: YAML error: " + std::string(e.what()),
            "config_module",
            "failure");
        return false;
    }

    out = std::move(cfg);
    return true;
}

bool load_config(Config& out, std::string& err) {
    std::string path = config_file_path();
    if (path.empty()) {
        err = "could not determine config path";
        return false;
    }
    return load_config_file(path, out, err);
}

bool load_config_or_defaults(Config& out, std::string& err) {
    std::string path = config_file_path();
    if (path.empty()) {
        err = "could not determine config path";
        return false;
    }
    struct stat st;
    if (stat(path.c_str(), &st) != 0 && errno == ENOENT) {
        out = Config{};
        out.path = path;
        return true;
    }
    return load_config_file(path, out, err);
}


// ---------------- Peer resolution ----------------
static std::string peer_names(const Config& cfg) {
    std::vector<std::string> names;
    for (const auto& p : cfg.peers) names.push_back(p.first);
    return join_args(names, ", ");
}

bool get_peer(const Config& cfg, const std::string& name, PeerDescriptor& out, std::string& err) {
    if (cfg.peers.empty()) {
        err = "no peers configured in " + (cfg.path.empty() ? std::string("config") : cfg.path);
        return false;
    }
    auto it = cfg.peers.find(name);
    if (it == cfg.peers.end()) {
        err = "unknown peer \"" + name + "\"; configured peers: " + peer_names(cfg);
        return false;
    }
    out = it->second;
    return true;
}

bool get_default_peer(const Config& cfg, std::string& name, std::string& err) {
    if (cfg.default_peer.empty()) {
        err = "no default peer configured; set defaults.peer or pass a peer name";
        return false;
    }
    name = cfg.default_peer;
    return true;
}

bool resolve_peer(const Config& cfg, const std::string& name, PeerDescriptor& out, std::string& err) {
    std::string peer_name = name;
    if (peer_name.empty() && !get_default_peer(cfg, peer_name, err)) {
        return false;
    }
    return get_peer(cfg, peer_name, out, err);
}


// ---------------- Transforms ----------------
bool get_fx(const Config& cfg, const std::string& name, FxDescriptor& out, std::string& err) {
    auto it = cfg.fx.find(name);
    if (it == cfg.fx.end()) {
        if (cfg.fx.empty()) {
            err = "unknown transform \"" + name + "\"; no transforms defined in " +
                (cfg.path.empty() ? std::string("config") : cfg.path);
            return false;
        }
        std::vector<std::string> names;
        for (const auto& f : cfg.fx) names.push_back(f.first);
        err = "unknown transform \"" + name + "\"; defined transforms: " + join_args(names, ", ");
        return false;
    }
    out = it->second;
    return true;
}

std::vector<std::string> fx_command(const FxDescriptor& fx) {
    if (!fx.cmd.empty()) return fx.cmd;
    return { "/bin/sh", "-c", fx.shell };
}
