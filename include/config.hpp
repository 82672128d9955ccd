#pragma once
#include "clipwire_common.hpp"

#include <string>
#include <vector>

// fx.<name>: exactly one of cmd or shell
struct FxDescriptor {
    std::string name;
    std::vector<std::string> cmd;   // argv, run directly
    std::string shell;              // run with sh -c
    std::string description;
};

using FxMap = std::map<std::string, FxDescriptor>;

// sync.*: slot storage
struct SyncSettings {
    std::string backend = "local";
    std::string path;               // empty: <config dir>/slots
    std::string encryption = "none"; // "none" or "xchacha20"
    std::string passphrase;
    unsigned ttl_days = 0;          // 0: slots never expire
};

struct Config {
    std::string path;           // file it was loaded from
    std::string default_peer;   // defaults.peer
    PeerMap peers;              // peers.<name>
    unsigned watch_interval_ms = DEFAULT_WATCH_INTERVAL_MS;
    FxMap fx;                   // fx.<name>
    SyncSettings sync;          // sync
};

// $CLIPWIRE_CONFIG, else <config dir>/config.yaml; empty if undeterminable
std::string config_file_path();

// -------- Loading --------
// On failure `err` holds a message suitable for the operator.
bool load_config(Config& out, std::string& err);
bool load_config_file(const std::string& path, Config& out, std::string& err);

// As load_config, but a missing file yields the defaults
bool load_config_or_defaults(Config& out, std::string& err);

// -------- Peer resolution --------
bool get_peer(const Config& cfg, const std::string& name, PeerDescriptor& out, std::string& err);
bool get_default_peer(const Config& cfg, std::string& name, std::string& err);

// `name` empty means the default peer
bool resolve_peer(const Config& cfg, const std::string& name, PeerDescriptor& out, std::string& err);

// -------- Transforms --------
bool get_fx(const Config& cfg, const std::string& name, FxDescriptor& out, std::string& err);

// argv to run: cmd as given, or {"/bin/sh", "-c", shell}
std::vector<std::string> fx_command(const FxDescriptor& fx);
