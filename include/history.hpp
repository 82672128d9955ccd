#pragma once
#include "clipwire_common.hpp"

#include <ostream>
#include <string>
#include <vector>

struct HistoryEntry {
    std::string timestamp; // "YYYY-MM-DD HH:MM:SS", local time
    std::string command;   // e.g. "send", "watch:recv"
    std::string target;    // peer name
    uint64_t size = 0;     // payload bytes
};

// <config dir>/history.log; empty if undeterminable
std::string history_file_path();

// -------- History serialization --------
std::string escape_str(const std::string& s);
std::string unescape_str(const std::string& x);
std::string serialize_history(const std::vector<HistoryEntry>& entries);
std::vector<HistoryEntry> deserialize_history(const std::string& s);

// -------- Recording --------
// A missing file loads as empty history
bool load_history(const std::string& path, std::vector<HistoryEntry>& out);

// Appends one entry, keeps the newest MAX_HISTORY_ENTRIES, rewrites atomically
bool record_history_to(const std::string& path,
    const std::string& command,
    const std::string& target,
    uint64_t size);

// Fire-and-forget variant on the default path; failures only reach the audit log
void record_history(const std::string& command, const std::string& target, uint64_t size);

// -------- Listing --------
bool is_peer_command(const std::string& command);
bool is_slot_command(const std::string& command);
bool is_fx_command(const std::string& command);

// Set flags are combined: an entry is shown only if it matches all of them
struct HistoryFilter {
    bool peer = false;
    bool slots = false;
    bool fx = false;
};

bool history_entry_matches(const HistoryEntry& e, const HistoryFilter& filter);

// Newest first; returns false if nothing was printed
bool print_history(std::ostream& os, const std::vector<HistoryEntry>& entries, const HistoryFilter& filter);
