#pragma once
#include "clipwire_common.hpp"

// -------- Logging (levels) --------
enum class LogLevel { INFO, WARN, ERROR, ALERT }; // levels

struct LogContext {
    std::string userId;
    std::string sessionId;
    std::string peer;
};

extern LogContext g_log_ctx;

// Audit log destination; empty means disabled (entries are dropped)
extern std::string g_audit_log_path;

// Initialize global logging context. Honors CLIPWIRE_AUDIT_LOG
// ("-" disables file logging).
void init_log_context();

// Peer name shown in subsequent entries
void set_log_peer(const std::string& peer);

// Log with level, message, optional event + outcome
// audit_log_level(LogLevel::INFO, "Watch started", "watch", "notify");
void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event = "",
    const std::string& outcome = ""
);
