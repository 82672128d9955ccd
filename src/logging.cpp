#include "logging.hpp"
#include "io.hpp"
#include "util.hpp"

LogContext g_log_ctx;
std::string g_audit_log_path;


// ---------------- Get username ----------------
static std::string get_system_username() {
    uid_t uid = geteuid();
    struct passwd* pw = getpwuid(uid);
    if (pw && pw->pw_name) {
        return std::string(pw->pw_name);
    }
    const char* envUser = std::getenv("USER");
    if (envUser && *envUser) {
        return std::string(envUser);
    }
    return "unknown";
}


// ---------------- Global logging context init ----------------
void init_log_context() {
    g_log_ctx.userId = get_system_username();
    g_log_ctx.sessionId = generate_session_id();
    g_log_ctx.peer = "-";

    const char* env_path = std::getenv("CLIPWIRE_AUDIT_LOG");
    if (env_path && *env_path) {
        g_audit_log_path = (std::strcmp(env_path, "-") == 0) ? "" : env_path;
        return;
    }

    std::string dir = config_dir_path();
    if (dir.empty() || !ensure_dir_exists(dir, S_IRWXU)) {
        // fall back to the working directory
        g_audit_log_path = AUDIT_LOG;
        return;
    }
    g_audit_log_path = dir + "/" + AUDIT_LOG;
}

void set_log_peer(const std::string& peer) {
    g_log_ctx.peer = peer.empty() ? "-" : peer;
}


// ---------------- Logging (levels) ----------------
static const char* log_level_str(LogLevel lvl) {
    switch (lvl) {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::ALERT: return "ALERT";
    default:              return "UNKNOWN";
    }
}

void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event,
    const std::string& outcome
)
{
    if (g_audit_log_path.empty()) return;

    FILE* f = std::fopen(g_audit_log_path.c_str(), "a");
    if (!f) {
        std::fprintf(stderr, "[audit-fail] %s: %s\n",
            log_level_str(lvl),
            entry.c_str());
        return;
    }

    fchmod(fileno(f), S_IRUSR | S_IWUSR);

    // timestamp
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);

    char tbuf[64];
    if (std::strftime(tbuf, sizeof(tbuf), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
        std::strncpy(tbuf, "0000-00-00 00:00:00", sizeof(tbuf));
        tbuf[sizeof(tbuf) - 1] = '\0';
    }

    // sanitize message fields to avoid newlines in log entries
    auto sanitize = [](const std::string& s) {
        std::string r = s;
        for (char& c : r) {
            if (c == '\n' || c == '\r') c = ' ';
        }
        return r;
        };

    std::string s_entry = sanitize(entry);
    std::string s_event = sanitize(event);
    std::string s_outcome = sanitize(outcome);
    std::string s_peer = sanitize(g_log_ctx.peer);

    // timestamp | level | user | peer | session | event | outcome | message
    std::fprintf(
        f,
        "%s | %s | user=%s | peer=%s | session=%s | event=%s | outcome=%s | %s\n",
        tbuf,
        log_level_str(lvl),
        g_log_ctx.userId.c_str(),
        s_peer.c_str(),
        g_log_ctx.sessionId.c_str(),
        s_event.c_str(),
        s_outcome.c_str(),
        s_entry.c_str()
    );

    std::fflush(f);
    std::fclose(f);
}
