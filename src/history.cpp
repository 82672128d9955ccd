#include "history.hpp"
#include "io.hpp"
#include "logging.hpp"
#include "util.hpp"

std::string history_file_path() {
    std::string dir = config_dir_path();
    if (dir.empty()) return "";
    return dir + "/" + HISTORY_FILENAME;
}

static std::string now_timestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);

    char tbuf[64];
    if (std::strftime(tbuf, sizeof(tbuf), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
        return "0000-00-00 00:00:00";
    }
    return tbuf;
}


// -------- Escaping --------
std::string escape_str(const std::string& s) {
    std::string r; r.reserve(s.size());
    for (unsigned char c : s) {
        if (c == '\n') { r += "\\n"; }
        else if (c == '\t') { r += "\\t"; }
        else if (c == '\\') { r += "\\\\"; }
        else r.push_back(c);
    }
    return r;
}

std::string unescape_str(const std::string& x) {
    std::string r; r.reserve(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        if (x[i] == '\\' && i + 1 < x.size()) {
            if (x[i + 1] == 'n') { r.push_back('\n'); ++i; }
            else if (x[i + 1] == 't') { r.push_back('\t'); ++i; }
            else if (x[i + 1] == '\\') { r.push_back('\\'); ++i; }
            else r.push_back(x[i]);
        }
        else r.push_back(x[i]);
    }
    return r;
}


// ----------- Serialize history to text ------------
std::string serialize_history(const std::vector<HistoryEntry>& entries) {
    std::ostringstream oss;
    for (const auto& e : entries) {
        oss << escape_str(e.timestamp) << '\t'
            << escape_str(e.command) << '\t'
            << escape_str(e.target) << '\t'
            << e.size << '\n';
    }
    return oss.str();
}


// ----------- Deserialize text to history ------------
std::vector<HistoryEntry> deserialize_history(const std::string& s) {
    std::vector<HistoryEntry> out;
    std::istringstream iss(s);
    std::string line;

    while (std::getline(iss, line)) {
        if (line.empty()) continue;

        std::vector<std::string> toks;
        toks.reserve(4);

        size_t start = 0;
        for (size_t pos = 0; pos <= line.size(); ++pos) {
            if (pos == line.size() || line[pos] == '\t') {
                toks.emplace_back(line.substr(start, pos - start));
                start = pos + 1;
            }
        }

        if (toks.size() != 4) {
            // malformed line -> skip and log
            audit_log_level(LogLevel::WARN,
                "deserialize_history: skipped malformed line",
                "history_module",
                "failure");
            continue;
        }

        HistoryEntry e;
        e.timestamp = unescape_str(toks[0]);
        e.command = unescape_str(toks[1]);
        e.target = unescape_str(toks[2]);

        char* end = nullptr;
        errno = 0;
        unsigned long long n = std::strtoull(toks[3].c_str(), &end, 10);
        if (toks[3].empty() || errno != 0 || (end && *end != '\0')) {
            audit_log_level(LogLevel::WARN,
                "deserialize_history: skipped line with bad size",
                "history_module",
                "failure");
            continue;
        }
        e.size = static_cast<uint64_t>(n);

        out.push_back(std::move(e));
    }

    return out;
}


// ---------------- Recording ----------------
bool load_history(const std::string& path, std::vector<HistoryEntry>& out) {
    std::string text;
    if (!read_file(path, text, MAX_TEXT_FILE_SIZE)) {
        if (errno == ENOENT) {
            out.clear();
            return true;
        }
        return false;
    }
    out = deserialize_history(text);
    return true;
}

bool record_history_to(const std::string& path,
    const std::string& command,
    const std::string& target,
    uint64_t size)
{
    std::vector<HistoryEntry> history;
    if (!load_history(path, history)) {
        // unreadable history is replaced rather than blocking new entries
        audit_log_level(LogLevel::WARN,
            "record_history: existing history unreadable, starting fresh",
            "history_module",
            "failure");
        history.clear();
    }

    history.push_back(HistoryEntry{ now_timestamp(), command, target, size });

    if (history.size() > MAX_HISTORY_ENTRIES) {
        history.erase(history.begin(),
            history.begin() + static_cast<std::ptrdiff_t>(history.size() - MAX_HISTORY_ENTRIES));
    }

    std::string content = serialize_history(history);
    if (!atomic_write_file(path,
        reinterpret_cast<const byte*>(content.data()),
        content.size())) {
        audit_log_level(LogLevel::ERROR,
            "record_history: atomic write failed",
            "history_module",
            "failure");
        return false;
    }
    return true;
}

void record_history(const std::string& command, const std::string& target, uint64_t size) {
    std::string dir = config_dir_path();
    if (dir.empty() || !ensure_dir_exists(dir, S_IRWXU)) {
        audit_log_level(LogLevel::WARN,
            "record_history: no usable config directory",
            "history_module",
            "failure");
        return;
    }
    record_history_to(history_file_path(), command, target, size);
}


// ---------------- Listing ----------------
bool is_peer_command(const std::string& command) {
    return command == "send" || command == "recv" || command == "peek" ||
        command.rfind("watch:", 0) == 0;
}

bool is_slot_command(const std::string& command) {
    return command == "push" || command == "pull" || command == "show" || command == "rm";
}

bool is_fx_command(const std::string& command) {
    return command.rfind("fx:", 0) == 0;
}

bool history_entry_matches(const HistoryEntry& e, const HistoryFilter& filter) {
    if (filter.peer && !is_peer_command(e.command)) return false;
    if (filter.slots && !is_slot_command(e.command)) return false;
    if (filter.fx && !is_fx_command(e.command)) return false;
    return true;
}

bool print_history(std::ostream& os, const std::vector<HistoryEntry>& entries, const HistoryFilter& filter) {
    std::vector<const HistoryEntry*> shown;
    for (const auto& e : entries) {
        if (!history_entry_matches(e, filter)) continue;
        shown.push_back(&e);
    }
    if (shown.empty()) return false;

    auto row = [&os](const std::string& t, const std::string& c,
        const std::string& target, const std::string& size) {
        os << std::left << std::setw(20) << t << "  "
            << std::setw(12) << c << "  "
            << std::setw(15) << target << "  "
            << size << "\n";
        };

    row("TIME", "COMMAND", "TARGET", "SIZE");
    for (auto it = shown.rbegin(); it != shown.rend(); ++it) {
        const HistoryEntry& e = **it;
        row(e.timestamp, e.command, e.target, e.size > 0 ? format_size(e.size) : "");
    }
    return true;
}
