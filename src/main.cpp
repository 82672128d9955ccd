#include "clipwire_common.hpp"
#include "clipboard.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "doctor.hpp"
#include "fx.hpp"
#include "history.hpp"
#include "logging.hpp"
#include "process.hpp"
#include "remote.hpp"
#include "slots.hpp"
#include "util.hpp"
#include "watch.hpp"

#include <csignal>
#include <memory>
#include <stdexcept>

// ---------------- Usage ----------------
static const std::map<std::string, std::string> k_command_usage = {
    { "copy",    "Usage: clipwire copy [text...]\n\nCopy the arguments (joined by spaces) or stdin to the local clipboard." },
    { "paste",   "Usage: clipwire paste\n\nWrite the local clipboard to stdout." },
    { "clear",   "Usage: clipwire clear\n\nClear the local clipboard." },
    { "send",    "Usage: clipwire send [peer]\n\nSend the local clipboard to a peer's clipboard via SSH.\n\nArguments:\n  peer    Peer name from config (uses defaults.peer if omitted)" },
    { "recv",    "Usage: clipwire recv [peer]\n\nReceive a peer's clipboard into the local clipboard via SSH.\n\nArguments:\n  peer    Peer name from config (uses defaults.peer if omitted)" },
    { "peek",    "Usage: clipwire peek [peer]\n\nPrint a peer's clipboard to stdout without touching the local clipboard.\n\nArguments:\n  peer    Peer name from config (uses defaults.peer if omitted)" },
    { "watch",   "Usage: clipwire watch [peer] [--interval <ms>]\n\nKeep the local and peer clipboards in sync until interrupted.\n\nArguments:\n  peer             Peer name from config (uses defaults.peer if omitted)\n  --interval <ms>  Polling interval, at least 100 (default 500 or watch.interval_ms)" },
    { "push",    "Usage: clipwire push <slot>\n\nSave the local clipboard to a named slot." },
    { "pull",    "Usage: clipwire pull <slot>\n\nLoad a named slot into the local clipboard." },
    { "show",    "Usage: clipwire show <slot>\n\nWrite a named slot to stdout without touching the clipboard." },
    { "slots",   "Usage: clipwire slots\n\nList saved slots." },
    { "rm",      "Usage: clipwire rm <slot>\n\nDelete a named slot." },
    { "fx",      "Usage: clipwire fx <name>... [--dry-run]\n       clipwire fx --list\n\nRun configured transforms over the clipboard, in order.\n\n  --dry-run, -n  Print the result instead of writing the clipboard\n  --list, -l     List configured transforms" },
    { "history", "Usage: clipwire history [--peer] [--slots] [--fx]\n\nShow recent operations, most recent first. Filters combine.\n\n  --peer   Only send/recv/peek/watch entries\n  --slots  Only push/pull/show/rm entries\n  --fx     Only transform entries" },
    { "backend", "Usage: clipwire backend\n\nShow the detected clipboard backend and any missing tools." },
    { "doctor",  "Usage: clipwire doctor\n\nCheck the clipboard backend, ssh and config." },
};

static void print_help() {
    std::cout <<
        "clipwire - clipboard sync over SSH\n"
        "\n"
        "Local:\n"
        "  copy [text...]       Copy text or stdin to the clipboard\n"
        "  paste                Write the clipboard to stdout\n"
        "  clear                Clear the clipboard\n"
        "  backend              Show the detected clipboard backend\n"
        "  doctor               Check the environment\n"
        "  fx <name>...         Transform the clipboard (fx --list)\n"
        "\n"
        "Slots:\n"
        "  push <slot>          Save the clipboard to a slot\n"
        "  pull <slot>          Load a slot into the clipboard\n"
        "  show <slot>          Print a slot\n"
        "  slots                List slots\n"
        "  rm <slot>            Delete a slot\n"
        "\n"
        "Peers:\n"
        "  send [peer]          Local clipboard -> peer clipboard\n"
        "  recv [peer]          Peer clipboard -> local clipboard (alias: receive)\n"
        "  peek [peer]          Print peer clipboard\n"
        "  watch [peer]         Two-way sync until Ctrl+C\n"
        "\n"
        "Other:\n"
        "  history [filters]    Show recent operations\n"
        "  <command> --help     Show help for a command\n"
        "  help                 Show this help\n"
        "  version              Show version\n"
        "\n"
        "Config: ~/.config/clipwire/config.yaml\n"
        "\n"
        "  defaults:\n"
        "    peer: dev\n"
        "  peers:\n"
        "    dev:\n"
        "      ssh: devbox\n"
        "      remote_cmd: clipwire   # optional\n"
        "  watch:\n"
        "    interval_ms: 500       # optional, 100 to 86400000\n"
        "  fx:\n"
        "    upper:\n"
        "      cmd: [tr, a-z, A-Z]\n"
        "  sync:\n"
        "    encryption: xchacha20  # optional\n"
        "    passphrase: ...\n"
        "    ttl_days: 7            # optional\n"
        "\n"
        "With no command and piped stdin, clipwire copies stdin.\n";
}

static int fail(const std::string& msg) {
    std::cerr << "clipwire: " << msg << "\n";
    return 1;
}

static int usage_error(const std::string& cmd, const std::string& detail = "") {
    if (!detail.empty()) std::cerr << "clipwire: " << detail << "\n";
    auto it = k_command_usage.find(cmd);
    if (it != k_command_usage.end()) {
        std::cerr << it->second.substr(0, it->second.find('\n')) << "\n";
    }
    return 2;
}


// ---------------- Helpers ----------------
static bool require_backend(ClipboardBackend& b, std::string& err) {
    if (!detect_backend(b)) {
        err = "no supported clipboard backend found (set WAYLAND_DISPLAY or DISPLAY, or install clip.exe)";
        return false;
    }
    if (!b.missing.empty()) {
        err = std::string("backend ") + backend_kind_str(b.kind) +
            " is missing required tools: " + join_args(b.missing, ", ") +
            "\n       Hint: " + install_hint(b.kind);
        return false;
    }
    return true;
}

static bool write_stdout(const Bytes& data) {
    if (!data.empty() && std::fwrite(data.data(), 1, data.size(), stdout) != data.size()) {
        return false;
    }
    return std::fflush(stdout) == 0;
}

// Loads config and resolves [peer]; the usage line is prefixed when no peer
// was given and no default is configured
static bool load_peer(const std::string& cmd,
    const std::string& name,
    Config& cfg,
    PeerDescriptor& peer,
    std::string& err)
{
    if (!load_config(cfg, err)) {
        return false;
    }
    if (!resolve_peer(cfg, name, peer, err)) {
        if (name.empty()) {
            err = "usage: clipwire " + cmd + " [peer]\n" + err;
        }
        return false;
    }
    set_log_peer(peer.name);
    return true;
}


// ---------------- Local commands ----------------
static int cmd_copy(const std::vector<std::string>& args) {
    std::string err;
    ClipboardBackend b;
    if (!require_backend(b, err)) return fail(err);

    Bytes data;
    if (!args.empty()) {
        data = to_bytes(join_args(args));
    }
    else if (!read_fd_capped(STDIN_FILENO, data, MAX_CLIPBOARD_SIZE)) {
        return fail(std::string("reading stdin: ") + std::strerror(errno));
    }

    if (!clipboard_set(b, data)) {
        return fail("writing clipboard failed");
    }
    return 0;
}

static int cmd_paste(const std::vector<std::string>& args) {
    if (!args.empty()) return usage_error("paste", "unknown argument: " + args[0]);

    std::string err;
    ClipboardBackend b;
    if (!require_backend(b, err)) return fail(err);

    Bytes data;
    if (!clipboard_get(b, data)) {
        return fail("reading clipboard failed");
    }
    if (!write_stdout(data)) {
        return fail("writing stdout failed");
    }
    return 0;
}

static int cmd_clear(const std::vector<std::string>& args) {
    if (!args.empty()) return usage_error("clear", "clear does not take arguments");

    std::string err;
    ClipboardBackend b;
    if (!require_backend(b, err)) return fail(err);

    if (!clipboard_clear(b)) {
        return fail("clearing clipboard failed");
    }
    return 0;
}

static int cmd_backend(const std::vector<std::string>& args) {
    if (!args.empty()) return usage_error("backend", "backend does not take arguments");

    ClipboardBackend b;
    if (!detect_backend(b)) {
        return fail("no supported clipboard backend found");
    }

    std::cout << "Backend:   " << backend_kind_str(b.kind) << "\n";
    if (!b.env_source.empty()) {
        std::cout << "Env:       " << b.env_source << "\n";
    }
    std::cout << "Copy cmd:  " << join_args(b.copy_cmd) << "\n";
    std::cout << "Paste cmd: " << join_args(b.paste_cmd) << "\n";
    if (!b.clear_cmd.empty()) {
        std::cout << "Clear cmd: " << join_args(b.clear_cmd) << "\n";
    }
    if (!b.missing.empty()) {
        std::cout << "Missing:   " << join_args(b.missing, ", ") << "\n";
        std::cout << "Hint:      " << install_hint(b.kind) << "\n";
    }
    return 0;
}


// ---------------- Peer commands ----------------
static int cmd_send(const std::vector<std::string>& args) {
    if (args.size() > 1) return usage_error("send", "too many arguments");

    std::string err;
    Config cfg;
    PeerDescriptor peer;
    if (!load_peer("send", args.empty() ? "" : args[0], cfg, peer, err)) return fail(err);

    ClipboardBackend b;
    if (!require_backend(b, err)) return fail(err);

    Bytes data;
    if (!clipboard_get(b, data)) {
        return fail("reading clipboard failed");
    }

    SshRemoteClipboard remote(peer, false);
    if (!remote.write(data)) {
        audit_log_level(LogLevel::WARN, "Send failed", "send", "failure");
        return fail("failed to send to peer \"" + peer.name + "\" (" + peer.address + ")");
    }

    std::cout << "sent " << format_size(data.size()) << " to peer \""
        << peer.name << "\" (" << peer.address << ")\n";
    audit_log_level(LogLevel::INFO,
        "Sent " + std::to_string(data.size()) + " bytes",
        "send",
        "success");
    record_history("send", peer.name, data.size());
    return 0;
}

static int cmd_recv(const std::vector<std::string>& args) {
    if (args.size() > 1) return usage_error("recv", "too many arguments");

    std::string err;
    Config cfg;
    PeerDescriptor peer;
    if (!load_peer("recv", args.empty() ? "" : args[0], cfg, peer, err)) return fail(err);

    ClipboardBackend b;
    if (!require_backend(b, err)) return fail(err);

    SshRemoteClipboard remote(peer, false);
    Bytes data;
    if (!remote.read(data)) {
        audit_log_level(LogLevel::WARN, "Receive failed", "recv", "failure");
        return fail("failed to receive from peer \"" + peer.name + "\" (" + peer.address + ")");
    }

    if (!clipboard_set(b, data)) {
        return fail("writing clipboard failed");
    }

    std::cout << "received " << format_size(data.size()) << " from peer \""
        << peer.name << "\" (" << peer.address << ")\n";
    audit_log_level(LogLevel::INFO,
        "Received " + std::to_string(data.size()) + " bytes",
        "recv",
        "success");
    record_history("recv", peer.name, data.size());
    return 0;
}

static int cmd_peek(const std::vector<std::string>& args) {
    if (args.size() > 1) return usage_error("peek", "too many arguments");

    std::string err;
    Config cfg;
    PeerDescriptor peer;
    if (!load_peer("peek", args.empty() ? "" : args[0], cfg, peer, err)) return fail(err);

    // stdout of ssh goes straight to ours
    std::fflush(stdout);
    if (!run_command(remote_command(peer, "paste"))) {
        return fail("failed to peek from peer \"" + peer.name + "\" (" + peer.address + ")");
    }
    record_history("peek", peer.name, 0);
    return 0;
}

static int cmd_watch(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    long interval_arg = -1;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        std::string value;
        if (a == "--interval") {
            if (i + 1 >= args.size()) return usage_error("watch", "--interval needs a value");
            value = args[++i];
        }
        else if (a.rfind("--interval=", 0) == 0) {
            value = a.substr(std::strlen("--interval="));
        }
        else if (!a.empty() && a[0] == '-') {
            return usage_error("watch", "unknown flag: " + a);
        }
        else {
            positional.push_back(a);
            continue;
        }

        char* end = nullptr;
        errno = 0;
        interval_arg = std::strtol(value.c_str(), &end, 10);
        if (value.empty() || errno != 0 || (end && *end != '\0') || interval_arg < 0) {
            return usage_error("watch", "invalid interval: " + value);
        }
    }
    if (positional.size() > 1) return usage_error("watch", "too many arguments");

    std::string err;
    Config cfg;
    PeerDescriptor peer;
    if (!load_peer("watch", positional.empty() ? "" : positional[0], cfg, peer, err)) return fail(err);

    ClipboardBackend b;
    if (!require_backend(b, err)) return fail(err);

    long interval_ms = interval_arg >= 0 ? interval_arg : static_cast<long>(cfg.watch_interval_ms);

    // the detached signal thread holds a reference for the rest of the process
    static CancelToken cancel;
    SystemClipboard local(b, true);
    SshRemoteClipboard remote(peer, true);

    try {
        WatchSession session(peer, local, remote, cancel,
            std::chrono::milliseconds(interval_ms),
            [](const std::string& kind, const std::string& peer_name, uint64_t bytes) {
                record_history(kind, peer_name, bytes);
            });

        if (!start_signal_listener(cancel)) {
            return fail("could not install signal handling");
        }

        std::cout << "Watching clipboard with peer \"" << peer.name << "\" (" << peer.address << ")\n";
        std::cout << "Press Ctrl+C to stop\n" << std::endl;

        session.run();
    }
    catch (const std::invalid_argument& e) {
        return fail(e.what());
    }

    std::cout << "\nStopping watch..." << std::endl;
    return 0;
}


// ---------------- Slot commands ----------------
static bool open_slots(std::unique_ptr<SlotStore>& store, std::string& err) {
    Config cfg;
    if (!load_config_or_defaults(cfg, err)) return false;
    return open_slot_store(cfg, store, err);
}

static int cmd_push(const std::vector<std::string>& args) {
    if (args.size() != 1) return usage_error("push", "push takes exactly one slot name");

    std::string err;
    std::unique_ptr<SlotStore> store;
    if (!open_slots(store, err)) return fail(err);

    ClipboardBackend b;
    if (!require_backend(b, err)) return fail(err);

    Bytes data;
    if (!clipboard_get(b, data)) {
        return fail("reading clipboard failed");
    }
    if (!store->push(args[0], data, err)) return fail(err);

    std::cout << "pushed " << format_size(data.size()) << " to slot \"" << args[0] << "\"\n";
    record_history("push", args[0], data.size());
    return 0;
}

static int cmd_pull(const std::vector<std::string>& args) {
    if (args.size() != 1) return usage_error("pull", "pull takes exactly one slot name");

    std::string err;
    std::unique_ptr<SlotStore> store;
    if (!open_slots(store, err)) return fail(err);

    ClipboardBackend b;
    if (!require_backend(b, err)) return fail(err);

    Bytes data;
    SlotMeta meta;
    if (!store->pull(args[0], data, meta, err)) return fail(err);

    if (!clipboard_set(b, data)) {
        return fail("writing clipboard failed");
    }

    std::cout << "pulled " << format_size(data.size()) << " from slot \"" << args[0] << "\"";
    if (!meta.hostname.empty()) std::cout << " (source: " << meta.hostname << ")";
    std::cout << "\n";
    record_history("pull", args[0], data.size());
    return 0;
}

static int cmd_show(const std::vector<std::string>& args) {
    if (args.size() != 1) return usage_error("show", "show takes exactly one slot name");

    std::string err;
    std::unique_ptr<SlotStore> store;
    if (!open_slots(store, err)) return fail(err);

    Bytes data;
    SlotMeta meta;
    if (!store->pull(args[0], data, meta, err)) return fail(err);
    if (!write_stdout(data)) {
        return fail("writing stdout failed");
    }
    record_history("show", args[0], data.size());
    return 0;
}

static int cmd_slots(const std::vector<std::string>& args) {
    if (!args.empty()) return usage_error("slots", "slots does not take arguments");

    std::string err;
    std::unique_ptr<SlotStore> store;
    if (!open_slots(store, err)) return fail(err);

    std::vector<SlotInfo> slots;
    if (!store->list(slots, err)) return fail(err);
    print_slots(std::cout, slots, std::time(nullptr));
    return 0;
}

static int cmd_rm(const std::vector<std::string>& args) {
    if (args.size() != 1) return usage_error("rm", "rm takes exactly one slot name");

    std::string err;
    std::unique_ptr<SlotStore> store;
    if (!open_slots(store, err)) return fail(err);

    if (!store->remove(args[0], err)) return fail(err);
    std::cout << "deleted slot \"" << args[0] << "\"\n";
    record_history("rm", args[0], 0);
    return 0;
}


// ---------------- Transforms ----------------
static int cmd_fx(const std::vector<std::string>& args) {
    bool list = false;
    bool dry_run = false;
    std::vector<std::string> names;
    for (const auto& a : args) {
        if (a == "--list" || a == "-l") {
            list = true;
        }
        else if (a == "--dry-run" || a == "-n") {
            dry_run = true;
        }
        else if (!a.empty() && a[0] == '-') {
            return usage_error("fx", "unknown flag: " + a);
        }
        else {
            names.push_back(a);
        }
    }
    if (!list && names.empty()) return usage_error("fx", "no transform given");

    std::string err;
    Config cfg;
    if (!load_config_or_defaults(cfg, err)) return fail(err);

    if (list) {
        print_fx_list(std::cout, cfg);
        return 0;
    }

    ClipboardBackend b;
    if (!require_backend(b, err)) return fail(err);

    Bytes input;
    if (!clipboard_get(b, input)) {
        return fail("reading clipboard failed");
    }

    Bytes output;
    if (!apply_fx_chain(cfg, names, input, output, err)) return fail(err);

    if (dry_run) {
        if (!write_stdout(output)) return fail("writing stdout failed");
        return 0;
    }

    if (!clipboard_set(b, output)) {
        return fail("writing clipboard failed");
    }
    std::string label = fx_chain_label(names);
    std::cout << "fx " << label << ": " << format_size(input.size())
        << " \xe2\x86\x92 " << format_size(output.size()) << "\n";
    audit_log_level(LogLevel::INFO,
        "Applied " + label,
        "fx",
        "success");
    record_history("fx:" + label, "", output.size());
    return 0;
}

static int cmd_doctor(const std::vector<std::string>& args) {
    if (!args.empty()) return usage_error("doctor", "doctor does not take arguments");
    return run_doctor(std::cout) ? 0 : 1;
}


// ---------------- History ----------------
static int cmd_history(const std::vector<std::string>& args) {
    HistoryFilter filter;
    for (const auto& a : args) {
        if (a == "--peer") {
            filter.peer = true;
        }
        else if (a == "--slots") {
            filter.slots = true;
        }
        else if (a == "--fx") {
            filter.fx = true;
        }
        else {
            return usage_error("history", "unknown flag: " + a);
        }
    }

    std::string path = history_file_path();
    if (path.empty()) return fail("could not determine history path");

    std::vector<HistoryEntry> entries;
    if (!load_history(path, entries)) {
        return fail("reading history " + path + ": " + std::strerror(errno));
    }
    if (entries.empty()) {
        std::cout << "No history yet.\n";
        return 0;
    }
    if (!print_history(std::cout, entries, filter)) {
        std::cout << "No matching history entries.\n";
    }
    return 0;
}


// ---------------- Dispatch ----------------
int main(int argc, char** argv) {
    std::signal(SIGPIPE, SIG_IGN);

    if (!crypto_init()) {
        std::fprintf(stderr, "clipwire: libsodium initialization failed\n");
        return 1;
    }
    init_log_context();

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        struct stat st;
        if (fstat(STDIN_FILENO, &st) == 0 && !S_ISCHR(st.st_mode)) {
            // `... | clipwire`
            return cmd_copy({});
        }
        print_help();
        return 2;
    }

    std::string cmd = args[0];
    args.erase(args.begin());

    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_help();
        return 0;
    }
    if (cmd == "version" || cmd == "--version") {
        std::cout << APP_NAME << " " << APP_VERSION << "\n";
        return 0;
    }

    if (cmd == "receive") cmd = "recv";

    auto usage = k_command_usage.find(cmd);
    if (usage != k_command_usage.end() &&
        std::find_if(args.begin(), args.end(), [](const std::string& a) {
            return a == "--help" || a == "-h";
            }) != args.end())
    {
        std::cout << usage->second << "\n";
        return 0;
    }

    if (cmd == "copy")    return cmd_copy(args);
    if (cmd == "paste")   return cmd_paste(args);
    if (cmd == "clear")   return cmd_clear(args);
    if (cmd == "backend") return cmd_backend(args);
    if (cmd == "send")    return cmd_send(args);
    if (cmd == "recv")    return cmd_recv(args);
    if (cmd == "peek")    return cmd_peek(args);
    if (cmd == "watch")   return cmd_watch(args);
    if (cmd == "push")    return cmd_push(args);
    if (cmd == "pull")    return cmd_pull(args);
    if (cmd == "show")    return cmd_show(args);
    if (cmd == "slots")   return cmd_slots(args);
    if (cmd == "rm")      return cmd_rm(args);
    if (cmd == "fx")      return cmd_fx(args);
    if (cmd == "doctor")  return cmd_doctor(args);
    if (cmd == "history") return cmd_history(args);

    std::cerr << "clipwire: unknown command: " << cmd << "\n";
    std::cerr << "Run 'clipwire help' for usage.\n";
    return 2;
}
