#include "clipboard.hpp"
#include "logging.hpp"
#include "process.hpp"

// ---------------- Backend naming ----------------
const char* backend_kind_str(BackendKind kind) {
    switch (kind) {
    case BackendKind::DARWIN:  return "darwin";
    case BackendKind::WAYLAND: return "wayland";
    case BackendKind::X11:     return "x11";
    case BackendKind::WSL:     return "wsl";
    default:                   return "unknown";
    }
}

std::string install_hint(BackendKind kind) {
    switch (kind) {
    case BackendKind::WAYLAND:
        return "Install wl-clipboard: sudo apt install wl-clipboard (Debian/Ubuntu) or sudo dnf install wl-clipboard (Fedora)";
    case BackendKind::X11:
        return "Install xclip: sudo apt install xclip (Debian/Ubuntu) or sudo dnf install xclip (Fedora)";
    case BackendKind::DARWIN:
        return "pbcopy/pbpaste should be available by default on macOS";
    case BackendKind::WSL:
        return "Ensure clip.exe and powershell.exe are in your PATH";
    default:
        return "Run 'clipwire backend' for more information";
    }
}


// ---------------- Platform detection ----------------
static bool env_set(const char* name) {
    const char* v = std::getenv(name);
    return v && *v;
}

static bool detect_wayland(ClipboardBackend& b) {
    if (!env_set("WAYLAND_DISPLAY")) return false;

    b = ClipboardBackend{};
    b.kind = BackendKind::WAYLAND;
    b.copy_cmd = { "wl-copy" };
    b.paste_cmd = { "wl-paste", "--no-newline" };
    b.clear_cmd = { "wl-copy", "--clear" };
    b.env_source = "WAYLAND_DISPLAY";
    if (!find_in_path("wl-copy")) b.missing.push_back("wl-copy");
    if (!find_in_path("wl-paste")) b.missing.push_back("wl-paste");
    return true;
}

static bool detect_x11(ClipboardBackend& b) {
    if (!env_set("DISPLAY")) return false;

    b = ClipboardBackend{};
    b.kind = BackendKind::X11;
    b.env_source = "DISPLAY";
    if (find_in_path("xclip")) {
        b.copy_cmd = { "xclip", "-selection", "clipboard" };
        b.paste_cmd = { "xclip", "-selection", "clipboard", "-o" };
    }
    else if (find_in_path("xsel")) {
        b.copy_cmd = { "xsel", "--clipboard", "--input" };
        b.paste_cmd = { "xsel", "--clipboard", "--output" };
        b.clear_cmd = { "xsel", "--clipboard", "--clear" };
    }
    else {
        b.copy_cmd = { "xclip", "-selection", "clipboard" };
        b.paste_cmd = { "xclip", "-selection", "clipboard", "-o" };
        b.missing.push_back("xclip/xsel");
    }
    return true;
}

static bool detect_wsl(ClipboardBackend& b) {
    // clip.exe on PATH is taken as a WSL-style setup
    if (!find_in_path("clip.exe")) return false;

    b = ClipboardBackend{};
    b.kind = BackendKind::WSL;
    b.copy_cmd = { "clip.exe" };
    b.paste_cmd = { "powershell.exe", "-NoProfile", "-Command", "Get-Clipboard" };
    if (!find_in_path("powershell.exe")) b.missing.push_back("powershell.exe");
    return true;
}

bool detect_backend(ClipboardBackend& out) {
#if defined(__APPLE__)
    out = ClipboardBackend{};
    out.kind = BackendKind::DARWIN;
    out.copy_cmd = { "pbcopy" };
    out.paste_cmd = { "pbpaste" };
    if (!find_in_path("pbcopy")) out.missing.push_back("pbcopy");
    if (!find_in_path("pbpaste")) out.missing.push_back("pbpaste");
    return true;
#else
    if (detect_wayland(out)) return true;
    if (detect_x11(out)) return true;
    if (detect_wsl(out)) return true;

    audit_log_level(LogLevel::WARN,
        "detect_backend: no supported clipboard backend found",
        "clipboard_module",
        "failure");
    return false;
#endif
}


// ---------------- Clipboard operations ----------------
bool clipboard_set(const ClipboardBackend& b, const Bytes& data, bool quiet) {
    if (!b.missing.empty()) return false;

    bool ok = run_with_input(b.copy_cmd, data, quiet);
    if (!ok && !quiet) {
        audit_log_level(LogLevel::WARN,
            "clipboard_set: external tool failed",
            "clipboard_module",
            "failure");
    }
    return ok;
}

bool clipboard_get(const ClipboardBackend& b, Bytes& out, bool quiet) {
    if (!b.missing.empty()) return false;

    Bytes tmp;
    if (!run_capture(b.paste_cmd, tmp, quiet)) {
        if (!quiet) {
            audit_log_level(LogLevel::WARN,
                "clipboard_get: external tool failed",
                "clipboard_module",
                "failure");
        }
        return false;
    }
    out = std::move(tmp);
    return true;
}

bool clipboard_clear(const ClipboardBackend& b) {
    if (!b.missing.empty()) return false;
    if (!b.clear_cmd.empty()) {
        return run_command(b.clear_cmd);
    }
    return clipboard_set(b, Bytes{});
}


// ---------------- SystemClipboard ----------------
bool SystemClipboard::read(Bytes& out) {
    return clipboard_get(backend_, out, quiet_);
}

bool SystemClipboard::write(const Bytes& data) {
    return clipboard_set(backend_, data, quiet_);
}
