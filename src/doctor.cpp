#include "doctor.hpp"
#include "clipboard.hpp"
#include "config.hpp"
#include "process.hpp"
#include "util.hpp"

static const char* os_label() {
#if defined(__APPLE__)
    return "darwin";
#else
    return "linux";
#endif
}

bool run_doctor(std::ostream& os) {
    os << "OS:        " << os_label() << "\n";

    ClipboardBackend b;
    bool healthy = detect_backend(b);
    if (!healthy) {
        os << "Backend:   none\n"
            << "Status:    ERROR\n"
            << "Tip:       set WAYLAND_DISPLAY or DISPLAY, or run inside WSL with clip.exe on PATH\n";
    }
    else {
        os << "Backend:   " << backend_kind_str(b.kind) << "\n";
        if (!b.env_source.empty()) {
            os << "Env:       " << b.env_source << "\n";
        }
        if (b.missing.empty()) {
            os << "Status:    OK\n";
        }
        else {
            healthy = false;
            os << "Status:    WARNING\n"
                << "Missing:   " << join_args(b.missing, ", ") << "\n"
                << "Tip:       " << install_hint(b.kind) << "\n";
        }
    }

    if (find_in_path("ssh")) {
        os << "ssh:       found\n";
    }
    else {
        os << "ssh:       not found (needed by send, recv, peek and watch)\n";
    }

    std::string path = config_file_path();
    if (path.empty()) {
        os << "Config:    could not determine config path\n";
    }
    else {
        struct stat st;
        bool present = stat(path.c_str(), &st) == 0;
        os << "Config:    " << path << (present ? "" : " (not found)") << "\n";
    }
    return healthy;
}
