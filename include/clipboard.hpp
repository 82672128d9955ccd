#pragma once
#include "clipwire_common.hpp"

#include <string>
#include <vector>

// -------- Clipboard backends --------
enum class BackendKind { DARWIN, WAYLAND, X11, WSL };

struct ClipboardBackend {
    BackendKind kind = BackendKind::X11;
    std::vector<std::string> copy_cmd;
    std::vector<std::string> paste_cmd;
    std::vector<std::string> clear_cmd;   // empty: clear by copying nothing
    std::vector<std::string> missing;     // tools not found on PATH
    std::string env_source;               // variable that selected it
};

const char* backend_kind_str(BackendKind kind);
std::string install_hint(BackendKind kind);

// Picks the platform clipboard tools from the environment.
// false if no backend applies.
bool detect_backend(ClipboardBackend& out);

// -------- Clipboard API exposed to main --------
bool clipboard_set(const ClipboardBackend& b, const Bytes& data, bool quiet = false);
bool clipboard_get(const ClipboardBackend& b, Bytes& out, bool quiet = false);
bool clipboard_clear(const ClipboardBackend& b);


// -------- Local clipboard capability --------
// false from read/write is a transient failure
class LocalClipboard {
public:
    virtual ~LocalClipboard() = default;
    virtual bool read(Bytes& out) = 0;
    virtual bool write(const Bytes& data) = 0;
};

// Clipboard of this host through the detected backend tools
class SystemClipboard : public LocalClipboard {
public:
    // quiet: silence tool stderr and per-failure logging (polling use)
    explicit SystemClipboard(ClipboardBackend backend, bool quiet = false)
        : backend_(std::move(backend)), quiet_(quiet)
    {
    }

    bool read(Bytes& out) override;
    bool write(const Bytes& data) override;

    const ClipboardBackend& backend() const { return backend_; }

private:
    ClipboardBackend backend_;
    bool quiet_ = false;
};
