#include "util.hpp"


// ---------- SessionID ----------
std::string generate_session_id() {
    std::array<byte, 16> buf{};
    randombytes_buf(buf.data(), buf.size());

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(32);

    for (size_t i = 0; i < buf.size(); ++i) {
        out[2 * i] = hex[(buf[i] >> 4) & 0x0F];
        out[2 * i + 1] = hex[buf[i] & 0x0F];
    }
    return out;
}


// ---------- Formatting ----------
std::string format_size(uint64_t bytes) {
    const uint64_t unit = 1024;
    if (bytes < unit) {
        return std::to_string(bytes) + " B";
    }

    uint64_t div = unit;
    int exp = 0;
    for (uint64_t n = bytes / unit; n >= unit && exp < 2; n /= unit) {
        div *= unit;
        exp++;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %ciB",
        static_cast<double>(bytes) / static_cast<double>(div),
        "KMG"[exp]);
    return buf;
}

std::string join_args(const std::vector<std::string>& args, const char* sep) {
    std::string out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) out += sep;
        out += args[i];
    }
    return out;
}


// ---------- Byte helpers ----------
Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

std::string to_string(const Bytes& b) {
    return std::string(b.begin(), b.end());
}
