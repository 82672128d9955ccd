#include "io.hpp"
#include "logging.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <iostream>

// ---------- Path helpers ----------
std::string get_user_home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        struct passwd* pw = getpwuid(geteuid());
        if (pw && pw->pw_dir) {
            home = pw->pw_dir;
        }
    }
    if (!home || !*home) return "";
    return std::string(home);
}

std::string config_dir_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/" + APP_NAME;
    }
    std::string home = get_user_home_dir();
    if (home.empty()) return "";
    return home + "/.config/" + APP_NAME;
}

static bool make_one_dir(const std::string& path, mode_t mode) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            std::cerr << path << " exists but is not a directory\n";
            return false;
        }
        return true;
    }
    if (mkdir(path.c_str(), mode) != 0 && errno != EEXIST) {
        std::cerr << "Failed to create directory " << path << ": " << strerror(errno) << "\n";
        return false;
    }
    return true;
}

bool ensure_dir_exists(const std::string& path, mode_t mode) {
    if (path.empty()) return false;

    size_t slash = path.find_last_of('/');
    if (slash != std::string::npos && slash > 0) {
        std::string parent = path.substr(0, slash);
        struct stat st;
        if (stat(parent.c_str(), &st) != 0 && !make_one_dir(parent, S_IRWXU)) {
            return false;
        }
    }
    return make_one_dir(path, mode);
}


// -------- Atomic file write helper --------
bool atomic_write_file(const std::string& path, const byte* buf, size_t len) {
    if (!buf && len > 0) return false;

    std::string tmpl = path + ".tmpXXXXXX";
    std::vector<char> temp(tmpl.begin(), tmpl.end());
    temp.push_back('\0');

    int fd = mkostemp(temp.data(), O_CLOEXEC);
    if (fd < 0) {
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: mkostemp failed for " + path,
            "io_module",
            "failure");
        return false;
    }
    // set perms to 0600
    if (fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        close(fd);
        unlink(temp.data());
        return false;
    }

    size_t written = 0;
    while (written < len) {
        ssize_t w = write(fd, buf + written, len - written);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) {
            audit_log_level(LogLevel::ERROR,
                "atomic_write_file: write failed for " + path,
                "io_module",
                "failure");
            close(fd);
            unlink(temp.data());
            return false;
        }
        written += static_cast<size_t>(w);
    }

    if (fsync(fd) != 0) {
        audit_log_level(LogLevel::WARN,
            "atomic_write_file: fsync failed for " + path,
            "io_module",
            "failure");
    }
    if (close(fd) != 0) {
        audit_log_level(LogLevel::WARN,
            "atomic_write_file: close failed for " + path,
            "io_module",
            "failure");
    }
    if (rename(temp.data(), path.c_str()) != 0) {
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: rename failed for " + path,
            "io_module",
            "failure");
        unlink(temp.data());
        return false;
    }
    return true;
}


// -------- Whole-file read --------
bool read_file(const std::string& path, std::string& out, size_t max_size) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) return false;

    std::string s;
    char buf[4096];
    size_t r;
    while ((r = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        if (s.size() + r > max_size) {
            std::fclose(f);
            audit_log_level(LogLevel::WARN,
                "read_file: file too large: " + path,
                "io_module",
                "failure");
            errno = EFBIG;
            return false;
        }
        s.append(buf, r);
    }

    bool ok = !std::ferror(f);
    std::fclose(f);
    if (!ok) {
        audit_log_level(LogLevel::ERROR,
            "read_file: fread failed on " + path,
            "io_module",
            "failure");
        errno = EIO;
        return false;
    }

    out = std::move(s);
    return true;
}
