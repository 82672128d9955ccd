#pragma once
#include "clipwire_common.hpp"

#include <string>

// -------- Path helpers --------
std::string get_user_home_dir();

// $XDG_CONFIG_HOME/clipwire or ~/.config/clipwire; empty if undeterminable
std::string config_dir_path();

// Creates `path` (and a missing parent) with `mode`
bool ensure_dir_exists(const std::string& path, mode_t mode);

// -------- File helpers --------
// write to temp file in the same directory, fsync, rename; file mode 0600
bool atomic_write_file(const std::string& path, const byte* buf, size_t len);

// false with errno == ENOENT when the file does not exist
bool read_file(const std::string& path, std::string& out, size_t max_size);
