#pragma once
#include "clipwire_common.hpp"

#include <string>
#include <vector>

// ---------- SessionID ----------
std::string generate_session_id();

// ---------- Formatting ----------
// 512 -> "512 B", 1536 -> "1.5 KiB"
std::string format_size(uint64_t bytes);

std::string join_args(const std::vector<std::string>& args, const char* sep = " ");

// ---------- Byte helpers ----------
Bytes to_bytes(const std::string& s);
std::string to_string(const Bytes& b);
