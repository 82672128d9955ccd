#pragma once

#include <sodium.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <pwd.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <array>
#include <iostream>
#include <sstream>
#include <ctime>
#include <iomanip>
#include <cerrno>
#include <limits>
#include <algorithm>
#include <chrono>
#include <utility>

// -------- Configuration constants --------
inline constexpr const char* APP_NAME = "clipwire";
inline constexpr const char* APP_VERSION = "0.4.0";
inline constexpr const char* CONFIG_FILENAME = "config.yaml";
inline constexpr const char* HISTORY_FILENAME = "history.log";
inline constexpr const char* AUDIT_LOG = "audit.log";
inline constexpr const char* DEFAULT_REMOTE_CMD = "clipwire";

// Watch loop timing (milliseconds)
inline constexpr unsigned DEFAULT_WATCH_INTERVAL_MS = 500;
inline constexpr unsigned MIN_WATCH_INTERVAL_MS = 100;
inline constexpr unsigned MAX_WATCH_INTERVAL_MS = 24 * 60 * 60 * 1000; // one day

// limits
inline constexpr size_t MAX_CLIPBOARD_SIZE = 32 * 1024 * 1024; // 32 MB read cap
inline constexpr size_t MAX_HISTORY_ENTRIES = 50;
inline constexpr size_t MAX_TEXT_FILE_SIZE = 1024 * 1024; // config and history files
inline constexpr size_t FINGERPRINT_LEN = crypto_hash_sha256_BYTES;

// Slot encryption: Argon2id key, XChaCha20-Poly1305 payload
inline constexpr size_t SALT_LEN = crypto_pwhash_SALTBYTES;
inline constexpr size_t KEY_LEN = crypto_aead_xchacha20poly1305_ietf_KEYBYTES;
inline constexpr size_t NONCE_LEN = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
inline constexpr size_t ABYTES = crypto_aead_xchacha20poly1305_ietf_ABYTES;
inline constexpr unsigned long long OPSLIMIT = crypto_pwhash_OPSLIMIT_INTERACTIVE;
inline constexpr size_t MEMLIMIT = crypto_pwhash_MEMLIMIT_INTERACTIVE;
inline constexpr size_t MAX_PASS_LEN = 1024;

// Slots
inline constexpr const char* SLOTS_DIRNAME = "slots";
inline constexpr const char* SLOT_SUFFIX = ".slot";
inline constexpr size_t MAX_SLOT_NAME_LEN = 64;
inline constexpr size_t MAX_SLOT_FILE_SIZE = MAX_CLIPBOARD_SIZE / 3 * 4 + 64 * 1024; // base64 + metadata

using byte = unsigned char;
using Bytes = std::vector<byte>;
using Fingerprint = std::array<byte, FINGERPRINT_LEN>; // zero-initialized = "never seen"

struct PeerDescriptor {
    std::string name;       // e.g. "dev"
    std::string address;    // ssh destination, e.g. "user@devbox"
    std::string remote_cmd; // command run on the peer
};

using PeerMap = std::map<std::string, PeerDescriptor>; // key by name
