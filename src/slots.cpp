#include "slots.hpp"
#include "crypto.hpp"
#include "io.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <dirent.h>
#include <cctype>
#include <yaml-cpp/yaml.h>

static constexpr int SLOT_FORMAT_VERSION = 1;

bool valid_slot_name(const std::string& name) {
    if (name.empty() || name.size() > MAX_SLOT_NAME_LEN) return false;
    if (name[0] == '.') return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
        });
}


// ---------------- Time helpers ----------------
static std::string format_utc(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
        return "1970-01-01T00:00:00Z";
    }
    return buf;
}

static bool parse_utc(const std::string& s, std::time_t& out) {
    std::tm tm{};
    const char* end = strptime(s.c_str(), "%Y-%m-%dT%H:%M:%SZ", &tm);
    if (!end || *end != '\0') return false;
    out = timegm(&tm);
    return true;
}

static std::string host_name() {
    char buf[256] = { 0 };
    if (gethostname(buf, sizeof(buf) - 1) != 0) return "unknown";
    return buf;
}

static const char* os_name() {
#if defined(__APPLE__)
    return "darwin";
#else
    return "linux";
#endif
}


// ---------------- LocalSlotStore ----------------
LocalSlotStore::LocalSlotStore(std::string dir, std::string passphrase, unsigned ttl_days)
    : dir_(std::move(dir)), passphrase_(std::move(passphrase)), ttl_days_(ttl_days)
{
}

LocalSlotStore::~LocalSlotStore() {
    if (!passphrase_.empty()) {
        sodium_memzero(&passphrase_[0], passphrase_.size());
    }
}

std::string LocalSlotStore::slot_path(const std::string& slot) const {
    return dir_ + "/" + slot + SLOT_SUFFIX;
}

bool LocalSlotStore::seal(const Bytes& data, Bytes& stored,
    std::string& salt_b64, std::string& nonce_b64)
{
    Bytes salt(SALT_LEN);
    randombytes_buf(salt.data(), salt.size());

    byte key[KEY_LEN];
    if (!derive_key_from_passphrase(passphrase_, salt.data(), key)) {
        sodium_memzero(key, sizeof(key));
        return false;
    }

    Bytes nonce(NONCE_LEN);
    bool ok = encrypt_blob(key, data, stored, nonce.data());
    sodium_memzero(key, sizeof(key));
    if (!ok) return false;

    salt_b64 = base64_encode(salt);
    nonce_b64 = base64_encode(nonce);
    return true;
}

bool LocalSlotStore::open(const std::string& slot, const Bytes& stored,
    const std::string& salt_b64, const std::string& nonce_b64,
    Bytes& out, std::string& err)
{
    if (passphrase_.empty()) {
        err = "slot \"" + slot + "\" is encrypted but no passphrase is configured";
        return false;
    }

    Bytes salt, nonce;
    if (!base64_decode(salt_b64, salt) || salt.size() != SALT_LEN ||
        !base64_decode(nonce_b64, nonce) || nonce.size() != NONCE_LEN) {
        err = "slot \"" + slot + "\" has a corrupt encryption header";
        return false;
    }

    byte key[KEY_LEN];
    if (!derive_key_from_passphrase(passphrase_, salt.data(), key)) {
        sodium_memzero(key, sizeof(key));
        err = "deriving slot key failed";
        return false;
    }
    bool ok = decrypt_blob(key, stored, nonce.data(), out);
    sodium_memzero(key, sizeof(key));
    if (!ok) {
        err = "decrypting slot \"" + slot + "\" failed (wrong passphrase or corrupted file)";
        return false;
    }
    return true;
}

bool LocalSlotStore::push(const std::string& slot, const Bytes& data, std::string& err) {
    if (!valid_slot_name(slot)) {
        err = "invalid slot name \"" + slot + "\"; use letters, digits, '_', '-' or '.'";
        return false;
    }
    if (!ensure_dir_exists(dir_, S_IRWXU)) {
        err = "creating slots directory " + dir_ + " failed";
        return false;
    }

    Bytes stored = data;
    std::string salt_b64, nonce_b64;
    bool encrypted = !passphrase_.empty();
    if (encrypted && !seal(data, stored, salt_b64, nonce_b64)) {
        err = "encrypting slot \"" + slot + "\" failed";
        return false;
    }

    std::time_t now = std::time(nullptr);
    YAML::Emitter e;
    e << YAML::BeginMap;
    e << YAML::Key << "version" << YAML::Value << SLOT_FORMAT_VERSION;
    e << YAML::Key << "created_at" << YAML::Value << format_utc(now);
    if (ttl_days_ > 0) {
        e << YAML::Key << "expires_at" << YAML::Value
            << format_utc(now + static_cast<std::time_t>(ttl_days_) * 24 * 60 * 60);
    }
    e << YAML::Key << "hostname" << YAML::Value << host_name();
    e << YAML::Key << "os" << YAML::Value << os_name();
    e << YAML::Key << "len" << YAML::Value << static_cast<unsigned long long>(data.size());
    e << YAML::Key << "encrypted" << YAML::Value << encrypted;
    if (encrypted) {
        e << YAML::Key << "salt" << YAML::Value << salt_b64;
        e << YAML::Key << "nonce" << YAML::Value << nonce_b64;
    }
    e << YAML::Key << "data" << YAML::Value << base64_encode(stored);
    e << YAML::EndMap;
    if (!e.good()) {
        err = std::string("encoding slot failed: ") + e.GetLastError();
        return false;
    }

    std::string text = std::string(e.c_str()) + "\n";
    if (!atomic_write_file(slot_path(slot),
        reinterpret_cast<const byte*>(text.data()),
        text.size())) {
        err = "writing slot file " + slot_path(slot) + " failed";
        return false;
    }

    audit_log_level(LogLevel::INFO,
        "Pushed " + std::to_string(data.size()) + " bytes to slot " + slot +
        (encrypted ? " (encrypted)" : ""),
        "slot_push",
        "success");
    return true;
}

bool LocalSlotStore::pull(const std::string& slot, Bytes& out, SlotMeta& meta, std::string& err) {
    if (!valid_slot_name(slot)) {
        err = "invalid slot name \"" + slot + "\"";
        return false;
    }

    std::string path = slot_path(slot);
    std::string text;
    if (!read_file(path, text, MAX_SLOT_FILE_SIZE)) {
        if (errno == ENOENT) {
            err = "slot \"" + slot + "\" not found";
        }
        else {
            err = "reading slot file " + path + ": " + std::strerror(errno);
        }
        return false;
    }

    SlotMeta m;
    Bytes stored;
    std::string salt_b64, nonce_b64;
    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap() || !root["data"]) {
            err = "slot file " + path + " is malformed";
            return false;
        }
        int version = root["version"] ? root["version"].as<int>() : 0;
        if (version != SLOT_FORMAT_VERSION) {
            err = "slot file " + path + " has unsupported version " + std::to_string(version);
            return false;
        }
        m.created_at = root["created_at"] ? root["created_at"].as<std::string>() : "";
        m.expires_at = root["expires_at"] ? root["expires_at"].as<std::string>() : "";
        m.hostname = root["hostname"] ? root["hostname"].as<std::string>() : "";
        m.os = root["os"] ? root["os"].as<std::string>() : "";
        m.length = root["len"] ? root["len"].as<unsigned long long>() : 0;
        m.encrypted = root["encrypted"] ? root["encrypted"].as<bool>() : false;
        salt_b64 = root["salt"] ? root["salt"].as<std::string>() : "";
        nonce_b64 = root["nonce"] ? root["nonce"].as<std::string>() : "";
        if (!base64_decode(root["data"].as<std::string>(), stored)) {
            err = "slot file " + path + " has corrupt data";
            return false;
        }
    }
    catch (const YAML::Exception& e) {
        err = "parsing slot file " + path + ": " + e.what();
        return false;
    }

    std::time_t expires = 0;
    if (!m.expires_at.empty() && parse_utc(m.expires_at, expires) && std::time(nullptr) >= expires) {
        std::string ignored;
        if (!remove(slot, ignored)) {
            audit_log_level(LogLevel::WARN,
                "Could not delete expired slot " + slot + ": " + ignored,
                "slot_pull",
                "failure");
        }
        err = "slot \"" + slot + "\" has expired";
        return false;
    }

    Bytes data;
    if (m.encrypted) {
        if (!open(slot, stored, salt_b64, nonce_b64, data, err)) return false;
    }
    else {
        data = std::move(stored);
    }

    if (data.size() != m.length) {
        err = "slot \"" + slot + "\" is truncated or corrupt";
        return false;
    }

    out = std::move(data);
    meta = std::move(m);
    return true;
}

bool LocalSlotStore::list(std::vector<SlotInfo>& out, std::string& err) {
    out.clear();
    DIR* d = opendir(dir_.c_str());
    if (!d) {
        if (errno == ENOENT) return true;
        err = "reading slots directory " + dir_ + ": " + std::strerror(errno);
        return false;
    }

    const std::string suffix = SLOT_SUFFIX;
    while (struct dirent* ent = readdir(d)) {
        std::string fname = ent->d_name;
        if (fname.size() <= suffix.size() ||
            fname.compare(fname.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        std::string name = fname.substr(0, fname.size() - suffix.size());
        if (!valid_slot_name(name)) continue;

        struct stat st;
        if (stat((dir_ + "/" + fname).c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;

        out.push_back(SlotInfo{ name, static_cast<uint64_t>(st.st_size), st.st_mtime });
    }
    closedir(d);

    std::sort(out.begin(), out.end(), [](const SlotInfo& a, const SlotInfo& b) {
        return a.name < b.name;
        });
    return true;
}

bool LocalSlotStore::remove(const std::string& slot, std::string& err) {
    if (!valid_slot_name(slot)) {
        err = "invalid slot name \"" + slot + "\"";
        return false;
    }
    if (unlink(slot_path(slot).c_str()) != 0) {
        if (errno == ENOENT) {
            err = "slot \"" + slot + "\" not found";
        }
        else {
            err = "deleting slot file " + slot_path(slot) + ": " + std::strerror(errno);
        }
        return false;
    }
    audit_log_level(LogLevel::INFO,
        "Deleted slot " + slot,
        "slot_rm",
        "success");
    return true;
}


// ---------------- Construction from config ----------------
std::string slots_dir_path(const Config& cfg) {
    if (!cfg.sync.path.empty()) return cfg.sync.path;
    std::string dir = config_dir_path();
    if (dir.empty()) return "";
    return dir + "/" + SLOTS_DIRNAME;
}

bool open_slot_store(const Config& cfg, std::unique_ptr<SlotStore>& out, std::string& err) {
    if (cfg.sync.backend != "local") {
        err = "unsupported sync backend: " + cfg.sync.backend;
        return false;
    }
    std::string dir = slots_dir_path(cfg);
    if (dir.empty()) {
        err = "could not determine slots directory";
        return false;
    }
    std::string passphrase = cfg.sync.encryption == "xchacha20" ? cfg.sync.passphrase : "";
    out.reset(new LocalSlotStore(dir, passphrase, cfg.sync.ttl_days));
    return true;
}


// ---------------- Listing ----------------
std::string format_age(std::time_t then, std::time_t now) {
    long long d = static_cast<long long>(now - then);
    if (d < 0) d = 0;
    if (d < 60) return std::to_string(d) + "s ago";
    if (d < 60 * 60) return std::to_string(d / 60) + "m ago";
    if (d < 24 * 60 * 60) return std::to_string(d / (60 * 60)) + "h ago";
    return std::to_string(d / (24 * 60 * 60)) + "d ago";
}

void print_slots(std::ostream& os, const std::vector<SlotInfo>& slots, std::time_t now) {
    if (slots.empty()) {
        os << "No slots found.\n";
        return;
    }
    os << std::left << std::setw(20) << "NAME" << "  "
        << std::setw(10) << "SIZE" << "  "
        << "AGE" << "\n";
    for (const auto& s : slots) {
        os << std::left << std::setw(20) << s.name << "  "
            << std::setw(10) << format_size(s.size) << "  "
            << format_age(s.modified, now) << "\n";
    }
}
