#pragma once
#include "clipwire_common.hpp"
#include "config.hpp"

#include <ctime>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

// -------- Slot records --------
struct SlotMeta {
    std::string created_at;   // RFC 3339, UTC
    std::string expires_at;   // empty: never expires
    std::string hostname;     // host that pushed it
    std::string os;
    uint64_t length = 0;      // payload bytes before encryption
    bool encrypted = false;
};

struct SlotInfo {
    std::string name;
    uint64_t size = 0;        // bytes on disk
    std::time_t modified = 0;
};

// letters, digits, '_', '-' and '.', not starting with '.'; at most MAX_SLOT_NAME_LEN
bool valid_slot_name(const std::string& name);


// -------- Slot storage capability --------
// Named clipboard snapshots. On failure `err` holds an operator message.
class SlotStore {
public:
    virtual ~SlotStore() = default;
    virtual bool push(const std::string& slot, const Bytes& data, std::string& err) = 0;
    virtual bool pull(const std::string& slot, Bytes& out, SlotMeta& meta, std::string& err) = 0;
    virtual bool list(std::vector<SlotInfo>& out, std::string& err) = 0;
    virtual bool remove(const std::string& slot, std::string& err) = 0;
};

// One file per slot, <dir>/<name>.slot, mode 0600.
// A non-empty passphrase encrypts new slots; expired slots are deleted on pull.
class LocalSlotStore : public SlotStore {
public:
    explicit LocalSlotStore(std::string dir, std::string passphrase = "", unsigned ttl_days = 0);
    ~LocalSlotStore() override;

    LocalSlotStore(const LocalSlotStore&) = delete;
    LocalSlotStore& operator=(const LocalSlotStore&) = delete;

    bool push(const std::string& slot, const Bytes& data, std::string& err) override;
    bool pull(const std::string& slot, Bytes& out, SlotMeta& meta, std::string& err) override;
    bool list(std::vector<SlotInfo>& out, std::string& err) override;
    bool remove(const std::string& slot, std::string& err) override;

    const std::string& dir() const { return dir_; }
    std::string slot_path(const std::string& slot) const;

private:
    bool seal(const Bytes& data, Bytes& stored, std::string& salt_b64, std::string& nonce_b64);
    bool open(const std::string& slot, const Bytes& stored,
        const std::string& salt_b64, const std::string& nonce_b64,
        Bytes& out, std::string& err);

    std::string dir_;
    std::string passphrase_;
    unsigned ttl_days_ = 0;
};

// <sync.path>, else <config dir>/slots; empty if undeterminable
std::string slots_dir_path(const Config& cfg);

bool open_slot_store(const Config& cfg, std::unique_ptr<SlotStore>& out, std::string& err);


// -------- Listing --------
// "42s ago", "5m ago", "3h ago", "2d ago"
std::string format_age(std::time_t then, std::time_t now);

void print_slots(std::ostream& os, const std::vector<SlotInfo>& slots, std::time_t now);
