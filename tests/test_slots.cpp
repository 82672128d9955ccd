#include <gtest/gtest.h>
#include "test_support.hpp"

#include "slots.hpp"

#include <sstream>

class SlotStoreTest : public ::testing::Test {
protected:
    TempDir dir;

    std::string slots_dir() const { return dir.file("slots"); }
};

TEST(SlotNameTest, Validation) {
    EXPECT_TRUE(valid_slot_name("work"));
    EXPECT_TRUE(valid_slot_name("a.b-c_d9"));
    EXPECT_FALSE(valid_slot_name(""));
    EXPECT_FALSE(valid_slot_name(".hidden"));
    EXPECT_FALSE(valid_slot_name("../etc"));
    EXPECT_FALSE(valid_slot_name("a/b"));
    EXPECT_FALSE(valid_slot_name("with space"));
    EXPECT_TRUE(valid_slot_name(std::string(MAX_SLOT_NAME_LEN, 'x')));
    EXPECT_FALSE(valid_slot_name(std::string(MAX_SLOT_NAME_LEN + 1, 'x')));
}

TEST_F(SlotStoreTest, PushThenPullPlain) {
    LocalSlotStore store(slots_dir());
    Bytes payload = { 'h', 'i', 0x00, 0xff, '\n' };
    std::string err;
    ASSERT_TRUE(store.push("work", payload, err)) << err;

    struct stat st;
    ASSERT_EQ(stat(store.slot_path("work").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
    ASSERT_EQ(stat(slots_dir().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0700u);

    Bytes out;
    SlotMeta meta;
    ASSERT_TRUE(store.pull("work", out, meta, err)) << err;
    EXPECT_EQ(out, payload);
    EXPECT_FALSE(meta.encrypted);
    EXPECT_EQ(meta.length, payload.size());
    EXPECT_FALSE(meta.hostname.empty());
    EXPECT_TRUE(meta.expires_at.empty());
}

TEST_F(SlotStoreTest, PushOverwritesAndEmptyPayloadRoundTrips) {
    LocalSlotStore store(slots_dir());
    std::string err;
    ASSERT_TRUE(store.push("s", to_bytes("first"), err)) << err;
    ASSERT_TRUE(store.push("s", Bytes{}, err)) << err;

    Bytes out = to_bytes("stale");
    SlotMeta meta;
    ASSERT_TRUE(store.pull("s", out, meta, err)) << err;
    EXPECT_TRUE(out.empty());
}

TEST_F(SlotStoreTest, EncryptedSlotNeedsTheRightPassphrase) {
    std::string err;
    {
        LocalSlotStore store(slots_dir(), "hunter2");
        ASSERT_TRUE(store.push("secret", to_bytes("api key"), err)) << err;

        Bytes out;
        SlotMeta meta;
        ASSERT_TRUE(store.pull("secret", out, meta, err)) << err;
        EXPECT_EQ(to_string(out), "api key");
        EXPECT_TRUE(meta.encrypted);
    }

    std::string text;
    {
        std::ifstream f(slots_dir() + "/secret.slot");
        std::stringstream ss;
        ss << f.rdbuf();
        text = ss.str();
    }
    EXPECT_EQ(text.find("api key"), std::string::npos);
    EXPECT_NE(text.find("salt:"), std::string::npos);

    LocalSlotStore wrong(slots_dir(), "hunter3");
    Bytes out;
    SlotMeta meta;
    EXPECT_FALSE(wrong.pull("secret", out, meta, err));
    EXPECT_NE(err.find("wrong passphrase"), std::string::npos);

    LocalSlotStore none(slots_dir());
    EXPECT_FALSE(none.pull("secret", out, meta, err));
    EXPECT_NE(err.find("no passphrase is configured"), std::string::npos);
}

TEST_F(SlotStoreTest, ExpiredSlotIsDeletedOnPull) {
    LocalSlotStore store(slots_dir());
    std::string err;
    ASSERT_TRUE(store.push("old", to_bytes("x"), err)) << err;

    dir.write("slots/old.slot",
        "version: 1\n"
        "created_at: 2020-01-01T00:00:00Z\n"
        "expires_at: 2020-01-02T00:00:00Z\n"
        "hostname: elsewhere\n"
        "os: linux\n"
        "len: 1\n"
        "encrypted: false\n"
        "data: eA==\n");

    Bytes out;
    SlotMeta meta;
    EXPECT_FALSE(store.pull("old", out, meta, err));
    EXPECT_NE(err.find("has expired"), std::string::npos);
    EXPECT_NE(access(store.slot_path("old").c_str(), F_OK), 0);
}

TEST_F(SlotStoreTest, TtlWritesExpiry) {
    LocalSlotStore store(slots_dir(), "", 3);
    std::string err;
    ASSERT_TRUE(store.push("t", to_bytes("x"), err)) << err;

    Bytes out;
    SlotMeta meta;
    ASSERT_TRUE(store.pull("t", out, meta, err)) << err;
    EXPECT_FALSE(meta.expires_at.empty());
    EXPECT_GT(meta.expires_at, meta.created_at);
}

TEST_F(SlotStoreTest, MissingAndInvalidSlots) {
    LocalSlotStore store(slots_dir());
    Bytes out;
    SlotMeta meta;
    std::string err;

    EXPECT_FALSE(store.pull("nope", out, meta, err));
    EXPECT_EQ(err, "slot \"nope\" not found");

    EXPECT_FALSE(store.remove("nope", err));
    EXPECT_EQ(err, "slot \"nope\" not found");

    EXPECT_FALSE(store.push("../escape", to_bytes("x"), err));
    EXPECT_NE(err.find("invalid slot name"), std::string::npos);
    EXPECT_NE(access(dir.file("escape.slot").c_str(), F_OK), 0);
}

TEST_F(SlotStoreTest, CorruptSlotFileFails) {
    LocalSlotStore store(slots_dir());
    std::string err;
    ASSERT_TRUE(store.push("c", to_bytes("abc"), err)) << err;

    dir.write("slots/c.slot", "version: 1\nlen: 3\nencrypted: false\ndata: '***'\n");
    Bytes out;
    SlotMeta meta;
    EXPECT_FALSE(store.pull("c", out, meta, err));

    dir.write("slots/c.slot", "version: 1\nlen: 9\nencrypted: false\ndata: YWJj\n");
    EXPECT_FALSE(store.pull("c", out, meta, err));
    EXPECT_NE(err.find("truncated or corrupt"), std::string::npos);

    dir.write("slots/c.slot", "version: 2\ndata: YWJj\n");
    EXPECT_FALSE(store.pull("c", out, meta, err));
    EXPECT_NE(err.find("unsupported version"), std::string::npos);
}

TEST_F(SlotStoreTest, ListAndRemove) {
    LocalSlotStore store(slots_dir());
    std::vector<SlotInfo> slots;
    std::string err;

    ASSERT_TRUE(store.list(slots, err)) << err;
    EXPECT_TRUE(slots.empty());

    ASSERT_TRUE(store.push("beta", to_bytes("2"), err)) << err;
    ASSERT_TRUE(store.push("alpha", to_bytes("1"), err)) << err;
    dir.write("slots/notes.txt", "ignored");

    ASSERT_TRUE(store.list(slots, err)) << err;
    ASSERT_EQ(slots.size(), 2u);
    EXPECT_EQ(slots[0].name, "alpha");
    EXPECT_EQ(slots[1].name, "beta");
    EXPECT_GT(slots[0].size, 0u);

    ASSERT_TRUE(store.remove("alpha", err)) << err;
    ASSERT_TRUE(store.list(slots, err)) << err;
    ASSERT_EQ(slots.size(), 1u);
    EXPECT_EQ(slots[0].name, "beta");
}

TEST_F(SlotStoreTest, StoreFromConfig) {
    Config cfg;
    cfg.sync.path = slots_dir();
    cfg.sync.encryption = "xchacha20";
    cfg.sync.passphrase = "pw";
    EXPECT_EQ(slots_dir_path(cfg), slots_dir());

    std::unique_ptr<SlotStore> store;
    std::string err;
    ASSERT_TRUE(open_slot_store(cfg, store, err)) << err;
    ASSERT_TRUE(store->push("x", to_bytes("y"), err)) << err;

    Bytes out;
    SlotMeta meta;
    ASSERT_TRUE(store->pull("x", out, meta, err)) << err;
    EXPECT_TRUE(meta.encrypted);

    ScopedEnv xdg("XDG_CONFIG_HOME", dir.path().c_str());
    Config defaults;
    EXPECT_EQ(slots_dir_path(defaults), dir.file("clipwire/slots"));

    defaults.sync.backend = "s3";
    EXPECT_FALSE(open_slot_store(defaults, store, err));
}

TEST(SlotListingTest, FormatAge) {
    EXPECT_EQ(format_age(1000, 1042), "42s ago");
    EXPECT_EQ(format_age(1000, 1000 + 5 * 60 + 3), "5m ago");
    EXPECT_EQ(format_age(0, 3 * 3600 + 59), "3h ago");
    EXPECT_EQ(format_age(0, 2 * 86400 + 10), "2d ago");
    EXPECT_EQ(format_age(100, 50), "0s ago");
}

TEST(SlotListingTest, PrintSlots) {
    std::ostringstream empty;
    print_slots(empty, {}, 0);
    EXPECT_EQ(empty.str(), "No slots found.\n");

    std::ostringstream os;
    print_slots(os, { SlotInfo{ "work", 1536, 100 } }, 160);
    EXPECT_EQ(os.str().rfind("NAME", 0), 0u);
    EXPECT_NE(os.str().find("work"), std::string::npos);
    EXPECT_NE(os.str().find("1.5 KiB"), std::string::npos);
    EXPECT_NE(os.str().find("1m ago"), std::string::npos);
}
