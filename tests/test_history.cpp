#include <gtest/gtest.h>
#include "test_support.hpp"

#include "history.hpp"

#include <sstream>

TEST(HistoryEscapeTest, SpecialCharacters) {
    std::string raw = "a\tb\nc\\d";
    EXPECT_EQ(escape_str(raw), "a\\tb\\nc\\\\d");
    EXPECT_EQ(unescape_str(escape_str(raw)), raw);
}

TEST(HistoryEscapeTest, UnknownEscapeIsKept) {
    EXPECT_EQ(unescape_str("a\\qb\\"), "a\\qb\\");
}

TEST(HistorySerializeTest, FieldWithTabSurvives) {
    std::vector<HistoryEntry> in = {
        { "2026-01-02 03:04:05", "send", "dev\tbox", 42 },
    };
    std::vector<HistoryEntry> out = deserialize_history(serialize_history(in));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].target, "dev\tbox");
    EXPECT_EQ(out[0].size, 42u);
}

TEST(HistorySerializeTest, SkipsMalformedLines) {
    std::string text =
        "2026-01-02 03:04:05\tsend\tdev\t10\n"
        "garbage line\n"
        "2026-01-02 03:04:06\trecv\tdev\tnot-a-number\n"
        "\n"
        "2026-01-02 03:04:07\tcopy\t\t3\n";
    std::vector<HistoryEntry> out = deserialize_history(text);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].command, "send");
    EXPECT_EQ(out[1].command, "copy");
    EXPECT_EQ(out[1].target, "");
}

class HistoryFileTest : public ::testing::Test {
protected:
    TempDir dir;
    std::string path() const { return dir.file("history.log"); }
};

TEST_F(HistoryFileTest, MissingFileIsEmptyHistory) {
    std::vector<HistoryEntry> entries = { HistoryEntry{} };
    EXPECT_TRUE(load_history(path(), entries));
    EXPECT_TRUE(entries.empty());
}

TEST_F(HistoryFileTest, RecordsInOrder) {
    ASSERT_TRUE(record_history_to(path(), "send", "dev", 5));
    ASSERT_TRUE(record_history_to(path(), "watch:recv", "dev", 3));

    std::vector<HistoryEntry> entries;
    ASSERT_TRUE(load_history(path(), entries));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].command, "send");
    EXPECT_EQ(entries[1].command, "watch:recv");
    EXPECT_EQ(entries[1].size, 3u);
    EXPECT_EQ(entries[1].timestamp.size(), 19u);

    struct stat st;
    ASSERT_EQ(stat(path().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST_F(HistoryFileTest, KeepsNewestFifty) {
    for (int i = 0; i < 60; ++i) {
        ASSERT_TRUE(record_history_to(path(), "send", "peer" + std::to_string(i), i));
    }

    std::vector<HistoryEntry> entries;
    ASSERT_TRUE(load_history(path(), entries));
    ASSERT_EQ(entries.size(), MAX_HISTORY_ENTRIES);
    EXPECT_EQ(entries.front().target, "peer10");
    EXPECT_EQ(entries.back().target, "peer59");
}

TEST(HistoryPrintTest, NewestFirstWithHeader) {
    std::vector<HistoryEntry> entries = {
        { "2026-01-02 03:04:05", "copy", "", 0 },
        { "2026-01-02 03:04:06", "send", "dev", 1536 },
    };
    std::ostringstream os;
    ASSERT_TRUE(print_history(os, entries, HistoryFilter{}));

    std::istringstream lines(os.str());
    std::string header, first, second;
    std::getline(lines, header);
    std::getline(lines, first);
    std::getline(lines, second);

    EXPECT_EQ(header.rfind("TIME", 0), 0u);
    EXPECT_NE(header.find("COMMAND"), std::string::npos);
    EXPECT_NE(first.find("send"), std::string::npos);
    EXPECT_NE(first.find("1.5 KiB"), std::string::npos);
    EXPECT_NE(second.find("copy"), std::string::npos);
}

TEST(HistoryPrintTest, PeerFilter) {
    std::vector<HistoryEntry> entries = {
        { "2026-01-02 03:04:05", "copy", "", 4 },
        { "2026-01-02 03:04:06", "watch:send", "dev", 5 },
    };
    HistoryFilter peer_only;
    peer_only.peer = true;
    std::ostringstream os;
    ASSERT_TRUE(print_history(os, entries, peer_only));
    EXPECT_EQ(os.str().find("copy"), std::string::npos);
    EXPECT_NE(os.str().find("watch:send"), std::string::npos);

    std::ostringstream none;
    EXPECT_FALSE(print_history(none, { entries[0] }, peer_only));
    EXPECT_TRUE(none.str().empty());
}

TEST(HistoryPrintTest, PeerCommands) {
    EXPECT_TRUE(is_peer_command("send"));
    EXPECT_TRUE(is_peer_command("recv"));
    EXPECT_TRUE(is_peer_command("peek"));
    EXPECT_TRUE(is_peer_command("watch:recv"));
    EXPECT_FALSE(is_peer_command("copy"));
    EXPECT_FALSE(is_peer_command("watcher"));
}

TEST(HistoryPrintTest, SlotAndFxCommands) {
    EXPECT_TRUE(is_slot_command("push"));
    EXPECT_TRUE(is_slot_command("pull"));
    EXPECT_TRUE(is_slot_command("show"));
    EXPECT_TRUE(is_slot_command("rm"));
    EXPECT_FALSE(is_slot_command("send"));
    EXPECT_TRUE(is_fx_command("fx:upper"));
    EXPECT_TRUE(is_fx_command("fx:trim \xe2\x86\x92 upper"));
    EXPECT_FALSE(is_fx_command("fx"));
    EXPECT_FALSE(is_fx_command("copy"));
}

TEST(HistoryPrintTest, FiltersCombineWithAnd) {
    std::vector<HistoryEntry> entries = {
        { "2026-01-02 03:04:05", "push", "", 4 },
        { "2026-01-02 03:04:06", "fx:upper", "", 5 },
        { "2026-01-02 03:04:07", "send", "dev", 6 },
    };

    HistoryFilter slots;
    slots.slots = true;
    std::ostringstream os;
    ASSERT_TRUE(print_history(os, entries, slots));
    EXPECT_NE(os.str().find("push"), std::string::npos);
    EXPECT_EQ(os.str().find("fx:upper"), std::string::npos);
    EXPECT_EQ(os.str().find("send"), std::string::npos);

    HistoryFilter fx;
    fx.fx = true;
    EXPECT_TRUE(history_entry_matches(entries[1], fx));
    EXPECT_FALSE(history_entry_matches(entries[0], fx));

    HistoryFilter both;
    both.slots = true;
    both.fx = true;
    std::ostringstream none;
    EXPECT_FALSE(print_history(none, entries, both));
}
