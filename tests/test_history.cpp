#include <gtest/gtest.h>
#include <ide-shell/term/history.hpp>
#include "test_support.hpp"
#include <thread>

using namespace ideshell;
using namespace ideshell::testing;

TEST(CommandHistory, EmptyWalk) {
    CommandHistory h;
    EXPECT_FALSE(h.previous().has_value());
    EXPECT_FALSE(h.next().has_value());
}

TEST(CommandHistory, AppendResetsCursor) {
    CommandHistory h;
    h.append("a"); h.append("b"); h.append("c");
    EXPECT_EQ(h.previous(), "c");
    EXPECT_EQ(h.previous(), "b");
    h.append("d");
    EXPECT_EQ(h.cursor(), 4u);
    EXPECT_EQ(h.previous(), "d");
    EXPECT_EQ(h.size(), 4u);
}

TEST(HistoryStore, RecordMovesCommandToNewest) {
    InMemoryHistoryStore s;
    s.record("ls"); s.record("pwd"); s.record("ls");
    auto recent = s.recent(10);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].command, "ls");
    EXPECT_EQ(recent[0].use_count, 2);
    EXPECT_EQ(recent[1].command, "pwd");
    EXPECT_EQ(s.recent(1).size(), 1u);
}

TEST(HistoryStore, BookmarksOrderedFavoritesThenUse) {
    InMemoryHistoryStore s;
    BookmarkedCommand a; a.command = "make"; a.use_count = 5;
    BookmarkedCommand b; b.command = "git status"; b.favorite = true;
    BookmarkedCommand c; c.command = "cargo test"; c.use_count = 9;
    s.add_bookmark(a); s.add_bookmark(b); s.add_bookmark(c);
    auto all = s.bookmarks();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].command, "git status");
    EXPECT_EQ(all[1].command, "cargo test");
    EXPECT_EQ(all[2].command, "make");
    a.description = "replaced";
    s.add_bookmark(a);
    EXPECT_EQ(s.bookmarks().size(), 3u);
    EXPECT_EQ(s.find_bookmark("make")->description, "replaced");
    EXPECT_TRUE(s.remove_bookmark("make"));
    EXPECT_FALSE(s.remove_bookmark("make"));
    EXPECT_FALSE(s.increment_use_count("make"));
}

TEST(BookmarkFile, LineFormat) {
    BookmarkedCommand b;
    b.command = "printf 'a\\tb'"; b.description = "tabs\tinside"; b.tags = {"fmt", "demo"};
    b.favorite = true; b.use_count = 3; b.last_used = 1700000000123;
    std::string line = format_bookmark_line(b);
    EXPECT_EQ(line, "printf 'a\\\\tb'\ttabs\\tinside\tfmt,demo\t1\t3\t1700000000123");
    auto back = parse_bookmark_line(line);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->command, b.command);
    EXPECT_EQ(back->description, b.description);
    EXPECT_EQ(back->tags, b.tags);
    EXPECT_TRUE(back->favorite);
    EXPECT_EQ(back->use_count, 3);
    EXPECT_EQ(back->last_used, 1700000000123);
}

TEST(BookmarkFile, RejectsMalformedLines) {
    EXPECT_FALSE(parse_bookmark_line("only\tthree\tfields").has_value());
    EXPECT_FALSE(parse_bookmark_line("cmd\tdesc\t\tmaybe\t1\t0").has_value());
    EXPECT_FALSE(parse_bookmark_line("cmd\tdesc\t\t0\t-1\t0").has_value());
    EXPECT_FALSE(parse_bookmark_line("\tdesc\t\t0\t1\t0").has_value());
}

TEST(BookmarkFile, PersistsAcrossInstances) {
    TempDir dir;
    std::string path = dir / "nested/bookmarks.tsv";
    {
        FileBookmarkStore s(path);
        EXPECT_FALSE(s.load());
        BookmarkedCommand b; b.command = "./gradlew lint"; b.description = "lint";
        s.add_bookmark(b);
        EXPECT_TRUE(s.increment_use_count("./gradlew lint"));
    }
    write_file(path, read_file(path) + "garbage line\n");
    FileBookmarkStore again(path);
    ASSERT_TRUE(again.load());
    auto b = again.find_bookmark("./gradlew lint");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->use_count, 1);
    EXPECT_EQ(again.bookmarks().size(), 1u);
}

TEST(BookmarkFile, TagsWithCommasSurviveReload) {
    BookmarkedCommand b;
    b.command = "make"; b.tags = {"a,b", "back\\slash", "plain"};
    auto back = parse_bookmark_line(format_bookmark_line(b));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->tags, b.tags);
}

TEST(BookmarkFile, ConcurrentWritersKeepEveryRecord) {
    TempDir dir;
    std::string path = dir / "bookmarks.tsv";
    const int threads = 8, per_thread = 20;
    {
        FileBookmarkStore s(path);
        std::vector<std::thread> workers;
        for (int t=0;t<threads;++t) {
            workers.emplace_back([&s, t]{
                for (int i=0;i<per_thread;++i) {
                    BookmarkedCommand b;
                    b.command = "echo " + std::to_string(t) + "-" + std::to_string(i);
                    s.add_bookmark(b);
                    s.increment_use_count(b.command);
                }
            });
        }
        for (auto& w : workers) w.join();
        EXPECT_EQ(s.bookmarks().size(), static_cast<size_t>(threads * per_thread));
    }
    FileBookmarkStore again(path);
    ASSERT_TRUE(again.load());
    auto all = again.bookmarks();
    ASSERT_EQ(all.size(), static_cast<size_t>(threads * per_thread));
    for (auto& b : all) EXPECT_EQ(b.use_count, 1) << b.command;
}
