#include <gtest/gtest.h>
#include <ide-shell/term/transcript.hpp>
#include "test_support.hpp"
#include <ctime>
#include <regex>

using namespace ideshell;
using namespace ideshell::testing;

TEST(Transcript, DefaultNameFromTimestamp) {
    std::tm tm{};
    tm.tm_year = 2025 - 1900; tm.tm_mon = 2; tm.tm_mday = 7;
    tm.tm_hour = 9; tm.tm_min = 5; tm.tm_sec = 3; tm.tm_isdst = -1;
    auto when = std::chrono::system_clock::from_time_t(std::mktime(&tm));
    EXPECT_EQ(default_transcript_name(when), "terminal_20250307_090503.txt");
    EXPECT_TRUE(std::regex_match(default_transcript_name(), std::regex(R"(terminal_\d{8}_\d{6}\.txt)")));
}

TEST(Transcript, RendersOneLinePerEvent) {
    std::vector<OutputEvent> evs{
        OutputEvent(OutputKind::Task, "> Task :app:compileDebugKotlin", TaskInfo{"app:compileDebugKotlin"}),
        OutputEvent(OutputKind::Error, "e: Main.kt:3:1 boom"),
        OutputEvent(OutputKind::Artifact, "Generated: /w/app.apk (1.0 MB)", ArtifactInfo{"/w/app.apk"}),
    };
    EXPECT_EQ(render_transcript(evs),
              "TASK: > Task :app:compileDebugKotlin\n"
              "ERROR: e: Main.kt:3:1 boom\n"
              "ARTIFACT: Generated: /w/app.apk (1.0 MB)\n");
}

TEST(Transcript, WritesIntoCreatedDirectory) {
    TempDir dir;
    std::string logs = dir / "terminal_logs";
    auto path = write_transcript({OutputEvent(OutputKind::Success, "done")}, logs);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(fs::path(*path).parent_path().string(), logs);
    EXPECT_EQ(fs::path(*path).filename().string().rfind("terminal_", 0), 0u);
    EXPECT_EQ(read_file(*path), "SUCCESS: done\n");
}

TEST(Transcript, UnwritableDirectory) {
    TempDir dir;
    write_file(dir / "blocker", "file, not a directory");
    EXPECT_FALSE(write_transcript({}, dir / "blocker/logs", "x.txt").has_value());
}
