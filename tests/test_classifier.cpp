#include <gtest/gtest.h>
#include <ide-shell/classify/classifier.hpp>

using namespace ideshell;

static OutputEvent cls(const std::string& line, BackendFamily f, StreamSource src = StreamSource::Stdout) {
    return default_classifier().classify(RawLine{src, line}, f);
}

TEST(ClassifierGradle, BuildSuccessful) {
    auto ev = cls("BUILD SUCCESSFUL in 2s", BackendFamily::ManagedBuildTool);
    EXPECT_EQ(ev.kind(), OutputKind::Success);
    EXPECT_EQ(ev.message(), "BUILD SUCCESSFUL in 2s");
}

TEST(ClassifierGradle, TaskLine) {
    auto ev = cls("> Task :app:compileDebugKotlin", BackendFamily::ManagedBuildTool);
    EXPECT_EQ(ev.kind(), OutputKind::Task);
    EXPECT_EQ(ev.task_name(), "app:compileDebugKotlin");
}

TEST(ClassifierGradle, KotlinErrorWithLocation) {
    auto ev = cls("e: file:///src/Main.kt:12:5 Unresolved reference: foo", BackendFamily::ManagedBuildTool, StreamSource::Stderr);
    EXPECT_EQ(ev.kind(), OutputKind::Error);
    auto loc = ev.location();
    ASSERT_TRUE(loc.has_value());
    EXPECT_EQ(loc->file, "/src/Main.kt");
    EXPECT_EQ(loc->line, 12);
    EXPECT_EQ(loc->column, 5);
    ASSERT_EQ(ev.structured_errors().size(), 1u);
    EXPECT_EQ(ev.structured_errors()[0], "Unresolved reference: foo");
}

TEST(ClassifierGradle, JavacError) {
    auto ev = cls("src/Main.java:12: error: ';' expected", BackendFamily::ManagedBuildTool);
    EXPECT_EQ(ev.kind(), OutputKind::Error);
    ASSERT_TRUE(ev.location().has_value());
    EXPECT_EQ(ev.location()->file, "src/Main.java");
    EXPECT_EQ(ev.location()->line, 12);
    EXPECT_EQ(ev.structured_errors()[0], "';' expected");
}

TEST(ClassifierGradle, FailureBanner) {
    auto ev = cls("FAILURE: Build failed with an exception.", BackendFamily::ManagedBuildTool, StreamSource::Stderr);
    EXPECT_EQ(ev.kind(), OutputKind::Error);
    ASSERT_EQ(ev.structured_errors().size(), 1u);
    EXPECT_EQ(ev.structured_errors()[0], "Build failed with an exception.");
}

TEST(ClassifierGradle, GenericWarningAndError) {
    auto w = cls("Warning: deprecated API used", BackendFamily::ManagedBuildTool);
    EXPECT_EQ(w.kind(), OutputKind::Warning);
    EXPECT_EQ(w.structured_warnings()[0], "deprecated API used");
    auto e = cls("Execution failed: task ':app:lint'", BackendFamily::ManagedBuildTool);
    EXPECT_EQ(e.kind(), OutputKind::Error);
}

TEST(ClassifierGradle, ArtifactLines) {
    auto gen = cls("Generated: /work/app/build/outputs/apk/debug/app-debug.apk (4.2 MB)", BackendFamily::ManagedBuildTool);
    EXPECT_EQ(gen.kind(), OutputKind::Artifact);
    EXPECT_EQ(gen.artifact_path(), "/work/app/build/outputs/apk/debug/app-debug.apk");
    auto bare = cls("/work/build/libs/core.jar", BackendFamily::ManagedBuildTool);
    EXPECT_EQ(bare.kind(), OutputKind::Artifact);
    EXPECT_EQ(bare.artifact_path(), "/work/build/libs/core.jar");
}

TEST(ClassifierGradle, UnmatchedIsInfoOnBothStreams) {
    EXPECT_EQ(cls("* What went wrong:", BackendFamily::ManagedBuildTool).kind(), OutputKind::Info);
    EXPECT_EQ(cls("Starting a Gradle Daemon", BackendFamily::ManagedBuildTool, StreamSource::Stderr).kind(), OutputKind::Info);
}

TEST(ClassifierCargo, ErrorCode) {
    auto ev = cls("error[E0001]: mismatched types", BackendFamily::PackageManager, StreamSource::Stderr);
    EXPECT_EQ(ev.kind(), OutputKind::Error);
    ASSERT_EQ(ev.structured_errors().size(), 1u);
    EXPECT_NE(ev.structured_errors()[0].find("mismatched types"), std::string::npos);
    EXPECT_EQ(ev.source(), StreamSource::Stderr);
}

TEST(ClassifierCargo, WarningRecorded) {
    auto ev = cls("warning: unused import: `std::io`", BackendFamily::PackageManager, StreamSource::Stderr);
    EXPECT_EQ(ev.kind(), OutputKind::Warning);
    ASSERT_EQ(ev.structured_warnings().size(), 1u);
    EXPECT_EQ(ev.structured_warnings()[0], "unused import: `std::io`");
}

TEST(ClassifierCargo, ProgressLines) {
    auto c = cls("   Compiling serde v1.0.190", BackendFamily::PackageManager, StreamSource::Stderr);
    EXPECT_EQ(c.kind(), OutputKind::Task);
    EXPECT_EQ(c.task_name(), "serde");
    auto f = cls("    Finished dev [unoptimized + debuginfo] target(s) in 3.1s", BackendFamily::PackageManager, StreamSource::Stderr);
    EXPECT_EQ(f.kind(), OutputKind::Success);
    EXPECT_EQ(cls("test result: ok. 3 passed; 0 failed", BackendFamily::PackageManager).kind(), OutputKind::Success);
    EXPECT_EQ(cls("test result: FAILED. 1 passed; 2 failed", BackendFamily::PackageManager).kind(), OutputKind::Error);
}

TEST(ClassifierCargo, LocationArrow) {
    auto ev = cls("  --> src/main.rs:2:5", BackendFamily::PackageManager, StreamSource::Stderr);
    EXPECT_EQ(ev.kind(), OutputKind::Info);
    ASSERT_TRUE(ev.location().has_value());
    EXPECT_EQ(ev.location()->file, "src/main.rs");
    EXPECT_EQ(ev.location()->line, 2);
    EXPECT_EQ(ev.location()->column, 5);
}

TEST(ClassifierNative, ShortFormatDiagnostics) {
    std::string line = "src/main.rs:2:5: error[E0308]: mismatched types";
    auto ev = cls(line, BackendFamily::NativeDriver, StreamSource::Stderr);
    EXPECT_EQ(ev.kind(), OutputKind::Error);
    ASSERT_TRUE(ev.location().has_value());
    EXPECT_EQ(ev.location()->column, 5);
    // The package manager table does not know the short format.
    EXPECT_EQ(cls(line, BackendFamily::PackageManager, StreamSource::Stderr).kind(), OutputKind::Info);
    auto w = cls("src/lib.rs:10:1: warning: unused function", BackendFamily::NativeDriver);
    EXPECT_EQ(w.kind(), OutputKind::Warning);
    EXPECT_EQ(w.structured_warnings()[0], "unused function");
}

TEST(ClassifierShell, StderrDefaultsToError) {
    auto ev = cls("ls: cannot access 'nope': No such file or directory", BackendFamily::Shell, StreamSource::Stderr);
    EXPECT_EQ(ev.kind(), OutputKind::Error);
    EXPECT_EQ(ev.structured_errors().size(), 1u);
    EXPECT_EQ(cls("total 0", BackendFamily::Shell).kind(), OutputKind::Info);
}

TEST(ClassifierShell, KnownToolMessages) {
    EXPECT_EQ(cls("fatal: not a git repository", BackendFamily::Shell, StreamSource::Stderr).kind(), OutputKind::Error);
    EXPECT_EQ(cls("Cloning into 'repo'...", BackendFamily::Shell, StreamSource::Stderr).kind(), OutputKind::Info);
    EXPECT_EQ(cls("hint: Using 'master' as the name", BackendFamily::Shell, StreamSource::Stderr).kind(), OutputKind::Info);
    EXPECT_EQ(cls("npm WARN deprecated left-pad@1.0.0", BackendFamily::Shell, StreamSource::Stderr).kind(), OutputKind::Warning);
    EXPECT_EQ(cls("npm ERR! code ENOENT", BackendFamily::Shell, StreamSource::Stderr).kind(), OutputKind::Error);
    EXPECT_EQ(cls("E: Unable to locate package foo", BackendFamily::Shell, StreamSource::Stderr).kind(), OutputKind::Error);
    EXPECT_EQ(cls("    Updating crates.io index", BackendFamily::Shell, StreamSource::Stderr).kind(), OutputKind::Info);
}

TEST(ClassifierRegistry, RegisterReplacesTable) {
    Classifier c;
    RuleTable t; t.name = "custom";
    t.rules.emplace_back("^PONG\\b", OutputKind::Success);
    t.rules.emplace_back("^only-stderr$", OutputKind::Warning, RuleOptions{.stream = StreamFilter::Stderr});
    c.register_table(BackendFamily::Shell, t);
    EXPECT_EQ(c.classify("PONG from host", BackendFamily::Shell).kind(), OutputKind::Success);
    EXPECT_EQ(c.classify(RawLine{StreamSource::Stdout, "only-stderr"}, BackendFamily::Shell).kind(), OutputKind::Info);
    EXPECT_EQ(c.classify(RawLine{StreamSource::Stderr, "only-stderr"}, BackendFamily::Shell).kind(), OutputKind::Warning);
    // The shared instance keeps its built-in table.
    EXPECT_EQ(default_classifier().classify("PONG from host", BackendFamily::Shell).kind(), OutputKind::Info);
    ASSERT_NE(c.table(BackendFamily::Shell), nullptr);
    EXPECT_EQ(c.table(BackendFamily::Shell)->name, "custom");
}

TEST(ClassifierRegistry, FirstMatchWins) {
    Classifier c;
    RuleTable t;
    t.rules.emplace_back("boom", OutputKind::Error);
    t.rules.emplace_back("boom", OutputKind::Warning);
    c.register_table(BackendFamily::PackageManager, t);
    EXPECT_EQ(c.classify("boom", BackendFamily::PackageManager).kind(), OutputKind::Error);
}

TEST(OutputEvents, TranscriptLineAndNames) {
    OutputEvent ev(OutputKind::Warning, "careful");
    EXPECT_EQ(format_transcript_line(ev), "WARNING: careful");
    EXPECT_EQ(parse_output_kind("ARTIFACT"), OutputKind::Artifact);
    EXPECT_FALSE(parse_output_kind("NOPE").has_value());
    EXPECT_TRUE(is_terminal(SessionStatus::Cancelled));
    EXPECT_FALSE(is_terminal(SessionStatus::Running));
}
