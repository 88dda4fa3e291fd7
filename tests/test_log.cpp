#include <gtest/gtest.h>
#include <ide-shell/log/log.hpp>

using namespace ideshell;

TEST(Log, DebugIsGated) {
    set_debug(false);
    ::testing::internal::CaptureStderr();
    log_debug("hidden");
    log_warn("shown");
    std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(err, "[WARN] shown\n");

    set_debug(true);
    ::testing::internal::CaptureStderr();
    log_debug("visible");
    log_error("bad");
    err = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(err, "[DEBUG] visible\n[ERROR] bad\n");
    EXPECT_TRUE(debug_enabled());
    set_debug(false);
}
