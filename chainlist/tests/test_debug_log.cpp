#include <gtest/gtest.h>
#include <chainlist/debug_log.hpp>
#include <string>
#include <vector>

namespace {

std::vector<std::string> g_captured;

void capture(const char* message) {
    g_captured.emplace_back(message);
}

} // namespace

class DebugLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        g_captured.clear();
        chainlist::debug::set_debug_callback(&capture);
    }

    void TearDown() override {
        chainlist::debug::clear_debug_callback();
    }
};

TEST_F(DebugLogTest, RoutesToCallbackWithPrefix) {
    chainlist::debug::debug_output("pop on list of length %zu", static_cast<std::size_t>(0));
    ASSERT_EQ(g_captured.size(), 1u);
    const std::string& line = g_captured.front();
    EXPECT_EQ(line, "[chainlist] pop on list of length 0");
}

TEST_F(DebugLogTest, ClearedCallbackStopsRouting) {
    chainlist::debug::clear_debug_callback();
    chainlist::debug::debug_output("to stdout");
    EXPECT_TRUE(g_captured.empty());
}

TEST_F(DebugLogTest, MacroFollowsBuildOption) {
    CHAINLIST_DEBUG_LOG("index %d", 3);
#ifdef CHAINLIST_ENABLE_DEBUG_OUTPUT
    EXPECT_EQ(g_captured.size(), 1u);
#else
    EXPECT_TRUE(g_captured.empty());
#endif
}
