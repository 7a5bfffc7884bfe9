#include "../../src/common/debug.hpp"
#include "../../src/common/debug/closure.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace hatchet;

// ============================================================
// テストヘルパー（出力先を差し替え、終了時に既定へ戻す）
// ============================================================
class DebugLogTest : public ::testing::Test {
   protected:
    void SetUp() override {
        debug::set_sink(out);
        debug::set_debug_mode(true);
        debug::set_level(debug::Level::Debug);
        debug::set_lang(0);
    }

    void TearDown() override {
        debug::set_sink(std::cerr);
        debug::set_debug_mode(false);
        debug::set_level(debug::Level::Debug);
        debug::set_lang(0);
    }

    std::ostringstream out;
};

TEST_F(DebugLogTest, ParsesLevelNames) {
    EXPECT_EQ(debug::parse_level("trace"), debug::Level::Trace);
    EXPECT_EQ(debug::parse_level("debug"), debug::Level::Debug);
    EXPECT_EQ(debug::parse_level("info"), debug::Level::Info);
    EXPECT_EQ(debug::parse_level("warn"), debug::Level::Warn);
    EXPECT_EQ(debug::parse_level("error"), debug::Level::Error);
    EXPECT_FALSE(debug::parse_level("bogus").has_value());
    EXPECT_FALSE(debug::parse_level("WARN").has_value());
    EXPECT_FALSE(debug::parse_level("").has_value());
}

TEST_F(DebugLogTest, LinesCarryStageAndSeverity) {
    debug::log(debug::Stage::Closure, debug::Level::Warn, "cycle in bases");
    debug::log(debug::Stage::Harvest, debug::Level::Info, "3 units");
    debug::log(debug::Stage::Emit, debug::Level::Error, "cannot write");

    EXPECT_EQ(out.str(),
              "[CLOSURE] WARN: cycle in bases\n"
              "[HARVEST] 3 units\n"
              "[EMIT] ERROR: cannot write\n");
}

TEST_F(DebugLogTest, NothingIsWrittenWhenDisabled) {
    debug::set_debug_mode(false);
    debug::log(debug::Stage::Driver, debug::Level::Error, "hidden");
    debug::closure::log(debug::closure::Id::Start);

    EXPECT_TRUE(out.str().empty());
}

TEST_F(DebugLogTest, LevelsBelowThresholdAreFiltered) {
    debug::set_level(debug::Level::Warn);
    debug::log(debug::Stage::Policy, debug::Level::Info, "dropped");
    debug::log(debug::Stage::Policy, debug::Level::Warn, "kept");

    EXPECT_EQ(out.str(), "[POLICY] WARN: kept\n");
    EXPECT_FALSE(debug::enabled(debug::Level::Debug));
    EXPECT_TRUE(debug::enabled(debug::Level::Error));
}

TEST_F(DebugLogTest, StageMessagesFollowLanguage) {
    debug::closure::log(debug::closure::Id::UsefulType, "QWidget");
    debug::set_lang(1);
    debug::closure::log(debug::closure::Id::UsefulType, "QWidget");

    EXPECT_EQ(out.str(),
              "[CLOSURE] Useful type: QWidget\n"
              "[CLOSURE] 有用な型: QWidget\n");
}
