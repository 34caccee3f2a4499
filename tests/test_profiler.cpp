// Google Test for the scoped-timer profiler
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "cellclear/board.hpp"
#include "cellclear/profiler.hpp"
#include "cellclear/solver/bfs.hpp"

using namespace cellclear;

class ProfilerTest : public ::testing::Test {
   protected:
    void SetUp() override { Profiler::getInstance().reset(); }
    void TearDown() override { Profiler::getInstance().reset(); }
};

TEST_F(ProfilerTest, NestedTimersBuildCallPaths) {
    {
        ScopedTimer outer("outer");
        for (int i = 0; i < 2; ++i) {
            ScopedTimer inner("inner");
        }
    }

    Profiler& profiler = Profiler::getInstance();
    const TimingData* outer = profiler.find("outer");
    ASSERT_NE(outer, nullptr);
    EXPECT_EQ(outer->call_count, 1);
    EXPECT_EQ(outer->depth, 0);
    ASSERT_EQ(outer->children.size(), 1u);
    EXPECT_EQ(outer->children[0], "outer/inner");

    const TimingData* inner = profiler.find("outer/inner");
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->call_count, 2);
    EXPECT_EQ(inner->depth, 1);
    EXPECT_EQ(inner->display_name, "inner");
    EXPECT_EQ(inner->parent_path, "outer");
    EXPECT_LE(inner->min_time_ms, inner->max_time_ms);

    EXPECT_EQ(profiler.find("inner"), nullptr);
    EXPECT_GE(profiler.getTotalTime(), outer->total_time_ms);
}

TEST_F(ProfilerTest, ReportListsSections) {
    {
        ScopedTimer outer("load");
        ScopedTimer inner("parse");
    }

    std::ostringstream out;
    Profiler::getInstance().report(out);
    std::string text = out.str();
    EXPECT_NE(text.find("PROFILING REPORT"), std::string::npos);
    EXPECT_NE(text.find("load"), std::string::npos);
    EXPECT_NE(text.find("parse"), std::string::npos);
}

TEST_F(ProfilerTest, ResetClearsEverything) {
    { ScopedTimer timer("section"); }
    ASSERT_NE(Profiler::getInstance().find("section"), nullptr);

    Profiler::getInstance().reset();
    EXPECT_EQ(Profiler::getInstance().find("section"), nullptr);
    EXPECT_EQ(Profiler::getInstance().getTotalTime(), 0.0);
}

TEST_F(ProfilerTest, MismatchedEndIsIgnored) {
    Profiler& profiler = Profiler::getInstance();
    profiler.startSection("open");
    profiler.endSection("other");  // Reported, the open section stays on the stack
    profiler.endSection("open");

    const TimingData* data = profiler.find("open");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->call_count, 1);
    EXPECT_EQ(profiler.find("other"), nullptr);
}

#ifdef CELLCLEAR_PROFILING
TEST_F(ProfilerTest, SolverRoundsAreTimed) {
    BFS::Solver solver(2);
    ASSERT_TRUE(solver.solve(Board::parse("0 0 0 0|0 0 0 0|0 0 0 0|0 0 7 7"), 10).has_value());

    Profiler& profiler = Profiler::getInstance();
    const TimingData* solve = profiler.find("solve");
    ASSERT_NE(solve, nullptr);
    EXPECT_EQ(solve->call_count, 1);

    const TimingData* round = profiler.find("solve/round");
    ASSERT_NE(round, nullptr);
    EXPECT_EQ(round->call_count, 6);
    EXPECT_NE(profiler.find("solve/round/expand"), nullptr);
    EXPECT_NE(profiler.find("solve/round/merge"), nullptr);
}
#endif
