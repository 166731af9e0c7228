//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/support/TraceTests.cpp
// Purpose: Verify trace mode gating and the line format of the trace sink.
// Key invariants: Lines read "[talus:<area>] <text>" and verbose lines only
//                 appear in verbose mode.
// Ownership/Lifetime: Each test owns its output stream.
// Links: src/support/trace.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "support/trace.hpp"

#include <sstream>

using talus::support::TraceConfig;
using talus::support::TraceSink;

TEST(TraceTest, OffEmitsNothing)
{
    std::ostringstream os;
    TraceSink sink(TraceConfig{}, os);
    sink.decision("select", "hidden");
    sink.verbose("select", "hidden");
    EXPECT_TRUE(os.str().empty());
}

TEST(TraceTest, DecisionModeFormatsAndFiltersVerbose)
{
    std::ostringstream os;
    TraceSink sink(TraceConfig{TraceConfig::Decisions}, os);
    sink.decision("select", "block 1 selected");
    sink.verbose("select", "candidate detail");
    EXPECT_EQ(os.str(), "[talus:select] block 1 selected\n");
}

TEST(TraceTest, VerboseModeEmitsBoth)
{
    std::ostringstream os;
    TraceSink sink(TraceConfig{TraceConfig::Verbose}, os);
    sink.decision("train", "a");
    sink.verbose("train", "b");
    EXPECT_EQ(os.str(), "[talus:train] a\n[talus:train] b\n");
}

TEST(TraceTest, ParsesModeNames)
{
    TraceConfig::Mode mode = TraceConfig::Off;
    EXPECT_TRUE(talus::support::parseTraceMode("verbose", mode));
    EXPECT_EQ(mode, TraceConfig::Verbose);
    EXPECT_TRUE(talus::support::parseTraceMode("0", mode));
    EXPECT_EQ(mode, TraceConfig::Off);
    EXPECT_FALSE(talus::support::parseTraceMode("chatty", mode));
    EXPECT_EQ(mode, TraceConfig::Off);
}
