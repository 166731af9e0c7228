//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/gen/StackSchedulerTests.cpp
// Purpose: Exact lowering checks for individual scheduling knobs.
// Key invariants: Each knob only ever shortens or reorders the naive lowering;
//                 semantics are covered by the differential verifier tests.
// Ownership/Lifetime: Blocks are built per test.
// Links: src/gen/StackScheduler.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "gen/StackScheduler.hpp"
#include "tasm/CostModel.hpp"

#include <string>

using namespace talus::gen;
using talus::ir::BasicBlock;
using talus::ir::BlockBuilder;
using talus::tasm::Instr;
using talus::tasm::InstrSeq;
using talus::tasm::Opcode;

namespace
{
BasicBlock square()
{
    BlockBuilder b(1);
    const int32_t x = b.input(0);
    b.output(b.mul(x, x));
    return b.build();
}
} // namespace

TEST(StackSchedulerTest, NaiveLoweringCopiesEveryOperand)
{
    auto seq = lowerNaive(square());
    ASSERT_TRUE(seq.has_value());
    const InstrSeq want{{Opcode::Dup, 0},
                        {Opcode::Dup, 1},
                        {Opcode::Mul, 0},
                        {Opcode::Dup, 0},
                        {Opcode::Pick, 1},
                        {Opcode::Pop, 1},
                        {Opcode::Pick, 1},
                        {Opcode::Pop, 1}};
    EXPECT_EQ(*seq, want);
}

TEST(StackSchedulerTest, SquareViaDupConsumesInPlace)
{
    auto seq = StackScheduler(kAllKnobs).schedule(square());
    ASSERT_TRUE(seq.has_value());
    EXPECT_EQ(*seq, (InstrSeq{{Opcode::Dup, 0}, {Opcode::Mul, 0}}));
}

TEST(StackSchedulerTest, FoldsConstantSubtrees)
{
    BlockBuilder b(0);
    b.output(b.add(b.constant(2), b.constant(3)));
    auto seq = StackScheduler(knobBit(Knob::FoldConstants)).schedule(b.build());
    ASSERT_TRUE(seq.has_value());
    EXPECT_EQ(*seq, (InstrSeq{{Opcode::Push, 5}}));
}

TEST(StackSchedulerTest, FusesImmediateAdds)
{
    BlockBuilder b(1);
    b.output(b.add(b.input(0), b.constant(7)));
    const KnobSet knobs = knobBit(Knob::FoldConstants) | knobBit(Knob::FuseImmediate) |
                          knobBit(Knob::ConsumeInPlace);
    auto seq = StackScheduler(knobs).schedule(b.build());
    ASSERT_TRUE(seq.has_value());
    EXPECT_EQ(*seq, (InstrSeq{{Opcode::AddI, 7}}));
}

TEST(StackSchedulerTest, DropsDeadPureNodes)
{
    BlockBuilder b(1);
    const int32_t x = b.input(0);
    b.mul(x, x);
    b.output(x);
    auto seq = StackScheduler(kAllKnobs).schedule(b.build());
    ASSERT_TRUE(seq.has_value());
    EXPECT_TRUE(seq->empty());

    // Assertions are never dead even without a result.
    BlockBuilder keep(1);
    keep.assertTrue(keep.input(0));
    auto kept = StackScheduler(kAllKnobs).schedule(keep.build());
    ASSERT_TRUE(kept.has_value());
    EXPECT_EQ(*kept, (InstrSeq{{Opcode::Assert, 0}}));
}

TEST(StackSchedulerTest, BatchCleanupPopsTogether)
{
    BlockBuilder b(4);
    b.input(0);
    auto seq = StackScheduler(knobBit(Knob::BatchCleanup)).schedule(b.build());
    ASSERT_TRUE(seq.has_value());
    EXPECT_EQ(*seq, (InstrSeq{{Opcode::Pop, 4}}));
}

TEST(StackSchedulerTest, AllKnobsNeverCostMore)
{
    BlockBuilder b(3);
    const int32_t x = b.input(0);
    const int32_t y = b.input(1);
    const int32_t z = b.input(2);
    const int32_t s = b.add(x, b.constant(0));
    const int32_t t = b.mul(s, y);
    b.output(b.sub(t, b.neg(b.neg(z))));
    const BasicBlock block = b.build();

    talus::tasm::CostOracle oracle;
    auto naive = lowerNaive(block);
    auto tuned = StackScheduler(kAllKnobs).schedule(block);
    ASSERT_TRUE(naive.has_value());
    ASSERT_TRUE(tuned.has_value());
    EXPECT_LT(tuned->size(), naive->size());
    EXPECT_LE(oracle.cost(*tuned), oracle.cost(*naive));
}

TEST(StackSchedulerTest, RejectsInvalidBlocks)
{
    BlockBuilder b(1);
    b.input(2);
    EXPECT_FALSE(lowerNaive(b.build()).has_value());
    EXPECT_EQ(std::string(toString(Knob::SquareViaDup)), "square-via-dup");
}
