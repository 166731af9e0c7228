//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/verify/DifferentialVerifierTests.cpp
// Purpose: Differential checking of lowered sequences against block semantics,
//          including every scheduler knob subset.
// Key invariants: Every knob subset yields a sequence the verifier accepts;
//                 deliberate miscompilations are refuted.
// Ownership/Lifetime: Blocks and verifiers are stack values.
// Links: src/verify/DifferentialVerifier.hpp, src/gen/StackScheduler.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "gen/StackScheduler.hpp"
#include "verify/DifferentialVerifier.hpp"

#include <vector>

using namespace talus::verify;
using talus::gen::KnobSet;
using talus::gen::StackScheduler;
using talus::ir::BasicBlock;
using talus::ir::BlockBuilder;
using talus::ir::TypeTag;
using talus::tasm::InstrSeq;
using talus::tasm::Opcode;

namespace
{
std::vector<BasicBlock> corpus()
{
    std::vector<BasicBlock> blocks;
    {
        BlockBuilder b(1);
        const int32_t x = b.input(0);
        b.output(b.mul(x, x));
        blocks.push_back(b.build());
    }
    {
        BlockBuilder b(3);
        const int32_t x = b.input(0);
        const int32_t y = b.input(1);
        const int32_t z = b.input(2);
        const int32_t s = b.add(x, b.constant(0));
        const int32_t t = b.mul(s, b.constant(1));
        b.output(b.sub(t, b.neg(b.neg(z))));
        b.output(b.eq(y, y));
        b.output(b.add(b.constant(3), b.constant(4)));
        blocks.push_back(b.build());
    }
    {
        BlockBuilder b(2);
        const int32_t x = b.input(0, TypeTag::U32);
        const int32_t y = b.input(1, TypeTag::U32);
        const int32_t r = b.readIo(TypeTag::U32);
        b.writeIo(b.bitXor(x, r));
        b.output(b.popCount(b.bitAnd(y, x)));
        b.output(b.lt(x, y));
        blocks.push_back(b.build());
    }
    {
        BlockBuilder b(5);
        const int32_t a = b.input(4);
        const int32_t c = b.input(0);
        b.mul(a, c);
        b.output(b.sub(a, a));
        b.output(b.add(c, b.constant(9)));
        b.output(c);
        blocks.push_back(b.build());
    }
    return blocks;
}
} // namespace

TEST(DifferentialVerifierTest, EveryKnobSubsetIsVerified)
{
    const DifferentialVerifier verifier(3, 12);
    const auto blocks = corpus();
    for (size_t bi = 0; bi < blocks.size(); ++bi)
    {
        for (unsigned mask = 0; mask < 256; ++mask)
        {
            auto seq = StackScheduler(static_cast<KnobSet>(mask)).schedule(blocks[bi]);
            ASSERT_TRUE(seq.has_value()) << "block " << bi << " knobs " << mask;
            EXPECT_EQ(verifier.verify(blocks[bi], *seq), Verdict::Verified)
                << "block " << bi << " knobs " << mask;
        }
    }
}

TEST(DifferentialVerifierTest, RefutesMiscompilations)
{
    BlockBuilder b(1);
    b.output(b.add(b.input(0), b.constant(1)));
    const BasicBlock block = b.build();
    const DifferentialVerifier verifier;

    EXPECT_EQ(verifier.verify(block, InstrSeq{{Opcode::AddI, 1}}), Verdict::Verified);
    EXPECT_EQ(verifier.verify(block, InstrSeq{{Opcode::AddI, 2}}), Verdict::Refuted);

    // Leaving an extra word behind changes the stack below the outputs.
    EXPECT_EQ(verifier.verify(block, InstrSeq{{Opcode::Dup, 0}, {Opcode::AddI, 1}}),
              Verdict::Refuted);

    // Reaching below the block's inputs is malformed.
    EXPECT_EQ(verifier.verify(block, InstrSeq{{Opcode::Swap, 1}}), Verdict::Refuted);
}

TEST(DifferentialVerifierTest, IoMismatchIsRefuted)
{
    BlockBuilder b(0);
    b.writeIo(b.readIo());
    const BasicBlock block = b.build();
    const DifferentialVerifier verifier;
    EXPECT_EQ(verifier.verify(block, InstrSeq{{Opcode::ReadIo, 1}, {Opcode::WriteIo, 1}}),
              Verdict::Verified);
    EXPECT_EQ(verifier.verify(block, InstrSeq{{Opcode::ReadIo, 1}, {Opcode::Pop, 1}}),
              Verdict::Refuted);
}

TEST(DifferentialVerifierTest, AlwaysFailingBlockIsInconclusive)
{
    BlockBuilder b(0);
    b.assertTrue(b.constant(0));
    const BasicBlock block = b.build();
    const DifferentialVerifier verifier;
    EXPECT_EQ(verifier.verify(block, InstrSeq{{Opcode::Push, 0}, {Opcode::Assert, 0}}),
              Verdict::Inconclusive);
    EXPECT_EQ(verifier.verify(block, InstrSeq{}), Verdict::Refuted);
}

TEST(DifferentialVerifierTest, VerdictIsDeterministic)
{
    const auto blocks = corpus();
    auto seq = StackScheduler(talus::gen::kAllKnobs).schedule(blocks[2]);
    ASSERT_TRUE(seq.has_value());
    const DifferentialVerifier a(99, 8);
    const DifferentialVerifier b(99, 8);
    EXPECT_EQ(a.verify(blocks[2], *seq), b.verify(blocks[2], *seq));
    EXPECT_EQ(std::string(toString(Verdict::Timeout)), "timeout");
}
