//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/ir/BasicBlockTests.cpp
// Purpose: Structural validation and reference evaluation of IR blocks.
// Key invariants: Operands name earlier result-producing nodes; evaluation
//                 reports failures under "execution-error".
// Ownership/Lifetime: Blocks are built per test.
// Links: src/ir/BasicBlock.hpp, src/ir/Evaluate.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "ir/BasicBlock.hpp"
#include "ir/Evaluate.hpp"

#include <vector>

using namespace talus::ir;
using talus::field::Goldilocks;

namespace
{
std::vector<Goldilocks> words(std::initializer_list<uint64_t> vs)
{
    std::vector<Goldilocks> out;
    for (uint64_t v : vs)
        out.push_back(Goldilocks::fromU64(v));
    return out;
}
} // namespace

TEST(BasicBlockTest, BuilderProducesValidBlock)
{
    BlockBuilder b(2);
    const int32_t x = b.input(0);
    const int32_t y = b.input(1);
    const int32_t sum = b.add(x, y);
    b.output(b.mul(sum, b.constant(3)));
    const BasicBlock block = b.build();

    EXPECT_TRUE(validate(block));
    EXPECT_EQ(block.outputCount(), 1u);
    EXPECT_EQ(formatBlock(block).rfind("block inputs=2\n", 0), 0u);
}

TEST(BasicBlockTest, RejectsForwardAndResultlessReferences)
{
    BasicBlock forward;
    forward.inputCount = 1;
    forward.nodes.push_back(Node{NodeKind::Neg, TypeTag::Field, 1, -1, 0});
    forward.nodes.push_back(Node{NodeKind::Input, TypeTag::Field, -1, -1, 0});
    auto r = validate(forward);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, "invalid-reference");
    EXPECT_EQ(r.error().loc.node, 0);

    BlockBuilder b(1);
    const int32_t out = b.output(b.input(0));
    b.neg(out);
    auto resultless = validate(b.build());
    ASSERT_FALSE(resultless);
    EXPECT_EQ(resultless.error().code, "invalid-reference");

    BlockBuilder slot(1);
    slot.input(3);
    EXPECT_EQ(validate(slot.build()).error().code, "invalid-reference");
}

TEST(BasicBlockTest, RejectsOversizedBlocks)
{
    BlockBuilder b(1);
    for (size_t i = 0; i <= kMaxNodes; ++i)
        b.constant(i);
    auto r = validate(b.build());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, "block-too-large");

    BasicBlock wide;
    wide.inputCount = kMaxInputs + 1;
    EXPECT_EQ(validate(wide).error().code, "block-too-large");
}

TEST(BasicBlockTest, EvaluatesWithTopFirstInputs)
{
    BlockBuilder b(2);
    const int32_t top = b.input(0);
    const int32_t below = b.input(1);
    b.output(b.sub(top, below));
    b.writeIo(b.add(b.readIo(), top));

    auto r = evaluate(b.build(), words({10, 4}), words({100}));
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().outputs, words({6}));
    EXPECT_EQ(r.value().ioWrites, words({110}));
    EXPECT_EQ(r.value().ioReads, 1u);
}

TEST(BasicBlockTest, EvaluationFailures)
{
    BlockBuilder inv(1);
    inv.output(inv.inv(inv.input(0)));
    auto zero = evaluate(inv.build(), words({0}));
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code, "execution-error");

    BlockBuilder check(1);
    check.assertTrue(check.eq(check.input(0), check.constant(5)));
    EXPECT_TRUE(evaluate(check.build(), words({5})));
    EXPECT_FALSE(evaluate(check.build(), words({6})));

    BlockBuilder u32(2);
    u32.output(u32.lt(u32.input(0, TypeTag::U32), u32.input(1, TypeTag::U32)));
    EXPECT_FALSE(evaluate(u32.build(), words({uint64_t{1} << 33, 1})));
    EXPECT_FALSE(evaluate(u32.build(), words({1})));
}
