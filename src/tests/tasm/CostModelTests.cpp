//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/tasm/CostModelTests.cpp
// Purpose: Check per-instruction table deltas and the padded-height cost.
// Key invariants: Cost is the next power of two of the tallest table; an
//                 empty sequence costs zero.
// Ownership/Lifetime: Pure value tests.
// Links: src/tasm/CostModel.hpp, src/tasm/Opcode.def
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tasm/CostModel.hpp"

using namespace talus::tasm;

namespace
{
size_t idx(Table t)
{
    return static_cast<size_t>(t);
}
} // namespace

TEST(CostModelTest, Pow2CeilBoundaries)
{
    EXPECT_EQ(pow2Ceil(0), 0u);
    EXPECT_EQ(pow2Ceil(1), 1u);
    EXPECT_EQ(pow2Ceil(3), 4u);
    EXPECT_EQ(pow2Ceil(1024), 1024u);
    EXPECT_EQ(pow2Ceil(1025), 2048u);
}

TEST(CostModelTest, DeltasFollowTheOpcodeTable)
{
    TritonCostModel model;
    const TableRows push = model.deltas({Opcode::Push, 7});
    EXPECT_EQ(push[idx(Table::Processor)], 1u);
    EXPECT_EQ(push[idx(Table::OpStack)], 1u);
    EXPECT_EQ(push[idx(Table::U32)], 0u);

    const TableRows lt = model.deltas({Opcode::Lt, 0});
    EXPECT_EQ(lt[idx(Table::U32)], 33u);

    const TableRows hash = model.deltas({Opcode::Hash, 0});
    EXPECT_EQ(hash[idx(Table::Hash)], 6u);

    const TableRows mem = model.deltas({Opcode::WriteMem, 3});
    EXPECT_EQ(mem[idx(Table::Processor)], 1u);
    EXPECT_EQ(mem[idx(Table::OpStack)], 3u);
    EXPECT_EQ(mem[idx(Table::Ram)], 3u);

    const TableRows pop = model.deltas({Opcode::Pop, 4});
    EXPECT_EQ(pop[idx(Table::OpStack)], 4u);
    EXPECT_EQ(pop[idx(Table::Ram)], 0u);
}

TEST(CostModelTest, ProfileSumsAndCostIsACliff)
{
    CostOracle oracle;
    EXPECT_EQ(oracle.cost(InstrSeq{}), 0u);

    InstrSeq seq(16, Instr{Opcode::Nop, 0});
    EXPECT_EQ(oracle.cost(seq), 16u);
    seq.push_back({Opcode::Nop, 0});
    EXPECT_EQ(oracle.cost(seq), 32u);

    // One u32 comparison dominates a short program.
    const InstrSeq cmp{{Opcode::Push, 1}, {Opcode::Push, 2}, {Opcode::Lt, 0}};
    const CostProfile p = oracle.profile(cmp);
    EXPECT_EQ(p.rows[idx(Table::Processor)], 3u);
    EXPECT_EQ(p.rows[idx(Table::OpStack)], 3u);
    EXPECT_EQ(p.rows[idx(Table::U32)], 33u);
    EXPECT_EQ(p.dominantTable(), Table::U32);
    EXPECT_EQ(CostOracle::cost(p), 64u);
}

TEST(CostModelTest, DominantTableBreaksTiesTowardsProcessor)
{
    CostProfile p;
    p.rows[idx(Table::Processor)] = 8;
    p.rows[idx(Table::OpStack)] = 8;
    EXPECT_EQ(p.dominantTable(), Table::Processor);
    EXPECT_EQ(formatProfile(p), "processor=8 hash=0 u32=0 op_stack=8 ram=0 jump_stack=0");
}
