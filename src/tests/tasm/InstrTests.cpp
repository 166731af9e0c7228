//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/tasm/InstrTests.cpp
// Purpose: Parse, format and well-formedness checks for TASM instructions.
// Key invariants: Arguments outside their kind's range are rejected with
//                 "malformed-instruction"; depth overruns with "stack-underflow".
// Ownership/Lifetime: Pure value tests.
// Links: src/tasm/Instr.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "field/Goldilocks.hpp"
#include "tasm/Instr.hpp"

using namespace talus::tasm;

TEST(InstrTest, ParsesMnemonicsAndArguments)
{
    auto push = parseInstr("  push 42 // constant");
    ASSERT_TRUE(push);
    EXPECT_EQ(push.value(), (Instr{Opcode::Push, 42}));

    auto neg = parseInstr("push -1");
    ASSERT_TRUE(neg);
    EXPECT_EQ(neg.value().arg, talus::field::kModulus - 1);

    auto div = parseInstr("div_mod");
    ASSERT_TRUE(div);
    EXPECT_EQ(div.value().op, Opcode::DivMod);
}

TEST(InstrTest, RejectsBadArguments)
{
    for (const char *line : {"dup 16", "swap 0", "pop 0", "pop 6", "add 1", "push", "frobnicate",
                             "push 18446744069414584321"})
    {
        auto r = parseInstr(line);
        ASSERT_FALSE(r) << line;
        EXPECT_EQ(r.error().code, "malformed-instruction") << line;
    }
}

TEST(InstrTest, ProgramErrorsCarryLineNumbers)
{
    auto ok = parseProgram("push 1\n\n// comment only\npush 2\nadd\n");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value().size(), 3u);

    auto bad = parseProgram("push 1\nswap 0\n");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message.rfind("line 2: ", 0), 0u);
}

TEST(InstrTest, FormatProgramIsParseable)
{
    const InstrSeq seq{{Opcode::Push, 5}, {Opcode::Dup, 0}, {Opcode::Mul, 0}, {Opcode::WriteIo, 1}};
    const std::string text = formatProgram(seq);
    EXPECT_EQ(text, "push 5\ndup 0\nmul\nwrite_io 1\n");
    auto back = parseProgram(text);
    ASSERT_TRUE(back);
    EXPECT_EQ(back.value(), seq);
}

TEST(InstrTest, StackEffectCountsAndReach)
{
    const StackEffect pop = stackEffect({Opcode::Pop, 3});
    EXPECT_EQ(pop.pops, 3u);
    EXPECT_EQ(pop.pushes, 0u);

    const StackEffect swap = stackEffect({Opcode::Swap, 4});
    EXPECT_EQ(swap.reach, 5u);
    EXPECT_EQ(swap.pops, 0u);

    const StackEffect hash = stackEffect({Opcode::Hash, 0});
    EXPECT_EQ(hash.pops, 10u);
    EXPECT_EQ(hash.pushes, 5u);
}

TEST(InstrTest, WellFormedTracksDepth)
{
    const InstrSeq seq{{Opcode::Add, 0}, {Opcode::Dup, 0}, {Opcode::Mul, 0}};
    EXPECT_TRUE(checkWellFormed(seq, 2));

    auto under = checkWellFormed(seq, 1);
    ASSERT_FALSE(under);
    EXPECT_EQ(under.error().code, "stack-underflow");

    auto range = checkWellFormed({{Opcode::Pop, 9}}, 16);
    ASSERT_FALSE(range);
    EXPECT_EQ(range.error().code, "malformed-instruction");
}
