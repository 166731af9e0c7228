//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/tasm/StackMachineTests.cpp
// Purpose: Execute short TASM programs and inspect the resulting machine state.
// Key invariants: The stack is bottom-first; errors stop execution and name
//                 the failing instruction.
// Ownership/Lifetime: Each test owns its machine.
// Links: src/tasm/StackMachine.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tasm/StackMachine.hpp"

#include <vector>

using namespace talus::tasm;
using Word = StackMachine::Word;

namespace
{
std::vector<uint64_t> values(const std::vector<Word> &ws)
{
    std::vector<uint64_t> out;
    for (const auto &w : ws)
        out.push_back(w.value());
    return out;
}

InstrSeq program(std::string_view text)
{
    auto seq = parseProgram(text);
    EXPECT_TRUE(seq);
    return seq ? seq.value() : InstrSeq{};
}
} // namespace

TEST(StackMachineTest, ArithmeticAndStackShuffles)
{
    StackMachine vm({Word::fromU64(3), Word::fromU64(4)});
    ASSERT_TRUE(vm.run(program("add\ndup 0\nmul\npush 2\nswap 1\n")));
    EXPECT_EQ(values(vm.stack()), (std::vector<uint64_t>{2, 49}));

    StackMachine order({Word::fromU64(1), Word::fromU64(2), Word::fromU64(3)});
    ASSERT_TRUE(order.run(program("pick 2\n")));
    EXPECT_EQ(values(order.stack()), (std::vector<uint64_t>{2, 3, 1}));
    ASSERT_TRUE(order.run(program("place 2\n")));
    EXPECT_EQ(values(order.stack()), (std::vector<uint64_t>{1, 2, 3}));
}

TEST(StackMachineTest, U32OperationsCheckTheirOperands)
{
    StackMachine vm({Word::fromU64(12), Word::fromU64(10)});
    ASSERT_TRUE(vm.run(program("xor\npop_count\n")));
    EXPECT_EQ(values(vm.stack()), (std::vector<uint64_t>{2}));

    StackMachine big({Word::fromU64(uint64_t{1} << 40), Word::fromU64(1)});
    EXPECT_FALSE(big.run(program("lt\n")));
    EXPECT_TRUE(big.failed());
    EXPECT_NE(big.error().find("u32"), std::string::npos);
}

TEST(StackMachineTest, IoAndMemory)
{
    StackMachine vm;
    vm.setPublicInput({Word::fromU64(5), Word::fromU64(6)});
    ASSERT_TRUE(vm.run(program("read_io 2\nadd\nwrite_io 1\n")));
    EXPECT_EQ(vm.publicInputConsumed(), 2u);
    EXPECT_EQ(values(vm.publicOutput()), (std::vector<uint64_t>{11}));
    EXPECT_TRUE(vm.stack().empty());

    StackMachine mem;
    ASSERT_TRUE(mem.run(program("push 77\npush 100\nwrite_mem 1\npush 100\nread_mem 1\n")));
    EXPECT_EQ(values(mem.stack()), (std::vector<uint64_t>{101, 77, 99}));
}

TEST(StackMachineTest, FailuresStopExecution)
{
    StackMachine vm({Word::fromU64(0)});
    EXPECT_FALSE(vm.run(program("assert\npush 1\n")));
    EXPECT_EQ(vm.executed(), 0u);
    EXPECT_NE(vm.error().find("assertion"), std::string::npos);

    StackMachine empty;
    EXPECT_FALSE(empty.run(program("add\n")));
    EXPECT_NE(empty.error().find("underflow"), std::string::npos);

    StackMachine starved;
    EXPECT_FALSE(starved.run(program("read_io 1\n")));
}
