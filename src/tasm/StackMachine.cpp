//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tasm/StackMachine.cpp
// Purpose: Instruction semantics for the concrete executor.
// Key invariants: Argument ranges are checked before any state changes, so a
//                 failing instruction leaves the stack as it was.
//
//===----------------------------------------------------------------------===//

#include "tasm/StackMachine.hpp"

#include "support/hash.hpp"

#include <array>
#include <bit>
#include <utility>

namespace talus::tasm
{
namespace
{
constexpr uint64_t kU32Limit = uint64_t{1} << 32;

bool isU32(field::Goldilocks w)
{
    return w.value() < kU32Limit;
}

/// Deterministic 10-to-5 digest standing in for the sponge permutation.
std::array<field::Goldilocks, 5> digest(const std::array<field::Goldilocks, 10> &in)
{
    support::Fnv1a h;
    for (const auto &w : in)
        h.u64(w.value());
    const uint64_t seed = h.digest();
    std::array<field::Goldilocks, 5> out{};
    for (size_t i = 0; i < out.size(); ++i)
        out[i] = field::Goldilocks::fromU64(support::mix64(seed + i));
    return out;
}
} // namespace

StackMachine::StackMachine(std::vector<Word> initial) : stack_(std::move(initial)) {}

void StackMachine::setPublicInput(std::vector<Word> input)
{
    input_ = std::move(input);
    inputPos_ = 0;
}

void StackMachine::setSecretInput(std::vector<Word> input)
{
    secret_ = std::move(input);
    secretPos_ = 0;
}

bool StackMachine::run(const InstrSeq &seq)
{
    for (const auto &instr : seq)
    {
        if (!step(instr))
            return false;
    }
    return true;
}

bool StackMachine::fail(const Instr &instr, const std::string &why)
{
    error_ = "instruction " + std::to_string(executed_) + " (" + formatInstr(instr) + "): " + why;
    return false;
}

bool StackMachine::need(const Instr &instr, size_t n)
{
    if (stack_.size() >= n)
        return true;
    return fail(instr, "stack underflow");
}

StackMachine::Word StackMachine::pop()
{
    Word w = stack_.back();
    stack_.pop_back();
    return w;
}

StackMachine::Word StackMachine::peek(size_t depth) const
{
    return stack_[stack_.size() - 1 - depth];
}

bool StackMachine::step(const Instr &instr)
{
    if (failed())
        return false;
    if (static_cast<size_t>(instr.op) >= kNumOpcodes)
        return fail(instr, "unknown opcode");

    const StackEffect fx = stackEffect(instr);
    if (!need(instr, fx.reach))
        return false;

    const size_t d = static_cast<size_t>(instr.arg);
    switch (instr.op)
    {
        case Opcode::Push:
            stack_.push_back(Word::fromU64(instr.arg));
            break;
        case Opcode::Pop:
            stack_.resize(stack_.size() - d);
            break;
        case Opcode::Dup:
            stack_.push_back(peek(d));
            break;
        case Opcode::Swap:
            if (d == 0)
                return fail(instr, "swap depth must be at least 1");
            std::swap(stack_.back(), stack_[stack_.size() - 1 - d]);
            break;
        case Opcode::Pick:
        {
            const auto it = stack_.end() - 1 - static_cast<std::ptrdiff_t>(d);
            const Word w = *it;
            stack_.erase(it);
            stack_.push_back(w);
            break;
        }
        case Opcode::Place:
        {
            const Word w = pop();
            stack_.insert(stack_.end() - static_cast<std::ptrdiff_t>(d), w);
            break;
        }
        case Opcode::Nop:
            break;
        case Opcode::Add:
        {
            const Word rhs = pop();
            const Word lhs = pop();
            stack_.push_back(lhs.add(rhs));
            break;
        }
        case Opcode::AddI:
            stack_.back() = stack_.back().add(Word::fromU64(instr.arg));
            break;
        case Opcode::Mul:
        {
            const Word rhs = pop();
            const Word lhs = pop();
            stack_.push_back(lhs.mul(rhs));
            break;
        }
        case Opcode::Invert:
        {
            auto inv = stack_.back().inverse();
            if (!inv)
                return fail(instr, "inverse of zero");
            stack_.back() = *inv;
            break;
        }
        case Opcode::Eq:
        {
            const Word rhs = pop();
            const Word lhs = pop();
            stack_.push_back(Word::fromU64(lhs == rhs ? 1 : 0));
            break;
        }
        case Opcode::Lt:
        case Opcode::And:
        case Opcode::Xor:
        case Opcode::DivMod:
        case Opcode::Pow:
        {
            const Word rhs = peek(0);
            const Word lhs = peek(1);
            if (!isU32(rhs) || (instr.op != Opcode::Pow && !isU32(lhs)))
                return fail(instr, "operand is not a u32");
            if (instr.op == Opcode::DivMod && rhs.isZero())
                return fail(instr, "division by zero");
            pop();
            pop();
            const uint64_t a = lhs.value();
            const uint64_t b = rhs.value();
            switch (instr.op)
            {
                case Opcode::Lt:
                    stack_.push_back(Word::fromU64(a < b ? 1 : 0));
                    break;
                case Opcode::And:
                    stack_.push_back(Word::fromU64(a & b));
                    break;
                case Opcode::Xor:
                    stack_.push_back(Word::fromU64(a ^ b));
                    break;
                case Opcode::DivMod:
                    stack_.push_back(Word::fromU64(a / b));
                    stack_.push_back(Word::fromU64(a % b));
                    break;
                default:
                    stack_.push_back(lhs.pow(b));
                    break;
            }
            break;
        }
        case Opcode::Split:
        {
            const uint64_t x = pop().value();
            stack_.push_back(Word::fromU64(x >> 32));
            stack_.push_back(Word::fromU64(x & 0xFFFFFFFFULL));
            break;
        }
        case Opcode::Log2Floor:
        {
            const Word x = peek(0);
            if (!isU32(x))
                return fail(instr, "operand is not a u32");
            if (x.isZero())
                return fail(instr, "logarithm of zero");
            stack_.back() = Word::fromU64(63 - static_cast<uint64_t>(std::countl_zero(x.value())));
            break;
        }
        case Opcode::PopCount:
        {
            const Word x = peek(0);
            if (!isU32(x))
                return fail(instr, "operand is not a u32");
            stack_.back() = Word::fromU64(static_cast<uint64_t>(std::popcount(x.value())));
            break;
        }
        case Opcode::Hash:
        {
            std::array<Word, 10> in{};
            for (auto &w : in)
                w = pop();
            for (const auto &w : digest(in))
                stack_.push_back(w);
            break;
        }
        case Opcode::Assert:
            if (peek(0) != Word::fromU64(1))
                return fail(instr, "assertion failed");
            pop();
            break;
        case Opcode::ReadIo:
            if (input_.size() - inputPos_ < d)
                return fail(instr, "public input exhausted");
            for (size_t i = 0; i < d; ++i)
                stack_.push_back(input_[inputPos_++]);
            break;
        case Opcode::WriteIo:
            for (size_t i = 0; i < d; ++i)
                output_.push_back(pop());
            break;
        case Opcode::Divine:
            if (secret_.size() - secretPos_ < d)
                return fail(instr, "secret input exhausted");
            for (size_t i = 0; i < d; ++i)
                stack_.push_back(secret_[secretPos_++]);
            break;
        case Opcode::ReadMem:
        {
            const Word ptr = pop();
            for (size_t i = 0; i < d; ++i)
            {
                const Word addr = ptr.sub(Word::fromU64(i));
                auto it = ram_.find(addr.value());
                stack_.push_back(it == ram_.end() ? Word{} : it->second);
            }
            stack_.push_back(ptr.sub(Word::fromU64(d)));
            break;
        }
        case Opcode::WriteMem:
        {
            const Word ptr = pop();
            for (size_t i = 0; i < d; ++i)
                ram_[ptr.add(Word::fromU64(i)).value()] = pop();
            stack_.push_back(ptr.add(Word::fromU64(d)));
            break;
        }
        case Opcode::Count:
            return fail(instr, "unknown opcode");
    }
    ++executed_;
    return true;
}

} // namespace talus::tasm
