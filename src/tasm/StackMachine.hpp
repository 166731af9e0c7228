//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tasm/StackMachine.hpp
// Purpose: Concrete executor for straight-line target instruction sequences.
// Key invariants: Once an instruction fails the machine latches the error and
//                 ignores every later instruction.
// Ownership/Lifetime: Owns its stack, RAM and I/O buffers.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "field/Goldilocks.hpp"
#include "tasm/Instr.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace talus::tasm
{

/// @brief Executes TASM over the Goldilocks field.
/// @details Binary instructions pop the right operand (top) first, then the
///          left, and push `lhs OP rhs`. u32 instructions fail on operands
///          that do not fit in 32 bits.
class StackMachine
{
  public:
    using Word = field::Goldilocks;

    /// @brief Create a machine whose stack holds @p initial (bottom first).
    explicit StackMachine(std::vector<Word> initial = {});

    /// @brief Words consumed by read_io, front first.
    void setPublicInput(std::vector<Word> input);

    /// @brief Words consumed by divine, front first.
    void setSecretInput(std::vector<Word> input);

    /// @brief Execute @p seq until it ends or an instruction fails.
    /// @return True when every instruction executed successfully.
    bool run(const InstrSeq &seq);

    /// @brief Execute one instruction.
    /// @return False when the machine is (or becomes) failed.
    bool step(const Instr &instr);

    /// @brief Current stack, bottom first.
    const std::vector<Word> &stack() const
    {
        return stack_;
    }

    /// @brief Words written by write_io, in order.
    const std::vector<Word> &publicOutput() const
    {
        return output_;
    }

    /// @brief Number of public input words consumed so far.
    size_t publicInputConsumed() const
    {
        return inputPos_;
    }

    bool failed() const
    {
        return !error_.empty();
    }

    /// @brief Description of the first failure; empty when none.
    const std::string &error() const
    {
        return error_;
    }

    /// @brief Instructions successfully executed.
    size_t executed() const
    {
        return executed_;
    }

  private:
    bool fail(const Instr &instr, const std::string &why);
    bool need(const Instr &instr, size_t n);
    Word pop();
    Word peek(size_t depth) const;

    std::vector<Word> stack_;
    std::vector<Word> input_;
    std::vector<Word> secret_;
    std::vector<Word> output_;
    std::unordered_map<uint64_t, Word> ram_;
    size_t inputPos_ = 0;
    size_t secretPos_ = 0;
    size_t executed_ = 0;
    std::string error_;
};

} // namespace talus::tasm
