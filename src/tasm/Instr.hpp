//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tasm/Instr.hpp
// Purpose: Target instructions, their TASM text form and structural checks.
// Key invariants: An Instr that passed checkWellFormed has an in-range
//                 argument and never reaches below the visible stack window.
// Ownership/Lifetime: Value types; sequences own their instructions.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "tasm/Opcode.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace talus::tasm
{

/// @brief One target instruction with its optional immediate.
struct Instr
{
    Opcode op = Opcode::Nop;
    uint64_t arg = 0; ///< Literal (canonical field element), depth or count.

    friend bool operator==(const Instr &a, const Instr &b)
    {
        return a.op == b.op && a.arg == b.arg;
    }

    friend bool operator!=(const Instr &a, const Instr &b)
    {
        return !(a == b);
    }
};

/// @brief Straight-line instruction sequence.
using InstrSeq = std::vector<Instr>;

/// @brief Stack footprint of a single instruction.
struct StackEffect
{
    size_t pops = 0;   ///< Values consumed from the top.
    size_t pushes = 0; ///< Values produced on the top.
    size_t reach = 0;  ///< Minimum stack depth required to execute.
};

/// @brief Compute the stack footprint of @p instr.
/// @pre The argument is in range for the opcode.
StackEffect stackEffect(const Instr &instr);

/// @brief Parse one line of TASM such as "push 5" or "dup 3".
/// @details Literals accept negative decimals, which wrap into the field.
support::Expected<Instr> parseInstr(std::string_view line);

/// @brief Parse a program with one instruction per line.
/// @details Blank lines and text after "//" are ignored.
support::Expected<InstrSeq> parseProgram(std::string_view text);

/// @brief Render @p instr in TASM syntax.
std::string formatInstr(const Instr &instr);

/// @brief Render @p seq with one instruction per line.
std::string formatProgram(const InstrSeq &seq);

/// @brief Validate argument ranges and stack discipline.
/// @param seq Sequence to check.
/// @param entryDepth Number of stack slots visible to the sequence on entry.
/// @return Error "malformed-instruction" or "stack-underflow" on failure.
support::Expected<void> checkWellFormed(const InstrSeq &seq, size_t entryDepth);

} // namespace talus::tasm
