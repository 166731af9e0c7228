//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: gen/StackScheduler.hpp
// Purpose: Knob-parameterised lowering of a block to target instructions.
// Key invariants: Every schedule honours the block contract: inputs are
//                 consumed, outputs end on top in node order, values below
//                 the inputs are never touched and I/O order is kept.
// Ownership/Lifetime: Stateless apart from its knob set.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/BasicBlock.hpp"
#include "tasm/Instr.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace talus::gen
{

/// @brief Independent rewrites the scheduler can apply.
enum class Knob : uint8_t
{
    FoldConstants,   ///< Evaluate constant subtrees; push constants at each use.
    Identities,      ///< x+0, x-0, x*1, x*0, x-x, x==x, -(-x).
    FuseImmediate,   ///< add/sub with a known constant becomes addi.
    ConsumeInPlace,  ///< Move an operand at its last use instead of copying it.
    CommuteOperands, ///< Reorder commutative operands already on top.
    EliminateDead,   ///< Drop pure nodes whose results are never used.
    BatchCleanup,    ///< Remove leftover values with batched pops.
    SquareViaDup,    ///< Duplicate the first operand when both operands match.
};

/// @brief Number of knobs.
constexpr size_t kNumKnobs = 8;

/// @brief Bit set over Knob.
using KnobSet = uint8_t;

constexpr KnobSet knobBit(Knob k)
{
    return static_cast<KnobSet>(1u << static_cast<unsigned>(k));
}

constexpr KnobSet kNoKnobs = 0;
constexpr KnobSet kAllKnobs = 0xFF;

const char *toString(Knob k);

/// @brief Lowers blocks under a fixed knob set.
class StackScheduler
{
  public:
    explicit StackScheduler(KnobSet knobs) : knobs_(knobs) {}

    /// @brief Lower @p block.
    /// @return Empty when the block is invalid or a schedule would need to
    ///         reach deeper than the 16-slot window.
    std::optional<tasm::InstrSeq> schedule(const ir::BasicBlock &block) const;

    KnobSet knobs() const
    {
        return knobs_;
    }

  private:
    bool has(Knob k) const
    {
        return (knobs_ & knobBit(k)) != 0;
    }

    KnobSet knobs_;
};

/// @brief Reference lowering with every knob disabled.
std::optional<tasm::InstrSeq> lowerNaive(const ir::BasicBlock &block);

} // namespace talus::gen
