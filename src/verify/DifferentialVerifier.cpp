//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: verify/DifferentialVerifier.cpp
// Purpose: Typed random input generation and per-trial comparison.
// Key invariants: Inputs are a pure function of (seed, trial, slot).
//
//===----------------------------------------------------------------------===//

#include "verify/DifferentialVerifier.hpp"

#include "field/Goldilocks.hpp"
#include "ir/Evaluate.hpp"
#include "support/hash.hpp"
#include "tasm/StackMachine.hpp"

#include <array>
#include <utility>
#include <vector>

namespace talus::verify
{
using field::Goldilocks;

namespace
{
/// Draw one value of @p type; the trial number selects the value range so
/// that u32 paths and full-field paths are both exercised.
Goldilocks draw(ir::TypeTag type, uint32_t trial, uint64_t bits)
{
    if (type == ir::TypeTag::Bool)
        return Goldilocks::fromU64(bits & 1);
    const uint32_t band = trial % 4;
    if (band == 0)
        return Goldilocks::fromU64(bits & 0xF);
    if (band == 1 || type == ir::TypeTag::U32)
        return Goldilocks::fromU64(bits & 0xFFFFFFFFULL);
    return Goldilocks::fromU64(bits);
}

/// Type of entry slot @p slot as seen by the block's input nodes.
ir::TypeTag slotType(const ir::BasicBlock &block, uint64_t slot)
{
    for (const auto &n : block.nodes)
    {
        if (n.kind == ir::NodeKind::Input && n.imm == slot)
            return n.type;
    }
    return ir::TypeTag::Field;
}

class TrialRng
{
  public:
    TrialRng(uint64_t seed, uint32_t trial) : state_(support::mix64(seed ^ (uint64_t{trial} << 32))) {}

    uint64_t next()
    {
        state_ = support::mix64(state_);
        return state_;
    }

  private:
    uint64_t state_;
};
} // namespace

Verdict DifferentialVerifier::verify(const ir::BasicBlock &block, const tasm::InstrSeq &instrs) const
{
    if (!ir::validate(block))
        return Verdict::Inconclusive;
    if (!tasm::checkWellFormed(instrs, block.inputCount))
        return Verdict::Refuted;

    std::vector<ir::TypeTag> readTypes;
    for (const auto &n : block.nodes)
    {
        if (n.kind == ir::NodeKind::ReadIo)
            readTypes.push_back(n.type);
    }

    uint32_t completed = 0;
    for (uint32_t trial = 0; trial < trials_; ++trial)
    {
        TrialRng rng(seed_, trial);

        std::array<Goldilocks, kGuardWords> guards{};
        for (auto &g : guards)
            g = Goldilocks::fromU64(rng.next());

        std::vector<Goldilocks> inputs(block.inputCount);
        for (uint32_t s = 0; s < block.inputCount; ++s)
            inputs[s] = draw(slotType(block, s), trial, rng.next());

        std::vector<Goldilocks> ioIn;
        for (auto type : readTypes)
            ioIn.push_back(draw(type, trial, rng.next()));

        auto expected = ir::evaluate(block, inputs, ioIn);

        std::vector<Goldilocks> initial(guards.begin(), guards.end());
        for (uint32_t s = block.inputCount; s-- > 0;)
            initial.push_back(inputs[s]);
        tasm::StackMachine machine(std::move(initial));
        machine.setPublicInput(ioIn);
        const bool ran = machine.run(instrs);

        if (!expected && !ran)
            continue;
        if (!expected || !ran)
            return Verdict::Refuted;

        const ir::EvalResult &want = expected.value();
        std::vector<Goldilocks> wantStack(guards.begin(), guards.end());
        wantStack.insert(wantStack.end(), want.outputs.begin(), want.outputs.end());
        if (machine.stack() != wantStack || machine.publicOutput() != want.ioWrites ||
            machine.publicInputConsumed() != want.ioReads)
            return Verdict::Refuted;
        ++completed;
    }
    return completed > 0 ? Verdict::Verified : Verdict::Inconclusive;
}

} // namespace talus::verify
