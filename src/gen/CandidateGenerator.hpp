//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: gen/CandidateGenerator.hpp
// Purpose: Interface of the learned search that proposes replacement
//          sequences for an encoded block.
// Key invariants: propose() is deterministic for fixed parameters, performs
//                 no I/O and terminates in a bounded number of steps.
// Ownership/Lifetime: Candidates are returned by value and owned by the caller.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "encode/BlockEncoder.hpp"
#include "field/Fixed.hpp"
#include "tasm/Instr.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace talus::gen
{

/// @brief One proposed sequence with the generator's confidence.
struct Candidate
{
    tasm::InstrSeq instrs;
    field::Fixed score;
};

/// @brief Proposes candidate sequences for an encoded block.
class CandidateGenerator
{
  public:
    virtual ~CandidateGenerator() = default;

    /// @brief Return at most @p k candidates, best first; empty is valid.
    virtual std::vector<Candidate> propose(const encode::FeatureTensor &tensor, size_t k) const = 0;

    /// @brief Content hash of the parameters driving this generator.
    virtual std::string version() const = 0;
};

} // namespace talus::gen
