//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tasm/CostModel.hpp
// Purpose: Per-instruction table deltas and the cliff-aware cost oracle.
// Key invariants: Profiles are exact sums of deltas; the cost of a profile is
//                 the next power of two of its tallest table (0 stays 0).
// Ownership/Lifetime: A CostOracle borrows its CostModel, which must outlive it.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tasm/Instr.hpp"
#include "tasm/Opcode.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace talus::tasm
{

/// @brief Round @p x up to a power of two; pow2Ceil(0) == 0.
/// @details Inputs above 2^63 saturate to UINT64_MAX.
uint64_t pow2Ceil(uint64_t x);

/// @brief Row counts of the six execution tables for a sequence.
struct CostProfile
{
    TableRows rows{};

    /// @brief Accumulate @p delta row-wise.
    void add(const TableRows &delta);

    /// @brief Height of the tallest table.
    uint64_t maxHeight() const;

    /// @brief Index of the tallest table; the first wins ties.
    Table dominantTable() const;

    friend bool operator==(const CostProfile &a, const CostProfile &b)
    {
        return a.rows == b.rows;
    }
};

/// @brief Upstream description of how instructions fill execution tables.
class CostModel
{
  public:
    virtual ~CostModel() = default;

    /// @brief Human readable target name.
    virtual std::string_view targetName() const = 0;

    /// @brief Names of the tables, in profile order.
    virtual std::span<const std::string_view> tableNames() const = 0;

    /// @brief Rows contributed by one execution of @p instr.
    virtual TableRows deltas(const Instr &instr) const = 0;
};

/// @brief Default six-table model built from Opcode.def.
class TritonCostModel final : public CostModel
{
  public:
    std::string_view targetName() const override;
    std::span<const std::string_view> tableNames() const override;
    TableRows deltas(const Instr &instr) const override;
};

/// @brief Computes profiles and cliff costs of instruction sequences.
class CostOracle
{
  public:
    /// @brief Oracle over the shared default TritonCostModel.
    CostOracle();

    explicit CostOracle(const CostModel &model) : model_(&model) {}

    /// @brief Sum the table deltas of every instruction in @p seq.
    CostProfile profile(const InstrSeq &seq) const;

    /// @brief Cliff cost of @p profile.
    static uint64_t cost(const CostProfile &profile)
    {
        return pow2Ceil(profile.maxHeight());
    }

    /// @brief Cliff cost of @p seq.
    uint64_t cost(const InstrSeq &seq) const
    {
        return cost(profile(seq));
    }

    const CostModel &model() const
    {
        return *model_;
    }

  private:
    const CostModel *model_;
};

/// @brief Render @p profile as "processor=N hash=N ..." for traces.
std::string formatProfile(const CostProfile &profile);

} // namespace talus::tasm
