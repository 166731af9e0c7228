//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tasm/CostModel.cpp
// Purpose: Default cost model and the profile/cost computations.
//
//===----------------------------------------------------------------------===//

#include "tasm/CostModel.hpp"

#include <array>
#include <bit>
#include <limits>

namespace talus::tasm
{
namespace
{
constexpr std::array<std::string_view, kNumTables> kTritonTables = {
    "processor", "hash", "u32", "op_stack", "ram", "jump_stack"};

const TritonCostModel &defaultModel()
{
    static const TritonCostModel model;
    return model;
}
} // namespace

uint64_t pow2Ceil(uint64_t x)
{
    if (x == 0)
        return 0;
    if (x > (uint64_t{1} << 63))
        return std::numeric_limits<uint64_t>::max();
    return std::bit_ceil(x);
}

void CostProfile::add(const TableRows &delta)
{
    for (size_t i = 0; i < kNumTables; ++i)
        rows[i] += delta[i];
}

uint64_t CostProfile::maxHeight() const
{
    uint64_t best = 0;
    for (uint64_t r : rows)
        best = r > best ? r : best;
    return best;
}

Table CostProfile::dominantTable() const
{
    size_t best = 0;
    for (size_t i = 1; i < kNumTables; ++i)
    {
        if (rows[i] > rows[best])
            best = i;
    }
    return static_cast<Table>(best);
}

std::string_view TritonCostModel::targetName() const
{
    return "Triton VM";
}

std::span<const std::string_view> TritonCostModel::tableNames() const
{
    return kTritonTables;
}

TableRows TritonCostModel::deltas(const Instr &instr) const
{
    const OpcodeInfo &info = getOpcodeInfo(instr.op);
    TableRows rows = info.base;
    if (info.arg == ArgKind::Count)
    {
        rows[static_cast<size_t>(Table::OpStack)] += instr.arg * info.countOpStack;
        rows[static_cast<size_t>(Table::Ram)] += instr.arg * info.countRam;
    }
    return rows;
}

CostOracle::CostOracle() : model_(&defaultModel()) {}

CostProfile CostOracle::profile(const InstrSeq &seq) const
{
    CostProfile p;
    for (const auto &instr : seq)
        p.add(model_->deltas(instr));
    return p;
}

std::string formatProfile(const CostProfile &profile)
{
    std::string out;
    for (size_t i = 0; i < kNumTables; ++i)
    {
        if (i)
            out += ' ';
        out += tableName(static_cast<Table>(i));
        out += '=';
        out += std::to_string(profile.rows[i]);
    }
    return out;
}

} // namespace talus::tasm
