//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tasm/Opcode.hpp
// Purpose: Enumerates target instructions and exposes their static metadata.
// Key invariants: Enumeration order and metadata both derive from Opcode.def.
// Ownership/Lifetime: Metadata lives in static storage.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace talus::tasm
{

/// @brief All target instructions.
enum class Opcode : uint8_t
{
#define TALUS_OPCODE(NAME, ...) NAME,
#include "tasm/Opcode.def"
#undef TALUS_OPCODE
    Count
};

/// @brief Total number of opcodes.
constexpr size_t kNumOpcodes = static_cast<size_t>(Opcode::Count);

/// @brief Execution tables of the target machine, in profile order.
enum class Table : uint8_t
{
    Processor,
    Hash,
    U32,
    OpStack,
    Ram,
    JumpStack
};

/// @brief Number of execution tables.
constexpr size_t kNumTables = 6;

/// @brief Row counts contributed to each table.
using TableRows = std::array<uint64_t, kNumTables>;

/// @brief Number of stack slots reachable by depth arguments.
constexpr unsigned kStackWindow = 16;

/// @brief Largest count accepted by count-argument instructions.
constexpr unsigned kMaxCount = 5;

/// @brief Shape of an instruction's immediate argument.
enum class ArgKind : uint8_t
{
    None,      ///< No argument.
    Literal,   ///< Field element.
    Depth,     ///< Stack depth 0..15.
    SwapDepth, ///< Stack depth 1..15.
    Count      ///< Element count 1..5.
};

/// @brief Static description of one opcode.
struct OpcodeInfo
{
    const char *mnemonic; ///< TASM spelling.
    ArgKind arg;          ///< Argument shape.
    uint8_t pops;         ///< Fixed values consumed.
    uint8_t pushes;       ///< Fixed values produced.
    uint8_t countPops;    ///< Extra values consumed per count unit.
    uint8_t countPushes;  ///< Extra values produced per count unit.
    TableRows base;       ///< Table rows for every execution.
    uint8_t countOpStack; ///< Extra op_stack rows per count unit.
    uint8_t countRam;     ///< Extra ram rows per count unit.
};

/// @brief Metadata for @p op.
const OpcodeInfo &getOpcodeInfo(Opcode op);

/// @brief TASM mnemonic for @p op; empty string when out of range.
const char *toString(Opcode op);

/// @brief Resolve a TASM mnemonic.
std::optional<Opcode> lookupMnemonic(std::string_view mnemonic);

/// @brief Lower-case name of table @p t.
std::string_view tableName(Table t);

} // namespace talus::tasm
