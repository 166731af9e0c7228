//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tasm/Opcode.cpp
// Purpose: Build the opcode metadata table from Opcode.def.
//
//===----------------------------------------------------------------------===//

#include "tasm/Opcode.hpp"

namespace talus::tasm
{
namespace
{
constexpr std::array<OpcodeInfo, kNumOpcodes> kOpcodeTable = {{
#define TALUS_OPCODE(NAME, MNEMONIC, ARG, POPS, PUSHES, CPOPS, CPUSHES, PROC, HASH, U32, OPST, RAM, \
                     JUMP, COPST, CRAM)                                                           \
    OpcodeInfo{MNEMONIC,                                                                          \
               ArgKind::ARG,                                                                      \
               POPS,                                                                              \
               PUSHES,                                                                            \
               CPOPS,                                                                             \
               CPUSHES,                                                                           \
               TableRows{PROC, HASH, U32, OPST, RAM, JUMP},                                       \
               COPST,                                                                             \
               CRAM},
#include "tasm/Opcode.def"
#undef TALUS_OPCODE
}};

static_assert(kOpcodeTable.size() == kNumOpcodes, "Opcode table must match enum count");

constexpr std::array<std::string_view, kNumTables> kTableNames = {
    "processor", "hash", "u32", "op_stack", "ram", "jump_stack"};
} // namespace

const OpcodeInfo &getOpcodeInfo(Opcode op)
{
    return kOpcodeTable[static_cast<size_t>(op)];
}

const char *toString(Opcode op)
{
    const size_t index = static_cast<size_t>(op);
    if (index < kOpcodeTable.size())
        return kOpcodeTable[index].mnemonic;
    return "";
}

std::optional<Opcode> lookupMnemonic(std::string_view mnemonic)
{
    for (size_t i = 0; i < kOpcodeTable.size(); ++i)
    {
        if (mnemonic == kOpcodeTable[i].mnemonic)
            return static_cast<Opcode>(i);
    }
    return std::nullopt;
}

std::string_view tableName(Table t)
{
    return kTableNames[static_cast<size_t>(t)];
}

} // namespace talus::tasm
