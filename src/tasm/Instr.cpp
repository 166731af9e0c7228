//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tasm/Instr.cpp
// Purpose: TASM text parsing/formatting and structural validation.
// Key invariants: formatInstr output always re-parses to the same Instr.
//
//===----------------------------------------------------------------------===//

#include "tasm/Instr.hpp"

#include "field/Goldilocks.hpp"

#include <cctype>
#include <charconv>

namespace talus::tasm
{
using support::Expected;
using support::makeError;

namespace
{
std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

std::string_view stripComment(std::string_view s)
{
    const size_t pos = s.find("//");
    return pos == std::string_view::npos ? s : s.substr(0, pos);
}

bool parseUnsigned(std::string_view text, uint64_t &out)
{
    if (text.empty())
        return false;
    const char *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc() && ptr == end;
}

/// Parse a literal into its canonical field representative.
bool parseLiteral(std::string_view text, uint64_t &out)
{
    bool negative = false;
    if (!text.empty() && text.front() == '-')
    {
        negative = true;
        text.remove_prefix(1);
    }
    uint64_t mag = 0;
    if (!parseUnsigned(text, mag) || mag >= field::kModulus)
        return false;
    auto g = field::Goldilocks::fromU64(mag);
    out = (negative ? g.neg() : g).value();
    return true;
}

/// Inclusive argument range for @p kind.
void argRange(ArgKind kind, uint64_t &lo, uint64_t &hi)
{
    switch (kind)
    {
        case ArgKind::None:
            lo = hi = 0;
            return;
        case ArgKind::Literal:
            lo = 0;
            hi = field::kModulus - 1;
            return;
        case ArgKind::Depth:
            lo = 0;
            hi = kStackWindow - 1;
            return;
        case ArgKind::SwapDepth:
            lo = 1;
            hi = kStackWindow - 1;
            return;
        case ArgKind::Count:
            lo = 1;
            hi = kMaxCount;
            return;
    }
    lo = hi = 0;
}

bool argInRange(const Instr &instr)
{
    if (static_cast<size_t>(instr.op) >= kNumOpcodes)
        return false;
    uint64_t lo = 0;
    uint64_t hi = 0;
    argRange(getOpcodeInfo(instr.op).arg, lo, hi);
    return instr.arg >= lo && instr.arg <= hi;
}
} // namespace

StackEffect stackEffect(const Instr &instr)
{
    const OpcodeInfo &info = getOpcodeInfo(instr.op);
    StackEffect fx;
    const size_t units = info.arg == ArgKind::Count ? static_cast<size_t>(instr.arg) : 0;
    fx.pops = info.pops + units * info.countPops;
    fx.pushes = info.pushes + units * info.countPushes;
    fx.reach = fx.pops;
    switch (instr.op)
    {
        case Opcode::Dup:
        case Opcode::Swap:
        case Opcode::Pick:
        case Opcode::Place:
            fx.reach = static_cast<size_t>(instr.arg) + 1;
            break;
        default:
            break;
    }
    return fx;
}

Expected<Instr> parseInstr(std::string_view line)
{
    line = trim(stripComment(line));
    const size_t split = line.find_first_of(" \t");
    const std::string_view mnemonic = line.substr(0, split);
    const std::string_view operand =
        split == std::string_view::npos ? std::string_view{} : trim(line.substr(split));

    auto op = lookupMnemonic(mnemonic);
    if (!op)
        return makeError("malformed-instruction", "unknown mnemonic '" + std::string(mnemonic) + "'");

    Instr instr{*op, 0};
    const ArgKind kind = getOpcodeInfo(*op).arg;
    if (kind == ArgKind::None)
    {
        if (!operand.empty())
            return makeError("malformed-instruction",
                             std::string(mnemonic) + " takes no argument");
        return instr;
    }
    if (operand.empty())
        return makeError("malformed-instruction", std::string(mnemonic) + " requires an argument");

    const bool ok = kind == ArgKind::Literal ? parseLiteral(operand, instr.arg)
                                             : parseUnsigned(operand, instr.arg);
    if (!ok || !argInRange(instr))
        return makeError("malformed-instruction",
                         "invalid argument '" + std::string(operand) + "' for " +
                             std::string(mnemonic));
    return instr;
}

Expected<InstrSeq> parseProgram(std::string_view text)
{
    InstrSeq seq;
    size_t lineNo = 0;
    while (!text.empty())
    {
        ++lineNo;
        const size_t nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);

        line = trim(stripComment(line));
        if (line.empty())
            continue;
        auto instr = parseInstr(line);
        if (!instr)
        {
            auto diag = instr.error();
            diag.message = "line " + std::to_string(lineNo) + ": " + diag.message;
            return diag;
        }
        seq.push_back(instr.value());
    }
    return seq;
}

std::string formatInstr(const Instr &instr)
{
    std::string out = toString(instr.op);
    if (getOpcodeInfo(instr.op).arg != ArgKind::None)
    {
        out += ' ';
        out += std::to_string(instr.arg);
    }
    return out;
}

std::string formatProgram(const InstrSeq &seq)
{
    std::string out;
    for (const auto &instr : seq)
    {
        out += formatInstr(instr);
        out += '\n';
    }
    return out;
}

Expected<void> checkWellFormed(const InstrSeq &seq, size_t entryDepth)
{
    size_t depth = entryDepth;
    for (size_t i = 0; i < seq.size(); ++i)
    {
        const Instr &instr = seq[i];
        if (!argInRange(instr))
            return makeError("malformed-instruction",
                             "instruction " + std::to_string(i) + " has an out-of-range argument");
        const StackEffect fx = stackEffect(instr);
        if (fx.reach > depth)
            return makeError("stack-underflow",
                             "instruction " + std::to_string(i) + " (" + formatInstr(instr) +
                                 ") needs " + std::to_string(fx.reach) + " slots, " +
                                 std::to_string(depth) + " visible");
        depth = depth - fx.pops + fx.pushes;
    }
    return {};
}

} // namespace talus::tasm
