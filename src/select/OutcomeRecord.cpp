//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: select/OutcomeRecord.cpp
// Purpose: Names and the payload codec of outcome records.
// Key invariants: Payload layout is tensor, baseline, chosen, verified flag,
//                 generator version, state and reason, in that order.
//
//===----------------------------------------------------------------------===//

#include "select/OutcomeRecord.hpp"

#include "field/Goldilocks.hpp"
#include "support/byte_io.hpp"

namespace talus::select
{
using support::ByteReader;
using support::Expected;
using support::makeError;

namespace
{
/// Longest generator version string accepted by the reader.
constexpr uint32_t kMaxVersionBytes = 256;

/// Longest instruction sequence accepted by the reader.
constexpr uint32_t kMaxSeqLength = 1u << 16;

void putSeq(std::string &out, const tasm::InstrSeq &seq)
{
    support::putU32(out, static_cast<uint32_t>(seq.size()));
    for (const auto &in : seq)
    {
        support::putU8(out, static_cast<uint8_t>(in.op));
        support::putU64(out, in.arg);
    }
}

bool getSeq(ByteReader &r, tasm::InstrSeq &seq)
{
    uint32_t n = 0;
    if (!r.u32(n) || n > kMaxSeqLength)
        return false;
    seq.clear();
    seq.reserve(n);
    for (uint32_t i = 0; i < n; ++i)
    {
        uint8_t op = 0;
        uint64_t arg = 0;
        if (!r.u8(op) || !r.u64(arg) || op >= tasm::kNumOpcodes)
            return false;
        seq.push_back({static_cast<tasm::Opcode>(op), arg});
    }
    return true;
}

Expected<OutcomeRecord> corrupt(const char *what)
{
    return makeError("replay-corrupt", std::string("outcome record has a bad ") + what);
}
} // namespace

const char *toString(SelectionState state)
{
    switch (state)
    {
        case SelectionState::Start:
            return "start";
        case SelectionState::Encoded:
            return "encoded";
        case SelectionState::Proposed:
            return "proposed";
        case SelectionState::Verifying:
            return "verifying";
        case SelectionState::Selected:
            return "selected";
        case SelectionState::Fallback:
            return "fallback";
    }
    return "unknown";
}

const char *toString(DecisionReason reason)
{
    switch (reason)
    {
        case DecisionReason::CliffJump:
            return "cliff-jump";
        case DecisionReason::TableRebalance:
            return "table-rebalance";
        case DecisionReason::StackScheduling:
            return "stack-scheduling";
        case DecisionReason::FailedVerify:
            return "failed-verify";
        case DecisionReason::NoImprovement:
            return "no-improvement";
        case DecisionReason::NoCandidate:
            return "no-candidate";
        case DecisionReason::GeneratorError:
            return "generator-error";
        case DecisionReason::GeneratorTimeout:
            return "generator-timeout";
    }
    return "unknown";
}

bool isWin(DecisionReason reason)
{
    return reason == DecisionReason::CliffJump || reason == DecisionReason::TableRebalance ||
           reason == DecisionReason::StackScheduling;
}

std::string serializeRecord(const OutcomeRecord &record)
{
    std::string out;
    out.reserve(encode::kTensorWords * 8 + 64);
    support::putU32(out, static_cast<uint32_t>(encode::kTensorWords));
    for (const auto &w : record.tensor)
        support::putU64(out, w.raw().value());
    support::putU64(out, record.baselineCost);
    putSeq(out, record.baseline);
    support::putU64(out, record.chosenCost);
    putSeq(out, record.chosen);
    support::putU8(out, record.verified ? 1 : 0);
    support::putU32(out, static_cast<uint32_t>(record.generatorVersion.size()));
    out += record.generatorVersion;
    support::putU8(out, static_cast<uint8_t>(record.state));
    support::putU8(out, static_cast<uint8_t>(record.reason));
    return out;
}

Expected<OutcomeRecord> deserializeRecord(std::string_view payload)
{
    ByteReader r(payload);
    OutcomeRecord rec;

    uint32_t words = 0;
    if (!r.u32(words) || words != encode::kTensorWords)
        return corrupt("tensor length");
    for (auto &w : rec.tensor)
    {
        uint64_t raw = 0;
        if (!r.u64(raw) || raw >= field::kModulus)
            return corrupt("tensor word");
        w = field::Fixed::fromRaw(field::Goldilocks::fromU64(raw));
    }

    if (!r.u64(rec.baselineCost) || !getSeq(r, rec.baseline))
        return corrupt("baseline");
    if (!r.u64(rec.chosenCost) || !getSeq(r, rec.chosen))
        return corrupt("chosen sequence");

    uint8_t verified = 0;
    if (!r.u8(verified) || verified > 1)
        return corrupt("verified flag");
    rec.verified = verified == 1;

    uint32_t versionLen = 0;
    if (!r.u32(versionLen) || versionLen > kMaxVersionBytes ||
        !r.str(versionLen, rec.generatorVersion))
        return corrupt("generator version");

    uint8_t state = 0;
    uint8_t reason = 0;
    if (!r.u8(state) || state > static_cast<uint8_t>(SelectionState::Fallback))
        return corrupt("selection state");
    if (!r.u8(reason) || reason >= kNumDecisionReasons)
        return corrupt("decision reason");
    rec.state = static_cast<SelectionState>(state);
    rec.reason = static_cast<DecisionReason>(reason);

    if (!r.atEnd())
        return corrupt("length");
    return rec;
}

} // namespace talus::select
