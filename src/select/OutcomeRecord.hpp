//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: select/OutcomeRecord.hpp
// Purpose: Per-block record of what the selector decided and why.
// Key invariants: A record is built once by the selector and never mutated;
//                 chosenCost <= baselineCost, and unverified records carry the
//                 baseline as the chosen sequence.
// Ownership/Lifetime: Value type; the replay log stores copies.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "encode/BlockEncoder.hpp"
#include "support/diag_expected.hpp"
#include "tasm/Instr.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace talus::select
{

/// @brief Progress of one selection; only Selected and Fallback are final.
enum class SelectionState : uint8_t
{
    Start,
    Encoded,
    Proposed,
    Verifying,
    Selected,
    Fallback
};

/// @brief Why a block ended with the sequence it did.
enum class DecisionReason : uint8_t
{
    CliffJump,        ///< Trimming the tallest table saved more cost than rows.
    TableRebalance,   ///< A different table became the tallest.
    StackScheduling,  ///< Cheaper without a cliff or table change.
    FailedVerify,     ///< Cheaper candidates existed but none verified.
    NoImprovement,    ///< Candidates existed but none was cheaper.
    NoCandidate,      ///< The generator proposed nothing.
    GeneratorError,   ///< The generator threw.
    GeneratorTimeout, ///< The generator overran its budget.
};

/// @brief Number of DecisionReason enumerators.
constexpr size_t kNumDecisionReasons = 8;

const char *toString(SelectionState state);
const char *toString(DecisionReason reason);

/// @brief True for the reasons that accompany a Selected outcome.
bool isWin(DecisionReason reason);

/// @brief Outcome of one optimize call.
struct OutcomeRecord
{
    encode::FeatureTensor tensor{};
    tasm::InstrSeq baseline;
    uint64_t baselineCost = 0;
    tasm::InstrSeq chosen;
    uint64_t chosenCost = 0;
    bool verified = false;
    std::string generatorVersion;
    SelectionState state = SelectionState::Start;
    DecisionReason reason = DecisionReason::NoCandidate;
};

/// @brief Version of the record payload layout.
constexpr uint32_t kRecordFormatVersion = 1;

/// @brief Encode @p record as a little-endian payload.
std::string serializeRecord(const OutcomeRecord &record);

/// @brief Parse a payload produced by serializeRecord().
/// @return "replay-corrupt" when a field is short, out of range or trailing
///         bytes remain.
support::Expected<OutcomeRecord> deserializeRecord(std::string_view payload);

} // namespace talus::select
