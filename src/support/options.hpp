//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares the optimizer and trainer settings plus a key = value
//          configuration reader.
// Key invariants: Defaults describe a working single-threaded configuration.
// Ownership/Lifetime: Value types; caller owns option values.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/trace.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace talus::support
{

/// @brief Settings for an offline population training session.
/// @ownership Value type.
struct TrainingOptions
{
    /// @brief Members per population; the top quarter survive each generation.
    size_t populationSize = 16;

    /// @brief Generations per training session.
    size_t generations = 20;

    /// @brief Replay records used to score members during a session.
    size_t batchSize = 64;

    /// @brief Most recent replay records held out for the promotion check.
    size_t validationSize = 32;

    /// @brief Validation fitness the best member must exceed the active
    ///        parameters by before it is promoted.
    int64_t promotionMargin = 0;

    /// @brief Worker threads used to score population members; 0 selects the
    ///        hardware concurrency.
    size_t evalThreads = 0;
};

/// @brief Holds settings that influence optimizer behavior.
/// @invariant Durations of zero mean "no limit".
/// @ownership Value type.
struct Options
{
    /// @brief Candidates requested from the generator per block (K).
    size_t candidatesPerBlock = 32;

    /// @brief Per-candidate verification timeout in milliseconds.
    uint32_t verifyTimeoutMs = 1000;

    /// @brief Verification worker threads; 0 verifies inline on the caller.
    size_t verifyWorkers = 0;

    /// @brief Differential trials run by the reference verifier per candidate.
    uint32_t verifyTrials = 16;

    /// @brief Verdicts memoised across blocks before the least recently used
    ///        is evicted.
    size_t verdictCacheCapacity = 4096;

    /// @brief Wall-clock budget for candidate generation per block.
    uint32_t generationBudgetMs = 0;

    /// @brief Seed threaded through generation and training.
    uint64_t seed = 0;

    /// @brief Directory holding the checkpoint store.
    std::string checkpointDir;

    /// @brief Path of the append-only outcome log; empty disables logging.
    std::string replayLogPath;

    /// @brief Tracing configuration.
    TraceConfig trace{};

    /// @brief Offline training settings.
    TrainingOptions training{};
};

/// @brief Read options from "key = value" lines.
/// @details Blank lines and lines starting with '#' are ignored. Training keys
///          use a "training." prefix. Unknown keys and malformed values yield an
///          "options-parse" diagnostic naming the line.
Expected<Options> parseOptions(std::istream &in);

/// @brief Apply environment overrides (TALUS_TRACE) to @p opts.
void applyEnvironment(Options &opts);

} // namespace talus::support
