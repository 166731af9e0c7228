//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the configuration reader. The format is deliberately small:
// one "key = value" pair per line, '#' comments, and a "training." prefix for
// trainer settings. Every malformed line is reported with its line number so a
// broken configuration fails loudly at startup instead of silently falling
// back to defaults.
//
//===----------------------------------------------------------------------===//

#include "support/options.hpp"

#include <charconv>
#include <cstdlib>
#include <istream>
#include <string_view>

namespace talus::support
{

namespace
{

std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
        s.remove_suffix(1);
    return s;
}

template <typename Int> bool parseInt(std::string_view text, Int &out)
{
    Int value{};
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last)
        return false;
    out = value;
    return true;
}

Diag lineError(size_t lineNo, const std::string &what)
{
    return makeError("options-parse", "line " + std::to_string(lineNo) + ": " + what);
}

/// @brief Apply one key/value pair to @p opts.
/// @return Empty string on success, otherwise a description of the problem.
std::string applyKey(Options &opts, std::string_view key, std::string_view value)
{
    bool ok = true;
    if (key == "candidates_per_block")
        ok = parseInt(value, opts.candidatesPerBlock);
    else if (key == "verify_timeout_ms")
        ok = parseInt(value, opts.verifyTimeoutMs);
    else if (key == "verify_workers")
        ok = parseInt(value, opts.verifyWorkers);
    else if (key == "verify_trials")
        ok = parseInt(value, opts.verifyTrials) && opts.verifyTrials > 0;
    else if (key == "verdict_cache_capacity")
        ok = parseInt(value, opts.verdictCacheCapacity) && opts.verdictCacheCapacity > 0;
    else if (key == "generation_budget_ms")
        ok = parseInt(value, opts.generationBudgetMs);
    else if (key == "seed")
        ok = parseInt(value, opts.seed);
    else if (key == "checkpoint_dir")
        opts.checkpointDir = std::string(value);
    else if (key == "replay_log")
        opts.replayLogPath = std::string(value);
    else if (key == "trace")
        ok = parseTraceMode(value, opts.trace.mode);
    else if (key == "training.population_size")
        ok = parseInt(value, opts.training.populationSize) && opts.training.populationSize >= 4;
    else if (key == "training.generations")
        ok = parseInt(value, opts.training.generations);
    else if (key == "training.batch_size")
        ok = parseInt(value, opts.training.batchSize);
    else if (key == "training.validation_size")
        ok = parseInt(value, opts.training.validationSize);
    else if (key == "training.promotion_margin")
        ok = parseInt(value, opts.training.promotionMargin) && opts.training.promotionMargin >= 0;
    else if (key == "training.eval_threads")
        ok = parseInt(value, opts.training.evalThreads);
    else
        return "unknown key '" + std::string(key) + "'";

    if (!ok)
        return "invalid value '" + std::string(value) + "' for '" + std::string(key) + "'";
    return {};
}

} // namespace

Expected<Options> parseOptions(std::istream &in)
{
    Options opts;
    std::string raw;
    size_t lineNo = 0;
    while (std::getline(in, raw))
    {
        ++lineNo;
        std::string_view line = trim(raw);
        if (line.empty() || line.front() == '#')
            continue;
        const auto eq = line.find('=');
        if (eq == std::string_view::npos)
            return lineError(lineNo, "expected 'key = value'");
        const std::string_view key = trim(line.substr(0, eq));
        const std::string_view value = trim(line.substr(eq + 1));
        if (key.empty())
            return lineError(lineNo, "missing key");
        if (auto problem = applyKey(opts, key, value); !problem.empty())
            return lineError(lineNo, problem);
    }
    return opts;
}

void applyEnvironment(Options &opts)
{
    if (const char *flag = std::getenv("TALUS_TRACE"))
    {
        TraceConfig::Mode mode = TraceConfig::Decisions;
        if (parseTraceMode(flag, mode))
            opts.trace.mode = mode;
    }
}

} // namespace talus::support
