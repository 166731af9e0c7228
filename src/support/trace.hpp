//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/trace.hpp
// Purpose: Declare tracing configuration and the line-oriented trace sink used
//          for optimizer decisions and degraded-path reporting.
// Key invariants: Each emitted line is written atomically and prefixed with
//                 "[talus:<area>] ".
// Ownership/Lifetime: The sink borrows its output stream; the stream must
//                     outlive the sink.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

namespace talus::support
{

/// @brief Configuration for optimizer tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,       ///< Tracing disabled
        Decisions, ///< One line per block decision plus degraded-path events
        Verbose    ///< Also trace every candidate and verification verdict
    } mode{Off};

    /// @brief Check whether tracing is enabled.
    bool enabled() const;

    /// @brief Check whether per-candidate lines should be emitted.
    bool verbose() const;
};

/// @brief Parse a trace mode name ("off", "decisions", "verbose").
/// @return True when @p text named a mode; @p out is left untouched otherwise.
bool parseTraceMode(std::string_view text, TraceConfig::Mode &out);

/// @brief Sink that formats and emits trace lines.
/// @details Safe to share between compiler threads; lines never interleave.
class TraceSink
{
  public:
    /// @brief Create a sink writing to std::cerr.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Create a sink writing to @p os.
    TraceSink(TraceConfig cfg, std::ostream &os);

    /// @brief Current configuration.
    const TraceConfig &config() const;

    /// @brief Emit a decision-level line for @p area.
    void decision(std::string_view area, const std::string &line);

    /// @brief Emit a verbose-level line for @p area.
    void verbose(std::string_view area, const std::string &line);

  private:
    void emit(std::string_view area, const std::string &line);

    TraceConfig cfg_;
    std::ostream *os_;
    std::mutex mutex_;
};

} // namespace talus::support
