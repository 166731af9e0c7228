//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares diagnostic records and the engine that collects them.
// Key invariants: Counts reflect reported diagnostics; codes are stable strings.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace talus::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Optional location of a diagnostic inside a basic block.
/// @details A block id of zero means "no block"; node index -1 means the
///          diagnostic applies to the whole block.
struct BlockLoc
{
    uint64_t block = 0; ///< Caller-assigned block identifier
    int32_t node = -1;  ///< Offending node index, or -1

    /// @brief Check whether the location names a block.
    [[nodiscard]] bool hasBlock() const
    {
        return block != 0;
    }
};

/// @brief Single diagnostic message with a stable machine-readable code.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string code;    ///< Stable identifier such as "block-too-large"
    std::string message; ///< Human-readable text
    BlockLoc loc{};      ///< Optional block location
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    void printAll(std::ostream &os) const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

    /// @brief Read-only access to every recorded diagnostic.
    const std::vector<Diagnostic> &all() const;

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};

} // namespace talus::support
