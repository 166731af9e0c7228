//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library: the Expected<void> specialisation, severity-to-string mapping and
// the single diagnostic printer every subsystem shares, so block encoding,
// checkpoint and option errors all read the same way.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace talus::support
{

/// @brief Construct an Expected<void> that stores a diagnostic error state.
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Success is indicated by the absence of a stored diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the recorded failure; callers must check hasValue() first.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
/// @brief Map a diagnostic severity to the lowercase word used when printing.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(std::string code, std::string msg, BlockLoc loc)
{
    return Diag{Severity::Error, std::move(code), std::move(msg), loc};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// When the diagnostic names a block the line is prefixed with
/// "block <id>:" and, for node-level problems, ":<node>". The severity word is
/// followed by the bracketed code so logs can be grepped by code. A trailing
/// newline is always written.
void printDiag(const Diag &diag, std::ostream &os)
{
    if (diag.loc.hasBlock())
    {
        os << "block " << diag.loc.block;
        if (diag.loc.node >= 0)
            os << ':' << diag.loc.node;
        os << ": ";
    }
    os << detail::diagSeverityToString(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message << '\n';
}

} // namespace talus::support
