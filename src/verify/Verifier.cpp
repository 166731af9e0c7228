//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: verify/Verifier.cpp
// Purpose: Verdict names used in traces and outcome summaries.
//
//===----------------------------------------------------------------------===//

#include "verify/Verifier.hpp"

namespace talus::verify
{

const char *toString(Verdict v)
{
    switch (v)
    {
        case Verdict::Verified:
            return "verified";
        case Verdict::Refuted:
            return "refuted";
        case Verdict::Inconclusive:
            return "inconclusive";
        case Verdict::Timeout:
            return "timeout";
    }
    return "";
}

} // namespace talus::verify
