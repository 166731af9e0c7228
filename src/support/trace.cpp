//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/trace.cpp
// Purpose: Implement deterministic, line-oriented tracing for the optimizer.
// Key invariants: Each call produces at most one flushed line.
// Ownership/Lifetime: Uses external streams; no resource ownership.
//
//===----------------------------------------------------------------------===//

#include "support/trace.hpp"

#include <iostream>

namespace talus::support
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

bool TraceConfig::verbose() const
{
    return mode == Verbose;
}

bool parseTraceMode(std::string_view text, TraceConfig::Mode &out)
{
    if (text == "off" || text == "0")
    {
        out = TraceConfig::Off;
        return true;
    }
    if (text == "decisions" || text == "1" || text.empty())
    {
        out = TraceConfig::Decisions;
        return true;
    }
    if (text == "verbose" || text == "2")
    {
        out = TraceConfig::Verbose;
        return true;
    }
    return false;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg_(cfg), os_(&std::cerr) {}

TraceSink::TraceSink(TraceConfig cfg, std::ostream &os) : cfg_(cfg), os_(&os) {}

const TraceConfig &TraceSink::config() const
{
    return cfg_;
}

void TraceSink::decision(std::string_view area, const std::string &line)
{
    if (cfg_.enabled())
        emit(area, line);
}

void TraceSink::verbose(std::string_view area, const std::string &line)
{
    if (cfg_.verbose())
        emit(area, line);
}

/// @brief Write one prefixed line under the sink mutex and flush it.
void TraceSink::emit(std::string_view area, const std::string &line)
{
    std::lock_guard<std::mutex> lock(mutex_);
    *os_ << "[talus:" << area << "] " << line << '\n';
    os_->flush();
}

} // namespace talus::support
