//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: select/ReplayLog.hpp
// Purpose: Append-only on-disk log of outcome records.
// Key invariants: A single writer thread owns the file, so frames appended
//                 from many compiler threads never interleave. Each frame is
//                 "TLOR", version, payload length, payload, FNV-1a checksum.
//                 Readers stop at the first torn or corrupt frame.
// Ownership/Lifetime: The log owns its writer thread and stream; destruction
//                     drains queued records and joins the writer.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "select/OutcomeRecord.hpp"
#include "support/diag_expected.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace talus::select
{

/// @brief Frame header bytes: magic, version and payload length.
constexpr size_t kFrameHeaderBytes = 12;

/// @brief Frame trailer bytes: FNV-1a checksum of the payload.
constexpr size_t kFrameTrailerBytes = 8;

/// @brief Everything a reader could recover from a log file.
struct ReplayContents
{
    std::vector<OutcomeRecord> records;
    bool truncatedTail = false; ///< Bytes after the last good frame were dropped.
    uint64_t validBytes = 0;    ///< Length of the well-formed prefix.
};

/// @brief Wrap @p record in a checksummed frame.
std::string frameRecord(const OutcomeRecord &record);

class ReplayLog
{
  public:
    /// @brief Open @p path for appending, creating it if needed.
    /// @details A torn tail left by an interrupted writer is cut off first so
    ///          new frames stay reachable.
    /// @return "io-error" when the file cannot be opened or repaired.
    static support::Expected<std::unique_ptr<ReplayLog>> open(const std::string &path);

    /// @brief Read every intact frame of @p path.
    /// @return "io-error" when the file cannot be read.
    static support::Expected<ReplayContents> readAll(const std::string &path);

    ~ReplayLog();

    ReplayLog(const ReplayLog &) = delete;
    ReplayLog &operator=(const ReplayLog &) = delete;

    /// @brief Queue @p record for the writer; returns immediately.
    void append(OutcomeRecord record);

    /// @brief Wait until every queued record has been written and flushed.
    /// @return The first write failure seen since the log was opened.
    support::Expected<void> flush();

    /// @brief Drain the queue, stop the writer and close the file.
    void close();

    const std::string &path() const
    {
        return path_;
    }

  private:
    ReplayLog(std::string path, std::ofstream out);

    void writerLoop();
    void fail(std::string message);

    std::string path_;
    std::ofstream out_;
    std::deque<OutcomeRecord> queue_;
    std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    bool writing_ = false;
    bool stop_ = false;
    std::optional<support::Diag> status_;
    std::thread writer_;
};

} // namespace talus::select
