//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: select/ReplayLog.cpp
// Purpose: Frame codec, tail repair and the single-writer loop.
//
//===----------------------------------------------------------------------===//

#include "select/ReplayLog.hpp"

#include "support/byte_io.hpp"
#include "support/hash.hpp"

#include <filesystem>
#include <iterator>
#include <system_error>
#include <utility>

namespace talus::select
{
using support::Expected;
using support::makeError;

namespace
{
constexpr char kMagic[4] = {'T', 'L', 'O', 'R'};

/// Payloads above this size are treated as corruption, not allocation requests.
constexpr uint64_t kMaxPayloadBytes = uint64_t{1} << 24;
} // namespace

std::string frameRecord(const OutcomeRecord &record)
{
    const std::string payload = serializeRecord(record);
    std::string out(kMagic, 4);
    support::putU32(out, kRecordFormatVersion);
    support::putU32(out, static_cast<uint32_t>(payload.size()));
    out += payload;
    support::putU64(out, support::fnv1a(payload));
    return out;
}

Expected<ReplayContents> ReplayLog::readAll(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return makeError("io-error", "cannot open replay log '" + path + "'");
    const std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
        return makeError("io-error", "failed reading replay log '" + path + "'");

    ReplayContents out;
    const std::string_view view(bytes);
    size_t pos = 0;
    while (pos < view.size())
    {
        const size_t remaining = view.size() - pos;
        if (remaining < kFrameHeaderBytes || view.substr(pos, 4) != std::string_view(kMagic, 4))
            break;
        const uint64_t version = support::getLE(view, pos + 4, 4);
        const uint64_t length = support::getLE(view, pos + 8, 4);
        if (version != kRecordFormatVersion || length > kMaxPayloadBytes ||
            remaining < kFrameHeaderBytes + length + kFrameTrailerBytes)
            break;
        const std::string_view payload = view.substr(pos + kFrameHeaderBytes, length);
        const uint64_t checksum = support::getLE(view, pos + kFrameHeaderBytes + length, 8);
        if (checksum != support::fnv1a(payload))
            break;
        auto rec = deserializeRecord(payload);
        if (!rec)
            break;
        out.records.push_back(std::move(rec.value()));
        pos += kFrameHeaderBytes + length + kFrameTrailerBytes;
    }
    out.validBytes = pos;
    out.truncatedTail = pos < view.size();
    return out;
}

Expected<std::unique_ptr<ReplayLog>> ReplayLog::open(const std::string &path)
{
    std::error_code ec;
    if (std::filesystem::exists(path, ec))
    {
        auto existing = readAll(path);
        if (!existing)
            return existing.error();
        if (existing.value().truncatedTail)
        {
            std::filesystem::resize_file(path, existing.value().validBytes, ec);
            if (ec)
                return makeError("io-error",
                                 "cannot repair replay log '" + path + "': " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out)
        return makeError("io-error", "cannot open replay log '" + path + "' for append");
    return std::unique_ptr<ReplayLog>(new ReplayLog(path, std::move(out)));
}

ReplayLog::ReplayLog(std::string path, std::ofstream out)
    : path_(std::move(path)), out_(std::move(out))
{
    writer_ = std::thread([this] { writerLoop(); });
}

ReplayLog::~ReplayLog()
{
    close();
}

void ReplayLog::append(OutcomeRecord record)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_)
        {
            if (!status_)
                status_ = makeError("io-error", "append to closed replay log '" + path_ + "'");
            return;
        }
        queue_.push_back(std::move(record));
    }
    wake_.notify_one();
}

Expected<void> ReplayLog::flush()
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && !writing_; });
    if (out_.is_open())
    {
        out_.flush();
        if (!out_ && !status_)
            status_ = makeError("io-error", "failed flushing replay log '" + path_ + "'");
    }
    if (status_)
        return *status_;
    return {};
}

void ReplayLog::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    wake_.notify_all();
    if (writer_.joinable())
        writer_.join();
    if (out_.is_open())
        out_.close();
}

void ReplayLog::fail(std::string message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!status_)
        status_ = makeError("io-error", std::move(message));
}

void ReplayLog::writerLoop()
{
    while (true)
    {
        OutcomeRecord record;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this] { return stop_ || !queue_.empty(); });
            if (queue_.empty())
                return;
            record = std::move(queue_.front());
            queue_.pop_front();
            writing_ = true;
        }

        const std::string frame = frameRecord(record);
        out_.write(frame.data(), static_cast<std::streamsize>(frame.size()));
        out_.flush();
        if (!out_)
            fail("failed writing replay log '" + path_ + "'");

        {
            std::lock_guard<std::mutex> lock(mutex_);
            writing_ = false;
        }
        idle_.notify_all();
    }
}

} // namespace talus::select
