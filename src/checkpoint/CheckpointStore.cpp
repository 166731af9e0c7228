//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: checkpoint/CheckpointStore.cpp
// Purpose: Atomic file writes, blob validation and the metadata format.
//
//===----------------------------------------------------------------------===//

#include "checkpoint/CheckpointStore.hpp"

#include "support/hash.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

namespace talus::checkpoint
{
using support::Expected;
using support::makeError;
namespace fs = std::filesystem;

namespace
{
constexpr const char *kParamsDir = "params";
constexpr const char *kActiveFile = "ACTIVE";

std::atomic<uint64_t> tempCounter{0};

/// Temporary sibling of @p target, unique across threads and processes that
/// share the store.
fs::path tempPath(const fs::path &target)
{
    const uint64_t salt =
        support::mix64(static_cast<uint64_t>(
                           std::chrono::steady_clock::now().time_since_epoch().count()) ^
                       std::hash<std::thread::id>{}(std::this_thread::get_id()) ^
                       (tempCounter.fetch_add(1) << 32));
    fs::path tmp = target;
    tmp += ".tmp." + support::toHex(salt);
    return tmp;
}

/// Write @p bytes to @p target through a temporary file and a rename.
Expected<void> writeAtomic(const fs::path &target, std::string_view bytes)
{
    const fs::path tmp = tempPath(target);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
            return makeError("io-error", "cannot create '" + tmp.string() + "'");
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out)
        {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return makeError("io-error", "failed writing '" + tmp.string() + "'");
        }
    }
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec)
    {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return makeError("io-error",
                         "cannot rename into '" + target.string() + "': " + ec.message());
    }
    return {};
}

Expected<std::string> readFile(const fs::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return makeError("io-error", "cannot open '" + path.string() + "'");
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
        return makeError("io-error", "failed reading '" + path.string() + "'");
    return bytes;
}

template <typename Int> bool parseNumber(const std::string &text, Int &out)
{
    Int value{};
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc() || ptr != last)
        return false;
    out = value;
    return true;
}
} // namespace

bool isContentHash(std::string_view hash)
{
    return hash.size() == 32 && std::all_of(hash.begin(), hash.end(), [](char c) {
               return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
           });
}

CheckpointStore::CheckpointStore(fs::path root) : root_(std::move(root)) {}

fs::path CheckpointStore::paramsPath(const std::string &hash) const
{
    return root_ / kParamsDir / (hash + ".bin");
}

fs::path CheckpointStore::metaPath(const std::string &hash) const
{
    return root_ / kParamsDir / (hash + ".meta");
}

Expected<std::string> CheckpointStore::save(const gen::GeneratorParams &params)
{
    const std::string blob = params.serialize();
    const std::string hash = support::contentHash(blob);
    const fs::path target = paramsPath(hash);

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec)
        return makeError("io-error", "cannot create '" + target.parent_path().string() +
                                         "': " + ec.message());

    if (fs::exists(target, ec))
    {
        auto existing = readFile(target);
        if (existing && existing.value() == blob)
            return hash;
    }
    auto written = writeAtomic(target, blob);
    if (!written)
        return written.error();
    return hash;
}

Expected<gen::GeneratorParams> CheckpointStore::load(const std::string &hash) const
{
    std::error_code ec;
    if (!isContentHash(hash) || !fs::exists(paramsPath(hash), ec))
        return makeError("checkpoint-not-found", "no checkpoint '" + hash + "'");

    auto bytes = readFile(paramsPath(hash));
    if (!bytes)
        return bytes.error();
    if (support::contentHash(bytes.value()) != hash)
        return makeError("checkpoint-corrupt", "checkpoint '" + hash + "' fails its content hash");
    return gen::GeneratorParams::deserialize(bytes.value());
}

Expected<std::string> CheckpointStore::active() const
{
    const fs::path pointer = root_ / kActiveFile;
    std::error_code ec;
    if (!fs::exists(pointer, ec))
        return makeError("checkpoint-not-found", "no active checkpoint in '" + root_.string() + "'");

    auto text = readFile(pointer);
    if (!text)
        return text.error();
    std::string hash = text.value();
    while (!hash.empty() && (hash.back() == '\n' || hash.back() == '\r'))
        hash.pop_back();
    if (!isContentHash(hash))
        return makeError("checkpoint-corrupt", "ACTIVE does not name a checkpoint");
    return hash;
}

Expected<void> CheckpointStore::setActive(const std::string &hash)
{
    auto params = load(hash);
    if (!params)
        return params.error();
    return writeAtomic(root_ / kActiveFile, hash + "\n");
}

Expected<void> CheckpointStore::saveMeta(const std::string &hash, const CheckpointMeta &meta)
{
    std::error_code ec;
    if (!isContentHash(hash) || !fs::exists(paramsPath(hash), ec))
        return makeError("checkpoint-not-found", "no checkpoint '" + hash + "'");

    std::ostringstream os;
    os << "generation=" << meta.generation << "\n";
    os << "fitness=" << meta.fitness << "\n";
    os << "validation_fitness=" << meta.validationFitness << "\n";
    os << "parent=" << meta.parent << "\n";
    return writeAtomic(metaPath(hash), os.str());
}

Expected<CheckpointMeta> CheckpointStore::loadMeta(const std::string &hash) const
{
    std::error_code ec;
    if (!isContentHash(hash) || !fs::exists(metaPath(hash), ec))
        return makeError("checkpoint-not-found", "no metadata for checkpoint '" + hash + "'");

    auto text = readFile(metaPath(hash));
    if (!text)
        return text.error();

    CheckpointMeta meta;
    std::istringstream in(text.value());
    std::string line;
    while (std::getline(in, line))
    {
        if (line.empty())
            continue;
        const auto eq = line.find('=');
        if (eq == std::string::npos)
            return makeError("checkpoint-corrupt", "metadata line '" + line + "' has no '='");
        const std::string key = line.substr(0, eq);
        const std::string value = line.substr(eq + 1);
        bool ok = true;
        if (key == "generation")
            ok = parseNumber(value, meta.generation);
        else if (key == "fitness")
            ok = parseNumber(value, meta.fitness);
        else if (key == "validation_fitness")
            ok = parseNumber(value, meta.validationFitness);
        else if (key == "parent")
            ok = value.empty() || isContentHash(value);
        if (!ok)
            return makeError("checkpoint-corrupt", "metadata value for '" + key + "' is malformed");
        if (key == "parent")
            meta.parent = value;
    }
    return meta;
}

std::vector<std::string> CheckpointStore::list() const
{
    std::vector<std::string> out;
    std::error_code ec;
    const fs::path dir = root_ / kParamsDir;
    if (!fs::is_directory(dir, ec))
        return out;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        const fs::path &p = it->path();
        if (p.extension() != ".bin")
            continue;
        const std::string stem = p.stem().string();
        if (isContentHash(stem))
            out.push_back(stem);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace talus::checkpoint
