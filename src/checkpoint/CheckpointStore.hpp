//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: checkpoint/CheckpointStore.hpp
// Purpose: Content-addressed storage of generator parameters plus the pointer
//          naming the active set.
// Key invariants: <root>/params/<hash>.bin always holds a blob whose content
//                 hash is <hash>; every file is written to a temporary name and
//                 renamed into place, so readers never observe a partial file.
// Ownership/Lifetime: Holds only the root path; files are the shared state.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "gen/GeneratorParams.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace talus::checkpoint
{

/// @brief Training provenance stored beside a checkpoint.
struct CheckpointMeta
{
    uint64_t generation = 0;
    int64_t fitness = 0;
    int64_t validationFitness = 0;
    std::string parent; ///< Hash of the parameters this set was trained from.

    friend bool operator==(const CheckpointMeta &a, const CheckpointMeta &b)
    {
        return a.generation == b.generation && a.fitness == b.fitness &&
               a.validationFitness == b.validationFitness && a.parent == b.parent;
    }
};

/// @brief True when @p hash has the 32 lowercase hex digit shape of a content hash.
bool isContentHash(std::string_view hash);

class CheckpointStore
{
  public:
    explicit CheckpointStore(std::filesystem::path root);

    /// @brief Persist @p params under their content hash.
    /// @details Saving an already stored set rewrites nothing.
    /// @return The content hash, or "io-error".
    support::Expected<std::string> save(const gen::GeneratorParams &params);

    /// @brief Load the parameters stored under @p hash.
    /// @return "checkpoint-not-found", "checkpoint-corrupt" or "io-error".
    support::Expected<gen::GeneratorParams> load(const std::string &hash) const;

    /// @brief Hash named by the ACTIVE pointer.
    /// @return "checkpoint-not-found" when no set was ever activated.
    support::Expected<std::string> active() const;

    /// @brief Point ACTIVE at @p hash after checking that it loads.
    support::Expected<void> setActive(const std::string &hash);

    /// @brief Write the provenance file of @p hash.
    support::Expected<void> saveMeta(const std::string &hash, const CheckpointMeta &meta);

    /// @brief Read the provenance file of @p hash.
    support::Expected<CheckpointMeta> loadMeta(const std::string &hash) const;

    /// @brief Hashes of every stored parameter set, sorted.
    std::vector<std::string> list() const;

    const std::filesystem::path &root() const
    {
        return root_;
    }

  private:
    std::filesystem::path paramsPath(const std::string &hash) const;
    std::filesystem::path metaPath(const std::string &hash) const;

    std::filesystem::path root_;
};

} // namespace talus::checkpoint
