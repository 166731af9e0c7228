//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: encode/BlockEncoder.hpp
// Purpose: Lossless mapping between (block, machine state) and a fixed-size
//          feature tensor.
// Key invariants: decode(encode(b, s)) reproduces b and s exactly; the tensor
//                 size never depends on the block.
// Ownership/Lifetime: Tensors are plain value arrays.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "field/Fixed.hpp"
#include "ir/BasicBlock.hpp"
#include "support/diag_expected.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace talus::encode
{

/// @brief Header words: node count and input count.
constexpr size_t kHeaderWords = 2;

/// @brief Words per node record.
constexpr size_t kWordsPerNode = 24;

/// @brief Entry context words: 16 occupancy followed by 16 liveness flags.
constexpr size_t kContextWords = 32;

/// @brief Total tensor length.
constexpr size_t kTensorWords = kHeaderWords + ir::kMaxNodes * kWordsPerNode + kContextWords;

/// @name Offsets inside a node record.
/// @{
constexpr size_t kKindOffset = 0;
constexpr size_t kTypeOffset = kKindOffset + ir::kNumNodeKinds;
constexpr size_t kLhsOffset = kTypeOffset + ir::kNumTypeTags;
constexpr size_t kRhsOffset = kLhsOffset + 1;
constexpr size_t kLiveStartOffset = kRhsOffset + 1;
constexpr size_t kLiveEndOffset = kLiveStartOffset + 1;
constexpr size_t kImmOffset = kLiveEndOffset + 1;
/// @}

static_assert(kImmOffset + 1 == kWordsPerNode, "node record layout must fill 24 words");

/// @brief Offset of the entry context.
constexpr size_t kContextOffset = kHeaderWords + ir::kMaxNodes * kWordsPerNode;

using FeatureTensor = std::array<field::Fixed, kTensorWords>;

/// @brief Result of decoding a tensor.
struct DecodedBlock
{
    ir::BasicBlock block;
    ir::MachineState state;
};

/// @brief Encode @p block under entry state @p state.
/// @return "block-too-large", "invalid-reference" or "malformed-node" on
///         structurally invalid input.
support::Expected<FeatureTensor> encode(const ir::BasicBlock &block, const ir::MachineState &state);

/// @brief Rebuild the block and machine state from @p tensor.
support::Expected<DecodedBlock> decode(const FeatureTensor &tensor);

/// @brief Stable 64-bit digest of @p tensor, used as a block identity.
uint64_t tensorDigest(const FeatureTensor &tensor);

} // namespace talus::encode
