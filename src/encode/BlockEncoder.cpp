//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: encode/BlockEncoder.cpp
// Purpose: Tensor encoding, liveness analysis and the inverse decoding.
// Key invariants: Integer fields are stored as exact fixed-point integers;
//                 immediates are stored as raw field elements.
//
//===----------------------------------------------------------------------===//

#include "encode/BlockEncoder.hpp"

#include "support/hash.hpp"
#include "tasm/Opcode.hpp"

#include <initializer_list>
#include <optional>

namespace talus::encode
{
using field::Fixed;
using field::Goldilocks;
using support::Expected;
using support::makeError;

namespace
{
constexpr size_t recordBase(size_t node)
{
    return kHeaderWords + node * kWordsPerNode;
}

/// Integer view of a word that must hold an exact small integer.
std::optional<int64_t> asInt(Fixed f)
{
    const int64_t s = f.toScaled();
    if (s % static_cast<int64_t>(field::kScale) != 0)
        return std::nullopt;
    return s / static_cast<int64_t>(field::kScale);
}

/// Index of the single word equal to one in [base, base + n), or -1.
int oneHot(const FeatureTensor &t, size_t base, size_t n)
{
    int hot = -1;
    for (size_t i = 0; i < n; ++i)
    {
        const Fixed w = t[base + i];
        if (w == Fixed::one())
        {
            if (hot >= 0)
                return -1;
            hot = static_cast<int>(i);
        }
        else if (w != Fixed::zero())
        {
            return -1;
        }
    }
    return hot;
}

support::BlockLoc at(size_t node)
{
    support::BlockLoc loc;
    loc.node = static_cast<int32_t>(node);
    return loc;
}
} // namespace

Expected<FeatureTensor> encode(const ir::BasicBlock &block, const ir::MachineState &state)
{
    if (auto ok = ir::validate(block); !ok)
        return ok.error();
    if (state.stackDepth > tasm::kStackWindow)
        return makeError("block-too-large", "machine state occupies " +
                                                std::to_string(state.stackDepth) +
                                                " slots of a 16-slot window");

    const size_t n = block.nodes.size();

    // Backward pass: the first use seen is the last use in program order.
    std::array<int32_t, ir::kMaxNodes> lastUse{};
    lastUse.fill(-1);
    for (size_t i = n; i-- > 0;)
    {
        const ir::Node &node = block.nodes[i];
        const int32_t pos = node.kind == ir::NodeKind::Output ? static_cast<int32_t>(n)
                                                              : static_cast<int32_t>(i);
        for (int32_t ref : {node.lhs, node.rhs})
        {
            if (ref >= 0 && lastUse[static_cast<size_t>(ref)] < pos)
                lastUse[static_cast<size_t>(ref)] = pos;
        }
    }

    FeatureTensor t{};
    t[0] = Fixed::fromInt(static_cast<int64_t>(n));
    t[1] = Fixed::fromInt(block.inputCount);
    for (size_t i = 0; i < n; ++i)
    {
        const ir::Node &node = block.nodes[i];
        const size_t base = recordBase(i);
        t[base + kKindOffset + static_cast<size_t>(node.kind)] = Fixed::one();
        t[base + kTypeOffset + static_cast<size_t>(node.type)] = Fixed::one();
        t[base + kLhsOffset] = Fixed::fromInt(node.lhs + 1);
        t[base + kRhsOffset] = Fixed::fromInt(node.rhs + 1);
        t[base + kLiveStartOffset] = Fixed::fromInt(static_cast<int64_t>(i));
        t[base + kLiveEndOffset] =
            Fixed::fromInt(lastUse[i] < 0 ? static_cast<int64_t>(i) : lastUse[i]);
        t[base + kImmOffset] = Fixed::fromRaw(Goldilocks::fromU64(node.imm));
    }

    for (size_t slot = 0; slot < tasm::kStackWindow; ++slot)
    {
        if (slot < state.stackDepth)
            t[kContextOffset + slot] = Fixed::one();
        if (state.liveMask & (1u << slot))
            t[kContextOffset + tasm::kStackWindow + slot] = Fixed::one();
    }
    return t;
}

Expected<DecodedBlock> decode(const FeatureTensor &t)
{
    const auto nodeCount = asInt(t[0]);
    const auto inputCount = asInt(t[1]);
    if (!nodeCount || *nodeCount < 0 || static_cast<size_t>(*nodeCount) > ir::kMaxNodes)
        return makeError("block-too-large", "tensor header names an invalid node count");
    if (!inputCount || *inputCount < 0 || static_cast<size_t>(*inputCount) > ir::kMaxInputs)
        return makeError("block-too-large", "tensor header names an invalid input count");

    DecodedBlock out;
    out.block.inputCount = static_cast<uint32_t>(*inputCount);
    const size_t n = static_cast<size_t>(*nodeCount);
    for (size_t i = 0; i < n; ++i)
    {
        const size_t base = recordBase(i);
        const int kind = oneHot(t, base + kKindOffset, ir::kNumNodeKinds);
        const int type = oneHot(t, base + kTypeOffset, ir::kNumTypeTags);
        const auto lhs = asInt(t[base + kLhsOffset]);
        const auto rhs = asInt(t[base + kRhsOffset]);
        if (kind < 0 || type < 0 || !lhs || !rhs)
            return makeError("malformed-node", "node record is not a valid encoding", at(i));

        ir::Node node;
        node.kind = static_cast<ir::NodeKind>(kind);
        node.type = static_cast<ir::TypeTag>(type);
        node.lhs = static_cast<int32_t>(*lhs - 1);
        node.rhs = static_cast<int32_t>(*rhs - 1);
        node.imm = t[base + kImmOffset].raw().value();
        out.block.nodes.push_back(node);
    }
    for (size_t i = n; i < ir::kMaxNodes; ++i)
    {
        for (size_t w = 0; w < kWordsPerNode; ++w)
        {
            if (t[recordBase(i) + w] != Fixed::zero())
                return makeError("malformed-node", "padding record is not zero", at(i));
        }
    }

    bool prefix = true;
    for (size_t slot = 0; slot < tasm::kStackWindow; ++slot)
    {
        const Fixed occ = t[kContextOffset + slot];
        const Fixed live = t[kContextOffset + tasm::kStackWindow + slot];
        if ((occ != Fixed::zero() && occ != Fixed::one()) ||
            (live != Fixed::zero() && live != Fixed::one()))
            return makeError("malformed-node", "entry context word is not a flag");
        if (occ == Fixed::one())
        {
            if (!prefix)
                return makeError("malformed-node", "occupied slots are not contiguous");
            ++out.state.stackDepth;
        }
        else
        {
            prefix = false;
        }
        if (live == Fixed::one())
            out.state.liveMask = static_cast<uint16_t>(out.state.liveMask | (1u << slot));
    }

    if (auto ok = ir::validate(out.block); !ok)
        return ok.error();
    return out;
}

uint64_t tensorDigest(const FeatureTensor &tensor)
{
    support::Fnv1a h;
    for (const auto &w : tensor)
        h.u64(w.raw().value());
    return h.digest();
}

} // namespace talus::encode
