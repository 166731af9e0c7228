//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Evaluate.cpp
// Purpose: Implement the block interpreter and scalar operator semantics.
//
//===----------------------------------------------------------------------===//

#include "ir/Evaluate.hpp"

#include <bit>

namespace talus::ir
{
using field::Goldilocks;
using support::Expected;
using support::makeError;

namespace
{
constexpr uint64_t kU32Limit = uint64_t{1} << 32;

bool isU32(Goldilocks g)
{
    return g.value() < kU32Limit;
}

support::BlockLoc at(size_t node)
{
    support::BlockLoc loc;
    loc.node = static_cast<int32_t>(node);
    return loc;
}
} // namespace

std::optional<Goldilocks> evalOp(NodeKind kind, Goldilocks lhs, Goldilocks rhs)
{
    switch (kind)
    {
        case NodeKind::Add:
            return lhs.add(rhs);
        case NodeKind::Sub:
            return lhs.sub(rhs);
        case NodeKind::Mul:
            return lhs.mul(rhs);
        case NodeKind::Neg:
            return lhs.neg();
        case NodeKind::Inv:
            return lhs.inverse();
        case NodeKind::Eq:
            return Goldilocks::fromU64(lhs == rhs ? 1 : 0);
        case NodeKind::Lt:
            if (!isU32(lhs) || !isU32(rhs))
                return std::nullopt;
            return Goldilocks::fromU64(lhs.value() < rhs.value() ? 1 : 0);
        case NodeKind::And:
            if (!isU32(lhs) || !isU32(rhs))
                return std::nullopt;
            return Goldilocks::fromU64(lhs.value() & rhs.value());
        case NodeKind::Xor:
            if (!isU32(lhs) || !isU32(rhs))
                return std::nullopt;
            return Goldilocks::fromU64(lhs.value() ^ rhs.value());
        case NodeKind::PopCount:
            if (!isU32(lhs))
                return std::nullopt;
            return Goldilocks::fromU64(static_cast<uint64_t>(std::popcount(lhs.value())));
        default:
            return std::nullopt;
    }
}

Expected<EvalResult> evaluate(const BasicBlock &block, std::span<const Goldilocks> inputs,
                              std::span<const Goldilocks> ioIn)
{
    if (auto ok = validate(block); !ok)
        return ok.error();
    if (inputs.size() < block.inputCount)
        return makeError("execution-error", "block needs " + std::to_string(block.inputCount) +
                                                " inputs, got " + std::to_string(inputs.size()));

    EvalResult result;
    std::vector<Goldilocks> values(block.nodes.size());
    for (size_t i = 0; i < block.nodes.size(); ++i)
    {
        const Node &n = block.nodes[i];
        const Goldilocks a = n.lhs >= 0 ? values[static_cast<size_t>(n.lhs)] : Goldilocks{};
        const Goldilocks b = n.rhs >= 0 ? values[static_cast<size_t>(n.rhs)] : Goldilocks{};
        switch (n.kind)
        {
            case NodeKind::Input:
                values[i] = inputs[static_cast<size_t>(n.imm)];
                break;
            case NodeKind::Const:
                values[i] = Goldilocks::fromU64(n.imm);
                break;
            case NodeKind::ReadIo:
                if (result.ioReads >= ioIn.size())
                    return makeError("execution-error", "public input exhausted", at(i));
                values[i] = ioIn[result.ioReads++];
                break;
            case NodeKind::WriteIo:
                result.ioWrites.push_back(a);
                break;
            case NodeKind::Assert:
                if (a != Goldilocks::fromU64(1))
                    return makeError("execution-error", "assertion failed", at(i));
                break;
            case NodeKind::Output:
                result.outputs.push_back(a);
                break;
            default:
            {
                auto v = evalOp(n.kind, a, b);
                if (!v)
                    return makeError("execution-error",
                                     std::string(toString(n.kind)) + " failed on its operands", at(i));
                values[i] = *v;
                break;
            }
        }
    }
    return result;
}

} // namespace talus::ir
