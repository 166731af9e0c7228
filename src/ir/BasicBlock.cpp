//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/BasicBlock.cpp
// Purpose: Node metadata, structural validation and the block builder.
//
//===----------------------------------------------------------------------===//

#include "ir/BasicBlock.hpp"

#include "field/Goldilocks.hpp"

#include <array>
#include <sstream>

namespace talus::ir
{
using support::Expected;
using support::makeError;

namespace
{
constexpr std::array<NodeKindInfo, kNumNodeKinds> kNodeKinds = {{
#define TALUS_NODE_KIND(NAME, MNEMONIC, ARITY, HAS_RESULT, PURE)                                    \
    NodeKindInfo{MNEMONIC, ARITY, HAS_RESULT, PURE},
#include "ir/NodeKind.def"
#undef TALUS_NODE_KIND
}};

static_assert(kNodeKinds.size() == kNumNodeKinds, "NodeKind table must match enum count");

constexpr std::array<const char *, kNumTypeTags> kTypeNames = {"field", "u32", "bool"};

support::BlockLoc at(size_t node)
{
    support::BlockLoc loc;
    loc.node = static_cast<int32_t>(node);
    return loc;
}

/// Check one operand slot of node @p i.
Expected<void> checkOperand(const BasicBlock &block, size_t i, int32_t ref, const char *which)
{
    if (ref < 0 || static_cast<size_t>(ref) >= i)
        return makeError("invalid-reference",
                         std::string(which) + " operand must name an earlier node", at(i));
    const Node &dep = block.nodes[static_cast<size_t>(ref)];
    if (!getNodeKindInfo(dep.kind).hasResult)
        return makeError("invalid-reference",
                         std::string(which) + " operand names a node without a result", at(i));
    return {};
}
} // namespace

const NodeKindInfo &getNodeKindInfo(NodeKind kind)
{
    return kNodeKinds[static_cast<size_t>(kind)];
}

const char *toString(NodeKind kind)
{
    const size_t index = static_cast<size_t>(kind);
    return index < kNodeKinds.size() ? kNodeKinds[index].name : "";
}

const char *toString(TypeTag type)
{
    const size_t index = static_cast<size_t>(type);
    return index < kTypeNames.size() ? kTypeNames[index] : "";
}

size_t BasicBlock::outputCount() const
{
    size_t n = 0;
    for (const auto &node : nodes)
        n += node.kind == NodeKind::Output ? 1 : 0;
    return n;
}

Expected<void> validate(const BasicBlock &block)
{
    if (block.nodes.size() > kMaxNodes)
        return makeError("block-too-large",
                         "block has " + std::to_string(block.nodes.size()) + " nodes, limit is " +
                             std::to_string(kMaxNodes));
    if (block.inputCount > kMaxInputs)
        return makeError("block-too-large",
                         "block consumes " + std::to_string(block.inputCount) +
                             " inputs, limit is " + std::to_string(kMaxInputs));

    for (size_t i = 0; i < block.nodes.size(); ++i)
    {
        const Node &node = block.nodes[i];
        if (static_cast<size_t>(node.kind) >= kNumNodeKinds ||
            static_cast<size_t>(node.type) >= kNumTypeTags)
            return makeError("malformed-node", "unknown kind or type tag", at(i));

        const NodeKindInfo &info = getNodeKindInfo(node.kind);
        if (info.arity >= 1)
        {
            if (auto ok = checkOperand(block, i, node.lhs, "first"); !ok)
                return ok;
        }
        else if (node.lhs != -1)
        {
            return makeError("malformed-node", std::string(info.name) + " takes no operands", at(i));
        }

        if (info.arity == 2)
        {
            if (auto ok = checkOperand(block, i, node.rhs, "second"); !ok)
                return ok;
        }
        else if (node.rhs != -1)
        {
            return makeError("malformed-node",
                             std::string(info.name) + " takes at most one operand", at(i));
        }

        if (node.kind == NodeKind::Input && node.imm >= block.inputCount)
            return makeError("invalid-reference",
                             "input slot " + std::to_string(node.imm) + " is not below the input count",
                             at(i));
        if (node.kind == NodeKind::Const && node.imm >= field::kModulus)
            return makeError("malformed-node", "constant is not a canonical field element", at(i));
        if (node.kind != NodeKind::Input && node.kind != NodeKind::Const && node.imm != 0)
            return makeError("malformed-node",
                             std::string(info.name) + " carries no immediate", at(i));
    }
    return {};
}

std::string formatBlock(const BasicBlock &block)
{
    std::ostringstream os;
    os << "block inputs=" << block.inputCount << "\n";
    for (size_t i = 0; i < block.nodes.size(); ++i)
    {
        const Node &n = block.nodes[i];
        const NodeKindInfo &info = getNodeKindInfo(n.kind);
        os << "  ";
        if (info.hasResult)
            os << '%' << i << " = ";
        os << info.name;
        if (n.kind == NodeKind::Input || n.kind == NodeKind::Const)
            os << ' ' << n.imm;
        if (n.lhs >= 0)
            os << " %" << n.lhs;
        if (n.rhs >= 0)
            os << " %" << n.rhs;
        if (info.hasResult)
            os << " : " << toString(n.type);
        os << "\n";
    }
    return os.str();
}

int32_t BlockBuilder::append(Node node)
{
    nodes_.push_back(node);
    return static_cast<int32_t>(nodes_.size() - 1);
}

TypeTag BlockBuilder::typeOf(int32_t node) const
{
    if (node < 0 || static_cast<size_t>(node) >= nodes_.size())
        return TypeTag::Field;
    return nodes_[static_cast<size_t>(node)].type;
}

int32_t BlockBuilder::binary(NodeKind kind, TypeTag type, int32_t a, int32_t b)
{
    return append(Node{kind, type, a, b, 0});
}

int32_t BlockBuilder::unary(NodeKind kind, TypeTag type, int32_t a)
{
    return append(Node{kind, type, a, -1, 0});
}

int32_t BlockBuilder::input(uint32_t slot, TypeTag type)
{
    return append(Node{NodeKind::Input, type, -1, -1, slot});
}

int32_t BlockBuilder::constant(uint64_t value, TypeTag type)
{
    return append(Node{NodeKind::Const, type, -1, -1, value});
}

int32_t BlockBuilder::add(int32_t a, int32_t b)
{
    return binary(NodeKind::Add, TypeTag::Field, a, b);
}

int32_t BlockBuilder::sub(int32_t a, int32_t b)
{
    return binary(NodeKind::Sub, TypeTag::Field, a, b);
}

int32_t BlockBuilder::mul(int32_t a, int32_t b)
{
    return binary(NodeKind::Mul, TypeTag::Field, a, b);
}

int32_t BlockBuilder::neg(int32_t a)
{
    return unary(NodeKind::Neg, TypeTag::Field, a);
}

int32_t BlockBuilder::inv(int32_t a)
{
    return unary(NodeKind::Inv, TypeTag::Field, a);
}

int32_t BlockBuilder::eq(int32_t a, int32_t b)
{
    return binary(NodeKind::Eq, TypeTag::Bool, a, b);
}

int32_t BlockBuilder::lt(int32_t a, int32_t b)
{
    return binary(NodeKind::Lt, TypeTag::Bool, a, b);
}

int32_t BlockBuilder::bitAnd(int32_t a, int32_t b)
{
    return binary(NodeKind::And, TypeTag::U32, a, b);
}

int32_t BlockBuilder::bitXor(int32_t a, int32_t b)
{
    return binary(NodeKind::Xor, TypeTag::U32, a, b);
}

int32_t BlockBuilder::popCount(int32_t a)
{
    return unary(NodeKind::PopCount, TypeTag::U32, a);
}

int32_t BlockBuilder::readIo(TypeTag type)
{
    return append(Node{NodeKind::ReadIo, type, -1, -1, 0});
}

int32_t BlockBuilder::writeIo(int32_t a)
{
    return unary(NodeKind::WriteIo, typeOf(a), a);
}

int32_t BlockBuilder::assertTrue(int32_t a)
{
    return unary(NodeKind::Assert, TypeTag::Bool, a);
}

int32_t BlockBuilder::output(int32_t a)
{
    return unary(NodeKind::Output, typeOf(a), a);
}

BasicBlock BlockBuilder::build() const
{
    BasicBlock block;
    block.nodes = nodes_;
    block.inputCount = inputCount_;
    return block;
}

} // namespace talus::ir
