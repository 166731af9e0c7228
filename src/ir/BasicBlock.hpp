//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/BasicBlock.hpp
// Purpose: Straight-line block IR consumed by the encoder, the scheduler and
//          the reference interpreter.
// Key invariants: Nodes only reference earlier, result-producing nodes; a
//                 block holds at most kMaxNodes nodes and kMaxInputs inputs.
// Ownership/Lifetime: Blocks own their nodes and are treated as immutable
//                     once built.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace talus::ir
{

/// @brief Node kinds of the block IR.
enum class NodeKind : uint8_t
{
#define TALUS_NODE_KIND(NAME, ...) NAME,
#include "ir/NodeKind.def"
#undef TALUS_NODE_KIND
    Count
};

/// @brief Number of node kinds.
constexpr size_t kNumNodeKinds = static_cast<size_t>(NodeKind::Count);

/// @brief Value type annotation of a node.
enum class TypeTag : uint8_t
{
    Field,
    U32,
    Bool,
    Count
};

/// @brief Number of type tags.
constexpr size_t kNumTypeTags = static_cast<size_t>(TypeTag::Count);

/// @brief Largest number of nodes in one block.
constexpr size_t kMaxNodes = 32;

/// @brief Largest number of entry-stack inputs one block may consume.
constexpr size_t kMaxInputs = 16;

/// @brief Static properties of a node kind.
struct NodeKindInfo
{
    const char *name;
    uint8_t arity;
    bool hasResult;
    bool pure;
};

const NodeKindInfo &getNodeKindInfo(NodeKind kind);

const char *toString(NodeKind kind);

const char *toString(TypeTag type);

/// @brief One IR node.
struct Node
{
    NodeKind kind = NodeKind::Const;
    TypeTag type = TypeTag::Field;
    int32_t lhs = -1;  ///< First operand node, or -1.
    int32_t rhs = -1;  ///< Second operand node, or -1.
    uint64_t imm = 0;  ///< Literal for const, slot for input (0 = top).

    friend bool operator==(const Node &a, const Node &b)
    {
        return a.kind == b.kind && a.type == b.type && a.lhs == b.lhs && a.rhs == b.rhs &&
               a.imm == b.imm;
    }
};

/// @brief A straight-line block with a declared input count.
struct BasicBlock
{
    std::vector<Node> nodes;
    uint32_t inputCount = 0;

    /// @brief Number of output nodes.
    size_t outputCount() const;

    friend bool operator==(const BasicBlock &a, const BasicBlock &b)
    {
        return a.inputCount == b.inputCount && a.nodes == b.nodes;
    }
};

/// @brief View of the near-register stack window at block entry.
struct MachineState
{
    uint32_t stackDepth = 0; ///< Occupied slots of the 16-slot window.
    uint16_t liveMask = 0;   ///< Slots whose values stay live after the block.

    friend bool operator==(const MachineState &a, const MachineState &b)
    {
        return a.stackDepth == b.stackDepth && a.liveMask == b.liveMask;
    }
};

/// @brief Check the structural rules every consumer relies on.
/// @return "block-too-large", "invalid-reference" or "malformed-node" errors.
support::Expected<void> validate(const BasicBlock &block);

/// @brief Render @p block one node per line, e.g. "%3 = add %1 %2 : field".
std::string formatBlock(const BasicBlock &block);

/// @brief Incremental construction helper for blocks.
/// @details Mirrors how a front end emits nodes; every method returns the
///          index of the node it appended.
class BlockBuilder
{
  public:
    explicit BlockBuilder(uint32_t inputCount) : inputCount_(inputCount) {}

    int32_t input(uint32_t slot, TypeTag type = TypeTag::Field);
    int32_t constant(uint64_t value, TypeTag type = TypeTag::Field);
    int32_t add(int32_t a, int32_t b);
    int32_t sub(int32_t a, int32_t b);
    int32_t mul(int32_t a, int32_t b);
    int32_t neg(int32_t a);
    int32_t inv(int32_t a);
    int32_t eq(int32_t a, int32_t b);
    int32_t lt(int32_t a, int32_t b);
    int32_t bitAnd(int32_t a, int32_t b);
    int32_t bitXor(int32_t a, int32_t b);
    int32_t popCount(int32_t a);
    int32_t readIo(TypeTag type = TypeTag::Field);
    int32_t writeIo(int32_t a);
    int32_t assertTrue(int32_t a);
    int32_t output(int32_t a);

    /// @brief Append an arbitrary node.
    int32_t append(Node node);

    /// @brief Snapshot of the block built so far.
    BasicBlock build() const;

  private:
    int32_t binary(NodeKind kind, TypeTag type, int32_t a, int32_t b);
    int32_t unary(NodeKind kind, TypeTag type, int32_t a);
    TypeTag typeOf(int32_t node) const;

    uint32_t inputCount_;
    std::vector<Node> nodes_;
};

} // namespace talus::ir
