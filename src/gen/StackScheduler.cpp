//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: gen/StackScheduler.cpp
// Purpose: Rewrite, liveness and emission phases of the stack lowering.
// Key invariants: Rewrites never remove a node that can fail or touch I/O,
//                 and folding only happens when the folded operation succeeds.
//                 The symbolic stack tracks exactly the block's own values;
//                 caller slots below the inputs are never addressed.
//
//===----------------------------------------------------------------------===//

#include "gen/StackScheduler.hpp"

#include "field/Goldilocks.hpp"
#include "ir/Evaluate.hpp"

#include <array>
#include <utility>
#include <vector>

namespace talus::gen
{
using field::Goldilocks;
using ir::NodeKind;
using tasm::Instr;
using tasm::InstrSeq;
using tasm::Opcode;

namespace
{
constexpr uint32_t kInputBase = ir::kMaxNodes;
constexpr size_t kNumValues = ir::kMaxNodes + ir::kMaxInputs;
constexpr uint32_t kNoValue = 0xFFFFFFFFu;
constexpr uint32_t kPlaced = kNoValue - 1;
constexpr uint64_t kMinusOne = field::kModulus - 1;
constexpr size_t kMaxReach = tasm::kStackWindow - 1;
constexpr size_t kMaxPop = tasm::kMaxCount;
constexpr size_t kNotFound = static_cast<size_t>(-1);

/// Where an operand comes from: a stack value, or a constant pushed on use.
struct Operand
{
    uint32_t value = kNoValue;     ///< Stack value id; kNoValue when lazy.
    std::optional<uint64_t> known; ///< Compile-time value when known.

    bool lazy() const
    {
        return value == kNoValue;
    }
};

Operand lazyConst(uint64_t v)
{
    Operand o;
    o.known = v;
    return o;
}

Operand stackValue(uint32_t id, std::optional<uint64_t> known = std::nullopt)
{
    Operand o;
    o.value = id;
    o.known = known;
    return o;
}

bool sameValue(const Operand &a, const Operand &b)
{
    if (a.known && b.known)
        return *a.known == *b.known;
    return !a.lazy() && a.value == b.value;
}

bool isCommutative(NodeKind k)
{
    return k == NodeKind::Add || k == NodeKind::Mul || k == NodeKind::Eq || k == NodeKind::And ||
           k == NodeKind::Xor;
}

bool isKnown(const Operand &o, uint64_t v)
{
    return o.known && *o.known == v;
}

/// One node that survives rewriting.
struct Action
{
    NodeKind kind = NodeKind::Const;
    bool addImmediate = false; ///< Lowered as `addi imm`.
    uint64_t imm = 0;
    Operand a;
    Operand b;
    uint8_t arity = 0;
    uint32_t result = kNoValue;
    bool live = true;

    bool removable() const
    {
        return result != kNoValue && (addImmediate || ir::getNodeKindInfo(kind).pure);
    }
};

struct Plan
{
    std::vector<Action> actions;
    std::vector<Operand> outputs;
    std::array<uint32_t, kNumValues> uses{};
};

/// Emission state: the symbolic stack mirrors the block's own slots.
class Emitter
{
  public:
    Emitter(const Plan &plan, uint32_t inputCount, bool consume, bool commute, bool square)
        : remaining_(plan.uses), consume_(consume), commute_(commute), square_(square)
    {
        for (uint32_t s = inputCount; s-- > 0;)
            stack_.push_back(kInputBase + s);
    }

    bool run(const Action &act)
    {
        if (act.arity == 2)
        {
            if (square_ && !act.a.lazy() && act.a.value == act.b.value)
            {
                if (!placeTwice(act.a))
                    return false;
            }
            else
            {
                Operand first = act.a;
                Operand second = act.b;
                if (commute_ && consume_ && isCommutative(act.kind) && !second.lazy() &&
                    second.value != first.value && depthOf(second.value) == 0 &&
                    remaining_[second.value] == 1)
                    std::swap(first, second);
                if (!place(first) || !place(second))
                    return false;
            }
        }
        else if (act.arity == 1)
        {
            if (!place(act.a))
                return false;
        }
        stack_.resize(stack_.size() - act.arity);
        emitOp(act);
        if (act.result != kNoValue)
            stack_.push_back(act.result);
        return true;
    }

    bool placeOutputs(const std::vector<Operand> &outputs)
    {
        for (const auto &o : outputs)
        {
            if (!place(o))
                return false;
        }
        return true;
    }

    /// Remove every slot below the @p k outputs on top.
    bool cleanup(size_t k, bool batch)
    {
        size_t garbage = stack_.size() - k;
        if (garbage == 0)
            return true;
        if (k > kMaxReach)
            return false;

        if (!batch)
        {
            for (; garbage > 0; --garbage)
            {
                if (k > 0)
                    emit(Opcode::Pick, k);
                emit(Opcode::Pop, 1);
            }
        }
        else if (k == 0)
        {
            popBatched(garbage);
        }
        else if (k == 1)
        {
            while (garbage > 0)
            {
                const size_t m = garbage < kMaxReach ? garbage : kMaxReach;
                emit(Opcode::Swap, m);
                popBatched(m);
                garbage -= m;
            }
        }
        else
        {
            const size_t chunkLimit = tasm::kStackWindow - k;
            while (garbage > 0)
            {
                size_t c = garbage < kMaxPop ? garbage : kMaxPop;
                c = c < chunkLimit ? c : chunkLimit;
                for (size_t j = 0; j < c; ++j)
                    emit(Opcode::Pick, k + j);
                emit(Opcode::Pop, c);
                garbage -= c;
            }
        }
        stack_.resize(k);
        return true;
    }

    InstrSeq take()
    {
        return std::move(out_);
    }

  private:
    void emit(Opcode op, uint64_t arg = 0)
    {
        out_.push_back(Instr{op, arg});
    }

    void popBatched(size_t n)
    {
        while (n > 0)
        {
            const size_t c = n < kMaxPop ? n : kMaxPop;
            emit(Opcode::Pop, c);
            n -= c;
        }
    }

    size_t depthOf(uint32_t id) const
    {
        for (size_t d = 0; d < stack_.size(); ++d)
        {
            if (stack_[stack_.size() - 1 - d] == id)
                return d;
        }
        return kNotFound;
    }

    /// Bring @p o to the top; copies unless this is its last use.
    bool place(const Operand &o)
    {
        if (o.lazy())
        {
            emit(Opcode::Push, *o.known);
            stack_.push_back(kPlaced);
            return true;
        }
        const size_t d = depthOf(o.value);
        if (d == kNotFound || d > kMaxReach)
            return false;
        const bool last = --remaining_[o.value] == 0;
        if (consume_ && last)
            moveToTop(d);
        else
        {
            emit(Opcode::Dup, d);
            stack_.push_back(o.value);
        }
        stack_.back() = kPlaced;
        return true;
    }

    /// Place both operands of `x OP x` with a single reach.
    bool placeTwice(const Operand &o)
    {
        const size_t d = depthOf(o.value);
        if (d == kNotFound || d > kMaxReach)
            return false;
        remaining_[o.value] -= 2;
        if (consume_ && remaining_[o.value] == 0)
            moveToTop(d);
        else
        {
            emit(Opcode::Dup, d);
            stack_.push_back(o.value);
        }
        stack_.back() = kPlaced;
        emit(Opcode::Dup, 0);
        stack_.push_back(kPlaced);
        return true;
    }

    void moveToTop(size_t d)
    {
        if (d == 0)
            return;
        emit(Opcode::Pick, d);
        const size_t idx = stack_.size() - 1 - d;
        const uint32_t id = stack_[idx];
        stack_.erase(stack_.begin() + static_cast<std::ptrdiff_t>(idx));
        stack_.push_back(id);
    }

    void emitOp(const Action &act)
    {
        if (act.addImmediate)
        {
            emit(Opcode::AddI, act.imm);
            return;
        }
        switch (act.kind)
        {
            case NodeKind::Const:
                emit(Opcode::Push, act.imm);
                break;
            case NodeKind::Add:
                emit(Opcode::Add);
                break;
            case NodeKind::Sub:
                emit(Opcode::Push, kMinusOne);
                emit(Opcode::Mul);
                emit(Opcode::Add);
                break;
            case NodeKind::Mul:
                emit(Opcode::Mul);
                break;
            case NodeKind::Neg:
                emit(Opcode::Push, kMinusOne);
                emit(Opcode::Mul);
                break;
            case NodeKind::Inv:
                emit(Opcode::Invert);
                break;
            case NodeKind::Eq:
                emit(Opcode::Eq);
                break;
            case NodeKind::Lt:
                emit(Opcode::Lt);
                break;
            case NodeKind::And:
                emit(Opcode::And);
                break;
            case NodeKind::Xor:
                emit(Opcode::Xor);
                break;
            case NodeKind::PopCount:
                emit(Opcode::PopCount);
                break;
            case NodeKind::ReadIo:
                emit(Opcode::ReadIo, 1);
                break;
            case NodeKind::WriteIo:
                emit(Opcode::WriteIo, 1);
                break;
            case NodeKind::Assert:
                emit(Opcode::Assert);
                break;
            default:
                break;
        }
    }

    std::vector<uint32_t> stack_;
    std::array<uint32_t, kNumValues> remaining_;
    InstrSeq out_;
    bool consume_;
    bool commute_;
    bool square_;
};

/// Apply algebraic identities; returns the replacement operand if one fires.
std::optional<Operand> applyIdentity(NodeKind kind, const Operand &a, const Operand &b,
                                     const std::array<std::optional<Operand>, ir::kMaxNodes> &negOf)
{
    switch (kind)
    {
        case NodeKind::Add:
            if (isKnown(a, 0))
                return b;
            if (isKnown(b, 0))
                return a;
            break;
        case NodeKind::Sub:
            if (isKnown(b, 0))
                return a;
            if (sameValue(a, b))
                return lazyConst(0);
            break;
        case NodeKind::Mul:
            if (isKnown(a, 0) || isKnown(b, 0))
                return lazyConst(0);
            if (isKnown(a, 1))
                return b;
            if (isKnown(b, 1))
                return a;
            break;
        case NodeKind::Eq:
            if (sameValue(a, b))
                return lazyConst(1);
            break;
        case NodeKind::Neg:
            if (!a.lazy() && a.value < ir::kMaxNodes && negOf[a.value])
                return negOf[a.value];
            break;
        default:
            break;
    }
    return std::nullopt;
}
} // namespace

const char *toString(Knob k)
{
    switch (k)
    {
        case Knob::FoldConstants:
            return "fold-constants";
        case Knob::Identities:
            return "identities";
        case Knob::FuseImmediate:
            return "fuse-immediate";
        case Knob::ConsumeInPlace:
            return "consume-in-place";
        case Knob::CommuteOperands:
            return "commute-operands";
        case Knob::EliminateDead:
            return "eliminate-dead";
        case Knob::BatchCleanup:
            return "batch-cleanup";
        case Knob::SquareViaDup:
            return "square-via-dup";
    }
    return "";
}

std::optional<InstrSeq> StackScheduler::schedule(const ir::BasicBlock &block) const
{
    if (!ir::validate(block))
        return std::nullopt;

    // Rewrite: resolve every result node to an operand and collect the
    // nodes that still need code.
    Plan plan;
    std::array<Operand, ir::kMaxNodes> def{};
    std::array<std::optional<Operand>, ir::kMaxNodes> negOf{};
    for (size_t i = 0; i < block.nodes.size(); ++i)
    {
        const ir::Node &n = block.nodes[i];
        const auto self = static_cast<uint32_t>(i);
        const ir::NodeKindInfo &info = ir::getNodeKindInfo(n.kind);
        const Operand a = n.lhs >= 0 ? def[static_cast<size_t>(n.lhs)] : Operand{};
        const Operand b = n.rhs >= 0 ? def[static_cast<size_t>(n.rhs)] : Operand{};

        switch (n.kind)
        {
            case NodeKind::Input:
                def[i] = stackValue(kInputBase + static_cast<uint32_t>(n.imm));
                continue;
            case NodeKind::Const:
                if (has(Knob::FoldConstants))
                {
                    def[i] = lazyConst(n.imm);
                    continue;
                }
                plan.actions.push_back(Action{NodeKind::Const, false, n.imm, {}, {}, 0, self, true});
                def[i] = stackValue(self, n.imm);
                continue;
            case NodeKind::Output:
                plan.outputs.push_back(a);
                continue;
            case NodeKind::ReadIo:
                plan.actions.push_back(Action{n.kind, false, 0, {}, {}, 0, self, true});
                def[i] = stackValue(self);
                continue;
            case NodeKind::WriteIo:
            case NodeKind::Assert:
                plan.actions.push_back(Action{n.kind, false, 0, a, {}, 1, kNoValue, true});
                continue;
            default:
                break;
        }

        if (has(Knob::FoldConstants) && a.known && (info.arity < 2 || b.known))
        {
            auto folded = ir::evalOp(n.kind, Goldilocks::fromU64(*a.known),
                                     Goldilocks::fromU64(b.known ? *b.known : 0));
            if (folded)
            {
                def[i] = lazyConst(folded->value());
                continue;
            }
        }

        if (has(Knob::Identities))
        {
            if (auto alias = applyIdentity(n.kind, a, b, negOf))
            {
                def[i] = *alias;
                continue;
            }
        }

        if (has(Knob::FuseImmediate))
        {
            const bool addRhs = n.kind == NodeKind::Add && b.known && !a.known;
            const bool addLhs = n.kind == NodeKind::Add && a.known && !b.known;
            const bool subRhs = n.kind == NodeKind::Sub && b.known;
            if (addRhs || addLhs || subRhs)
            {
                Action act;
                act.kind = n.kind;
                act.addImmediate = true;
                act.a = addLhs ? b : a;
                act.imm = addLhs  ? *a.known
                          : addRhs ? *b.known
                                   : Goldilocks::fromU64(*b.known).neg().value();
                act.arity = 1;
                act.result = self;
                plan.actions.push_back(act);
                def[i] = stackValue(self);
                continue;
            }
        }

        plan.actions.push_back(Action{n.kind, false, 0, a, b, info.arity, self, true});
        def[i] = stackValue(self);
        if (n.kind == NodeKind::Neg)
            negOf[i] = a;
    }

    // Liveness: count stack uses of every value.
    auto countUse = [&plan](const Operand &o, int delta) {
        if (!o.lazy())
            plan.uses[o.value] = static_cast<uint32_t>(static_cast<int>(plan.uses[o.value]) + delta);
    };
    for (const auto &act : plan.actions)
    {
        if (act.arity >= 1)
            countUse(act.a, 1);
        if (act.arity == 2)
            countUse(act.b, 1);
    }
    for (const auto &o : plan.outputs)
        countUse(o, 1);

    if (has(Knob::EliminateDead))
    {
        for (size_t i = plan.actions.size(); i-- > 0;)
        {
            Action &act = plan.actions[i];
            if (!act.removable() || plan.uses[act.result] != 0)
                continue;
            act.live = false;
            if (act.arity >= 1)
                countUse(act.a, -1);
            if (act.arity == 2)
                countUse(act.b, -1);
        }
    }

    Emitter emitter(plan,
                    block.inputCount,
                    has(Knob::ConsumeInPlace),
                    has(Knob::CommuteOperands),
                    has(Knob::SquareViaDup));
    for (const auto &act : plan.actions)
    {
        if (act.live && !emitter.run(act))
            return std::nullopt;
    }
    if (!emitter.placeOutputs(plan.outputs))
        return std::nullopt;
    if (!emitter.cleanup(plan.outputs.size(), has(Knob::BatchCleanup)))
        return std::nullopt;
    return emitter.take();
}

std::optional<InstrSeq> lowerNaive(const ir::BasicBlock &block)
{
    return StackScheduler(kNoKnobs).schedule(block);
}

} // namespace talus::gen
