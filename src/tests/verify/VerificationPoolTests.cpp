//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/verify/VerificationPoolTests.cpp
// Purpose: Concurrency behaviour of the verification worker pool.
// Key invariants: Every submitted check resolves its future, including checks
//                 submitted after shutdown and checks whose verifier throws.
// Ownership/Lifetime: The pool joins its workers on destruction.
// Links: src/verify/VerificationPool.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "verify/DifferentialVerifier.hpp"
#include "verify/VerificationPool.hpp"

#include <atomic>
#include <stdexcept>
#include <vector>

using namespace talus::verify;
using talus::ir::BasicBlock;
using talus::ir::BlockBuilder;
using talus::tasm::InstrSeq;
using talus::tasm::Opcode;

namespace
{
BasicBlock increment()
{
    BlockBuilder b(1);
    b.output(b.add(b.input(0), b.constant(1)));
    return b.build();
}

class CountingVerifier final : public EquivalenceVerifier
{
  public:
    Verdict verify(const BasicBlock &, const InstrSeq &instrs) const override
    {
        calls.fetch_add(1);
        return instrs.empty() ? Verdict::Refuted : Verdict::Verified;
    }

    mutable std::atomic<int> calls{0};
};

class ThrowingVerifier final : public EquivalenceVerifier
{
  public:
    Verdict verify(const BasicBlock &, const InstrSeq &) const override
    {
        throw std::runtime_error("solver crashed");
    }
};
} // namespace

TEST(VerificationPoolTest, WorkersResolveEveryFuture)
{
    auto verifier = std::make_shared<CountingVerifier>();
    VerificationPool pool(3);
    EXPECT_EQ(pool.workerCount(), 3u);

    std::vector<std::future<Verdict>> pending;
    for (int i = 0; i < 40; ++i)
    {
        InstrSeq seq;
        if (i % 2)
            seq.push_back({Opcode::AddI, 1});
        pending.push_back(pool.submit(verifier, increment(), seq));
    }
    int verified = 0;
    for (auto &f : pending)
        verified += f.get() == Verdict::Verified ? 1 : 0;
    EXPECT_EQ(verified, 20);
    EXPECT_EQ(verifier->calls.load(), 40);
}

TEST(VerificationPoolTest, ZeroWorkersRunsInline)
{
    VerificationPool pool(0);
    auto verdict = pool.submit(std::make_shared<DifferentialVerifier>(), increment(),
                               InstrSeq{{Opcode::AddI, 1}});
    ASSERT_EQ(verdict.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_EQ(verdict.get(), Verdict::Verified);
}

TEST(VerificationPoolTest, ExceptionsTravelThroughTheFuture)
{
    VerificationPool pool(1);
    auto verdict = pool.submit(std::make_shared<ThrowingVerifier>(), increment(), InstrSeq{});
    EXPECT_THROW(verdict.get(), std::runtime_error);
}

TEST(VerificationPoolTest, SubmitAfterShutdownStillResolves)
{
    auto verifier = std::make_shared<CountingVerifier>();
    VerificationPool pool(2);
    pool.shutdown();
    auto verdict = pool.submit(verifier, increment(), InstrSeq{{Opcode::AddI, 1}});
    EXPECT_EQ(verdict.get(), Verdict::Verified);
    EXPECT_EQ(verifier->calls.load(), 1);
}
