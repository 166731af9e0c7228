//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/train/PopulationTrainerTests.cpp
// Purpose: Fitness scoring, training sessions, promotion and the background
//          training worker.
// Key invariants: Only a member that beats the active parameters on held-out
//                 samples is promoted; promotion updates the store, its
//                 metadata and the live generator handle together.
// Ownership/Lifetime: Each test owns a scratch checkpoint directory.
// Links: src/train/PopulationTrainer.hpp, src/train/TrainingWorker.hpp,
//        src/train/FitnessEvaluator.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "gen/StackScheduler.hpp"
#include "gen/TemplateSearchGenerator.hpp"
#include "select/ReplayLog.hpp"
#include "train/PopulationTrainer.hpp"
#include "train/TrainingWorker.hpp"
#include "verify/DifferentialVerifier.hpp"

#include <chrono>
#include <filesystem>
#include <sstream>
#include <thread>

using namespace talus::train;
using talus::checkpoint::CheckpointStore;
using talus::gen::GeneratorParams;
using talus::ir::BlockBuilder;
using talus::select::OutcomeRecord;
using talus::support::Options;
using talus::tasm::Instr;
using talus::tasm::InstrSeq;
using talus::tasm::Opcode;

namespace
{
struct TempDir
{
    std::filesystem::path path;

    explicit TempDir(std::string_view tag)
    {
        path = std::filesystem::temp_directory_path() /
               std::filesystem::path("talus-train-" + std::string(tag));
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path, ec);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

OutcomeRecord record(uint64_t k)
{
    BlockBuilder b(2);
    const int32_t x = b.input(0);
    const int32_t y = b.input(1);
    const int32_t scaled = b.mul(x, b.constant(k));
    b.output(b.add(scaled, b.mul(y, y)));
    const auto block = b.build();

    OutcomeRecord rec;
    auto tensor = talus::encode::encode(block, talus::ir::MachineState{2, 0});
    EXPECT_TRUE(tensor);
    rec.tensor = tensor.value();
    auto naive = talus::gen::lowerNaive(block);
    EXPECT_TRUE(naive.has_value());
    rec.baseline = naive ? *naive : InstrSeq{};
    rec.chosen = rec.baseline;
    return rec;
}

std::vector<OutcomeRecord> records(size_t n)
{
    std::vector<OutcomeRecord> out;
    for (size_t i = 0; i < n; ++i)
        out.push_back(record(i + 2));
    return out;
}

Options smallOptions()
{
    Options opts;
    opts.seed = 21;
    opts.candidatesPerBlock = 8;
    opts.training.populationSize = 4;
    opts.training.generations = 2;
    opts.training.batchSize = 3;
    opts.training.validationSize = 2;
    opts.training.evalThreads = 1;
    return opts;
}

std::shared_ptr<const talus::verify::EquivalenceVerifier> verifier()
{
    return std::make_shared<const talus::verify::DifferentialVerifier>(3, 8);
}

class StallingVerifier final : public talus::verify::EquivalenceVerifier
{
  public:
    talus::verify::Verdict verify(const talus::ir::BasicBlock &, const InstrSeq &) const override
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return talus::verify::Verdict::Verified;
    }
};

TrainingSample tagged(size_t nops)
{
    TrainingSample s;
    s.baseline.assign(nops, Instr{Opcode::Nop, 0});
    return s;
}
} // namespace

TEST(FitnessEvaluatorTest, SamplesSkipUndecodableRecords)
{
    std::vector<OutcomeRecord> recs = records(3);
    recs[1].tensor[0] = talus::field::Fixed::fromReal(0.5);
    const auto samples = samplesFromRecords(recs);
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_EQ(samples[0].baseline, recs[0].baseline);
    EXPECT_EQ(samples[1].baseline, recs[2].baseline);
    EXPECT_EQ(samples[1].tensor, recs[2].tensor);
}

TEST(FitnessEvaluatorTest, FitnessIsNegatedChosenCost)
{
    const talus::tasm::CostOracle oracle;
    FitnessEvaluator eval(oracle, verifier(), 8, 0);
    const auto samples = samplesFromRecords(records(2));
    ASSERT_EQ(samples.size(), 2u);

    EXPECT_EQ(eval.fitness(GeneratorParams::defaults(), {}), 0);
    const int64_t one = eval.fitness(GeneratorParams::defaults(), {samples[0]});
    EXPECT_LT(one, 0);
    EXPECT_LE(-one, static_cast<int64_t>(oracle.cost(samples[0].baseline)));
    EXPECT_EQ(eval.fitness(GeneratorParams::defaults(), {samples[0], samples[0]}), 2 * one);

    const std::vector<GeneratorParams> params{GeneratorParams::defaults(), GeneratorParams::zeros(),
                                              GeneratorParams::defaults()};
    const auto serial = eval.fitnessAll(params, samples, 1);
    const auto threaded = eval.fitnessAll(params, samples, 3);
    EXPECT_EQ(serial, threaded);
    EXPECT_EQ(serial[0], serial[2]);
}

TEST(FitnessEvaluatorTest, StalledVerificationScoresTheBaseline)
{
    const talus::tasm::CostOracle oracle;
    FitnessEvaluator eval(oracle, std::make_shared<const StallingVerifier>(), 2, 0,
                          std::chrono::milliseconds(20));
    const auto samples = samplesFromRecords(records(1));
    ASSERT_EQ(samples.size(), 1u);

    const auto start = std::chrono::steady_clock::now();
    const int64_t score = eval.fitness(GeneratorParams::defaults(), samples);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(250));
    EXPECT_EQ(score, -static_cast<int64_t>(oracle.cost(samples[0].baseline)));
}

TEST(PopulationTrainerTest, SplitHoldsOutTheNewestSamples)
{
    std::vector<TrainingSample> samples;
    for (size_t i = 0; i < 10; ++i)
        samples.push_back(tagged(i));
    const SampleSplit split = splitSamples(samples, 3, 4);
    ASSERT_EQ(split.training.size(), 3u);
    ASSERT_EQ(split.validation.size(), 4u);
    EXPECT_EQ(split.training[0].baseline.size(), 3u);
    EXPECT_EQ(split.training[2].baseline.size(), 5u);
    EXPECT_EQ(split.validation[0].baseline.size(), 6u);
    EXPECT_EQ(split.validation[3].baseline.size(), 9u);

    // Validation never takes more than half.
    const SampleSplit small = splitSamples({tagged(0), tagged(1), tagged(2)}, 8, 5);
    EXPECT_EQ(small.training.size(), 2u);
    EXPECT_EQ(small.validation.size(), 1u);
}

TEST(PopulationTrainerTest, TooFewRecordsIsAnError)
{
    TempDir dir("empty");
    CheckpointStore store(dir.path);
    PopulationTrainer trainer(store, smallOptions(), verifier());
    const std::atomic<bool> cancel{false};

    auto none = trainer.run({}, cancel);
    ASSERT_FALSE(none);
    EXPECT_EQ(none.error().code, "no-training-data");

    auto single = trainer.run(records(1), cancel);
    ASSERT_FALSE(single);
    EXPECT_EQ(single.error().code, "no-training-data");
}

TEST(PopulationTrainerTest, CancelledSessionPromotesNothing)
{
    TempDir dir("cancel");
    CheckpointStore store(dir.path);
    PopulationTrainer trainer(store, smallOptions(), verifier());
    const std::atomic<bool> cancel{true};

    auto result = trainer.run(records(6), cancel);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().cancelled);
    EXPECT_FALSE(result.value().promoted);
    EXPECT_EQ(result.value().generations, 0u);
    EXPECT_EQ(store.active().error().code, "checkpoint-not-found");
    EXPECT_TRUE(store.list().empty());
}

TEST(PopulationTrainerTest, MarginBlocksPromotion)
{
    TempDir dir("margin");
    CheckpointStore store(dir.path);
    auto active = store.save(GeneratorParams::defaults());
    ASSERT_TRUE(active);
    ASSERT_TRUE(store.setActive(active.value()));

    Options opts = smallOptions();
    opts.training.promotionMargin = 1'000'000;
    PopulationTrainer trainer(store, opts, verifier());
    const std::atomic<bool> cancel{false};

    auto result = trainer.run(records(6), cancel);
    ASSERT_TRUE(result);
    EXPECT_FALSE(result.value().promoted);
    EXPECT_FALSE(result.value().cancelled);
    EXPECT_EQ(result.value().generations, 2u);
    EXPECT_EQ(result.value().parentHash, active.value());
    EXPECT_TRUE(result.value().promotedHash.empty());
    EXPECT_EQ(store.active().value(), active.value());
    EXPECT_EQ(store.list().size(), 1u);
}

TEST(PopulationTrainerTest, PromotionUpdatesStoreAndLiveHandle)
{
    TempDir dir("promote");
    CheckpointStore store(dir.path);
    Options opts = smallOptions();
    opts.training.promotionMargin = -1'000'000;
    PopulationTrainer::GeneratorHandle live(
        std::make_shared<const talus::gen::TemplateSearchGenerator>(GeneratorParams::defaults(),
                                                                    opts.seed));
    opts.trace.mode = talus::support::TraceConfig::Decisions;
    std::ostringstream os;
    talus::support::TraceSink trace(opts.trace, os);
    PopulationTrainer trainer(store, opts, verifier(), &live, &trace);
    const std::atomic<bool> cancel{false};

    auto first = trainer.run(records(6), cancel);
    ASSERT_TRUE(first);
    ASSERT_TRUE(first.value().promoted);
    const std::string hash = first.value().promotedHash;
    EXPECT_EQ(store.active().value(), hash);
    EXPECT_EQ(live.load()->version(), hash);
    EXPECT_TRUE(store.load(hash));

    auto meta = store.loadMeta(hash);
    ASSERT_TRUE(meta);
    EXPECT_EQ(meta.value().generation, 2u);
    EXPECT_EQ(meta.value().fitness, first.value().bestFitness);
    EXPECT_EQ(meta.value().validationFitness, first.value().bestValidationFitness);
    EXPECT_TRUE(meta.value().parent.empty());
    EXPECT_NE(os.str().find("[talus:train] promoted " + hash), std::string::npos);

    auto second = trainer.run(records(6), cancel);
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value().parentHash, hash);
}

TEST(TrainingWorkerTest, RunsOneSessionAtATime)
{
    TempDir dir("worker");
    CheckpointStore store(dir.path);
    TrainingWorker worker(store, smallOptions(), verifier());

    auto idle = worker.wait();
    ASSERT_FALSE(idle);
    EXPECT_EQ(idle.error().code, "training-idle");

    ASSERT_TRUE(worker.start(records(6)));
    EXPECT_FALSE(worker.start(records(6)));
    auto result = worker.wait();
    ASSERT_TRUE(result);
    EXPECT_FALSE(result.value().cancelled);
    EXPECT_EQ(result.value().generations, 2u);

    EXPECT_EQ(worker.wait().error().code, "training-idle");
}

TEST(TrainingWorkerTest, StartsFromAReplayLog)
{
    TempDir dir("worker-log");
    CheckpointStore store(dir.path / "ckpt");
    TrainingWorker worker(store, smallOptions(), verifier());

    auto missing = worker.startFromLog((dir.path / "absent.log").string());
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, "io-error");

    const std::string logPath = (dir.path / "outcomes.log").string();
    {
        auto log = talus::select::ReplayLog::open(logPath);
        ASSERT_TRUE(log);
        for (const auto &rec : records(5))
            log.value()->append(rec);
        ASSERT_TRUE(log.value()->flush());
    }

    ASSERT_TRUE(worker.startFromLog(logPath));
    auto busy = worker.startFromLog(logPath);
    ASSERT_FALSE(busy);
    EXPECT_EQ(busy.error().code, "training-busy");
    auto result = worker.wait();
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().generations, 2u);
}
