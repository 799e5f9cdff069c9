#include "engine_fixture.h"
#include "core/reputation.h"
#include <cmath>

using namespace stakerep;
using namespace stakerep::core;

namespace {

Reputation makeRep(double alpha, double beta, int64_t lastTs) {
    Reputation r;
    r.actorId = "alice";
    r.dimension = "quality";
    r.alpha = alpha;
    r.beta = beta;
    r.lastTs = lastTs;
    return r;
}

}

TEST(ReputationMathTest, ScoreIsAlphaShare) {
    EXPECT_DOUBLE_EQ(makeRep(3, 2, 0).score(), 0.6);
    EXPECT_DOUBLE_EQ(makeRep(2, 2, 0).score(), 0.5);
    EXPECT_DOUBLE_EQ(makeRep(0, 0, 0).score(), 0.5);
}

TEST(ReputationMathTest, BetaVarianceOfUniformIsMaximal) {
    EXPECT_NEAR(betaVariance(1, 1), 1.0 / 12.0, 1e-12);
    EXPECT_LT(betaVariance(20, 20), betaVariance(2, 2));
}

TEST(ReputationMathTest, DecayNeverBelowPrior) {
    SystemConfig cfg = SystemConfig::defaults();
    std::vector<Reputation> reps = {makeRep(2, 2, 0), makeRep(50, 3, 0), makeRep(2.5, 40, 0)};
    std::vector<int64_t> elapsed = {0, 1, 3600, 86400, 86400 * 30, 86400LL * 365 * 50};
    for (const auto& rep : reps) {
        for (int64_t dt : elapsed) {
            Reputation d = applyDecay(rep, cfg, rep.lastTs + dt);
            EXPECT_GE(d.alpha, cfg.initialAlpha);
            EXPECT_GE(d.beta, cfg.initialBeta);
        }
    }
}

TEST(ReputationMathTest, DecayIsNoOpWithoutElapsedTime) {
    SystemConfig cfg = SystemConfig::defaults();
    Reputation rep = makeRep(10, 4, 1000);
    Reputation same = applyDecay(rep, cfg, 1000);
    EXPECT_DOUBLE_EQ(same.alpha, 10);
    EXPECT_DOUBLE_EQ(same.beta, 4);

    Reputation past = applyDecay(rep, cfg, 500);
    EXPECT_DOUBLE_EQ(past.alpha, 10);
}

TEST(ReputationMathTest, DecayFollowsAdaptiveRate) {
    SystemConfig cfg = SystemConfig::defaults();
    Reputation rep = makeRep(30, 10, 0);
    Reputation d = applyDecay(rep, cfg, cfg.decayPeriod);

    double normVar = std::min(1.0, betaVariance(30, 10) / (1.0 / 12.0));
    double factor = std::pow(cfg.decayRate, 1.0 + normVar);
    EXPECT_NEAR(d.alpha, 30 * factor, 1e-9);
    EXPECT_NEAR(d.beta, 10 * factor, 1e-9);
}

TEST(ReputationMathTest, ContestedEvidenceDecaysFaster) {
    SystemConfig cfg = SystemConfig::defaults();
    cfg.initialAlpha = 0.01;
    cfg.initialBeta = 0.01;
    Reputation thin = applyDecay(makeRep(3, 3, 0), cfg, cfg.decayPeriod * 10);
    Reputation thick = applyDecay(makeRep(300, 300, 0), cfg, cfg.decayPeriod * 10);
    EXPECT_LT(thin.alpha / 3.0, thick.alpha / 300.0);
}

TEST(ReputationMathTest, WilsonBoundsContainScore) {
    std::vector<std::pair<double, double>> params = {
        {2, 2}, {3, 2}, {100, 1}, {1, 100}, {0.5, 0.5}, {1e-3, 5}, {5000, 4000}};
    for (double confidence : {0.95, 0.99}) {
        for (const auto& [a, b] : params) {
            auto bounds = wilsonInterval(a, b, confidence);
            ASSERT_TRUE(bounds.ok());
            double score = a / (a + b);
            EXPECT_GE(bounds.value().lower, 0.0);
            EXPECT_LE(bounds.value().lower, score + 1e-12);
            EXPECT_GE(bounds.value().upper, score - 1e-12);
            EXPECT_LE(bounds.value().upper, 1.0);
        }
    }
}

TEST(ReputationMathTest, WilsonWidensWithConfidence) {
    auto narrow = wilsonInterval(10, 5, 0.95);
    auto wide = wilsonInterval(10, 5, 0.99);
    ASSERT_TRUE(narrow.ok());
    ASSERT_TRUE(wide.ok());
    EXPECT_LT(wide.value().lower, narrow.value().lower);
    EXPECT_GT(wide.value().upper, narrow.value().upper);
}

TEST(ReputationMathTest, WilsonRejectsUnsupportedConfidence) {
    auto r = wilsonInterval(3, 2, 0.9);
    ASSERT_TRUE(r.failed());
    EXPECT_EQ(r.code(), ErrorCode::INVALID_INPUT);
}

class ReputationStoreTest : public test::EngineTest {
protected:
    SystemConfig cfg = SystemConfig::defaults();
    ReputationStore reps;
};

TEST_F(ReputationStoreTest, MonotonicUpdate) {
    std::vector<double> values = {0.0, 0.2, 0.49, 0.5, 0.75, 1.0};
    for (size_t i = 0; i < values.size(); i++) {
        auto tx = store.begin();
        CallContext call = as("rater");
        TxContext ctx(*tx, call);
        std::string target = "target" + std::to_string(i);

        auto before = reps.getOrInit(ctx, cfg, target, "quality");
        ASSERT_TRUE(before.ok());
        double prev = applyDecay(before.value(), cfg, T0).score();

        auto after = reps.update(ctx, cfg, target, "quality", values[i], 1.0, T0);
        ASSERT_TRUE(after.ok());
        if (values[i] >= 0.5) {
            EXPECT_GE(after.value().score(), prev) << values[i];
        } else {
            EXPECT_LE(after.value().score(), prev) << values[i];
        }
        EXPECT_EQ(after.value().totalEvents, 1u);
        EXPECT_EQ(after.value().lastTs, T0);
        ASSERT_TRUE(tx->commit().ok());
    }
}

TEST_F(ReputationStoreTest, ScenarioPriorPlusOnePositive) {
    auto tx = store.begin();
    CallContext call = as("rater");
    TxContext ctx(*tx, call);

    auto rep = reps.update(ctx, cfg, "alice", "quality", 1.0, 1.0, T0);
    ASSERT_TRUE(rep.ok());
    EXPECT_DOUBLE_EQ(rep.value().alpha, 3.0);
    EXPECT_DOUBLE_EQ(rep.value().beta, 2.0);
    EXPECT_DOUBLE_EQ(rep.value().score(), 0.6);
}

TEST_F(ReputationStoreTest, LastTimestampNeverMovesBackwards) {
    auto tx = store.begin();
    CallContext call = as("rater");
    TxContext ctx(*tx, call);

    ASSERT_TRUE(reps.update(ctx, cfg, "alice", "quality", 1.0, 1.0, T0 + 100).ok());
    auto rep = reps.update(ctx, cfg, "alice", "quality", 1.0, 1.0, T0);
    ASSERT_TRUE(rep.ok());
    EXPECT_EQ(rep.value().lastTs, T0 + 100);
    EXPECT_EQ(rep.value().totalEvents, 2u);
}

TEST_F(ReputationStoreTest, ReverseUndoesContribution) {
    auto tx = store.begin();
    CallContext call = as("rater");
    TxContext ctx(*tx, call);

    ASSERT_TRUE(reps.update(ctx, cfg, "alice", "quality", 0.1, 2.0, T0).ok());
    auto reversed = reps.reverse(ctx, cfg, "alice", "quality", 0.1, 2.0);
    ASSERT_TRUE(reversed.ok());
    EXPECT_NEAR(reversed.value().alpha, 2.0, 1e-12);
    EXPECT_NEAR(reversed.value().beta, 2.0, 1e-12);
    EXPECT_EQ(reversed.value().totalEvents, 0u);
    EXPECT_EQ(reversed.value().lastTs, T0);

    auto again = reps.reverse(ctx, cfg, "alice", "quality", 0.1, 2.0);
    ASSERT_TRUE(again.ok());
    EXPECT_DOUBLE_EQ(again.value().beta, cfg.initialBeta);
    EXPECT_EQ(again.value().totalEvents, 0u);
}

TEST_F(ReputationStoreTest, UpdateValidatesInputs) {
    auto tx = store.begin();
    CallContext call = as("rater");
    TxContext ctx(*tx, call);

    EXPECT_EQ(reps.update(ctx, cfg, "alice", "quality", 1.5, 1.0, T0).code(), ErrorCode::INVALID_VALUE);
    EXPECT_EQ(reps.update(ctx, cfg, "alice", "quality", NAN, 1.0, T0).code(), ErrorCode::INVALID_VALUE);
    EXPECT_EQ(reps.update(ctx, cfg, "alice", "quality", 0.5, -1.0, T0).code(), ErrorCode::INVALID_INPUT);
}

TEST_F(ReputationStoreTest, PriorIsNotPersisted) {
    auto tx = store.begin();
    CallContext call = as("rater");
    TxContext ctx(*tx, call);

    auto rep = reps.getOrInit(ctx, cfg, "ghost", "quality");
    ASSERT_TRUE(rep.ok());
    EXPECT_DOUBLE_EQ(rep.value().alpha, cfg.initialAlpha);
    ASSERT_TRUE(tx->commit().ok());
    EXPECT_FALSE(store.database().exists(Reputation::key("ghost", "quality")));
}
