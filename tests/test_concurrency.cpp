#include "engine_fixture.h"
#include <functional>

using namespace stakerep;
using namespace stakerep::core;

namespace {

// Runs a one-shot hook right before the next commit reaches the store, so a
// competing call can land between a transaction's reads and its commit.
class InterleavingStore : public StateStore {
public:
    explicit InterleavingStore(StateStore& inner) : inner_(inner) {}

    void beforeNextCommit(std::function<void()> hook) { hook_ = std::move(hook); }

    std::unique_ptr<Transaction> begin() override {
        auto tx = inner_.begin();
        if (!tx) return nullptr;
        return std::make_unique<HookedTransaction>(std::move(tx), hook_);
    }

private:
    class HookedTransaction : public Transaction {
    public:
        HookedTransaction(std::unique_ptr<Transaction> inner, std::function<void()>& hook)
            : inner_(std::move(inner)), hook_(hook) {}

        Result<std::optional<Bytes>> get(const std::string& key) override { return inner_->get(key); }
        Result<void> put(const std::string& key, const Bytes& value) override { return inner_->put(key, value); }
        Result<std::vector<KeyValue>> rangeQuery(const std::string& prefix) override {
            return inner_->rangeQuery(prefix);
        }

        Result<void> commit() override {
            if (hook_) {
                auto hook = std::move(hook_);
                hook_ = nullptr;
                hook();
            }
            return inner_->commit();
        }

        void abort() override { inner_->abort(); }

    private:
        std::unique_ptr<Transaction> inner_;
        std::function<void()>& hook_;
    };

    StateStore& inner_;
    std::function<void()> hook_;
};

}

class ConcurrencyTest : public test::UnitWeightEngineTest {
protected:
    void SetUp() override {
        UnitWeightEngineTest::SetUp();
        interleaving = std::make_unique<InterleavingStore>(store);
        engine = std::make_unique<ReputationEngine>(*interleaving, &bus, options());
    }

    void TearDown() override {
        engine.reset();
        interleaving.reset();
        UnitWeightEngineTest::TearDown();
    }

    std::unique_ptr<InterleavingStore> interleaving;
};

TEST_F(ConcurrencyTest, ConcurrentDepositsConflictThenRetrySums) {
    fund("alice", 100);

    Result<Stake> inner = makeError(ErrorCode::INTERNAL_ERROR, "hook not run");
    interleaving->beforeNextCommit([&]() {
        inner = engine->deposit(as("alice"), 50);
    });

    auto outer = engine->deposit(as("alice"), 25);
    ASSERT_TRUE(inner.ok());
    EXPECT_DOUBLE_EQ(inner.value().available, 150);
    EXPECT_EQ(outer.code(), ErrorCode::STORAGE_CONFLICT);
    EXPECT_TRUE(isRetryable(outer.code()));

    auto retry = engine->deposit(as("alice"), 25);
    ASSERT_TRUE(retry.ok());
    EXPECT_DOUBLE_EQ(retry.value().available, 175);
    EXPECT_DOUBLE_EQ(engine->getStake(as("x"), "alice").value().available, 175);
}

TEST_F(ConcurrencyTest, ConflictEmitsNoNotifications) {
    fund("alice", 100);
    size_t before = bus.getHistory(topic::STAKE_DEPOSITED).size();

    interleaving->beforeNextCommit([&]() {
        ASSERT_TRUE(engine->deposit(as("alice"), 1).ok());
    });
    EXPECT_EQ(engine->deposit(as("alice"), 2).code(), ErrorCode::STORAGE_CONFLICT);

    // only the interleaved deposit committed
    EXPECT_EQ(bus.getHistory(topic::STAKE_DEPOSITED).size(), before + 1);
    EXPECT_DOUBLE_EQ(engine->getStake(as("x"), "alice").value().available, 101);
}

TEST_F(ConcurrencyTest, DifferentActorsDoNotConflict) {
    interleaving->beforeNextCommit([&]() {
        ASSERT_TRUE(engine->deposit(as("bob"), 500).ok());
    });
    auto alice = engine->deposit(as("alice"), 700);
    ASSERT_TRUE(alice.ok());

    EXPECT_DOUBLE_EQ(engine->getStake(as("x"), "alice").value().available, 700);
    EXPECT_DOUBLE_EQ(engine->getStake(as("x"), "bob").value().available, 500);
}

TEST_F(ConcurrencyTest, RatingRacingSlashSeesConflict) {
    fund("rater", 1000);
    fund("alice", 500);
    fund("bob", 1000);
    std::string ratingId = rate("rater", "alice", "quality", 1.0);
    auto dispute = engine->initiateDispute(as("alice"), ratingId, "");
    ASSERT_TRUE(dispute.ok());

    // the slash lands after the rater's stake check but before its commit
    interleaving->beforeNextCommit([&]() {
        ASSERT_TRUE(engine->resolveDispute(as("arbiter", T0 + 10), dispute.value(), "overturned", "").ok());
    });
    auto raced = engine->submitRating(as("rater", T0 + 5), "bob", "quality", 1.0, "", T0 + 5);
    EXPECT_EQ(raced.code(), ErrorCode::STORAGE_CONFLICT);
    EXPECT_EQ(stored("bob", "quality").totalEvents, 0u);

    auto retried = engine->submitRating(as("rater", T0 + 5), "bob", "quality", 1.0, "", T0 + 5);
    EXPECT_EQ(retried.code(), ErrorCode::INSUFFICIENT_STAKE);
}
