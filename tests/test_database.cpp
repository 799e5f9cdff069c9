#include <gtest/gtest.h>
#include "database/database.h"
#include "core/state_store.h"
#include "utils/logger.h"
#include <filesystem>
#include <stdexcept>

using namespace stakerep;
using namespace stakerep::core;

namespace {

Bytes bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

std::string text(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

}

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::setLevel(utils::LogLevel::ERROR);
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dbPath = std::filesystem::temp_directory_path() /
                 (std::string("stakerep_db_") + info->name() + ".db");
        cleanup();
        ASSERT_TRUE(store.open(dbPath.string()));
    }

    void TearDown() override {
        store.close();
        cleanup();
    }

    void cleanup() {
        std::error_code ec;
        std::filesystem::remove(dbPath, ec);
        std::filesystem::remove(dbPath.string() + "-wal", ec);
        std::filesystem::remove(dbPath.string() + "-shm", ec);
    }

    database::Database& db() { return store.database(); }

    std::filesystem::path dbPath;
    SqliteStateStore store;
};

TEST_F(DatabaseTest, VersionsStartAtOneAndBump) {
    EXPECT_EQ(db().getVersion("k"), 0u);
    bool ok = false;
    EXPECT_FALSE(db().getVersioned("k", &ok).found);
    EXPECT_TRUE(ok);

    ASSERT_TRUE(db().put("k", std::string("v1")));
    EXPECT_EQ(db().getVersion("k"), 1u);
    ASSERT_TRUE(db().put("k", std::string("v2")));

    auto vv = db().getVersioned("k");
    EXPECT_TRUE(vv.found);
    EXPECT_EQ(vv.version, 2u);
    EXPECT_EQ(db().getString("k"), "v2");
}

TEST_F(DatabaseTest, PrefixScanIsLiteral) {
    ASSERT_TRUE(db().put("REP:a:quality", std::string("1")));
    ASSERT_TRUE(db().put("REP:b:quality", std::string("2")));
    ASSERT_TRUE(db().put("RAT:x", std::string("3")));
    ASSERT_TRUE(db().put("REP_", std::string("4")));
    ASSERT_TRUE(db().put("rep:c", std::string("5")));

    EXPECT_EQ(db().count("REP:"), 2u);
    EXPECT_EQ(db().count("R"), 4u);
    EXPECT_EQ(db().count(), 5u);
    auto keys = db().keys("REP:");
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "REP:a:quality");
}

TEST_F(DatabaseTest, CommitIfUnchangedDetectsStaleVersion) {
    ASSERT_TRUE(db().put("k", std::string("v1")));

    database::WriteBatch batch;
    batch.put("k", bytes("v2"));
    std::map<std::string, uint64_t> expected = {{"k", 1}};
    EXPECT_EQ(db().commitIfUnchanged(expected, batch), database::CommitStatus::Committed);

    database::WriteBatch stale;
    stale.put("k", bytes("v3"));
    EXPECT_EQ(db().commitIfUnchanged(expected, stale), database::CommitStatus::Conflict);
    EXPECT_EQ(db().getString("k"), "v2");
}

TEST_F(DatabaseTest, TransactionReadsItsOwnWrites) {
    auto tx = store.begin();
    ASSERT_TRUE(tx->put("STK:alice", bytes("10")).ok());
    auto read = tx->get("STK:alice");
    ASSERT_TRUE(read.ok());
    ASSERT_TRUE(read.value().has_value());
    EXPECT_EQ(text(*read.value()), "10");
    EXPECT_FALSE(db().exists("STK:alice"));

    ASSERT_TRUE(tx->commit().ok());
    EXPECT_EQ(db().getString("STK:alice"), "10");
}

TEST_F(DatabaseTest, AbortDiscardsWrites) {
    auto tx = store.begin();
    ASSERT_TRUE(tx->put("k", bytes("v")).ok());
    tx->abort();
    EXPECT_FALSE(db().exists("k"));
    EXPECT_EQ(tx->commit().code(), ErrorCode::INTERNAL_ERROR);
}

TEST_F(DatabaseTest, SameKeyConflicts) {
    ASSERT_TRUE(db().put("STK:alice", std::string("0")));

    auto first = store.begin();
    auto second = store.begin();
    ASSERT_TRUE(first->get("STK:alice").ok());
    ASSERT_TRUE(second->get("STK:alice").ok());
    ASSERT_TRUE(first->put("STK:alice", bytes("5")).ok());
    ASSERT_TRUE(second->put("STK:alice", bytes("7")).ok());

    EXPECT_TRUE(first->commit().ok());
    auto lost = second->commit();
    ASSERT_TRUE(lost.failed());
    EXPECT_EQ(lost.code(), ErrorCode::STORAGE_CONFLICT);
    EXPECT_TRUE(isRetryable(lost.code()));
    EXPECT_EQ(db().getString("STK:alice"), "5");
}

TEST_F(DatabaseTest, BlindWritesToNewKeyConflict) {
    auto first = store.begin();
    auto second = store.begin();
    ASSERT_TRUE(first->put("RAT:r1", bytes("a")).ok());
    ASSERT_TRUE(second->put("RAT:r1", bytes("b")).ok());

    EXPECT_TRUE(first->commit().ok());
    EXPECT_EQ(second->commit().code(), ErrorCode::STORAGE_CONFLICT);
}

TEST_F(DatabaseTest, ReadOnlyKeyChangeConflicts) {
    ASSERT_TRUE(db().put("CFG:system", std::string("v1")));

    auto tx = store.begin();
    ASSERT_TRUE(tx->get("CFG:system").ok());
    ASSERT_TRUE(tx->put("STK:bob", bytes("1")).ok());

    ASSERT_TRUE(db().put("CFG:system", std::string("v2")));
    EXPECT_EQ(tx->commit().code(), ErrorCode::STORAGE_CONFLICT);
    EXPECT_FALSE(db().exists("STK:bob"));
}

TEST_F(DatabaseTest, DifferentKeysNeverConflict) {
    auto first = store.begin();
    auto second = store.begin();
    ASSERT_TRUE(first->get("STK:alice").ok());
    ASSERT_TRUE(second->get("STK:bob").ok());
    ASSERT_TRUE(first->put("STK:alice", bytes("1")).ok());
    ASSERT_TRUE(second->put("STK:bob", bytes("2")).ok());

    EXPECT_TRUE(first->commit().ok());
    EXPECT_TRUE(second->commit().ok());
}

TEST_F(DatabaseTest, RangeQueryMergesBufferedWrites) {
    ASSERT_TRUE(db().put("RAT:a", std::string("stored")));
    ASSERT_TRUE(db().put("RAT:b", std::string("stored")));

    auto tx = store.begin();
    ASSERT_TRUE(tx->put("RAT:b", bytes("mine")).ok());
    ASSERT_TRUE(tx->put("RAT:c", bytes("new")).ok());
    ASSERT_TRUE(tx->put("DIS:z", bytes("other")).ok());

    auto rows = tx->rangeQuery("RAT:");
    ASSERT_TRUE(rows.ok());
    ASSERT_EQ(rows.value().size(), 3u);
    EXPECT_EQ(rows.value()[0].first, "RAT:a");
    EXPECT_EQ(text(rows.value()[1].second), "mine");
    EXPECT_EQ(rows.value()[2].first, "RAT:c");
}

TEST_F(DatabaseTest, ReadFailureIsNotAnAbsentKey) {
    ASSERT_TRUE(db().put("STK:alice", std::string("10")));
    auto tx = store.begin();
    db().close();

    bool ok = true;
    EXPECT_FALSE(db().getVersioned("STK:alice", &ok).found);
    EXPECT_FALSE(ok);

    auto read = tx->get("STK:alice");
    ASSERT_TRUE(read.failed());
    EXPECT_EQ(read.code(), ErrorCode::DATABASE_ERROR);
    EXPECT_FALSE(isRetryable(read.code()));
    EXPECT_EQ(tx->put("STK:bob", bytes("1")).code(), ErrorCode::DATABASE_ERROR);
    EXPECT_EQ(tx->rangeQuery("STK:").code(), ErrorCode::DATABASE_ERROR);
}

TEST_F(DatabaseTest, EmptyTransactionCommits) {
    auto tx = store.begin();
    ASSERT_TRUE(tx->get("missing").ok());
    EXPECT_TRUE(tx->commit().ok());
}

TEST(NotificationBusTest, DeliversByTopic) {
    NotificationBus bus;
    int ratings = 0;
    int all = 0;
    bus.subscribe(topic::RATING_SUBMITTED, [&](const Notification&) { ratings++; });
    std::string everything = bus.subscribe("", [&](const Notification&) { all++; });

    bus.emit(topic::RATING_SUBMITTED, "{}");
    bus.emit(topic::STAKE_DEPOSITED, "{}");
    EXPECT_EQ(ratings, 1);
    EXPECT_EQ(all, 2);
    EXPECT_EQ(bus.getEmittedCount(), 2u);

    EXPECT_TRUE(bus.unsubscribe(everything));
    EXPECT_FALSE(bus.unsubscribe(everything));
    bus.emit(topic::STAKE_DEPOSITED, "{}");
    EXPECT_EQ(all, 2);
    EXPECT_EQ(bus.getSubscriberCount(), 1u);
}

TEST(NotificationBusTest, HistoryFiltersByTopic) {
    NotificationBus bus;
    bus.emit(topic::STAKE_DEPOSITED, "a");
    bus.emit(topic::STAKE_SLASHED, "b");
    bus.emit(topic::STAKE_DEPOSITED, "c");

    auto deposits = bus.getHistory(topic::STAKE_DEPOSITED);
    ASSERT_EQ(deposits.size(), 2u);
    EXPECT_EQ(deposits[0].payload, "a");
    EXPECT_EQ(deposits[1].payload, "c");
    EXPECT_LT(deposits[0].sequence, deposits[1].sequence);

    auto last = bus.getHistory(1);
    ASSERT_EQ(last.size(), 1u);
    EXPECT_EQ(last[0].payload, "c");

    bus.clearHistory();
    EXPECT_TRUE(bus.getHistory().empty());
}

TEST(NotificationBusTest, ThrowingHandlerDoesNotStopOthers) {
    utils::Logger::setLevel(utils::LogLevel::ERROR);
    NotificationBus bus;
    int delivered = 0;
    bus.subscribe("", [](const Notification&) { throw std::runtime_error("boom"); });
    bus.subscribe("", [&](const Notification&) { delivered++; });
    bus.emit(topic::ROLE_CHANGED, "{}");
    EXPECT_EQ(delivered, 1);
}
