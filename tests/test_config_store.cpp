#include "engine_fixture.h"
#include "core/system_config.h"
#include "crypto/crypto.h"
#include "utils/config.h"
#include <algorithm>
#include <cmath>
#include <fstream>

using namespace stakerep;
using namespace stakerep::core;

class ConfigStoreTest : public test::EngineTest {};

TEST_F(ConfigStoreTest, DefaultsAutoInitialize) {
    auto cfg = engine->getConfig(as("anyone"));
    ASSERT_TRUE(cfg.ok());
    EXPECT_EQ(cfg.value().version, 1u);
    EXPECT_DOUBLE_EQ(cfg.value().minStake, 1000.0);
    EXPECT_DOUBLE_EQ(cfg.value().disputeCost, 100.0);
    EXPECT_DOUBLE_EQ(cfg.value().slashFraction, 0.30);
    EXPECT_EQ(cfg.value().validDimensions.size(), 4u);
    EXPECT_EQ(cfg.value().metaDimensionFor("quality").value_or(""), "rater_quality");

    // queries never write
    EXPECT_FALSE(store.database().exists(SystemConfig::KEY));
}

TEST_F(ConfigStoreTest, BootstrapPersistsOnce) {
    auto first = engine->bootstrap(as("system"));
    ASSERT_TRUE(first.ok());
    EXPECT_TRUE(store.database().exists(SystemConfig::KEY));

    auto second = engine->bootstrap(as("system", T0 + 50));
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.value().version, 1u);
    EXPECT_EQ(second.value().lastUpdated, T0);
}

TEST_F(ConfigStoreTest, InitRequiresAdminAndIsOneShot) {
    SystemConfig cfg = SystemConfig::defaults();
    cfg.minStake = 10.0;

    EXPECT_EQ(engine->initConfig(as("mallory"), cfg).code(), ErrorCode::UNAUTHORIZED);

    auto created = engine->initConfig(as("admin"), cfg);
    ASSERT_TRUE(created.ok());
    EXPECT_EQ(created.value().version, 1u);
    EXPECT_DOUBLE_EQ(created.value().minStake, 10.0);

    EXPECT_EQ(engine->initConfig(as("admin"), cfg).code(), ErrorCode::ALREADY_EXISTS);
}

TEST_F(ConfigStoreTest, UpdateBumpsVersionAndNotifies) {
    ASSERT_TRUE(engine->bootstrap(as("system")).ok());
    SystemConfig cfg = SystemConfig::defaults();
    cfg.disputeCost = 25.0;

    auto v2 = engine->updateConfig(as("admin", T0 + 10), cfg);
    ASSERT_TRUE(v2.ok());
    EXPECT_EQ(v2.value().version, 2u);
    EXPECT_EQ(v2.value().lastUpdated, T0 + 10);

    auto v3 = engine->updateConfig(as("admin", T0 + 20), cfg);
    ASSERT_TRUE(v3.ok());
    EXPECT_EQ(v3.value().version, 3u);

    auto read = engine->getConfig(as("anyone"));
    ASSERT_TRUE(read.ok());
    EXPECT_DOUBLE_EQ(read.value().disputeCost, 25.0);
    EXPECT_EQ(bus.getHistory(topic::CONFIG_UPDATED).size(), 2u);
}

TEST_F(ConfigStoreTest, UpdateRejectsNonAdmin) {
    auto r = engine->updateConfig(as("arbiter"), SystemConfig::defaults());
    EXPECT_EQ(r.code(), ErrorCode::UNAUTHORIZED);
    EXPECT_EQ(errorCategory(r.code()), ErrorCategory::Unauthorized);
}

TEST_F(ConfigStoreTest, UpdateRejectsInvalidConfig) {
    SystemConfig bad = SystemConfig::defaults();
    bad.slashFraction = 1.5;
    EXPECT_EQ(engine->updateConfig(as("admin"), bad).code(), ErrorCode::INVALID_CONFIG);

    bad = SystemConfig::defaults();
    bad.maxRaterWeight = 0.01;
    EXPECT_EQ(engine->updateConfig(as("admin"), bad).code(), ErrorCode::INVALID_CONFIG);

    bad = SystemConfig::defaults();
    bad.metaDimensions.erase("warranty");
    EXPECT_EQ(engine->updateConfig(as("admin"), bad).code(), ErrorCode::INVALID_CONFIG);

    bad = SystemConfig::defaults();
    bad.metaDimensions["quality"] = "delivery";
    EXPECT_EQ(engine->updateConfig(as("admin"), bad).code(), ErrorCode::INVALID_CONFIG);

    bad = SystemConfig::defaults();
    bad.decayPeriod = 0;
    EXPECT_EQ(engine->updateConfig(as("admin"), bad).code(), ErrorCode::INVALID_CONFIG);

    bad = SystemConfig::defaults();
    bad.minStake = NAN;
    EXPECT_EQ(engine->updateConfig(as("admin"), bad).code(), ErrorCode::INVALID_CONFIG);
}

// Engine defaults built from a config file with out-of-range values.
class InvalidDefaultsTest : public test::EngineTest {
protected:
    EngineOptions options() const override {
        EngineOptions opts = EngineTest::options();
        opts.defaults.slashFraction = 1.5;
        opts.defaults.decayRate = 2.0;
        return opts;
    }
};

TEST_F(InvalidDefaultsTest, NeverPersisted) {
    EXPECT_EQ(engine->bootstrap(as("system")).code(), ErrorCode::INVALID_CONFIG);
    EXPECT_FALSE(store.database().exists(SystemConfig::KEY));

    fund("bob", 2000);
    EXPECT_EQ(engine->submitRating(as("bob"), "alice", "quality", 0.8, "", T0).code(),
              ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(engine->getReputation(as("anyone"), "alice", "quality", T0).code(),
              ErrorCode::INVALID_CONFIG);
    EXPECT_FALSE(store.database().exists(SystemConfig::KEY));
}

TEST_F(InvalidDefaultsTest, AdminCanStoreValidConfig) {
    auto created = engine->initConfig(as("admin"), SystemConfig::defaults());
    ASSERT_TRUE(created.ok()) << created.error().message;
    EXPECT_DOUBLE_EQ(created.value().slashFraction, 0.30);

    fund("bob", 2000);
    EXPECT_FALSE(rate("bob", "alice", "quality", 0.8).empty());
    auto cfg = engine->getConfig(as("anyone"));
    ASSERT_TRUE(cfg.ok());
    EXPECT_DOUBLE_EQ(cfg.value().decayRate, 0.98);
}

TEST_F(ConfigStoreTest, AddDimension) {
    auto added = engine->addDimension(as("admin"), "security", "rater_security");
    ASSERT_TRUE(added.ok());
    EXPECT_TRUE(added.value().isValidDimension("security"));
    EXPECT_TRUE(added.value().isMetaDimension("rater_security"));
    EXPECT_EQ(added.value().version, 2u);
    EXPECT_EQ(bus.getHistory(topic::DIMENSION_ADDED).size(), 1u);

    fund("bob", 1000);
    EXPECT_FALSE(rate("bob", "alice", "security", 0.8).empty());
}

TEST_F(ConfigStoreTest, AddDimensionValidation) {
    EXPECT_EQ(engine->addDimension(as("bob"), "x", "rater_x").code(), ErrorCode::UNAUTHORIZED);
    EXPECT_EQ(engine->addDimension(as("admin"), "", "rater_x").code(), ErrorCode::INVALID_INPUT);
    EXPECT_EQ(engine->addDimension(as("admin"), "x", "x").code(), ErrorCode::INVALID_INPUT);
    EXPECT_EQ(engine->addDimension(as("admin"), "x", "quality").code(), ErrorCode::INVALID_INPUT);
    EXPECT_EQ(engine->addDimension(as("admin"), "rater_quality", "rater_rater").code(),
              ErrorCode::INVALID_INPUT);
}

TEST_F(ConfigStoreTest, RoleGrantAndRevoke) {
    EXPECT_TRUE(engine->hasRole(as("x"), "admin", Role::Admin).value());
    EXPECT_FALSE(engine->hasRole(as("x"), "carol", Role::Arbitrator).value());

    EXPECT_EQ(engine->grantRole(as("carol"), "carol", Role::Admin).code(), ErrorCode::UNAUTHORIZED);

    auto granted = engine->grantRole(as("admin"), "CN=Carol,OU=client", Role::Arbitrator);
    ASSERT_TRUE(granted.ok());
    EXPECT_EQ(granted.value(), static_cast<uint32_t>(Role::Arbitrator));
    EXPECT_TRUE(engine->hasRole(as("x"), "carol", Role::Arbitrator).value());

    ASSERT_TRUE(engine->revokeRole(as("admin"), "carol", Role::Arbitrator).ok());
    EXPECT_FALSE(engine->hasRole(as("x"), "carol", Role::Arbitrator).value());
    EXPECT_EQ(engine->revokeRole(as("admin"), "carol", Role::Arbitrator).code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(bus.getHistory(topic::ROLE_CHANGED).size(), 2u);
}

TEST_F(ConfigStoreTest, AdminRecognizedThroughEncodedCredential) {
    std::string credential = crypto::base64EncodeString("x509::CN=Admin,OU=admin::CN=ca");
    auto added = engine->addDimension(as(credential), "speed", "rater_speed");
    EXPECT_TRUE(added.ok());
}

TEST(ConfigFileTest, EngineKeysRoundTripThroughFile) {
    auto& cfg = utils::Config::instance();
    cfg.reset();
    cfg.set("engine.min_stake", 250.0);
    cfg.set("engine.decay_period", static_cast<int64_t>(3600));
    cfg.setList("engine.admins", {"root", "CN=Ops"});
    cfg.set("engine.arbitrators", "judge, , jury");

    auto path = std::filesystem::temp_directory_path() / "stakerep_config_test.conf";
    ASSERT_TRUE(cfg.save(path.string()));
    cfg.reset();
    EXPECT_DOUBLE_EQ(cfg.getDouble("engine.min_stake"), 1000.0);

    ASSERT_TRUE(cfg.load(path.string()));
    EngineOptions opts = EngineOptions::fromConfig(cfg);
    EXPECT_DOUBLE_EQ(opts.defaults.minStake, 250.0);
    EXPECT_EQ(opts.defaults.decayPeriod, 3600);
    EXPECT_DOUBLE_EQ(opts.defaults.disputeCost, 100.0);
    ASSERT_EQ(opts.admins.size(), 2u);
    EXPECT_EQ(opts.admins[1], "CN=Ops");
    ASSERT_EQ(opts.arbitrators.size(), 2u);
    EXPECT_EQ(opts.arbitrators[1], "jury");
    EXPECT_EQ(opts.defaults.validDimensions.size(), 4u);

    std::filesystem::remove(path);
    cfg.reset();
}

TEST(ConfigFileTest, MalformedNumbersFallBack) {
    auto& cfg = utils::Config::instance();
    cfg.reset();
    cfg.set("engine.slash_fraction", "lots");
    EXPECT_DOUBLE_EQ(cfg.getEngineConfig().slashFraction, 0.30);
    EXPECT_FALSE(cfg.load("/nonexistent/stakerep.conf"));
    cfg.reset();
}

TEST(ConfigFileTest, OutOfRangeEngineKeysFailValidation) {
    auto& cfg = utils::Config::instance();
    cfg.reset();
    cfg.set("engine.slash_fraction", 1.5);
    EngineOptions opts = EngineOptions::fromConfig(cfg);
    EXPECT_DOUBLE_EQ(opts.defaults.slashFraction, 1.5);
    EXPECT_EQ(validateConfig(opts.defaults).code(), ErrorCode::INVALID_CONFIG);
    cfg.reset();
}

TEST(ConfigFileTest, StorageKeysDriveLoggingAndStore) {
    auto& cfg = utils::Config::instance();
    cfg.reset();
    auto dir = std::filesystem::temp_directory_path() / "stakerep_storage_test";
    std::filesystem::remove_all(dir);
    std::string previousDir = cfg.getDataDir();
    cfg.setDataDir(dir.string());
    cfg.reset();
    cfg.set("storage.log_level", "debug");

    utils::StorageConfig storage = cfg.getStorageConfig();
    EXPECT_EQ(storage.dbPath, (dir / "stakerep.db").string());

    utils::Logger::clearLogs();
    utils::Logger::enableConsole(false);
    utils::Logger::init(storage);
    EXPECT_TRUE(utils::Logger::isInitialized());
    EXPECT_EQ(utils::Logger::getLevel(), utils::LogLevel::DEBUG);

    std::vector<std::string> seen;
    utils::Logger::onLog([&](const utils::LogEntry& e) { seen.push_back(e.message); });

    std::filesystem::create_directories(dir);
    core::SqliteStateStore store;
    ASSERT_TRUE(store.open(storage.dbPath));
    core::ReputationEngine engine(store, nullptr, EngineOptions::fromConfig(cfg));
    core::CallContext call;
    call.caller = "x509::CN=Bob,OU=client,O=Org1::CN=ca.org1.example.com";
    call.txId = "tx-log";
    call.timestamp = 1700000000;
    ASSERT_TRUE(engine.deposit(call, 10).ok());

    auto recent = utils::Logger::getRecentLogs(10);
    EXPECT_TRUE(std::any_of(recent.begin(), recent.end(), [](const utils::LogEntry& e) {
        return e.message.find("deposit committed tx=tx-log caller=bob") != std::string::npos;
    }));
    EXPECT_FALSE(seen.empty());
    EXPECT_EQ(utils::Logger::redactCredential(call.caller), "CN=Bob,...");

    utils::Logger::onLog(nullptr);
    utils::Logger::shutdown();
    utils::Logger::enableConsole(true);
    utils::Logger::setLevel(utils::LogLevel::INFO);
    EXPECT_TRUE(std::filesystem::exists(storage.logPath));
    store.close();
    std::filesystem::remove_all(dir);
    cfg.setDataDir(previousDir);
    cfg.reset();
}
