#pragma once

#include "core/state_store.h"
#include "core/system_config.h"
#include "core/roles.h"
#include "core/stake_ledger.h"
#include "core/rating.h"
#include "core/dispute.h"
#include "core/analytics.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace stakerep {
namespace core {

struct EngineOptions {
    SystemConfig defaults = SystemConfig::defaults();
    std::vector<std::string> admins;
    std::vector<std::string> arbitrators;

    static EngineOptions fromConfig(const utils::Config& config);
};

// Entry points of the reputation engine. Every call runs in its own store
// transaction: writes commit or fail as a whole, queries never write.
// STORAGE_CONFLICT is returned as-is; callers retry with the same inputs.
class ReputationEngine {
public:
    ReputationEngine(StateStore& store, NotificationSink* sink, const EngineOptions& options);
    ~ReputationEngine();

    // Persists the default configuration if the store has none yet.
    Result<SystemConfig> bootstrap(const CallContext& call);

    Result<SystemConfig> getConfig(const CallContext& call);
    Result<SystemConfig> initConfig(const CallContext& call, const SystemConfig& config);
    Result<SystemConfig> updateConfig(const CallContext& call, const SystemConfig& config);
    Result<SystemConfig> addDimension(const CallContext& call, const std::string& base,
                                      const std::string& meta);

    Result<uint32_t> grantRole(const CallContext& call, const std::string& actor, Role role);
    Result<uint32_t> revokeRole(const CallContext& call, const std::string& actor, Role role);
    Result<bool> hasRole(const CallContext& call, const std::string& actor, Role role);

    // Credits the caller.
    Result<Stake> deposit(const CallContext& call, double amount);
    Result<Stake> getStake(const CallContext& call, const std::string& actor);

    Result<std::string> submitRating(const CallContext& call, const std::string& target,
                                     const std::string& dimension, double value,
                                     const std::string& evidence, int64_t timestamp);
    Result<std::string> initiateDispute(const CallContext& call, const std::string& ratingId,
                                        const std::string& reason);
    Result<Dispute> resolveDispute(const CallContext& call, const std::string& disputeId,
                                   const std::string& verdict, const std::string& notes);

    Result<ReputationView> getReputation(const CallContext& call, const std::string& actor,
                                         const std::string& dimension, int64_t now,
                                         double confidence = 0.95);
    Result<std::vector<ReputationView>> batchGetReputations(const CallContext& call,
                                                            const std::vector<std::string>& actors,
                                                            const std::string& dimension,
                                                            int64_t now);
    Result<std::vector<Rating>> getRatingHistory(const CallContext& call, const std::string& actor,
                                                 const std::string& dimension);
    Result<Rating> getRating(const CallContext& call, const std::string& ratingId);
    Result<Dispute> getDispute(const CallContext& call, const std::string& disputeId);
    Result<DisputeStats> getDisputeStats(const CallContext& call);
    Result<AgentProfile> getAgentProfile(const CallContext& call, const std::string& actor,
                                         int64_t now);
    // The caller is the prospective rater.
    Result<ImpactSimulation> simulateRatingImpact(const CallContext& call, const std::string& target,
                                                  const std::string& dimension, double value,
                                                  int64_t now);
    Result<std::vector<std::string>> getAllActors(const CallContext& call);
    Result<SystemMetrics> getSystemMetrics(const CallContext& call);
    Result<std::vector<AttackEvent>> getAttackEvents(const CallContext& call);
    Result<SystemMetrics> rebuildMetrics(const CallContext& call);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
