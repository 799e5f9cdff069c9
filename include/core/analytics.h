#pragma once

#include "core/state_store.h"
#include "core/system_config.h"
#include "core/reputation.h"
#include "core/stake_ledger.h"
#include "core/rating.h"
#include "core/dispute.h"
#include "core/roles.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace stakerep {
namespace core {

struct ReputationView {
    std::string actorId;
    std::string dimension;
    double alpha = 0.0;
    double beta = 0.0;
    double score = 0.0;
    double lower = 0.0;
    double upper = 1.0;
    double confidenceLevel = 0.95;
    // 1 - 1/(1 + totalEvents)
    double confidence = 0.0;
    uint64_t totalEvents = 0;
    int64_t lastUpdated = 0;

    std::string toJson() const;
};

struct DisputeStats {
    uint64_t total = 0;
    uint64_t pending = 0;
    uint64_t resolved = 0;
    uint64_t upheld = 0;
    uint64_t overturned = 0;
    double avgResolutionSeconds = 0.0;
    double upheldRate = 0.0;
    double overturnedRate = 0.0;

    std::string toJson() const;
};

struct AgentProfile {
    std::string actorId;
    std::vector<ReputationView> reputations;
    Stake stake;
    uint64_t ratingsGiven = 0;
    uint64_t ratingsReceived = 0;
    uint64_t disputesInitiated = 0;
    uint64_t disputesAgainst = 0;

    std::string toJson() const;
};

struct ImpactSimulation {
    double currentScore = 0.0;
    double predictedScore = 0.0;
    double scoreDelta = 0.0;
    double raterWeight = 0.0;

    std::string toJson() const;
};

// Telemetry counters. Rebuildable from the authoritative records.
struct SystemMetrics {
    uint64_t totalRatings = 0;
    uint64_t totalDisputes = 0;
    uint64_t disputesUpheld = 0;
    uint64_t disputesOverturned = 0;
    double totalStakeSlashed = 0.0;
    int64_t lastUpdated = 0;

    std::string toJson() const;

    static const char* KEY;
    std::vector<uint8_t> serialize() const;
    static std::optional<SystemMetrics> deserialize(const std::vector<uint8_t>& data);
};

struct MetricsDelta {
    uint64_t ratings = 0;
    uint64_t disputes = 0;
    uint64_t upheld = 0;
    uint64_t overturned = 0;
    double slashed = 0.0;

    bool empty() const {
        return ratings == 0 && disputes == 0 && upheld == 0 && overturned == 0 && slashed == 0.0;
    }
};

Result<SystemMetrics> applyMetricsDelta(Transaction& tx, const MetricsDelta& delta, int64_t now);

// Suspicious rating pattern, kept for offline analysis. Never affects scores.
struct AttackEvent {
    std::string eventId;
    std::string eventType;
    std::vector<std::string> actorIds;
    std::string ratingId;
    double confidence = 0.0;
    std::string description;
    int64_t timestamp = 0;

    std::string toJson() const;

    static std::string key(const std::string& eventId);
    std::vector<uint8_t> serialize() const;
    static std::optional<AttackEvent> deserialize(const std::vector<uint8_t>& data);
};

namespace attack {
constexpr const char* POTENTIAL_SYBIL = "potential_sybil";
}

// A rater with fewer than NEW_RATER_EVENTS events of their own in the rated
// dimension giving a value below 0.1 or above 0.9.
constexpr uint64_t NEW_RATER_EVENTS = 5;

// "ATK-" followed by the first 8 bytes of sha256("type:ratingId") in hex.
std::string makeAttackEventId(const std::string& eventType, const std::string& ratingId);

std::optional<AttackEvent> detectRatingAnomaly(const Reputation& raterRecord, const Rating& rating);

// Stages an event for `rating` when one is detected and none is stored yet.
Result<std::optional<AttackEvent>> recordRatingAnomaly(Transaction& tx, const Rating& rating);

class Analytics {
public:
    Analytics(const ReputationStore& reputations, const StakeLedger& stakes,
              const RatingPipeline& ratings, const RoleRegistry& roles);

    Result<ReputationView> reputation(TxContext& ctx, const SystemConfig& config,
                                      const std::string& actor, const std::string& dimension,
                                      int64_t now, double confidence = 0.95) const;

    // Blank entries are skipped; invalid ones fail the whole batch.
    Result<std::vector<ReputationView>> batchReputations(TxContext& ctx, const SystemConfig& config,
                                                         const std::vector<std::string>& actors,
                                                         const std::string& dimension,
                                                         int64_t now) const;

    // Ratings received by `actor`, oldest first. An empty dimension matches all.
    Result<std::vector<Rating>> ratingHistory(TxContext& ctx, const std::string& actor,
                                              const std::string& dimension) const;

    Result<DisputeStats> disputeStats(TxContext& ctx) const;

    Result<AgentProfile> agentProfile(TxContext& ctx, const SystemConfig& config,
                                      const std::string& actor, int64_t now) const;

    Result<ImpactSimulation> simulateRatingImpact(TxContext& ctx, const SystemConfig& config,
                                                  const std::string& target,
                                                  const std::string& dimension,
                                                  double value, int64_t now) const;

    // Distinct actors holding at least one reputation record, sorted.
    Result<std::vector<std::string>> allActors(TxContext& ctx) const;

    Result<SystemMetrics> metrics(TxContext& ctx) const;

    // Oldest first.
    Result<std::vector<AttackEvent>> attackEvents(TxContext& ctx) const;

    // Admin only. Recounts from ratings and disputes and stages the result.
    Result<SystemMetrics> rebuildMetrics(TxContext& ctx) const;

private:
    const ReputationStore& reputations_;
    const StakeLedger& stakes_;
    const RatingPipeline& ratings_;
    const RoleRegistry& roles_;
};

}
}
