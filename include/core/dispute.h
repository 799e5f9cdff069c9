#pragma once

#include "core/state_store.h"
#include "core/system_config.h"
#include "core/reputation.h"
#include "core/stake_ledger.h"
#include "core/rating.h"
#include "core/roles.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace stakerep {
namespace core {

enum class DisputeStatus : uint8_t {
    Pending = 0,
    Upheld = 1,
    Overturned = 2
};

const char* disputeStatusToString(DisputeStatus status);

// Accepts "upheld" or "overturned" (case-insensitive).
Result<DisputeStatus> parseVerdict(const std::string& verdict);

struct Dispute {
    std::string disputeId;
    std::string ratingId;
    std::string initiator;
    std::string raterId;
    std::string actorId;
    std::string dimension;
    // rater meta dimension at initiation; resolution does not depend on
    // later config changes
    std::string metaDimension;
    std::string reason;
    DisputeStatus status = DisputeStatus::Pending;
    std::string arbitrator;
    std::string notes;
    double lockedCost = 0.0;
    double slashedAmount = 0.0;
    int64_t createdTs = 0;
    int64_t resolvedTs = 0;

    bool isPending() const { return status == DisputeStatus::Pending; }
    std::string toJson() const;

    static std::string key(const std::string& disputeId);
    std::vector<uint8_t> serialize() const;
    static std::optional<Dispute> deserialize(const std::vector<uint8_t>& data);
};

struct DisputeOutcome {
    Dispute dispute;
    bool replay = false;
    double slashed = 0.0;
};

// "DIS-" followed by the first 8 bytes of sha256("ratingId:initiator") in hex.
std::string makeDisputeId(const std::string& ratingId, const std::string& initiator);

class DisputeMachine {
public:
    DisputeMachine(const ReputationStore& reputations, const StakeLedger& stakes,
                   const RatingPipeline& ratings, const RoleRegistry& roles);

    // Only the rated actor may dispute. Locks the dispute cost.
    Result<DisputeOutcome> initiate(TxContext& ctx, const SystemConfig& config,
                                    const std::string& ratingId, const std::string& reason) const;

    // Arbitrator only. Pending -> upheld | overturned, exactly once.
    Result<DisputeOutcome> resolve(TxContext& ctx, const SystemConfig& config,
                                   const std::string& disputeId, const std::string& verdict,
                                   const std::string& notes) const;

    Result<std::optional<Dispute>> find(TxContext& ctx, const std::string& disputeId) const;

private:
    const ReputationStore& reputations_;
    const StakeLedger& stakes_;
    const RatingPipeline& ratings_;
    const RoleRegistry& roles_;
};

}
}
