#pragma once

#include "core/state_store.h"
#include "core/system_config.h"
#include "core/reputation.h"
#include "core/stake_ledger.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace stakerep {
namespace core {

struct Rating {
    std::string ratingId;
    std::string raterId;
    std::string actorId;
    std::string dimension;
    double value = 0.0;
    double weight = 0.0;
    std::string evidence;
    int64_t timestamp = 0;
    std::string txId;

    std::string toJson() const;

    static std::string key(const std::string& ratingId);
    std::vector<uint8_t> serialize() const;
    static std::optional<Rating> deserialize(const std::vector<uint8_t>& data);
};

struct RatingRequest {
    std::string target;
    std::string dimension;
    double value = 0.0;
    std::string evidence;
    int64_t timestamp = 0;
};

struct RatingOutcome {
    std::string ratingId;
    bool duplicate = false;
    double weight = 0.0;
    double newScore = 0.0;
    uint64_t totalEvents = 0;
    // stored record; unset for duplicates
    Rating rating;
};

// "RAT-" followed by the first 8 bytes of sha256("rater:target:dimension:ts") in hex.
std::string makeRatingId(const std::string& rater, const std::string& target,
                         const std::string& dimension, int64_t timestamp);

class RatingPipeline {
public:
    RatingPipeline(const ReputationStore& reputations, const StakeLedger& stakes);

    // The rater is the normalized caller of `ctx`.
    Result<RatingOutcome> submit(TxContext& ctx, const SystemConfig& config,
                                 const RatingRequest& request) const;

    // Influence of `rater` on ratings in `baseDimension`, derived from the
    // rater's own reputation in the mapped meta dimension.
    Result<double> raterWeight(TxContext& ctx, const SystemConfig& config,
                               const std::string& rater, const std::string& baseDimension,
                               int64_t now) const;

    Result<std::optional<Rating>> find(TxContext& ctx, const std::string& ratingId) const;

private:
    const ReputationStore& reputations_;
    const StakeLedger& stakes_;
};

}
}
