#pragma once

#include "core/state_store.h"
#include "core/system_config.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace stakerep {
namespace core {

// Beta(alpha, beta) belief about one actor in one dimension.
struct Reputation {
    std::string actorId;
    std::string dimension;
    double alpha = 0.0;
    double beta = 0.0;
    uint64_t totalEvents = 0;
    int64_t lastTs = 0;

    double score() const;

    static std::string key(const std::string& actorId, const std::string& dimension);
    std::vector<uint8_t> serialize() const;
    static std::optional<Reputation> deserialize(const std::vector<uint8_t>& data);
};

struct WilsonBounds {
    double lower = 0.0;
    double upper = 1.0;
};

Reputation priorReputation(const SystemConfig& config, const std::string& actor,
                           const std::string& dimension);

double betaVariance(double alpha, double beta);

// View-time projection toward the prior. Thin or contested evidence
// (higher variance) decays faster. Never drops below the prior.
Reputation applyDecay(const Reputation& rep, const SystemConfig& config, int64_t now);

// Only 0.95 and 0.99 are supported; anything else is INVALID_INPUT.
Result<WilsonBounds> wilsonInterval(double alpha, double beta, double confidence);

class ReputationStore {
public:
    Result<std::optional<Reputation>> find(TxContext& ctx, const std::string& actor,
                                           const std::string& dimension) const;

    // Stored record or the prior. The prior is not staged.
    Result<Reputation> getOrInit(TxContext& ctx, const SystemConfig& config,
                                 const std::string& actor, const std::string& dimension) const;

    Result<Reputation> update(TxContext& ctx, const SystemConfig& config,
                              const std::string& actor, const std::string& dimension,
                              double value, double weight, int64_t now) const;

    // Removes a contribution previously added by update(). No decay; the
    // last-update timestamp is kept.
    Result<Reputation> reverse(TxContext& ctx, const SystemConfig& config,
                               const std::string& actor, const std::string& dimension,
                               double value, double weight) const;
};

}
}
