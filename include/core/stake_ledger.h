#pragma once

#include "core/state_store.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace stakerep {
namespace core {

struct Stake {
    std::string actorId;
    double available = 0.0;
    double locked = 0.0;
    int64_t lastUpdated = 0;

    double total() const { return available + locked; }
    std::string toJson() const;

    static std::string key(const std::string& actorId);
    std::vector<uint8_t> serialize() const;
    static std::optional<Stake> deserialize(const std::vector<uint8_t>& data);
};

class StakeLedger {
public:
    // Zero record when the actor never deposited. Nothing is staged.
    Result<Stake> get(TxContext& ctx, const std::string& actor) const;

    Result<Stake> deposit(TxContext& ctx, const std::string& actor, double amount) const;
    Result<Stake> lockForDispute(TxContext& ctx, const std::string& actor, double cost) const;
    Result<Stake> releaseLock(TxContext& ctx, const std::string& actor, double cost) const;

    // Removes `fraction` of the available balance. Returns the amount taken.
    Result<double> slash(TxContext& ctx, const std::string& actor, double fraction) const;

private:
    Result<void> save(TxContext& ctx, Stake& stake) const;
};

}
}
