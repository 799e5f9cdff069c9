#pragma once

#include "core/state_store.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace stakerep {
namespace core {

class RoleRegistry;

struct SystemConfig {
    double minStake = 1000.0;
    double disputeCost = 100.0;
    double slashFraction = 0.30;
    double decayRate = 0.98;
    int64_t decayPeriod = 86400;
    double initialAlpha = 2.0;
    double initialBeta = 2.0;
    double minRaterWeight = 0.1;
    double maxRaterWeight = 5.0;
    std::vector<std::string> validDimensions;
    std::map<std::string, std::string> metaDimensions;
    uint64_t version = 0;
    int64_t lastUpdated = 0;

    static SystemConfig defaults();
    static SystemConfig fromEngineConfig(const utils::EngineConfig& engine);

    bool isValidDimension(const std::string& dimension) const;
    bool isMetaDimension(const std::string& dimension) const;
    std::optional<std::string> metaDimensionFor(const std::string& base) const;

    std::string toJson() const;

    static const char* KEY;
    std::vector<uint8_t> serialize() const;
    static std::optional<SystemConfig> deserialize(const std::vector<uint8_t>& data);
};

Result<void> validateConfig(const SystemConfig& config);

class ConfigStore {
public:
    ConfigStore(const SystemConfig& defaults, const RoleRegistry& roles);

    // Creates and stages the default record when none is stored yet.
    Result<SystemConfig> get(TxContext& ctx) const;
    Result<SystemConfig> init(TxContext& ctx, const SystemConfig& config) const;
    Result<SystemConfig> update(TxContext& ctx, const SystemConfig& config) const;
    Result<SystemConfig> addDimension(TxContext& ctx, const std::string& base,
                                      const std::string& meta) const;

    const SystemConfig& defaults() const { return defaults_; }

private:
    SystemConfig defaults_;
    const RoleRegistry& roles_;
};

}
}
