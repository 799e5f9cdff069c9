#include "core/system_config.h"
#include "core/roles.h"
#include "utils/serialize.h"
#include "utils/utils.h"
#include "utils/logger.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace stakerep {
namespace core {

using utils::Formatter;

static const uint8_t CONFIG_RECORD_VERSION = 1;

const char* SystemConfig::KEY = "CFG:system";

SystemConfig SystemConfig::defaults() {
    SystemConfig cfg;
    cfg.validDimensions = {"quality", "delivery", "compliance", "warranty"};
    for (const auto& dim : cfg.validDimensions) {
        cfg.metaDimensions[dim] = "rater_" + dim;
    }
    return cfg;
}

SystemConfig SystemConfig::fromEngineConfig(const utils::EngineConfig& engine) {
    SystemConfig cfg = defaults();
    cfg.minStake = engine.minStake;
    cfg.disputeCost = engine.disputeCost;
    cfg.slashFraction = engine.slashFraction;
    cfg.decayRate = engine.decayRate;
    cfg.decayPeriod = engine.decayPeriod;
    cfg.initialAlpha = engine.initialAlpha;
    cfg.initialBeta = engine.initialBeta;
    cfg.minRaterWeight = engine.minRaterWeight;
    cfg.maxRaterWeight = engine.maxRaterWeight;
    return cfg;
}

bool SystemConfig::isValidDimension(const std::string& dimension) const {
    return std::find(validDimensions.begin(), validDimensions.end(), dimension) != validDimensions.end();
}

bool SystemConfig::isMetaDimension(const std::string& dimension) const {
    for (const auto& [base, meta] : metaDimensions) {
        if (meta == dimension) return true;
    }
    return false;
}

std::optional<std::string> SystemConfig::metaDimensionFor(const std::string& base) const {
    auto it = metaDimensions.find(base);
    if (it == metaDimensions.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

std::string SystemConfig::toJson() const {
    std::ostringstream ss;
    ss << "{"
       << Formatter::formatJsonDouble("minStake", minStake) << ","
       << Formatter::formatJsonDouble("disputeCost", disputeCost) << ","
       << Formatter::formatJsonDouble("slashFraction", slashFraction) << ","
       << Formatter::formatJsonDouble("decayRate", decayRate) << ","
       << Formatter::formatJsonNumber("decayPeriod", decayPeriod) << ","
       << Formatter::formatJsonDouble("initialAlpha", initialAlpha) << ","
       << Formatter::formatJsonDouble("initialBeta", initialBeta) << ","
       << Formatter::formatJsonDouble("minRaterWeight", minRaterWeight) << ","
       << Formatter::formatJsonDouble("maxRaterWeight", maxRaterWeight) << ","
       << "\"validDimensions\":[";
    for (size_t i = 0; i < validDimensions.size(); i++) {
        if (i > 0) ss << ",";
        ss << "\"" << Formatter::escapeJson(validDimensions[i]) << "\"";
    }
    ss << "],\"metaDimensions\":{";
    bool first = true;
    for (const auto& [base, meta] : metaDimensions) {
        if (!first) ss << ",";
        first = false;
        ss << Formatter::formatJson(base, meta);
    }
    ss << "},"
       << Formatter::formatJsonNumber("version", static_cast<int64_t>(version)) << ","
       << Formatter::formatJsonNumber("lastUpdated", lastUpdated)
       << "}";
    return ss.str();
}

std::vector<uint8_t> SystemConfig::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(CONFIG_RECORD_VERSION);
    buf.writeDouble(minStake);
    buf.writeDouble(disputeCost);
    buf.writeDouble(slashFraction);
    buf.writeDouble(decayRate);
    buf.writeInt64(decayPeriod);
    buf.writeDouble(initialAlpha);
    buf.writeDouble(initialBeta);
    buf.writeDouble(minRaterWeight);
    buf.writeDouble(maxRaterWeight);
    buf.writeStringList(validDimensions);
    buf.writeVarInt(metaDimensions.size());
    for (const auto& [base, meta] : metaDimensions) {
        buf.writeString(base);
        buf.writeString(meta);
    }
    buf.writeUint64(version);
    buf.writeInt64(lastUpdated);
    return buf.data();
}

std::optional<SystemConfig> SystemConfig::deserialize(const std::vector<uint8_t>& data) {
    try {
        utils::ByteBuffer buf(data);
        if (buf.readUint8() != CONFIG_RECORD_VERSION) return std::nullopt;
        SystemConfig cfg;
        cfg.minStake = buf.readDouble();
        cfg.disputeCost = buf.readDouble();
        cfg.slashFraction = buf.readDouble();
        cfg.decayRate = buf.readDouble();
        cfg.decayPeriod = buf.readInt64();
        cfg.initialAlpha = buf.readDouble();
        cfg.initialBeta = buf.readDouble();
        cfg.minRaterWeight = buf.readDouble();
        cfg.maxRaterWeight = buf.readDouble();
        cfg.validDimensions = buf.readStringList();
        uint64_t metaCount = buf.readVarInt();
        for (uint64_t i = 0; i < metaCount; i++) {
            std::string base = buf.readString();
            cfg.metaDimensions[base] = buf.readString();
        }
        cfg.version = buf.readUint64();
        cfg.lastUpdated = buf.readInt64();
        return cfg;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static bool inUnitRange(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

Result<void> validateConfig(const SystemConfig& c) {
    STAKEREP_CHECK(std::isfinite(c.minStake) && c.minStake >= 0.0,
                   ErrorCode::INVALID_CONFIG, "minStake must be finite and non-negative");
    STAKEREP_CHECK(std::isfinite(c.disputeCost) && c.disputeCost >= 0.0,
                   ErrorCode::INVALID_CONFIG, "disputeCost must be finite and non-negative");
    STAKEREP_CHECK(inUnitRange(c.slashFraction), ErrorCode::INVALID_CONFIG,
                   "slashFraction must be in [0,1]");
    STAKEREP_CHECK(inUnitRange(c.decayRate), ErrorCode::INVALID_CONFIG,
                   "decayRate must be in [0,1]");
    STAKEREP_CHECK(c.decayPeriod > 0, ErrorCode::INVALID_CONFIG, "decayPeriod must be positive");
    STAKEREP_CHECK(std::isfinite(c.initialAlpha) && c.initialAlpha > 0.0,
                   ErrorCode::INVALID_CONFIG, "initialAlpha must be positive");
    STAKEREP_CHECK(std::isfinite(c.initialBeta) && c.initialBeta > 0.0,
                   ErrorCode::INVALID_CONFIG, "initialBeta must be positive");
    STAKEREP_CHECK(std::isfinite(c.minRaterWeight) && c.minRaterWeight > 0.0,
                   ErrorCode::INVALID_CONFIG, "minRaterWeight must be positive");
    STAKEREP_CHECK(std::isfinite(c.maxRaterWeight) && c.maxRaterWeight >= c.minRaterWeight,
                   ErrorCode::INVALID_CONFIG, "maxRaterWeight must be at least minRaterWeight");
    STAKEREP_CHECK(!c.validDimensions.empty(), ErrorCode::INVALID_CONFIG,
                   "At least one dimension is required");

    for (size_t i = 0; i < c.validDimensions.size(); i++) {
        const std::string& dim = c.validDimensions[i];
        STAKEREP_CHECK(!dim.empty(), ErrorCode::INVALID_CONFIG, "Empty dimension name");
        STAKEREP_CHECK(std::find(c.validDimensions.begin() + i + 1, c.validDimensions.end(), dim) ==
                       c.validDimensions.end(), ErrorCode::INVALID_CONFIG,
                       "Duplicate dimension " + dim);
        auto meta = c.metaDimensionFor(dim);
        STAKEREP_CHECK(meta.has_value(), ErrorCode::INVALID_CONFIG,
                       "Dimension " + dim + " has no meta dimension");
        STAKEREP_CHECK(!c.isValidDimension(*meta), ErrorCode::INVALID_CONFIG,
                       "Meta dimension " + *meta + " is also a base dimension");
    }
    return {};
}

ConfigStore::ConfigStore(const SystemConfig& defaults, const RoleRegistry& roles)
    : defaults_(defaults), roles_(roles) {}

Result<SystemConfig> ConfigStore::get(TxContext& ctx) const {
    auto stored = loadRecord<SystemConfig>(ctx.tx(), SystemConfig::KEY);
    if (stored.failed()) return stored.error();
    if (stored.value()) return *stored.value();

    // defaults come from the config file and have not been checked yet
    auto valid = validateConfig(defaults_);
    if (valid.failed()) return valid.error();

    SystemConfig cfg = defaults_;
    cfg.version = 1;
    cfg.lastUpdated = ctx.now();
    auto put = storeRecord(ctx.tx(), SystemConfig::KEY, cfg);
    if (put.failed()) return put.error();
    LOG_DEBUG("System config auto-initialized");
    return cfg;
}

Result<SystemConfig> ConfigStore::init(TxContext& ctx, const SystemConfig& config) const {
    auto auth = roles_.requireRole(ctx, Role::Admin);
    if (auth.failed()) return auth.error();

    auto valid = validateConfig(config);
    if (valid.failed()) return valid.error();

    auto stored = ctx.tx().get(SystemConfig::KEY);
    if (stored.failed()) return stored.error();
    if (stored.value()) {
        return makeError(ErrorCode::ALREADY_EXISTS, "System config already initialized");
    }

    SystemConfig cfg = config;
    cfg.version = 1;
    cfg.lastUpdated = ctx.now();
    auto put = storeRecord(ctx.tx(), SystemConfig::KEY, cfg);
    if (put.failed()) return put.error();

    ctx.notify(topic::CONFIG_UPDATED, "{\"action\":\"init\",\"config\":" + cfg.toJson() + "}");
    return cfg;
}

Result<SystemConfig> ConfigStore::update(TxContext& ctx, const SystemConfig& config) const {
    auto auth = roles_.requireRole(ctx, Role::Admin);
    if (auth.failed()) return auth.error();

    auto valid = validateConfig(config);
    if (valid.failed()) return valid.error();

    auto current = get(ctx);
    if (current.failed()) return current.error();

    SystemConfig cfg = config;
    cfg.version = current.value().version + 1;
    cfg.lastUpdated = ctx.now();
    auto put = storeRecord(ctx.tx(), SystemConfig::KEY, cfg);
    if (put.failed()) return put.error();

    ctx.notify(topic::CONFIG_UPDATED,
               "{\"action\":\"update\"," +
               Formatter::formatJsonNumber("previousVersion", static_cast<int64_t>(current.value().version)) +
               ",\"config\":" + cfg.toJson() + "}");
    return cfg;
}

Result<SystemConfig> ConfigStore::addDimension(TxContext& ctx, const std::string& base,
                                               const std::string& meta) const {
    auto auth = roles_.requireRole(ctx, Role::Admin);
    if (auth.failed()) return auth.error();

    std::string b = Formatter::trim(base);
    std::string m = Formatter::trim(meta);
    STAKEREP_CHECK(!b.empty() && !m.empty(), ErrorCode::INVALID_INPUT,
                   "Dimension names must be non-empty");
    STAKEREP_CHECK(b != m, ErrorCode::INVALID_INPUT, "Base and meta dimension must differ");

    auto current = get(ctx);
    if (current.failed()) return current.error();
    SystemConfig cfg = current.value();

    STAKEREP_CHECK(!cfg.isValidDimension(m), ErrorCode::INVALID_INPUT,
                   "Meta dimension " + m + " is already a base dimension");
    STAKEREP_CHECK(!cfg.isMetaDimension(b), ErrorCode::INVALID_INPUT,
                   "Dimension " + b + " is already used as a meta dimension");

    if (!cfg.isValidDimension(b)) cfg.validDimensions.push_back(b);
    cfg.metaDimensions[b] = m;
    cfg.version = current.value().version + 1;
    cfg.lastUpdated = ctx.now();

    auto put = storeRecord(ctx.tx(), SystemConfig::KEY, cfg);
    if (put.failed()) return put.error();

    ctx.notify(topic::DIMENSION_ADDED,
               "{" + Formatter::formatJson("dimension", b) + "," +
               Formatter::formatJson("metaDimension", m) + "," +
               Formatter::formatJsonNumber("version", static_cast<int64_t>(cfg.version)) + "}");
    return cfg;
}

}
}
