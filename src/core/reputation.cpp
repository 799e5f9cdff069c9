#include "core/reputation.h"
#include "utils/serialize.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace stakerep {
namespace core {

static const uint8_t REPUTATION_RECORD_VERSION = 1;

// Variance of Beta(1,1), the largest a Beta distribution with alpha, beta >= 1 reaches.
static const double MAX_BETA_VARIANCE = 1.0 / 12.0;

double Reputation::score() const {
    double n = alpha + beta;
    if (n <= 0.0) return 0.5;
    return alpha / n;
}

std::string Reputation::key(const std::string& actorId, const std::string& dimension) {
    return "REP:" + actorId + ":" + dimension;
}

std::vector<uint8_t> Reputation::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(REPUTATION_RECORD_VERSION);
    buf.writeString(actorId);
    buf.writeString(dimension);
    buf.writeDouble(alpha);
    buf.writeDouble(beta);
    buf.writeUint64(totalEvents);
    buf.writeInt64(lastTs);
    return buf.data();
}

std::optional<Reputation> Reputation::deserialize(const std::vector<uint8_t>& data) {
    try {
        utils::ByteBuffer buf(data);
        if (buf.readUint8() != REPUTATION_RECORD_VERSION) return std::nullopt;
        Reputation r;
        r.actorId = buf.readString();
        r.dimension = buf.readString();
        r.alpha = buf.readDouble();
        r.beta = buf.readDouble();
        r.totalEvents = buf.readUint64();
        r.lastTs = buf.readInt64();
        return r;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Reputation priorReputation(const SystemConfig& config, const std::string& actor,
                           const std::string& dimension) {
    Reputation r;
    r.actorId = actor;
    r.dimension = dimension;
    r.alpha = config.initialAlpha;
    r.beta = config.initialBeta;
    return r;
}

double betaVariance(double alpha, double beta) {
    double n = alpha + beta;
    if (n <= 0.0) return MAX_BETA_VARIANCE;
    return (alpha * beta) / (n * n * (n + 1.0));
}

Reputation applyDecay(const Reputation& rep, const SystemConfig& config, int64_t now) {
    Reputation out = rep;
    double elapsed = static_cast<double>(std::max<int64_t>(0, now - rep.lastTs));
    if (elapsed > 0.0 && config.decayPeriod > 0) {
        double normVar = std::clamp(betaVariance(rep.alpha, rep.beta) / MAX_BETA_VARIANCE, 0.0, 1.0);
        double adaptiveRate = std::pow(config.decayRate, 1.0 + normVar);
        double factor = std::pow(adaptiveRate, elapsed / static_cast<double>(config.decayPeriod));
        out.alpha = rep.alpha * factor;
        out.beta = rep.beta * factor;
    }
    out.alpha = std::max(out.alpha, config.initialAlpha);
    out.beta = std::max(out.beta, config.initialBeta);
    return out;
}

Result<WilsonBounds> wilsonInterval(double alpha, double beta, double confidence) {
    double z = 0.0;
    if (std::fabs(confidence - 0.95) < 1e-9) {
        z = 1.96;
    } else if (std::fabs(confidence - 0.99) < 1e-9) {
        z = 2.576;
    } else {
        return makeError(ErrorCode::INVALID_INPUT, "Unsupported confidence level");
    }

    STAKEREP_CHECK(std::isfinite(alpha) && std::isfinite(beta) && alpha >= 0.0 && beta >= 0.0 &&
                   alpha + beta > 0.0, ErrorCode::INVALID_INPUT, "Invalid Beta parameters");

    double n = alpha + beta;
    double p = alpha / n;
    double z2 = z * z;
    double denom = 1.0 + z2 / n;
    double center = (p + z2 / (2.0 * n)) / denom;
    double margin = (z / denom) * std::sqrt(p * (1.0 - p) / n + z2 / (4.0 * n * n));

    WilsonBounds bounds;
    bounds.lower = std::clamp(center - margin, 0.0, 1.0);
    bounds.upper = std::clamp(center + margin, 0.0, 1.0);
    return bounds;
}

Result<std::optional<Reputation>> ReputationStore::find(TxContext& ctx, const std::string& actor,
                                                        const std::string& dimension) const {
    return loadRecord<Reputation>(ctx.tx(), Reputation::key(actor, dimension));
}

Result<Reputation> ReputationStore::getOrInit(TxContext& ctx, const SystemConfig& config,
                                              const std::string& actor,
                                              const std::string& dimension) const {
    STAKEREP_TRY(stored, find(ctx, actor, dimension));
    if (stored.value()) return *stored.value();
    return priorReputation(config, actor, dimension);
}

Result<Reputation> ReputationStore::update(TxContext& ctx, const SystemConfig& config,
                                           const std::string& actor, const std::string& dimension,
                                           double value, double weight, int64_t now) const {
    STAKEREP_CHECK(std::isfinite(value) && value >= 0.0 && value <= 1.0,
                   ErrorCode::INVALID_VALUE, "Rating value must be in [0,1]");
    STAKEREP_CHECK(std::isfinite(weight) && weight >= 0.0,
                   ErrorCode::INVALID_INPUT, "Weight must be finite and non-negative");

    STAKEREP_TRY(current, getOrInit(ctx, config, actor, dimension));
    Reputation rep = applyDecay(current.value(), config, now);

    if (value >= 0.5) {
        rep.alpha += weight * value;
    } else {
        rep.beta += weight * (1.0 - value);
    }
    rep.totalEvents += 1;
    rep.lastTs = std::max(rep.lastTs, now);

    auto put = storeRecord(ctx.tx(), Reputation::key(actor, dimension), rep);
    if (put.failed()) return put.error();
    return rep;
}

Result<Reputation> ReputationStore::reverse(TxContext& ctx, const SystemConfig& config,
                                            const std::string& actor, const std::string& dimension,
                                            double value, double weight) const {
    STAKEREP_TRY(current, getOrInit(ctx, config, actor, dimension));
    Reputation rep = current.value();

    if (value >= 0.5) {
        rep.alpha = std::max(config.initialAlpha, rep.alpha - weight * value);
    } else {
        rep.beta = std::max(config.initialBeta, rep.beta - weight * (1.0 - value));
    }
    if (rep.totalEvents > 0) rep.totalEvents -= 1;

    auto put = storeRecord(ctx.tx(), Reputation::key(actor, dimension), rep);
    if (put.failed()) return put.error();
    return rep;
}

}
}
