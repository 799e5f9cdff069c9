#include "core/rating.h"
#include "core/identity.h"
#include "crypto/crypto.h"
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

static const uint8_t RATING_RECORD_VERSION = 1;
static const size_t RATING_ID_BYTES = 8;

std::string Rating::key(const std::string& ratingId) {
    return "RAT:" + ratingId;
}

std::string Rating::toJson() const {
    std::ostringstream ss;
    ss << "{"
       << Formatter::formatJson("ratingId", ratingId) << ","
       << Formatter::formatJson("raterId", raterId) << ","
       << Formatter::formatJson("actorId", actorId) << ","
       << Formatter::formatJson("dimension", dimension) << ","
       << Formatter::formatJsonDouble("value", value) << ","
       << Formatter::formatJsonDouble("weight", weight) << ","
       << Formatter::formatJson("evidence", evidence) << ","
       << Formatter::formatJsonNumber("timestamp", timestamp) << ","
       << Formatter::formatJson("txId", txId)
       << "}";
    return ss.str();
}

std::vector<uint8_t> Rating::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(RATING_RECORD_VERSION);
    buf.writeString(ratingId);
    buf.writeString(raterId);
    buf.writeString(actorId);
    buf.writeString(dimension);
    buf.writeDouble(value);
    buf.writeDouble(weight);
    buf.writeString(evidence);
    buf.writeInt64(timestamp);
    buf.writeString(txId);
    return buf.data();
}

std::optional<Rating> Rating::deserialize(const std::vector<uint8_t>& data) {
    try {
        utils::ByteBuffer buf(data);
        if (buf.readUint8() != RATING_RECORD_VERSION) return std::nullopt;
        Rating r;
        r.ratingId = buf.readString();
        r.raterId = buf.readString();
        r.actorId = buf.readString();
        r.dimension = buf.readString();
        r.value = buf.readDouble();
        r.weight = buf.readDouble();
        r.evidence = buf.readString();
        r.timestamp = buf.readInt64();
        r.txId = buf.readString();
        return r;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string makeRatingId(const std::string& rater, const std::string& target,
                         const std::string& dimension, int64_t timestamp) {
    std::string material = rater + ":" + target + ":" + dimension + ":" + std::to_string(timestamp);
    crypto::Hash256 digest = crypto::sha256(material);
    return "RAT-" + crypto::toHex(digest.data(), RATING_ID_BYTES);
}

RatingPipeline::RatingPipeline(const ReputationStore& reputations, const StakeLedger& stakes)
    : reputations_(reputations), stakes_(stakes) {}

Result<std::optional<Rating>> RatingPipeline::find(TxContext& ctx, const std::string& ratingId) const {
    return loadRecord<Rating>(ctx.tx(), Rating::key(ratingId));
}

Result<double> RatingPipeline::raterWeight(TxContext& ctx, const SystemConfig& config,
                                           const std::string& rater, const std::string& baseDimension,
                                           int64_t now) const {
    auto meta = config.metaDimensionFor(baseDimension);
    if (!meta) {
        return makeError(ErrorCode::NO_META_DIMENSION,
                         "No meta dimension mapped for " + baseDimension);
    }

    STAKEREP_TRY(stored, reputations_.find(ctx, rater, *meta));
    if (!stored.value()) {
        return config.minRaterWeight;
    }

    Reputation effective = applyDecay(*stored.value(), config, now);
    double n = effective.alpha + effective.beta;
    double multiplier = 1.0 + std::sqrt(n / (n + 10.0));
    double weight = effective.score() * multiplier;
    return std::clamp(weight, config.minRaterWeight, config.maxRaterWeight);
}

Result<RatingOutcome> RatingPipeline::submit(TxContext& ctx, const SystemConfig& config,
                                             const RatingRequest& request) const {
    const std::string& rater = ctx.caller();
    std::string target = normalizeIdentity(request.target);
    std::string dimension = Formatter::trim(request.dimension);

    STAKEREP_CHECK(!rater.empty(), ErrorCode::INVALID_INPUT, "Caller identity is required");
    STAKEREP_CHECK(!target.empty(), ErrorCode::INVALID_INPUT, "Target actor is required");
    STAKEREP_CHECK(!dimension.empty(), ErrorCode::INVALID_INPUT, "Dimension is required");
    STAKEREP_CHECK(request.timestamp > 0, ErrorCode::INVALID_INPUT, "Timestamp must be positive");
    STAKEREP_CHECK(std::isfinite(request.value) && request.value >= 0.0 && request.value <= 1.0,
                   ErrorCode::INVALID_VALUE, "Rating value must be in [0,1]");
    STAKEREP_CHECK(config.isValidDimension(dimension), ErrorCode::INVALID_DIMENSION,
                   "Unknown dimension " + dimension);
    STAKEREP_CHECK(rater != target, ErrorCode::SELF_RATING_FORBIDDEN,
                   "Actors cannot rate themselves");

    RatingOutcome outcome;
    outcome.ratingId = makeRatingId(rater, target, dimension, request.timestamp);

    STAKEREP_TRY(existing, find(ctx, outcome.ratingId));
    if (existing.value()) {
        LOG_DEBUG("Duplicate rating " + outcome.ratingId + " ignored");
        outcome.duplicate = true;
        outcome.weight = existing.value()->weight;
        return outcome;
    }

    STAKEREP_TRY(stake, stakes_.get(ctx, rater));
    if (stake.value().available < config.minStake) {
        return makeError(ErrorCode::INSUFFICIENT_STAKE,
                         "Available stake " + Formatter::formatDouble(stake.value().available, 2) +
                         " is below the minimum " + Formatter::formatDouble(config.minStake, 2),
                         rater);
    }

    STAKEREP_TRY(weight, raterWeight(ctx, config, rater, dimension, request.timestamp));

    Rating rating;
    rating.ratingId = outcome.ratingId;
    rating.raterId = rater;
    rating.actorId = target;
    rating.dimension = dimension;
    rating.value = request.value;
    rating.weight = weight.value();
    rating.evidence = request.evidence;
    rating.timestamp = request.timestamp;
    rating.txId = ctx.txId();

    auto put = storeRecord(ctx.tx(), Rating::key(rating.ratingId), rating);
    if (put.failed()) return put.error();

    STAKEREP_TRY(updated, reputations_.update(ctx, config, target, dimension, request.value,
                                              rating.weight, request.timestamp));

    outcome.weight = rating.weight;
    outcome.newScore = updated.value().score();
    outcome.totalEvents = updated.value().totalEvents;
    outcome.rating = rating;

    ctx.notify(topic::RATING_SUBMITTED,
               "{" + Formatter::formatJson("ratingId", rating.ratingId) + "," +
               Formatter::formatJson("raterId", rater) + "," +
               Formatter::formatJson("actorId", target) + "," +
               Formatter::formatJson("dimension", dimension) + "," +
               Formatter::formatJsonDouble("value", rating.value) + "," +
               Formatter::formatJsonDouble("weight", rating.weight) + "," +
               Formatter::formatJsonDouble("newScore", outcome.newScore) + "," +
               Formatter::formatJsonNumber("totalEvents", static_cast<int64_t>(outcome.totalEvents)) +
               "}");
    return outcome;
}

}
}
