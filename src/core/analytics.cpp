#include "core/analytics.h"
#include "core/identity.h"
#include "crypto/crypto.h"
#include "utils/serialize.h"
#include "utils/utils.h"
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>

namespace stakerep {
namespace core {

using utils::Formatter;

static const uint8_t METRICS_RECORD_VERSION = 1;
static const uint8_t ATTACK_RECORD_VERSION = 1;
static const size_t ATTACK_ID_BYTES = 8;
static const double SYBIL_CONFIDENCE = 0.6;

const char* SystemMetrics::KEY = "MET:global";

std::string ReputationView::toJson() const {
    std::ostringstream ss;
    ss << "{"
       << Formatter::formatJson("actorId", actorId) << ","
       << Formatter::formatJson("dimension", dimension) << ","
       << Formatter::formatJsonDouble("alpha", alpha) << ","
       << Formatter::formatJsonDouble("beta", beta) << ","
       << Formatter::formatJsonDouble("score", score) << ","
       << "\"confidenceInterval\":{"
       << Formatter::formatJsonDouble("level", confidenceLevel) << ","
       << Formatter::formatJsonDouble("lower", lower) << ","
       << Formatter::formatJsonDouble("upper", upper) << "},"
       << Formatter::formatJsonDouble("confidence", confidence) << ","
       << Formatter::formatJsonNumber("totalEvents", static_cast<int64_t>(totalEvents)) << ","
       << Formatter::formatJsonNumber("lastUpdated", lastUpdated)
       << "}";
    return ss.str();
}

std::string DisputeStats::toJson() const {
    std::ostringstream ss;
    ss << "{"
       << Formatter::formatJsonNumber("totalDisputes", static_cast<int64_t>(total)) << ","
       << Formatter::formatJsonNumber("pending", static_cast<int64_t>(pending)) << ","
       << Formatter::formatJsonNumber("resolved", static_cast<int64_t>(resolved)) << ","
       << Formatter::formatJsonNumber("upheld", static_cast<int64_t>(upheld)) << ","
       << Formatter::formatJsonNumber("overturned", static_cast<int64_t>(overturned)) << ","
       << Formatter::formatJsonDouble("avgResolutionTimeSec", avgResolutionSeconds) << ","
       << Formatter::formatJsonDouble("upheldRate", upheldRate) << ","
       << Formatter::formatJsonDouble("overturnedRate", overturnedRate)
       << "}";
    return ss.str();
}

std::string AgentProfile::toJson() const {
    std::ostringstream ss;
    ss << "{" << Formatter::formatJson("actorId", actorId) << ",\"reputations\":{";
    for (size_t i = 0; i < reputations.size(); i++) {
        if (i > 0) ss << ",";
        ss << "\"" << Formatter::escapeJson(reputations[i].dimension) << "\":" << reputations[i].toJson();
    }
    ss << "},\"stake\":" << stake.toJson() << ","
       << Formatter::formatJsonNumber("ratingsGiven", static_cast<int64_t>(ratingsGiven)) << ","
       << Formatter::formatJsonNumber("ratingsReceived", static_cast<int64_t>(ratingsReceived)) << ","
       << Formatter::formatJsonNumber("disputesInitiated", static_cast<int64_t>(disputesInitiated)) << ","
       << Formatter::formatJsonNumber("disputesAgainst", static_cast<int64_t>(disputesAgainst))
       << "}";
    return ss.str();
}

std::string ImpactSimulation::toJson() const {
    std::ostringstream ss;
    ss << "{"
       << Formatter::formatJsonDouble("currentScore", currentScore) << ","
       << Formatter::formatJsonDouble("predictedScore", predictedScore) << ","
       << Formatter::formatJsonDouble("scoreDelta", scoreDelta) << ","
       << Formatter::formatJsonDouble("raterWeight", raterWeight)
       << "}";
    return ss.str();
}

std::string SystemMetrics::toJson() const {
    std::ostringstream ss;
    ss << "{"
       << Formatter::formatJsonNumber("totalRatings", static_cast<int64_t>(totalRatings)) << ","
       << Formatter::formatJsonNumber("totalDisputes", static_cast<int64_t>(totalDisputes)) << ","
       << Formatter::formatJsonNumber("disputesUpheld", static_cast<int64_t>(disputesUpheld)) << ","
       << Formatter::formatJsonNumber("disputesOverturned", static_cast<int64_t>(disputesOverturned)) << ","
       << Formatter::formatJsonDouble("totalStakeSlashed", totalStakeSlashed) << ","
       << Formatter::formatJsonNumber("lastUpdated", lastUpdated)
       << "}";
    return ss.str();
}

std::vector<uint8_t> SystemMetrics::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(METRICS_RECORD_VERSION);
    buf.writeUint64(totalRatings);
    buf.writeUint64(totalDisputes);
    buf.writeUint64(disputesUpheld);
    buf.writeUint64(disputesOverturned);
    buf.writeDouble(totalStakeSlashed);
    buf.writeInt64(lastUpdated);
    return buf.data();
}

std::optional<SystemMetrics> SystemMetrics::deserialize(const std::vector<uint8_t>& data) {
    try {
        utils::ByteBuffer buf(data);
        if (buf.readUint8() != METRICS_RECORD_VERSION) return std::nullopt;
        SystemMetrics m;
        m.totalRatings = buf.readUint64();
        m.totalDisputes = buf.readUint64();
        m.disputesUpheld = buf.readUint64();
        m.disputesOverturned = buf.readUint64();
        m.totalStakeSlashed = buf.readDouble();
        m.lastUpdated = buf.readInt64();
        return m;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Result<SystemMetrics> applyMetricsDelta(Transaction& tx, const MetricsDelta& delta, int64_t now) {
    STAKEREP_TRY(stored, loadRecord<SystemMetrics>(tx, SystemMetrics::KEY));
    SystemMetrics m = stored.value().value_or(SystemMetrics{});
    m.totalRatings += delta.ratings;
    m.totalDisputes += delta.disputes;
    m.disputesUpheld += delta.upheld;
    m.disputesOverturned += delta.overturned;
    m.totalStakeSlashed += delta.slashed;
    m.lastUpdated = std::max(m.lastUpdated, now);

    auto put = storeRecord(tx, SystemMetrics::KEY, m);
    if (put.failed()) return put.error();
    return m;
}

std::string AttackEvent::toJson() const {
    std::vector<std::string> quoted;
    for (const auto& id : actorIds) {
        quoted.push_back("\"" + Formatter::escapeJson(id) + "\"");
    }
    std::ostringstream ss;
    ss << "{"
       << Formatter::formatJson("eventId", eventId) << ","
       << Formatter::formatJson("eventType", eventType) << ","
       << "\"actorIds\":[" << Formatter::join(quoted, ",") << "],"
       << Formatter::formatJson("ratingId", ratingId) << ","
       << Formatter::formatJsonDouble("confidence", confidence) << ","
       << Formatter::formatJson("description", description) << ","
       << Formatter::formatJsonNumber("timestamp", timestamp)
       << "}";
    return ss.str();
}

std::string AttackEvent::key(const std::string& eventId) {
    return "ATK:" + eventId;
}

std::vector<uint8_t> AttackEvent::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(ATTACK_RECORD_VERSION);
    buf.writeString(eventId);
    buf.writeString(eventType);
    buf.writeStringList(actorIds);
    buf.writeString(ratingId);
    buf.writeDouble(confidence);
    buf.writeString(description);
    buf.writeInt64(timestamp);
    return buf.data();
}

std::optional<AttackEvent> AttackEvent::deserialize(const std::vector<uint8_t>& data) {
    try {
        utils::ByteBuffer buf(data);
        if (buf.readUint8() != ATTACK_RECORD_VERSION) return std::nullopt;
        AttackEvent e;
        e.eventId = buf.readString();
        e.eventType = buf.readString();
        e.actorIds = buf.readStringList();
        e.ratingId = buf.readString();
        e.confidence = buf.readDouble();
        e.description = buf.readString();
        e.timestamp = buf.readInt64();
        return e;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string makeAttackEventId(const std::string& eventType, const std::string& ratingId) {
    crypto::Hash256 digest = crypto::sha256(eventType + ":" + ratingId);
    return "ATK-" + crypto::toHex(digest.data(), ATTACK_ID_BYTES);
}

std::optional<AttackEvent> detectRatingAnomaly(const Reputation& raterRecord, const Rating& rating) {
    if (raterRecord.totalEvents >= NEW_RATER_EVENTS) return std::nullopt;
    if (rating.value >= 0.1 && rating.value <= 0.9) return std::nullopt;

    AttackEvent e;
    e.eventType = attack::POTENTIAL_SYBIL;
    e.eventId = makeAttackEventId(e.eventType, rating.ratingId);
    e.actorIds = {rating.raterId, rating.actorId};
    e.ratingId = rating.ratingId;
    e.confidence = SYBIL_CONFIDENCE;
    e.description = "New rater giving extreme rating";
    e.timestamp = rating.timestamp;
    return e;
}

Result<std::optional<AttackEvent>> recordRatingAnomaly(Transaction& tx, const Rating& rating) {
    STAKEREP_TRY(raterRecord, loadRecord<Reputation>(tx, Reputation::key(rating.raterId, rating.dimension)));
    Reputation rater = raterRecord.value().value_or(Reputation{});

    std::optional<AttackEvent> event = detectRatingAnomaly(rater, rating);
    if (!event) return event;

    auto existing = tx.get(AttackEvent::key(event->eventId));
    if (existing.failed()) return existing.error();
    if (existing.value()) return std::optional<AttackEvent>();

    auto put = storeRecord(tx, AttackEvent::key(event->eventId), *event);
    if (put.failed()) return put.error();
    return event;
}

Analytics::Analytics(const ReputationStore& reputations, const StakeLedger& stakes,
                     const RatingPipeline& ratings, const RoleRegistry& roles)
    : reputations_(reputations), stakes_(stakes), ratings_(ratings), roles_(roles) {}

Result<ReputationView> Analytics::reputation(TxContext& ctx, const SystemConfig& config,
                                             const std::string& actor, const std::string& dimension,
                                             int64_t now, double confidence) const {
    std::string id = normalizeIdentity(actor);
    std::string dim = Formatter::trim(dimension);
    STAKEREP_CHECK(!id.empty(), ErrorCode::INVALID_INPUT, "Actor is required");
    STAKEREP_CHECK(!dim.empty(), ErrorCode::INVALID_INPUT, "Dimension is required");
    STAKEREP_CHECK(config.isValidDimension(dim) || config.isMetaDimension(dim),
                   ErrorCode::INVALID_DIMENSION, "Unknown dimension " + dim);

    STAKEREP_TRY(stored, reputations_.getOrInit(ctx, config, id, dim));
    Reputation effective = applyDecay(stored.value(), config, now);

    STAKEREP_TRY(bounds, wilsonInterval(effective.alpha, effective.beta, confidence));

    ReputationView view;
    view.actorId = id;
    view.dimension = dim;
    view.alpha = effective.alpha;
    view.beta = effective.beta;
    view.score = effective.score();
    view.lower = bounds.value().lower;
    view.upper = bounds.value().upper;
    view.confidenceLevel = confidence;
    view.totalEvents = effective.totalEvents;
    view.confidence = 1.0 - 1.0 / (1.0 + static_cast<double>(effective.totalEvents));
    view.lastUpdated = effective.lastTs;
    return view;
}

Result<std::vector<ReputationView>> Analytics::batchReputations(TxContext& ctx, const SystemConfig& config,
                                                                const std::vector<std::string>& actors,
                                                                const std::string& dimension,
                                                                int64_t now) const {
    std::vector<ReputationView> views;
    for (const auto& actor : actors) {
        if (Formatter::trim(actor).empty()) continue;
        STAKEREP_TRY(view, reputation(ctx, config, actor, dimension, now));
        views.push_back(view.value());
    }
    return views;
}

Result<std::vector<Rating>> Analytics::ratingHistory(TxContext& ctx, const std::string& actor,
                                                     const std::string& dimension) const {
    std::string id = normalizeIdentity(actor);
    std::string dim = Formatter::trim(dimension);
    STAKEREP_CHECK(!id.empty(), ErrorCode::INVALID_INPUT, "Actor is required");

    STAKEREP_TRY(all, scanRecords<Rating>(ctx.tx(), Rating::key("")));
    std::vector<Rating> history;
    for (const auto& r : all.value()) {
        if (r.actorId != id) continue;
        if (!dim.empty() && r.dimension != dim) continue;
        history.push_back(r);
    }
    std::stable_sort(history.begin(), history.end(), [](const Rating& a, const Rating& b) {
        return a.timestamp < b.timestamp;
    });
    return history;
}

Result<DisputeStats> Analytics::disputeStats(TxContext& ctx) const {
    STAKEREP_TRY(all, scanRecords<Dispute>(ctx.tx(), Dispute::key("")));

    DisputeStats stats;
    int64_t totalResolution = 0;
    for (const auto& d : all.value()) {
        stats.total++;
        if (d.isPending()) {
            stats.pending++;
            continue;
        }
        stats.resolved++;
        if (d.status == DisputeStatus::Upheld) stats.upheld++;
        if (d.status == DisputeStatus::Overturned) stats.overturned++;
        totalResolution += std::max<int64_t>(0, d.resolvedTs - d.createdTs);
    }

    if (stats.resolved > 0) {
        double resolved = static_cast<double>(stats.resolved);
        stats.avgResolutionSeconds = static_cast<double>(totalResolution) / resolved;
        stats.upheldRate = static_cast<double>(stats.upheld) / resolved;
        stats.overturnedRate = static_cast<double>(stats.overturned) / resolved;
    }
    return stats;
}

Result<AgentProfile> Analytics::agentProfile(TxContext& ctx, const SystemConfig& config,
                                             const std::string& actor, int64_t now) const {
    AgentProfile profile;
    profile.actorId = normalizeIdentity(actor);
    STAKEREP_CHECK(!profile.actorId.empty(), ErrorCode::INVALID_INPUT, "Actor is required");

    for (const auto& dim : config.validDimensions) {
        STAKEREP_TRY(view, reputation(ctx, config, profile.actorId, dim, now));
        profile.reputations.push_back(view.value());
    }

    STAKEREP_TRY(stake, stakes_.get(ctx, profile.actorId));
    profile.stake = stake.value();

    STAKEREP_TRY(ratings, scanRecords<Rating>(ctx.tx(), Rating::key("")));
    for (const auto& r : ratings.value()) {
        if (r.raterId == profile.actorId) profile.ratingsGiven++;
        if (r.actorId == profile.actorId) profile.ratingsReceived++;
    }

    STAKEREP_TRY(disputes, scanRecords<Dispute>(ctx.tx(), Dispute::key("")));
    for (const auto& d : disputes.value()) {
        if (d.initiator == profile.actorId) profile.disputesInitiated++;
        if (d.raterId == profile.actorId) profile.disputesAgainst++;
    }
    return profile;
}

Result<ImpactSimulation> Analytics::simulateRatingImpact(TxContext& ctx, const SystemConfig& config,
                                                         const std::string& target,
                                                         const std::string& dimension,
                                                         double value, int64_t now) const {
    STAKEREP_CHECK(std::isfinite(value) && value >= 0.0 && value <= 1.0,
                   ErrorCode::INVALID_VALUE, "Rating value must be in [0,1]");
    std::string dim = Formatter::trim(dimension);
    STAKEREP_CHECK(config.isValidDimension(dim), ErrorCode::INVALID_DIMENSION,
                   "Unknown dimension " + dim);

    STAKEREP_TRY(current, reputation(ctx, config, target, dim, now));
    STAKEREP_TRY(weight, ratings_.raterWeight(ctx, config, ctx.caller(), dim, now));

    double alpha = current.value().alpha;
    double beta = current.value().beta;
    if (value >= 0.5) {
        alpha += weight.value() * value;
    } else {
        beta += weight.value() * (1.0 - value);
    }

    ImpactSimulation sim;
    sim.currentScore = current.value().score;
    sim.predictedScore = alpha / (alpha + beta);
    sim.scoreDelta = sim.predictedScore - sim.currentScore;
    sim.raterWeight = weight.value();
    return sim;
}

Result<std::vector<std::string>> Analytics::allActors(TxContext& ctx) const {
    STAKEREP_TRY(reps, scanRecords<Reputation>(ctx.tx(), "REP:"));
    std::set<std::string> actors;
    for (const auto& r : reps.value()) {
        actors.insert(r.actorId);
    }
    return std::vector<std::string>(actors.begin(), actors.end());
}

Result<SystemMetrics> Analytics::metrics(TxContext& ctx) const {
    STAKEREP_TRY(stored, loadRecord<SystemMetrics>(ctx.tx(), SystemMetrics::KEY));
    return stored.value().value_or(SystemMetrics{});
}

Result<std::vector<AttackEvent>> Analytics::attackEvents(TxContext& ctx) const {
    STAKEREP_TRY(events, scanRecords<AttackEvent>(ctx.tx(), AttackEvent::key("")));
    std::vector<AttackEvent> sorted = std::move(events.value());
    std::sort(sorted.begin(), sorted.end(), [](const AttackEvent& a, const AttackEvent& b) {
        if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
        return a.eventId < b.eventId;
    });
    return sorted;
}

Result<SystemMetrics> Analytics::rebuildMetrics(TxContext& ctx) const {
    auto auth = roles_.requireRole(ctx, Role::Admin);
    if (auth.failed()) return auth.error();

    SystemMetrics m;
    STAKEREP_TRY(ratings, scanRecords<Rating>(ctx.tx(), Rating::key("")));
    m.totalRatings = ratings.value().size();

    STAKEREP_TRY(disputes, scanRecords<Dispute>(ctx.tx(), Dispute::key("")));
    for (const auto& d : disputes.value()) {
        m.totalDisputes++;
        if (d.status == DisputeStatus::Upheld) m.disputesUpheld++;
        if (d.status == DisputeStatus::Overturned) m.disputesOverturned++;
        m.totalStakeSlashed += d.slashedAmount;
    }
    m.lastUpdated = ctx.now();

    auto put = storeRecord(ctx.tx(), SystemMetrics::KEY, m);
    if (put.failed()) return put.error();
    return m;
}

}
}
