#include "core/dispute.h"
#include "crypto/crypto.h"
#include "utils/serialize.h"
#include "utils/utils.h"
#include "utils/logger.h"
#include <sstream>
#include <stdexcept>

namespace stakerep {
namespace core {

using utils::Formatter;

static const uint8_t DISPUTE_RECORD_VERSION = 2;
static const size_t DISPUTE_ID_BYTES = 8;

const char* disputeStatusToString(DisputeStatus status) {
    switch (status) {
        case DisputeStatus::Pending: return "pending";
        case DisputeStatus::Upheld: return "upheld";
        case DisputeStatus::Overturned: return "overturned";
        default: return "unknown";
    }
}

Result<DisputeStatus> parseVerdict(const std::string& verdict) {
    std::string v = Formatter::toLower(Formatter::trim(verdict));
    if (v == "upheld") return DisputeStatus::Upheld;
    if (v == "overturned") return DisputeStatus::Overturned;
    return makeError(ErrorCode::INVALID_INPUT, "Verdict must be upheld or overturned");
}

std::string Dispute::key(const std::string& disputeId) {
    return "DIS:" + disputeId;
}

std::string Dispute::toJson() const {
    std::ostringstream ss;
    ss << "{"
       << Formatter::formatJson("disputeId", disputeId) << ","
       << Formatter::formatJson("ratingId", ratingId) << ","
       << Formatter::formatJson("initiator", initiator) << ","
       << Formatter::formatJson("raterId", raterId) << ","
       << Formatter::formatJson("actorId", actorId) << ","
       << Formatter::formatJson("dimension", dimension) << ","
       << Formatter::formatJson("metaDimension", metaDimension) << ","
       << Formatter::formatJson("reason", reason) << ","
       << Formatter::formatJson("status", disputeStatusToString(status)) << ","
       << Formatter::formatJson("arbitrator", arbitrator) << ","
       << Formatter::formatJson("notes", notes) << ","
       << Formatter::formatJsonDouble("lockedCost", lockedCost) << ","
       << Formatter::formatJsonDouble("slashedAmount", slashedAmount) << ","
       << Formatter::formatJsonNumber("createdTs", createdTs) << ","
       << Formatter::formatJsonNumber("resolvedTs", resolvedTs)
       << "}";
    return ss.str();
}

std::vector<uint8_t> Dispute::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(DISPUTE_RECORD_VERSION);
    buf.writeString(disputeId);
    buf.writeString(ratingId);
    buf.writeString(initiator);
    buf.writeString(raterId);
    buf.writeString(actorId);
    buf.writeString(dimension);
    buf.writeString(metaDimension);
    buf.writeString(reason);
    buf.writeUint8(static_cast<uint8_t>(status));
    buf.writeString(arbitrator);
    buf.writeString(notes);
    buf.writeDouble(lockedCost);
    buf.writeDouble(slashedAmount);
    buf.writeInt64(createdTs);
    buf.writeInt64(resolvedTs);
    return buf.data();
}

std::optional<Dispute> Dispute::deserialize(const std::vector<uint8_t>& data) {
    try {
        utils::ByteBuffer buf(data);
        if (buf.readUint8() != DISPUTE_RECORD_VERSION) return std::nullopt;
        Dispute d;
        d.disputeId = buf.readString();
        d.ratingId = buf.readString();
        d.initiator = buf.readString();
        d.raterId = buf.readString();
        d.actorId = buf.readString();
        d.dimension = buf.readString();
        d.metaDimension = buf.readString();
        d.reason = buf.readString();
        uint8_t status = buf.readUint8();
        if (status > static_cast<uint8_t>(DisputeStatus::Overturned)) return std::nullopt;
        d.status = static_cast<DisputeStatus>(status);
        d.arbitrator = buf.readString();
        d.notes = buf.readString();
        d.lockedCost = buf.readDouble();
        d.slashedAmount = buf.readDouble();
        d.createdTs = buf.readInt64();
        d.resolvedTs = buf.readInt64();
        return d;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string makeDisputeId(const std::string& ratingId, const std::string& initiator) {
    crypto::Hash256 digest = crypto::sha256(ratingId + ":" + initiator);
    return "DIS-" + crypto::toHex(digest.data(), DISPUTE_ID_BYTES);
}

DisputeMachine::DisputeMachine(const ReputationStore& reputations, const StakeLedger& stakes,
                               const RatingPipeline& ratings, const RoleRegistry& roles)
    : reputations_(reputations), stakes_(stakes), ratings_(ratings), roles_(roles) {}

Result<std::optional<Dispute>> DisputeMachine::find(TxContext& ctx, const std::string& disputeId) const {
    return loadRecord<Dispute>(ctx.tx(), Dispute::key(disputeId));
}

Result<DisputeOutcome> DisputeMachine::initiate(TxContext& ctx, const SystemConfig& config,
                                                const std::string& ratingId,
                                                const std::string& reason) const {
    std::string id = Formatter::trim(ratingId);
    STAKEREP_CHECK(!id.empty(), ErrorCode::INVALID_INPUT, "Rating id is required");

    STAKEREP_TRY(rating, ratings_.find(ctx, id));
    if (!rating.value()) {
        return makeError(ErrorCode::RATING_NOT_FOUND, "Rating not found", id);
    }
    const Rating& r = *rating.value();

    const std::string& initiator = ctx.caller();
    if (initiator != r.actorId) {
        return makeError(ErrorCode::UNAUTHORIZED,
                         "Only the rated actor may dispute a rating", initiator);
    }

    DisputeOutcome outcome;
    std::string disputeId = makeDisputeId(id, initiator);

    STAKEREP_TRY(existing, find(ctx, disputeId));
    if (existing.value()) {
        LOG_DEBUG("Dispute " + disputeId + " already exists, returning it unchanged");
        outcome.dispute = *existing.value();
        outcome.replay = true;
        return outcome;
    }

    auto meta = config.metaDimensionFor(r.dimension);
    if (!meta) {
        return makeError(ErrorCode::NO_META_DIMENSION,
                         "No meta dimension mapped for " + r.dimension);
    }

    auto locked = stakes_.lockForDispute(ctx, initiator, config.disputeCost);
    if (locked.failed()) return locked.error();

    Dispute& d = outcome.dispute;
    d.disputeId = disputeId;
    d.ratingId = id;
    d.initiator = initiator;
    d.raterId = r.raterId;
    d.actorId = r.actorId;
    d.dimension = r.dimension;
    d.metaDimension = *meta;
    d.reason = reason;
    d.status = DisputeStatus::Pending;
    d.lockedCost = config.disputeCost;
    d.createdTs = ctx.now();

    auto put = storeRecord(ctx.tx(), Dispute::key(disputeId), d);
    if (put.failed()) return put.error();

    ctx.notify(topic::DISPUTE_INITIATED,
               "{" + Formatter::formatJson("disputeId", disputeId) + "," +
               Formatter::formatJson("ratingId", id) + "," +
               Formatter::formatJson("initiator", initiator) + "," +
               Formatter::formatJson("raterId", d.raterId) + "," +
               Formatter::formatJsonDouble("lockedCost", d.lockedCost) + "}");
    return outcome;
}

Result<DisputeOutcome> DisputeMachine::resolve(TxContext& ctx, const SystemConfig& config,
                                               const std::string& disputeId,
                                               const std::string& verdict,
                                               const std::string& notes) const {
    STAKEREP_TRY(status, parseVerdict(verdict));

    auto auth = roles_.requireRole(ctx, Role::Arbitrator);
    if (auth.failed()) return auth.error();

    std::string id = Formatter::trim(disputeId);
    STAKEREP_TRY(stored, find(ctx, id));
    if (!stored.value()) {
        return makeError(ErrorCode::DISPUTE_NOT_FOUND, "Dispute not found", id);
    }

    DisputeOutcome outcome;
    outcome.dispute = *stored.value();
    Dispute& d = outcome.dispute;
    if (!d.isPending()) {
        return makeError(ErrorCode::ALREADY_RESOLVED,
                         std::string("Dispute already ") + disputeStatusToString(d.status), id);
    }

    STAKEREP_TRY(rating, ratings_.find(ctx, d.ratingId));
    if (!rating.value()) {
        return makeError(ErrorCode::RATING_NOT_FOUND, "Disputed rating is missing", d.ratingId);
    }
    const Rating& r = *rating.value();

    // the rater was right when upheld, wrong when overturned
    bool upheld = status.value() == DisputeStatus::Upheld;
    auto metaUpdate = reputations_.update(ctx, config, r.raterId, d.metaDimension,
                                          upheld ? 1.0 : 0.0, 1.0, ctx.now());
    if (metaUpdate.failed()) return metaUpdate.error();

    if (!upheld) {
        auto reversed = reputations_.reverse(ctx, config, r.actorId, r.dimension, r.value, r.weight);
        if (reversed.failed()) return reversed.error();

        STAKEREP_TRY(slashed, stakes_.slash(ctx, r.raterId, config.slashFraction));
        outcome.slashed = slashed.value();
        d.slashedAmount = slashed.value();
    }

    auto released = stakes_.releaseLock(ctx, d.initiator, d.lockedCost);
    if (released.failed()) return released.error();

    d.status = status.value();
    d.arbitrator = ctx.caller();
    d.notes = notes;
    d.resolvedTs = ctx.now();

    auto put = storeRecord(ctx.tx(), Dispute::key(d.disputeId), d);
    if (put.failed()) return put.error();

    ctx.notify(topic::DISPUTE_RESOLVED,
               "{" + Formatter::formatJson("disputeId", d.disputeId) + "," +
               Formatter::formatJson("ratingId", d.ratingId) + "," +
               Formatter::formatJson("verdict", disputeStatusToString(d.status)) + "," +
               Formatter::formatJson("arbitrator", d.arbitrator) + "," +
               Formatter::formatJsonDouble("slashed", outcome.slashed) + "}");
    return outcome;
}

}
}
