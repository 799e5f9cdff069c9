#include "core/stake_ledger.h"
#include "utils/serialize.h"
#include "utils/utils.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace stakerep {
namespace core {

using utils::Formatter;

static const uint8_t STAKE_RECORD_VERSION = 1;

std::string Stake::key(const std::string& actorId) {
    return "STK:" + actorId;
}

std::string Stake::toJson() const {
    std::ostringstream ss;
    ss << "{"
       << Formatter::formatJson("actorId", actorId) << ","
       << Formatter::formatJsonDouble("available", available) << ","
       << Formatter::formatJsonDouble("locked", locked) << ","
       << Formatter::formatJsonDouble("total", total()) << ","
       << Formatter::formatJsonNumber("lastUpdated", lastUpdated)
       << "}";
    return ss.str();
}

std::vector<uint8_t> Stake::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(STAKE_RECORD_VERSION);
    buf.writeString(actorId);
    buf.writeDouble(available);
    buf.writeDouble(locked);
    buf.writeInt64(lastUpdated);
    return buf.data();
}

std::optional<Stake> Stake::deserialize(const std::vector<uint8_t>& data) {
    try {
        utils::ByteBuffer buf(data);
        if (buf.readUint8() != STAKE_RECORD_VERSION) return std::nullopt;
        Stake s;
        s.actorId = buf.readString();
        s.available = buf.readDouble();
        s.locked = buf.readDouble();
        s.lastUpdated = buf.readInt64();
        return s;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Result<Stake> StakeLedger::get(TxContext& ctx, const std::string& actor) const {
    auto stored = loadRecord<Stake>(ctx.tx(), Stake::key(actor));
    if (stored.failed()) return stored.error();
    if (stored.value()) return *stored.value();
    Stake s;
    s.actorId = actor;
    return s;
}

Result<void> StakeLedger::save(TxContext& ctx, Stake& stake) const {
    stake.lastUpdated = ctx.now();
    return storeRecord(ctx.tx(), Stake::key(stake.actorId), stake);
}

Result<Stake> StakeLedger::deposit(TxContext& ctx, const std::string& actor, double amount) const {
    STAKEREP_CHECK(!actor.empty(), ErrorCode::INVALID_INPUT, "Actor is required");
    STAKEREP_CHECK(std::isfinite(amount) && amount > 0.0, ErrorCode::INVALID_AMOUNT,
                   "Deposit amount must be a positive finite number");

    STAKEREP_TRY(current, get(ctx, actor));
    Stake s = current.value();
    s.available += amount;

    auto put = save(ctx, s);
    if (put.failed()) return put.error();

    ctx.notify(topic::STAKE_DEPOSITED,
               "{" + Formatter::formatJson("actorId", actor) + "," +
               Formatter::formatJsonDouble("amount", amount) + "," +
               Formatter::formatJsonDouble("available", s.available) + "}");
    return s;
}

Result<Stake> StakeLedger::lockForDispute(TxContext& ctx, const std::string& actor, double cost) const {
    STAKEREP_CHECK(std::isfinite(cost) && cost >= 0.0, ErrorCode::INVALID_AMOUNT,
                   "Lock amount must be finite and non-negative");

    STAKEREP_TRY(current, get(ctx, actor));
    Stake s = current.value();
    if (s.available < cost) {
        return makeError(ErrorCode::INSUFFICIENT_STAKE,
                         "Available stake " + Formatter::formatDouble(s.available, 2) +
                         " is below the dispute cost " + Formatter::formatDouble(cost, 2),
                         actor);
    }

    s.available -= cost;
    s.locked += cost;
    auto put = save(ctx, s);
    if (put.failed()) return put.error();
    return s;
}

Result<Stake> StakeLedger::releaseLock(TxContext& ctx, const std::string& actor, double cost) const {
    STAKEREP_CHECK(std::isfinite(cost) && cost >= 0.0, ErrorCode::INVALID_AMOUNT,
                   "Release amount must be finite and non-negative");

    STAKEREP_TRY(current, get(ctx, actor));
    Stake s = current.value();
    double amount = std::min(cost, s.locked);
    s.locked -= amount;
    s.available += amount;

    auto put = save(ctx, s);
    if (put.failed()) return put.error();
    return s;
}

Result<double> StakeLedger::slash(TxContext& ctx, const std::string& actor, double fraction) const {
    STAKEREP_CHECK(std::isfinite(fraction) && fraction >= 0.0 && fraction <= 1.0,
                   ErrorCode::INVALID_AMOUNT, "Slash fraction must be in [0,1]");

    STAKEREP_TRY(current, get(ctx, actor));
    Stake s = current.value();
    double slashed = s.available * fraction;
    s.available = std::max(0.0, s.available - slashed);

    auto put = save(ctx, s);
    if (put.failed()) return put.error();

    if (slashed > 0.0) {
        ctx.notify(topic::STAKE_SLASHED,
                   "{" + Formatter::formatJson("actorId", actor) + "," +
                   Formatter::formatJsonDouble("slashed", slashed) + "," +
                   Formatter::formatJsonDouble("available", s.available) + "}");
    }
    return slashed;
}

}
}
