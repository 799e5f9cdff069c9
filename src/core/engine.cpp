#include "core/engine.h"
#include "core/identity.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <optional>

namespace stakerep {
namespace core {

using utils::Formatter;

EngineOptions EngineOptions::fromConfig(const utils::Config& config) {
    utils::EngineConfig engine = config.getEngineConfig();
    EngineOptions options;
    options.defaults = SystemConfig::fromEngineConfig(engine);
    options.admins = engine.admins;
    options.arbitrators = engine.arbitrators;
    return options;
}

// Follow-up work derived from a committed call, applied best-effort in its
// own transaction.
struct Telemetry {
    MetricsDelta metrics;
    std::optional<Rating> rating;
};

struct ReputationEngine::Impl {
    StateStore& store;
    NotificationSink* sink;
    RoleRegistry roles;
    ConfigStore configs;
    ReputationStore reputations;
    StakeLedger stakes;
    RatingPipeline ratings;
    DisputeMachine disputes;
    Analytics analytics;

    Impl(StateStore& s, NotificationSink* n, const EngineOptions& options)
        : store(s), sink(n),
          roles(options.admins, options.arbitrators),
          configs(options.defaults, roles),
          ratings(reputations, stakes),
          disputes(reputations, stakes, ratings, roles),
          analytics(reputations, stakes, ratings, roles) {}

    template<typename T, typename Fn>
    Result<T> write(const char* op, const CallContext& call, Fn&& fn);

    template<typename T, typename Fn>
    Result<T> query(const char* op, const CallContext& call, Fn&& fn);

    Error reject(const char* op, const CallContext& call, const Error& error);
    void publish(const TxContext& ctx);
    void recordMetrics(const CallContext& call, const MetricsDelta& delta);
    void recordAnomalies(const Rating& rating);
};

template<typename T, typename Fn>
Result<T> ReputationEngine::Impl::write(const char* op, const CallContext& call, Fn&& fn) {
    std::unique_ptr<Transaction> tx = store.begin();
    if (!tx) {
        return reject(op, call, makeError(ErrorCode::DATABASE_ERROR, "State store unavailable"));
    }

    TxContext ctx(*tx, call);
    Telemetry telemetry;
    Result<T> result = fn(ctx, telemetry);
    if (result.failed()) {
        tx->abort();
        return reject(op, call, result.error());
    }

    auto committed = tx->commit();
    if (committed.failed()) {
        return reject(op, call, committed.error());
    }

    LOG_INFO(std::string(op) + " committed tx=" + call.txId +
             " caller=" + utils::Logger::redactCredential(ctx.caller()));
    publish(ctx);
    recordMetrics(call, telemetry.metrics);
    if (telemetry.rating) recordAnomalies(*telemetry.rating);
    return result;
}

template<typename T, typename Fn>
Result<T> ReputationEngine::Impl::query(const char* op, const CallContext& call, Fn&& fn) {
    std::unique_ptr<Transaction> tx = store.begin();
    if (!tx) {
        return reject(op, call, makeError(ErrorCode::DATABASE_ERROR, "State store unavailable"));
    }

    TxContext ctx(*tx, call);
    Result<T> result = fn(ctx);
    tx->abort();
    if (result.failed()) {
        return reject(op, call, result.error());
    }
    return result;
}

Error ReputationEngine::Impl::reject(const char* op, const CallContext& call, const Error& error) {
    ErrorHandler::instance().handle(error);

    std::string msg = std::string(op) + " rejected tx=" + call.txId + " [" +
                      errorToString(error.code) + "] " + error.message;
    if (!error.context.empty()) msg += " (" + utils::Logger::redactCredential(error.context) + ")";

    ErrorCategory category = errorCategory(error.code);
    if (category == ErrorCategory::StorageConflict || category == ErrorCategory::Internal) {
        LOG_WARN(msg);
    } else {
        LOG_DEBUG(msg);
    }
    return error;
}

void ReputationEngine::Impl::publish(const TxContext& ctx) {
    if (!sink) return;
    for (const auto& [topic, payload] : ctx.pendingNotifications()) {
        sink->emit(topic, payload);
    }
}

void ReputationEngine::Impl::recordMetrics(const CallContext& call, const MetricsDelta& delta) {
    if (delta.empty()) return;

    std::unique_ptr<Transaction> tx = store.begin();
    if (!tx) {
        LOG_WARN("Metrics update skipped: state store unavailable");
        return;
    }
    auto applied = applyMetricsDelta(*tx, delta, call.timestamp);
    if (applied.failed()) {
        tx->abort();
        LOG_WARN("Metrics update failed: " + applied.error().message);
        return;
    }
    auto committed = tx->commit();
    if (committed.failed()) {
        LOG_WARN(std::string("Metrics update not committed: ") + errorToString(committed.code()));
    }
}

void ReputationEngine::Impl::recordAnomalies(const Rating& rating) {
    using utils::LogLevel;
    std::unique_ptr<Transaction> tx = store.begin();
    if (!tx) {
        LOG_CAT(LogLevel::WARN, "anomaly", "Check skipped: state store unavailable");
        return;
    }
    auto recorded = recordRatingAnomaly(*tx, rating);
    if (recorded.failed()) {
        tx->abort();
        LOG_CAT(LogLevel::WARN, "anomaly", "Check failed: " + recorded.error().message);
        return;
    }
    if (!recorded.value()) {
        tx->abort();
        return;
    }
    auto committed = tx->commit();
    if (committed.failed()) {
        LOG_CAT(LogLevel::WARN, "anomaly",
                std::string("Event not committed: ") + errorToString(committed.code()));
        return;
    }
    const AttackEvent& event = *recorded.value();
    LOG_CAT(LogLevel::WARN, "anomaly", event.eventType + " " + event.eventId + " rating=" +
            rating.ratingId + " rater=" + utils::Logger::redactCredential(rating.raterId));
}

ReputationEngine::ReputationEngine(StateStore& store, NotificationSink* sink, const EngineOptions& options)
    : impl_(std::make_unique<Impl>(store, sink, options)) {
    auto valid = validateConfig(options.defaults);
    if (valid.failed()) {
        LOG_ERROR("Default engine config rejected: " + valid.error().message +
                  "; calls fail until a valid config is stored");
    }
}

ReputationEngine::~ReputationEngine() = default;

Result<SystemConfig> ReputationEngine::bootstrap(const CallContext& call) {
    return impl_->write<SystemConfig>("bootstrap", call,
        [&](TxContext& ctx, Telemetry&) -> Result<SystemConfig> {
            return impl_->configs.get(ctx);
        });
}

Result<SystemConfig> ReputationEngine::getConfig(const CallContext& call) {
    return impl_->query<SystemConfig>("getConfig", call,
        [&](TxContext& ctx) -> Result<SystemConfig> {
            return impl_->configs.get(ctx);
        });
}

Result<SystemConfig> ReputationEngine::initConfig(const CallContext& call, const SystemConfig& config) {
    return impl_->write<SystemConfig>("initConfig", call,
        [&](TxContext& ctx, Telemetry&) -> Result<SystemConfig> {
            return impl_->configs.init(ctx, config);
        });
}

Result<SystemConfig> ReputationEngine::updateConfig(const CallContext& call, const SystemConfig& config) {
    return impl_->write<SystemConfig>("updateConfig", call,
        [&](TxContext& ctx, Telemetry&) -> Result<SystemConfig> {
            return impl_->configs.update(ctx, config);
        });
}

Result<SystemConfig> ReputationEngine::addDimension(const CallContext& call, const std::string& base,
                                                   const std::string& meta) {
    return impl_->write<SystemConfig>("addDimension", call,
        [&](TxContext& ctx, Telemetry&) -> Result<SystemConfig> {
            return impl_->configs.addDimension(ctx, base, meta);
        });
}

Result<uint32_t> ReputationEngine::grantRole(const CallContext& call, const std::string& actor, Role role) {
    return impl_->write<uint32_t>("grantRole", call,
        [&](TxContext& ctx, Telemetry&) -> Result<uint32_t> {
            return impl_->roles.grant(ctx, actor, role);
        });
}

Result<uint32_t> ReputationEngine::revokeRole(const CallContext& call, const std::string& actor, Role role) {
    return impl_->write<uint32_t>("revokeRole", call,
        [&](TxContext& ctx, Telemetry&) -> Result<uint32_t> {
            return impl_->roles.revoke(ctx, actor, role);
        });
}

Result<bool> ReputationEngine::hasRole(const CallContext& call, const std::string& actor, Role role) {
    return impl_->query<bool>("hasRole", call,
        [&](TxContext& ctx) -> Result<bool> {
            return impl_->roles.hasRole(ctx, actor, role);
        });
}

Result<Stake> ReputationEngine::deposit(const CallContext& call, double amount) {
    return impl_->write<Stake>("deposit", call,
        [&](TxContext& ctx, Telemetry&) -> Result<Stake> {
            STAKEREP_CHECK(!ctx.caller().empty(), ErrorCode::INVALID_INPUT, "Caller identity is required");
            return impl_->stakes.deposit(ctx, ctx.caller(), amount);
        });
}

Result<Stake> ReputationEngine::getStake(const CallContext& call, const std::string& actor) {
    return impl_->query<Stake>("getStake", call,
        [&](TxContext& ctx) -> Result<Stake> {
            std::string id = normalizeIdentity(actor);
            STAKEREP_CHECK(!id.empty(), ErrorCode::INVALID_INPUT, "Actor is required");
            return impl_->stakes.get(ctx, id);
        });
}

Result<std::string> ReputationEngine::submitRating(const CallContext& call, const std::string& target,
                                                   const std::string& dimension, double value,
                                                   const std::string& evidence, int64_t timestamp) {
    return impl_->write<std::string>("submitRating", call,
        [&](TxContext& ctx, Telemetry& telemetry) -> Result<std::string> {
            STAKEREP_TRY(config, impl_->configs.get(ctx));

            RatingRequest request;
            request.target = target;
            request.dimension = dimension;
            request.value = value;
            request.evidence = evidence;
            request.timestamp = timestamp;

            STAKEREP_TRY(outcome, impl_->ratings.submit(ctx, config.value(), request));
            if (!outcome.value().duplicate) {
                telemetry.metrics.ratings = 1;
                telemetry.rating = outcome.value().rating;
            }
            return outcome.value().ratingId;
        });
}

Result<std::string> ReputationEngine::initiateDispute(const CallContext& call, const std::string& ratingId,
                                                      const std::string& reason) {
    return impl_->write<std::string>("initiateDispute", call,
        [&](TxContext& ctx, Telemetry& telemetry) -> Result<std::string> {
            STAKEREP_TRY(config, impl_->configs.get(ctx));
            STAKEREP_TRY(outcome, impl_->disputes.initiate(ctx, config.value(), ratingId, reason));
            if (!outcome.value().replay) telemetry.metrics.disputes = 1;
            return outcome.value().dispute.disputeId;
        });
}

Result<Dispute> ReputationEngine::resolveDispute(const CallContext& call, const std::string& disputeId,
                                                 const std::string& verdict, const std::string& notes) {
    return impl_->write<Dispute>("resolveDispute", call,
        [&](TxContext& ctx, Telemetry& telemetry) -> Result<Dispute> {
            STAKEREP_TRY(config, impl_->configs.get(ctx));
            STAKEREP_TRY(outcome, impl_->disputes.resolve(ctx, config.value(), disputeId, verdict, notes));
            const Dispute& d = outcome.value().dispute;
            if (d.status == DisputeStatus::Upheld) telemetry.metrics.upheld = 1;
            if (d.status == DisputeStatus::Overturned) telemetry.metrics.overturned = 1;
            telemetry.metrics.slashed = outcome.value().slashed;
            return d;
        });
}

Result<ReputationView> ReputationEngine::getReputation(const CallContext& call, const std::string& actor,
                                                       const std::string& dimension, int64_t now,
                                                       double confidence) {
    return impl_->query<ReputationView>("getReputation", call,
        [&](TxContext& ctx) -> Result<ReputationView> {
            STAKEREP_TRY(config, impl_->configs.get(ctx));
            return impl_->analytics.reputation(ctx, config.value(), actor, dimension, now, confidence);
        });
}

Result<std::vector<ReputationView>> ReputationEngine::batchGetReputations(
        const CallContext& call, const std::vector<std::string>& actors,
        const std::string& dimension, int64_t now) {
    return impl_->query<std::vector<ReputationView>>("batchGetReputations", call,
        [&](TxContext& ctx) -> Result<std::vector<ReputationView>> {
            STAKEREP_TRY(config, impl_->configs.get(ctx));
            return impl_->analytics.batchReputations(ctx, config.value(), actors, dimension, now);
        });
}

Result<std::vector<Rating>> ReputationEngine::getRatingHistory(const CallContext& call,
                                                               const std::string& actor,
                                                               const std::string& dimension) {
    return impl_->query<std::vector<Rating>>("getRatingHistory", call,
        [&](TxContext& ctx) -> Result<std::vector<Rating>> {
            return impl_->analytics.ratingHistory(ctx, actor, dimension);
        });
}

Result<Rating> ReputationEngine::getRating(const CallContext& call, const std::string& ratingId) {
    return impl_->query<Rating>("getRating", call,
        [&](TxContext& ctx) -> Result<Rating> {
            std::string id = Formatter::trim(ratingId);
            STAKEREP_TRY(found, impl_->ratings.find(ctx, id));
            if (!found.value()) return makeError(ErrorCode::RATING_NOT_FOUND, "Rating not found", id);
            return *found.value();
        });
}

Result<Dispute> ReputationEngine::getDispute(const CallContext& call, const std::string& disputeId) {
    return impl_->query<Dispute>("getDispute", call,
        [&](TxContext& ctx) -> Result<Dispute> {
            std::string id = Formatter::trim(disputeId);
            STAKEREP_TRY(found, impl_->disputes.find(ctx, id));
            if (!found.value()) return makeError(ErrorCode::DISPUTE_NOT_FOUND, "Dispute not found", id);
            return *found.value();
        });
}

Result<DisputeStats> ReputationEngine::getDisputeStats(const CallContext& call) {
    return impl_->query<DisputeStats>("getDisputeStats", call,
        [&](TxContext& ctx) -> Result<DisputeStats> {
            return impl_->analytics.disputeStats(ctx);
        });
}

Result<AgentProfile> ReputationEngine::getAgentProfile(const CallContext& call, const std::string& actor,
                                                       int64_t now) {
    return impl_->query<AgentProfile>("getAgentProfile", call,
        [&](TxContext& ctx) -> Result<AgentProfile> {
            STAKEREP_TRY(config, impl_->configs.get(ctx));
            return impl_->analytics.agentProfile(ctx, config.value(), actor, now);
        });
}

Result<ImpactSimulation> ReputationEngine::simulateRatingImpact(const CallContext& call,
                                                               const std::string& target,
                                                               const std::string& dimension,
                                                               double value, int64_t now) {
    return impl_->query<ImpactSimulation>("simulateRatingImpact", call,
        [&](TxContext& ctx) -> Result<ImpactSimulation> {
            STAKEREP_TRY(config, impl_->configs.get(ctx));
            return impl_->analytics.simulateRatingImpact(ctx, config.value(), target, dimension, value, now);
        });
}

Result<std::vector<std::string>> ReputationEngine::getAllActors(const CallContext& call) {
    return impl_->query<std::vector<std::string>>("getAllActors", call,
        [&](TxContext& ctx) -> Result<std::vector<std::string>> {
            return impl_->analytics.allActors(ctx);
        });
}

Result<SystemMetrics> ReputationEngine::getSystemMetrics(const CallContext& call) {
    return impl_->query<SystemMetrics>("getSystemMetrics", call,
        [&](TxContext& ctx) -> Result<SystemMetrics> {
            return impl_->analytics.metrics(ctx);
        });
}

Result<std::vector<AttackEvent>> ReputationEngine::getAttackEvents(const CallContext& call) {
    return impl_->query<std::vector<AttackEvent>>("getAttackEvents", call,
        [&](TxContext& ctx) -> Result<std::vector<AttackEvent>> {
            return impl_->analytics.attackEvents(ctx);
        });
}

Result<SystemMetrics> ReputationEngine::rebuildMetrics(const CallContext& call) {
    return impl_->write<SystemMetrics>("rebuildMetrics", call,
        [&](TxContext& ctx, Telemetry&) -> Result<SystemMetrics> {
            return impl_->analytics.rebuildMetrics(ctx);
        });
}

}
}
