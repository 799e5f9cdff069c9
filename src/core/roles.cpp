#include "core/roles.h"
#include "core/identity.h"
#include "utils/serialize.h"
#include "utils/utils.h"
#include "utils/logger.h"
#include <stdexcept>

namespace stakerep {
namespace core {

static const uint8_t ROLE_RECORD_VERSION = 1;

const char* roleToString(Role role) {
    switch (role) {
        case Role::Admin: return "admin";
        case Role::Arbitrator: return "arbitrator";
        default: return "unknown";
    }
}

Result<Role> parseRole(const std::string& name) {
    std::string n = utils::Formatter::toLower(utils::Formatter::trim(name));
    if (n == "admin") return Role::Admin;
    if (n == "arbitrator") return Role::Arbitrator;
    return makeError(ErrorCode::INVALID_INPUT, "Unknown role: " + name);
}

std::string RoleGrant::key(const std::string& actorId) {
    return "ROLE:" + actorId;
}

std::vector<uint8_t> RoleGrant::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(ROLE_RECORD_VERSION);
    buf.writeString(actorId);
    buf.writeUint32(roles);
    buf.writeInt64(updatedAt);
    return buf.data();
}

std::optional<RoleGrant> RoleGrant::deserialize(const std::vector<uint8_t>& data) {
    try {
        utils::ByteBuffer buf(data);
        if (buf.readUint8() != ROLE_RECORD_VERSION) return std::nullopt;
        RoleGrant g;
        g.actorId = buf.readString();
        g.roles = buf.readUint32();
        g.updatedAt = buf.readInt64();
        return g;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

RoleRegistry::RoleRegistry(const std::vector<std::string>& admins,
                           const std::vector<std::string>& arbitrators) {
    for (const auto& a : admins) {
        std::string id = normalizeIdentity(a);
        if (!id.empty()) admins_.insert(id);
    }
    for (const auto& a : arbitrators) {
        std::string id = normalizeIdentity(a);
        if (!id.empty()) arbitrators_.insert(id);
    }
}

uint32_t RoleRegistry::bootstrapRoles(const std::string& actor) const {
    uint32_t roles = 0;
    if (admins_.count(actor)) roles |= static_cast<uint32_t>(Role::Admin);
    if (arbitrators_.count(actor)) roles |= static_cast<uint32_t>(Role::Arbitrator);
    return roles;
}

Result<uint32_t> RoleRegistry::rolesOf(TxContext& ctx, const std::string& actor) const {
    std::string id = normalizeIdentity(actor);
    auto stored = loadRecord<RoleGrant>(ctx.tx(), RoleGrant::key(id));
    if (stored.failed()) return stored.error();
    uint32_t roles = bootstrapRoles(id);
    if (stored.value()) roles |= stored.value()->roles;
    return roles;
}

Result<bool> RoleRegistry::hasRole(TxContext& ctx, const std::string& actor, Role role) const {
    auto roles = rolesOf(ctx, actor);
    if (roles.failed()) return roles.error();
    return (roles.value() & static_cast<uint32_t>(role)) != 0;
}

Result<void> RoleRegistry::requireRole(TxContext& ctx, Role role) const {
    auto allowed = hasRole(ctx, ctx.caller(), role);
    if (allowed.failed()) return allowed.error();
    if (!allowed.value()) {
        return makeError(ErrorCode::UNAUTHORIZED,
                         std::string("Caller lacks role ") + roleToString(role), ctx.caller());
    }
    return {};
}

Result<uint32_t> RoleRegistry::grant(TxContext& ctx, const std::string& actor, Role role) const {
    auto auth = requireRole(ctx, Role::Admin);
    if (auth.failed()) return auth.error();

    std::string id = normalizeIdentity(actor);
    STAKEREP_CHECK(!id.empty(), ErrorCode::INVALID_INPUT, "Actor is required");

    auto stored = loadRecord<RoleGrant>(ctx.tx(), RoleGrant::key(id));
    if (stored.failed()) return stored.error();
    RoleGrant g = stored.value().value_or(RoleGrant{id, 0, 0});
    g.roles |= static_cast<uint32_t>(role);
    g.updatedAt = ctx.now();

    auto put = storeRecord(ctx.tx(), RoleGrant::key(id), g);
    if (put.failed()) return put.error();

    ctx.notify(topic::ROLE_CHANGED,
               "{" + utils::Formatter::formatJson("actorId", id) + "," +
               utils::Formatter::formatJson("granted", roleToString(role)) + "," +
               utils::Formatter::formatJson("by", ctx.caller()) + "}");
    return g.roles | bootstrapRoles(id);
}

Result<uint32_t> RoleRegistry::revoke(TxContext& ctx, const std::string& actor, Role role) const {
    auto auth = requireRole(ctx, Role::Admin);
    if (auth.failed()) return auth.error();

    std::string id = normalizeIdentity(actor);
    STAKEREP_CHECK(!id.empty(), ErrorCode::INVALID_INPUT, "Actor is required");

    auto stored = loadRecord<RoleGrant>(ctx.tx(), RoleGrant::key(id));
    if (stored.failed()) return stored.error();
    if (!stored.value() || !stored.value()->has(role)) {
        return makeError(ErrorCode::NOT_FOUND,
                         std::string("No stored ") + roleToString(role) + " grant", id);
    }

    RoleGrant g = *stored.value();
    g.roles &= ~static_cast<uint32_t>(role);
    g.updatedAt = ctx.now();

    auto put = storeRecord(ctx.tx(), RoleGrant::key(id), g);
    if (put.failed()) return put.error();

    if (bootstrapRoles(id) & static_cast<uint32_t>(role)) {
        LOG_WARN("Revoked stored " + std::string(roleToString(role)) + " grant for " + id +
                 " but the role is still configured at startup");
    }

    ctx.notify(topic::ROLE_CHANGED,
               "{" + utils::Formatter::formatJson("actorId", id) + "," +
               utils::Formatter::formatJson("revoked", roleToString(role)) + "," +
               utils::Formatter::formatJson("by", ctx.caller()) + "}");
    return g.roles | bootstrapRoles(id);
}

}
}
