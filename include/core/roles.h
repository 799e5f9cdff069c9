#pragma once

#include "core/state_store.h"
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>

namespace stakerep {
namespace core {

enum class Role : uint32_t {
    Admin = 1,
    Arbitrator = 2
};

const char* roleToString(Role role);
Result<Role> parseRole(const std::string& name);

struct RoleGrant {
    std::string actorId;
    uint32_t roles = 0;
    int64_t updatedAt = 0;

    bool has(Role role) const { return (roles & static_cast<uint32_t>(role)) != 0; }

    static std::string key(const std::string& actorId);
    std::vector<uint8_t> serialize() const;
    static std::optional<RoleGrant> deserialize(const std::vector<uint8_t>& data);
};

// Stored grants plus the admins and arbitrators the engine was started
// with. Bootstrap roles cannot be revoked through the store.
class RoleRegistry {
public:
    RoleRegistry(const std::vector<std::string>& admins,
                 const std::vector<std::string>& arbitrators);

    Result<bool> hasRole(TxContext& ctx, const std::string& actor, Role role) const;
    Result<void> requireRole(TxContext& ctx, Role role) const;
    Result<uint32_t> rolesOf(TxContext& ctx, const std::string& actor) const;

    Result<uint32_t> grant(TxContext& ctx, const std::string& actor, Role role) const;
    Result<uint32_t> revoke(TxContext& ctx, const std::string& actor, Role role) const;

private:
    uint32_t bootstrapRoles(const std::string& actor) const;

    std::set<std::string> admins_;
    std::set<std::string> arbitrators_;
};

}
}
