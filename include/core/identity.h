#pragma once

#include <string>

namespace stakerep {
namespace core {

// Canonical actor key for a raw caller credential. Accepts plain names,
// distinguished-name bundles ("x509::CN=alice,OU=org::CN=ca,...") and the
// base64 encoding of either. Never fails; repeated application is a no-op.
std::string normalizeIdentity(const std::string& raw);

bool sameIdentity(const std::string& a, const std::string& b);

}
}
