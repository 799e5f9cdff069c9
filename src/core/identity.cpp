#include "core/identity.h"
#include "crypto/crypto.h"
#include "utils/utils.h"
#include <string>
#include <vector>

namespace stakerep {
namespace core {

using utils::Formatter;

static const char* X509_MARKER = "x509::";

static bool isPrintableText(const std::vector<uint8_t>& data) {
    if (data.empty()) return false;
    for (uint8_t c : data) {
        if (c == '\t' || c == '\n' || c == '\r') continue;
        if (c < 0x20 || c > 0x7e) return false;
    }
    return true;
}

static bool hasDnMarker(const std::string& text) {
    std::string lower = Formatter::toLower(text);
    return lower.find(X509_MARKER) != std::string::npos ||
           lower.find("cn=") != std::string::npos;
}

static std::string decodeIfEncoded(const std::string& text) {
    if (!crypto::isBase64(text)) return text;
    std::vector<uint8_t> decoded = crypto::base64Decode(
        std::vector<uint8_t>(text.begin(), text.end()));
    if (!isPrintableText(decoded)) return text;
    std::string candidate(decoded.begin(), decoded.end());
    if (!hasDnMarker(candidate)) return text;
    return Formatter::trim(candidate);
}

static std::string extractCommonName(const std::string& text) {
    std::string lower = Formatter::toLower(text);
    if (lower.find("cn=") == std::string::npos) return "";

    std::string subject = text;
    size_t marker = lower.find(X509_MARKER);
    if (marker != std::string::npos) {
        size_t start = marker + std::char_traits<char>::length(X509_MARKER);
        size_t end = lower.find("::", start);
        subject = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
    }

    for (const auto& part : Formatter::splitAny(subject, ",/")) {
        std::string field = Formatter::trim(part);
        if (!Formatter::startsWithIgnoreCase(field, "cn=")) continue;
        std::string value = Formatter::trim(field.substr(3));
        if (!value.empty()) return value;
    }
    return "";
}

static std::string normalizeOnce(const std::string& raw) {
    std::string text = decodeIfEncoded(Formatter::trim(raw));
    std::string cn = extractCommonName(text);
    if (!cn.empty()) text = cn;
    return Formatter::toLower(text);
}

std::string normalizeIdentity(const std::string& raw) {
    // nested subjects ("CN=cn=x") settle after a few passes
    std::string current = normalizeOnce(raw);
    for (int i = 0; i < 4; i++) {
        std::string next = normalizeOnce(current);
        if (next == current) break;
        current = next;
    }
    return current;
}

bool sameIdentity(const std::string& a, const std::string& b) {
    return normalizeIdentity(a) == normalizeIdentity(b);
}

}
}
