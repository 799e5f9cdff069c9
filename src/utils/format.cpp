#include "utils/utils.h"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace stakerep {
namespace utils {

std::string Formatter::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string Formatter::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

bool Formatter::startsWithIgnoreCase(const std::string& str, const std::string& prefix) {
    if (str.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(str[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> Formatter::splitAny(const std::string& str, const std::string& delimiters) {
    std::vector<std::string> result;
    std::string current;
    for (char c : str) {
        if (delimiters.find(c) != std::string::npos) {
            result.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    result.push_back(current);
    return result;
}

std::string Formatter::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

std::string Formatter::formatDouble(double value, int precision) {
    if (!std::isfinite(value)) return "null";
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string Formatter::escapeJson(const std::string& str) {
    std::string result;
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::stringstream ss;
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(static_cast<unsigned char>(c));
                    result += ss.str();
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

std::string Formatter::formatJson(const std::string& key, const std::string& value) {
    return "\"" + escapeJson(key) + "\":\"" + escapeJson(value) + "\"";
}

std::string Formatter::formatJsonNumber(const std::string& key, int64_t value) {
    return "\"" + escapeJson(key) + "\":" + std::to_string(value);
}

std::string Formatter::formatJsonDouble(const std::string& key, double value) {
    return "\"" + escapeJson(key) + "\":" + formatDouble(value);
}

}
}
