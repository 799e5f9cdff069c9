#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace stakerep {
namespace utils {

class Formatter {
public:
    static std::string toLower(const std::string& str);
    static std::string trim(const std::string& str);
    static bool startsWithIgnoreCase(const std::string& str, const std::string& prefix);
    static std::vector<std::string> splitAny(const std::string& str, const std::string& delimiters);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string formatDouble(double value, int precision = 6);
    static std::string escapeJson(const std::string& str);
    static std::string formatJson(const std::string& key, const std::string& value);
    static std::string formatJsonNumber(const std::string& key, int64_t value);
    static std::string formatJsonDouble(const std::string& key, double value);
};

}
}
