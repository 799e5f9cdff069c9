#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace stakerep {
namespace utils {

// Engine parameters read from the "engine.*" keys. These seed the
// SystemConfig record the first time it is created in a store.
struct EngineConfig {
    double minStake = 1000.0;
    double disputeCost = 100.0;
    double slashFraction = 0.30;
    double decayRate = 0.98;
    int64_t decayPeriod = 86400;
    double initialAlpha = 2.0;
    double initialBeta = 2.0;
    double minRaterWeight = 0.1;
    double maxRaterWeight = 5.0;
    std::vector<std::string> admins;
    std::vector<std::string> arbitrators;
};

struct StorageConfig {
    std::string dbPath;
    std::string logPath;
    std::string logLevel = "info";
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    double getDouble(const std::string& key, double def = 0.0) const;
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, double value);
    void setList(const std::string& key, const std::vector<std::string>& values);

    EngineConfig getEngineConfig() const;
    StorageConfig getStorageConfig() const;
    void setEngineConfig(const EngineConfig& config);
    void setStorageConfig(const StorageConfig& config);

    std::string getDataDir() const;
    void setDataDir(const std::string& path);

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
