#include "utils/config.h"
#include <map>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <mutex>

namespace stakerep {
namespace utils {

struct Config::Impl {
    std::map<std::string, std::string> data;
    std::string configPath;
    std::string dataDir;
    mutable std::mutex mtx;
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    const char* home = std::getenv("HOME");
    if (home) {
        impl_->dataDir = std::string(home) + "/.stakerep";
    } else {
        impl_->dataDir = ".stakerep";
    }
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    EngineConfig engine;
    setEngineConfig(engine);

    StorageConfig storage;
    storage.dbPath = getDataDir() + "/stakerep.db";
    storage.logPath = getDataDir() + "/stakerep.log";
    setStorageConfig(storage);
    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
        impl_->configPath.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;

    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) continue;

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t\r") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r") + 1);
        if (key.empty()) continue;

        impl_->data[key] = value;
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;

    std::ofstream file(savePath);
    if (!file.is_open()) return false;

    file << "# StakeRep Configuration\n\n";

    std::string lastPrefix;
    for (const auto& [key, value] : impl_->data) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << value << "\n";
    }
    return file.good();
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    return it != impl_->data.end() ? it->second : def;
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoll(it->second); }
    catch (const std::exception&) { return def; }
}

double Config::getDouble(const std::string& key, double def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stod(it->second); }
    catch (const std::exception&) { return def; }
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return result;

    std::istringstream iss(it->second);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data[key] = value;
}

void Config::set(const std::string& key, const char* value) {
    set(key, std::string(value ? value : ""));
}

void Config::set(const std::string& key, int64_t value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, double value) {
    std::ostringstream oss;
    oss.precision(17);
    oss << value;
    set(key, oss.str());
}

void Config::setList(const std::string& key, const std::vector<std::string>& values) {
    std::string joined;
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) joined += ",";
        joined += values[i];
    }
    set(key, joined);
}

EngineConfig Config::getEngineConfig() const {
    EngineConfig def;
    EngineConfig cfg;
    cfg.minStake = getDouble("engine.min_stake", def.minStake);
    cfg.disputeCost = getDouble("engine.dispute_cost", def.disputeCost);
    cfg.slashFraction = getDouble("engine.slash_fraction", def.slashFraction);
    cfg.decayRate = getDouble("engine.decay_rate", def.decayRate);
    cfg.decayPeriod = getInt64("engine.decay_period", def.decayPeriod);
    cfg.initialAlpha = getDouble("engine.initial_alpha", def.initialAlpha);
    cfg.initialBeta = getDouble("engine.initial_beta", def.initialBeta);
    cfg.minRaterWeight = getDouble("engine.min_rater_weight", def.minRaterWeight);
    cfg.maxRaterWeight = getDouble("engine.max_rater_weight", def.maxRaterWeight);
    cfg.admins = getList("engine.admins");
    cfg.arbitrators = getList("engine.arbitrators");
    return cfg;
}

StorageConfig Config::getStorageConfig() const {
    StorageConfig cfg;
    cfg.dbPath = getString("storage.db_path", getDataDir() + "/stakerep.db");
    cfg.logPath = getString("storage.log_path", getDataDir() + "/stakerep.log");
    cfg.logLevel = getString("storage.log_level", "info");
    return cfg;
}

void Config::setEngineConfig(const EngineConfig& cfg) {
    set("engine.min_stake", cfg.minStake);
    set("engine.dispute_cost", cfg.disputeCost);
    set("engine.slash_fraction", cfg.slashFraction);
    set("engine.decay_rate", cfg.decayRate);
    set("engine.decay_period", cfg.decayPeriod);
    set("engine.initial_alpha", cfg.initialAlpha);
    set("engine.initial_beta", cfg.initialBeta);
    set("engine.min_rater_weight", cfg.minRaterWeight);
    set("engine.max_rater_weight", cfg.maxRaterWeight);
    setList("engine.admins", cfg.admins);
    setList("engine.arbitrators", cfg.arbitrators);
}

void Config::setStorageConfig(const StorageConfig& cfg) {
    set("storage.db_path", cfg.dbPath);
    set("storage.log_path", cfg.logPath);
    set("storage.log_level", cfg.logLevel);
}

std::string Config::getDataDir() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->dataDir;
}

void Config::setDataDir(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->dataDir = path;
}

}
}
