#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <cstdint>

namespace stakerep {
namespace database {

// Every stored key carries a version that starts at 1 and is bumped on each
// write. An absent key reads as version 0.
struct VersionedValue {
    std::vector<uint8_t> value;
    uint64_t version = 0;
    bool found = false;
};

enum class CommitStatus {
    Committed,
    Conflict,
    Failed
};

class WriteBatch {
public:
    WriteBatch();
    ~WriteBatch();
    void put(const std::string& key, const std::vector<uint8_t>& value);
    void clear();
    size_t size() const;
    bool empty() const;
private:
    friend class Database;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class Database {
public:
    Database();
    ~Database();

    bool open(const std::string& path);
    void close();
    bool isOpen() const;

    bool put(const std::string& key, const std::vector<uint8_t>& value);
    bool put(const std::string& key, const std::string& value);
    std::vector<uint8_t> get(const std::string& key) const;
    std::string getString(const std::string& key) const;
    // `ok` (when given) is false if the lookup itself failed; the result is
    // then empty and must not be taken as an absent key.
    VersionedValue getVersioned(const std::string& key, bool* ok = nullptr) const;
    uint64_t getVersion(const std::string& key, bool* ok = nullptr) const;
    bool del(const std::string& key);
    bool exists(const std::string& key) const;

    // Applies the batch only if every key in `expected` still has the
    // recorded version. Runs under BEGIN IMMEDIATE so the check and the
    // writes are one atomic step across connections.
    CommitStatus commitIfUnchanged(const std::map<std::string, uint64_t>& expected,
                                   WriteBatch& batch);

    // Returns false if the scan could not run.
    bool forEach(const std::string& prefix,
                 std::function<bool(const std::string&, const std::vector<uint8_t>&, uint64_t)> fn) const;
    std::vector<std::string> keys(const std::string& prefix = "") const;
    size_t count(const std::string& prefix = "") const;

    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
