#pragma once

#include "infrastructure/error_handling.h"
#include "database/database.h"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <functional>
#include <utility>
#include <cstdint>

namespace stakerep {
namespace core {

using Bytes = std::vector<uint8_t>;
using KeyValue = std::pair<std::string, Bytes>;

namespace topic {
constexpr const char* RATING_SUBMITTED = "RatingSubmitted";
constexpr const char* STAKE_DEPOSITED = "StakeDeposited";
constexpr const char* STAKE_SLASHED = "StakeSlashed";
constexpr const char* DISPUTE_INITIATED = "DisputeInitiated";
constexpr const char* DISPUTE_RESOLVED = "DisputeResolved";
constexpr const char* CONFIG_UPDATED = "ConfigUpdated";
constexpr const char* DIMENSION_ADDED = "DimensionAdded";
constexpr const char* ROLE_CHANGED = "RoleChanged";
}

// Identity and clock of the caller, supplied by the runtime hosting the
// engine. `caller` is the raw credential; the engine normalizes it.
struct CallContext {
    std::string caller;
    std::string txId;
    int64_t timestamp = 0;
};

// One optimistic transaction. Reads see the transaction's own buffered
// writes; nothing reaches the store until commit() succeeds.
class Transaction {
public:
    virtual ~Transaction() = default;

    virtual Result<std::optional<Bytes>> get(const std::string& key) = 0;
    virtual Result<void> put(const std::string& key, const Bytes& value) = 0;
    virtual Result<std::vector<KeyValue>> rangeQuery(const std::string& prefix) = 0;

    // Fails with STORAGE_CONFLICT when any key read or written has changed
    // since this transaction first observed it.
    virtual Result<void> commit() = 0;
    virtual void abort() = 0;
};

class StateStore {
public:
    virtual ~StateStore() = default;
    virtual std::unique_ptr<Transaction> begin() = 0;
};

class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void emit(const std::string& topic, const std::string& payload) = 0;
};

class SqliteStateStore : public StateStore {
public:
    SqliteStateStore();
    ~SqliteStateStore() override;

    bool open(const std::string& path);
    void close();
    bool isOpen() const;
    database::Database& database();

    std::unique_ptr<Transaction> begin() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

struct Notification {
    std::string topic;
    std::string payload;
    uint64_t sequence = 0;
};

using NotificationHandler = std::function<void(const Notification&)>;

// In-process fan-out of engine notifications. Subscribing to an empty
// topic receives everything.
class NotificationBus : public NotificationSink {
public:
    NotificationBus();
    ~NotificationBus() override;

    std::string subscribe(const std::string& topic, NotificationHandler handler);
    bool unsubscribe(const std::string& subscriptionId);

    void emit(const std::string& topic, const std::string& payload) override;

    std::vector<Notification> getHistory(size_t count = 100) const;
    std::vector<Notification> getHistory(const std::string& topic, size_t count = 100) const;
    uint64_t getEmittedCount() const;
    size_t getSubscriberCount() const;
    void clearHistory();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Per-call view handed to every component: the transaction, the normalized
// caller and the notifications to publish once the transaction commits.
class TxContext {
public:
    TxContext(Transaction& tx, const CallContext& call);

    Transaction& tx() { return tx_; }
    const std::string& caller() const { return caller_; }
    const std::string& rawCaller() const { return call_.caller; }
    const std::string& txId() const { return call_.txId; }
    int64_t now() const { return call_.timestamp; }

    void notify(const std::string& topic, const std::string& payload);
    const std::vector<std::pair<std::string, std::string>>& pendingNotifications() const {
        return pending_;
    }

private:
    Transaction& tx_;
    CallContext call_;
    std::string caller_;
    std::vector<std::pair<std::string, std::string>> pending_;
};

template<typename T>
Result<std::optional<T>> loadRecord(Transaction& tx, const std::string& key) {
    auto raw = tx.get(key);
    if (raw.failed()) return raw.error();
    if (!raw.value()) return std::optional<T>();
    std::optional<T> record = T::deserialize(*raw.value());
    if (!record) {
        return makeError(ErrorCode::SERIALIZATION_ERROR, "Corrupt record", key);
    }
    return record;
}

template<typename T>
Result<void> storeRecord(Transaction& tx, const std::string& key, const T& record) {
    return tx.put(key, record.serialize());
}

template<typename T>
Result<std::vector<T>> scanRecords(Transaction& tx, const std::string& prefix) {
    auto rows = tx.rangeQuery(prefix);
    if (rows.failed()) return rows.error();
    std::vector<T> records;
    records.reserve(rows.value().size());
    for (const auto& [key, value] : rows.value()) {
        std::optional<T> record = T::deserialize(value);
        if (!record) {
            return makeError(ErrorCode::SERIALIZATION_ERROR, "Corrupt record", key);
        }
        records.push_back(std::move(*record));
    }
    return records;
}

}
}
