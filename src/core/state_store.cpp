#include "core/state_store.h"
#include "core/identity.h"
#include "utils/logger.h"
#include <map>
#include <deque>
#include <mutex>
#include <atomic>
#include <algorithm>

namespace stakerep {
namespace core {

namespace {

class SqliteTransaction : public Transaction {
public:
    explicit SqliteTransaction(database::Database& db) : db_(db) {}

    Result<std::optional<Bytes>> get(const std::string& key) override {
        STAKEREP_CHECK(!finished_, ErrorCode::INTERNAL_ERROR, "Transaction already finished");

        auto w = writes_.find(key);
        if (w != writes_.end()) {
            return std::optional<Bytes>(w->second);
        }

        bool ok = false;
        database::VersionedValue stored = db_.getVersioned(key, &ok);
        if (!ok) return makeError(ErrorCode::DATABASE_ERROR, "Read failed", db_.lastError());
        observe(key, stored.version);
        if (!stored.found) return std::optional<Bytes>();
        return std::optional<Bytes>(std::move(stored.value));
    }

    Result<void> put(const std::string& key, const Bytes& value) override {
        STAKEREP_CHECK(!finished_, ErrorCode::INTERNAL_ERROR, "Transaction already finished");
        STAKEREP_CHECK(!key.empty(), ErrorCode::INVALID_INPUT, "Empty key");

        if (observed_.find(key) == observed_.end()) {
            bool ok = false;
            uint64_t version = db_.getVersion(key, &ok);
            if (!ok) return makeError(ErrorCode::DATABASE_ERROR, "Read failed", db_.lastError());
            observe(key, version);
        }
        writes_[key] = value;
        return {};
    }

    Result<std::vector<KeyValue>> rangeQuery(const std::string& prefix) override {
        STAKEREP_CHECK(!finished_, ErrorCode::INTERNAL_ERROR, "Transaction already finished");

        std::map<std::string, Bytes> merged;
        bool scanned = db_.forEach(prefix, [&](const std::string& key, const Bytes& value, uint64_t version) {
            observe(key, version);
            merged[key] = value;
            return true;
        });
        if (!scanned) return makeError(ErrorCode::DATABASE_ERROR, "Range scan failed", db_.lastError());
        for (const auto& [key, value] : writes_) {
            if (key.compare(0, prefix.size(), prefix) == 0) {
                merged[key] = value;
            }
        }
        return std::vector<KeyValue>(merged.begin(), merged.end());
    }

    Result<void> commit() override {
        STAKEREP_CHECK(!finished_, ErrorCode::INTERNAL_ERROR, "Transaction already finished");
        finished_ = true;

        if (writes_.empty()) return {};

        database::WriteBatch batch;
        for (const auto& [key, value] : writes_) {
            batch.put(key, value);
        }

        switch (db_.commitIfUnchanged(observed_, batch)) {
            case database::CommitStatus::Committed:
                return {};
            case database::CommitStatus::Conflict:
                return makeError(ErrorCode::STORAGE_CONFLICT,
                                 "Concurrent write detected", db_.lastError());
            default:
                return makeError(ErrorCode::DATABASE_ERROR, "Commit failed", db_.lastError());
        }
    }

    void abort() override {
        finished_ = true;
        writes_.clear();
    }

private:
    void observe(const std::string& key, uint64_t version) {
        observed_.emplace(key, version);
    }

    database::Database& db_;
    std::map<std::string, uint64_t> observed_;
    std::map<std::string, Bytes> writes_;
    bool finished_ = false;
};

}

struct SqliteStateStore::Impl {
    database::Database db;
};

SqliteStateStore::SqliteStateStore() : impl_(std::make_unique<Impl>()) {}
SqliteStateStore::~SqliteStateStore() = default;

bool SqliteStateStore::open(const std::string& path) {
    if (!impl_->db.open(path)) {
        LOG_ERROR("Failed to open state store at " + path + ": " + impl_->db.lastError());
        return false;
    }
    LOG_INFO("State store opened at " + path);
    return true;
}

void SqliteStateStore::close() {
    impl_->db.close();
}

bool SqliteStateStore::isOpen() const {
    return impl_->db.isOpen();
}

database::Database& SqliteStateStore::database() {
    return impl_->db;
}

std::unique_ptr<Transaction> SqliteStateStore::begin() {
    return std::make_unique<SqliteTransaction>(impl_->db);
}

struct NotificationBus::Impl {
    struct Subscription {
        std::string id;
        std::string topic;
        NotificationHandler handler;
    };

    std::vector<Subscription> subscriptions;
    std::deque<Notification> history;
    uint64_t nextSubscription = 1;
    std::atomic<uint64_t> sequence{0};
    mutable std::mutex mtx;
    static constexpr size_t MAX_HISTORY = 1000;
};

NotificationBus::NotificationBus() : impl_(std::make_unique<Impl>()) {}
NotificationBus::~NotificationBus() = default;

std::string NotificationBus::subscribe(const std::string& topic, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string id = "sub_" + std::to_string(impl_->nextSubscription++);
    impl_->subscriptions.push_back({id, topic, std::move(handler)});
    return id;
}

bool NotificationBus::unsubscribe(const std::string& subscriptionId) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = std::remove_if(impl_->subscriptions.begin(), impl_->subscriptions.end(),
        [&](const Impl::Subscription& s) { return s.id == subscriptionId; });
    if (it == impl_->subscriptions.end()) return false;
    impl_->subscriptions.erase(it, impl_->subscriptions.end());
    return true;
}

void NotificationBus::emit(const std::string& topic, const std::string& payload) {
    Notification n;
    n.topic = topic;
    n.payload = payload;
    n.sequence = ++impl_->sequence;

    std::vector<NotificationHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->history.push_back(n);
        while (impl_->history.size() > Impl::MAX_HISTORY) {
            impl_->history.pop_front();
        }
        for (const auto& sub : impl_->subscriptions) {
            if (sub.topic.empty() || sub.topic == topic) {
                handlers.push_back(sub.handler);
            }
        }
    }

    for (const auto& handler : handlers) {
        try {
            handler(n);
        } catch (const std::exception& e) {
            LOG_WARN("Notification handler for " + topic + " threw: " + e.what());
        }
    }
}

std::vector<Notification> NotificationBus::getHistory(size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    size_t start = impl_->history.size() > count ? impl_->history.size() - count : 0;
    return std::vector<Notification>(impl_->history.begin() + start, impl_->history.end());
}

std::vector<Notification> NotificationBus::getHistory(const std::string& topic, size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<Notification> result;
    for (auto it = impl_->history.rbegin(); it != impl_->history.rend() && result.size() < count; ++it) {
        if (it->topic == topic) result.push_back(*it);
    }
    std::reverse(result.begin(), result.end());
    return result;
}

uint64_t NotificationBus::getEmittedCount() const {
    return impl_->sequence.load();
}

size_t NotificationBus::getSubscriberCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->subscriptions.size();
}

void NotificationBus::clearHistory() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->history.clear();
}

TxContext::TxContext(Transaction& tx, const CallContext& call)
    : tx_(tx), call_(call), caller_(normalizeIdentity(call.caller)) {}

void TxContext::notify(const std::string& topic, const std::string& payload) {
    pending_.emplace_back(topic, payload);
}

}
}
