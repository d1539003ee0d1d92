#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace btcfi {

/**
 * Keyed storage capability for one aggregate's records.
 * Engines depend only on this interface so a persistent backend can be
 * substituted for the in-memory one.
 */
template <typename V>
class Repository {
public:
    virtual ~Repository() = default;

    virtual std::optional<V> get(const std::string& key) const = 0;
    virtual void put(const std::string& key, V value) = 0;
    virtual std::vector<V> list() const = 0;
};

/**
 * Process-lifetime storage. Listing is ordered by key.
 */
template <typename V>
class InMemoryRepository : public Repository<V> {
public:
    std::optional<V> get(const std::string& key) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = items_.find(key);
        if (it == items_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void put(const std::string& key, V value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        items_[key] = std::move(value);
    }

    std::vector<V> list() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<V> result;
        result.reserve(items_.size());
        for (const auto& [key, value] : items_) {
            result.push_back(value);
        }
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, V> items_;
};

} // namespace btcfi
