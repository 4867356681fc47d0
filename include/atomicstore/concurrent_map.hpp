#pragma once

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>


namespace atomicstore {

/*
 * Thread-safe string-keyed map.
 * Every method is atomic on its own; nothing is atomic across calls.
 */
template <typename V>
class ConcurrentMap {
public:
    std::optional<V> load(const std::string& key) const {
        std::shared_lock lock(mutex_);
        auto it = data_.find(key);
        return it != data_.end() ? std::make_optional(it->second) : std::nullopt;
    }

    // Insert or overwrite. Returns true if the key was already present.
    bool store(const std::string& key, const V& value) {
        std::unique_lock lock(mutex_);
        auto [it, inserted] = data_.insert_or_assign(key, value);
        return !inserted;
    }

    // Store only if absent. Returns the value now mapped at key and
    // whether it was already there.
    std::pair<V, bool> load_or_store(const std::string& key, const V& value) {
        std::unique_lock lock(mutex_);
        auto [it, inserted] = data_.try_emplace(key, value);
        return {it->second, !inserted};
    }

    // Remove and hand back the value, if the key existed
    std::optional<V> extract(const std::string& key) {
        std::unique_lock lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end())
            return std::nullopt;
        std::optional<V> value{std::move(it->second)};
        data_.erase(it);
        return value;
    }

    std::unordered_set<std::string> keys() const {
        std::shared_lock lock(mutex_);
        std::unordered_set<std::string> out;
        out.reserve(data_.size());
        for (const auto& entry : data_)
            out.insert(entry.first);
        return out;
    }

    // Calls fn(key, value) for each entry of a snapshot until fn returns false.
    // fn runs without the map lock, so it may mutate the map.
    template <typename Fn>
    void range(Fn&& fn) const {
        std::vector<std::pair<std::string, V>> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot.assign(data_.begin(), data_.end());
        }
        for (const auto& [key, value] : snapshot) {
            if (!fn(key, value))
                break;
        }
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return data_.size();
    }

private:
    std::unordered_map<std::string, V> data_;
    mutable std::shared_mutex mutex_;
};

} // namespace atomicstore
