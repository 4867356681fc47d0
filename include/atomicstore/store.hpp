#pragma once

#include "atomicstore/atomic_counter.hpp"
#include "atomicstore/change_notifier.hpp"
#include "atomicstore/concurrent_map.hpp"
#include "atomicstore/errors.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <unordered_set>


namespace atomicstore {

template <typename V>
using KeyValueMap = std::unordered_map<std::string, V>;

template <typename V>
struct InsertResult {
    V value;      // the value now stored at the key
    bool existed; // key was present before the call
};

template <typename V>
class Batch;

/*
 * Thread-safe in-memory key–value store with a live element count,
 * change notification and batch execution.
 *
 * A lockable store serializes every mutation, its counter update and its
 * callback under one store-wide mutex. Callbacks therefore run with that
 * mutex held: calling a mutating method of the same store from inside one
 * throws ReentrancyError. Reads never take the store mutex.
 *
 * A non-lockable store skips the mutex; notify/wait become no-ops.
 */
template <typename V>
class Store {
public:
    using Callback = std::function<void(const std::string& key, const V& value)>;
    using BatchCallback = std::function<void(const KeyValueMap<V>& items)>;

    explicit Store(bool lockable = true)
        : notifier_(lockable ? std::make_unique<ChangeNotifier>() : nullptr) {}

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    Store(Store&&) = delete;
    Store& operator=(Store&&) = delete;

    bool lockable() const noexcept {
        return notifier_ != nullptr;
    }

    uint64_t size() const noexcept {
        return count_.get();
    }

    // Create or overwrite. Fires on_update if the key existed, on_insert otherwise.
    InsertResult<V> insert(const std::string& key, const V& value) {
        return insert_impl(key, value, false, true);
    }

    // Create only if the key is absent. An existing key is left untouched
    // and returned with existed == true; no callback fires in that case.
    InsertResult<V> insert_unique(const std::string& key, const V& value) {
        return insert_impl(key, value, true, true);
    }

    // Returns false if the key was not present
    bool remove(const std::string& key) {
        return remove_impl(key, true).has_value();
    }

    std::optional<V> get(const std::string& key) const {
        return map_.load(key);
    }

    // Keys present at some point during the call. Not atomic against
    // concurrent writers.
    std::unordered_set<std::string> key_map() const {
        return map_.keys();
    }

    // Remove every key through remove(), then notify waiters once
    void flush() {
        map_.range([this](const std::string& key, const V&) {
            remove(key);
            return true;
        });
        notify_did_change();
    }

    void notify_did_change() {
        if (!lockable())
            return;
        check_reentrancy("notify_did_change");
        notifier_->notify_all();
    }

    // Blocks until the next notify_did_change() or until stop is requested.
    // Returns true if woken by a notification. Wakeups are store-wide, so
    // callers must re-check whatever they are waiting for.
    // A non-lockable store returns false immediately.
    bool wait_for_data_change(std::stop_token stop_token) {
        if (!lockable())
            return false;
        check_reentrancy("wait_for_data_change");
        return notifier_->wait(std::move(stop_token));
    }

    void on_insert(Callback callback) {
        set_callback(on_insert_, std::move(callback));
    }

    void on_update(Callback callback) {
        set_callback(on_update_, std::move(callback));
    }

    void on_remove(Callback callback) {
        set_callback(on_remove_, std::move(callback));
    }

    void on_batch_insert(BatchCallback callback) {
        set_callback(on_batch_insert_, std::move(callback));
    }

    void on_batch_update(BatchCallback callback) {
        set_callback(on_batch_update_, std::move(callback));
    }

    void on_batch_remove(BatchCallback callback) {
        set_callback(on_batch_remove_, std::move(callback));
    }

    // Defined in batch.hpp
    Batch<V> batch();

private:
    friend class Batch<V>;

    // Marks the calling thread as running a callback of this store
    class CallbackScope {
    public:
        explicit CallbackScope(const Store* store) : previous_(t_callback_owner_) {
            t_callback_owner_ = store;
        }
        ~CallbackScope() {
            t_callback_owner_ = previous_;
        }

        CallbackScope(const CallbackScope&) = delete;
        CallbackScope& operator=(const CallbackScope&) = delete;

    private:
        const Store* previous_;
    };

    InsertResult<V> insert_impl(const std::string& key, const V& value,
                                bool unique, bool run_callbacks) {
        auto lock = write_lock(unique ? "insert_unique" : "insert");

        if (unique) {
            auto [stored, existed] = map_.load_or_store(key, value);
            if (!existed) {
                count_.inc();
                if (run_callbacks)
                    invoke("on_insert", load_callback(on_insert_), key, stored);
            }
            return InsertResult<V>{std::move(stored), existed};
        }

        bool existed = map_.store(key, value);
        if (!existed)
            count_.inc();
        if (run_callbacks) {
            if (existed)
                invoke("on_update", load_callback(on_update_), key, value);
            else
                invoke("on_insert", load_callback(on_insert_), key, value);
        }
        return InsertResult<V>{value, existed};
    }

    // Returns the removed value, or nullopt if the key was absent
    std::optional<V> remove_impl(const std::string& key, bool run_callbacks) {
        auto lock = write_lock("remove");

        auto removed = map_.extract(key);
        if (!removed)
            return std::nullopt;

        count_.dec();
        if (run_callbacks)
            invoke("on_remove", load_callback(on_remove_), key, *removed);
        return removed;
    }

    // Owns nothing for a non-lockable store
    std::unique_lock<std::mutex> write_lock(const char* operation) {
        check_reentrancy(operation);
        if (!lockable())
            return std::unique_lock<std::mutex>{};
        return std::unique_lock<std::mutex>{notifier_->mutex()};
    }

    void check_reentrancy(const char* operation) const {
        if (t_callback_owner_ == this)
            throw ReentrancyError{std::string{operation} + " called from a callback of the same store"};
    }

    template <typename Fn>
    Fn load_callback(const Fn& slot) const {
        std::shared_lock lock(callbacks_mutex_);
        return slot;
    }

    template <typename Fn>
    void set_callback(Fn& slot, Fn callback) {
        std::unique_lock lock(callbacks_mutex_);
        slot = std::move(callback);
    }

    // Nothing a callback throws unwinds through the write lock; it is
    // logged and the mutation stands.
    void invoke(const char* name, const Callback& callback, const std::string& key, const V& value) const {
        if (!callback)
            return;
        CallbackScope scope(this);
        try {
            callback(key, value);
        } catch (const std::exception& e) {
            std::cerr << "[Store] " << name << " callback threw: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[Store] " << name << " callback threw a non-standard exception\n";
        }
    }

    ConcurrentMap<V> map_;
    AtomicCounter count_;
    std::unique_ptr<ChangeNotifier> notifier_; // null when not lockable

    mutable std::shared_mutex callbacks_mutex_;
    Callback on_insert_;
    Callback on_update_;
    Callback on_remove_;
    BatchCallback on_batch_insert_;
    BatchCallback on_batch_update_;
    BatchCallback on_batch_remove_;

    inline static thread_local const Store* t_callback_owner_ = nullptr;
};

} // namespace atomicstore
