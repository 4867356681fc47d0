#pragma once

#include "atomicstore/errors.hpp"
#include "atomicstore/store.hpp"

#include <cstddef>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace atomicstore {

struct BatchSummary {
    size_t created{0};
    size_t updated{0};
    size_t deleted{0};
};

/*
 * Queues mutations against one store and applies them concurrently.
 *
 * execute() runs every job on its own thread with per-key callbacks
 * suppressed, waits for all of them, then reports the outcome once through
 * the store's batch callbacks. Jobs run in no particular order: two jobs on
 * the same key race, the last commit under the store mutex wins, and each
 * job is classified by what it alone observed (a key can show up in both
 * created and updated).
 *
 * Single use. Must not outlive its store.
 */
template <typename V>
class Batch {
public:
    explicit Batch(Store<V>& store) : store_(store) {}

    Batch(const Batch&) = delete;
    Batch& operator=(const Batch&) = delete;

    void insert(const std::string& key, const V& value) {
        enqueue(Job{Op::Insert, key, value});
    }

    void insert_unique(const std::string& key, const V& value) {
        enqueue(Job{Op::InsertUnique, key, value});
    }

    void remove(const std::string& key) {
        enqueue(Job{Op::Remove, key, std::nullopt});
    }

    // Number of queued jobs
    size_t size() const {
        std::lock_guard lock(mutex_);
        return jobs_.size();
    }

    // Blocks until every job has been applied. Jobs that threw are left out
    // of the results; the batch callbacks still report every job that
    // committed, then the first job exception is rethrown.
    BatchSummary execute() {
        store_.check_reentrancy("Batch::execute");

        std::vector<Job> jobs;
        {
            std::lock_guard lock(mutex_);
            if (executed_)
                throw BatchStateError{"batch already executed"};
            executed_ = true;
            jobs.swap(jobs_);
        }

        {
            std::vector<std::jthread> workers;
            workers.reserve(jobs.size());
            for (auto& job : jobs) {
                workers.emplace_back([this, &job]() {
                    run(job);
                });
            }
        } // jthreads join here

        KeyValueMap<V> created;
        KeyValueMap<V> updated;
        KeyValueMap<V> deleted;

        std::exception_ptr first_error;

        for (auto& job : jobs) {
            if (job.error) {
                if (!first_error)
                    first_error = job.error;
                continue;
            }
            switch (job.op) {
            case Op::Insert:
            case Op::InsertUnique:
                if (!job.existed)
                    created.insert_or_assign(job.key, std::move(*job.result));
                else if (job.op == Op::Insert)
                    updated.insert_or_assign(job.key, std::move(*job.result));
                break;
            case Op::Remove:
                if (job.existed)
                    deleted.insert_or_assign(job.key, std::move(*job.result));
                break;
            }
        }

        BatchSummary summary{created.size(), updated.size(), deleted.size()};

        if (!created.empty())
            invoke("on_batch_insert", store_.load_callback(store_.on_batch_insert_), created);
        if (!updated.empty())
            invoke("on_batch_update", store_.load_callback(store_.on_batch_update_), updated);
        if (!deleted.empty())
            invoke("on_batch_remove", store_.load_callback(store_.on_batch_remove_), deleted);

        if (first_error)
            std::rethrow_exception(first_error);
        return summary;
    }

private:
    enum class Op { Insert, InsertUnique, Remove };

    struct Job {
        Op op;
        std::string key;
        std::optional<V> value;

        // Filled in by the worker
        bool existed{false};
        std::optional<V> result;
        std::exception_ptr error;
    };

    void enqueue(Job job) {
        std::lock_guard lock(mutex_);
        if (executed_)
            throw BatchStateError{"cannot queue into an executed batch"};
        jobs_.push_back(std::move(job));
    }

    // Worker body. Failures are handed back to execute() through job.error.
    void run(Job& job) noexcept {
        try {
            if (job.op == Op::Remove) {
                job.result = store_.remove_impl(job.key, false);
                job.existed = job.result.has_value();
                return;
            }
            auto inserted = store_.insert_impl(job.key, *job.value, job.op == Op::InsertUnique, false);
            job.existed = inserted.existed;
            job.result = std::move(inserted.value);
        } catch (...) {
            job.error = std::current_exception();
        }
    }

    // Runs outside the store mutex, so the callback may use the store.
    void invoke(const char* name, const typename Store<V>::BatchCallback& callback,
                const KeyValueMap<V>& items) const {
        if (!callback)
            return;
        try {
            callback(items);
        } catch (const std::exception& e) {
            std::cerr << "[Batch] " << name << " callback threw: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[Batch] " << name << " callback threw a non-standard exception\n";
        }
    }

    Store<V>& store_;
    mutable std::mutex mutex_;
    std::vector<Job> jobs_;
    bool executed_{false};
};

template <typename V>
Batch<V> Store<V>::batch() {
    return Batch<V>(*this);
}

} // namespace atomicstore
