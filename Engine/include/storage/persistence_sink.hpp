/**
 * @file persistence_sink.hpp
 * @brief Durable destination for finalized reasoning paths
 */

#pragma once

#include <cognitive/reasoning_path.hpp>
#include <export.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace Russell {

/**
 * @brief Accepts finalized records keyed by path id
 *
 * Called after the core has released its lock. Failures are reported by
 * throwing; the caller logs them and marks the path unpersisted.
 */
class RUSSELL_API PersistenceSink {
public:
    virtual ~PersistenceSink() = default;

    virtual void store(const ReasoningPath& path) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief In-process sink (tests, CLI without a database)
 */
class RUSSELL_API MemorySink : public PersistenceSink {
public:
    void store(const ReasoningPath& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        paths_.push_back(path);
    }

    std::string name() const override { return "memory"; }

    std::vector<ReasoningPath> paths() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return paths_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return paths_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<ReasoningPath> paths_;
};

} // namespace Russell
