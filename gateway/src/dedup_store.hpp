#pragma once
#include "clock.hpp"
#include <sw/redis++/redis.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

class DedupStore {
public:
    virtual ~DedupStore() = default;

    // True the first time a signature is seen within the window
    virtual bool mark_if_new(const std::string& signature) = 0;

    // Drops a mark so a retried delivery is processed again
    virtual void forget(const std::string& signature) = 0;

    virtual void cleanup() {}

    virtual const char* kind() const = 0;
};

class InMemoryDedupStore : public DedupStore {
public:
    InMemoryDedupStore(std::chrono::seconds window, const Clock& clock);

    bool mark_if_new(const std::string& signature) override;
    void forget(const std::string& signature) override;
    void cleanup() override;
    const char* kind() const override { return "memory"; }

    size_t size() const;

private:
    const std::chrono::seconds window_;
    const Clock& clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> seen_;
};

// Shared across gateway instances through SET NX EX
class RedisDedupStore : public DedupStore {
public:
    RedisDedupStore(std::shared_ptr<sw::redis::Redis> redis, std::chrono::seconds window,
                    std::string key_prefix = "solrelay:dedup:");

    bool mark_if_new(const std::string& signature) override;
    void forget(const std::string& signature) override;
    const char* kind() const override { return "redis"; }

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    const std::chrono::seconds window_;
    const std::string key_prefix_;
};
