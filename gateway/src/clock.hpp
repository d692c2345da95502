#pragma once
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

// Time source for everything that schedules or expires. Tests drive ManualClock.
class Clock {
public:
    virtual ~Clock() = default;

    virtual std::chrono::steady_clock::time_point steady_now() const = 0;
    virtual std::chrono::system_clock::time_point system_now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    std::chrono::steady_clock::time_point steady_now() const override {
        return std::chrono::steady_clock::now();
    }

    std::chrono::system_clock::time_point system_now() const override {
        return std::chrono::system_clock::now();
    }

    void sleep_for(std::chrono::milliseconds duration) override {
        if (duration.count() > 0) {
            std::this_thread::sleep_for(duration);
        }
    }
};

// sleep_for advances time instead of blocking and records the requested delay
class ManualClock : public Clock {
public:
    ManualClock()
        : steady_(std::chrono::steady_clock::time_point{} + std::chrono::hours(1)),
          system_(std::chrono::system_clock::now()) {}

    explicit ManualClock(std::chrono::system_clock::time_point system_start)
        : steady_(std::chrono::steady_clock::time_point{} + std::chrono::hours(1)),
          system_(system_start) {}

    std::chrono::steady_clock::time_point steady_now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return steady_;
    }

    std::chrono::system_clock::time_point system_now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return system_;
    }

    void sleep_for(std::chrono::milliseconds duration) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sleeps_.push_back(duration);
        steady_ += duration;
        system_ += duration;
    }

    void advance(std::chrono::milliseconds duration) {
        std::lock_guard<std::mutex> lock(mutex_);
        steady_ += duration;
        system_ += duration;
    }

    void set_system_time(std::chrono::system_clock::time_point tp) {
        std::lock_guard<std::mutex> lock(mutex_);
        system_ = tp;
    }

    std::vector<std::chrono::milliseconds> sleeps() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sleeps_;
    }

private:
    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point steady_;
    std::chrono::system_clock::time_point system_;
    std::vector<std::chrono::milliseconds> sleeps_;
};
