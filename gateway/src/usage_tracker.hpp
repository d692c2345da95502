#pragma once
#include "clock.hpp"
#include "provider_registry.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class QuotaResetMode {
    CalendarMonthUtc,
    Rolling30Days
};

QuotaResetMode parse_quota_reset_mode(const std::string& name);

enum class UsageResult {
    Accepted,
    OverQuota,
    RateLimited,
    UnknownProvider
};

const char* to_string(UsageResult result);

struct UsageSnapshot {
    std::string provider_id;
    std::string period;
    uint64_t requests = 0;
    uint64_t monthly_quota = 0;
    double cost = 0.0;
    double usage_percent = 0.0;
    double remaining_fraction = 1.0;

    nlohmann::json to_json() const;
};

// What record_usage took, so a release undoes exactly that request
struct UsageReservation {
    std::string provider_id;
    std::string period;
    std::chrono::steady_clock::time_point reserved_at;
    double cost = 0.0;
};

class UsageTracker {
public:
    UsageTracker(const ProviderRegistry& registry, const Clock& clock,
                 QuotaResetMode mode = QuotaResetMode::CalendarMonthUtc,
                 double alert_fraction = 0.8);

    // Atomically checks the quota and per-minute limit, then reserves one request
    UsageResult record_usage(const std::string& provider_id, double cost,
                             UsageReservation* reservation = nullptr);

    // Returns a reservation for a request the provider never accepted.
    // No-op once the billing period it was taken in has reset.
    void release_usage(const UsageReservation& reservation);

    // Unknown providers count as over quota so they are never routed to
    bool is_over_quota(const std::string& provider_id);
    bool is_rate_limited(const std::string& provider_id);

    double remaining_fraction(const std::string& provider_id);

    std::optional<UsageSnapshot> snapshot(const std::string& provider_id);
    std::vector<UsageSnapshot> snapshots();

    // Resets every counter whose billing period has passed; idempotent
    void reset_expired_periods();

    std::string current_period() const;

    bool save_state(const std::string& path);
    bool load_state(const std::string& path);

private:
    struct Counter {
        std::mutex mutex;
        std::string provider_id;
        uint64_t monthly_quota = 0;
        int rpm_limit = 0;
        std::string period;
        uint64_t requests = 0;
        double cost = 0.0;
        std::deque<std::chrono::steady_clock::time_point> minute_window;
        std::optional<std::chrono::steady_clock::time_point> last_alert;
    };

    Counter* counter_for(const std::string& provider_id);
    void maybe_reset(Counter& counter, const std::string& period);
    void prune_minute_window(Counter& counter, std::chrono::steady_clock::time_point now);
    void maybe_alert(Counter& counter, std::chrono::steady_clock::time_point now);
    UsageSnapshot snapshot_locked(const Counter& counter) const;

    const Clock& clock_;
    QuotaResetMode mode_;
    double alert_fraction_;
    std::chrono::system_clock::time_point rolling_anchor_;

    std::vector<std::unique_ptr<Counter>> counters_;
    std::unordered_map<std::string, Counter*> index_;
};
