#include "usage_tracker.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>

namespace {

constexpr auto kMinute = std::chrono::seconds(60);
constexpr auto kAlertInterval = std::chrono::hours(1);
constexpr auto kRollingPeriod = std::chrono::hours(24 * 30);

}

QuotaResetMode parse_quota_reset_mode(const std::string& name) {
    if (name == "calendar_month_utc") return QuotaResetMode::CalendarMonthUtc;
    if (name == "rolling_30d") return QuotaResetMode::Rolling30Days;
    throw GatewayError(ErrorCode::ValidationFailed, "Unknown quota reset mode: " + name);
}

const char* to_string(UsageResult result) {
    switch (result) {
        case UsageResult::Accepted:        return "accepted";
        case UsageResult::OverQuota:       return "over_quota";
        case UsageResult::RateLimited:     return "rate_limited";
        case UsageResult::UnknownProvider: return "unknown_provider";
    }
    return "unknown";
}

nlohmann::json UsageSnapshot::to_json() const {
    return nlohmann::json{
        {"provider", provider_id},
        {"period", period},
        {"requests", requests},
        {"monthly_quota", monthly_quota},
        {"cost", cost},
        {"usage_percent", usage_percent},
        {"remaining_fraction", remaining_fraction}
    };
}

UsageTracker::UsageTracker(const ProviderRegistry& registry, const Clock& clock,
                           QuotaResetMode mode, double alert_fraction)
    : clock_(clock),
      mode_(mode),
      alert_fraction_(alert_fraction),
      rolling_anchor_(clock.system_now()) {
    const std::string period = current_period();
    for (const auto& p : registry.list_providers()) {
        auto counter = std::make_unique<Counter>();
        counter->provider_id = p.id;
        counter->monthly_quota = p.monthly_quota;
        counter->rpm_limit = p.rpm_limit;
        counter->period = period;
        index_[p.id] = counter.get();
        counters_.push_back(std::move(counter));
    }
}

std::string UsageTracker::current_period() const {
    auto now = clock_.system_now();
    if (mode_ == QuotaResetMode::CalendarMonthUtc) {
        return util::utc_year_month(now);
    }

    auto elapsed = now - rolling_anchor_;
    long long index = elapsed.count() < 0 ? 0 : static_cast<long long>(elapsed / kRollingPeriod);
    auto anchor_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        rolling_anchor_.time_since_epoch()).count();
    return fmt::format("rolling-{}-{}", anchor_seconds, index);
}

UsageResult UsageTracker::record_usage(const std::string& provider_id, double cost,
                                       UsageReservation* reservation) {
    Counter* counter = counter_for(provider_id);
    if (!counter) {
        return UsageResult::UnknownProvider;
    }

    const std::string period = current_period();
    const auto now = clock_.steady_now();

    std::lock_guard<std::mutex> lock(counter->mutex);
    maybe_reset(*counter, period);
    prune_minute_window(*counter, now);

    if (counter->requests + 1 > counter->monthly_quota) {
        return UsageResult::OverQuota;
    }

    if (counter->rpm_limit > 0 &&
        counter->minute_window.size() >= static_cast<size_t>(counter->rpm_limit)) {
        return UsageResult::RateLimited;
    }

    counter->requests++;
    counter->cost += cost;
    counter->minute_window.push_back(now);

    if (reservation) {
        reservation->provider_id = provider_id;
        reservation->period = counter->period;
        reservation->reserved_at = now;
        reservation->cost = cost;
    }

    maybe_alert(*counter, now);
    return UsageResult::Accepted;
}

void UsageTracker::release_usage(const UsageReservation& reservation) {
    Counter* counter = counter_for(reservation.provider_id);
    if (!counter) {
        return;
    }

    std::lock_guard<std::mutex> lock(counter->mutex);
    if (counter->period != reservation.period) {
        spdlog::debug("Dropping release for {} from past period {}", reservation.provider_id,
                      reservation.period);
        return;
    }

    if (counter->requests > 0) {
        counter->requests--;
        counter->cost = std::max(0.0, counter->cost - reservation.cost);
    }

    auto& window = counter->minute_window;
    auto it = std::find(window.rbegin(), window.rend(), reservation.reserved_at);
    if (it != window.rend()) {
        window.erase(std::next(it).base());
    }
}

bool UsageTracker::is_over_quota(const std::string& provider_id) {
    Counter* counter = counter_for(provider_id);
    if (!counter) {
        return true;
    }

    const std::string period = current_period();
    std::lock_guard<std::mutex> lock(counter->mutex);
    maybe_reset(*counter, period);
    return counter->requests >= counter->monthly_quota;
}

bool UsageTracker::is_rate_limited(const std::string& provider_id) {
    Counter* counter = counter_for(provider_id);
    if (!counter) {
        return true;
    }

    std::lock_guard<std::mutex> lock(counter->mutex);
    if (counter->rpm_limit <= 0) {
        return false;
    }
    prune_minute_window(*counter, clock_.steady_now());
    return counter->minute_window.size() >= static_cast<size_t>(counter->rpm_limit);
}

double UsageTracker::remaining_fraction(const std::string& provider_id) {
    auto snap = snapshot(provider_id);
    return snap ? snap->remaining_fraction : 0.0;
}

std::optional<UsageSnapshot> UsageTracker::snapshot(const std::string& provider_id) {
    Counter* counter = counter_for(provider_id);
    if (!counter) {
        return std::nullopt;
    }

    const std::string period = current_period();
    std::lock_guard<std::mutex> lock(counter->mutex);
    maybe_reset(*counter, period);
    return snapshot_locked(*counter);
}

std::vector<UsageSnapshot> UsageTracker::snapshots() {
    std::vector<UsageSnapshot> result;
    const std::string period = current_period();
    for (const auto& counter : counters_) {
        std::lock_guard<std::mutex> lock(counter->mutex);
        maybe_reset(*counter, period);
        result.push_back(snapshot_locked(*counter));
    }
    return result;
}

void UsageTracker::reset_expired_periods() {
    const std::string period = current_period();
    for (const auto& counter : counters_) {
        std::lock_guard<std::mutex> lock(counter->mutex);
        maybe_reset(*counter, period);
    }
}

bool UsageTracker::save_state(const std::string& path) {
    nlohmann::json state = {
        {"mode", mode_ == QuotaResetMode::CalendarMonthUtc ? "calendar_month_utc" : "rolling_30d"},
        {"rolling_anchor", std::chrono::duration_cast<std::chrono::seconds>(
            rolling_anchor_.time_since_epoch()).count()},
        {"saved_at", util::format_timestamp(clock_.system_now())},
        {"providers", nlohmann::json::object()}
    };

    for (const auto& counter : counters_) {
        std::lock_guard<std::mutex> lock(counter->mutex);
        state["providers"][counter->provider_id] = {
            {"period", counter->period},
            {"requests", counter->requests},
            {"cost", counter->cost}
        };
    }

    const std::string tmp_path = path + ".tmp";
    try {
        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out) {
                spdlog::error("Cannot write usage state to {}", tmp_path);
                return false;
            }
            out << state.dump(2);
        }
        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            spdlog::error("Failed to move usage state into place at {}", path);
            return false;
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to save usage state: {}", e.what());
        return false;
    }

    spdlog::debug("Usage state saved to {}", path);
    return true;
}

bool UsageTracker::load_state(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        spdlog::info("No usage state at {}, starting with empty counters", path);
        return false;
    }

    try {
        auto state = nlohmann::json::parse(in);

        if (mode_ == QuotaResetMode::Rolling30Days && state.contains("rolling_anchor")) {
            rolling_anchor_ = std::chrono::system_clock::time_point(
                std::chrono::seconds(state["rolling_anchor"].get<long long>()));
        }

        const auto& providers = state.at("providers");
        for (const auto& [id, entry] : providers.items()) {
            Counter* counter = counter_for(id);
            if (!counter) {
                spdlog::warn("Usage state names unknown provider {}, skipping", id);
                continue;
            }
            std::lock_guard<std::mutex> lock(counter->mutex);
            counter->period = entry.value("period", counter->period);
            counter->requests = entry.value("requests", static_cast<uint64_t>(0));
            counter->cost = entry.value("cost", 0.0);
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to load usage state from {}: {}", path, e.what());
        return false;
    }

    spdlog::info("Loaded usage state from {}", path);
    return true;
}

UsageTracker::Counter* UsageTracker::counter_for(const std::string& provider_id) {
    auto it = index_.find(provider_id);
    return it == index_.end() ? nullptr : it->second;
}

void UsageTracker::maybe_reset(Counter& counter, const std::string& period) {
    if (counter.period == period) {
        return;
    }
    spdlog::info("Quota reset for {} ({} -> {}, {} requests, ${:.4f} in previous period)",
                 counter.provider_id, counter.period, period, counter.requests, counter.cost);
    counter.period = period;
    counter.requests = 0;
    counter.cost = 0.0;
    counter.last_alert.reset();
}

void UsageTracker::prune_minute_window(Counter& counter, std::chrono::steady_clock::time_point now) {
    while (!counter.minute_window.empty() && now - counter.minute_window.front() >= kMinute) {
        counter.minute_window.pop_front();
    }
}

void UsageTracker::maybe_alert(Counter& counter, std::chrono::steady_clock::time_point now) {
    if (counter.monthly_quota == 0) {
        return;
    }
    double fraction = static_cast<double>(counter.requests) / counter.monthly_quota;
    if (fraction < alert_fraction_) {
        return;
    }
    if (counter.last_alert && now - *counter.last_alert < kAlertInterval) {
        return;
    }
    counter.last_alert = now;
    spdlog::warn("Provider {} has used {:.1f}% of its monthly quota ({}/{})",
                 counter.provider_id, fraction * 100.0, counter.requests, counter.monthly_quota);
}

UsageSnapshot UsageTracker::snapshot_locked(const Counter& counter) const {
    UsageSnapshot snap;
    snap.provider_id = counter.provider_id;
    snap.period = counter.period;
    snap.requests = counter.requests;
    snap.monthly_quota = counter.monthly_quota;
    snap.cost = counter.cost;
    if (counter.monthly_quota > 0) {
        double used = static_cast<double>(counter.requests) / counter.monthly_quota;
        snap.usage_percent = used * 100.0;
        snap.remaining_fraction = std::max(0.0, 1.0 - used);
    } else {
        snap.usage_percent = 100.0;
        snap.remaining_fraction = 0.0;
    }
    return snap;
}
