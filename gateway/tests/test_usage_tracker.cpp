#include "test_support.hpp"
#include "../src/usage_tracker.hpp"
#include "../src/util.hpp"
#include <cstdio>
#include <ctime>

namespace {

std::chrono::system_clock::time_point utc(int year, int month, int day, int hour = 12) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::string temp_state_path() {
    return "/tmp/solrelay_usage_test_" + util::generate_uuid() + ".json";
}

}

void test_quota_never_exceeded() {
    ManualClock clock(utc(2026, 3, 10));
    ProviderRegistry registry({make_provider("helius", 0.0001, 3)});
    UsageTracker usage(registry, clock);

    assert(usage.record_usage("helius", 0.0001) == UsageResult::Accepted);
    assert(usage.record_usage("helius", 0.0001) == UsageResult::Accepted);
    assert(!usage.is_over_quota("helius"));
    assert(usage.record_usage("helius", 0.0001) == UsageResult::Accepted);
    assert(usage.is_over_quota("helius") && "Quota fully consumed");
    assert(usage.record_usage("helius", 0.0001) == UsageResult::OverQuota && "Fails closed");

    auto snap = usage.snapshot("helius");
    assert(snap && snap->requests == 3 && "Rejected call not counted");
    assert(near(snap->usage_percent, 100.0));
    assert(near(snap->remaining_fraction, 0.0));
    assert(near(snap->cost, 0.0003, 1e-12));
}

void test_unknown_provider() {
    ManualClock clock;
    ProviderRegistry registry({make_provider("helius", 0.0)});
    UsageTracker usage(registry, clock);

    assert(usage.record_usage("nope", 1.0) == UsageResult::UnknownProvider);
    assert(usage.is_over_quota("nope") && "Unknown providers are never routable");
    assert(!usage.snapshot("nope"));
}

void test_release_returns_reservation() {
    ManualClock clock;
    ProviderRegistry registry({make_provider("quicknode", 0.5, 2)});
    UsageTracker usage(registry, clock);

    UsageReservation reservation;
    assert(usage.record_usage("quicknode", 0.5) == UsageResult::Accepted);
    assert(usage.record_usage("quicknode", 0.5, &reservation) == UsageResult::Accepted);
    assert(reservation.provider_id == "quicknode");
    usage.release_usage(reservation);
    assert(usage.snapshot("quicknode")->requests == 1);
    assert(near(usage.snapshot("quicknode")->cost, 0.5));
    assert(usage.record_usage("quicknode", 0.5) == UsageResult::Accepted);
}

void test_release_frees_its_own_minute_slot() {
    ManualClock clock;
    Provider p = make_provider("public", 0.0);
    p.rpm_limit = 2;
    ProviderRegistry registry({p});
    UsageTracker usage(registry, clock);

    UsageReservation early;
    assert(usage.record_usage("public", 0.0, &early) == UsageResult::Accepted);
    clock.advance(std::chrono::seconds(40));
    assert(usage.record_usage("public", 0.0) == UsageResult::Accepted);

    // The earlier call is released after a concurrent one reserved
    usage.release_usage(early);
    assert(usage.record_usage("public", 0.0) == UsageResult::Accepted);
    assert(usage.is_rate_limited("public"));

    // Had the newest slot been dropped, the 0s entry would expire here instead
    clock.advance(std::chrono::seconds(21));
    assert(usage.is_rate_limited("public") && "Remaining slots are the 40s and 40s reservations");
    clock.advance(std::chrono::seconds(40));
    assert(!usage.is_rate_limited("public"));
}

void test_release_after_period_reset_is_ignored() {
    ManualClock clock(utc(2026, 1, 31, 23));
    ProviderRegistry registry({make_provider("helius", 1.0, 10)});
    UsageTracker usage(registry, clock);

    UsageReservation january;
    assert(usage.record_usage("helius", 1.0, &january) == UsageResult::Accepted);
    assert(january.period == "2026-01");

    clock.advance(std::chrono::hours(2));
    assert(usage.record_usage("helius", 1.0) == UsageResult::Accepted);
    assert(usage.snapshot("helius")->period == "2026-02");

    usage.release_usage(january);
    assert(usage.snapshot("helius")->requests == 1 && "New period keeps its own request");
    assert(near(usage.snapshot("helius")->cost, 1.0));
}

void test_per_minute_limit() {
    ManualClock clock;
    Provider p = make_provider("public", 0.0);
    p.rpm_limit = 2;
    ProviderRegistry registry({p});
    UsageTracker usage(registry, clock);

    assert(usage.record_usage("public", 0.0) == UsageResult::Accepted);
    assert(usage.record_usage("public", 0.0) == UsageResult::Accepted);
    assert(usage.is_rate_limited("public"));
    assert(usage.record_usage("public", 0.0) == UsageResult::RateLimited);

    clock.advance(std::chrono::seconds(60));
    assert(!usage.is_rate_limited("public") && "Minute window slid");
    assert(usage.record_usage("public", 0.0) == UsageResult::Accepted);
}

void test_calendar_month_reset() {
    ManualClock clock(utc(2026, 1, 31, 23));
    ProviderRegistry registry({make_provider("helius", 1.0, 2)});
    UsageTracker usage(registry, clock);

    usage.record_usage("helius", 1.0);
    usage.record_usage("helius", 1.0);
    assert(usage.is_over_quota("helius"));
    assert(usage.current_period() == "2026-01");

    clock.set_system_time(utc(2026, 2, 1, 0));
    assert(!usage.is_over_quota("helius") && "New month resets the counter");
    assert(usage.snapshot("helius")->requests == 0);
    assert(usage.snapshot("helius")->period == "2026-02");

    usage.reset_expired_periods();
    usage.reset_expired_periods();
    assert(usage.snapshot("helius")->requests == 0 && "Reset is idempotent");
}

void test_reset_after_restart() {
    const std::string path = temp_state_path();
    {
        ManualClock clock(utc(2026, 4, 29));
        ProviderRegistry registry({make_provider("alchemy", 0.25, 100)});
        UsageTracker usage(registry, clock);
        for (int i = 0; i < 40; ++i) {
            usage.record_usage("alchemy", 0.25);
        }
        assert(usage.save_state(path));
    }

    // Restart within the same month keeps the counters
    {
        ManualClock clock(utc(2026, 4, 30));
        ProviderRegistry registry({make_provider("alchemy", 0.25, 100)});
        UsageTracker usage(registry, clock);
        assert(usage.load_state(path));
        assert(usage.snapshot("alchemy")->requests == 40);
        assert(near(usage.snapshot("alchemy")->cost, 10.0));
    }

    // Offline across the boundary: first use resets before evaluating
    {
        ManualClock clock(utc(2026, 5, 2));
        ProviderRegistry registry({make_provider("alchemy", 0.25, 100)});
        UsageTracker usage(registry, clock);
        assert(usage.load_state(path));
        assert(usage.record_usage("alchemy", 0.25) == UsageResult::Accepted);
        auto snap = usage.snapshot("alchemy");
        assert(snap->requests == 1 && "Stale period reset on first use");
        assert(snap->period == "2026-05");
    }

    std::remove(path.c_str());
}

void test_rolling_period() {
    ManualClock clock(utc(2026, 1, 15));
    ProviderRegistry registry({make_provider("genesys", 0.0, 5)});
    UsageTracker usage(registry, clock, QuotaResetMode::Rolling30Days);

    for (int i = 0; i < 5; ++i) usage.record_usage("genesys", 0.0);
    assert(usage.is_over_quota("genesys"));

    clock.advance(std::chrono::hours(24 * 29));
    assert(usage.is_over_quota("genesys") && "Still inside the 30-day period");

    clock.advance(std::chrono::hours(24));
    assert(!usage.is_over_quota("genesys") && "30 days after start the period rolls");
}

void test_concurrent_reservations_respect_quota() {
    ManualClock clock;
    ProviderRegistry registry({make_provider("helius", 0.0, 500)});
    UsageTracker usage(registry, clock);

    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; ++i) {
                if (usage.record_usage("helius", 0.0) == UsageResult::Accepted) {
                    accepted++;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    assert(accepted.load() == 500 && "Exactly the quota is admitted");
    assert(usage.snapshot("helius")->requests == 500);
}

void test_parse_reset_mode() {
    assert(parse_quota_reset_mode("calendar_month_utc") == QuotaResetMode::CalendarMonthUtc);
    assert(parse_quota_reset_mode("rolling_30d") == QuotaResetMode::Rolling30Days);
    bool threw = false;
    try {
        parse_quota_reset_mode("weekly");
    } catch (const GatewayError& e) {
        threw = e.code() == ErrorCode::ValidationFailed;
    }
    assert(threw);
}

int main() {
    quiet_logging();
    std::cout << "\n=== Usage Tracker Test Suite ===\n" << std::endl;

    TestReporter reporter;
    reporter.test("Quota never exceeded", test_quota_never_exceeded);
    reporter.test("Unknown provider", test_unknown_provider);
    reporter.test("Release returns reservation", test_release_returns_reservation);
    reporter.test("Release frees its own minute slot", test_release_frees_its_own_minute_slot);
    reporter.test("Release after period reset is ignored", test_release_after_period_reset_is_ignored);
    reporter.test("Per-minute limit", test_per_minute_limit);
    reporter.test("Calendar month reset", test_calendar_month_reset);
    reporter.test("Reset after restart", test_reset_after_restart);
    reporter.test("Rolling 30-day period", test_rolling_period);
    reporter.test("Concurrent reservations respect quota", test_concurrent_reservations_respect_quota);
    reporter.test("Parse reset mode", test_parse_reset_mode);

    return reporter.report();
}
