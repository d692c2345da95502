#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
double get_env_double(const std::string& name, double default_value);

// Logging
void setup_logging(const std::string& service_name, const std::string& level);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);

// Compares two secrets without an early exit on the first mismatching byte
bool constant_time_equals(const std::string& a, const std::string& b);

// Time utilities
std::string current_iso8601();
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);

// "YYYY-MM" of the UTC calendar month containing tp
std::string utc_year_month(const std::chrono::system_clock::time_point& tp);

// Random utilities
std::string generate_uuid();
double random_jitter(double base_value, double jitter_factor = 0.1);

} // namespace util
