#ifndef TIME_UTIL_H
#define TIME_UTIL_H

#include <functional>
#include <string>

// Seconds since the Unix epoch, with sub-second precision.
using Clock = std::function<double()>;

double wall_clock_seconds();

// "YYYY-MM-DD HH:MM:SS" in local time.
std::string format_local_time(double epoch_seconds);

// ISO-8601 local timestamp used in persisted grant metadata.
std::string format_iso8601(double epoch_seconds);

// Rounds to one decimal place for human-facing hour counts.
double round_one_decimal(double value);

#endif // TIME_UTIL_H
