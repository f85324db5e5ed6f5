#include "TimeUtil.h"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

double wall_clock_seconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

static std::string format_with(double epoch_seconds, const char* fmt) {
    std::time_t tt = static_cast<std::time_t>(epoch_seconds);
    std::tm tmv{};
    localtime_r(&tt, &tmv);
    std::ostringstream out;
    out << std::put_time(&tmv, fmt);
    return out.str();
}

std::string format_local_time(double epoch_seconds) {
    return format_with(epoch_seconds, "%Y-%m-%d %H:%M:%S");
}

std::string format_iso8601(double epoch_seconds) {
    return format_with(epoch_seconds, "%Y-%m-%dT%H:%M:%S");
}

double round_one_decimal(double value) {
    return std::round(value * 10.0) / 10.0;
}
