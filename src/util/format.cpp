#include "cbu/util/format.hpp"

#include <spdlog/fmt/fmt.h>

namespace cbu::util {

std::string format_file_size(std::uint64_t bytes) {
    constexpr double kb = 1024.0;
    constexpr double mb = kb * 1024.0;
    constexpr double gb = mb * 1024.0;

    const auto value = static_cast<double>(bytes);
    if (value >= gb) {
        return fmt::format("{:.1f} GB", value / gb);
    }
    if (value >= mb) {
        return fmt::format("{:.1f} MB", value / mb);
    }
    return fmt::format("{:.0f} KB", value / kb);
}

std::string format_duration(std::int64_t seconds) {
    if (seconds < 0) {
        return "--";
    }
    const auto h = seconds / 3600;
    const auto m = (seconds % 3600) / 60;
    const auto s = seconds % 60;
    if (h > 0) {
        return fmt::format("{}h {:02}m", h, m);
    }
    if (m > 0) {
        return fmt::format("{}m {:02}s", m, s);
    }
    return fmt::format("{}s", s);
}

std::string format_schedule_time(int hour, int minute) {
    int display_hour = hour;
    if (hour == 0) {
        display_hour = 12;
    } else if (hour > 12) {
        display_hour = hour - 12;
    }
    return fmt::format("{}:{:02} {}", display_hour, minute, hour < 12 ? "AM" : "PM");
}

} // namespace cbu::util
