#pragma once

#include <cstdint>
#include <string>

namespace cbu::util {

/// "1.5 GB", "256.3 MB", "512 KB" (binary units).
std::string format_file_size(std::uint64_t bytes);

/// "1h 02m", "4m 10s", "12s"; "--" for a negative (unknown) duration.
std::string format_duration(std::int64_t seconds);

/// 24-hour time as "3:00 AM" / "11:30 PM".
std::string format_schedule_time(int hour, int minute);

} // namespace cbu::util
