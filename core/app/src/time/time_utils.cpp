#include "autotrade/time/time_utils.hpp"

#include <ctime>

namespace autotrade {

std::int32_t local_day_key(std::int64_t ms) {
  const std::time_t seconds =
      std::chrono::system_clock::to_time_t(ms_to_timestamp(ms));

  // localtime_r is the reentrant form; std::localtime shares a static buffer
  // across threads.
  std::tm local{};
  localtime_r(&seconds, &local);

  return (local.tm_year + 1900) * 10000 + (local.tm_mon + 1) * 100 +
         local.tm_mday;
}

}  // namespace autotrade
