#include "time.hpp"

namespace bazaar::util {

TimePoint Now() {
  return Clock::now();
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  auto total = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
  if (total.count() <= 0) {
    return fallback;
  }
  return total;
}

std::int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace bazaar::util
