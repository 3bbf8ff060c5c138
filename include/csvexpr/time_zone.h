#ifndef CSVEXPR_TIME_ZONE_H
#define CSVEXPR_TIME_ZONE_H

#include <cstdint>
#include <string>
#include <string_view>

namespace csvexpr {

// A fixed-offset time zone. There is no zone database: only UTC aliases and
// explicit offsets resolve.
class TimeZone {
public:
  TimeZone() : id_("UTC"), offset_minutes_(0) {}
  TimeZone(std::string id, int offset_minutes)
      : id_(std::move(id)), offset_minutes_(offset_minutes) {}

  static TimeZone utc() { return TimeZone(); }

  const std::string& id() const { return id_; }
  int offset_minutes() const { return offset_minutes_; }
  int64_t offset_micros() const { return static_cast<int64_t>(offset_minutes_) * 60 * 1000000; }

  bool operator==(const TimeZone& other) const {
    return offset_minutes_ == other.offset_minutes_;
  }

private:
  std::string id_;
  int offset_minutes_;
};

// Accepts UTC, GMT, UT, Z, Etc/UTC, Etc/GMT, +hh, +hh:mm, +hhmm, -hh:mm,
// UTC+h, UTC+hh:mm, GMT-hh:mm, ... Offsets are limited to +-18:00.
// Throws ConfigurationError(UNKNOWN_TIME_ZONE).
TimeZone resolve_time_zone(std::string_view id);

} // namespace csvexpr

#endif // CSVEXPR_TIME_ZONE_H
