#include "csvexpr/time_zone.h"

#include "csvexpr/error.h"

#include <cctype>
#include <optional>

namespace csvexpr {

namespace {

std::string upper_copy(std::string_view s) {
  std::string out(s);
  for (auto& c : out)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

bool all_digits(std::string_view s) {
  if (s.empty())
    return false;
  for (char c : s) {
    if (c < '0' || c > '9')
      return false;
  }
  return true;
}

int to_int(std::string_view s) {
  int v = 0;
  for (char c : s)
    v = v * 10 + (c - '0');
  return v;
}

// Parses "+h", "+hh", "+hhmm", "+hh:mm"; returns minutes east of UTC.
std::optional<int> parse_offset(std::string_view s) {
  if (s.size() < 2 || (s[0] != '+' && s[0] != '-'))
    return std::nullopt;
  int sign = s[0] == '-' ? -1 : 1;
  std::string_view rest = s.substr(1);

  int hours = 0;
  int minutes = 0;
  size_t colon = rest.find(':');
  if (colon != std::string_view::npos) {
    std::string_view h = rest.substr(0, colon);
    std::string_view m = rest.substr(colon + 1);
    if (!all_digits(h) || h.size() > 2 || !all_digits(m) || m.size() != 2)
      return std::nullopt;
    hours = to_int(h);
    minutes = to_int(m);
  } else if (all_digits(rest) && rest.size() <= 2) {
    hours = to_int(rest);
  } else if (all_digits(rest) && rest.size() == 4) {
    hours = to_int(rest.substr(0, 2));
    minutes = to_int(rest.substr(2));
  } else {
    return std::nullopt;
  }

  if (minutes > 59 || hours * 60 + minutes > 18 * 60)
    return std::nullopt;
  return sign * (hours * 60 + minutes);
}

} // namespace

TimeZone resolve_time_zone(std::string_view id) {
  std::string upper = upper_copy(id);

  if (upper == "UTC" || upper == "GMT" || upper == "UT" || upper == "Z" || upper == "ETC/UTC" ||
      upper == "ETC/GMT" || upper == "ZULU") {
    return TimeZone(std::string(id), 0);
  }

  std::string_view offset_part = id;
  for (const char* prefix : {"UTC", "GMT", "UT"}) {
    std::string_view p(prefix);
    if (upper.compare(0, p.size(), p) == 0 && upper.size() > p.size() &&
        (upper[p.size()] == '+' || upper[p.size()] == '-')) {
      offset_part = id.substr(p.size());
      break;
    }
  }

  if (auto minutes = parse_offset(offset_part)) {
    return TimeZone(std::string(id), *minutes);
  }

  throw ConfigurationError(ErrorCode::UNKNOWN_TIME_ZONE,
                           "Unknown time zone '" + std::string(id) +
                               "'; expected UTC or a fixed offset such as +02:00");
}

} // namespace csvexpr
