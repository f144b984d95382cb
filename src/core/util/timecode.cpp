// File: src/core/util/timecode.cpp
#include "reel/core/util/timecode.hpp"

#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

namespace reel {
namespace {

std::vector<std::string> split(const std::string& s, char sep) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == sep) {
      out.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  out.push_back(cur);
  return out;
}

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

// Whole string must be a finite, non-negative decimal number.
std::optional<double> parse_plain_seconds(const std::string& s) {
  if (s.empty()) return std::nullopt;
  std::size_t pos = 0;
  double v = 0.0;
  try {
    v = std::stod(s, &pos);
  } catch (const std::exception&) {
    return std::nullopt;
  }
  if (pos != s.size() || !std::isfinite(v) || v < 0.0) return std::nullopt;
  return v;
}

// Colon-separated integer fields, most significant first: [h:]m:s
std::optional<double> parse_colon_fields(const std::vector<std::string>& parts) {
  double total = 0.0;
  for (const auto& p : parts) {
    if (!is_digits(p) || p.size() > 9) return std::nullopt;
    total = total * 60.0 + static_cast<double>(std::stol(p));
  }
  return total;
}

}  // namespace

Result<Seconds> parse_match_clock(const std::string& clock_in) {
  const std::string clock = trim(clock_in);
  const auto parts = split(clock, ':');

  if (parts.size() == 2 || parts.size() == 3) {
    const auto v = parse_colon_fields(parts);
    if (!v) return Result<Seconds>::err(Status::parse_error("invalid clock format: '" + clock_in + "'"));
    return Result<Seconds>::ok(*v);
  }

  if (parts.size() == 1) {
    const auto v = parse_plain_seconds(clock);
    if (v) return Result<Seconds>::ok(*v);
  }
  return Result<Seconds>::err(Status::parse_error("invalid clock format: '" + clock_in + "'"));
}

Result<Seconds> parse_timestamp(const std::string& ts_in) {
  const std::string ts = trim(ts_in);
  if (ts.find(':') == std::string::npos) {
    const auto v = parse_plain_seconds(ts);
    if (!v) return Result<Seconds>::err(Status::parse_error("invalid timestamp: '" + ts_in + "'"));
    return Result<Seconds>::ok(*v);
  }

  std::string whole = ts;
  std::string frac;
  const auto dot = ts.find('.');
  if (dot != std::string::npos) {
    whole = ts.substr(0, dot);
    frac = ts.substr(dot + 1);
    if (!is_digits(frac)) {
      return Result<Seconds>::err(Status::parse_error("invalid timestamp fraction: '" + ts_in + "'"));
    }
  }

  const auto parts = split(whole, ':');
  if (parts.size() != 3) {
    return Result<Seconds>::err(Status::parse_error("timestamp must be HH:MM:SS[.fff]: '" + ts_in + "'"));
  }
  const auto v = parse_colon_fields(parts);
  if (!v) return Result<Seconds>::err(Status::parse_error("invalid timestamp: '" + ts_in + "'"));

  double total = *v;
  if (!frac.empty()) total += std::stod("0." + frac.substr(0, 9));
  return Result<Seconds>::ok(total);
}

std::string seconds_to_timestamp(Seconds s) {
  if (!(s > 0.0)) s = 0.0;
  // Round to milliseconds first so 59.9996 does not print as "00:00:60.000".
  const long long total_ms = std::llround(s * 1000.0);
  const long long hours = total_ms / 3'600'000;
  const long long minutes = (total_ms % 3'600'000) / 60'000;
  const long long ms_in_minute = total_ms % 60'000;

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld.%03lld", hours, minutes,
                ms_in_minute / 1000, ms_in_minute % 1000);
  return buf;
}

std::string seconds_to_clock(Seconds s) {
  if (!(s > 0.0)) s = 0.0;
  const long long total = static_cast<long long>(std::floor(s));
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld", total / 60, total % 60);
  return buf;
}

std::optional<MatchScore> parse_score(const std::string& s) {
  const auto parts = split(trim(s), '-');
  if (parts.size() != 2) return std::nullopt;
  const std::string h = trim(parts[0]);
  const std::string a = trim(parts[1]);
  if (!is_digits(h) || !is_digits(a) || h.size() > 6 || a.size() > 6) return std::nullopt;
  return MatchScore{std::stoi(h), std::stoi(a)};
}

Result<Seconds> compute_absolute_time(int half, const std::string& clock, Seconds kickoff_s,
                                      const MatchTiming& timing) {
  auto clock_r = parse_match_clock(clock);
  if (!clock_r.ok()) return clock_r;
  const Seconds clock_s = *clock_r;

  if (half == 2) {
    return Result<Seconds>::ok(kickoff_s + timing.first_half_duration_s +
                               timing.half_time_duration_s + clock_s);
  }
  return Result<Seconds>::ok(kickoff_s + clock_s);
}

}  // namespace reel
