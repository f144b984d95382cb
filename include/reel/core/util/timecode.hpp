// File: include/reel/core/util/timecode.hpp
#pragma once

#include <optional>
#include <string>

#include "reel/core/status.hpp"
#include "reel/core/types.hpp"

namespace reel {

// Match clock: "mm:ss", "hh:mm:ss" or plain seconds ("83", "12.5").
Result<Seconds> parse_match_clock(const std::string& clock);

// Video timestamp: "HH:MM:SS", "HH:MM:SS.fff" or plain seconds.
Result<Seconds> parse_timestamp(const std::string& ts);

// "HH:MM:SS.mmm"
std::string seconds_to_timestamp(Seconds s);

// "mm:ss" (minutes are not wrapped at 60)
std::string seconds_to_clock(Seconds s);

// Score string "H-A" (e.g. "2-1"). nullopt if it does not parse.
std::optional<MatchScore> parse_score(const std::string& s);

struct MatchTiming {
  Seconds first_half_duration_s = 49.0 * 60.0;
  Seconds half_time_duration_s = 15.0 * 60.0;
};

// Absolute video time for a match-clock reading.
//   half 1: kickoff + clock
//   half 2: kickoff + first half + half-time break + clock
//   other : kickoff + clock
Result<Seconds> compute_absolute_time(int half, const std::string& clock, Seconds kickoff_s,
                                      const MatchTiming& timing = MatchTiming{});

}  // namespace reel
