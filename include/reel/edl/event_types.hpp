// File: include/reel/edl/event_types.hpp
#pragma once

#include <cstdint>
#include <string>

namespace reel {

// Importance used when the EDL has to drop events for budget:
// goal 10, goal_like 9, big_save 8, save 7, chance 6, card 5, foul 4, celebration 3, other 0.
int priority_score(const std::string& type);

// Bitmask of the related-type groups a type belongs to (0 = none). A type may sit in several
// groups: goal_like is related both to goal and to chance, while goal and chance are not related.
std::uint32_t related_groups(const std::string& type);

// Same type, or sharing at least one related-type group.
bool types_related(const std::string& a, const std::string& b);

// Types a guided (human-curated) record may carry.
bool is_guided_type(const std::string& type);

}  // namespace reel
