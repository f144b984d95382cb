// File: src/edl/event_types.cpp
#include "reel/edl/event_types.hpp"

#include <array>
#include <string_view>

namespace reel {
namespace {

struct TypeInfo {
  std::string_view type;
  int priority;
  std::uint32_t groups;
  bool guided;
};

// Related-type groups. Adding a pair is one bit here plus the bit on both rows below.
constexpr std::uint32_t kGoalGroup = 1u << 0;    // goal ~ goal_like
constexpr std::uint32_t kSaveGroup = 1u << 1;    // big_save ~ save
constexpr std::uint32_t kChanceGroup = 1u << 2;  // chance ~ goal_like
constexpr std::uint32_t kFoulGroup = 1u << 3;    // foul ~ card

constexpr std::array<TypeInfo, 8> kTypes{{
    {"goal", 10, kGoalGroup, true},
    {"goal_like", 9, kGoalGroup | kChanceGroup, false},
    {"big_save", 8, kSaveGroup, true},
    {"save", 7, kSaveGroup, true},
    {"chance", 6, kChanceGroup, true},
    {"card", 5, kFoulGroup, true},
    {"foul", 4, kFoulGroup, true},
    {"celebration", 3, 0u, true},
}};

const TypeInfo* find_type(const std::string& type) {
  for (const auto& t : kTypes) {
    if (t.type == type) return &t;
  }
  return nullptr;
}

}  // namespace

int priority_score(const std::string& type) {
  const TypeInfo* t = find_type(type);
  return t ? t->priority : 0;
}

std::uint32_t related_groups(const std::string& type) {
  const TypeInfo* t = find_type(type);
  return t ? t->groups : 0u;
}

bool types_related(const std::string& a, const std::string& b) {
  if (a == b) return true;
  return (related_groups(a) & related_groups(b)) != 0u;
}

bool is_guided_type(const std::string& type) {
  const TypeInfo* t = find_type(type);
  return t && t->guided;
}

}  // namespace reel
