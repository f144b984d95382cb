// Guided-event documents and whole-list schema validation.

#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

#include "reel/edl/event_records.hpp"

namespace reel {
namespace {

bool HasError(const std::vector<std::string>& errors, const std::string& needle) {
  for (const auto& e : errors) {
    if (e.find(needle) != std::string::npos) return true;
  }
  return false;
}

TEST(EventRecordsTest, ParsesYamlList) {
  auto r = parse_event_records(R"(
- id: g1
  type: goal
  half: 1
  clock: "12:34"
  team: home
  player: Saka
  assist: Odegaard
  score: "1-0"
  notes: curler
  confidence: 0.95
  signals: [celebration, build_up]
)");
  ASSERT_TRUE(r.ok()) << r.status().to_string();
  ASSERT_EQ(r->size(), 1u);

  const EventRecord& e = (*r)[0];
  EXPECT_EQ(e.id, "g1");
  EXPECT_EQ(e.type, "goal");
  EXPECT_EQ(e.half, 1);
  EXPECT_EQ(e.clock, "12:34");
  EXPECT_EQ(e.team, "home");
  EXPECT_EQ(e.player, "Saka");
  EXPECT_EQ(e.assist, "Odegaard");
  ASSERT_TRUE(e.score.has_value());
  EXPECT_EQ(std::get<std::string>(*e.score), "1-0");
  EXPECT_EQ(e.notes, "curler");
  EXPECT_DOUBLE_EQ(*e.confidence, 0.95);
  EXPECT_EQ(e.signals, (std::vector<std::string>{"celebration", "build_up"}));
  EXPECT_FALSE(e.abs_ts.has_value());
  EXPECT_TRUE(e.problems.empty());
  EXPECT_TRUE(validate_event_records(*r).empty());
}

TEST(EventRecordsTest, ParsesJsonEventsMap) {
  auto r = parse_event_records(R"({"events": [
    {"type": "save", "abs_ts": 300.5},
    {"type": "card", "abs_ts": "00:05:00", "status": "HT"}
  ]})");
  ASSERT_TRUE(r.ok()) << r.status().to_string();
  ASSERT_EQ(r->size(), 2u);
  EXPECT_DOUBLE_EQ(std::get<Seconds>(*(*r)[0].abs_ts), 300.5);
  EXPECT_EQ(std::get<std::string>(*(*r)[1].abs_ts), "00:05:00");
  EXPECT_EQ((*r)[1].status, "HT");
  EXPECT_TRUE(validate_event_records(*r).empty());
}

TEST(EventRecordsTest, ScoreForms) {
  auto r = parse_event_records(R"(
- {type: goal, abs_ts: 1, score: {home: 2, away: 1}}
- {type: goal, abs_ts: 2, score: [3, 1]}
- {type: goal, abs_ts: 3, score: [x, y]}
- {type: goal, abs_ts: 4, score: {winner: home}}
)");
  ASSERT_TRUE(r.ok()) << r.status().to_string();
  ASSERT_EQ(r->size(), 4u);
  EXPECT_EQ(std::get<MatchScore>(*(*r)[0].score), (MatchScore{2, 1}));
  EXPECT_EQ(std::get<MatchScore>(*(*r)[1].score), (MatchScore{3, 1}));
  // Unreadable scores are dropped without failing the record.
  EXPECT_FALSE((*r)[2].score.has_value());
  EXPECT_FALSE((*r)[3].score.has_value());
  EXPECT_TRUE(validate_event_records(*r).empty());
}

TEST(EventRecordsTest, EmptyAndMalformedDocuments) {
  auto empty = parse_event_records("");
  ASSERT_TRUE(empty.ok());
  EXPECT_TRUE(empty->empty());

  auto no_events = parse_event_records("match: derby\n");
  ASSERT_TRUE(no_events.ok());
  EXPECT_TRUE(no_events->empty());

  auto scalar = parse_event_records("hello");
  ASSERT_FALSE(scalar.ok());
  EXPECT_EQ(scalar.status().code(), Status::Code::kInvalidArgument);

  auto syntax = parse_event_records("[{type: goal");
  ASSERT_FALSE(syntax.ok());
  EXPECT_EQ(syntax.status().code(), Status::Code::kParseError);

  auto missing = load_event_records("/nonexistent/reel/events.json");
  ASSERT_FALSE(missing.ok());
  EXPECT_EQ(missing.status().code(), Status::Code::kNotFound);
}

TEST(EventRecordsTest, ValidationReportsEveryProblem) {
  auto r = parse_event_records(R"(
- {half: 1, clock: "10:00"}
- {type: goal_like, abs_ts: 10}
- {type: goal}
- {type: save, half: 3, clock: "10:00"}
- {type: chance, half: 1, clock: "ten past"}
- {type: foul, abs_ts: 5, confidence: 1.5}
- {type: card, abs_ts: "later"}
- {type: goal, half: first, clock: "01:00"}
- not a map
)");
  ASSERT_TRUE(r.ok()) << r.status().to_string();
  const auto errors = validate_event_records(*r);

  EXPECT_TRUE(HasError(errors, "event 0: missing required field: type"));
  EXPECT_TRUE(HasError(errors, "event 1: invalid event type: goal_like"));
  EXPECT_TRUE(HasError(errors, "event 2: missing required field: half"));
  EXPECT_TRUE(HasError(errors, "event 2: missing required field: clock"));
  EXPECT_TRUE(HasError(errors, "event 3: invalid half: 3"));
  EXPECT_TRUE(HasError(errors, "event 4: invalid clock format"));
  EXPECT_TRUE(HasError(errors, "event 5: confidence must be in [0, 1]"));
  EXPECT_TRUE(HasError(errors, "event 6: invalid abs_ts: later"));
  EXPECT_TRUE(HasError(errors, "event 7: unreadable field 'half'"));
  EXPECT_TRUE(HasError(errors, "event 8: event must be a map"));
}

}  // namespace
}  // namespace reel
