/*
 * File: tests/test_handlers.cpp
 * Project: Gamification Demo API
 * Purpose: Lookup and award handlers over the demo dataset
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include "gamify_handlers.hpp"

using nlohmann::json;


TEST_CASE("every summary embeds the listed user with the same id"){
auto d = make_demo_dataset();
for (const auto& u : d.users) {
  const auto& s = get_user_summary(d, u.id);
  REQUIRE(s.user == u);
}
}


TEST_CASE("unknown user id is not found"){
auto d = make_demo_dataset();
REQUIRE_THROWS_AS(get_user_summary(d, "u_999"), NotFound);
REQUIRE_THROWS_WITH(get_user_summary(d, "u_999"), "User not found in demo dataset");
REQUIRE_THROWS_AS(get_user_summary(d, ""), NotFound);
}


TEST_CASE("leaderboard is four entries in rank order"){
auto d = make_demo_dataset();
json lb = list_leaderboard(d);
REQUIRE(lb.size() == 4);
for (size_t i = 1; i < lb.size(); ++i) {
  REQUIRE(lb[i]["rank"].get<int>() > lb[i - 1]["rank"].get<int>());
  REQUIRE(lb[i]["points"].get<int>() < lb[i - 1]["points"].get<int>());
}
REQUIRE(lb[0]["rank"] == 1);
REQUIRE(lb[0]["points"] == 18250);
REQUIRE(lb[3]["rank"] == 4);
REQUIRE(lb[3]["points"] == 13320);
REQUIRE(lb[0]["user"]["name"] == "Alex Morgan");
}


TEST_CASE("badges include the hero badge"){
auto d = make_demo_dataset();
json badges = list_badges(d);
REQUIRE(badges.size() == 3);
bool found = false;
for (const auto& b : badges) {
  if (b["id"] == "b_hero") { found = true; REQUIRE(b["color"] == "#F59E0B"); REQUIRE(b["icon"] == "Trophy"); }
}
REQUIRE(found);
}


TEST_CASE("users serialize avatar as null"){
auto d = make_demo_dataset();
json users = list_users(d);
REQUIRE(users.size() == 4);
REQUIRE(users[1] == json{{"id", "u_002"}, {"name", "Jamie Lee"}, {"avatar", nullptr}, {"title", "Ops Strategist"}});
}


TEST_CASE("summary json carries streak, badges and actions"){
auto d = make_demo_dataset();
json s = user_summary_to_json(get_user_summary(d, "u_002"));
REQUIRE(s["points"] == 16940);
REQUIRE(s["level"] == 11);
REQUIRE(s["streak_days"] == 6);
REQUIRE(s["badges"].size() == 1);
REQUIRE(s["badges"][0]["id"] == "b_streak");
REQUIRE(s["recent_actions"] == json::array({"Optimized ops workflow (+500)", "Daily check-in (+20)"}));
}


TEST_CASE("award acknowledges and changes nothing"){
auto d = make_demo_dataset();
json users_before = list_users(d);
json lb_before = list_leaderboard(d);

auto a = parse_award_action(R"({"action":"test","points":50})");
REQUIRE(a.action == "test");
REQUIRE(a.points == 50);
REQUIRE(award_points(a) == json{{"mode", "demo"}, {"message", "Read-only demo: no data was changed."}});

REQUIRE(list_users(d) == users_before);
REQUIRE(list_leaderboard(d) == lb_before);
}


TEST_CASE("award points default to zero and accept any sign"){
REQUIRE(parse_award_action(R"({"action":"x"})").points == 0);
REQUIRE(parse_award_action(R"({"action":"x","points":-9000})").points == -9000);
}


TEST_CASE("award points accept integer-like values"){
REQUIRE(parse_award_action(R"({"action":"a","points":50.0})").points == 50);
REQUIRE(parse_award_action(R"({"action":"a","points":"50"})").points == 50);
REQUIRE(parse_award_action(R"({"action":"a","points":" -7 "})").points == -7);
REQUIRE(parse_award_action(R"({"action":"a","points":"+3"})").points == 3);
REQUIRE(parse_award_action(R"({"action":"a","points":true})").points == 1);
REQUIRE(parse_award_action(R"({"action":"a","points":false})").points == 0);
}


TEST_CASE("award body type errors"){
REQUIRE_THROWS_AS(parse_award_action("not json"), BadBody);
REQUIRE_THROWS_AS(parse_award_action("[1,2]"), BadBody);
REQUIRE_THROWS_WITH(parse_award_action("{}"), "field required: action");
REQUIRE_THROWS_WITH(parse_award_action(R"({"action":5})"), "action must be a string");
REQUIRE_THROWS_WITH(parse_award_action(R"({"action":"x","points":"ten"})"), "points must be an integer");
REQUIRE_THROWS_WITH(parse_award_action(R"({"action":"x","points":1.5})"), "points must be an integer");
REQUIRE_THROWS_WITH(parse_award_action(R"({"action":"x","points":"5.0"})"), "points must be an integer");
REQUIRE_THROWS_WITH(parse_award_action(R"({"action":"x","points":"-"})"), "points must be an integer");
REQUIRE_THROWS_WITH(parse_award_action(R"({"action":"x","points":null})"), "points must be an integer");
REQUIRE_THROWS_WITH(parse_award_action(R"({"action":"x","points":"99999999999999999999"})"), "points is out of range");
}


TEST_CASE("root and health bodies"){
GamifyConfig cfg;
REQUIRE(root_message() == json{{"message", "Gamification Demo API running"}});
REQUIRE(health(cfg) == json{{"status", "ok"}, {"mode", "demo"}, {"version", "1.0"}});
}
