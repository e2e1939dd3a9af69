/*
 * File: include/common/models.hpp
 * Project: Gamification Demo API
 * Purpose: Demo record types and their JSON encoders
 * Notes:
 *  - Field names match the wire format exactly
 *  - Records are values; entries and summaries embed a copy of the user
 * Last updated: 2026-10-19
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>


struct User {
std::string id;
std::string name;
std::optional<std::string> avatar;
std::string title = "Player";
};


struct Badge {
std::string id;
std::string name;
std::string description;
std::string icon = "Star";
std::string color = "#6366F1";
};


struct LeaderboardEntry {
User user;
int points = 0;
int level = 1;
int rank = 1;
};


struct UserSummary {
User user;
int points = 0;
int level = 1;
int streak_days = 0;
std::vector<Badge> badges;
std::vector<std::string> recent_actions;
};


inline bool operator==(const User& a, const User& b){
return a.id == b.id && a.name == b.name && a.avatar == b.avatar && a.title == b.title;
}
inline bool operator!=(const User& a, const User& b){ return !(a == b); }


inline nlohmann::json user_to_json(const User& u){
using nlohmann::json;
return json{
{"id", u.id},
{"name", u.name},
{"avatar", u.avatar ? json(*u.avatar) : json(nullptr)},
{"title", u.title}
};
}


inline nlohmann::json badge_to_json(const Badge& b){
return nlohmann::json{
{"id", b.id},
{"name", b.name},
{"description", b.description},
{"icon", b.icon},
{"color", b.color}
};
}


inline nlohmann::json leaderboard_entry_to_json(const LeaderboardEntry& e){
return nlohmann::json{
{"user", user_to_json(e.user)},
{"points", e.points},
{"level", e.level},
{"rank", e.rank}
};
}


inline nlohmann::json user_summary_to_json(const UserSummary& s){
using nlohmann::json;
json badges = json::array();
for (const auto& b : s.badges) badges.push_back(badge_to_json(b));
return json{
{"user", user_to_json(s.user)},
{"points", s.points},
{"level", s.level},
{"streak_days", s.streak_days},
{"badges", badges},
{"recent_actions", s.recent_actions}
};
}
