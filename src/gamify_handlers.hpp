/*
 * File: src/gamify_handlers.hpp
 * Project: Gamification Demo API
 * Purpose: Endpoint bodies over the demo dataset
 * Notes:
 *  - Pure functions of (dataset, input); no socket or HTTP types here
 *  - get_user_summary is the only lookup that can fail
 * Last updated: 2026-10-19
 */

#pragma once
#include <cmath>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "common/demo_dataset.hpp"
#include "gamify_config.hpp"


// Client-facing not-found; the router maps it to 404 with what() as detail.
class NotFound : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Request body did not have the expected field types; mapped to 422.
class BadBody : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};


struct AwardAction {
std::string action;
long long points{0};
};


inline nlohmann::json root_message()
{
    return nlohmann::json{{"message", "Gamification Demo API running"}};
}

inline nlohmann::json health(const GamifyConfig &cfg)
{
    return nlohmann::json{{"status", "ok"}, {"mode", "demo"}, {"version", cfg.version}};
}

inline nlohmann::json list_leaderboard(const DemoDataset &d)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto &e : d.leaderboard)
        out.push_back(leaderboard_entry_to_json(e));
    return out;
}

inline nlohmann::json list_badges(const DemoDataset &d)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto &b : d.badges)
        out.push_back(badge_to_json(b));
    return out;
}

inline nlohmann::json list_users(const DemoDataset &d)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto &u : d.users)
        out.push_back(user_to_json(u));
    return out;
}

inline const UserSummary &get_user_summary(const DemoDataset &d, const std::string &user_id)
{
    auto it = d.summaries.find(user_id);
    if (it == d.summaries.end())
        throw NotFound("User not found in demo dataset");
    return it->second;
}

// Lax integer coercion: integers, bools, floats with no fractional part and
// decimal digit strings (optional sign) are accepted.
inline long long coerce_points(const nlohmann::json &v)
{
    if (v.is_number_integer())
        return v.get<long long>();
    if (v.is_boolean())
        return v.get<bool>() ? 1 : 0;
    if (v.is_number_float())
    {
        const double d = v.get<double>();
        if (std::isfinite(d) && std::floor(d) == d && d >= -9.2e18 && d <= 9.2e18)
            return static_cast<long long>(d);
        throw BadBody("points must be an integer");
    }
    if (v.is_string())
    {
        std::string s = v.get<std::string>();
        auto b = s.find_first_not_of(" \t\n\r");
        auto e = s.find_last_not_of(" \t\n\r");
        s = (b == std::string::npos) ? std::string() : s.substr(b, e - b + 1);
        size_t digits_at = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
        if (s.size() > digits_at &&
            s.find_first_not_of("0123456789", digits_at) == std::string::npos)
        {
            try
            {
                return std::stoll(s);
            }
            catch (const std::out_of_range &)
            {
                throw BadBody("points is out of range");
            }
        }
    }
    throw BadBody("points must be an integer");
}

// Type check only: `action` must be a string, `points` integer-like when given.
inline AwardAction parse_award_action(const std::string &body)
{
    using nlohmann::json;

    json j = json::parse(body, nullptr, false);
    if (j.is_discarded())
        throw BadBody("body is not valid JSON");
    if (!j.is_object())
        throw BadBody("body must be a JSON object");

    AwardAction a;
    auto act = j.find("action");
    if (act == j.end())
        throw BadBody("field required: action");
    if (!act->is_string())
        throw BadBody("action must be a string");
    a.action = act->get<std::string>();

    auto pts = j.find("points");
    if (pts != j.end())
        a.points = coerce_points(*pts);
    return a;
}

// The dataset is read-only; the action is acknowledged and dropped.
inline nlohmann::json award_points(const AwardAction &)
{
    return nlohmann::json{{"mode", "demo"}, {"message", "Read-only demo: no data was changed."}};
}
