/*
 * File: include/common/demo_dataset.hpp
 * Project: Gamification Demo API
 * Purpose: Fixed demo records and their startup validation
 * Notes:
 *  - Built once by make_demo_dataset(); never mutated afterwards
 *  - Leaderboard insertion order is rank order; nothing sorts it at runtime
 * Last updated: 2026-10-19
 */

#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"


struct DemoDataset {
std::vector<User> users;
std::vector<Badge> badges;
std::vector<LeaderboardEntry> leaderboard;
std::map<std::string, UserSummary> summaries; // keyed by user id
};


inline DemoDataset make_demo_dataset()
{
    DemoDataset d;

    d.users = {
        User{"u_001", "Alex Morgan", std::nullopt, "Sales Captain"},
        User{"u_002", "Jamie Lee", std::nullopt, "Ops Strategist"},
        User{"u_003", "Riley Chen", std::nullopt, "Product Ace"},
        User{"u_004", "Jordan Patel", std::nullopt, "CX Pro"},
    };

    d.badges = {
        Badge{"b_hero", "Hero", "Top performer of the week", "Trophy", "#F59E0B"},
        Badge{"b_streak", "Streak", "7-day activity streak", "Flame", "#EF4444"},
        Badge{"b_helper", "Mentor", "Helped 5 teammates", "Handshake", "#10B981"},
    };

    d.leaderboard = {
        LeaderboardEntry{d.users[0], 18250, 12, 1},
        LeaderboardEntry{d.users[1], 16940, 11, 2},
        LeaderboardEntry{d.users[2], 15100, 10, 3},
        LeaderboardEntry{d.users[3], 13320, 9, 4},
    };

    d.summaries["u_001"] = UserSummary{
        d.users[0], 18250, 12, 8,
        {d.badges[0], d.badges[1]},
        {"Closed enterprise deal (+2,000)",
         "Completed onboarding quest (+300)",
         "Shared playbook with team (+100)"}};
    d.summaries["u_002"] = UserSummary{
        d.users[1], 16940, 11, 6,
        {d.badges[1]},
        {"Optimized ops workflow (+500)",
         "Daily check-in (+20)"}};
    d.summaries["u_003"] = UserSummary{
        d.users[2], 15100, 10, 4,
        {},
        {"Launched feature beta (+1,200)"}};
    d.summaries["u_004"] = UserSummary{
        d.users[3], 13320, 9, 2,
        {d.badges[2]},
        {"Resolved 20+ support tickets (+800)"}};

    return d;
}


// Returns one message per broken invariant; empty means the dataset is usable.
inline std::vector<std::string> validate_dataset(const DemoDataset &d)
{
    std::vector<std::string> problems;

    std::set<std::string> user_ids;
    for (const auto &u : d.users)
    {
        if (!user_ids.insert(u.id).second)
            problems.push_back("duplicate user id: " + u.id);
    }

    std::set<std::string> badge_ids;
    for (const auto &b : d.badges)
    {
        if (!badge_ids.insert(b.id).second)
            problems.push_back("duplicate badge id: " + b.id);
    }

    for (size_t i = 0; i < d.leaderboard.size(); ++i)
    {
        const auto &e = d.leaderboard[i];
        const std::string where = "leaderboard[" + std::to_string(i) + "] ";
        if (!user_ids.count(e.user.id))
            problems.push_back(where + "references unknown user " + e.user.id);
        if (e.points < 0)
            problems.push_back(where + "has negative points");
        if (e.level < 1)
            problems.push_back(where + "has level below 1");
        if (e.rank != static_cast<int>(i) + 1)
            problems.push_back(where + "has rank " + std::to_string(e.rank) +
                               ", expected " + std::to_string(i + 1));
        if (i > 0 && e.points >= d.leaderboard[i - 1].points)
            problems.push_back(where + "points not below previous rank");
    }

    for (const auto &[key, s] : d.summaries)
    {
        if (!user_ids.count(key))
            problems.push_back("summary for unknown user " + key);
        if (s.user.id != key)
            problems.push_back("summary " + key + " embeds user " + s.user.id);
        if (s.streak_days < 0)
            problems.push_back("summary " + key + " has negative streak");
        for (const auto &b : s.badges)
        {
            if (!badge_ids.count(b.id))
                problems.push_back("summary " + key + " references unknown badge " + b.id);
        }
    }

    return problems;
}
