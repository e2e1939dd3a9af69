/*
 * File: src/gamify_state.hpp
 * Project: Gamification Demo API
 * Purpose: Process-wide read-only state shared by all HTTP sessions
 * Notes:
 *  - Built once in main before the acceptor starts; sessions only hold const refs
 * Last updated: 2026-10-19
 */

#pragma once
#include <optional>
#include "common/demo_dataset.hpp"
#include "gamify_config.hpp"
#include "db_probe.hpp"


struct GamifyState {
GamifyConfig config;
DemoDataset data = make_demo_dataset();
std::optional<DatabaseModule> database; // empty: no database integration linked
};
