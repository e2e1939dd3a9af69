/*
 * File: src/gamify_config.hpp
 * Project: Gamification Demo API
 * Purpose: Startup configuration from environment and command line
 * Notes:
 *  - Environment first (HOST, PORT), then flags override
 *  - DATABASE_URL / DATABASE_NAME are not read here; /test checks them per request
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>


struct GamifyConfig {
std::string host{"0.0.0.0"};
unsigned short port{8000};
int threads{1};
std::string title{"Gamification Demo API"};
std::string version{"1.0"};
};


inline bool env_is_set(const char *name)
{
    const char *v = std::getenv(name);
    return v && *v;
}

// Strict port parse: digits only, 1..65535.
inline bool parse_port(const std::string &s, unsigned short &out)
{
    if (s.empty() || s.size() > 5)
        return false;
    for (char c : s)
    {
        if (c < '0' || c > '9')
            return false;
    }
    unsigned long v = std::stoul(s);
    if (v == 0 || v > 65535)
        return false;
    out = static_cast<unsigned short>(v);
    return true;
}

// Non-fatal problems (bad env values) are appended to `warnings`.
// Bad command-line values throw std::invalid_argument.
inline GamifyConfig load_config(int argc, char **argv, std::vector<std::string> &warnings)
{
    GamifyConfig cfg;

    if (env_is_set("HOST"))
        cfg.host = std::getenv("HOST");
    if (env_is_set("PORT"))
    {
        const std::string v = std::getenv("PORT");
        if (!parse_port(v, cfg.port))
            warnings.push_back("ignoring invalid PORT=" + v + ", using " + std::to_string(cfg.port));
    }

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        auto value = [&]() -> std::string
        {
            if (i + 1 >= argc)
                throw std::invalid_argument("missing value for " + a);
            return argv[++i];
        };

        if (a == "--host")
            cfg.host = value();
        else if (a == "--port")
        {
            const std::string v = value();
            if (!parse_port(v, cfg.port))
                throw std::invalid_argument("invalid port: " + v);
        }
        else if (a == "--http")
        {
            const std::string v = value();
            auto p = v.rfind(':');
            if (p == std::string::npos || p == 0 || !parse_port(v.substr(p + 1), cfg.port))
                throw std::invalid_argument("expected host:port, got " + v);
            cfg.host = v.substr(0, p);
        }
        else if (a == "--threads")
        {
            const std::string v = value();
            int n = 0;
            try
            {
                size_t used = 0;
                n = std::stoi(v, &used);
                if (used != v.size())
                    n = 0;
            }
            catch (const std::exception &)
            {
                n = 0;
            }
            if (n < 1 || n > 64)
                throw std::invalid_argument("invalid thread count: " + v);
            cfg.threads = n;
        }
        else
            throw std::invalid_argument("unknown argument: " + a);
    }
    return cfg;
}

inline void print_usage(std::ostream &os, const char *prog)
{
    os << "Usage: " << prog << " [--host ADDR] [--port N] [--http ADDR:PORT] [--threads N]\n"
       << "Environment: HOST, PORT (default 0.0.0.0:8000)\n";
}
