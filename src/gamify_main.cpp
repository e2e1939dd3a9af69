/*
 * File: src/gamify_main.cpp
 * Project: Gamification Demo API
 * Purpose: Server binary: demo endpoints under /api/demo/*, /api/health, /test
 * Notes:
 *  - Dataset is validated before the acceptor opens; a broken dataset exits 1
 *  - No database integration is linked, so /test reports the module as absent
 * Last updated: 2026-10-19
 */

#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "gamify_http.hpp"
#include "gamify_state.hpp"

int main(int argc, char **argv)
{
    std::vector<std::string> warnings;
    GamifyState state;
    try
    {
        state.config = load_config(argc, argv, warnings);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "ERROR: " << e.what() << "\n";
        print_usage(std::cerr, argv[0]);
        return 2;
    }
    for (const auto &w : warnings)
        std::cerr << "WARN: " << w << "\n";

    const auto problems = validate_dataset(state.data);
    if (!problems.empty())
    {
        for (const auto &p : problems)
            std::cerr << "ERROR: demo dataset: " << p << "\n";
        return 1;
    }

    const GamifyConfig &cfg = state.config;
    boost::asio::io_context ioc{cfg.threads};

    std::unique_ptr<HttpServer> server;
    try
    {
        boost::asio::ip::tcp::endpoint ep{boost::asio::ip::make_address(cfg.host), cfg.port};
        server = std::make_unique<HttpServer>(ioc, ep, state);
    }
    catch (const std::exception &e)
    {
        std::cerr << "ERROR: cannot listen on " << cfg.host << ":" << cfg.port << ": " << e.what() << "\n";
        return 1;
    }

    std::cout << cfg.title << " " << cfg.version << " listening http=" << cfg.host << ":" << cfg.port
              << " threads=" << cfg.threads
              << " database=" << (state.database ? "linked" : "none") << "\n";

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc](const boost::system::error_code &, int)
                       { ioc.stop(); });

    std::vector<std::thread> workers;
    for (int i = 1; i < cfg.threads; ++i)
        workers.emplace_back([&ioc]
                             { ioc.run(); });
    ioc.run();
    for (auto &t : workers)
        t.join();

    std::cout << "shutdown\n";
    return 0;
}
