/*
 * File: src/hud_main.cpp
 * Project: Drum HUD Transport Hub
 * Purpose: Main server binary: /api/* endpoints and /ws/state observers
 * Notes:
 *  - Single-threaded io_context; the store still locks for its own sake
 * Last updated: 2026-10-19
 */

#include <csignal>
#include <iostream>
#include <boost/asio.hpp>
#include "hud_config.hpp"
#include "hud_http.hpp"
#include "hud_state.hpp"

int main(int argc, char **argv)
{
    HudConfig cfg;
    try
    {
        cfg = parse_config(argc, argv);
    }
    catch (const ConfigError &e)
    {
        std::cerr << "drumhud: " << e.what() << "\n" << hud_usage();
        return 1;
    }
    if (cfg.help)
    {
        std::cout << hud_usage();
        return 0;
    }

    try
    {
        auto catalog = load_configured_catalog(cfg);
        if (catalog.empty())
            throw std::runtime_error("no usable projects in " + cfg.projects);

        boost::asio::io_context ioc{1};
        HudState state{std::move(catalog), cfg.project};

        boost::asio::ip::tcp::endpoint ep{boost::asio::ip::make_address(cfg.host), cfg.port};
        HttpServer http{ioc, ep, state};

        boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
        signals.async_wait([&ioc](const boost::system::error_code &ec, int sig)
                           {
            if (ec) return;
            std::cout << "caught signal " << sig << ", shutting down\n";
            ioc.stop(); });

        std::cout << "drumhud listening http=" << cfg.host << ":" << http.local_endpoint().port()
                  << " ws=/ws/state projects=" << state.catalog.size()
                  << " active=" << state.store.active_project_id() << "\n";

        ioc.run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "drumhud: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
