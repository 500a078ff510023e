/*
 * File: clients/transport_client/transport_client_main.cpp
 * Project: Drum HUD Transport Hub
 * Purpose: Example controller: plays a fake transport into POST /api/state
 * Notes:
 *  - Bar/beat/ppq derived from elapsed time at a fixed tempo, 960 ticks per quarter
 *  - --select issues one POST /api/select before streaming
 * Last updated: 2026-10-19
 */

#include <iostream>
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include <nlohmann/json.hpp>
#include <chrono>
#include <algorithm>
#include <cmath>
#include <string>
#include <thread>
#include "common/url.hpp"

namespace http = boost::beast::http;
using json = nlohmann::json;

static http::response<http::string_body> post_json(boost::asio::io_context &ioc,
                                                   const boost::asio::ip::tcp::resolver::results_type &results,
                                                   const std::string &host, const std::string &target, const json &body)
{
    boost::asio::ip::tcp::socket sock{ioc};
    boost::asio::connect(sock, results.begin(), results.end());
    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::content_type, "application/json");
    req.body() = body.dump();
    req.prepare_payload();
    http::write(sock, req);
    boost::beast::flat_buffer buf;
    http::response<http::string_body> res;
    http::read(sock, buf, res);
    boost::system::error_code ignored;
    sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    return res;
}

int main(int argc, char **argv)
{
    std::string base = "http://localhost:8765";
    std::string select;
    double bpm = 120.0;
    int ts_num = 4;
    int rate_hz = 20;
    int seconds = 10;
    bool quiet = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            base = argv[++i];
        else if (a == "--select" && i + 1 < argc)
            select = argv[++i];
        else if (a == "--bpm" && i + 1 < argc)
            bpm = std::stod(argv[++i]);
        else if (a == "--beats-per-bar" && i + 1 < argc)
            ts_num = std::stoi(argv[++i]);
        else if (a == "--rate" && i + 1 < argc)
            rate_hz = std::max(1, std::stoi(argv[++i]));
        else if (a == "--seconds" && i + 1 < argc)
            seconds = std::stoi(argv[++i]);
        else if (a == "--quiet")
            quiet = true;
    }

    try
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto url = parse_url(base);
        const std::string &host = url.host;
        auto results = res.resolve(host, url.port);

        if (!select.empty())
        {
            auto r = post_json(ioc, results, host, "/api/select", json{{"projectId", select}});
            std::cout << "[transport_client] select " << select << " status=" << r.result_int() << " " << r.body() << std::endl;
            if (r.result() != http::status::ok)
                return 1;
        }

        const auto t0 = std::chrono::steady_clock::now();
        const auto period = std::chrono::milliseconds(1000 / rate_hz);
        for (int k = 0; k < seconds * rate_hz; ++k)
        {
            double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
            double qn = elapsed * bpm / 60.0;
            json j{{"playing", true},
                   {"bar", static_cast<int>(std::floor(qn / ts_num)) + 1},
                   {"beat", static_cast<int>(std::floor(std::fmod(qn, ts_num))) + 1},
                   {"bpm", bpm},
                   {"ppq", qn * 960.0},
                   {"ts_num", ts_num},
                   {"ts_den", 4}};
            auto r = post_json(ioc, results, host, "/api/state", j);
            if (!quiet)
                std::cout << "[transport_client] status=" << r.result_int() << " " << r.body() << std::endl;
            std::this_thread::sleep_for(period);
        }

        post_json(ioc, results, host, "/api/state", json{{"playing", false}});
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "transport_client error: " << e.what() << "\n";
        return 1;
    }
}
