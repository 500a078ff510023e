#include <iostream>
#include <string>
#include <boost/asio.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include "common/url.hpp"

using json = nlohmann::json;
namespace websocket = boost::beast::websocket;

int main(int argc, char **argv)
{
    std::string ws_url = "ws://localhost:8765/ws/state";
    bool ping = true;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--ws" && i + 1 < argc)
            ws_url = argv[++i];
        else if (a == "--no-ping")
            ping = false;
    }

    try
    {
        // connect WS and print incoming snapshots
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto url = parse_url(ws_url);
        auto const results = res.resolve(url.host, url.port);
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        websocket::stream<boost::asio::ip::tcp::socket> ws{std::move(sock)};
        ws.handshake(url.host, url.target);
        if (ping)
        {
            ws.text(true);
            ws.write(boost::asio::buffer(std::string("ping")));
        }

        boost::beast::flat_buffer buf;
        while (true)
        {
            ws.read(buf);
            auto s = boost::beast::buffers_to_string(buf.data());
            buf.consume(buf.size());
            auto j = json::parse(s, nullptr, false);
            if (j.is_object())
                std::cout << "hud: bar " << j.value("bar", 0) << " beat " << j.value("beat", 0)
                          << " @" << j.value("bpm", 0.0) << " " << j.value("ts_num", 0) << "/" << j.value("ts_den", 0)
                          << (j.value("playing", false) ? " playing" : " stopped")
                          << " [" << j.value("activeProjectId", std::string()) << "]\n";
            else
                std::cout << "hud got: " << s << "\n";
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "hud_client error: " << e.what() << "\n";
        return 1;
    }
}
