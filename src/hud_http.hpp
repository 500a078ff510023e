/*
 * File: src/hud_http.hpp
 * Project: Drum HUD Transport Hub
 * Purpose: HTTP routing and handlers, WebSocket upgrade on /ws/state
 * Notes:
 *  - Malformed request bodies count as an empty update
 *  - Only an unknown project id is reported back as an error (404)
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "hud_state.hpp"
#include "hud_ws.hpp"

namespace http = boost::beast::http;

// -------- request helpers --------

// "/api/state?x=1" -> "/api/state"
inline std::string target_path(boost::beast::string_view target)
{
    std::string s(target);
    auto q = s.find('?');
    if (q != std::string::npos)
        s.resize(q);
    return s;
}

// Anything that is not a JSON object is treated as {}.
inline nlohmann::json parse_body_object(const std::string &body)
{
    if (body.empty())
        return nlohmann::json::object();
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
    {
        std::cerr << "WARN: ignoring malformed request body (" << body.size() << " bytes)\n";
        return nlohmann::json::object();
    }
    return j;
}

inline http::response<http::string_body> json_response(http::status st, unsigned version, bool keep_alive,
                                                       const nlohmann::json &body)
{
    http::response<http::string_body> res{st, version};
    res.set(http::field::server, "drumhud-beast");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(keep_alive);
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

inline http::response<http::string_body> handle_request(HudState &state, const http::request<http::string_body> &req)
{
    using nlohmann::json;
    const std::string path = target_path(req.target());
    const bool ka = req.keep_alive();
    auto reply = [&](http::status st, const json &body)
    { return json_response(st, req.version(), ka, body); };

    try
    {
        // GET /api/health
        if (req.method() == http::verb::get && path == "/api/health")
        {
            auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
            return reply(http::status::ok, json{{"ok", true}, {"uptime_s", up}});
        }

        // GET /api/projects
        if (req.method() == http::verb::get && path == "/api/projects")
            return reply(http::status::ok, state.catalog.list_json());

        // GET /api/project  (full definition of the active project)
        if (req.method() == http::verb::get && path == "/api/project")
            return reply(http::status::ok, state.store.active_project().document);

        // GET /api/state
        if (req.method() == http::verb::get && path == "/api/state")
            return reply(http::status::ok, snapshot_to_json(state.store.snapshot()));

        // POST /api/state
        // Body (JSON): any subset of playing, bar, beat, bpm, ppq, ts_num, ts_den
        if (req.method() == http::verb::post && path == "/api/state")
        {
            auto snap = state.store.apply_partial_update(parse_body_object(req.body()));
            return reply(http::status::ok, json{{"ok", true}, {"state", snapshot_to_json(snap)}});
        }

        // POST /api/select
        // Body (JSON): { "projectId": "..." }
        if (req.method() == http::verb::post && path == "/api/select")
        {
            auto body = parse_body_object(req.body());
            std::string id = json_string_or(body, "projectId", "");
            try
            {
                auto snap = state.store.select_project(id);
                std::cout << "active project -> " << id << "\n";
                return reply(http::status::ok, json{{"ok", true}, {"state", snapshot_to_json(snap)}});
            }
            catch (const ProjectNotFound &e)
            {
                return reply(http::status::not_found,
                             json{{"ok", false}, {"error", "project not found"}, {"projectId", e.project_id}});
            }
        }

        // 404 fallback
        return reply(http::status::not_found, json{{"error", "not found"}});
    }
    catch (const std::exception &e)
    {
        return reply(http::status::internal_server_error, json{{"error", "internal error"}, {"what", e.what()}});
    }
}

// -------- HTTP server --------

class HttpServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    HudState &state_;

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, HudState &s)
        : ioc_(ioc), acceptor_(ioc), state_(s)
    {
        boost::system::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (!ec)
            acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (!ec)
            acceptor_.bind(ep, ec);
        if (!ec)
            acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::runtime_error("cannot listen on " + ep.address().to_string() + ":" +
                                     std::to_string(ep.port()) + ": " + ec.message());
        do_accept();
    }

    boost::asio::ip::tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

private:
    void do_accept()
    {
        acceptor_.async_accept(boost::asio::make_strand(ioc_), [this](boost::beast::error_code ec, boost::asio::ip::tcp::socket s)
                               {
            if (!ec) std::make_shared<Session>(std::move(s), state_)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        HudState &state;

        Session(boost::asio::ip::tcp::socket &&s, HudState &st)
            : socket(std::move(s)), state(st) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            req = {};
            http::async_read(socket, buffer, req, [self](boost::beast::error_code ec, std::size_t)
                             {
                if (!ec) self->handle(); });
        }

        void handle()
        {
            if (websocket::is_upgrade(req))
            {
                if (target_path(req.target()) == "/ws/state")
                {
                    std::make_shared<WsSession>(std::move(socket), state)->run(std::move(req));
                    return;
                }
                return respond(json_response(http::status::not_found, req.version(), false,
                                             nlohmann::json{{"error", "not found"}}));
            }
            respond(handle_request(state, req));
        }

        // keep response alive through async_write
        void respond(http::response<http::string_body> &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code ec, std::size_t)
                              {
                if (!ec && !sp->need_eof())
                    return self->do_read();
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }
    };
};
