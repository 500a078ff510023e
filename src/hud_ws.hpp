/*
 * File: src/hud_ws.hpp
 * Project: Drum HUD Transport Hub
 * Purpose: WebSocket observer sessions on /ws/state
 * Notes:
 *  - CONNECTING -> ACTIVE -> CLOSED, deregistered exactly once on close
 *  - Welcome snapshot goes to the new session only
 *  - Beast keep-alive pings detect dead peers
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <deque>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include "hud_state.hpp"

namespace websocket = boost::beast::websocket;

// Application-level liveness probe: "ping" in any case, padding ignored.
inline bool is_ping_message(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    if (s.size() != 4)
        return false;
    return std::equal(s.begin(), s.end(), "ping",
                      [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) == b; });
}

class WsSession : public Observer, public std::enable_shared_from_this<WsSession>
{
public:
    enum class Phase
    {
        connecting,
        active,
        closed
    };

    static constexpr std::size_t max_queued = 64;

    WsSession(boost::asio::ip::tcp::socket &&s, HudState &st)
        : ws_(std::move(s)), state_(st)
    {
        boost::system::error_code ec;
        auto ep = ws_.next_layer().remote_endpoint(ec);
        peer_ = ec ? std::string("?") : ep.address().to_string() + ":" + std::to_string(ep.port());
    }

    // Takes over the upgrade request read by the HTTP session.
    void run(boost::beast::http::request<boost::beast::http::string_body> req)
    {
        ws_.set_option(websocket::stream_base::timeout{
            std::chrono::seconds(30), // handshake
            std::chrono::seconds(20), // idle, then ping
            true});
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type &res)
                                                         { res.set(boost::beast::http::field::server, "drumhud-beast"); }));
        auto self = shared_from_this();
        ws_.async_accept(req, [self](boost::beast::error_code ec)
                         { self->on_accept(ec); });
    }

    void deliver(const std::shared_ptr<const std::string> &payload) override
    {
        if (phase_.load() == Phase::closed)
            throw DeliveryError("connection closed");
        if (queued_.fetch_add(1) >= max_queued)
        {
            queued_.fetch_sub(1);
            auto self = shared_from_this();
            boost::asio::post(ws_.get_executor(), [self]
                              { self->close_session("send queue full"); });
            throw DeliveryError("send queue full");
        }
        auto self = shared_from_this();
        boost::asio::post(ws_.get_executor(), [self, payload]
                          { self->on_send(payload); });
    }

    std::string describe() const override { return "ws " + peer_; }

private:
    websocket::stream<boost::asio::ip::tcp::socket> ws_;
    boost::beast::flat_buffer buffer_;
    HudState &state_;
    std::string peer_;
    std::atomic<Phase> phase_{Phase::connecting};
    std::atomic<std::size_t> queued_{0};
    std::deque<std::shared_ptr<const std::string>> queue_;
    ObserverHandle handle_ = 0;

    void on_accept(boost::beast::error_code ec)
    {
        if (ec)
        {
            std::cerr << "WARN: ws handshake from " << peer_ << " failed: " << ec.message() << "\n";
            return close_session("handshake failed");
        }
        phase_ = Phase::active;
        handle_ = state_.observers.add(shared_from_this());
        std::cout << "observer #" << handle_ << " connected from " << peer_
                  << " (" << state_.observers.size() << " total)\n";

        // point-to-point welcome, not a broadcast
        ++queued_;
        on_send(serialize_snapshot(state_.store.snapshot()));
        do_read();
    }

    void do_read()
    {
        auto self = shared_from_this();
        ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t)
                       { self->on_read(ec); });
    }

    void on_read(boost::beast::error_code ec)
    {
        if (ec)
            return close_session(ec == websocket::error::closed ? "remote close" : ec.message());

        if (ws_.got_text() && is_ping_message(boost::beast::buffers_to_string(buffer_.data())))
        {
            static const auto pong = std::make_shared<const std::string>("pong");
            ++queued_;
            on_send(pong);
        }
        buffer_.consume(buffer_.size());
        do_read();
    }

    // Runs on the stream's executor; `queued_` was already counted.
    void on_send(std::shared_ptr<const std::string> payload)
    {
        if (phase_.load() == Phase::closed)
        {
            --queued_;
            return;
        }
        queue_.push_back(std::move(payload));
        if (queue_.size() > 1)
            return; // a write is in flight
        do_write();
    }

    void do_write()
    {
        ws_.text(true);
        auto self = shared_from_this();
        ws_.async_write(boost::asio::buffer(*queue_.front()), [self](boost::beast::error_code ec, std::size_t)
                        { self->on_write(ec); });
    }

    void on_write(boost::beast::error_code ec)
    {
        queue_.pop_front();
        --queued_;
        if (ec)
            close_session("write failed: " + ec.message());
        if (phase_.load() == Phase::closed)
        {
            queued_ -= queue_.size();
            queue_.clear();
            return;
        }
        if (!queue_.empty())
            do_write();
    }

    void close_session(const std::string &why)
    {
        if (phase_.exchange(Phase::closed) == Phase::closed)
            return;
        if (handle_ != 0 && state_.observers.remove(handle_))
            std::cout << "observer #" << handle_ << " disconnected (" << why << ")\n";

        // a pending write, if any, drains the queue when it is cancelled
        boost::system::error_code ignored;
        ws_.next_layer().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
        ws_.next_layer().close(ignored);
    }
};
