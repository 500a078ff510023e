/*
 * File: src/hud_observers.hpp
 * Project: Drum HUD Transport Hub
 * Purpose: Observer registry and broadcast fan-out
 * Notes:
 *  - Fan-out walks a copy of the membership, never the live set
 *  - A failing observer is dropped after the pass, others still get the frame
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>


struct DeliveryError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};


// A connected party that wants transport frames.
class Observer
{
public:
    virtual ~Observer() = default;

    // Hands one text frame to the channel. Must not block on the network;
    // throws DeliveryError (or any std::exception) when the channel is dead.
    virtual void deliver(const std::shared_ptr<const std::string> &payload) = 0;

    virtual std::string describe() const { return "observer"; }
};

using ObserverHandle = std::uint64_t;


class ObserverRegistry
{
    mutable std::mutex mtx_;
    std::unordered_map<ObserverHandle, std::shared_ptr<Observer>> members_;
    ObserverHandle next_{1}; // 0 is never handed out

public:
    using Member = std::pair<ObserverHandle, std::shared_ptr<Observer>>;

    ObserverHandle add(std::shared_ptr<Observer> o)
    {
        std::scoped_lock lk(mtx_);
        ObserverHandle h = next_++;
        members_.emplace(h, std::move(o));
        return h;
    }

    // Removing an absent handle is a no-op.
    bool remove(ObserverHandle h)
    {
        std::scoped_lock lk(mtx_);
        return members_.erase(h) != 0;
    }

    std::size_t remove_all(const std::vector<ObserverHandle> &hs)
    {
        if (hs.empty())
            return 0;
        std::scoped_lock lk(mtx_);
        std::size_t n = 0;
        for (auto h : hs)
            n += members_.erase(h);
        return n;
    }

    std::vector<Member> members() const
    {
        std::scoped_lock lk(mtx_);
        return {members_.begin(), members_.end()};
    }

    bool contains(ObserverHandle h) const
    {
        std::scoped_lock lk(mtx_);
        return members_.count(h) != 0;
    }

    std::size_t size() const
    {
        std::scoped_lock lk(mtx_);
        return members_.size();
    }
};


struct FanoutResult
{
    std::size_t attempted = 0;
    std::size_t delivered = 0;
    std::vector<ObserverHandle> dropped;
};

inline FanoutResult fan_out(ObserverRegistry &observers, const std::shared_ptr<const std::string> &payload)
{
    FanoutResult r;
    for (const auto &[h, o] : observers.members())
    {
        ++r.attempted;
        try
        {
            o->deliver(payload);
            ++r.delivered;
        }
        catch (const std::exception &e)
        {
            std::cerr << "WARN: dropping observer #" << h << " (" << o->describe() << "): " << e.what() << "\n";
            r.dropped.push_back(h);
        }
    }
    observers.remove_all(r.dropped);
    return r;
}
