/*
 * File: tests/test_support.hpp
 * Project: Drum HUD Transport Hub
 * Purpose: Shared fixtures: scratch project directories, recording observers
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>
#include "common/project.hpp"
#include "hud_observers.hpp"

namespace fs = std::filesystem;

// Scratch directory under the system temp dir, removed on destruction.
struct TempDir
{
    fs::path path;

    TempDir()
    {
        std::random_device rd;
        path = fs::temp_directory_path() / ("drumhud_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        fs::create_directories(path);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    fs::path write(const std::string &name, const std::string &content) const
    {
        fs::path p = path / name;
        std::ofstream f(p, std::ios::binary | std::ios::trunc);
        f << content;
        return p;
    }
};

inline ProjectInfo make_project(const std::string &id, std::optional<double> bpm = std::nullopt,
                                std::optional<std::string> ts = std::nullopt)
{
    nlohmann::json meta = nlohmann::json::object();
    meta["title"] = "Title of " + id;
    meta["artist"] = "Artist of " + id;
    if (bpm)
        meta["bpm"] = *bpm;
    if (ts)
        meta["timeSig"] = *ts;
    return parse_project(nlohmann::json{{"id", id}, {"meta", meta}}, id);
}

// Three-project catalog: "default" (120, 4/4), "waltz" (90, 3/4), "bare" (no metadata).
inline ProjectCatalog sample_catalog()
{
    ProjectCatalog c;
    c.add(make_project("default", 120.0, std::string("4/4")));
    c.add(make_project("waltz", 90.0, std::string("3/4")));
    c.add(make_project("bare"));
    return c;
}

struct RecordingObserver : Observer
{
    std::mutex mtx;
    std::vector<std::shared_ptr<const std::string>> received;
    std::atomic<bool> fail{false};
    std::atomic<int> attempts{0};

    void deliver(const std::shared_ptr<const std::string> &payload) override
    {
        ++attempts;
        if (fail)
            throw DeliveryError("peer gone");
        std::scoped_lock lk(mtx);
        received.push_back(payload);
    }

    std::size_t count()
    {
        std::scoped_lock lk(mtx);
        return received.size();
    }

    nlohmann::json last()
    {
        std::scoped_lock lk(mtx);
        return nlohmann::json::parse(*received.back());
    }
};
