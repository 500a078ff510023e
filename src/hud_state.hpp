/*
 * File: src/hud_state.hpp
 * Project: Drum HUD Transport Hub
 * Purpose: Authoritative transport state store and process-wide state
 * Notes:
 *  - Every mutation, its clamp, snapshot and broadcast run under one lock
 *  - Lock order is store -> registry, never the reverse
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "common/project.hpp"
#include "common/transport.hpp"
#include "hud_observers.hpp"


struct ProjectNotFound : std::runtime_error
{
    explicit ProjectNotFound(const std::string &id)
        : std::runtime_error("project not found: " + id), project_id(id) {}
    std::string project_id;
};


class StateStore
{
    std::mutex mtx_;
    const ProjectCatalog &catalog_;
    ObserverRegistry &observers_;
    TransportState state_;
    std::string active_id_;
    double last_t_host_ = 0.0;

    static double now_seconds()
    {
        using namespace std::chrono;
        return duration<double>(system_clock::now().time_since_epoch()).count();
    }

    Snapshot snapshot_locked()
    {
        state_.clamp();
        // wall clock may step back; snapshots never do
        last_t_host_ = std::max(last_t_host_, now_seconds());
        state_.t_host = last_t_host_;
        return Snapshot{state_, active_id_};
    }

    void broadcast_locked(const Snapshot &s)
    {
        fan_out(observers_, serialize_snapshot(s));
    }

public:
    StateStore(const ProjectCatalog &catalog, ObserverRegistry &observers, const std::string &initial_id)
        : catalog_(catalog), observers_(observers)
    {
        const ProjectInfo *p = catalog_.find(initial_id);
        if (!p)
            throw ProjectNotFound(initial_id);
        active_id_ = p->id;
        apply_project_metadata(state_, *p);
        state_.clamp();
    }

    StateStore(const StateStore &) = delete;
    StateStore &operator=(const StateStore &) = delete;

    Snapshot snapshot()
    {
        std::scoped_lock lk(mtx_);
        return snapshot_locked();
    }

    Snapshot apply_partial_update(const nlohmann::json &fields)
    {
        std::scoped_lock lk(mtx_);
        apply_transport_fields(state_, fields);
        auto snap = snapshot_locked();
        broadcast_locked(snap);
        return snap;
    }

    // Unknown ids throw before anything is touched.
    Snapshot select_project(const std::string &id)
    {
        const ProjectInfo *p = catalog_.find(id);
        if (!p)
            throw ProjectNotFound(id);

        std::scoped_lock lk(mtx_);
        active_id_ = p->id;
        state_.bar = 1;
        state_.beat = 1;
        state_.ppq = 0.0;
        apply_project_metadata(state_, *p);
        auto snap = snapshot_locked();
        broadcast_locked(snap);
        return snap;
    }

    // Pushes an explicit snapshot to every observer; mutations do this on
    // their own.
    void broadcast(const Snapshot &s)
    {
        std::scoped_lock lk(mtx_);
        broadcast_locked(s);
    }

    std::string active_project_id()
    {
        std::scoped_lock lk(mtx_);
        return active_id_;
    }

    // Catalog entries live as long as the catalog and never change.
    const ProjectInfo &active_project()
    {
        std::scoped_lock lk(mtx_);
        return *catalog_.find(active_id_);
    }
};


struct HudState
{
    ProjectCatalog catalog;
    ObserverRegistry observers;
    StateStore store;
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

    // An empty initial id selects the first project in load order.
    HudState(ProjectCatalog c, const std::string &initial_id)
        : catalog(std::move(c)),
          store(catalog, observers, initial_id.empty() && !catalog.empty() ? catalog.ids().front() : initial_id)
    {
    }
};
