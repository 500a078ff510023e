/*
 * File: src/hud_config.hpp
 * Project: Drum HUD Transport Hub
 * Purpose: Command line / environment configuration for the hub
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include "common/project.hpp"


struct ConfigError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct HudConfig
{
    std::string host = "0.0.0.0";
    unsigned short port = 8765;
    std::string projects = "projects"; // directory of *.json, or one file
    std::string project;               // initial active id or a project .json file, empty = first loaded
    bool help = false;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

inline std::optional<std::string> process_env(const std::string &name)
{
    const char *v = std::getenv(name.c_str());
    if (!v || !*v)
        return std::nullopt;
    return std::string(v);
}

inline unsigned short parse_port(const std::string &s)
{
    std::size_t used = 0;
    int p = -1;
    try
    {
        p = std::stoi(s, &used);
    }
    catch (const std::exception &)
    {
        used = 0;
    }
    if (used == 0 || used != s.size() || p < 0 || p > 65535)
        throw ConfigError("invalid port '" + s + "'");
    return static_cast<unsigned short>(p);
}

inline std::string hud_usage()
{
    return "usage: drumhud [--host ADDR] [--port N] [--projects DIR|FILE] [--project ID]\n"
           "  env: DRUMHUD_HOST, DRUMHUD_PORT, DRUMHUD_PROJECTS, DRUMHUD_PROJECT\n";
}

// Flags win over the environment, the environment over built-in defaults.
inline HudConfig parse_config(int argc, char **argv, const EnvLookup &env = process_env)
{
    HudConfig cfg;
    if (auto v = env("DRUMHUD_HOST"))
        cfg.host = *v;
    if (auto v = env("DRUMHUD_PORT"))
        cfg.port = parse_port(*v);
    if (auto v = env("DRUMHUD_PROJECTS"))
        cfg.projects = *v;
    if (auto v = env("DRUMHUD_PROJECT"))
        cfg.project = *v;

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            cfg.help = true;
            continue;
        }
        if (a != "--host" && a != "--port" && a != "--projects" && a != "--project")
            throw ConfigError("unknown option '" + a + "'");
        if (i + 1 >= argc)
            throw ConfigError("option '" + a + "' needs a value");
        std::string v = argv[++i];
        if (a == "--host")
            cfg.host = v;
        else if (a == "--port")
            cfg.port = parse_port(v);
        else if (a == "--projects")
            cfg.projects = v;
        else
            cfg.project = v;
    }
    return cfg;
}

// --project / DRUMHUD_PROJECT may name a project file instead of an id, as
// single-project deployments do. That file joins the catalog (the projects
// source is optional then) and its id becomes the initial project.
inline ProjectCatalog load_configured_catalog(HudConfig &cfg)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path file(cfg.project);
    if (cfg.project.empty() || file.extension() != ".json" || !fs::is_regular_file(file, ec))
        return ProjectCatalog::load(cfg.projects);

    ProjectCatalog cat;
    if (fs::exists(cfg.projects, ec))
        cat = ProjectCatalog::load(cfg.projects);
    else
        std::cerr << "WARN: project source " << cfg.projects << " not found, serving " << cfg.project << " only\n";

    ProjectCatalog single = ProjectCatalog::load(file);
    if (single.empty())
        throw ConfigError("project file " + cfg.project + " is not a usable project");
    const ProjectInfo &p = *single.find(single.ids().front());
    if (!cat.add(p))
        std::cerr << "WARN: " << cfg.project << " has id '" << p.id << "', already in the catalog; using the catalog entry\n";
    cfg.project = p.id;
    return cat;
}
