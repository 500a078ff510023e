/*
 * File: include/common/project.hpp
 * Project: Drum HUD Transport Hub
 * Purpose: Project catalog loaded from JSON project definitions
 * Notes:
 *  - Read-only after start-up; shared by the store and the router
 *  - Malformed entries are skipped, never fatal
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/transport.hpp"


struct ProjectInfo
{
    std::string id;
    std::string display_name;
    std::string artist;
    std::optional<double> bpm;     // declared tempo, positive when present
    std::optional<std::string> time_sig; // raw "N/D" as declared
    nlohmann::json document;       // the whole definition, served by /api/project
    std::string path;
};


// Whole decimal integer with optional sign and surrounding blanks. Values
// below 1 are accepted here; clamp() lifts them later. Out of int range is
// malformed.
inline std::optional<int> parse_int_field(const std::string &s)
{
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a])))
        ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1])))
        --b;
    if (a < b && s[a] == '+')
        ++a;
    if (a == b)
        return std::nullopt;
    int v = 0;
    auto [ptr, ec] = std::from_chars(s.data() + a, s.data() + b, v);
    if (ec != std::errc() || ptr != s.data() + b)
        return std::nullopt;
    return v;
}

// "3/4" -> {3, 4}. Only the first two slash-separated fields count
// ("6/8/x" -> {6, 8}); if either is not an integer the string is malformed.
inline std::optional<std::pair<int, int>> parse_time_signature(const std::string &s)
{
    auto slash = s.find('/');
    if (slash == std::string::npos)
        return std::nullopt;
    auto rest = s.substr(slash + 1);
    auto num = parse_int_field(s.substr(0, slash));
    auto den = parse_int_field(rest.substr(0, rest.find('/')));
    if (!num || !den)
        return std::nullopt;
    return std::make_pair(*num, *den);
}

// Seeds tempo and meter from project metadata. Fields the project does not
// declare (or declares badly) keep whatever `st` already holds.
inline void apply_project_metadata(TransportState &st, const ProjectInfo &p)
{
    if (p.bpm)
        st.bpm = *p.bpm;
    if (p.time_sig)
    {
        if (auto ts = parse_time_signature(*p.time_sig))
        {
            st.ts_num = ts->first;
            st.ts_den = ts->second;
        }
    }
}


inline std::string json_string_or(const nlohmann::json &obj, const char *key, const std::string &fallback)
{
    if (obj.is_object())
    {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_string() && !it->get_ref<const std::string &>().empty())
            return it->get<std::string>();
    }
    return fallback;
}

// Builds a catalog entry from a parsed definition. Throws std::runtime_error
// when the document cannot describe a project.
inline ProjectInfo parse_project(const nlohmann::json &doc, const std::string &fallback_id)
{
    if (!doc.is_object())
        throw std::runtime_error("project definition is not a JSON object");

    ProjectInfo p;
    p.id = json_string_or(doc, "id", fallback_id);
    if (p.id.empty())
        throw std::runtime_error("project has no id");

    static const nlohmann::json no_meta = nlohmann::json::object();
    auto mit = doc.find("meta");
    const nlohmann::json &meta = (mit != doc.end() && mit->is_object()) ? *mit : no_meta;

    p.display_name = json_string_or(meta, "title", json_string_or(doc, "title", p.id));
    p.artist = json_string_or(meta, "artist", json_string_or(doc, "artist", ""));

    // bpm wins over tempo unless it is missing or zero
    for (const char *key : {"bpm", "tempo"})
    {
        auto it = meta.find(key);
        if (it == meta.end())
            continue;
        auto v = json_number(*it);
        if (v && std::isfinite(*v) && *v > 0.0)
        {
            p.bpm = *v;
            break;
        }
    }

    auto ts = meta.find("timeSig");
    if (ts != meta.end() && ts->is_string())
        p.time_sig = ts->get<std::string>();

    p.document = doc;
    return p;
}


class ProjectCatalog
{
    std::map<std::string, ProjectInfo> by_id_;
    std::vector<std::string> order_; // load order, used for listing

public:
    // False when the id is already taken; the existing entry wins.
    bool add(ProjectInfo p)
    {
        if (by_id_.count(p.id))
            return false;
        order_.push_back(p.id);
        std::string id = p.id;
        by_id_.emplace(std::move(id), std::move(p));
        return true;
    }

    const ProjectInfo *find(const std::string &id) const
    {
        auto it = by_id_.find(id);
        return it == by_id_.end() ? nullptr : &it->second;
    }

    bool contains(const std::string &id) const { return by_id_.count(id) != 0; }
    bool empty() const { return order_.empty(); }
    std::size_t size() const { return order_.size(); }
    const std::vector<std::string> &ids() const { return order_; }

    nlohmann::json list_json() const
    {
        auto out = nlohmann::json::array();
        for (const auto &id : order_)
        {
            const ProjectInfo &p = by_id_.at(id);
            out.push_back({{"id", p.id}, {"displayName", p.display_name}, {"artist", p.artist}});
        }
        return out;
    }

    // Loads one file, or every *.json directly inside a directory, in path
    // order. Bad files are reported on stderr and skipped.
    static ProjectCatalog load(const std::filesystem::path &source)
    {
        namespace fs = std::filesystem;
        std::error_code ec;
        if (!fs::exists(source, ec))
            throw std::runtime_error("project source not found: " + source.string());

        std::vector<fs::path> files;
        if (fs::is_directory(source, ec))
        {
            for (const auto &e : fs::directory_iterator(source, ec))
            {
                if (e.is_regular_file() && e.path().extension() == ".json")
                    files.push_back(e.path());
            }
            if (ec)
                throw std::runtime_error("cannot list " + source.string() + ": " + ec.message());
            std::sort(files.begin(), files.end());
        }
        else
        {
            files.push_back(source);
        }

        ProjectCatalog cat;
        for (const auto &f : files)
        {
            try
            {
                std::ifstream in(f);
                if (!in)
                    throw std::runtime_error("cannot open file");
                std::ostringstream ss;
                ss << in.rdbuf();
                auto info = parse_project(nlohmann::json::parse(ss.str()), f.stem().string());
                info.path = f.string();
                if (!cat.add(info))
                    std::cerr << "WARN: skipping " << f.string() << ": duplicate project id '" << info.id << "'\n";
            }
            catch (const std::exception &e)
            {
                std::cerr << "WARN: skipping " << f.string() << ": " << e.what() << "\n";
            }
        }
        return cat;
    }
};
