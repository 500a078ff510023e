/*
 * File: include/common/transport.hpp
 * Project: Drum HUD Transport Hub
 * Purpose: Transport state record, field coercion and snapshot JSON
 * Notes:
 *  - Snapshots are the only form of the state handed out of the store
 *  - t_host is stamped by the store, never by a client
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>


struct TransportState
{
    bool playing = false;
    int bar = 1;
    int beat = 1;
    double bpm = 120.0;
    double ppq = 0.0;
    int ts_num = 4;
    int ts_den = 4;
    double t_host = 0.0; // server clock, seconds since epoch

    // Restores the invariants after raw writes. Zero/negative/non-finite bpm
    // falls back to 120, ppq below zero (or not finite) collapses to 0.
    void clamp()
    {
        bar = std::max(1, bar);
        beat = std::max(1, beat);
        if (!std::isfinite(bpm) || bpm <= 0.0)
            bpm = 120.0;
        if (!std::isfinite(ppq) || ppq < 0.0)
            ppq = 0.0;
        ts_num = std::max(1, ts_num);
        ts_den = std::max(1, ts_den);
    }
};


struct Snapshot
{
    TransportState transport;
    std::string active_project_id;
};


// Numbers as-is, booleans as 0/1, numeric strings parsed. Anything else
// (null, arrays, objects, garbage text) has no numeric value.
inline std::optional<double> json_number(const nlohmann::json &v)
{
    if (v.is_number())
        return v.get<double>();
    if (v.is_boolean())
        return v.get<bool>() ? 1.0 : 0.0;
    if (!v.is_string())
        return std::nullopt;

    const auto &s = v.get_ref<const std::string &>();
    const char *begin = s.c_str();
    char *end = nullptr;
    double d = std::strtod(begin, &end);
    if (end == begin)
        return std::nullopt;
    while (*end && std::isspace(static_cast<unsigned char>(*end)))
        ++end;
    if (*end != '\0')
        return std::nullopt;
    return d;
}

inline bool json_flag(const nlohmann::json &v)
{
    if (v.is_boolean())
        return v.get<bool>();
    if (v.is_number())
        return v.get<double>() != 0.0;
    if (v.is_string())
    {
        std::string s = v.get<std::string>();
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s == "true" || s == "1" || s == "yes" || s == "on";
    }
    return false;
}

// Truncates toward zero like a float->int cast, saturating at the int range.
// Missing values map to 0 so the clamp step lifts them to the minimum.
inline int json_int(const nlohmann::json &v)
{
    auto d = json_number(v);
    if (!d || std::isnan(*d))
        return 0;
    const double lo = static_cast<double>(std::numeric_limits<int>::min());
    const double hi = static_cast<double>(std::numeric_limits<int>::max());
    return static_cast<int>(std::clamp(std::trunc(*d), lo, hi));
}

inline double json_real(const nlohmann::json &v)
{
    return json_number(v).value_or(0.0);
}

// Overwrites every recognised field present in `fields`. Unknown keys and
// non-object input are ignored. Returns how many fields were written.
inline std::size_t apply_transport_fields(TransportState &st, const nlohmann::json &fields)
{
    if (!fields.is_object())
        return 0;

    std::size_t n = 0;
    for (auto it = fields.begin(); it != fields.end(); ++it)
    {
        const std::string &k = it.key();
        const auto &v = it.value();
        if (k == "playing")
            st.playing = json_flag(v);
        else if (k == "bar")
            st.bar = json_int(v);
        else if (k == "beat")
            st.beat = json_int(v);
        else if (k == "bpm")
            st.bpm = json_real(v);
        else if (k == "ppq")
            st.ppq = json_real(v);
        else if (k == "ts_num")
            st.ts_num = json_int(v);
        else if (k == "ts_den")
            st.ts_den = json_int(v);
        else
            continue;
        ++n;
    }
    return n;
}


inline nlohmann::json snapshot_to_json(const Snapshot &s)
{
    const TransportState &t = s.transport;
    return nlohmann::json{
        {"playing", t.playing},
        {"bar", t.bar},
        {"beat", t.beat},
        {"bpm", t.bpm},
        {"ppq", t.ppq},
        {"ts_num", t.ts_num},
        {"ts_den", t.ts_den},
        {"t_host", t.t_host},
        {"activeProjectId", s.active_project_id}};
}

// One immutable payload per broadcast, shared by every recipient.
inline std::shared_ptr<const std::string> serialize_snapshot(const Snapshot &s)
{
    return std::make_shared<const std::string>(snapshot_to_json(s).dump());
}
