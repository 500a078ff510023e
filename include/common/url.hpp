/*
 * File: include/common/url.hpp
 * Project: Drum HUD Transport Hub
 * Purpose: Minimal http:// / ws:// URL splitting for the example clients
 * Last updated: 2026-10-19
 */

#pragma once
#include <string>


struct UrlParts
{
    std::string host;
    std::string port;
    std::string target;
};

// expect scheme://host[:port][/path]; missing port -> default_port,
// missing path -> "/"
inline UrlParts parse_url(const std::string &url, const std::string &default_port = "80")
{
    UrlParts u;
    auto scheme_pos = url.find("://");
    auto rest = (scheme_pos == std::string::npos) ? url : url.substr(scheme_pos + 3);
    auto slash = rest.find('/');
    std::string hp = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    u.target = (slash == std::string::npos) ? "/" : rest.substr(slash);
    auto colon = hp.find(':');
    if (colon == std::string::npos || colon + 1 == hp.size())
    {
        u.host = hp.substr(0, colon);
        u.port = default_port;
    }
    else
    {
        u.host = hp.substr(0, colon);
        u.port = hp.substr(colon + 1);
    }
    return u;
}
