/*
 * File: tests/test_config.cpp
 * Project: Drum HUD Transport Hub
 * Purpose: Command line and environment configuration
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include <map>
#include "hud_config.hpp"
#include "test_support.hpp"

namespace
{
EnvLookup fake_env(std::map<std::string, std::string> vars)
{
    return [vars](const std::string &k) -> std::optional<std::string>
    {
        auto it = vars.find(k);
        if (it == vars.end())
            return std::nullopt;
        return it->second;
    };
}

HudConfig parse(std::vector<std::string> args, std::map<std::string, std::string> env = {})
{
    args.insert(args.begin(), "drumhud");
    std::vector<char *> argv;
    for (auto &a : args)
        argv.push_back(a.data());
    return parse_config(static_cast<int>(argv.size()), argv.data(), fake_env(std::move(env)));
}
} // namespace


TEST_CASE("defaults"){
auto c = parse({});
REQUIRE(c.host == "0.0.0.0");
REQUIRE(c.port == 8765);
REQUIRE(c.projects == "projects");
REQUIRE(c.project.empty());
REQUIRE_FALSE(c.help);
}

TEST_CASE("environment overrides defaults, flags override environment"){
std::map<std::string, std::string> env{{"DRUMHUD_HOST", "127.0.0.1"}, {"DRUMHUD_PORT", "9000"},
                                       {"DRUMHUD_PROJECTS", "/srv/songs"}, {"DRUMHUD_PROJECT", "waltz"}};
auto c = parse({}, env);
REQUIRE(c.host == "127.0.0.1");
REQUIRE(c.port == 9000);
REQUIRE(c.projects == "/srv/songs");
REQUIRE(c.project == "waltz");

c = parse({"--port", "9100", "--project", "rock"}, env);
REQUIRE(c.port == 9100);
REQUIRE(c.project == "rock");
REQUIRE(c.host == "127.0.0.1");
}

TEST_CASE("bad options are rejected"){
REQUIRE_THROWS_AS(parse({"--port", "http"}), ConfigError);
REQUIRE_THROWS_AS(parse({"--port", "70000"}), ConfigError);
REQUIRE_THROWS_AS(parse({"--port", "80x"}), ConfigError);
REQUIRE_THROWS_AS(parse({"--projects"}), ConfigError);
REQUIRE_THROWS_AS(parse({"--verbose"}), ConfigError);
REQUIRE_THROWS_AS(parse({}, {{"DRUMHUD_PORT", "-1"}}), ConfigError);
}

TEST_CASE("help flag"){
REQUIRE(parse({"--help"}).help);
REQUIRE(hud_usage().find("--projects") != std::string::npos);
}

TEST_CASE("project may name a definition file"){
TempDir d;
fs::create_directories(d.path / "songs");
d.write("songs/rock.json", R"({"meta":{"title":"Rock","bpm":128}})");
auto solo = d.write("seven_nation_army.json", R"({"meta":{"title":"Seven Nation Army","bpm":124,"timeSig":"4/4"}})");

auto c = parse({"--projects", (d.path / "songs").string()}, {{"DRUMHUD_PROJECT", solo.string()}});
auto cat = load_configured_catalog(c);
REQUIRE(c.project == "seven_nation_army");
REQUIRE(cat.size() == 2);
REQUIRE(cat.contains("rock"));
REQUIRE(cat.find("seven_nation_army")->bpm == 124.0);

auto alone = parse({"--projects", (d.path / "missing").string(), "--project", solo.string()});
auto cat2 = load_configured_catalog(alone);
REQUIRE(cat2.ids() == std::vector<std::string>{"seven_nation_army"});
REQUIRE(alone.project == "seven_nation_army");
}

TEST_CASE("project ids and bad project files"){
TempDir d;
d.write("rock.json", R"({"meta":{"title":"Rock"}})");
auto bad = d.write("broken.json.json", "{ nope");

auto c = parse({"--projects", d.path.string(), "--project", "rock"});
auto cat = load_configured_catalog(c);
REQUIRE(c.project == "rock");
REQUIRE(cat.contains("rock"));

auto b = parse({"--projects", (d.path / "missing").string(), "--project", bad.string()});
REQUIRE_THROWS_AS(load_configured_catalog(b), ConfigError);
}
