#include <catch2/catch.hpp>

#include <cstdlib>

#include "appdirs/infra/environment.hpp"

using appdirs::infra::MapEnvironment;
using appdirs::infra::ProcessEnvironment;

TEST_CASE("MapEnvironment get/set/unset", "[infra][environment]") {
    MapEnvironment env;
    CHECK_FALSE(env.get("XDG_CONFIG_HOME").has_value());

    env.set("XDG_CONFIG_HOME", "/home/u/.config");
    REQUIRE(env.get("XDG_CONFIG_HOME").has_value());
    CHECK(*env.get("XDG_CONFIG_HOME") == "/home/u/.config");

    env.set("XDG_CONFIG_HOME", "");
    REQUIRE(env.get("XDG_CONFIG_HOME").has_value());
    CHECK(env.get("XDG_CONFIG_HOME")->empty());

    env.unset("XDG_CONFIG_HOME");
    CHECK_FALSE(env.get("XDG_CONFIG_HOME").has_value());
}

TEST_CASE("MapEnvironment home_dir reads HOME", "[infra][environment]") {
    MapEnvironment env;
    CHECK_FALSE(env.home_dir().has_value());

    env.set("HOME", "");
    CHECK_FALSE(env.home_dir().has_value());

    env.set("HOME", "/home/alice");
    REQUIRE(env.home_dir().has_value());
    CHECK(env.home_dir()->string() == "/home/alice");
}

TEST_CASE("ProcessEnvironment reads the process", "[infra][environment]") {
#ifdef _WIN32
    _putenv_s("TEST_APPDIRS_ENV", "value");
#else
    setenv("TEST_APPDIRS_ENV", "value", 1);
#endif
    ProcessEnvironment env;
    REQUIRE(env.get("TEST_APPDIRS_ENV").has_value());
    CHECK(*env.get("TEST_APPDIRS_ENV") == "value");
    CHECK_FALSE(env.get("TEST_APPDIRS_ENV_UNSET_12345").has_value());
}

TEST_CASE("ProcessEnvironment finds a home directory", "[infra][environment]") {
    ProcessEnvironment env;
    auto home = env.home_dir();
    REQUIRE(home.has_value());
    CHECK_FALSE(home->empty());
    CHECK(home->is_absolute());
}
