#include <catch2/catch.hpp>

#include "appdirs/core/config.hpp"
#include "appdirs/infra/environment.hpp"

using namespace appdirs;

TEST_CASE("Config ${VAR} resolution", "[core][config]") {
    infra::MapEnvironment env({
        {"HOME", "/home/u"},
        {"TEST_A", "aaa"},
        {"TEST_B", "bbb"},
    });

    SECTION("Resolves existing var") {
        CHECK(resolve_env_refs("${HOME}/cache", env) == "/home/u/cache");
    }

    SECTION("Preserves unresolved vars") {
        CHECK(resolve_env_refs("value=${NONEXISTENT_VAR_12345}", env) ==
              "value=${NONEXISTENT_VAR_12345}");
    }

    SECTION("Handles multiple refs") {
        CHECK(resolve_env_refs("${TEST_A}:${TEST_B}", env) == "aaa:bbb");
    }

    SECTION("No refs returns input unchanged") {
        CHECK(resolve_env_refs("/srv/plain", env) == "/srv/plain");
    }

    SECTION("Empty input") {
        CHECK(resolve_env_refs("", env).empty());
    }

    SECTION("Unterminated ref is literal") {
        CHECK(resolve_env_refs("${HOME", env) == "${HOME");
    }
}

TEST_CASE("Config $${VAR} escaping", "[core][config]") {
    infra::MapEnvironment env;
    env.set("TEST_REAL", "resolved");

    SECTION("Double dollar escapes to literal") {
        CHECK(resolve_env_refs("value=$${LITERAL}", env) == "value=${LITERAL}");
    }

    SECTION("Mixed escaping and resolution") {
        CHECK(resolve_env_refs("$${ESCAPED} and ${TEST_REAL}", env) == "${ESCAPED} and resolved");
    }
}

TEST_CASE("Config ${VAR} resolution reads the process environment", "[core][config]") {
#ifdef _WIN32
    _putenv_s("TEST_APPDIRS_VAR", "hello_world");
#else
    setenv("TEST_APPDIRS_VAR", "hello_world", 1);
#endif
    infra::ProcessEnvironment env;
    CHECK(resolve_env_refs("prefix_${TEST_APPDIRS_VAR}_suffix", env) ==
          "prefix_hello_world_suffix");
}
