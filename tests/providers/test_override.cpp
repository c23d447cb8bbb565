#include <catch2/catch.hpp>

#include <memory>

#include "appdirs/core/deriver.hpp"
#include "appdirs/providers/override.hpp"
#include "appdirs/providers/static_provider.hpp"

using namespace appdirs;
using appdirs::infra::MapEnvironment;
using appdirs::providers::OverrideProvider;
using appdirs::providers::StaticProvider;
using appdirs::providers::make_override_provider;

namespace {

auto fallback() -> std::shared_ptr<StaticProvider> {
    return std::make_shared<StaticProvider>(StaticProvider{
        {DirectoryKind::Cache, "/home/u/.cache"},
        {DirectoryKind::Config, "/home/u/.config"},
    });
}

} // anonymous namespace

TEST_CASE("StaticProvider answers from its table", "[providers][static]") {
    StaticProvider provider;
    CHECK_FALSE(provider.base_path(DirectoryKind::Cache).has_value());

    provider.set(DirectoryKind::Cache, "/c");
    REQUIRE(provider.base_path(DirectoryKind::Cache).has_value());
    CHECK(provider.base_path(DirectoryKind::Cache)->string() == "/c");
    CHECK_FALSE(provider.base_path(DirectoryKind::Config).has_value());
    CHECK(provider.name() == "static");
}

TEST_CASE("OverrideProvider prefers overrides over the fallback", "[providers][override]") {
    OverrideProvider provider({{DirectoryKind::Cache, "/srv/cache"}}, fallback());

    CHECK(provider.base_path(DirectoryKind::Cache)->string() == "/srv/cache");
    CHECK(provider.base_path(DirectoryKind::Config)->string() == "/home/u/.config");
    CHECK_FALSE(provider.base_path(DirectoryKind::Data).has_value());
}

TEST_CASE("OverrideProvider without fallback", "[providers][override]") {
    OverrideProvider provider({{DirectoryKind::Log, "/var/log"}}, nullptr);

    CHECK(provider.base_path(DirectoryKind::Log)->string() == "/var/log");
    CHECK_FALSE(provider.base_path(DirectoryKind::Cache).has_value());
}

TEST_CASE("make_override_provider resolves and filters config", "[providers][override]") {
    MapEnvironment env;
    env.set("HOME", "/home/u");
    env.set("SCRATCH", "/scratch");

    Config config;
    config.overrides["cache"] = "${SCRATCH}/cache";
    config.overrides["data"] = "${HOME}/data";
    config.overrides["config"] = "relative/config";
    config.overrides["music"] = "/srv/music";

    auto provider = make_override_provider(config, Platform::Linux, env, fallback());

    CHECK(provider->base_path(DirectoryKind::Cache)->string() == "/scratch/cache");
    CHECK(provider->base_path(DirectoryKind::Data)->string() == "/home/u/data");
    // Relative override is dropped, the fallback answers.
    CHECK(provider->base_path(DirectoryKind::Config)->string() == "/home/u/.config");
    CHECK_FALSE(provider->base_path(DirectoryKind::Log).has_value());
}

TEST_CASE("make_override_provider checks absoluteness for the target platform",
          "[providers][override]") {
    MapEnvironment env;
    Config config;
    config.overrides["cache"] = "D:\\Cache";

    auto windows = make_override_provider(config, Platform::Windows, env, nullptr);
    CHECK(windows->base_path(DirectoryKind::Cache)->string() == "D:\\Cache");

    auto posix = make_override_provider(config, Platform::Linux, env, nullptr);
    CHECK_FALSE(posix->base_path(DirectoryKind::Cache).has_value());
}

TEST_CASE("overrides flow through the deriver", "[providers][override]") {
    MapEnvironment env;
    Config config;
    config.overrides["cache"] = "/srv/cache";
    config.overrides["favorites"] = "/srv/favorites";

    AppPathDeriver deriver(Platform::Linux,
                           make_override_provider(config, Platform::Linux, env, fallback()));

    CHECK(deriver.cache_dir()->string() == "/srv/cache");
    CHECK(deriver.cache_dir_for("acme")->string() == "/srv/cache/acme");
    CHECK(deriver.config_dir_for("acme")->string() == "/home/u/.config/acme");
    // A base for favorites does not create a Linux favorites location.
    CHECK_FALSE(deriver.favorites_dir_for("acme").has_value());
}
