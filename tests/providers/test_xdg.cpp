#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <memory>

#include "appdirs/core/deriver.hpp"
#include "appdirs/providers/xdg.hpp"

using namespace appdirs;
using appdirs::infra::MapEnvironment;
using appdirs::providers::XdgProvider;

namespace fs = std::filesystem;

namespace {

auto make_env(std::initializer_list<std::pair<const std::string, std::string>> vars)
    -> std::shared_ptr<MapEnvironment> {
    auto env = std::make_shared<MapEnvironment>();
    for (const auto& [name, value] : vars) {
        env->set(name, value);
    }
    return env;
}

auto base(const XdgProvider& provider, DirectoryKind kind) -> std::string {
    auto path = provider.base_path(kind);
    return path ? path->string() : std::string("<none>");
}

} // anonymous namespace

TEST_CASE("XdgProvider falls back to HOME defaults", "[providers][xdg]") {
    XdgProvider provider(make_env({{"HOME", "/home/alice"}}));

    CHECK(base(provider, DirectoryKind::Cache) == "/home/alice/.cache");
    CHECK(base(provider, DirectoryKind::Config) == "/home/alice/.config");
    CHECK(base(provider, DirectoryKind::Data) == "/home/alice/.local/share");
    CHECK(base(provider, DirectoryKind::DataLocal) == "/home/alice/.local/share");
    CHECK(base(provider, DirectoryKind::UserApplication) == "/home/alice/.local/bin");
}

TEST_CASE("XdgProvider honours XDG variables", "[providers][xdg]") {
    XdgProvider provider(make_env({
        {"HOME", "/home/alice"},
        {"XDG_CACHE_HOME", "/tmp/cache"},
        {"XDG_CONFIG_HOME", "/home/u/.config"},
        {"XDG_DATA_HOME", "/data"},
    }));

    CHECK(base(provider, DirectoryKind::Cache) == "/tmp/cache");
    CHECK(base(provider, DirectoryKind::Config) == "/home/u/.config");
    CHECK(base(provider, DirectoryKind::Data) == "/data");
    CHECK(base(provider, DirectoryKind::DataLocal) == "/data");
}

TEST_CASE("XdgProvider ignores empty and relative XDG variables", "[providers][xdg]") {
    XdgProvider provider(make_env({
        {"HOME", "/home/alice"},
        {"XDG_CACHE_HOME", ""},
        {"XDG_CONFIG_HOME", "relative/config"},
    }));

    CHECK(base(provider, DirectoryKind::Cache) == "/home/alice/.cache");
    CHECK(base(provider, DirectoryKind::Config) == "/home/alice/.config");
}

TEST_CASE("XdgProvider without a home directory", "[providers][xdg]") {
    XdgProvider provider(make_env({{"XDG_CONFIG_HOME", "/etc/alice"}}));

    CHECK(base(provider, DirectoryKind::Config) == "/etc/alice");
    CHECK(base(provider, DirectoryKind::Cache) == "<none>");
    CHECK(base(provider, DirectoryKind::UserApplication) == "<none>");
    CHECK(base(provider, DirectoryKind::Template) == "<none>");
}

TEST_CASE("XdgProvider fixed and absent kinds", "[providers][xdg]") {
    XdgProvider provider(make_env({{"HOME", "/home/alice"}}));

    CHECK(base(provider, DirectoryKind::Application) == "/opt");
    CHECK(base(provider, DirectoryKind::ApplicationShared) == "/usr/lib");

    for (auto kind : {DirectoryKind::Favorites, DirectoryKind::Preferences,
                      DirectoryKind::Template, DirectoryKind::Log,
                      DirectoryKind::AppContainer, DirectoryKind::AppContainerExecutable,
                      DirectoryKind::UserAppContainer,
                      DirectoryKind::UserAppContainerExecutable}) {
        CHECK_FALSE(provider.base_path(kind).has_value());
    }
    CHECK(provider.name() == "xdg");
}

TEST_CASE("XdgProvider has no templates base", "[providers][xdg]") {
    auto config_home = fs::temp_directory_path() / "appdirs_test_xdg_config";
    fs::remove_all(config_home);
    fs::create_directories(config_home);
    {
        std::ofstream out(config_home / "user-dirs.dirs");
        out << "XDG_TEMPLATES_DIR=\"$HOME/Templates\"\n";
    }

    XdgProvider provider(make_env({
        {"HOME", "/home/alice"},
        {"XDG_CONFIG_HOME", config_home.string()},
    }));
    CHECK_FALSE(provider.base_path(DirectoryKind::Template).has_value());

    AppPathDeriver deriver(Platform::Linux,
                           std::make_shared<XdgProvider>(make_env({{"HOME", "/home/alice"}})));
    CHECK_FALSE(deriver.template_dir_for("acme").has_value());

    fs::remove_all(config_home);
}

TEST_CASE("Linux scenarios through the XDG provider", "[providers][xdg]") {
    AppPathDeriver deriver(Platform::Linux, std::make_shared<XdgProvider>(make_env({
                                                {"HOME", "/home/u"},
                                                {"XDG_CONFIG_HOME", "/home/u/.config"},
                                            })));

    REQUIRE(deriver.config_dir_for("acme").has_value());
    CHECK(deriver.config_dir_for("acme")->string() == "/home/u/.config/acme");
    CHECK(deriver.cache_dir_for("Chrome")->string() == "/home/u/.cache/Chrome");
    CHECK(deriver.log_dir_for("Chrome")->string() == "/home/u/.local/share/Chrome/logs");
    CHECK_FALSE(deriver.favorites_dir_for("acme").has_value());
    CHECK_FALSE(deriver.app_container_dir_for("acme").has_value());
}
