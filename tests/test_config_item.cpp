#include <catch2/catch.hpp>
#include <cfgonce/config_item.hpp>
#include "test_helpers.hpp"

using namespace cfgonce;
using cfgonce_test::Sandbox;
namespace fs = std::filesystem;

namespace {

struct Window {
    int width = 800;
    int height = 600;
    bool fullscreen = false;
};

void to_json(nlohmann::json& j, const Window& w) {
    j = nlohmann::json{{"width", w.width}, {"height", w.height}, {"fullscreen", w.fullscreen}};
}

void from_json(const nlohmann::json& j, Window& w) {
    j.at("width").get_to(w.width);
    j.at("height").get_to(w.height);
    j.at("fullscreen").get_to(w.fullscreen);
}

ConfigPathMetadata window_policy() {
    ConfigPathMetadata meta;
    meta.project_path = {"org", "Example", "Window Demo"};
    meta.config_names = {"window"};
    meta.default_format = FileFormat::Toml;
    return meta;
}

} // namespace

TEST_CASE("declare rejects invalid policies", "[config_item]") {
    ConfigPathMetadata meta = window_policy();
    meta.config_names.clear();
    auto item = ConfigItem<Window>::declare(meta);
    REQUIRE(item.is_err());
    REQUIRE(item.error().code == CfgError::InvalidArg);
}

TEST_CASE("declared item keeps its policy", "[config_item]") {
    auto item = ConfigItem<Window>::declare(window_policy());
    REQUIRE(item.is_ok());
    REQUIRE(item.value().metadata().config_names.front() == "window");

    auto copy = item.value();
    REQUIRE(copy.shared_metadata() == item.value().shared_metadata());
}

TEST_CASE("first read creates the default file", "[config_item]") {
    Sandbox sb;
    auto item = ConfigItem<Window>::declare(window_policy());
    REQUIRE(item.is_ok());

    auto w = item.value().read_or_default();
    REQUIRE(w.is_ok());
    REQUIRE(w.value().width == 800);
    REQUIRE(fs::exists(sb.work / "window.toml"));
}

TEST_CASE("write then read round-trips", "[config_item]") {
    Sandbox sb;
    auto item = ConfigItem<Window>::declare(window_policy()).value();

    Window w;
    w.width = 1920;
    w.height = 1080;
    w.fullscreen = true;
    REQUIRE(item.write(w).is_ok());

    auto back = item.read();
    REQUIRE(back.is_ok());
    REQUIRE(back.value().width == 1920);
    REQUIRE(back.value().height == 1080);
    REQUIRE(back.value().fullscreen);
}

TEST_CASE("an existing system file is used", "[config_item]") {
    Sandbox sb;
    auto item = ConfigItem<Window>::declare(window_policy()).value();
    auto sys = item.metadata().sys_dir();
    REQUIRE(sys.is_ok());
    fs::create_directories(sys.value());
    {
        std::ofstream f(sys.value() / "window.toml");
        f << "width = 1024\nheight = 768\nfullscreen = false\n";
    }

    auto file = item.resolve();
    REQUIRE(file.is_ok());
    REQUIRE(file.value().path() == sys.value() / "window.toml");
    REQUIRE(item.read().value().width == 1024);
    REQUIRE_FALSE(fs::exists(sb.work / "window.toml"));
}

TEST_CASE("read without a file is an IO error", "[config_item]") {
    Sandbox sb;
    auto item = ConfigItem<Window>::declare(window_policy()).value();
    auto w = item.read();
    REQUIRE(w.is_err());
    REQUIRE(w.error().code == CfgError::IO);
}

TEST_CASE("read_or_new seeds a custom value", "[config_item]") {
    Sandbox sb;
    auto item = ConfigItem<Window>::declare(window_policy()).value();
    Window seed;
    seed.width = 320;
    REQUIRE(item.read_or_new(seed).value().width == 320);
    REQUIRE(item.read().value().width == 320);
}
