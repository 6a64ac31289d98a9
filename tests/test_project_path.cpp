#include <catch2/catch.hpp>
#include <cfgonce/project_path.hpp>
#include "test_helpers.hpp"

using namespace cfgonce;
using cfgonce_test::EnvGuard;
namespace fs = std::filesystem;

static const ProjectPath kProject{"org", "Example Corp", "My App"};

TEST_CASE("bundle_id joins the identity with dots", "[project_path]") {
    REQUIRE(kProject.bundle_id() == "org.Example-Corp.My-App");
    REQUIRE(ProjectPath{"", "acme", "tool"}.bundle_id() == "acme.tool");
    REQUIRE(ProjectPath{" com ", "", " x "}.bundle_id() == "com.x");
}

TEST_CASE("ProjectPath equality", "[project_path]") {
    REQUIRE(kProject == ProjectPath{"org", "Example Corp", "My App"});
    REQUIRE(kProject != ProjectPath{"org", "Example Corp", "Other"});
}

TEST_CASE("config_type_name", "[project_path]") {
    REQUIRE(std::string(config_type_name(ConfigType::Config)) == "config");
    REQUIRE(std::string(config_type_name(ConfigType::Preference)) == "preference");
}

#if !defined(_WIN32) && !defined(__APPLE__)

TEST_CASE("config dir follows XDG_CONFIG_HOME", "[project_path]") {
    EnvGuard xdg("XDG_CONFIG_HOME", std::string("/xdg/config"));
    auto dir = system_config_dir(kProject);
    REQUIRE(dir.is_ok());
    REQUIRE(dir.value() == fs::path("/xdg/config/myapp"));
}

TEST_CASE("config dir falls back to HOME/.config", "[project_path]") {
    EnvGuard xdg("XDG_CONFIG_HOME", std::nullopt);
    EnvGuard home("HOME", std::string("/home/someone"));
    auto dir = system_config_dir(kProject);
    REQUIRE(dir.is_ok());
    REQUIRE(dir.value() == fs::path("/home/someone/.config/myapp"));
}

TEST_CASE("relative XDG_CONFIG_HOME is ignored", "[project_path]") {
    EnvGuard xdg("XDG_CONFIG_HOME", std::string("relative/dir"));
    EnvGuard home("HOME", std::string("/home/someone"));
    auto dir = system_config_dir(kProject);
    REQUIRE(dir.is_ok());
    REQUIRE(dir.value() == fs::path("/home/someone/.config/myapp"));
}

TEST_CASE("preference dir equals config dir on Linux", "[project_path]") {
    EnvGuard xdg("XDG_CONFIG_HOME", std::string("/xdg/config"));
    auto config = system_config_dir(kProject);
    auto pref = system_preference_dir(kProject);
    REQUIRE(config.is_ok());
    REQUIRE(pref.is_ok());
    REQUIRE(config.value() == pref.value());
}

TEST_CASE("missing home directory is reported, not guessed", "[project_path]") {
    EnvGuard xdg("XDG_CONFIG_HOME", std::nullopt);
    EnvGuard home("HOME", std::nullopt);
    auto dir = system_config_dir(kProject);
    REQUIRE(dir.is_err());
    REQUIRE(dir.error().code == CfgError::PlatformDirectoryUnavailable);
}

#endif

TEST_CASE("system_dir dispatches on ConfigType", "[project_path]") {
    cfgonce_test::TempDir td;
    EnvGuard home("HOME", td.path.string());
    EnvGuard xdg("XDG_CONFIG_HOME", (td.path / ".config").string());
    EnvGuard appdata("APPDATA", (td.path / "AppData").string());

    auto config = system_dir(kProject, ConfigType::Config);
    auto pref = system_dir(kProject, ConfigType::Preference);
    REQUIRE(config.is_ok());
    REQUIRE(pref.is_ok());
    REQUIRE(config.value() == system_config_dir(kProject).value());
    REQUIRE(pref.value() == system_preference_dir(kProject).value());
}

TEST_CASE("empty application name cannot name a directory", "[project_path]") {
    cfgonce_test::TempDir td;
    EnvGuard home("HOME", td.path.string());
    EnvGuard xdg("XDG_CONFIG_HOME", (td.path / ".config").string());
    EnvGuard appdata("APPDATA", (td.path / "AppData").string());

    auto dir = system_config_dir(ProjectPath{"", "", "   "});
    REQUIRE(dir.is_err());
    REQUIRE(dir.error().code == CfgError::PlatformDirectoryUnavailable);
}

TEST_CASE("directory lookup performs no I/O", "[project_path]") {
    cfgonce_test::TempDir td;
    EnvGuard home("HOME", td.path.string());
    EnvGuard xdg("XDG_CONFIG_HOME", (td.path / ".config").string());
    EnvGuard appdata("APPDATA", (td.path / "AppData").string());

    auto dir = system_config_dir(kProject);
    REQUIRE(dir.is_ok());
    REQUIRE_FALSE(fs::exists(dir.value()));
}
