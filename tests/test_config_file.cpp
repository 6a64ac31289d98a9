#include <catch2/catch.hpp>
#include <cfgonce/config_file.hpp>
#include "test_helpers.hpp"

using namespace cfgonce;
using cfgonce_test::Sandbox;
namespace fs = std::filesystem;

struct Counter {
    int id = 0;
    std::string label = "none";
};

inline void to_json(nlohmann::json& j, const Counter& c) {
    j = nlohmann::json{{"id", c.id}, {"label", c.label}};
}

inline void from_json(const nlohmann::json& j, Counter& c) {
    j.at("id").get_to(c.id);
    c.label = j.value("label", std::string("none"));
}

static std::shared_ptr<const ConfigPathMetadata> app_policy() {
    ConfigPathMetadata meta;
    meta.project_path = {"org", "Example", "app"};
    meta.config_names = {"app"};
    meta.default_format = FileFormat::Toml;
    return std::make_shared<const ConfigPathMetadata>(std::move(meta));
}

static RawConfigFile searched(std::shared_ptr<const ConfigPathMetadata> meta) {
    auto r = search_config_file(std::move(meta));
    REQUIRE(r.is_ok());
    return r.value();
}

// ===== ResolutionState =====

TEST_CASE("resolution state kinds", "[config_file]") {
    ResolutionState unresolved;
    REQUIRE(unresolved.kind() == ResolutionState::Unresolved);
    REQUIRE_FALSE(unresolved.is_found());
    REQUIRE(ResolutionState::not_found().kind() == ResolutionState::NotFound);

    auto a = ResolutionState::found("a.toml", FileFormat::Toml);
    REQUIRE(a.is_found());
    REQUIRE(a == ResolutionState::found("a.toml", FileFormat::Toml));
    REQUIRE(a != ResolutionState::found("b.toml", FileFormat::Toml));
    REQUIRE(unresolved != ResolutionState::not_found());
    REQUIRE(std::string(ResolutionState::kind_name(ResolutionState::NotFound)) == "not found");
}

// ===== Unresolved files =====

TEST_CASE("unresolved file refuses path operations", "[config_file]") {
    RawConfigFile raw(app_policy());
    REQUIRE(raw.state().kind() == ResolutionState::Unresolved);
    REQUIRE(raw.format() == FileFormat::Toml);

    auto checked = raw.check();
    REQUIRE(checked.is_err());
    REQUIRE(checked.error().code == CfgError::NoPathResolved);
    REQUIRE(checked.error().hint.find("fallback_default") != std::string::npos);

    REQUIRE(raw.raw_path().has_code(CfgError::NoPathResolved));
    REQUIRE(raw.with_format_unchecked(FileFormat::Toml).has_code(CfgError::NoPathResolved));
    REQUIRE(raw.read<Counter>().has_code(CfgError::NoPathResolved));
    REQUIRE(raw.write(Counter{}).has_code(CfgError::NoPathResolved));
    REQUIRE(raw.read_or_default<Counter>().has_code(CfgError::NoPathResolved));
}

TEST_CASE("not found file refuses path operations without touching disk", "[config_file]") {
    Sandbox sb;
    auto raw = searched(app_policy());
    REQUIRE(raw.state().kind() == ResolutionState::NotFound);
    REQUIRE(raw.read_or_new(Counter{}).has_code(CfgError::NoPathResolved));
    REQUIRE(fs::is_empty(sb.work));
}

// ===== Fallbacks =====

TEST_CASE("fallback_default points at the current directory", "[config_file]") {
    Sandbox sb;
    auto raw = searched(app_policy());
    auto located = raw.fallback_default();
    REQUIRE(located.is_ok());
    REQUIRE(located.value().state() ==
            ResolutionState::found(sb.work / "app.toml", FileFormat::Toml));
    // assigning a location creates nothing
    REQUIRE_FALSE(fs::exists(sb.work / "app.toml"));
}

TEST_CASE("fallback_default ignores the dot prefix", "[config_file]") {
    Sandbox sb;
    auto meta = app_policy();
    REQUIRE(meta->option.allow_dot_prefix);
    auto located = RawConfigFile(meta).fallback_default();
    REQUIRE(located.is_ok());
    REQUIRE(located.value().raw_path().value().filename() == "app.toml");
}

TEST_CASE("fallback_default is idempotent from not found", "[config_file]") {
    Sandbox sb;
    auto raw = searched(app_policy());
    REQUIRE(raw.state().kind() == ResolutionState::NotFound);

    auto once = raw.fallback_default();
    REQUIRE(once.is_ok());
    auto again = raw.fallback_default();
    REQUIRE(again.is_ok());
    REQUIRE(once.value().state() == again.value().state());

    auto twice = once.value().fallback_default();
    REQUIRE(twice.is_ok());
    REQUIRE(twice.value().state() == once.value().state());
}

TEST_CASE("fallback_default keeps a found file", "[config_file]") {
    Sandbox sb;
    cfgonce_test::TempDir other;
    auto found = RawConfigFile(app_policy(),
        ResolutionState::found(other.path / "x.toml", FileFormat::Toml));
    auto once = found.fallback_default();
    REQUIRE(once.is_ok());
    REQUIRE(once.value().state() == found.state());

    auto twice = once.value().fallback_default();
    REQUIRE(twice.is_ok());
    REQUIRE(twice.value().state() == found.state());
}

TEST_CASE("fallback_default_sys points at the system directory", "[config_file]") {
    Sandbox sb;
    auto meta = app_policy();
    auto located = RawConfigFile(meta).fallback_default_sys();
    REQUIRE(located.is_ok());
    REQUIRE(located.value().raw_path().value() == meta->sys_dir().value() / "app.toml");
}

TEST_CASE("default_config_file follows sys_override_local", "[config_file]") {
    Sandbox sb;
    ConfigPathMetadata meta = *app_policy();
    REQUIRE(meta.default_config_file().value() == sb.work / "app.toml");
    meta.option.sys_override_local = true;
    REQUIRE(meta.default_config_file().value() == meta.sys_dir().value() / "app.toml");

    meta.config_names.clear();
    REQUIRE(meta.default_config_file().has_code(CfgError::InvalidArg));
}

TEST_CASE("fallback_path takes the format from the extension", "[config_file]") {
    RawConfigFile raw(app_policy());
    auto located = raw.fallback_path("/etc/app/settings.toml");
    REQUIRE(located.state() ==
            ResolutionState::found("/etc/app/settings.toml", FileFormat::Toml));

    auto unknown = raw.fallback_path("/etc/app/settings.conf");
    REQUIRE(unknown.format() == FileFormat::Toml);

    auto found = RawConfigFile(app_policy(), ResolutionState::found("a.toml", FileFormat::Toml));
    REQUIRE(found.fallback_path("b.toml").raw_path().value() == "a.toml");
}

TEST_CASE("with_format_unchecked keeps the path", "[config_file]") {
    auto found = RawConfigFile(app_policy(), ResolutionState::found("a.toml", FileFormat::Toml));
    for (const auto& entry : registered_formats()) {
        auto forced = found.with_format_unchecked(entry.format);
        REQUIRE(forced.is_ok());
        REQUIRE(forced.value().raw_path().value() == "a.toml");
        REQUIRE(forced.value().format() == entry.format);
    }
}

// ===== Reading and writing =====

TEST_CASE("write then read through a fallback", "[config_file]") {
    Sandbox sb;
    auto located = searched(app_policy()).fallback_default();
    REQUIRE(located.is_ok());

    REQUIRE(located.value().write(Counter{1, "first"}).is_ok());
    REQUIRE(fs::exists(sb.work / "app.toml"));

    auto back = located.value().read<Counter>();
    REQUIRE(back.is_ok());
    REQUIRE(back.value().id == 1);
    REQUIRE(back.value().label == "first");

    // a fresh search now finds the written file
    auto again = searched(app_policy());
    REQUIRE(again.state() == ResolutionState::found(sb.work / "app.toml", FileFormat::Toml));
}

#ifdef CFGONCE_WITH_JSON
TEST_CASE("found file is read in its own format", "[config_file]") {
    Sandbox sb;
    {
        std::ofstream f(sb.work / ".app.json");
        f << "{\"id\": 1}";
    }
    auto raw = searched(app_policy());
    REQUIRE(raw.format() == FileFormat::Json);

    auto value = raw.read<Counter>();
    REQUIRE(value.is_ok());
    REQUIRE(value.value().id == 1);
    REQUIRE(value.value().label == "none");
}

TEST_CASE("write uses the resolved format", "[config_file]") {
    Sandbox sb;
    auto raw = RawConfigFile(app_policy()).fallback_path(sb.work / "out.json");
    REQUIRE(raw.write(Counter{7, "x"}).is_ok());
    std::ifstream f(sb.work / "out.json");
    std::stringstream ss;
    ss << f.rdbuf();
    REQUIRE(ss.str() == "{\n    \"id\": 7,\n    \"label\": \"x\"\n}\n");
}
#endif

TEST_CASE("read_or_default creates a missing file", "[config_file]") {
    Sandbox sb;
    auto located = searched(app_policy()).fallback_default();
    REQUIRE(located.is_ok());

    auto value = located.value().read_or_default<Counter>();
    REQUIRE(value.is_ok());
    REQUIRE(value.value().id == 0);
    REQUIRE(fs::exists(sb.work / "app.toml"));

    auto reread = located.value().read<Counter>();
    REQUIRE(reread.is_ok());
    REQUIRE(reread.value().label == "none");
}

TEST_CASE("read_or_new writes the given value only once", "[config_file]") {
    Sandbox sb;
    auto located = RawConfigFile(app_policy()).fallback_default();
    REQUIRE(located.is_ok());

    REQUIRE(located.value().read_or_new(Counter{5, "seed"}).value().id == 5);
    REQUIRE(located.value().read_or_new(Counter{9, "other"}).value().id == 5);
}

TEST_CASE("malformed file is a decode error, not a reset", "[config_file]") {
    Sandbox sb;
    {
        std::ofstream f(sb.work / "app.toml");
        f << "id = [unterminated";
    }
    auto raw = searched(app_policy());
    auto value = raw.read_or_default<Counter>();
    REQUIRE(value.is_err());
    REQUIRE(value.error().code == CfgError::Decode);
    REQUIRE(value.error().file == (sb.work / "app.toml").string());

    std::ifstream f(sb.work / "app.toml");
    std::stringstream ss;
    ss << f.rdbuf();
    REQUIRE(ss.str() == "id = [unterminated");
}

TEST_CASE("wrong shape is a decode error", "[config_file]") {
    Sandbox sb;
    {
        std::ofstream f(sb.work / "app.toml");
        f << "label = \"no id\"\n";
    }
    REQUIRE(searched(app_policy()).read<Counter>().has_code(CfgError::Decode));
}

TEST_CASE("write creates missing parent directories", "[config_file]") {
    Sandbox sb;
    auto located = RawConfigFile(app_policy()).fallback_default_sys();
    REQUIRE(located.is_ok());
    auto path = located.value().raw_path().value();
    REQUIRE_FALSE(fs::exists(path.parent_path()));

    REQUIRE(located.value().write(Counter{3, "sys"}).is_ok());
    REQUIRE(fs::exists(path));
}

TEST_CASE("reading a missing file is an IO error", "[config_file]") {
    Sandbox sb;
    auto raw = RawConfigFile(app_policy()).fallback_path(sb.work / "absent.toml");
    auto file = raw.check();
    REQUIRE(file.is_ok());
    REQUIRE_FALSE(file.value().exists());
    auto text = file.value().read_text();
    REQUIRE(text.is_err());
    REQUIRE(text.error().code == CfgError::IO);
    REQUIRE(text.error().file == (sb.work / "absent.toml").string());
}

TEST_CASE("a directory at the resolved path is an IO error", "[config_file]") {
    Sandbox sb;
    fs::create_directories(sb.work / "app.toml");
    auto located = RawConfigFile(app_policy()).fallback_default();
    REQUIRE(located.is_ok());

    auto file = located.value().check();
    REQUIRE(file.is_ok());
    REQUIRE_FALSE(file.value().exists());

    auto text = file.value().read_text();
    REQUIRE(text.is_err());
    REQUIRE(text.error().code == CfgError::IO);
    REQUIRE(text.error().os_error == std::make_error_code(std::errc::is_a_directory));

    REQUIRE(located.value().read<Counter>().has_code(CfgError::IO));
    REQUIRE(located.value().read_or_default<Counter>().has_code(CfgError::IO));
    REQUIRE(fs::is_directory(sb.work / "app.toml"));
}

TEST_CASE("checked file exposes its policy", "[config_file]") {
    Sandbox sb;
    auto meta = app_policy();
    auto file = RawConfigFile(meta).fallback_default().value().check();
    REQUIRE(file.is_ok());
    REQUIRE(file.value().metadata().config_names == meta->config_names);
    REQUIRE(file.value().path() == sb.work / "app.toml");
    REQUIRE(file.value().format() == FileFormat::Toml);
}
