// demo_config.cpp
//
// Declares a config item once and walks it through search, fallback, read
// and write. Run it from any directory:
//
//     ./demo_config                  # show where the config lives and its contents
//     ./demo_config bump             # increment the launch counter and save
//     ./demo_config candidates       # list every path that is checked, in order
//
// Set CFGONCE_LOG=debug to watch the search.

#include <cfgonce/config_item.hpp>
#include <cfgonce/log.hpp>

#include <iostream>
#include <string>

using namespace cfgonce;

struct DemoSettings {
    std::string name = "cfgonce-demo";
    int launches = 0;
    bool verbose = false;
};

void to_json(Document& j, const DemoSettings& s) {
    j = Document{{"name", s.name}, {"launches", s.launches}, {"verbose", s.verbose}};
}

void from_json(const Document& j, DemoSettings& s) {
    j.at("name").get_to(s.name);
    j.at("launches").get_to(s.launches);
    s.verbose = j.value("verbose", false);
}

// ---------------------------------------------------------------------------
// Declared once, shared by every command below
// ---------------------------------------------------------------------------
static Result<ConfigItem<DemoSettings>> declare_demo_config() {
    ConfigPathMetadata policy;
    policy.project_path = {"org", "cfgonce", "cfgonce-demo"};
    policy.config_names = {"cfgonce-demo"};
    policy.default_format = FileFormat::Toml;
    policy.option.allow_dot_prefix = true;
    policy.option.sys_override_local = false;
    return ConfigItem<DemoSettings>::declare(std::move(policy));
}

static Status show(const ConfigItem<DemoSettings>& item) {
    auto file = item.resolve();
    CFGONCE_TRY(file);

    auto settings = file.value().read_or_default<DemoSettings>();
    CFGONCE_TRY(settings);

    std::cout << "file:     " << file.value().path().string() << "\n"
              << "format:   " << format_name(file.value().format()) << "\n"
              << "name:     " << settings.value().name << "\n"
              << "launches: " << settings.value().launches << "\n";
    return ok_status();
}

static Status bump(const ConfigItem<DemoSettings>& item) {
    auto settings = item.read_or_default();
    CFGONCE_TRY(settings);

    settings.value().launches += 1;
    CFGONCE_TRY(item.write(settings.value()));

    log::info("launch counter is now %d", settings.value().launches);
    std::cout << settings.value().launches << "\n";
    return ok_status();
}

static Status list_candidates(const ConfigItem<DemoSettings>& item) {
    auto candidates = item.metadata().candidates();
    CFGONCE_TRY(candidates);

    for (const auto& c : candidates.value()) {
        std::cout << (candidate_exists(c.path) ? "* " : "  ")
                  << c.path.string() << " (" << format_name(c.format) << ")\n";
    }
    return ok_status();
}

int main(int argc, char** argv) {
    log::init_from_env();

    auto item = declare_demo_config();
    if (item.is_err()) {
        std::cerr << item.error().format() << "\n";
        return 1;
    }

    std::string command = argc > 1 ? argv[1] : "show";
    Status result = ok_status();
    if (command == "show") {
        result = show(item.value());
    } else if (command == "bump") {
        result = bump(item.value());
    } else if (command == "candidates") {
        result = list_candidates(item.value());
    } else {
        result = CfgError{CfgError::InvalidArg,
            "unknown command '" + command + "'",
            "usage: demo_config [show|bump|candidates]"};
    }

    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
