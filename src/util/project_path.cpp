#include <cfgonce/project_path.hpp>
#include <cctype>
#include <cstdlib>
#include <optional>

namespace cfgonce {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

static std::string replace_spaces(const std::string& s, const std::string& with) {
    std::string out;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            out += with;
        } else {
            out += c;
        }
    }
    return out;
}

static std::string lowercase(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

// Non-empty absolute path from an environment variable, if any
static std::optional<fs::path> env_dir(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    fs::path p(value);
    if (!p.is_absolute()) return std::nullopt;
    return p;
}

static CfgError no_directory(const std::string& what) {
    return CfgError{CfgError::PlatformDirectoryUnavailable,
        "cannot determine " + what,
#ifdef _WIN32
        "make sure %APPDATA% is set"};
#else
        "make sure $HOME is set to an absolute path"};
#endif
}

#if !defined(_WIN32) && !defined(__APPLE__)
static Result<fs::path> xdg_config_home() {
    if (auto xdg = env_dir("XDG_CONFIG_HOME")) {
        return Result<fs::path>::ok(*xdg);
    }
    auto home = env_dir("HOME");
    if (!home) return no_directory("the XDG config directory");
    return Result<fs::path>::ok(*home / ".config");
}
#endif

// Per-project directory name under the platform base directory
static Result<fs::path> project_dir_name(const ProjectPath& project) {
    fs::path name;
#if defined(_WIN32)
    name = fs::path(trim(project.organization)) / trim(project.application);
    if (trim(project.application).empty()) name.clear();
#elif defined(__APPLE__)
    name = project.bundle_id();
#else
    name = lowercase(replace_spaces(trim(project.application), ""));
#endif
    if (name.empty()) {
        return CfgError{CfgError::PlatformDirectoryUnavailable,
            "project identity yields an empty directory name",
            "set a non-empty application name"};
    }
    return Result<fs::path>::ok(std::move(name));
}

// ---------------------------------------------------------------------------
// ProjectPath
// ---------------------------------------------------------------------------

std::string ProjectPath::bundle_id() const {
    std::string id;
    for (const auto* part : {&qualifier, &organization, &application}) {
        std::string piece = replace_spaces(trim(*part), "-");
        if (piece.empty()) continue;
        if (!id.empty()) id += '.';
        id += piece;
    }
    return id;
}

// ---------------------------------------------------------------------------
// Directory lookup
// ---------------------------------------------------------------------------

Result<fs::path> system_config_dir(const ProjectPath& project) {
    auto name = project_dir_name(project);
    if (name.is_err()) return std::move(name).error();

#if defined(_WIN32)
    auto appdata = env_dir("APPDATA");
    if (!appdata) return no_directory("the roaming AppData directory");
    return Result<fs::path>::ok(*appdata / name.value() / "config");
#elif defined(__APPLE__)
    auto home = env_dir("HOME");
    if (!home) return no_directory("the home directory");
    return Result<fs::path>::ok(*home / "Library" / "Application Support" / name.value());
#else
    auto base = xdg_config_home();
    if (base.is_err()) return std::move(base).error();
    return Result<fs::path>::ok(base.value() / name.value());
#endif
}

Result<fs::path> system_preference_dir(const ProjectPath& project) {
#if defined(__APPLE__)
    auto name = project_dir_name(project);
    if (name.is_err()) return std::move(name).error();
    auto home = env_dir("HOME");
    if (!home) return no_directory("the home directory");
    return Result<fs::path>::ok(*home / "Library" / "Preferences" / name.value());
#else
    // Only macOS separates preferences from config
    return system_config_dir(project);
#endif
}

Result<fs::path> system_dir(const ProjectPath& project, ConfigType type) {
    switch (type) {
        case ConfigType::Preference: return system_preference_dir(project);
        case ConfigType::Config:     return system_config_dir(project);
    }
    return system_config_dir(project);
}

const char* config_type_name(ConfigType type) {
    switch (type) {
        case ConfigType::Config:     return "config";
        case ConfigType::Preference: return "preference";
    }
    return "unknown";
}

} // namespace cfgonce
