#pragma once

#include <cfgonce/result.hpp>
#include <filesystem>
#include <string>

namespace cfgonce {

// Which system-level directory holds the config files
enum class ConfigType { Config, Preference };

// Application identity, e.g. "org" / "Example Corp" / "My App".
// Only used to derive the platform directories; never persisted.
struct ProjectPath {
    std::string qualifier;
    std::string organization;
    std::string application;

    // "qualifier.organization.application" with spaces as '-', empty parts skipped
    std::string bundle_id() const;

    bool operator==(const ProjectPath& other) const {
        return qualifier == other.qualifier
            && organization == other.organization
            && application == other.application;
    }
    bool operator!=(const ProjectPath& other) const { return !(*this == other); }
};

// Platform conventions:
//   Linux:   $XDG_CONFIG_HOME/<app> or $HOME/.config/<app> (app lowercased, no spaces)
//   macOS:   $HOME/Library/Application Support/<bundle id>   (preference: Library/Preferences)
//   Windows: %APPDATA%\<organization>\<application>\config
// Fails with PlatformDirectoryUnavailable when no home/base directory can be found.
Result<std::filesystem::path> system_config_dir(const ProjectPath& project);
Result<std::filesystem::path> system_preference_dir(const ProjectPath& project);

// Dispatch on ConfigType
Result<std::filesystem::path> system_dir(const ProjectPath& project, ConfigType type);

const char* config_type_name(ConfigType type);

} // namespace cfgonce
