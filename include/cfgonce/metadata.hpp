#pragma once

#include <cfgonce/format.hpp>
#include <cfgonce/project_path.hpp>
#include <cfgonce/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace cfgonce {

struct ConfigOption {
    // Also accept ".<name>.<ext>"; the dot-prefixed file wins when both exist
    bool allow_dot_prefix = true;
    // Search the system directory before the current directory
    bool sys_override_local = false;
    ConfigType config_sys_type = ConfigType::Config;
};

// One (location, format) pairing considered during a search
struct Candidate {
    std::filesystem::path path;
    FileFormat format;
};

// Declarative search policy for one application's config file.
//
// Candidates are tried in this order:
//   1. local (cwd) then system directory, or system then local when
//      option.sys_override_local is set
//   2. extra_folders, in declaration order
//   3. extra_files, verbatim, each with the format named by its own extension
// Within a directory every config name is tried with the default format's
// extensions first, then the other compiled-in formats in registry order.
struct ConfigPathMetadata {
    ProjectPath project_path;
    std::vector<std::string> config_names;
    FileFormat default_format = default_file_format();
    std::vector<std::filesystem::path> extra_files;
    std::vector<std::filesystem::path> extra_folders;
    ConfigOption option;

    // Rejects policies that can never produce a candidate
    Status validate() const;

    // System-level directory selected by option.config_sys_type
    Result<std::filesystem::path> sys_dir() const;

    // <dir>/<first config name>.<default extension>, never dot-prefixed
    Result<std::filesystem::path> default_local_config_file() const;
    Result<std::filesystem::path> default_sys_config_file() const;
    // System or local default, following option.sys_override_local
    Result<std::filesystem::path> default_config_file() const;

    // Full ordered candidate list (reads the environment and cwd, not files)
    Result<std::vector<Candidate>> candidates() const;

    // Candidates for a single directory
    std::vector<Candidate> directory_candidates(const std::filesystem::path& dir) const;
};

// Formats in the order they are tried: `preferred` first, then the rest of
// the registry
std::vector<FileFormat> search_format_order(FileFormat preferred);

} // namespace cfgonce
