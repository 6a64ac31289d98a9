#include <cfgonce/metadata.hpp>
#include <cfgonce/log.hpp>

namespace cfgonce {

namespace fs = std::filesystem;

std::vector<FileFormat> search_format_order(FileFormat preferred) {
    std::vector<FileFormat> order;
    if (is_format_enabled(preferred)) order.push_back(preferred);
    for (const auto& entry : registered_formats()) {
        if (entry.format != preferred) order.push_back(entry.format);
    }
    return order;
}

static Result<fs::path> current_dir() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        return CfgError::io("cannot determine the current directory", "", ec);
    }
    return Result<fs::path>::ok(std::move(cwd));
}

// ---------------------------------------------------------------------------
// ConfigPathMetadata
// ---------------------------------------------------------------------------

Status ConfigPathMetadata::validate() const {
    if (config_names.empty() && extra_files.empty()) {
        return CfgError{CfgError::InvalidArg,
            "config search policy has no config names and no extra files",
            "declare at least one config name"};
    }
    for (const auto& name : config_names) {
        if (name.empty()) {
            return CfgError{CfgError::InvalidArg,
                "config names must not be empty"};
        }
    }
    if (!is_format_enabled(default_format)) {
        return CfgError{CfgError::UnsupportedExtension,
            std::string("default format '") + format_name(default_format) +
                "' is not compiled in"};
    }
    return ok_status();
}

Result<fs::path> ConfigPathMetadata::sys_dir() const {
    return system_dir(project_path, option.config_sys_type);
}

static Result<fs::path> default_file_in(const ConfigPathMetadata& meta,
                                        const fs::path& dir) {
    if (meta.config_names.empty()) {
        return CfgError{CfgError::InvalidArg,
            "cannot build a default config path without a config name"};
    }
    return Result<fs::path>::ok(
        dir / (meta.config_names.front() + "." + extension_for(meta.default_format)));
}

Result<fs::path> ConfigPathMetadata::default_local_config_file() const {
    CFGONCE_TRY_ASSIGN(fs::path cwd, current_dir());
    return default_file_in(*this, cwd);
}

Result<fs::path> ConfigPathMetadata::default_sys_config_file() const {
    CFGONCE_TRY_ASSIGN(fs::path dir, sys_dir());
    return default_file_in(*this, dir);
}

Result<fs::path> ConfigPathMetadata::default_config_file() const {
    if (option.sys_override_local) return default_sys_config_file();
    return default_local_config_file();
}

std::vector<Candidate> ConfigPathMetadata::directory_candidates(const fs::path& dir) const {
    std::vector<Candidate> out;
    auto formats = search_format_order(default_format);
    for (const auto& name : config_names) {
        for (FileFormat format : formats) {
            for (const auto& ext : extensions_for(format)) {
                std::string file = name + "." + ext;
                if (option.allow_dot_prefix) {
                    out.push_back({dir / ("." + file), format});
                }
                out.push_back({dir / file, format});
            }
        }
    }
    return out;
}

Result<std::vector<Candidate>> ConfigPathMetadata::candidates() const {
    CFGONCE_TRY_ASSIGN(fs::path sys, sys_dir());
    CFGONCE_TRY_ASSIGN(fs::path cwd, current_dir());

    std::vector<fs::path> dirs;
    if (option.sys_override_local) {
        dirs = {sys, cwd};
    } else {
        dirs = {cwd, sys};
    }
    dirs.insert(dirs.end(), extra_folders.begin(), extra_folders.end());

    std::vector<Candidate> out;
    for (const auto& dir : dirs) {
        auto found = directory_candidates(dir);
        out.insert(out.end(), found.begin(), found.end());
    }

    for (const auto& file : extra_files) {
        auto format = format_for_path(file);
        if (!format) {
            log::debug("skipping extra file %s: no format for extension '%s'",
                       file.string().c_str(), file.extension().string().c_str());
            continue;
        }
        out.push_back({file, *format});
    }
    return Result<std::vector<Candidate>>::ok(std::move(out));
}

} // namespace cfgonce
