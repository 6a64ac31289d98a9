#include <cfgonce/config_file.hpp>
#include <cerrno>
#include <fstream>
#include <sstream>

namespace cfgonce {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// ResolutionState
// ---------------------------------------------------------------------------

ResolutionState ResolutionState::found(fs::path path, FileFormat format) {
    ResolutionState s;
    s.kind_ = Found;
    s.path_ = std::move(path);
    s.format_ = format;
    return s;
}

ResolutionState ResolutionState::not_found() {
    ResolutionState s;
    s.kind_ = NotFound;
    return s;
}

bool ResolutionState::operator==(const ResolutionState& other) const {
    if (kind_ != other.kind_) return false;
    if (kind_ != Found) return true;
    return path_ == other.path_ && format_ == other.format_;
}

const char* ResolutionState::kind_name(Kind kind) {
    switch (kind) {
        case Unresolved: return "unresolved";
        case Found:      return "found";
        case NotFound:   return "not found";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// ConfigFile
// ---------------------------------------------------------------------------

bool ConfigFile::exists() const {
    return candidate_exists(path_);
}

Result<std::string> ConfigFile::read_text() const {
    // ifstream happily opens a directory and reads nothing
    std::error_code ec;
    auto status = fs::status(path_, ec);
    if (!ec && fs::is_directory(status)) {
        return CfgError::io("cannot read config file", path_,
                            std::make_error_code(std::errc::is_a_directory));
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return CfgError::io("cannot open config file", path_,
                            std::error_code(errno, std::generic_category()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return CfgError::io("cannot read config file", path_,
                            std::error_code(errno, std::generic_category()));
    }
    return Result<std::string>::ok(ss.str());
}

Status ConfigFile::write_text(const std::string& text) const {
    fs::path parent = path_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return CfgError::io("cannot create config directory", parent, ec);
        }
    }

    std::ofstream file(path_, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return CfgError::io("cannot open config file for writing", path_,
                            std::error_code(errno, std::generic_category()));
    }
    file << text;
    file.flush();
    if (!file.good()) {
        return CfgError::io("cannot write config file", path_,
                            std::error_code(errno, std::generic_category()));
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// RawConfigFile
// ---------------------------------------------------------------------------

RawConfigFile::RawConfigFile(std::shared_ptr<const ConfigPathMetadata> meta,
                             ResolutionState state)
    : meta_(std::move(meta)), state_(std::move(state)) {}

FileFormat RawConfigFile::format() const {
    return state_.is_found() ? state_.format() : meta_->default_format;
}

Result<RawConfigFile> RawConfigFile::fallback_default() const {
    if (state_.is_found()) return Result<RawConfigFile>::ok(*this);

    CFGONCE_TRY_ASSIGN(fs::path path, meta_->default_local_config_file());
    log::debug("no config file found, falling back to %s", path.string().c_str());
    return Result<RawConfigFile>::ok(RawConfigFile(meta_,
        ResolutionState::found(std::move(path), meta_->default_format)));
}

Result<RawConfigFile> RawConfigFile::fallback_default_sys() const {
    if (state_.is_found()) return Result<RawConfigFile>::ok(*this);

    CFGONCE_TRY_ASSIGN(fs::path path, meta_->default_sys_config_file());
    log::debug("no config file found, falling back to %s", path.string().c_str());
    return Result<RawConfigFile>::ok(RawConfigFile(meta_,
        ResolutionState::found(std::move(path), meta_->default_format)));
}

RawConfigFile RawConfigFile::fallback_path(const fs::path& path) const {
    return fallback_path(path, format_for_path(path).value_or(meta_->default_format));
}

RawConfigFile RawConfigFile::fallback_path(const fs::path& path, FileFormat format) const {
    if (state_.is_found()) return *this;
    return RawConfigFile(meta_, ResolutionState::found(path, format));
}

Result<ConfigFile> RawConfigFile::check() const {
    if (!state_.is_found()) {
        return CfgError{CfgError::NoPathResolved,
            std::string("no config file resolved (search state: ") +
                ResolutionState::kind_name(state_.kind()) + ")",
            "call fallback_default() to use the default location"};
    }
    return Result<ConfigFile>::ok(ConfigFile(meta_, state_.path(), state_.format()));
}

Result<fs::path> RawConfigFile::raw_path() const {
    if (!state_.is_found()) {
        return CfgError{CfgError::NoPathResolved, "no config file resolved"};
    }
    return Result<fs::path>::ok(state_.path());
}

Result<RawConfigFile> RawConfigFile::with_format_unchecked(FileFormat format) const {
    if (!state_.is_found()) {
        return CfgError{CfgError::NoPathResolved,
            "cannot force a format before a config file is resolved"};
    }
    return Result<RawConfigFile>::ok(
        RawConfigFile(meta_, ResolutionState::found(state_.path(), format)));
}

// ---------------------------------------------------------------------------
// Search
// ---------------------------------------------------------------------------

bool candidate_exists(const fs::path& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec) return false;
    return fs::exists(status) && !fs::is_directory(status);
}

Result<RawConfigFile> search_config_file(std::shared_ptr<const ConfigPathMetadata> meta) {
    CFGONCE_TRY(meta->validate());
    CFGONCE_TRY_ASSIGN(std::vector<Candidate> candidates, meta->candidates());

    for (const auto& candidate : candidates) {
        if (log::enabled(log::Trace)) {
            log::trace("checking %s", candidate.path.string().c_str());
        }
        if (candidate_exists(candidate.path)) {
            log::debug("found config file %s (%s)", candidate.path.string().c_str(),
                       format_name(candidate.format));
            return Result<RawConfigFile>::ok(RawConfigFile(std::move(meta),
                ResolutionState::found(candidate.path, candidate.format)));
        }
    }

    log::debug("no config file found among %zu candidates", candidates.size());
    return Result<RawConfigFile>::ok(RawConfigFile(std::move(meta),
        ResolutionState::not_found()));
}

Result<RawConfigFile> search_config_file(const ConfigPathMetadata& meta) {
    return search_config_file(std::make_shared<const ConfigPathMetadata>(meta));
}

} // namespace cfgonce
