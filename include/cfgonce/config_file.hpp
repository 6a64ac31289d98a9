#pragma once

#include <cfgonce/format.hpp>
#include <cfgonce/log.hpp>
#include <cfgonce/metadata.hpp>
#include <cfgonce/result.hpp>
#include <filesystem>
#include <memory>
#include <string>

namespace cfgonce {

// Outcome of a search. Immutable: transitions build a new state.
class ResolutionState {
public:
    enum Kind { Unresolved, Found, NotFound };

    ResolutionState() = default;
    static ResolutionState found(std::filesystem::path path, FileFormat format);
    static ResolutionState not_found();

    Kind kind() const { return kind_; }
    bool is_found() const { return kind_ == Found; }

    // Empty unless Found
    const std::filesystem::path& path() const { return path_; }
    FileFormat format() const { return format_; }

    bool operator==(const ResolutionState& other) const;
    bool operator!=(const ResolutionState& other) const { return !(*this == other); }

    static const char* kind_name(Kind kind);

private:
    Kind kind_ = Unresolved;
    std::filesystem::path path_;
    FileFormat format_ = FileFormat::Toml;
};

// A config file with a resolved location. Only RawConfigFile::check()
// creates one, so reads and writes never fail for lack of a path.
class ConfigFile {
public:
    const std::filesystem::path& path() const { return path_; }
    FileFormat format() const { return format_; }
    const ConfigPathMetadata& metadata() const { return *meta_; }

    // Same rule as the search: a directory does not count
    bool exists() const;

    Result<std::string> read_text() const;

    // Creates parent directories, truncates any existing file
    Status write_text(const std::string& text) const;

    template<typename T>
    Result<T> read() const {
        return read_text().and_then([this](const std::string& text) {
            return decode<T>(format_, text).with_file(path_.string());
        });
    }

    template<typename T>
    Status write(const T& value) const {
        auto text = encode(format_, value).with_file(path_.string());
        if (text.is_err()) return std::move(text).error();
        return write_text(text.value());
    }

    // Writes `default_value` first if the file does not exist yet.
    // A file that exists but cannot be decoded is an error, not a reset.
    template<typename T>
    Result<T> read_or_new(T default_value) const {
        if (exists()) return read<T>();
        log::info("creating config file %s", path_.string().c_str());
        auto st = write(default_value);
        if (st.is_err()) return std::move(st).error();
        return Result<T>::ok(std::move(default_value));
    }

    template<typename T>
    Result<T> read_or_default() const {
        return read_or_new(T{});
    }

private:
    friend class RawConfigFile;

    ConfigFile(std::shared_ptr<const ConfigPathMetadata> meta,
               std::filesystem::path path, FileFormat format)
        : meta_(std::move(meta)), path_(std::move(path)), format_(format) {}

    std::shared_ptr<const ConfigPathMetadata> meta_;
    std::filesystem::path path_;
    FileFormat format_;
};

// A search result that may or may not have a location. Operations that
// need a path fail with NoPathResolved until one is assigned.
class RawConfigFile {
public:
    RawConfigFile(std::shared_ptr<const ConfigPathMetadata> meta,
                  ResolutionState state = {});

    const ResolutionState& state() const { return state_; }
    const ConfigPathMetadata& metadata() const { return *meta_; }
    const std::shared_ptr<const ConfigPathMetadata>& shared_metadata() const { return meta_; }

    bool is_found() const { return state_.is_found(); }

    // Resolved format, or the policy's default format
    FileFormat format() const;

    // Assign <cwd>/<first name>.<default ext> when nothing was found.
    // No existence check, no dot prefix. A found file is kept as is.
    Result<RawConfigFile> fallback_default() const;

    // Same, in the system directory
    Result<RawConfigFile> fallback_default_sys() const;

    // Explicit fallback location; the format comes from its extension when
    // recognised, otherwise from the policy
    RawConfigFile fallback_path(const std::filesystem::path& path) const;
    RawConfigFile fallback_path(const std::filesystem::path& path, FileFormat format) const;

    Result<ConfigFile> check() const;

    // Low-level access. The caller is responsible for path/format mismatches.
    Result<std::filesystem::path> raw_path() const;
    Result<RawConfigFile> with_format_unchecked(FileFormat format) const;

    template<typename T>
    Result<T> read() const {
        return check().and_then([](const ConfigFile& file) { return file.template read<T>(); });
    }

    template<typename T>
    Status write(const T& value) const {
        return check().and_then([&value](const ConfigFile& file) { return file.write(value); });
    }

    template<typename T>
    Result<T> read_or_new(T default_value) const {
        return check().and_then([&default_value](const ConfigFile& file) {
            return file.read_or_new(std::move(default_value));
        });
    }

    template<typename T>
    Result<T> read_or_default() const {
        return check().and_then([](const ConfigFile& file) {
            return file.template read_or_default<T>();
        });
    }

private:
    std::shared_ptr<const ConfigPathMetadata> meta_;
    ResolutionState state_;
};

// Try every candidate of `meta` in order and return the first existing file
// (Found) or NotFound. Only checks for existence; file contents are not read.
Result<RawConfigFile> search_config_file(std::shared_ptr<const ConfigPathMetadata> meta);
Result<RawConfigFile> search_config_file(const ConfigPathMetadata& meta);

// Existing, non-directory path (symlinks followed, broken links don't count)
bool candidate_exists(const std::filesystem::path& path);

} // namespace cfgonce
