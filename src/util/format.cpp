#include <cfgonce/format.hpp>
#include <cfgonce/codec.hpp>
#include <cfgonce/ron.hpp>
#include <cctype>

namespace cfgonce {

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

const std::vector<FormatEntry>& registered_formats() {
    static const std::vector<FormatEntry> table = {
#ifdef CFGONCE_WITH_TOML
        {FileFormat::Toml, "toml", {"toml"}},
#endif
#ifdef CFGONCE_WITH_JSON
        {FileFormat::Json, "json", {"json"}},
#endif
#ifdef CFGONCE_WITH_YAML
        {FileFormat::Yaml, "yaml", {"yaml", "yml"}},
#endif
#ifdef CFGONCE_WITH_RON
        {FileFormat::Ron,  "ron",  {"ron"}},
#endif
    };
    return table;
}

#if !defined(CFGONCE_WITH_TOML) && !defined(CFGONCE_WITH_JSON) \
    && !defined(CFGONCE_WITH_YAML) && !defined(CFGONCE_WITH_RON)
#error "at least one of CFGONCE_WITH_TOML/JSON/YAML/RON must be defined"
#endif

static const FormatEntry* find_entry(FileFormat format) {
    for (const auto& entry : registered_formats()) {
        if (entry.format == format) return &entry;
    }
    return nullptr;
}

bool is_format_enabled(FileFormat format) {
    return find_entry(format) != nullptr;
}

FileFormat default_file_format() {
    return registered_formats().front().format;
}

const char* format_name(FileFormat format) {
    switch (format) {
        case FileFormat::Toml: return "toml";
        case FileFormat::Json: return "json";
        case FileFormat::Yaml: return "yaml";
        case FileFormat::Ron:  return "ron";
    }
    return "unknown";
}

const char* extension_for(FileFormat format) {
    // Same spelling as the format name for every language
    return format_name(format);
}

std::vector<std::string> extensions_for(FileFormat format) {
    if (auto entry = find_entry(format)) return entry->extensions;
    return {extension_for(format)};
}

std::optional<FileFormat> format_for_extension(const std::string& ext) {
    std::string key = ext;
    if (!key.empty() && key[0] == '.') key.erase(0, 1);
    for (char& c : key) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (key.empty()) return std::nullopt;

    for (const auto& entry : registered_formats()) {
        for (const auto& candidate : entry.extensions) {
            if (candidate == key) return entry.format;
        }
    }
    return std::nullopt;
}

std::optional<FileFormat> format_for_path(const std::filesystem::path& path) {
    return format_for_extension(path.extension().string());
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

static CfgError not_compiled_in(FileFormat format) {
    return CfgError{CfgError::UnsupportedExtension,
        std::string("format '") + format_name(format) + "' is not compiled in",
        std::string("rebuild with CFGONCE_WITH_") +
            (format == FileFormat::Toml ? "TOML" :
             format == FileFormat::Json ? "JSON" :
             format == FileFormat::Yaml ? "YAML" : "RON") + "=ON"};
}

Result<std::string> serialize(FileFormat format, const Document& doc) {
    switch (format) {
#ifdef CFGONCE_WITH_TOML
        case FileFormat::Toml: return codec::toml_dump(doc);
#endif
#ifdef CFGONCE_WITH_JSON
        case FileFormat::Json: return codec::json_dump(doc);
#endif
#ifdef CFGONCE_WITH_YAML
        case FileFormat::Yaml: return codec::yaml_dump(doc);
#endif
#ifdef CFGONCE_WITH_RON
        case FileFormat::Ron:  return ron::dump(doc);
#endif
        default: break;
    }
    return not_compiled_in(format);
}

Result<Document> deserialize(FileFormat format, const std::string& text) {
    switch (format) {
#ifdef CFGONCE_WITH_TOML
        case FileFormat::Toml: return codec::toml_parse(text);
#endif
#ifdef CFGONCE_WITH_JSON
        case FileFormat::Json: return codec::json_parse(text);
#endif
#ifdef CFGONCE_WITH_YAML
        case FileFormat::Yaml: return codec::yaml_parse(text);
#endif
#ifdef CFGONCE_WITH_RON
        case FileFormat::Ron:  return ron::parse(text);
#endif
        default: break;
    }
    return not_compiled_in(format);
}

} // namespace cfgonce
