#pragma once

#include <cfgonce/result.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cfgonce {

// Supported configuration languages. Which ones are usable depends on the
// CFGONCE_WITH_<FORMAT> build options; see registered_formats().
enum class FileFormat { Toml, Json, Yaml, Ron };

// In-memory document every format converts to and from. Payload types take
// part through nlohmann's to_json / from_json functions.
using Document = nlohmann::json;

struct FormatEntry {
    FileFormat format;
    const char* name;
    std::vector<std::string> extensions;  // canonical extension first
};

// Compiled-in formats in detection order (toml, json, yaml, ron)
const std::vector<FormatEntry>& registered_formats();

bool is_format_enabled(FileFormat format);

// First registered format
FileFormat default_file_format();

const char* format_name(FileFormat format);

// Canonical extension, without the dot ("yaml" for Yaml)
const char* extension_for(FileFormat format);

// Canonical plus alternate extensions ("yaml", "yml")
std::vector<std::string> extensions_for(FileFormat format);

// Case-insensitive, a leading dot is accepted. Formats that are not compiled
// in never match. When two formats claim an extension the earlier one wins.
std::optional<FileFormat> format_for_extension(const std::string& ext);
std::optional<FileFormat> format_for_path(const std::filesystem::path& path);

// Text <-> document for one format. Disabled formats fail with
// UnsupportedExtension, malformed text with Decode, unrepresentable values
// with Encode.
Result<std::string> serialize(FileFormat format, const Document& doc);
Result<Document> deserialize(FileFormat format, const std::string& text);

template<typename T>
Result<std::string> encode(FileFormat format, const T& value) {
    Document doc;
    try {
        doc = value;
    } catch (const nlohmann::json::exception& e) {
        return CfgError{CfgError::Encode,
            std::string("cannot convert value for ") + format_name(format) + ": " + e.what()};
    }
    return serialize(format, doc);
}

template<typename T>
Result<T> decode(FileFormat format, const std::string& text) {
    auto doc = deserialize(format, text);
    if (doc.is_err()) return std::move(doc).error();
    try {
        return Result<T>::ok(doc.value().template get<T>());
    } catch (const nlohmann::json::exception& e) {
        return CfgError{CfgError::Decode,
            std::string(format_name(format)) + " content does not match the expected type: " + e.what()};
    }
}

} // namespace cfgonce
