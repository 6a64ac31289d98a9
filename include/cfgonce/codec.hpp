#pragma once

#include <cfgonce/format.hpp>
#include <string>

// Per-language converters behind serialize() / deserialize(). Each pair is
// only defined when its format is compiled in.
namespace cfgonce::codec {

Result<std::string> json_dump(const Document& doc);
Result<Document> json_parse(const std::string& text);

// TOML needs a table at the root. Null members of a table are omitted,
// nulls inside arrays cannot be written.
Result<std::string> toml_dump(const Document& doc);
Result<Document> toml_parse(const std::string& text);

// Plain scalars are typed (null, bool, int, float); quoted scalars stay strings
Result<std::string> yaml_dump(const Document& doc);
Result<Document> yaml_parse(const std::string& text);

} // namespace cfgonce::codec
