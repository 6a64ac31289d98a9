#pragma once

#include <cfgonce/format.hpp>
#include <string>

// Reader and writer for Rusty Object Notation (RON).
//
// Mapping to the document model:
//   (a: 1, b: 2)   Name(a: 1)   -> object (struct names are dropped)
//   {"k": v}                    -> object (keys must be scalars)
//   [1, 2]   (1, 2)   Name(1)   -> array
//   None   ()                   -> null
//   Some(x)                     -> x
//   'c'   "str"   r#"raw"#      -> string
//   Variant                     -> "Variant"
// Objects are written as structs when every key is an identifier,
// otherwise as maps.
namespace cfgonce::ron {

Result<Document> parse(const std::string& text);
Result<std::string> dump(const Document& doc);

} // namespace cfgonce::ron
