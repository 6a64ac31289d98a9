#include <cfgonce/codec.hpp>

namespace cfgonce::codec {

Result<std::string> json_dump(const Document& doc) {
    try {
        return Result<std::string>::ok(doc.dump(4) + "\n");
    } catch (const nlohmann::json::type_error& e) {
        // invalid UTF-8 in a string
        return CfgError{CfgError::Encode,
            std::string("cannot write JSON: ") + e.what()};
    }
}

Result<Document> json_parse(const std::string& text) {
    try {
        return Result<Document>::ok(Document::parse(text));
    } catch (const nlohmann::json::parse_error& e) {
        return CfgError{CfgError::Decode,
            std::string("JSON parse error: ") + e.what()};
    }
}

} // namespace cfgonce::codec
