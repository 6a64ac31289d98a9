#include <cfgonce/codec.hpp>
#include <yaml-cpp/yaml.h>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <regex>

namespace cfgonce::codec {

// ---------------------------------------------------------------------------
// Plain scalar resolution (YAML 1.2 core schema)
// ---------------------------------------------------------------------------

static bool is_null_scalar(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

static std::optional<bool> bool_scalar(const std::string& s) {
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    return std::nullopt;
}

static std::optional<Document> int_scalar(const std::string& s) {
    static const std::regex dec("[-+]?[0-9]+");
    static const std::regex hex("0x[0-9a-fA-F]+");
    static const std::regex oct("0o[0-7]+");

    int base = 0;
    std::string digits;
    if (std::regex_match(s, dec)) {
        base = 10;
        digits = s;
    } else if (std::regex_match(s, hex)) {
        base = 16;
        digits = s.substr(2);
    } else if (std::regex_match(s, oct)) {
        base = 8;
        digits = s.substr(2);
    } else {
        return std::nullopt;
    }

    errno = 0;
    if (!digits.empty() && digits[0] != '-') {
        unsigned long long u = std::strtoull(digits.c_str(), nullptr, base);
        if (errno == ERANGE) return std::nullopt;
        if (u <= static_cast<unsigned long long>(INT64_MAX)) {
            return Document(static_cast<int64_t>(u));
        }
        return Document(static_cast<uint64_t>(u));
    }
    long long v = std::strtoll(digits.c_str(), nullptr, base);
    if (errno == ERANGE) return std::nullopt;
    return Document(static_cast<int64_t>(v));
}

static std::optional<double> float_scalar(const std::string& s) {
    static const std::regex num("[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?");
    static const std::regex inf("[-+]?\\.(inf|Inf|INF)");
    static const std::regex nan("\\.(nan|NaN|NAN)");

    if (std::regex_match(s, inf)) {
        return s[0] == '-' ? -HUGE_VAL : HUGE_VAL;
    }
    if (std::regex_match(s, nan)) return std::nan("");
    if (std::regex_match(s, num)) return std::strtod(s.c_str(), nullptr);
    return std::nullopt;
}

static Document resolve_plain(const std::string& s) {
    if (is_null_scalar(s)) return Document(nullptr);
    if (auto b = bool_scalar(s)) return Document(*b);
    if (auto i = int_scalar(s)) return *i;
    if (auto f = float_scalar(s)) return Document(*f);
    return Document(s);
}

// A string that would read back as something else must be quoted
static bool needs_quotes(const std::string& s) {
    return !resolve_plain(s).is_string();
}

// ---------------------------------------------------------------------------
// Document -> YAML
// ---------------------------------------------------------------------------

static std::string float_text(double d) {
    if (std::isnan(d)) return ".nan";
    if (std::isinf(d)) return d < 0 ? "-.inf" : ".inf";
    return Document(d).dump();
}

static void emit(YAML::Emitter& out, const Document& v) {
    switch (v.type()) {
        case Document::value_t::object:
            out << YAML::BeginMap;
            for (auto it = v.begin(); it != v.end(); ++it) {
                out << YAML::Key;
                if (needs_quotes(it.key())) out << YAML::DoubleQuoted;
                out << it.key() << YAML::Value;
                emit(out, it.value());
            }
            out << YAML::EndMap;
            break;
        case Document::value_t::array:
            out << YAML::BeginSeq;
            for (const auto& item : v) emit(out, item);
            out << YAML::EndSeq;
            break;
        case Document::value_t::string: {
            const auto& s = v.get_ref<const std::string&>();
            if (needs_quotes(s)) out << YAML::DoubleQuoted;
            out << s;
            break;
        }
        case Document::value_t::boolean:
            out << v.get<bool>();
            break;
        case Document::value_t::number_integer:
            out << v.get<int64_t>();
            break;
        case Document::value_t::number_unsigned:
            out << v.get<uint64_t>();
            break;
        case Document::value_t::number_float:
            out << float_text(v.get<double>());
            break;
        default:
            out << YAML::Null;
            break;
    }
}

Result<std::string> yaml_dump(const Document& doc) {
    if (doc.is_binary()) {
        return CfgError{CfgError::Encode, "cannot write binary data to YAML"};
    }
    YAML::Emitter out;
    emit(out, doc);
    if (!out.good()) {
        return CfgError{CfgError::Encode,
            "YAML emitter error: " + out.GetLastError()};
    }
    return Result<std::string>::ok(std::string(out.c_str()) + "\n");
}

// ---------------------------------------------------------------------------
// YAML -> Document
// ---------------------------------------------------------------------------

static Result<Document> from_yaml_node(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return Result<Document>::ok(Document(nullptr));
        case YAML::NodeType::Scalar:
            // "!" marks a quoted (non-plain) scalar
            if (node.Tag() == "!") {
                return Result<Document>::ok(Document(node.Scalar()));
            }
            return Result<Document>::ok(resolve_plain(node.Scalar()));
        case YAML::NodeType::Sequence: {
            Document arr = Document::array();
            for (const auto& item : node) {
                auto v = from_yaml_node(item);
                if (v.is_err()) return v;
                arr.push_back(std::move(v).value());
            }
            return Result<Document>::ok(std::move(arr));
        }
        case YAML::NodeType::Map: {
            Document obj = Document::object();
            for (const auto& kv : node) {
                if (!kv.first.IsScalar()) {
                    return CfgError{CfgError::Decode,
                        "YAML mapping keys must be scalars (line " +
                            std::to_string(kv.first.Mark().line + 1) + ")"};
                }
                auto v = from_yaml_node(kv.second);
                if (v.is_err()) return v;
                obj[kv.first.Scalar()] = std::move(v).value();
            }
            return Result<Document>::ok(std::move(obj));
        }
    }
    return Result<Document>::ok(Document(nullptr));
}

Result<Document> yaml_parse(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return CfgError{CfgError::Decode,
            "YAML parse error at line " + std::to_string(e.mark.line + 1) +
                ": " + e.msg};
    }
    return from_yaml_node(root);
}

} // namespace cfgonce::codec
