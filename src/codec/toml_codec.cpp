#include <cfgonce/codec.hpp>
#include <tomlplusplus/toml.hpp>
#include <cstdint>
#include <limits>
#include <sstream>

namespace cfgonce::codec {

// ---------------------------------------------------------------------------
// Document -> TOML
// ---------------------------------------------------------------------------

static CfgError not_representable(const std::string& where, const char* what) {
    return CfgError{CfgError::Encode,
        std::string("cannot write ") + what + " to TOML at '" +
            (where.empty() ? "<root>" : where) + "'"};
}

template<typename Put>
static Status put_scalar(const Document& v, const std::string& where, Put&& put) {
    switch (v.type()) {
        case Document::value_t::string:
            put(v.get<std::string>());
            return ok_status();
        case Document::value_t::boolean:
            put(v.get<bool>());
            return ok_status();
        case Document::value_t::number_integer:
            put(v.get<int64_t>());
            return ok_status();
        case Document::value_t::number_unsigned: {
            auto u = v.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return not_representable(where, "an integer above 2^63-1");
            }
            put(static_cast<int64_t>(u));
            return ok_status();
        }
        case Document::value_t::number_float:
            put(v.get<double>());
            return ok_status();
        case Document::value_t::null:
            return not_representable(where, "a null value");
        case Document::value_t::binary:
            return not_representable(where, "binary data");
        default:
            return not_representable(where, "a discarded value");
    }
}

static Result<toml::array> to_toml_array(const Document& arr, const std::string& where);

static Result<toml::table> to_toml_table(const Document& obj, const std::string& where) {
    toml::table tbl;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const std::string& key = it.key();
        const Document& v = it.value();
        std::string at = where.empty() ? key : where + "." + key;

        if (v.is_null()) continue;  // absent optional
        if (v.is_object()) {
            auto sub = to_toml_table(v, at);
            if (sub.is_err()) return std::move(sub).error();
            tbl.insert_or_assign(key, std::move(sub).value());
        } else if (v.is_array()) {
            auto sub = to_toml_array(v, at);
            if (sub.is_err()) return std::move(sub).error();
            tbl.insert_or_assign(key, std::move(sub).value());
        } else {
            auto st = put_scalar(v, at, [&](auto&& x) {
                tbl.insert_or_assign(key, std::forward<decltype(x)>(x));
            });
            if (st.is_err()) return std::move(st).error();
        }
    }
    return Result<toml::table>::ok(std::move(tbl));
}

static Result<toml::array> to_toml_array(const Document& arr, const std::string& where) {
    toml::array out;
    size_t index = 0;
    for (const auto& v : arr) {
        std::string at = where + "[" + std::to_string(index++) + "]";
        if (v.is_object()) {
            auto sub = to_toml_table(v, at);
            if (sub.is_err()) return std::move(sub).error();
            out.push_back(std::move(sub).value());
        } else if (v.is_array()) {
            auto sub = to_toml_array(v, at);
            if (sub.is_err()) return std::move(sub).error();
            out.push_back(std::move(sub).value());
        } else {
            auto st = put_scalar(v, at, [&](auto&& x) {
                out.push_back(std::forward<decltype(x)>(x));
            });
            if (st.is_err()) return std::move(st).error();
        }
    }
    return Result<toml::array>::ok(std::move(out));
}

Result<std::string> toml_dump(const Document& doc) {
    if (!doc.is_object()) {
        return CfgError{CfgError::Encode,
            std::string("TOML documents must be tables, got ") + doc.type_name(),
            "wrap the value in a struct or map"};
    }
    auto tbl = to_toml_table(doc, "");
    if (tbl.is_err()) return std::move(tbl).error();

    std::ostringstream ss;
    ss << tbl.value() << "\n";
    return Result<std::string>::ok(ss.str());
}

// ---------------------------------------------------------------------------
// TOML -> Document
// ---------------------------------------------------------------------------

static Document from_toml_node(const toml::node& node) {
    if (auto tbl = node.as_table()) {
        Document obj = Document::object();
        for (const auto& [key, val] : *tbl) {
            obj[std::string(key)] = from_toml_node(val);
        }
        return obj;
    }
    if (auto arr = node.as_array()) {
        Document out = Document::array();
        for (const auto& val : *arr) {
            out.push_back(from_toml_node(val));
        }
        return out;
    }
    if (auto s = node.as_string())         return Document(s->get());
    if (auto i = node.as_integer())        return Document(i->get());
    if (auto f = node.as_floating_point()) return Document(f->get());
    if (auto b = node.as_boolean())        return Document(b->get());

    // dates and times keep their TOML spelling
    std::ostringstream ss;
    node.visit([&](const auto& n) { ss << n; });
    return Document(ss.str());
}

Result<Document> toml_parse(const std::string& text) {
    toml::table doc;
    try {
        doc = toml::parse(text);
    } catch (const toml::parse_error& e) {
        return CfgError{CfgError::Decode,
            std::string("TOML parse error at line ") +
                std::to_string(e.source().begin.line) + ": " +
                std::string(e.description())};
    }
    return Result<Document>::ok(from_toml_node(doc));
}

} // namespace cfgonce::codec
