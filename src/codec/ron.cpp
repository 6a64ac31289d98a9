#include <cfgonce/ron.hpp>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace cfgonce::ron {

// ---------------------------------------------------------------------------
// Reader
// ---------------------------------------------------------------------------

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

class Reader {
public:
    explicit Reader(const std::string& src) : src_(src) {}

    Result<Document> document() {
        auto st = skip_trivia();
        if (st.is_err()) return std::move(st).error();
        st = skip_attributes();
        if (st.is_err()) return std::move(st).error();

        auto v = value();
        if (v.is_err()) return v;

        st = skip_trivia();
        if (st.is_err()) return std::move(st).error();
        if (!at_end()) return fail("unexpected trailing characters");
        return v;
    }

private:
    const std::string& src_;
    size_t pos_ = 0;
    int line_ = 1;
    int col_ = 1;

    bool at_end() const { return pos_ >= src_.size(); }
    char peek(size_t ahead = 0) const {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }

    char advance() {
        char c = src_[pos_++];
        if (c == '\n') {
            ++line_;
            col_ = 1;
        } else {
            ++col_;
        }
        return c;
    }

    CfgError fail(const std::string& msg) const {
        return CfgError{CfgError::Decode,
            "RON parse error at line " + std::to_string(line_) +
                ", column " + std::to_string(col_) + ": " + msg};
    }

    // Whitespace, line comments and (nested) block comments
    Status skip_trivia() {
        while (!at_end()) {
            char c = peek();
            if (std::isspace(static_cast<unsigned char>(c))) {
                advance();
            } else if (c == '/' && peek(1) == '/') {
                while (!at_end() && peek() != '\n') advance();
            } else if (c == '/' && peek(1) == '*') {
                advance();
                advance();
                int depth = 1;
                while (depth > 0) {
                    if (at_end()) return fail("unterminated block comment");
                    if (peek() == '/' && peek(1) == '*') {
                        advance();
                        advance();
                        ++depth;
                    } else if (peek() == '*' && peek(1) == '/') {
                        advance();
                        advance();
                        --depth;
                    } else {
                        advance();
                    }
                }
            } else {
                break;
            }
        }
        return ok_status();
    }

    // #![enable(...)] extension attributes carry no data
    Status skip_attributes() {
        while (peek() == '#' && peek(1) == '!' && peek(2) == '[') {
            int depth = 0;
            while (!at_end()) {
                char c = advance();
                if (c == '[') ++depth;
                if (c == ']' && --depth == 0) break;
            }
            if (depth != 0) return fail("unterminated attribute");
            auto st = skip_trivia();
            if (st.is_err()) return st;
        }
        return ok_status();
    }

    bool consume(char expected) {
        if (peek() != expected) return false;
        advance();
        return true;
    }

    Status expect(char expected) {
        auto st = skip_trivia();
        if (st.is_err()) return st;
        if (!consume(expected)) {
            return fail(std::string("expected '") + expected + "'");
        }
        return ok_status();
    }

    std::string identifier() {
        std::string out;
        while (!at_end() && is_ident_char(peek())) out += advance();
        return out;
    }

    // Looks past an identifier and trivia for ':' without consuming anything
    bool struct_field_ahead() const {
        size_t p = pos_;
        if (p >= src_.size() || !is_ident_start(src_[p])) return false;
        while (p < src_.size() && is_ident_char(src_[p])) ++p;
        while (p < src_.size() && std::isspace(static_cast<unsigned char>(src_[p]))) ++p;
        return p < src_.size() && src_[p] == ':' &&
               (p + 1 >= src_.size() || src_[p + 1] != ':');
    }

    Result<Document> value() {
        auto st = skip_trivia();
        if (st.is_err()) return std::move(st).error();
        if (at_end()) return fail("unexpected end of input");

        char c = peek();
        if (c == '"') return string_literal();
        if (c == 'r' && (peek(1) == '"' || peek(1) == '#')) return raw_string();
        if (c == '\'') return char_literal();
        if (c == '[') return list();
        if (c == '{') return map();
        if (c == '(') return parenthesized();
        if (c == '-' || c == '+' || c == '.' || std::isdigit(static_cast<unsigned char>(c))) {
            return number();
        }
        if (is_ident_start(c)) return named();
        return fail(std::string("unexpected character '") + c + "'");
    }

    Result<Document> named() {
        std::string name = identifier();
        if (name == "true") return Result<Document>::ok(Document(true));
        if (name == "false") return Result<Document>::ok(Document(false));
        if (name == "None") return Result<Document>::ok(Document(nullptr));
        if (name == "inf") return Result<Document>::ok(Document(HUGE_VAL));
        if (name == "NaN") return Result<Document>::ok(Document(std::nan("")));

        auto st = skip_trivia();
        if (st.is_err()) return std::move(st).error();

        if (name == "Some") {
            st = expect('(');
            if (st.is_err()) return std::move(st).error();
            auto inner = value();
            if (inner.is_err()) return inner;
            st = skip_trivia();
            if (st.is_err()) return std::move(st).error();
            consume(',');
            st = expect(')');
            if (st.is_err()) return std::move(st).error();
            return inner;
        }

        // Named struct / tuple struct: the name carries no data
        if (peek() == '(') return parenthesized();

        // Unit struct or unit enum variant
        return Result<Document>::ok(Document(name));
    }

    // Struct "(a: 1)", tuple "(1, 2)" or unit "()"
    Result<Document> parenthesized() {
        advance();  // (
        auto st = skip_trivia();
        if (st.is_err()) return std::move(st).error();
        if (consume(')')) return Result<Document>::ok(Document(nullptr));

        if (struct_field_ahead()) {
            Document obj = Document::object();
            while (true) {
                st = skip_trivia();
                if (st.is_err()) return std::move(st).error();
                if (consume(')')) break;
                if (!is_ident_start(peek())) return fail("expected field name");
                std::string key = identifier();
                st = expect(':');
                if (st.is_err()) return std::move(st).error();
                auto v = value();
                if (v.is_err()) return v;
                obj[key] = std::move(v).value();
                st = skip_trivia();
                if (st.is_err()) return std::move(st).error();
                if (consume(',')) continue;
                st = expect(')');
                if (st.is_err()) return std::move(st).error();
                break;
            }
            return Result<Document>::ok(std::move(obj));
        }

        Document arr = Document::array();
        while (true) {
            st = skip_trivia();
            if (st.is_err()) return std::move(st).error();
            if (consume(')')) break;
            auto v = value();
            if (v.is_err()) return v;
            arr.push_back(std::move(v).value());
            st = skip_trivia();
            if (st.is_err()) return std::move(st).error();
            if (consume(',')) continue;
            st = expect(')');
            if (st.is_err()) return std::move(st).error();
            break;
        }
        return Result<Document>::ok(std::move(arr));
    }

    Result<Document> list() {
        advance();  // [
        Document arr = Document::array();
        while (true) {
            auto st = skip_trivia();
            if (st.is_err()) return std::move(st).error();
            if (consume(']')) break;
            auto v = value();
            if (v.is_err()) return v;
            arr.push_back(std::move(v).value());
            st = skip_trivia();
            if (st.is_err()) return std::move(st).error();
            if (consume(',')) continue;
            st = expect(']');
            if (st.is_err()) return std::move(st).error();
            break;
        }
        return Result<Document>::ok(std::move(arr));
    }

    Result<Document> map() {
        advance();  // {
        Document obj = Document::object();
        while (true) {
            auto st = skip_trivia();
            if (st.is_err()) return std::move(st).error();
            if (consume('}')) break;

            auto key = value();
            if (key.is_err()) return key;
            std::string key_text;
            if (key.value().is_string()) {
                key_text = key.value().get<std::string>();
            } else if (key.value().is_primitive() && !key.value().is_null()) {
                key_text = key.value().dump();
            } else {
                return fail("map keys must be strings, numbers or booleans");
            }

            st = expect(':');
            if (st.is_err()) return std::move(st).error();
            auto v = value();
            if (v.is_err()) return v;
            obj[key_text] = std::move(v).value();

            st = skip_trivia();
            if (st.is_err()) return std::move(st).error();
            if (consume(',')) continue;
            st = expect('}');
            if (st.is_err()) return std::move(st).error();
            break;
        }
        return Result<Document>::ok(std::move(obj));
    }

    Result<uint32_t> escape_code(size_t max_digits, bool braced) {
        if (braced && !consume('{')) return fail("expected '{' in unicode escape");
        uint32_t cp = 0;
        size_t n = 0;
        while (n < max_digits && std::isxdigit(static_cast<unsigned char>(peek()))) {
            char h = advance();
            cp = cp * 16 + static_cast<uint32_t>(
                std::isdigit(static_cast<unsigned char>(h)) ? h - '0'
                                                            : std::tolower(h) - 'a' + 10);
            ++n;
        }
        if (n == 0) return fail("empty escape sequence");
        if (braced && !consume('}')) return fail("expected '}' in unicode escape");
        if (!braced && n != max_digits) return fail("short escape sequence");
        // surrogates and values past U+10FFFF have no UTF-8 encoding
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return fail("invalid unicode escape");
        }
        return Result<uint32_t>::ok(cp);
    }

    Status escape(std::string& out) {
        if (at_end()) return fail("unterminated escape");
        char e = advance();
        switch (e) {
            case '"':  out += '"'; break;
            case '\'': out += '\''; break;
            case '\\': out += '\\'; break;
            case '/':  out += '/'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case '0':  out += '\0'; break;
            case 'x': {
                auto cp = escape_code(2, false);
                if (cp.is_err()) return std::move(cp).error();
                append_utf8(out, cp.value());
                break;
            }
            case 'u': {
                bool braced = peek() == '{';
                auto cp = escape_code(braced ? 6 : 4, braced);
                if (cp.is_err()) return std::move(cp).error();
                append_utf8(out, cp.value());
                break;
            }
            default:
                return fail(std::string("unknown escape '\\") + e + "'");
        }
        return ok_status();
    }

    Result<Document> string_literal() {
        advance();  // "
        std::string out;
        while (true) {
            if (at_end()) return fail("unterminated string");
            char c = advance();
            if (c == '"') break;
            if (c == '\\') {
                auto st = escape(out);
                if (st.is_err()) return std::move(st).error();
            } else {
                out += c;
            }
        }
        return Result<Document>::ok(Document(std::move(out)));
    }

    // r"..." or r#"..."# with any number of hashes
    Result<Document> raw_string() {
        advance();  // r
        size_t hashes = 0;
        while (consume('#')) ++hashes;
        if (!consume('"')) return fail("expected '\"' after raw string prefix");

        std::string out;
        while (true) {
            if (at_end()) return fail("unterminated raw string");
            char c = advance();
            if (c == '"') {
                size_t n = 0;
                while (n < hashes && peek(n) == '#') ++n;
                if (n == hashes) {
                    for (size_t i = 0; i < hashes; ++i) advance();
                    break;
                }
            }
            out += c;
        }
        return Result<Document>::ok(Document(std::move(out)));
    }

    Result<Document> char_literal() {
        advance();  // '
        std::string out;
        if (at_end()) return fail("unterminated char literal");
        char c = advance();
        if (c == '\\') {
            auto st = escape(out);
            if (st.is_err()) return std::move(st).error();
        } else {
            out += c;
            // rest of a multi-byte UTF-8 sequence
            while (!at_end() && (static_cast<unsigned char>(peek()) & 0xC0) == 0x80) {
                out += advance();
            }
        }
        if (!consume('\'')) return fail("expected closing '\\''");
        return Result<Document>::ok(Document(std::move(out)));
    }

    Result<Document> number() {
        bool negative = false;
        if (peek() == '+' || peek() == '-') negative = advance() == '-';

        if (is_ident_start(peek())) {
            std::string word = identifier();
            if (word == "inf") return Result<Document>::ok(Document(negative ? -HUGE_VAL : HUGE_VAL));
            if (word == "NaN") return Result<Document>::ok(Document(std::nan("")));
            return fail("invalid number '" + word + "'");
        }

        int base = 10;
        if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'o' || peek(1) == 'b')) {
            char prefix = peek(1);
            base = prefix == 'x' ? 16 : prefix == 'o' ? 8 : 2;
            advance();
            advance();
        }

        std::string text;
        bool is_float = false;
        while (!at_end()) {
            char c = peek();
            if (c == '_') {
                advance();
                continue;
            }
            if (base == 16 ? std::isxdigit(static_cast<unsigned char>(c))
                           : std::isdigit(static_cast<unsigned char>(c))) {
                text += advance();
            } else if (base == 10 && (c == '.' || c == 'e' || c == 'E')) {
                is_float = true;
                text += advance();
                if ((c == 'e' || c == 'E') && (peek() == '+' || peek() == '-')) {
                    text += advance();
                }
            } else {
                break;
            }
        }
        if (text.empty()) return fail("expected digits");

        errno = 0;
        if (is_float) {
            char* end = nullptr;
            double d = std::strtod(text.c_str(), &end);
            if (*end != '\0') return fail("invalid float literal '" + text + "'");
            return Result<Document>::ok(Document(negative ? -d : d));
        }

        char* end = nullptr;
        unsigned long long u = std::strtoull(text.c_str(), &end, base);
        if (*end != '\0') return fail("invalid integer literal '" + text + "'");
        if (errno == ERANGE) return fail("integer literal out of range");
        if (negative) {
            if (u > static_cast<unsigned long long>(INT64_MAX) + 1ULL) {
                return fail("integer literal out of range");
            }
            return Result<Document>::ok(Document(static_cast<int64_t>(0 - u)));
        }
        if (u <= static_cast<unsigned long long>(INT64_MAX)) {
            return Result<Document>::ok(Document(static_cast<int64_t>(u)));
        }
        return Result<Document>::ok(Document(static_cast<uint64_t>(u)));
    }
};

// ---------------------------------------------------------------------------
// Writer
// ---------------------------------------------------------------------------

bool is_identifier(const std::string& s) {
    if (s.empty() || !is_ident_start(s[0])) return false;
    for (char c : s) {
        if (!is_ident_char(c)) return false;
    }
    // keywords would read back as values
    return s != "true" && s != "false" && s != "None" && s != "Some" &&
           s != "inf" && s != "NaN";
}

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u{";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                    out += '}';
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

std::string float_text(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
    std::string text = Document(d).dump();
    if (text.find_first_of(".eE") == std::string::npos) text += ".0";
    return text;
}

class Writer {
public:
    Status write(const Document& v, int depth) {
        switch (v.type()) {
            case Document::value_t::object:
                return write_object(v, depth);
            case Document::value_t::array: {
                if (v.empty()) {
                    out_ += "[]";
                    return ok_status();
                }
                out_ += "[\n";
                for (const auto& item : v) {
                    indent(depth + 1);
                    auto st = write(item, depth + 1);
                    if (st.is_err()) return st;
                    out_ += ",\n";
                }
                indent(depth);
                out_ += "]";
                return ok_status();
            }
            case Document::value_t::string:
                out_ += quote(v.get_ref<const std::string&>());
                return ok_status();
            case Document::value_t::boolean:
                out_ += v.get<bool>() ? "true" : "false";
                return ok_status();
            case Document::value_t::number_integer:
            case Document::value_t::number_unsigned:
                out_ += v.dump();
                return ok_status();
            case Document::value_t::number_float:
                out_ += float_text(v.get<double>());
                return ok_status();
            case Document::value_t::null:
                out_ += "None";
                return ok_status();
            default:
                return CfgError{CfgError::Encode, "cannot write binary data to RON"};
        }
    }

    std::string take() { return std::move(out_); }

private:
    std::string out_;

    void indent(int depth) { out_.append(static_cast<size_t>(depth) * 4, ' '); }

    Status write_object(const Document& v, int depth) {
        bool as_struct = !v.empty();
        for (auto it = v.begin(); it != v.end() && as_struct; ++it) {
            as_struct = is_identifier(it.key());
        }
        if (v.empty()) {
            out_ += "{}";
            return ok_status();
        }

        out_ += as_struct ? "(\n" : "{\n";
        for (auto it = v.begin(); it != v.end(); ++it) {
            indent(depth + 1);
            out_ += as_struct ? it.key() : quote(it.key());
            out_ += ": ";
            auto st = write(it.value(), depth + 1);
            if (st.is_err()) return st;
            out_ += ",\n";
        }
        indent(depth);
        out_ += as_struct ? ")" : "}";
        return ok_status();
    }
};

} // namespace

Result<Document> parse(const std::string& text) {
    Reader reader(text);
    return reader.document();
}

Result<std::string> dump(const Document& doc) {
    Writer writer;
    auto st = writer.write(doc, 0);
    if (st.is_err()) return std::move(st).error();
    return Result<std::string>::ok(writer.take() + "\n");
}

} // namespace cfgonce::ron
