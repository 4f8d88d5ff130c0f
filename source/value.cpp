// value.cpp - Value utilities and JSON text conversion

#include <json_diff/value.h>
#include <json_diff/builders.h>
#include <json_diff/serialization.h>

#include <cctype>
#include <charconv>   // for std::to_chars / std::from_chars
#include <cstdio>     // for std::snprintf
#include <fstream>
#include <sstream>
#include <stdexcept>  // for std::runtime_error
#include <system_error>

namespace json_diff {

std::string_view kind_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::Null:   return "null";
        case ValueKind::Bool:   return "bool";
        case ValueKind::Number: return "number";
        case ValueKind::String: return "string";
        case ValueKind::Array:  return "array";
        case ValueKind::Object: return "object";
    }
    return "unknown";
}

namespace {

// Shortest representation that parses back to the same double.
// A decimal point is appended to integral values so 1.0 never prints as 1.
// Exponents carry no '+' and no leading zeros.
std::string format_double(double v)
{
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc{}) {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
    std::string result(buf, end);
    const auto exp = result.find('e');
    if (exp == std::string::npos) {
        if (result.find_first_of(".n") == std::string::npos) {
            result += ".0";
        }
        return result;
    }
    // "1e+20" -> "1e20", "1e-07" -> "1e-7"
    std::size_t digits = exp + 1;
    if (result[digits] == '+') {
        result.erase(digits, 1);
    } else if (result[digits] == '-') {
        ++digits;
    }
    while (digits + 1 < result.size() && result[digits] == '0') {
        result.erase(digits, 1);
    }
    return result;
}

} // anonymous namespace

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_double(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{object:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[array:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

// ============================================================
// JSON Serialization / Deserialization Implementation
// ============================================================

namespace {

// JSON escape special characters in strings
std::string json_escape_string(const std::string& s) {
    std::string result;
    // Pre-allocate with some extra space for potential escapes
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Control characters as \uXXXX
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level) {
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << format_double(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.size() == 0) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const std::string* k : sorted_keys(arg)) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(*k) << "\":" << space_after_colon;
                    to_json_impl(arg.find(*k)->get(), oss, compact, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.size() == 0) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                bool first = true;
                for (const auto& v : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    to_json_impl(*v, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        }
    }, val.data);
}

// ============================================================
// Simple JSON Parser
// ============================================================

class JsonParser {
public:
    explicit JsonParser(std::string_view json) : json_(json), pos_(0) {}

    Value parse(std::string* error_out) {
        try {
            skip_whitespace();
            if (pos_ >= json_.size()) {
                throw std::runtime_error("Empty JSON input");
            }
            Value result = parse_value();
            skip_whitespace();
            if (pos_ < json_.size()) {
                throw std::runtime_error("Unexpected trailing characters at position " + std::to_string(pos_));
            }
            return result;
        } catch (const std::exception& e) {
            detail::log_access_error("from_json", e.what());
            if (error_out) *error_out = e.what();
            return Value{};
        }
    }

private:
    std::string_view json_;
    std::size_t pos_;
    std::size_t depth_ = 0;

    // Tracks container nesting so deep documents are rejected up front
    class DepthGuard {
    public:
        explicit DepthGuard(JsonParser& parser) : parser_(parser) {
            if (++parser_.depth_ > JSON_DIFF_MAX_PARSE_DEPTH) {
                throw std::runtime_error("Maximum nesting depth of " +
                                         std::to_string(JSON_DIFF_MAX_PARSE_DEPTH) +
                                         " exceeded at position " + std::to_string(parser_.pos_));
            }
        }
        ~DepthGuard() { --parser_.depth_; }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        JsonParser& parser_;
    };

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace() {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (consume() != c) {
            throw std::runtime_error(std::string("Expected '") + c + "' at position " + std::to_string(pos_));
        }
    }

    Value parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return parse_string();
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        throw std::runtime_error("Unexpected character '" + std::string(1, c) + "' at position " + std::to_string(pos_));
    }

    Value parse_object() {
        DepthGuard guard{*this};
        expect('{');
        skip_whitespace();

        if (peek() == '}') {
            consume();
            return Value{ValueMap{}};
        }

        MapBuilder builder;

        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            Value val = parse_value();
            builder.set(std::move(key), std::move(val));

            skip_whitespace();
            char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or '}' in object at position " + std::to_string(pos_));
            }
            consume();
        }

        return builder.finish();
    }

    Value parse_array() {
        DepthGuard guard{*this};
        expect('[');
        skip_whitespace();

        if (peek() == ']') {
            consume();
            return Value{ValueVector{}};
        }

        VectorBuilder builder;

        while (true) {
            builder.push_back(parse_value());

            skip_whitespace();
            char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or ']' in array at position " + std::to_string(pos_));
            }
            consume();
        }

        return builder.finish();
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            throw std::runtime_error("Invalid unicode escape");
        }
        unsigned codepoint = 0;
        auto [ptr, ec] = std::from_chars(json_.data() + pos_, json_.data() + pos_ + 4, codepoint, 16);
        if (ec != std::errc{} || ptr != json_.data() + pos_ + 4) {
            throw std::runtime_error("Invalid unicode escape at position " + std::to_string(pos_));
        }
        pos_ += 4;
        return codepoint;
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    std::string parse_string_raw() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = consume();
            if (c == '"') {
                return result;
            }
            if (c == '\\') {
                if (pos_ >= json_.size()) {
                    throw std::runtime_error("Unexpected end of string escape");
                }
                char escaped = consume();
                switch (escaped) {
                    case '"':  result += '"'; break;
                    case '\\': result += '\\'; break;
                    case '/':  result += '/'; break;
                    case 'b':  result += '\b'; break;
                    case 'f':  result += '\f'; break;
                    case 'n':  result += '\n'; break;
                    case 'r':  result += '\r'; break;
                    case 't':  result += '\t'; break;
                    case 'u': {
                        unsigned codepoint = parse_hex4();
                        if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                            throw std::runtime_error("Unpaired low surrogate at position " + std::to_string(pos_));
                        }
                        // A high surrogate must be followed by an escaped low surrogate
                        if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                            if (json_.substr(pos_, 2) != "\\u") {
                                throw std::runtime_error("Unpaired high surrogate at position " + std::to_string(pos_));
                            }
                            pos_ += 2;
                            unsigned low = parse_hex4();
                            if (low < 0xDC00 || low > 0xDFFF) {
                                throw std::runtime_error("Invalid surrogate pair at position " + std::to_string(pos_));
                            }
                            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        }
                        append_utf8(result, codepoint);
                        break;
                    }
                    default:
                        throw std::runtime_error("Invalid escape sequence: \\" + std::string(1, escaped));
                }
            } else {
                result += c;
            }
        }

        throw std::runtime_error("Unterminated string");
    }

    Value parse_string() {
        return Value{parse_string_raw()};
    }

    void consume_digits() {
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            throw std::runtime_error("Expected digit at position " + std::to_string(pos_));
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            consume();
        }
    }

    // number = [ "-" ] ( "0" / 1-9 *DIGIT ) [ "." 1*DIGIT ] [ ( "e" / "E" ) [ "+" / "-" ] 1*DIGIT ]
    Value parse_number() {
        std::size_t start = pos_;
        bool has_decimal = false;
        bool has_exponent = false;

        if (peek() == '-') consume();

        if (peek() == '0') {
            consume();
            if (std::isdigit(static_cast<unsigned char>(peek()))) {
                throw std::runtime_error("Leading zero in number at position " + std::to_string(start));
            }
        } else {
            consume_digits();
        }

        if (peek() == '.') {
            has_decimal = true;
            consume();
            consume_digits();
        }

        if (peek() == 'e' || peek() == 'E') {
            has_exponent = true;
            consume();
            if (peek() == '+' || peek() == '-') consume();
            consume_digits();
        }

        const char* first = json_.data() + start;
        const char* last = json_.data() + pos_;

        if (!has_decimal && !has_exponent) {
            int64_t signed_val = 0;
            auto [p1, ec1] = std::from_chars(first, last, signed_val);
            if (ec1 == std::errc{} && p1 == last) {
                return Value{signed_val};
            }
            uint64_t unsigned_val = 0;
            auto [p2, ec2] = std::from_chars(first, last, unsigned_val);
            if (ec2 == std::errc{} && p2 == last) {
                return Value{unsigned_val};
            }
        }

        double double_val = 0.0;
        auto [p3, ec3] = std::from_chars(first, last, double_val);
        if (ec3 != std::errc{} || p3 != last) {
            throw std::runtime_error("Invalid number '" + std::string(first, last) +
                                     "' at position " + std::to_string(start));
        }
        return Value{double_val};
    }

    Value parse_bool() {
        if (json_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return Value{true};
        }
        if (json_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return Value{false};
        }
        throw std::runtime_error("Expected 'true' or 'false' at position " + std::to_string(pos_));
    }

    Value parse_null() {
        if (json_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return Value{};
        }
        throw std::runtime_error("Expected 'null' at position " + std::to_string(pos_));
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact) {
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value from_json(std::string_view json_str, std::string* error_out) {
    JsonParser parser(json_str);
    return parser.parse(error_out);
}

Value from_json_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open '" + path + "'");
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("Failed to read '" + path + "'");
    }

    std::string error;
    Value result = from_json(contents.str(), &error);
    if (!error.empty()) {
        throw std::runtime_error(path + ": " + error);
    }
    return result;
}

// ============================================================
// Explicit Template Instantiations
//
// These instantiations generate the actual code for the templated classes
// that are declared with 'extern template' in value.h.
// ============================================================

template struct BasicValue<unsafe_memory_policy>;
template class BasicMapBuilder<unsafe_memory_policy>;
template class BasicVectorBuilder<unsafe_memory_policy>;

} // namespace json_diff
