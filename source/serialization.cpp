// serialization.cpp - JSON reader/writer for Value

#include <docdiff/serialization.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace docdiff {

namespace {

// ============================================================
// JSON Writer
// ============================================================

// OPTIMIZATION: Use string::reserve + append instead of ostringstream for better performance
std::string json_escape_string(const std::string& s) {
    std::string result;
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

void to_json_impl(const Value& val, std::string& out, bool compact, int indent_level) {
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const char* newline = compact ? "" : "\n";
    const char* space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            out += std::isfinite(arg) ? number_to_string(val) : "null";
        } else if constexpr (std::is_same_v<T, std::string>) {
            out += '"';
            out += json_escape_string(arg);
            out += '"';
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.size() == 0) {
                out += "{}";
                return;
            }
            std::vector<const ValueMap::value_type*> entries;
            entries.reserve(arg.size());
            for (const auto& entry : arg) {
                entries.push_back(&entry);
            }
            std::sort(entries.begin(), entries.end(),
                      [](const auto* a, const auto* b) { return a->first < b->first; });

            out += '{';
            out += newline;
            bool first = true;
            for (const auto* entry : entries) {
                if (!first) {
                    out += ',';
                    out += newline;
                }
                first = false;
                out += child_indent;
                out += '"';
                out += json_escape_string(entry->first);
                out += "\":";
                out += space_after_colon;
                to_json_impl(entry->second.get(), out, compact, indent_level + 1);
            }
            out += newline;
            out += indent;
            out += '}';
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.size() == 0) {
                out += "[]";
                return;
            }
            out += '[';
            out += newline;
            bool first = true;
            for (const auto& v : arg) {
                if (!first) {
                    out += ',';
                    out += newline;
                }
                first = false;
                out += child_indent;
                to_json_impl(v.get(), out, compact, indent_level + 1);
            }
            out += newline;
            out += indent;
            out += ']';
        }
    }, val.data);
}

// ============================================================
// Simple JSON Parser
// ============================================================

class JsonParser {
public:
    JsonParser(std::string_view json, std::size_t max_depth)
        : json_(json), pos_(0), depth_(0), max_depth_(max_depth) {}

    Value parse(std::string* error_out) {
        try {
            skip_whitespace();
            if (pos_ >= json_.size()) {
                throw std::runtime_error("Empty JSON input");
            }
            Value result = parse_value();
            skip_whitespace();
            if (pos_ < json_.size()) {
                throw std::runtime_error("Unexpected trailing content at position " + std::to_string(pos_));
            }
            if (error_out) error_out->clear();
            return result;
        } catch (const std::runtime_error& e) {
            if (error_out) *error_out = e.what();
            return Value{};
        }
    }

private:
    std::string_view json_;
    std::size_t pos_;
    std::size_t depth_;
    std::size_t max_depth_;

    // Tracks container nesting for the lifetime of one object/array
    struct DepthGuard {
        JsonParser& parser;
        explicit DepthGuard(JsonParser& p) : parser(p) {
            if (++parser.depth_ > parser.max_depth_) {
                throw std::runtime_error("Maximum nesting depth (" + std::to_string(parser.max_depth_) +
                                         ") exceeded at position " + std::to_string(parser.pos_));
            }
        }
        ~DepthGuard() { --parser.depth_; }
    };

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace() {
        while (pos_ < json_.size()) {
            const char c = json_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
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
        if (c == '"') return Value{parse_string_raw()};
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        if (pos_ >= json_.size()) {
            throw std::runtime_error("Unexpected end of input");
        }
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

        auto transient = ValueMap{}.transient();

        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                throw std::runtime_error("Expected string key at position " + std::to_string(pos_));
            }
            std::string key = parse_string_raw();
            expect(':');
            Value val = parse_value();
            transient.set(std::move(key), ValueBox{std::move(val)});

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

        return Value{transient.persistent()};
    }

    Value parse_array() {
        DepthGuard guard{*this};
        expect('[');
        skip_whitespace();

        if (peek() == ']') {
            consume();
            return Value{ValueVector{}};
        }

        auto transient = ValueVector{}.transient();

        while (true) {
            Value val = parse_value();
            transient.push_back(ValueBox{std::move(val)});

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

        return Value{transient.persistent()};
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            throw std::runtime_error("Invalid unicode escape at position " + std::to_string(pos_));
        }
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(json_.data() + pos_, json_.data() + pos_ + 4, value, 16);
        if (ec != std::errc{} || ptr != json_.data() + pos_ + 4) {
            throw std::runtime_error("Invalid unicode escape at position " + std::to_string(pos_));
        }
        pos_ += 4;
        return value;
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
            if (static_cast<unsigned char>(c) < 0x20) {
                throw std::runtime_error("Control character in string at position " + std::to_string(pos_ - 1));
            }
            if (c != '\\') {
                result += c;
                continue;
            }
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
                    // Surrogate pair
                    if (codepoint >= 0xD800 && codepoint <= 0xDBFF &&
                        json_.substr(pos_, 2) == "\\u") {
                        const std::size_t saved = pos_;
                        pos_ += 2;
                        unsigned low = parse_hex4();
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            pos_ = saved;
                        }
                    }
                    append_utf8(result, codepoint);
                    break;
                }
                default:
                    throw std::runtime_error("Invalid escape sequence: \\" + std::string(1, escaped));
            }
        }

        throw std::runtime_error("Unterminated string");
    }

    Value parse_number() {
        const std::size_t start = pos_;
        bool is_integer = true;

        if (peek() == '-') consume();

        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            throw std::runtime_error("Invalid number at position " + std::to_string(start));
        }
        if (peek() == '0') {
            consume();
        } else {
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        if (peek() == '.') {
            is_integer = false;
            consume();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                throw std::runtime_error("Invalid number at position " + std::to_string(start));
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            is_integer = false;
            consume();
            if (peek() == '+' || peek() == '-') consume();
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                throw std::runtime_error("Invalid number at position " + std::to_string(start));
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        const char* first = json_.data() + start;
        const char* last = json_.data() + pos_;

        if (is_integer) {
            int64_t ival = 0;
            auto [ptr, ec] = std::from_chars(first, last, ival);
            if (ec == std::errc{} && ptr == last) {
                return Value{ival};
            }
            // Out of int64 range: fall through to double
        }

        double dval = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, dval, std::chars_format::general);
        if (ec != std::errc{} || ptr != last) {
            throw std::runtime_error("Number out of range at position " + std::to_string(start));
        }
        return Value{dval};
    }

    Value parse_bool() {
        if (json_.substr(pos_, 4) == "true") {
            pos_ += 4;
            return Value{true};
        }
        if (json_.substr(pos_, 5) == "false") {
            pos_ += 5;
            return Value{false};
        }
        throw std::runtime_error("Expected 'true' or 'false' at position " + std::to_string(pos_));
    }

    Value parse_null() {
        if (json_.substr(pos_, 4) == "null") {
            pos_ += 4;
            return Value{};
        }
        throw std::runtime_error("Expected 'null' at position " + std::to_string(pos_));
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact) {
    std::string out;
    to_json_impl(val, out, compact, 0);
    return out;
}

Value from_json(std::string_view json_str, std::string* error_out, std::size_t max_depth) {
    JsonParser parser(json_str, max_depth);
    return parser.parse(error_out);
}

std::string read_text_file(const std::string& file_path) {
    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("failed to read file: cannot open " + file_path);
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("failed to read file: I/O error on " + file_path);
    }
    return content.str();
}

Value read_json_file(const std::string& file_path, std::size_t max_depth) {
    const std::string text = read_text_file(file_path);

    std::string error;
    Value result = from_json(text, &error, max_depth);
    if (!error.empty()) {
        detail::log_access_error("read_json_file", file_path + ": " + error);
        throw std::runtime_error("invalid JSON: " + error);
    }
    return result;
}

void write_text_file(const std::string& file_path, std::string_view content) {
    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("failed to write file: cannot open " + file_path);
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        throw std::runtime_error("failed to write file: I/O error on " + file_path);
    }
}

} // namespace docdiff
