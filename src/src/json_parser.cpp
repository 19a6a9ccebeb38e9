#include <od/json.h>

#include <cctype>
#include <cstdint>
#include <sstream>
#include <vector>

namespace od {

namespace {
    struct Parser {
        const std::string& s;
        size_t i = 0;
        size_t line = 1;
        size_t col = 1;

        struct Opener {
            char ch;
            size_t line, col;
        };
        std::vector<Opener> opener_stack;

        static constexpr size_t max_depth = 512;

        void open(char ch) {
            if (opener_stack.size() >= max_depth) fail("maximum nesting depth exceeded");
            opener_stack.push_back(Opener{ch, line, col});
        }

        explicit Parser(const std::string& str) : s(str) {}

        char peek() const { return i < s.size() ? s[i] : '\0'; }

        char get() {
            if (i >= s.size()) return '\0';
            char c = s[i++];
            if (c == '\n') {
                ++line;
                col = 1;
            } else {
                ++col;
            }
            return c;
        }

        // Build "<base> (line L, column C)" followed by the offending line and
        // a caret under the column.
        std::string format_error(const std::string& base) const {
            size_t pos = 0;
            for (size_t cur = 1; cur < line and pos < s.size(); ++pos)
                if (s[pos] == '\n') ++cur;
            size_t end = s.find('\n', pos);
            if (end == std::string::npos) end = s.size();
            std::string line_text = s.substr(pos, end - pos);
            size_t caret = col > 0 ? col - 1 : 0;
            if (caret > line_text.size()) caret = line_text.size();

            std::ostringstream ss;
            ss << base << " (line " << line << ", column " << col << ")\n";
            ss << line_text << "\n" << std::string(caret, ' ') << '^';
            if (not opener_stack.empty()) {
                auto const& o = opener_stack.back();
                ss << "\n('" << o.ch << "' opened at line " << o.line << ", column " << o.col
                   << ")";
            }
            return ss.str();
        }

        [[noreturn]] void fail(const std::string& base) const {
            throw JsonParseError(format_error(base), line, col);
        }

        void skip_ws() {
            while (i < s.size()) {
                unsigned char c = static_cast<unsigned char>(s[i]);
                if (std::isspace(c)) {
                    get();
                    continue;
                }
                if (c == '/' and i + 1 < s.size() and s[i + 1] == '/') {
                    while (i < s.size() and peek() != '\n') get();
                    continue;
                }
                if (c == '/' and i + 1 < s.size() and s[i + 1] == '*') {
                    get();
                    get();
                    bool closed = false;
                    while (i < s.size()) {
                        if (get() == '*' and peek() == '/') {
                            get();
                            closed = true;
                            break;
                        }
                    }
                    if (not closed) fail("unterminated block comment");
                    continue;
                }
                break;
            }
        }

        Value parse_value() {
            skip_ws();
            char c = peek();
            if (c == 'n') return parse_literal("null", Value());
            if (c == 't') return parse_literal("true", Value(true));
            if (c == 'f') return parse_literal("false", Value(false));
            if (c == '"') return Value(parse_string());
            if (c == '[') return parse_array();
            if (c == '{') return parse_object();
            if (c == '-' or std::isdigit(static_cast<unsigned char>(c))) return parse_number();
            if (c == '\0') fail("unexpected end of input while parsing value");
            if (s.compare(i, 4, "True") == 0) fail("unexpected token; did you mean 'true'?");
            if (s.compare(i, 5, "False") == 0) fail("unexpected token; did you mean 'false'?");
            if (s.compare(i, 4, "None") == 0) fail("unexpected token; did you mean 'null'?");
            fail("unexpected token while parsing value");
        }

        Value parse_literal(const char* word, Value v) {
            std::string w(word);
            if (s.compare(i, w.size(), w) != 0) fail("invalid literal");
            for (size_t k = 0; k < w.size(); ++k) get();
            return v;
        }

        static int hex_val(char c) {
            if ('0' <= c and c <= '9') return c - '0';
            if ('a' <= c and c <= 'f') return 10 + (c - 'a');
            if ('A' <= c and c <= 'F') return 10 + (c - 'A');
            return -1;
        }

        static void encode_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        uint32_t parse_hex4() {
            uint32_t v = 0;
            for (int k = 0; k < 4; ++k) {
                int hv = hex_val(peek());
                if (hv < 0) fail("invalid unicode escape");
                get();
                v = (v << 4) | static_cast<uint32_t>(hv);
            }
            return v;
        }

        std::string parse_string() {
            if (get() != '"') fail("expected '\"'");
            std::string out;
            while (true) {
                if (i >= s.size()) fail("unexpected end in string");
                char c = get();
                if (c == '"') break;
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }
                char e = get();
                switch (e) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        uint32_t cp = parse_hex4();
                        if (cp >= 0xDC00 and cp <= 0xDFFF) fail("unpaired surrogate in unicode escape");
                        // join a UTF-16 surrogate pair into one code point
                        if (cp >= 0xD800 and cp <= 0xDBFF) {
                            if (peek() != '\\' or i + 1 >= s.size() or s[i + 1] != 'u')
                                fail("unpaired surrogate in unicode escape");
                            get();
                            get();
                            uint32_t lo = parse_hex4();
                            if (lo < 0xDC00 or lo > 0xDFFF) fail("unpaired surrogate in unicode escape");
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        }
                        encode_utf8(cp, out);
                        break;
                    }
                    case '\0':
                        fail("unexpected end in string escape");
                    default:
                        fail("unsupported escape sequence");
                }
            }
            return out;
        }

        Value parse_number() {
            size_t start = i;
            if (peek() == '-') get();
            if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
            while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            bool is_float = false;
            if (peek() == '.') {
                is_float = true;
                get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            if (peek() == 'e' or peek() == 'E') {
                is_float = true;
                get();
                if (peek() == '+' or peek() == '-') get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            std::string token = s.substr(start, i - start);
            if (not is_float) {
                int64_t n;
                std::istringstream ss(token);
                if (ss >> n) return Value(n);
                // out of int64 range: keep it as a double
            }
            double d;
            std::istringstream ss(token);
            ss >> d;
            return Value(d);
        }

        Value parse_array() {
            open('[');
            get();
            OrderedMap out;
            skip_ws();
            if (peek() == ']') {
                get();
                opener_stack.pop_back();
                return Value(std::move(out));
            }
            while (true) {
                out.append(parse_value());
                skip_ws();
                char c = get();
                if (c == ']') break;
                if (c == ',') continue;
                if (c == ':') fail("unexpected ':' after value; found key/value pair inside array");
                fail("expected ',' or ']'");
            }
            opener_stack.pop_back();
            return Value(std::move(out));
        }

        Value parse_object() {
            open('{');
            get();
            OrderedMap out;
            skip_ws();
            if (peek() == '}') {
                get();
                opener_stack.pop_back();
                return Value(std::move(out));
            }
            while (true) {
                skip_ws();
                if (peek() != '"') {
                    size_t j = i;
                    while (j < s.size() and
                           (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_'))
                        ++j;
                    std::string ident = s.substr(i, j - i);
                    if (ident.empty()) fail("expected string key");
                    fail("expected string key; are you missing quotes around '" + ident + "'?");
                }
                std::string k = parse_string();
                skip_ws();
                if (get() != ':') fail("expected ':' after object key");
                out.set(Key(std::move(k)), parse_value());
                skip_ws();
                char c = get();
                if (c == '}') break;
                if (c == ',') continue;
                fail("expected ',' or '}'");
            }
            opener_stack.pop_back();
            return Value(std::move(out));
        }
    };
}

Value parse_json(const std::string& text) {
    Parser p(text);
    Value v = p.parse_value();
    p.skip_ws();
    if (p.peek() != '\0') p.fail("extra data after JSON value");
    return v;
}

}  // namespace od
