#include <od/json.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>

namespace od {

namespace {
    std::string escape_json_string(const std::string& s) {
        std::string result;
        result.reserve(s.size() + 2);
        result.push_back('"');
        for (char c : s) {
            switch (c) {
                case '"':
                    result += "\\\"";
                    break;
                case '\\':
                    result += "\\\\";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                        result += buf;
                    } else {
                        result.push_back(c);
                    }
                    break;
            }
        }
        result.push_back('"');
        return result;
    }

    // Shortest of 15 or 17 significant digits that reads back exactly, always
    // with a '.' or exponent so the text parses back as a double.
    std::string format_double(double x) {
        if (not std::isfinite(x)) return "null";
        std::ostringstream ss;
        ss << std::setprecision(15) << x;
        if (std::strtod(ss.str().c_str(), nullptr) != x) {
            ss.str("");
            ss << std::setprecision(std::numeric_limits<double>::max_digits10) << x;
        }
        std::string out = ss.str();
        if (out.find_first_of(".eE") == std::string::npos) out += ".0";
        return out;
    }

    struct Printer {
        std::ostringstream out;
        int indent;

        explicit Printer(int ind) : indent(ind) {}

        void newline(int level) {
            if (indent <= 0) return;
            out << '\n' << std::string(static_cast<size_t>(level * indent), ' ');
        }

        void value(const Value& v, int level) {
            switch (v.type()) {
                case Value::Null:
                    out << "null";
                    return;
                case Value::Boolean:
                    out << (v.asBool() ? "true" : "false");
                    return;
                case Value::Integer:
                    out << v.asInt();
                    return;
                case Value::Double:
                    out << format_double(v.asDouble());
                    return;
                case Value::String:
                    out << escape_json_string(v.asString());
                    return;
                case Value::Map:
                    map(v.asMap(), level);
                    return;
            }
        }

        void map(const OrderedMap& m, int level) {
            bool as_array = m.isList();
            char open = as_array ? '[' : '{';
            char close = as_array ? ']' : '}';
            if (m.empty()) {
                out << open << close;
                return;
            }
            // Key(0) and Key("0") both render as "0" in an object.
            std::set<std::string> seen;
            out << open;
            bool first = true;
            for (auto const& [k, v] : m) {
                if (not as_array and not seen.insert(k.to_string()).second)
                    throw JsonWriteError("cannot write map as a JSON object: key \"" + k.to_string() +
                                         "\" is used both as an integer and as a string key");
                if (not first) out << ',';
                first = false;
                newline(level + 1);
                if (not as_array) out << escape_json_string(k.to_string()) << (indent > 0 ? ": " : ":");
                value(v, level + 1);
            }
            newline(level);
            out << close;
        }
    };
}

std::string dump_json(const Value& v, int indent) {
    Printer p(indent);
    p.value(v, 0);
    return p.out.str();
}

std::string dump_json(const OrderedMap& m, int indent) {
    Printer p(indent);
    p.map(m, 0);
    return p.out.str();
}

}  // namespace od
