/**
 * @file Equality.cpp
 * @brief Implementation of structural equality
 */

#include "datamerge/Equality.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace datamerge {

bool deep_equal(const Value& a, const Value& b) {
    const Shape sa = shape_of(a);
    if (sa != shape_of(b)) {
        return false; // RULE E4
    }

    switch (sa) {
        case Shape::Array: {
            if (a.size() != b.size()) {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!deep_equal(a[i], b[i])) {
                    return false;
                }
            }
            return true;
        }

        case Shape::Object: {
            if (a.size() != b.size()) {
                return false;
            }
            for (auto it = a.begin(); it != a.end(); ++it) {
                auto other = b.find(it.key());
                if (other == b.end() || !deep_equal(it.value(), *other)) {
                    return false;
                }
            }
            return true;
        }

        case Shape::Null:
            return true;

        case Shape::Boolean:
        case Shape::Number:
        case Shape::String:
        default:
            // nlohmann compares mixed integer/float numbers by value
            return a == b;
    }
}

bool contains_equal(const std::vector<Value>& values, const Value& item) {
    return std::any_of(values.begin(), values.end(),
                       [&](const Value& v) { return deep_equal(v, item); });
}

namespace {
    /**
     * @brief Quote a string, escaping only '"', '\\' and control bytes
     *
     * Other bytes are copied as-is, so strings that are not valid UTF-8
     * still get distinct texts.
     */
    void write_quoted(const std::string& s, std::string& out) {
        static const char kHex[] = "0123456789abcdef";
        out += '"';
        for (unsigned char c : s) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\b': out += "\\b"; break;
                case '\f': out += "\\f"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (c < 0x20) {
                        out += "\\u00";
                        out += kHex[c >> 4];
                        out += kHex[c & 0x0f];
                    } else {
                        out += static_cast<char>(c);
                    }
            }
        }
        out += '"';
    }

    void write_canonical(const Value& val, std::string& out) {
        if (val.is_object()) {
            std::vector<std::string> keys;
            keys.reserve(val.size());
            for (auto it = val.begin(); it != val.end(); ++it) {
                keys.push_back(it.key());
            }
            std::sort(keys.begin(), keys.end());

            out += '{';
            for (std::size_t i = 0; i < keys.size(); ++i) {
                if (i > 0) out += ',';
                write_quoted(keys[i], out);
                out += ':';
                write_canonical(val.at(keys[i]), out);
            }
            out += '}';
            return;
        }

        if (val.is_array()) {
            out += '[';
            for (std::size_t i = 0; i < val.size(); ++i) {
                if (i > 0) out += ',';
                write_canonical(val[i], out);
            }
            out += ']';
            return;
        }

        if (val.is_string()) {
            write_quoted(val.get_ref<const std::string&>(), out);
            return;
        }

        if (val.is_number_float()) {
            const double d = val.get<double>();
            // 2^53: every integer below this is exactly representable
            if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < 9007199254740992.0) {
                out += std::to_string(static_cast<std::int64_t>(d));
                return;
            }
        }

        out += val.dump();
    }
}

std::string canonical_dump(const Value& val) {
    std::string out;
    write_canonical(val, out);
    return out;
}

std::string to_text(const Value& val) {
    if (val.is_string()) {
        return val.get<std::string>();
    }
    return canonical_dump(val);
}

std::string identity_key(const Value& val) {
    if (val.is_object()) {
        for (const char* field : {"id", "_id", "key"}) {
            auto it = val.find(field);
            if (it != val.end()) {
                return std::string(field) + ":" + to_text(*it);
            }
        }
    }
    return canonical_dump(val);
}

} // namespace datamerge
