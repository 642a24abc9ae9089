/**
 * @file Path.cpp
 * @brief Implementation of path utilities
 */

#include "datamerge/Path.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace datamerge {

std::string join_key(const std::string& base, const std::string& key) {
    if (base.empty()) {
        return key;
    }
    return base + "." + key;
}

std::string join_index(const std::string& base, std::size_t index) {
    return base + "[" + std::to_string(index) + "]";
}

namespace {
    /**
     * @brief Parse the digits of a bracket index
     * @pre digits is non-empty and all characters are digits
     */
    std::size_t parse_index(const std::string& path, const std::string& digits) {
        std::size_t value = 0;
        for (char c : digits) {
            const std::size_t digit = static_cast<std::size_t>(c - '0');
            if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
                throw PathError(path, "index " + digits + " is out of range");
            }
            value = value * 10 + digit;
        }
        return value;
    }

    void walk(const Value& data, const std::string& base,
              std::vector<PathEntry>& out) {
        if (data.is_array()) {
            out.push_back(PathEntry{base, &data});
            for (std::size_t i = 0; i < data.size(); ++i) {
                walk(data[i], join_index(base, i), out);
            }
            return;
        }

        if (!base.empty()) {
            out.push_back(PathEntry{base, &data});
        }

        if (data.is_object()) {
            for (auto it = data.begin(); it != data.end(); ++it) {
                walk(it.value(), join_key(base, it.key()), out);
            }
        }
    }
}

std::vector<PathSegment> split_path(const std::string& path) {
    std::vector<PathSegment> segments;
    if (path.empty()) {
        return segments;
    }

    std::string current;
    // True right after '.', or at the start: a key must follow
    bool expect_key = true;
    std::size_t i = 0;

    while (i < path.size()) {
        const char c = path[i];

        if (c == '.') {
            if (expect_key && current.empty()) {
                throw PathError(path, "empty key at offset " + std::to_string(i));
            }
            if (!current.empty()) {
                segments.push_back(PathSegment::make_key(current));
                current.clear();
            }
            expect_key = true;
            ++i;
            continue;
        }

        if (c == '[') {
            if (!current.empty()) {
                segments.push_back(PathSegment::make_key(current));
                current.clear();
            } else if (expect_key && !segments.empty()) {
                throw PathError(path, "empty key before '[' at offset " + std::to_string(i));
            }

            const auto close = path.find(']', i + 1);
            if (close == std::string::npos) {
                throw PathError(path, "unterminated '['");
            }
            const std::string digits = path.substr(i + 1, close - i - 1);
            if (digits.empty() ||
                !std::all_of(digits.begin(), digits.end(),
                             [](unsigned char d) { return std::isdigit(d) != 0; })) {
                throw PathError(path, "array index must be a non-negative integer, got '" + digits + "'");
            }
            segments.push_back(PathSegment::make_index(parse_index(path, digits)));
            expect_key = false;
            i = close + 1;
            continue;
        }

        if (c == ']') {
            throw PathError(path, "unexpected ']' at offset " + std::to_string(i));
        }

        if (!expect_key && current.empty()) {
            throw PathError(path, "expected '.' or '[' after index at offset " + std::to_string(i));
        }
        current += c;
        ++i;
    }

    if (!current.empty()) {
        segments.push_back(PathSegment::make_key(current));
    } else if (expect_key) {
        throw PathError(path, "path ends with '.'");
    }

    return segments;
}

std::string join_path(const std::vector<PathSegment>& segments) {
    std::string out;
    for (const auto& seg : segments) {
        if (seg.kind == PathSegment::Kind::Key) {
            out = join_key(out, seg.key);
        } else {
            out = join_index(out, seg.index);
        }
    }
    return out;
}

const Value* get_by_path(const Value& data, const std::string& path) {
    const auto segments = split_path(path);

    const Value* current = &data;
    for (const auto& seg : segments) {
        if (seg.kind == PathSegment::Kind::Key) {
            if (!current->is_object()) {
                return nullptr;
            }
            auto it = current->find(seg.key);
            if (it == current->end()) {
                return nullptr;
            }
            current = &(*it);
        } else {
            if (!current->is_array() || seg.index >= current->size()) {
                return nullptr;
            }
            current = &(*current)[seg.index];
        }
    }
    return current;
}

bool contains_path(const Value& data, const std::string& path) {
    return get_by_path(data, path) != nullptr;
}

std::vector<PathEntry> flatten(const Value& data) {
    std::vector<PathEntry> out;
    walk(data, "", out);
    return out;
}

} // namespace datamerge
