/**
 * @file Path.hpp
 * @brief Path utilities for addressing locations inside nested values
 *
 * A path joins object keys with '.' and appends "[<index>]" for array
 * elements, e.g. "database.hosts[2].name". The empty path addresses the
 * root. Paths are the only key extension points are registered under, so
 * every component builds them through join_key() and join_index() to keep
 * the text identical.
 *
 * Rules:
 * - RULE A1: join_key("", k) is k; otherwise base + "." + k
 * - RULE A2: join_index(base, i) is base + "[" + i + "]", even for an
 *            empty base ("[0]" addresses the first element of a root array)
 * - RULE A3: get_by_path() returns nullptr for anything it cannot reach
 *            (missing key, index out of range, scalar in the way)
 * - RULE A4: split_path() throws PathError for malformed text
 */

#ifndef DATAMERGE_PATH_HPP
#define DATAMERGE_PATH_HPP

#include "datamerge/Value.hpp"
#include "datamerge/Errors.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace datamerge {

/**
 * @brief One step of a parsed path
 */
struct PathSegment {
    enum class Kind { Key, Index };

    Kind kind = Kind::Key;
    std::string key;
    std::size_t index = 0;

    static PathSegment make_key(std::string k) {
        PathSegment seg;
        seg.kind = Kind::Key;
        seg.key = std::move(k);
        return seg;
    }

    static PathSegment make_index(std::size_t i) {
        PathSegment seg;
        seg.kind = Kind::Index;
        seg.index = i;
        return seg;
    }

    bool operator==(const PathSegment& other) const {
        return kind == other.kind && key == other.key && index == other.index;
    }
};

/**
 * @brief Child path for an object key
 *
 * RULE A1.
 *
 * Examples:
 * - join_key("", "db") → "db"
 * - join_key("db", "host") → "db.host"
 * - join_key("rows[0]", "id") → "rows[0].id"
 */
std::string join_key(const std::string& base, const std::string& key);

/**
 * @brief Child path for an array element
 *
 * RULE A2.
 *
 * Examples:
 * - join_index("rows", 2) → "rows[2]"
 * - join_index("", 0) → "[0]"
 */
std::string join_index(const std::string& base, std::size_t index);

/**
 * @brief Parse path text into segments
 *
 * @param path Path text
 * @return Segments in traversal order (empty for the root path)
 * @throws PathError on an empty key ("a..b"), an unterminated or
 *         non-numeric bracket ("a[x]", "a[1"), or a trailing dot
 *
 * Examples:
 * - "a.b[2].c" → [key a, key b, index 2, key c]
 * - "[0][1]" → [index 0, index 1]
 * - "" → []
 */
std::vector<PathSegment> split_path(const std::string& path);

/**
 * @brief Render segments back into path text
 *
 * Inverse of split_path() for any path it accepts.
 */
std::string join_path(const std::vector<PathSegment>& segments);

/**
 * @brief Look up the value at a path
 *
 * @param data Root value
 * @param path Path text ("" returns &data)
 * @return Pointer into data, or nullptr when the path does not resolve
 * @throws PathError if the path text is malformed
 *
 * RULE A3: Unlike a strict lookup, a missing key, an out-of-range index or
 * an attempt to traverse into a scalar all yield nullptr.
 *
 * Examples:
 * ```cpp
 * Value v = {{"rows", {{{"id", 1}}, {{"id", 2}}}}};
 * get_by_path(v, "rows[1].id");   // → points to 2
 * get_by_path(v, "rows[5].id");   // → nullptr
 * get_by_path(v, "rows.id");      // → nullptr (rows is an array)
 * ```
 */
const Value* get_by_path(const Value& data, const std::string& path);

/**
 * @brief Check whether a path resolves inside data
 */
bool contains_path(const Value& data, const std::string& path);

/**
 * @brief One reachable location of a value
 */
struct PathEntry {
    std::string path;
    const Value* value = nullptr;
};

/**
 * @brief Enumerate every location reachable from a value
 *
 * Objects contribute their own path (when non-empty) and recurse into
 * each key; arrays contribute their own path (even at the root) and
 * recurse into each element; scalars contribute their own path (when
 * non-empty). Entries come out in depth-first, document order. The
 * pointers refer into data and are valid as long as data is.
 *
 * Examples:
 * ```cpp
 * Value v = {{"a", {{"b", 1}}}, {"c", {1, 2}}};
 * flatten(v);
 * // → a, a.b, c, c[0], c[1]
 * ```
 */
std::vector<PathEntry> flatten(const Value& data);

} // namespace datamerge

#endif // DATAMERGE_PATH_HPP
