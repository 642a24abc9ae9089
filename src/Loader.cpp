/**
 * @file Loader.cpp
 * @brief JSON and TOML source reading
 */

#include "datamerge/Loader.hpp"
#include "datamerge/Errors.hpp"
#include "datamerge/Log.hpp"
#include "datamerge/Util.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <type_traits>
#include <utility>

namespace fs = std::filesystem;

namespace datamerge {

namespace {

enum class SourceFormat { Json, Toml };

/**
 * @brief Whole file contents; the single place an unreadable file is reported
 */
std::string read_source(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FileNotFoundError(path);
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

SourceFormat format_of(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return SourceFormat::Json;
    }
    if (ext == ".toml") {
        return SourceFormat::Toml;
    }
    throw MergeError("Unsupported source type '" + ext + "' for '" + path +
                     "' (expected .json or .toml)");
}

Value parse_json(const std::string& path, const std::string& text) {
    try {
        return Value::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        // e.byte counts from 1 and points at the last byte read
        const TextPosition pos = position_at(text, e.byte > 0 ? e.byte - 1 : 0);
        throw SourceParseError(path, "JSON", pos.line, pos.column, e.what());
    }
}

Value from_toml(const toml::node& node);

/**
 * @brief Table entries in the order they were written
 *
 * toml++ stores tables sorted by key; each key keeps its source position,
 * which restores document order. Keys without a position (none from a
 * parsed file) sort first, in key order.
 */
Value from_toml_table(const toml::table& table) {
    std::vector<std::pair<const toml::key*, const toml::node*>> entries;
    entries.reserve(table.size());
    for (auto&& [key, child] : table) {
        entries.emplace_back(&key, &child);
    }
    std::stable_sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        const auto& pa = a.first->source().begin;
        const auto& pb = b.first->source().begin;
        return pa.line != pb.line ? pa.line < pb.line : pa.column < pb.column;
    });

    Value obj = Value::object();
    for (const auto& [key, child] : entries) {
        obj[std::string(key->str())] = from_toml(*child);
    }
    return obj;
}

Value from_toml(const toml::node& node) {
    return node.visit([](const auto& n) -> Value {
        using T = std::decay_t<decltype(n)>;
        if constexpr (toml::is_table<T>) {
            return from_toml_table(n);
        } else if constexpr (toml::is_array<T>) {
            Value arr = Value::array();
            for (const auto& elem : n) {
                arr.push_back(from_toml(elem));
            }
            return arr;
        } else if constexpr (toml::is_date<T> || toml::is_time<T> || toml::is_date_time<T>) {
            std::ostringstream text;
            text << n.get();
            return Value(text.str());
        } else {
            return Value(n.get());
        }
    });
}

Value parse_toml(const std::string& path, const std::string& text) {
    try {
        return from_toml_table(toml::parse(text, path));
    } catch (const toml::parse_error& e) {
        throw SourceParseError(path, "TOML",
                               static_cast<int>(e.source().begin.line),
                               static_cast<int>(e.source().begin.column),
                               std::string(e.description()));
    }
}

} // anonymous namespace

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Value load_json_file(const std::string& path) {
    return parse_json(path, read_source(path));
}

Value load_toml_file(const std::string& path) {
    return parse_toml(path, read_source(path));
}

Value load_source_file(const std::string& path) {
    const std::string text = read_source(path);
    const SourceFormat format = format_of(path);
    DATAMERGE_DEBUG("loading '{}' ({} bytes)", path, text.size());
    return format == SourceFormat::Json ? parse_json(path, text) : parse_toml(path, text);
}

std::vector<Value> load_source_files(const std::vector<std::string>& paths) {
    std::vector<Value> sources;
    sources.reserve(paths.size());
    for (const auto& path : paths) {
        sources.push_back(load_source_file(path));
    }
    return sources;
}

} // namespace datamerge
