/**
 * @file Loader.hpp
 * @brief Reading merge sources, options documents and schemas from disk
 *
 * RULE F1: A file that cannot be opened raises FileNotFoundError, whatever
 *          its extension.
 * RULE F2: Malformed text raises SourceParseError carrying the 1-based
 *          line and column where parsing stopped.
 * RULE F3: The format follows the extension: .json is parsed by
 *          nlohmann::json, .toml by toml++; anything else is a MergeError.
 * RULE F4: Object keys keep document order in both formats, so the first
 *          source's keys lead the merged object.
 */

#ifndef DATAMERGE_LOADER_HPP
#define DATAMERGE_LOADER_HPP

#include "datamerge/Value.hpp"
#include <string>
#include <vector>

namespace datamerge {

/**
 * @brief Parse a JSON file; the root may be any JSON value
 */
Value load_json_file(const std::string& path);

/**
 * @brief Parse a TOML file into an object
 *
 * Dates, times and date-times become their TOML text ("2024-05-01").
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Parse a .json or .toml file (RULE F3)
 */
Value load_source_file(const std::string& path);

/**
 * @brief Load several files in order, for use as merge sources
 */
std::vector<Value> load_source_files(const std::vector<std::string>& paths);

/**
 * @brief Lowercased extension with its dot (".json"), or "" if none
 */
std::string get_file_extension(const std::string& path);

} // namespace datamerge

#endif // DATAMERGE_LOADER_HPP
