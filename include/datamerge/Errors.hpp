/**
 * @file Errors.hpp
 * @brief Exception types for datamerge errors
 *
 * Error taxonomy:
 * - MergeError: Base class
 * - MergeConflictError: "error" conflict policy aborted a merge
 * - PathError: Malformed path text
 * - FileNotFoundError: Source, options or schema file cannot be opened
 * - SourceParseError: JSON/TOML syntax error, with its location
 * - OptionsError: Invalid merge options document
 * - SchemaError: Invalid validation rule document
 *
 * Validator failures are never thrown; they are recorded on the
 * MergeResult instead.
 */

#ifndef DATAMERGE_ERRORS_HPP
#define DATAMERGE_ERRORS_HPP

#include "datamerge/Value.hpp"

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>
#include <utility>

namespace datamerge {

/**
 * @brief Base class for all datamerge exceptions
 */
class MergeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Conflicting values under the "error" resolution policy
 *
 * Thrown from the middle of a merge; the caller receives no partial
 * result.
 */
class MergeConflictError : public MergeError {
public:
    /**
     * @brief Construct with conflict location and the values involved
     * @param path Path of the conflicting location ("" for the root)
     * @param values Conflicting values in source order
     */
    MergeConflictError(std::string path, std::vector<Value> values)
        : MergeError(format_message(path, values))
        , path_(std::move(path))
        , values_(std::move(values))
    {}

    /**
     * @brief Get the path where the conflict occurred
     */
    const std::string& path() const noexcept {
        return path_;
    }

    /**
     * @brief Get the conflicting values in source order
     */
    const std::vector<Value>& values() const noexcept {
        return values_;
    }

private:
    std::string path_;
    std::vector<Value> values_;

    static std::string format_message(const std::string& path,
                                      const std::vector<Value>& values) {
        std::ostringstream oss;
        oss << "Merge conflict at path \"" << path << "\": [";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) oss << ",";
            oss << values[i].dump(-1, ' ', false, Value::error_handler_t::replace);
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief Path text could not be parsed
 */
class PathError : public MergeError {
public:
    /**
     * @brief Construct with the offending path and what is wrong with it
     * @param path Full path text (e.g., "rows[x]")
     * @param detail Description of the problem
     */
    PathError(std::string path, std::string detail)
        : MergeError("Invalid path '" + path + "': " + detail)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief A source, options or schema file could not be opened
 */
class FileNotFoundError : public MergeError {
public:
    explicit FileNotFoundError(std::string path)
        : MergeError("Cannot open '" + path + "': no such readable file")
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief A file was read but its JSON or TOML text is malformed
 *
 * line() and column() are 1-based and locate the byte where the parser
 * gave up.
 */
class SourceParseError : public MergeError {
public:
    SourceParseError(std::string file, std::string format, int line, int column,
                     std::string details)
        : MergeError(format + " syntax error in '" + file + "' at line " +
                     std::to_string(line) + ", column " + std::to_string(column) +
                     ": " + details)
        , file_(std::move(file))
        , format_(std::move(format))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    /// "JSON" or "TOML"
    const std::string& format() const noexcept { return format_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    std::string format_;
    int line_;
    int column_;
    std::string details_;
};

/**
 * @brief Merge options document contains an invalid entry
 */
class OptionsError : public MergeError {
public:
    /**
     * @param key Option key that was rejected
     * @param detail Why it was rejected
     */
    OptionsError(std::string key, std::string detail)
        : MergeError("Invalid merge option '" + key + "': " + detail)
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

/**
 * @brief Validation schema contains an invalid rule
 */
class SchemaError : public MergeError {
public:
    /**
     * @param path Path whose rule was rejected
     * @param detail Why it was rejected
     */
    SchemaError(std::string path, std::string detail)
        : MergeError("Invalid validation rule for '" + path + "': " + detail)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

} // namespace datamerge

#endif // DATAMERGE_ERRORS_HPP
