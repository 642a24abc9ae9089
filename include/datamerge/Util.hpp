#ifndef DATAMERGE_UTIL_HPP
#define DATAMERGE_UTIL_HPP

#include <cstddef>
#include <string>

namespace datamerge {

// ASCII lowercase copy; used for policy names and file extensions.
std::string to_lower(std::string s);

// 1-based line and column of a byte offset in a text buffer.
struct TextPosition {
    int line = 1;
    int column = 1;
};

// Offsets past the end resolve to the position just after the last byte.
TextPosition position_at(const std::string& text, std::size_t offset);

} // namespace datamerge

#endif // DATAMERGE_UTIL_HPP
