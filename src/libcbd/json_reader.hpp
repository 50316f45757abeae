// json_reader.hpp
//
// parsing of JSON text into a cbd::value

#ifndef JSON_READER_HPP
#define JSON_READER_HPP

#include <string>
#include <utility>
#include "value.hpp"
#include "error.hpp"

namespace cbd::json {

    static constexpr size_t default_max_depth = 256;

    /// parses exactly one JSON value from \param text, which may be
    /// surrounded by insignificant whitespace, and returns it as a
    /// \ref value.
    ///
    /// Number literals containing `.`, `e`, or `E` become floating
    /// point values; all others become integers, unless they fall
    /// outside of the range -2^64 .. 2^64-1.  Object members are kept
    /// in the order in which they appear, including duplicates.
    /// Arrays and objects may be nested at most \param max_depth
    /// levels deep.
    ///
    /// \throws json_parse_error
    ///
    value parse(const std::string &text, size_t max_depth=default_max_depth);

    /// returns the one-based line and column of the byte at \param
    /// offset in \param text
    ///
    std::pair<size_t, size_t> line_and_column(const std::string &text, size_t offset);

} // namespace cbd::json

#endif // JSON_READER_HPP
