// json_printer.hpp
//
// compact JSON rendering of a cbd::value

#ifndef JSON_PRINTER_HPP
#define JSON_PRINTER_HPP

#include <string>
#include "value.hpp"
#include "error.hpp"

namespace cbd::json {

    /// the JSON rendering of a byte string
    ///
    enum class bytes_policy {
        base64,   // unpadded base64 (standard alphabet) in a JSON string
        hex,      // lowercase hexadecimal in a JSON string
        reject,   // json_print_error::code::unsupported_value
    };

    const char *bytes_policy_name(bytes_policy p);

    /// returns the JSON text representing \param v.
    ///
    /// Map keys that are text strings are written as they are, integer
    /// keys are written as their decimal representation in a string,
    /// and tagged keys are replaced by the item that they wrap; any
    /// other key is an error.  Tags are otherwise dropped, leaving
    /// only their items.  Floating point values are written in the
    /// shortest form that reads back as the same double, and NaN or
    /// infinite values are written as null, as is `undefined`.
    ///
    /// \throws json_print_error
    ///
    std::string print(const value &v, bytes_policy policy=bytes_policy::base64);

    /// returns the JSON object key that represents the map key \param k
    ///
    /// \throws json_print_error if \param k has no key representation
    ///
    std::string key_string(const value &k);

} // namespace cbd::json

#endif // JSON_PRINTER_HPP
