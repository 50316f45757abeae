// transcode.hpp
//
// the CBOR to JSON and JSON to CBOR pipelines, along with their
// configuration

#ifndef TRANSCODE_HPP
#define TRANSCODE_HPP

#include <cstdio>
#include <string>
#include <vector>
#include "cbor.hpp"
#include "json_printer.hpp"

namespace cbd {

    /// the largest nesting depth that may be configured; the CBOR
    /// decoder and the value destructor use one stack frame per level
    ///
    static constexpr size_t max_depth_limit = 1024;

    /// transcode_config holds the options that select and control a
    /// pipeline; the defaults decode raw CBOR into JSON
    ///
    struct transcode_config {
        bool encode = false;            // JSON to CBOR, rather than CBOR to JSON
        bool base64 = false;            // CBOR side is base64 text
        bool url_safe = false;          // base64 output uses the URL-safe alphabet
        json::bytes_policy bytes = json::bytes_policy::base64;
        size_t max_depth = cbor::default_max_depth;
        bool verbose = false;
    };

    /// parses a maximum nesting depth from \param s, which must be a
    /// decimal number no larger than \ref max_depth_limit; returns
    /// false, and leaves \param depth unchanged, otherwise
    ///
    bool parse_max_depth(const std::string &s, size_t &depth);

    /// parses the name of a byte string policy ("base64", "hex", or
    /// "reject") from \param s; returns false if it is not one
    ///
    bool parse_bytes_policy(const std::string &s, json::bytes_policy &policy);

    /// decodes \param input, which holds one CBOR data item (or its
    /// base64 encoding, if `config.base64` is set), and returns its
    /// compact JSON text
    ///
    std::string cbor_to_json(const std::vector<uint8_t> &input, const transcode_config &config);

    /// parses the JSON text \param input and returns its CBOR
    /// encoding, or the unpadded base64 encoding of those bytes if
    /// `config.base64` is set
    ///
    std::vector<uint8_t> json_to_cbor(const std::string &input, const transcode_config &config);

    /// runs the pipeline selected by \param config on \param input
    /// and returns the complete output; in decode mode, the output is
    /// the JSON text followed by a newline
    ///
    std::vector<uint8_t> transcode(const std::vector<uint8_t> &input, const transcode_config &config);

    /// reads \param f until end of file
    ///
    /// \throws io_error
    ///
    std::vector<uint8_t> read_all(FILE *f);

    /// writes all of \param data to \param f and flushes it
    ///
    /// \throws io_error
    ///
    void write_all(FILE *f, const std::vector<uint8_t> &data);

} // namespace cbd

#endif // TRANSCODE_HPP
