// utf8.hpp

#ifndef UTF8_HPP
#define UTF8_HPP

#include "datum.h"
#include "buffer_stream.h"
#include <vector> // used for unit test cases

/// class utf8_string represents a sequence of UTF-8 code points in
/// memory; it can check that the sequence is valid UTF-8, and can
/// write out a JSON-escaped representation with \ref
/// utf8_string::write().
///
class utf8_string : public datum {
public:

    /// construct a utf8_string from a datum by copying
    ///
    utf8_string(const datum &d) : datum{d} { }

    /// construct a utf8_string from the first byte \param d, and the
    /// byte immedately after its end \param d_end
    ///
    utf8_string(const uint8_t *d, const uint8_t *d_end) : datum{d, d_end} { }

    // code sequence used to represent invalid byte sequences
    //
    static constexpr const char *replacement_character = "\\ufffd";

    /// reads one code point from the UTF-8 sequence starting at \p x
    /// and ending before \p end, and advances \p x past it.
    ///
    /// \return the code point, or `invalid` if the sequence starting
    /// at \p x is truncated, overlong, a surrogate half, beyond
    /// U+10FFFF, or starts with a continuation byte; in that case
    /// \p x is advanced by one byte
    ///
    static inline uint32_t decode_codepoint(const uint8_t *&x, const uint8_t *end);

    static constexpr uint32_t invalid = 0xffffffff;

    /// returns the number of bytes at the start of \p d that form a
    /// valid UTF-8 sequence; the whole datum is valid if and only if
    /// the result equals `d.length()`
    ///
    static inline size_t valid_prefix_length(const datum &d) {
        const uint8_t *x = d.data;
        while (x < d.data_end) {
            const uint8_t *start = x;
            if (decode_codepoint(x, d.data_end) == invalid) {
                return start - d.data;
            }
        }
        return d.length();
    }

    bool is_valid() const {
        return is_null() or valid_prefix_length(*this) == length();
    }

    /// write the \param len bytes at location \param data as a UTF-8
    /// string with the JSON special characters (quotation mark,
    /// reverse solidus) and control characters escaped as per RFC
    /// 8259 Section 7; valid non-ASCII characters are copied as they
    /// are.
    ///
    /// Invalid byte sequences are replaced with the escape '\ufffd'.
    ///
    /// \return `true` if the input bytes formed a valid UTF-8
    /// sequence, `false` otherwise.
    ///
    static inline bool write(buffer_stream &b, const uint8_t *data, size_t len);

    /// write this utf8 string into a buffer_stream, as with
    /// utf8_string::write()
    ///
    bool write(buffer_stream &b) const {
        if (datum::is_not_null()) {
            return write(b, data, length());
        }
        return true;
    }

    // return true if x is a continuation byte, and false otherwise
    //
    static bool is_continuation(uint8_t x) {
        return x >= 0x80 && x <= 0xbf;
    }

    // write the uint16_t value as a '\uXXXX'-encoded codepoint
    //
    static void write_codepoint(buffer_stream &b, uint16_t codepoint) {
        b.write_char('\\');
        b.write_char('u');
        b.write_hex_uint(codepoint);
    }

    /// runs the unit tests for \ref utf8_string and returns `true` if
    /// and only if all test cases pass.  If a non-null `FILE *`
    /// argument is passed, then a brief description of each test case
    /// run is written to that `FILE`.
    ///
    static inline bool unit_test(FILE *f=nullptr);

    // implements a test case for \ref utf8_string
    //
    class test_case {
        std::vector<uint8_t> s_in;   // string to be checked
        bool valid;                  // true is s_in is valid utf8; false otherwise

    public:

        test_case(const std::vector<uint8_t> input, bool is_valid) :
            s_in{input},
            valid{is_valid}
        { }

        bool test() const {
            utf8_string s_utf8{datum{s_in}};
            buffer_stream buf;
            return s_utf8.is_valid() == valid and s_utf8.write(buf) == valid;
        }

        void fprint(FILE *f) const {
            fprintf(f, "input: ");
            datum{s_in}.fprint_hex(f);
            fprintf(f, "\texpected: %s\t%s\n", valid ? "valid" : "invalid", test() ? "passed" : "failed");
        }

    };

};

// UTF-8 is a variable-length encoding scheme that represents unicode
// code points in sequences of one to four bytes.  It is backwards
// compatible with ASCII.
//
// Legal UTF-8 Byte Sequences, following http://www.unicode.org/versions/corrigendum1.html
//
//  Code Points         1st Byte  2nd Byte   3rd Byte    4th Byte
//  ---------------------------------------------------------------
//  U+0000..U+007F      00..7F    -          -           -
//  U+0080..U+07FF      C2..DF    80..BF     -           -
//  U+0800..U+0FFF      E0        A0..BF     80..BF      -
//  U+1000..U+FFFF      E1..EF    80..BF     80..BF      -
//  U+10000..U+3FFFF    F0        90..BF     80..BF      80..BF
//  U+40000..U+FFFFF    F1..F3    80..BF     80..BF      80..BF
//  U+100000..U+10FFFF  F4        80..8F     80..BF      80..BF
//
// The surrogate halves U+D800..U+DFFF are not legal in UTF-8.
//
inline uint32_t utf8_string::decode_codepoint(const uint8_t *&x, const uint8_t *end) {
    uint8_t byte1 = *x;

    if (byte1 < 0x80) {            // ASCII
        x++;
        return byte1;
    }
    if (byte1 < 0xc2 || byte1 > 0xf4) {
        x++;                       // continuation byte, overlong 0xc0/0xc1, or out of range
        return invalid;
    }

    size_t num_bytes;
    uint32_t codepoint;
    uint32_t minimum;
    if (byte1 >= 0xf0) {
        num_bytes = 4;
        codepoint = byte1 & 0x07;
        minimum = 0x10000;
    } else if (byte1 >= 0xe0) {
        num_bytes = 3;
        codepoint = byte1 & 0x0f;
        minimum = 0x0800;
    } else {
        num_bytes = 2;
        codepoint = byte1 & 0x1f;
        minimum = 0x80;
    }

    if (static_cast<size_t>(end - x) < num_bytes) {
        x++;                       // error; too few bytes for code point
        return invalid;
    }
    for (size_t i = 1; i < num_bytes; i++) {
        if (!is_continuation(x[i])) {
            x++;
            return invalid;
        }
        codepoint = (codepoint << 6) | (x[i] & 0x3f);
    }
    if (codepoint < minimum                               // overlong encoding
        || (codepoint >= 0xd800 && codepoint <= 0xdfff)   // surrogate half
        || codepoint > 0x10ffff) {
        x++;
        return invalid;
    }
    x += num_bytes;
    return codepoint;
}

inline bool utf8_string::write(buffer_stream &b, const uint8_t *data, size_t len) {
    bool valid = true;

    const uint8_t *x = data;
    const uint8_t *end = data + len;
    while (x < end) {

        if (*x >= 0x80) {            // non-ASCII/multi-byte characters

            const uint8_t *start = x;
            if (decode_codepoint(x, end) == invalid) {
                b.puts(replacement_character);
                valid = false;
            } else {
                b.write(reinterpret_cast<const char *>(start), x - start);
            }

        } else {    // *x < 0x80; ASCII

            if (*x < 0x20 || *x == 0x7f) {       // escape control characters
                switch (*x) {
                case '\b': b.puts("\\b"); break;
                case '\f': b.puts("\\f"); break;
                case '\n': b.puts("\\n"); break;
                case '\r': b.puts("\\r"); break;
                case '\t': b.puts("\\t"); break;
                default:
                    write_codepoint(b, *x);
                }

            } else {
                if (*x == '"' || *x == '\\') {   // escape json special characters
                    b.write_char('\\');
                }
                b.write_char(*x);                // print out ascii character
            }
            x++;
        }
    }
    return valid;
}

inline bool utf8_string::unit_test(FILE *output) {

    // note: output=nullptr by default, but can be set to stdout or
    // another FILE* to enable verbose output

    // UTF-8 test cases, including some adapted from the "UTF-8
    // decoder capability and stress test", Markus Kuhn
    // <http://www.cl.cam.ac.uk/~mgk25/>, 2015-08-28, which is CC BY
    // 4.0.
    //
    utf8_string::test_case utf8_test_cases[] = {

        // correct ASCII-US
        //
        { { 0x50, 0x6c, 0x65, 0x69, 0x73, 0x74, 0x6f, 0x63, 0x65, 0x6e, 0x65 }, true },
        //
        // ASCII control characters
        //
        { { 0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x7f }, true },
        //
        // correct UTF-8 (greek word 'kosme')
        //
        { { 0xce, 0xba, 0xe1, 0xbd, 0xb9, 0xcf, 0x83, 0xce, 0xbc, 0xce, 0xb5 }, true },
        //
        // first and last possible sequences of each length
        //
        { { 0xc2, 0x80 }, true },
        { { 0xe0, 0xa0, 0x80 }, true },
        { { 0xf0, 0x90, 0x80, 0x80 }, true },
        { { 0xdf, 0xbf }, true },
        { { 0xef, 0xbf, 0xbf }, true },
        { { 0xf4, 0x8f, 0xbf, 0xbf }, true },
        //
        // private use code points are valid text
        //
        { { 0xee, 0x80, 0x80 }, true },
        //
        // unexpected continuation bytes
        //
        { { 0x80 }, false },
        { { 0xbf }, false },
        { { 0x61, 0x80, 0xbf }, false },
        //
        // sequences with last continuation byte missing
        //
        { { 0xc2 }, false },
        { { 0xe0, 0x80 }, false },
        { { 0xf0, 0x80, 0x80 }, false },
        //
        // overlong sequences
        //
        { { 0xc0, 0xaf }, false },
        { { 0xe0, 0x80, 0xaf }, false },
        { { 0xf0, 0x80, 0x80, 0xaf }, false },
        //
        // single UTF-16 surrogates
        //
        { { 0xed, 0xa0, 0x80 }, false },
        { { 0xed, 0xbf, 0xbf }, false },
        //
        // code points beyond U+10FFFF
        //
        { { 0xf4, 0x90, 0x80, 0x80 }, false },
        { { 0xf5, 0x80, 0x80, 0x80 }, false },
        { { 0xfe }, false },
        { { 0xff }, false },
    };

    bool all_passed = true;
    for (const auto &tc : utf8_test_cases) {
        if (output) {
            tc.fprint(output);
        }
        if (tc.test() == false) {
            all_passed = false;
        }
    }
    return all_passed;
}

#endif // UTF8_HPP
