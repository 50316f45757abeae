/*
 * buffer_stream.h
 *
 * growable text output buffer used by the JSON printer
 */

#ifndef BUFFER_STREAM_H
#define BUFFER_STREAM_H

#include <stdint.h>
#include <stdio.h>
#include <string>

class buffer_stream {
    std::string dstr;

public:

    buffer_stream() = default;

    void write_char(char schr) { dstr.push_back(schr); }

    void puts(const char *sstr) { dstr.append(sstr); }

    void write(const char *sstr, size_t len) { dstr.append(sstr, len); }

    void write(const std::string &s) { dstr.append(s); }

    /// writes \p u as exactly `2*sizeof(U)` lowercase hex digits
    ///
    template <typename U>
    void write_hex_uint(U u) {
        static const char hex_table[] = "0123456789abcdef";
        for (size_t i = sizeof(U) * 2; i > 0; i--) {
            dstr.push_back(hex_table[(u >> (4 * (i - 1))) & 0x0f]);
        }
    }

    void raw_as_hex(const uint8_t *data, size_t len) {
        for (size_t i = 0; i < len; i++) {
            write_hex_uint(data[i]);
        }
    }

    /// moves the text written so far out of this buffer, leaving it
    /// empty
    ///
    std::string release() {
        std::string tmp;
        tmp.swap(dstr);
        return tmp;
    }

};

#endif /* BUFFER_STREAM_H */
