/*
 * json_object.h
 *
 * compact JSON writers for objects and arrays
 */

#ifndef JSON_OBJECT_H
#define JSON_OBJECT_H

#include <string>
#include "buffer_stream.h"
#include "utf8.hpp"

/*
 * json_object and json_array serialize JSON objects and arrays,
 * respectively, into a buffer.  Members and elements are separated by
 * an unpadded comma, and each key is followed by a colon and a single
 * space, as in {"key": [1,2]}
 */

struct json_object {
    buffer_stream *b;
    bool comma = false;
    void write_comma(bool &c) {
        if (c) {
            b->write_char(',');
        } else {
            c = true;
        }
    }
    explicit json_object(buffer_stream *buf) : b{buf} {
        b->write_char('{');
    }
    void close() {
        b->write_char('}');
    }

    /// writes the key \param k as an escaped JSON string followed by a
    /// colon; the caller must then write exactly one value
    ///
    void print_key(const std::string &k) {
        write_comma(comma);
        b->write_char('\"');
        utf8_string::write(*b, reinterpret_cast<const uint8_t *>(k.data()), k.length());
        b->puts("\": ");
    }
};

struct json_array {
    buffer_stream *b;
    bool comma = false;
    void write_comma(bool &c) {
        if (c) {
            b->write_char(',');
        } else {
            c = true;
        }
    }
    explicit json_array(buffer_stream *buf) : b{buf} {
        b->write_char('[');
    }
    void close() {
        b->write_char(']');
    }

    /// prepares for the next element; the caller must then write
    /// exactly one value
    ///
    void next() {
        write_comma(comma);
    }
};

#endif // JSON_OBJECT_H
