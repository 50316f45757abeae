// cbor_decoder.cc
//
// decoding of a single CBOR data item into a cbd::value

#include "cbor.hpp"
#include "utf8.hpp"

namespace cbd::cbor {

    namespace {

        using code = cbor_decode_error::code;

        // class decoder reads one data item from a datum, tracking
        // the offset of each item so that errors can be located
        //
        class decoder {
            datum d;
            const uint8_t *start;
            size_t max_depth;

        public:

            decoder(datum input, size_t depth_limit) :
                d{input},
                start{input.data},
                max_depth{depth_limit}
            { }

            value decode_top_level() {
                value v = read_item(0);
                if (d.is_readable()) {
                    fail(code::trailing_data, d.data,
                         std::to_string(d.length()) + " unconsumed bytes after data item");
                }
                return v;
            }

        private:

            [[noreturn]] void fail(code c, const uint8_t *location, const std::string &detail="") const {
                throw cbor_decode_error{c, static_cast<size_t>(location - start), detail};
            }

            // returns the initial byte at the front of d, without
            // consuming it
            //
            initial_byte peek_initial_byte(const uint8_t *item_start) const {
                lookahead<initial_byte> ib{d};
                if (!ib) {
                    fail(code::unexpected_eof, item_start);
                }
                return ib.value;
            }

            // reads the initial byte and argument of a data item whose
            // additional info is neither reserved nor indefinite
            //
            uint64_t read_argument(const uint8_t *item_start) {
                initial_byte ib = peek_initial_byte(item_start);
                if (ib.is_reserved()) {
                    fail(code::invalid_additional_info, item_start,
                         "reserved additional info " + std::to_string(ib.additional_info()));
                }
                argument arg{d};
                if (d.is_null()) {
                    fail(code::unexpected_eof, item_start, "truncated argument");
                }
                return arg.value();
            }

            // reads the header of a string, array, or map; returns
            // true if the length is indefinite, in which case the
            // initial byte has been consumed and length is unset
            //
            bool read_length(const uint8_t *item_start, uint64_t &length) {
                initial_byte ib = peek_initial_byte(item_start);
                if (ib.is_indefinite_length()) {
                    d.data++;
                    return true;
                }
                length = read_argument(item_start);
                return false;
            }

            // consumes a break byte if one is at the front of d
            //
            bool accept_break(const uint8_t *container_start) {
                if (d.is_not_readable()) {
                    fail(code::unexpected_eof, d.data == nullptr ? container_start : d.data,
                         "missing break in indefinite-length item");
                }
                if (d.peek() == 0xff) {
                    d.data++;
                    return true;
                }
                return false;
            }

            datum read_bytes(const uint8_t *item_start, uint64_t length) {
                if (length > d.length()) {
                    fail(code::unexpected_eof, item_start,
                         "string length " + std::to_string(length) + " exceeds remaining input");
                }
                return datum{d, static_cast<size_t>(length)};
            }

            void check_text(const datum &chunk) const {
                size_t valid_length = utf8_string::valid_prefix_length(chunk);
                if (valid_length != chunk.length()) {
                    fail(code::invalid_text_string, chunk.data + valid_length, "invalid UTF-8");
                }
            }

            // reads a byte string or text string, concatenating the
            // chunks of an indefinite-length string
            //
            std::string read_string(const uint8_t *item_start, uint8_t type) {
                uint64_t length = 0;
                if (!read_length(item_start, length)) {
                    datum bytes = read_bytes(item_start, length);
                    if (type == text_string_type) {
                        check_text(bytes);
                    }
                    return bytes.get_string();
                }

                std::string s;
                while (!accept_break(item_start)) {
                    const uint8_t *chunk_start = d.data;
                    initial_byte ib = peek_initial_byte(chunk_start);
                    if (ib.major_type() != type) {
                        fail(code::malformed_indefinite_string, chunk_start,
                             "chunk of major type " + std::to_string(ib.major_type()));
                    }
                    if (ib.is_indefinite_length()) {
                        fail(code::malformed_indefinite_string, chunk_start, "nested indefinite-length chunk");
                    }
                    datum chunk = read_bytes(chunk_start, read_argument(chunk_start));
                    if (type == text_string_type) {
                        check_text(chunk);
                    }
                    s.append(chunk.get_string());
                }
                return s;
            }

            value read_array(const uint8_t *item_start, size_t depth) {
                array items;
                uint64_t count = 0;
                if (read_length(item_start, count)) {
                    while (!accept_break(item_start)) {
                        items.push_back(read_item(depth + 1));
                    }
                } else {
                    // every item takes at least one byte
                    items.reserve(count < d.length() ? count : d.length());
                    for (uint64_t i = 0; i < count; i++) {
                        items.push_back(read_item(depth + 1));
                    }
                }
                return value{std::move(items)};
            }

            value read_map(const uint8_t *item_start, size_t depth) {
                map entries;
                uint64_t count = 0;
                if (read_length(item_start, count)) {
                    while (!accept_break(item_start)) {
                        value key = read_item(depth + 1);
                        value val = read_item(depth + 1);
                        entries.push_back({std::move(key), std::move(val)});
                    }
                } else {
                    // every pair takes at least two bytes
                    size_t limit = d.length() / 2;
                    entries.reserve(count < limit ? count : limit);
                    for (uint64_t i = 0; i < count; i++) {
                        value key = read_item(depth + 1);
                        value val = read_item(depth + 1);
                        entries.push_back({std::move(key), std::move(val)});
                    }
                }
                return value{std::move(entries)};
            }

            value read_simple_or_float(const uint8_t *item_start, initial_byte ib) {
                uint8_t ai = ib.additional_info();
                if (ai == initial_byte::indefinite_length) {
                    fail(code::unexpected_break, item_start);
                }
                if (ib.is_reserved()) {
                    fail(code::invalid_additional_info, item_start,
                         "reserved additional info " + std::to_string(ai));
                }
                if (ai < initial_byte::simple_one_byte) {
                    d.data++;
                    switch (ai) {
                    case initial_byte::False: return value{false};
                    case initial_byte::True:  return value{true};
                    case initial_byte::null:  return value{null_value{}};
                    default:                  return value{simple_value{ai}};
                    }
                }

                // the remaining forms carry 1, 2, 4, or 8 bytes after
                // the initial byte
                //
                argument arg{d};
                if (d.is_null()) {
                    fail(code::unexpected_eof, item_start, "truncated simple value or float");
                }
                switch (ai) {
                case initial_byte::simple_one_byte:
                    if (arg.value() < 32) {
                        fail(code::invalid_simple_value, item_start,
                             "two-byte encoding of simple value " + std::to_string(arg.value()));
                    }
                    return value{simple_value{static_cast<uint8_t>(arg.value())}};
                case initial_byte::half_float:
                    return value{half_to_double(static_cast<uint16_t>(arg.value()))};
                case initial_byte::single_float:
                    return value{single_to_double(static_cast<uint32_t>(arg.value()))};
                default:
                    return value{bits_to_double(arg.value())};
                }
            }

            value read_item(size_t depth) {
                const uint8_t *item_start = d.data;
                if (d.is_not_readable()) {
                    fail(code::unexpected_eof, item_start == nullptr ? start : item_start);
                }
                initial_byte ib = peek_initial_byte(item_start);
                uint8_t type = ib.major_type();

                if ((type == array_type || type == map_type || type == tagged_item_type) && depth >= max_depth) {
                    fail(code::depth_exceeded, item_start,
                         "more than " + std::to_string(max_depth) + " nested items");
                }
                if (ib.is_indefinite_length() && (type == unsigned_integer_type
                                                  || type == negative_integer_type
                                                  || type == tagged_item_type)) {
                    fail(code::invalid_additional_info, item_start,
                         "indefinite length not allowed for major type " + std::to_string(type));
                }

                switch (type) {
                case unsigned_integer_type:
                    return value{integer{read_argument(item_start), false}};
                case negative_integer_type:
                    return value{integer{read_argument(item_start), true}};
                case byte_string_type:
                    {
                        std::string s = read_string(item_start, type);
                        return value{byte_string(s.begin(), s.end())};
                    }
                case text_string_type:
                    return value{read_string(item_start, type)};
                case array_type:
                    return read_array(item_start, depth);
                case map_type:
                    return read_map(item_start, depth);
                case tagged_item_type:
                    {
                        uint64_t tag = read_argument(item_start);
                        return value{tagged_value{tag, read_item(depth + 1)}};
                    }
                default:
                    return read_simple_or_float(item_start, ib);
                }
            }

        };

    } // namespace

    value decode(datum d, size_t max_depth) {
        if (d.is_null()) {
            throw cbor_decode_error{cbor_decode_error::code::unexpected_eof, 0, "no input"};
        }
        cbd_debug("decoding %zu bytes of CBOR\n", d.length());
        decoder dec{d, max_depth};
        return dec.decode_top_level();
    }

} // namespace cbd::cbor
