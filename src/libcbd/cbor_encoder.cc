// cbor_encoder.cc
//
// definite-length CBOR encoding of a cbd::value

#include "cbor.hpp"

namespace cbd::cbor {

    namespace {

        void write_simple(simple_value s, dynamic_buffer &buf) {
            if (s.code < initial_byte::simple_one_byte) {
                initial_byte{simple_or_float_type, s.code}.write(buf);
                return;
            }
            if (s.code < 32) {
                throw cbor_encode_error{cbor_encode_error::code::invalid_simple_value,
                                        "simple value " + std::to_string(s.code) + " is reserved"};
            }
            initial_byte{simple_or_float_type, initial_byte::simple_one_byte}.write(buf);
            buf << s.code;
        }

        // floating point values are always written as double
        // precision, so that no information is lost
        //
        void write_double(double d, dynamic_buffer &buf) {
            initial_byte{simple_or_float_type, initial_byte::double_float}.write(buf);
            encoded<uint64_t>{double_to_bits(d)}.write(buf);
        }

    } // namespace

    void encode(const value &v, dynamic_buffer &buf) {
        switch (v.type()) {
        case value_type::null:
            initial_byte{simple_or_float_type, initial_byte::null}.write(buf);
            return;
        case value_type::boolean:
            initial_byte{simple_or_float_type, v.as_bool() ? initial_byte::True : initial_byte::False}.write(buf);
            return;
        case value_type::integer:
            {
                const integer &i = v.as_integer();
                argument{i.argument(), i.is_negative() ? negative_integer_type : unsigned_integer_type}.write(buf);
            }
            return;
        case value_type::floating_point:
            write_double(v.as_float(), buf);
            return;
        case value_type::byte_string:
            {
                const byte_string &bytes = v.as_bytes();
                argument{bytes.size(), byte_string_type}.write(buf);
                buf.copy(bytes.data(), bytes.size());
            }
            return;
        case value_type::text_string:
            {
                const text_string &text = v.as_text();
                argument{text.size(), text_string_type}.write(buf);
                buf.copy(reinterpret_cast<const uint8_t *>(text.data()), text.size());
            }
            return;
        case value_type::array:
            argument{v.as_array().size(), array_type}.write(buf);
            for (const value &item : v.as_array()) {
                encode(item, buf);
            }
            return;
        case value_type::map:
            argument{v.as_map().size(), map_type}.write(buf);
            for (const map_entry &entry : v.as_map()) {
                encode(entry.key, buf);
                encode(entry.val, buf);
            }
            return;
        case value_type::tag:
            argument{v.as_tag().number(), tagged_item_type}.write(buf);
            encode(v.as_tag().item(), buf);
            return;
        case value_type::simple:
            write_simple(v.as_simple(), buf);
            return;
        }
        throw cbor_encode_error{cbor_encode_error::code::unsupported_value, describe(v)};
    }

} // namespace cbd::cbor
