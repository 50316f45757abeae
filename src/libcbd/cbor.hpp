// cbor.hpp
//
// compact binary object representation (cbor) encoding and decoding,
// following RFC 8949

#ifndef CBOR_HPP
#define CBOR_HPP

#include "datum.h"
#include "value.hpp"
#include "error.hpp"
#include <cstdio>
#include <cstring>
#include <cmath>
#include <string>
#include <vector>

namespace cbd::cbor {

    static constexpr uint8_t unsigned_integer_type = 0;
    static constexpr uint8_t negative_integer_type = 1;
    static constexpr uint8_t byte_string_type      = 2;
    static constexpr uint8_t text_string_type      = 3;
    static constexpr uint8_t array_type            = 4;
    static constexpr uint8_t map_type              = 5;
    static constexpr uint8_t tagged_item_type      = 6;
    static constexpr uint8_t simple_or_float_type  = 7;

    /// the default bound on the number of nested arrays, maps, and
    /// tags that \ref decode() accepts
    ///
    static constexpr size_t default_max_depth = 256;

    // The initial byte of each encoded data item contains both
    // information about the major type (the high-order 3 bits,
    // described in Section 3.1) and additional information (the
    // low-order 5 bits). With a few exceptions, the additional
    // information's value describes how to load an unsigned integer
    // "argument":
    //
    // Less than 24: the argument's value is the value of the
    // additional information.
    //
    // 24, 25, 26, or 27: the argument's value is held in the
    // following 1, 2, 4, or 8 bytes, respectively, in network byte
    // order. For major type 7 and additional information value 25,
    // 26, 27, these bytes are not used as an integer argument, but as
    // a floating-point value (see Section 3.3).
    //
    // 28, 29, 30: these values are reserved for future additions to
    // the CBOR format. In the present version of CBOR, the encoded
    // item is not well-formed.
    //
    // 31: no argument value is derived. If the major type is 0, 1, or
    // 6, the encoded item is not well-formed. For major types 2 to 5,
    // the item's length is indefinite, and for major type 7, the byte
    // does not constitute a data item at all but terminates an
    // indefinite-length item; all are described in Section 3.2.

    class initial_byte {
        encoded<uint8_t> byte;
    public:

        // additional information values for major type 7
        //
        static constexpr uint8_t False = 20;
        static constexpr uint8_t True  = 21;
        static constexpr uint8_t null  = 22;
        static constexpr uint8_t undefined = 23;
        static constexpr uint8_t simple_one_byte = 24;
        static constexpr uint8_t half_float   = 25;
        static constexpr uint8_t single_float = 26;
        static constexpr uint8_t double_float = 27;

        static constexpr uint8_t indefinite_length = 31;

        // read an initial byte from `d`; if `d` is not readable, it
        // is set to null
        //
        explicit initial_byte(datum &d) : byte{d} { }

        // construct an initial_byte for writing
        //
        initial_byte(uint8_t type, uint8_t info) :
            byte{static_cast<uint8_t>(type << 5 | info)}
        { }

        uint8_t major_type() const { return byte.slice<0,3>(); }

        uint8_t additional_info() const { return byte.slice<3,8>(); }

        // a break indicates the end of a variable-length array, map,
        // byte string, or text string
        //
        bool is_break() const {
            return byte == 0b11111111;
        }

        bool is_reserved() const {
            uint8_t ai = additional_info();
            return ai >= 28 && ai <= 30;
        }

        bool is_indefinite_length() const {
            return additional_info() == indefinite_length;
        }

        void write(dynamic_buffer &buf) const {
            buf << byte.value();
        }

    };

    /// class argument holds the initial byte of a data item together
    /// with the unsigned integer argument that follows it.
    ///
    /// For major type 0, the argument is the value of the item; for
    /// major type 1, the value is -1 minus the argument; for major
    /// types 2 through 5, the argument is a length or count; for
    /// major type 6, it is the tag number.
    ///
    class argument {
        initial_byte ib;
        uint64_t value__;

    public:

        /// construct an argument object by decoding it from the \ref
        /// datum \param d; if the additional info is reserved,
        /// indefinite, or the bytes holding the argument are not
        /// present, then \param d is set to null
        ///
        explicit argument(datum &d) : ib{d}, value__{0} {
            if (d.is_null()) {
                return;
            }
            uint8_t ai = ib.additional_info();
            if (ai < 24) {
                value__ = ai;
            } else if (ai == 24) {
                value__ = encoded<uint8_t>{d}.value();
            } else if (ai == 25) {
                value__ = encoded<uint16_t>{d}.value();
            } else if (ai == 26) {
                value__ = encoded<uint32_t>{d}.value();
            } else if (ai == 27) {
                value__ = encoded<uint64_t>{d}.value();
            } else {
                d.set_null();
            }
        }

        /// construct an argument object, suitable for encoding, with
        /// the value \param x and the major_type \param type; the
        /// type is an unsigned_integer by default, but can be set to
        /// other types
        ///
        explicit argument(uint64_t x, uint8_t type=unsigned_integer_type) :
            ib{type, additional_info(x)},
            value__{x}
        { }

        // returns a `uint8_t` containing the smallest additional
        // information field for encoding a `uint64_t` with the value
        // \param x
        //
        static uint8_t additional_info(uint64_t x) {
            if (x < 24) {
                return static_cast<uint8_t>(x);
            }
            if (x < 0x100) {
                return 24;          // one-byte uint
            }
            if (x < 0x10000) {
                return 25;          // two-byte uint
            }
            if (x < 0x100000000) {
                return 26;          // four-byte uint
            }
            return 27;              // eight-byte uint
        }

        uint8_t major_type() const { return ib.major_type(); }

        /// returns the value of this object as a `uint64_t`
        ///
        uint64_t value() const {
            return value__;
        }

        /// encode this object into the \ref dynamic_buffer \param buf
        ///
        void write(dynamic_buffer &buf) const {
            ib.write(buf);
            switch (ib.additional_info()) {
            case 24:
                encoded<uint8_t>{static_cast<uint8_t>(value__)}.write(buf);
                break;
            case 25:
                encoded<uint16_t>{static_cast<uint16_t>(value__)}.write(buf);
                break;
            case 26:
                encoded<uint32_t>{static_cast<uint32_t>(value__)}.write(buf);
                break;
            case 27:
                encoded<uint64_t>{value__}.write(buf);
                break;
            default:
                ;
            }
        }

        /// `cbor::argument::unit_test()` performs unit tests on the
        /// class \ref cbor::argument and returns `true` if they all
        /// pass, and `false` otherwise.  If \param f == `nullptr`,
        /// then no output is written; otherwise, output is written to
        /// \param f.
        ///
        static bool unit_test(FILE *f=nullptr);

    };

    /// returns the value of the IEEE 754 half-precision number with
    /// the bit pattern \param half, following RFC 8949 Appendix D
    ///
    inline double half_to_double(uint16_t half) {
        int exp = (half >> 10) & 0x1f;
        int mant = half & 0x3ff;
        double val;
        if (exp == 0) {
            val = std::ldexp(mant, -24);
        } else if (exp != 31) {
            val = std::ldexp(mant + 1024, exp - 25);
        } else {
            val = mant == 0 ? INFINITY : NAN;
        }
        return half & 0x8000 ? -val : val;
    }

    inline double single_to_double(uint32_t bits) {
        float f;
        memcpy(&f, &bits, sizeof(f));
        return f;
    }

    inline double bits_to_double(uint64_t bits) {
        double d;
        memcpy(&d, &bits, sizeof(d));
        return d;
    }

    inline uint64_t double_to_bits(double d) {
        uint64_t bits;
        memcpy(&bits, &d, sizeof(bits));
        return bits;
    }

    /// decodes exactly one CBOR data item from \param d and returns
    /// it as a \ref value.
    ///
    /// Arrays, maps, and tags may be nested at most \param max_depth
    /// levels deep.
    ///
    /// \throws cbor_decode_error if \param d does not hold exactly
    /// one well-formed data item
    ///
    value decode(datum d, size_t max_depth=default_max_depth);

    inline value decode(const std::vector<uint8_t> &bytes, size_t max_depth=default_max_depth) {
        return decode(datum{bytes}, max_depth);
    }

    /// appends the definite-length CBOR encoding of \param v to \param buf
    ///
    /// \throws cbor_encode_error if \param v holds a simple value in
    /// the reserved range 24 through 31
    ///
    void encode(const value &v, dynamic_buffer &buf);

    /// returns the definite-length CBOR encoding of \param v
    ///
    inline std::vector<uint8_t> encode(const value &v) {
        dynamic_buffer buf;
        encode(v, buf);
        return buf.release();
    }

    // static unit test function for cbor::argument
    //
    inline bool argument::unit_test(FILE *f) {

        // valid input and output pairs
        //
        std::vector<std::pair<std::vector<uint8_t>,uint64_t>> test_cases = {
            { { 0x00 }, 0 },
            { { 0x01 }, 1 },
            { { 0x0a }, 10 },
            { { 0x17 }, 23 },
            { { 0x18, 0x18 }, 24 },
            { { 0x18, 0x19 }, 25 },
            { { 0x18, 0x64 }, 100 },
            { { 0x18, 0xff }, 255 },
            { { 0x19, 0x01, 0x00 }, 256 },
            { { 0x19, 0x03, 0xe8 }, 1000 },
            { { 0x1a, 0x00, 0x0f, 0x42, 0x40 }, 1000000 },
            { { 0x1b, 0x00, 0x00, 0x00, 0xe8, 0xd4, 0xa5, 0x10, 0x00 }, 1000000000000 },
            { { 0x1b, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff }, 18446744073709551615u },
        };

        bool no_tests_failed = true;
        if (f) { fprintf(f, "cbor::argument test cases:\n"); }
        for (const auto & tc : test_cases) {
            datum d{tc.first};
            cbor::argument u{d};
            bool decoding_passed = d.is_empty() and (u.value() == tc.second);

            dynamic_buffer dbuf;
            cbor::argument{tc.second}.write(dbuf);
            bool encoding_passed = (dbuf.contents() == datum{tc.first});
            bool passed = decoding_passed and encoding_passed;
            no_tests_failed &= passed;

            if (f) {
                fprintf(f, "encoded: ");
                datum{tc.first}.fprint_hex(f);
                fprintf(f, "\tdecoded: %llu\tre-encoded: ", (unsigned long long)u.value());
                dbuf.contents().fprint_hex(f);
                fprintf(f, "\t%s\n", passed ? "passed" : "failed");
            }
        }

        // negative test cases (invalid input)
        //
        std::vector<std::vector<uint8_t>> negative_test_cases = {
            { 0x18 },                           // missing one-byte argument
            { 0x19, 0x03 },                     // truncated two-byte argument
            { 0x1b, 0x00, 0x00, 0x00, 0xe8 },   // truncated eight-byte argument
            { 0x1c },                           // reserved additional info
            { 0x1f },                           // indefinite length
        };
        if (f) { fprintf(f, "cbor::argument negative test cases:\n"); }
        for (const auto & tc : negative_test_cases) {
            datum d{tc};
            cbor::argument u{d};
            bool passed = d.is_null();
            no_tests_failed &= passed;
            if (f) {
                fprintf(f, "encoded: ");
                datum{tc}.fprint_hex(f);
                fprintf(f, "\t%s\n", passed ? "passed (input rejected)" : "failed (input accepted)");
            }
        }
        if (f) { fprintf(f, "cbor::argument::unit_test: %s\n", no_tests_failed ? "passed" : "failed"); }

        return no_tests_failed;
    }

} // namespace cbd::cbor

#endif // CBOR_HPP
