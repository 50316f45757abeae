/*
 * cbor_decoder_test.cc
 *
 * test vectors are from RFC 8949 Appendix A, where possible
 */

#include <catch2/catch.hpp>
#include <cmath>
#include <optional>
#include "cbor.hpp"

using namespace cbd;
using code = cbor_decode_error::code;

static value decode(const std::vector<uint8_t> &bytes, size_t max_depth=cbor::default_max_depth) {
    return cbor::decode(bytes, max_depth);
}

// returns the code of the error thrown while decoding bytes, if any
//
static std::optional<code> decode_error(const std::vector<uint8_t> &bytes, size_t max_depth=cbor::default_max_depth) {
    try {
        cbor::decode(bytes, max_depth);
    }
    catch (const cbor_decode_error &e) {
        return e.get_code();
    }
    return std::nullopt;
}

static std::vector<uint8_t> nested_arrays(size_t depth) {
    std::vector<uint8_t> bytes(depth, 0x81);
    bytes.push_back(0x01);
    return bytes;
}

TEST_CASE("decode integers") {
    CHECK(decode({ 0x00 }) == value{0});
    CHECK(decode({ 0x17 }) == value{23});
    CHECK(decode({ 0x18, 0x18 }) == value{24});
    CHECK(decode({ 0x19, 0x01, 0x00 }) == value{256});
    CHECK(decode({ 0x1a, 0x00, 0x0f, 0x42, 0x40 }) == value{1000000});
    CHECK(decode({ 0x1b, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff }) == value{integer{UINT64_MAX}});
    CHECK(decode({ 0x20 }) == value{-1});
    CHECK(decode({ 0x38, 0x63 }) == value{-100});
    CHECK(decode({ 0x39, 0x03, 0xe7 }) == value{-1000});

    value most_negative = decode({ 0x3b, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff });
    REQUIRE(most_negative.is_integer());
    CHECK(most_negative.as_integer().to_string() == "-18446744073709551616");
}

TEST_CASE("decode strings") {
    CHECK(decode({ 0x40 }) == value{byte_string{}});
    CHECK(decode({ 0x44, 0x01, 0x02, 0x03, 0x04 }) == value{byte_string{ 0x01, 0x02, 0x03, 0x04 }});
    CHECK(decode({ 0x60 }) == value{""});
    CHECK(decode({ 0x64, 0x49, 0x45, 0x54, 0x46 }) == value{"IETF"});
    CHECK(decode({ 0x62, 0xc3, 0xbc }) == value{"\xc3\xbc"});
    CHECK(decode({ 0x64, 0xf0, 0x90, 0x85, 0x91 }) == value{"\xf0\x90\x85\x91"});

    SECTION("indefinite-length strings are concatenated") {
        CHECK(decode({ 0x5f, 0x42, 0x01, 0x02, 0x43, 0x03, 0x04, 0x05, 0xff })
              == value{byte_string{ 0x01, 0x02, 0x03, 0x04, 0x05 }});
        CHECK(decode({ 0x7f, 0x65, 's', 't', 'r', 'e', 'a', 0x64, 'm', 'i', 'n', 'g', 0xff })
              == value{"streaming"});
        CHECK(decode({ 0x7f, 0xff }) == value{""});
    }
}

TEST_CASE("decode arrays and maps") {
    CHECK(decode({ 0x80 }) == value{array{}});
    CHECK(decode({ 0x83, 0x01, 0x02, 0x03 }) == value{array{ value{1}, value{2}, value{3} }});
    CHECK(decode({ 0x82, 0x61, 0x61, 0xa1, 0x61, 0x62, 0x61, 0x63 })
          == value{array{ value{"a"}, value{map{ {value{"b"}, value{"c"}} }} }});
    CHECK(decode({ 0xa0 }) == value{map{}});

    SECTION("map entries keep their encoded order") {
        value m = decode({ 0xa3, 0x61, 'z', 0x01, 0x61, 'a', 0x02, 0x61, 'm', 0x03 });
        REQUIRE(m.is_map());
        REQUIRE(m.as_map().size() == 3);
        CHECK(m.as_map()[0].key == value{"z"});
        CHECK(m.as_map()[1].key == value{"a"});
        CHECK(m.as_map()[2].key == value{"m"});
    }

    SECTION("map keys of any type") {
        value m = decode({ 0xa2, 0x01, 0x02, 0x03, 0x04 });
        CHECK(m == value{map{ {value{1}, value{2}}, {value{3}, value{4}} }});
    }

    SECTION("indefinite-length containers") {
        CHECK(decode({ 0x9f, 0xff }) == value{array{}});
        CHECK(decode({ 0x9f, 0x01, 0x82, 0x02, 0x03, 0x9f, 0x04, 0x05, 0xff, 0xff })
              == value{array{ value{1}, value{array{ value{2}, value{3} }}, value{array{ value{4}, value{5} }} }});
        CHECK(decode({ 0xbf, 0x61, 0x61, 0x01, 0x61, 0x62, 0x9f, 0x02, 0x03, 0xff, 0xff })
              == value{map{ {value{"a"}, value{1}}, {value{"b"}, value{array{ value{2}, value{3} }}} }});
    }
}

TEST_CASE("decode tags") {
    value t = decode({ 0xc1, 0x1a, 0x51, 0x4b, 0x67, 0xb0 });
    REQUIRE(t.is_tag());
    CHECK(t.as_tag().number() == 1);
    CHECK(t.as_tag().item() == value{1363896240});

    value nested = decode({ 0xd8, 0x20, 0xc2, 0x41, 0x01 });
    REQUIRE(nested.is_tag());
    CHECK(nested.as_tag().number() == 32);
    CHECK(nested.as_tag().item() == value{tagged_value{2, value{byte_string{ 0x01 }}}});
}

TEST_CASE("decode simple values and floats") {
    CHECK(decode({ 0xf4 }) == value{false});
    CHECK(decode({ 0xf5 }) == value{true});
    CHECK(decode({ 0xf6 }) == value{});
    CHECK(decode({ 0xf7 }) == value{simple_value{23}});
    CHECK(decode({ 0xf0 }) == value{simple_value{16}});
    CHECK(decode({ 0xf8, 0xff }) == value{simple_value{255}});

    SECTION("half precision") {
        CHECK(decode({ 0xf9, 0x00, 0x00 }) == value{0.0});
        CHECK(decode({ 0xf9, 0x80, 0x00 }) == value{-0.0});
        CHECK(decode({ 0xf9, 0x3c, 0x00 }) == value{1.0});
        CHECK(decode({ 0xf9, 0x3e, 0x00 }) == value{1.5});
        CHECK(decode({ 0xf9, 0x7b, 0xff }) == value{65504.0});
        CHECK(decode({ 0xf9, 0x00, 0x01 }) == value{5.960464477539063e-8});
        CHECK(decode({ 0xf9, 0x04, 0x00 }) == value{0.00006103515625});
        CHECK(decode({ 0xf9, 0xc4, 0x00 }) == value{-4.0});
        CHECK(decode({ 0xf9, 0x7c, 0x00 }) == value{INFINITY});
        CHECK(decode({ 0xf9, 0xfc, 0x00 }) == value{-INFINITY});
        value nan = decode({ 0xf9, 0x7e, 0x00 });
        REQUIRE(nan.is_float());
        CHECK(std::isnan(nan.as_float()));
    }

    SECTION("single and double precision") {
        CHECK(decode({ 0xfa, 0x47, 0xc3, 0x50, 0x00 }) == value{100000.0});
        CHECK(decode({ 0xfa, 0x7f, 0x7f, 0xff, 0xff }) == value{3.4028234663852886e+38});
        CHECK(decode({ 0xfb, 0x3f, 0xf1, 0x99, 0x99, 0x99, 0x99, 0x99, 0x9a }) == value{1.1});
        CHECK(decode({ 0xfb, 0x7e, 0x37, 0xe4, 0x3c, 0x88, 0x00, 0x75, 0x9c }) == value{1.0e+300});
    }
}

TEST_CASE("truncated input is unexpected_eof") {
    CHECK(decode_error({}) == code::unexpected_eof);
    CHECK(decode_error({ 0x18 }) == code::unexpected_eof);
    CHECK(decode_error({ 0x1a, 0x00, 0x01 }) == code::unexpected_eof);
    CHECK(decode_error({ 0x62, 0x61 }) == code::unexpected_eof);
    CHECK(decode_error({ 0x82, 0x01 }) == code::unexpected_eof);
    CHECK(decode_error({ 0xf9, 0x3c }) == code::unexpected_eof);
    CHECK(decode_error({ 0x5f }) == code::unexpected_eof);
    CHECK(decode_error({ 0x5f, 0x41 }) == code::unexpected_eof);
    CHECK(decode_error({ 0x9f, 0x01 }) == code::unexpected_eof);
    CHECK(decode_error({ 0xc1 }) == code::unexpected_eof);

    SECTION("a map header declaring one entry with nothing after it") {
        try {
            cbor::decode(std::vector<uint8_t>{ 0xa1 });
            FAIL("no exception thrown");
        }
        catch (const cbor_decode_error &e) {
            CHECK(e.get_code() == code::unexpected_eof);
            CHECK(e.position() == 1);
            CHECK(std::string{e.what()} == "cbor decode error: unexpected end of input at offset 1");
        }
    }

    SECTION("a huge declared length does not exhaust memory") {
        CHECK(decode_error({ 0x9b, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff }) == code::unexpected_eof);
        CHECK(decode_error({ 0xbb, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff }) == code::unexpected_eof);
        CHECK(decode_error({ 0x5b, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff }) == code::unexpected_eof);
    }
}

TEST_CASE("reserved and misplaced additional info") {
    CHECK(decode_error({ 0x1c }) == code::invalid_additional_info);
    CHECK(decode_error({ 0x3d }) == code::invalid_additional_info);
    CHECK(decode_error({ 0x5e }) == code::invalid_additional_info);
    CHECK(decode_error({ 0xfc }) == code::invalid_additional_info);
    CHECK(decode_error({ 0x1f }) == code::invalid_additional_info);
    CHECK(decode_error({ 0x3f }) == code::invalid_additional_info);
    CHECK(decode_error({ 0xdf, 0x01 }) == code::invalid_additional_info);
}

TEST_CASE("break outside of an indefinite-length item") {
    CHECK(decode_error({ 0xff }) == code::unexpected_break);
    CHECK(decode_error({ 0x81, 0xff }) == code::unexpected_break);
    CHECK(decode_error({ 0xa1, 0x01, 0xff }) == code::unexpected_break);
    CHECK(decode_error({ 0xc1, 0xff }) == code::unexpected_break);
    CHECK(decode_error({ 0xbf, 0x01, 0xff }) == code::unexpected_break);
}

TEST_CASE("malformed indefinite-length strings") {
    CHECK(decode_error({ 0x5f, 0x61, 0x61, 0xff }) == code::malformed_indefinite_string);
    CHECK(decode_error({ 0x7f, 0x41, 0x61, 0xff }) == code::malformed_indefinite_string);
    CHECK(decode_error({ 0x7f, 0x01, 0xff }) == code::malformed_indefinite_string);
    CHECK(decode_error({ 0x5f, 0x5f, 0xff, 0xff }) == code::malformed_indefinite_string);
}

TEST_CASE("text strings must be valid UTF-8") {
    CHECK(decode_error({ 0x62, 0xc3, 0x28 }) == code::invalid_text_string);
    CHECK(decode_error({ 0x63, 0xed, 0xa0, 0x80 }) == code::invalid_text_string);
    CHECK(decode_error({ 0x62, 0xc0, 0xaf }) == code::invalid_text_string);

    // each chunk of an indefinite-length string must be valid by itself
    CHECK(decode_error({ 0x7f, 0x61, 0xc3, 0x61, 0xbc, 0xff }) == code::invalid_text_string);

    // byte strings are not checked
    CHECK(decode({ 0x42, 0xc3, 0x28 }) == value{byte_string{ 0xc3, 0x28 }});
}

TEST_CASE("two-byte simple values below 32 are not well-formed") {
    CHECK(decode_error({ 0xf8, 0x00 }) == code::invalid_simple_value);
    CHECK(decode_error({ 0xf8, 0x14 }) == code::invalid_simple_value);
    CHECK(decode_error({ 0xf8, 0x1f }) == code::invalid_simple_value);
    CHECK(decode({ 0xf8, 0x20 }) == value{simple_value{32}});
}

TEST_CASE("nesting depth is bounded") {
    CHECK(decode(nested_arrays(3), 3).is_array());
    CHECK(decode_error(nested_arrays(4), 3) == code::depth_exceeded);
    CHECK(decode_error({ 0xa1, 0x01, 0x81, 0x01 }, 1) == code::depth_exceeded);
    CHECK(decode_error({ 0xc1, 0xc1, 0x01 }, 1) == code::depth_exceeded);
    CHECK(decode({ 0x01 }, 0) == value{1});
    CHECK(decode_error({ 0x80 }, 0) == code::depth_exceeded);

    SECTION("the default bound") {
        CHECK(decode(nested_arrays(cbor::default_max_depth)).is_array());
        CHECK(decode_error(nested_arrays(cbor::default_max_depth + 1)) == code::depth_exceeded);
        CHECK(decode_error(nested_arrays(100000)) == code::depth_exceeded);
    }
}

TEST_CASE("exactly one data item") {
    CHECK(decode_error({ 0x01, 0x02 }) == code::trailing_data);
    CHECK(decode_error({ 0x80, 0x00 }) == code::trailing_data);
    CHECK(decode_error({ 0x9f, 0xff, 0xff }) == code::trailing_data);

    try {
        cbor::decode(std::vector<uint8_t>{ 0xf6, 0xf6, 0xf6 });
        FAIL("no exception thrown");
    }
    catch (const cbor_decode_error &e) {
        CHECK(e.get_code() == code::trailing_data);
        CHECK(e.position() == 1);
    }
}
