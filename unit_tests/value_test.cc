/*
 * value_test.cc
 */

#include <catch2/catch.hpp>
#include <cmath>
#include "value.hpp"

using namespace cbd;

TEST_CASE("integer covers the full CBOR range") {
    CHECK(integer{0}.to_string() == "0");
    CHECK(integer{UINT64_MAX}.to_string() == "18446744073709551615");
    CHECK(integer{0, true}.to_string() == "-1");
    CHECK(integer{99, true}.to_string() == "-100");
    CHECK(integer{UINT64_MAX, true}.to_string() == "-18446744073709551616");

    SECTION("conversion from int64_t") {
        CHECK(integer::from_int64(-1) == integer{0, true});
        CHECK(integer::from_int64(INT64_MIN).to_string() == "-9223372036854775808");
        CHECK(integer::from_int64(INT64_MAX).to_string() == "9223372036854775807");
        CHECK(integer::from_int64(INT64_MIN).to_int64() == INT64_MIN);
        CHECK(integer::from_int64(-42).fits_int64());
        CHECK_FALSE(integer(UINT64_MAX, true).fits_int64());
    }
}

TEST_CASE("value reports its type") {
    CHECK(value{}.is_null());
    CHECK(value{true}.type() == value_type::boolean);
    CHECK(value{7}.type() == value_type::integer);
    CHECK(value{int64_t{-7}}.as_integer() == integer{6, true});
    CHECK(value{1.5}.type() == value_type::floating_point);
    CHECK(value{byte_string{0x01}}.type() == value_type::byte_string);
    CHECK(value{"text"}.type() == value_type::text_string);
    CHECK(value{array{}}.type() == value_type::array);
    CHECK(value{map{}}.type() == value_type::map);
    CHECK(value{tagged_value{1, value{0}}}.type() == value_type::tag);
    CHECK(value{simple_value{16}}.type() == value_type::simple);
    CHECK_THROWS_AS(value{"text"}.as_integer(), std::bad_variant_access);
}

TEST_CASE("every integral type constructs an integer") {
    CHECK(value{1u}.as_integer() == integer{1});
    CHECK(value{-3L}.as_integer() == integer{2, true});
    CHECK(value{-3LL}.as_integer() == integer{2, true});
    CHECK(value{18446744073709551615ULL}.as_integer() == integer{UINT64_MAX});
    CHECK(value{static_cast<uint8_t>(255)}.as_integer() == integer{255});
    CHECK(value{static_cast<short>(-1)}.as_integer() == integer{0, true});
    CHECK(value{INT64_MIN}.as_integer() == integer{static_cast<uint64_t>(INT64_MAX), true});
    CHECK(value{size_t{10}} == value{10});
    CHECK(value{false}.is_bool());
}

TEST_CASE("value equality") {
    CHECK(value{1} == value{uint64_t{1}});
    CHECK(value{1} != value{1.0});
    CHECK(value{"a"} != value{byte_string{'a'}});

    SECTION("floating point values compare by bit pattern") {
        CHECK(value{NAN} == value{NAN});
        CHECK(value{0.0} != value{-0.0});
    }

    SECTION("map order is significant") {
        value ab{map{ {value{"a"}, value{1}}, {value{"b"}, value{2}} }};
        value ba{map{ {value{"b"}, value{2}}, {value{"a"}, value{1}} }};
        CHECK(ab != ba);
    }
}

TEST_CASE("tagged values are deep copied") {
    value original{tagged_value{32, value{array{value{1}, value{"x"}}}}};
    value copy = original;
    CHECK(copy == original);
    CHECK(&copy.as_tag().item() != &original.as_tag().item());
    CHECK(copy.as_tag().number() == 32);

    value moved = std::move(copy);
    CHECK(moved == original);
}

TEST_CASE("describe") {
    CHECK(describe(value{}) == "null");
    CHECK(describe(value{-3}) == "integer(-3)");
    CHECK(describe(value{map{ {value{"a"}, value{1}} }}) == "map(1)");
    CHECK(describe(value{tagged_value{1, value{0}}}) == "tag(1)");
    CHECK(describe(value{simple_value{23}}) == "simple value(23)");
}
