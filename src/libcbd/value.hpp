// value.hpp
//
// the in-memory value model shared by the CBOR and JSON codecs

#ifndef VALUE_HPP
#define VALUE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace cbd {

    class value;
    struct map_entry;

    struct null_value { };

    /// an integer in the CBOR range -2^64 .. 2^64-1, stored as the
    /// CBOR sign (major type 0 or 1) and argument; the value of a
    /// negative integer is -1 minus its argument
    ///
    class integer {
        uint64_t arg;
        bool neg;

    public:

        constexpr integer(uint64_t argument=0, bool negative=false) : arg{argument}, neg{negative} { }

        static constexpr integer from_int64(int64_t x) {
            if (x < 0) {
                return integer{static_cast<uint64_t>(-(x + 1)), true};
            }
            return integer{static_cast<uint64_t>(x), false};
        }

        bool is_negative() const { return neg; }

        uint64_t argument() const { return arg; }

        bool fits_int64() const { return arg <= INT64_MAX; }

        /// returns the value as an `int64_t`; only meaningful if
        /// \ref fits_int64() is true
        ///
        int64_t to_int64() const {
            return neg ? -1 - static_cast<int64_t>(arg) : static_cast<int64_t>(arg);
        }

        /// returns the decimal representation of this integer
        ///
        std::string to_string() const;

        bool operator==(const integer &rhs) const { return arg == rhs.arg && neg == rhs.neg; }

        bool operator!=(const integer &rhs) const { return !(*this == rhs); }
    };

    /// a CBOR simple value (major type 7) with no other mapping in the
    /// value model, such as `undefined` (23) or an unassigned code
    ///
    struct simple_value {
        uint8_t code;

        static constexpr uint8_t undefined = 23;

        bool operator==(const simple_value &rhs) const { return code == rhs.code; }
    };

    /// a CBOR tag number and the single data item that it wraps; the
    /// tag carries no other meaning
    ///
    class tagged_value {
        uint64_t tag;
        std::unique_ptr<value> inner;

    public:

        tagged_value(uint64_t number, value &&item);

        tagged_value(const tagged_value &other);

        tagged_value(tagged_value &&other) noexcept = default;

        tagged_value &operator=(const tagged_value &other);

        tagged_value &operator=(tagged_value &&other) noexcept = default;

        ~tagged_value();

        uint64_t number() const { return tag; }

        const value &item() const { return *inner; }
    };

    using byte_string = std::vector<uint8_t>;
    using text_string = std::string;
    using array = std::vector<value>;
    using map = std::vector<map_entry>;

    /// the kind of a \ref value; the enumerators are in the same
    /// order as the alternatives of value::variant_type
    ///
    enum class value_type : uint8_t {
        null,
        boolean,
        integer,
        floating_point,
        byte_string,
        text_string,
        array,
        map,
        tag,
        simple,
    };

    const char *type_name(value_type t);

    /// a value is one of the alternatives listed in \ref value_type;
    /// it cannot be changed after it has been constructed
    ///
    class value {
    public:
        using variant_type = std::variant<null_value,
                                          bool,
                                          integer,
                                          double,
                                          byte_string,
                                          text_string,
                                          array,
                                          map,
                                          tagged_value,
                                          simple_value>;

        value() : v{null_value{}} { }
        value(null_value) : v{null_value{}} { }
        value(bool b) : v{b} { }
        value(integer i) : v{i} { }

        // any integral type other than bool becomes an integer
        template <typename T,
                  typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value, bool>::type = true>
        value(T i) : v{std::is_signed<T>::value ? integer::from_int64(static_cast<int64_t>(i)) : integer{static_cast<uint64_t>(i)}} { }

        value(double d) : v{d} { }
        value(byte_string bytes) : v{std::move(bytes)} { }
        value(text_string text) : v{std::move(text)} { }
        value(const char *text) : v{text_string{text}} { }
        value(array items) : v{std::move(items)} { }
        value(map entries) : v{std::move(entries)} { }
        value(tagged_value t) : v{std::move(t)} { }
        value(simple_value s) : v{s} { }

        value_type type() const { return static_cast<value_type>(v.index()); }

        bool is_null() const    { return type() == value_type::null; }
        bool is_bool() const    { return type() == value_type::boolean; }
        bool is_integer() const { return type() == value_type::integer; }
        bool is_float() const   { return type() == value_type::floating_point; }
        bool is_bytes() const   { return type() == value_type::byte_string; }
        bool is_text() const    { return type() == value_type::text_string; }
        bool is_array() const   { return type() == value_type::array; }
        bool is_map() const     { return type() == value_type::map; }
        bool is_tag() const     { return type() == value_type::tag; }
        bool is_simple() const  { return type() == value_type::simple; }

        // the accessors below throw std::bad_variant_access if the
        // value is of another type

        bool as_bool() const                 { return std::get<bool>(v); }
        const integer &as_integer() const    { return std::get<integer>(v); }
        double as_float() const              { return std::get<double>(v); }
        const byte_string &as_bytes() const  { return std::get<byte_string>(v); }
        const text_string &as_text() const   { return std::get<text_string>(v); }
        const array &as_array() const        { return std::get<array>(v); }
        const map &as_map() const            { return std::get<map>(v); }
        const tagged_value &as_tag() const   { return std::get<tagged_value>(v); }
        simple_value as_simple() const       { return std::get<simple_value>(v); }

    private:
        variant_type v;
    };

    struct map_entry {
        value key;
        value val;
    };

    /// structural equality; floating point values are equal if their
    /// bit patterns are equal, so that NaN equals itself and 0.0 does
    /// not equal -0.0
    ///
    bool operator==(const value &lhs, const value &rhs);

    inline bool operator!=(const value &lhs, const value &rhs) { return !(lhs == rhs); }

    inline bool operator==(const map_entry &lhs, const map_entry &rhs) {
        return lhs.key == rhs.key && lhs.val == rhs.val;
    }

    /// returns a short human-readable rendering of \param v, such as
    /// `map(2)` or `tag(1)`, for use in log and error messages
    ///
    std::string describe(const value &v);

} // namespace cbd

#endif // VALUE_HPP
