///
/// \file datum.h
///
/// read-only byte cursors and growable output buffers used by the
/// CBOR codec
///

#ifndef DATUM_H
#define DATUM_H

#include <stddef.h>
#include <stdint.h>
#include <string.h>
#include <stdio.h>
#include <string>
#include <vector>
#include <type_traits>

/// `cbd_debug` is a compile-time option that turns on debugging output
///
/// the macro `cbd_debug` accepts `printf()` style arguments, and
/// prints out debugging information only if DEBUG is `#defined` at
/// compile time, and otherwise prints out nothing
///
#ifndef DEBUG
#define cbd_debug(...)
#else
#define cbd_debug(...)  (fprintf(stderr, __VA_ARGS__))
#endif

/// returns the unsigned integer given by the bits in between `i` and
/// `j-1`, inclusive, where zero denotes the leftmost (most
/// significant) bit, so that for example `slice<0,3>(0xa5)` is `5`
///
template <size_t i, size_t j, typename T>
static inline constexpr T slice(T x) {
    static_assert(i < j && j <= sizeof(T) * 8, "invalid slice");
    constexpr size_t bits = sizeof(T) * 8;
    constexpr size_t width = j - i;
    if constexpr (width == bits) {
        return x;
    } else {
        return (x >> (bits - j)) & ((T{1} << width) - 1);
    }
}

/// A datum is a read-only sequence of bytes in memory, which is
/// consumed from the front as it is parsed.  It is in one of three
/// states:
///
///   |    State        | data          |   data_end   |
///   |-----------------|---------------|--------------|
///   |    null         | `nullptr`     |   `nullptr`  |
///   |    readable     | `!= nullptr`  |   `> data`   |
///   |    empty        | `!= nullptr`  |   `== data`  |
///
/// If an accept operation on a datum fails, then the datum will be
/// set to the null state.  In contrast, a lookahead operation
/// attempts to parse a type `T` from a datum, but if that attempt
/// fails, it leaves the datum unchanged.
///
struct datum {
    const uint8_t *data;          ///< the start of the data in memory, or `nullptr`
    const uint8_t *data_end;      ///< the end of data in memory, or `nullptr`

    /// construct a null datum
    ///
    datum() : data{nullptr}, data_end{nullptr} {}

    /// construct a datum representing the sequence between `first` and `last`
    ///
    datum(const uint8_t *first, const uint8_t *last) : data{first}, data_end{last} {}

    /// construct a datum representing the contents of the vector \param v
    ///
    explicit datum(const std::vector<uint8_t> &v) : data{v.data()}, data_end{v.data() + v.size()} {}

    /// construct a datum representing the `std::string` \param str
    ///
    explicit datum(const std::string &str) :
        data{reinterpret_cast<const uint8_t *>(str.data())},
        data_end{data + str.length()}
    { }

    /// construct a datum by accepting \p length bytes from datum \p d
    ///
    /// If `length > d.length()`, then \p d and this datum are set
    /// to the null state.
    ///
    datum(datum &d, size_t length) {
        parse(d, length);
    }

    bool is_null() const { return data == nullptr; }
    bool is_not_null() const { return data != nullptr; }
    bool is_readable() const { return data != nullptr && data < data_end; }
    bool is_not_readable() const { return data == nullptr || data == data_end; }
    bool is_empty() const { return data != nullptr && data == data_end; }
    void set_null() { data = data_end = nullptr; }
    size_t length() const { return data_end - data; }

    void parse(datum &r, size_t num_bytes) {
        if (r.is_null() || r.length() < num_bytes) {
            r.set_null();
            set_null();
            return;
        }
        data = r.data;
        data_end = r.data + num_bytes;
        r.data += num_bytes;
    }

    /// returns the byte at the front of this datum without consuming
    /// it; the datum must be readable
    ///
    uint8_t peek() const { return *data; }

    /// returns a `std::string` that contains a copy of the data in this datum
    ///
    std::string get_string() const {
        return std::string{reinterpret_cast<const char *>(data), length()};
    }

    int cmp(const datum &p) const {
        if (length() != p.length()) {
            return length() < p.length() ? -1 : 1;
        }
        if (length() == 0) {
            return 0;
        }
        return ::memcmp(data, p.data, length());
    }

    bool operator==(const datum &p) const { return cmp(p) == 0; }

    bool operator!=(const datum &p) const { return cmp(p) != 0; }

    void fprint_hex(FILE *f) const {
        for (const uint8_t *x = data; x < data_end; x++) {
            fprintf(f, "%02x", *x);
        }
    }

};

/// class `encoded<T>` reads or writes an unsigned integer of type `T`
/// in network (big endian) byte order
///
template <typename T>
class encoded {
    T val;    ///< the value, if decoding was successful

    static_assert(std::is_unsigned_v<T>, "T must be an unsigned integer");

public:

    /// constructs an `encoded<T>` by accepting/reading an unsigned
    /// integer type `T` from the datum `d`, in network byte order
    ///
    /// if `d` holds fewer than `sizeof(T)` bytes, it is set to the
    /// null state and the value is zero
    ///
    explicit encoded(datum &d) : val{0} {
        if (d.data == nullptr || d.data + sizeof(T) > d.data_end) {
            d.set_null();
            return;
        }
        for (size_t i = 0; i < sizeof(T); i++) {
            val = static_cast<T>(val << 8) | d.data[i];
        }
        d.data += sizeof(T);
    }

    encoded(const T& rhs) : val{rhs} { }

    operator T() const { return val; }

    T value() const { return val; }

    template <size_t i, size_t j>
    T slice() const {
        return ::slice<i,j>(val);
    }

    /// write this integer into \param buf in network byte order
    ///
    template <typename W>
    void write(W &buf) const {
        for (size_t i = sizeof(T); i > 0; i--) {
            buf.copy(static_cast<uint8_t>(val >> (8 * (i - 1))));
        }
    }

};

/// class `lookahead<T>` attempts to parse a `T` from a copy of a
/// datum, so that the original datum is left unchanged.  Casting the
/// lookahead object to `bool` returns `true` if the parse succeeded.
///
template <typename T>
class lookahead {
public:
    T value;
private:
    datum tmp;
public:

    lookahead(datum d) : value{d}, tmp{d} { }

    explicit operator bool() const { return tmp.is_not_null(); }

};

/// dynamic_buffer is a growable output buffer; data written to it
/// is appended at the end, and \ref contents() returns the bytes
/// written so far
///
class dynamic_buffer {
    std::vector<uint8_t> buffer;

public:

    /// constructs a `dynamic_buffer` with an initial capacity of
    /// \param initial_size bytes
    ///
    explicit dynamic_buffer(size_t initial_size=256) {
        buffer.reserve(initial_size);
    }

    void copy(uint8_t x) { buffer.push_back(x); }

    void copy(const uint8_t *rdata, size_t num_bytes) {
        buffer.insert(buffer.end(), rdata, rdata + num_bytes);
    }

    dynamic_buffer &operator<<(uint8_t x) {
        copy(x);
        return *this;
    }

    /// returns a \ref datum representing the bytes written so far;
    /// the datum is invalidated by any later write
    ///
    datum contents() const { return datum{buffer}; }

    /// moves the bytes written so far out of this buffer, leaving it
    /// empty
    ///
    std::vector<uint8_t> release() {
        std::vector<uint8_t> tmp;
        tmp.swap(buffer);
        return tmp;
    }

};

#endif // DATUM_H
