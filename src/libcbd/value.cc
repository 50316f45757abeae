// value.cc

#include "value.hpp"
#include <cstring>

namespace cbd {

    std::string integer::to_string() const {
        if (!neg) {
            return std::to_string(arg);
        }
        if (arg == UINT64_MAX) {
            return "-18446744073709551616";   // -1 - (2^64 - 1)
        }
        return "-" + std::to_string(arg + 1);
    }

    tagged_value::tagged_value(uint64_t number, value &&item) :
        tag{number},
        inner{std::make_unique<value>(std::move(item))}
    { }

    tagged_value::tagged_value(const tagged_value &other) :
        tag{other.tag},
        inner{std::make_unique<value>(*other.inner)}
    { }

    tagged_value &tagged_value::operator=(const tagged_value &other) {
        if (this != &other) {
            tag = other.tag;
            inner = std::make_unique<value>(*other.inner);
        }
        return *this;
    }

    tagged_value::~tagged_value() = default;

    const char *type_name(value_type t) {
        switch(t) {
        case value_type::null:           return "null";
        case value_type::boolean:        return "bool";
        case value_type::integer:        return "integer";
        case value_type::floating_point: return "float";
        case value_type::byte_string:    return "byte string";
        case value_type::text_string:    return "text string";
        case value_type::array:          return "array";
        case value_type::map:            return "map";
        case value_type::tag:            return "tag";
        case value_type::simple:         return "simple value";
        }
        return "unknown";
    }

    bool operator==(const value &lhs, const value &rhs) {
        if (lhs.type() != rhs.type()) {
            return false;
        }
        switch(lhs.type()) {
        case value_type::null:
            return true;
        case value_type::boolean:
            return lhs.as_bool() == rhs.as_bool();
        case value_type::integer:
            return lhs.as_integer() == rhs.as_integer();
        case value_type::floating_point:
            {
                double l = lhs.as_float();
                double r = rhs.as_float();
                return memcmp(&l, &r, sizeof(double)) == 0;
            }
        case value_type::byte_string:
            return lhs.as_bytes() == rhs.as_bytes();
        case value_type::text_string:
            return lhs.as_text() == rhs.as_text();
        case value_type::array:
            return lhs.as_array() == rhs.as_array();
        case value_type::map:
            return lhs.as_map() == rhs.as_map();
        case value_type::tag:
            return lhs.as_tag().number() == rhs.as_tag().number()
                and lhs.as_tag().item() == rhs.as_tag().item();
        case value_type::simple:
            return lhs.as_simple() == rhs.as_simple();
        }
        return false;
    }

    std::string describe(const value &v) {
        std::string s{type_name(v.type())};
        switch(v.type()) {
        case value_type::integer:
            s.append("(").append(v.as_integer().to_string()).append(")");
            break;
        case value_type::byte_string:
            s.append("(").append(std::to_string(v.as_bytes().size())).append(")");
            break;
        case value_type::text_string:
            s.append("(").append(std::to_string(v.as_text().size())).append(")");
            break;
        case value_type::array:
            s.append("(").append(std::to_string(v.as_array().size())).append(")");
            break;
        case value_type::map:
            s.append("(").append(std::to_string(v.as_map().size())).append(")");
            break;
        case value_type::tag:
            s.append("(").append(std::to_string(v.as_tag().number())).append(")");
            break;
        case value_type::simple:
            s.append("(").append(std::to_string(v.as_simple().code)).append(")");
            break;
        default:
            ;
        }
        return s;
    }

} // namespace cbd
