// json_printer.cc

#include "json_printer.hpp"
#include "json_object.h"
#include "base64.h"

#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <cmath>

namespace cbd::json {

    const char *bytes_policy_name(bytes_policy p) {
        switch (p) {
        case bytes_policy::base64: return "base64";
        case bytes_policy::hex:    return "hex";
        case bytes_policy::reject: return "reject";
        }
        return "unknown";
    }

    std::string key_string(const value &k) {
        const value *key = &k;
        while (key->is_tag()) {
            key = &key->as_tag().item();
        }
        if (key->is_text()) {
            return key->as_text();
        }
        if (key->is_integer()) {
            return key->as_integer().to_string();
        }
        throw json_print_error{json_print_error::code::non_string_map_key, describe(*key)};
    }

    namespace {

        void write_float(buffer_stream &b, double d) {
            if (!std::isfinite(d)) {
                b.puts("null");
                return;
            }
            rapidjson::StringBuffer sb;
            rapidjson::Writer<rapidjson::StringBuffer> writer{sb};
            writer.Double(d);
            b.write(sb.GetString(), sb.GetSize());
        }

        void write_bytes(buffer_stream &b, const byte_string &bytes, bytes_policy policy) {
            switch (policy) {
            case bytes_policy::base64:
                b.write_char('\"');
                b.write(base64::encode(bytes));
                b.write_char('\"');
                return;
            case bytes_policy::hex:
                b.write_char('\"');
                b.raw_as_hex(bytes.data(), bytes.size());
                b.write_char('\"');
                return;
            case bytes_policy::reject:
                break;
            }
            throw json_print_error{json_print_error::code::unsupported_value,
                                   "byte string of length " + std::to_string(bytes.size())};
        }

        void write_value(buffer_stream &b, const value &v, bytes_policy policy) {
            switch (v.type()) {
            case value_type::null:
                b.puts("null");
                return;
            case value_type::boolean:
                b.puts(v.as_bool() ? "true" : "false");
                return;
            case value_type::integer:
                b.write(v.as_integer().to_string());
                return;
            case value_type::floating_point:
                write_float(b, v.as_float());
                return;
            case value_type::byte_string:
                write_bytes(b, v.as_bytes(), policy);
                return;
            case value_type::text_string:
                b.write_char('\"');
                utf8_string::write(b, reinterpret_cast<const uint8_t *>(v.as_text().data()), v.as_text().length());
                b.write_char('\"');
                return;
            case value_type::array:
                {
                    json_array a{&b};
                    for (const value &item : v.as_array()) {
                        a.next();
                        write_value(b, item, policy);
                    }
                    a.close();
                }
                return;
            case value_type::map:
                {
                    json_object o{&b};
                    for (const map_entry &entry : v.as_map()) {
                        o.print_key(key_string(entry.key));
                        write_value(b, entry.val, policy);
                    }
                    o.close();
                }
                return;
            case value_type::tag:
                write_value(b, v.as_tag().item(), policy);
                return;
            case value_type::simple:
                if (v.as_simple().code == simple_value::undefined) {
                    b.puts("null");
                    return;
                }
                break;
            }
            throw json_print_error{json_print_error::code::unsupported_value, describe(v)};
        }

    } // namespace

    std::string print(const value &v, bytes_policy policy) {
        buffer_stream b;
        write_value(b, v, policy);
        return b.release();
    }

} // namespace cbd::json
