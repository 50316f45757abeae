// json_reader.cc
//
// JSON parsing with the rapidjson SAX reader; the reader's events are
// assembled into a cbd::value on an explicit stack of open
// containers, so that deeply nested input does not recurse

#include "json_reader.hpp"
#include "utf8.hpp"
#include "err.h"

#include "rapidjson/reader.h"
#include "rapidjson/error/en.h"

#include <cstdlib>
#include <cerrno>
#include <cmath>

namespace cbd::json {

    namespace {

        constexpr unsigned int parse_flags = rapidjson::kParseIterativeFlag
            | rapidjson::kParseNumbersAsStringsFlag
            | rapidjson::kParseValidateEncodingFlag
            | rapidjson::kParseStopWhenDoneFlag;

        // converts the text of a JSON number literal, which the reader
        // has already checked against the JSON number grammar
        //
        value number_from_literal(const char *str, size_t len) {
            std::string literal{str, len};
            bool is_float = literal.find_first_of(".eE") != std::string::npos;

            if (!is_float) {
                bool negative = literal[0] == '-';
                uint64_t magnitude = 0;
                bool overflow = false;
                for (size_t i = negative ? 1 : 0; i < literal.length(); i++) {
                    uint64_t digit = literal[i] - '0';
                    if (magnitude > (UINT64_MAX - digit) / 10) {
                        overflow = true;
                        break;
                    }
                    magnitude = magnitude * 10 + digit;
                }
                if (!overflow) {
                    if (!negative || magnitude == 0) {
                        return value{integer{magnitude, false}};
                    }
                    return value{integer{magnitude - 1, true}};
                }
                if (negative && literal == "-18446744073709551616") {
                    return value{integer{UINT64_MAX, true}};
                }
                printf_err(log_debug, "integer literal %s is out of range, parsed as float\n", literal.c_str());
            }
            return value{std::strtod(literal.c_str(), nullptr)};
        }

        // class value_builder is a rapidjson SAX handler that builds a
        // value from the reader's events
        //
        class value_builder : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, value_builder> {

            struct frame {
                bool is_object;
                std::vector<value> items;   // alternating keys and values, for an object
            };

            const rapidjson::StringStream &stream;
            size_t max_depth;
            std::vector<frame> stack;
            value root;

        public:

            // set when the handler stops the parse, along with the
            // offset at which it did so
            //
            bool stopped = false;
            json_parse_error::code stop_code = json_parse_error::code::syntax_error;
            size_t stop_offset = 0;
            std::string stop_detail;

            value_builder(const rapidjson::StringStream &s, size_t depth_limit) :
                stream{s},
                max_depth{depth_limit}
            { }

            value &get_root() { return root; }

            bool Null() { return add(value{null_value{}}); }

            bool Bool(bool b) { return add(value{b}); }

            bool RawNumber(const char *str, rapidjson::SizeType len, bool) {
                return add(number_from_literal(str, len));
            }

            bool String(const char *str, rapidjson::SizeType len, bool) {
                if (!check_string(str, len)) {
                    return false;
                }
                return add(value{text_string{str, len}});
            }

            bool Key(const char *str, rapidjson::SizeType len, bool copy) {
                return String(str, len, copy);
            }

            bool StartObject() { return open(true); }

            bool EndObject(rapidjson::SizeType) {
                std::vector<value> items = std::move(stack.back().items);
                stack.pop_back();
                map entries;
                entries.reserve(items.size() / 2);
                for (size_t i = 0; i + 1 < items.size(); i += 2) {
                    entries.push_back({std::move(items[i]), std::move(items[i+1])});
                }
                return add(value{std::move(entries)});
            }

            bool StartArray() { return open(false); }

            bool EndArray(rapidjson::SizeType) {
                array items = std::move(stack.back().items);
                stack.pop_back();
                return add(value{std::move(items)});
            }

        private:

            bool add(value &&v) {
                if (stack.empty()) {
                    root = std::move(v);
                } else {
                    stack.back().items.push_back(std::move(v));
                }
                return true;
            }

            bool open(bool is_object) {
                if (stack.size() >= max_depth) {
                    return stop(json_parse_error::code::depth_exceeded,
                                "more than " + std::to_string(max_depth) + " nested arrays or objects");
                }
                stack.push_back({is_object, {}});
                return true;
            }

            // the reader transcodes \u escapes without rejecting a lone
            // low surrogate, so each string is checked for code points
            // that are not Unicode scalar values
            //
            bool check_string(const char *str, size_t len) {
                datum d{reinterpret_cast<const uint8_t *>(str), reinterpret_cast<const uint8_t *>(str) + len};
                if (utf8_string::valid_prefix_length(d) != len) {
                    return stop(json_parse_error::code::invalid_escape, "unpaired surrogate");
                }
                return true;
            }

            bool stop(json_parse_error::code c, const std::string &detail) {
                stopped = true;
                stop_code = c;
                stop_offset = stream.Tell();
                stop_detail = detail;
                return false;
            }
        };

        json_parse_error::code code_from_rapidjson(rapidjson::ParseErrorCode e) {
            switch (e) {
            case rapidjson::kParseErrorStringEscapeInvalid:
            case rapidjson::kParseErrorStringUnicodeEscapeInvalidHex:
            case rapidjson::kParseErrorStringUnicodeSurrogateInvalid:
                return json_parse_error::code::invalid_escape;
            default:
                return json_parse_error::code::syntax_error;
            }
        }

        [[noreturn]] void throw_parse_error(const std::string &text, json_parse_error::code c,
                                            size_t offset, const std::string &detail) {
            auto [ line, column ] = line_and_column(text, offset);
            throw json_parse_error{c, offset, line, column, detail};
        }

        bool is_json_whitespace(char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r';
        }

    } // namespace

    std::pair<size_t, size_t> line_and_column(const std::string &text, size_t offset) {
        size_t line = 1;
        size_t line_start = 0;
        for (size_t i = 0; i < offset && i < text.length(); i++) {
            if (text[i] == '\n') {
                line++;
                line_start = i + 1;
            }
        }
        return { line, offset - line_start + 1 };
    }

    value parse(const std::string &text, size_t max_depth) {
        rapidjson::StringStream stream{text.c_str()};
        value_builder builder{stream, max_depth};
        rapidjson::Reader reader;

        rapidjson::ParseResult result = reader.Parse<parse_flags>(stream, builder);
        if (result.IsError()) {
            if (builder.stopped) {
                throw_parse_error(text, builder.stop_code, builder.stop_offset, builder.stop_detail);
            }
            throw_parse_error(text, code_from_rapidjson(result.Code()), result.Offset(),
                              rapidjson::GetParseError_En(result.Code()));
        }

        // the reader stops after the first complete value; anything
        // after it other than whitespace is an error, including a NUL
        // character that ends the stream early
        //
        size_t offset = stream.Tell();
        while (offset < text.length() && is_json_whitespace(text[offset])) {
            offset++;
        }
        if (offset < text.length()) {
            throw_parse_error(text, json_parse_error::code::trailing_data, offset,
                              "unexpected content after JSON value");
        }

        printf_err(log_debug, "parsed %zu bytes of JSON into %s\n", text.length(), describe(builder.get_root()).c_str());
        return std::move(builder.get_root());
    }

} // namespace cbd::json
