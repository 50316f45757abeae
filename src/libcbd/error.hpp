// error.hpp
//
// exceptions thrown by the cbd codecs; each carries an error code
// and, where one is known, the offset of the offending input byte

#ifndef ERROR_HPP
#define ERROR_HPP

#include <stdexcept>
#include <string>
#include <cstddef>
#include <cerrno>
#include <cstring>

namespace cbd {

    /// base class for all cbd errors
    ///
    class error : public std::runtime_error {
        const char *category_name;
        size_t offset;
        bool has_offset;

        static std::string format(const char *category, const char *code,
                                  const std::string &detail, size_t offset, bool has_offset) {
            std::string s{category};
            s.append(": ").append(code);
            if (has_offset) {
                s.append(" at offset ").append(std::to_string(offset));
            }
            if (!detail.empty()) {
                s.append(": ").append(detail);
            }
            return s;
        }

    protected:

        error(const char *category, const char *code, const std::string &detail) :
            std::runtime_error{format(category, code, detail, 0, false)},
            category_name{category},
            offset{0},
            has_offset{false}
        { }

        error(const char *category, const char *code, const std::string &detail, size_t pos) :
            std::runtime_error{format(category, code, detail, pos, true)},
            category_name{category},
            offset{pos},
            has_offset{true}
        { }

    public:

        const char *category() const { return category_name; }

        /// returns the byte offset of the input at which the error
        /// was detected; only meaningful if \ref has_position()
        ///
        size_t position() const { return offset; }

        bool has_position() const { return has_offset; }

        virtual const char *code_name() const = 0;
    };

    /// thrown by \ref cbor::decode() for input that is not a single
    /// well-formed CBOR data item
    ///
    class cbor_decode_error : public error {
    public:
        enum class code {
            unexpected_eof,
            invalid_additional_info,
            unexpected_break,
            malformed_indefinite_string,
            invalid_text_string,
            invalid_simple_value,
            depth_exceeded,
            trailing_data,
        };

        cbor_decode_error(code c, size_t pos, const std::string &detail="") :
            error{"cbor decode error", name(c), detail, pos},
            err{c}
        { }

        code get_code() const { return err; }

        const char *code_name() const override { return name(err); }

        static const char *name(code c) {
            switch(c) {
            case code::unexpected_eof:              return "unexpected end of input";
            case code::invalid_additional_info:     return "invalid additional info";
            case code::unexpected_break:            return "unexpected break";
            case code::malformed_indefinite_string: return "malformed indefinite-length string";
            case code::invalid_text_string:         return "invalid text string";
            case code::invalid_simple_value:        return "invalid simple value";
            case code::depth_exceeded:              return "maximum nesting depth exceeded";
            case code::trailing_data:               return "trailing data";
            }
            return "unknown";
        }

    private:
        code err;
    };

    class cbor_encode_error : public error {
    public:
        enum class code {
            unsupported_value,
            invalid_simple_value,
        };

        cbor_encode_error(code c, const std::string &detail="") :
            error{"cbor encode error", name(c), detail},
            err{c}
        { }

        code get_code() const { return err; }

        const char *code_name() const override { return name(err); }

        static const char *name(code c) {
            switch(c) {
            case code::unsupported_value:    return "unsupported value";
            case code::invalid_simple_value: return "invalid simple value";
            }
            return "unknown";
        }

    private:
        code err;
    };

    /// thrown by \ref json::parse(); in addition to the byte offset,
    /// the one-based line and column of the error are reported
    ///
    class json_parse_error : public error {
    public:
        enum class code {
            syntax_error,
            invalid_escape,
            trailing_data,
            depth_exceeded,
        };

        json_parse_error(code c, size_t pos, size_t line, size_t column, const std::string &detail="") :
            error{"json parse error", name(c), locate(line, column, detail), pos},
            err{c},
            line_number{line},
            column_number{column}
        { }

        code get_code() const { return err; }

        size_t line() const { return line_number; }

        size_t column() const { return column_number; }

        const char *code_name() const override { return name(err); }

        static const char *name(code c) {
            switch(c) {
            case code::syntax_error:   return "syntax error";
            case code::invalid_escape: return "invalid escape";
            case code::trailing_data:  return "trailing data";
            case code::depth_exceeded: return "maximum nesting depth exceeded";
            }
            return "unknown";
        }

    private:
        code err;
        size_t line_number;
        size_t column_number;

        static std::string locate(size_t line, size_t column, const std::string &detail) {
            std::string s{"line "};
            s.append(std::to_string(line)).append(", column ").append(std::to_string(column));
            if (!detail.empty()) {
                s.append(": ").append(detail);
            }
            return s;
        }
    };

    class json_print_error : public error {
    public:
        enum class code {
            non_string_map_key,
            unsupported_value,
        };

        json_print_error(code c, const std::string &detail="") :
            error{"json print error", name(c), detail},
            err{c}
        { }

        code get_code() const { return err; }

        const char *code_name() const override { return name(err); }

        static const char *name(code c) {
            switch(c) {
            case code::non_string_map_key: return "non-string map key";
            case code::unsupported_value:  return "unsupported value";
            }
            return "unknown";
        }

    private:
        code err;
    };

    class base64_error : public error {
    public:
        enum class code {
            invalid_character,
            invalid_length,
        };

        base64_error(code c, size_t pos, const std::string &detail="") :
            error{"base64 error", name(c), detail, pos},
            err{c}
        { }

        code get_code() const { return err; }

        const char *code_name() const override { return name(err); }

        static const char *name(code c) {
            switch(c) {
            case code::invalid_character: return "invalid character";
            case code::invalid_length:    return "invalid length";
            }
            return "unknown";
        }

    private:
        code err;
    };

    /// io_error reports a read or write failure; it should be thrown
    /// immediately after the function that set errno
    ///
    class io_error : public error {
    public:
        explicit io_error(const char *operation) :
            error{"io error", operation, strerror(errno)}
        { }

        const char *code_name() const override { return "read/write failure"; }
    };

} // namespace cbd

#endif // ERROR_HPP
