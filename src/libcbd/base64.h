/*
 * base64.h
 *
 * base64 (RFC 4648) encoding of byte strings
 */

#ifndef BASE64_H
#define BASE64_H

#include <stdio.h>
#include <stdint.h>
#include <string.h>
#include <string>
#include <vector>
#include "error.hpp"

namespace cbd {

    class base64 {

        // index[] maps each character of both the standard and the
        // URL-safe alphabets to its six-bit value, and every other
        // character to -1
        //
        static constexpr int8_t index[256] = {
            -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
            -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
            -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, 62, -1, 62, -1, 63,
            52, 53, 54, 55, 56, 57, 58, 59, 60, 61, -1, -1, -1, -1, -1, -1,
            -1,  0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14,
            15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, -1, -1, -1, -1, 63,
            -1, 26, 27, 28, 29, 30, 31, 32, 33, 34, 35, 36, 37, 38, 39, 40,
            41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, -1, -1, -1, -1, -1,
            -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
            -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
            -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
            -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
            -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
            -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
            -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
            -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
        };

    public:

        enum class alphabet {
            standard,   // '+' and '/'
            url_safe,   // '-' and '_'
        };

        static const char *alphabet_name(alphabet a) {
            return a == alphabet::url_safe ? "url-safe" : "standard";
        }

        /// returns the unpadded base64 encoding of the \p len bytes at
        /// \p src, using the alphabet \p a
        ///
        static std::string encode(const uint8_t *src, size_t len, alphabet a=alphabet::standard);

        static std::string encode(const std::vector<uint8_t> &bytes, alphabet a=alphabet::standard) {
            return encode(bytes.data(), bytes.size(), a);
        }

        /// decodes the \p len characters at \p data, which may use
        /// either the standard or the URL-safe alphabet (but not both),
        /// with or without `=` padding.  Trailing whitespace is
        /// ignored.  If \p detected is not null, the alphabet of the
        /// input is written to it.
        ///
        /// \throws base64_error if the input is not base64
        ///
        static std::vector<uint8_t> decode(const char *data, size_t len, alphabet *detected=nullptr);

        static std::vector<uint8_t> decode(const std::string &text, alphabet *detected=nullptr) {
            return decode(text.data(), text.length(), detected);
        }

        // class unit_test_case holds a single test case for
        // base64::decode() and base64::encode()
        //
        class unit_test_case {
            const char *output;
            const char *input;

        public:

            unit_test_case(const char *out, const char *in) : output{out}, input{in} { }

            // unit_test_case::test() returns true if the decoded input
            // matches the expected output, and false otherwise
            //
            bool test() const {
                std::vector<uint8_t> result;
                try {
                    result = decode(input, strlen(input));
                }
                catch (const base64_error &) {
                    return false;
                }
                return result.size() == strlen(output)
                    and (result.empty() or memcmp(result.data(), output, result.size()) == 0);
            }

            void fprint(FILE *f) const {
                fprintf(f, "input: \"%s\"\texpected: \"%s\"\t%s\n", input, output, test() ? "passed" : "failed");
            }
        };

        /// base64::unit_test() is a static function that performs a
        /// unit test of base64::decode() and base64::encode(), and
        /// returns true if all tests passed, and false otherwise.  If
        /// \p f is not null, the test cases are written to it.
        ///
        static bool unit_test(FILE *f=nullptr) {

            // test cases following RFC 4648 Section 10, along with
            // their unpadded and URL-safe variants
            //
            unit_test_case tests[] = {
                { "",       "" },
                { "f",      "Zg==" },
                { "fo",     "Zm8=" },
                { "foo",    "Zm9v" },
                { "foob",   "Zm9vYg==" },
                { "fooba",  "Zm9vYmE=" },
                { "foobar", "Zm9vYmFy" },
                { "f",      "Zg" },
                { "fooba",  "Zm9vYmE" },
                { "foobar", "Zm9vYmFy\n" },
                { "\xfb\xff", "+/8" },
                { "\xfb\xff", "-_8=" },
            };

            bool all_passed = true;
            for (const auto & t : tests) {
                if (f) {
                    t.fprint(f);
                }
                all_passed &= t.test();
            }

            const uint8_t key_value[] = { 0xa1, 0x63, 'k', 'e', 'y', 0x65, 'v', 'a', 'l', 'u', 'e' };
            bool encode_passed = encode(key_value, sizeof(key_value)) == "oWNrZXlldmFsdWU"
                and encode(std::vector<uint8_t>{ 0xfb, 0xff }, alphabet::url_safe) == "-_8";
            if (f) {
                fprintf(f, "base64::encode: %s\n", encode_passed ? "passed" : "failed");
            }
            return all_passed and encode_passed;
        }

    };

} // namespace cbd

#endif // BASE64_H
