// base64.cc

#include "base64.h"

namespace cbd {

    static const char base64_table[65] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    static const char base64url_table[65] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string base64::encode(const uint8_t *src, size_t len, alphabet a) {
        const char *table = (a == alphabet::url_safe) ? base64url_table : base64_table;

        std::string out;
        out.reserve(4 * ((len + 2) / 3));

        const uint8_t *in = src;
        const uint8_t *end = src + len;
        while (end - in >= 3) {
            out += table[in[0] >> 2];
            out += table[((in[0] & 0x03) << 4) | (in[1] >> 4)];
            out += table[((in[1] & 0x0f) << 2) | (in[2] >> 6)];
            out += table[in[2] & 0x3f];
            in += 3;
        }
        if (end - in == 1) {
            out += table[in[0] >> 2];
            out += table[(in[0] & 0x03) << 4];
        } else if (end - in == 2) {
            out += table[in[0] >> 2];
            out += table[((in[0] & 0x03) << 4) | (in[1] >> 4)];
            out += table[(in[1] & 0x0f) << 2];
        }
        return out;
    }

    static bool is_whitespace(char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    std::vector<uint8_t> base64::decode(const char *data, size_t len, alphabet *detected) {
        using code = base64_error::code;

        while (len > 0 && is_whitespace(data[len - 1])) {
            len--;
        }

        // strip up to two padding characters; padding must bring the
        // input to a multiple of four characters
        //
        size_t pad = 0;
        while (pad < 2 && len > pad && data[len - 1 - pad] == '=') {
            pad++;
        }
        size_t symbols = len - pad;
        if (pad > 0 && (len % 4 != 0 || symbols % 4 == 0)) {
            throw base64_error{code::invalid_length, symbols, "misplaced padding"};
        }
        if (symbols % 4 == 1) {
            throw base64_error{code::invalid_length, symbols - 1, "dangling symbol"};
        }

        bool standard_seen = false;
        bool url_safe_seen = false;
        std::vector<uint8_t> out;
        out.reserve(symbols / 4 * 3 + 2);
        uint32_t accumulator = 0;
        unsigned int bits = 0;
        for (size_t i = 0; i < symbols; i++) {
            char c = data[i];
            if (c == '=') {
                throw base64_error{code::invalid_length, i, "misplaced padding"};
            }
            int8_t sextet = index[static_cast<uint8_t>(c)];
            if (sextet < 0) {
                throw base64_error{code::invalid_character, i, "unexpected character"};
            }
            if (c == '+' || c == '/') {
                standard_seen = true;
            } else if (c == '-' || c == '_') {
                url_safe_seen = true;
            }
            if (standard_seen && url_safe_seen) {
                throw base64_error{code::invalid_character, i, "mixed standard and url-safe alphabets"};
            }
            accumulator = (accumulator << 6) | static_cast<uint32_t>(sextet);
            bits += 6;
            if (bits >= 8) {
                bits -= 8;
                out.push_back(static_cast<uint8_t>(accumulator >> bits));
                accumulator &= (1u << bits) - 1;
            }
        }
        if (accumulator != 0) {
            // the bits left over in the final symbol must be zero, as
            // an encoder writes them
            throw base64_error{code::invalid_character, symbols - 1, "non-zero trailing bits"};
        }

        if (detected != nullptr) {
            *detected = url_safe_seen ? alphabet::url_safe : alphabet::standard;
        }
        return out;
    }

} // namespace cbd
