// transcode.cc

#include "transcode.hpp"
#include "json_reader.hpp"
#include "base64.h"
#include "err.h"

namespace cbd {

    bool parse_max_depth(const std::string &s, size_t &depth) {
        if (s.empty() || s.length() > 9 || s.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        size_t d = std::stoul(s);
        if (d > max_depth_limit) {
            return false;
        }
        depth = d;
        return true;
    }

    bool parse_bytes_policy(const std::string &s, json::bytes_policy &policy) {
        for (auto p : { json::bytes_policy::base64, json::bytes_policy::hex, json::bytes_policy::reject }) {
            if (s == json::bytes_policy_name(p)) {
                policy = p;
                return true;
            }
        }
        return false;
    }

    // returns the configured depth, reduced to max_depth_limit if it
    // is larger
    //
    static size_t depth_bound(const transcode_config &config) {
        if (config.max_depth > max_depth_limit) {
            printf_err(log_warning, "maximum depth %zu reduced to %zu\n", config.max_depth, max_depth_limit);
            return max_depth_limit;
        }
        return config.max_depth;
    }

    std::string cbor_to_json(const std::vector<uint8_t> &input, const transcode_config &config) {
        std::vector<uint8_t> decoded_text;
        datum cbor_data{input};
        if (config.base64) {
            base64::alphabet variant = base64::alphabet::standard;
            decoded_text = base64::decode(reinterpret_cast<const char *>(input.data()), input.size(), &variant);
            printf_err(log_debug, "base64 input uses the %s alphabet\n", base64::alphabet_name(variant));
            printf_err(log_info, "decoded %zu bytes of base64 into %zu bytes\n", input.size(), decoded_text.size());
            cbor_data = datum{decoded_text};
        }

        value v = cbor::decode(cbor_data, depth_bound(config));
        std::string json_text = json::print(v, config.bytes);
        printf_err(log_info, "decoded %zu bytes of CBOR (%s) into %zu bytes of JSON\n",
                   cbor_data.length(), describe(v).c_str(), json_text.length());
        return json_text;
    }

    std::vector<uint8_t> json_to_cbor(const std::string &input, const transcode_config &config) {
        value v = json::parse(input, depth_bound(config));
        std::vector<uint8_t> cbor_bytes = cbor::encode(v);
        printf_err(log_info, "encoded %zu bytes of JSON (%s) into %zu bytes of CBOR\n",
                   input.length(), describe(v).c_str(), cbor_bytes.size());
        if (!config.base64) {
            return cbor_bytes;
        }

        base64::alphabet variant = config.url_safe ? base64::alphabet::url_safe : base64::alphabet::standard;
        std::string text = base64::encode(cbor_bytes, variant);
        printf_err(log_debug, "base64 output uses the %s alphabet\n", base64::alphabet_name(variant));
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    std::vector<uint8_t> transcode(const std::vector<uint8_t> &input, const transcode_config &config) {
        if (config.encode) {
            return json_to_cbor(std::string(input.begin(), input.end()), config);
        }
        std::string json_text = cbor_to_json(input, config);
        std::vector<uint8_t> output(json_text.begin(), json_text.end());
        output.push_back('\n');
        return output;
    }

    std::vector<uint8_t> read_all(FILE *f) {
        std::vector<uint8_t> data;
        uint8_t buf[4096];
        size_t n;
        while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
            data.insert(data.end(), buf, buf + n);
        }
        if (ferror(f)) {
            throw io_error{"read"};
        }
        return data;
    }

    void write_all(FILE *f, const std::vector<uint8_t> &data) {
        if (!data.empty() && fwrite(data.data(), 1, data.size(), f) != data.size()) {
            throw io_error{"write"};
        }
        if (fflush(f) != 0) {
            throw io_error{"flush"};
        }
    }

} // namespace cbd
