// cbd.cpp
//
// command line CBOR/JSON transcoder: reads standard input and writes
// standard output

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "options.h"
#include "libcbd/transcode.hpp"
#include "libcbd/base64.h"
#include "libcbd/utf8.hpp"
#include "libcbd/err.h"

using namespace cbd_option;

static bool run_self_tests(FILE *f) {
    bool argument_result = cbd::cbor::argument::unit_test(f);
    bool utf8_result = utf8_string::unit_test(f);
    bool base64_result = cbd::base64::unit_test(f);

    fprintf(stdout, "cbor::argument::unit_test: %s\n", argument_result ? "passed" : "failed");
    fprintf(stdout, "utf8_string::unit_test: %s\n", utf8_result ? "passed" : "failed");
    fprintf(stdout, "base64::unit_test: %s\n", base64_result ? "passed" : "failed");

    return argument_result and utf8_result and base64_result;
}

int main(int argc, char *argv[]) {

    const char *summary = "[OPTIONS]\n"
        "reads CBOR from standard input and writes JSON to standard output, or\n"
        "with --encode, reads JSON and writes CBOR\n\n";
    option_processor opt({
            { argument::none,     "--encode",     "-e", "encode JSON input as CBOR" },
            { argument::none,     "--base64",     "-b", "CBOR input or output is base64 text" },
            { argument::none,     "--url-safe",   "-u", "write base64 with the URL-safe alphabet" },
            { argument::required, "--bytes",      "",   "render byte strings as base64, hex, or reject" },
            { argument::required, "--max-depth",  "",   "maximum nesting depth (default 256, at most 1024)" },
            { argument::none,     "--self-test",  "",   "run built-in unit tests" },
            { argument::none,     "--verbose",    "-v", "provide verbose output" },
            { argument::none,     "--help",       "-h", "print out help message" },
        });

    if (!opt.process_argv(argc, argv)) {
        opt.usage(stderr, argv[0], summary);
        return EXIT_FAILURE;
    }
    if (opt.is_set("--help")) {
        opt.usage(stdout, argv[0], summary);
        return EXIT_SUCCESS;
    }

    cbd::transcode_config config;
    config.encode   = opt.is_set("--encode");
    config.base64   = opt.is_set("--base64");
    config.url_safe = opt.is_set("--url-safe");
    config.verbose  = opt.is_set("--verbose");

    auto [ bytes_is_set, bytes ] = opt.get_value("--bytes");
    if (bytes_is_set && !cbd::parse_bytes_policy(bytes, config.bytes)) {
        fprintf(stderr, "error: unknown byte string policy \"%s\"\n", bytes.c_str());
        opt.usage(stderr, argv[0], summary);
        return EXIT_FAILURE;
    }
    auto [ depth_is_set, depth ] = opt.get_value("--max-depth");
    if (depth_is_set && !cbd::parse_max_depth(depth, config.max_depth)) {
        fprintf(stderr, "error: invalid maximum depth \"%s\"\n", depth.c_str());
        opt.usage(stderr, argv[0], summary);
        return EXIT_FAILURE;
    }

    if (config.verbose) {
        set_log_threshold(log_debug);
    }

    if (opt.is_set("--self-test")) {
        if (run_self_tests(config.verbose ? stdout : nullptr)) {
            printf("all unit tests passed\n");
            return EXIT_SUCCESS;
        }
        printf_err(log_err, "one or more unit tests failed\n");
        return EXIT_FAILURE;
    }

    printf_err(log_debug, "%s mode, base64 %s, byte strings as %s, maximum depth %zu\n",
               config.encode ? "encode" : "decode",
               config.base64 ? "on" : "off",
               cbd::json::bytes_policy_name(config.bytes),
               config.max_depth);

    try {
        std::vector<uint8_t> input = cbd::read_all(stdin);
        std::vector<uint8_t> output = cbd::transcode(input, config);
        cbd::write_all(stdout, output);
    }
    catch (const cbd::error &e) {
        printf_err(log_err, "%s\n", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
