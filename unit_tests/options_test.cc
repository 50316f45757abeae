/*
 * options_test.cc
 */

#include <catch2/catch.hpp>
#include <string>
#include <vector>
#include "options.h"
#include "transcode.hpp"

using namespace cbd_option;

static option_processor cbd_options() {
    return option_processor({
            { argument::none,     "--encode",     "-e", "encode JSON input as CBOR" },
            { argument::none,     "--base64",     "-b", "CBOR input or output is base64 text" },
            { argument::required, "--bytes",      "",   "render byte strings as base64, hex, or reject" },
            { argument::required, "--max-depth",  "",   "maximum nesting depth" },
            { argument::none,     "--help",       "-h", "print out help message" },
        });
}

static bool process(option_processor &opt, std::vector<std::string> args) {
    args.insert(args.begin(), "cbd");
    std::vector<char *> argv;
    for (std::string &a : args) {
        argv.push_back(&a[0]);
    }
    argv.push_back(nullptr);
    return opt.process_argv(static_cast<int>(args.size()), argv.data());
}

TEST_CASE("short aliases select the same option") {
    option_processor opt = cbd_options();
    REQUIRE(process(opt, { "-e", "--base64" }));
    CHECK(opt.is_set("--encode"));
    CHECK(opt.is_set("-e"));
    CHECK(opt.is_set("--base64"));
    CHECK_FALSE(opt.is_set("--help"));

    option_processor long_form = cbd_options();
    REQUIRE(process(long_form, { "--encode" }));
    CHECK(long_form.is_set("-e"));
}

TEST_CASE("option arguments") {
    option_processor opt = cbd_options();
    REQUIRE(process(opt, { "--bytes", "hex", "--max-depth", "12" }));
    CHECK(opt.get_value("--bytes") == std::pair<bool, std::string>{true, "hex"});
    CHECK(opt.get_value("--max-depth") == std::pair<bool, std::string>{true, "12"});
    CHECK(opt.get_value("--encode").first == false);
    CHECK(opt.get_value("--no-such-option").first == false);
}

TEST_CASE("malformed command lines are rejected") {
    option_processor missing_argument = cbd_options();
    CHECK_FALSE(process(missing_argument, { "-e", "--max-depth" }));

    option_processor unknown = cbd_options();
    CHECK_FALSE(process(unknown, { "--decode" }));

    option_processor unknown_alias = cbd_options();
    CHECK_FALSE(process(unknown_alias, { "-x" }));

    option_processor empty_alias = cbd_options();
    CHECK_FALSE(process(empty_alias, { "" }));

    option_processor none = cbd_options();
    CHECK(process(none, {}));
}

TEST_CASE("maximum depth values") {
    size_t depth = 7;
    CHECK(cbd::parse_max_depth("12", depth));
    CHECK(depth == 12);
    CHECK(cbd::parse_max_depth("0", depth));
    CHECK(depth == 0);
    CHECK(cbd::parse_max_depth(std::to_string(cbd::max_depth_limit), depth));
    CHECK(depth == cbd::max_depth_limit);

    depth = 7;
    for (const char *s : { "abc", "-1", "", "12x", " 12", "+5", "1e3", "1025", "3000000", "18446744073709551616" }) {
        INFO(s);
        CHECK_FALSE(cbd::parse_max_depth(s, depth));
        CHECK(depth == 7);
    }
}

TEST_CASE("byte string policy names") {
    cbd::json::bytes_policy policy = cbd::json::bytes_policy::base64;
    CHECK(cbd::parse_bytes_policy("hex", policy));
    CHECK(policy == cbd::json::bytes_policy::hex);
    CHECK(cbd::parse_bytes_policy("reject", policy));
    CHECK(policy == cbd::json::bytes_policy::reject);
    CHECK(cbd::parse_bytes_policy("base64", policy));
    CHECK(policy == cbd::json::bytes_policy::base64);

    for (const char *s : { "foo", "", "HEX", "base64url" }) {
        INFO(s);
        CHECK_FALSE(cbd::parse_bytes_policy(s, policy));
        CHECK(policy == cbd::json::bytes_policy::base64);
    }
}
