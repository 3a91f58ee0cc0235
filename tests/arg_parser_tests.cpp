#include "test_common.hpp"
#include <climits>

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--foo", "--opt", "42", "pos", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--foo", "--bar", "--opt"});
    REQUIRE(parser.has_flag("--foo"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "pos");
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--unknown");
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--opt=val"};
    ArgParser parser(2, const_cast<char**>(argv), {"--opt"});
    REQUIRE(parser.has_flag("--opt"));
    REQUIRE(parser.get_option("--opt") == "val");
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-y42"};
    ArgParser parser(3, const_cast<char**>(argv), {"--help", "--opt"},
                     {{'h', "--help"}, {'y', "--opt"}});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--opt") == std::string("42"));
}

TEST_CASE("ArgParser stacked short switches") {
    const char* argv[] = {"prog", "-ab"};
    ArgParser parser(2, const_cast<char**>(argv), {"--flag-a", "--flag-b"},
                     {{'a', "--flag-a"}, {'b', "--flag-b"}}, {"--flag-a", "--flag-b"});
    REQUIRE(parser.has_flag("--flag-a"));
    REQUIRE(parser.has_flag("--flag-b"));
}

TEST_CASE("ArgParser unknown short flag") {
    const char* argv[] = {"prog", "-x"};
    ArgParser parser(2, const_cast<char**>(argv), {"--bar"}, {{'a', "--bar"}});
    REQUIRE(parser.positional().empty());
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "-x");
}

TEST_CASE("ArgParser switches do not consume positionals") {
    const char* argv[] = {"prog", "--no-wait", "src", "dst"};
    ArgParser parser(4, const_cast<char**>(argv), {"--no-wait"}, {}, {"--no-wait"});
    REQUIRE(parser.has_flag("--no-wait"));
    REQUIRE(parser.get_option("--no-wait").empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"src", "dst"});
}

TEST_CASE("ArgParser keeps arguments after the positional cap verbatim") {
    const char* argv[] = {"prog", "--lock", "/tmp/l", "src", "dst", "--delete", "--exclude",
                          "*.tmp", "-h"};
    ArgParser parser(9, const_cast<char**>(argv), {"--lock", "--help"}, {{'h', "--help"}}, {},
                     2);
    REQUIRE(parser.get_option("--lock") == "/tmp/l");
    REQUIRE(parser.positional() == std::vector<std::string>{"src", "dst"});
    REQUIRE(parser.remainder() ==
            std::vector<std::string>{"--delete", "--exclude", "*.tmp", "-h"});
    REQUIRE_FALSE(parser.has_flag("--help"));
    REQUIRE(parser.unknown_flags().empty());
}

TEST_CASE("ArgParser double dash ends option parsing") {
    const char* argv[] = {"prog", "--", "--weird-source", "dst", "--size-only"};
    ArgParser parser(5, const_cast<char**>(argv), {"--lock"}, {}, {}, 2);
    REQUIRE(parser.positional() == std::vector<std::string>{"--weird-source", "dst"});
    REQUIRE(parser.remainder() == std::vector<std::string>{"--size-only"});
    REQUIRE(parser.unknown_flags().empty());
}

TEST_CASE("ArgParser flag without value at the end") {
    const char* argv[] = {"prog", "--log"};
    ArgParser parser(2, const_cast<char**>(argv), {"--log"});
    REQUIRE(parser.has_flag("--log"));
    REQUIRE(parser.get_option("--log").empty());
}

TEST_CASE("parse_int bounds and trailing text") {
    bool ok = false;
    REQUIRE(parse_int("42", 0, 100, ok) == 42);
    REQUIRE(ok);
    parse_int("101", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_int("12abc", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_int("", 0, INT_MAX, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bytes units") {
    bool ok = false;
    REQUIRE(parse_bytes("1KB", 0, SIZE_MAX, ok) == 1024);
    REQUIRE(ok);
    REQUIRE(parse_bytes("2mb", 0, SIZE_MAX, ok) == 2u * 1024 * 1024);
    REQUIRE(ok);
    REQUIRE(parse_bytes("512", 0, SIZE_MAX, ok) == 512);
    REQUIRE(ok);
    parse_bytes("10XB", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("2KB", 0, 1000, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_time_ms units") {
    bool ok = false;
    REQUIRE(parse_time_ms("250", ok).count() == 250);
    REQUIRE(ok);
    REQUIRE(parse_time_ms("250ms", ok).count() == 250);
    REQUIRE(ok);
    REQUIRE(parse_time_ms("2s", ok).count() == 2000);
    REQUIRE(ok);
    REQUIRE(parse_time_ms("1m", ok).count() == 60000);
    REQUIRE(ok);
    parse_time_ms("-5", ok);
    REQUIRE_FALSE(ok);
    parse_time_ms("fast", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bool accepts common spellings") {
    REQUIRE(parse_bool(""));
    REQUIRE(parse_bool("1"));
    REQUIRE(parse_bool("TRUE"));
    REQUIRE(parse_bool("yes"));
    REQUIRE(parse_bool("on"));
    REQUIRE_FALSE(parse_bool("false"));
    REQUIRE_FALSE(parse_bool("0"));
    REQUIRE_FALSE(parse_bool("no"));
}
