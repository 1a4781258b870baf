#include <doctest/doctest.h>
#include "commandlines/parsers.hpp"

#include <stdexcept>

using namespace commandlines::parsers;

TEST_CASE("parse_options keeps argv order and reduces definitions to their name") {
    ArgVector argv{"tester", "subcommand", "-o", "spacedefinition",
                   "--longoption", "--defoption=equaldefinition", "lastpos"};

    std::vector<std::string> expected{"-o", "--longoption", "--defoption"};
    CHECK(parse_options(argv) == expected);
}

TEST_CASE("parse_options skips '-' and stops at the first '--'") {
    ArgVector argv{"app", "-", "-a", "--", "-b", "--c=d"};
    std::vector<std::string> expected{"-a"};
    CHECK(parse_options(argv) == expected);
}

TEST_CASE("parse_options never looks at the executable") {
    CHECK(parse_options({"-bash"}).empty());
    CHECK(parse_options({"-bash", "-l"}) == std::vector<std::string>{"-l"});
}

TEST_CASE("parse_definitions splits on the first '=' only") {
    ArgVector argv{"app", "--opt=a=b", "-x=1", "--empty=", "plain=notanoption"};
    DefinitionMap defs = parse_definitions(argv);

    REQUIRE(defs.size() == 3);
    CHECK(defs["--opt"] == "a=b");
    CHECK(defs["-x"] == "1");
    CHECK(defs.count("--empty") == 1);
    CHECK(defs["--empty"].empty());
    CHECK(defs.count("plain") == 0);
}

TEST_CASE("parse_definitions ignores tokens after '--' and lets the last duplicate win") {
    ArgVector argv{"app", "--k=1", "--k=2", "--", "--k=3", "--after=x"};
    DefinitionMap defs = parse_definitions(argv);

    REQUIRE(defs.size() == 1);
    CHECK(defs["--k"] == "2");
}

TEST_CASE("first and last arg are absent for an executable-only list") {
    CHECK_FALSE(parse_first_arg({"app"}).has_value());
    CHECK_FALSE(parse_last_arg({"app"}).has_value());

    ArgVector argv{"app", "-o", "file"};
    CHECK(parse_first_arg(argv) == std::string("-o"));
    CHECK(parse_last_arg(argv) == std::string("file"));

    ArgVector one{"app", "only"};
    CHECK(parse_first_arg(one) == parse_last_arg(one));
}

TEST_CASE("parse_double_hyphen_args returns the raw tail after the first '--'") {
    ArgVector argv{"app", "-o", "--", "--keep", "-x", "--"};
    auto tail = parse_double_hyphen_args(argv);
    REQUIRE(tail.has_value());
    CHECK(*tail == std::vector<std::string>{"--keep", "-x", "--"});
}

TEST_CASE("parse_double_hyphen_args is absent without a sentinel or without a tail") {
    CHECK_FALSE(parse_double_hyphen_args({"app"}).has_value());
    CHECK_FALSE(parse_double_hyphen_args({"app", "a", "b"}).has_value());
    CHECK_FALSE(parse_double_hyphen_args({"app", "a", "--"}).has_value());
    // prefix matches are not sentinels
    CHECK_FALSE(parse_double_hyphen_args({"app", "--x", "y"}).has_value());
}

TEST_CASE("parse_mops expands bundled short options and passes single ones through") {
    auto mops = parse_mops({"-hij", "--long", "-l"});
    REQUIRE(mops.has_value());
    CHECK(*mops == std::vector<std::string>{"-h", "-i", "-j", "-l"});
}

TEST_CASE("parse_mops is absent when only long options exist") {
    CHECK_FALSE(parse_mops({}).has_value());
    CHECK_FALSE(parse_mops({"--help", "--version"}).has_value());
}

TEST_CASE("parse_mops keeps multi-byte characters whole") {
    auto mops = parse_mops({"-a\xC3\xA9"});
    REQUIRE(mops.has_value());
    CHECK(*mops == std::vector<std::string>{"-a", "-\xC3\xA9"});

    // a single non-ASCII switch is one character, not a bundle
    auto single = parse_mops({"-\xC3\xA9"});
    REQUIRE(single.has_value());
    CHECK(*single == std::vector<std::string>{"-\xC3\xA9"});
}

TEST_CASE("parse_last_option_index points at the rightmost option before '--'") {
    CHECK(parse_last_option_index({"app"}) == 0);
    CHECK(parse_last_option_index({"app", "a", "b"}) == 0);
    CHECK(parse_last_option_index({"app", "-a", "x", "--b=1", "y"}) == 3);
    CHECK(parse_last_option_index({"app", "-a", "--", "-b"}) == 1);
    CHECK(parse_last_option_index({"app", "-a", "-"}) == 1);
}

TEST_CASE("token predicates") {
    CHECK(is_option("-a"));
    CHECK(is_option("--all"));
    CHECK(is_option("--a=b"));
    CHECK_FALSE(is_option("-"));
    CHECK_FALSE(is_option("--"));
    CHECK_FALSE(is_option("file"));
    CHECK_FALSE(is_option(""));

    CHECK(is_short_option("-abc"));
    CHECK_FALSE(is_short_option("--abc"));
    CHECK(is_long_option("--abc"));
    CHECK_FALSE(is_long_option("-abc"));

    CHECK(is_definition_option("--option=definition"));
    CHECK_FALSE(is_definition_option("--option"));

    CHECK(is_double_hyphen("--"));
    CHECK_FALSE(is_double_hyphen("---"));
    CHECK(is_single_hyphen("-"));
}

TEST_CASE("get_definition_parts") {
    auto parts = get_definition_parts("--option=definition");
    CHECK(parts.first == "--option");
    CHECK(parts.second == "definition");

    auto nested = get_definition_parts("--expr=a=b=c");
    CHECK(nested.first == "--expr");
    CHECK(nested.second == "a=b=c");

    CHECK_THROWS_AS(get_definition_parts("--option"), std::invalid_argument);
}
