#include <catch2/catch.hpp>
#include <sshcopy/pattern.hpp>

using namespace sshcopy;

TEST_CASE("includes are anchored to the source root", "[pattern]") {
    auto c = classify_patterns({"**/*.so", "bin/*"}, "/build/out");
    REQUIRE(c.includes == std::vector<std::string>{"/build/out/**/*.so", "/build/out/bin/*"});
    REQUIRE(c.excludes.empty());
}

TEST_CASE("excludes keep their bang run in front of the anchored body", "[pattern]") {
    auto c = classify_patterns({"**", "!**/*.log", "!!!tmp/*"}, "/build/out");
    REQUIRE(c.includes == std::vector<std::string>{"/build/out/**"});
    REQUIRE(c.excludes == std::vector<std::string>{"!/build/out/**/*.log", "!!!/build/out/tmp/*"});
}

TEST_CASE("an even bang run is an include", "[pattern]") {
    auto c = classify_patterns({"!!keep.txt"}, "src");
    REQUIRE(c.includes == std::vector<std::string>{"src/!!keep.txt"});
    REQUIRE(c.excludes.empty());
}

TEST_CASE("only excludes injects match-everything", "[pattern]") {
    auto c = classify_patterns({"!*.tmp"}, "/data");
    REQUIRE(c.includes == std::vector<std::string>{kMatchEverything});
    REQUIRE(c.excludes == std::vector<std::string>{"!/data/*.tmp"});
}

TEST_CASE("patterns are trimmed and blanks dropped", "[pattern]") {
    auto c = classify_patterns({"  *.so\t", "", "   ", "\r"}, "out");
    REQUIRE(c.includes == std::vector<std::string>{"out/*.so"});
    REQUIRE(c.excludes.empty());

    auto none = classify_patterns({" ", ""}, "out");
    REQUIRE(none.includes.empty());
    REQUIRE(none.excludes.empty());
}

TEST_CASE("anchor_pattern normalizes the join", "[pattern]") {
    REQUIRE(anchor_pattern("out/", "*.so") == "out/*.so");
    REQUIRE(anchor_pattern("C:\\build\\out", "lib/*.so") == "C:/build/out/lib/*.so");
    REQUIRE(anchor_pattern(".", "**/*.so") == "**/*.so");
    REQUIRE(anchor_pattern("out", "../shared/*.h") == "shared/*.h");
}

TEST_CASE("trim", "[pattern]") {
    REQUIRE(trim("  a b  ") == "a b");
    REQUIRE(trim("\n") == "");
    REQUIRE(trim("x") == "x");
}
