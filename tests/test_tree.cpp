#include <catch2/catch.hpp>
#include <sshcopy/tree.hpp>
#include "temp_dir.hpp"

using namespace sshcopy;
using sshcopy::testing::TempDir;
namespace fs = std::filesystem;

TEST_CASE("list_files walks the tree and skips directories", "[tree]") {
    TempDir td;
    td.write_file("b.txt");
    td.write_file("a/deep/c.bin");
    td.write_file(".hidden/d.cfg");
    fs::create_directories(td.path / "empty");

    auto r = list_files(td.root());
    REQUIRE(r.is_ok());
    const std::string root = td.root();
    REQUIRE(r.value() == std::vector<std::string>{
        root + "/.hidden/d.cfg",
        root + "/a/deep/c.bin",
        root + "/b.txt",
    });
}

TEST_CASE("list_files of an empty directory is empty", "[tree]") {
    TempDir td;
    auto r = list_files(td.root());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().empty());
}

TEST_CASE("list_files on a missing root is a config error", "[tree]") {
    TempDir td;
    auto r = list_files(td.root() + "/missing");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CopyError::Config);
    REQUIRE(r.error().message.find("does not exist") != std::string::npos);
}

TEST_CASE("require_directory rejects a file", "[tree]") {
    TempDir td;
    td.write_file("file.txt");
    auto s = require_directory(td.root() + "/file.txt");
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == CopyError::Config);
    REQUIRE(s.error().message.find("not a directory") != std::string::npos);

    REQUIRE(require_directory(td.root()).is_ok());
}

#ifndef _WIN32
TEST_CASE("list_files follows directory symlinks", "[tree]") {
    TempDir td;
    td.write_file("real/x.txt");
    fs::create_directories(td.path / "src");
    fs::create_directory_symlink(td.path / "real", td.path / "src" / "link");

    auto r = list_files(td.root() + "/src");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{td.root() + "/src/link/x.txt"});
}
#endif
