#include <catch2/catch.hpp>
#include <sshcopy/clean_command.hpp>

using namespace sshcopy;

TEST_CASE("posix clean removes visible entries", "[clean_command]") {
    REQUIRE(clean_target_folder_command("/opt/app", false, false) ==
            "sh -c \"rm -rf '/opt/app'/*\"");
}

TEST_CASE("posix clean with hidden files adds dotfile globs", "[clean_command]") {
    REQUIRE(clean_target_folder_command("./site", false, true) ==
            "sh -c \"rm -rf './site'/* './site'/.[!.]* './site'/..?*\"");
}

TEST_CASE("windows clean deletes files then subfolders", "[clean_command]") {
    REQUIRE(clean_target_folder_command("C:\\deploy", true, false) ==
            "del /q \"C:\\deploy\\*\" && FOR /D %p IN (\"C:\\deploy\\*\") DO rmdir \"%p\" /s /q");
}

TEST_CASE("windows clean with hidden files uses the hidden attribute", "[clean_command]") {
    std::string cmd = clean_target_folder_command("D:\\www", true, true);
    REQUIRE(cmd.rfind("del /q /A:H \"D:\\www\\*\" && ", 0) == 0);
    REQUIRE(cmd.find("rmdir \"%p\" /s /q") != std::string::npos);
}
