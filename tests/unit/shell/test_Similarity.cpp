#include <tabshell/shell/Similarity.hpp>

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace TS::Shell;

TEST_SUITE("shell.similarity") {
    TEST_CASE("edit_distance counts single-byte edits") {
        CHECK(edit_distance("", "") == 0);
        CHECK(edit_distance("ls", "") == 2);
        CHECK(edit_distance("", "cd") == 2);
        CHECK(edit_distance("kitten", "sitting") == 3);
        CHECK(edit_distance("mkdir", "mkdri") == 2);
        CHECK(edit_distance("pwd", "pwd") == 0);
        CHECK(edit_distance("LS", "ls") == 2);
    }

    TEST_CASE("similarity_ratio is normalised by the longer input") {
        CHECK(similarity_ratio("", "") == doctest::Approx(1.0));
        CHECK(similarity_ratio("abc", "abc") == doctest::Approx(1.0));
        CHECK(similarity_ratio("abc", "xyz") == doctest::Approx(0.0));
        CHECK(similarity_ratio("list files", "list fils") == doctest::Approx(0.9));
    }

    TEST_CASE("close_matches ranks and filters candidates") {
        std::vector<std::string> const names{"cat", "cd", "clear", "cp", "cpu", "echo", "ls", "mkdir", "pwd"};

        auto matches = close_matches("mkdr", names, 3, 0.6);
        REQUIRE_FALSE(matches.empty());
        CHECK(matches.front() == "mkdir");

        auto upper = close_matches("PWD", names, 3, 0.6);
        REQUIRE(upper.size() == 1);
        CHECK(upper.front() == "pwd");

        CHECK(close_matches("zzzzzz", names, 3, 0.6).empty());

        auto limited = close_matches("c", names, 2, 0.0);
        CHECK(limited.size() == 2);
    }

    TEST_CASE("close_matches keeps candidate order for ties") {
        std::vector<std::string> const names{"cp", "cd"};
        auto matches = close_matches("cx", names, 5, 0.5);
        REQUIRE(matches.size() == 2);
        CHECK(matches[0] == "cp");
        CHECK(matches[1] == "cd");
    }

    TEST_CASE("to_lower_copy") {
        CHECK(to_lower_copy("Show CPU") == "show cpu");
        CHECK(to_lower_copy("") == "");
    }
}
