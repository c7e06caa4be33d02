#include <catch2/catch.hpp>
#include "test_helpers.h"
#include "../load_word_lists.h"
#include <string>
#include <string.h>

using namespace test_helpers;

namespace {

std::string solution_at(const word_lists_t& lists, int index)
{
    return std::string(lists.p_solutions + (size_t)index * WORDLE_WORD_LENGTH, WORDLE_WORD_LENGTH);
}

}

TEST_CASE("load_word_lists reads both files", "[word_lists]")
{
    ScopedTempDir dir;
    REQUIRE_FALSE(dir.path.empty());
    const std::string solutions = dir.file("solutions.txt");
    const std::string guesses = dir.file("valid_guesses.txt");

    REQUIRE(write_text_file(solutions, "zonal\r\nCRANE  \n\nabbey\t\nallow"));
    REQUIRE(write_text_file(guesses, "hello\nWorld\n\n"));

    word_lists_t lists;
    REQUIRE(load_word_lists(solutions.c_str(), guesses.c_str(), &lists) == WORDLE_OK);

    SECTION("solutions keep file order and are folded to lowercase")
    {
        REQUIRE(lists.solution_count == 4);
        CHECK(solution_at(lists, 0) == "zonal");
        CHECK(solution_at(lists, 1) == "crane");
        CHECK(solution_at(lists, 2) == "abbey");
        CHECK(solution_at(lists, 3) == "allow");
        CHECK(lists.valid_guess_count == 2);
    }

    SECTION("membership covers both lists in any case")
    {
        CHECK(is_word_in_lists(&lists, "ZONAL"));
        CHECK(is_word_in_lists(&lists, "abbey"));
        CHECK(is_word_in_lists(&lists, "World"));
        CHECK(is_word_in_lists(&lists, "HELLO"));
        CHECK_FALSE(is_word_in_lists(&lists, "SLATE"));
        CHECK_FALSE(is_word_in_lists(&lists, "CRAN"));
        CHECK_FALSE(is_word_in_lists(&lists, "CRANES"));
        CHECK_FALSE(is_word_in_lists(&lists, NULL));
    }

    free_word_lists(&lists);
    CHECK(lists.p_solutions == NULL);
    CHECK(lists.solution_count == 0);
}

TEST_CASE("an empty valid-guess file is allowed", "[word_lists]")
{
    ScopedTempDir dir;
    REQUIRE_FALSE(dir.path.empty());
    const std::string solutions = dir.file("solutions.txt");
    const std::string guesses = dir.file("valid_guesses.txt");
    REQUIRE(write_text_file(solutions, "crane\n"));
    REQUIRE(write_text_file(guesses, ""));

    word_lists_t lists;
    REQUIRE(load_word_lists(solutions.c_str(), guesses.c_str(), &lists) == WORDLE_OK);
    CHECK(lists.solution_count == 1);
    CHECK(lists.valid_guess_count == 0);
    CHECK(is_word_in_lists(&lists, "CRANE"));
    free_word_lists(&lists);
}

TEST_CASE("load_word_lists rejects unusable files", "[word_lists]")
{
    ScopedTempDir dir;
    REQUIRE_FALSE(dir.path.empty());
    const std::string solutions = dir.file("solutions.txt");
    const std::string guesses = dir.file("valid_guesses.txt");
    REQUIRE(write_text_file(guesses, "hello\n"));

    word_lists_t lists;

    SECTION("missing solutions file")
    {
        CHECK(load_word_lists(dir.file("nope.txt").c_str(), guesses.c_str(), &lists) == WORDLE_ERR_WORD_LIST);
    }

    SECTION("missing guesses file")
    {
        REQUIRE(write_text_file(solutions, "crane\n"));
        CHECK(load_word_lists(solutions.c_str(), dir.file("nope.txt").c_str(), &lists) == WORDLE_ERR_WORD_LIST);
    }

    SECTION("empty solutions file")
    {
        REQUIRE(write_text_file(solutions, "\n\n"));
        CHECK(load_word_lists(solutions.c_str(), guesses.c_str(), &lists) == WORDLE_ERR_WORD_LIST);
    }

    SECTION("a word of the wrong length")
    {
        REQUIRE(write_text_file(solutions, "crane\ncranes\n"));
        CHECK(load_word_lists(solutions.c_str(), guesses.c_str(), &lists) == WORDLE_ERR_WORD_LIST);
    }

    SECTION("a word with a non-letter")
    {
        REQUIRE(write_text_file(solutions, "crane\n"));
        REQUIRE(write_text_file(guesses, "hel1o\n"));
        CHECK(load_word_lists(solutions.c_str(), guesses.c_str(), &lists) == WORDLE_ERR_WORD_LIST);
    }

    CHECK(lists.p_solutions == NULL);
}

TEST_CASE("init_word_lists builds lists from arrays", "[word_lists]")
{
    ScopedWordLists words;
    REQUIRE(words.status == WORDLE_OK);
    CHECK(words.lists.solution_count == TEST_SOLUTION_COUNT);
    CHECK(words.lists.valid_guess_count == TEST_GUESS_COUNT);
    CHECK(solution_at(words.lists, 0) == "crane");
    CHECK(is_word_in_lists(&words.lists, "VIVID"));

    const char* bad[] = { "crane", "xy" };
    word_lists_t lists;
    CHECK(init_word_lists(bad, 2, NULL, 0, &lists) == WORDLE_ERR_WORD_LIST);
    CHECK(init_word_lists(NULL, 0, NULL, 0, &lists) == WORDLE_ERR_WORD_LIST);
}
