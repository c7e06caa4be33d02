#include <catch2/catch.hpp>
#include "../game_config.h"
#include <string>
#include <vector>
#include <string.h>

namespace {

/*
 * Owns a mutable argv for getopt.
 */
struct Arguments
{
    std::vector<std::string> storage;
    std::vector<char*> argv;

    Arguments(std::initializer_list<const char*> args)
    {
        storage.push_back("wordle_daily");
        for (const char* arg : args) storage.push_back(arg);
        for (std::string& arg : storage) argv.push_back(&arg[0]);
        argv.push_back(NULL);
    }

    int argc() const { return (int)storage.size(); }
};

wordle_status_t parse(Arguments& args, game_config_t* p_config, bool* p_show_help)
{
    return parse_game_config(args.argc(), args.argv.data(), p_config, p_show_help);
}

}

TEST_CASE("no options gives the defaults", "[config]")
{
    Arguments args({});
    game_config_t config;
    bool show_help = true;

    REQUIRE(parse(args, &config, &show_help) == WORDLE_OK);
    CHECK_FALSE(show_help);
    CHECK(strcmp(config.puzzle_name, "Wordle") == 0);
    CHECK(config.epoch.year == 2021);
    CHECK(config.epoch.month == 6);
    CHECK(config.epoch.day == 19);
    CHECK(strcmp(config.solutions_path, "solutions.txt") == 0);
    CHECK(strcmp(config.valid_guesses_path, "valid_guesses.txt") == 0);
    CHECK(strcmp(config.stats_path, ".stats.json") == 0);
}

TEST_CASE("every option overrides its default", "[config]")
{
    Arguments args({ "-s", "words/a.txt", "-g", "words/b.txt", "-r", "/tmp/s.json", "-e", "2024-02-29", "-n", "Lingo" });
    game_config_t config;
    bool show_help = false;

    REQUIRE(parse(args, &config, &show_help) == WORDLE_OK);
    CHECK(strcmp(config.solutions_path, "words/a.txt") == 0);
    CHECK(strcmp(config.valid_guesses_path, "words/b.txt") == 0);
    CHECK(strcmp(config.stats_path, "/tmp/s.json") == 0);
    CHECK(strcmp(config.puzzle_name, "Lingo") == 0);
    CHECK(config.epoch.year == 2024);
    CHECK(config.epoch.month == 2);
    CHECK(config.epoch.day == 29);
}

TEST_CASE("-h asks for help", "[config]")
{
    Arguments args({ "-h" });
    game_config_t config;
    bool show_help = false;

    REQUIRE(parse(args, &config, &show_help) == WORDLE_OK);
    CHECK(show_help);
}

TEST_CASE("bad command lines are rejected", "[config]")
{
    game_config_t config;
    bool show_help = false;

    SECTION("unknown option")
    {
        Arguments args({ "-x" });
        CHECK(parse(args, &config, &show_help) == WORDLE_ERR_CONFIG);
    }

    SECTION("missing argument")
    {
        Arguments args({ "-s" });
        CHECK(parse(args, &config, &show_help) == WORDLE_ERR_CONFIG);
    }

    SECTION("invalid epoch")
    {
        Arguments args({ "-e", "2023-02-29" });
        CHECK(parse(args, &config, &show_help) == WORDLE_ERR_CONFIG);
    }

    SECTION("positional argument")
    {
        Arguments args({ "extra" });
        CHECK(parse(args, &config, &show_help) == WORDLE_ERR_CONFIG);
    }
}

TEST_CASE("parse_puzzle_date accepts only YYYY-MM-DD", "[config]")
{
    puzzle_date_t date = { 0, 0, 0 };

    REQUIRE(parse_puzzle_date("2024-02-29", &date));
    CHECK(date.year == 2024);
    CHECK(date.month == 2);
    CHECK(date.day == 29);

    date = { 1, 1, 1 };
    CHECK_FALSE(parse_puzzle_date("2023-02-29", &date));
    CHECK_FALSE(parse_puzzle_date("2021-6-19", &date));
    CHECK_FALSE(parse_puzzle_date("2021-06-19x", &date));
    CHECK_FALSE(parse_puzzle_date("1969-12-31", &date));
    CHECK_FALSE(parse_puzzle_date("", &date));
    CHECK_FALSE(parse_puzzle_date(NULL, &date));
    CHECK(date.year == 1);
}
