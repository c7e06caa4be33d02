#include <catch2/catch.hpp>
#include "test_helpers.h"
#include "../game_stats.h"
#include <string.h>

using namespace test_helpers;

TEST_CASE("a fresh record has nothing played", "[stats]")
{
    day_record_t record;
    init_day_record(&record);

    CHECK(record.last_played == -1);
    CHECK(record.last_result == DAY_RESULT_UNSET);
    CHECK(record.played == 0);
    CHECK(strlen(record.last_letters) == 0);
    CHECK(strlen(record.last_statuses) == 0);
    for (int i = 0; i < WORDLE_ROWS; i++) CHECK(record.stats[i] == 0);

    stats_summary_t summary;
    summarize_stats(&record, &summary);
    CHECK(summary.played == 0);
    CHECK(summary.wins == 0);
    CHECK(summary.win_percent == Approx(0.0));
    CHECK(summary.last_win_attempts == 0);
    CHECK(summary.current_streak == 0);
    CHECK(summary.max_streak == 0);
}

TEST_CASE("record_game_result folds a finished game into the record", "[stats]")
{
    ScopedWordLists words;
    day_record_t record;
    init_day_record(&record);
    game_t game;
    init_game(&game, "CRANE", &words.lists);

    SECTION("an unfinished game is not recorded")
    {
        REQUIRE(guess_word(&game, "SLATE") == WORDLE_OK);
        CHECK_FALSE(record_game_result(&record, 3, &game));
        CHECK(record.played == 0);
        CHECK(record.last_played == -1);
    }

    SECTION("a win in three")
    {
        REQUIRE(guess_word(&game, "SLATE") == WORDLE_OK);
        REQUIRE(guess_word(&game, "HELLO") == WORDLE_OK);
        REQUIRE(guess_word(&game, "CRANE") == WORDLE_OK);

        REQUIRE(record_game_result(&record, 3, &game));
        CHECK(record.played == 1);
        CHECK(record.stats[2] == 1);
        CHECK(record.last_played == 3);
        CHECK(record.last_result == DAY_RESULT_WON);
        CHECK(strcmp(record.last_letters, "SLATEHELLOCRANE") == 0);
        CHECK(strcmp(record.last_statuses, "002020100022222") == 0);

        stats_summary_t summary;
        summarize_stats(&record, &summary);
        CHECK(summary.last_win_attempts == 3);
        CHECK(summary.win_percent == Approx(100.0));

        SECTION("the same day is never counted twice")
        {
            CHECK_FALSE(record_game_result(&record, 3, &game));
            CHECK(record.played == 1);
            CHECK(record.stats[2] == 1);
        }

        SECTION("the next day counts again")
        {
            game_t next;
            init_game(&next, "ALLOW", &words.lists);
            REQUIRE(guess_word(&next, "ALLOW") == WORDLE_OK);
            REQUIRE(record_game_result(&record, 4, &next));
            CHECK(record.played == 2);
            CHECK(record.stats[0] == 1);
            CHECK(record.stats[2] == 1);
            CHECK(record.last_played == 4);
        }
    }

    SECTION("a loss counts as played without a distribution entry")
    {
        const char* guesses[] = { "SLATE", "ALLOW", "GHOST", "HELLO", "WORLD", "PLUMB" };
        for (const char* guess : guesses) REQUIRE(guess_word(&game, guess) == WORDLE_OK);
        REQUIRE(game.state == GAME_STATE_LOST);

        REQUIRE(record_game_result(&record, 3, &game));
        CHECK(record.played == 1);
        for (int i = 0; i < WORDLE_ROWS; i++) CHECK(record.stats[i] == 0);
        CHECK(record.last_result == DAY_RESULT_LOST);
        CHECK(strlen(record.last_letters) == WORDLE_CELL_COUNT);

        stats_summary_t summary;
        summarize_stats(&record, &summary);
        CHECK(summary.win_percent == Approx(0.0));
        CHECK(summary.last_win_attempts == 0);
    }

    SECTION("an unset result for today is finished and counted")
    {
        record.last_played = 3;
        strcpy(record.last_letters, "SLATE");
        strcpy(record.last_statuses, "00202");
        REQUIRE(replay_guesses(&game, record.last_letters, record.last_statuses, DAY_RESULT_UNSET) == WORDLE_OK);
        REQUIRE(guess_word(&game, "CRANE") == WORDLE_OK);

        REQUIRE(record_game_result(&record, 3, &game));
        CHECK(record.played == 1);
        CHECK(record.stats[1] == 1);
    }
}

TEST_CASE("summarize_stats rounds the win rate to one decimal", "[stats]")
{
    day_record_t record;
    init_day_record(&record);
    stats_summary_t summary;

    record.played = 4;
    record.stats[1] = 2;
    record.stats[4] = 1;
    summarize_stats(&record, &summary);
    CHECK(summary.wins == 3);
    CHECK(summary.win_percent == Approx(75.0));

    record.played = 3;
    record.stats[4] = 0;
    summarize_stats(&record, &summary);
    CHECK(summary.win_percent == Approx(66.7));
}

TEST_CASE("summarize_stats derives the streak figures", "[stats]")
{
    day_record_t record;
    init_day_record(&record);
    stats_summary_t summary;

    SECTION("current streak follows the stored day's winning row")
    {
        record.played = 5;
        record.stats[1] = 2;
        record.stats[3] = 1;
        record.last_result = DAY_RESULT_WON;
        strcpy(record.last_letters, "SLATEHELLOGHOSTCRANE");
        strcpy(record.last_statuses, "00202010000000022222");
        summarize_stats(&record, &summary);
        CHECK(summary.last_win_attempts == 4);
        CHECK(summary.current_streak == 3);
        CHECK(summary.max_streak == 3);
    }

    SECTION("a lost or unset day has no current streak")
    {
        record.played = 2;
        record.stats[4] = 1;
        strcpy(record.last_letters, "SLATE");
        strcpy(record.last_statuses, "00202");

        record.last_result = DAY_RESULT_LOST;
        summarize_stats(&record, &summary);
        CHECK(summary.current_streak == 0);
        CHECK(summary.max_streak == 4);

        record.last_result = DAY_RESULT_UNSET;
        summarize_stats(&record, &summary);
        CHECK(summary.current_streak == 0);
    }

    SECTION("a first-try win gives a zero current streak")
    {
        record.played = 1;
        record.stats[0] = 1;
        record.last_result = DAY_RESULT_WON;
        strcpy(record.last_letters, "CRANE");
        strcpy(record.last_statuses, "22222");
        summarize_stats(&record, &summary);
        CHECK(summary.current_streak == 0);
        CHECK(summary.max_streak == 0);
    }

    SECTION("max streak is the highest used distribution slot")
    {
        record.played = 9;
        record.stats[0] = 4;
        record.stats[5] = 1;
        summarize_stats(&record, &summary);
        CHECK(summary.max_streak == 5);
    }
}
