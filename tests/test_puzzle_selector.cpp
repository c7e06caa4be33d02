#include <catch2/catch.hpp>
#include "test_helpers.h"
#include "../puzzle_selector.h"
#include <string.h>
#include <time.h>

using namespace test_helpers;

namespace {

// A local wall-clock time, the way the player's clock would show it.
time_t local_time(int year, int month, int day, int hour, int minute, int second)
{
    struct tm t;
    memset(&t, 0, sizeof(t));
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    t.tm_hour = hour;
    t.tm_min = minute;
    t.tm_sec = second;
    t.tm_isdst = -1;
    return mktime(&t);
}

}

TEST_CASE("days_from_civil counts days since 1970-01-01", "[selector]")
{
    CHECK(days_from_civil(1970, 1, 1) == 0);
    CHECK(days_from_civil(1969, 12, 31) == -1);
    CHECK(days_from_civil(2000, 3, 1) == 11017);
    CHECK(days_from_civil(2021, 6, 19) == 18797);
    CHECK(days_from_civil(2024, 2, 29) == 19782);
    CHECK(days_from_civil(2024, 3, 1) - days_from_civil(2024, 2, 28) == 2);
    CHECK(days_from_civil(2023, 3, 1) - days_from_civil(2023, 2, 28) == 1);
}

TEST_CASE("is_valid_puzzle_date checks calendar bounds", "[selector]")
{
    puzzle_date_t date = { 2024, 2, 29 };
    CHECK(is_valid_puzzle_date(&date));

    date = { 2023, 2, 29 };
    CHECK_FALSE(is_valid_puzzle_date(&date));
    date = { 2021, 13, 1 };
    CHECK_FALSE(is_valid_puzzle_date(&date));
    date = { 2021, 4, 31 };
    CHECK_FALSE(is_valid_puzzle_date(&date));
    date = { 1969, 12, 31 };
    CHECK_FALSE(is_valid_puzzle_date(&date));
    CHECK_FALSE(is_valid_puzzle_date(NULL));
}

TEST_CASE("compute_day_index follows the local calendar date", "[selector]")
{
    const puzzle_date_t epoch = { 2021, 6, 19 };
    int index = -1;

    SECTION("the epoch date is day 0")
    {
        REQUIRE(compute_day_index(local_time(2021, 6, 19, 12, 0, 0), &epoch, 1000, &index) == WORDLE_OK);
        CHECK(index == 0);
    }

    SECTION("every moment of one day maps to the same index")
    {
        int early = -1;
        int late = -1;
        REQUIRE(compute_day_index(local_time(2022, 1, 6, 0, 0, 1), &epoch, 1000, &early) == WORDLE_OK);
        REQUIRE(compute_day_index(local_time(2022, 1, 6, 23, 59, 59), &epoch, 1000, &late) == WORDLE_OK);
        CHECK(early == late);
        CHECK(early == days_from_civil(2022, 1, 6) - days_from_civil(2021, 6, 19));
    }

    SECTION("consecutive days advance by exactly one")
    {
        int previous = -1;
        REQUIRE(compute_day_index(local_time(2021, 6, 19, 12, 0, 0), &epoch, 1000, &previous) == WORDLE_OK);
        for (int offset = 1; offset <= 400; offset++)
        {
            REQUIRE(compute_day_index(local_time(2021, 6, 19 + offset, 12, 0, 0), &epoch, 1000, &index) == WORDLE_OK);
            CHECK(index == previous + 1);
            previous = index;
        }
    }

    SECTION("dates outside the solution list are rejected")
    {
        index = 42;
        CHECK(compute_day_index(local_time(2021, 6, 18, 23, 0, 0), &epoch, 1000, &index) == WORDLE_ERR_OUT_OF_RANGE);
        CHECK(compute_day_index(local_time(2021, 6, 29, 12, 0, 0), &epoch, 10, &index) == WORDLE_ERR_OUT_OF_RANGE);
        CHECK(index == 42);

        REQUIRE(compute_day_index(local_time(2021, 6, 28, 12, 0, 0), &epoch, 10, &index) == WORDLE_OK);
        CHECK(index == 9);
    }
}

TEST_CASE("solution_for returns the day's word in uppercase", "[selector]")
{
    ScopedWordLists words;
    char solution[WORDLE_WORD_LENGTH + 1];

    REQUIRE(solution_for(&words.lists, 0, solution) == WORDLE_OK);
    CHECK(strcmp(solution, "CRANE") == 0);
    REQUIRE(solution_for(&words.lists, 5, solution) == WORDLE_OK);
    CHECK(strcmp(solution, "GHOST") == 0);

    CHECK(solution_for(&words.lists, 6, solution) == WORDLE_ERR_OUT_OF_RANGE);
    CHECK(solution_for(&words.lists, -1, solution) == WORDLE_ERR_OUT_OF_RANGE);
}

TEST_CASE("resume_state decides between a fresh game and a replay", "[selector]")
{
    day_record_t record;
    memset(&record, 0, sizeof(record));
    record.played = 7;
    record.stats[2] = 4;
    strcpy(record.last_letters, "SLATECRANE");
    strcpy(record.last_statuses, "0020222222");
    record.last_result = DAY_RESULT_WON;

    resume_decision_t decision;

    SECTION("a past day starts fresh and forgets its result")
    {
        record.last_played = 99;
        REQUIRE(resume_state(100, &record, &decision) == WORDLE_OK);
        CHECK(decision.kind == RESUME_FRESH);
        CHECK(record.last_result == DAY_RESULT_UNSET);
        CHECK(record.played == 7);
        CHECK(record.stats[2] == 4);
    }

    SECTION("today's record is replayed")
    {
        record.last_played = 100;
        REQUIRE(resume_state(100, &record, &decision) == WORDLE_OK);
        CHECK(decision.kind == RESUME_REPLAY);
        CHECK(strcmp(decision.letters, "SLATECRANE") == 0);
        CHECK(strcmp(decision.statuses, "0020222222") == 0);
        CHECK(decision.result == DAY_RESULT_WON);
        CHECK(record.last_result == DAY_RESULT_WON);
    }

    SECTION("a record from the future is an error")
    {
        record.last_played = 101;
        CHECK(resume_state(100, &record, &decision) == WORDLE_ERR_OUT_OF_RANGE);
        CHECK(record.played == 7);
    }
}

TEST_CASE("the next puzzle is the next day index", "[selector]")
{
    CHECK(next_puzzle_day_index(0) == 1);
    CHECK(next_puzzle_day_index(199) == 200);
}

TEST_CASE("seconds_until_next_puzzle counts down to local midnight", "[selector]")
{
    const puzzle_date_t epoch = { 2022, 1, 1 };
    const int day_index = 5;    /* 2022-01-06 */

    CHECK(seconds_until_next_puzzle(local_time(2022, 1, 6, 23, 0, 0), &epoch, day_index) == 3600);
    CHECK(seconds_until_next_puzzle(local_time(2022, 1, 6, 0, 0, 0), &epoch, day_index) == 86400);
    CHECK(seconds_until_next_puzzle(local_time(2022, 1, 6, 23, 59, 59), &epoch, day_index) == 1);
    CHECK(seconds_until_next_puzzle(local_time(2022, 1, 7, 0, 0, 5), &epoch, day_index) == 0);
}

TEST_CASE("format_countdown prints HH:MM:SS", "[selector]")
{
    char buffer[16];
    REQUIRE(format_countdown(3661, buffer, sizeof(buffer)) == WORDLE_OK);
    CHECK(strcmp(buffer, "01:01:01") == 0);
    REQUIRE(format_countdown(86399, buffer, sizeof(buffer)) == WORDLE_OK);
    CHECK(strcmp(buffer, "23:59:59") == 0);
    REQUIRE(format_countdown(-5, buffer, sizeof(buffer)) == WORDLE_OK);
    CHECK(strcmp(buffer, "00:00:00") == 0);

    char small[8];
    CHECK(format_countdown(3661, small, sizeof(small)) == WORDLE_ERR_BUFFER);
}
