/*
 * FILE: puzzle_selector.h
 *
 * WHAT:
 * Defines the interface for the Puzzle Selector.
 * This module maps the wall-clock date to a day index and a solution word,
 * decides whether the persisted record describes today's puzzle, and answers
 * "when does the next puzzle start".
 *
 * WHY:
 * Every player on the same calendar day must see the same puzzle, and a
 * player must not be able to replay a finished day. Both rules depend only on
 * the day index, so they are kept together and away from the Guess Engine.
 */

#pragma once
#ifndef PUZZLE_SELECTOR_H
#define PUZZLE_SELECTOR_H
#include "wordle_types.h"
#include "load_word_lists.h"
#include <time.h>

/*
 * ENUM: resume_kind_t
 *
 * - RESUME_FRESH:  the stored record belongs to an earlier day; start empty.
 * - RESUME_REPLAY: the stored record belongs to today; replay it first.
 */
typedef enum _resume_kind
{
    RESUME_FRESH = 0,
    RESUME_REPLAY
} resume_kind_t;

/*
 * STRUCT: resume_decision_t
 *
 * WHAT:
 * Result of `resume_state`. For RESUME_REPLAY the string pointers borrow from
 * the record passed in and stay valid as long as that record is unchanged.
 */
typedef struct _resume_decision
{
    resume_kind_t kind;
    const char* letters;
    const char* statuses;
    day_result_t result;
} resume_decision_t;

/*
 * FUNCTION: is_valid_puzzle_date
 *
 * WHAT:
 * True if the date exists on the Gregorian calendar (year 1970 or later,
 * month 1-12, day within the month, leap years honoured).
 */
bool is_valid_puzzle_date(const puzzle_date_t* p_date);

/*
 * FUNCTION: days_from_civil
 *
 * WHAT:
 * Number of days between 1970-01-01 and the given civil date. Pure calendar
 * arithmetic, no time zone involved.
 */
long days_from_civil(int year, int month, int day);

/*
 * FUNCTION: compute_day_index
 *
 * WHAT:
 * Whole calendar days between `epoch` and the local calendar date of `now`.
 * Times of day are ignored, so every call during the same local day returns
 * the same index and the index grows by exactly one per day.
 *
 * RETURNS:
 * - WORDLE_OK with `*p_day_index` set.
 * - WORDLE_ERR_OUT_OF_RANGE if the index is negative or not below
 * `solution_count` (no puzzle exists for that date).
 */
wordle_status_t compute_day_index(time_t now, const puzzle_date_t* epoch, int solution_count, int* p_day_index);

/*
 * FUNCTION: solution_for
 *
 * WHAT:
 * The solution for a day index: a direct lookup into the day-ordered
 * solution list, uppercased into `solution` (6 bytes, null terminated).
 * Returns WORDLE_ERR_OUT_OF_RANGE for an index outside the list.
 */
wordle_status_t solution_for(const word_lists_t* p_lists, int day_index, char* solution);

/*
 * FUNCTION: resume_state
 *
 * WHAT:
 * Decides how the session starts from the persisted record.
 * - last_played < day_index: RESUME_FRESH. The record's `last_result` is
 * reset to DAY_RESULT_UNSET; `played` and `stats` are kept.
 * - last_played == day_index: RESUME_REPLAY with the stored rows and result,
 * which must be replayed into the grid before any new input.
 * - last_played > day_index: WORDLE_ERR_OUT_OF_RANGE. The clock went
 * backwards; no puzzle is offered rather than replaying an earlier day.
 */
wordle_status_t resume_state(int day_index, day_record_t* p_record, resume_decision_t* p_decision);

/*
 * FUNCTION: next_puzzle_day_index
 *
 * WHAT:
 * The day index of tomorrow's puzzle.
 */
int next_puzzle_day_index(int day_index);

/*
 * FUNCTION: seconds_until_next_puzzle
 *
 * WHAT:
 * Seconds from `now` until local midnight starting day `day_index + 1`.
 * Never negative. Reads the clock only; no game state is involved.
 */
long seconds_until_next_puzzle(time_t now, const puzzle_date_t* epoch, int day_index);

/*
 * FUNCTION: format_countdown
 *
 * WHAT:
 * Renders a second count as "HH:MM:SS" into `buffer`.
 * Returns WORDLE_ERR_BUFFER if `size` cannot hold the text.
 */
wordle_status_t format_countdown(long seconds, char* buffer, size_t size);

#endif
