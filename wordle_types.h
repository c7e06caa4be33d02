/*
 * FILE: wordle_types.h
 *
 * WHAT:
 * Defines the core data structures and types shared by every layer of the
 * daily puzzle: letter states, grid cells, the game state machine, the
 * persisted day record and the status codes returned by every operation.
 *
 * WHY:
 * The Word List, Puzzle, Engine and Storage layers all exchange these
 * structures. Keeping them in one header keeps the layout of `game_t` and
 * `day_record_t` identical everywhere they are copied or serialized.
 */

#pragma once
#ifndef WORDLE_TYPES_H
#define WORDLE_TYPES_H

#include <stdlib.h>
#include <stdbool.h>

/*
 * CONSTANTS: Game Constraints
 *
 * WHAT:
 * The physical limits of one puzzle.
 * - WORDLE_WORD_LENGTH / WORDLE_COLUMNS: five letters per attempt.
 * - WORDLE_ROWS: six attempts.
 * - WORDLE_CELL_COUNT: 30 cells, addressed row-major by the cursor (0..29).
 * - WORDLE_ALPHABET_SIZE: one keyboard key per letter A-Z.
 */
const int WORDLE_WORD_LENGTH = 5;
const int WORDLE_COLUMNS = WORDLE_WORD_LENGTH;
const int WORDLE_ROWS = 6;
const int WORDLE_CELL_COUNT = WORDLE_ROWS * WORDLE_COLUMNS;
const int WORDLE_ALPHABET_SIZE = 26;

/*
 * ENUM: wordle_status_t
 *
 * WHAT:
 * The result of every fallible operation. WORDLE_OK is zero so callers can
 * test `if (status != WORDLE_OK)`.
 *
 * DOMAIN VALUES:
 * - WORDLE_ERR_INCOMPLETE_ROW : Submit with an empty cell in the row (recoverable).
 * - WORDLE_ERR_UNKNOWN_WORD   : Submitted word is in neither list (recoverable).
 * - WORDLE_ERR_OUT_OF_RANGE   : Day index outside the solution list (fatal at start).
 * - WORDLE_ERR_PERSISTENCE    : Day record could not be read or written.
 * - WORDLE_ERR_WORD_LIST      : Word lists could not be loaded or are malformed.
 * - WORDLE_ERR_GAME_OVER      : Submit after the game reached Won or Lost.
 * - WORDLE_ERR_NOT_FINISHED   : Export requested before the game ended.
 * - WORDLE_ERR_BUFFER         : Caller supplied buffer is too small.
 * - WORDLE_ERR_CONFIG         : Invalid command line option.
 */
typedef enum _wordle_status
{
    WORDLE_OK = 0,
    WORDLE_ERR_INCOMPLETE_ROW,
    WORDLE_ERR_UNKNOWN_WORD,
    WORDLE_ERR_OUT_OF_RANGE,
    WORDLE_ERR_PERSISTENCE,
    WORDLE_ERR_WORD_LIST,
    WORDLE_ERR_GAME_OVER,
    WORDLE_ERR_NOT_FINISHED,
    WORDLE_ERR_BUFFER,
    WORDLE_ERR_CONFIG
} wordle_status_t;

/*
 * ENUM: letter_state_t
 *
 * WHAT:
 * The feedback attached to one grid cell or one keyboard key.
 *
 * The keyboard only ever moves up the ordering
 * Unknown < Absent < Present < Correct. That ordering lives in
 * `letter_state_rank` (comparators.h); do not compare these values directly.
 */
typedef enum _letter_state
{
    LETTER_UNKNOWN = 0,     /* Not evaluated yet                        */
    LETTER_ABSENT,          /* Not in the solution (or supply used up)  */
    LETTER_PRESENT,         /* In the solution, different position      */
    LETTER_CORRECT          /* In the solution at this position         */
} letter_state_t;

/*
 * ENUM: game_state_t
 *
 * WHAT:
 * The Guess Engine state machine.
 * FILLING -> SUBMITTED -> FILLING (next row) | WON | LOST
 *
 * SUBMITTED only exists for the duration of a successful `submit_guess`.
 * WON and LOST are absorbing: letter input and backspace become no-ops.
 */
typedef enum _game_state
{
    GAME_STATE_FILLING = 0,
    GAME_STATE_SUBMITTED,
    GAME_STATE_WON,
    GAME_STATE_LOST
} game_state_t;

/*
 * ENUM: day_result_t
 *
 * WHAT:
 * The persisted `last_result` field. UNSET maps to JSON `null` and means the
 * stored day was not finished.
 */
typedef enum _day_result
{
    DAY_RESULT_UNSET = 0,
    DAY_RESULT_WON,
    DAY_RESULT_LOST
} day_result_t;

/*
 * STRUCT: cell_t
 *
 * WHAT:
 * One grid position. `letter` is an uppercase A-Z, or '\0' when empty.
 */
typedef struct _cell
{
    char letter;
    letter_state_t state;
} cell_t;

/* Forward declaration, see load_word_lists.h */
struct _word_lists;

/*
 * STRUCT: game_t
 *
 * WHAT:
 * The complete state of one day's puzzle: grid, cursor, keyboard, state and
 * the solution it is scored against.
 *
 * FIELDS:
 * - cells: row-major, cells[row * WORDLE_COLUMNS + column].
 * - cursor: absolute cell index. The current (mutable) row is cursor / 5.
 * It sits on the last typed letter of the row, or on the first cell while
 * the row is empty.
 * - keyboard: keyboard[letter - 'A'], monotonic per `max_letter_state`.
 * - solution: uppercase, null terminated.
 * - p_word_lists: borrowed, must outlive the game. Used to validate guesses.
 */
typedef struct _game
{
    cell_t cells[WORDLE_CELL_COUNT];
    int cursor;
    letter_state_t keyboard[WORDLE_ALPHABET_SIZE];
    game_state_t state;
    char solution[WORDLE_WORD_LENGTH + 1];
    const struct _word_lists* p_word_lists;
} game_t;

/*
 * STRUCT: submit_outcome_t
 *
 * WHAT:
 * What `submit_guess` hands back to the presentation layer after scoring a row.
 */
typedef struct _submit_outcome
{
    letter_state_t states[WORDLE_WORD_LENGTH];  /* Per-cell feedback of the scored row */
    int row;                                    /* 0-based row that was scored         */
    bool is_match;                              /* true if the guess was the solution  */
    game_state_t state;                         /* FILLING, WON or LOST after the move */
} submit_outcome_t;

/*
 * STRUCT: day_record_t
 *
 * WHAT:
 * The persisted record, one per installation.
 *
 * FIELDS:
 * - last_played: day index of the stored day, -1 if nothing was ever played.
 * - last_letters / last_statuses: row-major letters (uppercase) and status
 * digits ('0' Absent, '1' Present, '2' Correct) of every submitted row.
 * Always the same length, a multiple of 5, at most 30.
 * - last_result: outcome of the stored day.
 * - played: finished games.
 * - stats[i]: wins achieved in i+1 attempts.
 */
typedef struct _day_record
{
    int last_played;
    char last_letters[WORDLE_CELL_COUNT + 1];
    char last_statuses[WORDLE_CELL_COUNT + 1];
    day_result_t last_result;
    int played;
    int stats[WORDLE_ROWS];
} day_record_t;

/*
 * STRUCT: puzzle_date_t
 *
 * WHAT:
 * A civil calendar date (no time of day). month is 1-12, day is 1-31.
 */
typedef struct _puzzle_date
{
    int year;
    int month;
    int day;
} puzzle_date_t;

#endif
