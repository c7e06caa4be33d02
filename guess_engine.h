/*
 * FILE: guess_engine.h
 *
 * WHAT:
 * Defines the interface for the Guess Engine, the state machine that drives
 * one day's puzzle. This module is responsible for:
 * 1. Editing the current row (typing and deleting letters).
 * 2. Validating and scoring a completed row.
 * 3. Aggregating feedback onto the keyboard.
 * 4. Deciding Won / Lost.
 * 5. Rebuilding the grid from a stored day record (replay).
 *
 * WHY:
 * The engine never reads the clock or touches storage. It returns explicit
 * results (`submit_outcome_t`, status codes) that the surrounding
 * application renders and persists.
 */

#pragma once
#ifndef GUESS_ENGINE_H
#define GUESS_ENGINE_H
#include "wordle_types.h"
#include "load_word_lists.h"

/*
 * FUNCTION: init_game
 *
 * WHAT:
 * Resets `p_game` to an empty grid (cursor 0, every cell and key Unknown,
 * state FILLING) for the given uppercase solution. `p_lists` is borrowed and
 * must outlive the game.
 */
void init_game(game_t* p_game, const char* solution, const word_lists_t* p_lists);

/*
 * FUNCTION: input_letter
 *
 * WHAT:
 * Types one letter into the current row. Letters are uppercased; anything
 * that is not A-Z is ignored.
 * - If the cell under the cursor already holds a letter, the cursor first
 * moves one column right.
 * - On a full row (cursor on the last column, which is filled) the call
 * does nothing.
 * - In WON or LOST the call does nothing.
 */
void input_letter(game_t* p_game, char letter);

/*
 * FUNCTION: backspace_letter
 *
 * WHAT:
 * Deletes the last typed letter of the current row.
 * - If the cell under the cursor is empty, the cursor moves one column left
 * (never past column 0, where the call does nothing) and that cell is
 * cleared.
 * - Otherwise the cell under the cursor is cleared in place.
 * - In WON or LOST the call does nothing.
 */
void backspace_letter(game_t* p_game);

/*
 * FUNCTION: submit_guess
 *
 * WHAT:
 * Submits the current row.
 *
 * FLOW:
 * 1. Any empty cell in the row: WORDLE_ERR_INCOMPLETE_ROW.
 * 2. Word in neither list: WORDLE_ERR_UNKNOWN_WORD.
 * 3. Otherwise (state passes through SUBMITTED): the row is scored, the
 * keyboard updated, and the state becomes WON on a full match, LOST after
 * the sixth row, or FILLING on the next row.
 *
 * On any error the grid, cursor, keyboard and state are unchanged.
 * After the game is over the call returns WORDLE_ERR_GAME_OVER.
 * `p_outcome` is filled only on WORDLE_OK and may be NULL.
 */
wordle_status_t submit_guess(game_t* p_game, submit_outcome_t* p_outcome);

/*
 * FUNCTION: replay_guesses
 *
 * WHAT:
 * Rebuilds the grid from a stored day record: row-major uppercase letters and
 * status digits of every submitted row, plus the stored result.
 * - The keyboard is rebuilt with the same `max_letter_state` rule.
 * - DAY_RESULT_WON / DAY_RESULT_LOST put the game in the matching terminal
 * state. DAY_RESULT_UNSET continues on the next empty row (LOST if all six
 * rows were already used without a win).
 *
 * `p_game` must be freshly initialized. If the strings are inconsistent
 * (different lengths, not whole rows, more than six rows, bad letters or
 * digits, or a won result whose last row is not all correct) the game is
 * left fresh and WORDLE_ERR_PERSISTENCE is returned.
 */
wordle_status_t replay_guesses(game_t* p_game, const char* letters, const char* statuses, day_result_t result);

/*
 * FUNCTION: count_submitted_rows
 *
 * WHAT:
 * Number of rows that have been scored (0..6).
 */
int count_submitted_rows(const game_t* p_game);

/*
 * FUNCTION: current_row
 *
 * WHAT:
 * The row the cursor is on (0..5).
 */
int current_row(const game_t* p_game);

/*
 * FUNCTION: is_game_over
 *
 * WHAT:
 * True in WON or LOST.
 */
bool is_game_over(const game_t* p_game);

/*
 * FUNCTION: get_cell
 *
 * WHAT:
 * Read-only access to cells[row * WORDLE_COLUMNS + column].
 * Returns NULL for coordinates outside the grid.
 */
const cell_t* get_cell(const game_t* p_game, int row, int column);

#endif
