/*
 * FILE: feedback_calculator.h
 *
 * WHAT:
 * Defines the interface for scoring a guess against the solution and for
 * converting letter states to and from the single-digit codes stored in the
 * day record ('0' Absent, '1' Present, '2' Correct).
 *
 * WHY:
 * This is the "Calculator" component. It knows nothing about the grid,
 * the cursor or the keyboard; it only turns two words into five states.
 */

#pragma once
#ifndef FEEDBACK_CALCULATOR_H
#define FEEDBACK_CALCULATOR_H
#include "wordle_types.h"

/*
 * FUNCTION: score_guess
 *
 * WHAT:
 * Scores a 5-letter guess against a 5-letter solution (same case).
 *
 * LOGIC:
 * 1. First Pass (Correct): exact position matches, each consuming one unit
 * of that letter from the solution's letter counts.
 * 2. Second Pass (Present/Absent), left to right: a letter with remaining
 * supply is Present and consumes one unit; otherwise it is Absent.
 *
 * GUARANTEES:
 * - No letter is marked Correct or Present more often than it occurs in the
 * solution.
 * - Exact matches always win the supply over displaced matches.
 * - score_guess(S, S) is all Correct.
 *
 * RETURNS:
 * - true if every position is Correct.
 */
bool score_guess(const char* guess, const char* solution, letter_state_t* states);

/*
 * FUNCTION: letter_state_to_digit
 *
 * WHAT:
 * '0' for Absent, '1' for Present, '2' for Correct. Unknown has no stored
 * form and maps to '0'.
 */
char letter_state_to_digit(letter_state_t state);

/*
 * FUNCTION: letter_state_from_digit
 *
 * WHAT:
 * Inverse of `letter_state_to_digit`. Returns false for anything other than
 * '0', '1' or '2'.
 */
bool letter_state_from_digit(char digit, letter_state_t* p_state);

#endif
