/*
 * FILE: comparators.h
 *
 * WHAT:
 * Defines the ordering rules used throughout the game:
 * - The total ordering of letter states that drives the keyboard.
 * - The packed-word comparator used by `qsort` and `bsearch` on word lists.
 *
 * WHY:
 * The keyboard rule "a key shows the best state it ever reached" needs an
 * explicit ordering of Unknown < Absent < Present < Correct. The enum values
 * happen to be declared in that order, but callers must go through these
 * functions so the ordering stays correct if the enum ever changes.
 */

#pragma once
#ifndef COMPARATORS_H
#define COMPARATORS_H
#include "wordle_types.h"

/*
 * FUNCTION: letter_state_rank
 *
 * WHAT:
 * Returns the position of a state in the keyboard ordering:
 * Unknown = 0, Absent = 1, Present = 2, Correct = 3.
 */
int letter_state_rank(letter_state_t state);

/*
 * FUNCTION: compare_letter_states
 *
 * WHAT:
 * Three-way comparison on `letter_state_rank`.
 * Positive if s1 ranks above s2, negative if below, zero if equal.
 */
int compare_letter_states(letter_state_t s1, letter_state_t s2);

/*
 * FUNCTION: max_letter_state
 *
 * WHAT:
 * Returns whichever of the two states ranks higher. This is the keyboard
 * aggregation rule: keyboard[c] = max_letter_state(keyboard[c], observed).
 */
letter_state_t max_letter_state(letter_state_t s1, letter_state_t s2);

/*
 * FUNCTION: compare_packed_words
 *
 * WHAT:
 * A `qsort`/`bsearch` comparator over packed word buffers (5 bytes per word,
 * no null terminators). Compares WORDLE_WORD_LENGTH bytes with `memcmp`.
 */
int compare_packed_words(const void* p1, const void* p2);

#endif
