/*
 * FILE: load_word_lists.h
 *
 * WHAT:
 * Defines the interface for the Word List subsystem.
 * This module loads the two immutable word lists the game depends on:
 * 1. Solutions: the daily answers, in day order (index = day offset).
 * 2. Valid Guesses: additional words accepted as guesses but never answers.
 *
 * WHY:
 * The lists are an injected dependency. The Puzzle Selector and the Guess
 * Engine only ever see a loaded, validated `word_lists_t` handle, so they can
 * be tested against small in-memory lists without touching the filesystem.
 */

#pragma once
#ifndef LOAD_WORD_LISTS_H
#define LOAD_WORD_LISTS_H
#include "wordle_types.h"

/*
 * STRUCT: word_lists_t
 *
 * WHAT:
 * All word buffers are packed: 5 lowercase bytes per word, no null
 * terminators, so word `i` starts at `p + i * WORDLE_WORD_LENGTH`.
 *
 * FIELDS:
 * - p_solutions: day order. Never re-sorted.
 * - p_solutions_sorted: alphabetical copy of p_solutions for `bsearch`.
 * - p_valid_guesses: alphabetical.
 *
 * All three buffers are owned by the struct and released by `free_word_lists`.
 */
typedef struct _word_lists
{
    char* p_solutions;
    char* p_solutions_sorted;
    int solution_count;
    char* p_valid_guesses;
    int valid_guess_count;
} word_lists_t;

/*
 * FUNCTION: load_word_lists
 *
 * WHAT:
 * Reads both lists from text files (one word per line).
 * - Trailing whitespace (including '\r') is trimmed; blank lines are skipped.
 * - Every other line must be exactly five ASCII letters. Case is folded.
 * - The solution list must not be empty.
 *
 * RETURNS:
 * - WORDLE_OK, with `p_lists` populated.
 * - WORDLE_ERR_WORD_LIST if a file cannot be read or fails validation. The
 * reason is written to stderr and `p_lists` is left empty.
 */
wordle_status_t load_word_lists(const char* solutions_path, const char* valid_guesses_path, word_lists_t* p_lists);

/*
 * FUNCTION: init_word_lists
 *
 * WHAT:
 * Builds the lists from in-memory arrays of C strings, applying the same
 * validation as `load_word_lists`. `valid_guesses` may be NULL when
 * `valid_guess_count` is 0.
 */
wordle_status_t init_word_lists(const char* const* solutions, int solution_count,
    const char* const* valid_guesses, int valid_guess_count,
    word_lists_t* p_lists);

/*
 * FUNCTION: free_word_lists
 *
 * WHAT:
 * Releases the buffers and resets the counts. Safe on an already freed or
 * zero-initialized struct.
 */
void free_word_lists(word_lists_t* p_lists);

/*
 * FUNCTION: is_word_in_lists
 *
 * WHAT:
 * Case-insensitive membership test of a 5-letter word against the union of
 * the solution list and the valid-guess list. Words that are not exactly five
 * letters are never members.
 */
bool is_word_in_lists(const word_lists_t* p_lists, const char* word);

#endif
