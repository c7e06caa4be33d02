/*
 * FILE: comparators.cpp
 *
 * WHAT:
 * Implements the ordering rules for letter states and packed words.
 *
 * TIE-BREAKING:
 * Word comparison is plain byte order on lowercase letters, so sorting a
 * list and searching it with the same comparator always agree.
 */

#include "comparators.h"
#include <string.h>

int letter_state_rank(letter_state_t state)
{
    switch (state)
    {
    case LETTER_CORRECT: return 3;
    case LETTER_PRESENT: return 2;
    case LETTER_ABSENT:  return 1;
    case LETTER_UNKNOWN: return 0;
    }
    return 0;
}

int compare_letter_states(letter_state_t s1, letter_state_t s2)
{
    return letter_state_rank(s1) - letter_state_rank(s2);
}

letter_state_t max_letter_state(letter_state_t s1, letter_state_t s2)
{
    return (compare_letter_states(s1, s2) >= 0) ? s1 : s2;
}

int compare_packed_words(const void* p1, const void* p2)
{
    return memcmp(p1, p2, WORDLE_WORD_LENGTH);
}
