/*
 * FILE: feedback_calculator.cpp
 *
 * WHAT:
 * The scoring engine of the game and the status digit codec.
 *
 * Scoring runs in two passes so that exact matches consume letter supply
 * before displaced matches do. Guessing "SPEED" against "ABIDE" yields a
 * single Present 'E', even though "SPEED" has two.
 */

#include "feedback_calculator.h"
#include <ctype.h>

bool score_guess(const char* guess, const char* solution, letter_state_t* states)
{
    int solution_char_counts[26] = { 0 };
    bool is_match = true;

    // 1. First Pass: Correct (Exact Matches)
    // The counts only hold letters that were not matched exactly, which is the
    // same as counting everything and decrementing on each exact match.
    for (int i = 0; i < WORDLE_WORD_LENGTH; i++)
    {
        if (guess[i] == solution[i])
        {
            states[i] = LETTER_CORRECT;
        }
        else
        {
            states[i] = LETTER_ABSENT;
            is_match = false;
            int char_idx = toupper((unsigned char)solution[i]) - 'A';
            if (char_idx >= 0 && char_idx < 26) solution_char_counts[char_idx]++;
        }
    }

    if (is_match)
    {
        return true;
    }

    // 2. Second Pass: Present (Displaced Matches)
    for (int i = 0; i < WORDLE_WORD_LENGTH; i++)
    {
        if (states[i] == LETTER_CORRECT)
        {
            continue;
        }
        int char_idx = toupper((unsigned char)guess[i]) - 'A';
        if (char_idx >= 0 && char_idx < 26 && solution_char_counts[char_idx] > 0)
        {
            states[i] = LETTER_PRESENT;
            solution_char_counts[char_idx]--;
        }
    }
    return false;
}

char letter_state_to_digit(letter_state_t state)
{
    switch (state)
    {
    case LETTER_CORRECT: return '2';
    case LETTER_PRESENT: return '1';
    case LETTER_ABSENT:
    case LETTER_UNKNOWN:
        break;
    }
    return '0';
}

bool letter_state_from_digit(char digit, letter_state_t* p_state)
{
    switch (digit)
    {
    case '0': *p_state = LETTER_ABSENT;  return true;
    case '1': *p_state = LETTER_PRESENT; return true;
    case '2': *p_state = LETTER_CORRECT; return true;
    }
    return false;
}
