/*
 * FILE: guess_engine.cpp
 *
 * WHAT:
 * Implements the Guess Engine state machine.
 *
 * CURSOR RULES:
 * The cursor is an absolute cell index. While a row is being typed it sits on
 * the last typed letter, or on the first cell of an empty row. Typing into a
 * filled cell first advances the cursor; deleting from an empty cell first
 * steps it back. Scoring the last column of a row moves the cursor to the
 * first cell of the next row.
 */

#include "guess_engine.h"
#include "comparators.h"
#include "feedback_calculator.h"
#include <string.h>
#include <ctype.h>

void init_game(game_t* p_game, const char* solution, const word_lists_t* p_lists)
{
    memset(p_game, 0, sizeof(*p_game));
    for (int i = 0; i < WORDLE_CELL_COUNT; i++)
    {
        p_game->cells[i].letter = '\0';
        p_game->cells[i].state = LETTER_UNKNOWN;
    }
    for (int i = 0; i < WORDLE_ALPHABET_SIZE; i++)
    {
        p_game->keyboard[i] = LETTER_UNKNOWN;
    }
    p_game->cursor = 0;
    p_game->state = GAME_STATE_FILLING;
    for (int i = 0; i < WORDLE_WORD_LENGTH; i++)
    {
        p_game->solution[i] = (char)toupper((unsigned char)solution[i]);
    }
    p_game->solution[WORDLE_WORD_LENGTH] = '\0';
    p_game->p_word_lists = p_lists;
}

bool is_game_over(const game_t* p_game)
{
    return p_game->state == GAME_STATE_WON || p_game->state == GAME_STATE_LOST;
}

int current_row(const game_t* p_game)
{
    return p_game->cursor / WORDLE_COLUMNS;
}

const cell_t* get_cell(const game_t* p_game, int row, int column)
{
    if (row < 0 || row >= WORDLE_ROWS || column < 0 || column >= WORDLE_COLUMNS)
    {
        return NULL;
    }
    return &p_game->cells[row * WORDLE_COLUMNS + column];
}

int count_submitted_rows(const game_t* p_game)
{
    int rows = 0;
    for (int row = 0; row < WORDLE_ROWS; row++)
    {
        // A scored row never has an Unknown first cell.
        if (p_game->cells[row * WORDLE_COLUMNS].state == LETTER_UNKNOWN) break;
        rows++;
    }
    return rows;
}

void input_letter(game_t* p_game, char letter)
{
    if (is_game_over(p_game)) return;
    if (!isalpha((unsigned char)letter) || (unsigned char)letter > 127) return;

    cell_t* p_cell = &p_game->cells[p_game->cursor];
    if (p_cell->letter != '\0')
    {
        // The last letter is filled
        if (p_game->cursor % WORDLE_COLUMNS == WORDLE_COLUMNS - 1) return;
        p_game->cursor++;
        p_cell = &p_game->cells[p_game->cursor];
    }
    p_cell->letter = (char)toupper((unsigned char)letter);
}

void backspace_letter(game_t* p_game)
{
    if (is_game_over(p_game)) return;

    cell_t* p_cell = &p_game->cells[p_game->cursor];
    if (p_cell->letter == '\0')
    {
        // The first letter
        if (p_game->cursor % WORDLE_COLUMNS == 0) return;
        p_game->cursor--;
        p_cell = &p_game->cells[p_game->cursor];
    }
    p_cell->letter = '\0';
}

/*
 * FUNCTION: update_keyboard
 *
 * WHAT:
 * Folds one scored row into the keyboard. A key never moves down the
 * Unknown < Absent < Present < Correct ordering.
 */
static void update_keyboard(game_t* p_game, int row)
{
    for (int column = 0; column < WORDLE_COLUMNS; column++)
    {
        const cell_t* p_cell = &p_game->cells[row * WORDLE_COLUMNS + column];
        int key = p_cell->letter - 'A';
        if (key < 0 || key >= WORDLE_ALPHABET_SIZE) continue;
        p_game->keyboard[key] = max_letter_state(p_game->keyboard[key], p_cell->state);
    }
}

wordle_status_t submit_guess(game_t* p_game, submit_outcome_t* p_outcome)
{
    if (is_game_over(p_game)) return WORDLE_ERR_GAME_OVER;

    int row = current_row(p_game);
    cell_t* p_row = &p_game->cells[row * WORDLE_COLUMNS];
    char word[WORDLE_WORD_LENGTH + 1];

    // 1. Every cell of the row must hold a letter
    for (int column = 0; column < WORDLE_COLUMNS; column++)
    {
        if (p_row[column].letter == '\0') return WORDLE_ERR_INCOMPLETE_ROW;
        word[column] = p_row[column].letter;
    }
    word[WORDLE_WORD_LENGTH] = '\0';

    // 2. Dictionary check against solutions + valid guesses
    if (!is_word_in_lists(p_game->p_word_lists, word)) return WORDLE_ERR_UNKNOWN_WORD;

    p_game->state = GAME_STATE_SUBMITTED;

    // 3. Score the row and fold it into the keyboard
    letter_state_t states[WORDLE_WORD_LENGTH];
    bool is_match = score_guess(word, p_game->solution, states);
    for (int column = 0; column < WORDLE_COLUMNS; column++)
    {
        p_row[column].state = states[column];
    }
    update_keyboard(p_game, row);

    // 4. Transition
    if (is_match)
    {
        p_game->state = GAME_STATE_WON;
    }
    else if (p_game->cursor < WORDLE_CELL_COUNT - 1)
    {
        p_game->cursor++;
        p_game->state = GAME_STATE_FILLING;
    }
    else
    {
        p_game->state = GAME_STATE_LOST;
    }

    if (p_outcome != NULL)
    {
        memcpy(p_outcome->states, states, sizeof(states));
        p_outcome->row = row;
        p_outcome->is_match = is_match;
        p_outcome->state = p_game->state;
    }
    return WORDLE_OK;
}

wordle_status_t replay_guesses(game_t* p_game, const char* letters, const char* statuses, day_result_t result)
{
    if (letters == NULL || statuses == NULL) return WORDLE_ERR_PERSISTENCE;

    size_t length = strlen(letters);
    if (length != strlen(statuses) || length % WORDLE_COLUMNS != 0 || length > (size_t)WORDLE_CELL_COUNT)
    {
        return WORDLE_ERR_PERSISTENCE;
    }

    // Validate everything before touching the grid
    letter_state_t states[WORDLE_CELL_COUNT];
    for (size_t i = 0; i < length; i++)
    {
        if (letters[i] < 'A' || letters[i] > 'Z') return WORDLE_ERR_PERSISTENCE;
        if (!letter_state_from_digit(statuses[i], &states[i])) return WORDLE_ERR_PERSISTENCE;
    }

    int rows = (int)length / WORDLE_COLUMNS;
    if (result == DAY_RESULT_WON)
    {
        // A win ends on the all-correct row
        if (rows == 0) return WORDLE_ERR_PERSISTENCE;
        for (size_t i = length - WORDLE_COLUMNS; i < length; i++)
        {
            if (states[i] != LETTER_CORRECT) return WORDLE_ERR_PERSISTENCE;
        }
    }

    for (size_t i = 0; i < length; i++)
    {
        p_game->cells[i].letter = letters[i];
        p_game->cells[i].state = states[i];
    }
    for (int row = 0; row < rows; row++)
    {
        update_keyboard(p_game, row);
    }

    if (rows == 0)
    {
        p_game->cursor = 0;
    }
    else if (rows < WORDLE_ROWS)
    {
        p_game->cursor = rows * WORDLE_COLUMNS;
    }
    else
    {
        p_game->cursor = WORDLE_CELL_COUNT - 1;
    }

    switch (result)
    {
    case DAY_RESULT_WON:
        p_game->state = GAME_STATE_WON;
        break;
    case DAY_RESULT_LOST:
        p_game->state = GAME_STATE_LOST;
        break;
    case DAY_RESULT_UNSET:
        p_game->state = (rows == WORDLE_ROWS) ? GAME_STATE_LOST : GAME_STATE_FILLING;
        break;
    }
    return WORDLE_OK;
}
