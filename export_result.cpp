/*
 * FILE: export_result.cpp
 *
 * WHAT:
 * Implements the share text template.
 */

#include "export_result.h"
#include "guess_engine.h"
#include <stdio.h>
#include <string.h>

const char* letter_state_glyph(letter_state_t state)
{
    switch (state)
    {
    case LETTER_CORRECT: return "\xF0\x9F\x9F\xA9";    /* 🟩 */
    case LETTER_PRESENT: return "\xF0\x9F\x9F\xA8";    /* 🟨 */
    case LETTER_ABSENT:
    case LETTER_UNKNOWN:
        break;
    }
    return "\xE2\xAC\x9B";                              /* ⬛ */
}

/*
 * FUNCTION: append_text
 *
 * WHAT:
 * Appends `text` at `*p_used`, keeping the buffer null terminated.
 * Returns false once the buffer is full.
 */
static bool append_text(char* buffer, size_t size, size_t* p_used, const char* text)
{
    size_t length = strlen(text);
    if (*p_used + length + 1 > size) return false;
    memcpy(buffer + *p_used, text, length);
    *p_used += length;
    buffer[*p_used] = '\0';
    return true;
}

wordle_status_t build_share_text(const char* puzzle_name, int day_index, const game_t* p_game, char* buffer, size_t size)
{
    if (!is_game_over(p_game)) return WORDLE_ERR_NOT_FINISHED;
    if (buffer == NULL || size == 0) return WORDLE_ERR_BUFFER;

    int rows = count_submitted_rows(p_game);
    char score[64];
    int written;
    if (p_game->state == GAME_STATE_WON)
    {
        written = snprintf(score, sizeof(score), " %d %d/%d\n", day_index, rows, WORDLE_ROWS);
    }
    else
    {
        written = snprintf(score, sizeof(score), " %d x/%d\n", day_index, WORDLE_ROWS);
    }
    if (written < 0 || (size_t)written >= sizeof(score)) return WORDLE_ERR_BUFFER;

    // The name is appended as is; it has no length limit of its own.
    size_t used = 0;
    buffer[0] = '\0';
    if (!append_text(buffer, size, &used, puzzle_name)) return WORDLE_ERR_BUFFER;
    if (!append_text(buffer, size, &used, score)) return WORDLE_ERR_BUFFER;

    for (int row = 0; row < rows; row++)
    {
        if (!append_text(buffer, size, &used, "\n")) return WORDLE_ERR_BUFFER;
        for (int column = 0; column < WORDLE_COLUMNS; column++)
        {
            const cell_t* p_cell = get_cell(p_game, row, column);
            if (!append_text(buffer, size, &used, letter_state_glyph(p_cell->state))) return WORDLE_ERR_BUFFER;
        }
    }
    return WORDLE_OK;
}
