/*
 * FILE: export_result.h
 *
 * WHAT:
 * Builds the share text of a finished game:
 *
 *   Wordle 1218 4/6
 *
 *   ⬛🟨⬛⬛⬛
 *   ⬛⬛🟩🟨⬛
 *   🟩🟩🟩⬛⬛
 *   🟩🟩🟩🟩🟩
 *
 * The attempt count is "x" for a lost game. Cells use one glyph per state:
 * ⬛ Absent, 🟨 Present, 🟩 Correct (UTF-8).
 */

#pragma once
#ifndef EXPORT_RESULT_H
#define EXPORT_RESULT_H
#include "wordle_types.h"

/* Large enough for any title plus six rows of five 4-byte glyphs. */
const size_t WORDLE_SHARE_TEXT_MAX = 512;

/*
 * FUNCTION: letter_state_glyph
 *
 * WHAT:
 * The UTF-8 glyph for a scored cell. Unknown renders like Absent.
 */
const char* letter_state_glyph(letter_state_t state);

/*
 * FUNCTION: build_share_text
 *
 * WHAT:
 * Writes the share text into `buffer` (null terminated, no trailing newline).
 *
 * RETURNS:
 * - WORDLE_OK.
 * - WORDLE_ERR_NOT_FINISHED if the game is still in progress.
 * - WORDLE_ERR_BUFFER if `size` is too small (buffer contents undefined).
 */
wordle_status_t build_share_text(const char* puzzle_name, int day_index, const game_t* p_game, char* buffer, size_t size);

#endif
