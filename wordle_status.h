/*
 * FILE: wordle_status.h
 *
 * WHAT:
 * Maps `wordle_status_t` codes to the text shown to the player or written to
 * stderr.
 */

#pragma once
#ifndef WORDLE_STATUS_H
#define WORDLE_STATUS_H
#include "wordle_types.h"

/*
 * FUNCTION: wordle_status_message
 *
 * WHAT:
 * Returns a static, human-readable message for a status code. The two
 * submit-time errors return the exact prompts the game displays
 * ("Not enough letters", "Not in word list").
 */
const char* wordle_status_message(wordle_status_t status);

#endif
