/*
 * FILE: day_record_store.h
 *
 * WHAT:
 * Defines the interface for persisting the day record as a small JSON file:
 *
 * {
 *   "last_played": 1218,
 *   "last_guesses": ["CRANESLOTH", "0010222222"],
 *   "last_result": true,
 *   "played": 12,
 *   "stats": [0, 1, 4, 3, 2, 1]
 * }
 *
 * "last_result" is true (won), false (lost) or null (not finished).
 * "played" and "stats" are required; the other keys default to a record with
 * nothing played when absent.
 */

#pragma once
#ifndef DAY_RECORD_STORE_H
#define DAY_RECORD_STORE_H
#include "wordle_types.h"

/*
 * FUNCTION: load_day_record
 *
 * WHAT:
 * Loads the record stored at `path` into `p_record`.
 *
 * RETURNS:
 * - WORDLE_OK: file parsed, or file does not exist (fresh record).
 * - WORDLE_ERR_PERSISTENCE: file unreadable or malformed. `p_record` holds
 * a fresh record so the session can continue; the reason is on stderr.
 */
wordle_status_t load_day_record(const char* path, day_record_t* p_record);

/*
 * FUNCTION: save_day_record
 *
 * WHAT:
 * Writes the record to "<path>.tmp", flushes it to disk and renames it over
 * `path`. The previous file is either fully replaced or left untouched.
 *
 * RETURNS:
 * - WORDLE_OK on success.
 * - WORDLE_ERR_PERSISTENCE on any failure (temp file removed). `p_record`
 * is never modified.
 */
wordle_status_t save_day_record(const char* path, const day_record_t* p_record);

/*
 * FUNCTION: parse_day_record
 *
 * WHAT:
 * Parses the JSON text of a record. Exposed for tests; `load_day_record`
 * reads the file and calls this. Returns false on malformed input, in which
 * case `p_record` holds a fresh record.
 */
bool parse_day_record(const char* json, day_record_t* p_record);

#endif
