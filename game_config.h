/*
 * FILE: game_config.h
 *
 * WHAT:
 * Defines the runtime configuration of the game: puzzle name, epoch date and
 * the paths of the word lists and the statistics file.
 *
 * WHY:
 * Day-index arithmetic and file locations are process configuration, not
 * game logic. The defaults live in one data object and the command line
 * only overrides what it names.
 */

#pragma once
#ifndef GAME_CONFIG_H
#define GAME_CONFIG_H
#include "wordle_types.h"

/*
 * STRUCT: game_config_t
 *
 * WHAT:
 * The master configuration object. String fields point either at static
 * defaults or into `argv`, so they live as long as the process.
 */
typedef struct _game_config
{
    // Title used in the share text ("Wordle 1218 4/6").
    const char* puzzle_name;

    // Day zero. Day index = calendar days since this date.
    puzzle_date_t epoch;

    // One lowercase 5-letter word per line, in day order.
    const char* solutions_path;

    // Extra accepted guesses, one per line.
    const char* valid_guesses_path;

    // The persisted day record (JSON).
    const char* stats_path;
} game_config_t;

/*
 * GLOBAL: DEFAULT_GAME_CONFIG
 *
 * Wordle / 2021-06-19 / solutions.txt / valid_guesses.txt / .stats.json
 */
extern const game_config_t DEFAULT_GAME_CONFIG;

/*
 * FUNCTION: parse_puzzle_date
 *
 * WHAT:
 * Parses "YYYY-MM-DD" into `p_date`. Rejects trailing characters and dates
 * that do not exist on the calendar.
 */
bool parse_puzzle_date(const char* text, puzzle_date_t* p_date);

/*
 * FUNCTION: parse_game_config
 *
 * WHAT:
 * Starts from DEFAULT_GAME_CONFIG and applies the command line:
 *   -s <file>        solutions list
 *   -g <file>        valid guesses list
 *   -r <file>        statistics record
 *   -e <YYYY-MM-DD>  epoch date
 *   -n <name>        puzzle name
 *   -h               help
 *
 * RETURNS:
 * - WORDLE_OK with `p_config` populated. `*p_show_help` is set when -h was given.
 * - WORDLE_ERR_CONFIG on an unknown option, a missing argument, a bad date
 * or stray positional arguments. The reason is on stderr.
 */
wordle_status_t parse_game_config(int argc, char* argv[], game_config_t* p_config, bool* p_show_help);

/*
 * FUNCTION: print_usage
 *
 * WHAT:
 * Prints the option summary to stdout.
 */
void print_usage(const char* program_name);

#endif
