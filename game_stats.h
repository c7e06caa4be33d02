/*
 * FILE: game_stats.h
 *
 * WHAT:
 * Defines the interface for the Statistics Aggregator.
 * This module folds a finished game into the persisted day record and
 * derives the numbers shown on the stats panel (games played, win rate,
 * guess distribution).
 *
 * WHY:
 * The Guess Engine only reports outcomes. Deciding whether an outcome counts
 * (once per day, never again on replay) belongs here, next to the record it
 * updates.
 */

#pragma once
#ifndef GAME_STATS_H
#define GAME_STATS_H
#include "wordle_types.h"

/*
 * STRUCT: stats_summary_t
 *
 * WHAT:
 * Derived figures for display.
 *
 * FIELDS:
 * - played / wins: finished games and won games.
 * - win_percent: 0.0 when nothing was played, otherwise rounded to one decimal.
 * - last_win_attempts: attempts used on the stored day if it was won, else 0.
 * Used to highlight that bar of the distribution.
 * - current_streak: last_win_attempts - 1 when the stored day was won, else 0.
 * - max_streak: highest distribution index (0-based) with a non-zero count,
 * 0 when nothing was won.
 */
typedef struct _stats_summary
{
    int played;
    int wins;
    double win_percent;
    int last_win_attempts;
    int current_streak;
    int max_streak;
} stats_summary_t;

/*
 * FUNCTION: init_day_record
 *
 * WHAT:
 * A fresh record: nothing played (last_played = -1), empty history, unset
 * result, all counters zero.
 */
void init_day_record(day_record_t* p_record);

/*
 * FUNCTION: record_game_result
 *
 * WHAT:
 * Folds a finished game for `day_index` into the record.
 * 1. Increments `played`.
 * 2. On a win, increments stats[attempts - 1].
 * 3. Stores last_played, last_result and the letters/status digits of every
 * submitted row.
 *
 * RETURNS:
 * - true if the record changed and should be saved.
 * - false if the game is not over, or the record already holds a finished
 * result for `day_index` (a replayed day is never counted twice).
 */
bool record_game_result(day_record_t* p_record, int day_index, const game_t* p_game);

/*
 * FUNCTION: summarize_stats
 *
 * WHAT:
 * Computes the display figures for `p_record`.
 */
void summarize_stats(const day_record_t* p_record, stats_summary_t* p_summary);

/*
 * FUNCTION: print_stats
 *
 * WHAT:
 * Prints the stats panel: a header line with games played, win rate and
 * both streak figures, followed by a bar per attempt count (1..6). The bar of the stored day's
 * winning attempt is marked with '*'.
 */
void print_stats(const day_record_t* p_record);

#endif
