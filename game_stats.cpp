/*
 * FILE: game_stats.cpp
 *
 * WHAT:
 * Implements the Statistics Aggregator and the text stats panel.
 */

#include "game_stats.h"
#include "guess_engine.h"
#include "feedback_calculator.h"
#include <stdio.h>
#include <string.h>
#include <math.h>

/* Widest bar of the distribution chart, in characters. */
#define MAX_BAR_WIDTH 30

void init_day_record(day_record_t* p_record)
{
    memset(p_record, 0, sizeof(*p_record));
    p_record->last_played = -1;
    p_record->last_letters[0] = '\0';
    p_record->last_statuses[0] = '\0';
    p_record->last_result = DAY_RESULT_UNSET;
    p_record->played = 0;
    for (int i = 0; i < WORDLE_ROWS; i++) p_record->stats[i] = 0;
}

bool record_game_result(day_record_t* p_record, int day_index, const game_t* p_game)
{
    if (!is_game_over(p_game)) return false;

    // Already counted: this is today's record being replayed.
    if (p_record->last_played == day_index && p_record->last_result != DAY_RESULT_UNSET) return false;

    int rows = count_submitted_rows(p_game);
    bool won = (p_game->state == GAME_STATE_WON);

    p_record->played++;
    if (won && rows >= 1 && rows <= WORDLE_ROWS)
    {
        p_record->stats[rows - 1]++;
    }

    int cells = rows * WORDLE_COLUMNS;
    for (int i = 0; i < cells; i++)
    {
        p_record->last_letters[i] = p_game->cells[i].letter;
        p_record->last_statuses[i] = letter_state_to_digit(p_game->cells[i].state);
    }
    p_record->last_letters[cells] = '\0';
    p_record->last_statuses[cells] = '\0';

    p_record->last_played = day_index;
    p_record->last_result = won ? DAY_RESULT_WON : DAY_RESULT_LOST;
    return true;
}

void summarize_stats(const day_record_t* p_record, stats_summary_t* p_summary)
{
    int wins = 0;
    for (int i = 0; i < WORDLE_ROWS; i++) wins += p_record->stats[i];

    p_summary->played = p_record->played;
    p_summary->wins = wins;
    p_summary->win_percent = 0.0;
    if (p_record->played > 0)
    {
        p_summary->win_percent = round(1000.0 * wins / p_record->played) / 10.0;
    }

    p_summary->last_win_attempts = 0;
    if (p_record->last_result == DAY_RESULT_WON)
    {
        p_summary->last_win_attempts = (int)(strlen(p_record->last_letters) / WORDLE_COLUMNS);
    }

    p_summary->current_streak = (p_summary->last_win_attempts > 0) ? p_summary->last_win_attempts - 1 : 0;

    p_summary->max_streak = 0;
    for (int i = 0; i < WORDLE_ROWS; i++)
    {
        if (p_record->stats[i] != 0) p_summary->max_streak = i;
    }
}

void print_stats(const day_record_t* p_record)
{
    stats_summary_t summary;
    summarize_stats(p_record, &summary);

    printf("Played: %d   Win %%: %.1f   Current Streak: %d   Max Streak: %d\n",
        summary.played, summary.win_percent, summary.current_streak, summary.max_streak);

    int max_count = 0;
    for (int i = 0; i < WORDLE_ROWS; i++)
    {
        if (p_record->stats[i] > max_count) max_count = p_record->stats[i];
    }

    for (int i = 0; i < WORDLE_ROWS; i++)
    {
        int count = p_record->stats[i];
        int width = (max_count > 0) ? (count * MAX_BAR_WIDTH) / max_count : 0;
        char marker = (i + 1 == summary.last_win_attempts) ? '*' : '#';

        printf("  %d | ", i + 1);
        for (int w = 0; w < width; w++) putchar(marker);
        printf(" %d\n", count);
    }
}
