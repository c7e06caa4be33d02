/*
 * FILE: puzzle_selector.cpp
 *
 * WHAT:
 * Implements the date -> day index -> solution mapping and the resume policy.
 *
 * Day arithmetic is done on civil dates (year, month, day) rather than by
 * dividing seconds by 86400. A day that is 23 or 25 hours long because of a
 * DST change therefore still counts as exactly one day.
 */

#include "puzzle_selector.h"
#include <stdio.h>
#include <string.h>
#include <ctype.h>

static bool is_leap_year(int year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

static int days_in_month(int year, int month)
{
    static const int month_days[12] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (month == 2 && is_leap_year(year)) return 29;
    return month_days[month - 1];
}

bool is_valid_puzzle_date(const puzzle_date_t* p_date)
{
    if (p_date == NULL) return false;
    if (p_date->year < 1970) return false;
    if (p_date->month < 1 || p_date->month > 12) return false;
    if (p_date->day < 1 || p_date->day > days_in_month(p_date->year, p_date->month)) return false;
    return true;
}

long days_from_civil(int year, int month, int day)
{
    // Shift the year so it starts in March; February's leap day is then the
    // last day of the shifted year.
    long y = (long)year - (month <= 2 ? 1 : 0);
    long era = (y >= 0 ? y : y - 399) / 400;
    long yoe = y - era * 400;                                         /* [0, 399]     */
    long mp = (month + 9) % 12;                                       /* March = 0    */
    long doy = (153 * mp + 2) / 5 + day - 1;                          /* [0, 365]     */
    long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;                 /* [0, 146096]  */
    return era * 146097 + doe - 719468;
}

wordle_status_t compute_day_index(time_t now, const puzzle_date_t* epoch, int solution_count, int* p_day_index)
{
    struct tm local;
    if (localtime_r(&now, &local) == NULL)
    {
        fprintf(stderr, "ERROR: Could not convert the current time to a local date.\n");
        return WORDLE_ERR_OUT_OF_RANGE;
    }

    long today = days_from_civil(local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
    long first = days_from_civil(epoch->year, epoch->month, epoch->day);
    long index = today - first;

    if (index < 0 || index >= (long)solution_count)
    {
        fprintf(stderr, "ERROR: Day index %ld is outside the solution list (0..%d).\n", index, solution_count - 1);
        return WORDLE_ERR_OUT_OF_RANGE;
    }
    *p_day_index = (int)index;
    return WORDLE_OK;
}

wordle_status_t solution_for(const word_lists_t* p_lists, int day_index, char* solution)
{
    if (day_index < 0 || day_index >= p_lists->solution_count)
    {
        return WORDLE_ERR_OUT_OF_RANGE;
    }
    const char* p_word = p_lists->p_solutions + (size_t)day_index * WORDLE_WORD_LENGTH;
    for (int i = 0; i < WORDLE_WORD_LENGTH; i++)
    {
        solution[i] = (char)toupper((unsigned char)p_word[i]);
    }
    solution[WORDLE_WORD_LENGTH] = '\0';
    return WORDLE_OK;
}

wordle_status_t resume_state(int day_index, day_record_t* p_record, resume_decision_t* p_decision)
{
    memset(p_decision, 0, sizeof(*p_decision));

    if (p_record->last_played < day_index)
    {
        // A stale day must not leak into today's puzzle.
        p_record->last_result = DAY_RESULT_UNSET;
        p_decision->kind = RESUME_FRESH;
        p_decision->result = DAY_RESULT_UNSET;
        return WORDLE_OK;
    }

    if (p_record->last_played > day_index)
    {
        fprintf(stderr, "ERROR: Stored day %d is ahead of today's day %d. Was the clock changed?\n",
            p_record->last_played, day_index);
        return WORDLE_ERR_OUT_OF_RANGE;
    }

    p_decision->kind = RESUME_REPLAY;
    p_decision->letters = p_record->last_letters;
    p_decision->statuses = p_record->last_statuses;
    p_decision->result = p_record->last_result;
    return WORDLE_OK;
}

int next_puzzle_day_index(int day_index)
{
    return day_index + 1;
}

long seconds_until_next_puzzle(time_t now, const puzzle_date_t* epoch, int day_index)
{
    struct tm target;
    memset(&target, 0, sizeof(target));
    target.tm_year = epoch->year - 1900;
    target.tm_mon = epoch->month - 1;
    target.tm_mday = epoch->day + next_puzzle_day_index(day_index);    /* mktime normalizes */
    target.tm_isdst = -1;

    time_t next_midnight = mktime(&target);
    if (next_midnight == (time_t)-1)
    {
        return 0;
    }
    double remaining = difftime(next_midnight, now);
    return (remaining > 0.0) ? (long)remaining : 0;
}

wordle_status_t format_countdown(long seconds, char* buffer, size_t size)
{
    if (seconds < 0) seconds = 0;
    long hours = seconds / 3600;
    long minutes = (seconds % 3600) / 60;
    long secs = seconds % 60;

    int written = snprintf(buffer, size, "%02ld:%02ld:%02ld", hours, minutes, secs);
    if (written < 0 || (size_t)written >= size)
    {
        return WORDLE_ERR_BUFFER;
    }
    return WORDLE_OK;
}
