/*
 * FILE: day_record_store.cpp
 *
 * WHAT:
 * Implements loading and saving of the day record.
 *
 * PARSING:
 * The record has five fixed keys, so the reader does not build a document
 * tree. Each key is located with `strstr`, then its value is read in place:
 * an integer, a literal (true/false/null), an array of six integers or an
 * array of two plain strings. Anything unexpected rejects the whole file.
 *
 * WRITING:
 * Write-to-temp-then-rename. `rename` replaces the target atomically on POSIX
 * file systems, so a crash leaves either the old record or the new one.
 */

#include "day_record_store.h"
#include "game_stats.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <ctype.h>
#include <errno.h>
#include <limits.h>
#include <unistd.h>

/* Largest record file accepted; a valid record is well under 1 KB. */
#define MAX_RECORD_FILE_SIZE 65536

static const char* skip_whitespace(const char* p)
{
    while (*p != '\0' && isspace((unsigned char)*p)) p++;
    return p;
}

/*
 * FUNCTION: find_value
 *
 * WHAT:
 * Returns a pointer to the first non-space character after `"key":`,
 * or NULL if the key is missing.
 */
static const char* find_value(const char* json, const char* key)
{
    char pattern[64];
    snprintf(pattern, sizeof(pattern), "\"%s\"", key);

    const char* p = strstr(json, pattern);
    if (p == NULL) return NULL;
    p = skip_whitespace(p + strlen(pattern));
    if (*p != ':') return NULL;
    return skip_whitespace(p + 1);
}

static bool parse_int(const char* p, int* p_value, const char** pp_end)
{
    char* p_end = NULL;
    errno = 0;
    long value = strtol(p, &p_end, 10);
    if (p_end == p || errno != 0 || value < INT_MIN || value > INT_MAX) return false;
    *p_value = (int)value;
    *pp_end = p_end;
    return true;
}

/*
 * FUNCTION: parse_plain_string
 *
 * WHAT:
 * Reads a JSON string with no escape sequences into `out` (at most
 * `max_length` characters plus terminator).
 */
static bool parse_plain_string(const char* p, char* out, size_t max_length, const char** pp_end)
{
    if (*p != '"') return false;
    p++;
    size_t length = 0;
    while (*p != '"')
    {
        if (*p == '\0' || *p == '\\' || length == max_length) return false;
        out[length++] = *p++;
    }
    out[length] = '\0';
    *pp_end = p + 1;
    return true;
}

static bool parse_last_guesses(const char* p, day_record_t* p_record)
{
    const char* p_end = NULL;
    if (*p != '[') return false;
    p = skip_whitespace(p + 1);
    if (!parse_plain_string(p, p_record->last_letters, WORDLE_CELL_COUNT, &p_end)) return false;
    p = skip_whitespace(p_end);
    if (*p != ',') return false;
    p = skip_whitespace(p + 1);
    if (!parse_plain_string(p, p_record->last_statuses, WORDLE_CELL_COUNT, &p_end)) return false;
    p = skip_whitespace(p_end);
    return *p == ']';
}

static bool parse_stats(const char* p, day_record_t* p_record)
{
    const char* p_end = NULL;
    if (*p != '[') return false;
    p = skip_whitespace(p + 1);
    for (int i = 0; i < WORDLE_ROWS; i++)
    {
        if (!parse_int(p, &p_record->stats[i], &p_end) || p_record->stats[i] < 0) return false;
        p = skip_whitespace(p_end);
        if (i < WORDLE_ROWS - 1)
        {
            if (*p != ',') return false;
            p = skip_whitespace(p + 1);
        }
    }
    return *p == ']';
}

/*
 * FUNCTION: match_literal
 *
 * WHAT:
 * True if `p` starts with `literal` followed by ',', '}' or whitespace.
 */
static bool match_literal(const char* p, const char* literal)
{
    size_t length = strlen(literal);
    if (strncmp(p, literal, length) != 0) return false;
    char next = p[length];
    return next == ',' || next == '}' || isspace((unsigned char)next);
}

static bool parse_last_result(const char* p, day_result_t* p_result)
{
    if (match_literal(p, "true"))  { *p_result = DAY_RESULT_WON;   return true; }
    if (match_literal(p, "false")) { *p_result = DAY_RESULT_LOST;  return true; }
    if (match_literal(p, "null"))  { *p_result = DAY_RESULT_UNSET; return true; }
    return false;
}

/*
 * FUNCTION: is_consistent_history
 *
 * WHAT:
 * The stored letters/statuses must describe whole rows: same length, a
 * multiple of 5, uppercase letters and digits 0-2. A won day must end on an
 * all-correct row, and `played` can never be below the number of wins.
 */
static bool is_consistent_history(const day_record_t* p_record)
{
    size_t length = strlen(p_record->last_letters);
    if (length != strlen(p_record->last_statuses)) return false;
    if (length % WORDLE_COLUMNS != 0) return false;
    for (size_t i = 0; i < length; i++)
    {
        if (p_record->last_letters[i] < 'A' || p_record->last_letters[i] > 'Z') return false;
        if (p_record->last_statuses[i] < '0' || p_record->last_statuses[i] > '2') return false;
    }

    if (p_record->last_result == DAY_RESULT_WON)
    {
        if (length == 0) return false;
        for (size_t i = length - WORDLE_COLUMNS; i < length; i++)
        {
            if (p_record->last_statuses[i] != '2') return false;
        }
    }

    long wins = 0;
    for (int i = 0; i < WORDLE_ROWS; i++) wins += p_record->stats[i];
    return wins <= (long)p_record->played;
}

static bool parse_record_fields(const char* json, day_record_t* p_record)
{
    const char* p = skip_whitespace(json);
    const char* p_end = NULL;
    if (*p != '{') return false;

    // Required
    p = find_value(json, "played");
    if (p == NULL || !parse_int(p, &p_record->played, &p_end) || p_record->played < 0) return false;

    p = find_value(json, "stats");
    if (p == NULL || !parse_stats(p, p_record)) return false;

    // Optional
    p = find_value(json, "last_played");
    if (p != NULL && !parse_int(p, &p_record->last_played, &p_end)) return false;

    p = find_value(json, "last_result");
    if (p != NULL && !parse_last_result(p, &p_record->last_result)) return false;

    p = find_value(json, "last_guesses");
    if (p != NULL && !parse_last_guesses(p, p_record)) return false;

    return is_consistent_history(p_record);
}

bool parse_day_record(const char* json, day_record_t* p_record)
{
    init_day_record(p_record);
    if (json == NULL || !parse_record_fields(json, p_record))
    {
        init_day_record(p_record);
        return false;
    }
    return true;
}

wordle_status_t load_day_record(const char* path, day_record_t* p_record)
{
    init_day_record(p_record);

    FILE* fpIn = fopen(path, "rb");
    if (fpIn == NULL)
    {
        if (errno == ENOENT) return WORDLE_OK;    /* First run */
        fprintf(stderr, "Warning: Could not open statistics file '%s': %s\n", path, strerror(errno));
        return WORDLE_ERR_PERSISTENCE;
    }

    char* p_buffer = (char*)malloc(MAX_RECORD_FILE_SIZE + 1);
    if (p_buffer == NULL)
    {
        fprintf(stderr, "ERROR: Out of memory reading statistics file!\n");
        fclose(fpIn);
        return WORDLE_ERR_PERSISTENCE;
    }

    size_t length = fread(p_buffer, 1, MAX_RECORD_FILE_SIZE + 1, fpIn);
    bool read_failed = ferror(fpIn) != 0;
    fclose(fpIn);

    if (read_failed || length > MAX_RECORD_FILE_SIZE)
    {
        fprintf(stderr, "Warning: Statistics file '%s' is unreadable or too large. Starting fresh.\n", path);
        free(p_buffer);
        return WORDLE_ERR_PERSISTENCE;
    }
    p_buffer[length] = '\0';

    bool ok = parse_day_record(p_buffer, p_record);
    free(p_buffer);
    if (!ok)
    {
        fprintf(stderr, "Warning: Statistics file '%s' is malformed. Starting fresh.\n", path);
        return WORDLE_ERR_PERSISTENCE;
    }
    return WORDLE_OK;
}

static const char* last_result_literal(day_result_t result)
{
    switch (result)
    {
    case DAY_RESULT_WON:   return "true";
    case DAY_RESULT_LOST:  return "false";
    case DAY_RESULT_UNSET: break;
    }
    return "null";
}

wordle_status_t save_day_record(const char* path, const day_record_t* p_record)
{
    char tmp_path[4096];
    int written = snprintf(tmp_path, sizeof(tmp_path), "%s.tmp", path);
    if (written < 0 || (size_t)written >= sizeof(tmp_path))
    {
        fprintf(stderr, "ERROR: Statistics path '%s' is too long.\n", path);
        return WORDLE_ERR_PERSISTENCE;
    }

    FILE* fpOut = fopen(tmp_path, "w");
    if (fpOut == NULL)
    {
        fprintf(stderr, "ERROR: Could not create '%s': %s\n", tmp_path, strerror(errno));
        return WORDLE_ERR_PERSISTENCE;
    }

    fprintf(fpOut, "{\n");
    fprintf(fpOut, "  \"last_played\": %d,\n", p_record->last_played);
    fprintf(fpOut, "  \"last_guesses\": [\n");
    fprintf(fpOut, "    \"%s\",\n", p_record->last_letters);
    fprintf(fpOut, "    \"%s\"\n", p_record->last_statuses);
    fprintf(fpOut, "  ],\n");
    fprintf(fpOut, "  \"last_result\": %s,\n", last_result_literal(p_record->last_result));
    fprintf(fpOut, "  \"played\": %d,\n", p_record->played);
    fprintf(fpOut, "  \"stats\": [\n");
    for (int i = 0; i < WORDLE_ROWS; i++)
    {
        fprintf(fpOut, "    %d%s\n", p_record->stats[i], (i < WORDLE_ROWS - 1) ? "," : "");
    }
    fprintf(fpOut, "  ]\n");
    fprintf(fpOut, "}\n");

    bool ok = (fflush(fpOut) == 0) && (fsync(fileno(fpOut)) == 0) && !ferror(fpOut);
    if (fclose(fpOut) != 0) ok = false;

    if (!ok || rename(tmp_path, path) != 0)
    {
        fprintf(stderr, "ERROR: Could not save statistics to '%s': %s\n", path, strerror(errno));
        remove(tmp_path);
        return WORDLE_ERR_PERSISTENCE;
    }
    return WORDLE_OK;
}
