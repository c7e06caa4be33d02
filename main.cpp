/*
 * PROJECT: Daily Word Puzzle
 *
 * ARCHITECTURE OVERVIEW:
 * A console rendition of the daily five-letter word game. One puzzle per
 * calendar day, six attempts, per-letter feedback, persistent statistics.
 *
 * 1. Data Layer: the injected word lists (load_word_lists) and the persisted
 * day record (day_record_store).
 * 2. Logic Layer: the Puzzle Selector (date -> day index -> solution, resume
 * policy), the Guess Engine (grid, cursor, keyboard, scoring) and the
 * Statistics Aggregator.
 * 3. Presentation Layer: this file. It renders state and turns input lines
 * into engine calls; it never decides game rules.
 *
 * INPUT:
 * Each line is processed character by character. Letters are typed into the
 * current row, '<' deletes the last letter, and the end of the line submits
 * the row. Lines starting with ':' are commands:
 * - :c  print the share text (after the game is over)
 * - :s  print statistics
 * - :q  quit
 */

#include "wordle_types.h"
#include "wordle_status.h"
#include "game_config.h"
#include "load_word_lists.h"
#include "puzzle_selector.h"
#include "guess_engine.h"
#include "game_stats.h"
#include "day_record_store.h"
#include "export_result.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <ctype.h>
#include <time.h>
#include <unistd.h>

// CONSTANTS: Display
const char* KEYBOARD_ROWS[] = { "QWERTYUIOP", "ASDFGHJKL", "ZXCVBNM" };
const int KEYBOARD_ROW_COUNT = 3;
const char* SEPARATOR_TEMPLATE = "----------------------------------------";

// Cell colors, 24-bit ANSI backgrounds
const char* STYLE_EMPTY = "\x1b[1;48;2;18;18;18m";
const char* STYLE_IDLE = "\x1b[1;97;48;2;130;130;130m";
const char* STYLE_ABSENT = "\x1b[1;97;48;2;58;58;58m";
const char* STYLE_PRESENT = "\x1b[1;97;48;2;181;159;59m";
const char* STYLE_CORRECT = "\x1b[1;97;48;2;83;141;78m";
const char* STYLE_RESET = "\x1b[0m";

// GLOBALS: Terminal capabilities
bool g_useColor = false;

/*
 * STRUCT: session_t
 *
 * WHAT:
 * Everything the console loop needs for one day's puzzle.
 */
typedef struct _session
{
    game_config_t config;
    word_lists_t word_lists;
    day_record_t record;
    game_t game;
    int day_index;
} session_t;

static const char* style_for_state(letter_state_t state, bool is_key)
{
    switch (state)
    {
    case LETTER_CORRECT: return STYLE_CORRECT;
    case LETTER_PRESENT: return STYLE_PRESENT;
    case LETTER_ABSENT:  return STYLE_ABSENT;
    case LETTER_UNKNOWN: break;
    }
    return is_key ? STYLE_IDLE : STYLE_EMPTY;
}

/*
 * FUNCTION: state_marker
 *
 * WHAT:
 * Plain-text marker used when stdout is not a terminal:
 * '+' Correct, '?' Present, '-' Absent, ' ' Unknown.
 */
static char state_marker(letter_state_t state)
{
    switch (state)
    {
    case LETTER_CORRECT: return '+';
    case LETTER_PRESENT: return '?';
    case LETTER_ABSENT:  return '-';
    case LETTER_UNKNOWN: break;
    }
    return ' ';
}

static void print_tile(char letter, letter_state_t state, bool is_key)
{
    char shown = (letter != '\0') ? letter : '_';
    if (g_useColor)
    {
        printf("%s %c %s ", style_for_state(state, is_key), shown, STYLE_RESET);
    }
    else
    {
        printf("%c%c ", shown, state_marker(state));
    }
}

static void print_grid(const game_t* p_game)
{
    printf("%s\n", SEPARATOR_TEMPLATE);
    for (int row = 0; row < WORDLE_ROWS; row++)
    {
        printf("  ");
        for (int column = 0; column < WORDLE_COLUMNS; column++)
        {
            const cell_t* p_cell = get_cell(p_game, row, column);
            print_tile(p_cell->letter, p_cell->state, false);
        }
        printf("\n");
    }
    printf("%s\n", SEPARATOR_TEMPLATE);
}

static void print_keyboard(const game_t* p_game)
{
    for (int i = 0; i < KEYBOARD_ROW_COUNT; i++)
    {
        printf("%*s", i * 2, "");
        for (const char* p = KEYBOARD_ROWS[i]; *p != '\0'; p++)
        {
            print_tile(*p, p_game->keyboard[*p - 'A'], true);
        }
        printf("\n");
    }
    printf("%s\n", SEPARATOR_TEMPLATE);
}

/*
 * FUNCTION: show_result
 *
 * WHAT:
 * Prints the end-of-game message and the countdown to the next puzzle. The
 * countdown is computed from the clock at the moment of printing.
 */
static void show_result(const session_t* p_session)
{
    if (p_session->game.state == GAME_STATE_WON)
    {
        printf("You Win!\n");
    }
    else
    {
        printf("You Lose! The answer is:\n%s\n", p_session->game.solution);
    }
    printf("Type ':c' to show the share text.\n");

    char countdown[32];
    long remaining = seconds_until_next_puzzle(time(NULL), &p_session->config.epoch, p_session->day_index);
    if (format_countdown(remaining, countdown, sizeof(countdown)) == WORDLE_OK)
    {
        printf("\nNext %s: %s\n", p_session->config.puzzle_name, countdown);
    }
}

static void print_share_text(const session_t* p_session)
{
    char share_text[WORDLE_SHARE_TEXT_MAX];
    wordle_status_t status = build_share_text(p_session->config.puzzle_name, p_session->day_index,
        &p_session->game, share_text, sizeof(share_text));
    if (status != WORDLE_OK)
    {
        printf("%s\n", wordle_status_message(status));
        return;
    }
    printf("%s\n", share_text);
}

/*
 * FUNCTION: finish_game
 *
 * WHAT:
 * Called once, on the transition into WON or LOST during this session.
 * Updates the record and persists it. A failed save is reported but the
 * session keeps running on its in-memory state.
 */
static void finish_game(session_t* p_session)
{
    show_result(p_session);
    if (record_game_result(&p_session->record, p_session->day_index, &p_session->game))
    {
        wordle_status_t status = save_day_record(p_session->config.stats_path, &p_session->record);
        if (status != WORDLE_OK)
        {
            fprintf(stderr, "Warning: %s. This result was not saved.\n", wordle_status_message(status));
        }
    }
}

/*
 * FUNCTION: handle_command
 *
 * WHAT:
 * Executes a ':' command. Returns false when the player asked to quit.
 */
static bool handle_command(const session_t* p_session, const char* line)
{
    char command = (char)tolower((unsigned char)line[1]);
    switch (command)
    {
    case 'q':
        return false;
    case 'c':
        print_share_text(p_session);
        break;
    case 's':
        print_stats(&p_session->record);
        break;
    default:
        printf("Unknown command '%s'. Use :c, :s or :q.\n", line);
        break;
    }
    return true;
}

/*
 * FUNCTION: handle_guess_line
 *
 * WHAT:
 * Feeds one input line to the engine and submits the row. Submit-time
 * errors leave the row as typed so the player can fix it.
 */
static void handle_guess_line(session_t* p_session, const char* line)
{
    for (const char* p = line; *p != '\0'; p++)
    {
        if (*p == '<')
        {
            backspace_letter(&p_session->game);
        }
        else
        {
            input_letter(&p_session->game, *p);
        }
    }

    submit_outcome_t outcome;
    wordle_status_t status = submit_guess(&p_session->game, &outcome);
    if (status != WORDLE_OK)
    {
        print_grid(&p_session->game);
        printf("%s\n", wordle_status_message(status));
        return;
    }

    print_grid(&p_session->game);
    print_keyboard(&p_session->game);
    if (outcome.state == GAME_STATE_WON || outcome.state == GAME_STATE_LOST)
    {
        finish_game(p_session);
    }
}

/*
 * FUNCTION: run_game_loop
 *
 * WHAT:
 * The core console loop. Reads lines until EOF or ':q'.
 */
static void run_game_loop(session_t* p_session)
{
    char buffer[256];
    while (1)
    {
        printf("> ");
        fflush(stdout);
        if (fgets(buffer, sizeof(buffer), stdin) == NULL) break;

        size_t len = strlen(buffer);
        while (len > 0 && (buffer[len - 1] == '\n' || buffer[len - 1] == '\r')) buffer[--len] = '\0';

        if (buffer[0] == ':')
        {
            if (!handle_command(p_session, buffer)) break;
            continue;
        }

        if (is_game_over(&p_session->game))
        {
            printf("Today's puzzle is finished. Use :c, :s or :q.\n");
            continue;
        }
        handle_guess_line(p_session, buffer);
    }
}

/*
 * FUNCTION: start_session
 *
 * WHAT:
 * The bootstrap sequence:
 * 1. Day index and solution from the clock.
 * 2. Day record from disk (falls back to a fresh record).
 * 3. Resume decision: fresh game, or replay of today's stored rows.
 *
 * RETURNS:
 * - WORDLE_OK, or the fatal status that prevents a puzzle from being offered.
 */
static wordle_status_t start_session(session_t* p_session)
{
    char solution[WORDLE_WORD_LENGTH + 1];
    wordle_status_t status = compute_day_index(time(NULL), &p_session->config.epoch,
        p_session->word_lists.solution_count, &p_session->day_index);
    if (status != WORDLE_OK) return status;

    status = solution_for(&p_session->word_lists, p_session->day_index, solution);
    if (status != WORDLE_OK) return status;

    // A broken record is not fatal; load_day_record already returned a fresh one.
    if (load_day_record(p_session->config.stats_path, &p_session->record) != WORDLE_OK)
    {
        fprintf(stderr, "Warning: Statistics were reset.\n");
    }

    resume_decision_t decision;
    status = resume_state(p_session->day_index, &p_session->record, &decision);
    if (status != WORDLE_OK) return status;

    init_game(&p_session->game, solution, &p_session->word_lists);
    if (decision.kind == RESUME_REPLAY)
    {
        if (replay_guesses(&p_session->game, decision.letters, decision.statuses, decision.result) != WORDLE_OK)
        {
            fprintf(stderr, "Warning: Could not restore today's guesses. Starting over.\n");
            init_game(&p_session->game, solution, &p_session->word_lists);
        }
    }
    return WORDLE_OK;
}

/*
 * FUNCTION: main
 *
 * WHAT:
 * The application entry point.
 * 1. Parses the configuration.
 * 2. Loads the word lists.
 * 3. Starts the session (day index, record, resume).
 * 4. Runs the console loop.
 * 5. Releases the word lists on exit.
 */
int main(int argc, char* argv[])
{
    session_t session;
    memset(&session, 0, sizeof(session));

    bool show_help = false;
    if (parse_game_config(argc, argv, &session.config, &show_help) != WORDLE_OK)
    {
        print_usage(argv[0]);
        return 2;
    }
    if (show_help)
    {
        print_usage(argv[0]);
        return 0;
    }

    g_useColor = isatty(fileno(stdout)) != 0;

    if (load_word_lists(session.config.solutions_path, session.config.valid_guesses_path, &session.word_lists) != WORDLE_OK)
    {
        fprintf(stderr, "Failed to load word lists.\n");
        return 1;
    }

    wordle_status_t status = start_session(&session);
    if (status != WORDLE_OK)
    {
        fprintf(stderr, "%s.\n", wordle_status_message(status));
        free_word_lists(&session.word_lists);
        return 1;
    }

    printf("\n%s #%d\n", session.config.puzzle_name, session.day_index);
    print_grid(&session.game);
    print_keyboard(&session.game);
    if (is_game_over(&session.game))
    {
        show_result(&session);
    }

    run_game_loop(&session);

    free_word_lists(&session.word_lists);
    return 0;
}
