/*
 * FILE: game_config.cpp
 *
 * WHAT:
 * The default configuration and the command line parser.
 */

#include "game_config.h"
#include "puzzle_selector.h"
#include <stdio.h>
#include <string.h>
#include <getopt.h>

const game_config_t DEFAULT_GAME_CONFIG = {
    "Wordle",
    { 2021, 6, 19 },
    "solutions.txt",
    "valid_guesses.txt",
    ".stats.json"
};

bool parse_puzzle_date(const char* text, puzzle_date_t* p_date)
{
    if (text == NULL) return false;

    puzzle_date_t date;
    int consumed = 0;
    if (sscanf(text, "%4d-%2d-%2d%n", &date.year, &date.month, &date.day, &consumed) != 3) return false;
    if (consumed != 10 || text[consumed] != '\0') return false;
    if (!is_valid_puzzle_date(&date)) return false;

    *p_date = date;
    return true;
}

wordle_status_t parse_game_config(int argc, char* argv[], game_config_t* p_config, bool* p_show_help)
{
    *p_config = DEFAULT_GAME_CONFIG;
    *p_show_help = false;

    optind = 1;
    opterr = 0;
    int opt;
    while ((opt = getopt(argc, argv, "s:g:r:e:n:h")) != -1)
    {
        switch (opt)
        {
        case 's': p_config->solutions_path = optarg; break;
        case 'g': p_config->valid_guesses_path = optarg; break;
        case 'r': p_config->stats_path = optarg; break;
        case 'n': p_config->puzzle_name = optarg; break;
        case 'e':
            if (!parse_puzzle_date(optarg, &p_config->epoch))
            {
                fprintf(stderr, "ERROR: Invalid epoch date '%s' (expected YYYY-MM-DD).\n", optarg);
                return WORDLE_ERR_CONFIG;
            }
            break;
        case 'h':
            *p_show_help = true;
            break;
        case '?':
        default:
            if (optopt != 0 && strchr("sgren", optopt) != NULL)
            {
                fprintf(stderr, "ERROR: Option -%c requires an argument.\n", optopt);
            }
            else
            {
                fprintf(stderr, "ERROR: Unknown option -%c.\n", optopt);
            }
            return WORDLE_ERR_CONFIG;
        }
    }

    if (optind < argc)
    {
        fprintf(stderr, "ERROR: Unexpected argument '%s'.\n", argv[optind]);
        return WORDLE_ERR_CONFIG;
    }
    return WORDLE_OK;
}

void print_usage(const char* program_name)
{
    printf("Usage: %s [-s solutions.txt] [-g valid_guesses.txt] [-r .stats.json] [-e YYYY-MM-DD] [-n name]\n", program_name);
    printf("  -s <file>        Solution list, one word per line in day order (default: %s)\n", DEFAULT_GAME_CONFIG.solutions_path);
    printf("  -g <file>        Additional valid guesses, one word per line (default: %s)\n", DEFAULT_GAME_CONFIG.valid_guesses_path);
    printf("  -r <file>        Statistics record (default: %s)\n", DEFAULT_GAME_CONFIG.stats_path);
    printf("  -e <YYYY-MM-DD>  Date of puzzle 0 (default: %04d-%02d-%02d)\n",
        DEFAULT_GAME_CONFIG.epoch.year, DEFAULT_GAME_CONFIG.epoch.month, DEFAULT_GAME_CONFIG.epoch.day);
    printf("  -n <name>        Puzzle name used in the share text (default: %s)\n", DEFAULT_GAME_CONFIG.puzzle_name);
    printf("  -h               Show this help\n");
    printf("\nWhile playing: type a word and press Enter. '<' deletes a letter.\n");
    printf("Commands: :c share text (after the game), :s statistics, :q quit.\n");
}
